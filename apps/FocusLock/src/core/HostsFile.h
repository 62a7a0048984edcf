#ifndef HOSTSFILE_H
#define HOSTSFILE_H

#include <QByteArray>
#include <QList>
#include <QString>
#include <QStringList>

/**
 * @brief In-memory model of the name-resolution (hosts) file
 *
 * The file is held as a list of segments: plain lines, which are carried
 * through untouched, and marker regions owned by a single feature:
 *
 *   # >>> FOCUSLOCK-PERMANENT-START <<<
 *   127.0.0.1 example.com
 *   # >>> FOCUSLOCK-PERMANENT-END <<<
 *
 * Parsing repairs malformed markers instead of failing. A region that is
 * never closed gives its body lines back to the plain content, end markers
 * without a matching start are dropped, and duplicate regions are collapsed
 * into the first one the next time that region is written.
 *
 * Line endings, a UTF-8 BOM and the presence of a final newline are kept so
 * that content outside the regions serializes back byte for byte.
 */
class HostsFile
{
public:
    HostsFile();

    static HostsFile parse(const QByteArray& raw);
    QByteArray serialize() const;

    bool hasRegion(const QString& markerId) const;
    int regionCount(const QString& markerId) const;
    QStringList regionIds() const;
    QStringList regionLines(const QString& markerId) const;

    // Replaces the first occurrence of the region (dropping any duplicates)
    // or appends it at the end of the file
    void setRegion(const QString& markerId, const QStringList& lines);

    // Removes every occurrence; returns false if none existed
    bool removeRegion(const QString& markerId);

    // True when parsing had to drop or release malformed marker lines
    bool wasRepaired() const;

    static QString startMarker(const QString& markerId);
    static QString endMarker(const QString& markerId);

    // One "<address> <domain>" line per normalized domain
    static QStringList entryLines(const QString& redirectAddress, const QStringList& domains);

    static bool isValidDomain(const QString& domain);

    // Trims, lowercases, validates and de-duplicates, keeping first-seen order
    static QStringList normalizeDomains(const QStringList& domains);

private:
    struct Segment
    {
        bool isRegion = false;
        QString text;        // plain line, '\r' kept when the file uses CRLF
        QString markerId;
        QString startLine;
        QString endLine;
        QStringList body;
    };

    enum MarkerKind { NotMarker, StartMarker, EndMarker };
    static MarkerKind classify(const QString& line, QString& markerId);

    QString lineSuffix() const;

    QList<Segment> m_segments;
    bool m_hasBom;
    bool m_crlf;
    bool m_trailingNewline;
    bool m_repaired;
};

#endif // HOSTSFILE_H
