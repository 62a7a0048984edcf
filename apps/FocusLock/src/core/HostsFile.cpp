#include "HostsFile.h"
#include <QRegularExpression>
#include <QSet>

namespace {

const QByteArray kUtf8Bom("\xEF\xBB\xBF");

} // namespace

HostsFile::HostsFile()
    : m_hasBom(false)
    , m_crlf(false)
    , m_trailingNewline(false)
    , m_repaired(false)
{
}

HostsFile::MarkerKind HostsFile::classify(const QString& line, QString& markerId)
{
    static const QRegularExpression markerPattern(
        "^\\s*#\\s*>>>\\s*(\\S+)-(START|END)\\s*<<<\\s*$");

    QRegularExpressionMatch match = markerPattern.match(line);
    if (!match.hasMatch()) {
        return NotMarker;
    }

    markerId = match.captured(1).toUpper();
    return match.captured(2) == "START" ? StartMarker : EndMarker;
}

HostsFile HostsFile::parse(const QByteArray& raw)
{
    HostsFile file;

    QByteArray content = raw;
    if (content.startsWith(kUtf8Bom)) {
        file.m_hasBom = true;
        content.remove(0, kUtf8Bom.size());
    }

    file.m_crlf = content.contains("\r\n");

    QStringList lines = QString::fromUtf8(content).split('\n');
    if (lines.last().isEmpty()) {
        // "a\nb\n" splits into a, b and an empty tail
        lines.removeLast();
        file.m_trailingNewline = !content.isEmpty();
    }

    Segment open;
    bool inRegion = false;

    auto releaseOpenRegion = [&file, &open]() {
        // Unterminated: the dangling start marker goes, its body stays
        for (const QString& bodyLine : open.body) {
            Segment plain;
            plain.text = bodyLine;
            file.m_segments.append(plain);
        }
        file.m_repaired = true;
    };

    for (const QString& line : lines) {
        QString markerId;
        MarkerKind kind = classify(line, markerId);

        if (kind == StartMarker) {
            if (inRegion) {
                releaseOpenRegion();
            }
            open = Segment();
            open.isRegion = true;
            open.markerId = markerId;
            open.startLine = line;
            inRegion = true;
        } else if (kind == EndMarker) {
            if (inRegion && markerId == open.markerId) {
                open.endLine = line;
                file.m_segments.append(open);
                inRegion = false;
            } else {
                file.m_repaired = true;
            }
        } else if (inRegion) {
            open.body.append(line);
        } else {
            Segment plain;
            plain.text = line;
            file.m_segments.append(plain);
        }
    }

    if (inRegion) {
        releaseOpenRegion();
    }

    return file;
}

QString HostsFile::lineSuffix() const
{
    return m_crlf ? QString("\r") : QString();
}

QByteArray HostsFile::serialize() const
{
    QStringList lines;
    for (const Segment& segment : m_segments) {
        if (!segment.isRegion) {
            lines.append(segment.text);
            continue;
        }
        lines.append(segment.startLine);
        lines.append(segment.body);
        lines.append(segment.endLine);
    }

    QByteArray out;
    if (m_hasBom) {
        out.append(kUtf8Bom);
    }
    if (lines.isEmpty()) {
        return out;
    }

    out.append(lines.join('\n').toUtf8());

    const bool endsWithRegion = m_segments.last().isRegion;
    if (m_trailingNewline || endsWithRegion) {
        out.append('\n');
    }
    return out;
}

bool HostsFile::hasRegion(const QString& markerId) const
{
    return regionCount(markerId) > 0;
}

int HostsFile::regionCount(const QString& markerId) const
{
    const QString id = markerId.toUpper();
    int count = 0;
    for (const Segment& segment : m_segments) {
        if (segment.isRegion && segment.markerId == id) {
            ++count;
        }
    }
    return count;
}

QStringList HostsFile::regionIds() const
{
    QStringList ids;
    for (const Segment& segment : m_segments) {
        if (segment.isRegion && !ids.contains(segment.markerId)) {
            ids.append(segment.markerId);
        }
    }
    return ids;
}

QStringList HostsFile::regionLines(const QString& markerId) const
{
    const QString id = markerId.toUpper();
    for (const Segment& segment : m_segments) {
        if (segment.isRegion && segment.markerId == id) {
            QStringList lines;
            for (const QString& line : segment.body) {
                lines.append(line.trimmed());
            }
            return lines;
        }
    }
    return QStringList();
}

void HostsFile::setRegion(const QString& markerId, const QStringList& lines)
{
    const QString id = markerId.toUpper();
    const QString suffix = lineSuffix();

    Segment region;
    region.isRegion = true;
    region.markerId = id;
    region.startLine = startMarker(id) + suffix;
    region.endLine = endMarker(id) + suffix;
    for (const QString& line : lines) {
        region.body.append(line + suffix);
    }

    bool replaced = false;
    for (int i = 0; i < m_segments.size();) {
        const Segment& segment = m_segments.at(i);
        if (segment.isRegion && segment.markerId == id) {
            if (!replaced) {
                m_segments[i] = region;
                replaced = true;
                ++i;
            } else {
                m_segments.removeAt(i);
            }
        } else {
            ++i;
        }
    }

    if (!replaced) {
        m_segments.append(region);
    }
}

bool HostsFile::removeRegion(const QString& markerId)
{
    const QString id = markerId.toUpper();
    bool removed = false;
    for (int i = m_segments.size() - 1; i >= 0; --i) {
        if (m_segments.at(i).isRegion && m_segments.at(i).markerId == id) {
            m_segments.removeAt(i);
            removed = true;
        }
    }
    return removed;
}

bool HostsFile::wasRepaired() const
{
    return m_repaired;
}

QString HostsFile::startMarker(const QString& markerId)
{
    return QString("# >>> %1-START <<<").arg(markerId.toUpper());
}

QString HostsFile::endMarker(const QString& markerId)
{
    return QString("# >>> %1-END <<<").arg(markerId.toUpper());
}

QStringList HostsFile::entryLines(const QString& redirectAddress, const QStringList& domains)
{
    QStringList lines;
    for (const QString& domain : normalizeDomains(domains)) {
        lines.append(QString("%1 %2").arg(redirectAddress, domain));
    }
    return lines;
}

bool HostsFile::isValidDomain(const QString& domain)
{
    if (domain.isEmpty() || domain.size() > 253) {
        return false;
    }
    if (domain.startsWith('.') || domain.endsWith('.') || domain.startsWith('-') || domain.endsWith('-')) {
        return false;
    }
    if (domain.contains("..")) {
        return false;
    }

    for (const QChar c : domain) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '.' || c == '-';
        if (!ok) {
            return false;
        }
    }

    const QStringList labels = domain.split('.');
    for (const QString& label : labels) {
        if (label.size() > 63 || label.startsWith('-') || label.endsWith('-')) {
            return false;
        }
    }
    return true;
}

QStringList HostsFile::normalizeDomains(const QStringList& domains)
{
    QStringList result;
    QSet<QString> seen;
    for (const QString& domain : domains) {
        const QString normalized = domain.trimmed().toLower();
        if (!isValidDomain(normalized) || seen.contains(normalized)) {
            continue;
        }
        seen.insert(normalized);
        result.append(normalized);
    }
    return result;
}
