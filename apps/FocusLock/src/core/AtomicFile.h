#ifndef ATOMICFILE_H
#define ATOMICFILE_H

#include <QByteArray>
#include <QJsonObject>
#include <QString>

// Small-file persistence used by every engine. Writes go through QSaveFile
// (temporary file in the target directory, renamed over the target on commit)
// so readers never observe a half-written file.
class AtomicFile
{
public:
    enum Status {
        Ok = 0,
        NotFound,
        PermissionDenied,
        IoError,
        ParseError
    };

    static Status readAll(const QString& path, QByteArray& data, QString* errorMessage = nullptr);
    static Status writeAll(const QString& path, const QByteArray& data, QString* errorMessage = nullptr);

    static Status readJsonObject(const QString& path, QJsonObject& object, QString* errorMessage = nullptr);
    static Status writeJsonObject(const QString& path, const QJsonObject& object, QString* errorMessage = nullptr);

    // Flag files carry no payload beyond their presence
    static Status writeFlag(const QString& path, QString* errorMessage = nullptr);
    static bool exists(const QString& path);
    static bool removeFile(const QString& path, QString* errorMessage = nullptr);

    static bool ensureParentDir(const QString& path);
    static QString statusToString(Status status);
};

#endif // ATOMICFILE_H
