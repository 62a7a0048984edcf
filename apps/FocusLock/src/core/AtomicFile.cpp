#include "AtomicFile.h"
#include "logger/logger.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>

namespace {

AtomicFile::Status statusFromFileError(QFileDevice::FileError error)
{
    switch (error) {
    case QFileDevice::NoError:
        return AtomicFile::Ok;
    case QFileDevice::PermissionsError:
        return AtomicFile::PermissionDenied;
    default:
        return AtomicFile::IoError;
    }
}

void setMessage(QString* target, const QString& message)
{
    if (target) {
        *target = message;
    }
}

} // namespace

AtomicFile::Status AtomicFile::readAll(const QString& path, QByteArray& data, QString* errorMessage)
{
    QFile file(path);
    if (!file.exists()) {
        setMessage(errorMessage, QString("File not found: %1").arg(path));
        return NotFound;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        setMessage(errorMessage, QString("Cannot open %1: %2").arg(path, file.errorString()));
        return statusFromFileError(file.error());
    }

    data = file.readAll();
    if (file.error() != QFileDevice::NoError) {
        setMessage(errorMessage, QString("Cannot read %1: %2").arg(path, file.errorString()));
        return statusFromFileError(file.error());
    }
    return Ok;
}

AtomicFile::Status AtomicFile::writeAll(const QString& path, const QByteArray& data, QString* errorMessage)
{
    if (!ensureParentDir(path)) {
        setMessage(errorMessage, QString("Cannot create directory for %1").arg(path));
        return IoError;
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        setMessage(errorMessage, QString("Cannot open %1 for writing: %2").arg(path, file.errorString()));
        return statusFromFileError(file.error());
    }

    if (file.write(data) != data.size()) {
        setMessage(errorMessage, QString("Short write to %1: %2").arg(path, file.errorString()));
        Status status = statusFromFileError(file.error());
        file.cancelWriting();
        return status == Ok ? IoError : status;
    }

    if (!file.commit()) {
        setMessage(errorMessage, QString("Cannot replace %1: %2").arg(path, file.errorString()));
        Status status = statusFromFileError(file.error());
        return status == Ok ? IoError : status;
    }
    return Ok;
}

AtomicFile::Status AtomicFile::readJsonObject(const QString& path, QJsonObject& object, QString* errorMessage)
{
    QByteArray raw;
    Status status = readAll(path, raw, errorMessage);
    if (status != Ok) {
        return status;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(raw, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        setMessage(errorMessage, QString("Invalid JSON in %1: %2").arg(path, parseError.errorString()));
        return ParseError;
    }

    object = doc.object();
    return Ok;
}

AtomicFile::Status AtomicFile::writeJsonObject(const QString& path, const QJsonObject& object, QString* errorMessage)
{
    return writeAll(path, QJsonDocument(object).toJson(QJsonDocument::Indented), errorMessage);
}

AtomicFile::Status AtomicFile::writeFlag(const QString& path, QString* errorMessage)
{
    return writeAll(path, QByteArray("1\n"), errorMessage);
}

bool AtomicFile::exists(const QString& path)
{
    return QFileInfo::exists(path);
}

bool AtomicFile::removeFile(const QString& path, QString* errorMessage)
{
    QFile file(path);
    if (!file.exists()) {
        return true;
    }
    if (!file.remove()) {
        setMessage(errorMessage, QString("Cannot remove %1: %2").arg(path, file.errorString()));
        return false;
    }
    return true;
}

bool AtomicFile::ensureParentDir(const QString& path)
{
    QDir dir = QFileInfo(path).absoluteDir();
    if (dir.exists()) {
        return true;
    }
    if (!dir.mkpath(".")) {
        LOG_ERROR("Failed to create directory: " + dir.path());
        return false;
    }
    return true;
}

QString AtomicFile::statusToString(Status status)
{
    switch (status) {
    case Ok:               return "ok";
    case NotFound:         return "not found";
    case PermissionDenied: return "permission denied";
    case IoError:          return "i/o error";
    case ParseError:       return "parse error";
    }
    return "unknown";
}
