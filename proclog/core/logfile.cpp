#include "logfile.h"
#include "text_normalizer.h"
#include <QFile>
#include <QFileInfo>
#include <QDir>

namespace ProcLog {

IoResult LogFile::ensureParentDirectory(const QString& filePath)
{
    QFileInfo fileInfo(filePath);
    QDir dir = fileInfo.dir();
    if (dir.exists()) {
        return IoResult::success();
    }

    if (!dir.mkpath(dir.absolutePath())) {
        return IoResult::failure(QString("Failed to create directory: %1").arg(dir.absolutePath()));
    }
    return IoResult::success();
}

IoResult LogFile::append(const QString& filePath, const QString& text)
{
    QFile file(filePath);
    // No QIODevice::Text: the persisted format is \n on every platform
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        return IoResult::failure(QString("Failed to open %1: %2").arg(filePath, file.errorString()));
    }

    const QByteArray data = text.toUtf8();
    if (file.write(data) != data.size()) {
        return IoResult::failure(QString("Short write to %1: %2").arg(filePath, file.errorString()));
    }

    file.close();
    return IoResult::success();
}

IoResult LogFile::truncate(const QString& filePath)
{
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return IoResult::failure(QString("Failed to truncate %1: %2").arg(filePath, file.errorString()));
    }
    file.close();
    return IoResult::success();
}

IoResult LogFile::readAll(const QString& filePath, QString& out)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        return IoResult::failure(QString("Failed to read %1: %2").arg(filePath, file.errorString()));
    }

    out = decodeLossy(file.readAll());
    file.close();
    return IoResult::success();
}

QDateTime LogFile::modificationTime(const QString& filePath)
{
    QFileInfo fileInfo(filePath);
    if (!fileInfo.exists()) {
        return QDateTime();
    }
    return fileInfo.lastModified();
}

bool LogFile::exists(const QString& filePath)
{
    return QFileInfo::exists(filePath);
}

} // namespace ProcLog
