#ifndef PROCLOG_LOGFILE_H
#define PROCLOG_LOGFILE_H

#include <QString>
#include <QDateTime>

namespace ProcLog {

struct IoResult {
    bool ok = true;
    QString error;

    static IoResult success() { return IoResult(); }
    static IoResult failure(const QString& message) { return IoResult{false, message}; }

    explicit operator bool() const { return ok; }
};

// Synchronous file helpers shared by the writer thread and the history reader.
// None of them throw; failures are returned as IoResult.
class LogFile
{
public:
    static IoResult ensureParentDirectory(const QString& filePath);

    // Append UTF-8 text as-is (line endings are expected to be \n already)
    static IoResult append(const QString& filePath, const QString& text);

    static IoResult truncate(const QString& filePath);

    static IoResult readAll(const QString& filePath, QString& out);

    // Invalid QDateTime when the file does not exist
    static QDateTime modificationTime(const QString& filePath);

    static bool exists(const QString& filePath);

private:
    LogFile() = delete;
};

} // namespace ProcLog

#endif // PROCLOG_LOGFILE_H
