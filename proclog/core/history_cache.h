#ifndef PROCLOG_HISTORY_CACHE_H
#define PROCLOG_HISTORY_CACHE_H

#include <QString>
#include <QStringList>
#include <QDateTime>

namespace ProcLog {

// Memoized line list of a log file, keyed by the file's modification time.
// A refresh is a stat; the file is only re-read when its mtime changed.
// Two writes within one filesystem timestamp tick are indistinguishable,
// so a read between them can stay stale until the next invalidate().
class HistoryCache
{
public:
    explicit HistoryCache(const QString& filePath);

    // Fills out with the file's lines; false when it is missing or unreadable
    bool lines(QStringList& out);

    void invalidate();
    bool isValid() const { return m_valid; }
    int reloadCount() const { return m_reloads; }

private:
    QString m_filePath;
    QStringList m_lines;
    bool m_valid = false;
    QDateTime m_mtime;
    int m_reloads = 0;
};

} // namespace ProcLog

#endif // PROCLOG_HISTORY_CACHE_H
