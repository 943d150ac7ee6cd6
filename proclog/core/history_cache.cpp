#include "history_cache.h"
#include "logfile.h"
#include "text_normalizer.h"
#include "shared/proclogger.h"

namespace ProcLog {

HistoryCache::HistoryCache(const QString& filePath)
    : m_filePath(filePath)
{
}

bool HistoryCache::lines(QStringList& out)
{
    QDateTime mtime = LogFile::modificationTime(m_filePath);
    if (!mtime.isValid()) {
        return false;
    }

    if (m_valid && mtime == m_mtime) {
        out = m_lines;
        return true;
    }

    QString content;
    IoResult result = LogFile::readAll(m_filePath, content);
    if (!result) {
        if (ProcLogger::isInitialized()) {
            ProcLogger::instance().log(LogLevel::Debug, "history", result.error);
        }
        return false;
    }

    m_lines = splitLines(normalizeLineEndings(content));
    m_mtime = mtime;
    m_valid = true;
    ++m_reloads;
    out = m_lines;
    return true;
}

void HistoryCache::invalidate()
{
    m_lines.clear();
    m_valid = false;
    m_mtime = QDateTime();
}

} // namespace ProcLog
