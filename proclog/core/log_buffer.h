#ifndef PROCLOG_LOG_BUFFER_H
#define PROCLOG_LOG_BUFFER_H

#include <QString>
#include <QStringList>
#include <QByteArray>
#include <QStringDecoder>
#include "history_cache.h"
#include "shared/common.h"

namespace ProcLog {

class AsyncFileWriter;

/**
 * Output of one monitored process stream.
 *
 * Keeps the last maxLines rendered lines in memory for live display and
 * hands a plain-text copy of every complete line to the AsyncFileWriter.
 * Text without a trailing newline is held back until a later append()
 * completes it, so callers can feed arbitrarily chunked output.
 *
 * History (lineCount/loadChunk/search) reads the backing file through a
 * HistoryCache and falls back to the in-memory lines when there is no file.
 *
 * Not thread-safe: each buffer is driven from a single producer thread.
 */
class LogBuffer
{
public:
    struct Config {
        QString logDir;                                             // Backing file is <logDir>/<name>.log
        int maxLines = ProcLogCommon::Config::MAX_LOG_LINES;
        int historyChunk = ProcLogCommon::Config::HISTORY_CHUNK;
    };

    struct AppendResult {
        QString display;    // Colored, as shown live
        QString file;       // Plain, as persisted
    };

    struct ChunkResult {
        QString text;
        int start = 0;
    };

    struct SearchResult {
        QString text;
        int matches = 0;
    };

    LogBuffer(const QString& name, AsyncFileWriter& writer, const Config& config);

    LogBuffer(const LogBuffer&) = delete;
    LogBuffer& operator=(const LogBuffer&) = delete;

    AppendResult append(const QString& text);

    // Raw process output; UTF-8 sequences split across calls decode intact
    AppendResult append(const QByteArray& bytes);

    QString getRecent() const;
    int recentLineCount() const { return m_lines.size(); }

    int lineCount();
    ChunkResult loadChunk(int end);
    ChunkResult loadChunk(int end, int size);
    SearchResult search(const QString& pattern);

    void clear();

    QString name() const { return m_name; }
    QString filePath() const { return m_filePath; }
    QString partial() const { return m_partial; }
    int maxLines() const { return m_maxLines; }
    int historyChunk() const { return m_historyChunk; }
    const HistoryCache& cache() const { return m_cache; }

    static QString colorizeTimestamp(const QString& line);

private:
    QStringList historyLines();
    QString currentTimestamp();

    QString m_name;
    QString m_filePath;
    int m_maxLines;
    int m_historyChunk;
    AsyncFileWriter& m_writer;

    QStringList m_lines;
    QString m_partial;
    QStringDecoder m_decoder;
    HistoryCache m_cache;

    qint64 m_timestampSecs = -1;
    QString m_timestampText;
};

} // namespace ProcLog

#endif // PROCLOG_LOG_BUFFER_H
