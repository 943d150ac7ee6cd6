#include "log_buffer.h"
#include "async_file_writer.h"
#include "logfile.h"
#include "text_normalizer.h"
#include "shared/proclogger.h"
#include <QDir>
#include <QDateTime>
#include <algorithm>

namespace ProcLog {

namespace {

const QString kTimestampColor = QStringLiteral("\x1b[94m");
const QString kColorReset = QStringLiteral("\x1b[0m");
const QString kTimestampFormat = QStringLiteral("yyyy-MM-dd HH:mm:ss");

void logBufferIssue(LogLevel level, const QString& message)
{
    if (ProcLogger::isInitialized()) {
        ProcLogger::instance().log(level, "buffer", message);
    }
}

} // namespace

LogBuffer::LogBuffer(const QString& name, AsyncFileWriter& writer, const Config& config)
    : m_name(name)
    , m_filePath(QDir(config.logDir).absoluteFilePath(name + ".log"))
    , m_maxLines(std::max(1, config.maxLines))
    , m_historyChunk(std::max(1, config.historyChunk))
    , m_writer(writer)
    , m_decoder(QStringDecoder::Utf8)
    , m_cache(m_filePath)
{
    IoResult dirResult = LogFile::ensureParentDirectory(m_filePath);
    if (!dirResult) {
        logBufferIssue(LogLevel::Warning, dirResult.error);
    }
}

LogBuffer::AppendResult LogBuffer::append(const QByteArray& bytes)
{
    if (bytes.isEmpty()) {
        return AppendResult();
    }
    QString text = m_decoder.decode(bytes);
    return append(text);
}

LogBuffer::AppendResult LogBuffer::append(const QString& text)
{
    if (text.isEmpty()) {
        return AppendResult();
    }

    QString data = m_partial + text;
    m_partial.clear();

    // A trailing \r may be the first half of a \r\n split across chunks
    bool heldCarriageReturn = data.endsWith(QLatin1Char('\r'));
    if (heldCarriageReturn) {
        data.chop(1);
    }
    data = normalizeLineEndings(data);

    // No newline yet: keep buffering the partial line
    if (!data.contains(QLatin1Char('\n'))) {
        m_partial = heldCarriageReturn ? data + QStringLiteral("\r") : data;
        return AppendResult();
    }

    QStringList parts = data.split(QLatin1Char('\n'));
    // Whatever follows the last newline is incomplete (possibly empty)
    m_partial = parts.takeLast();
    if (heldCarriageReturn) {
        m_partial += QLatin1Char('\r');
    }

    AppendResult result;
    for (const QString& content : parts) {
        QString ts = currentTimestamp();

        QString display = QStringLiteral("[") + kTimestampColor + ts + kColorReset
                        + QStringLiteral("] ") + content + QStringLiteral("\n");
        m_lines.append(display);
        if (m_lines.size() > m_maxLines) {
            m_lines.removeFirst();
        }
        result.display += display;

        result.file += QStringLiteral("[") + ts + QStringLiteral("] ")
                     + stripAnsi(content) + QStringLiteral("\n");
    }

    m_cache.invalidate();

    // Persist asynchronously; a dropped chunk is counted and annotated by the writer
    m_writer.write(m_filePath, result.file);

    return result;
}

QString LogBuffer::currentTimestamp()
{
    QDateTime now = QDateTime::currentDateTime();
    qint64 secs = now.toSecsSinceEpoch();
    if (secs != m_timestampSecs) {
        m_timestampSecs = secs;
        m_timestampText = now.toString(kTimestampFormat);
    }
    return m_timestampText;
}

QString LogBuffer::getRecent() const
{
    return m_lines.join(QString());
}

QStringList LogBuffer::historyLines()
{
    QStringList lines;
    if (m_cache.lines(lines)) {
        return lines;
    }

    lines.reserve(m_lines.size());
    for (const QString& line : m_lines) {
        lines.append(line.endsWith(QLatin1Char('\n')) ? line.chopped(1) : line);
    }
    return lines;
}

int LogBuffer::lineCount()
{
    return historyLines().size();
}

QString LogBuffer::colorizeTimestamp(const QString& line)
{
    if (line.startsWith(QLatin1Char('['))) {
        int bracket = line.indexOf(QLatin1Char(']'));
        if (bracket > 0) {
            return QStringLiteral("[") + kTimestampColor + stripAnsi(line.mid(1, bracket - 1))
                 + kColorReset + line.mid(bracket);
        }
    }
    return line;
}

LogBuffer::ChunkResult LogBuffer::loadChunk(int end)
{
    return loadChunk(end, m_historyChunk);
}

LogBuffer::ChunkResult LogBuffer::loadChunk(int end, int size)
{
    QStringList lines = historyLines();
    if (lines.isEmpty() || end <= 0) {
        return ChunkResult();
    }

    int start = std::max(0, end - size);
    int stop = std::min(end, static_cast<int>(lines.size()));
    if (start >= stop) {
        return ChunkResult();
    }

    ChunkResult result;
    result.start = start;
    for (int i = start; i < stop; ++i) {
        result.text += colorizeTimestamp(lines.at(i)) + QStringLiteral("\n");
    }
    return result;
}

LogBuffer::SearchResult LogBuffer::search(const QString& pattern)
{
    SearchResult result;
    const QStringList lines = historyLines();
    for (const QString& line : lines) {
        if (line.contains(pattern, Qt::CaseInsensitive)) {
            result.text += colorizeTimestamp(line) + QStringLiteral("\n");
            ++result.matches;
        }
    }
    return result;
}

void LogBuffer::clear()
{
    // Queued writes for this file must not land after the truncation
    m_writer.discardPending(m_filePath);

    m_lines.clear();
    m_partial.clear();
    m_decoder.resetState();
    m_cache.invalidate();

    IoResult truncated = LogFile::truncate(m_filePath);
    if (!truncated) {
        logBufferIssue(LogLevel::Warning, truncated.error);
    }
}

} // namespace ProcLog
