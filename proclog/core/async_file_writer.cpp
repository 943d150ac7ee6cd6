#include "async_file_writer.h"
#include "logfile.h"
#include "shared/proclogger.h"
#include <QDeadlineTimer>

namespace ProcLog {

namespace {

const QString kCategory = QStringLiteral("writer");

void reportWriterIssue(LogLevel level, const QString& message)
{
    if (ProcLogger::isInitialized()) {
        ProcLogger::instance().log(level, kCategory, message);
    }
}

} // namespace

AsyncFileWriter::AsyncFileWriter()
    : AsyncFileWriter(Config())
{
}

AsyncFileWriter::AsyncFileWriter(const Config& config)
    : m_config(config)
{
    if (m_config.maxQueue < 1) {
        m_config.maxQueue = 1;
    }
    if (m_config.pollIntervalMs < 1) {
        m_config.pollIntervalMs = 1;
    }
}

AsyncFileWriter::~AsyncFileWriter()
{
    bool closed;
    {
        QMutexLocker locker(&m_mutex);
        closed = m_closed;
    }
    if (!closed) {
        close(m_config.closeTimeoutMs);
    }

    // Whatever is still queued after close() is abandoned
    {
        QMutexLocker locker(&m_mutex);
        m_abort = true;
        m_stopRequested = true;
        m_jobAvailable.wakeAll();
    }
    if (m_thread) {
        m_thread->wait();
    }
}

bool AsyncFileWriter::write(const QString& filePath, const QString& text)
{
    if (text.isEmpty()) {
        return false;
    }

    QMutexLocker locker(&m_mutex);

    if (m_queue.size() >= m_config.maxQueue) {
        // Never block the producer. Drop the chunk and count it.
        ++m_droppedTotal;
        ++m_droppedByPath[filePath];
        return false;
    }

    m_queue.enqueue(Job{filePath, text});
    m_jobAvailable.wakeOne();

    if (m_config.lazyStart && !m_closed && !m_thread) {
        startLocked();
    }
    return true;
}

void AsyncFileWriter::start()
{
    QMutexLocker locker(&m_mutex);
    startLocked();
}

void AsyncFileWriter::startLocked()
{
    if (m_running) {
        return;
    }

    if (m_thread) {
        // A previous worker was asked to stop; let it finish before replacing it
        m_mutex.unlock();
        m_thread->wait();
        m_mutex.lock();
        m_thread.reset();
    }

    m_stopRequested = false;
    m_abort = false;
    m_closed = false;
    m_running = true;

    m_thread.reset(QThread::create([this]() { run(); }));
    m_thread->setObjectName(QStringLiteral("log-writer"));
    m_thread->start();
}

bool AsyncFileWriter::close(int timeoutMs)
{
    {
        QMutexLocker locker(&m_mutex);
        m_stopRequested = true;
        m_closed = true;
        m_jobAvailable.wakeAll();
    }

    if (!m_thread) {
        return true;
    }

    bool finished = m_thread->wait(QDeadlineTimer(timeoutMs));
    if (!finished) {
        reportWriterIssue(LogLevel::Warning,
                          QString("Log writer did not drain within %1ms, %2 job(s) still queued")
                          .arg(timeoutMs)
                          .arg(pendingCount()));
    }
    return finished;
}

int AsyncFileWriter::discardPending(const QString& filePath)
{
    int removed = 0;
    {
        QMutexLocker locker(&m_mutex);
        for (auto it = m_queue.begin(); it != m_queue.end();) {
            if (it->path == filePath) {
                it = m_queue.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        m_droppedByPath.remove(filePath);
        if (m_queue.isEmpty() && !m_inFlight) {
            m_idle.wakeAll();
        }
    }

    // The worker holds m_ioMutex for the duration of one job, so taking it
    // here waits out a write that was already dequeued.
    QMutexLocker ioLocker(&m_ioMutex);
    return removed;
}

bool AsyncFileWriter::waitForIdle(int timeoutMs)
{
    QDeadlineTimer deadline(timeoutMs);
    QMutexLocker locker(&m_mutex);

    while (!m_queue.isEmpty() || m_inFlight) {
        if (!m_running) {
            return false;
        }
        if (!m_idle.wait(&m_mutex, deadline)) {
            return m_queue.isEmpty() && !m_inFlight;
        }
    }
    return true;
}

bool AsyncFileWriter::isRunning() const
{
    QMutexLocker locker(&m_mutex);
    return m_running;
}

int AsyncFileWriter::pendingCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_queue.size();
}

quint64 AsyncFileWriter::droppedCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_droppedTotal;
}

int AsyncFileWriter::droppedCountFor(const QString& filePath) const
{
    QMutexLocker locker(&m_mutex);
    return m_droppedByPath.value(filePath, 0);
}

void AsyncFileWriter::run()
{
    QMutexLocker locker(&m_mutex);

    while (!m_abort && (!m_stopRequested || !m_queue.isEmpty())) {
        if (m_queue.isEmpty()) {
            m_jobAvailable.wait(&m_mutex, static_cast<unsigned long>(m_config.pollIntervalMs));
            continue;
        }

        Job job = m_queue.dequeue();
        m_inFlight = true;
        m_ioMutex.lock();
        locker.unlock();

        processJob(job);

        m_ioMutex.unlock();
        locker.relock();
        m_inFlight = false;
        if (m_queue.isEmpty()) {
            m_idle.wakeAll();
        }
    }

    m_running = false;
    m_idle.wakeAll();
}

void AsyncFileWriter::processJob(const Job& job)
{
    if (!m_preparedPaths.contains(job.path)) {
        IoResult prepared = LogFile::ensureParentDirectory(job.path);
        if (!prepared) {
            reportWriterIssue(LogLevel::Warning, prepared.error);
            return;
        }
        m_preparedPaths.insert(job.path);
    }

    IoResult written = LogFile::append(job.path, job.text);
    if (!written) {
        // Directory may have been removed underneath us; re-create it next time
        m_preparedPaths.remove(job.path);
        reportWriterIssue(LogLevel::Warning, written.error);
        return;
    }

    // If we dropped anything for this file, record it now that a write succeeded
    int dropped;
    {
        QMutexLocker locker(&m_mutex);
        dropped = m_droppedByPath.take(job.path);
    }
    if (dropped > 0) {
        IoResult annotated = LogFile::append(
            job.path, QString("[log-writer] dropped %1 chunks due to backpressure\n").arg(dropped));
        if (annotated) {
            reportWriterIssue(LogLevel::Warning,
                              QString("Dropped %1 chunk(s) for %2 due to backpressure").arg(dropped).arg(job.path));
        } else {
            reportWriterIssue(LogLevel::Warning, annotated.error);
        }
    }
}

} // namespace ProcLog
