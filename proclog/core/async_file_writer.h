#ifndef PROCLOG_ASYNC_FILE_WRITER_H
#define PROCLOG_ASYNC_FILE_WRITER_H

#include <QString>
#include <QQueue>
#include <QHash>
#include <QSet>
#include <QMutex>
#include <QWaitCondition>
#include <QThread>
#include <memory>

namespace ProcLog {

/**
 * Non-blocking log file appender.
 *
 * Producers (the thread delivering process output) enqueue text with write();
 * a single background thread does all disk I/O. The queue is bounded: when it
 * is full the chunk is dropped and counted, and the count is written into the
 * same file as a "[log-writer] dropped N chunks" line on its next successful
 * write. Jobs for one path are applied in enqueue order.
 *
 * One instance is meant to serve the whole process. It is constructed by the
 * application and handed to every LogBuffer by reference.
 */
class AsyncFileWriter
{
public:
    struct Config {
        int maxQueue = 10000;           // Queued jobs before drops start
        int pollIntervalMs = 200;       // Worker wake-up interval to observe stop
        int closeTimeoutMs = 2000;      // Used by the destructor when close() was never called
        bool lazyStart = true;          // Start the worker on the first write()
    };

    AsyncFileWriter();
    explicit AsyncFileWriter(const Config& config);
    ~AsyncFileWriter();

    AsyncFileWriter(const AsyncFileWriter&) = delete;
    AsyncFileWriter& operator=(const AsyncFileWriter&) = delete;

    // Enqueue text to append to filePath. Never blocks on I/O.
    // Returns false when the text was empty or the job was dropped.
    bool write(const QString& filePath, const QString& text);

    void start();

    // Request stop and wait up to timeoutMs for the worker to drain and exit.
    // Returns true if the worker is no longer running.
    bool close(int timeoutMs);

    // Remove queued jobs for filePath and wait for an in-flight write to it
    int discardPending(const QString& filePath);

    // Wait until the queue is empty and no write is in flight
    bool waitForIdle(int timeoutMs);

    bool isRunning() const;
    int pendingCount() const;
    int capacity() const { return m_config.maxQueue; }
    quint64 droppedCount() const;
    int droppedCountFor(const QString& filePath) const;

private:
    struct Job {
        QString path;
        QString text;
    };

    void startLocked();
    void run();
    void processJob(const Job& job);

    Config m_config;

    mutable QMutex m_mutex;             // Protects everything below except m_ioMutex
    QMutex m_ioMutex;                   // Held by the worker while writing one job
    QWaitCondition m_jobAvailable;
    QWaitCondition m_idle;

    QQueue<Job> m_queue;
    QHash<QString, int> m_droppedByPath;
    quint64 m_droppedTotal = 0;
    bool m_inFlight = false;
    bool m_stopRequested = false;
    bool m_abort = false;
    bool m_closed = false;
    bool m_running = false;

    std::unique_ptr<QThread> m_thread;

    // Worker thread only
    QSet<QString> m_preparedPaths;      // Parent directory already ensured
};

} // namespace ProcLog

#endif // PROCLOG_ASYNC_FILE_WRITER_H
