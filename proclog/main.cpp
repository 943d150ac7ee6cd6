#include <iostream>
#include <memory>
#include <cstdio>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QTextStream>
#ifndef Q_OS_WIN
#include <unistd.h>
#else
#include <io.h>
#endif
#include "core/async_file_writer.h"
#include "core/log_buffer.h"
#include "core/text_normalizer.h"
#include "shared/proclogger.h"
#include "shared/common.h"
#include "shared/cli_args.h"
#include "shared/cli_help.h"
#include "shared/health_check.h"
#include "shared/qt_message_handler.h"

using namespace ProcLogCommon;

namespace {

constexpr qint64 STDIN_CHUNK_BYTES = 4096;

bool isTerminal(FILE* stream)
{
#ifdef Q_OS_WIN
    return _isatty(_fileno(stream)) != 0;
#else
    return isatty(fileno(stream)) != 0;
#endif
}

// Color codes only make sense on a terminal
void printText(QTextStream& out, const QString& text, bool colors)
{
    if (text.isEmpty()) {
        return;
    }
    if (!colors && ProcLog::containsAnsi(text)) {
        out << ProcLog::stripAnsi(text);
    } else {
        out << text;
    }
    out.flush();
}

int ingestStdin(ProcLog::LogBuffer& buffer, QTextStream& out, bool echo, bool colors)
{
    QFile input;
    if (!input.open(stdin, QIODevice::ReadOnly | QIODevice::Unbuffered)) {
        PROCLOG_LOG_ERROR(QString("Cannot read standard input: %1").arg(input.errorString()));
        return static_cast<int>(ExitCode::GENERAL_ERROR);
    }

    qint64 totalBytes = 0;
    while (true) {
        QByteArray chunk = input.read(STDIN_CHUNK_BYTES);
        if (chunk.isEmpty()) {
            // EOF, or an error which ends the stream just the same
            break;
        }
        totalBytes += chunk.size();

        ProcLog::LogBuffer::AppendResult result = buffer.append(chunk);
        if (echo) {
            printText(out, result.display, colors);
        }
    }

    // The producer is gone, so a trailing fragment is as complete as it will get
    if (!buffer.partial().isEmpty()) {
        PROCLOG_LOG_DEBUG("Input ended without a newline, completing the last line");
        ProcLog::LogBuffer::AppendResult result = buffer.append(QString("\n"));
        if (echo) {
            printText(out, result.display, colors);
        }
    }

    PROCLOG_LOG_DEBUG(QString("Ingested %1 bytes into '%2'").arg(totalBytes).arg(buffer.name()));
    return static_cast<int>(ExitCode::SUCCESS);
}

int runCommand(const ProcLogCLI::Args& args, ProcLog::LogBuffer& buffer, QTextStream& out)
{
    const bool colors = isTerminal(stdout);

    switch (args.command) {
    case ProcLogCLI::Args::Command::Ingest: {
        int result = ingestStdin(buffer, out, !args.quiet && !args.tailAfterIngest, colors);
        if (result == static_cast<int>(ExitCode::SUCCESS) && args.tailAfterIngest) {
            printText(out, buffer.getRecent(), colors);
        }
        return result;
    }
    case ProcLogCLI::Args::Command::Tail: {
        // Nothing in memory in a fresh process: show the last page of history
        ProcLog::LogBuffer::ChunkResult chunk = buffer.loadChunk(buffer.lineCount());
        printText(out, chunk.text, colors);
        return static_cast<int>(ExitCode::SUCCESS);
    }
    case ProcLogCLI::Args::Command::Count:
        out << buffer.lineCount() << "\n";
        out.flush();
        return static_cast<int>(ExitCode::SUCCESS);
    case ProcLogCLI::Args::Command::Page: {
        ProcLog::LogBuffer::ChunkResult chunk = buffer.loadChunk(args.pageEnd);
        printText(out, chunk.text, colors);
        PROCLOG_LOG_DEBUG(QString("Page starts at line %1").arg(chunk.start));
        return static_cast<int>(ExitCode::SUCCESS);
    }
    case ProcLogCLI::Args::Command::Search: {
        ProcLog::LogBuffer::SearchResult found = buffer.search(QString::fromStdString(args.pattern));
        printText(out, found.text, colors);
        PROCLOG_LOG_INFO(QString("%1 match(es)").arg(found.matches));
        return static_cast<int>(ExitCode::SUCCESS);
    }
    case ProcLogCLI::Args::Command::Clear:
        buffer.clear();
        PROCLOG_LOG_INFO(QString("Cleared %1").arg(buffer.filePath()));
        return static_cast<int>(ExitCode::SUCCESS);
    case ProcLogCLI::Args::Command::None:
    default:
        return static_cast<int>(ExitCode::INVALID_ARGUMENTS);
    }
}

} // namespace

int main(int argc, char *argv[])
{
    ProcLogCLI::Args args = ProcLogCLI::parseArguments(argc, argv);

    if (!ProcLogCLI::validateArguments(args)) {
        std::cerr << "Error: " << args.errorMessage << "\n";
        std::cerr << "Run '" << argv[0] << " --help' for usage.\n";
        return static_cast<int>(ExitCode::INVALID_ARGUMENTS);
    }

    if (args.showHelp) {
        std::cout << ProcLogCLI::generateHelpText(argv[0]);
        return static_cast<int>(ExitCode::SUCCESS);
    }

    if (args.showVersion) {
        std::cout << ProcLogCLI::generateVersionString() << std::endl;
        return static_cast<int>(ExitCode::SUCCESS);
    }

    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(Config::APP_NAME);
    QCoreApplication::setApplicationVersion(Config::APP_VERSION);

    LogSettings settings = resolveLogSettings(ProcLogCLI::toSettingsOverrides(args));

    ProcLoggerConfig loggerConfig;
    loggerConfig.appName = Config::APP_NAME;
    loggerConfig.logDir = settings.logDir;
    loggerConfig.consoleColors = isTerminal(stderr);
    loggerConfig.minLevel = args.verbose ? LogLevel::Debug
                          : (args.check ? LogLevel::Info : LogLevel::Warning);
    ProcLogger::initialize(loggerConfig);
    if (!ProcLogger::isInitialized()) {
        exitWithError(ExitCode::LOGGER_INIT_FAILED);
    }
    installQtMessageHandler();

    if (args.check) {
        ProcLogHealthCheck::HealthCheckConfig checkConfig;
        checkConfig.settings = settings;
        checkConfig.verbose = args.verbose;
        checkConfig.writerTimeoutMs = Config::WRITER_CLOSE_TIMEOUT_MS;
        int result = ProcLogHealthCheck::runHealthCheck(checkConfig);
        uninstallQtMessageHandler();
        ProcLogger::shutdown();
        return result == 0 ? static_cast<int>(ExitCode::SUCCESS)
                           : static_cast<int>(ExitCode::CHECK_FAILED);
    }

    if (!QDir().mkpath(settings.logDir)) {
        ProcLogger::shutdown();
        exitWithError(ExitCode::LOG_DIR_CREATE_FAILED, settings.logDir);
    }

    ProcLog::AsyncFileWriter::Config writerConfig;
    writerConfig.maxQueue = settings.writerQueueCapacity;
    writerConfig.pollIntervalMs = Config::WRITER_POLL_INTERVAL_MS;
    writerConfig.closeTimeoutMs = Config::WRITER_CLOSE_TIMEOUT_MS;
    auto writer = std::make_unique<ProcLog::AsyncFileWriter>(writerConfig);

    ProcLog::LogBuffer::Config bufferConfig;
    bufferConfig.logDir = settings.logDir;
    bufferConfig.maxLines = settings.maxLines;
    bufferConfig.historyChunk = settings.historyChunk;
    ProcLog::LogBuffer buffer(QString::fromStdString(args.name), *writer, bufferConfig);
    PROCLOG_LOG_DEBUG(QString("Stream file: %1, max lines: %2, page size: %3")
                      .arg(buffer.filePath())
                      .arg(buffer.maxLines())
                      .arg(buffer.historyChunk()));

    QTextStream out(stdout);
    int exitCode = runCommand(args, buffer, out);

    // Flush pending log writes and stop the writer thread
    bool drained = writer->close(Config::WRITER_CLOSE_TIMEOUT_MS);
    if (writer->droppedCount() > 0) {
        PROCLOG_LOG_WARNING(QString("%1 chunk(s) dropped due to backpressure")
                                       .arg(writer->droppedCount()));
    }
    if (!drained) {
        PROCLOG_LOG_WARNING(QString("%1 pending chunk(s) not written").arg(writer->pendingCount()));
        if (exitCode == static_cast<int>(ExitCode::SUCCESS)) {
            exitCode = static_cast<int>(ExitCode::WRITER_DRAIN_TIMEOUT);
        }
    }
    writer.reset();

    uninstallQtMessageHandler();
    ProcLogger::shutdown();
    return exitCode;
}
