#include "test_framework.h"
#include "core/history_cache.h"
#include "core/logfile.h"
#include <QDir>
#include <QFile>
#include <QTemporaryDir>

using namespace ProcLog;

static QList<TestResult> testResults;

static bool writeFile(const QString& path, const QByteArray& content) {
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    return file.write(content) == content.size();
}

static bool setModificationTime(const QString& path, const QDateTime& time) {
    QFile file(path);
    if (!file.open(QIODevice::ReadWrite)) {
        return false;
    }
    return file.setFileTime(time, QFileDevice::FileModificationTime);
}

bool testMissingFileHasNoLines(TestContext& ctx) {
    QTemporaryDir dir;
    TEST_REQUIRE(ctx, dir.isValid(), "temporary directory");

    HistoryCache cache(QDir(dir.path()).absoluteFilePath("missing.log"));
    QStringList lines;
    TEST_ASSERT(ctx, !cache.lines(lines), "missing file has no lines");
    TEST_ASSERT(ctx, !cache.isValid(), "nothing cached");
    return ctx.passed;
}

bool testReadsOnceWhileUnchanged(TestContext& ctx) {
    QTemporaryDir dir;
    TEST_REQUIRE(ctx, dir.isValid(), "temporary directory");
    QString path = QDir(dir.path()).absoluteFilePath("stream.log");
    TEST_REQUIRE(ctx, writeFile(path, "[2024-01-01 00:00:00] a\n[2024-01-01 00:00:01] b\n"), "write fixture");

    HistoryCache cache(path);
    QStringList first;
    TEST_REQUIRE(ctx, cache.lines(first), "file lines available");
    TEST_ASSERT(ctx, first.size() == 2, QString("expected 2 lines, got %1").arg(first.size()));
    TEST_ASSERT(ctx, first.value(1) == "[2024-01-01 00:00:01] b", "second line content");

    QStringList second;
    TEST_ASSERT(ctx, cache.lines(second) && second == first, "same lines on repeat");
    TEST_ASSERT(ctx, cache.reloadCount() == 1, QString("expected 1 read, got %1").arg(cache.reloadCount()));
    return ctx.passed;
}

bool testReloadsWhenModificationTimeChanges(TestContext& ctx) {
    QTemporaryDir dir;
    TEST_REQUIRE(ctx, dir.isValid(), "temporary directory");
    QString path = QDir(dir.path()).absoluteFilePath("stream.log");
    TEST_REQUIRE(ctx, writeFile(path, "one\ntwo\n"), "write fixture");
    QDateTime base = QDateTime::currentDateTime().addSecs(-60);
    TEST_REQUIRE(ctx, setModificationTime(path, base), "set initial mtime");

    HistoryCache cache(path);
    QStringList lines;
    TEST_ASSERT(ctx, cache.lines(lines) && lines.size() == 2, "initial read");

    TEST_REQUIRE(ctx, LogFile::append(path, "three\n").ok, "append line");
    TEST_REQUIRE(ctx, setModificationTime(path, base.addSecs(10)), "advance mtime");

    TEST_ASSERT(ctx, cache.lines(lines) && lines.size() == 3, "new line visible after mtime change");
    TEST_ASSERT(ctx, cache.reloadCount() == 2, QString("expected 2 reads, got %1").arg(cache.reloadCount()));
    return ctx.passed;
}

bool testUnchangedModificationTimeKeepsCachedLines(TestContext& ctx) {
    // mtime is the only validity signal; same-tick writes stay invisible until invalidate()
    QTemporaryDir dir;
    TEST_REQUIRE(ctx, dir.isValid(), "temporary directory");
    QString path = QDir(dir.path()).absoluteFilePath("stream.log");
    TEST_REQUIRE(ctx, writeFile(path, "one\ntwo\n"), "write fixture");
    QDateTime base = QDateTime::currentDateTime().addSecs(-60);
    TEST_REQUIRE(ctx, setModificationTime(path, base), "set initial mtime");

    HistoryCache cache(path);
    QStringList lines;
    TEST_ASSERT(ctx, cache.lines(lines) && lines.size() == 2, "initial read");

    TEST_REQUIRE(ctx, LogFile::append(path, "three\n").ok, "append line");
    TEST_REQUIRE(ctx, setModificationTime(path, base), "restore mtime");

    TEST_ASSERT(ctx, cache.lines(lines) && lines.size() == 2, "cached lines reused while mtime matches");

    cache.invalidate();
    TEST_ASSERT(ctx, !cache.isValid(), "invalidate drops the cache");
    TEST_ASSERT(ctx, cache.lines(lines) && lines.size() == 3, "explicit invalidation forces a re-read");
    return ctx.passed;
}

bool testNormalizesLineEndingsOnRead(TestContext& ctx) {
    QTemporaryDir dir;
    TEST_REQUIRE(ctx, dir.isValid(), "temporary directory");
    QString path = QDir(dir.path()).absoluteFilePath("crlf.log");
    TEST_REQUIRE(ctx, writeFile(path, "a\r\nb\r\n\r\nc"), "write fixture");

    HistoryCache cache(path);
    QStringList lines;
    TEST_REQUIRE(ctx, cache.lines(lines), "file lines available");
    TEST_ASSERT(ctx, lines == QStringList({"a", "b", "", "c"}), QString("got %1").arg(lines.join("|")));
    return ctx.passed;
}

bool testEmptyFileHasZeroLines(TestContext& ctx) {
    QTemporaryDir dir;
    TEST_REQUIRE(ctx, dir.isValid(), "temporary directory");
    QString path = QDir(dir.path()).absoluteFilePath("empty.log");
    TEST_REQUIRE(ctx, writeFile(path, QByteArray()), "create empty file");

    HistoryCache cache(path);
    QStringList lines = {"stale"};
    TEST_ASSERT(ctx, cache.lines(lines), "existing empty file is a valid source");
    TEST_ASSERT(ctx, lines.isEmpty(), "no lines in an empty file");
    return ctx.passed;
}

int runHistoryCacheTests(int& totalTests, int& passedTests) {
    ProcLogger::instance().info("[History Cache Tests]");

    testResults.clear();

    RUN_TEST(testResults, testMissingFileHasNoLines);
    RUN_TEST(testResults, testReadsOnceWhileUnchanged);
    RUN_TEST(testResults, testReloadsWhenModificationTimeChanges);
    RUN_TEST(testResults, testUnchangedModificationTimeKeepsCachedLines);
    RUN_TEST(testResults, testNormalizesLineEndingsOnRead);
    RUN_TEST(testResults, testEmptyFileHasZeroLines);

    return summarizeTestResults("History Cache Tests", testResults, totalTests, passedTests);
}
