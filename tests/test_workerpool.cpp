/**
 * @file test_workerpool.cpp
 * @brief Unit tests for WorkerPool.
 *
 * Tests verify:
 * - Every unit is offered to exactly one worker for any pool size
 * - Workers run concurrently
 * - The first failure becomes the run's result
 * - Cancellation on failure, and the cancellation-free mode
 */

#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "mocks/mockprocessrunner.h"
#include "services/workerpool.h"

class TestWorkerPool : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir *tempDir_ = nullptr;
    QString base_;

    QString createFile(const QString &relativePath)
    {
        const QString path = base_ + '/' + relativePath;
        QDir().mkpath(QFileInfo(path).path());
        QFile file(path);
        if (!file.open(QIODevice::WriteOnly)) {
            return QString();
        }
        file.write("x");
        return path;
    }

    QStringList createFiles(const QString &prefix, int count)
    {
        QStringList files;
        for (int i = 0; i < count; ++i) {
            files << createFile(QString("%1%2").arg(prefix).arg(i));
        }
        return files;
    }

private slots:
    void initTestCase()
    {
        qRegisterMetaType<TransferError>();
    }

    void init()
    {
        tempDir_ = new QTemporaryDir();
        QVERIFY(tempDir_->isValid());
        base_ = QFileInfo(tempDir_->path()).canonicalFilePath();
    }

    void cleanup()
    {
        delete tempDir_;
        tempDir_ = nullptr;
    }

    void testEveryUnitTransferredOnce_data()
    {
        QTest::addColumn<int>("fileCount");
        QTest::addColumn<int>("workerCount");

        QTest::newRow("no files, one worker") << 0 << 1;
        QTest::newRow("no files, many workers") << 0 << 8;
        QTest::newRow("one file, many workers") << 1 << 8;
        QTest::newRow("some files, one worker") << 7 << 1;
        QTest::newRow("some files, two workers") << 7 << 2;
        QTest::newRow("many files, four workers") << 150 << 4;
        QTest::newRow("fewer files than workers") << 3 << 16;
    }

    void testEveryUnitTransferredOnce()
    {
        QFETCH(int, fileCount);
        QFETCH(int, workerCount);

        QStringList expected = createFiles("tree/d/f", fileCount);
        QVERIFY(QDir().mkpath(base_ + "/tree"));

        MockProcessRunner runner;
        WorkerPool pool(&runner);
        const std::optional<TransferError> error = pool.run({base_ + "/tree"}, "host:dst", workerCount);

        QVERIFY(!error.has_value());
        QStringList sources = runner.mockSources();
        sources.sort();
        expected.sort();
        QCOMPARE(sources, expected);
        QCOMPARE(pool.transferredCount(), fileCount);
        QCOMPARE(pool.failureCount(), 0);
        QVERIFY(!pool.isRunning());
        QCOMPARE(pool.activeCount(), 0);
    }

    void testDestinationsFollowTree()
    {
        const QString top = createFile("photos/a.jpg");
        const QString nested = createFile("photos/2019/b.jpg");

        MockProcessRunner runner;
        WorkerPool pool(&runner);
        QVERIFY(!pool.run({base_ + "/photos"}, "user@host:incoming", 2).has_value());

        QMap<QString, QString> destinations;
        for (const MockProcessRunner::Invocation &invocation : runner.mockInvocations()) {
            destinations.insert(invocation.source(), invocation.destination());
        }
        QCOMPARE(destinations.value(top), QString("user@host:incoming/photos/"));
        QCOMPARE(destinations.value(nested), QString("user@host:incoming/photos/2019/"));
    }

    void testBareFilesLandInRootDirectory()
    {
        const QString first = createFile("loose/a.txt");
        const QString second = createFile("loose/b.txt");

        MockProcessRunner runner;
        WorkerPool pool(&runner);
        QVERIFY(!pool.run({first, second}, "user@host:incoming", 2).has_value());

        QCOMPARE(runner.mockInvocationCount(), 2);
        for (const MockProcessRunner::Invocation &invocation : runner.mockInvocations()) {
            QCOMPARE(invocation.destination(), QString("user@host:incoming/"));
        }
    }

    void testWorkerCountFromOptions()
    {
        createFiles("batch/f", 12);

        MockProcessRunner runner;
        runner.mockSetDelay(20);
        SendOptions options;
        options.workerCount = 3;
        WorkerPool pool(&runner, options);
        QSignalSpy started(&pool, &WorkerPool::runStarted);

        QVERIFY(!pool.run({base_ + "/batch"}, "host:dst").has_value());

        QCOMPARE(started.count(), 1);
        QCOMPARE(started.at(0).at(0).toInt(), 3);
        QVERIFY(runner.mockPeakConcurrency() <= 3);
        QCOMPARE(runner.mockInvocationCount(), 12);
    }

    void testWorkersRunConcurrently()
    {
        createFiles("parallel/f", 8);

        MockProcessRunner runner;
        runner.mockSetDelay(100);
        WorkerPool pool(&runner);

        QVERIFY(!pool.run({base_ + "/parallel"}, "host:dst", 4).has_value());

        QVERIFY(runner.mockPeakConcurrency() > 1);
        QVERIFY(runner.mockPeakConcurrency() <= 4);
    }

    void testFailureBecomesRunResult()
    {
        const QStringList files = createFiles("f", 5);

        MockProcessRunner runner;
        runner.mockSetExitCode(files.at(2), 23);
        WorkerPool pool(&runner);
        QSignalSpy finished(&pool, &WorkerPool::runFinished);

        const std::optional<TransferError> error = pool.run(files, "host:dst", 1);

        QVERIFY(error.has_value());
        QCOMPARE(error->exitStatus, 23);
        QCOMPARE(error->unit.source, files.at(2));
        QCOMPARE(error->command.last(), QString("host:dst/"));
        QCOMPARE(pool.failureCount(), 1);
        QCOMPARE(finished.count(), 1);
        QCOMPARE(finished.at(0).at(0).toBool(), false);
    }

    void testCancelOnFailureStopsNewWork()
    {
        const QStringList files = createFiles("f", 20);

        MockProcessRunner runner;
        runner.mockSetExitCode(files.first(), 12);
        runner.mockSetDelay(50);
        WorkerPool pool(&runner);

        const std::optional<TransferError> error = pool.run(files, "host:dst", 2);

        QVERIFY(error.has_value());
        QCOMPARE(error->unit.source, files.first());
        QVERIFY(runner.mockInvocationCount() < files.size());
    }

    void testWithoutCancellationSiblingsDrain()
    {
        const QStringList files = createFiles("f", 20);

        MockProcessRunner runner;
        runner.mockSetExitCode(files.first(), 12);
        runner.mockSetDelay(10);
        SendOptions options;
        options.cancelOnFailure = false;
        WorkerPool pool(&runner, options);

        const std::optional<TransferError> error = pool.run(files, "host:dst", 2);

        QVERIFY(error.has_value());
        QCOMPARE(error->unit.source, files.first());
        QCOMPARE(runner.mockInvocationCount(), files.size());
        QCOMPARE(pool.transferredCount(), files.size() - 1);
    }

    void testConcurrentFailuresReportOne()
    {
        const QStringList files = createFiles("f", 4);

        MockProcessRunner runner;
        for (const QString &file : files) {
            runner.mockSetExitCode(file, 30);
        }
        runner.mockSetDelay(20);
        SendOptions options;
        options.cancelOnFailure = false;
        WorkerPool pool(&runner, options);

        const std::optional<TransferError> error = pool.run(files, "host:dst", 4);

        QVERIFY(error.has_value());
        QVERIFY(files.contains(error->unit.source));
        QCOMPARE(pool.failureCount(), 4);
        QCOMPARE(pool.transferredCount(), 0);
    }

    void testLaunchFailureIsReported()
    {
        const QString file = createFile("only");

        MockProcessRunner runner;
        runner.mockSetFailToStart(file);
        WorkerPool pool(&runner);

        const std::optional<TransferError> error = pool.run({file}, "host:dst", 2);

        QVERIFY(error.has_value());
        QCOMPARE(error->kind, TransferError::Kind::FailedToStart);
    }

    void testSkippedPathsReported()
    {
        const QString file = createFile("present");
        const QString missing = base_ + "/missing";
        QTest::ignoreMessage(QtWarningMsg,
                             qPrintable(QString("'%1': no such file or directory").arg(missing)));

        MockProcessRunner runner;
        WorkerPool pool(&runner);
        QVERIFY(!pool.run({missing, file}, "host:dst", 2).has_value());

        QCOMPARE(pool.skippedPaths(), QStringList{missing});
        QCOMPARE(runner.mockSources(), QStringList{file});
    }

    void testPoolRunsAgainWithFreshState()
    {
        const QStringList files = createFiles("f", 3);

        MockProcessRunner runner;
        runner.mockSetExitCode(files.at(1), 23);
        WorkerPool pool(&runner);

        QVERIFY(pool.run(files, "host:dst", 1).has_value());
        QCOMPARE(pool.failureCount(), 1);

        QVERIFY(!pool.run({files.at(0), files.at(2)}, "host:dst", 1).has_value());
        QCOMPARE(pool.failureCount(), 0);
        QCOMPARE(pool.transferredCount(), 2);
    }
};

QTEST_MAIN(TestWorkerPool)
#include "test_workerpool.moc"
