#include <QtTest>
#include <QThread>
#include "../src/progress_tracker.h"

class TestProgressTracker : public QObject {
    Q_OBJECT
private slots:
    void testInitialState();
    void testEtaUnknownUntilFirstFile();
    void testCountsAndPercentage();
    void testCompletionAfterCancel();
    void testTerminalStateIsFrozen();
    void testListenerStatusChanges();
    void testStatusStrings();
    void testStateJson();
};

void TestProgressTracker::testInitialState()
{
    ProgressTracker t("b1", "copy", 10, 1000, CancellationToken());
    const ProgressState s = t.snapshot();
    QCOMPARE(s.batchId, QString("b1"));
    QCOMPARE(s.status, BatchStatus::Starting);
    QCOMPARE(s.totalFiles, 10);
    QCOMPARE(s.filesProcessed, 0);
    QVERIFY(!s.etaSeconds.has_value());
    QVERIFY(!t.isFinished());
}

void TestProgressTracker::testEtaUnknownUntilFirstFile()
{
    ProgressTracker t("b1", "copy", 4, 4000, CancellationToken(), 0);
    t.start();
    t.addBytes(500);
    QVERIFY(!t.snapshot().etaSeconds.has_value());
    QCOMPARE(t.snapshot().processedBytes, qint64(500));

    QThread::msleep(20);
    QVERIFY(t.recordFileCompleted("a.exr"));
    const ProgressState s = t.snapshot();
    QVERIFY(s.etaSeconds.has_value());
    QVERIFY(*s.etaSeconds >= 0);
}

void TestProgressTracker::testCountsAndPercentage()
{
    ProgressTracker t("b1", "move", 4, 0, CancellationToken());
    t.start();
    QVERIFY(t.recordFileCompleted("a"));
    t.recordFileFailed("b", "boom");
    const ProgressState s = t.snapshot();
    QCOMPARE(s.filesProcessed, 2);
    QCOMPARE(s.filesSucceeded, 1);
    QCOMPARE(s.filesFailed, 1);
    QCOMPARE(s.percentage(), 50);
    QCOMPARE(s.message, QString("boom"));
    QCOMPARE(s.filesProcessed, s.filesSucceeded + s.filesFailed);
}

void TestProgressTracker::testCompletionAfterCancel()
{
    CancellationToken token;
    ProgressTracker t("b1", "copy", 3, 0, token);
    t.start();
    QVERIFY(t.recordFileCompleted("a"));
    token.cancel();
    QVERIFY(!t.recordFileCompleted("b"));
    QCOMPARE(t.snapshot().filesSucceeded, 1);

    // A finished move cannot be undone and still counts
    QVERIFY(t.recordFileCompleted("c", true));
    QCOMPARE(t.snapshot().filesSucceeded, 2);
}

void TestProgressTracker::testTerminalStateIsFrozen()
{
    ProgressTracker t("b1", "copy", 3, 0, CancellationToken());
    t.start();
    QVERIFY(t.recordFileCompleted("a"));
    QVERIFY(t.finish(BatchStatus::Cancelled));
    QVERIFY(t.isFinished());

    QVERIFY(!t.recordFileCompleted("b", true));
    t.recordFileFailed("c", "late");
    t.addBytes(100);
    QVERIFY(!t.finish(BatchStatus::Completed));

    const ProgressState s = t.snapshot();
    QCOMPARE(s.status, BatchStatus::Cancelled);
    QCOMPARE(s.filesProcessed, 1);
    QCOMPARE(s.filesFailed, 0);
}

void TestProgressTracker::testListenerStatusChanges()
{
    ProgressTracker t("b1", "copy", 2, 0, CancellationToken(), 0);
    QVector<BatchStatus> transitions;
    int updates = 0;
    t.setListener([&](const ProgressState& s, bool statusChanged) {
        if (statusChanged) transitions << s.status;
        else ++updates;
    });
    t.start();
    QVERIFY(t.recordFileCompleted("a"));
    QVERIFY(t.recordFileCompleted("b"));
    QVERIFY(t.finish(BatchStatus::Completed));

    QCOMPARE(transitions, QVector<BatchStatus>({BatchStatus::Running, BatchStatus::Completed}));
    QCOMPARE(updates, 2);
    QCOMPARE(t.snapshot().etaSeconds.value_or(-1), qint64(0));
}

void TestProgressTracker::testStatusStrings()
{
    const QVector<BatchStatus> all = { BatchStatus::Starting, BatchStatus::Running, BatchStatus::Cancelled,
                                       BatchStatus::Completed, BatchStatus::CompletedWithErrors, BatchStatus::Failed };
    for (BatchStatus s : all)
        QCOMPARE(batchStatusFromString(batchStatusToString(s)), s);
    QVERIFY(!isTerminal(BatchStatus::Running));
    QVERIFY(isTerminal(BatchStatus::CompletedWithErrors));
}

void TestProgressTracker::testStateJson()
{
    ProgressTracker t("b9", "copy", 2, 2048, CancellationToken());
    t.start();
    QVERIFY(t.recordFileCompleted("a"));
    const ProgressState s = t.snapshot();
    const ProgressState back = ProgressState::fromJson(s.toJson());
    QCOMPARE(back.batchId, s.batchId);
    QCOMPARE(back.status, s.status);
    QCOMPARE(back.filesSucceeded, 1);
    QCOMPARE(back.totalBytes, qint64(2048));
    QCOMPARE(back.etaSeconds.has_value(), s.etaSeconds.has_value());
}

QTEST_APPLESS_MAIN(TestProgressTracker)
#include "test_progress_tracker.moc"
