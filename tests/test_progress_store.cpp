#include <QtTest>
#include <QTemporaryDir>
#include <QtConcurrent>
#include <QThread>
#include <memory>
#include "../src/progress_store.h"

class TestProgressStore : public QObject {
    Q_OBJECT
private slots:
    void testSaveAndLoad();
    void testOverwriteKeepsLatest();
    void testListAndRemove();
    void testMarkInterrupted();
    void testSaveFromWorkerThreads();
    void testSaveFromShortLivedThreads();
    void testClosedStore();
};

static ProgressState makeState(const QString& id, BatchStatus status, int processed = 0)
{
    ProgressState s;
    s.batchId = id;
    s.operation = "copy";
    s.status = status;
    s.totalFiles = 10;
    s.filesProcessed = processed;
    s.filesSucceeded = processed;
    s.totalBytes = 1000;
    s.processedBytes = processed * 100;
    s.startedAt = QDateTime::currentDateTimeUtc();
    s.updatedAt = s.startedAt;
    return s;
}

void TestProgressStore::testSaveAndLoad()
{
    QTemporaryDir dir;
    ProgressStore store;
    QString err;
    QVERIFY2(store.init(dir.filePath("db/progress.db"), &err), qPrintable(err));
    QVERIFY(store.isOpen());

    ProgressState s = makeState("batch-1", BatchStatus::Running, 4);
    s.etaSeconds = 12;
    s.currentFile = "a.exr";
    QVERIFY(store.save(s));

    const auto loaded = store.load("batch-1");
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->status, BatchStatus::Running);
    QCOMPARE(loaded->filesProcessed, 4);
    QCOMPARE(loaded->processedBytes, qint64(400));
    QCOMPARE(loaded->etaSeconds.value_or(-1), qint64(12));
    QCOMPARE(loaded->currentFile, QString("a.exr"));

    QVERIFY(!store.load("missing").has_value());
}

void TestProgressStore::testOverwriteKeepsLatest()
{
    QTemporaryDir dir;
    ProgressStore store;
    QVERIFY(store.init(dir.filePath("progress.db")));
    QVERIFY(store.save(makeState("b", BatchStatus::Running, 1)));
    QVERIFY(store.save(makeState("b", BatchStatus::Completed, 10)));
    QCOMPARE(store.listBatches().size(), 1);
    QCOMPARE(store.load("b")->status, BatchStatus::Completed);
    QCOMPARE(store.load("b")->filesProcessed, 10);
}

void TestProgressStore::testListAndRemove()
{
    QTemporaryDir dir;
    ProgressStore store;
    QVERIFY(store.init(dir.filePath("progress.db")));
    QVERIFY(store.save(makeState("one", BatchStatus::Completed)));
    QVERIFY(store.save(makeState("two", BatchStatus::Running)));

    QStringList ids = store.listBatches();
    ids.sort();
    QCOMPARE(ids, QStringList({"one", "two"}));

    QVERIFY(store.remove("one"));
    QVERIFY(!store.remove("one"));
    QCOMPARE(store.listBatches(), QStringList({"two"}));
}

void TestProgressStore::testMarkInterrupted()
{
    QTemporaryDir dir;
    const QString path = dir.filePath("progress.db");
    {
        ProgressStore first;
        QVERIFY(first.init(path));
        QVERIFY(first.save(makeState("done", BatchStatus::Completed, 10)));
        QVERIFY(first.save(makeState("crashed", BatchStatus::Running, 3)));
        QVERIFY(first.save(makeState("queued", BatchStatus::Starting)));
    }

    ProgressStore second;
    QVERIFY(second.init(path));
    QCOMPARE(second.markInterrupted(), 2);

    const auto crashed = second.load("crashed");
    QVERIFY(crashed.has_value());
    QCOMPARE(crashed->status, BatchStatus::Failed);
    QCOMPARE(crashed->message, QString("interrupted"));
    QCOMPARE(crashed->filesProcessed, 3);
    QCOMPARE(second.load("done")->status, BatchStatus::Completed);
    QCOMPARE(second.markInterrupted(), 0);
}

void TestProgressStore::testSaveFromWorkerThreads()
{
    QTemporaryDir dir;
    ProgressStore store;
    QVERIFY(store.init(dir.filePath("progress.db")));

    QList<int> ids;
    for (int i = 0; i < 16; ++i) ids << i;
    const QList<bool> saved = QtConcurrent::blockingMapped<QList<bool>>(ids, [&store](int i) {
        return store.save(makeState(QString("batch-%1").arg(i), BatchStatus::Running, i % 10));
    });
    QVERIFY(!saved.contains(false));
    QCOMPARE(store.listBatches().size(), 16);
}

void TestProgressStore::testSaveFromShortLivedThreads()
{
    QTemporaryDir dir;
    ProgressStore store;
    QVERIFY(store.init(dir.filePath("progress.db")));
    QCOMPARE(store.connectionCount(), 1);

    // Each thread exits before the next starts, so ids and QThread addresses get reused
    for (int i = 0; i < 4; ++i) {
        bool saved = false;
        bool loaded = false;
        const QString id = QString("thread-%1").arg(i);
        std::unique_ptr<QThread> thread(QThread::create([&store, &saved, &loaded, id, i]() {
            saved = store.save(makeState(id, BatchStatus::Running, i));
            loaded = store.load(id).has_value();
        }));
        thread->start();
        QVERIFY(thread->wait(10000));
        QVERIFY2(saved, qPrintable(id));
        QVERIFY(loaded);
        QCOMPARE(store.connectionCount(), 1);
    }
    QCOMPARE(store.listBatches().size(), 4);
    QCOMPARE(store.load("thread-3")->filesProcessed, 3);
}

void TestProgressStore::testClosedStore()
{
    ProgressStore store;
    QVERIFY(!store.isOpen());
    QVERIFY(!store.save(makeState("x", BatchStatus::Running)));
    QVERIFY(!store.load("x").has_value());
    QVERIFY(store.listBatches().isEmpty());
}

QTEST_GUILESS_MAIN(TestProgressStore)
#include "test_progress_store.moc"
