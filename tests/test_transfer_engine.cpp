#include <QtTest>
#include <QTemporaryDir>
#include <QDirIterator>
#include <QFile>
#include <QSemaphore>
#include <QUuid>
#include <atomic>
#include <cerrno>
#include "../src/progress_store.h"
#include "../src/test_hooks.h"
#include "../src/transfer_engine.h"

class TestTransferEngine : public QObject {
    Q_OBJECT
private slots:
    void init();
    void cleanup();

    void testCopyBatch();
    void testMoveBatch();
    void testMoveAcrossVolumes();
    void testSkippedProposals();
    void testSequencePartialSuccess();
    void testCancelAfterThreeFiles();
    void testProgressPersisted();
    void testSnapshotsPersistedAcrossBatches();
    void testReleaseFinishedBatch();
    void testUnknownBatch();

private:
    QString makeSource(const QString& name, qint64 size);
    Proposal fileProposal(const QString& source, const QString& relativeDest) const;
    QStringList filesUnder(const QString& dir) const;

    QScopedPointer<QTemporaryDir> m_dir;
};

void TestTransferEngine::init()
{
    m_dir.reset(new QTemporaryDir());
    QVERIFY(m_dir->isValid());
    QVERIFY(QDir().mkpath(m_dir->filePath("in")));
    QVERIFY(QDir().mkpath(m_dir->filePath("out")));
}

void TestTransferEngine::cleanup()
{
    TestHooks::resetRenameProbe();
    TestHooks::resetChunkWriteProbe();
}

QString TestTransferEngine::makeSource(const QString& name, qint64 size)
{
    const QString path = m_dir->filePath("in/" + name);
    QFile f(path);
    if (f.open(QIODevice::WriteOnly)) {
        f.write("head");
        f.resize(size);
    }
    return path;
}

Proposal TestTransferEngine::fileProposal(const QString& source, const QString& relativeDest) const
{
    Proposal p;
    p.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    p.kind = Proposal::Kind::File;
    p.name = QFileInfo(source).fileName();
    p.sourcePath = source;
    p.sourcePaths << source;
    p.totalBytes = QFileInfo(source).size();
    p.destinationPath = m_dir->filePath("out/" + relativeDest);
    p.destinationDir = QFileInfo(*p.destinationPath).absolutePath();
    p.status = Proposal::Status::Auto;
    return p;
}

QStringList TestTransferEngine::filesUnder(const QString& dir) const
{
    QStringList files;
    QDirIterator it(dir, QDir::Files, QDirIterator::Subdirectories);
    while (it.hasNext()) files << it.next();
    files.sort();
    return files;
}

static TransferSettings testSettings()
{
    TransferSettings s;
    s.fileWorkers = 4;
    s.chunkWorkers = 4;
    s.smallFileThreshold = 64 * 1024;
    s.minChunkSize = 64 * 1024;
    s.subChunkSize = 16 * 1024;
    s.progressIntervalMs = 0;
    return s;
}

void TestTransferEngine::testCopyBatch()
{
    Batch batch;
    batch.operation = Batch::Operation::Copy;
    batch.proposals << fileProposal(makeSource("SC001_comp_v001.exr", 1000), "2D/Comp/SC001_comp_v001.exr");
    batch.proposals << fileProposal(makeSource("SC002_plate.mov", 500 * 1024), "footage/SC002_plate.mov");

    TransferEngine engine(testSettings());
    QSignalSpy finished(&engine, &TransferEngine::batchFinished);
    const QString id = engine.submit(batch);
    QVERIFY(!id.isEmpty());

    const BatchResult r = engine.waitForFinished(id);
    QCOMPARE(r.status, BatchStatus::Completed);
    QVERIFY(r.success);
    QCOMPARE(r.count(ItemResult::Outcome::Succeeded), 2);
    QCOMPARE(r.finalState.filesSucceeded, 2);
    QCOMPARE(r.finalState.filesProcessed, r.finalState.totalFiles);
    QCOMPARE(r.finalState.processedBytes, r.finalState.totalBytes);
    QCOMPARE(r.finalState.etaSeconds.value_or(-1), qint64(0));

    QCOMPARE(QFileInfo(m_dir->filePath("out/footage/SC002_plate.mov")).size(), qint64(500 * 1024));
    QVERIFY(QFile::exists(batch.proposals.at(0).sourcePath));
    QCOMPARE(filesUnder(m_dir->filePath("out")).size(), 2);
    QVERIFY(!engine.isRunning(id));
    QTRY_COMPARE(finished.count(), 1);
}

void TestTransferEngine::testMoveBatch()
{
    Batch batch;
    batch.operation = Batch::Operation::Move;
    for (int i = 0; i < 6; ++i) {
        const QString name = QString("SC%1_beauty_v001.exr").arg(i, 3, 10, QChar('0'));
        batch.proposals << fileProposal(makeSource(name, 2048), "3D/Renders/" + name);
    }

    TransferEngine engine(testSettings());
    const BatchResult r = engine.waitForFinished(engine.submit(batch));
    QCOMPARE(r.status, BatchStatus::Completed);
    QCOMPARE(r.finalState.filesSucceeded, 6);
    QVERIFY(filesUnder(m_dir->filePath("in")).isEmpty());
    QCOMPARE(filesUnder(m_dir->filePath("out")).size(), 6);
}

void TestTransferEngine::testMoveAcrossVolumes()
{
    TestHooks::setRenameProbe([](const QString&, const QString&) -> std::optional<int> { return EXDEV; });

    Batch batch;
    batch.operation = Batch::Operation::Move;
    batch.proposals << fileProposal(makeSource("big.mov", 300 * 1024), "footage/big.mov");

    TransferEngine engine(testSettings());
    const BatchResult r = engine.waitForFinished(engine.submit(batch));
    QCOMPARE(r.status, BatchStatus::Completed);
    QCOMPARE(r.items.size(), 1);
    QVERIFY(r.items.first().usedCopyFallback);
    QVERIFY(!QFile::exists(batch.proposals.first().sourcePath));
    QCOMPARE(QFileInfo(m_dir->filePath("out/footage/big.mov")).size(), qint64(300 * 1024));
}

void TestTransferEngine::testSkippedProposals()
{
    Proposal ambiguous = fileProposal(makeSource("SC001_beauty_fx.exr", 10), "x.exr");
    ambiguous.status = Proposal::Status::Ambiguous;
    ambiguous.destinationPath.reset();
    ambiguous.ambiguousOptions = { {"beauty", "3D/Renders"}, {"fx", "3D/FX"} };

    Proposal broken = fileProposal(makeSource("broken.exr", 10), "y.exr");
    broken.status = Proposal::Status::Error;
    broken.errorMessage = QStringLiteral("No output root configured");

    Batch batch;
    batch.proposals << ambiguous << fileProposal(makeSource("ok.exr", 10), "ok.exr") << broken;

    TransferEngine engine(testSettings());
    const BatchResult r = engine.waitForFinished(engine.submit(batch));
    QCOMPARE(r.status, BatchStatus::CompletedWithErrors);
    QVERIFY(!r.success);
    QCOMPARE(r.items.size(), 3);
    QCOMPARE(r.items.at(0).outcome, ItemResult::Outcome::Skipped);
    QCOMPARE(r.items.at(0).errorKind, TransferErrorKind::AmbiguousMapping);
    QCOMPARE(r.items.at(1).outcome, ItemResult::Outcome::Succeeded);
    QCOMPARE(r.items.at(2).errorKind, TransferErrorKind::InvalidProposal);
    QCOMPARE(r.finalState.filesFailed, 2);
    QCOMPARE(r.finalState.filesSucceeded, 1);
    QCOMPARE(r.errors.size(), 2);
    QCOMPARE(filesUnder(m_dir->filePath("out")), QStringList({m_dir->filePath("out/ok.exr")}));
}

void TestTransferEngine::testSequencePartialSuccess()
{
    Proposal seq;
    seq.id = "seq-1";
    seq.kind = Proposal::Kind::Sequence;
    seq.name = "SC010_comp_v002.####.exr";
    seq.sourcePath = m_dir->filePath("in/" + seq.name);
    for (int f = 1001; f <= 1004; ++f)
        seq.sourcePaths << makeSource(QString("SC010_comp_v002.%1.exr").arg(f), 256);
    seq.totalBytes = 4 * 256;
    seq.destinationDir = m_dir->filePath("out/2D/Comp/SC010");
    seq.destinationPath = seq.destinationDir + "/" + seq.name;
    seq.status = Proposal::Status::Auto;
    seq.frameCount = 4;

    // One frame vanished between mapping and transfer
    QVERIFY(QFile::remove(seq.sourcePaths.at(2)));

    Batch batch;
    batch.proposals << seq;
    TransferEngine engine(testSettings());
    const BatchResult r = engine.waitForFinished(engine.submit(batch));
    QCOMPARE(r.status, BatchStatus::CompletedWithErrors);
    QCOMPARE(r.items.size(), 1);
    const ItemResult& item = r.items.first();
    QCOMPARE(item.outcome, ItemResult::Outcome::PartialSuccess);
    QCOMPARE(item.membersTotal, 4);
    QCOMPARE(item.membersSucceeded, 3);
    QCOMPARE(item.errorKind, TransferErrorKind::PathNotFound);
    QCOMPARE(r.finalState.totalFiles, 4);
    QVERIFY(QFile::exists(seq.destinationDir + "/SC010_comp_v002.1001.exr"));
    QVERIFY(!QFile::exists(seq.destinationDir + "/SC010_comp_v002.1003.exr"));
}

void TestTransferEngine::testCancelAfterThreeFiles()
{
    const qint64 size = 20 * TransferSettings::MB;
    Batch batch;
    batch.operation = Batch::Operation::Copy;
    for (int i = 0; i < 10; ++i) {
        const QString name = QString("plate_%1.mov").arg(i);
        batch.proposals << fileProposal(makeSource(name, size), "footage/" + name);
    }

    TransferSettings settings;
    settings.fileWorkers = 4;
    settings.progressIntervalMs = 0;
    TransferEngine engine(settings);

    // The callback runs on a worker thread, so it only records what happened
    std::atomic_int cancelRequests{0};
    std::atomic_bool cancelAccepted{false};
    const QString id = engine.submit(batch, [&engine, &cancelRequests, &cancelAccepted](const ProgressState& s) {
        if (s.filesSucceeded == 3 && cancelRequests.load() == 0) {
            ++cancelRequests;
            cancelAccepted = engine.cancel(s.batchId);
        }
    });
    QVERIFY(!id.isEmpty());

    const BatchResult r = engine.waitForFinished(id);
    QCOMPARE(cancelRequests.load(), 1);
    QVERIFY(cancelAccepted.load());
    QCOMPARE(r.status, BatchStatus::Cancelled);
    QVERIFY(!r.success);
    QCOMPARE(r.finalState.filesSucceeded, 3);
    QCOMPARE(r.finalState.filesFailed, 0);

    const QStringList written = filesUnder(m_dir->filePath("out"));
    QCOMPARE(written.size(), 3);
    for (const QString& path : written) {
        QVERIFY2(!path.contains(".chunk"), qPrintable(path));
        QCOMPARE(QFileInfo(path).size(), size);
    }
    QCOMPARE(filesUnder(m_dir->filePath("in")).size(), 10);
    QVERIFY(!engine.cancel(id));
}

void TestTransferEngine::testProgressPersisted()
{
    ProgressStore store;
    QVERIFY(store.init(m_dir->filePath("progress.db")));

    Batch batch;
    batch.batchId = "persisted-batch";
    batch.proposals << fileProposal(makeSource("a.exr", 100), "a.exr");
    batch.proposals << fileProposal(makeSource("b.exr", 100), "b.exr");

    int callbacks = 0;
    {
        TransferEngine engine(testSettings(), &store);
        const QString id = engine.submit(batch, [&callbacks](const ProgressState&) { ++callbacks; });
        QCOMPARE(id, QString("persisted-batch"));
        const BatchResult r = engine.waitForFinished(id);
        QCOMPARE(r.status, BatchStatus::Completed);

        const auto live = engine.progress(id);
        QVERIFY(live.has_value());
        QCOMPARE(live->filesSucceeded, 2);
    }
    QVERIFY(callbacks >= 3);

    const auto saved = store.load("persisted-batch");
    QVERIFY(saved.has_value());
    QCOMPARE(saved->status, BatchStatus::Completed);
    QCOMPARE(saved->filesSucceeded, 2);

    // A new engine still answers from the store
    TransferEngine later(testSettings(), &store);
    QCOMPARE(later.progress("persisted-batch")->status, BatchStatus::Completed);
}

void TestTransferEngine::testSnapshotsPersistedAcrossBatches()
{
    ProgressStore store;
    QVERIFY(store.init(m_dir->filePath("progress.db")));
    TransferEngine engine(testSettings(), &store);

    // Every batch runs on a fresh file pool whose threads exit afterwards
    for (int round = 0; round < 3; ++round) {
        Batch batch;
        batch.operation = Batch::Operation::Copy;
        batch.batchId = QString("round-%1").arg(round);
        for (int i = 0; i < 6; ++i) {
            const QString name = QString("r%1_f%2.exr").arg(round).arg(i);
            batch.proposals << fileProposal(makeSource(name, 4096), QString("r%1/%2").arg(round).arg(name));
        }

        std::atomic<int> midBatchSnapshots{0};
        const QString batchId = batch.batchId;
        const QString id = engine.submit(batch, [&store, &midBatchSnapshots, batchId](const ProgressState& s) {
            if (s.status != BatchStatus::Running || s.filesProcessed < 2) return;
            const auto saved = store.load(batchId);
            if (saved && !isTerminal(saved->status) && saved->filesProcessed >= 1)
                ++midBatchSnapshots;
        });
        QCOMPARE(id, batchId);
        const BatchResult r = engine.waitForFinished(id);
        QCOMPARE(r.status, BatchStatus::Completed);
        QVERIFY2(midBatchSnapshots.load() > 0, qPrintable(batchId));
        QCOMPARE(store.load(batchId)->status, BatchStatus::Completed);
        QVERIFY(engine.release(id));
    }
    QCOMPARE(store.listBatches().size(), 3);
}

void TestTransferEngine::testReleaseFinishedBatch()
{
    ProgressStore store;
    QVERIFY(store.init(m_dir->filePath("progress.db")));
    TransferEngine engine(testSettings(), &store);

    Batch batch;
    batch.operation = Batch::Operation::Copy;
    batch.batchId = "release-me";
    batch.proposals << fileProposal(makeSource("a.mov", 256 * 1024), "a.mov");

    // Hold the first chunk write of the large file until released
    QSemaphore entered;
    QSemaphore gate;
    std::atomic_bool held{false};
    TestHooks::setChunkWriteProbe([&entered, &gate, &held](const QString&, int) {
        if (!held.exchange(true)) {
            entered.release();
            gate.acquire();
        }
        return false;
    });
    const QString id = engine.submit(batch);
    QVERIFY(entered.tryAcquire(1, 10000));
    QVERIFY(!engine.release(id));
    QCOMPARE(engine.batchCount(), 1);
    gate.release();

    QCOMPARE(engine.waitForFinished(id).status, BatchStatus::Completed);
    QVERIFY(engine.release(id));
    QVERIFY(!engine.release(id));
    QCOMPARE(engine.batchCount(), 0);

    const auto fromStore = engine.progress(id);
    QVERIFY(fromStore.has_value());
    QCOMPARE(fromStore->status, BatchStatus::Completed);
    QCOMPARE(engine.waitForFinished(id).status, BatchStatus::Failed);

    // releaseFinished sweeps everything that is done
    batch.batchId.clear();
    batch.proposals = {fileProposal(makeSource("b.exr", 100), "b.exr")};
    const QString first = engine.submit(batch);
    batch.proposals = {fileProposal(makeSource("c.exr", 100), "c.exr")};
    const QString second = engine.submit(batch);
    engine.waitForFinished(first);
    engine.waitForFinished(second);
    QCOMPARE(engine.batchCount(), 2);
    QCOMPARE(engine.releaseFinished(), 2);
    QCOMPARE(engine.batchCount(), 0);
}

void TestTransferEngine::testUnknownBatch()
{
    TransferEngine engine;
    QVERIFY(!engine.cancel("nope"));
    QVERIFY(!engine.progress("nope").has_value());
    const BatchResult r = engine.waitForFinished("nope");
    QCOMPARE(r.status, BatchStatus::Failed);
    QVERIFY(!r.errors.isEmpty());
}

QTEST_GUILESS_MAIN(TestTransferEngine)
#include "test_transfer_engine.moc"
