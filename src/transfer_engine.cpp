#include "transfer_engine.h"
#include "file_utils.h"
#include "progress_store.h"

#include <QtConcurrent>
#include <QFileInfo>
#include <QMutexLocker>
#include <QSemaphore>
#include <QUuid>
#include <QDebug>

#include <exception>

static TransferSettings clamped(TransferSettings settings)
{
    settings.clamp();
    return settings;
}

TransferEngine::TransferEngine(const TransferSettings& settings, ProgressStore* store, QObject* parent)
    : QObject(parent)
    , m_settings(clamped(settings))
    , m_store(store)
    , m_copier(m_settings)
{
    m_coordinators.setMaxThreadCount(4);
}

TransferEngine::~TransferEngine()
{
    cancelAll();
    m_coordinators.waitForDone();
}

std::shared_ptr<TransferEngine::BatchContext> TransferEngine::find(const QString& batchId) const
{
    QMutexLocker lk(&m_mutex);
    return m_batches.value(batchId);
}

QString TransferEngine::submit(const Batch& batch, ProgressCallback onProgress)
{
    auto ctx = std::make_shared<BatchContext>();
    ctx->id = batch.batchId.isEmpty() ? QUuid::createUuid().toString(QUuid::WithoutBraces) : batch.batchId;
    ctx->batch = batch;
    ctx->batch.batchId = ctx->id;
    ctx->callback = std::move(onProgress);
    ctx->persistThrottle.setIntervalMs(m_settings.progressIntervalMs);

    int totalFiles = 0;
    qint64 totalBytes = 0;
    for (const Proposal& p : batch.proposals) {
        totalFiles += qMax(1, p.sourcePaths.size());
        totalBytes += p.totalBytes;
    }
    ctx->tracker = std::make_shared<ProgressTracker>(ctx->id, operationToString(batch.operation), totalFiles,
                                                     totalBytes, ctx->token, m_settings.progressIntervalMs);
    BatchContext* raw = ctx.get();
    ctx->tracker->setListener([this, raw](const ProgressState& state, bool statusChanged) {
        onProgress(*raw, state, statusChanged);
    });

    // The tracker lock is never taken while m_mutex is held
    if (auto existing = find(ctx->id); existing && !existing->tracker->isFinished()) {
        qWarning() << "[Transfer] Batch" << ctx->id << "is already running";
        return QString();
    }
    {
        QMutexLocker lk(&m_mutex);
        m_batches.insert(ctx->id, ctx);
        ctx->future = QtConcurrent::run(&m_coordinators, [this, ctx]() { return runBatch(ctx); });
    }

    qInfo() << "[Transfer] Submitted batch" << ctx->id << operationToString(batch.operation)
            << batch.proposals.size() << "proposals," << totalFiles << "files";
    return ctx->id;
}

bool TransferEngine::cancel(const QString& batchId)
{
    auto ctx = find(batchId);
    if (!ctx || ctx->tracker->isFinished()) return false;
    if (!ctx->token.isCancelled()) {
        ctx->token.cancel();
        qInfo() << "[Transfer] Cancel requested for batch" << batchId;
    }
    return true;
}

void TransferEngine::cancelAll()
{
    QList<std::shared_ptr<BatchContext>> all;
    {
        QMutexLocker lk(&m_mutex);
        all = m_batches.values();
    }
    for (const auto& ctx : all)
        ctx->token.cancel();
}

std::optional<ProgressState> TransferEngine::progress(const QString& batchId) const
{
    if (auto ctx = find(batchId)) return ctx->tracker->snapshot();
    if (m_store) return m_store->load(batchId);
    return std::nullopt;
}

BatchResult TransferEngine::waitForFinished(const QString& batchId)
{
    QFuture<BatchResult> future;
    {
        QMutexLocker lk(&m_mutex);
        auto ctx = m_batches.value(batchId);
        if (!ctx) {
            BatchResult missing;
            missing.batchId = batchId;
            missing.status = BatchStatus::Failed;
            missing.errors << QString("Unknown batch %1").arg(batchId);
            return missing;
        }
        future = ctx->future;
    }
    return future.result();
}

bool TransferEngine::isRunning(const QString& batchId) const
{
    auto ctx = find(batchId);
    return ctx && !ctx->tracker->isFinished();
}

bool TransferEngine::release(const QString& batchId)
{
    auto ctx = find(batchId);
    if (!ctx || !ctx->tracker->isFinished()) return false;
    // The coordinator may still be emitting batchFinished
    ctx->future.waitForFinished();

    QMutexLocker lk(&m_mutex);
    if (m_batches.value(batchId) != ctx) return false;
    m_batches.remove(batchId);
    qDebug() << "[Transfer] Released batch" << batchId;
    return true;
}

int TransferEngine::releaseFinished()
{
    QList<std::shared_ptr<BatchContext>> all;
    {
        QMutexLocker lk(&m_mutex);
        all = m_batches.values();
    }
    int released = 0;
    for (const auto& ctx : all) {
        if (release(ctx->id)) ++released;
    }
    return released;
}

int TransferEngine::batchCount() const
{
    QMutexLocker lk(&m_mutex);
    return m_batches.size();
}

void TransferEngine::onProgress(BatchContext& ctx, const ProgressState& state, bool statusChanged)
{
    if (ctx.callback) ctx.callback(state);
    emit progressChanged(ctx.id, state.filesProcessed, state.totalFiles);
    if (m_store && (statusChanged || ctx.persistThrottle.shouldEmit()))
        m_store->save(state);
}

TransferResult TransferEngine::transferMember(const BatchContext& ctx, const MemberTask& task) const
{
    const QString name = QFileInfo(task.source).fileName();
    ctx.tracker->setCurrentFile(name);

    std::shared_ptr<ProgressTracker> tracker = ctx.tracker;
    auto onBytes = [tracker](qint64 bytes) { tracker->addBytes(bytes); };

    const bool isMove = ctx.batch.operation == Batch::Operation::Move;
    TransferResult r = isMove ? m_copier.moveFile(task.source, task.destination, ctx.token, onBytes)
                              : m_copier.copyFile(task.source, task.destination, ctx.token, onBytes);

    if (r.ok()) {
        // A finished move cannot be rolled back, so it counts even if a cancel raced it
        if (!ctx.tracker->recordFileCompleted(name, isMove)) {
            FileUtils::removeIfExists(task.destination);
            return TransferResult::cancelledResult();
        }
        if (r.usedCopyFallback)
            qDebug() << "[Transfer] Moved across volumes:" << name;
        return r;
    }
    if (!r.cancelled()) {
        qWarning() << "[Transfer]" << errorKindToString(r.kind) << name << r.message;
        ctx.tracker->recordFileFailed(name, r.message);
    }
    return r;
}

ItemResult TransferEngine::summarizeItem(const Proposal& proposal, const QVector<TransferResult>& memberResults)
{
    ItemResult item;
    item.proposalId = proposal.id;
    item.name = proposal.name;
    item.membersTotal = memberResults.size();

    int cancelled = 0;
    const TransferResult* firstFailure = nullptr;
    for (const TransferResult& r : memberResults) {
        if (r.ok()) ++item.membersSucceeded;
        else if (r.cancelled()) ++cancelled;
        else if (!firstFailure) firstFailure = &r;
        if (r.usedCopyFallback) item.usedCopyFallback = true;
    }

    if (item.membersSucceeded == item.membersTotal) {
        item.outcome = ItemResult::Outcome::Succeeded;
    } else if (item.membersSucceeded > 0) {
        item.outcome = ItemResult::Outcome::PartialSuccess;
        item.errorKind = firstFailure ? firstFailure->kind : TransferErrorKind::Cancelled;
        item.message = QString("%1 of %2 frames transferred").arg(item.membersSucceeded).arg(item.membersTotal);
        if (firstFailure) item.message += ": " + firstFailure->message;
    } else if (!firstFailure && cancelled > 0) {
        item.outcome = ItemResult::Outcome::Cancelled;
        item.errorKind = TransferErrorKind::Cancelled;
    } else {
        item.outcome = ItemResult::Outcome::Failed;
        item.errorKind = firstFailure ? firstFailure->kind : TransferErrorKind::IoError;
        item.message = firstFailure ? firstFailure->message : QString();
    }
    return item;
}

BatchResult TransferEngine::runBatch(const std::shared_ptr<BatchContext>& ctx)
{
    BatchResult result;
    result.batchId = ctx->id;
    const QVector<Proposal>& proposals = ctx->batch.proposals;

    emit batchStarted(ctx->id);
    ctx->tracker->start();

    try {
        QVector<MemberTask> tasks;
        QVector<QVector<int>> itemTasks(proposals.size());
        QVector<bool> skipped(proposals.size(), false);

        for (int i = 0; i < proposals.size(); ++i) {
            const Proposal& p = proposals.at(i);
            if (!p.isTransferable() || p.sourcePaths.isEmpty()) {
                skipped[i] = true;
                continue;
            }
            for (const QString& src : p.sourcePaths) {
                itemTasks[i].append(tasks.size());
                tasks.append({i, src, p.destinationFor(src)});
            }
        }

        // Unusable proposals are failures of the batch, not of the engine
        QHash<int, ItemResult> skippedItems;
        for (int i = 0; i < proposals.size(); ++i) {
            if (!skipped.at(i)) continue;
            const Proposal& p = proposals.at(i);
            ItemResult item;
            item.proposalId = p.id;
            item.name = p.name;
            item.outcome = ItemResult::Outcome::Skipped;
            item.membersTotal = qMax(1, p.sourcePaths.size());
            if (p.status == Proposal::Status::Ambiguous) {
                item.errorKind = TransferErrorKind::AmbiguousMapping;
                item.message = QStringLiteral("Ambiguous mapping has no destination");
            } else {
                item.errorKind = TransferErrorKind::InvalidProposal;
                item.message = p.errorMessage.value_or(QStringLiteral("Proposal has no destination"));
            }
            for (int m = 0; m < item.membersTotal; ++m)
                ctx->tracker->recordFileFailed(p.name, item.message);
            skippedItems.insert(i, item);
        }

        std::vector<TransferResult> memberResults(static_cast<size_t>(tasks.size()),
                                                  TransferResult::cancelledResult());
        QThreadPool filePool;
        filePool.setMaxThreadCount(m_settings.fileWorkers);
        QSemaphore freeWorkers(m_settings.fileWorkers);

        // A worker slot is taken before dispatch, so nothing new starts once cancelled
        for (int t = 0; t < tasks.size(); ++t) {
            freeWorkers.acquire();
            if (ctx->token.isCancelled()) {
                freeWorkers.release();
                break;
            }
            const MemberTask task = tasks.at(t);
            filePool.start([this, ctx, task, t, &memberResults, &freeWorkers]() {
                memberResults[static_cast<size_t>(t)] = transferMember(*ctx, task);
                freeWorkers.release();
            });
        }
        filePool.waitForDone();

        for (int i = 0; i < proposals.size(); ++i) {
            const Proposal& p = proposals.at(i);
            if (skipped.at(i)) {
                const ItemResult item = skippedItems.value(i);
                result.items.append(item);
                result.errors << QString("%1: %2").arg(item.name, item.message);
                continue;
            }
            QVector<TransferResult> members;
            for (int t : itemTasks.at(i))
                members.append(memberResults[static_cast<size_t>(t)]);
            ItemResult item = summarizeItem(p, members);
            if (item.outcome == ItemResult::Outcome::PartialSuccess)
                qWarning() << "[Transfer] Partial sequence transfer" << p.name << item.message;
            if (item.outcome == ItemResult::Outcome::Failed || item.outcome == ItemResult::Outcome::PartialSuccess)
                result.errors << QString("%1: %2").arg(item.name, item.message);
            result.items.append(item);
        }
    } catch (const std::exception& e) {
        qCritical() << "[Transfer] Batch" << ctx->id << "aborted:" << e.what();
        result.errors << QString::fromUtf8(e.what());
        ctx->tracker->finish(BatchStatus::Failed, QString::fromUtf8(e.what()));
        result.status = BatchStatus::Failed;
        result.finalState = ctx->tracker->snapshot();
        emit batchFinished(ctx->id, false);
        return result;
    }

    const bool cancelled = ctx->token.isCancelled();
    const int failures = ctx->tracker->snapshot().filesFailed;
    if (cancelled) result.status = BatchStatus::Cancelled;
    else if (failures > 0) result.status = BatchStatus::CompletedWithErrors;
    else result.status = BatchStatus::Completed;
    result.success = !cancelled && failures == 0;

    ctx->tracker->finish(result.status);
    result.finalState = ctx->tracker->snapshot();

    qInfo() << "[Transfer] Batch" << ctx->id << batchStatusToString(result.status)
            << "succeeded:" << result.finalState.filesSucceeded
            << "failed:" << result.finalState.filesFailed
            << "of" << result.finalState.totalFiles;
    emit batchFinished(ctx->id, result.success);
    return result;
}
