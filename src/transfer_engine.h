#pragma once
#include <QObject>
#include <QFuture>
#include <QHash>
#include <QMutex>
#include <QStringList>
#include <QThreadPool>
#include <functional>
#include <memory>
#include <optional>

#include "cancellation_token.h"
#include "file_copier.h"
#include "progress_state.h"
#include "progress_throttle.h"
#include "progress_tracker.h"
#include "proposal.h"
#include "transfer_settings.h"

class ProgressStore;

/**
 * TransferEngine executes accepted proposals against the filesystem.
 *
 * Each submitted batch gets its own cancellation token and ProgressTracker,
 * owned by the engine and keyed by batch id. A coordinator thread feeds
 * member files to a bounded file pool (fileWorkers); large copies fan out
 * again into a per-file chunk pool (chunkWorkers). Sequence members are
 * independent work items, but a sequence is reported as one ItemResult.
 *
 * Per-file failures are recorded and the batch continues. Cancelling stops
 * new dispatch immediately; files already in flight clean up their partial
 * output. A cancelled batch always ends Cancelled.
 *
 * **Thread Safety:**
 * - submit/cancel/progress/waitForFinished may be called from any thread
 * - the progress callback runs on worker threads while the batch's progress
 *   lock is held; it may call cancel() and progress() but must not block
 * - signals are emitted from worker threads; connect with Qt::QueuedConnection
 *   when the receiver lives in a GUI thread
 */
class TransferEngine : public QObject {
    Q_OBJECT
public:
    using ProgressCallback = std::function<void(const ProgressState&)>;

    explicit TransferEngine(const TransferSettings& settings = TransferSettings(),
                            ProgressStore* store = nullptr, QObject* parent = nullptr);
    ~TransferEngine() override;

    // Starts the batch asynchronously. Returns the batch id, or an empty
    // string when a batch with the same id is still running.
    QString submit(const Batch& batch, ProgressCallback onProgress = {});

    // False when the batch is unknown or already finished
    bool cancel(const QString& batchId);
    void cancelAll();

    // Live state, or the persisted snapshot for batches not in memory
    std::optional<ProgressState> progress(const QString& batchId) const;

    BatchResult waitForFinished(const QString& batchId);
    bool isRunning(const QString& batchId) const;

    // Drops a finished batch from memory. Later progress() calls are answered
    // from the store. False when the batch is unknown or still running.
    bool release(const QString& batchId);
    // Releases every finished batch; returns how many were dropped
    int releaseFinished();
    int batchCount() const;

    const TransferSettings& settings() const { return m_settings; }

signals:
    void batchStarted(const QString& batchId);
    void progressChanged(const QString& batchId, int filesProcessed, int totalFiles);
    void batchFinished(const QString& batchId, bool success);

private:
    struct MemberTask {
        int itemIndex = 0;
        QString source;
        QString destination;
    };

    struct BatchContext {
        QString id;
        Batch batch;
        CancellationToken token;
        std::shared_ptr<ProgressTracker> tracker;
        ProgressCallback callback;
        ProgressThrottle persistThrottle;
        QFuture<BatchResult> future;
    };

    BatchResult runBatch(const std::shared_ptr<BatchContext>& ctx);
    TransferResult transferMember(const BatchContext& ctx, const MemberTask& task) const;
    static ItemResult summarizeItem(const Proposal& proposal, const QVector<TransferResult>& memberResults);
    void onProgress(BatchContext& ctx, const ProgressState& state, bool statusChanged);
    std::shared_ptr<BatchContext> find(const QString& batchId) const;

    TransferSettings m_settings;
    ProgressStore* m_store;
    FileCopier m_copier;
    QThreadPool m_coordinators;
    mutable QMutex m_mutex;
    QHash<QString, std::shared_ptr<BatchContext>> m_batches;
};
