#ifndef PROGRESS_TRACKER_H
#define PROGRESS_TRACKER_H

#include <QString>
#include <QRecursiveMutex>
#include <QElapsedTimer>
#include <functional>

#include "cancellation_token.h"
#include "progress_state.h"
#include "progress_throttle.h"

/**
 * ProgressTracker owns the ProgressState of one batch. It is the only code
 * that mutates that state; every mutation happens inside one critical
 * section and workers only see snapshots.
 *
 * The listener runs while the tracker lock is held, so notifications are
 * delivered in mutation order and a listener that cancels the batch does so
 * before any other worker can record a further completion. The lock is
 * recursive: a listener may read snapshot(), but it must not record
 * progress itself.
 *
 * Once a terminal status is set the state is frozen.
 */
class ProgressTracker {
public:
    using Listener = std::function<void(const ProgressState& state, bool statusChanged)>;

    ProgressTracker(const QString& batchId, const QString& operation, int totalFiles, qint64 totalBytes,
                    const CancellationToken& token, int byteUpdateIntervalMs = 500);

    void setListener(Listener listener);

    void start();
    void setCurrentFile(const QString& name);
    void addBytes(qint64 bytes);

    // Returns false when the batch was cancelled first (unless acceptAfterCancel);
    // the caller then owns the cleanup of the file it produced.
    bool recordFileCompleted(const QString& name, bool acceptAfterCancel = false);
    void recordFileFailed(const QString& name, const QString& error);

    // Sets a terminal status; returns false if one was already set
    bool finish(BatchStatus status, const QString& message = QString());

    ProgressState snapshot() const;
    bool isFinished() const;

private:
    void updateEta();
    void notify(bool statusChanged);

    mutable QRecursiveMutex m_mutex;
    ProgressState m_state;
    CancellationToken m_token;
    Listener m_listener;
    QElapsedTimer m_clock;
    ProgressThrottle m_byteThrottle;
};

#endif // PROGRESS_TRACKER_H
