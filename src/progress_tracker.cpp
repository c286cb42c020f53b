#include "progress_tracker.h"
#include <QMutexLocker>
#include <QDebug>
#include <cmath>

ProgressTracker::ProgressTracker(const QString& batchId, const QString& operation, int totalFiles,
                                 qint64 totalBytes, const CancellationToken& token, int byteUpdateIntervalMs)
    : m_token(token)
    , m_byteThrottle(byteUpdateIntervalMs)
{
    m_state.batchId = batchId;
    m_state.operation = operation;
    m_state.totalFiles = totalFiles;
    m_state.totalBytes = totalBytes;
    m_state.status = BatchStatus::Starting;
    m_state.startedAt = QDateTime::currentDateTimeUtc();
    m_state.updatedAt = m_state.startedAt;
    m_clock.start();
}

void ProgressTracker::setListener(Listener listener)
{
    QMutexLocker lk(&m_mutex);
    m_listener = std::move(listener);
}

void ProgressTracker::notify(bool statusChanged)
{
    m_state.updatedAt = QDateTime::currentDateTimeUtc();
    if (m_listener) m_listener(m_state, statusChanged);
}

void ProgressTracker::start()
{
    QMutexLocker lk(&m_mutex);
    if (m_state.status != BatchStatus::Starting) return;
    m_state.status = BatchStatus::Running;
    m_clock.restart();
    notify(true);
}

void ProgressTracker::setCurrentFile(const QString& name)
{
    QMutexLocker lk(&m_mutex);
    if (isTerminal(m_state.status)) return;
    m_state.currentFile = name;
}

void ProgressTracker::addBytes(qint64 bytes)
{
    QMutexLocker lk(&m_mutex);
    if (isTerminal(m_state.status)) return;
    m_state.processedBytes += bytes;
    if (m_byteThrottle.shouldEmit()) notify(false);
}

void ProgressTracker::updateEta()
{
    if (m_state.filesProcessed <= 0) {
        m_state.etaSeconds.reset();
        return;
    }
    const double elapsed = qMax<qint64>(1, m_clock.elapsed()) / 1000.0;
    const double filesPerSecond = m_state.filesProcessed / elapsed;
    const int remaining = qMax(0, m_state.totalFiles - m_state.filesProcessed);
    m_state.etaSeconds = static_cast<qint64>(std::ceil(remaining / filesPerSecond));
}

bool ProgressTracker::recordFileCompleted(const QString& name, bool acceptAfterCancel)
{
    QMutexLocker lk(&m_mutex);
    if (isTerminal(m_state.status)) return false;
    if (m_token.isCancelled() && !acceptAfterCancel) {
        qDebug() << "[Transfer] Discarding" << name << "completed after cancellation";
        return false;
    }
    ++m_state.filesProcessed;
    ++m_state.filesSucceeded;
    m_state.currentFile = name;
    updateEta();
    notify(false);
    return true;
}

void ProgressTracker::recordFileFailed(const QString& name, const QString& error)
{
    QMutexLocker lk(&m_mutex);
    if (isTerminal(m_state.status)) return;
    ++m_state.filesProcessed;
    ++m_state.filesFailed;
    m_state.currentFile = name;
    m_state.message = error;
    updateEta();
    notify(false);
}

bool ProgressTracker::finish(BatchStatus status, const QString& message)
{
    QMutexLocker lk(&m_mutex);
    if (isTerminal(m_state.status)) return false;
    m_state.status = status;
    m_state.currentFile.clear();
    if (!message.isEmpty()) m_state.message = message;
    if (status == BatchStatus::Completed || status == BatchStatus::CompletedWithErrors)
        m_state.etaSeconds = 0;
    notify(true);
    return true;
}

ProgressState ProgressTracker::snapshot() const
{
    QMutexLocker lk(&m_mutex);
    return m_state;
}

bool ProgressTracker::isFinished() const
{
    QMutexLocker lk(&m_mutex);
    return isTerminal(m_state.status);
}
