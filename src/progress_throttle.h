#pragma once
#include <QElapsedTimer>
#include <QMutex>
#include <QMutexLocker>

// Coalesces high-frequency progress updates. A forced update (status
// change, completion) always passes and restarts the interval.
class ProgressThrottle {
public:
    explicit ProgressThrottle(int intervalMs = 500) : m_intervalMs(intervalMs) {}

    bool shouldEmit(bool force = false) {
        QMutexLocker lk(&m_mutex);
        if (force || !m_timer.isValid() || m_timer.elapsed() >= m_intervalMs) {
            m_timer.restart();
            return true;
        }
        return false;
    }

    void reset() {
        QMutexLocker lk(&m_mutex);
        m_timer.invalidate();
    }

    void setIntervalMs(int intervalMs) {
        QMutexLocker lk(&m_mutex);
        m_intervalMs = intervalMs;
    }

private:
    QMutex m_mutex;
    QElapsedTimer m_timer;
    int m_intervalMs;
};
