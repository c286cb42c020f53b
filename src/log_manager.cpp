#include "log_manager.h"
#include "file_utils.h"

#include <QMutexLocker>
#include <cstdio>

LogManager::LogManager(QObject* parent) : QObject(parent) {
    m_sinceFlush.start();
}

LogManager::~LogManager() {
    flush();
}

bool LogManager::setLogFile(const QString& path, QString* errorOut) {
    QMutexLocker locker(&m_mutex);
    if (m_file.isOpen()) {
        m_ts.flush();
        m_ts.setDevice(nullptr);
        m_file.close();
    }
    if (path.isEmpty()) return true;

    if (!FileUtils::ensureParentDir(path, errorOut)) return false;
    m_file.setFileName(path);
    if (!m_file.open(QIODevice::Append | QIODevice::Text)) {
        if (errorOut) *errorOut = QString("Cannot open log file %1: %2").arg(path, m_file.errorString());
        return false;
    }
    m_ts.setDevice(&m_file);
    m_ts << "\n--- session start " << QDateTime::currentDateTime().toString(Qt::ISODate) << " ---\n";
    m_ts.flush();
    return true;
}

void LogManager::setEchoToStderr(bool echo) {
    QMutexLocker locker(&m_mutex);
    m_echo = echo;
}

void LogManager::setMinimumLevel(const QString& level) {
    QMutexLocker locker(&m_mutex);
    m_minimumRank = levelRank(level);
}

int LogManager::levelRank(const QString& level) {
    const QString upper = level.toUpper();
    if (upper == "DEBUG") return 0;
    if (upper == "INFO") return 1;
    if (upper == "WARN") return 2;
    return 3;
}

QStringList LogManager::logs() const {
    QMutexLocker locker(&m_mutex);
    return m_logs;
}

void LogManager::addLog(const QString& message, const QString& level) {
    QString logEntry;
    {
        QMutexLocker locker(&m_mutex);
        if (levelRank(level) < m_minimumRank) return;

        QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
        logEntry = QString("[%1] [%2] %3").arg(timestamp, level, message);
        m_logs.append(logEntry);
        if (m_logs.size() > MAX_LOGS) {
            m_logs.removeFirst();
        }

        if (m_echo) {
            fprintf(stderr, "%s\n", logEntry.toLocal8Bit().constData());
            fflush(stderr);
        }

        // Write-through to disk; routine lines are flushed at most every FLUSH_INTERVAL_MS
        if (m_ts.device()) {
            m_ts << logEntry << '\n';
            m_pendingFlush = true;
            if (shouldFlushImmediately(level) || m_sinceFlush.elapsed() >= FLUSH_INTERVAL_MS) {
                m_ts.flush();
                m_pendingFlush = false;
                m_sinceFlush.restart();
            }
        }
    } // unlock before emitting so receivers may log

    emit logAdded(logEntry);
}

void LogManager::flush() {
    QMutexLocker locker(&m_mutex);
    if (m_pendingFlush && m_ts.device()) {
        m_ts.flush();
    }
    m_pendingFlush = false;
    m_sinceFlush.restart();
}

bool LogManager::shouldFlushImmediately(const QString& level) const {
    const QString upper = level.toUpper();
    return upper == "WARN" || upper == "ERROR" || upper == "FATAL";
}

void LogManager::clear() {
    QMutexLocker locker(&m_mutex);
    m_logs.clear();
}

void LogManager::install() {
    instance();
    qInstallMessageHandler(customMessageHandler);
}

void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    Q_UNUSED(context);
    QString level;
    switch (type) {
        case QtDebugMsg:
            level = "DEBUG";
            break;
        case QtInfoMsg:
            level = "INFO";
            break;
        case QtWarningMsg:
            level = "WARN";
            break;
        case QtCriticalMsg:
            level = "ERROR";
            break;
        case QtFatalMsg:
            level = "FATAL";
            break;
    }

    // Worker threads log too; addLog serializes them
    LogManager::instance().addLog(msg, level);
    if (type == QtFatalMsg) {
        LogManager::instance().flush();
    }
}
