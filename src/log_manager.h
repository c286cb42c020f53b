#ifndef LOG_MANAGER_H
#define LOG_MANAGER_H

#include <QObject>
#include <QStringList>
#include <QMutex>
#include <QDateTime>
#include <QElapsedTimer>
#include <QFile>
#include <QTextStream>

// Central sink for qDebug/qInfo/qWarning/qCritical output.
// Keeps the most recent lines in memory and appends everything to a log file.
// addLog may be called from any thread.
class LogManager : public QObject {
    Q_OBJECT

public:
    static LogManager& instance() {
        static LogManager inst;
        return inst;
    }

    ~LogManager() override;

    // Opens (appends to) the log file; an empty path disables file output
    bool setLogFile(const QString& path, QString* errorOut = nullptr);

    // Mirror every line to stderr (on by default)
    void setEchoToStderr(bool echo);
    // Lines below this level are dropped: DEBUG, INFO, WARN, ERROR
    void setMinimumLevel(const QString& level);

    QStringList logs() const;

    void addLog(const QString& message, const QString& level = "INFO");
    void clear();
    void flush();

    // Routes Qt's message macros through LogManager
    static void install();

signals:
    void logAdded(const QString& message);

private:
    explicit LogManager(QObject* parent = nullptr);
    bool shouldFlushImmediately(const QString& level) const;
    static int levelRank(const QString& level);

    QStringList m_logs;
    mutable QMutex m_mutex;
    QFile m_file;
    QTextStream m_ts;
    QElapsedTimer m_sinceFlush;
    bool m_pendingFlush = false;
    bool m_echo = true;
    int m_minimumRank = 0;
    static constexpr int MAX_LOGS = 1000;
    static constexpr int FLUSH_INTERVAL_MS = 250;
};

// Custom message handler for qDebug/qWarning/qCritical
void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg);

#endif // LOG_MANAGER_H
