#pragma once
#include <QString>
#include <QStringList>
#include <QSqlDatabase>
#include <QHash>
#include <QMetaObject>
#include <QMutex>
#include <optional>

#include "progress_state.h"

class QThread;

// Keeps the latest ProgressState of every batch in SQLite so a batch that
// dies mid-flight can still be inspected after a restart.
// Safe to use from any thread: each thread gets its own named connection,
// which is closed and removed when that thread finishes.
class ProgressStore {
public:
    ProgressStore();
    ~ProgressStore();
    Q_DISABLE_COPY(ProgressStore)

    bool init(const QString& dbFilePath, QString* errorOut = nullptr);
    bool isOpen() const { return !m_path.isEmpty(); }
    QString path() const { return m_path; }

    bool save(const ProgressState& state);
    std::optional<ProgressState> load(const QString& batchId);
    QStringList listBatches();
    bool remove(const QString& batchId);

    // Batches still Starting/Running from a previous process become Failed
    int markInterrupted();

    // Connections currently registered for this store, one per live thread
    int connectionCount() const;

private:
    struct ThreadConnection {
        QString name;
        QMetaObject::Connection finishedHook;
    };

    QSqlDatabase connection();
    void dropConnection(QThread* thread);
    bool migrate(QSqlDatabase& db);
    bool exec(QSqlDatabase& db, const QString& sql);

    QString m_path;
    QString m_connectionPrefix;
    mutable QMutex m_mutex;
    QHash<QThread*, ThreadConnection> m_connections;
    quint64 m_connectionSerial = 0;
};
