#include "progress_store.h"

#include <QDir>
#include <QFileInfo>
#include <QJsonDocument>
#include <QMutexLocker>
#include <QSqlError>
#include <QSqlQuery>
#include <QThread>
#include <QUuid>
#include <QDebug>

ProgressStore::ProgressStore()
    : m_connectionPrefix(QStringLiteral("progress_store_") + QUuid::createUuid().toString(QUuid::Id128))
{
}

ProgressStore::~ProgressStore()
{
    QMutexLocker lk(&m_mutex);
    for (auto it = m_connections.cbegin(); it != m_connections.cend(); ++it) {
        QObject::disconnect(it->finishedHook);
        if (it.key() == QThread::currentThread()) {
            QSqlDatabase db = QSqlDatabase::database(it->name, false);
            if (db.isOpen()) db.close();
        }
        QSqlDatabase::removeDatabase(it->name);
    }
    m_connections.clear();
}

bool ProgressStore::init(const QString& dbFilePath, QString* errorOut)
{
    QFileInfo fi(dbFilePath);
    if (!QDir().mkpath(fi.absolutePath())) {
        if (errorOut) *errorOut = QString("Cannot create directory for %1").arg(dbFilePath);
        return false;
    }
    {
        QMutexLocker lk(&m_mutex);
        m_path = fi.absoluteFilePath();
    }

    QSqlDatabase db = connection();
    if (!db.isOpen()) {
        if (errorOut) *errorOut = db.lastError().text();
        QMutexLocker lk(&m_mutex);
        m_path.clear();
        return false;
    }
    QMutexLocker lk(&m_mutex);
    if (!migrate(db)) {
        if (errorOut) *errorOut = QStringLiteral("Progress database migration failed");
        return false;
    }
    qInfo() << "[ProgressStore] Using" << m_path;
    return true;
}

QSqlDatabase ProgressStore::connection()
{
    QThread* thread = QThread::currentThread();
    QMutexLocker lk(&m_mutex);
    const auto it = m_connections.constFind(thread);
    if (it != m_connections.cend()) return QSqlDatabase::database(it->name);

    // Serial names: thread ids and QThread addresses are both reused
    const QString name = QString("%1_%2").arg(m_connectionPrefix).arg(++m_connectionSerial);
    QSqlDatabase db = QSqlDatabase::addDatabase("QSQLITE", name);
    db.setDatabaseName(m_path);
    db.setConnectOptions(QStringLiteral("QSQLITE_BUSY_TIMEOUT=5000"));
    if (!db.open()) {
        qWarning() << "[ProgressStore] Open failed:" << db.lastError();
    }

    ThreadConnection entry;
    entry.name = name;
    // finished is emitted on the exiting thread itself, which owns the connection
    entry.finishedHook = QObject::connect(thread, &QThread::finished, thread,
                                          [this, thread]() { dropConnection(thread); },
                                          Qt::DirectConnection);
    m_connections.insert(thread, entry);
    return db;
}

void ProgressStore::dropConnection(QThread* thread)
{
    ThreadConnection entry;
    {
        QMutexLocker lk(&m_mutex);
        const auto it = m_connections.find(thread);
        if (it == m_connections.end()) return;
        entry = it.value();
        m_connections.erase(it);
    }
    QObject::disconnect(entry.finishedHook);
    {
        QSqlDatabase db = QSqlDatabase::database(entry.name, false);
        if (db.isOpen()) db.close();
    }
    QSqlDatabase::removeDatabase(entry.name);
}

int ProgressStore::connectionCount() const
{
    QMutexLocker lk(&m_mutex);
    return m_connections.size();
}

bool ProgressStore::exec(QSqlDatabase& db, const QString& sql)
{
    QSqlQuery q(db);
    if (!q.exec(sql)) {
        qWarning() << "[ProgressStore] SQL failed:" << sql << q.lastError();
        return false;
    }
    return true;
}

bool ProgressStore::migrate(QSqlDatabase& db)
{
    const char* ddl[] = {
        "PRAGMA journal_mode=WAL;",
        "CREATE TABLE IF NOT EXISTS batch_progress (\n"
        "  batch_id TEXT PRIMARY KEY,\n"
        "  status TEXT NOT NULL,\n"
        "  operation TEXT NULL,\n"
        "  snapshot TEXT NOT NULL,\n"
        "  updated_at TEXT DEFAULT CURRENT_TIMESTAMP\n"
        ");",
        "CREATE INDEX IF NOT EXISTS idx_batch_progress_status ON batch_progress(status);"
    };
    for (const char* sql : ddl) {
        if (!exec(db, QString::fromLatin1(sql))) return false;
    }
    return true;
}

bool ProgressStore::save(const ProgressState& state)
{
    if (!isOpen() || state.batchId.isEmpty()) return false;
    QSqlDatabase db = connection();
    if (!db.isOpen()) return false;

    QMutexLocker lk(&m_mutex);
    QSqlQuery q(db);
    q.prepare("INSERT OR REPLACE INTO batch_progress (batch_id, status, operation, snapshot, updated_at) "
              "VALUES (?, ?, ?, ?, ?)");
    q.addBindValue(state.batchId);
    q.addBindValue(batchStatusToString(state.status));
    q.addBindValue(state.operation);
    q.addBindValue(QString::fromUtf8(QJsonDocument(state.toJson()).toJson(QJsonDocument::Compact)));
    q.addBindValue(QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs));
    if (!q.exec()) {
        qWarning() << "[ProgressStore] Save failed for" << state.batchId << q.lastError();
        return false;
    }
    return true;
}

std::optional<ProgressState> ProgressStore::load(const QString& batchId)
{
    if (!isOpen()) return std::nullopt;
    QSqlDatabase db = connection();
    if (!db.isOpen()) return std::nullopt;

    QMutexLocker lk(&m_mutex);
    QSqlQuery q(db);
    q.prepare("SELECT snapshot FROM batch_progress WHERE batch_id = ?");
    q.addBindValue(batchId);
    if (!q.exec() || !q.next()) return std::nullopt;

    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(q.value(0).toString().toUtf8(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "[ProgressStore] Corrupt snapshot for" << batchId << err.errorString();
        return std::nullopt;
    }
    return ProgressState::fromJson(doc.object());
}

QStringList ProgressStore::listBatches()
{
    QStringList ids;
    if (!isOpen()) return ids;
    QSqlDatabase db = connection();
    if (!db.isOpen()) return ids;

    QMutexLocker lk(&m_mutex);
    QSqlQuery q(db);
    if (!q.exec("SELECT batch_id FROM batch_progress ORDER BY updated_at DESC")) return ids;
    while (q.next()) ids << q.value(0).toString();
    return ids;
}

bool ProgressStore::remove(const QString& batchId)
{
    if (!isOpen()) return false;
    QSqlDatabase db = connection();
    if (!db.isOpen()) return false;

    QMutexLocker lk(&m_mutex);
    QSqlQuery q(db);
    q.prepare("DELETE FROM batch_progress WHERE batch_id = ?");
    q.addBindValue(batchId);
    return q.exec() && q.numRowsAffected() > 0;
}

int ProgressStore::markInterrupted()
{
    int marked = 0;
    for (const QString& id : listBatches()) {
        std::optional<ProgressState> state = load(id);
        if (!state || isTerminal(state->status)) continue;
        state->status = BatchStatus::Failed;
        state->message = QStringLiteral("interrupted");
        state->currentFile.clear();
        state->etaSeconds.reset();
        if (save(*state)) ++marked;
    }
    if (marked > 0) qWarning() << "[ProgressStore] Marked" << marked << "interrupted batch(es) as failed";
    return marked;
}
