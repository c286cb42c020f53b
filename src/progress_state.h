#pragma once
#include <QString>
#include <QStringList>
#include <QVector>
#include <QDateTime>
#include <QJsonObject>
#include <optional>

#include "transfer_error.h"

enum class BatchStatus { Starting, Running, Cancelled, Completed, CompletedWithErrors, Failed };

QString batchStatusToString(BatchStatus status);
BatchStatus batchStatusFromString(const QString& s);
bool isTerminal(BatchStatus status);

struct ProgressState {
    QString batchId;
    QString operation;                  // "copy" or "move"
    BatchStatus status = BatchStatus::Starting;
    int totalFiles = 0;                 // sequence members counted individually
    int filesProcessed = 0;
    int filesSucceeded = 0;
    int filesFailed = 0;
    qint64 totalBytes = 0;
    qint64 processedBytes = 0;
    QString currentFile;
    std::optional<qint64> etaSeconds;   // unknown until one file has completed
    QDateTime startedAt;
    QDateTime updatedAt;
    QString message;

    int percentage() const { return totalFiles > 0 ? (filesProcessed * 100 / totalFiles) : 0; }

    QJsonObject toJson() const;
    static ProgressState fromJson(const QJsonObject& o);
};

// Final outcome of one proposal (file or whole sequence)
struct ItemResult {
    enum class Outcome { Succeeded, PartialSuccess, Failed, Cancelled, Skipped };

    QString proposalId;
    QString name;
    Outcome outcome = Outcome::Failed;
    TransferErrorKind errorKind = TransferErrorKind::None;
    QString message;
    int membersTotal = 1;
    int membersSucceeded = 0;
    bool usedCopyFallback = false;

    QJsonObject toJson() const;
};

QString outcomeToString(ItemResult::Outcome outcome);

struct BatchResult {
    QString batchId;
    BatchStatus status = BatchStatus::Starting;
    bool success = false;               // true iff zero failures and not cancelled
    QVector<ItemResult> items;
    QStringList errors;
    ProgressState finalState;

    int count(ItemResult::Outcome outcome) const;
    QJsonObject toJson() const;
};
