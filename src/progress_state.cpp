#include "progress_state.h"

#include <QJsonArray>

QString batchStatusToString(BatchStatus status)
{
    switch (status) {
        case BatchStatus::Starting: return "starting";
        case BatchStatus::Running: return "running";
        case BatchStatus::Cancelled: return "cancelled";
        case BatchStatus::Completed: return "completed";
        case BatchStatus::CompletedWithErrors: return "completed_with_errors";
        case BatchStatus::Failed: return "failed";
    }
    return "";
}

BatchStatus batchStatusFromString(const QString& s)
{
    if (s == QLatin1String("running")) return BatchStatus::Running;
    if (s == QLatin1String("cancelled")) return BatchStatus::Cancelled;
    if (s == QLatin1String("completed")) return BatchStatus::Completed;
    if (s == QLatin1String("completed_with_errors")) return BatchStatus::CompletedWithErrors;
    if (s == QLatin1String("failed")) return BatchStatus::Failed;
    return BatchStatus::Starting;
}

bool isTerminal(BatchStatus status)
{
    return status == BatchStatus::Cancelled || status == BatchStatus::Completed
        || status == BatchStatus::CompletedWithErrors || status == BatchStatus::Failed;
}

QJsonObject ProgressState::toJson() const
{
    QJsonObject o;
    o["batchId"] = batchId;
    o["operation"] = operation;
    o["status"] = batchStatusToString(status);
    o["totalFiles"] = totalFiles;
    o["filesProcessed"] = filesProcessed;
    o["filesSucceeded"] = filesSucceeded;
    o["filesFailed"] = filesFailed;
    o["totalBytes"] = totalBytes;
    o["processedBytes"] = processedBytes;
    o["currentFile"] = currentFile;
    o["percentage"] = percentage();
    o["etaSeconds"] = etaSeconds ? QJsonValue(static_cast<double>(*etaSeconds)) : QJsonValue(QJsonValue::Null);
    o["startedAt"] = startedAt.toString(Qt::ISODateWithMs);
    o["updatedAt"] = updatedAt.toString(Qt::ISODateWithMs);
    if (!message.isEmpty()) o["message"] = message;
    return o;
}

ProgressState ProgressState::fromJson(const QJsonObject& o)
{
    ProgressState s;
    s.batchId = o.value("batchId").toString();
    s.operation = o.value("operation").toString();
    s.status = batchStatusFromString(o.value("status").toString());
    s.totalFiles = o.value("totalFiles").toInt();
    s.filesProcessed = o.value("filesProcessed").toInt();
    s.filesSucceeded = o.value("filesSucceeded").toInt();
    s.filesFailed = o.value("filesFailed").toInt();
    s.totalBytes = static_cast<qint64>(o.value("totalBytes").toDouble());
    s.processedBytes = static_cast<qint64>(o.value("processedBytes").toDouble());
    s.currentFile = o.value("currentFile").toString();
    const QJsonValue eta = o.value("etaSeconds");
    if (eta.isDouble()) s.etaSeconds = static_cast<qint64>(eta.toDouble());
    s.startedAt = QDateTime::fromString(o.value("startedAt").toString(), Qt::ISODateWithMs);
    s.updatedAt = QDateTime::fromString(o.value("updatedAt").toString(), Qt::ISODateWithMs);
    s.message = o.value("message").toString();
    return s;
}

QString outcomeToString(ItemResult::Outcome outcome)
{
    switch (outcome) {
        case ItemResult::Outcome::Succeeded: return "succeeded";
        case ItemResult::Outcome::PartialSuccess: return "partial_success";
        case ItemResult::Outcome::Failed: return "failed";
        case ItemResult::Outcome::Cancelled: return "cancelled";
        case ItemResult::Outcome::Skipped: return "skipped";
    }
    return "";
}

QJsonObject ItemResult::toJson() const
{
    QJsonObject o;
    o["proposalId"] = proposalId;
    o["name"] = name;
    o["outcome"] = outcomeToString(outcome);
    o["errorKind"] = errorKindToString(errorKind);
    if (!message.isEmpty()) o["message"] = message;
    o["membersTotal"] = membersTotal;
    o["membersSucceeded"] = membersSucceeded;
    o["usedCopyFallback"] = usedCopyFallback;
    return o;
}

int BatchResult::count(ItemResult::Outcome outcome) const
{
    int n = 0;
    for (const ItemResult& item : items) {
        if (item.outcome == outcome) ++n;
    }
    return n;
}

QJsonObject BatchResult::toJson() const
{
    QJsonObject o;
    o["batchId"] = batchId;
    o["status"] = batchStatusToString(status);
    o["success"] = success;
    QJsonArray arr;
    for (const ItemResult& item : items)
        arr.append(item.toJson());
    o["items"] = arr;
    o["errors"] = QJsonArray::fromStringList(errors);
    o["progress"] = finalState.toJson();
    return o;
}
