#include "proposal.h"

#include <QDir>
#include <QFileInfo>
#include <QJsonArray>

static void putOptional(QJsonObject& o, const char* key, const std::optional<QString>& v)
{
    o[QLatin1String(key)] = v ? QJsonValue(*v) : QJsonValue(QJsonValue::Null);
}

static std::optional<QString> takeOptional(const QJsonObject& o, const char* key)
{
    const QJsonValue v = o.value(QLatin1String(key));
    if (!v.isString()) return std::nullopt;
    return v.toString();
}

QJsonObject TagSet::toJson() const
{
    QJsonObject o;
    putOptional(o, "shot", shot);
    putOptional(o, "task", task);
    putOptional(o, "asset", asset);
    putOptional(o, "stage", stage);
    putOptional(o, "version", version);
    putOptional(o, "resolution", resolution);
    return o;
}

TagSet TagSet::fromJson(const QJsonObject& o)
{
    TagSet t;
    t.shot = takeOptional(o, "shot");
    t.task = takeOptional(o, "task");
    t.asset = takeOptional(o, "asset");
    t.stage = takeOptional(o, "stage");
    t.version = takeOptional(o, "version");
    t.resolution = takeOptional(o, "resolution");
    return t;
}

std::optional<QString> FolderRule::subpathForToken(const QString& token) const
{
    if (token.trimmed().isEmpty()) return std::nullopt;
    for (const QString& kw : keywords) {
        if (kw.compare(token, Qt::CaseInsensitive) == 0)
            return destinationSubpath;
    }
    return std::nullopt;
}

bool FolderRule::hasAnyKeyword(const QStringList& candidates) const
{
    for (const QString& kw : keywords) {
        if (candidates.contains(kw, Qt::CaseInsensitive)) return true;
    }
    return false;
}

bool PatternConfig::isEmpty() const
{
    return shotPatterns.isEmpty() && taskPatterns.isEmpty() && versionPatterns.isEmpty()
        && resolutionPatterns.isEmpty() && assetPatterns.isEmpty() && stagePatterns.isEmpty();
}

QString Proposal::destinationFor(const QString& memberSourcePath) const
{
    if (!destinationPath) return QString();
    if (kind == Kind::File) return *destinationPath;
    return QDir(destinationDir).filePath(QFileInfo(memberSourcePath).fileName());
}

QString statusToString(Proposal::Status s)
{
    switch (s) {
        case Proposal::Status::Auto: return "auto";
        case Proposal::Status::Manual: return "manual";
        case Proposal::Status::Ambiguous: return "ambiguous";
        case Proposal::Status::Error: return "error";
    }
    return "";
}

Proposal::Status statusFromString(const QString& s)
{
    const QString l = s.toLower();
    if (l == "auto") return Proposal::Status::Auto;
    if (l == "ambiguous") return Proposal::Status::Ambiguous;
    if (l == "error") return Proposal::Status::Error;
    return Proposal::Status::Manual;
}

QString operationToString(Batch::Operation op)
{
    return op == Batch::Operation::Move ? QStringLiteral("move") : QStringLiteral("copy");
}

QJsonObject Proposal::toJson() const
{
    QJsonObject o;
    o["id"] = id;
    o["type"] = isSequence() ? QStringLiteral("sequence") : QStringLiteral("file");
    o["name"] = name;
    o["sourcePath"] = sourcePath;
    o["sourcePaths"] = QJsonArray::fromStringList(sourcePaths);
    o["size"] = totalBytes;
    putOptional(o, "targetPath", destinationPath);
    o["targetDir"] = destinationDir;
    o["tags"] = tags.toJson();
    o["status"] = statusToString(status);
    o["usedDefaultFootageRule"] = usedDefaultRule;
    QJsonArray opts;
    for (const AmbiguousOption& opt : ambiguousOptions) {
        QJsonObject oo;
        oo["keyword"] = opt.keyword;
        oo["path"] = opt.path;
        opts.append(oo);
    }
    o["ambiguousOptions"] = opts;
    putOptional(o, "error", errorMessage);
    if (!warning.isEmpty()) o["warning"] = warning;
    if (isSequence()) {
        o["frameCount"] = frameCount;
        o["frameRange"] = frameRange;
        o["gapCount"] = gapCount;
    }
    return o;
}

Proposal Proposal::fromJson(const QJsonObject& o)
{
    Proposal p;
    p.id = o.value("id").toString();
    p.kind = o.value("type").toString() == QLatin1String("sequence") ? Kind::Sequence : Kind::File;
    p.name = o.value("name").toString();
    p.sourcePath = o.value("sourcePath").toString();
    for (const QJsonValue& v : o.value("sourcePaths").toArray())
        p.sourcePaths.append(v.toString());
    if (p.sourcePaths.isEmpty() && !p.isSequence() && !p.sourcePath.isEmpty())
        p.sourcePaths.append(p.sourcePath);
    p.totalBytes = static_cast<qint64>(o.value("size").toDouble());
    p.destinationPath = takeOptional(o, "targetPath");
    p.destinationDir = o.value("targetDir").toString();
    if (p.destinationDir.isEmpty() && p.destinationPath)
        p.destinationDir = QFileInfo(*p.destinationPath).path();
    p.tags = TagSet::fromJson(o.value("tags").toObject());
    p.status = statusFromString(o.value("status").toString());
    p.usedDefaultRule = o.value("usedDefaultFootageRule").toBool();
    for (const QJsonValue& v : o.value("ambiguousOptions").toArray()) {
        const QJsonObject oo = v.toObject();
        p.ambiguousOptions.append({oo.value("keyword").toString(), oo.value("path").toString()});
    }
    p.errorMessage = takeOptional(o, "error");
    p.warning = o.value("warning").toString();
    p.frameCount = o.value("frameCount").toInt();
    p.frameRange = o.value("frameRange").toString();
    p.gapCount = o.value("gapCount").toInt();
    return p;
}

QJsonObject MappingSummary::toJson() const
{
    QJsonObject o;
    o["total"] = total;
    o["auto"] = autoCount;
    o["manual"] = manualCount;
    o["ambiguous"] = ambiguousCount;
    o["error"] = errorCount;
    o["sequences"] = sequenceCount;
    o["files"] = fileCount;
    o["substringMatches"] = fallbackMatches;
    return o;
}
