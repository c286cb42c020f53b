#include "config_loader.h"
#include "file_utils.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonParseError>
#include <QDebug>

bool ConfigLoader::readJsonFile(const QString& filePath, QJsonDocument& doc, QString* errorOut)
{
    if (!FileUtils::fileExists(filePath)) {
        if (errorOut) *errorOut = QString("Configuration file not found: %1").arg(filePath);
        return false;
    }
    QFile f(filePath);
    if (!f.open(QIODevice::ReadOnly)) {
        if (errorOut) *errorOut = QString("Cannot read %1: %2").arg(filePath, f.errorString());
        return false;
    }
    QJsonParseError err;
    doc = QJsonDocument::fromJson(f.readAll(), &err);
    if (err.error != QJsonParseError::NoError) {
        if (errorOut) *errorOut = QString("Invalid JSON in %1 at offset %2: %3")
                                      .arg(filePath).arg(err.offset).arg(err.errorString());
        return false;
    }
    return true;
}

bool ConfigLoader::readStringList(const QJsonValue& value, const QString& field, QStringList& out, QString* errorOut)
{
    out.clear();
    if (value.isUndefined() || value.isNull()) return true;
    if (!value.isArray()) {
        if (errorOut) *errorOut = QString("'%1' must be an array of strings").arg(field);
        return false;
    }
    for (const QJsonValue& v : value.toArray()) {
        if (!v.isString()) {
            if (errorOut) *errorOut = QString("'%1' must only contain strings").arg(field);
            return false;
        }
        if (!v.toString().isEmpty()) out << v.toString();
    }
    return true;
}

bool ConfigLoader::parsePatterns(const QJsonObject& root, PatternConfig& out, QString* errorOut)
{
    PatternConfig cfg;
    if (!readStringList(root.value("shotPatterns"), "shotPatterns", cfg.shotPatterns, errorOut)) return false;
    if (!readStringList(root.value("versionPatterns"), "versionPatterns", cfg.versionPatterns, errorOut)) return false;
    if (!readStringList(root.value("resolutionPatterns"), "resolutionPatterns", cfg.resolutionPatterns, errorOut)) return false;
    if (!readStringList(root.value("assetPatterns"), "assetPatterns", cfg.assetPatterns, errorOut)) return false;
    if (!readStringList(root.value("stagePatterns"), "stagePatterns", cfg.stagePatterns, errorOut)) return false;

    const QJsonValue tasks = root.value("taskPatterns");
    auto addCategory = [&cfg, errorOut](const QString& name, const QJsonValue& value) {
        QStringList patterns;
        if (name.trimmed().isEmpty()) {
            if (errorOut) *errorOut = QStringLiteral("Task category names must not be empty");
            return false;
        }
        if (!readStringList(value, QString("taskPatterns.%1").arg(name), patterns, errorOut)) return false;
        cfg.taskPatterns.append({name, patterns});
        return true;
    };

    if (tasks.isObject()) {
        // QJsonObject iterates keys alphabetically
        const QJsonObject obj = tasks.toObject();
        for (auto it = obj.constBegin(); it != obj.constEnd(); ++it) {
            if (!addCategory(it.key(), it.value())) return false;
        }
    } else if (tasks.isArray()) {
        // Array form keeps the author's order: [{"beauty": [...]}, {"fx": [...]}]
        for (const QJsonValue& entry : tasks.toArray()) {
            const QJsonObject obj = entry.toObject();
            if (!entry.isObject() || obj.size() != 1) {
                if (errorOut) *errorOut = QStringLiteral("taskPatterns array entries must be single-key objects");
                return false;
            }
            if (!addCategory(obj.constBegin().key(), obj.constBegin().value())) return false;
        }
    } else if (!tasks.isUndefined() && !tasks.isNull()) {
        if (errorOut) *errorOut = QStringLiteral("'taskPatterns' must be an object or an array");
        return false;
    }

    out = cfg;
    return true;
}

bool ConfigLoader::loadPatterns(const QString& filePath, PatternConfig& out, QString* errorOut)
{
    QJsonDocument doc;
    if (!readJsonFile(filePath, doc, errorOut)) return false;
    if (!doc.isObject()) {
        if (errorOut) *errorOut = QString("%1: patterns must be a JSON object").arg(filePath);
        return false;
    }
    if (!parsePatterns(doc.object(), out, errorOut)) return false;
    qInfo() << "[Config] Loaded patterns from" << filePath
            << "shot:" << out.shotPatterns.size() << "task categories:" << out.taskPatterns.size();
    return true;
}

bool ConfigLoader::parseRules(const QJsonValue& rulesValue, QVector<FolderRule>& out, QString* errorOut)
{
    out.clear();
    if (!rulesValue.isArray()) {
        if (errorOut) *errorOut = QStringLiteral("'rules' must be an array");
        return false;
    }
    const QJsonArray rules = rulesValue.toArray();
    for (int i = 0; i < rules.size(); ++i) {
        const QJsonObject obj = rules.at(i).toObject();
        if (!rules.at(i).isObject() || obj.size() != 1) {
            if (errorOut) *errorOut = QString("Rule %1 must be an object with exactly one path").arg(i);
            return false;
        }
        FolderRule rule;
        rule.destinationSubpath = obj.constBegin().key().trimmed();
        if (rule.destinationSubpath.isEmpty()) {
            if (errorOut) *errorOut = QString("Rule %1 has an empty path").arg(i);
            return false;
        }
        if (!readStringList(obj.constBegin().value(), rule.destinationSubpath, rule.keywords, errorOut)) return false;
        out.append(rule);
    }
    return true;
}

static bool parseProfileObject(const QString& fallbackName, const QJsonObject& obj, Profile& out, QString* errorOut)
{
    out.name = obj.value("name").toString(fallbackName);
    if (out.name.isEmpty()) out.name = fallbackName;
    if (out.name.isEmpty()) {
        if (errorOut) *errorOut = QStringLiteral("Profile without a name");
        return false;
    }
    out.vfxRoot = obj.value("vfx_root").toString(obj.value("vfxRoot").toString());
    QString ruleError;
    if (!ConfigLoader::parseRules(obj.value("rules"), out.rules, &ruleError)) {
        if (errorOut) *errorOut = QString("Profile '%1': %2").arg(out.name, ruleError);
        return false;
    }
    return true;
}

bool ConfigLoader::parseProfiles(const QJsonDocument& doc, QVector<Profile>& out, QString* errorOut)
{
    QVector<Profile> profiles;
    if (doc.isObject()) {
        const QJsonObject root = doc.object();
        for (auto it = root.constBegin(); it != root.constEnd(); ++it) {
            if (!it.value().isObject()) {
                if (errorOut) *errorOut = QString("Profile '%1' must be an object").arg(it.key());
                return false;
            }
            Profile p;
            // The key wins over an inner "name" that disagrees with it
            QJsonObject obj = it.value().toObject();
            obj["name"] = it.key();
            if (!parseProfileObject(it.key(), obj, p, errorOut)) return false;
            profiles.append(p);
        }
    } else if (doc.isArray()) {
        for (const QJsonValue& v : doc.array()) {
            Profile p;
            if (!v.isObject() || !parseProfileObject(QString(), v.toObject(), p, errorOut)) {
                if (errorOut && errorOut->isEmpty()) *errorOut = QStringLiteral("Profile entries must be objects");
                return false;
            }
            profiles.append(p);
        }
    } else {
        if (errorOut) *errorOut = QStringLiteral("Profiles must be a JSON object or array");
        return false;
    }
    out = profiles;
    return true;
}

bool ConfigLoader::loadProfiles(const QString& filePath, QVector<Profile>& out, QString* errorOut)
{
    QJsonDocument doc;
    if (!readJsonFile(filePath, doc, errorOut)) return false;
    if (!parseProfiles(doc, out, errorOut)) return false;
    qInfo() << "[Config] Loaded" << out.size() << "profiles from" << filePath;
    return true;
}

std::optional<Profile> ConfigLoader::findProfile(const QVector<Profile>& profiles, const QString& name)
{
    for (const Profile& p : profiles) {
        if (p.name == name) return p;
    }
    for (const Profile& p : profiles) {
        if (p.name.compare(name, Qt::CaseInsensitive) == 0) return p;
    }
    return std::nullopt;
}

TransferSettings ConfigLoader::loadTransferSettings(QSettings& settings)
{
    TransferSettings t;
    settings.beginGroup("Transfer");
    t.fileWorkers = settings.value("fileWorkers", t.fileWorkers).toInt();
    t.chunkWorkers = settings.value("chunkWorkers", t.chunkWorkers).toInt();
    t.maxThreadBudget = settings.value("maxThreadBudget", t.maxThreadBudget).toInt();
    t.smallFileThreshold = settings.value("smallFileThreshold", t.smallFileThreshold).toLongLong();
    t.microChunkSize = settings.value("microChunkSize", t.microChunkSize).toLongLong();
    t.subChunkSize = settings.value("subChunkSize", t.subChunkSize).toLongLong();
    t.minChunkSize = settings.value("minChunkSize", t.minChunkSize).toLongLong();
    t.maxChunkSize = settings.value("maxChunkSize", t.maxChunkSize).toLongLong();
    t.progressIntervalMs = settings.value("progressIntervalMs", t.progressIntervalMs).toInt();
    settings.endGroup();
    t.clamp();
    return t;
}

void ConfigLoader::saveTransferSettings(QSettings& settings, const TransferSettings& values)
{
    settings.beginGroup("Transfer");
    settings.setValue("fileWorkers", values.fileWorkers);
    settings.setValue("chunkWorkers", values.chunkWorkers);
    settings.setValue("maxThreadBudget", values.maxThreadBudget);
    settings.setValue("smallFileThreshold", values.smallFileThreshold);
    settings.setValue("microChunkSize", values.microChunkSize);
    settings.setValue("subChunkSize", values.subChunkSize);
    settings.setValue("minChunkSize", values.minChunkSize);
    settings.setValue("maxChunkSize", values.maxChunkSize);
    settings.setValue("progressIntervalMs", values.progressIntervalMs);
    settings.endGroup();
    settings.sync();
}

MappingOptions ConfigLoader::loadMappingOptions(QSettings& settings)
{
    MappingOptions o;
    settings.beginGroup("Mapping");
    o.workerCount = settings.value("workerCount", o.workerCount).toInt();
    o.validateSequenceFrames = settings.value("validateSequenceFrames", o.validateSequenceFrames).toBool();
    o.progressIntervalMs = settings.value("progressIntervalMs", o.progressIntervalMs).toInt();
    settings.endGroup();
    return o;
}
