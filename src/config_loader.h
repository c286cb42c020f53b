#pragma once
#include <QJsonDocument>
#include <QJsonObject>
#include <QSettings>
#include <QString>
#include <QVector>
#include <optional>

#include "mapping_generator.h"
#include "proposal.h"
#include "transfer_settings.h"

// Reads pattern lists, folder-rule profiles and engine settings.
// Every loader validates its input and reports problems through errorOut.
class ConfigLoader {
public:
    // {"shotPatterns": [...], "taskPatterns": {...} | [{"cat": [...]}, ...], ...}
    static bool loadPatterns(const QString& filePath, PatternConfig& out, QString* errorOut = nullptr);
    static bool parsePatterns(const QJsonObject& root, PatternConfig& out, QString* errorOut = nullptr);

    // {"name": {"name": ..., "vfx_root": ..., "rules": [{"sub/path": ["kw", ...]}, ...]}, ...}
    // or [{"name": ..., "rules": [...]}, ...]
    static bool loadProfiles(const QString& filePath, QVector<Profile>& out, QString* errorOut = nullptr);
    static bool parseProfiles(const QJsonDocument& doc, QVector<Profile>& out, QString* errorOut = nullptr);
    static bool parseRules(const QJsonValue& rulesValue, QVector<FolderRule>& out, QString* errorOut = nullptr);

    static std::optional<Profile> findProfile(const QVector<Profile>& profiles, const QString& name);

    // Values under the "Transfer/" group; missing keys keep their defaults
    static TransferSettings loadTransferSettings(QSettings& settings);
    static void saveTransferSettings(QSettings& settings, const TransferSettings& values);

    // Values under the "Mapping/" group
    static MappingOptions loadMappingOptions(QSettings& settings);

private:
    static bool readJsonFile(const QString& filePath, QJsonDocument& doc, QString* errorOut);
    static bool readStringList(const QJsonValue& value, const QString& field, QStringList& out, QString* errorOut);
};
