#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSettings>
#include <QStandardPaths>
#include <QTextStream>
#include <cstdio>

#include "config_loader.h"
#include "local_scanner.h"
#include "log_manager.h"
#include "mapping_generator.h"
#include "progress_store.h"
#include "transfer_engine.h"

namespace {

enum ExitCode { ExitOk = 0, ExitUsage = 1, ExitConfig = 2, ExitTransferErrors = 3 };

QJsonObject proposalsDocument(const QVector<Proposal>& proposals, const MappingSummary& summary)
{
    QJsonArray arr;
    for (const Proposal& p : proposals) arr.append(p.toJson());
    QJsonObject root;
    root["summary"] = summary.toJson();
    root["proposals"] = arr;
    return root;
}

bool writeFile(const QString& path, const QByteArray& data, QString* errorOut)
{
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (errorOut) *errorOut = QString("Cannot write %1: %2").arg(path, f.errorString());
        return false;
    }
    if (f.write(data) != data.size()) {
        if (errorOut) *errorOut = QString("Short write to %1").arg(path);
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Identify app for QSettings and AppDataLocation
    QCoreApplication::setOrganizationName("CleanIncomings");
    QCoreApplication::setOrganizationDomain("cleanincomings.local");
    QCoreApplication::setApplicationName("cleanincomings");
    QCoreApplication::setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Maps incoming VFX deliveries onto a project folder structure and transfers them.");
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption sourceOpt("source", "Incoming folder to scan.", "dir");
    const QCommandLineOption patternsOpt("patterns", "Pattern definitions (JSON).", "file");
    const QCommandLineOption profilesOpt("profiles", "Folder-rule profiles (JSON).", "file");
    const QCommandLineOption profileOpt("profile", "Profile to use.", "name");
    const QCommandLineOption outputOpt("output", "Project root; defaults to the profile's vfx_root.", "dir");
    const QCommandLineOption copyOpt("copy", "Copy accepted proposals.");
    const QCommandLineOption moveOpt("move", "Move accepted proposals.");
    const QCommandLineOption manualOpt("include-manual", "Also transfer proposals that need review.");
    const QCommandLineOption proposalsOutOpt("proposals-out", "Write the proposals JSON to a file.", "file");
    const QCommandLineOption settingsOpt("settings", "INI file with [Transfer] and [Mapping] settings.", "ini");
    const QCommandLineOption progressDbOpt("progress-db", "SQLite file for batch progress.", "file");
    const QCommandLineOption logOpt("log", "Append log output to this file.", "file");
    const QCommandLineOption verboseOpt("verbose", "Include debug messages.");
    parser.addOptions({sourceOpt, patternsOpt, profilesOpt, profileOpt, outputOpt, copyOpt, moveOpt, manualOpt,
                       proposalsOutOpt, settingsOpt, progressDbOpt, logOpt, verboseOpt});
    parser.process(app);

    LogManager::install();
    LogManager& log = LogManager::instance();
    log.setMinimumLevel(parser.isSet(verboseOpt) ? "DEBUG" : "INFO");
    if (parser.isSet(logOpt)) {
        QString err;
        if (!log.setLogFile(parser.value(logOpt), &err)) {
            qWarning() << "[Main]" << err;
        }
    }

    if (parser.isSet(copyOpt) && parser.isSet(moveOpt)) {
        qCritical() << "[Main] --copy and --move are mutually exclusive";
        return ExitUsage;
    }
    for (const QCommandLineOption& required : {sourceOpt, patternsOpt, profilesOpt, profileOpt}) {
        if (!parser.isSet(required)) {
            qCritical().noquote() << "[Main] Missing --" + required.names().first();
            parser.showHelp(ExitUsage);
        }
    }

    QString err;
    PatternConfig patterns;
    if (!ConfigLoader::loadPatterns(parser.value(patternsOpt), patterns, &err)) {
        qCritical().noquote() << "[Main]" << err;
        return ExitConfig;
    }
    QVector<Profile> profiles;
    if (!ConfigLoader::loadProfiles(parser.value(profilesOpt), profiles, &err)) {
        qCritical().noquote() << "[Main]" << err;
        return ExitConfig;
    }
    const std::optional<Profile> profile = ConfigLoader::findProfile(profiles, parser.value(profileOpt));
    if (!profile) {
        qCritical().noquote() << "[Main] Unknown profile" << parser.value(profileOpt);
        return ExitConfig;
    }

    TransferSettings transferSettings;
    MappingOptions mappingOptions;
    if (parser.isSet(settingsOpt)) {
        QSettings ini(parser.value(settingsOpt), QSettings::IniFormat);
        if (ini.status() != QSettings::NoError) {
            qCritical().noquote() << "[Main] Cannot read settings" << parser.value(settingsOpt);
            return ExitConfig;
        }
        transferSettings = ConfigLoader::loadTransferSettings(ini);
        mappingOptions = ConfigLoader::loadMappingOptions(ini);
    } else {
        transferSettings.clamp();
    }

    LocalDirectoryScanner scanner;
    FileTreeNode tree;
    if (!scanner.scan(parser.value(sourceOpt), tree, &err)) {
        qCritical().noquote() << "[Main]" << err;
        return ExitConfig;
    }

    MappingGenerator generator;
    generator.setOptions(mappingOptions);
    MappingSummary summary;
    const QString outputRoot = parser.isSet(outputOpt) ? QDir::cleanPath(parser.value(outputOpt)) : profile->vfxRoot;
    const QVector<Proposal> proposals = generator.generate(
        tree, *profile, patterns, outputRoot,
        [](const MappingProgress& p) {
            qDebug() << "[Main] Mapping" << p.processed << "/" << p.total << p.currentItem;
        },
        &summary);

    const QByteArray json = QJsonDocument(proposalsDocument(proposals, summary)).toJson(QJsonDocument::Indented);
    if (parser.isSet(proposalsOutOpt)) {
        if (!writeFile(parser.value(proposalsOutOpt), json, &err)) {
            qCritical().noquote() << "[Main]" << err;
            return ExitConfig;
        }
        qInfo().noquote() << "[Main] Proposals written to" << parser.value(proposalsOutOpt);
    }

    if (!parser.isSet(copyOpt) && !parser.isSet(moveOpt)) {
        QTextStream out(stdout);
        out << json;
        out.flush();
        return ExitOk;
    }

    Batch batch;
    batch.operation = parser.isSet(moveOpt) ? Batch::Operation::Move : Batch::Operation::Copy;
    const bool includeManual = parser.isSet(manualOpt);
    for (const Proposal& p : proposals) {
        if (p.status == Proposal::Status::Auto || (includeManual && p.status == Proposal::Status::Manual))
            batch.proposals.append(p);
    }
    if (batch.proposals.isEmpty()) {
        qWarning() << "[Main] No proposals accepted for transfer";
        return ExitOk;
    }

    ProgressStore store;
    const QString dbPath = parser.isSet(progressDbOpt)
        ? parser.value(progressDbOpt)
        : QStandardPaths::writableLocation(QStandardPaths::AppDataLocation) + "/progress.db";
    const bool storeOpen = store.init(dbPath, &err);
    if (storeOpen) {
        store.markInterrupted();
    } else {
        qWarning().noquote() << "[Main] Progress will not be persisted:" << err;
    }

    TransferEngine engine(transferSettings, storeOpen ? &store : nullptr);
    int lastPercent = -1;
    const QString id = engine.submit(batch, [&lastPercent](const ProgressState& s) {
        const int pct = s.percentage();
        if (pct != lastPercent) {
            lastPercent = pct;
            QString eta = s.etaSeconds ? QString::number(*s.etaSeconds) + "s" : QStringLiteral("--");
            qInfo().noquote() << QString("[Main] %1% (%2/%3 files) eta %4")
                                     .arg(pct).arg(s.filesProcessed).arg(s.totalFiles).arg(eta);
        }
    });
    if (id.isEmpty()) {
        qCritical() << "[Main] Transfer could not be started";
        return ExitTransferErrors;
    }

    const BatchResult result = engine.waitForFinished(id);
    engine.release(id);
    for (const QString& e : result.errors)
        qWarning().noquote() << "[Main]" << e;
    qInfo().noquote() << QString("[Main] %1: %2 succeeded, %3 failed")
                             .arg(batchStatusToString(result.status))
                             .arg(result.finalState.filesSucceeded)
                             .arg(result.finalState.filesFailed);
    log.flush();
    return result.success ? ExitOk : ExitTransferErrors;
}
