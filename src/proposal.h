#pragma once
#include <QString>
#include <QStringList>
#include <QVector>
#include <QPair>
#include <QJsonObject>
#include <optional>

// Semantic tags parsed from a filename. Every field is optional.
struct TagSet {
    std::optional<QString> shot;
    std::optional<QString> task;
    std::optional<QString> asset;
    std::optional<QString> stage;
    std::optional<QString> version;
    std::optional<QString> resolution;

    bool operator==(const TagSet& other) const {
        return shot == other.shot && task == other.task && asset == other.asset
            && stage == other.stage && version == other.version && resolution == other.resolution;
    }
    bool operator!=(const TagSet& other) const { return !(*this == other); }

    QJsonObject toJson() const;
    static TagSet fromJson(const QJsonObject& o);
};

// One destination folder and the keywords that route files into it.
struct FolderRule {
    QString destinationSubpath;   // e.g., "3D/Renders"
    QStringList keywords;         // e.g., {"beauty", "lighting"}

    // Subpath if a keyword equals token (case-insensitive)
    std::optional<QString> subpathForToken(const QString& token) const;

    bool hasAnyKeyword(const QStringList& candidates) const;
};

struct Profile {
    QString name;
    QString vfxRoot;              // optional default output root
    QVector<FolderRule> rules;    // order defines match priority
};

// Ordered pattern lists per tag category. Task patterns map a category
// name to the patterns that detect it; category order is preserved.
struct PatternConfig {
    QStringList shotPatterns;
    QVector<QPair<QString, QStringList>> taskPatterns;
    QStringList versionPatterns;
    QStringList resolutionPatterns;
    QStringList assetPatterns;
    QStringList stagePatterns;

    bool isEmpty() const;
};

struct AmbiguousOption {
    QString keyword;
    QString path;

    bool operator==(const AmbiguousOption& other) const {
        return keyword == other.keyword && path == other.path;
    }
};

struct Proposal {
    enum class Kind { File, Sequence };
    enum class Status { Auto, Manual, Ambiguous, Error };

    QString id;
    Kind kind = Kind::File;
    QString name;                      // file name, or "base.####.ext" for sequences
    QString sourcePath;                // file path, or pattern path for sequences
    QStringList sourcePaths;           // every member file in frame order
    qint64 totalBytes = 0;

    std::optional<QString> destinationPath;  // unset when Ambiguous or Error
    QString destinationDir;

    TagSet tags;
    Status status = Status::Manual;
    bool usedDefaultRule = false;
    QVector<AmbiguousOption> ambiguousOptions;
    std::optional<QString> errorMessage;
    QString warning;

    // Sequence metadata
    int frameCount = 0;
    QString frameRange;                // "1001-1100"
    int gapCount = 0;

    bool isSequence() const { return kind == Kind::Sequence; }
    bool isTransferable() const {
        return destinationPath.has_value()
            && status != Status::Ambiguous && status != Status::Error;
    }

    // Destination for one member file (sequence members keep their own names)
    QString destinationFor(const QString& memberSourcePath) const;

    QJsonObject toJson() const;
    static Proposal fromJson(const QJsonObject& o);
};

struct Batch {
    enum class Operation { Move, Copy };

    QString batchId;                   // assigned by the engine when empty
    QVector<Proposal> proposals;
    Operation operation = Operation::Copy;
};

struct MappingSummary {
    int total = 0;
    int autoCount = 0;
    int manualCount = 0;
    int ambiguousCount = 0;
    int errorCount = 0;
    int sequenceCount = 0;
    int fileCount = 0;
    int fallbackMatches = 0;           // tags matched through the substring branch

    QJsonObject toJson() const;
};

QString statusToString(Proposal::Status s);
Proposal::Status statusFromString(const QString& s);
QString operationToString(Batch::Operation op);
