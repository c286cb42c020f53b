#pragma once
#include <QString>
#include <QStringList>
#include <QVector>
#include <optional>

#include "proposal.h"

struct Resolution {
    std::optional<QString> destinationDir;   // unset when ambiguous
    std::optional<QString> destinationPath;  // destinationDir + filename
    QString chosenSubpath;
    bool usedDefaultRule = false;
    bool ambiguous = false;
    QVector<AmbiguousOption> ambiguousOptions;  // sorted by keyword
};

/**
 * PathResolver maps extracted tags onto a folder-rule profile.
 *
 * Resolution order:
 *  1. whole-keyword match of the task tag, then of the asset tag
 *  2. containment check: a tag containing keywords of two or more different
 *     rules is ambiguous and gets no destination
 *  3. the footage rule of the profile (or "unmapped_footage")
 *  4. dynamic folders built from shot/stage/task/asset/resolution/version
 *
 * Pure function of its inputs; calling it twice yields the same result.
 */
class PathResolver {
public:
    static const QStringList& defaultFootageKeywords();
    static QString unmappedSubpath() { return QStringLiteral("unmapped_footage"); }

    static Resolution resolve(const QString& rootOutputDir, const QVector<FolderRule>& rules,
                              const QString& fileName, const TagSet& tags);

    // Subpath of the rule selected as the footage fallback
    static QString defaultFootageSubpath(const QVector<FolderRule>& rules);

    // root / subpath / dynamic segments, normalized
    static QString assembleDir(const QString& rootOutputDir, const QString& subpath, const TagSet& tags);

    // Ordered, cased folder names derived from tags
    static QStringList dynamicSegments(const TagSet& tags);

    // Ambiguous candidates for a token, empty when it maps to a single path
    static QVector<AmbiguousOption> ambiguousCandidates(const QVector<FolderRule>& rules, const QString& token);

    static QString normalizeSubpath(const QString& subpath);
};
