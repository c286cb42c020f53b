#pragma once

#include <QString>
#include <QStringList>
#include <QVector>
#include <QPair>
#include <QHash>
#include <QCache>
#include <QMutex>
#include <QRegularExpression>
#include <optional>

#include "proposal.h"

/**
 * PatternExtractor turns a filename into semantic tags by trying ordered
 * pattern lists, one list per tag category.
 *
 * Each pattern is first compiled as a case-insensitive regular expression.
 * Patterns that do not compile are used as case-insensitive substrings
 * instead; that branch is reported in MatchResult::branch and never raises.
 * Only the filename is matched, never the directory part of a path.
 *
 * **Thread Safety:**
 * - extract(), extractTask() and extractAll() may be called from any thread
 * - the result cache and the compiled-regex cache share m_mutex
 * - results are deterministic; the cache only avoids recomputation
 *
 * **Memory Management:**
 * - results are memoized in an LRU cache (default 10000 entries)
 * - cache keys include a hash of the ordered pattern list, so editing the
 *   patterns never returns stale results
 */
class PatternExtractor {
public:
    enum class MatchBranch { None, Regex, Substring };

    struct MatchResult {
        bool matched = false;
        QString text;                       // matched portion of the filename
        MatchBranch branch = MatchBranch::None;
    };

    struct Extraction {
        std::optional<QString> value;
        MatchBranch branch = MatchBranch::None;
        int patternIndex = -1;
    };

    static constexpr int DEFAULT_CACHE_ENTRIES = 10000;

    explicit PatternExtractor(int maxCacheEntries = DEFAULT_CACHE_ENTRIES);

    // Shared extractor for callers that do not manage their own
    static PatternExtractor& instance();

    // Explicit regex-or-substring match of a single pattern
    MatchResult matchPattern(const QString& fileName, const QString& pattern) const;

    // First pattern that matches wins; returns the matched text.
    // category only namespaces the cache ("shot", "version", ...).
    Extraction extract(const QString& fileName, const QStringList& patterns, const QString& category);

    // Returns the task CATEGORY name whose patterns match first
    Extraction extractTask(const QString& fileName, const QVector<QPair<QString, QStringList>>& taskPatterns);

    // Runs every category. substringMatches counts tags found through the fallback branch.
    TagSet extractAll(const QString& fileName, const PatternConfig& config, int* substringMatches = nullptr);

    void clearCache();
    int cacheEntryCount() const;
    quint64 cacheHits() const;
    quint64 cacheMisses() const;

    static QString patternsHash(const QStringList& patterns);
    static QString patternsHash(const QVector<QPair<QString, QStringList>>& taskPatterns);

private:
    QRegularExpression compiled(const QString& pattern) const;
    bool lookup(const QString& key, Extraction& out);
    void store(const QString& key, const Extraction& value);

    mutable QMutex m_mutex;
    QCache<QString, Extraction> m_cache;
    mutable QHash<QString, QRegularExpression> m_regexCache;
    quint64 m_hits = 0;
    quint64 m_misses = 0;
};
