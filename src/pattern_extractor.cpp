#include "pattern_extractor.h"

#include <QCryptographicHash>
#include <QFileInfo>
#include <QMutexLocker>
#include <QDebug>

static QString baseFileName(const QString& fileName)
{
    // Callers occasionally hand over full paths; tags come from the name only
    if (fileName.contains('/') || fileName.contains('\\')) {
        QString normalized = fileName;
        normalized.replace('\\', '/');
        return normalized.section('/', -1);
    }
    return fileName;
}

PatternExtractor::PatternExtractor(int maxCacheEntries)
    : m_cache(qMax(1, maxCacheEntries))
{
}

PatternExtractor& PatternExtractor::instance()
{
    static PatternExtractor inst;
    return inst;
}

QRegularExpression PatternExtractor::compiled(const QString& pattern) const
{
    QMutexLocker lk(&m_mutex);
    auto it = m_regexCache.constFind(pattern);
    if (it != m_regexCache.constEnd()) return it.value();
    QRegularExpression re(pattern, QRegularExpression::CaseInsensitiveOption);
    if (!re.isValid()) {
        qDebug() << "[PatternExtractor] Pattern" << pattern << "is not a valid regex ("
                 << re.errorString() << "), using substring match";
    }
    m_regexCache.insert(pattern, re);
    return re;
}

PatternExtractor::MatchResult PatternExtractor::matchPattern(const QString& fileName, const QString& pattern) const
{
    MatchResult result;
    if (pattern.isEmpty() || fileName.isEmpty()) return result;

    const QRegularExpression re = compiled(pattern);
    if (re.isValid()) {
        const QRegularExpressionMatch m = re.match(fileName);
        // An empty match ("x*") carries no tag value
        if (m.hasMatch() && m.capturedLength(0) > 0) {
            result.matched = true;
            result.text = m.captured(0);
            result.branch = MatchBranch::Regex;
        }
        return result;
    }

    const int idx = fileName.indexOf(pattern, 0, Qt::CaseInsensitive);
    if (idx >= 0) {
        result.matched = true;
        result.text = fileName.mid(idx, pattern.length());
        result.branch = MatchBranch::Substring;
    }
    return result;
}

QString PatternExtractor::patternsHash(const QStringList& patterns)
{
    QCryptographicHash hasher(QCryptographicHash::Md5);
    for (const QString& p : patterns) {
        hasher.addData(p.toUtf8());
        hasher.addData(QByteArrayView("\x1f", 1));
    }
    return QString::fromLatin1(hasher.result().toHex().left(16));
}

QString PatternExtractor::patternsHash(const QVector<QPair<QString, QStringList>>& taskPatterns)
{
    QCryptographicHash hasher(QCryptographicHash::Md5);
    for (const auto& entry : taskPatterns) {
        hasher.addData(entry.first.toUtf8());
        hasher.addData(QByteArrayView("\x1e", 1));
        for (const QString& p : entry.second) {
            hasher.addData(p.toUtf8());
            hasher.addData(QByteArrayView("\x1f", 1));
        }
    }
    return QString::fromLatin1(hasher.result().toHex().left(16));
}

bool PatternExtractor::lookup(const QString& key, Extraction& out)
{
    QMutexLocker lk(&m_mutex);
    if (const Extraction* hit = m_cache.object(key)) {
        out = *hit;
        ++m_hits;
        return true;
    }
    ++m_misses;
    return false;
}

void PatternExtractor::store(const QString& key, const Extraction& value)
{
    QMutexLocker lk(&m_mutex);
    m_cache.insert(key, new Extraction(value));
}

PatternExtractor::Extraction PatternExtractor::extract(const QString& fileName, const QStringList& patterns,
                                                       const QString& category)
{
    Extraction result;
    if (patterns.isEmpty()) return result;

    const QString name = baseFileName(fileName);
    const QString key = name + '|' + category + '|' + patternsHash(patterns);
    if (lookup(key, result)) return result;

    for (int i = 0; i < patterns.size(); ++i) {
        const MatchResult m = matchPattern(name, patterns.at(i));
        if (m.matched) {
            result.value = m.text;
            result.branch = m.branch;
            result.patternIndex = i;
            break;
        }
    }
    store(key, result);
    return result;
}

PatternExtractor::Extraction PatternExtractor::extractTask(const QString& fileName,
                                                           const QVector<QPair<QString, QStringList>>& taskPatterns)
{
    Extraction result;
    if (taskPatterns.isEmpty()) return result;

    const QString name = baseFileName(fileName);
    const QString key = name + QStringLiteral("|task|") + patternsHash(taskPatterns);
    if (lookup(key, result)) return result;

    int flatIndex = 0;
    for (const auto& entry : taskPatterns) {
        for (const QString& pattern : entry.second) {
            const MatchResult m = matchPattern(name, pattern);
            if (m.matched) {
                result.value = entry.first;
                result.branch = m.branch;
                result.patternIndex = flatIndex;
                store(key, result);
                return result;
            }
            ++flatIndex;
        }
    }
    store(key, result);
    return result;
}

TagSet PatternExtractor::extractAll(const QString& fileName, const PatternConfig& config, int* substringMatches)
{
    TagSet tags;
    int fallbacks = 0;
    auto take = [&fallbacks](const Extraction& e) {
        if (e.branch == MatchBranch::Substring) ++fallbacks;
        return e.value;
    };

    tags.shot = take(extract(fileName, config.shotPatterns, QStringLiteral("shot")));
    tags.task = take(extractTask(fileName, config.taskPatterns));
    tags.version = take(extract(fileName, config.versionPatterns, QStringLiteral("version")));
    tags.resolution = take(extract(fileName, config.resolutionPatterns, QStringLiteral("resolution")));
    tags.asset = take(extract(fileName, config.assetPatterns, QStringLiteral("asset")));
    tags.stage = take(extract(fileName, config.stagePatterns, QStringLiteral("stage")));

    if (substringMatches) *substringMatches += fallbacks;
    return tags;
}

void PatternExtractor::clearCache()
{
    QMutexLocker lk(&m_mutex);
    m_cache.clear();
    m_regexCache.clear();
    m_hits = 0;
    m_misses = 0;
}

int PatternExtractor::cacheEntryCount() const
{
    QMutexLocker lk(&m_mutex);
    return m_cache.count();
}

quint64 PatternExtractor::cacheHits() const
{
    QMutexLocker lk(&m_mutex);
    return m_hits;
}

quint64 PatternExtractor::cacheMisses() const
{
    QMutexLocker lk(&m_mutex);
    return m_misses;
}
