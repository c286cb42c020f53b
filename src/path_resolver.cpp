#include "path_resolver.h"

#include <QDir>
#include <QMap>
#include <QSet>
#include <QDebug>
#include <algorithm>

const QStringList& PathResolver::defaultFootageKeywords()
{
    static const QStringList keywords = { "footage", "video", "source", "plate", "plates" };
    return keywords;
}

QString PathResolver::normalizeSubpath(const QString& subpath)
{
    QString s = subpath;
    s.replace('\\', '/');
    while (s.startsWith('/')) s.remove(0, 1);
    return s;
}

static bool isBlank(const std::optional<QString>& v)
{
    return !v || v->trimmed().isEmpty();
}

QStringList PathResolver::dynamicSegments(const TagSet& tags)
{
    QStringList segments;
    if (!isBlank(tags.shot)) segments << *tags.shot;
    if (!isBlank(tags.stage)) segments << tags.stage->toLower();
    if (!isBlank(tags.task)) segments << tags.task->toLower();
    if (!isBlank(tags.asset)) segments << tags.asset->toLower();
    if (!isBlank(tags.resolution)) segments << tags.resolution->toUpper();
    if (!isBlank(tags.version)) segments << tags.version->toLower();
    return segments;
}

QString PathResolver::defaultFootageSubpath(const QVector<FolderRule>& rules)
{
    const QStringList& footage = defaultFootageKeywords();
    QSet<QString> canonical(footage.begin(), footage.end());

    for (const FolderRule& rule : rules) {
        QSet<QString> kws;
        for (const QString& kw : rule.keywords) kws.insert(kw.toLower());
        if (kws == canonical) return rule.destinationSubpath;
    }
    for (const FolderRule& rule : rules) {
        if (rule.hasAnyKeyword(footage)) return rule.destinationSubpath;
    }
    return unmappedSubpath();
}

QVector<AmbiguousOption> PathResolver::ambiguousCandidates(const QVector<FolderRule>& rules, const QString& token)
{
    if (token.isEmpty()) return {};

    // keyword -> path; a keyword listed by several rules keeps the last rule's path
    QMap<QString, QString> keywordPaths;
    for (const FolderRule& rule : rules) {
        for (const QString& kw : rule.keywords) {
            if (!kw.isEmpty()) keywordPaths.insert(kw.toLower(), rule.destinationSubpath);
        }
    }

    const QString lowered = token.toLower();
    QVector<AmbiguousOption> hits;
    QSet<QString> paths;
    for (auto it = keywordPaths.constBegin(); it != keywordPaths.constEnd(); ++it) {
        if (lowered.contains(it.key())) {
            hits.append({it.key(), it.value()});
            paths.insert(it.value());
        }
    }
    if (paths.size() < 2) return {};

    std::sort(hits.begin(), hits.end(), [](const AmbiguousOption& a, const AmbiguousOption& b) {
        return a.keyword < b.keyword;
    });
    return hits;
}

QString PathResolver::assembleDir(const QString& rootOutputDir, const QString& subpath, const TagSet& tags)
{
    QString dir = QDir(rootOutputDir).absolutePath();
    const QString sub = normalizeSubpath(subpath);
    if (!sub.isEmpty()) dir += '/' + sub;
    for (const QString& segment : dynamicSegments(tags))
        dir += '/' + segment;
    return QDir::cleanPath(dir);
}

Resolution PathResolver::resolve(const QString& rootOutputDir, const QVector<FolderRule>& rules,
                                 const QString& fileName, const TagSet& tags)
{
    Resolution res;
    std::optional<QString> chosen;

    // 1. exact keyword match, task first
    if (!isBlank(tags.task)) {
        for (const FolderRule& rule : rules) {
            if ((chosen = rule.subpathForToken(*tags.task))) break;
        }
    }
    if (!chosen && !isBlank(tags.asset)) {
        for (const FolderRule& rule : rules) {
            if ((chosen = rule.subpathForToken(*tags.asset))) break;
        }
    }

    // 2. containment ambiguity
    if (!chosen) {
        if (!isBlank(tags.task))
            res.ambiguousOptions = ambiguousCandidates(rules, *tags.task);
        if (res.ambiguousOptions.isEmpty() && !isBlank(tags.asset))
            res.ambiguousOptions = ambiguousCandidates(rules, *tags.asset);
        res.ambiguous = !res.ambiguousOptions.isEmpty();
    }

    if (res.ambiguous) {
        qDebug() << "[PathResolver]" << fileName << "is ambiguous between"
                 << res.ambiguousOptions.size() << "keywords";
        return res;
    }

    // 3. footage fallback
    if (!chosen) {
        res.usedDefaultRule = true;
        chosen = defaultFootageSubpath(rules);
    }
    res.chosenSubpath = *chosen;

    const QString dir = assembleDir(rootOutputDir, *chosen, tags);
    res.destinationDir = dir;
    res.destinationPath = QDir::cleanPath(dir + '/' + fileName);
    return res;
}
