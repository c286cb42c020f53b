#include "mapping_generator.h"
#include "file_utils.h"

#include <QtConcurrent>
#include <QDir>
#include <QFileInfo>
#include <QMutexLocker>
#include <QThread>
#include <QUuid>
#include <QDebug>
#include <atomic>
#include <exception>

static bool hasValue(const std::optional<QString>& v)
{
    return v && !v->trimmed().isEmpty();
}

static QString newProposalId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

MappingGenerator::MappingGenerator(PatternExtractor& extractor)
    : m_extractor(extractor)
{
    setOptions(MappingOptions());
}

int MappingGenerator::defaultWorkerCount()
{
    const int ideal = qMax(1, QThread::idealThreadCount());
    return qMin(16, ideal * 2);
}

void MappingGenerator::setOptions(const MappingOptions& options)
{
    m_options = options;
    if (m_options.workerCount <= 0) m_options.workerCount = defaultWorkerCount();
    m_pool.setMaxThreadCount(m_options.workerCount);
    m_throttle.setIntervalMs(qMax(0, m_options.progressIntervalMs));
}

void MappingGenerator::report(const MappingProgressCallback& cb, const MappingProgress& progress, bool force)
{
    if (!cb) return;
    QMutexLocker lk(&m_progressMutex);
    if (!m_throttle.shouldEmit(force)) return;
    cb(progress);
}

Proposal::Status MappingGenerator::classify(const TagSet& tags, const Resolution& resolution)
{
    if (resolution.ambiguous) return Proposal::Status::Ambiguous;
    if (!resolution.destinationPath) return Proposal::Status::Error;
    const bool complete = hasValue(tags.shot) && hasValue(tags.task) && hasValue(tags.version);
    return (complete && !resolution.usedDefaultRule) ? Proposal::Status::Auto : Proposal::Status::Manual;
}

void MappingGenerator::applyResolution(Proposal& proposal, const Resolution& resolution)
{
    proposal.usedDefaultRule = resolution.usedDefaultRule;
    proposal.ambiguousOptions = resolution.ambiguousOptions;
    if (resolution.ambiguous || !resolution.destinationDir) {
        proposal.destinationPath.reset();
        proposal.destinationDir.clear();
    } else {
        proposal.destinationDir = *resolution.destinationDir;
        proposal.destinationPath = resolution.destinationPath;
    }
    proposal.status = classify(proposal.tags, resolution);
    if (proposal.status == Proposal::Status::Error && !proposal.errorMessage)
        proposal.errorMessage = QStringLiteral("No destination could be resolved");
}

Proposal MappingGenerator::errorProposal(const QString& name, const QString& sourcePath, const QString& message)
{
    Proposal p;
    p.id = newProposalId();
    p.name = name;
    p.sourcePath = sourcePath;
    if (!sourcePath.isEmpty()) p.sourcePaths << sourcePath;
    p.status = Proposal::Status::Error;
    p.errorMessage = message;
    return p;
}

Proposal MappingGenerator::proposalForFile(const FileEntry& file, const Profile& profile,
                                           const PatternConfig& patterns, const QString& outputRoot,
                                           int* substringMatches)
{
    if (file.name.isEmpty())
        return errorProposal(file.name, file.absolutePath, QStringLiteral("File entry has no name"));
    const QString root = outputRoot.isEmpty() ? profile.vfxRoot : outputRoot;
    if (root.isEmpty())
        return errorProposal(file.name, file.absolutePath, QStringLiteral("No output root configured"));

    Proposal p;
    p.id = newProposalId();
    p.kind = Proposal::Kind::File;
    p.name = file.name;
    p.sourcePath = file.absolutePath;
    p.sourcePaths << file.absolutePath;
    p.totalBytes = file.sizeBytes;
    p.tags = m_extractor.extractAll(file.name, patterns, substringMatches);

    const Resolution res = PathResolver::resolve(root, profile.rules, file.name, p.tags);
    applyResolution(p, res);
    return p;
}

Proposal MappingGenerator::proposalForSequence(const SequenceGroup& sequence, const Profile& profile,
                                               const PatternConfig& patterns, const QString& outputRoot,
                                               int* substringMatches)
{
    const QString root = outputRoot.isEmpty() ? profile.vfxRoot : outputRoot;
    if (root.isEmpty()) {
        Proposal e = errorProposal(sequence.pattern, sequence.patternPath(), QStringLiteral("No output root configured"));
        e.kind = Proposal::Kind::Sequence;
        return e;
    }

    QVector<FileEntry> valid;
    QStringList failed;
    if (m_options.validateSequenceFrames) {
        const QList<bool> checks = QtConcurrent::blockingMapped<QList<bool>>(&m_pool, sequence.files,
            [](const FileEntry& f) {
                return !f.name.isEmpty() && FileUtils::fileExists(f.absolutePath);
            });
        for (int i = 0; i < sequence.files.size(); ++i) {
            if (checks.value(i)) valid.append(sequence.files.at(i));
            else failed.append(sequence.files.at(i).name);
        }
    } else {
        valid = sequence.files;
    }

    if (valid.isEmpty()) {
        Proposal e = errorProposal(sequence.pattern, sequence.patternPath(),
                                   QString("None of the %1 frames could be validated").arg(sequence.files.size()));
        e.kind = Proposal::Kind::Sequence;
        return e;
    }

    Proposal p;
    p.id = newProposalId();
    p.kind = Proposal::Kind::Sequence;
    p.name = sequence.pattern;
    p.sourcePath = sequence.patternPath();
    for (const FileEntry& f : valid) {
        p.sourcePaths << f.absolutePath;
        p.totalBytes += f.sizeBytes;
    }
    p.frameCount = valid.size();
    p.frameRange = sequence.frameRange();
    p.gapCount = sequence.gapCount;
    if (!failed.isEmpty()) {
        p.warning = QString("%1 of %2 frames failed validation: %3")
                        .arg(failed.size()).arg(sequence.files.size()).arg(failed.join(", "));
        qWarning() << "[Mapping]" << sequence.pattern << p.warning;
    }

    // Tags come from the first frame
    p.tags = m_extractor.extractAll(valid.first().name, patterns, substringMatches);

    const Resolution res = PathResolver::resolve(root, profile.rules, sequence.pattern, p.tags);
    applyResolution(p, res);
    return p;
}

QVector<Proposal> MappingGenerator::generate(const FileTreeNode& tree, const Profile& profile,
                                             const PatternConfig& patterns, const QString& outputRoot,
                                             MappingProgressCallback onProgress, MappingSummary* summaryOut)
{
    MappingProgress progress;
    progress.stage = MappingProgress::Stage::Collecting;
    report(onProgress, progress, true);

    QVector<FileEntry> files;
    tree.collectFiles(files);
    return generate(files, profile, patterns, outputRoot, onProgress, summaryOut);
}

QVector<Proposal> MappingGenerator::generate(const QVector<FileEntry>& files, const Profile& profile,
                                             const PatternConfig& patterns, const QString& outputRoot,
                                             MappingProgressCallback onProgress, MappingSummary* summaryOut)
{
    qInfo() << "[Mapping] Generating proposals for" << files.size() << "files, profile" << profile.name
            << "workers:" << m_options.workerCount;

    MappingProgress progress;
    progress.stage = MappingProgress::Stage::Grouping;
    progress.total = files.size();
    report(onProgress, progress, true);

    const GroupingResult grouping = SequenceGrouper::group(files);
    const int total = grouping.sequences.size() + grouping.singles.size();
    std::atomic_int processed{0};
    std::atomic_int substringMatches{0};

    QVector<Proposal> proposals;
    proposals.reserve(total);

    progress.stage = MappingProgress::Stage::Sequences;
    progress.total = total;
    report(onProgress, progress, true);

    for (const SequenceGroup& seq : grouping.sequences) {
        int fallbacks = 0;
        Proposal p;
        try {
            p = proposalForSequence(seq, profile, patterns, outputRoot, &fallbacks);
        } catch (const std::exception& e) {
            qWarning() << "[Mapping] Failed to map sequence" << seq.pattern << ":" << e.what();
            p = errorProposal(seq.pattern, seq.patternPath(), QString::fromUtf8(e.what()));
            p.kind = Proposal::Kind::Sequence;
        }
        substringMatches += fallbacks;
        proposals.append(p);

        MappingProgress step;
        step.stage = MappingProgress::Stage::Sequences;
        step.processed = ++processed;
        step.total = total;
        step.currentItem = seq.pattern;
        report(onProgress, step, false);
    }

    progress.stage = MappingProgress::Stage::Files;
    progress.processed = processed;
    report(onProgress, progress, true);

    auto mapOne = [&](const FileEntry& file) -> Proposal {
        int fallbacks = 0;
        Proposal p;
        try {
            p = proposalForFile(file, profile, patterns, outputRoot, &fallbacks);
        } catch (const std::exception& e) {
            qWarning() << "[Mapping] Failed to map" << file.name << ":" << e.what();
            p = errorProposal(file.name, file.absolutePath, QString::fromUtf8(e.what()));
        }
        substringMatches += fallbacks;

        MappingProgress step;
        step.stage = MappingProgress::Stage::Files;
        step.processed = ++processed;
        step.total = total;
        step.currentItem = file.name;
        report(onProgress, step, false);
        return p;
    };

    const QList<Proposal> fileProposals =
        QtConcurrent::blockingMapped<QList<Proposal>>(&m_pool, grouping.singles, mapOne);
    for (const Proposal& p : fileProposals)
        proposals.append(p);

    MappingSummary summary = summarize(proposals);
    summary.fallbackMatches = substringMatches;
    qInfo() << "[Mapping] Generated" << summary.total << "proposals:"
            << "auto=" << summary.autoCount << "manual=" << summary.manualCount
            << "ambiguous=" << summary.ambiguousCount << "error=" << summary.errorCount
            << "sequences=" << summary.sequenceCount;
    if (summaryOut) *summaryOut = summary;

    progress.stage = MappingProgress::Stage::Done;
    progress.processed = total;
    report(onProgress, progress, true);
    return proposals;
}

MappingSummary MappingGenerator::summarize(const QVector<Proposal>& proposals)
{
    MappingSummary s;
    s.total = proposals.size();
    for (const Proposal& p : proposals) {
        if (p.isSequence()) ++s.sequenceCount;
        else ++s.fileCount;
        switch (p.status) {
            case Proposal::Status::Auto: ++s.autoCount; break;
            case Proposal::Status::Manual: ++s.manualCount; break;
            case Proposal::Status::Ambiguous: ++s.ambiguousCount; break;
            case Proposal::Status::Error: ++s.errorCount; break;
        }
    }
    return s;
}

static void mergeTag(std::optional<QString>& target, const std::optional<QString>& override)
{
    if (!override) return;
    if (override->trimmed().isEmpty()) target.reset();
    else target = override->trimmed();
}

Proposal MappingGenerator::applyTagOverrides(const Proposal& proposal, const TagSet& overrides,
                                             const QVector<FolderRule>& rules, const QString& outputRoot)
{
    Proposal p = proposal;
    if (p.name.isEmpty() || outputRoot.isEmpty()) {
        qWarning() << "[Mapping] Cannot re-resolve proposal" << p.id << "without name or output root";
        return p;
    }

    mergeTag(p.tags.shot, overrides.shot);
    mergeTag(p.tags.task, overrides.task);
    mergeTag(p.tags.asset, overrides.asset);
    mergeTag(p.tags.stage, overrides.stage);
    mergeTag(p.tags.version, overrides.version);
    mergeTag(p.tags.resolution, overrides.resolution);

    p.errorMessage.reset();
    const Resolution res = PathResolver::resolve(outputRoot, rules, p.name, p.tags);
    applyResolution(p, res);
    qDebug() << "[Mapping] Re-resolved" << p.name << "->" << p.destinationPath.value_or(QStringLiteral("<none>"));
    return p;
}

Proposal MappingGenerator::resolveAmbiguity(const Proposal& proposal, const QString& chosenSubpath,
                                            const QString& outputRoot, QString* errorOut)
{
    if (proposal.status != Proposal::Status::Ambiguous) {
        if (errorOut) *errorOut = QStringLiteral("Proposal is not ambiguous");
        return proposal;
    }
    bool offered = false;
    for (const AmbiguousOption& opt : proposal.ambiguousOptions) {
        if (opt.path == chosenSubpath) { offered = true; break; }
    }
    if (!offered) {
        if (errorOut) *errorOut = QString("'%1' is not one of the ambiguous options").arg(chosenSubpath);
        return proposal;
    }
    if (outputRoot.trimmed().isEmpty()) {
        if (errorOut) *errorOut = QStringLiteral("No output root to resolve against");
        return proposal;
    }

    Proposal p = proposal;
    p.destinationDir = PathResolver::assembleDir(outputRoot, chosenSubpath, p.tags);
    p.destinationPath = QDir::cleanPath(p.destinationDir + '/' + p.name);
    p.ambiguousOptions.clear();
    p.usedDefaultRule = false;
    p.status = Proposal::Status::Manual;
    return p;
}
