#pragma once
#include <QString>
#include <QVector>
#include <QThreadPool>
#include <QMutex>
#include <functional>

#include "file_tree.h"
#include "pattern_extractor.h"
#include "path_resolver.h"
#include "progress_throttle.h"
#include "proposal.h"
#include "sequence_grouper.h"

struct MappingOptions {
    int workerCount = 0;                 // 0 = min(16, 2 x ideal thread count)
    bool validateSequenceFrames = true;  // check every member exists on disk
    int progressIntervalMs = 500;
};

struct MappingProgress {
    enum class Stage { Collecting, Grouping, Sequences, Files, Done };

    Stage stage = Stage::Collecting;
    int processed = 0;
    int total = 0;
    QString currentItem;

    int percentage() const { return total > 0 ? (processed * 100 / total) : 0; }
};

using MappingProgressCallback = std::function<void(const MappingProgress&)>;

/**
 * MappingGenerator builds one Proposal per standalone file or sequence.
 *
 * Sequences are processed one after another (their frames are validated in
 * parallel); standalone files are spread across a bounded worker pool. A
 * failure while building one Proposal turns that item into an Error proposal
 * and never stops the others. Output order is deterministic: sequences in
 * discovery order, then standalone files in input order.
 *
 * The progress callback is serialized but may run on a worker thread.
 * Stage changes are delivered immediately; intermediate updates are
 * coalesced to the configured interval.
 */
class MappingGenerator {
public:
    explicit MappingGenerator(PatternExtractor& extractor = PatternExtractor::instance());

    void setOptions(const MappingOptions& options);
    const MappingOptions& options() const { return m_options; }

    QVector<Proposal> generate(const FileTreeNode& tree, const Profile& profile, const PatternConfig& patterns,
                               const QString& outputRoot, MappingProgressCallback onProgress = {},
                               MappingSummary* summaryOut = nullptr);

    QVector<Proposal> generate(const QVector<FileEntry>& files, const Profile& profile,
                               const PatternConfig& patterns, const QString& outputRoot,
                               MappingProgressCallback onProgress = {}, MappingSummary* summaryOut = nullptr);

    Proposal proposalForFile(const FileEntry& file, const Profile& profile, const PatternConfig& patterns,
                             const QString& outputRoot, int* substringMatches = nullptr);
    Proposal proposalForSequence(const SequenceGroup& sequence, const Profile& profile,
                                 const PatternConfig& patterns, const QString& outputRoot,
                                 int* substringMatches = nullptr);

    // Batch edit: replace the tags set in overrides and recompute the destination
    static Proposal applyTagOverrides(const Proposal& proposal, const TagSet& overrides,
                                      const QVector<FolderRule>& rules, const QString& outputRoot);

    // Pick one of the ambiguous options; the proposal becomes Manual
    static Proposal resolveAmbiguity(const Proposal& proposal, const QString& chosenSubpath,
                                     const QString& outputRoot, QString* errorOut = nullptr);

    static Proposal::Status classify(const TagSet& tags, const Resolution& resolution);
    static MappingSummary summarize(const QVector<Proposal>& proposals);
    static int defaultWorkerCount();

private:
    static void applyResolution(Proposal& proposal, const Resolution& resolution);
    static Proposal errorProposal(const QString& name, const QString& sourcePath, const QString& message);
    void report(const MappingProgressCallback& cb, const MappingProgress& progress, bool force);

    PatternExtractor& m_extractor;
    MappingOptions m_options;
    QThreadPool m_pool;
    QMutex m_progressMutex;
    ProgressThrottle m_throttle;
};
