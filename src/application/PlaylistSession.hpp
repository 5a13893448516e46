/**
 * @file PlaylistSession.hpp
 * @brief One streaming curation pass: parse, classify, dedupe, rewrite, emit.
 */

#pragma once
#include "application/CategoryClassifier.hpp"
#include "application/PlaylistEmitter.hpp"
#include "application/RecordParser.hpp"
#include "application/RecordRewriter.hpp"
#include "domain/ByteStream.hpp"
#include "domain/CuratorConfig.hpp"
#include "domain/PipelineStats.hpp"
#include "infrastructure/SnapshotCache.hpp"
#include <memory>
#include <string>

namespace channelcurator::application {

/**
 * @class PlaylistSession
 * @brief Lazy, single-pass producer of the curated playlist text.
 *
 * Each call to next() reads just enough input to append a bounded amount of
 * output, so the first bytes go out before the source is fully read. A
 * session cannot be restarted. Not thread-safe; owned by one request.
 */
class PlaylistSession {
public:
    static constexpr size_t kTargetChunkBytes = 16 * 1024;

    PlaylistSession(std::unique_ptr<domain::ByteStream> source,
                    std::string originLabel,
                    std::shared_ptr<const CategoryClassifier> classifier,
                    const domain::ParserSettings& parser,
                    const domain::OutputSettings& output,
                    std::shared_ptr<infrastructure::SnapshotRecorder> recorder = nullptr);
    ~PlaylistSession();

    PlaylistSession(const PlaylistSession&) = delete;
    PlaylistSession& operator=(const PlaylistSession&) = delete;

    /**
     * @brief Appends the next piece of output.
     * @return False once the playlist is complete (nothing appended).
     */
    bool next(std::string& out);

    /** @brief Stops the pass and releases the source; the recording is dropped. */
    void cancel();

    bool done() const { return m_done; }
    const std::string& originLabel() const { return m_originLabel; }
    const domain::PipelineStats& stats() const { return m_stats; }

private:
    /** @brief Runs one record through the pipeline; appends it to out if accepted. */
    void process(domain::RawRecord record, std::string& out);
    void complete();

    std::string m_originLabel;
    std::shared_ptr<const CategoryClassifier> m_classifier;
    std::shared_ptr<infrastructure::SnapshotRecorder> m_recorder;
    domain::PipelineStats m_stats;
    std::unique_ptr<RecordStream> m_records;
    RecordRewriter m_rewriter;
    PlaylistEmitter m_emitter;
    bool m_headerWritten = false;
    bool m_done = false;
};

} // namespace channelcurator::application
