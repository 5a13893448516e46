/**
 * @file PlaylistSession.cpp
 * @brief Implementation of PlaylistSession.
 */

#include "application/PlaylistSession.hpp"
#include "domain/Taxonomy.hpp"
#include <iostream>

namespace channelcurator::application {

PlaylistSession::PlaylistSession(std::unique_ptr<domain::ByteStream> source,
                                 std::string originLabel,
                                 std::shared_ptr<const CategoryClassifier> classifier,
                                 const domain::ParserSettings& parser,
                                 const domain::OutputSettings& output,
                                 std::shared_ptr<infrastructure::SnapshotRecorder> recorder)
    : m_originLabel(std::move(originLabel)),
      m_classifier(std::move(classifier)),
      m_recorder(std::move(recorder)),
      m_rewriter(output.categoryAttribute),
      m_emitter(output) {
    if (m_recorder) {
        source = std::make_unique<infrastructure::RecordingByteStream>(std::move(source), m_recorder);
    }
    m_records = std::make_unique<RecordStream>(std::move(source), parser, m_stats);
}

PlaylistSession::~PlaylistSession() {
    if (!m_done) cancel();
}

bool PlaylistSession::next(std::string& out) {
    if (m_done) return false;

    if (!m_headerWritten) {
        m_emitter.writeHeader(m_records->header(), out);
        m_headerWritten = true;
        return true;
    }

    const size_t start = out.size();
    while (out.size() - start < kTargetChunkBytes) {
        auto record = m_records->next();
        if (!record) {
            complete();
            break;
        }
        process(std::move(*record), out);
    }
    return out.size() > start;
}

void PlaylistSession::process(domain::RawRecord record, std::string& out) {
    auto admission = m_classifier->admit(record.metadata.displayName());
    if (!admission) {
        ++m_stats.outOfScope;
        return;
    }
    // Checked before classification so duplicates never reach the external classifier.
    if (m_rewriter.seen(record.locator)) {
        ++m_stats.duplicates;
        return;
    }

    domain::ClassificationResult result = m_classifier->classify(admission->displayName, admission->region);
    switch (result.provenance) {
        case domain::Provenance::Keyword: ++m_stats.byKeyword; break;
        case domain::Provenance::External: ++m_stats.byExternal; break;
        case domain::Provenance::Fallback: ++m_stats.byFallback; break;
    }

    if (result.category->excluded) {
        ++m_stats.excluded;
        return;
    }

    m_emitter.writeRecord(m_rewriter.accept(std::move(record), *admission, result), out);
    ++m_stats.emitted;
}

void PlaylistSession::complete() {
    m_done = true;
    std::string transportError = m_records->transportError();
    if (m_recorder) {
        if (transportError.empty()) {
            m_recorder->commit();
        } else {
            m_recorder->discard();
        }
    }
    if (!transportError.empty()) {
        std::cerr << "[PlaylistSession] Source " << m_originLabel
                  << " ended early: " << transportError << std::endl;
    }
    m_records->close();
    std::cout << "[PlaylistSession] " << m_originLabel << ": " << m_stats.summary() << std::endl;
}

void PlaylistSession::cancel() {
    if (m_done) return;
    m_done = true;
    if (m_recorder) m_recorder->discard();
    m_records->close();
    std::cout << "[PlaylistSession] Cancelled after " << m_stats.emitted << " records" << std::endl;
}

} // namespace channelcurator::application
