/**
 * @file SnapshotCache.cpp
 * @brief Implementation of SnapshotCache and its stream adapters.
 */

#include "infrastructure/SnapshotCache.hpp"
#include <atomic>
#include <iostream>

namespace channelcurator::infrastructure {

SnapshotCache::SnapshotCache(std::chrono::seconds ttl, size_t maxBytes, Clock clock)
    : m_ttl(ttl), m_maxBytes(maxBytes), m_clock(std::move(clock)) {
    if (!m_clock) {
        m_clock = [] { return std::chrono::system_clock::now(); };
    }
}

std::shared_ptr<const DocumentSnapshot> SnapshotCache::getFresh() const {
    auto current = std::atomic_load(&m_current);
    if (!current) return nullptr;
    if (m_clock() - current->fetchedAt > m_ttl) return nullptr;
    return current;
}

bool SnapshotCache::publish(std::shared_ptr<const DocumentSnapshot> snapshot) {
    if (!snapshot) return false;
    std::lock_guard<std::mutex> lock(m_writeMutex);
    auto current = std::atomic_load(&m_current);
    if (current && current->fetchedAt > snapshot->fetchedAt) {
        return false;
    }
    std::atomic_store(&m_current, std::move(snapshot));
    return true;
}

SnapshotRecorder::SnapshotRecorder(std::shared_ptr<SnapshotCache> cache, std::string originLabel)
    : m_cache(std::move(cache)), m_originLabel(std::move(originLabel)), m_startedAt(m_cache->now()) {}

void SnapshotRecorder::append(const std::string& chunk) {
    if (m_done || m_overflowed) return;
    if (m_body.size() + chunk.size() > m_cache->maxBytes()) {
        m_overflowed = true;
        m_body.clear();
        m_body.shrink_to_fit();
        std::cout << "[SnapshotCache] Document exceeds " << m_cache->maxBytes()
                  << " bytes; not caching this pass." << std::endl;
        return;
    }
    m_body += chunk;
}

void SnapshotRecorder::commit() {
    if (m_done) return;
    m_done = true;
    if (m_overflowed || m_body.empty()) return;

    auto snapshot = std::make_shared<DocumentSnapshot>();
    snapshot->body = std::move(m_body);
    snapshot->originLabel = m_originLabel;
    // Stamped with the fetch start so a slower, older pass cannot replace a newer one.
    snapshot->fetchedAt = m_startedAt;
    size_t size = snapshot->body.size();
    if (m_cache->publish(std::move(snapshot))) {
        std::cout << "[SnapshotCache] Stored " << size << " bytes from " << m_originLabel << std::endl;
    }
}

void SnapshotRecorder::discard() {
    m_done = true;
    m_body.clear();
}

RecordingByteStream::RecordingByteStream(std::unique_ptr<domain::ByteStream> inner,
                                         std::shared_ptr<SnapshotRecorder> recorder)
    : m_inner(std::move(inner)), m_recorder(std::move(recorder)) {}

std::optional<std::string> RecordingByteStream::read() {
    auto chunk = m_inner->read();
    if (chunk) {
        m_recorder->append(*chunk);
    }
    return chunk;
}

void RecordingByteStream::close() {
    m_inner->close();
}

std::string RecordingByteStream::error() const {
    return m_inner->error();
}

SnapshotByteStream::SnapshotByteStream(std::shared_ptr<const DocumentSnapshot> snapshot, size_t chunkSize)
    : m_snapshot(std::move(snapshot)), m_chunkSize(chunkSize == 0 ? 1 : chunkSize) {}

std::optional<std::string> SnapshotByteStream::read() {
    if (m_closed || m_offset >= m_snapshot->body.size()) return std::nullopt;
    std::string chunk = m_snapshot->body.substr(m_offset, m_chunkSize);
    m_offset += chunk.size();
    return chunk;
}

} // namespace channelcurator::infrastructure
