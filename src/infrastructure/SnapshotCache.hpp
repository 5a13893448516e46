/**
 * @file SnapshotCache.hpp
 * @brief Last-good raw playlist, kept to ride out short origin outages.
 */

#pragma once
#include "domain/ByteStream.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace channelcurator::infrastructure {

/**
 * @struct DocumentSnapshot
 * @brief Immutable copy of a raw document that streamed end to end without error.
 */
struct DocumentSnapshot {
    std::string body;
    std::string originLabel;
    std::chrono::system_clock::time_point fetchedAt;
};

/**
 * @class SnapshotCache
 * @brief Read-mostly holder of one DocumentSnapshot.
 *
 * Readers take a shared_ptr copy via an atomic load and never block. Writers are
 * serialized, and a snapshot older than the current one is never published.
 */
class SnapshotCache {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    SnapshotCache(std::chrono::seconds ttl, size_t maxBytes, Clock clock = nullptr);

    /** @brief Current snapshot if younger than the TTL, otherwise nullptr. */
    std::shared_ptr<const DocumentSnapshot> getFresh() const;

    /**
     * @brief Replaces the current snapshot if the candidate is newer.
     * @return True if the candidate was published.
     */
    bool publish(std::shared_ptr<const DocumentSnapshot> snapshot);

    size_t maxBytes() const { return m_maxBytes; }
    std::chrono::system_clock::time_point now() const { return m_clock(); }

private:
    std::chrono::seconds m_ttl;
    size_t m_maxBytes;
    Clock m_clock;
    std::shared_ptr<const DocumentSnapshot> m_current; ///< Only touched through std::atomic_load/store.
    std::mutex m_writeMutex;
};

/**
 * @class SnapshotRecorder
 * @brief Accumulates the raw bytes of one pass and publishes them on commit.
 */
class SnapshotRecorder {
public:
    SnapshotRecorder(std::shared_ptr<SnapshotCache> cache, std::string originLabel);

    void append(const std::string& chunk);

    /** @brief Publishes the recording unless it overflowed. Further calls are ignored. */
    void commit();

    /** @brief Drops the recording. */
    void discard();

    bool overflowed() const { return m_overflowed; }

private:
    std::shared_ptr<SnapshotCache> m_cache;
    std::string m_originLabel;
    std::chrono::system_clock::time_point m_startedAt;
    std::string m_body;
    bool m_overflowed = false;
    bool m_done = false;
};

/**
 * @class RecordingByteStream
 * @brief Passes chunks through while copying them into a SnapshotRecorder.
 */
class RecordingByteStream : public domain::ByteStream {
public:
    RecordingByteStream(std::unique_ptr<domain::ByteStream> inner, std::shared_ptr<SnapshotRecorder> recorder);

    std::optional<std::string> read() override;
    void close() override;
    std::string error() const override;

private:
    std::unique_ptr<domain::ByteStream> m_inner;
    std::shared_ptr<SnapshotRecorder> m_recorder;
};

/**
 * @class SnapshotByteStream
 * @brief Replays a snapshot in fixed-size chunks without copying the whole body.
 */
class SnapshotByteStream : public domain::ByteStream {
public:
    explicit SnapshotByteStream(std::shared_ptr<const DocumentSnapshot> snapshot, size_t chunkSize = 64 * 1024);

    std::optional<std::string> read() override;
    void close() override { m_closed = true; }

private:
    std::shared_ptr<const DocumentSnapshot> m_snapshot;
    size_t m_chunkSize;
    size_t m_offset = 0;
    bool m_closed = false;
};

} // namespace channelcurator::infrastructure
