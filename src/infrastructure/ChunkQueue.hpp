/**
 * @file ChunkQueue.hpp
 * @brief Bounded hand-off between an HTTP transport thread and the pipeline reader.
 */

#pragma once
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace channelcurator::infrastructure {

/**
 * @class ChunkQueue
 * @brief Single-producer, single-consumer queue of body chunks with backpressure.
 *
 * The producer blocks while the queue is full. Either side can end the exchange:
 * the producer with finish() (clean end or error), the consumer with close().
 */
class ChunkQueue {
public:
    explicit ChunkQueue(size_t capacity) : m_capacity(capacity == 0 ? 1 : capacity) {}

    /**
     * @brief Queues a chunk, waiting for space.
     * @return false once the consumer closed the queue; the producer must stop.
     */
    bool push(std::string chunk) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this] { return m_closed || m_chunks.size() < m_capacity; });
        if (m_closed) return false;
        m_chunks.push_back(std::move(chunk));
        m_cv.notify_all();
        return true;
    }

    /** @brief Marks the end of production. A non-empty error means the body was cut short. */
    void finish(const std::string& error = {}) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_finished) return;
        m_finished = true;
        m_error = error;
        m_cv.notify_all();
    }

    /** @brief Consumer side shutdown: drops pending chunks and unblocks the producer. */
    void close() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
        m_chunks.clear();
        m_cv.notify_all();
    }

    /** @brief Waits for the next chunk. std::nullopt once finished and drained, or closed. */
    std::optional<std::string> pop() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this] { return m_closed || m_finished || !m_chunks.empty(); });
        if (m_closed || m_chunks.empty()) return std::nullopt;
        std::string chunk = std::move(m_chunks.front());
        m_chunks.pop_front();
        m_cv.notify_all();
        return chunk;
    }

    std::string error() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_error;
    }

private:
    const size_t m_capacity;
    std::deque<std::string> m_chunks;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_finished = false;
    bool m_closed = false;
    std::string m_error;
};

} // namespace channelcurator::infrastructure
