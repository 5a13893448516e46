/**
 * @file ByteStream.hpp
 * @brief Pull-based body stream and the connector that opens one per request.
 */

#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace channelcurator::domain {

/**
 * @class ByteStream
 * @brief Forward-only, non-restartable sequence of body chunks.
 */
class ByteStream {
public:
    virtual ~ByteStream() = default;

    /**
     * @brief Blocks until the next chunk is available.
     * @return The chunk, or std::nullopt once the body ended (cleanly or not, see error()).
     */
    virtual std::optional<std::string> read() = 0;

    /** @brief Aborts the transfer and releases the connection. Idempotent. */
    virtual void close() = 0;

    /** @brief Transport error that ended the body early; empty after a clean end. */
    virtual std::string error() const { return {}; }
};

/**
 * @struct StreamRequest
 * @brief One GET to issue.
 */
struct StreamRequest {
    std::string url;
    std::chrono::milliseconds connectTimeout{10000};
    std::chrono::milliseconds readTimeout{120000};
    size_t queueChunks = 64; ///< Chunks buffered ahead of the reader before the transfer pauses.
};

/**
 * @struct StreamResponse
 * @brief Status line outcome plus the streaming body.
 */
struct StreamResponse {
    int status = 0;                   ///< HTTP status, 0 when no response arrived.
    std::string error;                ///< Transport error when status == 0.
    std::unique_ptr<ByteStream> body; ///< Set whenever status != 0.
};

/**
 * @class StreamConnector
 * @brief Opens streaming GET requests. Returns once the status is known, before the body is read.
 */
class StreamConnector {
public:
    virtual ~StreamConnector() = default;
    virtual StreamResponse open(const StreamRequest& request) = 0;
};

} // namespace channelcurator::domain
