/**
 * @file HttpStreamConnector.hpp
 * @brief Streaming GET over cpp-httplib.
 */

#pragma once
#include "domain/ByteStream.hpp"
#include <string>

namespace channelcurator::infrastructure {

/**
 * @class HttpStreamConnector
 * @brief Implements domain::StreamConnector with one transport thread per request.
 *
 * The body is pushed by httplib's content receiver into a bounded ChunkQueue
 * and pulled by the returned ByteStream, so it is never buffered whole.
 * Closing the stream stops the client and joins the thread.
 *
 * Redirects (301, 302, 303, 307, 308) are resolved here rather than by httplib,
 * each hop on a fresh client, so the client a body stream stops is always the
 * one carrying its transfer. After five hops the redirect response itself is
 * returned.
 */
class HttpStreamConnector : public domain::StreamConnector {
public:
    explicit HttpStreamConnector(std::string userAgent = "ChannelCurator/1.0");

    domain::StreamResponse open(const domain::StreamRequest& request) override;

private:
    std::string m_userAgent;
};

} // namespace channelcurator::infrastructure
