/**
 * @file OriginFetcher.hpp
 * @brief Acquires the source playlist from a list of origins with retry and backoff.
 */

#pragma once
#include "domain/ByteStream.hpp"
#include "domain/CuratorConfig.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace channelcurator::application {

/**
 * @struct FetchedDocument
 * @brief A body whose first line carries the playlist header, not yet consumed.
 */
struct FetchedDocument {
    std::unique_ptr<domain::ByteStream> stream; ///< Starts with the header line.
    std::string originLabel;
    int attempts = 0;
};

/**
 * @class OriginFetcher
 * @brief Tries origins until one answers 2xx with a valid header line.
 *
 * Only the first line is read before the stream is handed back; the bytes read
 * for the check are spliced in front of the remaining body.
 */
class OriginFetcher {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    OriginFetcher(std::vector<domain::Origin> origins,
                  domain::FetchPolicy policy,
                  std::shared_ptr<domain::StreamConnector> connector,
                  Sleeper sleeper = nullptr);

    /**
     * @brief Runs the attempt loop.
     * @throws ConfigurationError if the credentials are incomplete (no request is made).
     * @throws AcquisitionError once every attempt failed.
     */
    FetchedDocument fetch(const domain::Credentials& credentials) const;

    /** @brief True if the line (BOM and CR tolerated) starts with the header token. */
    static bool HasValidHeader(std::string_view firstLine);

private:
    const domain::Origin& originForAttempt(int attempt) const;

    /** @brief One attempt. Returns the failure reason, or std::nullopt with doc filled. */
    std::optional<std::string> attempt(const domain::Origin& origin,
                                       const domain::Credentials& credentials,
                                       FetchedDocument& doc) const;

    std::vector<domain::Origin> m_origins;
    domain::FetchPolicy m_policy;
    std::shared_ptr<domain::StreamConnector> m_connector;
    Sleeper m_sleeper;
};

} // namespace channelcurator::application
