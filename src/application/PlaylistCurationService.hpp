/**
 * @file PlaylistCurationService.hpp
 * @brief Entry point of the pipeline: acquire the source and open a curation session.
 */

#pragma once
#include "application/CategoryClassifier.hpp"
#include "application/OriginFetcher.hpp"
#include "application/PlaylistSession.hpp"
#include "domain/ByteStream.hpp"
#include "domain/CuratorConfig.hpp"
#include "domain/ExternalClassifier.hpp"
#include "infrastructure/SnapshotCache.hpp"
#include <memory>

namespace channelcurator::application {

/**
 * @class PlaylistCurationService
 * @brief Shared by all requests; every call to openSession() is independent.
 *
 * Only the snapshot cache is shared between sessions. When every origin fails,
 * a fresh cached document is replayed instead, unless the request supplied its
 * own credentials (the cache only holds documents fetched with the configured ones).
 */
class PlaylistCurationService {
public:
    PlaylistCurationService(std::shared_ptr<const domain::CuratorConfig> config,
                            std::shared_ptr<domain::StreamConnector> connector,
                            std::shared_ptr<domain::ExternalClassifier> external = nullptr,
                            std::shared_ptr<infrastructure::SnapshotCache> cache = nullptr,
                            OriginFetcher::Sleeper sleeper = nullptr);

    /**
     * @brief Acquires the source document and returns a session ready to stream.
     * @param overrides Non-empty fields replace the configured credentials.
     * @throws ConfigurationError, AcquisitionError
     */
    std::unique_ptr<PlaylistSession> openSession(const domain::Credentials& overrides = {}) const;

    const CategoryClassifier& classifier() const { return *m_classifier; }

private:
    std::shared_ptr<const domain::CuratorConfig> m_config;
    std::shared_ptr<const CategoryClassifier> m_classifier;
    std::shared_ptr<infrastructure::SnapshotCache> m_cache;
    OriginFetcher m_fetcher;
};

} // namespace channelcurator::application
