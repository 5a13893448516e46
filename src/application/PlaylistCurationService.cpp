/**
 * @file PlaylistCurationService.cpp
 * @brief Implementation of PlaylistCurationService.
 */

#include "application/PlaylistCurationService.hpp"
#include "domain/CuratorErrors.hpp"
#include <iostream>

namespace channelcurator::application {

PlaylistCurationService::PlaylistCurationService(std::shared_ptr<const domain::CuratorConfig> config,
                                                 std::shared_ptr<domain::StreamConnector> connector,
                                                 std::shared_ptr<domain::ExternalClassifier> external,
                                                 std::shared_ptr<infrastructure::SnapshotCache> cache,
                                                 OriginFetcher::Sleeper sleeper)
    : m_config(std::move(config)),
      m_classifier(std::make_shared<CategoryClassifier>(m_config->taxonomy, m_config->prefixes, std::move(external))),
      m_cache(std::move(cache)),
      m_fetcher(m_config->origins, m_config->fetch, std::move(connector), std::move(sleeper)) {}

std::unique_ptr<PlaylistSession> PlaylistCurationService::openSession(const domain::Credentials& overrides) const {
    domain::Credentials credentials = m_config->credentials;
    const bool overridden = !overrides.username.empty() || !overrides.password.empty();
    if (!overrides.username.empty()) credentials.username = overrides.username;
    if (!overrides.password.empty()) credentials.password = overrides.password;

    try {
        FetchedDocument doc = m_fetcher.fetch(credentials);
        std::shared_ptr<infrastructure::SnapshotRecorder> recorder;
        if (m_cache && !overridden) {
            recorder = std::make_shared<infrastructure::SnapshotRecorder>(m_cache, doc.originLabel);
        }
        return std::make_unique<PlaylistSession>(std::move(doc.stream), doc.originLabel, m_classifier,
                                                 m_config->parser, m_config->output, std::move(recorder));
    } catch (const domain::AcquisitionError& e) {
        if (!m_cache || overridden) throw;
        auto snapshot = m_cache->getFresh();
        if (!snapshot) throw;

        std::cerr << "[CurationService] " << e.what() << std::endl;
        std::cout << "[CurationService] Serving cached document from " << snapshot->originLabel << std::endl;
        std::string label = snapshot->originLabel + " (cached)";
        return std::make_unique<PlaylistSession>(std::make_unique<infrastructure::SnapshotByteStream>(snapshot),
                                                 std::move(label), m_classifier,
                                                 m_config->parser, m_config->output);
    }
}

} // namespace channelcurator::application
