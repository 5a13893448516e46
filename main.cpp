/**
 * @file main.cpp
 * @brief Entry point: loads settings and either serves the playlist or writes it once.
 */

#include "app/CuratorServer.hpp"
#include "application/PlaylistCurationService.hpp"
#include "domain/CuratorErrors.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/HttpStreamConnector.hpp"
#include "infrastructure/OllamaCategoryClassifier.hpp"
#include "infrastructure/SnapshotCache.hpp"

#include <iostream>
#include <memory>
#include <string>

using namespace channelcurator;

namespace {

void PrintUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--config settings.json] [--once]\n"
              << "  --config PATH  settings file (default: settings.json)\n"
              << "  --once         write one curated playlist to stdout and exit\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string configPath = "settings.json";
    bool once = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--once") {
            once = true;
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else {
            PrintUsage(argv[0]);
            return 64;
        }
    }

    // In one-shot mode stdout carries the playlist; log lines go to stderr.
    std::ostream playlistOut(std::cout.rdbuf());
    if (once) {
        std::cout.rdbuf(std::cerr.rdbuf());
    }

    std::shared_ptr<const domain::CuratorConfig> config;
    try {
        domain::CuratorConfig loaded = infrastructure::ConfigLoader::Load(configPath);
        infrastructure::ConfigLoader::ApplyEnvironment(loaded);
        infrastructure::ConfigLoader::Validate(loaded);
        config = std::make_shared<const domain::CuratorConfig>(std::move(loaded));
    } catch (const domain::ConfigurationError& e) {
        std::cerr << "[Main] Invalid configuration: " << e.what() << std::endl;
        return 2;
    }

    std::shared_ptr<domain::ExternalClassifier> external;
    if (config->classifier.enabled) {
        external = std::make_shared<infrastructure::OllamaCategoryClassifier>(config->classifier);
        std::cout << "[Main] External classifier: " << config->classifier.model << " at "
                  << config->classifier.host << ":" << config->classifier.port << std::endl;
    }

    std::shared_ptr<infrastructure::SnapshotCache> cache;
    if (config->cache.enabled) {
        cache = std::make_shared<infrastructure::SnapshotCache>(config->cache.ttl, config->cache.maxBytes);
    }

    std::shared_ptr<const application::PlaylistCurationService> service;
    try {
        service = std::make_shared<const application::PlaylistCurationService>(
            config, std::make_shared<infrastructure::HttpStreamConnector>(), external, cache);
    } catch (const domain::ConfigurationError& e) {
        std::cerr << "[Main] Invalid configuration: " << e.what() << std::endl;
        return 2;
    }

    if (once) {
        int rc = app::CuratorServer::RunOnce(*service, playlistOut);
        std::cout.rdbuf(playlistOut.rdbuf());
        return rc;
    }

    app::CuratorServer server(service, config->server);
    return server.Run() ? 0 : 1;
}
