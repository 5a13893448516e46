/**
 * @file CuratorConfig.hpp
 * @brief Immutable run configuration, produced by infrastructure::ConfigLoader.
 */

#pragma once
#include "domain/Taxonomy.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace channelcurator::domain {

struct Credentials {
    std::string username;
    std::string password;

    bool complete() const { return !username.empty() && !password.empty(); }
};

/**
 * @struct Origin
 * @brief Candidate source. Placeholders: {username} {password} {type} {output}.
 */
struct Origin {
    std::string label;
    std::string urlTemplate;
};

enum class OriginSelection {
    Cycle,      ///< Attempt i uses origin i mod n.
    Sequential  ///< Origins in order; the last one takes the remaining attempts.
};

struct FetchPolicy {
    int maxAttempts = 5;
    std::chrono::milliseconds backoff{2000};
    std::chrono::milliseconds connectTimeout{10000};
    std::chrono::milliseconds readTimeout{120000};
    size_t maxHeaderBytes = 64 * 1024;
    size_t queueChunks = 64;
    std::string playlistType = "m3u_plus";
    std::string outputFormat = "ts";
    OriginSelection selection = OriginSelection::Cycle;
};

struct ParserSettings {
    std::vector<std::string> locatorSchemes; ///< e.g. "http://"; matched case-insensitively.
    size_t maxLineBytes = 64 * 1024;
};

struct OutputSettings {
    bool forwardGuideUrl = true;
    std::string categoryAttribute = "group-title";
};

struct ClassifierSettings {
    bool enabled = false;
    std::string host = "localhost";
    int port = 11434;
    std::string model = "qwen2.5:7b";
    std::string apiKey;
    std::chrono::milliseconds timeout{3000};
    int maxFailures = 5; ///< Consecutive transport failures before the adapter stops calling out.
};

struct CacheSettings {
    bool enabled = true;
    std::chrono::seconds ttl{900};
    size_t maxBytes = 64 * 1024 * 1024;
};

struct ServerSettings {
    std::string host = "0.0.0.0";
    int port = 5000;
};

/**
 * @struct CuratorConfig
 * @brief Everything one run needs. Shared read-only between concurrent requests.
 */
struct CuratorConfig {
    Credentials credentials;
    std::vector<Origin> origins;
    FetchPolicy fetch;
    ParserSettings parser;
    std::vector<RoutingPrefix> prefixes;
    std::shared_ptr<const Taxonomy> taxonomy;
    OutputSettings output;
    ClassifierSettings classifier;
    CacheSettings cache;
    ServerSettings server;
};

} // namespace channelcurator::domain
