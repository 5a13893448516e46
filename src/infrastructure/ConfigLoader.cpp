/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/DefaultTaxonomy.hpp"
#include "domain/CuratorErrors.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace channelcurator::infrastructure {

using json = nlohmann::json;

namespace {

std::chrono::milliseconds Millis(const json& section, const char* key, std::chrono::milliseconds fallback) {
    if (!section.contains(key)) return fallback;
    return std::chrono::milliseconds(section.at(key).get<long long>());
}

std::string EnvOr(const char* primary, const char* secondary) {
    const char* value = std::getenv(primary);
    if (value && *value) return value;
    if (secondary) {
        value = std::getenv(secondary);
        if (value && *value) return value;
    }
    return {};
}

std::vector<domain::Category> ParseCategories(const json& list) {
    std::vector<domain::Category> categories;
    for (const auto& item : list) {
        domain::Category category;
        category.name = item.at("name").get<std::string>();
        category.region = item.value("region", std::string(domain::Taxonomy::kGlobalRegion));
        category.keywords = item.value("keywords", std::vector<std::string>{});
        category.excluded = item.value("excluded", false);
        categories.push_back(std::move(category));
    }
    return categories;
}

std::vector<domain::RegionProfile> ParseRegions(const json& list) {
    std::vector<domain::RegionProfile> regions;
    for (const auto& item : list) {
        domain::RegionProfile profile;
        profile.region = item.at("region").get<std::string>();
        profile.generalCategory = item.at("general").get<std::string>();
        profile.categories = item.value("categories", std::vector<std::string>{});
        regions.push_back(std::move(profile));
    }
    return regions;
}

domain::CuratorConfig FromJson(const json& j) {
    domain::CuratorConfig config = ConfigLoader::Defaults();
    if (!j.is_object()) {
        throw domain::ConfigurationError("settings root must be a JSON object");
    }

    if (j.contains("credentials")) {
        const auto& c = j["credentials"];
        config.credentials.username = c.value("username", std::string());
        config.credentials.password = c.value("password", std::string());
    }

    if (j.contains("origins")) {
        config.origins.clear();
        int index = 0;
        for (const auto& item : j["origins"]) {
            domain::Origin origin;
            origin.urlTemplate = item.at("url").get<std::string>();
            origin.label = item.value("label", "origin" + std::to_string(index));
            config.origins.push_back(std::move(origin));
            ++index;
        }
    }

    if (j.contains("fetch")) {
        const auto& f = j["fetch"];
        auto& fetch = config.fetch;
        fetch.maxAttempts = f.value("max_attempts", fetch.maxAttempts);
        fetch.backoff = Millis(f, "backoff_ms", fetch.backoff);
        fetch.connectTimeout = Millis(f, "connect_timeout_ms", fetch.connectTimeout);
        fetch.readTimeout = Millis(f, "read_timeout_ms", fetch.readTimeout);
        fetch.maxHeaderBytes = f.value("max_header_bytes", fetch.maxHeaderBytes);
        fetch.queueChunks = f.value("queue_chunks", fetch.queueChunks);
        fetch.playlistType = f.value("type", fetch.playlistType);
        fetch.outputFormat = f.value("output", fetch.outputFormat);
        std::string selection = f.value("origin_selection", std::string("cycle"));
        if (selection == "cycle") {
            fetch.selection = domain::OriginSelection::Cycle;
        } else if (selection == "sequential") {
            fetch.selection = domain::OriginSelection::Sequential;
        } else {
            throw domain::ConfigurationError("fetch.origin_selection must be 'cycle' or 'sequential', got '" + selection + "'");
        }
    }

    if (j.contains("parser")) {
        const auto& p = j["parser"];
        config.parser.locatorSchemes = p.value("locator_schemes", config.parser.locatorSchemes);
        config.parser.maxLineBytes = p.value("max_line_bytes", config.parser.maxLineBytes);
    }

    if (j.contains("routing_prefixes")) {
        config.prefixes.clear();
        for (const auto& item : j["routing_prefixes"]) {
            config.prefixes.push_back({item.at("prefix").get<std::string>(), item.at("region").get<std::string>()});
        }
    }

    if (j.contains("categories") || j.contains("regions")) {
        auto categories = j.contains("categories") ? ParseCategories(j["categories"]) : DefaultTaxonomy::Categories();
        auto regions = j.contains("regions") ? ParseRegions(j["regions"]) : DefaultTaxonomy::Regions();
        config.taxonomy = std::make_shared<const domain::Taxonomy>(std::move(categories), std::move(regions));
    }

    if (j.contains("output")) {
        const auto& o = j["output"];
        config.output.forwardGuideUrl = o.value("forward_guide_url", config.output.forwardGuideUrl);
        config.output.categoryAttribute = o.value("category_attribute", config.output.categoryAttribute);
    }

    if (j.contains("classifier")) {
        const auto& c = j["classifier"];
        auto& classifier = config.classifier;
        classifier.enabled = c.value("enabled", classifier.enabled);
        classifier.host = c.value("host", classifier.host);
        classifier.port = c.value("port", classifier.port);
        classifier.model = c.value("model", classifier.model);
        classifier.apiKey = c.value("api_key", classifier.apiKey);
        classifier.timeout = Millis(c, "timeout_ms", classifier.timeout);
        classifier.maxFailures = c.value("max_failures", classifier.maxFailures);
    }

    if (j.contains("cache")) {
        const auto& c = j["cache"];
        config.cache.enabled = c.value("enabled", config.cache.enabled);
        config.cache.ttl = std::chrono::seconds(c.value("ttl_seconds", static_cast<long long>(config.cache.ttl.count())));
        config.cache.maxBytes = c.value("max_bytes", config.cache.maxBytes);
    }

    if (j.contains("server")) {
        const auto& s = j["server"];
        config.server.host = s.value("host", config.server.host);
        config.server.port = s.value("port", config.server.port);
    }

    return config;
}

} // namespace

domain::CuratorConfig ConfigLoader::Defaults() {
    domain::CuratorConfig config;
    config.origins = DefaultTaxonomy::Origins();
    config.parser.locatorSchemes = DefaultTaxonomy::LocatorSchemes();
    config.prefixes = DefaultTaxonomy::Prefixes();
    config.taxonomy = std::make_shared<const domain::Taxonomy>(DefaultTaxonomy::Categories(), DefaultTaxonomy::Regions());
    return config;
}

domain::CuratorConfig ConfigLoader::Parse(const std::string& jsonText) {
    domain::CuratorConfig config;
    try {
        config = FromJson(json::parse(jsonText));
    } catch (const json::exception& e) {
        throw domain::ConfigurationError(std::string("invalid settings: ") + e.what());
    }
    Validate(config);
    return config;
}

domain::CuratorConfig ConfigLoader::Load(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        std::cout << "[ConfigLoader] " << path << " not found, using built-in defaults." << std::endl;
        auto config = Defaults();
        Validate(config);
        return config;
    }

    std::ifstream f(path);
    if (!f.is_open()) {
        throw domain::ConfigurationError("cannot open " + path);
    }
    std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    auto config = Parse(text);
    std::cout << "[ConfigLoader] Loaded " << path << " (" << config.origins.size() << " origins, "
              << config.taxonomy->categories().size() << " categories)" << std::endl;
    return config;
}

void ConfigLoader::ApplyEnvironment(domain::CuratorConfig& config) {
    std::string username = EnvOr("CURATOR_USERNAME", "USERNAME");
    std::string password = EnvOr("CURATOR_PASSWORD", "PASSWORD");
    if (!username.empty()) config.credentials.username = username;
    if (!password.empty()) config.credentials.password = password;

    std::string port = EnvOr("CURATOR_PORT", nullptr);
    if (!port.empty()) {
        try {
            config.server.port = std::stoi(port);
        } catch (const std::exception&) {
            throw domain::ConfigurationError("CURATOR_PORT is not a number: " + port);
        }
    }
}

void ConfigLoader::Validate(const domain::CuratorConfig& config) {
    if (config.origins.empty()) {
        throw domain::ConfigurationError("no origins configured");
    }
    for (const auto& origin : config.origins) {
        if (origin.urlTemplate.empty()) {
            throw domain::ConfigurationError("origin '" + origin.label + "' has an empty url");
        }
    }
    if (config.fetch.maxAttempts <= 0) {
        throw domain::ConfigurationError("fetch.max_attempts must be positive");
    }
    if (config.fetch.backoff.count() < 0) {
        throw domain::ConfigurationError("fetch.backoff_ms must not be negative");
    }
    if (config.fetch.connectTimeout.count() <= 0 || config.fetch.readTimeout.count() <= 0) {
        throw domain::ConfigurationError("fetch timeouts must be positive");
    }
    if (config.fetch.maxHeaderBytes == 0 || config.parser.maxLineBytes == 0) {
        throw domain::ConfigurationError("header and line limits must be positive");
    }
    if (config.parser.locatorSchemes.empty()) {
        throw domain::ConfigurationError("parser.locator_schemes is empty");
    }
    if (!config.taxonomy) {
        throw domain::ConfigurationError("no taxonomy configured");
    }
    if (config.prefixes.empty()) {
        throw domain::ConfigurationError("no routing prefixes configured");
    }
    for (const auto& prefix : config.prefixes) {
        if (prefix.token.empty()) {
            throw domain::ConfigurationError("empty routing prefix");
        }
        if (!config.taxonomy->hasRegion(prefix.region)) {
            throw domain::ConfigurationError("routing prefix '" + prefix.token + "' maps to unknown region: " + prefix.region);
        }
    }
    if (config.output.categoryAttribute.empty()) {
        throw domain::ConfigurationError("output.category_attribute is empty");
    }
    if (config.classifier.enabled && config.classifier.timeout.count() <= 0) {
        throw domain::ConfigurationError("classifier.timeout_ms must be positive");
    }
    if (config.cache.enabled && config.cache.maxBytes == 0) {
        throw domain::ConfigurationError("cache.max_bytes must be positive");
    }
}

} // namespace channelcurator::infrastructure
