#include <cassert>
#include <cstdlib>
#include <iostream>
#include "domain/CuratorErrors.hpp"
#include "infrastructure/ConfigLoader.hpp"

using namespace channelcurator;
using infrastructure::ConfigLoader;

namespace {

bool Rejects(const std::string& json) {
    try {
        ConfigLoader::Parse(json);
    } catch (const domain::ConfigurationError& e) {
        std::cout << "       rejected: " << e.what() << std::endl;
        return true;
    }
    return false;
}

} // namespace

void TestDefaults() {
    auto config = ConfigLoader::Parse("{}");
    assert(config.origins.size() == 1);
    assert(config.origins[0].label == "premiumpowers");
    assert(config.fetch.maxAttempts == 5);
    assert(config.fetch.backoff == std::chrono::milliseconds(2000));
    assert(config.fetch.selection == domain::OriginSelection::Cycle);
    assert(config.taxonomy->categories().size() == 19);
    assert(config.taxonomy->categories().front().name == "USA News");
    assert(config.taxonomy->generalCategory("mexico").name == "Mexico General");
    assert(config.output.categoryAttribute == "group-title");
    assert(!config.classifier.enabled);
    assert(!config.credentials.complete());
    std::cout << "[PASS] Empty settings fall back to the built-in defaults" << std::endl;
}

void TestFullSettings() {
    const std::string json = R"({
        "credentials": {"username": "u", "password": "p"},
        "origins": [{"label": "a", "url": "http://a/get.php?u={username}"},
                    {"url": "http://b/get.php?u={username}"}],
        "fetch": {"max_attempts": 3, "backoff_ms": 10, "origin_selection": "sequential", "type": "m3u"},
        "routing_prefixes": [{"prefix": "CA|", "region": "canada"}],
        "categories": [
            {"name": "CA News", "region": "canada", "keywords": ["CBC News", "CTV"]},
            {"name": "CA General", "region": "canada"},
            {"name": "Hockey", "keywords": ["NHL"], "excluded": true}
        ],
        "regions": [{"region": "canada", "general": "CA General", "categories": ["Hockey", "CA News", "CA General"]}],
        "output": {"forward_guide_url": false, "category_attribute": "tvg-group"},
        "classifier": {"enabled": true, "model": "llama3", "api_key": "k", "timeout_ms": 500, "max_failures": 2},
        "cache": {"enabled": false, "ttl_seconds": 30},
        "server": {"port": 8080}
    })";
    auto config = ConfigLoader::Parse(json);
    assert(config.credentials.complete());
    assert(config.origins.size() == 2);
    assert(config.origins[1].label == "origin1");
    assert(config.fetch.maxAttempts == 3);
    assert(config.fetch.selection == domain::OriginSelection::Sequential);
    assert(config.fetch.playlistType == "m3u");
    assert(config.prefixes.size() == 1);
    auto labels = config.taxonomy->labels("canada");
    assert((labels == std::vector<std::string>{"Hockey", "CA News", "CA General"}));
    assert(config.taxonomy->find("CA News")->keywords[0] == "cbc news");
    assert(config.taxonomy->find("Hockey")->excluded);
    assert(!config.output.forwardGuideUrl);
    assert(config.output.categoryAttribute == "tvg-group");
    assert(config.classifier.enabled && config.classifier.model == "llama3");
    assert(config.classifier.timeout == std::chrono::milliseconds(500));
    assert(!config.cache.enabled && config.cache.ttl == std::chrono::seconds(30));
    assert(config.server.port == 8080);
    std::cout << "[PASS] Every section is read" << std::endl;
}

void TestValidation() {
    assert(Rejects("not json"));
    assert(Rejects("[]"));
    assert(Rejects(R"({"origins": []})"));
    assert(Rejects(R"({"fetch": {"max_attempts": 0}})"));
    assert(Rejects(R"({"fetch": {"read_timeout_ms": 0}})"));
    assert(Rejects(R"({"fetch": {"origin_selection": "random"}})"));
    assert(Rejects(R"({"routing_prefixes": [{"prefix": "UK|", "region": "uk"}]})"));
    assert(Rejects(R"({"categories": [{"name": "A", "region": "usa"}, {"name": "A", "region": "usa"}]})"));
    assert(Rejects(R"({"regions": [{"region": "usa", "general": "Soccer", "categories": ["USA News"]}]})"));
    assert(Rejects(R"({"regions": [{"region": "usa", "general": "USA General", "categories": ["Nope", "USA General"]}]})"));
    assert(Rejects(R"({"origins": [{"label": "x"}]})"));
    std::cout << "[PASS] Invalid settings raise ConfigurationError" << std::endl;
}

void TestEnvironment() {
    setenv("CURATOR_USERNAME", "env-user", 1);
    unsetenv("CURATOR_PASSWORD");
    setenv("PASSWORD", "env-pass", 1);
    setenv("CURATOR_PORT", "6001", 1);

    auto config = ConfigLoader::Defaults();
    ConfigLoader::ApplyEnvironment(config);
    assert(config.credentials.username == "env-user");
    assert(config.credentials.password == "env-pass");
    assert(config.server.port == 6001);

    setenv("CURATOR_PORT", "abc", 1);
    bool threw = false;
    try {
        ConfigLoader::ApplyEnvironment(config);
    } catch (const domain::ConfigurationError&) {
        threw = true;
    }
    assert(threw);
    unsetenv("CURATOR_PORT");
    std::cout << "[PASS] Credentials and port taken from the environment" << std::endl;
}

void TestMissingFile() {
    auto config = ConfigLoader::Load("does-not-exist/settings.json");
    assert(config.origins.size() == 1);
    std::cout << "[PASS] Missing settings file yields defaults" << std::endl;
}

int main() {
    std::cout << "[Test] Starting Config Loader Test..." << std::endl;
    TestDefaults();
    TestFullSettings();
    TestValidation();
    TestEnvironment();
    TestMissingFile();
    std::cout << "[Test] All config loader tests passed." << std::endl;
    return 0;
}
