#include <cassert>
#include <iostream>
#include <set>
#include "application/PlaylistCurationService.hpp"
#include "application/PlaylistSession.hpp"
#include "domain/CuratorErrors.hpp"
#include "domain/ExtInfLine.hpp"
#include "TestSupport.hpp"

using namespace channelcurator;

namespace {

std::shared_ptr<const application::CategoryClassifier> MakeClassifier(
    const domain::CuratorConfig& config, std::shared_ptr<domain::ExternalClassifier> external = nullptr) {
    return std::make_shared<const application::CategoryClassifier>(config.taxonomy, config.prefixes, external);
}

std::string RunSession(application::PlaylistSession& session) {
    std::string out;
    int calls = 0;
    while (session.next(out)) {
        ++calls;
        assert(calls < 10000);
    }
    return out;
}

std::string Curate(const std::string& body, domain::PipelineStats* stats = nullptr,
                   domain::OutputSettings output = {}) {
    auto config = test::MakeTestConfig();
    application::PlaylistSession session(std::make_unique<test::StringByteStream>(body, 11), "test",
                                         MakeClassifier(config), config.parser, output);
    std::string out = RunSession(session);
    if (stats) *stats = session.stats();
    return out;
}

} // namespace

void TestDuplicateScenario() {
    const std::string input =
        "#EXTM3U\n"
        "#EXTINF:-1,US|CNN HD\nhttp://a/1\n"
        "#EXTINF:-1,MX|Canal 5\nhttp://b/2\n"
        "#EXTINF:-1,US|CNN HD\nhttp://a/1\n";

    domain::PipelineStats stats;
    std::string out = Curate(input, &stats);
    const std::string expected =
        "#EXTM3U\n"
        "#EXTINF:-1 group-title=\"USA News\",CNN HD\nhttp://a/1\n"
        "#EXTINF:-1 group-title=\"Mexico Movies\",Canal 5\nhttp://b/2\n";
    assert(out == expected);
    assert(stats.emitted == 2);
    assert(stats.duplicates == 1);
    std::cout << "[PASS] Duplicate locator is emitted once, prefixes stripped" << std::endl;
}

void TestRoundTrip() {
    struct Row { std::string name; std::string category; };
    const std::vector<Row> rows = {
        {"US|HBO East", "USA Movies"},
        {"US: Cartoon Network", "USA Kids"},
        {"USA|NBA League Pass", "Basketball"},
        {"MX|Milenio TV", "Mexico News"},
        {"MX: Las Estrellas", "Mexico General"},
        {"US|ESPN College Football", "Football"},
        {"MX|Liga MX 1", "Soccer"},
        {"US|Nat Geo Wild", "Documentary"},
    };

    std::string input = "#EXTM3U url-tvg=\"http://guide/epg.xml.gz\"\n";
    for (size_t i = 0; i < rows.size(); ++i) {
        input += "#EXTINF:-1 tvg-id=\"id" + std::to_string(i) + "\" tvg-logo=\"http://logo/" + std::to_string(i) +
                 ".png\"," + rows[i].name + "\n";
        input += "http://stream/" + std::to_string(i) + ".ts\n";
    }

    std::string out = Curate(input);
    auto lines = test::Lines(out);
    assert(lines.size() == 1 + 2 * rows.size());
    assert(lines[0] == "#EXTM3U url-tvg=\"http://guide/epg.xml.gz\"");

    for (size_t i = 0; i < rows.size(); ++i) {
        auto meta = domain::ExtInfLine::Parse(lines[1 + 2 * i]);
        assert(meta);
        assert(meta->attribute("group-title") == rows[i].category);
        assert(meta->attribute("tvg-id") == "id" + std::to_string(i));
        assert(lines[2 + 2 * i] == "http://stream/" + std::to_string(i) + ".ts");
    }
    std::cout << "[PASS] N well-formed records produce N pairs in input order" << std::endl;
}

void TestOutputInvariants() {
    const std::string input =
        "#EXTM3U\n"
        "#EXTINF:-1 group-title=\"Old\" tvg-id=\"x\" group-title=\"Older\",US| US: CNN\nhttp://a/1\n"
        "#EXTINF:-1,US|CNN\nhttp://a/1\n"
        "#EXTINF:-1 group-title=\"Sports\",USA|Local 12\nhttp://a/2\n"
        "#EXTINF:-1,UK|BBC One\nhttp://a/3\n"
        "#EXTINF:-1,MX|Cine Latino, HD\nhttp://a/4\n"
        "#EXTINF:-1,US|Orphan\n"
        "#EXTVLCOPT:http-user-agent=Player\n"
        "http://a/5\n"
        "#EXTINF:-1,US|No Locator\n"
        "#EXTINF:-1,MX:Canal 5\nhttp://a/4\n";

    domain::PipelineStats stats;
    std::string out = Curate(input, &stats);
    auto lines = test::Lines(out);

    std::set<std::string> locators;
    const auto prefixes = test::MakeTestConfig().prefixes;
    for (size_t i = 1; i < lines.size(); i += 2) {
        auto meta = domain::ExtInfLine::Parse(lines[i]);
        assert(meta);
        assert(meta->countAttribute("group-title") == 1);
        for (const auto& prefix : prefixes) {
            assert(meta->displayName().compare(0, prefix.token.size(), prefix.token) != 0);
        }
        assert(locators.insert(lines[i + 1]).second);
    }

    assert(locators.size() == 3);
    assert(lines[1] == "#EXTINF:-1 group-title=\"USA News\" tvg-id=\"x\",CNN");
    assert(lines[3] == "#EXTINF:-1 group-title=\"USA General\",Local 12");
    assert(lines[5] == "#EXTINF:-1 group-title=\"Mexico Movies\",Cine Latino, HD");
    assert(stats.orphanedMetadata == 2);
    assert(stats.orphanedLocators == 1);
    assert(stats.outOfScope == 1);
    assert(stats.duplicates == 2);
    assert(stats.byFallback == 1);
    std::cout << "[PASS] Unique locators, stripped prefixes and a single category attribute" << std::endl;
}

void TestExcludedAndGuideForwarding() {
    const std::string input =
        "#EXTM3U x-tvg-url=\"http://guide\"\n"
        "#EXTINF:-1,US|XXX After Dark\nhttp://a/1\n"
        "#EXTINF:-1,US|CNN\nhttp://a/2\n";

    auto config = test::MakeTestConfig();
    std::vector<domain::Category> categories = infrastructure::DefaultTaxonomy::Categories();
    for (auto& category : categories) {
        if (category.name == "Adult") category.excluded = true;
    }
    config.taxonomy = std::make_shared<const domain::Taxonomy>(categories, infrastructure::DefaultTaxonomy::Regions());

    domain::OutputSettings output;
    output.forwardGuideUrl = false;
    output.categoryAttribute = "group-title";
    application::PlaylistSession session(std::make_unique<test::StringByteStream>(input, 8), "test",
                                         MakeClassifier(config), config.parser, output);
    std::string out = RunSession(session);
    assert(out == "#EXTM3U\n#EXTINF:-1 group-title=\"USA News\",CNN\nhttp://a/2\n");
    assert(session.stats().excluded == 1);

    std::string forwarded = Curate(input);
    assert(test::Lines(forwarded)[0] == "#EXTM3U x-tvg-url=\"http://guide\"");
    std::cout << "[PASS] Excluded categories dropped; guide reference forwarded on request" << std::endl;
}

void TestStreamsIncrementally() {
    std::string input = "#EXTM3U\n";
    for (int i = 0; i < 2000; ++i) {
        input += "#EXTINF:-1 tvg-id=\"c" + std::to_string(i) + "\",US|Channel " + std::to_string(i) + "\n";
        input += "http://host/stream/" + std::to_string(i) + "\n";
    }
    auto config = test::MakeTestConfig();
    auto source = std::make_unique<test::StringByteStream>(input, 512);
    test::StringByteStream* raw = source.get();
    application::PlaylistSession session(std::move(source), "test", MakeClassifier(config),
                                         config.parser, config.output);

    std::string out;
    bool more = session.next(out);
    assert(more);
    assert(out == "#EXTM3U\n");
    out.clear();
    more = session.next(out);
    assert(more);
    size_t readsAfterFirstPiece = raw->reads();
    assert(out.size() >= application::PlaylistSession::kTargetChunkBytes);
    assert(readsAfterFirstPiece * 512 < input.size() / 2);

    session.cancel();
    assert(raw->closed());
    assert(session.done());
    std::string rest;
    more = session.next(rest);
    assert(!more);
    assert(rest.empty());
    std::cout << "[PASS] Output starts before input ends; cancel releases the source" << std::endl;
}

void TestExternalClassifierInPipeline() {
    auto config = test::MakeTestConfig();
    auto external = std::make_shared<test::FakeExternalClassifier>();
    external->answers["Local 12"] = "Golf";

    const std::string input =
        "#EXTM3U\n"
        "#EXTINF:-1,US|Local 12\nhttp://a/1\n"
        "#EXTINF:-1,US|Local 12\nhttp://a/1\n";
    application::PlaylistSession session(std::make_unique<test::StringByteStream>(input, 16), "test",
                                         MakeClassifier(config, external), config.parser, config.output);
    std::string out = RunSession(session);
    assert(out == "#EXTM3U\n#EXTINF:-1 group-title=\"Golf\",Local 12\nhttp://a/1\n");
    assert(external->calls == 1);
    assert(session.stats().byExternal == 1);
    std::cout << "[PASS] Duplicates never reach the external classifier" << std::endl;
}

void TestServiceUsesSnapshotOnOutage() {
    auto config = std::make_shared<const domain::CuratorConfig>(test::MakeTestConfig());
    auto connector = std::make_shared<test::FakeConnector>();
    auto cache = std::make_shared<infrastructure::SnapshotCache>(std::chrono::seconds(60), 1024 * 1024);
    int sleeps = 0;
    application::PlaylistCurationService service(config, connector, nullptr, cache,
                                                 [&](std::chrono::milliseconds) { ++sleeps; });

    const std::string body = "#EXTM3U\n#EXTINF:-1,US|CNN\nhttp://a/1\n";
    connector->push(200, body);
    {
        auto session = service.openSession();
        std::string out = RunSession(*session);
        assert(out == "#EXTM3U\n#EXTINF:-1 group-title=\"USA News\",CNN\nhttp://a/1\n");
    }
    assert(cache->getFresh() && cache->getFresh()->body == body);

    // Every origin down: the cached document is replayed.
    auto fromCache = service.openSession();
    assert(fromCache->originLabel() == "primary (cached)");
    assert(RunSession(*fromCache) == "#EXTM3U\n#EXTINF:-1 group-title=\"USA News\",CNN\nhttp://a/1\n");
    assert(sleeps == config->fetch.maxAttempts - 1);

    // Per-request credentials never see the shared snapshot.
    bool threw = false;
    try {
        service.openSession({"bob", "other"});
    } catch (const domain::AcquisitionError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Snapshot replayed when every origin fails" << std::endl;
}

void TestCancelledPassIsNotCached() {
    auto config = std::make_shared<const domain::CuratorConfig>(test::MakeTestConfig());
    auto connector = std::make_shared<test::FakeConnector>();
    auto cache = std::make_shared<infrastructure::SnapshotCache>(std::chrono::seconds(60), 1024 * 1024);
    application::PlaylistCurationService service(config, connector, nullptr, cache,
                                                 [](std::chrono::milliseconds) {});

    connector->push(200, "#EXTM3U\n#EXTINF:-1,US|CNN\nhttp://a/1\n#EXTINF:-1,US|NBC\nhttp://a/2\n");
    {
        auto session = service.openSession();
        std::string out;
        bool started = session->next(out);
        assert(started);
        session->cancel();
    }
    assert(!cache->getFresh());

    connector->push(200, "#EXTM3U\n#EXTINF:-1,US|CNN\nhttp://a/1\n", "Read");
    {
        auto session = service.openSession();
        RunSession(*session);
    }
    assert(!cache->getFresh());
    std::cout << "[PASS] Cancelled or truncated passes publish nothing" << std::endl;
}

int main() {
    std::cout << "[Test] Starting Playlist Session Test..." << std::endl;
    TestDuplicateScenario();
    TestRoundTrip();
    TestOutputInvariants();
    TestExcludedAndGuideForwarding();
    TestStreamsIncrementally();
    TestExternalClassifierInPipeline();
    TestServiceUsesSnapshotOnOutage();
    TestCancelledPassIsNotCached();
    std::cout << "[Test] All playlist session tests passed." << std::endl;
    return 0;
}
