#include <cassert>
#include <iostream>
#include "application/RecordParser.hpp"
#include "infrastructure/DefaultTaxonomy.hpp"
#include "TestSupport.hpp"

using namespace channelcurator;

namespace {

domain::ParserSettings Settings(size_t maxLineBytes = 64 * 1024) {
    domain::ParserSettings settings;
    settings.locatorSchemes = infrastructure::DefaultTaxonomy::LocatorSchemes();
    settings.maxLineBytes = maxLineBytes;
    return settings;
}

std::vector<domain::RawRecord> ParseAll(const std::string& body, size_t chunkSize,
                                        domain::PipelineStats& stats,
                                        std::optional<domain::PlaylistHeader>* header = nullptr,
                                        size_t maxLineBytes = 64 * 1024) {
    application::RecordStream stream(std::make_unique<test::StringByteStream>(body, chunkSize),
                                     Settings(maxLineBytes), stats);
    if (header) *header = stream.header();
    std::vector<domain::RawRecord> records;
    while (auto record = stream.next()) {
        records.push_back(std::move(*record));
    }
    return records;
}

} // namespace

void TestPairsAndHeader() {
    const std::string body =
        "\xEF\xBB\xBF#EXTM3U url-tvg=\"http://guide/epg.xml\" x-tvg-url=\"http://other\"\r\n"
        "#EXTINF:-1 tvg-id=\"a\",US|CNN\r\n"
        "http://a/1\r\n"
        "\r\n"
        "#EXTINF:-1,MX|Canal 5\n"
        "rtmp://b/2";

    domain::PipelineStats stats;
    std::optional<domain::PlaylistHeader> header;
    auto records = ParseAll(body, 3, stats, &header);

    assert(header);
    assert(header->guideRef == std::string("url-tvg=\"http://guide/epg.xml\""));
    assert(records.size() == 2);
    assert(records[0].metadata.displayName() == "US|CNN");
    assert(records[0].locator == "http://a/1");
    assert(records[1].metadata.displayName() == "MX|Canal 5");
    assert(records[1].locator == "rtmp://b/2");
    assert(stats.recordsParsed == 2);
    assert(stats.bytesRead == body.size());
    std::cout << "[PASS] Header captured and records paired across CRLF and chunk boundaries" << std::endl;
}

void TestChunkBoundaryIndependence() {
    std::string body = "#EXTM3U\n";
    for (int i = 0; i < 40; ++i) {
        body += "#EXTINF:-1 tvg-name=\"Ch, " + std::to_string(i) + "\",US|Channel " + std::to_string(i) + "\n";
        body += "http://host/" + std::to_string(i) + "\n";
    }

    std::vector<std::string> reference;
    for (size_t chunk : {1u, 2u, 13u, 64u, 100000u}) {
        domain::PipelineStats stats;
        auto records = ParseAll(body, chunk, stats);
        std::vector<std::string> got;
        for (const auto& r : records) got.push_back(r.metadata.str() + "|" + r.locator);
        if (reference.empty()) reference = got;
        assert(got == reference);
    }
    assert(reference.size() == 40);
    std::cout << "[PASS] Output does not depend on chunk size" << std::endl;
}

void TestOrphans() {
    const std::string body =
        "#EXTM3U\n"
        "http://orphan/locator\n"            // no metadata before it
        "#EXTINF:-1,US|Dropped\n"
        "#EXTGRP:News\n"                     // clears the pending metadata
        "http://a/1\n"
        "#EXTINF:-1,US|Replaced\n"
        "#EXTINF:-1,US|Kept\n"
        "http://a/2\n"
        "#EXTINF:-1,US|Trailing\n";

    domain::PipelineStats stats;
    auto records = ParseAll(body, 4, stats);
    assert(records.size() == 1);
    assert(records[0].metadata.displayName() == "US|Kept");
    assert(records[0].locator == "http://a/2");
    assert(stats.orphanedLocators == 2);
    assert(stats.orphanedMetadata == 3);

    // A line dropped as undecodable still separates the metadata from the locator.
    domain::PipelineStats undecodable;
    auto none = ParseAll("#EXTM3U\n#EXTINF:-1,US|CNN\n\xC3\x28 junk\nhttp://a/1\n", 5, undecodable, nullptr, 64);
    assert(none.empty());
    assert(undecodable.decodeSkips == 1);
    assert(undecodable.orphanedMetadata == 1);
    assert(undecodable.orphanedLocators == 1);

    // So does a line dropped for exceeding the length limit, whatever the chunking.
    const std::string oversized =
        "#EXTM3U\n#EXTINF:-1,US|CNN\n" + std::string(100, '#') + "\nhttp://a/1\n";
    for (size_t chunk : {1u, 7u, 64u, 4096u}) {
        domain::PipelineStats tooLong;
        auto dropped = ParseAll(oversized, chunk, tooLong, nullptr, 64);
        assert(dropped.empty());
        assert(tooLong.decodeSkips == 1);
        assert(tooLong.orphanedMetadata == 1);
        assert(tooLong.orphanedLocators == 1);
    }
    std::cout << "[PASS] Metadata is never paired with a non-adjacent locator" << std::endl;
}

void TestDecodeSkipsAndMalformed() {
    std::string longLine(200, 'x');
    const std::string body =
        "#EXTM3U\n"
        "#EXTINF:-1,US|Bad \xC3\x28 name\n"
        "http://a/1\n"
        "#EXTINF:-1 tvg-id=\"broken,US|Broken\n"
        "http://a/2\n"
        "#EXTINF:-1,US|" + longLine + "\n"
        "http://a/3\n"
        "#EXTINF:-1,US|Good\n"
        "http://a/4\n";

    domain::PipelineStats stats;
    application::RecordStream stream(std::make_unique<test::StringByteStream>(body, 9), Settings(64), stats);
    std::vector<domain::RawRecord> records;
    while (auto record = stream.next()) records.push_back(std::move(*record));

    assert(records.size() == 1);
    assert(records[0].locator == "http://a/4");
    assert(stats.decodeSkips == 2);
    assert(stats.malformedRecords == 1);
    assert(stream.transportError().empty());
    std::cout << "[PASS] Undecodable, over-long and malformed lines are absorbed" << std::endl;
}

void TestTransportError() {
    domain::PipelineStats stats;
    application::RecordStream stream(
        std::make_unique<test::StringByteStream>("#EXTM3U\n#EXTINF:-1,US|A\nhttp://a/1\n#EXTINF:-1,US|B\nhttp://a", 6, "Read"),
        Settings(), stats);
    int count = 0;
    while (stream.next()) ++count;
    // The unterminated last line still pairs; the error is reported, not thrown.
    assert(count == 2);
    assert(stream.transportError() == "Read");
    std::cout << "[PASS] Transport error ends the sequence without throwing" << std::endl;
}

void TestLineAssembler() {
    std::vector<std::string> lines;
    application::LineAssembler assembler(8, [&] { lines.emplace_back("<dropped>"); });
    auto sink = [&](std::string_view line) { lines.emplace_back(line); };
    assembler.append("ab", sink);
    assembler.append("c\r\n0123456789ABC", sink);
    assembler.append("DEF\nok\n", sink);
    assembler.append("tail", sink);
    assembler.flush(sink);
    assert((lines == std::vector<std::string>{"abc", "<dropped>", "ok", "tail"}));
    assert(assembler.oversizedLines() == 1);
    std::cout << "[PASS] Line assembler drops over-long lines up to their terminator" << std::endl;
}

int main() {
    std::cout << "[Test] Starting Record Parser Test..." << std::endl;
    TestPairsAndHeader();
    TestChunkBoundaryIndependence();
    TestOrphans();
    TestDecodeSkipsAndMalformed();
    TestTransportError();
    TestLineAssembler();
    std::cout << "[Test] All record parser tests passed." << std::endl;
    return 0;
}
