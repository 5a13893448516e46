/**
 * @file RecordParser.cpp
 * @brief Implementation of LineAssembler, RecordParser and RecordStream.
 */

#include "application/RecordParser.hpp"
#include "domain/ExtInfLine.hpp"
#include "domain/TextUtils.hpp"

namespace channelcurator::application {

using domain::TextUtils;

namespace {
constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";
}

// ---- LineAssembler ----

LineAssembler::LineAssembler(size_t maxLineBytes, OversizeHandler onOversized)
    : m_maxLineBytes(maxLineBytes), m_onOversized(std::move(onOversized)) {}

void LineAssembler::dropOversized() {
    ++m_oversized;
    m_partial.clear();
    if (m_onOversized) m_onOversized();
}

void LineAssembler::emit(std::string_view line, const LineHandler& onLine) {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    onLine(line);
}

void LineAssembler::append(std::string_view chunk, const LineHandler& onLine) {
    while (!chunk.empty()) {
        size_t nl = chunk.find('\n');
        std::string_view piece = chunk.substr(0, nl);

        if (m_discarding) {
            if (nl == std::string_view::npos) return;
            m_discarding = false;
            chunk.remove_prefix(nl + 1);
            continue;
        }

        if (m_partial.size() + piece.size() > m_maxLineBytes) {
            dropOversized();
            if (nl == std::string_view::npos) {
                m_discarding = true;
                return;
            }
            chunk.remove_prefix(nl + 1);
            continue;
        }

        if (nl == std::string_view::npos) {
            m_partial.append(piece);
            return;
        }

        if (m_partial.empty()) {
            emit(piece, onLine);
        } else {
            m_partial.append(piece);
            emit(m_partial, onLine);
            m_partial.clear();
        }
        chunk.remove_prefix(nl + 1);
    }
}

void LineAssembler::flush(const LineHandler& onLine) {
    if (!m_discarding && !m_partial.empty()) {
        emit(m_partial, onLine);
    }
    m_partial.clear();
    m_discarding = false;
}

// ---- RecordParser ----

RecordParser::RecordParser(std::vector<std::string> locatorSchemes, domain::PipelineStats& stats)
    : m_locatorSchemes(std::move(locatorSchemes)), m_stats(stats) {}

bool RecordParser::isLocator(std::string_view line) const {
    for (const auto& scheme : m_locatorSchemes) {
        if (TextUtils::StartsWithIgnoreCase(line, scheme) && line.size() > scheme.size()) {
            return true;
        }
    }
    return false;
}

std::optional<domain::PlaylistHeader> RecordParser::ParseHeader(std::string_view line) {
    if (TextUtils::StartsWith(line, kUtf8Bom)) {
        line.remove_prefix(kUtf8Bom.size());
    }
    line = TextUtils::Trim(line);
    if (!TextUtils::StartsWithIgnoreCase(line, kHeaderToken)) {
        return std::nullopt;
    }

    domain::PlaylistHeader header;
    header.line = std::string(line);

    std::vector<domain::M3uAttribute> attributes;
    std::string trailing;
    size_t pos = kHeaderToken.size();
    // A header with unparsable attributes is still a header; it just forwards nothing.
    if (domain::ExtInfLine::ScanAttributes(line, pos, attributes, trailing)) {
        for (const char* key : {"url-tvg", "x-tvg-url"}) {
            for (const auto& attr : attributes) {
                if (attr.key == key && !attr.value.empty()) {
                    header.guideRef = attr.raw();
                    return header;
                }
            }
        }
    }
    return header;
}

std::optional<domain::RawRecord> RecordParser::feed(std::string_view line) {
    ++m_stats.linesRead;

    if (!TextUtils::IsValidUtf8(line)) {
        ++m_stats.decodeSkips;
        orphanPending();
        return std::nullopt;
    }

    if (!m_sawFirstLine && TextUtils::StartsWith(line, kUtf8Bom)) {
        line.remove_prefix(kUtf8Bom.size());
    }
    std::string_view text = TextUtils::Trim(line);
    if (text.empty()) {
        return std::nullopt;
    }

    if (!m_sawFirstLine) {
        m_sawFirstLine = true;
        m_header = ParseHeader(text);
        if (m_header) return std::nullopt;
    }

    if (domain::ExtInfLine::IsMetadata(text)) {
        if (m_pending) ++m_stats.orphanedMetadata;
        m_pending = std::string(text);
        return std::nullopt;
    }

    if (isLocator(text)) {
        if (!m_pending) {
            ++m_stats.orphanedLocators;
            return std::nullopt;
        }
        auto metadata = domain::ExtInfLine::Parse(*m_pending);
        m_pending.reset();
        if (!metadata) {
            ++m_stats.malformedRecords;
            return std::nullopt;
        }
        ++m_stats.recordsParsed;
        return domain::RawRecord{std::move(*metadata), std::string(text)};
    }

    // Anything else between a metadata line and its locator orphans the metadata.
    orphanPending();
    return std::nullopt;
}

void RecordParser::skipLine() {
    ++m_stats.linesRead;
    ++m_stats.decodeSkips;
    orphanPending();
}

void RecordParser::orphanPending() {
    if (m_pending) {
        ++m_stats.orphanedMetadata;
        m_pending.reset();
    }
}

void RecordParser::finish() {
    orphanPending();
}

// ---- RecordStream ----

RecordStream::RecordStream(std::unique_ptr<domain::ByteStream> source,
                           const domain::ParserSettings& settings,
                           domain::PipelineStats& stats)
    : m_source(std::move(source)),
      m_stats(stats),
      m_assembler(settings.maxLineBytes, [this] { m_parser.skipLine(); }),
      m_parser(settings.locatorSchemes, stats) {}

bool RecordStream::pump() {
    if (m_exhausted) return false;

    auto onLine = [this](std::string_view line) {
        if (auto record = m_parser.feed(line)) {
            m_ready.push_back(std::move(*record));
        }
    };

    auto chunk = m_source->read();
    if (!chunk) {
        m_assembler.flush(onLine);
        m_parser.finish();
        m_transportError = m_source->error();
        m_exhausted = true;
        m_source->close();
        return false;
    }

    m_stats.bytesRead += chunk->size();
    m_assembler.append(*chunk, onLine);
    return true;
}

std::optional<domain::RawRecord> RecordStream::next() {
    while (m_ready.empty()) {
        if (!pump()) break;
    }
    if (m_ready.empty()) return std::nullopt;
    domain::RawRecord record = std::move(m_ready.front());
    m_ready.pop_front();
    return record;
}

const std::optional<domain::PlaylistHeader>& RecordStream::header() {
    while (!m_parser.sawFirstLine()) {
        if (!pump()) break;
    }
    return m_parser.header();
}

std::string RecordStream::transportError() const {
    return m_transportError;
}

void RecordStream::close() {
    if (m_exhausted) return;
    m_exhausted = true;
    m_ready.clear();
    m_source->close();
}

} // namespace channelcurator::application
