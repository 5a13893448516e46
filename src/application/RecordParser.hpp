/**
 * @file RecordParser.hpp
 * @brief Incremental M3U parsing: chunks to lines, lines to record pairs.
 */

#pragma once
#include "domain/ByteStream.hpp"
#include "domain/CuratorConfig.hpp"
#include "domain/PipelineStats.hpp"
#include "domain/PlaylistRecord.hpp"
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace channelcurator::application {

/**
 * @class LineAssembler
 * @brief Reassembles logical lines across arbitrary chunk boundaries.
 *
 * Lines end at '\n'; a trailing '\r' is removed. A line longer than the limit
 * is discarded up to its terminator; the oversize handler fires once for it, at
 * its position in the line sequence.
 */
class LineAssembler {
public:
    using LineHandler = std::function<void(std::string_view)>;
    using OversizeHandler = std::function<void()>;

    explicit LineAssembler(size_t maxLineBytes, OversizeHandler onOversized = nullptr);

    void append(std::string_view chunk, const LineHandler& onLine);

    /** @brief Emits a final unterminated line, if any. */
    void flush(const LineHandler& onLine);

    size_t oversizedLines() const { return m_oversized; }

private:
    void emit(std::string_view line, const LineHandler& onLine);

    void dropOversized();

    size_t m_maxLineBytes;
    OversizeHandler m_onOversized;
    std::string m_partial;
    bool m_discarding = false;
    size_t m_oversized = 0;
};

/**
 * @class RecordParser
 * @brief Pairs each metadata line with the locator line that directly follows it.
 *
 * Keeps a single pending-metadata slot. Any line other than a locator clears
 * it, so a metadata line is never paired with a non-adjacent locator.
 */
class RecordParser {
public:
    static constexpr std::string_view kHeaderToken = "#EXTM3U";

    RecordParser(std::vector<std::string> locatorSchemes, domain::PipelineStats& stats);

    /**
     * @brief Consumes one line (without terminator).
     * @return A record when the line completes a pair.
     */
    std::optional<domain::RawRecord> feed(std::string_view line);

    /**
     * @brief Accounts for a line that was dropped before it could be decoded.
     *
     * The line still sits between a pending metadata line and whatever follows,
     * so the pending metadata is orphaned.
     */
    void skipLine();

    /** @brief End of input: a still-pending metadata line is dropped. */
    void finish();

    bool sawFirstLine() const { return m_sawFirstLine; }
    const std::optional<domain::PlaylistHeader>& header() const { return m_header; }

    bool isLocator(std::string_view line) const;

    /** @brief Parses "#EXTM3U ..." and picks out the guide reference attribute. */
    static std::optional<domain::PlaylistHeader> ParseHeader(std::string_view line);

private:
    void orphanPending();

    std::vector<std::string> m_locatorSchemes;
    domain::PipelineStats& m_stats;
    std::optional<std::string> m_pending;
    std::optional<domain::PlaylistHeader> m_header;
    bool m_sawFirstLine = false;
};

/**
 * @class RecordStream
 * @brief Lazy, finite, non-restartable sequence of RawRecord over a ByteStream.
 *
 * Pulls one chunk at a time from the source; records completed by that chunk
 * are handed out before the next chunk is read.
 */
class RecordStream {
public:
    RecordStream(std::unique_ptr<domain::ByteStream> source,
                 const domain::ParserSettings& settings,
                 domain::PipelineStats& stats);

    /** @brief Next record, or std::nullopt once the source is exhausted. */
    std::optional<domain::RawRecord> next();

    /** @brief Source header; reads ahead until the first line has been seen. */
    const std::optional<domain::PlaylistHeader>& header();

    /** @brief Transport error that ended the source early (empty after a clean end). */
    std::string transportError() const;

    /** @brief Stops reading and releases the source. */
    void close();

private:
    bool pump();

    std::unique_ptr<domain::ByteStream> m_source;
    domain::PipelineStats& m_stats;
    LineAssembler m_assembler;
    RecordParser m_parser;
    std::deque<domain::RawRecord> m_ready;
    bool m_exhausted = false;
    std::string m_transportError;
};

} // namespace channelcurator::application
