/**
 * @file ExtInfLine.hpp
 * @brief Parsed form of an M3U metadata line: "#EXTINF:<duration> key="value" ...,<display name>".
 */

#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace channelcurator::domain {

/**
 * @struct M3uAttribute
 * @brief One key=value pair of a directive's attribute block, kept with its raw spelling.
 */
struct M3uAttribute {
    std::string separator; ///< Whitespace preceding the attribute, verbatim.
    std::string key;
    std::string rawValue;  ///< Value as written, including quotes and escapes.
    std::string value;     ///< Unquoted, unescaped value.

    std::string raw() const { return key + "=" + rawValue; }
};

/**
 * @class ExtInfLine
 * @brief Splits a metadata line into attributes and display name and rebuilds it.
 *
 * The split point is the ',' that follows the attribute block according to the
 * directive grammar, so commas inside quoted values or inside the display name
 * never move it. Untouched attributes are reproduced byte for byte.
 */
class ExtInfLine {
public:
    static constexpr std::string_view kDirective = "#EXTINF:";

    /** @brief True if the line carries the metadata directive. */
    static bool IsMetadata(std::string_view line);

    /**
     * @brief Parses a metadata line.
     *
     * A line whose quoted values contain bare '"' characters is recovered when a
     * closing quote directly followed by ',' marks the end of the attribute block.
     * @return std::nullopt if the line does not follow the grammar (malformed record).
     */
    static std::optional<ExtInfLine> Parse(std::string_view line);

    /**
     * @brief Scans whitespace-separated key=value pairs starting at pos.
     *
     * Stops (returning true) at end of input or at a ',' that is not part of a
     * value; pos is left on that ','. Trailing whitespace before the stop is
     * stored in trailing. With lenientQuotes an unescaped '"' closes a quoted
     * value only at the end of text or before whitespace and the next key=.
     * @return false on a grammar error (missing '=', unterminated quote, empty key).
     */
    static bool ScanAttributes(std::string_view text, size_t& pos,
                               std::vector<M3uAttribute>& out, std::string& trailing,
                               bool lenientQuotes = false);

    const std::string& duration() const { return m_duration; }
    const std::string& displayName() const { return m_displayName; }
    const std::vector<M3uAttribute>& attributes() const { return m_attributes; }

    /** @brief Value of the first attribute with the given key (case-insensitive). */
    std::optional<std::string> attribute(std::string_view key) const;

    /** @brief Number of attributes carrying the key (case-insensitive). */
    size_t countAttribute(std::string_view key) const;

    /**
     * @brief Sets an attribute to a quoted value.
     *
     * The first occurrence is replaced in place, further occurrences are removed,
     * and a missing attribute is appended at the end of the attribute block.
     */
    void setAttribute(const std::string& key, const std::string& value);

    void setDisplayName(std::string name) { m_displayName = std::move(name); }

    /** @brief Rebuilds the metadata line (no line terminator). */
    std::string str() const;

private:
    std::string m_directive;  ///< Directive as spelled in the source.
    std::string m_duration;
    std::vector<M3uAttribute> m_attributes;
    std::string m_trailing;   ///< Whitespace between the last attribute and ','.
    std::string m_displayName;
};

} // namespace channelcurator::domain
