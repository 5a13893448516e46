/**
 * @file PipelineStats.hpp
 * @brief Counters collected during one curation pass.
 */

#pragma once
#include <cstddef>
#include <sstream>
#include <string>

namespace channelcurator::domain {

struct PipelineStats {
    size_t bytesRead = 0;
    size_t linesRead = 0;
    size_t decodeSkips = 0;       ///< Invalid UTF-8 or over-long lines.
    size_t malformedRecords = 0;  ///< Metadata lines that failed the grammar.
    size_t orphanedMetadata = 0;  ///< Metadata lines never followed by a locator.
    size_t orphanedLocators = 0;  ///< Locators with no metadata right before them.
    size_t recordsParsed = 0;
    size_t outOfScope = 0;        ///< No routing prefix.
    size_t duplicates = 0;
    size_t excluded = 0;
    size_t emitted = 0;
    size_t byKeyword = 0;
    size_t byExternal = 0;
    size_t byFallback = 0;

    std::string summary() const {
        std::ostringstream ss;
        ss << "lines=" << linesRead
           << " records=" << recordsParsed
           << " emitted=" << emitted
           << " duplicates=" << duplicates
           << " out_of_scope=" << outOfScope
           << " excluded=" << excluded
           << " malformed=" << malformedRecords
           << " decode_skips=" << decodeSkips
           << " orphans=" << orphanedMetadata << "/" << orphanedLocators
           << " keyword/external/fallback=" << byKeyword << "/" << byExternal << "/" << byFallback;
        return ss.str();
    }
};

} // namespace channelcurator::domain
