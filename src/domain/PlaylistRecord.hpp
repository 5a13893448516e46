/**
 * @file PlaylistRecord.hpp
 * @brief Transient record types flowing through one curation pass.
 */

#pragma once
#include "domain/ExtInfLine.hpp"
#include <optional>
#include <string>

namespace channelcurator::domain {

/**
 * @struct PlaylistHeader
 * @brief First line of the source document.
 */
struct PlaylistHeader {
    std::string line;                    ///< Header as received (BOM removed).
    std::optional<std::string> guideRef; ///< Raw "url-tvg=..." / "x-tvg-url=..." attribute, if any.
};

/**
 * @struct RawRecord
 * @brief A metadata line and the resource locator that directly followed it.
 */
struct RawRecord {
    ExtInfLine metadata;
    std::string locator;
};

/**
 * @struct OutputRecord
 * @brief Rewritten metadata line plus the untouched locator, ready for emission.
 */
struct OutputRecord {
    std::string metadata;
    std::string locator;
};

} // namespace channelcurator::domain
