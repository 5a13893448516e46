/**
 * @file Classification.hpp
 * @brief Outcome of classifying one display name.
 */

#pragma once
#include <string>

namespace channelcurator::domain {

/**
 * @enum Provenance
 * @brief Mechanism that produced a category.
 */
enum class Provenance {
    Keyword,  ///< Matched the keyword table.
    External, ///< Answered by the external classifier.
    Fallback  ///< Region-general category.
};

inline const char* ProvenanceToString(Provenance p) {
    switch (p) {
        case Provenance::Keyword: return "keyword";
        case Provenance::External: return "external";
        case Provenance::Fallback: return "fallback";
    }
    return "fallback";
}

struct Category;

/**
 * @struct ClassificationResult
 * @brief Exactly one category plus how it was found.
 */
struct ClassificationResult {
    const Category* category = nullptr; ///< Never null for a result returned by the classifier.
    Provenance provenance = Provenance::Fallback;
    std::string matchedKeyword;         ///< Set for Provenance::Keyword.
};

} // namespace channelcurator::domain
