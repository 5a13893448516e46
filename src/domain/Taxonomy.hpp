/**
 * @file Taxonomy.hpp
 * @brief Region-partitioned category table used by the classifier.
 *
 * The table is pure data: an ordered list of categories, each owning an ordered
 * keyword list, plus one profile per routing region naming the categories that
 * region may use (in priority order) and its catch-all category.
 */

#pragma once
#include <map>
#include <string>
#include <vector>

namespace channelcurator::domain {

/**
 * @struct Category
 * @brief One entry of the taxonomy.
 */
struct Category {
    std::string name;                  ///< Unique across the whole taxonomy.
    std::string region;                ///< Owning region tag, or Taxonomy::kGlobalRegion.
    std::vector<std::string> keywords; ///< Case-insensitive substrings, in match order.
    bool excluded = false;             ///< Records landing here are dropped from the output.
};

/**
 * @struct RegionProfile
 * @brief Eligibility and fallback rules for one routing region.
 */
struct RegionProfile {
    std::string region;
    std::string generalCategory;         ///< Fallback when nothing else matched.
    std::vector<std::string> categories; ///< Eligible categories in priority order; empty = derive from table.
};

/**
 * @struct RoutingPrefix
 * @brief Display-name prefix that admits a record and selects its region.
 */
struct RoutingPrefix {
    std::string token;  ///< e.g. "US|"
    std::string region; ///< e.g. "usa"
};

/**
 * @class Taxonomy
 * @brief Immutable, validated category table.
 */
class Taxonomy {
public:
    static constexpr const char* kGlobalRegion = "global";

    /**
     * @brief Builds and validates the table.
     * @throws ConfigurationError on duplicate names, unknown categories in a region
     *         profile, or a general category that is not eligible for its region.
     */
    Taxonomy(std::vector<Category> categories, std::vector<RegionProfile> regions);

    // Region indexes point into m_categories.
    Taxonomy(const Taxonomy&) = delete;
    Taxonomy& operator=(const Taxonomy&) = delete;

    /** @brief Categories eligible for a region, in priority order. Empty for unknown regions. */
    const std::vector<const Category*>& eligible(const std::string& region) const;

    /** @brief Names of the eligible categories, the closed label set offered to external classifiers. */
    std::vector<std::string> labels(const std::string& region) const;

    /** @brief Fallback category of a region. @throws std::out_of_range for unknown regions. */
    const Category& generalCategory(const std::string& region) const;

    const Category* find(const std::string& name) const;
    bool hasRegion(const std::string& region) const;

    const std::vector<Category>& categories() const { return m_categories; }

private:
    struct RegionIndex {
        std::vector<const Category*> eligible;
        const Category* general = nullptr;
    };

    std::vector<Category> m_categories; ///< Keywords stored case-folded.
    std::map<std::string, RegionIndex> m_regions;
};

} // namespace channelcurator::domain
