/**
 * @file CategoryClassifier.hpp
 * @brief Region admission and category resolution for display names.
 */

#pragma once
#include "domain/Classification.hpp"
#include "domain/ExternalClassifier.hpp"
#include "domain/Taxonomy.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace channelcurator::application {

/**
 * @struct Admission
 * @brief A display name that carried a routing prefix.
 */
struct Admission {
    std::string region;
    std::string displayName; ///< Name with every leading routing prefix removed.
};

/**
 * @class CategoryClassifier
 * @brief Maps a display name to exactly one category of its region.
 *
 * Resolution order is keyword table, then the optional external classifier,
 * then the region's general category. The keyword stage is deterministic;
 * only the external stage may vary between calls.
 */
class CategoryClassifier {
public:
    CategoryClassifier(std::shared_ptr<const domain::Taxonomy> taxonomy,
                       std::vector<domain::RoutingPrefix> prefixes,
                       std::shared_ptr<domain::ExternalClassifier> external = nullptr);

    /**
     * @brief Admission filter.
     * @return std::nullopt when the name starts with no routing prefix (out of region scope).
     */
    std::optional<Admission> admit(const std::string& displayName) const;

    /** @brief Always returns a category eligible for the region. */
    domain::ClassificationResult classify(const std::string& displayName, const std::string& region) const;

    /** @brief Keyword stage only. */
    const domain::Category* matchKeyword(const std::string& displayName, const std::string& region,
                                         std::string* matchedKeyword = nullptr) const;

    const domain::Taxonomy& taxonomy() const { return *m_taxonomy; }

private:
    const domain::RoutingPrefix* matchPrefix(const std::string& name) const;

    std::shared_ptr<const domain::Taxonomy> m_taxonomy;
    std::vector<domain::RoutingPrefix> m_prefixes; ///< Longest token first.
    std::shared_ptr<domain::ExternalClassifier> m_external;
};

} // namespace channelcurator::application
