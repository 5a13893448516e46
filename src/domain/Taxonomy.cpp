/**
 * @file Taxonomy.cpp
 * @brief Implementation of Taxonomy.
 */

#include "domain/Taxonomy.hpp"
#include "domain/CuratorErrors.hpp"
#include "domain/TextUtils.hpp"
#include <algorithm>
#include <set>

namespace channelcurator::domain {

Taxonomy::Taxonomy(std::vector<Category> categories, std::vector<RegionProfile> regions)
    : m_categories(std::move(categories)) {
    std::set<std::string> names;
    for (auto& category : m_categories) {
        if (category.name.empty()) {
            throw ConfigurationError("category with empty name");
        }
        if (!names.insert(category.name).second) {
            throw ConfigurationError("duplicate category name: " + category.name);
        }
        for (auto& keyword : category.keywords) {
            keyword = TextUtils::FoldCase(keyword);
        }
        category.keywords.erase(
            std::remove_if(category.keywords.begin(), category.keywords.end(),
                [](const std::string& k) { return k.empty(); }),
            category.keywords.end());
    }

    for (const auto& profile : regions) {
        if (profile.region.empty() || profile.region == kGlobalRegion) {
            throw ConfigurationError("invalid routing region name: '" + profile.region + "'");
        }
        if (m_regions.count(profile.region)) {
            throw ConfigurationError("region configured twice: " + profile.region);
        }

        RegionIndex index;
        if (profile.categories.empty()) {
            // Own categories plus global ones, in table order.
            for (const auto& category : m_categories) {
                if (category.region == profile.region || category.region == kGlobalRegion) {
                    index.eligible.push_back(&category);
                }
            }
        } else {
            for (const auto& name : profile.categories) {
                const Category* category = find(name);
                if (!category) {
                    throw ConfigurationError("region " + profile.region + " lists unknown category: " + name);
                }
                if (std::find(index.eligible.begin(), index.eligible.end(), category) == index.eligible.end()) {
                    index.eligible.push_back(category);
                }
            }
        }

        index.general = find(profile.generalCategory);
        if (!index.general) {
            throw ConfigurationError("region " + profile.region + " has unknown general category: " + profile.generalCategory);
        }
        if (std::find(index.eligible.begin(), index.eligible.end(), index.general) == index.eligible.end()) {
            throw ConfigurationError("general category " + profile.generalCategory + " is not eligible for region " + profile.region);
        }
        m_regions.emplace(profile.region, std::move(index));
    }

    if (m_regions.empty()) {
        throw ConfigurationError("taxonomy defines no routing regions");
    }
}

const std::vector<const Category*>& Taxonomy::eligible(const std::string& region) const {
    static const std::vector<const Category*> kNone;
    auto it = m_regions.find(region);
    return it == m_regions.end() ? kNone : it->second.eligible;
}

std::vector<std::string> Taxonomy::labels(const std::string& region) const {
    std::vector<std::string> out;
    for (const Category* category : eligible(region)) {
        out.push_back(category->name);
    }
    return out;
}

const Category& Taxonomy::generalCategory(const std::string& region) const {
    return *m_regions.at(region).general;
}

const Category* Taxonomy::find(const std::string& name) const {
    for (const auto& category : m_categories) {
        if (category.name == name) return &category;
    }
    return nullptr;
}

bool Taxonomy::hasRegion(const std::string& region) const {
    return m_regions.count(region) > 0;
}

} // namespace channelcurator::domain
