/**
 * @file DefaultTaxonomy.hpp
 * @brief Built-in category table, prefixes and locator schemes used when settings.json omits them.
 */

#pragma once
#include "domain/CuratorConfig.hpp"
#include "domain/Taxonomy.hpp"
#include <string>
#include <vector>

namespace channelcurator::infrastructure {

class DefaultTaxonomy {
public:
    static constexpr const char* kUsa = "usa";
    static constexpr const char* kMexico = "mexico";

    static std::vector<domain::Category> Categories();
    static std::vector<domain::RegionProfile> Regions();
    static std::vector<domain::RoutingPrefix> Prefixes();
    static std::vector<std::string> LocatorSchemes();
    static std::vector<domain::Origin> Origins();
};

} // namespace channelcurator::infrastructure
