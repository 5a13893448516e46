#include "infrastructure/DefaultTaxonomy.hpp"

namespace channelcurator::infrastructure {

std::vector<domain::Category> DefaultTaxonomy::Categories() {
    const std::string global = domain::Taxonomy::kGlobalRegion;
    return {
        // USA
        {"USA News", kUsa, {"cnn", "fox news", "msnbc", "nbc news", "abc news", "cbs news"}},
        {"USA Movies", kUsa, {"hbo", "cinemax", "starz", "amc", "showtime", "tcm", "movie"}},
        {"USA Kids", kUsa, {"cartoon", "nick", "disney", "boomerang", "pbskids"}},
        {"USA General", kUsa, {"abc", "nbc", "cbs", "fox", "pbs"}},

        // Mexico
        {"Mexico News", kMexico, {"televisa", "tv azteca", "milenio", "imagen", "foro tv", "forotv"}},
        {"Mexico Movies", kMexico, {"cine", "canal 5", "canal once", "cinema"}},
        {"Mexico Kids", kMexico, {"canal once niños", "bitme", "kids mexico"}},
        {"Mexico General", kMexico, {"las estrellas", "azteca uno", "canal 2", "televisa"}},

        // Sports by type
        {"Basketball", global, {"nba", "basketball"}},
        {"Football", global, {"nfl", "football", "college football", "espn college"}},
        {"Baseball", global, {"mlb", "baseball"}},
        {"Soccer", global, {"soccer", "futbol", "fútbol", "liga mx", "champions", "premier league", "laliga"}},
        {"Tennis", global, {"tennis", "atp", "wta"}},
        {"Golf", global, {"golf", "pga"}},
        {"Fighting", global, {"ufc", "boxing", "mma", "wwe", "fight"}},
        {"eSports", global, {"esports", "gaming", "twitch"}},

        // Other
        {"Music", global, {"mtv", "vh1", "music", "radio"}},
        {"Documentary", global, {"nat geo", "discovery", "history", "documentary"}},
        {"Adult", global, {"xxx", "porn", "adult", "eros"}},
    };
}

std::vector<domain::RegionProfile> DefaultTaxonomy::Regions() {
    return {
        {kUsa, "USA General", {}},
        {kMexico, "Mexico General", {}},
    };
}

std::vector<domain::RoutingPrefix> DefaultTaxonomy::Prefixes() {
    return {
        {"USA|", kUsa},
        {"USA:", kUsa},
        {"US|", kUsa},
        {"US:", kUsa},
        {"MX|", kMexico},
        {"MX:", kMexico},
    };
}

std::vector<std::string> DefaultTaxonomy::LocatorSchemes() {
    return {"http://", "https://", "rtmp://", "rtmps://", "rtsp://", "rtp://", "udp://", "mms://"};
}

std::vector<domain::Origin> DefaultTaxonomy::Origins() {
    return {
        {"premiumpowers",
         "http://line.premiumpowers.net/get.php?username={username}&password={password}&type={type}&output={output}"},
    };
}

} // namespace channelcurator::infrastructure
