/**
 * @file UrlUtils.hpp
 * @brief Origin URL templating, splitting and credential masking.
 */

#pragma once
#include "domain/CuratorConfig.hpp"
#include <optional>
#include <string>

namespace channelcurator::infrastructure {

class UrlUtils {
public:
    struct Parts {
        std::string schemeHostPort; ///< "http://host:port", as httplib::Client expects.
        std::string pathAndQuery;   ///< "/get.php?..." ("/" when empty).
    };

    /** @brief Splits an absolute http(s) URL. std::nullopt for anything else. */
    static std::optional<Parts> Split(const std::string& url);

    /** @brief Percent-encodes everything outside the RFC 3986 unreserved set. */
    static std::string Encode(const std::string& value);

    /** @brief Substitutes {username} {password} {type} {output} (credentials percent-encoded). */
    static std::string Expand(const std::string& urlTemplate,
                              const domain::Credentials& credentials,
                              const std::string& playlistType,
                              const std::string& outputFormat);

    /** @brief Replaces the secret (raw and percent-encoded) with "***". */
    static std::string Mask(std::string text, const std::string& secret);
};

} // namespace channelcurator::infrastructure
