#include "infrastructure/UrlUtils.hpp"
#include "domain/TextUtils.hpp"
#include <cctype>

namespace channelcurator::infrastructure {

namespace {

void ReplaceAll(std::string& text, const std::string& from, const std::string& to) {
    if (from.empty()) return;
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace

std::optional<UrlUtils::Parts> UrlUtils::Split(const std::string& url) {
    size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) return std::nullopt;

    std::string scheme = url.substr(0, schemeEnd);
    if (!domain::TextUtils::StartsWithIgnoreCase(scheme, "http")) return std::nullopt;
    if (scheme.size() != 4 && !(scheme.size() == 5 && std::tolower(static_cast<unsigned char>(scheme[4])) == 's')) {
        return std::nullopt;
    }

    size_t hostStart = schemeEnd + 3;
    size_t pathStart = url.find_first_of("/?", hostStart);
    if (pathStart == hostStart) return std::nullopt;

    Parts parts;
    parts.schemeHostPort = url.substr(0, pathStart);
    if (pathStart == std::string::npos) {
        parts.pathAndQuery = "/";
    } else if (url[pathStart] == '?') {
        parts.pathAndQuery = "/" + url.substr(pathStart);
    } else {
        parts.pathAndQuery = url.substr(pathStart);
    }
    return parts;
}

std::string UrlUtils::Encode(const std::string& value) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::string UrlUtils::Expand(const std::string& urlTemplate,
                             const domain::Credentials& credentials,
                             const std::string& playlistType,
                             const std::string& outputFormat) {
    std::string url = urlTemplate;
    ReplaceAll(url, "{username}", Encode(credentials.username));
    ReplaceAll(url, "{password}", Encode(credentials.password));
    ReplaceAll(url, "{type}", Encode(playlistType));
    ReplaceAll(url, "{output}", Encode(outputFormat));
    return url;
}

std::string UrlUtils::Mask(std::string text, const std::string& secret) {
    if (secret.empty()) return text;
    ReplaceAll(text, Encode(secret), "***");
    ReplaceAll(text, secret, "***");
    return text;
}

} // namespace channelcurator::infrastructure
