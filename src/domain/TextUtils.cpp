#include "domain/TextUtils.hpp"
#include <cctype>

namespace channelcurator::domain {

namespace {
constexpr std::string_view kWhitespace = " \t\r\n\f\v";

bool IsContinuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}
}

bool TextUtils::IsValidUtf8(std::string_view text) {
    size_t i = 0;
    const size_t n = text.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t len = 0;
        unsigned int cp = 0;
        if (c >= 0xC2 && c <= 0xDF) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if (c >= 0xF0 && c <= 0xF4) { len = 4; cp = c & 0x07; }
        else return false;

        if (i + len > n) return false;
        for (size_t k = 1; k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(text[i + k]);
            if (!IsContinuation(cc)) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        if (len == 3 && (cp < 0x800 || (cp >= 0xD800 && cp <= 0xDFFF))) return false;
        if (len == 4 && (cp < 0x10000 || cp > 0x10FFFF)) return false;
        i += len;
    }
    return true;
}

std::string TextUtils::FoldCase(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (c < 0x80) {
            out.push_back(static_cast<char>(std::tolower(c)));
            continue;
        }
        // U+00C0..U+00DE (except U+00D7) encode as C3 80..C3 9E; lower case is +0x20.
        if (c == 0xC3 && i + 1 < text.size()) {
            unsigned char next = static_cast<unsigned char>(text[i + 1]);
            if (next >= 0x80 && next <= 0x9E && next != 0x97) {
                out.push_back(static_cast<char>(c));
                out.push_back(static_cast<char>(next + 0x20));
                ++i;
                continue;
            }
        }
        out.push_back(static_cast<char>(c));
    }
    return out;
}

bool TextUtils::StartsWithIgnoreCase(std::string_view text, std::string_view prefix) {
    if (text.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        unsigned char a = static_cast<unsigned char>(text[i]);
        unsigned char b = static_cast<unsigned char>(prefix[i]);
        if (std::tolower(a) != std::tolower(b)) return false;
    }
    return true;
}

std::string_view TextUtils::Trim(std::string_view text) {
    size_t start = text.find_first_not_of(kWhitespace);
    if (start == std::string_view::npos) return {};
    size_t end = text.find_last_not_of(kWhitespace);
    return text.substr(start, end - start + 1);
}

std::string_view TextUtils::TrimLeft(std::string_view text) {
    size_t start = text.find_first_not_of(kWhitespace);
    if (start == std::string_view::npos) return {};
    return text.substr(start);
}

} // namespace channelcurator::domain
