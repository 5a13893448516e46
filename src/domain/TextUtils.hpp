/**
 * @file TextUtils.hpp
 * @brief Small string helpers shared by the parser and the classifier.
 */

#pragma once
#include <string>
#include <string_view>

namespace channelcurator::domain {

class TextUtils {
public:
    /** @brief Returns true if the bytes form well-formed UTF-8 (no overlongs, no surrogates). */
    static bool IsValidUtf8(std::string_view text);

    /**
     * @brief Lower-cases ASCII and the Latin-1 supplement (U+00C0..U+00DE) of a UTF-8 string.
     * Other code points are copied unchanged.
     */
    static std::string FoldCase(std::string_view text);

    /** @brief ASCII case-insensitive prefix test. */
    static bool StartsWithIgnoreCase(std::string_view text, std::string_view prefix);

    static std::string_view Trim(std::string_view text);
    static std::string_view TrimLeft(std::string_view text);

    static bool StartsWith(std::string_view text, std::string_view prefix) {
        return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
    }
};

} // namespace channelcurator::domain
