/**
 * @file ExtInfLine.cpp
 * @brief Implementation of the EXTINF directive grammar.
 */

#include "domain/ExtInfLine.hpp"
#include "domain/TextUtils.hpp"
#include <algorithm>

namespace channelcurator::domain {

namespace {

bool IsSpace(char c) {
    return c == ' ' || c == '\t';
}

bool IsKeyChar(char c) {
    return c != '=' && c != ',' && c != '"' && !IsSpace(c);
}

// In lenient mode a bare quote ends a value only before the end of the block
// or before whitespace and the next key=.
bool ClosesValue(std::string_view text, size_t after) {
    const size_t n = text.size();
    if (after >= n) return true;
    if (!IsSpace(text[after])) return false;
    while (after < n && IsSpace(text[after])) ++after;
    if (after >= n) return true;
    size_t keyStart = after;
    while (after < n && IsKeyChar(text[after])) ++after;
    return after > keyStart && after < n && text[after] == '=';
}

bool KeyEquals(std::string_view a, std::string_view b) {
    return a.size() == b.size() && TextUtils::StartsWithIgnoreCase(a, b);
}

std::string Quote(const std::string& value) {
    std::string out = "\"";
    for (char c : value) {
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

} // namespace

bool ExtInfLine::IsMetadata(std::string_view line) {
    return TextUtils::StartsWithIgnoreCase(line, kDirective);
}

bool ExtInfLine::ScanAttributes(std::string_view text, size_t& pos,
                                std::vector<M3uAttribute>& out, std::string& trailing,
                                bool lenientQuotes) {
    const size_t n = text.size();
    while (true) {
        size_t wsStart = pos;
        while (pos < n && IsSpace(text[pos])) ++pos;
        std::string separator(text.substr(wsStart, pos - wsStart));

        if (pos >= n || text[pos] == ',') {
            trailing = std::move(separator);
            return true;
        }

        size_t keyStart = pos;
        while (pos < n && IsKeyChar(text[pos])) ++pos;
        if (pos == keyStart || pos >= n || text[pos] != '=') {
            return false;
        }

        M3uAttribute attr;
        attr.separator = std::move(separator);
        attr.key = std::string(text.substr(keyStart, pos - keyStart));
        ++pos; // '='

        size_t valueStart = pos;
        if (pos < n && text[pos] == '"') {
            ++pos;
            bool closed = false;
            while (pos < n) {
                char c = text[pos];
                if (c == '\\' && pos + 1 < n) {
                    attr.value.push_back(text[pos + 1]);
                    pos += 2;
                    continue;
                }
                ++pos;
                if (c == '"' && (!lenientQuotes || ClosesValue(text, pos))) {
                    closed = true;
                    break;
                }
                attr.value.push_back(c);
            }
            if (!closed) return false;
        } else {
            while (pos < n && text[pos] != ',' && !IsSpace(text[pos])) ++pos;
            attr.value = std::string(text.substr(valueStart, pos - valueStart));
        }
        attr.rawValue = std::string(text.substr(valueStart, pos - valueStart));
        out.push_back(std::move(attr));
    }
}

std::optional<ExtInfLine> ExtInfLine::Parse(std::string_view line) {
    if (!IsMetadata(line)) return std::nullopt;

    ExtInfLine result;
    result.m_directive = std::string(line.substr(0, kDirective.size()));

    size_t pos = kDirective.size();
    const size_t n = line.size();
    while (pos < n && IsSpace(line[pos])) ++pos;
    size_t durationStart = pos;
    while (pos < n && line[pos] != ',' && !IsSpace(line[pos])) ++pos;
    result.m_duration = std::string(line.substr(durationStart, pos - durationStart));
    if (result.m_duration.find('=') != std::string::npos) {
        // An attribute where the duration belongs.
        return std::nullopt;
    }

    const size_t attributesStart = pos;
    if (ScanAttributes(line, pos, result.m_attributes, result.m_trailing) && pos < n && line[pos] == ',') {
        result.m_displayName = std::string(line.substr(pos + 1));
        return result;
    }

    // Unescaped quotes inside a value: the block ends at the first closing quote
    // that is followed by the separating ','.
    for (size_t q = line.find('"', attributesStart); q != std::string_view::npos; q = line.find('"', q + 1)) {
        size_t comma = q + 1;
        while (comma < n && IsSpace(line[comma])) ++comma;
        if (comma >= n || line[comma] != ',') continue;

        std::string_view block = line.substr(0, comma);
        pos = attributesStart;
        result.m_attributes.clear();
        result.m_trailing.clear();
        if (!ScanAttributes(block, pos, result.m_attributes, result.m_trailing, true) || pos != block.size()) {
            return std::nullopt;
        }
        result.m_displayName = std::string(line.substr(comma + 1));
        return result;
    }
    return std::nullopt;
}

std::optional<std::string> ExtInfLine::attribute(std::string_view key) const {
    for (const auto& attr : m_attributes) {
        if (KeyEquals(attr.key, key)) return attr.value;
    }
    return std::nullopt;
}

size_t ExtInfLine::countAttribute(std::string_view key) const {
    return static_cast<size_t>(std::count_if(m_attributes.begin(), m_attributes.end(),
        [key](const M3uAttribute& attr) { return KeyEquals(attr.key, key); }));
}

void ExtInfLine::setAttribute(const std::string& key, const std::string& value) {
    bool replaced = false;
    for (auto it = m_attributes.begin(); it != m_attributes.end();) {
        if (!KeyEquals(it->key, key)) {
            ++it;
            continue;
        }
        if (replaced) {
            it = m_attributes.erase(it);
            continue;
        }
        it->value = value;
        it->rawValue = Quote(value);
        replaced = true;
        ++it;
    }

    if (!replaced) {
        M3uAttribute attr;
        attr.separator = " ";
        attr.key = key;
        attr.value = value;
        attr.rawValue = Quote(value);
        m_attributes.push_back(std::move(attr));
    }
}

std::string ExtInfLine::str() const {
    std::string out = m_directive + m_duration;
    for (const auto& attr : m_attributes) {
        out += attr.separator;
        out += attr.raw();
    }
    out += m_trailing;
    out += ',';
    out += m_displayName;
    return out;
}

} // namespace channelcurator::domain
