/**
 * @file CategoryClassifier.cpp
 * @brief Implementation of CategoryClassifier.
 */

#include "application/CategoryClassifier.hpp"
#include "domain/CuratorErrors.hpp"
#include "domain/TextUtils.hpp"
#include <algorithm>
#include <iostream>

namespace channelcurator::application {

using domain::TextUtils;

namespace {
constexpr std::string_view kPrefixSeparators = " |:-";
}

CategoryClassifier::CategoryClassifier(std::shared_ptr<const domain::Taxonomy> taxonomy,
                                       std::vector<domain::RoutingPrefix> prefixes,
                                       std::shared_ptr<domain::ExternalClassifier> external)
    : m_taxonomy(std::move(taxonomy)), m_prefixes(std::move(prefixes)), m_external(std::move(external)) {
    if (!m_taxonomy) {
        throw domain::ConfigurationError("Classifier requires a taxonomy");
    }
    for (const auto& prefix : m_prefixes) {
        if (prefix.token.empty()) {
            throw domain::ConfigurationError("Empty routing prefix");
        }
        if (!m_taxonomy->hasRegion(prefix.region)) {
            throw domain::ConfigurationError("Routing prefix '" + prefix.token +
                                             "' targets unknown region '" + prefix.region + "'");
        }
    }
    // "USA|" must win over "US" when both are configured.
    std::stable_sort(m_prefixes.begin(), m_prefixes.end(),
                     [](const domain::RoutingPrefix& a, const domain::RoutingPrefix& b) {
                         return a.token.size() > b.token.size();
                     });
}

const domain::RoutingPrefix* CategoryClassifier::matchPrefix(const std::string& name) const {
    for (const auto& prefix : m_prefixes) {
        if (TextUtils::StartsWithIgnoreCase(name, prefix.token)) {
            return &prefix;
        }
    }
    return nullptr;
}

std::optional<Admission> CategoryClassifier::admit(const std::string& displayName) const {
    std::string name(TextUtils::TrimLeft(displayName));
    const domain::RoutingPrefix* first = matchPrefix(name);
    if (!first) return std::nullopt;

    Admission admission;
    admission.region = first->region;

    // Names like "US| US: CNN" carry the prefix more than once.
    while (const domain::RoutingPrefix* prefix = matchPrefix(name)) {
        name.erase(0, prefix->token.size());
        if (!name.empty() && kPrefixSeparators.find(name.front()) != std::string_view::npos) {
            name.erase(0, 1);
        }
        name = std::string(TextUtils::TrimLeft(name));
    }

    admission.displayName = std::string(TextUtils::Trim(name));
    return admission;
}

const domain::Category* CategoryClassifier::matchKeyword(const std::string& displayName,
                                                         const std::string& region,
                                                         std::string* matchedKeyword) const {
    const std::string folded = TextUtils::FoldCase(displayName);
    for (const domain::Category* category : m_taxonomy->eligible(region)) {
        for (const auto& keyword : category->keywords) {
            if (folded.find(keyword) != std::string::npos) {
                if (matchedKeyword) *matchedKeyword = keyword;
                return category;
            }
        }
    }
    return nullptr;
}

domain::ClassificationResult CategoryClassifier::classify(const std::string& displayName,
                                                          const std::string& region) const {
    domain::ClassificationResult result;

    std::string keyword;
    if (const domain::Category* category = matchKeyword(displayName, region, &keyword)) {
        result.category = category;
        result.provenance = domain::Provenance::Keyword;
        result.matchedKeyword = keyword;
        return result;
    }

    if (m_external) {
        std::optional<std::string> label;
        try {
            label = m_external->classify(displayName, m_taxonomy->labels(region));
        } catch (const std::exception& e) {
            std::cerr << "[Classifier] External classifier failed for '" << displayName << "': " << e.what() << std::endl;
        }
        if (label) {
            const auto& eligible = m_taxonomy->eligible(region);
            auto it = std::find_if(eligible.begin(), eligible.end(),
                                   [&](const domain::Category* c) { return c->name == *label; });
            if (it != eligible.end()) {
                result.category = *it;
                result.provenance = domain::Provenance::External;
                return result;
            }
        }
    }

    result.category = &m_taxonomy->generalCategory(region);
    result.provenance = domain::Provenance::Fallback;
    return result;
}

} // namespace channelcurator::application
