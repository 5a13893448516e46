/**
 * @file RecordRewriter.hpp
 * @brief Per-pass deduplication and metadata rewriting.
 */

#pragma once
#include "application/CategoryClassifier.hpp"
#include "domain/Classification.hpp"
#include "domain/PlaylistRecord.hpp"
#include <string>
#include <unordered_set>

namespace channelcurator::application {

/**
 * @class RecordRewriter
 * @brief Owns the SeenSet of one emission pass.
 *
 * The set grows monotonically and dies with the rewriter; one instance per pass.
 */
class RecordRewriter {
public:
    explicit RecordRewriter(std::string categoryAttribute);

    /** @brief True if the locator was already accepted in this pass. */
    bool seen(const std::string& locator) const;

    /**
     * @brief Records the locator and rewrites the metadata line.
     *
     * The category attribute is replaced in place or appended; the display name
     * becomes the prefix-stripped name from the admission.
     */
    domain::OutputRecord accept(domain::RawRecord record, const Admission& admission,
                                const domain::ClassificationResult& result);

    size_t seenCount() const { return m_seen.size(); }

private:
    std::string m_categoryAttribute;
    std::unordered_set<std::string> m_seen;
};

} // namespace channelcurator::application
