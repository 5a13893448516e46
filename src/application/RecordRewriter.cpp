/**
 * @file RecordRewriter.cpp
 * @brief Implementation of RecordRewriter.
 */

#include "application/RecordRewriter.hpp"
#include "domain/Taxonomy.hpp"

namespace channelcurator::application {

RecordRewriter::RecordRewriter(std::string categoryAttribute)
    : m_categoryAttribute(std::move(categoryAttribute)) {}

bool RecordRewriter::seen(const std::string& locator) const {
    return m_seen.count(locator) > 0;
}

domain::OutputRecord RecordRewriter::accept(domain::RawRecord record, const Admission& admission,
                                            const domain::ClassificationResult& result) {
    m_seen.insert(record.locator);

    record.metadata.setAttribute(m_categoryAttribute, result.category->name);
    record.metadata.setDisplayName(admission.displayName);

    return domain::OutputRecord{record.metadata.str(), std::move(record.locator)};
}

} // namespace channelcurator::application
