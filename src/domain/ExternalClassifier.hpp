/**
 * @file ExternalClassifier.hpp
 * @brief Interface for an optional out-of-process text classifier.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

namespace channelcurator::domain {

/**
 * @class ExternalClassifier
 * @brief Picks one label from a closed set for a piece of free text.
 *
 * Implementations report every failure (timeout, transport error, unusable
 * reply) as std::nullopt; callers treat it exactly like "no classification".
 */
class ExternalClassifier {
public:
    virtual ~ExternalClassifier() = default;

    /**
     * @param text Display name to classify.
     * @param allowedLabels Closed set of acceptable answers.
     * @return One of allowedLabels, or std::nullopt.
     */
    virtual std::optional<std::string> classify(const std::string& text,
                                                const std::vector<std::string>& allowedLabels) = 0;
};

} // namespace channelcurator::domain
