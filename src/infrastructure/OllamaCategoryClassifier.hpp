/**
 * @file OllamaCategoryClassifier.hpp
 * @brief External classifier backed by an Ollama /api/generate endpoint.
 */

#pragma once
#include "domain/CuratorConfig.hpp"
#include "domain/ExternalClassifier.hpp"
#include <atomic>
#include <optional>
#include <string>
#include <vector>

namespace channelcurator::infrastructure {

/**
 * @class OllamaCategoryClassifier
 * @brief Asks a local model to pick one category label, with a short timeout.
 *
 * Safe to share between concurrent requests: each call uses its own client.
 * After ClassifierSettings::maxFailures consecutive transport failures the
 * adapter stops calling out and always answers std::nullopt.
 */
class OllamaCategoryClassifier : public domain::ExternalClassifier {
public:
    explicit OllamaCategoryClassifier(domain::ClassifierSettings settings);

    std::optional<std::string> classify(const std::string& text,
                                        const std::vector<std::string>& allowedLabels) override;

    /**
     * @brief Extracts the label from a model reply ({"category": "..."}).
     * @return The canonical spelling from allowedLabels, or std::nullopt.
     */
    static std::optional<std::string> ParseReply(const std::string& reply,
                                                 const std::vector<std::string>& allowedLabels);

    /** @brief Builds the instruction sent ahead of the display name. */
    static std::string BuildPrompt(const std::string& text, const std::vector<std::string>& allowedLabels);

private:
    void recordFailure();

    domain::ClassifierSettings m_settings;
    std::atomic<int> m_consecutiveFailures{0};
    std::atomic<bool> m_circuitReported{false};
};

} // namespace channelcurator::infrastructure
