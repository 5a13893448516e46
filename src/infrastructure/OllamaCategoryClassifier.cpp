/**
 * @file OllamaCategoryClassifier.cpp
 * @brief Implementation of OllamaCategoryClassifier.
 */

#include "infrastructure/OllamaCategoryClassifier.hpp"
#include "domain/TextUtils.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <sstream>

namespace channelcurator::infrastructure {

using json = nlohmann::json;

namespace {
constexpr double kDeterministicTemperature = 0.0;
constexpr double kDeterministicTopP = 1.0;
constexpr int kDeterministicSeed = 42;
}

OllamaCategoryClassifier::OllamaCategoryClassifier(domain::ClassifierSettings settings)
    : m_settings(std::move(settings)) {}

std::string OllamaCategoryClassifier::BuildPrompt(const std::string& text,
                                                  const std::vector<std::string>& allowedLabels) {
    std::ostringstream ss;
    ss << "You sort TV channels into categories.\n"
       << "Pick the single best category for the channel name below.\n"
       << "Allowed categories:\n";
    for (const auto& label : allowedLabels) {
        ss << "- " << label << "\n";
    }
    ss << "\nRULES:\n"
       << "1. Answer with JSON only: {\"category\": \"<one allowed category>\"}.\n"
       << "2. If none fits, answer {\"category\": \"none\"}.\n"
       << "3. Never invent a category.\n\n"
       << "Channel: " << text;
    return ss.str();
}

std::optional<std::string> OllamaCategoryClassifier::ParseReply(const std::string& reply,
                                                                const std::vector<std::string>& allowedLabels) {
    std::string answer;
    try {
        auto body = json::parse(reply);
        if (body.is_object() && body.contains("category") && body["category"].is_string()) {
            answer = body["category"].get<std::string>();
        } else if (body.is_string()) {
            answer = body.get<std::string>();
        } else {
            return std::nullopt;
        }
    } catch (const json::exception&) {
        // Models sometimes answer with the bare label.
        answer = reply;
    }

    std::string wanted = domain::TextUtils::FoldCase(domain::TextUtils::Trim(answer));
    if (wanted.empty() || wanted == "none") return std::nullopt;

    for (const auto& label : allowedLabels) {
        if (domain::TextUtils::FoldCase(label) == wanted) {
            return label;
        }
    }
    return std::nullopt;
}

std::optional<std::string> OllamaCategoryClassifier::classify(const std::string& text,
                                                              const std::vector<std::string>& allowedLabels) {
    if (allowedLabels.empty()) return std::nullopt;
    if (m_consecutiveFailures.load() >= m_settings.maxFailures) {
        if (!m_circuitReported.exchange(true)) {
            std::cerr << "[OllamaCategoryClassifier] " << m_consecutiveFailures.load()
                      << " consecutive failures; external classification disabled." << std::endl;
        }
        return std::nullopt;
    }

    httplib::Client cli(m_settings.host, m_settings.port);
    cli.set_connection_timeout(m_settings.timeout);
    cli.set_read_timeout(m_settings.timeout);
    cli.set_write_timeout(m_settings.timeout);
    if (!m_settings.apiKey.empty()) {
        cli.set_bearer_token_auth(m_settings.apiKey);
    }

    json requestData = {
        {"model", m_settings.model},
        {"prompt", BuildPrompt(text, allowedLabels)},
        {"stream", false},
        {"format", "json"},
        {"options", {
            {"temperature", kDeterministicTemperature},
            {"top_p", kDeterministicTopP},
            {"seed", kDeterministicSeed}
        }}
    };

    auto res = cli.Post("/api/generate", requestData.dump(), "application/json");
    if (!res) {
        std::cerr << "[OllamaCategoryClassifier] Connection failed: " << httplib::to_string(res.error()) << std::endl;
        recordFailure();
        return std::nullopt;
    }
    if (res->status != 200) {
        std::cerr << "[OllamaCategoryClassifier] HTTP Error " << res->status << std::endl;
        recordFailure();
        return std::nullopt;
    }
    m_consecutiveFailures = 0;

    try {
        auto body = json::parse(res->body);
        if (body.contains("response") && body["response"].is_string()) {
            return ParseReply(body["response"].get<std::string>(), allowedLabels);
        }
        std::cerr << "[OllamaCategoryClassifier] Response JSON missing 'response' field." << std::endl;
    } catch (const json::exception& e) {
        std::cerr << "[OllamaCategoryClassifier] JSON Parse Error: " << e.what() << std::endl;
    }
    return std::nullopt;
}

void OllamaCategoryClassifier::recordFailure() {
    ++m_consecutiveFailures;
}

} // namespace channelcurator::infrastructure
