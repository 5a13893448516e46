/**
 * @file OriginFetcher.cpp
 * @brief Implementation of OriginFetcher.
 */

#include "application/OriginFetcher.hpp"
#include "application/RecordParser.hpp"
#include "domain/CuratorErrors.hpp"
#include "domain/TextUtils.hpp"
#include "infrastructure/UrlUtils.hpp"
#include <algorithm>
#include <iostream>
#include <map>
#include <thread>

namespace channelcurator::application {

using domain::TextUtils;
using infrastructure::UrlUtils;

namespace {

/**
 * Replays the bytes consumed by the header check, then continues with the
 * underlying body.
 */
class PrefixedByteStream : public domain::ByteStream {
public:
    PrefixedByteStream(std::string prefix, std::unique_ptr<domain::ByteStream> inner)
        : m_prefix(std::move(prefix)), m_inner(std::move(inner)) {}

    std::optional<std::string> read() override {
        if (!m_prefix.empty()) {
            std::string out;
            out.swap(m_prefix);
            return out;
        }
        return m_inner->read();
    }

    void close() override {
        m_prefix.clear();
        m_inner->close();
    }

    std::string error() const override { return m_inner->error(); }

private:
    std::string m_prefix;
    std::unique_ptr<domain::ByteStream> m_inner;
};

} // namespace

OriginFetcher::OriginFetcher(std::vector<domain::Origin> origins,
                             domain::FetchPolicy policy,
                             std::shared_ptr<domain::StreamConnector> connector,
                             Sleeper sleeper)
    : m_origins(std::move(origins)),
      m_policy(std::move(policy)),
      m_connector(std::move(connector)),
      m_sleeper(std::move(sleeper)) {
    if (m_origins.empty()) {
        throw domain::ConfigurationError("No origins configured");
    }
    if (m_policy.maxAttempts < 1) {
        throw domain::ConfigurationError("fetch.max_attempts must be at least 1");
    }
    if (!m_connector) {
        throw domain::ConfigurationError("No stream connector");
    }
    if (!m_sleeper) {
        m_sleeper = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

bool OriginFetcher::HasValidHeader(std::string_view firstLine) {
    if (TextUtils::StartsWith(firstLine, "\xEF\xBB\xBF")) {
        firstLine.remove_prefix(3);
    }
    if (!firstLine.empty() && firstLine.back() == '\r') {
        firstLine.remove_suffix(1);
    }
    return TextUtils::StartsWithIgnoreCase(TextUtils::TrimLeft(firstLine), RecordParser::kHeaderToken);
}

const domain::Origin& OriginFetcher::originForAttempt(int attempt) const {
    const size_t n = m_origins.size();
    if (m_policy.selection == domain::OriginSelection::Sequential) {
        return m_origins[std::min(static_cast<size_t>(attempt), n - 1)];
    }
    return m_origins[static_cast<size_t>(attempt) % n];
}

std::optional<std::string> OriginFetcher::attempt(const domain::Origin& origin,
                                                  const domain::Credentials& credentials,
                                                  FetchedDocument& doc) const {
    domain::StreamRequest request;
    request.url = UrlUtils::Expand(origin.urlTemplate, credentials, m_policy.playlistType, m_policy.outputFormat);
    request.connectTimeout = m_policy.connectTimeout;
    request.readTimeout = m_policy.readTimeout;
    request.queueChunks = m_policy.queueChunks;

    domain::StreamResponse response = m_connector->open(request);
    if (response.status == 0) {
        return "connection failed: " + response.error;
    }
    if (response.status < 200 || response.status >= 300) {
        if (response.body) response.body->close();
        return "HTTP " + std::to_string(response.status);
    }
    if (!response.body) {
        return "empty response";
    }

    // Read just enough to see the first line.
    std::string head;
    size_t nl = std::string::npos;
    while (nl == std::string::npos && head.size() < m_policy.maxHeaderBytes) {
        auto chunk = response.body->read();
        if (!chunk) break;
        head += *chunk;
        nl = head.find('\n');
    }

    if (head.empty()) {
        std::string err = response.body->error();
        response.body->close();
        return err.empty() ? std::string("empty response") : "connection failed: " + err;
    }

    std::string_view firstLine(head);
    if (nl != std::string::npos) firstLine = firstLine.substr(0, nl);
    if (!HasValidHeader(firstLine)) {
        response.body->close();
        return "missing #EXTM3U header";
    }

    doc.stream = std::make_unique<PrefixedByteStream>(std::move(head), std::move(response.body));
    doc.originLabel = origin.label;
    return std::nullopt;
}

FetchedDocument OriginFetcher::fetch(const domain::Credentials& credentials) const {
    if (!credentials.complete()) {
        throw domain::ConfigurationError("Missing origin credentials (username and password are required)");
    }

    std::map<std::string, std::string> lastFailure;
    std::vector<std::string> order;

    for (int i = 0; i < m_policy.maxAttempts; ++i) {
        const domain::Origin& origin = originForAttempt(i);

        FetchedDocument doc;
        std::optional<std::string> failure;
        try {
            failure = attempt(origin, credentials, doc);
        } catch (const std::exception& e) {
            failure = std::string("connection failed: ") + e.what();
        }

        if (!failure) {
            doc.attempts = i + 1;
            std::cout << "[OriginFetcher] Connected to " << origin.label
                      << " (attempt " << (i + 1) << "/" << m_policy.maxAttempts << ")" << std::endl;
            return doc;
        }

        std::string reason = UrlUtils::Mask(*failure, credentials.password);
        if (lastFailure.find(origin.label) == lastFailure.end()) {
            order.push_back(origin.label);
        }
        lastFailure[origin.label] = reason;
        std::cerr << "[OriginFetcher] Attempt " << (i + 1) << "/" << m_policy.maxAttempts
                  << " (" << origin.label << ") failed: " << reason << std::endl;

        if (i + 1 < m_policy.maxAttempts) {
            m_sleeper(m_policy.backoff);
        }
    }

    std::vector<std::string> failures;
    std::string message = "All " + std::to_string(m_policy.maxAttempts) + " attempts failed";
    for (const auto& label : order) {
        failures.push_back(label + ": " + lastFailure[label]);
        message += "; " + failures.back();
    }
    throw domain::AcquisitionError(message, std::move(failures));
}

} // namespace channelcurator::application
