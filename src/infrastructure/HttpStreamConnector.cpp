/**
 * @file HttpStreamConnector.cpp
 * @brief Implementation of HttpStreamConnector.
 */

#include "infrastructure/HttpStreamConnector.hpp"
#include "infrastructure/ChunkQueue.hpp"
#include "infrastructure/UrlUtils.hpp"
#include <httplib.h>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

namespace channelcurator::infrastructure {

namespace {

struct TransferState {
    explicit TransferState(size_t capacity) : queue(capacity) {}

    ChunkQueue queue;
    std::mutex mutex;
    std::condition_variable cv;
    bool responded = false; ///< Status line and headers received.
    bool ended = false;     ///< Transport thread returned.
    int status = 0;
    std::string location;   ///< Location header of a redirect.
    std::string error;
};

class HttpByteStream : public domain::ByteStream {
public:
    HttpByteStream(std::shared_ptr<TransferState> state,
                   std::shared_ptr<httplib::Client> client,
                   std::thread worker)
        : m_state(std::move(state)), m_client(std::move(client)), m_worker(std::move(worker)) {}

    ~HttpByteStream() override {
        close();
    }

    std::optional<std::string> read() override {
        if (m_closed) return std::nullopt;
        return m_state->queue.pop();
    }

    void close() override {
        if (m_closed) return;
        m_closed = true;
        m_state->queue.close();
        m_client->stop();
        if (m_worker.joinable()) {
            m_worker.join();
        }
    }

    std::string error() const override {
        return m_state->queue.error();
    }

private:
    std::shared_ptr<TransferState> m_state;
    std::shared_ptr<httplib::Client> m_client;
    std::thread m_worker;
    bool m_closed = false;
};

constexpr int kMaxRedirects = 5;

bool IsRedirect(int status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

std::string ResolveLocation(const UrlUtils::Parts& base, const std::string& location) {
    if (UrlUtils::Split(location)) return location;
    if (location.compare(0, 2, "//") == 0) {
        return base.schemeHostPort.substr(0, base.schemeHostPort.find("://") + 1) + location;
    }
    if (!location.empty() && location[0] == '/') return base.schemeHostPort + location;
    std::string path = base.pathAndQuery.substr(0, base.pathAndQuery.find('?'));
    return base.schemeHostPort + path.substr(0, path.rfind('/') + 1) + location;
}

// One request on its own client. Redirects are reported through location, not followed.
domain::StreamResponse OpenOnce(const UrlUtils::Parts& parts,
                                const domain::StreamRequest& request,
                                const std::string& userAgent,
                                std::string& location) {
    domain::StreamResponse response;

    auto client = std::make_shared<httplib::Client>(parts.schemeHostPort);
    if (!client->is_valid()) {
        response.error = "cannot create client for " + parts.schemeHostPort;
        return response;
    }
    client->set_connection_timeout(request.connectTimeout);
    client->set_read_timeout(request.readTimeout);
    client->set_follow_location(false);
    client->set_keep_alive(false);

    auto state = std::make_shared<TransferState>(request.queueChunks);
    httplib::Headers headers = {
        {"User-Agent", userAgent},
        {"Accept", "*/*"}
    };

    std::thread worker([state, client, headers, path = parts.pathAndQuery]() {
        auto res = client->Get(path, headers,
            [state](const httplib::Response& r) {
                {
                    std::lock_guard<std::mutex> lock(state->mutex);
                    state->responded = true;
                    state->status = r.status;
                    state->location = r.get_header_value("Location");
                }
                state->cv.notify_all();
                // Non-2xx bodies are never read.
                return r.status >= 200 && r.status < 300;
            },
            [state](const char* data, size_t length) {
                return state->queue.push(std::string(data, length));
            });

        std::string error;
        if (!res && res.error() != httplib::Error::Canceled) {
            error = httplib::to_string(res.error());
        }
        state->queue.finish(error);
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->ended = true;
            if (!state->responded) {
                state->error = error.empty() ? "no response" : error;
            }
        }
        state->cv.notify_all();
    });

    {
        std::unique_lock<std::mutex> lock(state->mutex);
        state->cv.wait(lock, [&state] { return state->responded || state->ended; });
        response.status = state->status;
        response.error = state->error;
        location = state->location;
    }

    if (response.status == 0) {
        worker.join();
        return response;
    }

    response.body = std::make_unique<HttpByteStream>(state, client, std::move(worker));
    return response;
}

} // namespace

HttpStreamConnector::HttpStreamConnector(std::string userAgent)
    : m_userAgent(std::move(userAgent)) {}

domain::StreamResponse HttpStreamConnector::open(const domain::StreamRequest& request) {
    std::string url = request.url;
    for (int hop = 0;; ++hop) {
        auto parts = UrlUtils::Split(url);
        if (!parts) {
            domain::StreamResponse response;
            response.error = hop == 0 ? "unsupported URL" : "unsupported redirect target";
            return response;
        }

        std::string location;
        auto response = OpenOnce(*parts, request, m_userAgent, location);
        if (!IsRedirect(response.status) || location.empty() || hop >= kMaxRedirects) {
            return response;
        }

        // The redirect body was never read; this only joins the finished transfer.
        response.body->close();
        url = ResolveLocation(*parts, location);
        std::cout << "[HttpStreamConnector] Redirect " << response.status << " from "
                  << parts->schemeHostPort << " (hop " << (hop + 1) << ")" << std::endl;
    }
}

} // namespace channelcurator::infrastructure
