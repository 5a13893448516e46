/**
 * @file CuratorServer.cpp
 * @brief Implementation of CuratorServer.
 */

#include "app/CuratorServer.hpp"
#include "domain/CuratorErrors.hpp"
#include <httplib.h>
#include <iostream>

namespace channelcurator::app {

namespace {

constexpr const char* kPlaylistMime = "application/x-mpegurl";

std::string ErrorDocument(const domain::CuratorError& e) {
    std::string body = std::string("error: ") + e.stage() + " failed\n" + e.what() + "\n";
    if (auto acquisition = dynamic_cast<const domain::AcquisitionError*>(&e)) {
        for (const auto& failure : acquisition->originFailures()) {
            body += "  " + failure + "\n";
        }
    }
    return body;
}

domain::Credentials CredentialsFromQuery(const httplib::Request& req) {
    domain::Credentials overrides;
    if (req.has_param("username")) overrides.username = req.get_param_value("username");
    if (req.has_param("password")) overrides.password = req.get_param_value("password");
    return overrides;
}

} // namespace

CuratorServer::CuratorServer(std::shared_ptr<const application::PlaylistCurationService> service,
                             domain::ServerSettings settings)
    : m_service(std::move(service)),
      m_settings(std::move(settings)),
      m_server(std::make_unique<httplib::Server>()) {
    RegisterRoutes();
}

CuratorServer::~CuratorServer() = default;

void CuratorServer::RegisterRoutes() {
    auto playlist = [this](const httplib::Request& req, httplib::Response& res) {
        std::shared_ptr<application::PlaylistSession> session;
        try {
            session = m_service->openSession(CredentialsFromQuery(req));
        } catch (const domain::ConfigurationError& e) {
            std::cerr << "[CuratorServer] " << req.path << ": " << e.what() << std::endl;
            res.status = 400;
            res.set_content(ErrorDocument(e), "text/plain; charset=utf-8");
            return;
        } catch (const domain::AcquisitionError& e) {
            std::cerr << "[CuratorServer] " << req.path << ": " << e.what() << std::endl;
            res.status = 502;
            res.set_content(ErrorDocument(e), "text/plain; charset=utf-8");
            return;
        }

        std::cout << "[CuratorServer] Streaming playlist from " << session->originLabel()
                  << " to " << req.remote_addr << std::endl;

        res.set_chunked_content_provider(
            kPlaylistMime,
            [session](size_t /*offset*/, httplib::DataSink& sink) {
                std::string chunk;
                if (!session->next(chunk)) {
                    sink.done();
                    return true;
                }
                if (!sink.write(chunk.data(), chunk.size())) {
                    session->cancel();
                    return false;
                }
                return true;
            },
            [session](bool success) {
                // Client went away or the write failed.
                if (!success) session->cancel();
            });
    };

    m_server->Get("/m3u", playlist);
    m_server->Get("/playlist.m3u", playlist);

    m_server->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("ok", "text/plain");
    });
}

bool CuratorServer::Run() {
    std::cout << "[CuratorServer] Listening on " << m_settings.host << ":" << m_settings.port << std::endl;
    if (!m_server->listen(m_settings.host, m_settings.port)) {
        std::cerr << "[CuratorServer] Could not listen on " << m_settings.host << ":" << m_settings.port << std::endl;
        return false;
    }
    return true;
}

void CuratorServer::Stop() {
    m_server->stop();
}

int CuratorServer::RunOnce(const application::PlaylistCurationService& service, std::ostream& out) {
    std::unique_ptr<application::PlaylistSession> session;
    try {
        session = service.openSession();
    } catch (const domain::ConfigurationError& e) {
        std::cerr << ErrorDocument(e);
        return 2;
    } catch (const domain::AcquisitionError& e) {
        std::cerr << ErrorDocument(e);
        return 3;
    }

    std::string chunk;
    while (session->next(chunk)) {
        out << chunk;
        chunk.clear();
        if (!out) {
            session->cancel();
            return 1;
        }
    }
    out.flush();
    return 0;
}

} // namespace channelcurator::app
