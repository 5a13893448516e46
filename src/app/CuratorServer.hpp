/**
 * @file CuratorServer.hpp
 * @brief HTTP front end and one-shot runner for the curation service.
 */

#pragma once

#include "application/PlaylistCurationService.hpp"
#include "domain/CuratorConfig.hpp"
#include <memory>
#include <ostream>

namespace httplib {
class Server;
}

namespace channelcurator::app {

/**
 * @class CuratorServer
 * @brief Serves the curated playlist over HTTP.
 *
 * Routes: GET /m3u and GET /playlist.m3u stream the playlist (optional
 * "username" / "password" query parameters override the configured
 * credentials); GET /health answers "ok".
 */
class CuratorServer {
public:
    CuratorServer(std::shared_ptr<const application::PlaylistCurationService> service,
                  domain::ServerSettings settings);
    ~CuratorServer();

    /**
     * @brief Binds and blocks until stop() is called.
     * @return False if the socket could not be bound.
     */
    bool Run();

    void Stop();

    /**
     * @brief Writes one playlist to the stream.
     * @return Process exit code: 0 on success, 2 on configuration errors, 3 on acquisition errors.
     */
    static int RunOnce(const application::PlaylistCurationService& service, std::ostream& out);

private:
    void RegisterRoutes();

    std::shared_ptr<const application::PlaylistCurationService> m_service;
    domain::ServerSettings m_settings;
    std::unique_ptr<httplib::Server> m_server;
};

} // namespace channelcurator::app
