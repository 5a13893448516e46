/**
 * @file PlaylistEmitter.hpp
 * @brief Serializes the output playlist.
 */

#pragma once
#include "domain/CuratorConfig.hpp"
#include "domain/PlaylistRecord.hpp"
#include <optional>
#include <string>

namespace channelcurator::application {

class PlaylistEmitter {
public:
    explicit PlaylistEmitter(domain::OutputSettings settings);

    /** @brief "#EXTM3U", plus the forwarded guide reference when enabled and present. */
    void writeHeader(const std::optional<domain::PlaylistHeader>& source, std::string& out) const;

    void writeRecord(const domain::OutputRecord& record, std::string& out) const;

private:
    domain::OutputSettings m_settings;
};

} // namespace channelcurator::application
