/**
 * @file PlaylistEmitter.cpp
 * @brief Implementation of PlaylistEmitter.
 */

#include "application/PlaylistEmitter.hpp"

namespace channelcurator::application {

PlaylistEmitter::PlaylistEmitter(domain::OutputSettings settings) : m_settings(std::move(settings)) {}

void PlaylistEmitter::writeHeader(const std::optional<domain::PlaylistHeader>& source, std::string& out) const {
    out += "#EXTM3U";
    if (m_settings.forwardGuideUrl && source && source->guideRef) {
        out += ' ';
        out += *source->guideRef;
    }
    out += '\n';
}

void PlaylistEmitter::writeRecord(const domain::OutputRecord& record, std::string& out) const {
    out += record.metadata;
    out += '\n';
    out += record.locator;
    out += '\n';
}

} // namespace channelcurator::application
