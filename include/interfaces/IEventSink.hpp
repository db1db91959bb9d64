#pragma once
#include <string>
#include <vector>
#include "core/ReporterTypes.hpp"

namespace interfaces {

// Remote consumer of captured events. Must never block the caller.
class IEventSink {
public:
    virtual ~IEventSink() = default;

    virtual void publish_window(const core::WindowEvent& event) = 0;
    virtual void publish_media(const core::MediaEvent& event) = 0;

    // Artwork for a track, uploaded at most once per content item
    virtual void publish_artwork(const std::string& content_item_identifier,
                                 const std::vector<uint8_t>& bytes,
                                 const std::string& mime_type) = 0;
};

} // namespace interfaces
