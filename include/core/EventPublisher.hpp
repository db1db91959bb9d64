#pragma once
#include <memory>
#include "common/Logger.hpp"
#include "core/TransportManager.hpp"
#include "interfaces/IEventSink.hpp"

namespace core {

// Encodes captured events into wire messages and queues them on the
// transport. Never blocks the capture thread.
class EventPublisher : public interfaces::IEventSink {
public:
    EventPublisher(std::shared_ptr<TransportManager> transport,
                   std::shared_ptr<common::ILogger> logger);

    void publish_window(const WindowEvent& event) override;
    void publish_media(const MediaEvent& event) override;
    void publish_artwork(const std::string& content_item_identifier,
                         const std::vector<uint8_t>& bytes,
                         const std::string& mime_type) override;

private:
    void submit(OutboundMessage message);

    std::shared_ptr<TransportManager> transport_;
    std::shared_ptr<common::ILogger> logger_;
};

} // namespace core
