#include "core/EventPublisher.hpp"
#include "core/EventCodec.hpp"

namespace core {

EventPublisher::EventPublisher(std::shared_ptr<TransportManager> transport,
                               std::shared_ptr<common::ILogger> logger)
    : transport_(std::move(transport))
    , logger_(logger ? std::move(logger) : std::make_shared<common::NullLogger>())
{
}

void EventPublisher::submit(OutboundMessage message) {
    if (!transport_->enqueue(std::move(message))) {
        logger_->debug("[Publisher] Message queued with loss (transport busy or stopping)");
    }
}

void EventPublisher::publish_window(const WindowEvent& event) {
    submit(OutboundMessage::plain(codec::encode_window_info(event, codec::now_epoch_ms())));
}

void EventPublisher::publish_media(const MediaEvent& event) {
    auto url = transport_->artwork_url(event.content_item_identifier);
    submit(OutboundMessage::plain(codec::encode_media_playback(event, url, codec::now_epoch_ms())));
}

void EventPublisher::publish_artwork(const std::string& content_item_identifier,
                                     const std::vector<uint8_t>& bytes,
                                     const std::string& mime_type) {
    if (bytes.empty()) return;
    if (!transport_->claim_artwork_upload(content_item_identifier)) {
        return; // already uploaded or in flight
    }

    logger_->debug("[Publisher] Uploading artwork for " + content_item_identifier +
                   " (" + std::to_string(bytes.size()) + " bytes)");
    submit(OutboundMessage::artwork_upload(
        codec::encode_artwork_meta(content_item_identifier,
                                   mime_type.empty() ? "application/octet-stream" : mime_type,
                                   codec::now_epoch_ms()),
        bytes, content_item_identifier));
}

} // namespace core
