#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include "core/ReporterTypes.hpp"

namespace core {

// ============================================================================
// EventCodec - JSON wire messages exchanged with the reporting endpoint
// ============================================================================
// Outbound (text frames):
//   {"type":"window_info","timestamp":<ms>,"data":{...}}
//   {"type":"media_playback","timestamp":<ms>,"metadata":{...},"playback_state":{...}}
//   {"type":"upload_artwork_meta","timestamp":<ms>,"content_item_identifier":"...","mime_type":"..."}
//     followed by one binary frame carrying the artwork bytes
//
// Inbound:
//   {"type":"artwork_uploaded","content_item_identifier":"...","artwork_url":"..."}
// ============================================================================

namespace codec {

std::string escape_json(const std::string& s);

int64_t now_epoch_ms();

std::string encode_window_info(const WindowEvent& event, int64_t timestamp_ms);

// `artwork_url` is the server-side URL if the artwork was already uploaded
std::string encode_media_playback(const MediaEvent& event,
                                  const std::optional<std::string>& artwork_url,
                                  int64_t timestamp_ms);

std::string encode_artwork_meta(const std::string& content_item_identifier,
                                const std::string& mime_type,
                                int64_t timestamp_ms);

struct ServerMessage {
    std::string type;
    std::map<std::string, std::string> fields; // top-level string members
};

// Parses a JSON object and collects its top-level string members.
// Returns nullopt for anything that is not a well-formed object.
std::optional<ServerMessage> parse_server_message(const std::string& text);

} // namespace codec
} // namespace core
