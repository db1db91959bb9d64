#include "core/EventCodec.hpp"
#include <chrono>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace core {
namespace codec {

namespace {

// Length of the well-formed UTF-8 sequence starting at `i`, 0 if malformed.
// Overlong forms, surrogates and code points above U+10FFFF are malformed.
size_t utf8_sequence_length(const std::string& s, size_t i) {
    auto byte = [&](size_t k) { return static_cast<unsigned char>(s[k]); };
    unsigned char lead = byte(i);
    size_t len = 0;
    unsigned char lo = 0x80, hi = 0xBF; // allowed range of the second byte

    if (lead < 0x80) return 1;
    if (lead >= 0xC2 && lead <= 0xDF) {
        len = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        len = 3;
        if (lead == 0xE0) lo = 0xA0;
        if (lead == 0xED) hi = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        len = 4;
        if (lead == 0xF0) lo = 0x90;
        if (lead == 0xF4) hi = 0x8F;
    } else {
        return 0;
    }

    if (i + len > s.size()) return 0;
    if (byte(i + 1) < lo || byte(i + 1) > hi) return 0;
    for (size_t k = 2; k < len; ++k) {
        if (byte(i + k) < 0x80 || byte(i + k) > 0xBF) return 0;
    }
    return len;
}

const char REPLACEMENT_CHARACTER[] = "\xEF\xBF\xBD"; // U+FFFD

} // namespace

// Invalid UTF-8 (e.g. Latin-1 window titles) becomes U+FFFD, one per bad byte
std::string escape_json(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 10);
    for (size_t i = 0; i < s.size();) {
        char c = s[i];
        if (static_cast<unsigned char>(c) >= 0x80) {
            size_t len = utf8_sequence_length(s, i);
            if (len == 0) {
                out += REPLACEMENT_CHARACTER;
                ++i;
            } else {
                out.append(s, i, len);
                i += len;
            }
            continue;
        }

        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 32) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
        ++i;
    }
    return out;
}

int64_t now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

namespace {

// Optional string member: empty -> null
std::string string_or_null(const std::string& s) {
    return s.empty() ? "null" : "\"" + escape_json(s) + "\"";
}

// JSON has no NaN/Infinity
std::string number(double v) {
    if (!std::isfinite(v)) return "0";
    std::ostringstream ss;
    ss << std::setprecision(15) << v;
    return ss.str();
}

} // namespace

std::string encode_window_info(const WindowEvent& event, int64_t timestamp_ms) {
    std::ostringstream ss;
    ss << "{\"type\":\"window_info\""
       << ",\"timestamp\":" << timestamp_ms
       << ",\"data\":{"
       << "\"title\":\"" << escape_json(event.title) << "\""
       << ",\"process_name\":\"" << escape_json(event.process_name) << "\""
       << ",\"icon_url\":null"
       << ",\"app_id\":" << string_or_null(event.app_id)
       << ",\"pid\":" << event.pid
       << "}}";
    return ss.str();
}

std::string encode_media_playback(const MediaEvent& event,
                                  const std::optional<std::string>& artwork_url,
                                  int64_t timestamp_ms) {
    std::ostringstream ss;
    ss << "{\"type\":\"media_playback\""
       << ",\"timestamp\":" << timestamp_ms
       << ",\"metadata\":{"
       << "\"bundle_identifier\":\"" << escape_json(event.player) << "\""
       << ",\"title\":\"" << escape_json(event.title) << "\""
       << ",\"artist\":\"" << escape_json(event.artist) << "\""
       << ",\"album\":\"" << escape_json(event.album) << "\""
       << ",\"duration\":" << number(event.duration)
       << ",\"artwork_url\":" << (artwork_url ? string_or_null(*artwork_url) : "null")
       << ",\"content_item_identifier\":\"" << escape_json(event.content_item_identifier) << "\""
       << "},\"playback_state\":{"
       << "\"playing\":" << (event.playing ? "true" : "false")
       << ",\"playback_rate\":" << number(event.playback_rate)
       << ",\"elapsed_time\":" << number(event.elapsed_time)
       << "}}";
    return ss.str();
}

std::string encode_artwork_meta(const std::string& content_item_identifier,
                                const std::string& mime_type,
                                int64_t timestamp_ms) {
    std::ostringstream ss;
    ss << "{\"type\":\"upload_artwork_meta\""
       << ",\"timestamp\":" << timestamp_ms
       << ",\"content_item_identifier\":\"" << escape_json(content_item_identifier) << "\""
       << ",\"mime_type\":\"" << escape_json(mime_type) << "\""
       << "}";
    return ss.str();
}

// ============================================================================
// Inbound parsing
// ============================================================================

namespace {

class Scanner {
public:
    explicit Scanner(const std::string& text) : s_(text) {}

    void skip_ws() {
        while (pos_ < s_.size() &&
               (s_[pos_] == ' ' || s_[pos_] == '\t' || s_[pos_] == '\n' || s_[pos_] == '\r')) {
            ++pos_;
        }
    }

    bool consume(char c) {
        skip_ws();
        if (pos_ < s_.size() && s_[pos_] == c) { ++pos_; return true; }
        return false;
    }

    bool peek(char c) {
        skip_ws();
        return pos_ < s_.size() && s_[pos_] == c;
    }

    bool at_end() {
        skip_ws();
        return pos_ >= s_.size();
    }

    bool read_string(std::string& out) {
        if (!consume('"')) return false;
        out.clear();
        while (pos_ < s_.size()) {
            char c = s_[pos_++];
            if (c == '"') return true;
            if (c != '\\') { out += c; continue; }
            if (pos_ >= s_.size()) return false;
            char e = s_[pos_++];
            switch (e) {
                case '"': out += '"'; break;
                case '\\': out += '\\'; break;
                case '/': out += '/'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case 'u': {
                    uint32_t cp = 0;
                    if (!read_hex4(cp)) return false;
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        uint32_t low = 0;
                        if (pos_ + 1 < s_.size() && s_[pos_] == '\\' && s_[pos_ + 1] == 'u') {
                            pos_ += 2;
                            if (!read_hex4(low)) return false;
                            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                        }
                    }
                    append_utf8(out, cp);
                    break;
                }
                default: return false;
            }
        }
        return false;
    }

    // Skips any JSON value. Nesting is tracked so objects/arrays are skipped whole.
    bool skip_value() {
        skip_ws();
        if (pos_ >= s_.size()) return false;
        char c = s_[pos_];
        if (c == '"') { std::string tmp; return read_string(tmp); }
        if (c == '{' || c == '[') {
            char close = c == '{' ? '}' : ']';
            ++pos_;
            if (consume(close)) return true;
            do {
                if (close == '}') {
                    std::string key;
                    if (!read_string(key) || !consume(':')) return false;
                }
                if (!skip_value()) return false;
            } while (consume(','));
            return consume(close);
        }
        size_t start = pos_;
        while (pos_ < s_.size() && std::string(",}] \t\r\n").find(s_[pos_]) == std::string::npos) {
            ++pos_;
        }
        return pos_ > start;
    }

private:
    bool read_hex4(uint32_t& out) {
        if (pos_ + 4 > s_.size()) return false;
        out = 0;
        for (int i = 0; i < 4; ++i) {
            char h = s_[pos_++];
            out <<= 4;
            if (h >= '0' && h <= '9') out |= static_cast<uint32_t>(h - '0');
            else if (h >= 'a' && h <= 'f') out |= static_cast<uint32_t>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') out |= static_cast<uint32_t>(h - 'A' + 10);
            else return false;
        }
        return true;
    }

    static void append_utf8(std::string& out, uint32_t cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    const std::string& s_;
    size_t pos_ = 0;
};

} // namespace

std::optional<ServerMessage> parse_server_message(const std::string& text) {
    Scanner sc(text);
    if (!sc.consume('{')) return std::nullopt;

    ServerMessage msg;
    if (!sc.consume('}')) {
        do {
            std::string key;
            if (!sc.read_string(key) || !sc.consume(':')) return std::nullopt;
            if (sc.peek('"')) {
                std::string value;
                if (!sc.read_string(value)) return std::nullopt;
                msg.fields[key] = value;
            } else if (!sc.skip_value()) {
                return std::nullopt;
            }
        } while (sc.consume(','));
        if (!sc.consume('}')) return std::nullopt;
    }
    if (!sc.at_end()) return std::nullopt;

    auto it = msg.fields.find("type");
    if (it != msg.fields.end()) msg.type = it->second;
    return msg;
}

} // namespace codec
} // namespace core
