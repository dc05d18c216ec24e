// =============================================================================
// FILE: src/transport/relay_line_parser.cpp
// =============================================================================
#include "transport/relay_line_parser.h"
#include "common/logger.h"
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace device_watch {

namespace {

// Splits off the next space-delimited field starting at `pos`
std::string next_field(const std::string& line, size_t& pos) {
    while (pos < line.size() && line[pos] == ' ') ++pos;
    size_t start = pos;
    while (pos < line.size() && line[pos] != ' ') ++pos;
    return line.substr(start, pos - start);
}

// Remainder after a single separating space, verbatim
std::string rest_of_line(const std::string& line, size_t pos) {
    if (pos < line.size() && line[pos] == ' ') ++pos;
    return pos < line.size() ? line.substr(pos) : std::string();
}

bool parse_request_id(const std::string& s, uint64_t& out) {
    if (s.empty()) return false;
    for (char c : s) if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    errno = 0;
    char* end = nullptr;
    unsigned long long v = std::strtoull(s.c_str(), &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0') return false;
    out = static_cast<uint64_t>(v);
    return true;
}

} // namespace

RelayLineParser::RelayLineParser() { buffer_.reserve(4096); }
RelayLineParser::~RelayLineParser() = default;
void RelayLineParser::reset() { buffer_.clear(); }

bool RelayLineParser::is_wire_safe(const std::string& token, bool allow_comma) {
    if (token.empty()) return false;
    for (char c : token) {
        if (std::isspace(static_cast<unsigned char>(c))) return false;
        if (!allow_comma && c == ',') return false;
    }
    return true;
}

std::string RelayLineParser::encode_subscribe(uint64_t request_id, const DeviceId& device_id,
                                              const NameList& names) {
    return "SUB " + std::to_string(request_id) + " " + device_id + " " + join_names(names) + "\n";
}

std::string RelayLineParser::encode_unsubscribe(uint64_t request_id, const DeviceId& device_id,
                                                const NameList& names,
                                                const std::string& subscription_id) {
    return "UNSUB " + std::to_string(request_id) + " " + device_id + " " +
           join_names(names) + " " + subscription_id + "\n";
}

std::string RelayLineParser::encode_ping() { return "PING\n"; }

bool RelayLineParser::parse_line(const std::string& line, RelayFrame& frame) {
    size_t pos = 0;
    std::string verb = next_field(line, pos);

    if (verb == "PONG") {
        frame.type = RelayFrameType::kPong;
        return true;
    }

    if (verb == "OK" || verb == "ERR") {
        frame.type = (verb == "OK") ? RelayFrameType::kOk : RelayFrameType::kErr;
        if (!parse_request_id(next_field(line, pos), frame.request_id)) return false;
        if (frame.type == RelayFrameType::kOk) {
            frame.value = next_field(line, pos);
        } else {
            frame.value = rest_of_line(line, pos);
        }
        return true;
    }

    if (verb == "MSG") {
        frame.type = RelayFrameType::kMsg;
        std::string device = next_field(line, pos);
        std::string name = next_field(line, pos);
        if (device.empty() || name.empty()) return false;

        DeviceMessage& m = frame.message;
        m.id = DeviceMessage::next_id();
        m.received_at = Clock::now();
        m.device_id = device;
        m.values.emplace(name, rest_of_line(line, pos));
        m.is_valid = true;
        return true;
    }

    return false;
}

RelayLineParser::ParseResult RelayLineParser::feed(const char* data, size_t len) {
    ParseResult result;
    if (!data || len == 0) return result;

    buffer_.append(data, len);
    result.bytes_consumed = len;

    size_t start = 0;
    while (true) {
        auto nl = buffer_.find('\n', start);
        if (nl == std::string::npos) break;

        std::string line = buffer_.substr(start, nl - start);
        start = nl + 1;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        RelayFrame frame;
        if (!parse_line(line, frame)) {
            total_errors_++;
            result.malformed_lines++;
            LOG_WARN("RelayParser: malformed line skipped: %.80s", line.c_str());
            continue;
        }
        if (frame.type == RelayFrameType::kPong) result.received_heartbeat = true;
        total_parsed_++;
        result.frames.push_back(std::move(frame));
    }

    if (start > 0) buffer_.erase(0, start);

    if (buffer_.size() > max_line_size_) {
        LOG_ERROR("RelayParser: unterminated line exceeds %zu bytes, resetting", max_line_size_);
        buffer_.clear();
        result.error = "Line too long";
        total_errors_++;
    }
    return result;
}

} // namespace device_watch
