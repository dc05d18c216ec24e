// =============================================================================
// FILE: include/transport/relay_line_parser.h
// =============================================================================
#ifndef RELAY_LINE_PARSER_H
#define RELAY_LINE_PARSER_H

#include "common/types.h"
#include "router/device_message.h"
#include <string>
#include <vector>

namespace device_watch {

enum class RelayFrameType { kOk, kErr, kMsg, kPong };

inline const char* frame_type_to_string(RelayFrameType t) {
    switch (t) {
        case RelayFrameType::kOk:   return "OK";
        case RelayFrameType::kErr:  return "ERR";
        case RelayFrameType::kMsg:  return "MSG";
        case RelayFrameType::kPong: return "PONG";
        default:                    return "?";
    }
}

// One inbound line from the relay.
//   OK <req> [<sub_id>]           request_id, value = sub_id (may be empty)
//   ERR <req> <payload...>        request_id, value = payload
//   MSG <device> <name> <value>   message
//   PONG
struct RelayFrame {
    RelayFrameType type = RelayFrameType::kPong;
    uint64_t       request_id = 0;
    std::string    value;
    DeviceMessage  message;
};

// Incremental parser for the newline-framed relay protocol. Partial lines
// stay buffered until their terminator arrives; malformed lines are counted
// and skipped.
class RelayLineParser {
public:
    RelayLineParser();
    ~RelayLineParser();

    struct ParseResult {
        std::vector<RelayFrame> frames;
        bool received_heartbeat = false;
        size_t bytes_consumed   = 0;
        size_t malformed_lines  = 0;
        std::string error;
    };

    ParseResult feed(const char* data, size_t len);
    void reset();

    size_t buffered_bytes() const { return buffer_.size(); }
    uint64_t total_frames_parsed() const { return total_parsed_; }
    uint64_t total_parse_errors()  const { return total_errors_; }

    // Outbound request lines, newline included
    static std::string encode_subscribe(uint64_t request_id, const DeviceId& device_id,
                                        const NameList& names);
    static std::string encode_unsubscribe(uint64_t request_id, const DeviceId& device_id,
                                          const NameList& names, const std::string& subscription_id);
    static std::string encode_ping();

    // True if `token` can travel as a single protocol field
    static bool is_wire_safe(const std::string& token, bool allow_comma = false);

    RelayLineParser(const RelayLineParser&) = delete;
    RelayLineParser& operator=(const RelayLineParser&) = delete;

private:
    bool parse_line(const std::string& line, RelayFrame& frame);

    std::string buffer_;
    size_t max_line_size_ = 1048576;
    uint64_t total_parsed_ = 0;
    uint64_t total_errors_ = 0;
};

} // namespace device_watch
#endif // RELAY_LINE_PARSER_H
