#pragma once
#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include "types.hpp"

// Upstream feed wire format: type (u8) | payload size (u16, big endian) | payload.
enum class MessageType : Message_t {
    SUBSCRIBE = 1,
    UNSUBSCRIBE = 2,
    QUOTE = 3,
    HEARTBEAT = 4
};

constexpr size_t MESSAGE_HEADER_SIZE = 1 + 2;
constexpr size_t MAX_PAYLOAD_SIZE = 0xFFFF;

inline bool is_known_message_type(Message_t type) {
    return type >= static_cast<Message_t>(MessageType::SUBSCRIBE) && type <= static_cast<Message_t>(MessageType::HEARTBEAT);
}

const char* to_string(MessageType type);

struct Frame {
    MessageType type;
    std::string payload;
};

// Appends one encoded frame to out. Throws ValidationError when the payload does not fit.
void write_frame(std::vector<uint8_t>& out, MessageType type, const std::string& payload);

// Decodes every complete frame at the front of data into out and returns the
// number of bytes consumed. Throws ValidationError on an unknown message type.
size_t read_frames(const uint8_t* data, size_t size, std::vector<Frame>& out);

// Quote payloads are "key=value;key=value".
std::string format_fields(const FieldMap& fields);
FieldMap parse_fields(const std::string& payload);

// Symbols named by an update, from its "symbol" or "s" field.
SymbolList extract_symbols(const FieldMap& data);

// Subscribe and unsubscribe payloads are "capability\nSYM1,SYM2".
std::string make_subscription_payload(const std::string& capability, const SymbolList& symbols);
std::pair<std::string, SymbolList> parse_subscription_payload(const std::string& payload);
