#include "protocol.hpp"

#include <algorithm>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/endian/conversion.hpp>

#include "error.hpp"

const char* to_string(MessageType type) {
    switch (type) {
        case MessageType::SUBSCRIBE: return "SUBSCRIBE";
        case MessageType::UNSUBSCRIBE: return "UNSUBSCRIBE";
        case MessageType::QUOTE: return "QUOTE";
        case MessageType::HEARTBEAT: return "HEARTBEAT";
    }
    return "UNKNOWN";
}

void write_frame(std::vector<uint8_t>& out, MessageType type, const std::string& payload) {
    if (payload.size() > MAX_PAYLOAD_SIZE) {
        throw ValidationError("payload of " + std::to_string(payload.size()) + " bytes exceeds frame limit");
    }
    const uint16_t size_be = boost::endian::native_to_big(static_cast<uint16_t>(payload.size()));
    const size_t offset = out.size();
    out.resize(offset + MESSAGE_HEADER_SIZE + payload.size());
    uint8_t* data = out.data() + offset;
    data[0] = static_cast<uint8_t>(type);
    std::memcpy(data + 1, &size_be, sizeof(size_be));
    if (!payload.empty()) {
        std::memcpy(data + MESSAGE_HEADER_SIZE, payload.data(), payload.size());
    }
}

size_t read_frames(const uint8_t* data, size_t size, std::vector<Frame>& out) {
    const uint8_t* upto = data;
    size_t available = size;

    while (available >= MESSAGE_HEADER_SIZE) {
        const Message_t message_type = upto[0];
        if (!is_known_message_type(message_type)) {
            throw ValidationError("unknown message type " + std::to_string(static_cast<int>(message_type)));
        }
        uint16_t size_be = 0;
        std::memcpy(&size_be, upto + 1, sizeof(size_be));
        const size_t payload_size = boost::endian::big_to_native(size_be);

        if (available < payload_size + MESSAGE_HEADER_SIZE) {
            break;
        }
        const char* payload_ptr = reinterpret_cast<const char*>(upto + MESSAGE_HEADER_SIZE);
        out.push_back({static_cast<MessageType>(message_type), std::string(payload_ptr, payload_size)});

        upto += payload_size + MESSAGE_HEADER_SIZE;
        available -= payload_size + MESSAGE_HEADER_SIZE;
    }
    return static_cast<size_t>(upto - data);
}

std::string format_fields(const FieldMap& fields) {
    std::string payload;
    for (const auto& [key, value] : fields) {
        if (!payload.empty()) {
            payload += ';';
        }
        payload += key;
        payload += '=';
        payload += value;
    }
    return payload;
}

FieldMap parse_fields(const std::string& payload) {
    FieldMap fields;
    std::vector<std::string> pairs;
    boost::algorithm::split(pairs, payload, boost::algorithm::is_any_of(";"));
    for (auto& pair : pairs) {
        const auto eq = pair.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        std::string key = pair.substr(0, eq);
        boost::algorithm::trim(key);
        fields[key] = pair.substr(eq + 1);
    }
    return fields;
}

std::string make_subscription_payload(const std::string& capability, const SymbolList& symbols) {
    return capability + '\n' + boost::algorithm::join(symbols, ",");
}

std::pair<std::string, SymbolList> parse_subscription_payload(const std::string& payload) {
    const auto newline = payload.find('\n');
    std::string capability = payload.substr(0, newline);
    SymbolList symbols;
    if (newline != std::string::npos && newline + 1 < payload.size()) {
        boost::algorithm::split(symbols, payload.substr(newline + 1), boost::algorithm::is_any_of(","));
        symbols.erase(std::remove(symbols.begin(), symbols.end(), std::string()), symbols.end());
    }
    return {capability, symbols};
}

SymbolList extract_symbols(const FieldMap& data) {
    auto it = data.find("symbol");
    if (it == data.end()) {
        it = data.find("s");
    }
    SymbolList symbols;
    if (it == data.end()) {
        return symbols;
    }
    boost::algorithm::split(symbols, it->second, boost::algorithm::is_any_of(","));
    for (auto& symbol : symbols) {
        boost::algorithm::trim(symbol);
    }
    symbols.erase(std::remove(symbols.begin(), symbols.end(), std::string()), symbols.end());
    return symbols;
}
