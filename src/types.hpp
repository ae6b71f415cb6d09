#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

using Id_t = uint32_t;
using Time_t = int64_t; // milliseconds since epoch
using Message_t = uint8_t;

using SymbolList = std::vector<std::string>;
using FieldMap = std::map<std::string, std::string>;
using Clock = std::function<Time_t()>;

static constexpr size_t BATCH_HARD_CAP = 200;
static constexpr size_t MIN_ATTEMPTS_BEFORE_TRIP = 10;
static constexpr uint64_t BREAKER_RESCALE_LIMIT = 1'000;
static constexpr double FORCED_CLEANUP_RATIO = 0.1;

enum class ConnectionQuality : uint8_t {POOR, GOOD, EXCELLENT};

enum class RecoveryPriority : uint8_t {LOW, NORMAL, HIGH};

enum class ReconnectAction : uint8_t {NONE, WAIT_FOR_RECOVERY, RESUBSCRIBE};

enum class CacheMode : uint8_t {AUTO, HOT, WARM};

enum class CleanupType : uint8_t {SCHEDULED, FORCED};

template<typename C, typename T>
std::basic_ostream<C, T>& operator<<(std::basic_ostream<C, T>& strm, ConnectionQuality quality) {
    switch (quality) {
        case ConnectionQuality::EXCELLENT: strm << "excellent"; break;
        case ConnectionQuality::GOOD: strm << "good"; break;
        default: strm << "poor"; break;
    }
    return strm;
}

template<typename C, typename T>
std::basic_ostream<C, T>& operator<<(std::basic_ostream<C, T>& strm, RecoveryPriority priority) {
    switch (priority) {
        case RecoveryPriority::HIGH: strm << "high"; break;
        case RecoveryPriority::LOW: strm << "low"; break;
        default: strm << "normal"; break;
    }
    return strm;
}

inline const char* to_string(ReconnectAction action) {
    switch (action) {
        case ReconnectAction::WAIT_FOR_RECOVERY: return "wait_for_recovery";
        case ReconnectAction::RESUBSCRIBE: return "resubscribe";
        default: return "none";
    }
}

template<typename C, typename T>
std::basic_ostream<C, T>& operator<<(std::basic_ostream<C, T>& strm, ReconnectAction action) {
    strm << to_string(action);
    return strm;
}

inline std::string make_connection_key(const std::string& provider, const std::string& capability) {
    return provider + ":" + capability;
}

// One inbound raw update awaiting batch processing.
struct RawQuote {
    FieldMap raw_payload;
    std::string provider;
    std::string capability;
    Time_t timestamp = 0;
    SymbolList symbols;
};

// One record produced by the transform collaborator.
struct QuoteRecord {
    std::string symbol;
    FieldMap fields;
};

struct ClientSubscription {
    std::string client_id;
    SymbolList symbols;
    std::string provider;
    std::string capability;
    Time_t last_active_at = 0;
};

struct RecoveryJob {
    std::string client_id;
    SymbolList symbols;
    Time_t last_receive_timestamp = 0;
    std::string provider;
    std::string capability;
    RecoveryPriority priority = RecoveryPriority::NORMAL;
};
