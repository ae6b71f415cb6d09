#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "types.hpp"

// One live upstream feed for a (provider, capability) pair.
struct StreamConnection {
    using DataHandler = std::function<void(const FieldMap&)>;
    using ErrorHandler = std::function<void(const std::string&)>;

    virtual ~StreamConnection() = default;

    virtual const std::string& id() const = 0;
    virtual const std::string& provider() const = 0;
    virtual const std::string& capability() const = 0;
    virtual bool is_connected() const = 0;
    virtual Time_t created_at() const = 0;
    virtual Time_t last_active_at() const = 0;

    virtual void subscribe(const SymbolList& symbols) = 0;
    virtual void unsubscribe(const SymbolList& symbols) = 0;
    virtual void close() = 0;

    virtual void set_data_handler(DataHandler handler) = 0;
    virtual void set_error_handler(ErrorHandler handler) = 0;
};

struct ConnectionOptions {
    uint32_t max_reconnect_attempts = 3;
    std::chrono::milliseconds connection_timeout{30'000};
    std::chrono::milliseconds heartbeat_interval{30'000};
    bool auto_reconnect = true;
};

// Opens upstream connections. Establishing may block until the venue answers.
struct StreamFetcher {
    virtual ~StreamFetcher() = default;
    virtual std::shared_ptr<StreamConnection> establish_stream_connection(
        const std::string& provider,
        const std::string& capability,
        const ConnectionOptions& options
    ) = 0;
};
