#include "connectivity.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <vector>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/system/system_error.hpp>

#include "error.hpp"
#include "logging.hpp"

namespace error = boost::asio::error;

QR_INLINE_GLOBAL_LOGGER_WITH_CHANNEL(LG_FEED, "FEED")

namespace {

// Resolves and connects on a private io_context so the deadline cannot be held
// up by handlers queued on the shared one.
boost::system::error_code connect_with_deadline(
    const std::string& host,
    const std::string& port,
    std::chrono::milliseconds timeout,
    tcp::socket& socket
) {
    boost::asio::io_context io;
    tcp::resolver resolver(io);
    tcp::socket pending(io);
    boost::asio::steady_timer deadline(io, timeout);
    boost::system::error_code result = error::would_block;
    bool timed_out = false;

    deadline.async_wait([&](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        timed_out = true;
        resolver.cancel();
        boost::system::error_code close_ec;
        pending.close(close_ec);
    });
    resolver.async_resolve(host, port, [&](const boost::system::error_code& ec, tcp::resolver::results_type results) {
        if (ec) {
            result = ec;
            deadline.cancel();
            return;
        }
        boost::asio::async_connect(pending, results, [&](const boost::system::error_code& connect_ec, const tcp::endpoint&) {
            result = connect_ec;
            deadline.cancel();
        });
    });
    io.run();

    if (timed_out) {
        return error::timed_out;
    }
    if (result) {
        return result;
    }
    const auto protocol = pending.local_endpoint(result).protocol();
    if (result) {
        return result;
    }
    const auto handle = pending.release(result);
    if (result) {
        return result;
    }
    socket.assign(protocol, handle, result);
    return result;
}

}

std::pair<std::string, std::string> split_endpoint(const std::string& endpoint) {
    const auto colon = endpoint.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == endpoint.size()) {
        throw ValidationError("endpoint '" + endpoint + "' is not host:port");
    }
    return {endpoint.substr(0, colon), endpoint.substr(colon + 1)};
}

FeedConnection::FeedConnection(
    boost::asio::io_context& context,
    tcp::socket&& socket,
    std::string id,
    std::string provider,
    std::string capability,
    Clock clock
)
    : context_(context),
      socket_(std::move(socket)),
      strand_(boost::asio::make_strand(socket_.get_executor())),
      heartbeat_timer_(strand_),
      id_(std::move(id)),
      provider_(std::move(provider)),
      capability_(std::move(capability)),
      clock_(std::move(clock)),
      created_at_(clock_()),
      last_active_at_(created_at_) {}

FeedConnection::~FeedConnection() {
    RLOG(LG_FEED, LogLevel::LL_INFO) << std::quoted(id_, '\'') << " closing";
    boost::system::error_code ec;
    socket_.close(ec);
}

void FeedConnection::start(std::chrono::milliseconds heartbeat_interval) {
    heartbeat_interval_ = heartbeat_interval;
    boost::asio::post(strand_, [self = shared_from_this()] {
        self->async_read_();
        self->arm_heartbeat_();
    });
}

void FeedConnection::set_data_handler(DataHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    data_handler_ = std::move(handler);
}

void FeedConnection::set_error_handler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    error_handler_ = std::move(handler);
}

void FeedConnection::subscribe(const SymbolList& symbols) {
    if (symbols.empty()) {return;}
    boost::asio::post(strand_, [self = shared_from_this(), payload = make_subscription_payload(capability_, symbols)]() mutable {
        self->send_message_(MessageType::SUBSCRIBE, std::move(payload));
    });
}

void FeedConnection::unsubscribe(const SymbolList& symbols) {
    if (symbols.empty()) {return;}
    boost::asio::post(strand_, [self = shared_from_this(), payload = make_subscription_payload(capability_, symbols)]() mutable {
        self->send_message_(MessageType::UNSUBSCRIBE, std::move(payload));
    });
}

void FeedConnection::close() {
    if (!connected_.exchange(false)) {return;}
    boost::asio::post(strand_, [self = shared_from_this()] {
        boost::system::error_code ec;
        self->heartbeat_timer_.cancel();
        self->socket_.shutdown(tcp::socket::shutdown_both, ec);
        self->socket_.close(ec);
        RLOG(LG_FEED, LogLevel::LL_INFO) << std::quoted(self->id_, '\'') << " closed";
    });
}

void FeedConnection::async_read_() {
    auto buf = in_buffer_.prepare(READ_SIZE);
    socket_.async_read_some(buf, boost::asio::bind_executor(strand_,
        [self = shared_from_this()](const boost::system::error_code& error, size_t size) {
            self->read_some_handler_(error, size);
        }
    ));
}

void FeedConnection::read_some_handler_(const boost::system::error_code& error, size_t size) {
    if (error) {
        if (error == error::eof) {
            RLOG(LG_FEED, LogLevel::LL_INFO) << std::quoted(id_, '\'') << " remote disconnect";
            on_disconnect_("remote disconnect");
        } else if (error == error::operation_aborted) {
            RLOG(LG_FEED, LogLevel::LL_DEBUG) << std::quoted(id_, '\'') << " read cancelled";
            connected_ = false;
        } else if (error == error::interrupted || error == error::try_again || error == error::would_block) {
            RLOG(LG_FEED, LogLevel::LL_DEBUG) << std::quoted(id_, '\'') << " read interrupted: " << error.message();
            async_read_();
        } else {
            RLOG(LG_FEED, LogLevel::LL_ERROR) << std::quoted(id_, '\'') << " read error: " << error.message();
            on_disconnect_("read error: " + error.message());
        }
        return;
    }

    RLOG(LG_FEED, LogLevel::LL_DEBUG) << std::quoted(id_, '\'') << " received " << size << " bytes";
    in_buffer_.commit(size);

    // streambuf keeps its readable bytes contiguous
    auto bufs = in_buffer_.data();
    const uint8_t* begin = static_cast<const uint8_t*>(bufs.data());

    std::vector<Frame> frames;
    size_t consumed = 0;
    try {
        consumed = read_frames(begin, in_buffer_.size(), frames);
    } catch (const QRError& e) {
        RLOG(LG_FEED, LogLevel::LL_ERROR) << std::quoted(id_, '\'') << " protocol error: " << e.what();
        on_disconnect_(e.what());
        return;
    }
    in_buffer_.consume(consumed);

    for (const auto& frame : frames) {
        on_frame_(frame);
    }
    async_read_();
}

void FeedConnection::on_frame_(const Frame& frame) {
    last_active_at_ = clock_();
    switch (frame.type) {
        case MessageType::QUOTE: {
            const FieldMap fields = parse_fields(frame.payload);
            DataHandler handler;
            {
                std::lock_guard<std::mutex> lock(handler_mutex_);
                handler = data_handler_;
            }
            if (handler) {
                handler(fields);
            }
            break;
        }
        case MessageType::HEARTBEAT:
            RLOG(LG_FEED, LogLevel::LL_DEBUG) << std::quoted(id_, '\'') << " heartbeat";
            break;
        default:
            RLOG(LG_FEED, LogLevel::LL_WARNING)
                << std::quoted(id_, '\'') << " unexpected " << to_string(frame.type) << " from upstream";
            break;
    }
}

void FeedConnection::send_message_(MessageType type, std::string payload) {
    if (!connected_) {
        RLOG(LG_FEED, LogLevel::LL_DEBUG) << std::quoted(id_, '\'') << " dropping " << to_string(type) << " after close";
        return;
    }
    std::vector<uint8_t> frame;
    write_frame(frame, type, payload);
    auto buf = out_buffer_.prepare(frame.size());
    std::memcpy(buf.data(), frame.data(), frame.size());
    out_buffer_.commit(frame.size());
    if (!is_sending_) {
        send_();
    }
}

void FeedConnection::send_() {
    is_sending_ = true;
    socket_.async_write_some(out_buffer_.data(), boost::asio::bind_executor(strand_,
        [self = shared_from_this()](const boost::system::error_code& error, size_t size) {
            self->write_some_handler_(error, size);
        }
    ));
}

void FeedConnection::write_some_handler_(const boost::system::error_code& error, size_t size) {
    if (error) {
        if (error != error::interrupted && error != error::would_block && error != error::try_again) {
            RLOG(LG_FEED, LogLevel::LL_ERROR) << std::quoted(id_, '\'') << " send failed: " << error.message();
            is_sending_ = false;
            on_disconnect_("send failed: " + error.message());
            return;
        }
        RLOG(LG_FEED, LogLevel::LL_DEBUG) << std::quoted(id_, '\'') << " send interrupted: " << error.message();
    } else {
        RLOG(LG_FEED, LogLevel::LL_DEBUG) << std::quoted(id_, '\'') << " sent " << size << " bytes";
        out_buffer_.consume(size);
    }

    if (out_buffer_.size() > 0) {
        send_();
    } else {
        is_sending_ = false;
    }
}

void FeedConnection::arm_heartbeat_() {
    if (!connected_ || heartbeat_interval_.count() <= 0) {return;}
    heartbeat_timer_.expires_after(heartbeat_interval_);
    heartbeat_timer_.async_wait(boost::asio::bind_executor(strand_,
        [self = shared_from_this()](const boost::system::error_code& ec) {
            if (ec) {return;}
            self->send_message_(MessageType::HEARTBEAT, "");
            self->arm_heartbeat_();
        }
    ));
}

void FeedConnection::on_disconnect_(const std::string& reason) {
    if (!connected_.exchange(false)) {return;}
    heartbeat_timer_.cancel();
    boost::system::error_code ec;
    socket_.close(ec);

    ErrorHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = error_handler_;
    }
    if (handler) {
        handler(reason);
    }
}

TcpStreamFetcher::TcpStreamFetcher(boost::asio::io_context& context, std::map<std::string, std::string> endpoints, Clock clock)
    : context_(context), endpoints_(std::move(endpoints)), clock_(std::move(clock)) {}

std::shared_ptr<StreamConnection> TcpStreamFetcher::establish_stream_connection(
    const std::string& provider,
    const std::string& capability,
    const ConnectionOptions& options
) {
    auto it = endpoints_.find(provider);
    if (it == endpoints_.end()) {
        throw CollaboratorUnavailableError("no endpoint configured for provider " + provider);
    }
    const auto [host, port] = split_endpoint(it->second);

    const uint32_t attempts = std::max<uint32_t>(1, options.auto_reconnect ? options.max_reconnect_attempts : 1);
    boost::system::error_code last_error;

    for (uint32_t attempt = 1; attempt <= attempts; ++attempt) {
        tcp::socket socket(context_);
        const boost::system::error_code ec = connect_with_deadline(host, port, options.connection_timeout, socket);
        if (!ec) {
            const std::string id = provider + "-" + capability + "-" + std::to_string(next_connection_id_++);
            auto connection = std::make_shared<FeedConnection>(
                context_, std::move(socket), id, provider, capability, clock_
            );
            connection->start(options.heartbeat_interval);
            RLOG(LG_FEED, LogLevel::LL_INFO)
                << std::quoted(id, '\'') << " connected to " << it->second << " on attempt " << attempt;
            return connection;
        }
        last_error = ec;
        RLOG(LG_FEED, LogLevel::LL_WARNING)
            << "connect to " << provider << " at " << it->second << " failed (" << attempt << "/" << attempts << "): "
            << ec.message();
    }
    throw CollaboratorUnavailableError("cannot reach " + provider + " at " + it->second + ": " + last_error.message());
}
