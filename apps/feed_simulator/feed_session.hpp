#pragma once
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <boost/asio.hpp>

#include "logging.hpp"
#include "pcg32.hpp"
#include "protocol.hpp"
#include "time.hpp"

using boost::asio::ip::tcp;

QR_INLINE_GLOBAL_LOGGER_WITH_CHANNEL(LG_SIM, "SIM")

// One downstream relay connection. Holds a random-walk price per subscribed
// symbol and pushes a QUOTE frame for each of them every tick.
// Runs on a single threaded io_context.
class FeedSession : public std::enable_shared_from_this<FeedSession> {
    public:
        FeedSession(tcp::socket&& socket, std::chrono::milliseconds tick, uint64_t seed)
            : socket_(std::move(socket)), tick_timer_(socket_.get_executor()), tick_(tick), rng_(seed, 0) {}

        void start() {
            boost::system::error_code ec;
            const auto remote = socket_.remote_endpoint(ec);
            name_ = ec ? std::string("relay") : remote.address().to_string() + ":" + std::to_string(remote.port());
            RLOG(LG_SIM, LogLevel::LL_INFO) << std::quoted(name_, '\'') << " connected";
            async_read_();
            arm_tick_();
        }

    private:
        struct Instrument {
            double price = 100.0;
            uint64_t volume = 0;
        };

        void async_read_() {
            auto buf = in_buffer_.prepare(65535);
            socket_.async_read_some(buf, [self = shared_from_this()](const boost::system::error_code& error, size_t size) {
                self->read_some_handler_(error, size);
            });
        }

        void read_some_handler_(const boost::system::error_code& error, size_t size) {
            if (error) {
                RLOG(LG_SIM, LogLevel::LL_INFO) << std::quoted(name_, '\'') << " disconnected: " << error.message();
                close_();
                return;
            }
            in_buffer_.commit(size);
            std::vector<Frame> frames;
            try {
                const auto* data = static_cast<const uint8_t*>(in_buffer_.data().data());
                in_buffer_.consume(read_frames(data, in_buffer_.size(), frames));
            } catch (const std::exception& e) {
                RLOG(LG_SIM, LogLevel::LL_ERROR) << std::quoted(name_, '\'') << " protocol error: " << e.what();
                close_();
                return;
            }
            for (const auto& frame : frames) {
                on_frame_(frame);
            }
            async_read_();
        }

        void on_frame_(const Frame& frame) {
            switch (frame.type) {
                case MessageType::SUBSCRIBE: {
                    const auto [capability, symbols] = parse_subscription_payload(frame.payload);
                    for (const auto& symbol : symbols) {
                        if (instruments_.count(symbol) == 0) {
                            instruments_[symbol].price = 10.0 + 490.0 * rng_.uniform();
                        }
                    }
                    RLOG(LG_SIM, LogLevel::LL_INFO)
                        << std::quoted(name_, '\'') << " subscribed " << symbols.size() << " symbols for " << capability;
                    break;
                }
                case MessageType::UNSUBSCRIBE: {
                    const auto [capability, symbols] = parse_subscription_payload(frame.payload);
                    for (const auto& symbol : symbols) {
                        instruments_.erase(symbol);
                    }
                    RLOG(LG_SIM, LogLevel::LL_INFO)
                        << std::quoted(name_, '\'') << " unsubscribed " << symbols.size() << " symbols for " << capability;
                    break;
                }
                case MessageType::HEARTBEAT:
                    send_(MessageType::HEARTBEAT, "");
                    break;
                default:
                    RLOG(LG_SIM, LogLevel::LL_WARNING) << std::quoted(name_, '\'') << " unexpected " << to_string(frame.type);
                    break;
            }
        }

        void arm_tick_() {
            tick_timer_.expires_after(tick_);
            tick_timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
                if (ec || !self->socket_.is_open()) {return;}
                self->publish_();
                self->arm_tick_();
            });
        }

        void publish_() {
            const Time_t now = utc_now_ms();
            for (auto& [symbol, instrument] : instruments_) {
                instrument.price = std::max(0.01, instrument.price * (1.0 + 0.001 * rng_.standard_normal()));
                instrument.volume += 100 * (1 + rng_.next_uint() % 50);

                std::ostringstream price;
                price << std::fixed << std::setprecision(3) << instrument.price;
                send_(MessageType::QUOTE, format_fields({
                    {"symbol", symbol},
                    {"last", price.str()},
                    {"volume", std::to_string(instrument.volume)},
                    {"timestamp", std::to_string(now)}
                }));
            }
        }

        void send_(MessageType type, const std::string& payload) {
            std::vector<uint8_t> frame;
            write_frame(frame, type, payload);
            auto buf = out_buffer_.prepare(frame.size());
            std::memcpy(buf.data(), frame.data(), frame.size());
            out_buffer_.commit(frame.size());
            if (!is_sending_) {
                write_();
            }
        }

        void write_() {
            is_sending_ = true;
            socket_.async_write_some(out_buffer_.data(), [self = shared_from_this()](const boost::system::error_code& error, size_t size) {
                if (error) {
                    RLOG(LG_SIM, LogLevel::LL_ERROR) << std::quoted(self->name_, '\'') << " send failed: " << error.message();
                    self->is_sending_ = false;
                    self->close_();
                    return;
                }
                self->out_buffer_.consume(size);
                if (self->out_buffer_.size() > 0) {
                    self->write_();
                } else {
                    self->is_sending_ = false;
                }
            });
        }

        void close_() {
            boost::system::error_code ec;
            tick_timer_.cancel();
            socket_.close(ec);
        }

        tcp::socket socket_;
        boost::asio::steady_timer tick_timer_;
        std::chrono::milliseconds tick_;
        pcg32 rng_;
        std::string name_;

        std::map<std::string, Instrument> instruments_;
        boost::asio::streambuf in_buffer_;
        boost::asio::streambuf out_buffer_;
        bool is_sending_ = false;
};
