#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/strand.hpp>
#include <boost/system/error_code.hpp>

#include "protocol.hpp"
#include "stream_connection.hpp"
#include "types.hpp"

using boost::asio::ip::tcp;

// Upstream feed session over TCP. All socket work runs on the connection's strand;
// the public methods may be called from any thread.
class FeedConnection : public StreamConnection, public std::enable_shared_from_this<FeedConnection> {
    public:
        FeedConnection(
            boost::asio::io_context& context,
            tcp::socket&& socket,
            std::string id,
            std::string provider,
            std::string capability,
            Clock clock
        );

        ~FeedConnection() override;

        void start(std::chrono::milliseconds heartbeat_interval);

        const std::string& id() const override {return id_;}
        const std::string& provider() const override {return provider_;}
        const std::string& capability() const override {return capability_;}
        bool is_connected() const override {return connected_.load();}
        Time_t created_at() const override {return created_at_;}
        Time_t last_active_at() const override {return last_active_at_.load();}

        void subscribe(const SymbolList& symbols) override;
        void unsubscribe(const SymbolList& symbols) override;
        void close() override;

        void set_data_handler(DataHandler handler) override;
        void set_error_handler(ErrorHandler handler) override;

    private:
        // strand only
        void async_read_();
        void read_some_handler_(const boost::system::error_code& error, size_t size);
        void on_frame_(const Frame& frame);
        void send_message_(MessageType type, std::string payload);
        void send_();
        void write_some_handler_(const boost::system::error_code& error, size_t size);
        void arm_heartbeat_();
        void on_disconnect_(const std::string& reason);

        static constexpr size_t READ_SIZE = 65535;

        boost::asio::io_context& context_;
        tcp::socket socket_;
        boost::asio::strand<boost::asio::any_io_executor> strand_;
        boost::asio::steady_timer heartbeat_timer_;
        std::chrono::milliseconds heartbeat_interval_{30'000};

        const std::string id_;
        const std::string provider_;
        const std::string capability_;
        Clock clock_;
        const Time_t created_at_;

        std::atomic<bool> connected_{true};
        std::atomic<Time_t> last_active_at_;

        boost::asio::streambuf in_buffer_;
        boost::asio::streambuf out_buffer_;
        bool is_sending_ = false;

        std::mutex handler_mutex_;
        DataHandler data_handler_;
        ErrorHandler error_handler_;
};

// Opens FeedConnections to the endpoint configured for each provider.
class TcpStreamFetcher : public StreamFetcher {
    public:
        TcpStreamFetcher(boost::asio::io_context& context, std::map<std::string, std::string> endpoints, Clock clock);

        std::shared_ptr<StreamConnection> establish_stream_connection(
            const std::string& provider,
            const std::string& capability,
            const ConnectionOptions& options
        ) override;

    private:
        boost::asio::io_context& context_;
        const std::map<std::string, std::string> endpoints_;
        Clock clock_;
        std::atomic<Id_t> next_connection_id_{0};
};

// Splits "host:port"; throws ValidationError when the port is missing.
std::pair<std::string, std::string> split_endpoint(const std::string& endpoint);
