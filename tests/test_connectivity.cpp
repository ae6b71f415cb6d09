#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

#include "connectivity.hpp"
#include "error.hpp"
#include "fakes.hpp"

namespace {

Frame read_one_frame(tcp::socket& socket) {
    std::vector<uint8_t> header(MESSAGE_HEADER_SIZE);
    boost::asio::read(socket, boost::asio::buffer(header));
    const size_t payload_size = (static_cast<size_t>(header[1]) << 8) | header[2];
    std::vector<uint8_t> wire = header;
    wire.resize(MESSAGE_HEADER_SIZE + payload_size);
    if (payload_size > 0) {
        boost::asio::read(socket, boost::asio::buffer(wire.data() + MESSAGE_HEADER_SIZE, payload_size));
    }
    std::vector<Frame> frames;
    read_frames(wire.data(), wire.size(), frames);
    return frames.at(0);
}

}

class FeedConnectionTest : public ::testing::Test {
    protected:
        void SetUp() override {
            acceptor_.open(tcp::v4());
            acceptor_.bind(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
            acceptor_.listen();
            endpoint_ = "127.0.0.1:" + std::to_string(acceptor_.local_endpoint().port());
        }

        void TearDown() override {
            io_context_.stop();
            if (io_thread_.joinable()) {
                io_thread_.join();
            }
        }

        std::shared_ptr<StreamConnection> connect() {
            TcpStreamFetcher fetcher(io_context_, {{"longport", endpoint_}}, clock_.clock());
            ConnectionOptions options;
            options.heartbeat_interval = std::chrono::milliseconds(0);
            auto connection = fetcher.establish_stream_connection("longport", "ws-stock-quote", options);
            acceptor_.accept(server_);
            io_thread_ = std::thread([this] {
                auto guard = boost::asio::make_work_guard(io_context_);
                io_context_.run();
            });
            return connection;
        }

        boost::asio::io_context io_context_;
        boost::asio::io_context server_context_;
        tcp::acceptor acceptor_{server_context_};
        tcp::socket server_{server_context_};
        std::string endpoint_;
        std::thread io_thread_;
        ManualClock clock_;
};

TEST_F(FeedConnectionTest, QuoteFramesReachDataHandler) {
    auto connection = connect();
    EXPECT_TRUE(connection->is_connected());
    EXPECT_EQ(connection->provider(), "longport");
    EXPECT_EQ(connection->id(), "longport-ws-stock-quote-0");

    std::promise<FieldMap> received;
    auto future = received.get_future();
    connection->set_data_handler([&received](const FieldMap& data) {
        received.set_value(data);
    });

    std::vector<uint8_t> wire;
    write_frame(wire, MessageType::HEARTBEAT, "");
    write_frame(wire, MessageType::QUOTE, format_fields({{"symbol", "0700"}, {"last", "312.4"}}));
    boost::asio::write(server_, boost::asio::buffer(wire));

    ASSERT_EQ(future.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    const FieldMap data = future.get();
    EXPECT_EQ(data.at("symbol"), "0700");
    EXPECT_EQ(data.at("last"), "312.4");
    connection->close();
}

TEST_F(FeedConnectionTest, SubscribeIsSentUpstream) {
    auto connection = connect();
    connection->subscribe({"0700", "0005"});
    connection->unsubscribe({"0005"});

    const Frame subscribe = read_one_frame(server_);
    EXPECT_EQ(subscribe.type, MessageType::SUBSCRIBE);
    const auto [capability, symbols] = parse_subscription_payload(subscribe.payload);
    EXPECT_EQ(capability, "ws-stock-quote");
    EXPECT_EQ(symbols, (SymbolList{"0700", "0005"}));

    const Frame unsubscribe = read_one_frame(server_);
    EXPECT_EQ(unsubscribe.type, MessageType::UNSUBSCRIBE);
    EXPECT_EQ(parse_subscription_payload(unsubscribe.payload).second, (SymbolList{"0005"}));
    connection->close();
}

TEST_F(FeedConnectionTest, RemoteCloseReportsError) {
    auto connection = connect();
    std::promise<std::string> failed;
    auto future = failed.get_future();
    connection->set_error_handler([&failed](const std::string& message) {
        failed.set_value(message);
    });

    server_.close();
    ASSERT_EQ(future.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(future.get(), "remote disconnect");
    EXPECT_FALSE(connection->is_connected());
}

TEST_F(FeedConnectionTest, GarbageFromUpstreamDropsConnection) {
    auto connection = connect();
    std::promise<void> failed;
    auto future = failed.get_future();
    connection->set_error_handler([&failed](const std::string&) {
        failed.set_value();
    });

    const std::vector<uint8_t> garbage{0x7f, 0x00, 0x00};
    boost::asio::write(server_, boost::asio::buffer(garbage));
    ASSERT_EQ(future.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_FALSE(connection->is_connected());
}

TEST(TcpStreamFetcherTest, UnknownProviderIsUnavailable) {
    boost::asio::io_context context;
    ManualClock clock;
    TcpStreamFetcher fetcher(context, {{"longport", "127.0.0.1:17000"}}, clock.clock());
    EXPECT_THROW(fetcher.establish_stream_connection("itick", "ws-stock-quote", {}), CollaboratorUnavailableError);
}

TEST(TcpStreamFetcherTest, EndpointNeedsHostAndPort) {
    EXPECT_EQ(split_endpoint("feed.local:17000"), std::make_pair(std::string("feed.local"), std::string("17000")));
    EXPECT_THROW(split_endpoint("feed.local"), ValidationError);
    EXPECT_THROW(split_endpoint(":17000"), ValidationError);
    EXPECT_THROW(split_endpoint("feed.local:"), ValidationError);
}

TEST(TcpStreamFetcherTest, UnreachableEndpointFailsWithinConnectTimeout) {
    boost::asio::io_context context;
    ManualClock clock;
    // non routable: the connect either hangs until the deadline or is refused at once
    TcpStreamFetcher fetcher(context, {{"longport", "10.255.255.1:17000"}}, clock.clock());
    ConnectionOptions options;
    options.connection_timeout = std::chrono::milliseconds(200);
    options.auto_reconnect = false;

    const auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(fetcher.establish_stream_connection("longport", "ws-stock-quote", options), CollaboratorUnavailableError);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(2));
}
