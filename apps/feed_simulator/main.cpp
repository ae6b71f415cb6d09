#include "feed_session.hpp"

#include <cstdlib>
#include <functional>
#include <iostream>

#include "logging.hpp"

// feed_simulator [port] [tick_ms]
// Serves the upstream feed protocol so the relay can run without a real venue.
int main(int argc, char* argv[]) {
    try {
        uint16_t port = 17000;
        std::chrono::milliseconds tick{200};

        if (argc > 1) {
            int p = std::atoi(argv[1]);
            if (p > 0 && p <= 65535) {
                port = static_cast<uint16_t>(p);
            } else {
                std::cerr << "Invalid port number, using default: " << port << "\n";
            }
        }
        if (argc > 2) {
            int t = std::atoi(argv[2]);
            if (t > 0) {
                tick = std::chrono::milliseconds(t);
            } else {
                std::cerr << "Invalid tick, using default: " << tick.count() << "ms\n";
            }
        }

        init_logging(LogLevel::LL_INFO);

        boost::asio::io_context io_context;
        tcp::acceptor acceptor(io_context, tcp::endpoint(tcp::v4(), port));
        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code&, int) {
            io_context.stop();
        });

        uint64_t next_seed = 1;
        std::function<void()> accept = [&]() {
            acceptor.async_accept([&](const boost::system::error_code& ec, tcp::socket socket) {
                if (ec) {
                    RLOG(LG_SIM, LogLevel::LL_ERROR) << "accept failed: " << ec.message();
                    return;
                }
                std::make_shared<FeedSession>(std::move(socket), tick, next_seed++)->start();
                accept();
            });
        };
        accept();

        RLOG(LG_SIM, LogLevel::LL_INFO) << "feed simulator listening on port " << port << ", tick " << tick.count() << "ms";
        io_context.run();
    }
    catch (const std::exception& e) {
        std::cerr << "Simulator error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
