#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "application.hpp"
#include "config.hpp"
#include "error.hpp"
#include "logging.hpp"

// quote_relay [io_threads] [log_file] [capability] [symbol...]
// Symbols given on the command line are subscribed for a local "console" client
// whose quotes are printed to stdout.
int main(int argc, char* argv[]) {
    try {
        const char* level = std::getenv("QR_LOG_LEVEL");
        std::size_t io_threads = 2;

        auto now = std::chrono::system_clock::now();
        std::time_t t = std::chrono::system_clock::to_time_t(now);
        std::tm tm{};
        localtime_r(&t, &tm);

        std::ostringstream oss;
        oss << "logs/quote_relay_" << std::put_time(&tm, "%Y-%m-%d_%H%M") << ".log";
        std::string log_file = oss.str();

        if (argc > 1) {
            int n = std::atoi(argv[1]);
            if (n > 0) {
                io_threads = static_cast<std::size_t>(n);
            } else {
                std::cerr << "Invalid thread count, using default: " << io_threads << "\n";
            }
        }
        if (argc > 2) {
            log_file = argv[2];
        }
        std::string capability = "ws-stock-quote";
        if (argc > 3) {
            capability = argv[3];
        }
        std::vector<std::string> symbols;
        for (int i = 4; i < argc; ++i) {
            symbols.emplace_back(argv[i]);
        }

        init_logging(parse_log_level(level ? level : "INFO"), log_file);

        const RelayConfig config = load_config_from_env();

        Application app(config, io_threads, [](const std::string& client_id, const BroadcastPayload& payload) {
            for (const auto& record : payload.records) {
                std::ostringstream line;
                line << client_id << " " << record.symbol;
                for (const auto& [key, value] : record.fields) {
                    line << " " << key << "=" << value;
                }
                std::cout << line.str() << "\n";
            }
        });
        app.start();

        if (!symbols.empty()) {
            try {
                app.receiver().subscribe(symbols, capability, std::nullopt, "console");
            } catch (const QRError& e) {
                std::cerr << "Subscribe failed [" << e.code() << "]: " << e.what() << "\n";
            }
        }

        app.wait();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << "\n";
        return 1;
    }
}
