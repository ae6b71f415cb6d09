#include "application.hpp"

#include <algorithm>

#include "connectivity.hpp"
#include "logging.hpp"
#include "time.hpp"

QR_INLINE_GLOBAL_LOGGER_WITH_CHANNEL(LG_APP, "APP")

Application::Application(const RelayConfig& config, size_t num_threads, LocalClientRegistry::Delivery delivery)
    : config_(config),
    io_context_(),
    cleanup_timer_(io_context_),
    memory_timer_(io_context_),
    detection_timer_(io_context_),
    num_threads_(std::max<size_t>(1, num_threads)),
    signals_(io_context_, SIGINT, SIGTERM) {
    work_guard_.emplace(io_context_.get_executor());

    const Clock clock = system_clock();
    metrics_ = std::make_shared<LoggingMetricsSink>();
    registry_ = std::make_shared<LocalClientRegistry>(clock, std::move(delivery));
    auto symbol_mapper = std::make_shared<SuffixSymbolMapper>();

    connections_ = std::make_shared<ConnectionManager>(
        config_,
        std::make_shared<TcpStreamFetcher>(io_context_, config_.provider_endpoints, clock),
        std::make_shared<FixedWindowRateLimiter>(clock),
        metrics_,
        clock
    );
    auto pipeline = std::make_shared<DataPipeline>(
        config_,
        std::make_shared<PassthroughTransformer>(),
        symbol_mapper,
        std::make_shared<InMemoryQuoteCache>(),
        registry_,
        metrics_,
        clock
    );
    batches_ = std::make_shared<BatchPipeline>(io_context_, config_, pipeline, metrics_, clock);
    recovery_ = std::make_shared<RecoveryCoordinator>(
        config_, connections_, symbol_mapper, registry_, std::make_shared<LocalRecoveryWorker>(), metrics_, clock
    );
    receiver_ = std::make_unique<StreamReceiver>(config_, connections_, batches_, recovery_, symbol_mapper, registry_, clock);

    threads_.reserve(num_threads_);
    signals_.async_wait(
        [this](const boost::system::error_code& ec, int signal) {
            if (ec) {return;}
            RLOG(LG_APP, LogLevel::LL_INFO) << "signal " << signal << " received, shutting down";
            // stop joins the io threads, so it cannot run on one of them
            std::thread([this] { stop(); }).detach();
        }
    );
}

void Application::start() {
    if (running_.exchange(true)) {return;}
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stopped_ = false;
    }
    batches_->start();
    arm_periodic_(cleanup_timer_, config_.connection_cleanup_interval, &Application::run_stale_sweep_);
    arm_periodic_(memory_timer_, config_.memory_monitoring.check_interval, &Application::run_memory_sweep_);
    arm_periodic_(detection_timer_, config_.recovery.detection_interval, &Application::run_reconnection_detection_);
    for (size_t i = 0; i < num_threads_; ++i) {
        threads_.emplace_back([this]() {
            run_io_context();
        });
    }
    RLOG(LG_APP, LogLevel::LL_INFO)
        << "relay started with " << threads_.size() << " io threads, " << config_.provider_endpoints.size()
        << " provider endpoints, max " << config_.max_connections << " connections";
}

void Application::run_io_context() {
    try {
        io_context_.run();
    } catch (const std::exception& e) {
        RLOG(LG_APP, LogLevel::LL_FATAL) << "io thread failed: " << e.what();
        std::terminate();
    }
}

void Application::arm_periodic_(boost::asio::steady_timer& timer, Millis interval, void (Application::*task)()) {
    if (interval.count() <= 0) {return;}
    timer.expires_after(interval);
    timer.async_wait([this, &timer, interval, task](const boost::system::error_code& ec) {
        if (ec || !running_) {return;}
        try {
            (this->*task)();
        } catch (const std::exception& e) {
            RLOG(LG_APP, LogLevel::LL_ERROR) << "periodic task failed: " << e.what();
        }
        arm_periodic_(timer, interval, task);
    });
}

void Application::run_stale_sweep_() {
    const CleanupResult result = connections_->run_stale_sweep();
    if (result.removed > 0) {
        RLOG(LG_APP, LogLevel::LL_INFO) << "stale sweep removed " << result.removed << " connections";
    }
}

void Application::run_memory_sweep_() {
    connections_->run_memory_sweep();
}

void Application::run_reconnection_detection_() {
    const size_t flagged = recovery_->detect_reconnection();
    if (flagged > 0) {
        RLOG(LG_APP, LogLevel::LL_WARNING) << flagged << " providers lost their upstream connection";
    }
}

void Application::stop() {
    if (!running_.exchange(false)) {return;}

    cleanup_timer_.cancel();
    memory_timer_.cancel();
    detection_timer_.cancel();
    signals_.cancel();

    batches_->stop();
    connections_->close_all();

    work_guard_.reset();
    io_context_.stop();

    for (auto& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }

    threads_.clear();
    RLOG(LG_APP, LogLevel::LL_INFO) << "relay stopped";

    std::lock_guard<std::mutex> lock(stop_mutex_);
    stopped_ = true;
    stop_cv_.notify_all();
}

void Application::wait() {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    stop_cv_.wait(lock, [this] { return stopped_; });
}
