#pragma once

#include <boost/asio.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <thread>
#include <vector>
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

#include "batch_pipeline.hpp"
#include "config.hpp"
#include "connection_manager.hpp"
#include "data_pipeline.hpp"
#include "local_collaborators.hpp"
#include "recovery_coordinator.hpp"
#include "stream_receiver.hpp"

class Application {
    public:
        explicit Application(
            const RelayConfig& config,
            size_t num_threads = 1,
            LocalClientRegistry::Delivery delivery = nullptr
        );

        void start();
        void stop();
        // Blocks until stop has finished, from any thread.
        void wait();

        StreamReceiver& receiver() {return *receiver_;}
        LocalClientRegistry& registry() {return *registry_;}

    private:
        void run_io_context();
        void arm_periodic_(boost::asio::steady_timer& timer, Millis interval, void (Application::*task)());
        void run_stale_sweep_();
        void run_memory_sweep_();
        void run_reconnection_detection_();

        const RelayConfig config_;

        boost::asio::io_context io_context_;
        using work_guard_t = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

        std::optional<work_guard_t> work_guard_;

        std::shared_ptr<MetricsSink> metrics_;
        std::shared_ptr<LocalClientRegistry> registry_;
        std::shared_ptr<ConnectionManager> connections_;
        std::shared_ptr<BatchPipeline> batches_;
        std::shared_ptr<RecoveryCoordinator> recovery_;
        std::unique_ptr<StreamReceiver> receiver_;

        boost::asio::steady_timer cleanup_timer_;
        boost::asio::steady_timer memory_timer_;
        boost::asio::steady_timer detection_timer_;

        std::vector<std::thread> threads_;
        size_t num_threads_;
        std::atomic<bool> running_{false};
        std::mutex stop_mutex_;
        std::condition_variable stop_cv_;
        bool stopped_ = false;
        boost::asio::signal_set signals_;
};
