#ifndef EXPIRYSWEEPER_HPP
#define EXPIRYSWEEPER_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "../interfaces/ILogger.hpp"

namespace net = boost::asio;

// Runs a purge callback every `interval` on a private io_context thread.
// stop() cancels the timer and joins the thread; a purge already running
// finishes first, no new one starts.
class ExpirySweeper {
public:
    using PurgeFn = std::function<size_t()>;

    ExpirySweeper(std::chrono::milliseconds interval, PurgeFn purge, std::shared_ptr<ILogger> logger);
    ~ExpirySweeper();

    ExpirySweeper(const ExpirySweeper&) = delete;
    ExpirySweeper& operator=(const ExpirySweeper&) = delete;

    void start();
    void stop();

    bool running() const { return running_; }
    size_t sweepCount() const { return sweeps_; }

private:
    void arm();
    void onTick(const boost::system::error_code& ec);

    const std::chrono::milliseconds interval_;
    PurgeFn purge_;
    std::shared_ptr<ILogger> logger_;

    net::io_context ioc_;
    net::steady_timer timer_;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> work_guard_;
    std::thread thread_;

    std::mutex lifecycle_mutex_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<size_t> sweeps_{0};
};

#endif // EXPIRYSWEEPER_HPP
