#include "ExpirySweeper.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

ExpirySweeper::ExpirySweeper(std::chrono::milliseconds interval, PurgeFn purge, std::shared_ptr<ILogger> logger)
    : interval_(interval), purge_(std::move(purge)), logger_(std::move(logger)), timer_(ioc_) {
    if (interval_.count() <= 0) {
        throw std::invalid_argument("Sweep interval must be positive");
    }
    if (!purge_) {
        throw std::invalid_argument("Purge callback cannot be empty for ExpirySweeper");
    }
}

ExpirySweeper::~ExpirySweeper() {
    stop();
}

void ExpirySweeper::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_ || stopping_) {
        return;
    }
    work_guard_ = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(
        net::make_work_guard(ioc_));
    arm();
    thread_ = std::thread([this]() {
        try {
            ioc_.run();
        } catch (const std::exception& e) {
            if (logger_) logger_->error("Exception in expiry sweeper thread: " + std::string(e.what()));
        }
    });
    running_ = true;
    if (logger_) logger_->debug("Expiry sweeper started, interval " + std::to_string(interval_.count()) + "ms");
}

void ExpirySweeper::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (stopping_.exchange(true) || !running_) {
        return;
    }
    // Cancel on the io thread so it can not race with a re-arm in onTick
    net::post(ioc_, [this]() { timer_.cancel(); });
    work_guard_.reset();
    ioc_.stop();
    if (thread_.joinable()) {
        thread_.join();
    }
    running_ = false;
    if (logger_) logger_->debug("Expiry sweeper stopped after " + std::to_string(sweeps_.load()) + " sweeps");
}

void ExpirySweeper::arm() {
    timer_.expires_after(interval_);
    timer_.async_wait([this](const boost::system::error_code& ec) { onTick(ec); });
}

void ExpirySweeper::onTick(const boost::system::error_code& ec) {
    if (ec == net::error::operation_aborted || stopping_) {
        return;
    }
    try {
        size_t purged = purge_();
        ++sweeps_;
        if (purged > 0 && logger_) {
            logger_->debug("Expiry sweep removed " + std::to_string(purged) + " entries");
        }
    } catch (const std::exception& e) {
        if (logger_) logger_->error("Expiry sweep failed: " + std::string(e.what()));
    }
    arm();
}
