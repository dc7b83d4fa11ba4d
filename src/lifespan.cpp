#include "lifespan.hpp"
#include "errors.hpp"
#include <iostream>

namespace mcpharbor {

std::string to_string(LifespanState s) {
    switch (s) {
        case LifespanState::not_started: return "not_started";
        case LifespanState::starting: return "starting";
        case LifespanState::running: return "running";
        case LifespanState::shutting_down: return "shutting_down";
        case LifespanState::stopped: return "stopped";
        case LifespanState::failed: return "failed";
    }
    return "unknown";
}

// ── LifespanContext ──

void LifespanContext::startup_complete() {
    std::lock_guard<std::mutex> lock(mutex_);
    started_ = true;
    cv_.notify_all();
}

void LifespanContext::startup_failed(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_) return;
    start_failed_ = true;
    error_ = message;
    cv_.notify_all();
}

void LifespanContext::wait_for_shutdown() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return shutdown_requested_ || cancelled_; });
}

LifespanContext::StartResult LifespanContext::wait_for_startup(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    bool signalled = cv_.wait_for(lock, timeout, [this] { return started_ || start_failed_ || finished_; });
    if (!signalled) return StartResult::timeout;
    if (started_) return StartResult::complete;
    // A task that returns without reporting never started
    if (!start_failed_) error_ = "lifespan task exited before startup completed";
    return StartResult::failed;
}

void LifespanContext::request_shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_requested_ = true;
    cv_.notify_all();
}

void LifespanContext::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
    cv_.notify_all();
}

void LifespanContext::finished() {
    std::lock_guard<std::mutex> lock(mutex_);
    finished_ = true;
    cv_.notify_all();
}

bool LifespanContext::wait_finished(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return finished_; });
}

// ── LifespanWrapper ──

LifespanWrapper::LifespanWrapper(std::shared_ptr<LifespanApp> app, const LifespanConfig& cfg)
    : app_(std::move(app)),
      startup_timeout_(std::chrono::seconds(cfg.startup_timeout)),
      shutdown_timeout_(std::chrono::seconds(cfg.shutdown_timeout)) {}

LifespanWrapper::~LifespanWrapper() {
    shutdown();
    // A cancelled task may still be unwinding; the app's collaborators
    // must outlive it
    if (task_.joinable()) task_.join();
}

LifespanState LifespanWrapper::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

// A finished task is joined now; a cancelled one that is still running
// is left for the destructor to join.
void LifespanWrapper::release_task(bool finished) {
    if (finished && task_.joinable()) task_.join();
}

void LifespanWrapper::ensure_started() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return state_ != LifespanState::starting; });

    switch (state_) {
        case LifespanState::running:
            return;
        case LifespanState::failed:
            throw StartupError("lifespan startup failed: " + error_);
        case LifespanState::shutting_down:
        case LifespanState::stopped:
            throw StartupError("lifespan already shut down");
        case LifespanState::not_started:
        case LifespanState::starting:
            break;
    }

    state_ = LifespanState::starting;
    auto ctx = std::make_shared<LifespanContext>();
    ctx_ = ctx;
    std::cerr << "[lifespan] Starting\n";

    auto app = app_;
    task_ = std::thread([app, ctx]() {
        try {
            app->run(*ctx);
        } catch (const std::exception& e) {
            std::cerr << "[lifespan] Task error: " << e.what() << "\n";
            ctx->startup_failed(e.what());
        }
        ctx->finished();
    });
    lock.unlock();

    auto result = ctx->wait_for_startup(startup_timeout_);

    lock.lock();
    if (result == LifespanContext::StartResult::complete) {
        state_ = LifespanState::running;
        std::cerr << "[lifespan] Startup complete\n";
        cv_.notify_all();
        return;
    }

    if (result == LifespanContext::StartResult::timeout) {
        error_ = "startup timed out after " +
                 std::to_string(std::chrono::duration_cast<std::chrono::seconds>(startup_timeout_).count()) +
                 " seconds";
    } else {
        error_ = ctx->error();
    }
    std::cerr << "[lifespan] Startup failed: " << error_ << "\n";
    ctx->cancel();
    release_task(ctx->wait_finished(std::chrono::milliseconds(0)));
    state_ = LifespanState::failed;
    cv_.notify_all();
    throw StartupError("lifespan startup failed: " + error_);
}

void LifespanWrapper::handle(const httplib::Request& req, httplib::Response& res) {
    try {
        ensure_started();
    } catch (const StartupError& e) {
        std::cerr << "[lifespan] " << e.what() << "\n";
        res.status = 500;
        res.set_content("MCP server initialization failed", "text/plain");
        return;
    }

    try {
        app_->handle(req, res);
    } catch (const std::exception& e) {
        std::cerr << "[lifespan] Request failed: " << e.what() << "\n";
        res.status = 500;
        res.set_content(std::string("MCP connection error: ") + e.what(), "text/plain");
    }
}

void LifespanWrapper::shutdown() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] {
        return state_ != LifespanState::starting && state_ != LifespanState::shutting_down;
    });

    if (state_ == LifespanState::not_started) {
        state_ = LifespanState::stopped;
        cv_.notify_all();
        return;
    }
    if (state_ != LifespanState::running) return;

    state_ = LifespanState::shutting_down;
    auto ctx = ctx_;
    lock.unlock();

    std::cerr << "[lifespan] Shutting down\n";
    ctx->request_shutdown();
    bool graceful = ctx->wait_finished(shutdown_timeout_);
    if (!graceful) {
        std::cerr << "[lifespan] Shutdown timed out after "
                  << std::chrono::duration_cast<std::chrono::seconds>(shutdown_timeout_).count()
                  << " seconds, cancelling\n";
        ctx->cancel();
    }

    lock.lock();
    release_task(graceful);
    state_ = LifespanState::stopped;
    cv_.notify_all();
    std::cerr << "[lifespan] Stopped\n";
}

} // namespace mcpharbor
