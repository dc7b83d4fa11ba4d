#pragma once
#include "config.hpp"
#include <httplib.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace mcpharbor {

enum class LifespanState {
    not_started,
    starting,
    running,
    shutting_down,
    stopped,
    failed,
};

std::string to_string(LifespanState s);

// Handshake between the wrapper and the app's background task.
class LifespanContext {
public:
    // Called by the app
    void startup_complete();
    void startup_failed(const std::string& message);
    // Blocks until shutdown is requested or the task is cancelled
    void wait_for_shutdown();
    bool cancelled() const { return cancelled_; }

    // Called by the wrapper
    enum class StartResult { complete, failed, timeout };
    StartResult wait_for_startup(std::chrono::milliseconds timeout);
    const std::string& error() const { return error_; }
    void request_shutdown();
    void cancel();
    void finished();
    bool wait_finished(std::chrono::milliseconds timeout);

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool started_ = false;
    bool start_failed_ = false;
    bool shutdown_requested_ = false;
    bool finished_ = false;
    std::atomic<bool> cancelled_{false};
    std::string error_;
};

// Protocol application run behind the wrapper. run() performs startup,
// reports it through the context, then blocks until shutdown and cleans up.
class LifespanApp {
public:
    virtual ~LifespanApp() = default;

    virtual void run(LifespanContext& ctx) = 0;
    virtual void handle(const httplib::Request& req, httplib::Response& res) = 0;
};

// Starts the app once on first use, forwards requests while it runs and
// drains it on shutdown. Request failures become HTTP 500 responses.
// Destruction joins the background task, so whatever the app references
// must be declared before the wrapper.
class LifespanWrapper {
public:
    LifespanWrapper(std::shared_ptr<LifespanApp> app, const LifespanConfig& cfg);
    ~LifespanWrapper();

    LifespanWrapper(const LifespanWrapper&) = delete;
    LifespanWrapper& operator=(const LifespanWrapper&) = delete;

    // Concurrent callers share one startup. Throws StartupError on failure,
    // timeout, or when the wrapper is already shut down.
    void ensure_started();
    void handle(const httplib::Request& req, httplib::Response& res);
    // Idempotent
    void shutdown();

    LifespanState state() const;

private:
    std::shared_ptr<LifespanApp> app_;
    std::chrono::milliseconds startup_timeout_;
    std::chrono::milliseconds shutdown_timeout_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    LifespanState state_ = LifespanState::not_started;
    std::string error_;
    std::shared_ptr<LifespanContext> ctx_;
    std::thread task_;

    void release_task(bool finished);
};

} // namespace mcpharbor
