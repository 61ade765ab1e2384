#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>

namespace chremote {

class IHttpServer {
public:
    virtual ~IHttpServer() = default;
    virtual void Start() = 0;
    virtual void Stop() = 0;
};

struct AppOptions {
    std::size_t io_threads = 0; // 0 = hardware concurrency
    std::size_t task_threads = 1; // background tasks, see App::Post
    std::string log_level = "info";
};

// Owns the io_context run by the servers and the threads running it, plus a
// separate pool for blocking background tasks.
class App {
public:
    explicit App(AppOptions options);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    boost::asio::io_context& Io() { return ioc_; }

    void AddServer(std::shared_ptr<IHttpServer> server);

    // Runs task on the background pool, never on an io thread, so it may block
    // (outgoing HTTP calls). Tasks posted before Run() start once the servers
    // are up; tasks still queued at Stop() are dropped.
    // Thread-safe
    void Post(std::function<void()> task);

    // Blocking until Stop() or SIGINT/SIGTERM
    int Run();
    void Stop();

private:
    AppOptions options_;
    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> guard_;
    std::vector<std::thread> workers_;
    std::vector<std::shared_ptr<IHttpServer>> servers_;

    boost::asio::thread_pool tasks_;
    std::mutex tasks_mu_;
    bool tasks_open_{false};
    std::vector<std::function<void()>> pending_;

    std::atomic<bool> stop_requested_{false};
    std::mutex stop_mu_;
    std::condition_variable stop_cv_;
    bool stopped_{false};
};

} // namespace chremote
