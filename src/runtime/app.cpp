#include <chremote/runtime/app.h>

#include <chremote/core/log.h>

#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <exception>

namespace chremote {
namespace {

std::size_t ThreadCount(std::size_t requested) {
    if (requested != 0) {
        return requested;
    }
    auto hc = static_cast<std::size_t>(std::thread::hardware_concurrency());
    return hc == 0 ? static_cast<std::size_t>(1) : hc;
}

} // namespace

App::App(AppOptions options)
    : options_(std::move(options)),
      ioc_(static_cast<int>(ThreadCount(options_.io_threads))),
      guard_(boost::asio::make_work_guard(ioc_)),
      tasks_(options_.task_threads == 0 ? 1 : options_.task_threads) {
    chremote::log::Init(options_.log_level);
}

App::~App() {
    Stop();
}

void App::AddServer(std::shared_ptr<IHttpServer> server) {
    servers_.push_back(std::move(server));
}

void App::Post(std::function<void()> task) {
    auto guarded = [task = std::move(task)] {
        try {
            task();
        } catch (const std::exception& ex) {
            chremote::log::error("background task failed: {}", ex.what());
        }
    };

    std::lock_guard<std::mutex> lk(tasks_mu_);
    if (!tasks_open_) {
        pending_.push_back(std::move(guarded));
        return;
    }
    boost::asio::post(tasks_, std::move(guarded));
}

int App::Run() {
    {
        std::lock_guard<std::mutex> lk(stop_mu_);
        stopped_ = false;
    }
    stop_requested_.store(false, std::memory_order_release);

    // Keep the signal_set alive by capturing it.
    auto signals = std::make_shared<boost::asio::signal_set>(ioc_, SIGINT, SIGTERM);
    signals->async_wait([this, signals](const boost::system::error_code& ec, int signo) {
        if (ec) {
            return;
        }
        chremote::log::info("signal {} received", signo);
        this->Stop();
    });

    for (auto& s : servers_) {
        s->Start();
    }

    auto n = ThreadCount(options_.io_threads);
    workers_.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        workers_.emplace_back([this] { ioc_.run(); });
    }
    chremote::log::info("running with {} io threads", n);

    {
        std::lock_guard<std::mutex> lk(tasks_mu_);
        tasks_open_ = true;
        for (auto& task : pending_) {
            boost::asio::post(tasks_, std::move(task));
        }
        pending_.clear();
    }

    {
        std::unique_lock<std::mutex> lk(stop_mu_);
        stop_cv_.wait(lk, [&] { return stopped_; });
    }

    signals->cancel();
    for (auto& t : workers_) {
        if (t.joinable()) {
            t.join();
        }
    }
    workers_.clear();
    tasks_.join();
    return 0;
}

void App::Stop() {
    // idempotent
    if (stop_requested_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    chremote::log::info("Stopping app...");
    for (auto& s : servers_) {
        s->Stop();
    }
    {
        std::lock_guard<std::mutex> lk(tasks_mu_);
        tasks_open_ = false;
        pending_.clear();
    }
    tasks_.stop();
    guard_.reset();
    ioc_.stop();
    chremote::log::info("Stopped.");

    {
        std::lock_guard<std::mutex> lk(stop_mu_);
        stopped_ = true;
    }
    stop_cv_.notify_all();
}

} // namespace chremote
