#pragma once

#include "concurrency/Dispatcher.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <optional>
#include <string>
#include <thread>

namespace vcs::concurrency {

// Runs posted callbacks on a single dedicated thread driving an io_context.
class AsioDispatcher final : public Dispatcher {
public:
    explicit AsioDispatcher(std::string name = "StatusNotifier");
    ~AsioDispatcher() override;

    AsioDispatcher(const AsioDispatcher&) = delete;
    AsioDispatcher& operator=(const AsioDispatcher&) = delete;

    void post(std::function<void()> callback) override;

    // Lets queued callbacks finish, then joins the thread. Later posts are dropped.
    void shutdown();

    [[nodiscard]] bool onDispatcherThread() const { return std::this_thread::get_id() == thread_.get_id(); }

private:
    std::string name_;
    boost::asio::io_context ioContext_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> workGuard_;
    std::thread thread_;
};

}
