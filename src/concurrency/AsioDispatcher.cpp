#include "concurrency/AsioDispatcher.hpp"
#include "log/Registry.hpp"

#include <boost/asio/post.hpp>

using namespace vcs::concurrency;

AsioDispatcher::AsioDispatcher(std::string name)
    : name_(std::move(name)) {
    workGuard_.emplace(boost::asio::make_work_guard(ioContext_));

    thread_ = std::thread([this] {
        while (true) {
            try {
                ioContext_.run();
                return;
            } catch (const std::exception& e) {
                log::Registry::vcstatus()->error("[{}] Callback threw: {}", name_, e.what());
            }
        }
    });
}

AsioDispatcher::~AsioDispatcher() {
    shutdown();
}

void AsioDispatcher::post(std::function<void()> callback) {
    if (!callback || ioContext_.stopped()) return;
    boost::asio::post(ioContext_, std::move(callback));
}

void AsioDispatcher::shutdown() {
    workGuard_.reset();
    if (!thread_.joinable()) return;

    if (onDispatcherThread()) {
        ioContext_.stop();
        thread_.detach();
        return;
    }
    thread_.join();
}
