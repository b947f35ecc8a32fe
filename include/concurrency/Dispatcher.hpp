#pragma once

#include <functional>

namespace vcs::concurrency {

// Serializes callbacks onto one designated executor.
class Dispatcher {
public:
    virtual ~Dispatcher() = default;

    virtual void post(std::function<void()> callback) = 0;
};

}
