#include "application/SingleFlight.hpp"

namespace tiercache::application {

SingleFlight::Result SingleFlight::run(const std::string& key, const Fn& fn) {
    std::shared_ptr<Call> call;
    std::promise<Result> promise;
    bool leader = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_.find(key);
        if (it != calls_.end()) {
            call = it->second;
            ++call->joined;
        } else {
            call = std::make_shared<Call>();
            call->result = promise.get_future().share();
            calls_.emplace(key, call);
            leader = true;
        }
    }

    if (!leader) {
        return call->result.get();
    }

    try {
        promise.set_value(fn());
    } catch (...) {
        promise.set_exception(std::current_exception());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.erase(key);
    }

    return call->result.get();
}

std::size_t SingleFlight::inFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_.size();
}

std::size_t SingleFlight::joined(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = calls_.find(key);
    return it != calls_.end() ? it->second->joined : 0;
}

} // namespace tiercache::application
