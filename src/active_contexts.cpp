// src/active_contexts.cpp
// Implementation of the in-flight context registry

#include "stagewise/active_contexts.hpp"
#include <mutex>

namespace stagewise {

void ActiveContextRegistry::insert(const std::shared_ptr<Context>& context) {
    std::unique_lock lock(mutex_);
    contexts_[context->request_id()] = context;
}

bool ActiveContextRegistry::remove(const RequestId& request_id) {
    std::unique_lock lock(mutex_);
    return contexts_.erase(request_id) > 0;
}

std::shared_ptr<Context> ActiveContextRegistry::find(const RequestId& request_id) const {
    std::shared_lock lock(mutex_);
    auto it = contexts_.find(request_id);
    return it != contexts_.end() ? it->second : nullptr;
}

size_t ActiveContextRegistry::size() const {
    std::shared_lock lock(mutex_);
    return contexts_.size();
}

bool ActiveContextRegistry::empty() const {
    std::shared_lock lock(mutex_);
    return contexts_.empty();
}

std::vector<RequestId> ActiveContextRegistry::ids() const {
    std::shared_lock lock(mutex_);
    std::vector<RequestId> result;
    result.reserve(contexts_.size());
    for (const auto& [id, context] : contexts_) {
        result.push_back(id);
    }
    return result;
}

size_t ActiveContextRegistry::count_stale() const {
    auto now = SteadyClock::now();
    std::shared_lock lock(mutex_);
    size_t stale = 0;
    for (const auto& [id, context] : contexts_) {
        if (context->is_stale(now)) {
            stale++;
        }
    }
    return stale;
}

size_t ActiveContextRegistry::purge_stale() {
    auto now = SteadyClock::now();
    std::unique_lock lock(mutex_);
    size_t removed = 0;
    for (auto it = contexts_.begin(); it != contexts_.end();) {
        if (it->second->is_stale(now)) {
            it = contexts_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

} // namespace stagewise
