// include/stagewise/active_contexts.hpp
// Purpose: Concurrency-safe registry of in-flight request contexts

#pragma once

#include "context.hpp"
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace stagewise {

class ActiveContextRegistry {
public:
    void insert(const std::shared_ptr<Context>& context);
    bool remove(const RequestId& request_id);
    std::shared_ptr<Context> find(const RequestId& request_id) const;

    size_t size() const;
    bool empty() const;
    std::vector<RequestId> ids() const;

    // Contexts older than their context_timeout
    size_t count_stale() const;
    size_t purge_stale();

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<RequestId, std::shared_ptr<Context>> contexts_;
};

} // namespace stagewise
