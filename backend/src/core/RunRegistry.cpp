#include "core/RunRegistry.hpp"

#include <algorithm>

namespace fastmda {

void RunRegistry::insert(std::shared_ptr<Run> run) {
    std::lock_guard<std::mutex> lk(m_);
    const std::string id = run->id();
    if (!runs_.emplace(id, std::move(run)).second) {
        throw ConfigError("RunRegistry: duplicate run id '" + id + "'");
    }
    order_.push_back(id);
}

std::shared_ptr<Run> RunRegistry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lk(m_);
    auto it = runs_.find(id);
    return it == runs_.end() ? nullptr : it->second;
}

std::shared_ptr<Run> RunRegistry::require(const std::string& id) const {
    auto r = find(id);
    if (!r) throw NotFoundError("unknown run '" + id + "'");
    return r;
}

std::shared_ptr<Run> RunRegistry::remove_terminal(const std::string& id) {
    std::lock_guard<std::mutex> lk(m_);
    auto it = runs_.find(id);
    if (it == runs_.end()) throw NotFoundError("unknown run '" + id + "'");
    if (!is_terminal(it->second->state())) {
        throw ConfigError("run '" + id + "': " + errors::D1600_RUN_ACTIVE);
    }
    auto run = it->second;
    runs_.erase(it);
    order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    return run;
}

std::vector<std::shared_ptr<Run>> RunRegistry::all() const {
    std::lock_guard<std::mutex> lk(m_);
    std::vector<std::shared_ptr<Run>> out;
    out.reserve(order_.size());
    for (const auto& id : order_) out.push_back(runs_.at(id));
    return out;
}

std::size_t RunRegistry::size() const {
    std::lock_guard<std::mutex> lk(m_);
    return runs_.size();
}

} // namespace fastmda
