#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/Run.hpp"

namespace fastmda {

// Tracks in-flight and completed runs until they are explicitly purged.
class RunRegistry {
public:
    RunRegistry() = default;

    RunRegistry(const RunRegistry&) = delete;
    RunRegistry& operator=(const RunRegistry&) = delete;

    // Throws ConfigError on duplicate id.
    void insert(std::shared_ptr<Run> run);
    std::shared_ptr<Run> find(const std::string& id) const;
    // Throws NotFoundError.
    std::shared_ptr<Run> require(const std::string& id) const;
    // Throws NotFoundError; ConfigError if the run is not terminal.
    std::shared_ptr<Run> remove_terminal(const std::string& id);

    std::vector<std::shared_ptr<Run>> all() const;
    std::size_t size() const;

private:
    mutable std::mutex m_;
    std::map<std::string, std::shared_ptr<Run>> runs_;
    std::vector<std::string> order_; // insertion order for listings
};

} // namespace fastmda
