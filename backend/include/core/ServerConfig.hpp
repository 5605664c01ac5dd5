#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace fastmda {

/**
 * @brief Backend process configuration.
 *
 * Sources, later ones winning: built-in defaults, the JSON file named by
 * --config, then individual command-line flags. FASTMDA_RUNS_DIR overrides
 * runs_dir when the recorder resolves it.
 */
struct ServerConfig {
    int port = 8080;
    std::string devices_path;   // device config file; empty with sim=false means no devices
    std::string runs_dir;       // empty: FASTMDA_RUNS_DIR or ./runs
    bool record = true;
    bool sim = false;           // register the built-in simulated bench
    int broadcast_ms = 1000;    // runs_update period
    bool show_help = false;

    ServerConfig();

    // Throws ConfigError on wrong types or out-of-range values.
    static ServerConfig from_json(const nlohmann::json& j, ServerConfig base = {});
    static ServerConfig load_file(const std::string& path, ServerConfig base = {});
    static ServerConfig from_args(int argc, const char* const* argv);

    static void print_usage(const char* prog);
};

inline ServerConfig::ServerConfig() = default;

void to_json(nlohmann::json& j, const ServerConfig& c);

} // namespace fastmda
