#include "core/ServerConfig.hpp"

#include "core/Errors.hpp"

#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace fastmda {

namespace {

int parse_port(const std::string& s) {
    int port = 0;
    try {
        std::size_t used = 0;
        port = std::stoi(s, &used);
        if (used != s.size()) throw ConfigError("invalid port '" + s + "'");
    } catch (const std::logic_error&) {
        throw ConfigError("invalid port '" + s + "'");
    }
    if (port <= 0 || port > 65535) throw ConfigError("port out of range: " + s);
    return port;
}

} // namespace

void to_json(json& j, const ServerConfig& c) {
    j = json{
        {"port", c.port},
        {"devices", c.devices_path},
        {"runs_dir", c.runs_dir},
        {"record", c.record},
        {"sim", c.sim},
        {"broadcast_ms", c.broadcast_ms}
    };
}

ServerConfig ServerConfig::from_json(const json& j, ServerConfig c) {
    if (!j.is_object()) throw ConfigError("server config must be a JSON object");
    try {
        if (j.contains("port")) {
            c.port = j.at("port").get<int>();
            if (c.port <= 0 || c.port > 65535) throw ConfigError("port out of range");
        }
        if (j.contains("devices")) c.devices_path = j.at("devices").get<std::string>();
        if (j.contains("runs_dir")) c.runs_dir = j.at("runs_dir").get<std::string>();
        if (j.contains("record")) c.record = j.at("record").get<bool>();
        if (j.contains("sim")) c.sim = j.at("sim").get<bool>();
        if (j.contains("broadcast_ms")) {
            c.broadcast_ms = j.at("broadcast_ms").get<int>();
            if (c.broadcast_ms < 50) throw ConfigError("broadcast_ms must be >= 50");
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("server config: ") + e.what());
    }
    return c;
}

ServerConfig ServerConfig::load_file(const std::string& path, ServerConfig base) {
    std::ifstream f(path);
    if (!f) throw ConfigError("unable to open server config: " + path);
    json j;
    try {
        j = json::parse(f);
    } catch (const json::parse_error& e) {
        throw ConfigError(path + ": " + e.what());
    }
    return from_json(j, std::move(base));
}

ServerConfig ServerConfig::from_args(int argc, const char* const* argv) {
    ServerConfig c;

    // --config first so flags overlay the file regardless of their position.
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--config") {
            if (i + 1 >= argc) throw ConfigError("--config needs a path");
            c = load_file(argv[i + 1], c);
        } else if (a.rfind("--config=", 0) == 0) {
            c = load_file(a.substr(9), c);
        }
    }

    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        auto value = [&](const char* flag) -> std::string {
            if (i + 1 >= argc) throw ConfigError(std::string(flag) + " needs a value");
            return argv[++i];
        };

        if (a == "-h" || a == "--help") c.show_help = true;
        else if (a == "--config") ++i;
        else if (a.rfind("--config=", 0) == 0) continue;
        else if (a == "-s" || a == "--sim") c.sim = true;
        else if (a == "--no-record") c.record = false;
        else if (a == "-p" || a == "--port") c.port = parse_port(value("--port"));
        else if (a.rfind("--port=", 0) == 0) c.port = parse_port(a.substr(7));
        else if (a == "--devices") c.devices_path = value("--devices");
        else if (a.rfind("--devices=", 0) == 0) c.devices_path = a.substr(10);
        else if (a == "--runs-dir") c.runs_dir = value("--runs-dir");
        else if (a.rfind("--runs-dir=", 0) == 0) c.runs_dir = a.substr(11);
        else throw ConfigError("unknown argument '" + a + "'");
    }
    return c;
}

void ServerConfig::print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  -h, --help          Show this help message and exit\n"
              << "      --config PATH   JSON server configuration file\n"
              << "  -p, --port PORT     Listening TCP port (default 8080)\n"
              << "      --devices PATH  JSON device configuration file\n"
              << "  -s, --sim           Register the built-in simulated bench\n"
              << "      --runs-dir DIR  Where completed runs are written (env FASTMDA_RUNS_DIR wins)\n"
              << "      --no-record     Do not persist completed runs\n"
              << std::flush;
}

} // namespace fastmda
