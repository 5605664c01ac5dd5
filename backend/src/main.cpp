#include "DescriptorProtocol.hpp"
#include "DeviceRegistry.hpp"
#include "WebSocketServer.hpp"
#include "core/MeasurementEngine.hpp"
#include "core/RunRecorder.hpp"
#include "core/RunRegistry.hpp"
#include "core/ServerConfig.hpp"
#include "measurements/MeasurementCatalog.hpp"
#include "net/RpcDispatcher.hpp"
#include "toolkit/DeviceConfigLoader.hpp"
#include "toolkit/DeviceTypeCatalog.hpp"
#include "toolkit/StandardToolkit.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

using namespace fastmda;

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) { g_stop.store(true); }

// Built-in bench used with --sim.
nlohmann::json sim_bench() {
    return nlohmann::json::parse(R"({
        "devices": [
            {"id": "pd0", "type": "photodiode", "args": {"power_W": 0.002}},
            {"id": "fw0", "type": "filter_wheel", "args": {"slot_ms": 5}},
            {"id": "stage_x", "type": "linear_stage", "args": {"travel_mm": 50, "velocity_mm_s": 25}},
            {"id": "stage_y", "type": "linear_stage", "args": {"travel_mm": 50, "velocity_mm_s": 25}},
            {"id": "spec0", "type": "spectrometer", "args": {"pixels": 256, "integration_ms": 5}}
        ]
    })");
}

} // namespace

int main(int argc, char** argv) {
    ServerConfig cfg;
    try {
        cfg = ServerConfig::from_args(argc, argv);
    } catch (const Error& e) {
        std::cerr << "fastmda_backend: " << e.what() << std::endl;
        ServerConfig::print_usage(argv[0]);
        return 2;
    }
    if (cfg.show_help) {
        ServerConfig::print_usage(argv[0]);
        return 0;
    }

    DeviceTypeCatalog device_types;
    StandardToolkit standard;
    device_types.install(standard);

    DeviceRegistry registry;
    try {
        DeviceConfigLoader loader(device_types);
        if (cfg.sim) loader.load_json(sim_bench(), registry);
        if (!cfg.devices_path.empty()) loader.load(cfg.devices_path, registry);
    } catch (const Error& e) {
        std::cerr << "fastmda_backend: device configuration failed: " << e.what() << std::endl;
        return 1;
    }
    if (registry.size() == 0) {
        std::cerr << "fastmda_backend: no devices configured (use --devices or --sim)" << std::endl;
    }

    RunRegistry runs;
    MeasurementEngine engine(runs);
    std::unique_ptr<RunRecorder> recorder;
    if (cfg.record) {
        recorder = std::make_unique<RunRecorder>(cfg.runs_dir, cfg.port);
        recorder->attach(engine);
        std::cout << "fastmda_backend: recording runs to " << recorder->runs_dir() << std::endl;
    }

    MeasurementCatalog measurements;
    RpcDispatcher dispatcher(registry, device_types, measurements, engine);
    DescriptorProtocol protocol(registry, engine);
    WebSocketServer server(cfg.port, dispatcher, protocol, std::chrono::milliseconds(cfg.broadcast_ms));
    try {
        server.start();
    } catch (const Error& e) {
        std::cerr << "fastmda_backend: " << e.what() << std::endl;
        return 1;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    std::cout << "fastmda_backend: running on port " << server.bound_port() << " with "
              << registry.size() << " device(s)" << std::endl;

    while (!g_stop.load()) std::this_thread::sleep_for(std::chrono::milliseconds(100));

    std::cout << "fastmda_backend: shutting down" << std::endl;
    server.stop();
    engine.shutdown();
    registry.disconnect_all();
    return 0;
}
