#include <cstdlib>
#include <iostream>
#include <string>

#include "fastmda_api.hpp"

using json = nlohmann::json;

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " ws://host:port/ method [params_json]\n";
        std::cerr << "Example:\n";
        std::cerr << "  " << argv[0] << " ws://localhost:8080/ devices.list\n";
        std::cerr << "  " << argv[0] << " ws://localhost:8080/ actuator.set '{\"device_id\":\"stage_x\",\"actuator_id\":0,\"value\":12.5}'\n";
        std::cerr << "  " << argv[0] << " ws://localhost:8080/ measurement.start "
                  << "'{\"measurement\":{\"type\":\"time_series\",\"detectors\":[{\"device\":\"pd0\",\"detector\":0}],\"interval_s\":0.5,\"count\":10}}'\n";
        return 2;
    }

    const std::string ws_url = argv[1];
    const std::string method = argv[2];
    json params = json::object();
    if (argc >= 4) {
        try {
            params = json::parse(argv[3]);
        } catch (const std::exception& e) {
            std::cerr << "Invalid params_json: " << e.what() << "\n";
            return 2;
        }
    }

    try {
        fastmda::Client client(ws_url);
        json msg = client.rpc_raw(method, params);
        std::cout << msg.dump(2) << std::endl;
        return msg.value("ok", false) ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
