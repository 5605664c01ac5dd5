#include "core/RunRecorder.hpp"

#include "core/BuildInfo.hpp"
#include "core/MeasurementEngine.hpp"

#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

namespace fastmda {

RunRecorder::RunRecorder(std::string runs_dir, int port)
: runs_dir_(resolve_runs_dir(runs_dir)), port_(port) {}

std::string RunRecorder::resolve_runs_dir(const std::string& configured) {
    const char* env = std::getenv("FASTMDA_RUNS_DIR");
    if (env && *env) return std::string(env);
    if (!configured.empty()) return configured;
    return "runs";
}

void RunRecorder::attach(MeasurementEngine& engine) {
    engine.add_completion_listener([this](const RunSnapshot& s) { record(s); });
}

std::int64_t RunRecorder::runs_written() const {
    std::lock_guard<std::mutex> lk(m_);
    return runs_written_;
}

std::string RunRecorder::day_string(std::int64_t ts_ms) {
    std::time_t tt = static_cast<std::time_t>(ts_ms / 1000);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    std::ostringstream day;
    day << std::setfill('0') << std::setw(4) << (tm.tm_year + 1900) << "-" << std::setw(2) << (tm.tm_mon + 1) << "-" << std::setw(2) << tm.tm_mday;
    return day.str();
}

std::string RunRecorder::sanitize(std::string base) {
    for (char& c : base) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.')) c = '_';
    }
    if (base.empty()) base = "run";
    return base;
}

json RunRecorder::header(const RunSnapshot& s) const {
    return {
        {"type", "fastmda_run"},
        {"schema_version", 1},
        {"run_id", s.id},
        {"measurement_type", s.measurement_type},
        {"measurement", s.measurement},
        {"created_ms", s.created_ms},
        {"started_ms", s.started_ms},
        {"steps_total", s.steps_total ? json(*s.steps_total) : json(nullptr)},
        {"meta", {
            {"backend", {
                {"port", port_},
                {"git_commit", buildinfo::git_commit()},
                {"build_time", buildinfo::build_time_utc_approx()}
            }}
        }}
    };
}

std::string RunRecorder::record(const RunSnapshot& s) {
    std::filesystem::path path;
    try {
        std::filesystem::path day_dir = std::filesystem::path(runs_dir_) / day_string(s.created_ms);
        std::filesystem::create_directories(day_dir);
        path = day_dir / (sanitize(s.measurement_type) + "_" + s.id + ".jsonl");

        std::ofstream file(path, std::ios::out | std::ios::trunc);
        if (!file) {
            std::cerr << "RunRecorder: unable to open " << path.string() << std::endl;
            return {};
        }

        file << header(s).dump() << "\n";
        for (const auto& dp : s.data_points) {
            json line = dp;
            line["type"] = "datapoint";
            line["run_id"] = s.id;
            file << line.dump() << "\n";
        }
        json footer = {
            {"type", "end"},
            {"run_id", s.id},
            {"state", to_string(s.state)},
            {"ended_ms", s.ended_ms},
            {"error", s.error ? json(*s.error) : json(nullptr)},
            {"datapoints_written", s.data_points.size()}
        };
        file << footer.dump() << "\n";
        file.flush();
        if (!file) {
            std::cerr << "RunRecorder: write failed for " << path.string() << std::endl;
            return {};
        }
    } catch (const std::exception& e) {
        std::cerr << "RunRecorder: failed to record run " << s.id << ": " << e.what() << std::endl;
        return {};
    }

    {
        std::lock_guard<std::mutex> lk(m_);
        ++runs_written_;
    }
    std::cout << "RunRecorder: wrote " << path.string() << std::endl;
    return path.string();
}

} // namespace fastmda
