#include "devices/FilterWheelDevice.hpp"

#include <algorithm>
#include <mutex>

using json = nlohmann::json;

namespace fastmda {

namespace {

class FilterActuator : public DiscreteActuator {
public:
    FilterActuator(Device& dev, std::vector<std::string> slots, std::size_t initial, double slot_ms)
    : DiscreteActuator(FilterWheelDevice::kFilter, dev), slots_(std::move(slots)), slot_ms_(slot_ms), index_(initial) {}

    std::string name() const override { return "filter"; }
    std::vector<std::string> get_position_values() const override { return slots_; }

protected:
    std::size_t do_get_position() override {
        std::lock_guard<std::mutex> lk(m_);
        return index_;
    }
    void do_set_position(std::size_t index) override {
        std::size_t from = do_get_position();
        const std::size_t n = slots_.size();
        const std::size_t fwd = (index + n - from) % n;
        simulate_delay(slot_ms_ * static_cast<double>(std::min(fwd, n - fwd)));
        std::lock_guard<std::mutex> lk(m_);
        index_ = index;
    }

private:
    std::vector<std::string> slots_;
    double slot_ms_;
    std::mutex m_;
    std::size_t index_;
};

} // namespace

FilterWheelDevice::FilterWheelDevice(std::string id, const json& args)
: Device(std::move(id)), connect_fault(parse_connect_fault(args)) {
    auto slots = args.value("filters", std::vector<std::string>{"open", "ND0.5", "ND1", "ND2", "ND3", "blocked"});
    if (slots.empty()) throw ConfigError(this->id() + ": filter wheel needs at least one slot");
    const auto initial = args.value("position", std::size_t{0});
    if (initial >= slots.size()) throw ConfigError(this->id() + ": initial slot out of range");
    add_actuator(std::make_shared<FilterActuator>(*this, std::move(slots), initial, args.value("slot_ms", 0.0)));
}

void FilterWheelDevice::do_connect() {
    if (connect_fault) throw ConnectionError(*connect_fault, "filter wheel " + id() + " did not respond");
}

} // namespace fastmda
