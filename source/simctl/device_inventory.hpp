#ifndef SIMPILOT_DEVICE_INVENTORY_HPP
#define SIMPILOT_DEVICE_INVENTORY_HPP

// Simulator device inventory: queries `simctl list -j devices runtimes`,
// keeps iOS devices that can actually run, and ranks them for a default pick.

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "simctl/simulator_types.hpp"

namespace orchestrator_state {
class OrchestratorState;
}

namespace device_inventory {

using json = nlohmann::json;
using simulator_types::Device;
using simulator_types::DeviceListResult;
using simulator_types::Runtime;

static const char BOOTED_STATE[] = "Booted";

// Weights for the "best default device" score.
struct DeviceScoreWeights {
    int phone_family_bonus = 1000;
    int booted_bonus = 500;
};

// A runtime is relevant when its platform is "ios", its name starts with
// "ios", or its identifier contains "ios" (all case-insensitive).
bool is_relevant_runtime(const Runtime &runtime);

// First standalone run of 1-2 digits in the name ("iPhone 15 Pro" -> 15), else 0.
int parse_model_number(const std::string &device_name);

// model number + phone family bonus + booted bonus.
int score_device(const Device &device, const DeviceScoreWeights &weights = {});

// Stable sort, highest score first.
void sort_by_score(std::vector<Device> &devices, const DeviceScoreWeights &weights = {});

// Normalizes a parsed catalog payload. Throws std::runtime_error when the
// payload is not a JSON object.
std::vector<Device> parse_device_catalog(const json &payload);

// Cached (short TTL) catalog query, including the Xcode availability check.
// Failures are cached for the same TTL.
DeviceListResult list_devices(orchestrator_state::OrchestratorState &state);

// list_devices() filtered to state == Booted.
DeviceListResult list_booted(orchestrator_state::OrchestratorState &state);

// Uncached catalog query; used where the answer must reflect reality (boot polling).
DeviceListResult query_devices(orchestrator_state::OrchestratorState &state,
                               std::optional<uint64_t> task_id = std::nullopt);

// Live state of one device, nullopt when the query fails or the udid is unknown.
std::optional<Device> find_device(orchestrator_state::OrchestratorState &state,
                                  const std::string &udid,
                                  std::optional<uint64_t> task_id = std::nullopt);

} // namespace device_inventory

#endif // SIMPILOT_DEVICE_INVENTORY_HPP
