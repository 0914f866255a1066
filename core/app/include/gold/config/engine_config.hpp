#pragma once

#include "gold/custody/asset_custody.hpp"
#include "gold/domain/execution_options.hpp"
#include "gold/domain/member_status.hpp"
#include "gold/domain/role.hpp"
#include "gold/domain/types.hpp"
#include "gold/ledger/account_ledger.hpp"
#include "gold/registry/member_registry.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace gold {

// Address with the roles it is granted at start-up.
struct AddressSeed {
  domain::Address address;
  domain::RoleSet roles;
};

struct MemberSeed {
  domain::MemberId id;
  std::string name;
  std::string country;
  domain::MemberStatus status{domain::MemberStatus::Active};
  std::vector<AddressSeed> addresses;  // Linked to this member
};

// -----------------------------------------------------------------------------
// EngineConfig: start-up parameters of a CustodyEngine
// -----------------------------------------------------------------------------
//
// @details
// Plain value type; every field has a usable default so tests can build an
// engine from `EngineConfig{}`. The JSON form (config/engine.json):
//
//   {
//     "account_prefix": "IGAN-",
//     "first_account_sequence": 1000,
//     "operator_address": "gold-engine",
//     "execution": {"enable_on_chain_transfer": true,
//                   "enable_auto_ledger_update": true},
//     "custody":   {"allow_operator_status_updates": true},
//     "ipc":       {"command_endpoint": "", "telemetry_endpoint": ""},
//     "members":   [{"id": "GIC-1", "name": "...", "country": "CH",
//                    "status": "ACTIVE",
//                    "addresses": [{"address": "0xa1",
//                                   "roles": ["refiner", "minter"]}]}],
//     "operators": [{"address": "0xops", "roles": ["platform"]}],
//     "blacklist": ["0xbad"]
//   }
//
// Empty IPC endpoints leave the IPC server off.
// -----------------------------------------------------------------------------
struct EngineConfig {
  AccountIdFormat account_ids;
  domain::ExecutionOptions execution;
  CustodyOptions custody;

  std::string ipc_command_endpoint;
  std::string ipc_telemetry_endpoint;

  // Holder name under which the engine wires its component capabilities.
  domain::Address operator_address{"gold-engine"};

  std::vector<MemberSeed> members;
  std::vector<AddressSeed> operators;  // Role holders not linked to a member
  std::vector<domain::Address> blacklist;

  bool ipcEnabled() const {
    return !ipc_command_endpoint.empty() && !ipc_telemetry_endpoint.empty();
  }
};

// Throw ValidationError on malformed input (bad JSON, wrong field type,
// unknown role or status name).
EngineConfig parseEngineConfig(const nlohmann::json& j);
EngineConfig parseEngineConfig(const std::string& json_text);

// Throws NotFoundError if the file cannot be opened.
EngineConfig loadEngineConfig(const std::string& path);

// Registers members, links addresses, assigns roles and applies the
// blacklist.
void seedRegistry(const EngineConfig& config, MemberRegistry& registry);

}  // namespace gold
