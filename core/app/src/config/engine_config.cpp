#include "gold/config/engine_config.hpp"
#include "gold/errors/ledger_error.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

namespace gold {

namespace {

using nlohmann::json;

domain::MemberStatus parseMemberStatus(const std::string& name) {
  if (name == "PENDING") return domain::MemberStatus::Pending;
  if (name == "ACTIVE") return domain::MemberStatus::Active;
  if (name == "SUSPENDED") return domain::MemberStatus::Suspended;
  if (name == "TERMINATED") return domain::MemberStatus::Terminated;
  throw ValidationError("unknown member status: " + name);
}

domain::RoleSet parseRoles(const json& names) {
  domain::RoleSet roles;
  for (const auto& entry : names) {
    const auto name = entry.get<std::string>();
    auto role = domain::roleFromString(name);
    if (!role) {
      throw ValidationError("unknown role: " + name);
    }
    roles = roles.with(*role);
  }
  return roles;
}

AddressSeed parseAddress(const json& j) {
  AddressSeed seed;
  seed.address = j.at("address").get<std::string>();
  if (seed.address.empty()) {
    throw ValidationError("address entry with empty address");
  }
  if (j.contains("roles")) {
    seed.roles = parseRoles(j.at("roles"));
  }
  return seed;
}

MemberSeed parseMember(const json& j) {
  MemberSeed seed;
  seed.id = j.at("id").get<std::string>();
  seed.name = j.value("name", std::string{});
  seed.country = j.value("country", std::string{});
  if (j.contains("status")) {
    seed.status = parseMemberStatus(j.at("status").get<std::string>());
  }
  if (j.contains("addresses")) {
    for (const auto& a : j.at("addresses")) {
      seed.addresses.push_back(parseAddress(a));
    }
  }
  return seed;
}

}  // namespace

// -----------------------------------------------------------------------------
// parseEngineConfig(json)
// -----------------------------------------------------------------------------
EngineConfig parseEngineConfig(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw ValidationError("engine config must be a JSON object");
  }

  EngineConfig config;
  try {
    config.account_ids.prefix =
        j.value("account_prefix", config.account_ids.prefix);
    config.account_ids.first_sequence = j.value(
        "first_account_sequence", config.account_ids.first_sequence);
    config.operator_address =
        j.value("operator_address", config.operator_address);

    if (j.contains("execution")) {
      const auto& e = j.at("execution");
      config.execution.enable_on_chain_transfer = e.value(
          "enable_on_chain_transfer", config.execution.enable_on_chain_transfer);
      config.execution.enable_auto_ledger_update =
          e.value("enable_auto_ledger_update",
                  config.execution.enable_auto_ledger_update);
    }

    if (j.contains("custody")) {
      config.custody.allow_operator_status_updates =
          j.at("custody").value("allow_operator_status_updates",
                                config.custody.allow_operator_status_updates);
    }

    if (j.contains("ipc")) {
      const auto& ipc = j.at("ipc");
      config.ipc_command_endpoint = ipc.value("command_endpoint", std::string{});
      config.ipc_telemetry_endpoint =
          ipc.value("telemetry_endpoint", std::string{});
    }

    if (j.contains("members")) {
      for (const auto& m : j.at("members")) {
        config.members.push_back(parseMember(m));
      }
    }

    if (j.contains("operators")) {
      for (const auto& o : j.at("operators")) {
        config.operators.push_back(parseAddress(o));
      }
    }

    if (j.contains("blacklist")) {
      config.blacklist = j.at("blacklist").get<std::vector<std::string>>();
    }
  } catch (const nlohmann::json::exception& e) {
    throw ValidationError(std::string("malformed engine config: ") + e.what());
  }

  if (config.account_ids.prefix.empty()) {
    throw ValidationError("account_prefix must not be empty");
  }
  if (config.operator_address.empty()) {
    throw ValidationError("operator_address must not be empty");
  }
  return config;
}

EngineConfig parseEngineConfig(const std::string& json_text) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(json_text);
  } catch (const nlohmann::json::parse_error& e) {
    throw ValidationError(std::string("engine config is not valid JSON: ") +
                          e.what());
  }
  return parseEngineConfig(j);
}

// -----------------------------------------------------------------------------
// loadEngineConfig(path)
// -----------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw NotFoundError("cannot open engine config: " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  EngineConfig config = parseEngineConfig(buffer.str());
  std::cout << "[EngineConfig] loaded " << path << ": "
            << config.members.size() << " member(s), "
            << config.operators.size() << " operator(s)\n";
  return config;
}

// -----------------------------------------------------------------------------
// seedRegistry()
// -----------------------------------------------------------------------------
void seedRegistry(const EngineConfig& config, MemberRegistry& registry) {
  for (const auto& member : config.members) {
    registry.registerMember(member.id, member.name, member.country);
    registry.setMemberStatus(member.id, member.status);
    for (const auto& seed : member.addresses) {
      registry.linkAddress(seed.address, member.id);
      if (!seed.roles.empty()) {
        registry.assignRoles(seed.address, seed.roles);
      }
    }
  }
  for (const auto& seed : config.operators) {
    registry.assignRoles(seed.address, seed.roles);
  }
  for (const auto& address : config.blacklist) {
    registry.setBlacklisted(address, true);
  }
}

}  // namespace gold
