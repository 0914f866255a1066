#include "gold/registry/member_registry.hpp"
#include "gold/errors/ledger_error.hpp"

#include <iostream>
#include <mutex>

namespace gold {

void MemberRegistry::registerMember(const domain::MemberId& id,
                                    const std::string& name,
                                    const std::string& country) {
  if (id.empty()) {
    throw ValidationError("member id must not be empty");
  }

  std::unique_lock lock(mutex_);
  if (members_.count(id) != 0) {
    throw DuplicateError("member already registered: " + id);
  }
  members_.emplace(id, Member{id, name, country, domain::MemberStatus::Pending});

  std::cout << "[MemberRegistry] registered member=" << id << " (" << name
            << ")\n";
}

void MemberRegistry::setMemberStatus(const domain::MemberId& id,
                                     domain::MemberStatus status) {
  std::unique_lock lock(mutex_);
  auto it = members_.find(id);
  if (it == members_.end()) {
    throw NotFoundError("member not found: " + id);
  }
  it->second.status = status;

  std::cout << "[MemberRegistry] member=" << id
            << " status=" << domain::memberStatusToString(status) << "\n";
}

void MemberRegistry::linkAddress(const domain::Address& address,
                                 const domain::MemberId& member_id) {
  if (address.empty()) {
    throw ValidationError("address must not be empty");
  }

  std::unique_lock lock(mutex_);
  if (members_.count(member_id) == 0) {
    throw NotFoundError("member not found: " + member_id);
  }
  address_links_[address] = member_id;
}

void MemberRegistry::assignRoles(const domain::Address& address,
                                 domain::RoleSet roles) {
  std::unique_lock lock(mutex_);
  roles_[address] |= roles;
}

void MemberRegistry::revokeRoles(const domain::Address& address,
                                 domain::RoleSet roles) {
  std::unique_lock lock(mutex_);
  auto it = roles_.find(address);
  if (it == roles_.end()) {
    return;
  }
  domain::RoleSet remaining = it->second;
  for (domain::Role role : roles.roles()) {
    remaining = remaining.without(role);
  }
  it->second = remaining;
}

void MemberRegistry::setBlacklisted(const domain::Address& address,
                                    bool blacklisted) {
  std::unique_lock lock(mutex_);
  if (blacklisted) {
    blacklist_.insert(address);
  } else {
    blacklist_.erase(address);
  }

  std::cout << "[MemberRegistry] blacklist " << (blacklisted ? "add " : "remove ")
            << address << "\n";
}

std::optional<Member> MemberRegistry::member(
    const domain::MemberId& id) const {
  std::shared_lock lock(mutex_);
  auto it = members_.find(id);
  if (it == members_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Address> MemberRegistry::addressesOf(
    const domain::MemberId& id) const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Address> out;
  for (const auto& [address, member_id] : address_links_) {
    if (member_id == id) {
      out.push_back(address);
    }
  }
  return out;
}

std::size_t MemberRegistry::memberCount() const {
  std::shared_lock lock(mutex_);
  return members_.size();
}

bool MemberRegistry::isInRole(const domain::Address& address,
                              domain::Role role) const {
  return rolesOf(address).contains(role);
}

domain::RoleSet MemberRegistry::rolesOf(const domain::Address& address) const {
  std::shared_lock lock(mutex_);
  auto it = roles_.find(address);
  return it == roles_.end() ? domain::RoleSet{} : it->second;
}

domain::MemberStatus MemberRegistry::getMemberStatus(
    const domain::MemberId& member_id) const {
  std::shared_lock lock(mutex_);
  auto it = members_.find(member_id);
  if (it == members_.end()) {
    throw NotFoundError("member not found: " + member_id);
  }
  return it->second.status;
}

std::optional<domain::MemberId> MemberRegistry::memberOf(
    const domain::Address& address) const {
  std::shared_lock lock(mutex_);
  auto it = address_links_.find(address);
  if (it == address_links_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool MemberRegistry::isBlacklisted(const domain::Address& address) const {
  std::shared_lock lock(mutex_);
  return blacklist_.count(address) != 0;
}

}  // namespace gold
