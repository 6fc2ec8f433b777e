/**
 * @file identity_remapper.cpp
 * @brief Legacy-to-new identifier map for one restore pass
 */

#include "backup/identity_remapper.h"

namespace graphvault::backup {

bool IdentityRemapper::Register(const std::string& legacy_id, const std::string& new_id) {
  if (forward_.count(legacy_id) > 0 || assigned_.count(new_id) > 0) {
    return false;
  }
  forward_.emplace(legacy_id, new_id);
  assigned_.insert(new_id);
  return true;
}

std::optional<std::string> IdentityRemapper::Resolve(const std::string& legacy_id) const {
  auto iter = forward_.find(legacy_id);
  if (iter == forward_.end()) {
    return std::nullopt;
  }
  return iter->second;
}

void IdentityRemapper::Clear() {
  forward_.clear();
  assigned_.clear();
}

}  // namespace graphvault::backup
