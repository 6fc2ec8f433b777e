/**
 * @file identity_remapper.h
 * @brief Legacy-to-new identifier map for one restore pass
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace graphvault::backup {

/**
 * @brief Bijective legacy id -> new id map
 *
 * One instance per restore; holds only nodes actually (re)created in that
 * pass. A legacy id or a new id can be registered at most once.
 */
class IdentityRemapper {
 public:
  /**
   * @brief Register a mapping
   * @return false if either id is already mapped (nothing changes)
   */
  bool Register(const std::string& legacy_id, const std::string& new_id);

  [[nodiscard]] std::optional<std::string> Resolve(const std::string& legacy_id) const;

  [[nodiscard]] bool Contains(const std::string& legacy_id) const { return forward_.count(legacy_id) > 0; }

  [[nodiscard]] size_t Size() const { return forward_.size(); }

  void Clear();

 private:
  std::unordered_map<std::string, std::string> forward_;
  std::unordered_set<std::string> assigned_;
};

}  // namespace graphvault::backup
