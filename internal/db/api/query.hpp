#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/state_machine.hpp"

namespace forecast::db {

inline constexpr std::size_t kDefaultMirrorLimit = 1000;

// Mirror row predicate. Every set field narrows the result.
struct MirrorFilter {
  std::optional<std::string> category;
  std::optional<std::string> class_name;
  std::optional<std::string> source;
  std::optional<std::string> dor;

  // Case-insensitive substring over entity id, manufacturer and model.
  std::optional<std::string> search;

  std::size_t limit  = kDefaultMirrorLimit;
  std::size_t offset = 0;
};

struct ModificationQuery {
  std::string organization_id;

  std::optional<std::string> user_id;
  std::optional<std::string> session_id;

  // Empty means all mirrors / all states.
  std::vector<std::string>                mirror_ids;
  std::vector<forecast::model::SyncState> states;
};

} // namespace forecast::db
