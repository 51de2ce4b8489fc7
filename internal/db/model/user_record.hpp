#pragma once

#include <string>

namespace forecast::db::model {

struct UserRecord {
  std::string id;
  std::string username;
  std::string display_name;
};

} // namespace forecast::db::model
