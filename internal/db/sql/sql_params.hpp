#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace forecast::db::sql {

/*
  Parameter abstraction.

  Postgres: $1 $2 $3
  SQLite:   ? ? ?

  Both use ordered binding, so one parameter list serves both.
*/

using Param = std::variant<
    std::nullptr_t,
    int64_t,
    std::string
>;

using Params = std::vector<Param>;

}
