#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace roombook::db::sql {

/*
  Parameter abstraction.

  Bound in order, position i -> ?(i+1). nullptr binds SQL NULL, which is
  how optional filters and nullable columns are expressed.
*/

using Param = std::variant<std::nullptr_t, int32_t, int64_t, uint64_t, std::string>;

using Params = std::vector<Param>;

} // namespace roombook::db::sql
