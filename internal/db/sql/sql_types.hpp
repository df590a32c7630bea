#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace atomicswap::db::sql {

// Positional bind value. Statements are written with '?' placeholders;
// postgres gets them renumbered by ToPostgresPlaceholders().
using Param  = std::variant<std::nullptr_t, std::int64_t, std::string>;
using Params = std::vector<Param>;

// Read side of one result row, so swap decoding never sees pqxx or sqlite3 types.
class Row {
 public:
  virtual ~Row() = default;

  virtual bool         IsNull(int col) const   = 0;
  virtual std::string  GetText(int col) const  = 0;
  virtual std::int64_t GetInt64(int col) const = 0;

  // version and other counters are stored signed.
  std::uint64_t GetU64(int col) const { return static_cast<std::uint64_t>(GetInt64(col)); }
};

} // namespace atomicswap::db::sql
