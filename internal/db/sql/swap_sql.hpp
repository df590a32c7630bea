#pragma once

#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/swap_record.hpp"
#include "internal/db/sql/sql_types.hpp"

namespace atomicswap::db::sql {

/*
  Row mapping shared by the sqlite and postgres repositories.

  Storage layout: status as its name, amounts as decimal text, instants
  as integer seconds since epoch, absent optionals as NULL.
*/

struct Statement {
  std::string sql;
  Params      params;
};

Params InsertParams(const model::SwapRecord& record);

model::SwapRecord ReadSwap(const Row& row);

// SELECT ... WHERE status IN (...) ORDER BY created_at DESC
Statement BuildList(const SwapFilter& filter);

// UPDATE ... SET <fields>, version=version+1 WHERE id=? AND version=?
Statement BuildUpdate(const std::string& id, const model::SwapUpdate& update);

// '?' -> '$1', '$2', ...
std::string ToPostgresPlaceholders(const std::string& sql);

} // namespace atomicswap::db::sql
