#include "pg_repository.hpp"

#include "internal/db/sql/swap_sql.hpp"

namespace atomicswap::db::postgres {

namespace {

class PgRow final : public sql::Row {
 public:
  explicit PgRow(pqxx::row row) : row_(std::move(row)) {
  }

  std::string GetText(int col) const override {
    return row_[col].is_null() ? std::string() : std::string(row_[col].c_str());
  }

  std::int64_t GetInt64(int col) const override {
    return row_[col].as<std::int64_t>();
  }

  bool IsNull(int col) const override {
    return row_[col].is_null();
  }

 private:
  pqxx::row row_;
};

pqxx::params ToPq(const sql::Params& params) {
  pqxx::params out;
  for (const auto& p : params) {
    if (std::holds_alternative<std::nullptr_t>(p)) {
      out.append();
    } else if (const auto* v = std::get_if<std::int64_t>(&p)) {
      out.append(*v);
    } else {
      out.append(std::get<std::string>(p));
    }
  }
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::InsertSwap(Transaction& t, const model::SwapRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_swap", ToPq(sql::InsertParams(r)));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SwapRecord> PgRepository::GetSwap(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_swap", id);
  if (res.empty()) return std::nullopt;
  return sql::ReadSwap(PgRow(res[0]));
}

std::vector<model::SwapRecord> PgRepository::ListSwaps(Transaction& t, const SwapFilter& filter) {
  auto statement = sql::BuildList(filter);
  auto res       = TX(t).Work().exec_params(sql::ToPostgresPlaceholders(statement.sql), ToPq(statement.params));

  std::vector<model::SwapRecord> records;
  records.reserve(res.size());
  for (pqxx::result::size_type i = 0; i < res.size(); ++i) {
    records.push_back(sql::ReadSwap(PgRow(res[i])));
  }
  return records;
}

Result PgRepository::UpdateSwap(Transaction& t, const std::string& id, const model::SwapUpdate& update) {
  try {
    auto& work      = TX(t).Work();
    auto  statement = sql::BuildUpdate(id, update);
    auto  res       = work.exec_params(sql::ToPostgresPlaceholders(statement.sql), ToPq(statement.params));
    if (res.affected_rows() == 1) return Result::Ok();

    auto probe = work.exec_prepared("get_swap_version", id);
    if (probe.empty()) return Result::Err(ErrorCode::NotFound, "swap " + id + " not found");
    return Result::Err(ErrorCode::Conflict,
                       "swap " + id + " version " + probe[0][0].c_str() + " != expected " + std::to_string(update.expected_version));
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace atomicswap::db::postgres
