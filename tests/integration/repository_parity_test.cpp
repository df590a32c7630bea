#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

#if ATOMICSWAP_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if ATOMICSWAP_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using atomicswap::db::ErrorCode;
using atomicswap::db::Repository;
using atomicswap::db::SwapFilter;
using atomicswap::db::memory::MemoryRepository;
using atomicswap::db::model::SwapRecord;
using atomicswap::db::model::SwapUpdate;
using atomicswap::model::Amount;
using atomicswap::model::SwapStatus;
using atomicswap::util::FromUnixSeconds;

std::int64_t NowSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

SwapRecord MakeSwap(std::int64_t created_at) {
  SwapRecord swap;
  swap.id                 = atomicswap::util::NewId();
  swap.status             = SwapStatus::kOffered;
  swap.initiator_asset    = "btc";
  swap.initiator_amount   = Amount::Parse("0.00012345");
  swap.acceptor_asset     = "depix";
  swap.acceptor_amount    = Amount::Parse("123456789.5");
  swap.initiator_address  = "depix-addr-alice";
  swap.hashlock           = "66687aadf862bd776c8fc18b8e9f8e20089714856ee233b3902a591d0d5f2925";
  swap.secret             = std::string(64, '0');
  swap.created_at         = FromUnixSeconds(created_at);
  swap.updated_at         = swap.created_at;
  swap.initiator_timelock = FromUnixSeconds(created_at + 24 * 3600);
  swap.acceptor_timelock  = FromUnixSeconds(created_at + 12 * 3600);
  swap.version            = 1;
  return swap;
}

void VerifyInsertGetRoundTrip(Repository& repo) {
  const auto swap = MakeSwap(NowSeconds());
  {
    auto tx = repo.Begin();
    assert(repo.InsertSwap(*tx, swap));
    // visible inside its own transaction
    assert(repo.GetSwap(*tx, swap.id).has_value());
    tx->Commit();
  }

  auto tx     = repo.Begin();
  auto stored = repo.GetSwap(*tx, swap.id);
  tx->Commit();
  assert(stored.has_value());
  assert(stored->status == SwapStatus::kOffered);
  assert(stored->initiator_amount == swap.initiator_amount);
  assert(stored->acceptor_amount == swap.acceptor_amount);
  assert(stored->hashlock == swap.hashlock);
  assert(stored->secret == swap.secret);
  assert(stored->initiator_timelock == swap.initiator_timelock);
  assert(stored->acceptor_timelock == swap.acceptor_timelock);
  assert(stored->created_at == swap.created_at);
  assert(!stored->acceptor_address.has_value());
  assert(!stored->initiator_txid.has_value());
  assert(!stored->last_error.has_value());
  assert(!stored->failed_at.has_value());
  assert(!stored->accepted_at.has_value());
  assert(stored->version == 1);
}

void VerifyDuplicateInsert(Repository& repo) {
  const auto swap = MakeSwap(NowSeconds());
  {
    auto tx = repo.Begin();
    assert(repo.InsertSwap(*tx, swap));
    tx->Commit();
  }
  auto       tx     = repo.Begin();
  const auto result = repo.InsertSwap(*tx, swap);
  assert(!result);
  assert(result.code == ErrorCode::AlreadyExists);
  tx->Rollback();
}

void VerifyCompareAndSetUpdate(Repository& repo) {
  const auto swap = MakeSwap(NowSeconds());
  {
    auto tx = repo.Begin();
    assert(repo.InsertSwap(*tx, swap));
    tx->Commit();
  }

  const auto now = FromUnixSeconds(NowSeconds());
  {
    SwapUpdate update;
    update.expected_version = 1;
    update.status           = SwapStatus::kAccepted;
    update.acceptor_address = "btc-addr-bob";
    update.accepted_at      = now;
    update.last_error       = std::optional<std::string>("insufficient funds");
    update.failed_at        = std::optional<atomicswap::util::TimePoint>(now);
    update.updated_at       = now;

    auto tx = repo.Begin();
    assert(repo.UpdateSwap(*tx, swap.id, update));
    tx->Commit();
  }
  {
    auto tx     = repo.Begin();
    auto stored = repo.GetSwap(*tx, swap.id);
    tx->Commit();
    assert(stored->version == 2);
    assert(stored->status == SwapStatus::kAccepted);
    assert(stored->acceptor_address == std::string("btc-addr-bob"));
    assert(stored->accepted_at == now);
    assert(stored->last_error == std::string("insufficient funds"));
    assert(stored->failed_at == now);
  }

  // stale version
  {
    SwapUpdate stale;
    stale.expected_version = 1;
    stale.status           = SwapStatus::kCancelled;
    stale.updated_at       = now;

    auto       tx     = repo.Begin();
    const auto result = repo.UpdateSwap(*tx, swap.id, stale);
    assert(result.code == ErrorCode::Conflict);
    tx->Rollback();
  }

  // clearing the marker, untouched fields stay
  {
    SwapUpdate clear;
    clear.expected_version = 2;
    clear.initiator_txid   = "btc-lock-1";
    clear.last_error       = std::optional<std::string>();
    clear.failed_at        = std::optional<atomicswap::util::TimePoint>();
    clear.updated_at       = now;

    auto tx = repo.Begin();
    assert(repo.UpdateSwap(*tx, swap.id, clear));
    auto stored = repo.GetSwap(*tx, swap.id);
    tx->Commit();
    assert(stored->version == 3);
    assert(stored->status == SwapStatus::kAccepted);
    assert(stored->initiator_txid == std::string("btc-lock-1"));
    assert(!stored->last_error.has_value());
    assert(!stored->failed_at.has_value());
  }

  SwapUpdate missing;
  missing.expected_version = 1;
  missing.updated_at       = now;
  auto tx                  = repo.Begin();
  assert(repo.UpdateSwap(*tx, atomicswap::util::NewId(), missing).code == ErrorCode::NotFound);
  assert(!repo.GetSwap(*tx, atomicswap::util::NewId()).has_value());
  tx->Rollback();
}

void VerifyRollbackDiscardsWrites(Repository& repo) {
  const auto swap = MakeSwap(NowSeconds());
  {
    auto tx = repo.Begin();
    assert(repo.InsertSwap(*tx, swap));
    tx->Rollback();
  }
  {
    // dropped without commit
    auto tx = repo.Begin();
    assert(repo.InsertSwap(*tx, MakeSwap(NowSeconds())));
  }
  auto tx = repo.Begin();
  assert(!repo.GetSwap(*tx, swap.id).has_value());
  tx->Commit();
}

std::ptrdiff_t IndexOf(const std::vector<SwapRecord>& swaps, const std::string& id) {
  const auto it = std::find_if(swaps.begin(), swaps.end(), [&](const SwapRecord& s) { return s.id == id; });
  return it == swaps.end() ? -1 : it - swaps.begin();
}

void VerifyListOrderAndFilter(Repository& repo) {
  const auto base  = NowSeconds() + 3600;
  auto       older = MakeSwap(base);
  auto       newer = MakeSwap(base + 10);
  auto       tie_a = MakeSwap(base + 5);
  auto       tie_b = MakeSwap(base + 5);
  if (tie_a.id > tie_b.id) std::swap(tie_a, tie_b);
  newer.status = SwapStatus::kInitiatorLocked;

  {
    auto tx = repo.Begin();
    for (const auto* s : {&older, &newer, &tie_a, &tie_b}) {
      assert(repo.InsertSwap(*tx, *s));
    }
    tx->Commit();
  }

  auto tx  = repo.Begin();
  auto all = repo.ListSwaps(*tx, SwapFilter::All());
  assert(IndexOf(all, newer.id) >= 0);
  assert(IndexOf(all, newer.id) < IndexOf(all, tie_b.id));
  assert(IndexOf(all, tie_b.id) < IndexOf(all, tie_a.id));
  assert(IndexOf(all, tie_a.id) < IndexOf(all, older.id));

  auto open = repo.ListSwaps(*tx, SwapFilter::Open());
  assert(IndexOf(open, older.id) >= 0);
  assert(IndexOf(open, newer.id) < 0);
  for (const auto& s : open) {
    assert(s.status == SwapStatus::kOffered);
  }

  auto active = repo.ListSwaps(*tx, SwapFilter::Active());
  assert(IndexOf(active, newer.id) >= 0);
  assert(IndexOf(active, older.id) < 0);
  tx->Commit();
}

// Two transactions read the same version; only the first writer wins.
void VerifyConcurrentWritersConflict(Repository& repo) {
  const auto swap = MakeSwap(NowSeconds());
  {
    auto tx = repo.Begin();
    assert(repo.InsertSwap(*tx, swap));
    tx->Commit();
  }

  SwapUpdate update;
  update.expected_version = 1;
  update.status           = SwapStatus::kCancelled;
  update.updated_at       = swap.created_at;

  auto first  = repo.Begin();
  auto second = repo.Begin();
  assert(repo.GetSwap(*second, swap.id).has_value());

  assert(repo.UpdateSwap(*first, swap.id, update));
  first->Commit();

  bool rejected = false;
  if (repo.UpdateSwap(*second, swap.id, update).code == ErrorCode::Conflict) {
    rejected = true;
    second->Rollback();
  } else {
    try {
      second->Commit();
    } catch (const std::exception&) {
      rejected = true;
    }
  }
  assert(rejected);

  auto tx     = repo.Begin();
  auto stored = repo.GetSwap(*tx, swap.id);
  tx->Commit();
  assert(stored->version == 2);
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }
  auto repo = backend.make_repository();
  auto swap = MakeSwap(NowSeconds());
  {
    auto tx = repo->Begin();
    assert(repo->InsertSwap(*tx, swap));
    tx->Commit();
  }
  {
    SwapUpdate update;
    update.expected_version = 1;
    update.status           = SwapStatus::kAccepted;
    update.acceptor_address = "btc-addr-bob";
    update.updated_at       = swap.created_at;
    auto tx                 = repo->Begin();
    assert(repo->UpdateSwap(*tx, swap.id, update));
    tx->Commit();
  }

  backend.restart(repo);
  auto tx     = repo->Begin();
  auto stored = repo->GetSwap(*tx, swap.id);
  tx->Commit();
  assert(stored.has_value());
  assert(stored->status == SwapStatus::kAccepted);
  assert(stored->version == 2);
  assert(stored->acceptor_amount == swap.acceptor_amount);
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if ATOMICSWAP_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path =
      (std::filesystem::temp_directory_path() / ("atomicswap_integration_sqlite_" + atomicswap::util::NewId() + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<atomicswap::db::sqlite::SqliteDB>(db_path);
    atomicswap::db::sql::RunMigrations(*db, atomicswap::db::sql::SqliteSchema());
    return std::make_shared<atomicswap::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = [db_path]() { std::filesystem::remove(db_path); },
      .supports_parallel_transactions = false,
  };
}
#endif

#if ATOMICSWAP_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("ATOMICSWAP_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("ATOMICSWAP_TEST_POSTGRES_URI is not set");
  }
  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<atomicswap::db::postgres::PgPool>(conninfo);
    atomicswap::db::postgres::PgMigrationExecutor executor(pool);
    atomicswap::db::sql::RunMigrations(executor, atomicswap::db::sql::PostgresSchema());
    return std::make_shared<atomicswap::db::postgres::PgRepository>(pool);
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running repository suite: " << backend.name << "\n";
  {
    auto repo = backend.make_repository();
    VerifyInsertGetRoundTrip(*repo);
    VerifyDuplicateInsert(*repo);
    VerifyCompareAndSetUpdate(*repo);
    VerifyRollbackDiscardsWrites(*repo);
    VerifyListOrderAndFilter(*repo);
    if (backend.supports_parallel_transactions) {
      VerifyConcurrentWritersConflict(*repo);
    }
  }
  VerifyRestartDurability(backend);
  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if ATOMICSWAP_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if ATOMICSWAP_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "atomicswap_integration_repository_parity: pass\n";
  return 0;
}
