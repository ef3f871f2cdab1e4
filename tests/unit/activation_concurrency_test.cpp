#include <cassert>

#include <atomic>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/license_key.hpp"
#include "internal/core/license_registry.hpp"
#include "internal/core/plan_catalog.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

#if NOVE_DB_SQLITE
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using nove::core::ActivationStatus;
using nove::core::IssueRequest;
using nove::core::LicenseRegistry;
using nove::core::PlanCatalog;
using nove::core::TrialRequest;
using nove::db::Repository;

constexpr int kThreads = 16;

struct Backend {
  std::string                                  name;
  std::function<std::shared_ptr<Repository>()> make_repository;
};

std::unique_ptr<LicenseRegistry> MakeRegistry(std::shared_ptr<Repository> repository) {
  return std::make_unique<LicenseRegistry>(std::move(repository), PlanCatalog::Default(),
                                           [](std::string_view plan) { return nove::core::GenerateLicenseKey("TEST", plan); });
}

// Runs fn(i) on kThreads threads released together.
void RunTogether(const std::function<void(int)>& fn) {
  std::atomic<bool>        go{false};
  std::vector<std::thread> threads;
  threads.reserve(kThreads);
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      while (!go.load()) std::this_thread::yield();
      fn(i);
    });
  }
  go = true;
  for (auto& t : threads) t.join();
}

void VerifyLimitNeverExceeded(const Backend& backend) {
  auto registry = MakeRegistry(backend.make_repository());

  IssueRequest request;
  request.plan           = "personal"; // limit 3
  request.customer_name  = "Concurrent";
  request.customer_email = "concurrent@example.com";
  const auto key         = registry->Issue(request).license_key;

  std::atomic<int> admitted{0};
  std::atomic<int> refused{0};
  RunTogether([&](int i) {
    try {
      registry->Activate(key, "machine-" + std::to_string(i));
      admitted.fetch_add(1);
    } catch (const nove::util::Forbidden& e) {
      assert(e.reason() == nove::util::ForbiddenReason::kLimitReached);
      refused.fetch_add(1);
    }
  });

  assert(admitted.load() == 3);
  assert(refused.load() == kThreads - 3);
  assert(registry->Validate(key).activated_count == 3);
  assert(registry->ListActivations(key).size() == 3);
}

void VerifyKnownMachineAlwaysAdmitted(const Backend& backend) {
  auto registry = MakeRegistry(backend.make_repository());

  IssueRequest request;
  request.plan           = "trial14";
  request.customer_name  = "Heartbeat";
  request.customer_email = "heartbeat@example.com";
  const auto key         = registry->Issue(request).license_key;
  registry->Activate(key, "only-machine");

  std::atomic<int> valid{0};
  RunTogether([&](int) {
    auto result = registry->Activate(key, "only-machine");
    if (result.status == ActivationStatus::kValid && result.activated_count == 1) valid.fetch_add(1);
  });
  assert(valid.load() == kThreads);
}

void VerifyOneTrialPerEmail(const Backend& backend) {
  auto registry = MakeRegistry(backend.make_repository());

  std::atomic<int> issued{0};
  std::atomic<int> duplicates{0};
  RunTogether([&](int i) {
    try {
      // Case and whitespace differ; the normalized address is the same.
      registry->IssueTrial(TrialRequest{"Racer " + std::to_string(i), i % 2 ? " Race@Example.com" : "race@example.com", ""});
      issued.fetch_add(1);
    } catch (const nove::util::DuplicateTrial&) {
      duplicates.fetch_add(1);
    }
  });

  assert(issued.load() == 1);
  assert(duplicates.load() == kThreads - 1);

  auto licenses = registry->ListLicenses();
  assert(licenses.size() == 1);
  assert(licenses[0].record.customer_email == "race@example.com");
}

void RunBackend(const Backend& backend) {
  VerifyLimitNeverExceeded(backend);
  VerifyKnownMachineAlwaysAdmitted(backend);
  VerifyOneTrialPerEmail(backend);
  std::cout << "  " << backend.name << ": ok\n";
}

} // namespace

int main() {
  std::vector<Backend> backends;
  backends.push_back({"memory", [] { return std::make_shared<nove::db::memory::MemoryRepository>(); }});

#if NOVE_DB_SQLITE
  const auto dir = std::filesystem::temp_directory_path() / "nove_activation_concurrency";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  auto counter = std::make_shared<int>(0);
  backends.push_back({"sqlite", [dir, counter] {
                        const auto path = dir / ("ledger_" + std::to_string(++*counter) + ".db");
                        auto       db   = std::make_shared<nove::db::sqlite::SqliteDB>(path.string());
                        nove::db::sql::RunMigrations(*db, nove::db::sql::SqliteSchema());
                        return std::make_shared<nove::db::sqlite::SqliteRepository>(std::move(db));
                      }});
#endif

  for (const auto& backend : backends) {
    RunBackend(backend);
  }

#if NOVE_DB_SQLITE
  std::filesystem::remove_all(dir);
#endif

  std::cout << "nove_unit_activation_concurrency: pass\n";
  return 0;
}
