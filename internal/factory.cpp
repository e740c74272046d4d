#include "factory.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/delivery_report_server.hpp"
#include "internal/grpc/monitor_control_server.hpp"
#include "internal/hardware/file_register_reader.hpp"
#include "internal/hardware/simulated_register_reader.hpp"
#include "internal/monitor/cycle_ticker.hpp"
#include "internal/monitor/delivery_tracker.hpp"
#include "internal/monitor/monitoring_flag.hpp"
#include "internal/monitor/poll_cycle.hpp"
#include "internal/monitor/transition_detector.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/monitor_service.hpp"
#include "internal/service/report_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#if BREWMON_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if BREWMON_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace brewmon::factory {

using observability::IntField;
using observability::StringField;

Application::Application()                                  = default;
Application::Application(Application&&) noexcept            = default;
Application& Application::operator=(Application&&) noexcept = default;
Application::~Application()                                 = default;

void ValidateConfig(const brewmon::runtime::config::RuntimeConfig& config) {
  const auto interval = config.monitor().poll_interval_ms();
  if (interval < monitor::kMinPollIntervalMs || interval > monitor::kMaxPollIntervalMs) {
    throw util::InvalidArgument("monitor.poll_interval_ms must be between " + std::to_string(monitor::kMinPollIntervalMs) + " and " +
                                std::to_string(monitor::kMaxPollIntervalMs) + ", got " + std::to_string(interval));
  }

  const auto& machine = config.machine();
  if (machine.group_count() > monitor::kMaxGroupCount) {
    throw util::InvalidArgument("machine.group_count must be at most " + std::to_string(monitor::kMaxGroupCount));
  }
  if (machine.has_simulated() && machine.simulated().initial_status_words_size() > static_cast<int>(monitor::kMaxGroupCount)) {
    throw util::InvalidArgument("machine.simulated.initial_status_words has more entries than groups");
  }
  for (auto word : machine.simulated().initial_status_words()) {
    if (word > 0xffff) {
      throw util::InvalidArgument("machine.simulated.initial_status_words entries must fit in 16 bits");
    }
  }
  if (machine.has_register_file() && machine.register_file().path().empty()) {
    throw util::InvalidArgument("machine.register_file.path is required");
  }

  const auto& database = config.database();
  if (database.has_sqlite() && database.sqlite().path().empty()) {
    throw util::InvalidArgument("database.sqlite.path is required");
  }
  if (database.has_postgres() && database.postgres().connection_uri().empty()) {
    throw util::InvalidArgument("database.postgres.connection_uri is required");
  }
}

std::shared_ptr<db::Repository> BuildRepository(const brewmon::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if BREWMON_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    sqlite_db->BootstrapSchema();
    BREWMON_LOG_INFO("record store ready", {StringField("backend", "sqlite"), StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw util::InvalidArgument("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if BREWMON_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 4;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    pool->BootstrapSchema();
    BREWMON_LOG_INFO("record store ready", {StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw util::InvalidArgument("postgres backend requested but not enabled at build time");
#endif
  }

  BREWMON_LOG_INFO("record store ready", {StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<hardware::RegisterReader> BuildRegisterReader(const brewmon::runtime::config::RuntimeConfig& config) {
  const auto& machine = config.machine();
  if (machine.has_register_file()) {
    const auto& file = machine.register_file();
    BREWMON_LOG_INFO("machine interface", {StringField("type", "register_file"), StringField("path", file.path()),
                                          IntField("max_age_ms", static_cast<std::int64_t>(file.max_age_ms()))});
    return std::make_shared<hardware::FileRegisterReader>(file.path(), std::chrono::milliseconds(file.max_age_ms()));
  }

  std::optional<std::uint32_t> group_count;
  if (machine.group_count() > 0) group_count = machine.group_count();

  auto reader = std::make_shared<hardware::SimulatedRegisterReader>(group_count);
  const auto& words = machine.simulated().initial_status_words();
  for (int i = 0; i < words.size(); ++i) {
    reader->SetStatusWord(static_cast<std::uint32_t>(i + 1), static_cast<std::uint16_t>(words[i]));
  }
  BREWMON_LOG_INFO("machine interface", {StringField("type", "simulated")});
  return reader;
}

/*
    Build full application dependency graph
*/
Application Build(const brewmon::runtime::config::RuntimeConfig& config) {
  ValidateConfig(config);

  Application app;

  // ------------------------------------------------------------------
  // Record store and machine interface
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.reader     = BuildRegisterReader(config);

  // ------------------------------------------------------------------
  // Monitoring core
  // ------------------------------------------------------------------
  app.flag        = std::make_shared<monitor::MonitoringFlag>(config.monitor().start_enabled());
  auto detector   = std::make_shared<monitor::TransitionDetector>(app.reader);
  auto tracker    = std::make_shared<monitor::DeliveryTracker>(app.repository);
  app.poll_cycle  = std::make_shared<monitor::PollCycle>(app.flag, app.reader, detector, tracker, config.machine().group_count());

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository = app.repository;
  ctx.flag       = app.flag;
  ctx.poll_cycle = app.poll_cycle;
  ctx.tracker    = tracker;

  app.monitor_service = std::make_shared<service::MonitorService>(ctx);
  app.report_service  = std::make_shared<service::ReportService>(ctx);

  // ------------------------------------------------------------------
  // Cadence driver
  // ------------------------------------------------------------------
  std::weak_ptr<service::MonitorService> weak_monitor = app.monitor_service;
  app.ticker = std::make_unique<monitor::CycleTicker>(
      std::chrono::milliseconds(config.monitor().poll_interval_ms()),
      [weak_monitor] {
        if (auto svc = weak_monitor.lock()) svc->RunCycleNow();
      },
      [weak_monitor](const std::exception& e) {
        if (auto svc = weak_monitor.lock()) svc->RecordCycleError(e);
      });

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::MonitorControlServer>(app.monitor_service));
  app.grpc_services.push_back(std::make_unique<grpc::DeliveryReportServer>(app.report_service));

  return app;
}

} // namespace brewmon::factory
