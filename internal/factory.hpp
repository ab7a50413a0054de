#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/service/service_context.hpp"

namespace booking::db {
class Repository;
}
namespace booking::events {
class EventSink;
}
namespace booking::payout {
class PaymentProvider;
}
namespace booking::worker {
class HousekeepingWorker;
}

namespace booking::factory {

/*
  Runtime

  Owns all long-lived components used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Runtime {
  service::ServiceContext                     services;
  std::shared_ptr<events::EventSink>          events;
  std::shared_ptr<worker::HousekeepingWorker> housekeeping;
};

/*
  Composition root. The ONLY place allowed to know concrete DB types.

  Applies the schema before returning.
*/
std::shared_ptr<db::Repository> BuildRepository(const booking::runtime::config::DatabaseConfig& database);

// provider may be null; due payouts then fail transiently until one is configured.
Runtime BuildRuntime(const booking::runtime::config::RuntimeConfig& config, std::shared_ptr<payout::PaymentProvider> provider);

} // namespace booking::factory
