#include "schedule_service.hpp"

#include <algorithm>

#include "internal/availability/availability_service.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/api/tx_helpers.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "observe_rpc.hpp"
#include "proto_convert.hpp"

namespace booking::service {

using namespace booking::engine::v1;

namespace {

constexpr int32_t  kMaxUtcOffsetMinutes = 14 * 60;
constexpr uint32_t kMaxCommitAttempts   = 5;

const db::DateRange kAllDates{"0000-01-01", "9999-12-31"};

db::model::ProviderRecord RequireProvider(db::Repository& repository, db::Transaction& tx, const std::string& provider_id) {
  auto provider = repository.GetProvider(tx, provider_id);
  if (!provider) {
    throw util::NotFound("provider not found: " + provider_id);
  }
  return *provider;
}

} // namespace

ScheduleService::ScheduleService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

UpsertProviderResponse ScheduleService::UpsertProvider(const UpsertProviderRequest& req) {
  return ObserveRpc("ScheduleService.UpsertProvider", req.provider().id(), [&] {
    const auto& in = req.provider();
    if (in.id().empty()) {
      throw util::ValidationError("provider id is required");
    }
    if (in.utc_offset_minutes() < -kMaxUtcOffsetMinutes || in.utc_offset_minutes() > kMaxUtcOffsetMinutes) {
      throw util::ValidationError("utc_offset_minutes must be within +/-14h");
    }

    const auto now_ms = util::ToUnixMillis(util::Now());
    auto       record = db::RetryOnCommitConflict(kMaxCommitAttempts, [&] {
      auto tx       = ctx_.repository->Begin();
      auto existing = ctx_.repository->GetProvider(*tx, in.id());

      db::model::ProviderRecord provider;
      provider.id                 = in.id();
      provider.display_name       = in.display_name();
      provider.utc_offset_minutes = in.utc_offset_minutes();
      provider.created_at_ms      = existing ? existing->created_at_ms : now_ms;
      provider.updated_at_ms      = now_ms;
      db::ThrowIfDbError(ctx_.repository->UpsertProvider(*tx, provider), "upsert provider");
      tx->Commit();
      return provider;
    });

    BOOKING_LOG_INFO("provider saved", {observability::StringField("provider_id", record.id),
                                        observability::IntField("utc_offset_minutes", record.utc_offset_minutes)});
    UpsertProviderResponse resp;
    *resp.mutable_provider() = ToProto(record);
    return resp;
  });
}

SetWeeklyScheduleResponse ScheduleService::SetWeeklySchedule(const SetWeeklyScheduleRequest& req) {
  return ObserveRpc("ScheduleService.SetWeeklySchedule", req.provider_id(), [&] {
    std::vector<db::model::AvailabilityWindowRecord> windows;
    for (const auto& in : req.windows()) {
      if (in.day_of_week() > 6) {
        throw util::ValidationError("day_of_week must be 0-6");
      }
      if (in.start_minute() >= in.end_minute() || in.end_minute() > model::kMinutesPerDay) {
        throw util::ValidationError("window start must be before end within one day");
      }
      db::model::AvailabilityWindowRecord window;
      window.id           = util::NewId();
      window.provider_id  = req.provider_id();
      window.day_of_week  = in.day_of_week();
      window.start_minute = in.start_minute();
      window.end_minute   = in.end_minute();
      window.active       = true;
      windows.push_back(std::move(window));
    }

    // Cached days ahead of the provider's today depend on the old windows.
    const auto horizon = std::max<uint32_t>(ctx_.availability->Options().max_range_days, 1);

    db::RetryOnCommitConflict(kMaxCommitAttempts, [&] {
      auto       tx       = ctx_.repository->Begin();
      const auto provider = RequireProvider(*ctx_.repository, *tx, req.provider_id());
      db::ThrowIfDbError(ctx_.repository->ReplaceAvailabilityWindows(*tx, req.provider_id(), windows), "replace availability windows");

      const auto today = util::LocalDateOf(util::Now(), provider.utc_offset_minutes);
      for (uint32_t day = 0; day < horizon; ++day) {
        db::ThrowIfDbError(ctx_.repository->InvalidateCachedSlots(*tx, req.provider_id(), util::FormatDate(util::AddDays(today, static_cast<int>(day)))),
                           "invalidate availability cache");
      }
      tx->Commit();
    });

    BOOKING_LOG_INFO("weekly schedule replaced",
                     {observability::StringField("provider_id", req.provider_id()), observability::IntField("windows", static_cast<std::int64_t>(windows.size()))});
    SetWeeklyScheduleResponse resp;
    for (const auto& window : windows) {
      *resp.add_windows() = ToProto(window);
    }
    return resp;
  });
}

BlockSlotResponse ScheduleService::BlockSlot(const BlockSlotRequest& req) {
  return ObserveRpc("ScheduleService.BlockSlot", req.provider_id(), [&] {
    const auto from = util::ParseDate(req.date());
    const auto to   = req.date_to().empty() ? from : util::ParseDate(req.date_to());
    const int  span = util::DaysBetween(from, to);
    if (span < 0) {
      throw util::ValidationError("date is after date_to");
    }
    const auto max_days = ctx_.availability->Options().max_range_days;
    if (max_days > 0 && static_cast<uint32_t>(span) >= max_days) {
      throw util::ValidationError("block range exceeds " + std::to_string(max_days) + " days");
    }
    if (!req.full_day() && (req.start_minute() >= req.end_minute() || req.end_minute() > model::kMinutesPerDay)) {
      throw util::ValidationError("partial block needs start before end within one day");
    }

    const auto now_ms = util::ToUnixMillis(util::Now());
    std::vector<db::model::BlockedSlotRecord> blocks;
    for (int offset = 0; offset <= span; ++offset) {
      db::model::BlockedSlotRecord block;
      block.id            = util::NewId();
      block.provider_id   = req.provider_id();
      block.date          = util::FormatDate(util::AddDays(from, offset));
      block.full_day      = req.full_day();
      block.start_minute  = req.full_day() ? 0 : req.start_minute();
      block.end_minute    = req.full_day() ? 0 : req.end_minute();
      block.reason        = req.reason();
      block.created_at_ms = now_ms;
      blocks.push_back(std::move(block));
    }

    db::RetryOnCommitConflict(kMaxCommitAttempts, [&] {
      auto tx = ctx_.repository->Begin();
      RequireProvider(*ctx_.repository, *tx, req.provider_id());
      for (const auto& block : blocks) {
        db::ThrowIfDbError(ctx_.repository->InsertBlockedSlot(*tx, block), "insert blocked slot");
        db::ThrowIfDbError(ctx_.repository->InvalidateCachedSlots(*tx, block.provider_id, block.date), "invalidate availability cache");
      }
      tx->Commit();
    });

    BOOKING_LOG_INFO("slots blocked", {observability::StringField("provider_id", req.provider_id()), observability::StringField("from", req.date()),
                                       observability::IntField("days", span + 1), observability::BoolField("full_day", req.full_day())});
    BlockSlotResponse resp;
    for (const auto& block : blocks) {
      *resp.add_blocks() = ToProto(block);
    }
    return resp;
  });
}

void ScheduleService::UnblockSlot(const UnblockSlotRequest& req) {
  ObserveRpc("ScheduleService.UnblockSlot", req.block_id(), [&] {
    if (req.provider_id().empty() || req.block_id().empty()) {
      throw util::ValidationError("provider_id and block_id are required");
    }

    db::RetryOnCommitConflict(kMaxCommitAttempts, [&] {
      auto tx     = ctx_.repository->Begin();
      auto blocks = ctx_.repository->ListBlockedSlots(*tx, req.provider_id(), kAllDates);
      auto it     = std::find_if(blocks.begin(), blocks.end(), [&](const db::model::BlockedSlotRecord& b) {
        return b.id == req.block_id();
      });
      if (it == blocks.end()) {
        throw util::NotFound("blocked slot not found: " + req.block_id());
      }
      db::ThrowIfDbError(ctx_.repository->DeleteBlockedSlot(*tx, req.provider_id(), req.block_id()), "delete blocked slot");
      db::ThrowIfDbError(ctx_.repository->InvalidateCachedSlots(*tx, req.provider_id(), it->date), "invalidate availability cache");
      tx->Commit();
    });

    BOOKING_LOG_INFO("slot unblocked", {observability::StringField("provider_id", req.provider_id()), observability::StringField("block_id", req.block_id())});
  });
}

} // namespace booking::service
