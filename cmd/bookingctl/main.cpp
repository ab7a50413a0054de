#include <grpcpp/grpcpp.h>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

#include "booking/engine/v1/booking_service.grpc.pb.h"
#include "booking/engine/v1/payout_admin_service.grpc.pb.h"
#include "booking/engine/v1/schedule_service.grpc.pb.h"
#include "internal/util/time.hpp"

using namespace booking::engine::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  bookingctl <addr> provider <id> <display_name> [utc_offset_minutes]\n"
            << "  bookingctl <addr> schedule <provider> <dow>@<HH:MM>-<HH:MM> ...\n"
            << "  bookingctl <addr> block <provider> <date> [date_to] [HH:MM-HH:MM] [reason]\n"
            << "  bookingctl <addr> unblock <provider> <block_id>\n"
            << "  bookingctl <addr> availability <provider> <date_from> [date_to] [duration_minutes]\n"
            << "  bookingctl <addr> lock <provider> <date> <HH:MM-HH:MM> <session> [ttl_seconds]\n"
            << "  bookingctl <addr> unlock <lock_id>\n"
            << "  bookingctl <addr> book <provider> <customer_id|guest_email> <date> <HH:MM-HH:MM> <base_price_cents> [lock_id]\n"
            << "  bookingctl <addr> get <booking_id>\n"
            << "  bookingctl <addr> code <confirmation_code>\n"
            << "  bookingctl <addr> transition <booking_id> <status> <triggered_by> [reason]\n"
            << "  bookingctl <addr> history <booking_id>\n"
            << "  bookingctl <addr> payout <payout_id>\n"
            << "  bookingctl <addr> payouts [provider] [status]\n"
            << "  bookingctl <addr> payout-stats [provider]\n"
            << "  bookingctl <addr> cancel-payout <payout_id> <performed_by> [reason]\n"
            << "  bookingctl <addr> complete-payout <payout_id> <external_transaction_id> <performed_by> [notes]\n"
            << "  bookingctl <addr> process-payouts [limit]\n";
}

static std::pair<uint32_t, uint32_t> ParseInterval(const std::string& value) {
  const auto dash = value.find('-');
  if (dash == std::string::npos) {
    throw std::invalid_argument("expected HH:MM-HH:MM, got '" + value + "'");
  }
  return {booking::util::ParseMinuteOfDay(value.substr(0, dash)), booking::util::ParseMinuteOfDay(value.substr(dash + 1))};
}

static std::optional<BookingStatus> ParseBookingStatus(const std::string& value) {
  BookingStatus status;
  if (BookingStatus_Parse("BOOKING_STATUS_" + value, &status) && status != BOOKING_STATUS_UNSPECIFIED) {
    return status;
  }
  return std::nullopt;
}

static std::optional<PayoutStatus> ParsePayoutStatus(const std::string& value) {
  PayoutStatus status;
  if (PayoutStatus_Parse("PAYOUT_STATUS_" + value, &status) && status != PAYOUT_STATUS_UNSPECIFIED) {
    return status;
  }
  return std::nullopt;
}

static std::string Upper(std::string value) {
  for (auto& c : value) {
    if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
  }
  return value;
}

static std::string Interval(uint32_t start, uint32_t end) {
  return booking::util::FormatMinuteOfDay(start) + "-" + booking::util::FormatMinuteOfDay(end);
}

static void PrintBooking(const Booking& b) {
  std::cout << "id=" << b.id() << "\n"
            << "code=" << b.confirmation_code() << "\n"
            << "provider=" << b.provider_id() << "\n"
            << "slot=" << b.date() << " " << Interval(b.start_minute(), b.end_minute()) << "\n"
            << "status=" << BookingStatus_Name(b.status()) << "\n"
            << "total_cents=" << b.price().total_cents() << " " << b.price().currency() << "\n"
            << "platform_fee_cents=" << b.price().platform_fee_cents() << "\n"
            << "provider_payout_cents=" << b.price().provider_payout_cents() << "\n";
  if (b.cancellation_fee_cents() > 0) {
    std::cout << "cancellation_fee_cents=" << b.cancellation_fee_cents() << "\n";
  }
}

static void PrintPayout(const Payout& p) {
  std::cout << "id=" << p.id() << " booking=" << p.booking_id() << " provider=" << p.provider_id() << " amount_cents=" << p.amount_cents() << " "
            << p.currency() << " status=" << PayoutStatus_Name(p.status()) << " retries=" << p.retry_count();
  if (!p.external_transfer_id().empty()) {
    std::cout << " transfer=" << p.external_transfer_id();
  }
  if (!p.failure_reason().empty()) {
    std::cout << " reason=\"" << p.failure_reason() << "\"";
  }
  std::cout << "\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  if (status.error_code() == grpc::StatusCode::ABORTED && !status.error_details().empty()) {
    GetAvailabilityResponse alternatives;
    if (alternatives.ParseFromString(status.error_details())) {
      for (const auto& slot : alternatives.slots()) {
        std::cerr << "alternative=" << slot.date() << " " << Interval(slot.start_minute(), slot.end_minute()) << "\n";
      }
    }
  }
  return 2;
}

static int Run(int argc, char** argv) {
  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto booking_stub  = BookingService::NewStub(channel);
  auto schedule_stub = ScheduleService::NewStub(channel);
  auto payout_stub   = PayoutAdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "provider") {
    if (argc < 5) return 1;

    UpsertProviderRequest req;
    req.mutable_provider()->set_id(argv[3]);
    req.mutable_provider()->set_display_name(argv[4]);
    req.mutable_provider()->set_utc_offset_minutes(argc >= 6 ? std::stoi(argv[5]) : 0);

    UpsertProviderResponse resp;
    auto status = schedule_stub->UpsertProvider(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "provider=" << resp.provider().id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "schedule") {
    if (argc < 4) return 1;

    SetWeeklyScheduleRequest req;
    req.set_provider_id(argv[3]);
    for (int i = 4; i < argc; ++i) {
      const std::string spec = argv[i];
      const auto        at   = spec.find('@');
      if (at == std::string::npos) {
        std::cerr << "expected <dow>@<HH:MM>-<HH:MM>, got '" << spec << "'\n";
        return 1;
      }
      const auto [start, end] = ParseInterval(spec.substr(at + 1));
      auto* window            = req.add_windows();
      window->set_day_of_week(static_cast<uint32_t>(std::stoul(spec.substr(0, at))));
      window->set_start_minute(start);
      window->set_end_minute(end);
      window->set_active(true);
    }

    SetWeeklyScheduleResponse resp;
    auto status = schedule_stub->SetWeeklySchedule(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "windows=" << resp.windows_size() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "block") {
    if (argc < 5) return 1;

    BlockSlotRequest req;
    req.set_provider_id(argv[3]);
    req.set_date(argv[4]);
    req.set_full_day(true);
    int next = 5;
    if (argc > next && std::string(argv[next]).find(':') == std::string::npos && std::string(argv[next]).size() == 10) {
      req.set_date_to(argv[next++]);
    }
    if (argc > next && std::string(argv[next]).find(':') != std::string::npos) {
      const auto [start, end] = ParseInterval(argv[next++]);
      req.set_full_day(false);
      req.set_start_minute(start);
      req.set_end_minute(end);
    }
    if (argc > next) {
      req.set_reason(argv[next]);
    }

    BlockSlotResponse resp;
    auto status = schedule_stub->BlockSlot(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& block : resp.blocks()) {
      std::cout << "block=" << block.id() << " date=" << block.date() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "unblock") {
    if (argc < 5) return 1;

    UnblockSlotRequest req;
    req.set_provider_id(argv[3]);
    req.set_block_id(argv[4]);

    UnblockSlotResponse resp;
    auto status = schedule_stub->UnblockSlot(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "unblocked\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "availability") {
    if (argc < 5) return 1;

    GetAvailabilityRequest req;
    req.set_provider_id(argv[3]);
    req.set_date_from(argv[4]);
    req.set_date_to(argc >= 6 ? argv[5] : argv[4]);
    req.set_duration_minutes(argc >= 7 ? static_cast<uint32_t>(std::stoul(argv[6])) : 0);

    GetAvailabilityResponse resp;
    auto status = booking_stub->GetAvailability(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& slot : resp.slots()) {
      std::cout << slot.date() << " " << Interval(slot.start_minute(), slot.end_minute()) << " " << (slot.available() ? "free" : "taken") << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "lock") {
    if (argc < 7) return 1;

    const auto [start, end] = ParseInterval(argv[5]);

    AcquireSlotLockRequest req;
    req.set_provider_id(argv[3]);
    req.set_date(argv[4]);
    req.set_start_minute(start);
    req.set_end_minute(end);
    req.set_session_id(argv[6]);
    if (argc >= 8) {
      req.mutable_ttl()->set_seconds(std::stoll(argv[7]));
    }

    AcquireSlotLockResponse resp;
    auto status = booking_stub->AcquireSlotLock(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (!resp.acquired()) {
      std::cout << "contested\n";
      for (const auto& slot : resp.alternatives()) {
        std::cout << "alternative=" << slot.date() << " " << Interval(slot.start_minute(), slot.end_minute()) << "\n";
      }
      return 3;
    }
    std::cout << "lock=" << resp.lock().lock_id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "unlock") {
    if (argc < 4) return 1;

    ReleaseSlotLockRequest req;
    req.set_lock_id(argv[3]);

    ReleaseSlotLockResponse resp;
    auto status = booking_stub->ReleaseSlotLock(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "released\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "book") {
    if (argc < 8) return 1;

    const std::string who       = argv[4];
    const auto [start, end]     = ParseInterval(argv[6]);

    CreateBookingRequest req;
    req.set_provider_id(argv[3]);
    if (who.find('@') != std::string::npos) {
      req.set_guest_email(who);
    } else {
      req.set_customer_id(who);
    }
    req.set_date(argv[5]);
    req.set_start_minute(start);
    req.set_end_minute(end);
    req.set_base_price_cents(std::stoll(argv[7]));
    if (argc >= 9) {
      req.set_slot_lock_id(argv[8]);
    }

    CreateBookingResponse resp;
    auto status = booking_stub->CreateBooking(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintBooking(resp.booking());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get" || cmd == "code") {
    if (argc < 4) return 1;

    GetBookingRequest req;
    if (cmd == "get") {
      req.set_id(argv[3]);
    } else {
      req.set_confirmation_code(argv[3]);
    }

    GetBookingResponse resp;
    auto status = booking_stub->GetBooking(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintBooking(resp.booking());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "transition") {
    if (argc < 6) return 1;

    auto target = ParseBookingStatus(Upper(argv[4]));
    if (!target) {
      std::cerr << "unknown status: " << argv[4] << "\n";
      return 1;
    }

    TransitionBookingRequest req;
    req.set_booking_id(argv[3]);
    req.set_target(*target);
    req.set_triggered_by(argv[5]);
    if (argc >= 7) {
      req.set_reason(argv[6]);
    }

    TransitionBookingResponse resp;
    auto status = booking_stub->TransitionBooking(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintBooking(resp.booking());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "history") {
    if (argc < 4) return 1;

    ListTransitionsRequest req;
    req.set_booking_id(argv[3]);

    ListTransitionsResponse resp;
    auto status = booking_stub->ListTransitions(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& t : resp.transitions()) {
      std::cout << t.created_at().seconds() << " " << BookingStatus_Name(t.from_status()) << " -> " << BookingStatus_Name(t.to_status()) << " by "
                << t.triggered_by();
      if (!t.reason().empty()) {
        std::cout << " (" << t.reason() << ")";
      }
      std::cout << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "payout") {
    if (argc < 4) return 1;

    GetPayoutRequest req;
    req.set_payout_id(argv[3]);

    GetPayoutResponse resp;
    auto status = payout_stub->GetPayout(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintPayout(resp.payout());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "payouts") {
    ListPayoutsRequest req;
    if (argc >= 4) {
      req.set_provider_id(argv[3]);
    }
    if (argc >= 5) {
      auto parsed = ParsePayoutStatus(Upper(argv[4]));
      if (!parsed) {
        std::cerr << "unknown payout status: " << argv[4] << "\n";
        return 1;
      }
      req.add_statuses(*parsed);
    }

    ListPayoutsResponse resp;
    auto status = payout_stub->ListPayouts(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& payout : resp.payouts()) {
      PrintPayout(payout);
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "payout-stats") {
    PayoutStatsRequest req;
    if (argc >= 4) {
      req.set_provider_id(argv[3]);
    }

    PayoutStatsResponse resp;
    auto status = payout_stub->PayoutStats(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "scheduled=" << resp.scheduled() << "\n";
    std::cout << "processing=" << resp.processing() << "\n";
    std::cout << "completed=" << resp.completed() << "\n";
    std::cout << "failed=" << resp.failed() << "\n";
    std::cout << "cancelled=" << resp.cancelled() << "\n";
    std::cout << "completed_value_cents=" << resp.completed_value_cents() << "\n";
    std::cout << "pending_value_cents=" << resp.pending_value_cents() << "\n";
    if (resp.has_oldest_pending_scheduled_at()) {
      std::cout << "oldest_pending_scheduled_at=" << resp.oldest_pending_scheduled_at().seconds() << "\n";
    }
    std::cout << "failure_rate=" << resp.failure_rate() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cancel-payout") {
    if (argc < 5) return 1;

    CancelPayoutRequest req;
    req.set_payout_id(argv[3]);
    req.set_performed_by(argv[4]);
    if (argc >= 6) {
      req.set_reason(argv[5]);
    }

    CancelPayoutResponse resp;
    auto status = payout_stub->CancelPayout(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintPayout(resp.payout());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "complete-payout") {
    if (argc < 6) return 1;

    ManuallyCompletePayoutRequest req;
    req.set_payout_id(argv[3]);
    req.set_external_transaction_id(argv[4]);
    req.set_performed_by(argv[5]);
    if (argc >= 7) {
      req.set_notes(argv[6]);
    }

    ManuallyCompletePayoutResponse resp;
    auto status = payout_stub->ManuallyCompletePayout(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintPayout(resp.payout());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "process-payouts") {
    ProcessDuePayoutsRequest req;
    if (argc >= 4) {
      req.set_limit(static_cast<uint32_t>(std::stoul(argv[3])));
    }

    ProcessDuePayoutsResponse resp;
    auto status = payout_stub->ProcessDuePayouts(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "claimed=" << resp.claimed() << "\n";
    std::cout << "completed=" << resp.completed() << "\n";
    std::cout << "retried=" << resp.retried() << "\n";
    std::cout << "failed=" << resp.failed() << "\n";
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  try {
    return Run(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}
