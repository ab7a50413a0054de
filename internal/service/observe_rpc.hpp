#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace booking::service {

namespace detail {

inline double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

// Client mistakes are logged at info; everything else is an error.
inline bool IsClientError(const std::exception& ex) {
  return dynamic_cast<const util::ValidationError*>(&ex) || dynamic_cast<const util::NotFound*>(&ex) ||
         dynamic_cast<const util::AlreadyExists*>(&ex) || dynamic_cast<const util::ConflictError*>(&ex) ||
         dynamic_cast<const util::InvalidTransitionError*>(&ex) || dynamic_cast<const util::InvalidState*>(&ex);
}

} // namespace detail

/*
  Wraps one RPC body with a span, request metrics and failure logging.
  Exceptions are rethrown for the transport layer to map.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view subject_id, Fn&& fn) {
  booking::observability::SpanScope span(route);
  if (!subject_id.empty()) {
    span.SetAttribute("subject.id", subject_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      std::forward<Fn>(fn)();
      booking::observability::Metrics::Instance().RecordRequest(route, true);
      booking::observability::Metrics::Instance().ObserveRequestLatencyMs(route, detail::ElapsedMs(started_at));
      return;
    } else {
      auto result = std::forward<Fn>(fn)();
      booking::observability::Metrics::Instance().RecordRequest(route, true);
      booking::observability::Metrics::Instance().ObserveRequestLatencyMs(route, detail::ElapsedMs(started_at));
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    if (detail::IsClientError(ex)) {
      BOOKING_LOG_INFO("RPC rejected", {booking::observability::StringField("route", route), booking::observability::StringField("error", ex.what()),
                                        booking::observability::StringField("subject_id", subject_id)});
    } else {
      BOOKING_LOG_ERROR("RPC failed", {booking::observability::StringField("route", route), booking::observability::StringField("error", ex.what()),
                                       booking::observability::StringField("subject_id", subject_id)});
    }
    booking::observability::Metrics::Instance().RecordRequest(route, false);
    booking::observability::Metrics::Instance().ObserveRequestLatencyMs(route, detail::ElapsedMs(started_at));
    throw;
  }
}

} // namespace booking::service
