#include "notification_sink.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace strands::notify {

std::size_t EmitBestEffort(NotificationSink& sink, const std::vector<NotificationRequest>& requests) {
  std::size_t failures = 0;
  for (const auto& request : requests) {
    try {
      sink.Emit(request);
    } catch (const std::exception& e) {
      ++failures;
      STRANDS_LOG_WARN("notification emit failed", {observability::StringField("category", ToString(request.category)),
                                                    observability::UIntField("recipient_id", request.recipient_id),
                                                    observability::StringField("error", e.what())});
    }
  }
  return failures;
}

} // namespace strands::notify
