#include "log_sink.hpp"

#include "internal/observability/logging.hpp"

namespace strands::notify {

void LogNotificationSink::Emit(const NotificationRequest& request) {
  STRANDS_LOG_INFO("notification", {observability::StringField("category", ToString(request.category)),
                                     observability::UIntField("recipient_id", request.recipient_id),
                                     observability::UIntField("merchant_id", request.merchant_id),
                                     observability::StringField("message", TruncateMessage(request.message))});
}

} // namespace strands::notify
