#pragma once

#include "notification_sink.hpp"

namespace strands::notify {

// Writes each request to the service log; for deployments without an inbox.
class LogNotificationSink final : public NotificationSink {
 public:
  void Emit(const NotificationRequest& request) override;
};

} // namespace strands::notify
