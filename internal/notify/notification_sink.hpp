#pragma once

#include <cstddef>
#include <vector>

#include "notification.hpp"

namespace strands::notify {

/*
  Port to the delivery component. Emit() may throw; callers that must
  not fail on delivery go through EmitBestEffort().
*/
class NotificationSink {
 public:
  virtual ~NotificationSink() = default;

  virtual void Emit(const NotificationRequest& request) = 0;
};

// Emits each request independently and logs failures. Returns the failure count.
std::size_t EmitBestEffort(NotificationSink& sink, const std::vector<NotificationRequest>& requests);

} // namespace strands::notify
