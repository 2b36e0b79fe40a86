#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "notification_sink.hpp"

namespace strands::notify {

/*
  Persists each request to the notifications table in its own
  transaction. Must not be called while the caller still holds an open
  transaction on the same repository.
*/
class InboxNotificationSink final : public NotificationSink {
 public:
  explicit InboxNotificationSink(std::shared_ptr<db::Repository> repo);

  void Emit(const NotificationRequest& request) override;

 private:
  std::shared_ptr<db::Repository> repo_;
};

} // namespace strands::notify
