#include "inbox_sink.hpp"

#include <stdexcept>

#include "internal/util/time.hpp"

namespace strands::notify {

InboxNotificationSink::InboxNotificationSink(std::shared_ptr<db::Repository> repo) : repo_(std::move(repo)) {
  if (!repo_) {
    throw std::invalid_argument("InboxNotificationSink requires a repository");
  }
}

void InboxNotificationSink::Emit(const NotificationRequest& request) {
  auto record = ToRecord(request, util::NowMillis());

  auto tx = repo_->Begin();
  auto r  = repo_->InsertNotification(*tx, record);
  if (!r) {
    tx->Rollback();
    throw std::runtime_error("notification insert failed: " + r.message);
  }
  tx->Commit();
}

} // namespace strands::notify
