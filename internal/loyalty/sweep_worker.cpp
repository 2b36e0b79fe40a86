#include "sweep_worker.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/time.hpp"

namespace strands::loyalty {

SweepWorker::SweepWorker(std::shared_ptr<AccrualJob> accrual, std::shared_ptr<PromotionExpirySweep> expiry, Options options)
    : accrual_(std::move(accrual)), expiry_(std::move(expiry)), options_(options) {
}

SweepWorker::~SweepWorker() {
  Stop();
}

void SweepWorker::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&SweepWorker::Run, this);
}

void SweepWorker::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void SweepWorker::Run() {
  using Clock = std::chrono::steady_clock;

  auto next_accrual = Clock::now();
  auto next_expiry  = Clock::now();

  std::unique_lock lock(mutex_);
  while (running_) {
    const auto now = Clock::now();

    if (accrual_ && now >= next_accrual) {
      lock.unlock();
      RunAccrual();
      lock.lock();
      next_accrual = Clock::now() + options_.accrual_interval;
    }

    if (expiry_ && now >= next_expiry) {
      lock.unlock();
      RunExpiry();
      lock.lock();
      next_expiry = Clock::now() + options_.expiry_interval;
    }

    auto wake = Clock::now() + std::max(options_.accrual_interval, options_.expiry_interval);
    if (accrual_) wake = std::min(wake, next_accrual);
    if (expiry_) wake = std::min(wake, next_expiry);

    cv_.wait_until(lock, wake, [this] { return !running_; });
  }
}

namespace {

double MillisSince(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

} // namespace

void SweepWorker::RunAccrual() {
  observability::SpanScope span("loyalty.accrual_sweep");
  const auto               started_at = std::chrono::steady_clock::now();
  try {
    const auto report = accrual_->RunSweep(util::NowMillis());
    span.SetAttribute("sweep.scanned", static_cast<std::int64_t>(report.scanned));
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    observability::Metrics::Instance().RecordSweepItems("loyalty_accrual", "aborted", 1);
    STRANDS_LOG_ERROR("loyalty sweep failed", {observability::StringField("error", e.what())});
  }
  observability::Metrics::Instance().ObserveSweepDurationMs("loyalty_accrual", MillisSince(started_at));
}

void SweepWorker::RunExpiry() {
  observability::SpanScope span("promotions.expiry_sweep");
  const auto               started_at = std::chrono::steady_clock::now();
  try {
    const auto expired = expiry_->Run(util::NowMillis());
    span.SetAttribute("sweep.expired", static_cast<std::int64_t>(expired));
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    observability::Metrics::Instance().RecordSweepItems("promotion_expiry", "aborted", 1);
    STRANDS_LOG_ERROR("promotion expiry sweep failed", {observability::StringField("error", e.what())});
  }
  observability::Metrics::Instance().ObserveSweepDurationMs("promotion_expiry", MillisSince(started_at));
}

} // namespace strands::loyalty
