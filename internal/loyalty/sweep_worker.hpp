#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "accrual_job.hpp"
#include "promotion_expiry.hpp"

namespace strands::loyalty {

/*
  Background scheduler for the periodic sweeps.

  Runs:
      loyalty accrual   every accrual_interval
      promotion expiry  every expiry_interval

  Either job may be null (disabled). A failed run is logged and the
  next one happens on schedule.
*/
class SweepWorker {
 public:
  struct Options {
    std::chrono::milliseconds accrual_interval{60'000};
    std::chrono::milliseconds expiry_interval{60'000};
  };

  SweepWorker(std::shared_ptr<AccrualJob> accrual, std::shared_ptr<PromotionExpirySweep> expiry, Options options);
  ~SweepWorker();

  void Start();
  void Stop();

 private:
  void Run();
  void RunAccrual();
  void RunExpiry();

  std::shared_ptr<AccrualJob>           accrual_;
  std::shared_ptr<PromotionExpirySweep> expiry_;
  Options                               options_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace strands::loyalty
