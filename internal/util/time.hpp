#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace strands::util {

/*
  Time utilities. All clock reads go through NowMillis().
  Rows store wall-clock instants as unix milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();
uint64_t  NowMillis();

google::protobuf::Timestamp ToProto(TimePoint tp);
google::protobuf::Timestamp MillisToProto(uint64_t unix_ms);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);
uint64_t                    ProtoToMillis(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(TimePoint tp);

// UTC calendar date, "2026-03-01".
std::string FormatDate(uint64_t unix_ms);

} // namespace strands::util
