#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace docbuild::util {

/*
  Time utilities. Single place to control the clock source.

  Persistent records store Unix epoch milliseconds, 0 meaning "unset".
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t NowMillis();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

// 0 maps to an empty Timestamp.
google::protobuf::Timestamp MillisToProto(uint64_t unix_ms);

uint64_t ToUnixMillis(TimePoint tp);

} // namespace docbuild::util
