#pragma once

#include <chrono>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace jobflow::util {

/*
  Time utilities. Every clock read goes through Now().
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

// RFC 3339, UTC.
std::string FormatTimestamp(TimePoint tp);

} // namespace jobflow::util
