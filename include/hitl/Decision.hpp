#pragma once

#include <chrono>
#include <map>
#include <string>

namespace hitl {

enum class Decision : int {
  Reject  = 0,
  Approve = 1
};

const char* toString(Decision d);

inline Decision decisionFromBool(bool approved) {
  return approved ? Decision::Approve : Decision::Reject;
}

// What is being decided. The coordinator stores and returns it but never
// looks inside.
struct ToolRequest {
  std::string name;
  std::string description;
  std::string argsJson{"{}"};                 // serialized JSON object
  std::map<std::string, std::string> metadata;
};

using Clock = std::chrono::system_clock;

// Listing row handed to presentation code. Always a copy.
struct PendingSummary {
  std::string       id;
  std::string       owner;
  ToolRequest       payload;
  Clock::time_point createdAt;
};

} // namespace hitl
