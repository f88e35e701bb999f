#pragma once

#include <string>
#include <cstdint>

namespace hitl {
namespace util {

class Config {
public:
  // Construct with sensible defaults.
  Config() = default;

  // Load from a simple "key=value" file (unknown keys ignored).
  // Returns true if file read successfully (even if some keys are unknown).
  bool loadFromFile(const std::string& path);

  // Apply one key/value pair. Returns false for unknown keys and for values
  // that are rejected (out-of-range httpPort); the field keeps its value.
  bool set(const std::string& key, const std::string& value);

  // --- Approval handshake ---
  int  approvalTimeoutSec   = 30;     // default wait before the timeout outcome applies
  bool autoApproveOnTimeout = false;  // true approves on timeout; reject is the safe default

  // --- HTTP adapter ---
  std::string    httpAddress = "127.0.0.1";
  unsigned short httpPort    = 8080;
  int            ioThreads   = 1;

  // --- Runtime ---
  int  workerThreads   = 4;
  bool demoAgent       = false;
  int  demoIntervalSec = 20;

  // --- Logging / metrics ---
  std::string logLevel = "info";
  bool        logJson  = false;
  std::string logFile;                // empty -> stdout
  int         metricsIntervalSec = 0; // 0 disables the reporter

private:
  static bool parseLineKV(const std::string& line, std::string& k, std::string& v);
  static bool parseBool(const std::string& v);
  static std::string trim(const std::string& s);
};

} // namespace util
} // namespace hitl
