#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <vector>
#include <mutex>

namespace hitl {
namespace util {

enum class LogLevel : int {
  Trace = 0,
  Debug = 1,
  Info  = 2,
  Warn  = 3,
  Error = 4
};

struct Field {
  std::string k;
  std::string v;
};

LogLevel parseLevel(const std::string& s);
const char* levelName(LogLevel l);

class Logger {
public:
  Logger();
  ~Logger();

  void setLevel(LogLevel lvl);
  void setFormatJson(bool json);
  bool setFile(const std::string& path); // empty -> stdout; false if it could not be opened

  LogLevel level() const;

  void log(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields = {});

  // Thread-local context helper; fields are attached to every line logged
  // from this thread while the object is alive.
  class Scoped {
  public:
    explicit Scoped(const std::vector<Field>& add);
    ~Scoped();

    Scoped(const Scoped&)            = delete;
    Scoped& operator=(const Scoped&) = delete;

  private:
    std::size_t mark_;
  };

private:
  void writeLine(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields);

private:
  mutable std::mutex mx_;
  void* file_ = nullptr;            // FILE* stored as void* to avoid <cstdio> in header
  std::atomic<LogLevel> lvl_{LogLevel::Info};
  std::atomic<bool> json_{false};
};

Logger& logger();

} // namespace util
} // namespace hitl
