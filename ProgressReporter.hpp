#pragma once

#include <cstddef>
#include <mutex>
#include <string>

#include "types.hpp"

// Observer for per-file progress. Implementations must not affect control
// flow of the caller.
class ProgressReporter {
 public:
  virtual ~ProgressReporter() = default;
  virtual void start(std::size_t total) = 0;
  virtual void advance(const fs::path& item) = 0;
  virtual void finish() = 0;
};

class NullProgress : public ProgressReporter {
 public:
  void start(std::size_t) override {}
  void advance(const fs::path&) override {}
  void finish() override {}
};

// Single-line FTXUI gauge on stderr, redrawn in place. Log lines emitted while
// it is active are printed above the bar.
class TerminalProgress : public ProgressReporter {
 public:
  TerminalProgress() = default;
  ~TerminalProgress() override;

  void start(std::size_t total) override;
  void advance(const fs::path& item) override;
  void finish() override;

 private:
  void redraw();
  void clear_line();

  std::mutex m_mutex;
  std::size_t m_total = 0;
  std::size_t m_done = 0;
  std::string m_current;
  bool m_active = false;
};
