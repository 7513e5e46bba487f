#pragma once
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

// Single-line ASCII progress bar refreshed in place with '\r'.
class ProgressMeter {
public:
  ProgressMeter(std::string label, uint64_t total_bytes, std::size_t width, bool enabled, std::ostream& out);
  ~ProgressMeter();

  void advance(uint64_t bytes, const std::string& item, uint64_t chunk, uint64_t chunk_count);
  // Blanks the meter line so later output starts clean.
  void finish();

  uint64_t done() const { return done_; }
  bool enabled() const { return enabled_; }

  static std::string format_bar(uint64_t done, uint64_t total, std::size_t width);

private:
  std::string label_;
  uint64_t total_;
  uint64_t done_ = 0;
  std::size_t width_;
  bool enabled_;
  std::ostream& out_;
  std::size_t line_width_ = 0;
  bool finished_ = false;
};
