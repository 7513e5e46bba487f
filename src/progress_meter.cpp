#include "progress_meter.hpp"
#include "utils.hpp"

#include <algorithm>
#include <sstream>

ProgressMeter::ProgressMeter(std::string label, uint64_t total_bytes, std::size_t width, bool enabled, std::ostream& out)
  : label_(std::move(label)),
    total_(total_bytes),
    width_(std::max<std::size_t>(1, width)),
    enabled_(enabled),
    out_(out) {}

ProgressMeter::~ProgressMeter() {
  finish();
}

std::string ProgressMeter::format_bar(uint64_t done, uint64_t total, std::size_t width) {
  static constexpr char kMeterChars[] = {' ', '.', '_', 'v', 'Y', 'X', 'H', '#'};
  constexpr std::size_t kMeterCharCount = sizeof(kMeterChars) / sizeof(kMeterChars[0]);
  const std::size_t slots = std::max<std::size_t>(1, width);
  if(total == 0) {
    return std::string(slots, done > 0 ? '#' : '_');
  }
  done = std::min(done, total);
  std::string bar;
  bar.reserve(slots);
  for(std::size_t slot = 0; slot < slots; ++slot) {
    // Fraction of this slot's byte range that is done, scaled to a glyph.
    double slot_start = static_cast<double>(total) * slot / slots;
    double slot_end = static_cast<double>(total) * (slot + 1) / slots;
    double filled = std::clamp(static_cast<double>(done) - slot_start, 0.0, slot_end - slot_start);
    double ratio = slot_end > slot_start ? filled / (slot_end - slot_start) : 1.0;
    if(ratio >= 1.0) {
      bar.push_back('#');
      continue;
    }
    auto index = static_cast<std::size_t>(ratio * static_cast<double>(kMeterCharCount));
    if(index >= kMeterCharCount) index = kMeterCharCount - 1;
    bar.push_back(kMeterChars[index]);
  }
  return bar;
}

void ProgressMeter::advance(uint64_t bytes, const std::string& item, uint64_t chunk, uint64_t chunk_count) {
  done_ += bytes;
  if(!enabled_) return;

  std::ostringstream line;
  line << "\r" << label_ << " [" << format_bar(done_, total_, width_) << "] "
       << format_size(done_) << "/" << format_size(total_)
       << " " << item << " " << chunk << "/" << chunk_count;
  auto rendered = line.str();
  out_ << rendered;
  if(rendered.size() < line_width_) {
    out_ << std::string(line_width_ - rendered.size(), ' ');
  } else {
    line_width_ = rendered.size();
  }
  out_.flush();
}

void ProgressMeter::finish() {
  if(finished_) return;
  finished_ = true;
  if(!enabled_ || line_width_ == 0) return;
  out_ << "\r" << std::string(line_width_, ' ') << "\r";
  out_.flush();
}
