#include "progress_meter.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

#include "utils.hpp"

std::string format_chunk_meter(const std::vector<Chunk>& chunks,
                               uint64_t file_size,
                               std::size_t slots) {
  slots = std::max<std::size_t>(1, slots);
  static constexpr char kMeterChars[] = {' ', '.', '_', 'v', 'Y', 'X', 'H', '#'};
  constexpr std::size_t kMeterCharCount = sizeof(kMeterChars) / sizeof(kMeterChars[0]);
  std::string bar;
  bar.reserve(slots);
  if(chunks.empty()) {
    bar.assign(slots, ' ');
    return bar;
  }
  if(file_size == 0) {
    const auto& only = chunks.front();
    char c = only.status == ChunkStatus::Failed ? '!'
      : only.progress_percent >= 100.0 ? '#' : ' ';
    bar.assign(slots, c);
    return bar;
  }
  auto scaled_position = [file_size, slots](std::size_t idx) -> uint64_t {
    uint64_t base = (file_size / slots) * idx;
    uint64_t remainder = (file_size % slots) * idx / slots;
    return base + remainder;
  };
  std::size_t first = 0;
  for(std::size_t slot = 0; slot < slots; ++slot) {
    uint64_t slot_start = scaled_position(slot);
    if(slot_start >= file_size) {
      bar.push_back(' ');
      continue;
    }
    uint64_t slot_end = std::min(std::max(scaled_position(slot + 1), slot_start + 1), file_size);
    while(first < chunks.size() && chunks[first].byte_end <= slot_start) ++first;

    double filled = 0.0;
    bool failed = false;
    for(std::size_t i = first; i < chunks.size() && chunks[i].byte_start < slot_end; ++i) {
      const auto& chunk = chunks[i];
      uint64_t overlap_start = std::max(slot_start, chunk.byte_start);
      uint64_t overlap_end = std::min(slot_end, chunk.byte_end);
      if(overlap_end <= overlap_start) continue;
      if(chunk.status == ChunkStatus::Failed) failed = true;
      filled += static_cast<double>(overlap_end - overlap_start) * chunk.progress_percent / 100.0;
    }
    if(failed) {
      bar.push_back('!');
      continue;
    }
    const double ratio = std::clamp(filled / static_cast<double>(slot_end - slot_start), 0.0, 1.0);
    std::size_t index = static_cast<std::size_t>(ratio * static_cast<double>(kMeterCharCount));
    if(index >= kMeterCharCount) index = kMeterCharCount - 1;
    bar.push_back(kMeterChars[index]);
  }
  return bar;
}

std::string format_duration_compact(std::chrono::steady_clock::duration elapsed) {
  double value = std::chrono::duration<double>(elapsed).count();
  char unit = 's';
  if(value >= 60.0) {
    value /= 60.0;
    unit = 'm';
    if(value >= 60.0) {
      value /= 60.0;
      unit = 'h';
    }
  }
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(value >= 10.0 ? 0 : 1) << value << unit;
  return oss.str();
}

std::string ProgressMeter::format_line(const FileSnapshot& snapshot) const {
  const auto& state = snapshot.state;
  std::ostringstream line;
  std::string name = snapshot.file_name;
  if(name.size() > 24) name = name.substr(0, 21) + "...";
  line << std::left << std::setw(24) << name << " ["
       << format_chunk_meter(state.chunks, snapshot.file_size, meter_size_) << "] "
       << std::right << std::fixed << std::setprecision(1) << std::setw(5)
       << state.overall_progress << "% ";
  switch(state.phase) {
    case UploadPhase::Uploading:
      line << format_rate(snapshot.speed_bytes_per_sec);
      break;
    case UploadPhase::Failed:
      line << "failed: " << state.error;
      break;
    default:
      line << to_string(state.phase);
      break;
  }
  return line.str();
}

std::string ProgressMeter::format_totals(const UploadQueueManager::Counters& counters) const {
  std::ostringstream line;
  line << "sent " << format_bytes(counters.total_bytes_uploaded)
       << " at " << format_rate(counters.aggregate_speed_bytes_per_sec)
       << " | active " << counters.active_file_count
       << " queued " << counters.queued_file_count
       << " done " << counters.succeeded
       << " failed " << counters.failed
       << " cancelled " << counters.cancelled;
  return line.str();
}

void ProgressMeter::draw(std::ostream& out,
                         const std::vector<FileSnapshot>& snapshots,
                         const UploadQueueManager::Counters& counters) {
  clear(out);
  for(const auto& snapshot : snapshots) {
    out << format_line(snapshot) << "\x1b[K\n";
  }
  out << format_totals(counters) << "\x1b[K\n";
  lines_drawn_ = snapshots.size() + 1;
  out.flush();
}

void ProgressMeter::clear(std::ostream& out) {
  if(lines_drawn_ == 0) return;
  out << "\x1b[" << lines_drawn_ << "A\r\x1b[J";
  lines_drawn_ = 0;
}
