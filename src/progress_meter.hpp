#pragma once

#include <chrono>
#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "upload_queue_manager.hpp"
#include "upload_types.hpp"

// Byte-proportional bar of `slots` characters; each slot shades by how much of
// its byte range the overlapping chunks have acknowledged. Failed chunks show '!'.
std::string format_chunk_meter(const std::vector<Chunk>& chunks,
                               uint64_t file_size,
                               std::size_t slots);

std::string format_duration_compact(std::chrono::steady_clock::duration elapsed);

// Redraws one line per file plus a totals line in place.
class ProgressMeter {
public:
  explicit ProgressMeter(std::size_t meter_size = 40) : meter_size_(meter_size) {}

  std::string format_line(const FileSnapshot& snapshot) const;
  std::string format_totals(const UploadQueueManager::Counters& counters) const;

  void draw(std::ostream& out,
            const std::vector<FileSnapshot>& snapshots,
            const UploadQueueManager::Counters& counters);
  void clear(std::ostream& out);

private:
  std::size_t meter_size_;
  std::size_t lines_drawn_ = 0;
};
