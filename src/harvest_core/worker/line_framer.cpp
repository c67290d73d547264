#include "harvest_core/worker/line_framer.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace harvest_core {

namespace {

bool is_blank(const std::string& line) {
  return std::all_of(line.begin(), line.end(),
                     [](unsigned char c) { return c == ' ' || c == '\t' || c == '\r'; });
}

}  // namespace

LineFramer::LineFramer(std::size_t max_frame_bytes) : max_frame_bytes_(max_frame_bytes) {
  if (max_frame_bytes_ == 0) {
    throw std::invalid_argument("LineFramer frame limit must be positive");
  }
}

std::vector<std::string> LineFramer::feed(const std::string& data) {
  return feed(data.data(), data.size());
}

std::vector<std::string> LineFramer::feed(const char* data, std::size_t size) {
  std::vector<std::string> frames;
  std::size_t pos = 0;
  while (pos < size) {
    const char* newline = static_cast<const char*>(std::memchr(data + pos, '\n', size - pos));
    std::size_t end = newline ? static_cast<std::size_t>(newline - data) : size;

    if (discarding_) {
      // Still inside an oversized frame; skip up to its newline.
      if (newline) {
        discarding_ = false;
      }
      pos = end + 1;
      continue;
    }

    buffer_.append(data + pos, end - pos);
    if (buffer_.size() > max_frame_bytes_) {
      buffer_.clear();
      ++dropped_frames_;
      discarding_ = newline == nullptr;
      pos = end + 1;
      continue;
    }

    if (newline) {
      if (!buffer_.empty() && buffer_.back() == '\r') {
        buffer_.pop_back();
      }
      if (!is_blank(buffer_)) {
        frames.push_back(std::move(buffer_));
      }
      buffer_.clear();
    }
    pos = end + 1;
  }
  return frames;
}

std::optional<std::string> LineFramer::finish() {
  discarding_ = false;
  if (buffer_.empty() || is_blank(buffer_)) {
    buffer_.clear();
    return std::nullopt;
  }
  std::string tail = std::move(buffer_);
  buffer_.clear();
  return tail;
}

}  // namespace harvest_core
