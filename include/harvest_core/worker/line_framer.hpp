#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace harvest_core {

/**
 * @class LineFramer
 * @brief Splits a byte stream into newline-terminated frames.
 *
 * Bytes that arrive without a trailing newline are held until the rest of the
 * frame shows up, so a record split across two reads is reassembled instead of
 * being parsed as two broken halves. A frame that grows beyond the size limit
 * is discarded up to its terminating newline.
 */
class LineFramer {
 public:
  static constexpr std::size_t kDefaultMaxFrameBytes = 4 * 1024 * 1024;

  explicit LineFramer(std::size_t max_frame_bytes = kDefaultMaxFrameBytes);

  /**
   * @brief Appends raw bytes and returns every frame they complete.
   *
   * Frames are returned without the newline (a trailing '\r' is stripped too).
   * Blank frames are skipped.
   */
  std::vector<std::string> feed(const char* data, std::size_t size);
  std::vector<std::string> feed(const std::string& data);

  /**
   * @brief Ends the stream.
   * @return The unterminated tail, if one was buffered. Callers decide
   * whether a tail is acceptable; the framer itself never emits it as a frame.
   */
  std::optional<std::string> finish();

  bool has_partial() const {
    return !buffer_.empty() || discarding_;
  }

  // Number of frames thrown away for exceeding the size limit.
  std::size_t dropped_frames() const {
    return dropped_frames_;
  }

 private:
  std::size_t max_frame_bytes_;
  std::string buffer_;
  bool discarding_ = false;
  std::size_t dropped_frames_ = 0;
};

}  // namespace harvest_core
