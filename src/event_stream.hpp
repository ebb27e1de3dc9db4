#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace gateway {

// Splits an incrementally received body into lines. Handles "\r\n" and lines
// split across reads. The callback returns false to stop decoding.
class LineDecoder {
 public:
  using LineCallback = std::function<bool(const std::string& line)>;

  bool Feed(const char* data, std::size_t len, const LineCallback& on_line);
  // Emits a trailing line that was not newline-terminated.
  bool Finish(const LineCallback& on_line);

 private:
  std::string buf_;
};

struct SseEvent {
  std::string event;
  std::string data;
};

// Minimal text/event-stream decoder: collects "event:" and "data:" fields and
// dispatches on a blank line. Comment lines (":") are ignored.
class SseDecoder {
 public:
  using EventCallback = std::function<bool(const SseEvent& ev)>;

  bool Feed(const char* data, std::size_t len, const EventCallback& on_event);
  bool Finish(const EventCallback& on_event);

 private:
  bool OnLine(const std::string& line, const EventCallback& on_event);
  bool Dispatch(const EventCallback& on_event);

  LineDecoder lines_;
  SseEvent pending_;
  bool has_data_ = false;
};

}  // namespace gateway
