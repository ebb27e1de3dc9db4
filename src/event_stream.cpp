#include "event_stream.hpp"

#include <utility>

namespace gateway {
namespace {

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::string FieldValue(const std::string& line, std::size_t name_len) {
  std::string v = line.substr(name_len);
  if (!v.empty() && v.front() == ' ') v.erase(v.begin());
  return v;
}

}  // namespace

bool LineDecoder::Feed(const char* data, std::size_t len, const LineCallback& on_line) {
  buf_.append(data, len);
  std::size_t start = 0;
  while (true) {
    auto nl = buf_.find('\n', start);
    if (nl == std::string::npos) break;
    std::string line = buf_.substr(start, nl - start);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    start = nl + 1;
    if (!on_line(line)) {
      buf_.erase(0, start);
      return false;
    }
  }
  buf_.erase(0, start);
  return true;
}

bool LineDecoder::Finish(const LineCallback& on_line) {
  if (buf_.empty()) return true;
  std::string line = std::move(buf_);
  buf_.clear();
  if (!line.empty() && line.back() == '\r') line.pop_back();
  return on_line(line);
}

bool SseDecoder::Feed(const char* data, std::size_t len, const EventCallback& on_event) {
  return lines_.Feed(data, len, [&](const std::string& line) { return OnLine(line, on_event); });
}

bool SseDecoder::Finish(const EventCallback& on_event) {
  if (!lines_.Finish([&](const std::string& line) { return OnLine(line, on_event); })) return false;
  return Dispatch(on_event);
}

bool SseDecoder::OnLine(const std::string& line, const EventCallback& on_event) {
  if (line.empty()) return Dispatch(on_event);
  if (line.front() == ':') return true;
  if (StartsWith(line, "data:")) {
    if (has_data_) pending_.data.push_back('\n');
    pending_.data += FieldValue(line, 5);
    has_data_ = true;
    return true;
  }
  if (StartsWith(line, "event:")) {
    pending_.event = FieldValue(line, 6);
    return true;
  }
  // id:, retry: and unknown fields carry nothing we use.
  return true;
}

bool SseDecoder::Dispatch(const EventCallback& on_event) {
  if (!has_data_) {
    pending_.event.clear();
    return true;
  }
  SseEvent ev = std::move(pending_);
  pending_ = SseEvent{};
  has_data_ = false;
  return on_event(ev);
}

}  // namespace gateway
