#include "harvestlink/traffic_log.hpp"

#include <algorithm>

namespace harvestlink {

const char* to_string(LogTag tag) {
  switch (tag) {
    case LogTag::Cmd:  return "CMD";
    case LogTag::In:   return "IN";
    case LogTag::Out:  return "OUT";
    case LogTag::Info: return "INFO";
    case LogTag::Err:  return "ERR";
  }
  return "?";
}

void TrafficLog::add(LogTag tag, const std::string& text) {
  while (entries_.size() >= limit_) {   // evict oldest first
    entries_.pop_front();
    ++dropped_;
  }

  Entry e;
  e.tag = tag;
  if (text.size() <= LINE_MAX) {
    e.text.assign(text.data(), text.size());
  } else {
    static const char ELLIPSIS[] = "...";
    e.text.assign(text.data(), LINE_MAX - (sizeof(ELLIPSIS) - 1));
    e.text.append(ELLIPSIS);
  }
  entries_.push_back(e);
}

void TrafficLog::set_limit(std::size_t limit) {
  limit_ = std::max<std::size_t>(1, std::min(limit, CAPACITY));
  while (entries_.size() > limit_) {
    entries_.pop_front();
    ++dropped_;
  }
}

std::string TrafficLog::line(std::size_t i) const {
  const Entry& e = entries_[i];
  std::string s;
  s.reserve(e.text.size() + 8);
  s += '[';
  s += to_string(e.tag);
  s += "] ";
  s.append(e.text.data(), e.text.size());
  return s;
}

std::string TrafficLog::last_line() const {
  if (entries_.empty()) return {};
  return line(entries_.size() - 1);
}

} // namespace harvestlink
