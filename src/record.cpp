#include "harvestlink/record.hpp"

#include <cstdio>

namespace harvestlink {

std::string Timestamp::to_string() const {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04u-%02u-%02u %02u:%02u:%02u",
                unsigned(year), unsigned(month), unsigned(day),
                unsigned(hour), unsigned(minute), unsigned(second));
  return std::string(buf);
}

} // namespace harvestlink
