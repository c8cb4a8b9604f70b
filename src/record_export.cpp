#include "record_export.hpp"

#include <iomanip>      // std::setprecision for float columns
#include <sstream>      // std::ostringstream for line assembly

using json = nlohmann::json;

namespace harvestlink {

// Floats go out with float precision, not double noise (21.5, not 21.500000000).
static std::string fmt_float(float v) {
  std::ostringstream os;
  os << std::setprecision(7) << v;
  return os.str();
}

json record_to_json(const MeasurementRecord& r) {
  json j;
  j["id"]          = r.id;
  j["timestamp"]   = r.timestamp.to_string();
  j["category"]    = r.category;
  j["temperature"] = r.temperature;
  j["tree_no"]     = r.tree_no;
  j["defect_code"] = r.defect_code;
  json res = json::array();
  for (float v : r.results) res.push_back(v);
  j["results"] = res;
  return j;
}

json session_to_json(const FetchSession& s) {
  json j;
  j["status"] = to_string(s.state);
  j["reason"] = to_string(s.reason);
  j["error"]  = to_string(s.error);
  j["pages"]  = s.pages;
  json arr = json::array();
  for (const auto& r : s.records) arr.push_back(record_to_json(r));
  j["records"] = arr;
  return j;
}

void write_csv(const std::vector<MeasurementRecord>& records, std::ostream& os) {
  os << "id,timestamp,category,temperature,tree_no,defect_code,r1,r2,r3,r4,r5\n";
  for (const auto& r : records) {
    os << r.id << ','
       << r.timestamp.to_string() << ','
       << unsigned(r.category) << ','
       << fmt_float(r.temperature) << ','
       << r.tree_no << ','
       << r.defect_code;
    for (float v : r.results) os << ',' << fmt_float(v);
    os << '\n';
  }
}

std::string format_record_line(const MeasurementRecord& r) {
  std::ostringstream os;
  os << '#' << r.id
     << "  " << r.timestamp.to_string()
     << "  cat=" << unsigned(r.category)
     << "  temp=" << fmt_float(r.temperature)
     << "  tree=" << r.tree_no
     << "  defect=" << r.defect_code
     << "  results=[";
  for (std::size_t i = 0; i < r.results.size(); ++i) {
    if (i) os << ", ";
    os << fmt_float(r.results[i]);
  }
  os << ']';
  return os.str();
}

std::string summary_line(const FetchSession& s) {
  std::ostringstream os;
  os << "status=" << to_string(s.state)
     << " records=" << s.records.size()
     << " pages=" << s.pages;
  if (s.reason != CompletionReason::None) os << " reason=" << to_string(s.reason);
  if (s.error  != FetchError::None)       os << " error="  << to_string(s.error);
  return os.str();
}

} // namespace harvestlink
