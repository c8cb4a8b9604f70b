/**
 * @file record_export.hpp
 * @brief Render a fetch session for people (pretty), scripts (JSON) and spreadsheets (CSV).
 *
 * @details
 * These are read-only projections of FetchSession; nothing here feeds back
 * into the engine.
 *
 * JSON shape:
 * @code
 *   {
 *     "status": "complete",          // FetchState token
 *     "reason": "short_page",        // CompletionReason token
 *     "error":  "none",              // FetchError token
 *     "pages":  2,
 *     "records": [
 *       { "id": 1, "timestamp": "2024-06-15 10:30:00", "category": 3,
 *         "temperature": 21.5, "tree_no": 7, "defect_code": 0,
 *         "results": [1.0, 2.0, 3.0, 4.0, 5.0] }
 *     ]
 *   }
 * @endcode
 *
 * CSV header:
 *   id,timestamp,category,temperature,tree_no,defect_code,r1,r2,r3,r4,r5
 */
#pragma once
#include <ostream>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "harvestlink/fetch_controller.hpp"
#include "harvestlink/record.hpp"

namespace harvestlink {

nlohmann::json record_to_json(const MeasurementRecord& r);
nlohmann::json session_to_json(const FetchSession& s);

/// Header line plus one line per record. Floats use up to 7 significant digits.
void write_csv(const std::vector<MeasurementRecord>& records, std::ostream& os);

/// "#1  2024-06-15 10:30:00  cat=3  temp=21.5  tree=7  defect=0  results=[1, 2, 3, 4, 5]"
std::string format_record_line(const MeasurementRecord& r);

/// Shell-friendly summary: "status=complete records=50 pages=1 reason=short_page".
std::string summary_line(const FetchSession& s);

} // namespace harvestlink
