#pragma once

// MoldCheck - Analysis report views
// Designer and customer renderings of one AnalysisResult. Both read the
// stored numbers only; nothing is recomputed.

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "../molding/analysis_engine.h"
#include "../types.h"

namespace mc {
namespace report {

enum class ReportView {
    Designer, // Every number, designer messages, remediation, machine notes
    Customer  // Status, score, headline numbers, plain-language messages
};

const char* reportViewToString(ReportView view);
Result<ReportView> parseReportView(std::string_view str);

nlohmann::json toJson(const molding::AnalysisResult& result, ReportView view);
std::string toJsonString(const molding::AnalysisResult& result, ReportView view);

} // namespace report
} // namespace mc
