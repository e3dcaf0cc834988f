#include <codebox/diagnostics.h>

#include <regex>
#include <climits>
#include <sstream>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

const char kNoIssuesFound[] = "No issues found!";
const char kSyntaxErrorCode[] = "E999";

namespace {

bool GetPosition(const nlohmann::json& j, int& out) {
  if (!j.is_number_integer()) return false;
  int64_t value = j.get<int64_t>();
  if (value < 0 || value > INT_MAX) return false;
  out = (int)value;
  return true;
}

bool TranslateJson(const std::string& report, std::vector<DiagnosticRecord>& records) {
  nlohmann::json j = nlohmann::json::parse(report, nullptr, false);
  if (j.is_discarded() || !j.is_array()) return false;
  try {
    for (auto& item : j) {
      DiagnosticRecord record;
      auto& code = item.at("code");
      record.code = code.is_null() ? kSyntaxErrorCode : code.get<std::string>();
      item.at("message").get_to(record.message);
      auto& location = item.at("location");
      if (!GetPosition(location.at("row"), record.location.line) ||
          !GetPosition(location.at("column"), record.location.column)) {
        spdlog::warn("Malformed analyzer finding location: {}", location.dump());
        return false;
      }
      records.push_back(std::move(record));
    }
  } catch (nlohmann::json::exception& e) {
    spdlog::warn("Malformed analyzer finding: {}", e.what());
    return false;
  }
  return true;
}

// path:line:col: CODE message
bool TranslateText(const std::string& report, std::vector<DiagnosticRecord>& records) {
  static const std::regex kLine(R"(^(.*?):(\d+):(\d+): (\S+) (.*)$)");
  std::istringstream in(report);
  for (std::string line; std::getline(in, line);) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    std::smatch match;
    // summaries and source excerpts
    if (!std::regex_match(line, match, kLine)) continue;
    DiagnosticRecord record;
    record.code = match[4];
    record.message = match[5];
    if (record.code.back() == ':') {
      record.code = kSyntaxErrorCode;
    } else if (record.message.compare(0, 4, "[*] ") == 0) {
      record.message.erase(0, 4);
    }
    try {
      record.location.line = std::stoi(match[2]);
      record.location.column = std::stoi(match[3]);
    } catch (std::out_of_range&) {
      spdlog::warn("Analyzer position out of range: {}", line);
      return false;
    }
    records.push_back(std::move(record));
  }
  return true;
}

} // namespace

bool TranslateDiagnostics(const std::string& report, std::vector<DiagnosticRecord>& records) {
  records.clear();
  size_t start = report.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return true;
  if (report[start] == '[') {
    if (TranslateJson(report, records)) return true;
    records.clear();
    return false;
  }
  if (TranslateText(report, records)) return true;
  records.clear();
  return false;
}

std::string RenderDiagnostics(const std::vector<DiagnosticRecord>& records) {
  if (records.empty()) return kNoIssuesFound;
  return nlohmann::json(records).dump(2);
}

void to_json(nlohmann::json& j, const DiagnosticRecord& record) {
  j = nlohmann::json{
    {"code", record.code},
    {"message", record.message},
    {"location", {{"line", record.location.line}, {"column", record.location.column}}},
  };
}

void from_json(const nlohmann::json& j, DiagnosticRecord& record) {
  j.at("code").get_to(record.code);
  j.at("message").get_to(record.message);
  j.at("location").at("line").get_to(record.location.line);
  j.at("location").at("column").get_to(record.location.column);
}
