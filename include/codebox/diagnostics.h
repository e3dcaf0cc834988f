#ifndef INCLUDE_CODEBOX_DIAGNOSTICS_H_
#define INCLUDE_CODEBOX_DIAGNOSTICS_H_

#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

// Rendered instead of an empty list so callers can branch on "has diagnostics".
extern const char kNoIssuesFound[];
// Used when the analysis tool reports a finding without a rule code (syntax errors).
extern const char kSyntaxErrorCode[];

struct DiagnosticRecord {
  std::string code;
  std::string message;
  struct Location {
    int line;
    int column;
  } location;

  DiagnosticRecord() : location{0, 0} {}
};

// Accepts the analyzer's JSON report (an array of findings with "code", "message" and
// "location": {"row", "column"}) or its concise text form ("path:line:col: CODE message").
// Order is kept as reported. Returns false if the report cannot be understood, including
// positions that do not fit an int. Text without any finding lines gives no records.
bool TranslateDiagnostics(const std::string& report, std::vector<DiagnosticRecord>& records);

// JSON array of the records, or kNoIssuesFound if there are none.
std::string RenderDiagnostics(const std::vector<DiagnosticRecord>& records);

void to_json(nlohmann::json&, const DiagnosticRecord&);
void from_json(const nlohmann::json&, DiagnosticRecord&);

#endif  // INCLUDE_CODEBOX_DIAGNOSTICS_H_
