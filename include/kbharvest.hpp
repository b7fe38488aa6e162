#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace kbharvest {

// Depending on the KBART version there are 2 possible headers. They differ only in the 15th field
// (`notes` vs `coverage_notes`).
inline constexpr std::string_view kbart_header =
    "publication_title\tprint_identifier\tonline_identifier\tdate_first_issue_online\t"
    "num_first_vol_online\tnum_first_issue_online\tdate_last_issue_online\tnum_last_vol_online\t"
    "num_last_issue_online\ttitle_url\tfirst_author\ttitle_id\tembargo_info\tcoverage_depth\t"
    "notes\tpublisher_name\tpublication_type";

inline constexpr std::string_view kbart_header_5321 =
    "publication_title\tprint_identifier\tonline_identifier\tdate_first_issue_online\t"
    "num_first_vol_online\tnum_first_issue_online\tdate_last_issue_online\tnum_last_vol_online\t"
    "num_last_issue_online\ttitle_url\tfirst_author\ttitle_id\tembargo_info\tcoverage_depth\t"
    "coverage_notes\tpublisher_name\tpublication_type";

inline constexpr std::string_view kbart_headers[] = {kbart_header_5321, kbart_header};

enum class error_kind {
  missing_path,
  invalid_format,
  parse_error,
  transport_error,
  http_status,
  filesystem_error,
};

std::string_view to_string(error_kind kind);

// thrown by the per item steps and converted into a failed fetch_outcome
class harvest_error : public std::runtime_error {
public:
  harvest_error(error_kind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {}

  [[nodiscard]] error_kind kind() const noexcept { return kind_; }

private:
  error_kind kind_;
};

struct fetch_outcome {
  std::size_t               line_number = 0;
  std::string               url;
  std::filesystem::path     target;
  std::size_t               bytes = 0; // written to target
  std::optional<error_kind> error;     // empty => success
  std::string               message;

  [[nodiscard]] bool success() const { return !error; }
};

struct harvest_summary {
  std::vector<fetch_outcome> outcomes;
  std::size_t                succeeded = 0;
  std::size_t                failed    = 0;
};

} // namespace kbharvest
