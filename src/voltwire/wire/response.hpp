#pragma once

#include "table.hpp"

#include <optional>
#include <string>
#include <vector>

namespace voltwire::wire {

/**
 * @brief A decoded procedure response.
 */
struct Response {
  Handle handle{0};
  ResponseStatus status{ResponseStatus::UNINITIALIZED_APP_STATUS};
  std::optional<std::string> status_string{};
  int8_t app_status{int8_t(ResponseStatus::UNINITIALIZED_APP_STATUS)};
  std::optional<std::string> app_status_string{};
  int32_t cluster_round_trip{0}; //!< milliseconds
  std::vector<Table> tables{};

  bool ok() const { return status == ResponseStatus::SUCCESS; }
  std::size_t table_count() const { return tables.size(); }
  const Table& table(std::size_t index) const { return tables.at(index); }

  bool operator==(const Response&) const = default;
};

/**
 * @brief Outcome of a DML invocation.
 */
struct ExecResult {
  Handle handle{0};
  int64_t rows_affected{0};
  bool operator==(const ExecResult&) const = default;
};

/**
 * @brief Sums the leading integer of each table. Tables without rows, and null counts,
 * contribute nothing; a non-integer count is `ecode::type_error`.
 */
tl::expected<ExecResult, error_code> to_exec_result(const Response& response);

} // namespace voltwire::wire
