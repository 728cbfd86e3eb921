#include "stdinc.hpp"

#include "response.hpp"

namespace voltwire::wire {

expected<ExecResult, error_code> to_exec_result(const Response& response) {
  ExecResult result{response.handle, 0};
  for (const auto& table : response.tables) {
    if (table.row_count() == 0 || table.column_count() == 0)
      continue;
    const auto& value = table.values(0).at(0);
    if (is_null(value))
      continue;
    if (auto* x = std::get_if<int64_t>(&value))
      result.rows_affected += *x;
    else if (auto* x = std::get_if<int32_t>(&value))
      result.rows_affected += *x;
    else
      return make_unexpected(make_error_code(ecode::type_error));
  }
  return result;
}

} // namespace voltwire::wire
