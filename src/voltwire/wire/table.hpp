#pragma once

#include "wire-types.hpp"

#include "voltwire/utils/error-codes.hpp"

#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace voltwire::wire {

struct Column {
  std::string name{};
  WireType type{WireType::NULL_TYPE};
  bool operator==(const Column&) const = default;
};

class Table;

/**
 * @brief A view of one row of a `Table`. Must not outlive the table.
 */
class Row {
private:
  const Table* table_{nullptr};
  std::size_t index_{0};

public:
  Row(const Table& table, std::size_t index) : table_{&table}, index_{index} {}

  std::size_t index() const { return index_; }
  std::size_t size() const;

  tl::expected<Value, error_code> get(std::size_t column) const;
  tl::expected<Value, error_code> get(std::string_view column_name) const;

  /// Null maps to an empty optional; a non-string column is `ecode::type_error`
  tl::expected<std::optional<std::string>, error_code>
  get_string(std::string_view column_name) const;

  /// Any integer column widens to int64
  tl::expected<std::optional<int64_t>, error_code> get_i64(std::string_view column_name) const;

  tl::expected<std::optional<double>, error_code> get_f64(std::string_view column_name) const;
};

/**
 * @brief A decoded result table.
 */
class Table {
private:
  int8_t status_{0};
  std::vector<Column> columns_{};
  std::vector<std::vector<Value>> rows_{};

public:
  Table() = default;
  Table(int8_t status, std::vector<Column> columns, std::vector<std::vector<Value>> rows)
      : status_{status}, columns_{std::move(columns)}, rows_{std::move(rows)} {}

  int8_t status() const { return status_; }
  const std::vector<Column>& columns() const { return columns_; }
  std::size_t column_count() const { return columns_.size(); }
  std::size_t row_count() const { return rows_.size(); }

  std::optional<std::size_t> column_index(std::string_view name) const;

  /// `index` must be less than `row_count()`
  Row row(std::size_t index) const;

  const std::vector<Value>& values(std::size_t index) const { return rows_.at(index); }

  bool operator==(const Table&) const = default;
};

} // namespace voltwire::wire
