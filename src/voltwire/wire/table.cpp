#include "stdinc.hpp"

#include "table.hpp"

namespace voltwire::wire {

// ------------------------------------------------------------------------------------------ Table

std::optional<std::size_t> Table::column_index(std::string_view name) const {
  auto ii = ranges::find_if(columns_, [name](const auto& column) { return column.name == name; });
  if (ii == columns_.end())
    return std::nullopt;
  return std::size_t(ii - columns_.begin());
}

Row Table::row(std::size_t index) const {
  Expects(index < rows_.size());
  return Row{*this, index};
}

// -------------------------------------------------------------------------------------------- Row

std::size_t Row::size() const { return table_->values(index_).size(); }

expected<Value, error_code> Row::get(std::size_t column) const {
  const auto& values = table_->values(index_);
  if (column >= values.size())
    return make_unexpected(make_error_code(ecode::index_out_of_range));
  return values[column];
}

expected<Value, error_code> Row::get(std::string_view column_name) const {
  const auto index = table_->column_index(column_name);
  if (!index)
    return make_unexpected(make_error_code(ecode::column_not_found));
  return get(*index);
}

expected<std::optional<std::string>, error_code>
Row::get_string(std::string_view column_name) const {
  return get(column_name).and_then(
      [](Value value) -> expected<std::optional<std::string>, error_code> {
        if (is_null(value))
          return std::optional<std::string>{};
        if (auto* s = std::get_if<std::string>(&value))
          return std::optional<std::string>{std::move(*s)};
        return make_unexpected(make_error_code(ecode::type_error));
      });
}

expected<std::optional<int64_t>, error_code> Row::get_i64(std::string_view column_name) const {
  return get(column_name).and_then(
      [](const Value& value) -> expected<std::optional<int64_t>, error_code> {
        if (is_null(value))
          return std::optional<int64_t>{};
        if (auto* x = std::get_if<int8_t>(&value))
          return std::optional<int64_t>{*x};
        if (auto* x = std::get_if<int16_t>(&value))
          return std::optional<int64_t>{*x};
        if (auto* x = std::get_if<int32_t>(&value))
          return std::optional<int64_t>{*x};
        if (auto* x = std::get_if<int64_t>(&value))
          return std::optional<int64_t>{*x};
        return make_unexpected(make_error_code(ecode::type_error));
      });
}

expected<std::optional<double>, error_code> Row::get_f64(std::string_view column_name) const {
  return get(column_name).and_then(
      [](const Value& value) -> expected<std::optional<double>, error_code> {
        if (is_null(value))
          return std::optional<double>{};
        if (auto* x = std::get_if<double>(&value))
          return std::optional<double>{*x};
        return make_unexpected(make_error_code(ecode::type_error));
      });
}

} // namespace voltwire::wire
