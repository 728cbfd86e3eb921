#include "stdinc.hpp"

#include "wire-types.hpp"

namespace voltwire::wire {

namespace {
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
} // namespace

WireType wire_type_of(const Value& value) {
  return std::visit(overloaded{[](const Null&) { return WireType::NULL_TYPE; },
                               [](int8_t) { return WireType::TINYINT; },
                               [](int16_t) { return WireType::SMALLINT; },
                               [](int32_t) { return WireType::INTEGER; },
                               [](int64_t) { return WireType::BIGINT; },
                               [](double) { return WireType::FLOAT; },
                               [](const std::string&) { return WireType::STRING; },
                               [](const Timestamp&) { return WireType::TIMESTAMP; },
                               [](const Varbinary&) { return WireType::VARBINARY; }},
                    value);
}

std::string to_string(const Value& value) {
  return std::visit(overloaded{[](const Null&) { return std::string{"NULL"}; },
                               [](int8_t x) { return fmt::format("{}", int(x)); },
                               [](int16_t x) { return fmt::format("{}", x); },
                               [](int32_t x) { return fmt::format("{}", x); },
                               [](int64_t x) { return fmt::format("{}", x); },
                               [](double x) { return fmt::format("{}", x); },
                               [](const std::string& x) { return fmt::format("'{}'", x); },
                               [](const Timestamp& x) { return fmt::format("ts:{}us", x.micros); },
                               [](const Varbinary& x) {
                                 std::string out{"0x"};
                                 for (auto b : x)
                                   out += fmt::format("{:02x}", std::to_integer<unsigned>(b));
                                 return out;
                               }},
                    value);
}

} // namespace voltwire::wire
