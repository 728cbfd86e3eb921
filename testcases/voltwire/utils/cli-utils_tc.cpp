
#include "stdinc.hpp"

#include "voltwire/utils/cli-utils.hpp"

#include <catch2/catch_all.hpp>

#include <stdexcept>

namespace voltwire::cli::tests {

struct Argv {
  std::vector<std::string> args;
  std::vector<char*> pointers;

  explicit Argv(std::vector<std::string> args_) : args{std::move(args_)} {
    for (auto& arg : args)
      pointers.push_back(arg.data());
  }

  int argc() const { return int(args.size()); }
  char** argv() { return pointers.data(); }
};

CATCH_TEST_CASE("CliUtils", "[cli-utils]") {
  CATCH_SECTION("cli-utils") {
    Argv args{{"voltwire-hello", "--host", "db1", "--port", "21212", "--retries", "-3"}};
    int i = 1;
    CATCH_REQUIRE(safe_arg_str(args.argc(), args.argv(), i) == "db1");
    CATCH_REQUIRE(i == 2);
    ++i;
    CATCH_REQUIRE(safe_arg_port(args.argc(), args.argv(), i) == 21212);
    CATCH_REQUIRE(i == 4);
    ++i;
    CATCH_REQUIRE(safe_arg_int(args.argc(), args.argv(), i) == -3);
    CATCH_REQUIRE(i == 6);
  }

  CATCH_SECTION("missing-value") {
    Argv args{{"voltwire-hello", "--host"}};
    int i = 1;
    CATCH_REQUIRE_THROWS_AS(safe_arg_str(args.argc(), args.argv(), i), std::runtime_error);
  }

  CATCH_SECTION("bad-port") {
    Argv args{{"voltwire-hello", "--port", "0", "--port", "65536", "--port", "http"}};
    int i = 1;
    CATCH_REQUIRE_THROWS_AS(safe_arg_port(args.argc(), args.argv(), i), std::runtime_error);
    i = 3;
    CATCH_REQUIRE_THROWS_AS(safe_arg_port(args.argc(), args.argv(), i), std::runtime_error);
    i = 5;
    CATCH_REQUIRE_THROWS_AS(safe_arg_port(args.argc(), args.argv(), i), std::runtime_error);
  }
}

} // namespace voltwire::cli::tests
