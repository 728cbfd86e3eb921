
#include "stdinc.hpp"

#include "voltwire/client/pending-future.hpp"

#include <catch2/catch_all.hpp>

#include <thread>

namespace voltwire::client::test {

using net::Status;
using net::StatusCode;

static wire::ExecResult rows(Handle handle, int64_t count) { return {handle, count}; }

CATCH_TEST_CASE("PendingFuture", "[pending-future]") {
  CATCH_SECTION("resolve-success") {
    ExecFuture future{1};
    CATCH_REQUIRE(future.handle() == 1);
    CATCH_REQUIRE(future.is_active());
    CATCH_REQUIRE(!future.wait_for(std::chrono::milliseconds{1}));

    future.resolve_success(rows(1, 5));
    CATCH_REQUIRE(!future.is_active());
    CATCH_REQUIRE(future.is_success());
    CATCH_REQUIRE(future.wait_for(std::chrono::milliseconds{0}));

    // Repeatable, and the same object every time
    const auto& first = future.get();
    const auto& second = future.get();
    CATCH_REQUIRE(&first == &second);
    CATCH_REQUIRE(first.has_value());
    CATCH_REQUIRE(first->rows_affected == 5);
  }

  CATCH_SECTION("resolve-error") {
    QueryFuture future{2};
    future.resolve_error(Status{StatusCode::CONNECTION_LOST, "gone"});
    CATCH_REQUIRE(future.is_error());
    CATCH_REQUIRE(!future.get().has_value());
    CATCH_REQUIRE(future.get().error().error_code() == StatusCode::CONNECTION_LOST);
  }

  CATCH_SECTION("duplicate-resolution") {
    ExecFuture future{3};
    CATCH_REQUIRE(future.try_resolve_success(rows(3, 1)).ok());

    const auto again = future.try_resolve_success(rows(3, 2));
    CATCH_REQUIRE(again.error_code() == StatusCode::DUPLICATE_RESOLUTION);
    const auto error = future.try_resolve_error(Status{StatusCode::CONNECTION_LOST});
    CATCH_REQUIRE(error.error_code() == StatusCode::DUPLICATE_RESOLUTION);

    // The first outcome stands
    CATCH_REQUIRE(future.get()->rows_affected == 1);
  }

  CATCH_SECTION("blocking-get") {
    auto future = std::make_shared<ExecFuture>(4);
    std::thread resolver{[future]() {
      std::this_thread::sleep_for(std::chrono::milliseconds{20});
      future->resolve_success(rows(4, 9));
    }};
    const auto& result = future->get();
    resolver.join();
    CATCH_REQUIRE(result.has_value());
    CATCH_REQUIRE(result->rows_affected == 9);
  }

  CATCH_SECTION("observers") {
    ExecFuture future{5};
    int count = 0;
    future.add_observer([&count]() { ++count; });
    future.add_observer([&count]() { ++count; });
    CATCH_REQUIRE(count == 0);
    future.resolve_success(rows(5, 0));
    CATCH_REQUIRE(count == 2);

    // Already resolved: runs immediately
    future.add_observer([&count]() { ++count; });
    CATCH_REQUIRE(count == 3);
  }

  CATCH_SECTION("consumer-hook") {
    ExecFuture future{6};
    std::vector<Handle> consumed;
    future.set_consumer([&consumed](Handle handle) { consumed.push_back(handle); });
    CATCH_REQUIRE(!future.is_consumed());

    future.resolve_success(rows(6, 1));
    CATCH_REQUIRE(consumed.empty()); // resolution is not consumption

    future.get();
    future.get();
    future.mark_consumed();
    CATCH_REQUIRE(future.is_consumed());
    CATCH_REQUIRE(consumed == std::vector<Handle>{6});
  }
}

} // namespace voltwire::client::test
