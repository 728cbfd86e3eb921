
#include "stdinc.hpp"

#include "voltwire/client/drain.hpp"

#include <catch2/catch_all.hpp>

#include <random>
#include <thread>

namespace voltwire::client::test {

using net::Status;
using net::StatusCode;

static std::vector<QueryFuturePtr> make_futures(std::size_t n) {
  std::vector<QueryFuturePtr> futures;
  for (std::size_t i = 0; i < n; ++i)
    futures.push_back(std::make_shared<QueryFuture>(Handle(i + 1)));
  return futures;
}

static wire::Response response_for(Handle handle) {
  wire::Response response;
  response.handle = handle;
  response.status = wire::ResponseStatus::SUCCESS;
  return response;
}

CATCH_TEST_CASE("Drain", "[drain]") {
  CATCH_SECTION("any-order") {
    auto futures = make_futures(16);
    auto order = futures;
    std::shuffle(begin(order), end(order), std::mt19937{42});

    std::thread resolver{[order]() {
      for (std::size_t i = 0; i < order.size(); ++i) {
        if (i % 5 == 4)
          order[i]->resolve_error(Status{StatusCode::PROCEDURE_FAILED, "nope"});
        else
          order[i]->resolve_success(response_for(order[i]->handle()));
        std::this_thread::sleep_for(std::chrono::microseconds{200});
      }
    }};

    drain(futures);
    for (const auto& future : futures) {
      CATCH_REQUIRE(!future->is_active());
      CATCH_REQUIRE(future->is_consumed());
    }
    resolver.join();

    const auto n_errors =
        ranges::count_if(futures, [](const auto& future) { return future->is_error(); });
    CATCH_REQUIRE(n_errors == 3);
  }

  CATCH_SECTION("already-resolved") {
    auto futures = make_futures(4);
    for (const auto& future : futures)
      future->resolve_success(response_for(future->handle()));
    CATCH_REQUIRE(drain(futures) == 0);
    for (const auto& future : futures)
      CATCH_REQUIRE(future->is_consumed());
  }

  CATCH_SECTION("mixed") {
    auto futures = make_futures(3);
    futures[1]->resolve_success(response_for(2));
    futures.push_back(nullptr);

    std::thread resolver{[&futures]() {
      std::this_thread::sleep_for(std::chrono::milliseconds{10});
      futures[2]->resolve_success(response_for(3));
      futures[0]->resolve_error(Status{StatusCode::CONNECTION_LOST});
    }};
    CATCH_REQUIRE(drain(futures) == 2);
    resolver.join();

    CATCH_REQUIRE(futures[0]->is_error());
    CATCH_REQUIRE(futures[1]->is_success());
    CATCH_REQUIRE(futures[2]->is_success());
  }

  CATCH_SECTION("empty") { CATCH_REQUIRE(drain(std::vector<QueryFuturePtr>{}) == 0); }
}

} // namespace voltwire::client::test
