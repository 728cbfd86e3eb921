
#include "stdinc.hpp"

#include "voltwire/async/handle-allocator.hpp"

#include <catch2/catch_all.hpp>

#include <thread>

namespace voltwire::async
{

CATCH_TEST_CASE("HandleAllocator", "[handle-allocator]")
{
   CATCH_SECTION("sequential")
   {
      HandleAllocator handles;
      CATCH_REQUIRE(handles.last() == 0);
      CATCH_REQUIRE(handles.next() == 1);
      CATCH_REQUIRE(handles.next() == 2);
      CATCH_REQUIRE(handles.last() == 2);

      HandleAllocator offset{100};
      CATCH_REQUIRE(offset.next() == 101);
   }

   CATCH_SECTION("concurrent")
   {
      constexpr int k_n_threads    = 8;
      constexpr int k_n_per_thread = 5000;

      HandleAllocator handles;
      std::vector<std::vector<Handle>> results(k_n_threads);
      std::vector<std::thread> threads;
      for(auto i = 0; i < k_n_threads; ++i) {
         threads.emplace_back([&handles, &out = results[std::size_t(i)]]() {
            out.reserve(k_n_per_thread);
            for(auto j = 0; j < k_n_per_thread; ++j) out.push_back(handles.next());
         });
      }
      for(auto& thread : threads) thread.join();

      std::vector<Handle> all;
      for(const auto& out : results) {
         // Each thread sees a strictly increasing sequence
         CATCH_REQUIRE(std::adjacent_find(begin(out), end(out), std::greater_equal<>{})
                       == end(out));
         all.insert(end(all), begin(out), end(out));
      }

      std::sort(begin(all), end(all));
      CATCH_REQUIRE(all.size() == std::size_t(k_n_threads * k_n_per_thread));
      CATCH_REQUIRE(std::adjacent_find(begin(all), end(all)) == end(all)); // unique
      CATCH_REQUIRE(all.front() == 1);
      CATCH_REQUIRE(all.back() == Handle(k_n_threads * k_n_per_thread));
      CATCH_REQUIRE(handles.last() == all.back());
   }
}

} // namespace voltwire::async
