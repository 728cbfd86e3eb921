
#include "stdinc.hpp"

#include "voltwire/async/completion-queue.hpp"

#include <catch2/catch_all.hpp>

#include <thread>

namespace voltwire::async
{

CATCH_TEST_CASE("CompletionQueue", "[completion-queue]")
{
   CATCH_SECTION("fifo")
   {
      CompletionQueue<int> queue;
      int value = 0;
      CATCH_REQUIRE(!queue.try_pop(value));
      queue.push(1);
      queue.push(2);
      CATCH_REQUIRE(queue.size() == 2);
      CATCH_REQUIRE(queue.pop() == 1);
      CATCH_REQUIRE(queue.try_pop(value));
      CATCH_REQUIRE(value == 2);
      CATCH_REQUIRE(queue.size() == 0);
   }

   CATCH_SECTION("many-producers")
   {
      constexpr int k_n_producers = 4;
      constexpr int k_n_each      = 1000;

      CompletionQueue<int> queue;
      std::vector<std::thread> producers;
      for(auto i = 0; i < k_n_producers; ++i)
         producers.emplace_back([&queue, i]() {
            for(auto j = 0; j < k_n_each; ++j) queue.push(i * k_n_each + j);
         });

      std::vector<int> seen;
      for(auto i = 0; i < k_n_producers * k_n_each; ++i) seen.push_back(queue.pop());
      for(auto& producer : producers) producer.join();

      std::sort(begin(seen), end(seen));
      for(auto i = 0; i < k_n_producers * k_n_each; ++i) CATCH_REQUIRE(seen[std::size_t(i)] == i);
   }
}

} // namespace voltwire::async
