#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

namespace voltwire::async
{
/**
 * @ingroup async
 * @brief Unbounded multi-producer, single-consumer queue of completion notices.
 *
 * This is the fan-in point for waiting on a runtime-sized set of futures: each future posts a
 * notice (usually an index into the waited-on set) when it resolves, and the waiting thread pops
 * notices one at a time until it has seen all of them.
 */
template<typename T> class CompletionQueue final
{
 private:
   mutable std::mutex padlock_;
   std::condition_variable cv_;
   std::deque<T> queue_;

 public:
   CompletionQueue()                                  = default;
   CompletionQueue(const CompletionQueue&)            = delete;
   CompletionQueue& operator=(const CompletionQueue&) = delete;

   void push(T value)
   {
      {
         std::lock_guard lock{padlock_};
         queue_.push_back(std::move(value));
      }
      cv_.notify_one();
   }

   /**
    * @brief Blocks until a notice is available, and then removes and returns it.
    */
   T pop()
   {
      std::unique_lock lock{padlock_};
      cv_.wait(lock, [this]() { return !queue_.empty(); });
      T value = std::move(queue_.front());
      queue_.pop_front();
      return value;
   }

   bool try_pop(T& value)
   {
      std::lock_guard lock{padlock_};
      if(queue_.empty()) return false;
      value = std::move(queue_.front());
      queue_.pop_front();
      return true;
   }

   std::size_t size() const
   {
      std::lock_guard lock{padlock_};
      return queue_.size();
   }
};

} // namespace voltwire::async
