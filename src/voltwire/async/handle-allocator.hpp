#pragma once

#include <atomic>
#include <cstdint>

namespace voltwire
{
/**
 * @brief Correlation identifier for one request/response pair.
 */
using Handle = int64_t;
} // namespace voltwire

namespace voltwire::async
{
/**
 * @ingroup async
 * @brief Hands out strictly increasing `Handle`s, safe for concurrent callers.
 *
 * Construct one allocator when the process starts, and share it (by `shared_ptr`) with every
 * `Connection` that is opened. Handles are never reused, including across connections that
 * are opened one after another.
 */
class HandleAllocator final
{
 private:
   std::atomic<Handle> last_{0};

 public:
   explicit HandleAllocator(Handle last = 0) noexcept
       : last_{last}
   {}
   HandleAllocator(const HandleAllocator&)            = delete;
   HandleAllocator(HandleAllocator&&)                 = delete;
   ~HandleAllocator()                                 = default;
   HandleAllocator& operator=(const HandleAllocator&) = delete;
   HandleAllocator& operator=(HandleAllocator&&)      = delete;

   /** @brief The next handle; each call returns a value greater than all previous calls. */
   Handle next() noexcept { return last_.fetch_add(1, std::memory_order_acq_rel) + 1; }

   /** @brief The most recently allocated handle, or the starting value. */
   Handle last() const noexcept { return last_.load(std::memory_order_acquire); }
};

} // namespace voltwire::async
