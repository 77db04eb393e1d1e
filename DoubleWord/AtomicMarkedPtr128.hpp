#pragma once

#include <atomic>
#include <cassert>
#include <cstdint>
#include <optional>
#include <utility>
#include "DoubleWordCAS.hpp"
#include "MarkedPtr128.hpp"
#include "../MarkedPointer/MemoryOrder.hpp"

namespace mptr
{

// Loads are compare-exchanges too, so an instance must live in writable memory.
template <typename T>
class AtomicMarkedPtr128
{
public:
  using Value = MarkedPtr128<T>;
  using TagType = typename Value::TagType;
private:
  mutable DoubleWord mData;
  bool compareExchange(DoubleWord& expected, DoubleWord desired, std::memory_order success, std::memory_order failure) const noexcept
  {
    assert(Detail::isFailureOrder(success, failure));
    return doubleWordCompareExchange(&mData, expected, desired, toOrderCode(success), toOrderCode(failure));
  }
public:
  AtomicMarkedPtr128() noexcept: mData{0, 0} {}
  AtomicMarkedPtr128(Value value) noexcept: mData(value.toDoubleWord()) {}
  AtomicMarkedPtr128(T* pointer, TagType tag) noexcept: mData(Value(pointer, tag).toDoubleWord()) {}
  AtomicMarkedPtr128(const AtomicMarkedPtr128&) = delete;
  AtomicMarkedPtr128& operator=(const AtomicMarkedPtr128&) = delete;
  ~AtomicMarkedPtr128() = default;

  bool is_lock_free() const noexcept { return doubleWordIsLockFree(); }
  // exchanges (null, 0) with itself, which leaves any other value in place and reports it
  Value load(std::memory_order order = std::memory_order_seq_cst) const noexcept
  {
    assert(Detail::isLoadOrder(order));
    DoubleWord expected{0, 0};
    static_cast<void>(compareExchange(expected, expected, order, order));
    return Value::fromDoubleWord(expected);
  }
  void store(Value desired, std::memory_order order = std::memory_order_seq_cst) noexcept
  {
    assert(Detail::isStoreOrder(order));
    static_cast<void>(exchange(desired, order));
  }
  Value exchange(Value desired, std::memory_order order = std::memory_order_seq_cst) noexcept
  {
    auto expected = load(std::memory_order_relaxed).toDoubleWord();
    auto next = desired.toDoubleWord();
    while(!compareExchange(expected, next, order, std::memory_order_relaxed));
    return Value::fromDoubleWord(expected);
  }
  bool compare_exchange_strong(Value& expected, Value desired, std::memory_order success, std::memory_order failure) noexcept
  {
    auto data = expected.toDoubleWord();
    auto ans = compareExchange(data, desired.toDoubleWord(), success, failure);
    if(!ans)
    {
      expected = Value::fromDoubleWord(data);
    }
    return ans;
  }
  bool compare_exchange_strong(Value& expected, Value desired, std::memory_order order = std::memory_order_seq_cst) noexcept
  {
    return compare_exchange_strong(expected, desired, order, Detail::strongestFailureOrder(order));
  }
  // none of the backends fails spuriously
  bool compare_exchange_weak(Value& expected, Value desired, std::memory_order success, std::memory_order failure) noexcept
  {
    return compare_exchange_strong(expected, desired, success, failure);
  }
  bool compare_exchange_weak(Value& expected, Value desired, std::memory_order order = std::memory_order_seq_cst) noexcept
  {
    return compare_exchange_strong(expected, desired, order);
  }
  template <typename F>
  std::pair<Value, bool> fetch_update(std::memory_order success, std::memory_order failure, F&& func)
  {
    auto current = load(failure);
    while(std::optional<Value> next = func(current))
    {
      if(compare_exchange_strong(current, *next, success, failure))
      {
        return std::make_pair(current, true);
      }
    }
    return std::make_pair(current, false);
  }
  template <typename F>
  std::pair<Value, bool> fetch_update(std::memory_order order, F&& func)
  {
    return fetch_update(order, Detail::strongestFailureOrder(order), std::forward<F>(func));
  }
  Value fetch_add_tag(TagType value, std::memory_order order = std::memory_order_seq_cst) noexcept
  {
    return fetch_update(order, [value](Value current){ return std::optional<Value>(current.addTag(value)); }).first;
  }
};

}
