#pragma once

#include <atomic>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include "MarkedPtr.hpp"
#include "MemoryOrder.hpp"

namespace mptr
{

template <typename T, std::size_t N>
class AtomicMarkedPtr
{
public:
  using Value = MarkedPtr<T, N>;
  using TagType = typename Value::TagType;
private:
  using InternalRep = std::uintptr_t;
  std::atomic<InternalRep> mData;
public:
  AtomicMarkedPtr() noexcept: mData(0) {}
  AtomicMarkedPtr(Value value) noexcept: mData(value.toUintptr()) {}
  AtomicMarkedPtr(T* pointer, TagType tag) noexcept: mData(Value(pointer, tag).toUintptr()) {}
  AtomicMarkedPtr(const AtomicMarkedPtr&) = delete;
  AtomicMarkedPtr& operator=(const AtomicMarkedPtr&) = delete;
  ~AtomicMarkedPtr() = default;

  bool is_lock_free() const noexcept { return mData.is_lock_free(); }
  Value load(std::memory_order order = std::memory_order_seq_cst) const noexcept
  {
    assert(Detail::isLoadOrder(order));
    return Value::fromUintptr(mData.load(order));
  }
  void store(Value desired, std::memory_order order = std::memory_order_seq_cst) noexcept
  {
    assert(Detail::isStoreOrder(order));
    mData.store(desired.toUintptr(), order);
  }
  Value exchange(Value desired, std::memory_order order = std::memory_order_seq_cst) noexcept
  {
    return Value::fromUintptr(mData.exchange(desired.toUintptr(), order));
  }

  bool compare_exchange_strong(Value& expected, Value desired, std::memory_order success, std::memory_order failure) noexcept
  {
    assert(Detail::isFailureOrder(success, failure));
    auto data = expected.toUintptr();
    bool ans = mData.compare_exchange_strong(data, desired.toUintptr(), success, failure);
    if(!ans)
    {
      expected = Value::fromUintptr(data);
    }
    return ans;
  }
  bool compare_exchange_strong(Value& expected, Value desired, std::memory_order order = std::memory_order_seq_cst) noexcept
  {
    return compare_exchange_strong(expected, desired, order, Detail::strongestFailureOrder(order));
  }
  // may fail spuriously
  bool compare_exchange_weak(Value& expected, Value desired, std::memory_order success, std::memory_order failure) noexcept
  {
    assert(Detail::isFailureOrder(success, failure));
    auto data = expected.toUintptr();
    bool ans = mData.compare_exchange_weak(data, desired.toUintptr(), success, failure);
    if(!ans)
    {
      expected = Value::fromUintptr(data);
    }
    return ans;
  }
  bool compare_exchange_weak(Value& expected, Value desired, std::memory_order order = std::memory_order_seq_cst) noexcept
  {
    return compare_exchange_weak(expected, desired, order, Detail::strongestFailureOrder(order));
  }

  // retries until func returns std::nullopt or its result is stored
  template <typename F>
  std::pair<Value, bool> fetch_update(std::memory_order success, std::memory_order failure, F&& func)
  {
    auto current = load(failure);
    while(std::optional<Value> next = func(current))
    {
      if(compare_exchange_weak(current, *next, success, failure))
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

  // adds to the raw word: a tag overflow carries into the pointer bits
  Value fetch_add(TagType value, std::memory_order order = std::memory_order_seq_cst) noexcept
  {
    assert(value <= Value::sTagMask);
    return Value::fromUintptr(mData.fetch_add(value, order));
  }
  Value fetch_sub(TagType value, std::memory_order order = std::memory_order_seq_cst) noexcept
  {
    assert(value <= Value::sTagMask);
    return Value::fromUintptr(mData.fetch_sub(value, order));
  }
  Value fetch_or(TagType value, std::memory_order order = std::memory_order_seq_cst) noexcept
  {
    return Value::fromUintptr(mData.fetch_or(Value::sTagMask & value, order));
  }
  Value fetch_and(TagType value, std::memory_order order = std::memory_order_seq_cst) noexcept
  {
    return Value::fromUintptr(mData.fetch_and(Value::sPointerMask | value, order));
  }
};

}
