#pragma once

#include <atomic>
#include <cassert>
#include <cstdint>
#include <optional>
#include <utility>
#include "MarkedPtr64.hpp"
#include "MemoryOrder.hpp"

namespace mptr
{

template <typename T>
class AtomicMarkedPtr64
{
public:
  using Value = MarkedPtr64<T>;
  using TagType = typename Value::TagType;
private:
  std::atomic<std::uint64_t> mData;
  static constexpr std::uint64_t sTagUnit = static_cast<std::uint64_t>(1) << UpperTagCodec::sTagShift;
public:
  AtomicMarkedPtr64() noexcept: mData(0) {}
  AtomicMarkedPtr64(Value value) noexcept: mData(value.toUint64()) {}
  AtomicMarkedPtr64(T* pointer, TagType tag) noexcept: mData(Value(pointer, tag).toUint64()) {}
  AtomicMarkedPtr64(const AtomicMarkedPtr64&) = delete;
  AtomicMarkedPtr64& operator=(const AtomicMarkedPtr64&) = delete;
  ~AtomicMarkedPtr64() = default;

  bool is_lock_free() const noexcept { return mData.is_lock_free(); }
  Value load(std::memory_order order = std::memory_order_seq_cst) const noexcept
  {
    assert(Detail::isLoadOrder(order));
    return Value::fromUint64(mData.load(order));
  }
  void store(Value desired, std::memory_order order = std::memory_order_seq_cst) noexcept
  {
    assert(Detail::isStoreOrder(order));
    mData.store(desired.toUint64(), order);
  }
  Value exchange(Value desired, std::memory_order order = std::memory_order_seq_cst) noexcept
  {
    return Value::fromUint64(mData.exchange(desired.toUint64(), order));
  }
  bool compare_exchange_strong(Value& expected, Value desired, std::memory_order success, std::memory_order failure) noexcept
  {
    assert(Detail::isFailureOrder(success, failure));
    auto data = expected.toUint64();
    auto ans = mData.compare_exchange_strong(data, desired.toUint64(), success, failure);
    if(!ans)
    {
      expected = Value::fromUint64(data);
    }
    return ans;
  }
  bool compare_exchange_strong(Value& expected, Value desired, std::memory_order order = std::memory_order_seq_cst) noexcept
  {
    return compare_exchange_strong(expected, desired, order, Detail::strongestFailureOrder(order));
  }
  bool compare_exchange_weak(Value& expected, Value desired, std::memory_order success, std::memory_order failure) noexcept
  {
    assert(Detail::isFailureOrder(success, failure));
    auto data = expected.toUint64();
    auto ans = mData.compare_exchange_weak(data, desired.toUint64(), success, failure);
    if(!ans)
    {
      expected = Value::fromUint64(data);
    }
    return ans;
  }
  bool compare_exchange_weak(Value& expected, Value desired, std::memory_order order = std::memory_order_seq_cst) noexcept
  {
    return compare_exchange_weak(expected, desired, order, Detail::strongestFailureOrder(order));
  }
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
  // the tag occupies the top bits, so it wraps around without touching the pointer
  Value fetch_add_tag(TagType value, std::memory_order order = std::memory_order_seq_cst) noexcept
  {
    return Value::fromUint64(mData.fetch_add(static_cast<std::uint64_t>(value) * sTagUnit, order));
  }
  Value fetch_sub_tag(TagType value, std::memory_order order = std::memory_order_seq_cst) noexcept
  {
    return Value::fromUint64(mData.fetch_sub(static_cast<std::uint64_t>(value) * sTagUnit, order));
  }
  Value fetch_or_tag(TagType value, std::memory_order order = std::memory_order_seq_cst) noexcept
  {
    return Value::fromUint64(mData.fetch_or(static_cast<std::uint64_t>(value) << UpperTagCodec::sTagShift, order));
  }
  // the pointer bits are kept as they are
  Value fetch_and_tag(TagType value, std::memory_order order = std::memory_order_seq_cst) noexcept
  {
    return Value::fromUint64(mData.fetch_and(UpperTagCodec::sPointerMask | static_cast<std::uint64_t>(value) << UpperTagCodec::sTagShift, order));
  }
};

}
