#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <utility>
#include "DoubleWordCAS.hpp"
#include "../MarkedPointer/TagCodec.hpp"

namespace mptr
{

template <typename T>
class MarkedPtr128
{
  static_assert(sizeof(T*) == sizeof(std::uint64_t), "MarkedPtr128 requires 64 bit pointers");
public:
  using Pointer = T*;
  using TagType = std::uint64_t;
private:
  T* mPointer;
  TagType mTag;
public:
  constexpr MarkedPtr128() noexcept: mPointer(nullptr), mTag(0) {}
  constexpr MarkedPtr128(std::nullptr_t) noexcept: mPointer(nullptr), mTag(0) {}
  constexpr MarkedPtr128(T* pointer, TagType tag = 0) noexcept: mPointer(pointer), mTag(tag) {}
  static constexpr MarkedPtr128 null() noexcept { return MarkedPtr128(); }
  static MarkedPtr128 fromDoubleWord(DoubleWord word) noexcept
  {
    return MarkedPtr128(TagCodec::toPointer<T>(static_cast<TagCodec::Word>(word.first)), word.second);
  }
  DoubleWord toDoubleWord() const noexcept
  {
    return DoubleWord{static_cast<std::uint64_t>(TagCodec::toAddress(mPointer)), mTag};
  }

  constexpr std::pair<T*, TagType> decompose() const noexcept { return std::make_pair(mPointer, mTag); }
  constexpr T* decomposePtr() const noexcept { return mPointer; }
  constexpr TagType decomposeTag() const noexcept { return mTag; }
  constexpr bool isNull() const noexcept { return mPointer == nullptr; }
  T* operator->() const noexcept { return mPointer; }
  T& operator*() const noexcept { return *mPointer; }

  constexpr MarkedPtr128 withTag(TagType tag) const noexcept { return MarkedPtr128(mPointer, tag); }
  constexpr MarkedPtr128 clearTag() const noexcept { return MarkedPtr128(mPointer, 0); }
  constexpr std::pair<MarkedPtr128, TagType> splitTag() const noexcept
  {
    return std::make_pair(clearTag(), mTag);
  }
  template <typename F>
  MarkedPtr128 updateTag(F&& func) const
  {
    return withTag(std::forward<F>(func)(mTag));
  }
  constexpr MarkedPtr128 addTag(TagType value) const noexcept { return withTag(mTag + value); }
  constexpr MarkedPtr128 subTag(TagType value) const noexcept { return withTag(mTag - value); }
  template <typename U>
  MarkedPtr128<U> cast() const noexcept
  {
    return MarkedPtr128<U>(static_cast<U*>(static_cast<void*>(mPointer)), mTag);
  }

  friend constexpr bool operator==(MarkedPtr128 lhs, MarkedPtr128 rhs) noexcept
  {
    return lhs.mPointer == rhs.mPointer && lhs.mTag == rhs.mTag;
  }
  friend constexpr bool operator!=(MarkedPtr128 lhs, MarkedPtr128 rhs) noexcept
  {
    return !(lhs == rhs);
  }
  friend bool operator<(MarkedPtr128 lhs, MarkedPtr128 rhs) noexcept
  {
    if(lhs.mPointer != rhs.mPointer)
    {
      return std::less<T*>()(lhs.mPointer, rhs.mPointer);
    }
    return lhs.mTag < rhs.mTag;
  }
  friend std::ostream& operator<<(std::ostream& os, MarkedPtr128 ptr)
  {
    return os << "MarkedPtr128{ptr: " << static_cast<const void*>(ptr.mPointer) << ", tag: " << ptr.mTag << "}";
  }
};

}

namespace std
{
template <typename T>
struct hash<mptr::MarkedPtr128<T>>
{
  std::size_t operator()(mptr::MarkedPtr128<T> ptr) const noexcept
  {
    auto seed = std::hash<T*>()(ptr.decomposePtr());
    return seed ^ (std::hash<std::uint64_t>()(ptr.decomposeTag()) + 0x9e3779b9 + (seed << 6) + (seed >> 2));
  }
};
}
