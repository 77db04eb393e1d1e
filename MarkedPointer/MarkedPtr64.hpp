#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <utility>
#include "TagCodec.hpp"

namespace mptr
{

// A 64 bit pointer with a 16 bit tag in its upper bits, independent of the alignment of T.
template <typename T>
class MarkedPtr64
{
  static_assert(sizeof(T*) == 8);
public:
  using Pointer = T*;
  using TagType = UpperTagCodec::TagType;
  static constexpr std::size_t sTagBits = 16;
private:
  std::uint64_t mData;
public:
  constexpr MarkedPtr64() noexcept: mData(0) {}
  constexpr MarkedPtr64(std::nullptr_t) noexcept: mData(0) {}
  MarkedPtr64(T* pointer, TagType tag = 0) noexcept: mData(UpperTagCodec::compose(pointer, tag)) {}
  static constexpr MarkedPtr64 null() noexcept { return MarkedPtr64(); }
  static constexpr MarkedPtr64 fromUint64(std::uint64_t data) noexcept
  {
    MarkedPtr64 ans;
    ans.mData = data;
    return ans;
  }
  constexpr std::uint64_t toUint64() const noexcept { return mData; }

  std::pair<T*, TagType> decompose() const noexcept { return UpperTagCodec::decompose<T>(mData); }
  T* decomposePtr() const noexcept { return UpperTagCodec::decomposePtr<T>(mData); }
  constexpr TagType decomposeTag() const noexcept { return UpperTagCodec::decomposeTag(mData); }
  constexpr bool isNull() const noexcept { return (mData & UpperTagCodec::sPointerMask) == 0; }
  T* operator->() const noexcept { return decomposePtr(); }
  T& operator*() const noexcept { return *decomposePtr(); }

  MarkedPtr64 withTag(TagType tag) const noexcept
  {
    return fromUint64((mData & UpperTagCodec::sPointerMask) | static_cast<std::uint64_t>(tag) << UpperTagCodec::sTagShift);
  }
  MarkedPtr64 clearTag() const noexcept { return withTag(0); }
  std::pair<MarkedPtr64, TagType> splitTag() const noexcept
  {
    return std::make_pair(clearTag(), decomposeTag());
  }
  template <typename F>
  MarkedPtr64 updateTag(F&& func) const
  {
    return withTag(static_cast<TagType>(std::forward<F>(func)(decomposeTag())));
  }
  MarkedPtr64 addTag(TagType value) const noexcept
  {
    return withTag(static_cast<TagType>(decomposeTag() + value));
  }
  MarkedPtr64 subTag(TagType value) const noexcept
  {
    return withTag(static_cast<TagType>(decomposeTag() - value));
  }
  template <typename U>
  MarkedPtr64<U> cast() const noexcept
  {
    return MarkedPtr64<U>::fromUint64(mData);
  }

  friend constexpr bool operator==(MarkedPtr64 lhs, MarkedPtr64 rhs) noexcept { return lhs.mData == rhs.mData; }
  friend constexpr bool operator!=(MarkedPtr64 lhs, MarkedPtr64 rhs) noexcept { return lhs.mData != rhs.mData; }
  friend constexpr bool operator<(MarkedPtr64 lhs, MarkedPtr64 rhs) noexcept { return lhs.mData < rhs.mData; }
  friend constexpr bool operator<=(MarkedPtr64 lhs, MarkedPtr64 rhs) noexcept { return lhs.mData <= rhs.mData; }
  friend constexpr bool operator>(MarkedPtr64 lhs, MarkedPtr64 rhs) noexcept { return lhs.mData > rhs.mData; }
  friend constexpr bool operator>=(MarkedPtr64 lhs, MarkedPtr64 rhs) noexcept { return lhs.mData >= rhs.mData; }
  friend std::ostream& operator<<(std::ostream& os, MarkedPtr64 ptr)
  {
    return os << "MarkedPtr64{ptr: " << static_cast<const void*>(ptr.decomposePtr()) << ", tag: " << ptr.decomposeTag() << "}";
  }
};

}

namespace std
{
template <typename T>
struct hash<mptr::MarkedPtr64<T>>
{
  std::size_t operator()(mptr::MarkedPtr64<T> ptr) const noexcept
  {
    return std::hash<std::uint64_t>()(ptr.toUint64());
  }
};
}
