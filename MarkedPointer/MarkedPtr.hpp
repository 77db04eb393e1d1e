#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <utility>
#include "TagCodec.hpp"

namespace mptr
{

// A non-owning pointer with an N bit tag in its low bits, N bounded by the alignment of T.
template <typename T, std::size_t N>
class MarkedPtr
{
public:
  using Pointer = T*;
  using TagType = std::uintptr_t;
  static constexpr std::size_t sTagBits = N;
  static constexpr std::uintptr_t sTagMask = TagCodec::tagMask(N);
  static constexpr std::uintptr_t sPointerMask = TagCodec::pointerMask(N);
private:
  std::uintptr_t mData;
  // checked on use so that `T` may still be incomplete where a MarkedPtr<T, N> member is declared
  static constexpr bool hasEnoughTagBits() noexcept
  {
    return N <= TagCodec::alignmentBits<T>();
  }
public:
  constexpr MarkedPtr() noexcept: mData(0) {}
  constexpr MarkedPtr(std::nullptr_t) noexcept: mData(0) {}
  MarkedPtr(T* pointer, TagType tag = 0) noexcept: mData(TagCodec::compose(pointer, tag, N))
  {
    static_assert(hasEnoughTagBits(), "alignment of T leaves too few low bits for the tag");
  }
  static constexpr MarkedPtr null() noexcept
  {
    return MarkedPtr();
  }
  // reinterprets an already packed value, for interoperation with code that stores the raw word
  static constexpr MarkedPtr fromUintptr(std::uintptr_t data) noexcept
  {
    MarkedPtr ans;
    ans.mData = data;
    return ans;
  }
  constexpr std::uintptr_t toUintptr() const noexcept { return mData; }

  std::pair<T*, TagType> decompose() const noexcept
  {
    return TagCodec::decompose<T>(mData, N);
  }
  T* decomposePtr() const noexcept
  {
    return TagCodec::decomposePtr<T>(mData, N);
  }
  constexpr TagType decomposeTag() const noexcept
  {
    return TagCodec::decomposeTag(mData, N);
  }
  constexpr bool isNull() const noexcept
  {
    return (mData & sPointerMask) == 0;
  }
  T* operator->() const noexcept { return decomposePtr(); }
  T& operator*() const noexcept { return *decomposePtr(); }

  MarkedPtr withTag(TagType tag) const noexcept
  {
    return fromUintptr((mData & sPointerMask) | TagCodec::compose(0, tag, N));
  }
  MarkedPtr clearTag() const noexcept
  {
    return fromUintptr(mData & sPointerMask);
  }
  std::pair<MarkedPtr, TagType> splitTag() const noexcept
  {
    return std::make_pair(clearTag(), decomposeTag());
  }
  template <typename F>
  MarkedPtr updateTag(F&& func) const
  {
    return withTag(std::forward<F>(func)(decomposeTag()) & sTagMask);
  }
  // tag arithmetic wraps around within the tag bits
  MarkedPtr addTag(TagType value) const noexcept
  {
    return withTag((decomposeTag() + value) & sTagMask);
  }
  MarkedPtr subTag(TagType value) const noexcept
  {
    return withTag((decomposeTag() - value) & sTagMask);
  }
  template <typename U>
  MarkedPtr<U, N> cast() const noexcept
  {
    return MarkedPtr<U, N>::fromUintptr(mData);
  }

  friend constexpr bool operator==(MarkedPtr lhs, MarkedPtr rhs) noexcept { return lhs.mData == rhs.mData; }
  friend constexpr bool operator!=(MarkedPtr lhs, MarkedPtr rhs) noexcept { return lhs.mData != rhs.mData; }
  friend constexpr bool operator<(MarkedPtr lhs, MarkedPtr rhs) noexcept { return lhs.mData < rhs.mData; }
  friend constexpr bool operator<=(MarkedPtr lhs, MarkedPtr rhs) noexcept { return lhs.mData <= rhs.mData; }
  friend constexpr bool operator>(MarkedPtr lhs, MarkedPtr rhs) noexcept { return lhs.mData > rhs.mData; }
  friend constexpr bool operator>=(MarkedPtr lhs, MarkedPtr rhs) noexcept { return lhs.mData >= rhs.mData; }
  friend std::ostream& operator<<(std::ostream& os, MarkedPtr ptr)
  {
    return os << "MarkedPtr{ptr: " << static_cast<const void*>(ptr.decomposePtr()) << ", tag: " << ptr.decomposeTag() << "}";
  }
};

}

namespace std
{
template <typename T, std::size_t N>
struct hash<mptr::MarkedPtr<T, N>>
{
  std::size_t operator()(mptr::MarkedPtr<T, N> ptr) const noexcept
  {
    return std::hash<std::uintptr_t>()(ptr.toUintptr());
  }
};
}
