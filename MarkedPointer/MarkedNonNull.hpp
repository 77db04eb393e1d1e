#pragma once

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <utility>
#include "MarkedPtr.hpp"
#include "TagCodec.hpp"

namespace mptr
{

template <typename T, std::size_t N>
class MaybeNull;

// A MarkedPtr whose address part is never null. The tag alone does not make it non-null.
template <typename T, std::size_t N>
class MarkedNonNull
{
public:
  using Element = T;
  using Pointer = T*;
  using TagType = std::uintptr_t;
  static constexpr std::size_t sTagBits = N;
  static constexpr std::uintptr_t sTagMask = TagCodec::tagMask(N);
  static constexpr std::uintptr_t sPointerMask = TagCodec::pointerMask(N);
private:
  std::uintptr_t mData;
  explicit constexpr MarkedNonNull(std::uintptr_t data) noexcept: mData(data) {}
  static constexpr bool hasEnoughTagBits() noexcept
  {
    return N <= TagCodec::alignmentBits<T>();
  }
public:
  static std::optional<MarkedNonNull> fromPointer(T* pointer) noexcept
  {
    return tryCompose(pointer, 0);
  }
  static MarkedNonNull compose(T* pointer, TagType tag) noexcept
  {
    static_assert(hasEnoughTagBits(), "alignment of T leaves too few low bits for the tag");
    assert(pointer != nullptr);
    return MarkedNonNull(TagCodec::compose(pointer, tag, N));
  }
  static std::optional<MarkedNonNull> tryCompose(T* pointer, TagType tag) noexcept
  {
    if(pointer == nullptr)
    {
      return std::nullopt;
    }
    return compose(pointer, tag);
  }
  // the smallest well aligned address above the tag bits, never dereferenceable in practice
  static MarkedNonNull dangling() noexcept
  {
    static_assert(hasEnoughTagBits(), "alignment of T leaves too few low bits for the tag");
    return MarkedNonNull(std::max<std::uintptr_t>(alignof(T), sTagMask + 1));
  }
  static MaybeNull<T, N> fromMarkedPtr(MarkedPtr<T, N> ptr) noexcept;
  // ptr must not be null apart from its tag
  static MarkedNonNull fromMarkedPtrUnchecked(MarkedPtr<T, N> ptr) noexcept
  {
    assert(!ptr.isNull());
    return MarkedNonNull(ptr.toUintptr());
  }

  constexpr std::uintptr_t toUintptr() const noexcept { return mData; }
  MarkedPtr<T, N> toMarkedPtr() const noexcept { return MarkedPtr<T, N>::fromUintptr(mData); }

  std::pair<T*, TagType> decompose() const noexcept { return TagCodec::decompose<T>(mData, N); }
  T* decomposePtr() const noexcept { return TagCodec::decomposePtr<T>(mData, N); }
  constexpr TagType decomposeTag() const noexcept { return TagCodec::decomposeTag(mData, N); }
  T* operator->() const noexcept { return decomposePtr(); }
  T& operator*() const noexcept { return *decomposePtr(); }

  MarkedNonNull withTag(TagType tag) const noexcept
  {
    return MarkedNonNull((mData & sPointerMask) | TagCodec::compose(0, tag, N));
  }
  MarkedNonNull clearTag() const noexcept { return MarkedNonNull(mData & sPointerMask); }
  std::pair<MarkedNonNull, TagType> splitTag() const noexcept
  {
    return std::make_pair(clearTag(), decomposeTag());
  }
  template <typename F>
  MarkedNonNull updateTag(F&& func) const
  {
    return withTag(std::forward<F>(func)(decomposeTag()) & sTagMask);
  }
  MarkedNonNull addTag(TagType value) const noexcept { return withTag((decomposeTag() + value) & sTagMask); }
  MarkedNonNull subTag(TagType value) const noexcept { return withTag((decomposeTag() - value) & sTagMask); }
  template <typename U>
  MarkedNonNull<U, N> cast() const noexcept
  {
    return MarkedNonNull<U, N>::fromMarkedPtrUnchecked(MarkedPtr<U, N>::fromUintptr(mData));
  }

  friend constexpr bool operator==(MarkedNonNull lhs, MarkedNonNull rhs) noexcept { return lhs.mData == rhs.mData; }
  friend constexpr bool operator!=(MarkedNonNull lhs, MarkedNonNull rhs) noexcept { return lhs.mData != rhs.mData; }
  friend constexpr bool operator<(MarkedNonNull lhs, MarkedNonNull rhs) noexcept { return lhs.mData < rhs.mData; }
  friend constexpr bool operator<=(MarkedNonNull lhs, MarkedNonNull rhs) noexcept { return lhs.mData <= rhs.mData; }
  friend constexpr bool operator>(MarkedNonNull lhs, MarkedNonNull rhs) noexcept { return lhs.mData > rhs.mData; }
  friend constexpr bool operator>=(MarkedNonNull lhs, MarkedNonNull rhs) noexcept { return lhs.mData >= rhs.mData; }
  friend std::ostream& operator<<(std::ostream& os, MarkedNonNull ptr)
  {
    return os << "MarkedNonNull{ptr: " << static_cast<const void*>(ptr.decomposePtr()) << ", tag: " << ptr.decomposeTag() << "}";
  }
};

// Either a MarkedNonNull or a null pointer that still carries a tag.
template <typename T, std::size_t N>
class MaybeNull
{
public:
  using NonNull = MarkedNonNull<T, N>;
  using TagType = std::uintptr_t;
private:
  MarkedPtr<T, N> mPtr;
public:
  constexpr MaybeNull() noexcept: mPtr() {}
  MaybeNull(NonNull value) noexcept: mPtr(value.toMarkedPtr()) {}
  static MaybeNull null(TagType tag = 0) noexcept
  {
    MaybeNull ans;
    ans.mPtr = MarkedPtr<T, N>::null().withTag(tag);
    return ans;
  }

  bool isNull() const noexcept { return mPtr.isNull(); }
  bool isValue() const noexcept { return !mPtr.isNull(); }
  NonNull value() const noexcept
  {
    return NonNull::fromMarkedPtrUnchecked(mPtr);
  }
  // the tag of a null
  TagType nullTag() const noexcept
  {
    assert(isNull());
    return mPtr.decomposeTag();
  }
  std::optional<NonNull> notNull() const noexcept
  {
    if(isNull())
    {
      return std::nullopt;
    }
    return value();
  }
  template <typename F>
  NonNull valueOrElse(F&& func) const
  {
    if(isNull())
    {
      return std::forward<F>(func)(nullTag());
    }
    return value();
  }
  template <typename F>
  auto map(F&& func) const
  {
    using Mapped = decltype(std::forward<F>(func)(std::declval<NonNull>()));
    using Result = MaybeNull<typename Mapped::Element, Mapped::sTagBits>;
    if(isNull())
    {
      return Result::null(nullTag());
    }
    return Result(std::forward<F>(func)(value()));
  }
  MaybeNull take() noexcept
  {
    auto ans = *this;
    *this = MaybeNull();
    return ans;
  }

  MarkedPtr<T, N> toMarkedPtr() const noexcept { return mPtr; }
  std::pair<T*, TagType> decompose() const noexcept { return mPtr.decompose(); }
  T* decomposePtr() const noexcept { return mPtr.decomposePtr(); }
  TagType decomposeTag() const noexcept { return mPtr.decomposeTag(); }
  MaybeNull clearTag() const noexcept { return withTag(0); }
  MaybeNull withTag(TagType tag) const noexcept
  {
    MaybeNull ans;
    ans.mPtr = mPtr.withTag(tag);
    return ans;
  }

  friend bool operator==(MaybeNull lhs, MaybeNull rhs) noexcept { return lhs.mPtr == rhs.mPtr; }
  friend bool operator!=(MaybeNull lhs, MaybeNull rhs) noexcept { return lhs.mPtr != rhs.mPtr; }
  friend std::ostream& operator<<(std::ostream& os, MaybeNull ptr)
  {
    if(ptr.isNull())
    {
      return os << "Null{tag: " << ptr.nullTag() << "}";
    }
    return os << ptr.value();
  }
};

template <typename T, std::size_t N>
MaybeNull<T, N> MarkedNonNull<T, N>::fromMarkedPtr(MarkedPtr<T, N> ptr) noexcept
{
  if(ptr.isNull())
  {
    return MaybeNull<T, N>::null(ptr.decomposeTag());
  }
  return fromMarkedPtrUnchecked(ptr);
}

}

namespace std
{
template <typename T, std::size_t N>
struct hash<mptr::MarkedNonNull<T, N>>
{
  std::size_t operator()(mptr::MarkedNonNull<T, N> ptr) const noexcept
  {
    return std::hash<std::uintptr_t>()(ptr.toUintptr());
  }
};
}
