#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <utility>

namespace mptr
{

// All conversions between pointers and their integer representation go through this class.
class TagCodec
{
public:
  using Word = std::uintptr_t;
  static constexpr std::size_t sWordBits = std::numeric_limits<Word>::digits;

  static constexpr std::size_t alignmentBits(std::size_t alignment) noexcept
  {
    std::size_t bits = 0;
    while(alignment > 1)
    {
      alignment >>= 1;
      ++bits;
    }
    return bits;
  }
  template <typename T>
  static constexpr std::size_t alignmentBits() noexcept
  {
    return alignmentBits(alignof(T));
  }
  static constexpr Word tagMask(std::size_t width) noexcept
  {
    return width == 0 ? 0 : (~static_cast<Word>(0) >> (sWordBits - width));
  }
  static constexpr Word pointerMask(std::size_t width) noexcept
  {
    return ~tagMask(width);
  }

  template <typename T>
  static Word toAddress(T* pointer) noexcept
  {
    return reinterpret_cast<Word>(pointer);
  }
  template <typename T>
  static T* toPointer(Word address) noexcept
  {
    return reinterpret_cast<T*>(address);
  }
  template <typename T>
  static bool isAligned(T* pointer, std::size_t alignment) noexcept
  {
    return (toAddress(pointer) & (alignment - 1)) == 0;
  }

  // the low `width` bits of address must be zero
  static Word compose(Word address, Word tag, std::size_t width) noexcept
  {
    assert(width < sWordBits);
    assert((address & tagMask(width)) == 0);
    assert((tag & ~tagMask(width)) == 0);
    return address | (tag & tagMask(width));
  }
  template <typename T>
  static Word compose(T* pointer, Word tag, std::size_t width) noexcept
  {
    return compose(toAddress(pointer), tag, width);
  }
  template <typename T>
  static T* decomposePtr(Word packed, std::size_t width) noexcept
  {
    return toPointer<T>(packed & pointerMask(width));
  }
  static constexpr Word decomposeTag(Word packed, std::size_t width) noexcept
  {
    return packed & tagMask(width);
  }
  template <typename T>
  static std::pair<T*, Word> decompose(Word packed, std::size_t width) noexcept
  {
    return std::make_pair(decomposePtr<T>(packed, width), decomposeTag(packed, width));
  }
};

// 16 bit tags in the unused upper bits of a 48 bit virtual address.
class UpperTagCodec
{
public:
  using Word = std::uint64_t;
  using TagType = std::uint16_t;
  static constexpr unsigned sTagShift = 48;
  static constexpr Word sPointerMask = 0x0000FFFFFFFFFFFF;
  static constexpr Word sTagMask = ~sPointerMask;

  template <typename T>
  static Word compose(T* pointer, TagType tag) noexcept
  {
    return static_cast<Word>(tag) << sTagShift | (sPointerMask & TagCodec::toAddress(pointer));
  }
  template <typename T>
  static T* decomposePtr(Word packed) noexcept
  {
    // restore the canonical form of the address by sign extending bit 47
    auto sign = (sPointerMask & packed) >> (sTagShift - 1);
    auto signExtensionMask = (static_cast<Word>(0) - sign) << sTagShift;
    return TagCodec::toPointer<T>(static_cast<TagCodec::Word>((sPointerMask & packed) | signExtensionMask));
  }
  static constexpr TagType decomposeTag(Word packed) noexcept
  {
    return static_cast<TagType>(packed >> sTagShift);
  }
  template <typename T>
  static std::pair<T*, TagType> decompose(Word packed) noexcept
  {
    return std::make_pair(decomposePtr<T>(packed), decomposeTag(packed));
  }
};

}
