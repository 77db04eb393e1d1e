#pragma once

#include <cassert>
#include "../DoubleWordCAS.hpp"
#include "../../MarkedPointer/TagCodec.hpp"

#if defined(_MSC_VER) && !defined(__clang__) && (defined(_M_X64) || defined(_M_ARM64))
#define MPTR_DWCAS_HAS_INTERLOCKED 1
#else
#define MPTR_DWCAS_HAS_INTERLOCKED 0
#endif

#if MPTR_DWCAS_HAS_INTERLOCKED

#include <intrin.h>

namespace mptr
{
namespace Backend
{
namespace Interlocked
{

constexpr const char* sName = "_InterlockedCompareExchange128";

constexpr bool isLockFree() noexcept
{
  return true;
}

// The intrinsic takes no ordering arguments, every call is sequentially consistent.
inline bool compareExchange(DoubleWord* dest, DoubleWord& expected, DoubleWord desired, int success, int failure) noexcept
{
  static_cast<void>(success);
  static_cast<void>(failure);
  assert(TagCodec::isAligned(dest, 16));
  return _InterlockedCompareExchange128(
    reinterpret_cast<volatile long long*>(dest),
    static_cast<long long>(desired.second),
    static_cast<long long>(desired.first),
    reinterpret_cast<long long*>(&expected)
  ) != 0;
}

}
}
}

#endif
