#pragma once

#include <cassert>
#include "../DoubleWordCAS.hpp"
#include "../../MarkedPointer/TagCodec.hpp"

#if defined(__x86_64__) && (defined(__GNUC__) || defined(__clang__))
#define MPTR_DWCAS_HAS_ASM 1
#else
#define MPTR_DWCAS_HAS_ASM 0
#endif

#if MPTR_DWCAS_HAS_ASM

namespace mptr
{
namespace Backend
{
namespace LockCmpxchg16b
{

constexpr const char* sName = "lock cmpxchg16b";

constexpr bool isLockFree() noexcept
{
  return true;
}

// The locked instruction is a full barrier whatever the order codes say, they only matter
// to the compiler, which the "memory" clobber already keeps from reordering across the asm.
inline bool compareExchange(DoubleWord* dest, DoubleWord& expected, DoubleWord desired, int success, int failure) noexcept
{
  static_cast<void>(success);
  static_cast<void>(failure);
  assert(TagCodec::isAligned(dest, 16));
  bool ans;
  __asm__ __volatile__(
    "lock cmpxchg16b %[dest]"
    : [dest] "+m"(*dest), "=@ccz"(ans), "+a"(expected.first), "+d"(expected.second)
    : "b"(desired.first), "c"(desired.second)
    : "memory"
  );
  return ans;
}

}
}
}

#endif
