#pragma once

#include <cassert>
#include <cstring>
#include "../DoubleWordCAS.hpp"
#include "../../MarkedPointer/TagCodec.hpp"

#if (defined(__GNUC__) || defined(__clang__)) && defined(__SIZEOF_INT128__)
#define MPTR_DWCAS_HAS_BUILTIN 1
#else
#define MPTR_DWCAS_HAS_BUILTIN 0
#endif

#if MPTR_DWCAS_HAS_BUILTIN

namespace mptr
{
namespace Backend
{
namespace AtomicBuiltin
{

constexpr const char* sName = "__atomic_compare_exchange_n";

__extension__ typedef unsigned __int128 Int128;
static_assert(sizeof(Int128) == sizeof(DoubleWord));

constexpr int toBuiltinOrder(int code) noexcept
{
  switch(static_cast<OrderCode>(code))
  {
  case OrderCode::Relaxed:
    return __ATOMIC_RELAXED;
  case OrderCode::Acquire:
    return __ATOMIC_ACQUIRE;
  case OrderCode::Release:
    return __ATOMIC_RELEASE;
  case OrderCode::AcqRel:
    return __ATOMIC_ACQ_REL;
  default:
    return __ATOMIC_SEQ_CST;
  }
}

// libatomic may fall back to a lock when the CPU lacks a 16 byte compare-exchange
inline bool isLockFree() noexcept
{
  return __atomic_is_lock_free(sizeof(Int128), nullptr);
}

inline bool compareExchange(DoubleWord* dest, DoubleWord& expected, DoubleWord desired, int success, int failure) noexcept
{
  assert(TagCodec::isAligned(dest, 16));
  Int128 current;
  Int128 next;
  std::memcpy(&current, &expected, sizeof(Int128));
  std::memcpy(&next, &desired, sizeof(Int128));
  auto ans = __atomic_compare_exchange_n(reinterpret_cast<Int128*>(dest), &current, next, false, toBuiltinOrder(success), toBuiltinOrder(failure));
  if(!ans)
  {
    std::memcpy(&expected, &current, sizeof(Int128));
  }
  return ans;
}

}
}
}

#endif
