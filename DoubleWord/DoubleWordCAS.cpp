#include "DoubleWordCAS.hpp"
#include "Backend/AtomicBuiltin.hpp"
#include "Backend/Interlocked.hpp"
#include "Backend/LockCmpxchg16b.hpp"

// The build may force a backend with MPTR_DWCAS_USE_{ASM,BUILTIN,INTERLOCKED}, otherwise
// the first one the target supports is taken. There is no lock based fallback.
#if !defined(MPTR_DWCAS_USE_ASM) && !defined(MPTR_DWCAS_USE_BUILTIN) && !defined(MPTR_DWCAS_USE_INTERLOCKED)
#  if MPTR_DWCAS_HAS_INTERLOCKED
#    define MPTR_DWCAS_USE_INTERLOCKED
#  elif MPTR_DWCAS_HAS_ASM
#    define MPTR_DWCAS_USE_ASM
#  elif MPTR_DWCAS_HAS_BUILTIN
#    define MPTR_DWCAS_USE_BUILTIN
#  else
#    error "no double-word compare-exchange is available for this target"
#  endif
#endif

#if defined(MPTR_DWCAS_USE_ASM)
#  if !MPTR_DWCAS_HAS_ASM
#    error "the lock cmpxchg16b backend requires x86-64 and GCC or Clang"
#  endif
namespace Selected = mptr::Backend::LockCmpxchg16b;
#elif defined(MPTR_DWCAS_USE_BUILTIN)
#  if !MPTR_DWCAS_HAS_BUILTIN
#    error "the __atomic builtin backend requires GCC or Clang with 128 bit integers"
#  endif
namespace Selected = mptr::Backend::AtomicBuiltin;
#elif defined(MPTR_DWCAS_USE_INTERLOCKED)
#  if !MPTR_DWCAS_HAS_INTERLOCKED
#    error "the _InterlockedCompareExchange128 backend requires MSVC on x64 or ARM64"
#  endif
namespace Selected = mptr::Backend::Interlocked;
#endif

namespace mptr
{

bool doubleWordCompareExchange(DoubleWord* dest, DoubleWord& expected, DoubleWord desired, int success, int failure) noexcept
{
  return Selected::compareExchange(dest, expected, desired, success, failure);
}

const char* doubleWordBackendName() noexcept
{
  return Selected::sName;
}

bool doubleWordIsLockFree() noexcept
{
  return Selected::isLockFree();
}

}
