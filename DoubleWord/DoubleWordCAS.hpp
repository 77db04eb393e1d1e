#pragma once

#include <atomic>
#include <cstdint>
#include <ostream>

namespace mptr
{

// Two adjacent 64 bit words, `first` at the lower address.
struct alignas(16) DoubleWord
{
  std::uint64_t first;
  std::uint64_t second;
};

inline bool operator==(const DoubleWord& lhs, const DoubleWord& rhs) noexcept
{
  return lhs.first == rhs.first && lhs.second == rhs.second;
}
inline bool operator!=(const DoubleWord& lhs, const DoubleWord& rhs) noexcept
{
  return !(lhs == rhs);
}
inline std::ostream& operator<<(std::ostream& os, const DoubleWord& word)
{
  return os << "{" << word.first << ", " << word.second << "}";
}

// Memory ordering as passed across the double-word compare-exchange boundary.
enum class OrderCode : int
{
  Relaxed = 0,
  Acquire = 1,
  Release = 2,
  AcqRel = 3,
  SeqCst = 4
};

constexpr int toOrderCode(std::memory_order order) noexcept
{
  switch(order)
  {
  case std::memory_order_relaxed:
    return static_cast<int>(OrderCode::Relaxed);
  case std::memory_order_consume:
  case std::memory_order_acquire:
    return static_cast<int>(OrderCode::Acquire);
  case std::memory_order_release:
    return static_cast<int>(OrderCode::Release);
  case std::memory_order_acq_rel:
    return static_cast<int>(OrderCode::AcqRel);
  default:
    return static_cast<int>(OrderCode::SeqCst);
  }
}

// dest must be 16 byte aligned, expected receives the observed value on failure
bool doubleWordCompareExchange(DoubleWord* dest, DoubleWord& expected, DoubleWord desired, int success, int failure) noexcept;

const char* doubleWordBackendName() noexcept;
bool doubleWordIsLockFree() noexcept;

}
