#pragma once

#include <atomic>

namespace mptr
{
namespace Detail
{

constexpr std::memory_order strongestFailureOrder(std::memory_order order) noexcept
{
  switch(order)
  {
  case std::memory_order_release:
    return std::memory_order_relaxed;
  case std::memory_order_acq_rel:
    return std::memory_order_acquire;
  default:
    return order;
  }
}
constexpr bool isLoadOrder(std::memory_order order) noexcept
{
  return order != std::memory_order_release && order != std::memory_order_acq_rel;
}
constexpr bool isStoreOrder(std::memory_order order) noexcept
{
  return order == std::memory_order_relaxed || order == std::memory_order_release || order == std::memory_order_seq_cst;
}
// strength of the load part of an operation performed with `order`
constexpr int acquireStrength(std::memory_order order) noexcept
{
  switch(order)
  {
  case std::memory_order_consume:
    return 1;
  case std::memory_order_acquire:
  case std::memory_order_acq_rel:
    return 2;
  case std::memory_order_seq_cst:
    return 3;
  default:
    return 0;
  }
}
constexpr bool isFailureOrder(std::memory_order success, std::memory_order failure) noexcept
{
  return isLoadOrder(failure) && acquireStrength(failure) <= acquireStrength(success);
}

}
}
