#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MAIN

#include <boost/test/unit_test.hpp>
#include <array>
#include <atomic>
#include <cstdint>
#include <optional>
#include "AtomicMarkedPtr.hpp"
#include "AtomicMarkedPtr64.hpp"
#include "../TestSupport/ConcurrentTest.hpp"

namespace
{
struct alignas(8) Node
{
  std::uint64_t mValue;
};
// 12 free low bits
struct alignas(4096) Page
{
  char mData[4096];
};
Page sPage;
}

BOOST_AUTO_TEST_CASE(TestCompareExchangeExample)
{
  using Ptr = mptr::MarkedPtr<Node, 3>;
  mptr::AtomicMarkedPtr<Node, 3> atomic(Ptr::fromUintptr(0x1005));

  auto current = Ptr::fromUintptr(0x1005);
  BOOST_CHECK(atomic.compare_exchange_strong(current, Ptr::fromUintptr(0x1006), std::memory_order_acq_rel, std::memory_order_acquire));
  BOOST_CHECK_EQUAL(current.toUintptr(), 0x1005u);
  BOOST_CHECK_EQUAL(atomic.load().toUintptr(), 0x1006u);

  auto stale = Ptr::fromUintptr(0x1005);
  BOOST_CHECK(!atomic.compare_exchange_strong(stale, Ptr::fromUintptr(0x1007), std::memory_order_acq_rel, std::memory_order_acquire));
  BOOST_CHECK_EQUAL(stale.toUintptr(), 0x1006u);
  BOOST_CHECK_EQUAL(atomic.load().toUintptr(), 0x1006u);
}

BOOST_AUTO_TEST_CASE(TestLoadStoreExchange)
{
  using Ptr = mptr::MarkedPtr<Node, 3>;
  std::array<Node, 2> nodes{};
  mptr::AtomicMarkedPtr<Node, 3> atomic;
  BOOST_CHECK(atomic.load(std::memory_order_relaxed).isNull());
  BOOST_CHECK(atomic.is_lock_free());

  atomic.store(Ptr(&nodes[0], 2), std::memory_order_release);
  auto [pointer, tag] = atomic.load(std::memory_order_acquire).decompose();
  BOOST_CHECK_EQUAL(pointer, &nodes[0]);
  BOOST_CHECK_EQUAL(tag, 2u);

  auto prev = atomic.exchange(Ptr(&nodes[1], 4), std::memory_order_acq_rel);
  BOOST_CHECK_EQUAL(prev, Ptr(&nodes[0], 2));
  BOOST_CHECK_EQUAL(atomic.load(), Ptr(&nodes[1], 4));
}

BOOST_AUTO_TEST_CASE(TestTagOnlyChangeIsObserved)
{
  using Ptr = mptr::MarkedPtr<Node, 3>;
  std::array<Node, 2> nodes{};
  mptr::AtomicMarkedPtr<Node, 3> atomic(&nodes[0], 0);
  auto seen = atomic.load();

  // the address goes away and comes back with a new tag in between
  atomic.store(Ptr(&nodes[1]));
  atomic.store(Ptr(&nodes[0], 1));

  BOOST_CHECK(!atomic.compare_exchange_strong(seen, Ptr(&nodes[1], 5)));
  BOOST_CHECK_EQUAL(seen, Ptr(&nodes[0], 1));
  BOOST_CHECK_EQUAL(atomic.load(), Ptr(&nodes[0], 1));
}

BOOST_AUTO_TEST_CASE(TestFetchUpdate)
{
  using Ptr = mptr::MarkedPtr<Node, 3>;
  Node node{};
  mptr::AtomicMarkedPtr<Node, 3> atomic(&node, 6);
  auto incrementBelowSeven = [](Ptr current) -> std::optional<Ptr> {
    if(current.decomposeTag() == 7)
    {
      return std::nullopt;
    }
    return current.addTag(1);
  };

  auto [prev, updated] = atomic.fetch_update(std::memory_order_acq_rel, incrementBelowSeven);
  BOOST_CHECK(updated);
  BOOST_CHECK_EQUAL(prev, Ptr(&node, 6));
  BOOST_CHECK_EQUAL(atomic.load(), Ptr(&node, 7));

  auto [observed, updatedAgain] = atomic.fetch_update(std::memory_order_release, std::memory_order_relaxed, incrementBelowSeven);
  BOOST_CHECK(!updatedAgain);
  BOOST_CHECK_EQUAL(observed, Ptr(&node, 7));
  BOOST_CHECK_EQUAL(atomic.load(), Ptr(&node, 7));
}

BOOST_AUTO_TEST_CASE(TestFetchBitOperations)
{
  using Ptr = mptr::MarkedPtr<Node, 3>;
  Node node{};
  mptr::AtomicMarkedPtr<Node, 3> atomic(&node, 0b010);

  BOOST_CHECK_EQUAL(atomic.fetch_or(0b101), Ptr(&node, 0b010));
  BOOST_CHECK_EQUAL(atomic.load(), Ptr(&node, 0b111));
  BOOST_CHECK_EQUAL(atomic.fetch_and(0b001), Ptr(&node, 0b111));
  BOOST_CHECK_EQUAL(atomic.load(), Ptr(&node, 0b001));
  BOOST_CHECK_EQUAL(atomic.fetch_add(2), Ptr(&node, 0b001));
  BOOST_CHECK_EQUAL(atomic.fetch_sub(1), Ptr(&node, 0b011));
  BOOST_CHECK_EQUAL(atomic.load(), Ptr(&node, 0b010));
}

BOOST_AUTO_TEST_CASE(TestConcurrentTagIncrement)
{
  static constexpr std::size_t numThread = 8;
  static constexpr std::size_t numIncr = 500;
  using Atomic = mptr::AtomicMarkedPtr<Page, 12>;
  static_assert(numThread * numIncr <= Atomic::Value::sTagMask);
  Atomic atomic(&sPage, 0);
  mptr::Test::runConcurrently(numThread, [&atomic](std::size_t){
    for(std::size_t i = 0; i < numIncr; ++i)
    {
      auto current = atomic.load(std::memory_order_relaxed);
      while(!atomic.compare_exchange_weak(current, current.addTag(1), std::memory_order_acq_rel, std::memory_order_relaxed));
    }
  });
  auto [pointer, tag] = atomic.load().decompose();
  BOOST_CHECK_EQUAL(pointer, &sPage);
  BOOST_CHECK_EQUAL(tag, numThread * numIncr);
}

BOOST_AUTO_TEST_CASE(TestUpperBitsCompareExchange)
{
  using Ptr = mptr::MarkedPtr64<Node>;
  std::array<Node, 2> nodes{};
  mptr::AtomicMarkedPtr64<Node> atomic(&nodes[0], 1);

  auto expected = Ptr(&nodes[0], 1);
  BOOST_CHECK(atomic.compare_exchange_strong(expected, Ptr(&nodes[1], 2)));
  auto stale = Ptr(&nodes[0], 1);
  BOOST_CHECK(!atomic.compare_exchange_strong(stale, Ptr(&nodes[0], 3), std::memory_order_seq_cst, std::memory_order_seq_cst));
  BOOST_CHECK_EQUAL(stale, Ptr(&nodes[1], 2));
  BOOST_CHECK_EQUAL(atomic.exchange(Ptr(&nodes[0], 0xFFFF)), Ptr(&nodes[1], 2));

  BOOST_CHECK_EQUAL(atomic.fetch_add_tag(1), Ptr(&nodes[0], 0xFFFF));
  BOOST_CHECK_EQUAL(atomic.load(), Ptr(&nodes[0], 0));
  BOOST_CHECK_EQUAL(atomic.fetch_sub_tag(1), Ptr(&nodes[0], 0));
  BOOST_CHECK_EQUAL(atomic.load(), Ptr(&nodes[0], 0xFFFF));

  auto [prev, updated] = atomic.fetch_update(std::memory_order_acq_rel, [](Ptr current){
    return std::optional<Ptr>(current.withTag(7));
  });
  BOOST_CHECK(updated);
  BOOST_CHECK_EQUAL(prev, Ptr(&nodes[0], 0xFFFF));
  BOOST_CHECK_EQUAL(atomic.load(), Ptr(&nodes[0], 7));
}

BOOST_AUTO_TEST_CASE(TestUpperBitsConcurrentTagIncrement)
{
  static constexpr std::size_t numThread = 8;
  static constexpr std::size_t numIncr = 5000;
  Node node{};
  mptr::AtomicMarkedPtr64<Node> atomic(&node, 0);
  mptr::Test::runConcurrently(numThread, [&atomic](std::size_t){
    for(std::size_t i = 0; i < numIncr; ++i)
    {
      auto current = atomic.load(std::memory_order_relaxed);
      while(!atomic.compare_exchange_weak(current, current.addTag(1), std::memory_order_acq_rel, std::memory_order_relaxed));
    }
  });
  auto [pointer, tag] = atomic.load().decompose();
  BOOST_CHECK_EQUAL(pointer, &node);
  BOOST_CHECK_EQUAL(tag, numThread * numIncr);
}

BOOST_AUTO_TEST_CASE(TestUpperBitsFetchBitOperations)
{
  using Ptr = mptr::MarkedPtr64<Node>;
  Node node{};
  mptr::AtomicMarkedPtr64<Node> atomic(&node, 0x00F0);

  BOOST_CHECK_EQUAL(atomic.fetch_or_tag(0x0F0F), Ptr(&node, 0x00F0));
  BOOST_CHECK_EQUAL(atomic.load(), Ptr(&node, 0x0FFF));
  BOOST_CHECK_EQUAL(atomic.fetch_and_tag(0x0F00, std::memory_order_acq_rel), Ptr(&node, 0x0FFF));
  BOOST_CHECK_EQUAL(atomic.load(), Ptr(&node, 0x0F00));

  // clearing every tag bit leaves the address untouched
  BOOST_CHECK_EQUAL(atomic.fetch_and_tag(0), Ptr(&node, 0x0F00));
  BOOST_CHECK_EQUAL(atomic.load(), Ptr(&node, 0));
  BOOST_CHECK_EQUAL(atomic.fetch_or_tag(0xFFFF), Ptr(&node, 0));
  BOOST_CHECK_EQUAL(atomic.load().decomposePtr(), &node);
  BOOST_CHECK_EQUAL(atomic.load().decomposeTag(), 0xFFFF);
}
