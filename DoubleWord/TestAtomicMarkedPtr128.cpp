#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MAIN

#include <boost/test/unit_test.hpp>
#include <array>
#include <cstdint>
#include <limits>
#include <optional>
#include <unordered_set>
#include "AtomicMarkedPtr128.hpp"
#include "../TestSupport/ConcurrentTest.hpp"

namespace
{
struct Node
{
  int mValue;
};
using Ptr = mptr::MarkedPtr128<Node>;
using Atomic = mptr::AtomicMarkedPtr128<Node>;
}

BOOST_AUTO_TEST_CASE(TestValue)
{
  std::array<Node, 2> nodes{};
  Ptr ptr(&nodes[0], std::numeric_limits<std::uint64_t>::max());
  auto [pointer, tag] = ptr.decompose();
  BOOST_CHECK_EQUAL(pointer, &nodes[0]);
  BOOST_CHECK_EQUAL(tag, std::numeric_limits<std::uint64_t>::max());
  BOOST_CHECK_EQUAL(ptr.withTag(3).decomposePtr(), &nodes[0]);
  BOOST_CHECK_EQUAL(ptr.addTag(1).decomposeTag(), 0u);
  BOOST_CHECK_EQUAL(ptr.clearTag(), Ptr(&nodes[0]));
  BOOST_CHECK(ptr != Ptr(&nodes[1], ptr.decomposeTag()));
  BOOST_CHECK(Ptr(&nodes[0], 1) < Ptr(&nodes[0], 2));

  Ptr null(nullptr, 42);
  BOOST_CHECK(null.isNull());
  BOOST_CHECK_EQUAL(null.decomposeTag(), 42u);

  auto word = ptr.toDoubleWord();
  BOOST_CHECK_EQUAL(word.second, std::numeric_limits<std::uint64_t>::max());
  BOOST_CHECK_EQUAL(Ptr::fromDoubleWord(word), ptr);

  std::unordered_set<Ptr> set{ptr, ptr.withTag(1), Ptr(&nodes[0], std::numeric_limits<std::uint64_t>::max())};
  BOOST_CHECK_EQUAL(set.size(), 2u);
}

BOOST_AUTO_TEST_CASE(TestLayout)
{
  static_assert(alignof(Atomic) == 16);
  static_assert(sizeof(Atomic) == 16);
  Atomic atomic;
  BOOST_CHECK_EQUAL(atomic.is_lock_free(), mptr::doubleWordIsLockFree());
  BOOST_CHECK(atomic.load().isNull());
  BOOST_CHECK_EQUAL(atomic.load().decomposeTag(), 0u);
}

BOOST_AUTO_TEST_CASE(TestLoadStoreExchange)
{
  std::array<Node, 2> nodes{};
  Atomic atomic(&nodes[0], 7);
  BOOST_CHECK_EQUAL(atomic.load(std::memory_order_relaxed), Ptr(&nodes[0], 7));
  BOOST_CHECK_EQUAL(atomic.load(std::memory_order_acquire), Ptr(&nodes[0], 7));

  atomic.store(Ptr(nullptr, 9), std::memory_order_release);
  BOOST_CHECK_EQUAL(atomic.load(), Ptr(nullptr, 9));

  BOOST_CHECK_EQUAL(atomic.exchange(Ptr(&nodes[1], 1), std::memory_order_acq_rel), Ptr(nullptr, 9));
  BOOST_CHECK_EQUAL(atomic.load(), Ptr(&nodes[1], 1));
}

BOOST_AUTO_TEST_CASE(TestCompareExchange)
{
  std::array<Node, 2> nodes{};
  Atomic atomic(&nodes[0], 5);

  auto expected = Ptr(&nodes[0], 5);
  BOOST_CHECK(atomic.compare_exchange_strong(expected, Ptr(&nodes[0], 6), std::memory_order_acq_rel, std::memory_order_acquire));
  BOOST_CHECK_EQUAL(expected, Ptr(&nodes[0], 5));
  BOOST_CHECK_EQUAL(atomic.load(), Ptr(&nodes[0], 6));

  // same address, stale tag
  auto stale = Ptr(&nodes[0], 5);
  BOOST_CHECK(!atomic.compare_exchange_strong(stale, Ptr(&nodes[1], 0)));
  BOOST_CHECK_EQUAL(stale, Ptr(&nodes[0], 6));
  BOOST_CHECK_EQUAL(atomic.load(), Ptr(&nodes[0], 6));

  BOOST_CHECK(atomic.compare_exchange_weak(stale, Ptr(&nodes[1], 0), std::memory_order_release, std::memory_order_relaxed));
  BOOST_CHECK_EQUAL(atomic.load(), Ptr(&nodes[1], 0));
}

BOOST_AUTO_TEST_CASE(TestFetchUpdate)
{
  Node node{};
  Atomic atomic(&node, 0);
  auto [prev, updated] = atomic.fetch_update(std::memory_order_acq_rel, [](Ptr current) -> std::optional<Ptr> {
    if(current.isNull())
    {
      return std::nullopt;
    }
    return current.clearTag().withTag(100);
  });
  BOOST_CHECK(updated);
  BOOST_CHECK_EQUAL(prev, Ptr(&node, 0));
  BOOST_CHECK_EQUAL(atomic.load(), Ptr(&node, 100));

  atomic.store(Ptr(nullptr, 1));
  auto [observed, updatedAgain] = atomic.fetch_update(std::memory_order_seq_cst, [](Ptr current) -> std::optional<Ptr> {
    if(current.isNull())
    {
      return std::nullopt;
    }
    return current.addTag(1);
  });
  BOOST_CHECK(!updatedAgain);
  BOOST_CHECK_EQUAL(observed, Ptr(nullptr, 1));

  BOOST_CHECK_EQUAL(atomic.fetch_add_tag(2), Ptr(nullptr, 1));
  BOOST_CHECK_EQUAL(atomic.load(), Ptr(nullptr, 3));
}

BOOST_AUTO_TEST_CASE(TestConcurrentTagIncrement)
{
  static constexpr std::size_t numThread = 8;
  static constexpr std::size_t numIncr = 10000;
  Node node{};
  Atomic atomic(&node, 0);
  mptr::Test::runConcurrently(numThread, [&atomic](std::size_t){
    for(std::size_t i = 0; i < numIncr; ++i)
    {
      auto current = atomic.load(std::memory_order_relaxed);
      while(!atomic.compare_exchange_weak(current, current.addTag(1), std::memory_order_acq_rel, std::memory_order_relaxed));
    }
  });
  BOOST_CHECK_EQUAL(atomic.load(), Ptr(&node, numThread * numIncr));
}

BOOST_AUTO_TEST_CASE(TestConcurrentPointerSwapKeepsVersionCount)
{
  static constexpr std::size_t numThread = 4;
  static constexpr std::size_t numSwap = 5000;
  std::array<Node, numThread> nodes{};
  Atomic atomic(nullptr, 0);
  mptr::Test::runConcurrently(numThread, [&atomic, &nodes](std::size_t index){
    for(std::size_t i = 0; i < numSwap; ++i)
    {
      atomic.fetch_update(std::memory_order_acq_rel, [&nodes, index](Ptr current){
        return std::optional<Ptr>(Ptr(&nodes[index], current.decomposeTag() + 1));
      });
    }
  });
  auto [pointer, tag] = atomic.load().decompose();
  BOOST_CHECK_EQUAL(tag, numThread * numSwap);
  BOOST_CHECK(pointer >= &nodes.front() && pointer <= &nodes.back());
}
