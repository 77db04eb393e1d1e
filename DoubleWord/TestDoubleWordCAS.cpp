#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MAIN

#include <boost/test/unit_test.hpp>
#include <cstdint>
#include <string>
#include <vector>
#include "DoubleWordCAS.hpp"
#include "Backend/AtomicBuiltin.hpp"
#include "Backend/Interlocked.hpp"
#include "Backend/LockCmpxchg16b.hpp"
#include "../TestSupport/ConcurrentTest.hpp"

namespace
{
using mptr::DoubleWord;
using mptr::OrderCode;
using CompareExchange = bool (*)(DoubleWord*, DoubleWord&, DoubleWord, int, int) noexcept;

struct Backend
{
  std::string mName;
  CompareExchange mCompareExchange;
};

std::vector<Backend> availableBackends()
{
  std::vector<Backend> ans;
  ans.push_back({std::string("selected: ") + mptr::doubleWordBackendName(), &mptr::doubleWordCompareExchange});
#if MPTR_DWCAS_HAS_ASM
  ans.push_back({mptr::Backend::LockCmpxchg16b::sName, &mptr::Backend::LockCmpxchg16b::compareExchange});
#endif
#if MPTR_DWCAS_HAS_BUILTIN
  ans.push_back({mptr::Backend::AtomicBuiltin::sName, &mptr::Backend::AtomicBuiltin::compareExchange});
#endif
#if MPTR_DWCAS_HAS_INTERLOCKED
  ans.push_back({mptr::Backend::Interlocked::sName, &mptr::Backend::Interlocked::compareExchange});
#endif
  return ans;
}

int code(OrderCode order)
{
  return static_cast<int>(order);
}

struct Step
{
  DoubleWord mExpected;
  DoubleWord mDesired;
  OrderCode mSuccess;
  OrderCode mFailure;
  // outcome
  bool mResult;
  DoubleWord mObserved;
  DoubleWord mLocation;
};

constexpr std::uint64_t sAllOnes = ~static_cast<std::uint64_t>(0);

// starting from a location holding {1, 2}
const std::vector<Step> sSequence = {
  {{1, 2}, {3, 4}, OrderCode::SeqCst, OrderCode::SeqCst, true, {1, 2}, {3, 4}},
  {{1, 2}, {5, 6}, OrderCode::AcqRel, OrderCode::Acquire, false, {3, 4}, {3, 4}},
  {{3, 5}, {7, 8}, OrderCode::Release, OrderCode::Relaxed, false, {3, 4}, {3, 4}},
  {{4, 4}, {7, 8}, OrderCode::Acquire, OrderCode::Acquire, false, {3, 4}, {3, 4}},
  {{3, 4}, {sAllOnes, 0}, OrderCode::Release, OrderCode::Relaxed, true, {3, 4}, {sAllOnes, 0}},
  {{0, 0}, {0, 0}, OrderCode::Relaxed, OrderCode::Relaxed, false, {sAllOnes, 0}, {sAllOnes, 0}},
  {{sAllOnes, 0}, {0, sAllOnes}, OrderCode::AcqRel, OrderCode::Relaxed, true, {sAllOnes, 0}, {0, sAllOnes}},
  {{0, sAllOnes}, {0, 0}, OrderCode::SeqCst, OrderCode::Acquire, true, {0, sAllOnes}, {0, 0}},
  {{0, 0}, {0, 0}, OrderCode::Acquire, OrderCode::Acquire, true, {0, 0}, {0, 0}},
};
}

BOOST_AUTO_TEST_CASE(TestOrderCodes)
{
  BOOST_CHECK_EQUAL(mptr::toOrderCode(std::memory_order_relaxed), 0);
  BOOST_CHECK_EQUAL(mptr::toOrderCode(std::memory_order_consume), 1);
  BOOST_CHECK_EQUAL(mptr::toOrderCode(std::memory_order_acquire), 1);
  BOOST_CHECK_EQUAL(mptr::toOrderCode(std::memory_order_release), 2);
  BOOST_CHECK_EQUAL(mptr::toOrderCode(std::memory_order_acq_rel), 3);
  BOOST_CHECK_EQUAL(mptr::toOrderCode(std::memory_order_seq_cst), 4);
}

BOOST_AUTO_TEST_CASE(TestLockFreeReport)
{
  std::string selected = mptr::doubleWordBackendName();
#if MPTR_DWCAS_HAS_ASM
  BOOST_CHECK(mptr::Backend::LockCmpxchg16b::isLockFree());
  if(selected == mptr::Backend::LockCmpxchg16b::sName)
  {
    BOOST_CHECK(mptr::doubleWordIsLockFree());
  }
#endif
#if MPTR_DWCAS_HAS_BUILTIN
  // whatever libatomic decides for this CPU
  bool builtinLockFree = __atomic_is_lock_free(sizeof(DoubleWord), nullptr);
  BOOST_CHECK_EQUAL(mptr::Backend::AtomicBuiltin::isLockFree(), builtinLockFree);
  if(selected == mptr::Backend::AtomicBuiltin::sName)
  {
    BOOST_CHECK_EQUAL(mptr::doubleWordIsLockFree(), builtinLockFree);
  }
#endif
#if MPTR_DWCAS_HAS_INTERLOCKED
  BOOST_CHECK(mptr::Backend::Interlocked::isLockFree());
  if(selected == mptr::Backend::Interlocked::sName)
  {
    BOOST_CHECK(mptr::doubleWordIsLockFree());
  }
#endif
}

BOOST_AUTO_TEST_CASE(TestBackendsFollowTheSameSequence)
{
  auto backends = availableBackends();
  BOOST_TEST_MESSAGE("double-word backend: " << mptr::doubleWordBackendName());
  BOOST_CHECK_GE(backends.size(), 2u);
  for(auto& backend: backends)
  {
    BOOST_TEST_CONTEXT("backend " << backend.mName)
    {
      DoubleWord location{1, 2};
      for(auto& step: sSequence)
      {
        auto expected = step.mExpected;
        auto ans = backend.mCompareExchange(&location, expected, step.mDesired, code(step.mSuccess), code(step.mFailure));
        BOOST_CHECK_EQUAL(ans, step.mResult);
        BOOST_CHECK_EQUAL(expected, step.mObserved);
        BOOST_CHECK_EQUAL(location, step.mLocation);
      }
    }
  }
}

BOOST_AUTO_TEST_CASE(TestBackendsUnderContention)
{
  static constexpr std::size_t numThread = 8;
  static constexpr std::uint64_t numIncr = 10000;
  static constexpr std::uint64_t marker = 0xDEADBEEFCAFEBABE;
  for(auto& backend: availableBackends())
  {
    BOOST_TEST_CONTEXT("backend " << backend.mName)
    {
      DoubleWord location{marker, 0};
      auto compareExchange = backend.mCompareExchange;
      mptr::Test::runConcurrently(numThread, [&location, compareExchange](std::size_t){
        for(std::uint64_t i = 0; i < numIncr; ++i)
        {
          DoubleWord expected{0, 0};
          while(!compareExchange(&location, expected, DoubleWord{expected.first, expected.second + 1}, code(OrderCode::AcqRel), code(OrderCode::Relaxed)));
        }
      });
      BOOST_CHECK_EQUAL(location.first, marker);
      BOOST_CHECK_EQUAL(location.second, numThread * numIncr);
    }
  }
}
