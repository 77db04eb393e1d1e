#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MAIN

#include <boost/test/unit_test.hpp>
#include <array>
#include <optional>
#include <cstdint>
#include <sstream>
#include <unordered_set>
#include "TagCodec.hpp"
#include "MarkedPtr.hpp"
#include "MarkedPtr64.hpp"
#include "MarkedNonNull.hpp"

namespace
{
struct alignas(8) Node
{
  std::uint64_t mValue;
};
using Codec = mptr::TagCodec;
}

BOOST_AUTO_TEST_CASE(TestComposeExample)
{
  auto packed = Codec::compose(0x1000, 5, 3);
  BOOST_CHECK_EQUAL(packed, 0x1005u);
  auto [pointer, tag] = Codec::decompose<Node>(packed, 3);
  BOOST_CHECK_EQUAL(pointer, Codec::toPointer<Node>(0x1000));
  BOOST_CHECK_EQUAL(tag, 5u);
}

BOOST_AUTO_TEST_CASE(TestComposeRoundTrip)
{
  std::array<Node, 4> nodes{};
  for(std::size_t width = 0; width <= Codec::alignmentBits<Node>(); ++width)
  {
    for(auto& node: nodes)
    {
      for(Codec::Word tag = 0; tag <= Codec::tagMask(width); ++tag)
      {
        auto packed = Codec::compose(&node, tag, width);
        BOOST_CHECK_EQUAL(Codec::decomposePtr<Node>(packed, width), &node);
        BOOST_CHECK_EQUAL(Codec::decomposeTag(packed, width), tag);
      }
    }
  }
}

BOOST_AUTO_TEST_CASE(TestMasks)
{
  BOOST_CHECK_EQUAL(Codec::alignmentBits<Node>(), 3u);
  BOOST_CHECK_EQUAL(Codec::alignmentBits(1), 0u);
  BOOST_CHECK_EQUAL(Codec::tagMask(0), 0u);
  BOOST_CHECK_EQUAL(Codec::tagMask(3), 0b111u);
  BOOST_CHECK_EQUAL(Codec::pointerMask(0), ~static_cast<Codec::Word>(0));
  BOOST_CHECK_EQUAL(Codec::pointerMask(2), ~static_cast<Codec::Word>(0b11));
}

BOOST_AUTO_TEST_CASE(TestZeroWidthIsPassthrough)
{
  char c = 'x';
  mptr::MarkedPtr<char, 0> ptr(&c);
  BOOST_CHECK_EQUAL(ptr.toUintptr(), Codec::toAddress(&c));
  BOOST_CHECK_EQUAL(ptr.decomposePtr(), &c);
  BOOST_CHECK_EQUAL(ptr.decomposeTag(), 0u);
  BOOST_CHECK_EQUAL(*ptr, 'x');
  static_assert(mptr::MarkedPtr<char, 0>::sTagMask == 0);
}

BOOST_AUTO_TEST_CASE(TestNullKeepsTag)
{
  using Ptr = mptr::MarkedPtr<Node, 3>;
  for(Ptr::TagType tag = 0; tag <= Ptr::sTagMask; ++tag)
  {
    Ptr ptr(nullptr, tag);
    BOOST_CHECK(ptr.isNull());
    BOOST_CHECK(ptr.decomposePtr() == nullptr);
    BOOST_CHECK_EQUAL(ptr.decomposeTag(), tag);
  }
  BOOST_CHECK(Ptr::null() == Ptr());
  BOOST_CHECK_EQUAL(Ptr::null().toUintptr(), 0u);
}

BOOST_AUTO_TEST_CASE(TestWithTagKeepsAddress)
{
  using Ptr = mptr::MarkedPtr<Node, 3>;
  Node node{42};
  Ptr ptr(&node, 0b101);
  for(Ptr::TagType tag = 0; tag <= Ptr::sTagMask; ++tag)
  {
    auto tagged = ptr.withTag(tag);
    BOOST_CHECK_EQUAL(tagged.decomposePtr(), &node);
    BOOST_CHECK_EQUAL(tagged.decomposeTag(), tag);
    BOOST_CHECK_EQUAL(tagged->mValue, 42u);
  }
  BOOST_CHECK_EQUAL(ptr.decomposeTag(), 0b101u);
}

BOOST_AUTO_TEST_CASE(TestTagManipulation)
{
  using Ptr = mptr::MarkedPtr<Node, 3>;
  Node node{};
  Ptr ptr(&node, 7);
  BOOST_CHECK_EQUAL(ptr.addTag(1).decomposeTag(), 0u);
  BOOST_CHECK_EQUAL(ptr.addTag(1).decomposePtr(), &node);
  BOOST_CHECK_EQUAL(ptr.clearTag().subTag(1).decomposeTag(), 7u);
  BOOST_CHECK_EQUAL(ptr.clearTag(), Ptr(&node));
  BOOST_CHECK_EQUAL(ptr.updateTag([](Ptr::TagType tag){ return tag * 2; }).decomposeTag(), 6u);

  auto [untagged, tag] = ptr.splitTag();
  BOOST_CHECK_EQUAL(untagged.decomposeTag(), 0u);
  BOOST_CHECK_EQUAL(untagged.decomposePtr(), &node);
  BOOST_CHECK_EQUAL(tag, 7u);

  auto raw = ptr.cast<unsigned char>();
  BOOST_CHECK_EQUAL(raw.toUintptr(), ptr.toUintptr());
  BOOST_CHECK_EQUAL(raw.decomposeTag(), 7u);
}

BOOST_AUTO_TEST_CASE(TestEqualityAndOrdering)
{
  using Ptr = mptr::MarkedPtr<Node, 2>;
  std::array<Node, 2> nodes{};
  Ptr a(&nodes[0], 1);
  BOOST_CHECK(a == Ptr(&nodes[0], 1));
  BOOST_CHECK(a != Ptr(&nodes[0], 2));
  BOOST_CHECK(a != Ptr(&nodes[1], 1));
  BOOST_CHECK(a < Ptr(&nodes[0], 2));
  BOOST_CHECK(a < Ptr(&nodes[1], 0));
  BOOST_CHECK(Ptr(&nodes[1], 0) >= a);

  std::unordered_set<Ptr> set{a, Ptr(&nodes[0], 2), Ptr(&nodes[0], 1)};
  BOOST_CHECK_EQUAL(set.size(), 2u);

  std::ostringstream os;
  os << a;
  BOOST_CHECK(os.str().find("tag: 1") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(TestUpperBitsTag)
{
  using Ptr = mptr::MarkedPtr64<Node>;
  Node node{};
  Ptr ptr(&node, 0xBEEF);
  BOOST_CHECK_EQUAL(ptr.decomposePtr(), &node);
  BOOST_CHECK_EQUAL(ptr.decomposeTag(), 0xBEEF);
  BOOST_CHECK_EQUAL(ptr.withTag(1).decomposePtr(), &node);
  BOOST_CHECK_EQUAL(ptr.withTag(0xFFFF).addTag(1).decomposeTag(), 0);
  BOOST_CHECK_EQUAL(ptr.withTag(0xFFFF).addTag(1).decomposePtr(), &node);
  BOOST_CHECK(Ptr(nullptr, 3).isNull());
  BOOST_CHECK_EQUAL(Ptr(nullptr, 3).decomposeTag(), 3);
}

BOOST_AUTO_TEST_CASE(TestUpperBitsTagRestoresCanonicalAddress)
{
  using Ptr = mptr::MarkedPtr64<Node>;
  auto high = Codec::toPointer<Node>(static_cast<Codec::Word>(0xFFFF800000001000ull));
  Ptr ptr(high, 0x1234);
  BOOST_CHECK_EQUAL(ptr.toUint64(), 0x1234800000001000ull);
  BOOST_CHECK_EQUAL(ptr.decomposePtr(), high);
  BOOST_CHECK_EQUAL(ptr.decomposeTag(), 0x1234);

  auto low = Codec::toPointer<Node>(static_cast<Codec::Word>(0x00007FFFFFFFF000ull));
  BOOST_CHECK_EQUAL(Ptr(low, 0xFFFF).decomposePtr(), low);
}

BOOST_AUTO_TEST_CASE(TestUpperBitsCastAndOrdering)
{
  using Ptr = mptr::MarkedPtr64<Node>;
  std::array<Node, 2> nodes{};
  Ptr ptr(&nodes[0], 7);
  auto bytes = ptr.cast<unsigned char>();
  BOOST_CHECK_EQUAL(bytes.toUint64(), ptr.toUint64());
  BOOST_CHECK_EQUAL(bytes.decomposeTag(), 7);
  BOOST_CHECK(bytes.decomposePtr() == reinterpret_cast<unsigned char*>(&nodes[0]));
  BOOST_CHECK_EQUAL(bytes.cast<Node>(), ptr);

  BOOST_CHECK(Ptr(&nodes[0], 1) < Ptr(&nodes[0], 2));
  BOOST_CHECK(Ptr(&nodes[0], 1) <= Ptr(&nodes[0], 1));
  BOOST_CHECK(Ptr(&nodes[1], 1) > Ptr(&nodes[0], 1));
  BOOST_CHECK(Ptr(&nodes[0], 2) >= Ptr(&nodes[0], 2));
  BOOST_CHECK(!(Ptr(&nodes[0], 2) > Ptr(&nodes[0], 3)));
}

BOOST_AUTO_TEST_CASE(TestNonNullCompose)
{
  using NonNull = mptr::MarkedNonNull<Node, 3>;
  Node node{};
  auto ptr = NonNull::compose(&node, 0b101);
  auto [pointer, tag] = ptr.decompose();
  BOOST_CHECK_EQUAL(pointer, &node);
  BOOST_CHECK_EQUAL(tag, 0b101u);
  BOOST_CHECK_EQUAL(ptr.toMarkedPtr(), (mptr::MarkedPtr<Node, 3>(&node, 0b101)));
  BOOST_CHECK_EQUAL(ptr.toUintptr(), Codec::toAddress(&node) | 0b101);
  BOOST_CHECK_EQUAL(&ptr->mValue, &node.mValue);

  BOOST_CHECK(!NonNull::tryCompose(nullptr, 1).has_value());
  BOOST_CHECK(!NonNull::fromPointer(nullptr).has_value());
  auto composed = NonNull::tryCompose(&node, 2);
  BOOST_REQUIRE(composed.has_value());
  BOOST_CHECK_EQUAL(*composed, ptr.withTag(2));
  BOOST_CHECK_EQUAL(NonNull::fromPointer(&node)->decomposeTag(), 0u);
}

BOOST_AUTO_TEST_CASE(TestNonNullDangling)
{
  auto wide = mptr::MarkedNonNull<Node, 3>::dangling();
  BOOST_CHECK_EQUAL(wide.toUintptr(), alignof(Node));
  BOOST_CHECK_EQUAL(wide.decomposeTag(), 0u);
  BOOST_CHECK(wide.decomposePtr() != nullptr);

  auto narrow = mptr::MarkedNonNull<Node, 1>::dangling();
  BOOST_CHECK_EQUAL(narrow.toUintptr(), alignof(Node));

  auto bytes = mptr::MarkedNonNull<char, 0>::dangling();
  BOOST_CHECK_EQUAL(bytes.toUintptr(), 1u);
}

BOOST_AUTO_TEST_CASE(TestNonNullTagManipulation)
{
  using NonNull = mptr::MarkedNonNull<Node, 3>;
  Node node{};
  auto ptr = NonNull::compose(&node, 0b111);
  BOOST_CHECK_EQUAL(ptr.clearTag().decomposeTag(), 0u);
  BOOST_CHECK_EQUAL(ptr.clearTag().decomposePtr(), &node);
  auto [cleared, tag] = ptr.splitTag();
  BOOST_CHECK_EQUAL(cleared, NonNull::compose(&node, 0));
  BOOST_CHECK_EQUAL(tag, 0b111u);
  BOOST_CHECK_EQUAL(ptr.addTag(1).decomposeTag(), 0u);
  BOOST_CHECK_EQUAL(ptr.subTag(2).decomposeTag(), 0b101u);
  BOOST_CHECK_EQUAL(ptr.updateTag([](std::uintptr_t current){ return current >> 1; }).decomposeTag(), 0b011u);
  BOOST_CHECK(NonNull::compose(&node, 1) < NonNull::compose(&node, 2));
  BOOST_CHECK_EQUAL(ptr.cast<unsigned char>().toUintptr(), ptr.toUintptr());

  std::unordered_set<NonNull> set{ptr, ptr.withTag(0b111), ptr.clearTag()};
  BOOST_CHECK_EQUAL(set.size(), 2u);

  std::ostringstream os;
  os << NonNull::compose(&node, 3);
  BOOST_CHECK(os.str().find("tag: 3}") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(TestMaybeNullFromMarkedPtr)
{
  using Ptr = mptr::MarkedPtr<Node, 3>;
  using NonNull = mptr::MarkedNonNull<Node, 3>;
  Node node{};

  auto value = NonNull::fromMarkedPtr(Ptr(&node, 4));
  BOOST_CHECK(value.isValue());
  BOOST_CHECK(!value.isNull());
  BOOST_CHECK_EQUAL(value.value(), NonNull::compose(&node, 4));
  BOOST_CHECK_EQUAL(value.toMarkedPtr(), Ptr(&node, 4));

  // a marked null stays null and keeps its tag
  auto null = NonNull::fromMarkedPtr(Ptr(nullptr, 6));
  BOOST_CHECK(null.isNull());
  BOOST_CHECK_EQUAL(null.nullTag(), 6u);
  BOOST_CHECK(!null.notNull().has_value());
  BOOST_CHECK_EQUAL(null, (mptr::MaybeNull<Node, 3>::null(6)));
  BOOST_CHECK_EQUAL(null.toMarkedPtr(), Ptr(nullptr, 6));

  auto fallback = null.valueOrElse([&node](std::uintptr_t tag){ return NonNull::compose(&node, tag + 1); });
  BOOST_CHECK_EQUAL(fallback, NonNull::compose(&node, 7));
  BOOST_CHECK_EQUAL(value.valueOrElse([](std::uintptr_t){ return NonNull::dangling(); }), NonNull::compose(&node, 4));
}

BOOST_AUTO_TEST_CASE(TestMaybeNullMapAndTake)
{
  using NonNull = mptr::MarkedNonNull<Node, 3>;
  Node node{};
  auto bump = [](NonNull ptr){ return ptr.addTag(1); };

  mptr::MaybeNull<Node, 3> value(NonNull::compose(&node, 1));
  BOOST_CHECK_EQUAL(value.map(bump), (mptr::MaybeNull<Node, 3>(NonNull::compose(&node, 2))));
  auto null = mptr::MaybeNull<Node, 3>::null(5);
  auto mappedNull = null.map(bump);
  BOOST_CHECK(mappedNull.isNull());
  BOOST_CHECK_EQUAL(mappedNull.nullTag(), 5u);

  auto taken = value.take();
  BOOST_CHECK(taken.isValue());
  BOOST_CHECK(value.isNull());
  BOOST_CHECK_EQUAL(value.nullTag(), 0u);
  BOOST_CHECK_EQUAL(taken.withTag(0).decomposePtr(), &node);
  BOOST_CHECK_EQUAL(taken.clearTag().decomposeTag(), 0u);

  std::ostringstream os;
  os << null;
  BOOST_CHECK_EQUAL(os.str(), "Null{tag: 5}");
}
