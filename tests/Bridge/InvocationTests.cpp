#include <catch2/catch_test_macros.hpp>

#include <ObjBridge/Bridge.hpp>

#include "World.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <thread>

using namespace ObjBridge;
using namespace ObjBridgeTests;

namespace InvokeDemo
{
  ProxyHandle Make(Bridge &bridge, std::string_view className)
  {
    auto cls = bridge.ResolveClass(className);
    REQUIRE(cls.has_value());
    auto obj = cls->CallAs<ProxyHandle>("new");
    REQUIRE(obj.has_value());
    REQUIRE(obj->IsValid());
    return *obj;
  }
} // namespace InvokeDemo

TEST_CASE("InvokesScalarMethods", "[bridge][Invocation]")
{
  World world;
  Bridge bridge{world.runtime};
  auto counter = InvokeDemo::Make(bridge, "Counter");

  CHECK(counter.CallAs<std::int64_t>("count").value() == 0);
  REQUIRE(counter.CallAs<void>("increment").has_value());
  REQUIRE(counter.CallAs<void>("increment").has_value());
  CHECK(counter.CallAs<std::int64_t>("addValue:", std::int64_t{40}).value() == 42);
  CHECK(counter.CallAs<std::int64_t>("count").value() == 42);

  auto positive = counter.Call("isPositive:", std::array<Any, 1>{Any{5}});
  REQUIRE(positive.has_value());
  CHECK(positive->Cast<bool>());
  CHECK_FALSE(counter.CallAs<bool>("isPositive:", -5).value());
}

TEST_CASE("WidensNarrowReturns", "[bridge][Invocation]")
{
  World world;
  Bridge bridge{world.runtime};
  auto counter = InvokeDemo::Make(bridge, "Counter");

  auto negative = counter.Call("negativeByte");
  REQUIRE(negative.has_value());
  CHECK(negative->Cast<std::int64_t>() == -5);

  auto byte = counter.Call("echoByte:", std::array<Any, 1>{Any{200}});
  REQUIRE(byte.has_value());
  CHECK(byte->Cast<std::uint64_t>() == 200);

  auto shortValue = counter.Call("echoShort:", std::array<Any, 1>{Any{-1234}});
  REQUIRE(shortValue.has_value());
  CHECK(shortValue->Cast<std::int64_t>() == -1234);

  auto narrow = counter.Call("echoByte:", std::array<Any, 1>{Any{256}});
  REQUIRE_FALSE(narrow.has_value());
  CHECK(narrow.error().code == ErrorCode::ArgumentRange);
  CHECK(narrow.error().argIndex == 0);
}

TEST_CASE("InvokesFloatingMethods", "[bridge][Invocation]")
{
  World world;
  Bridge bridge{world.runtime};
  auto counter = InvokeDemo::Make(bridge, "Counter");

  auto f = counter.Call("echoFloat:", std::array<Any, 1>{Any{0.25f}});
  REQUIRE(f.has_value());
  CHECK(f->Cast<float>() == 0.25f);

  auto ld = counter.Call("echoLongDouble:", std::array<Any, 1>{Any{1.5L}});
  REQUIRE(ld.has_value());
  CHECK(ld->Cast<long double>() == 1.5L);

  auto cls = bridge.ResolveClass("Rect");
  REQUIRE(cls.has_value());
  auto rect = cls->CallAs<ProxyHandle>("rectWithWidth:height:", 3.0, 4.0);
  REQUIRE(rect.has_value());
  CHECK(rect->CallAs<double>("area").value() == 12.0);
}

TEST_CASE("PassesStructsByValue", "[bridge][Invocation]")
{
  World world;
  Bridge bridge{world.runtime};
  auto rect = InvokeDemo::Make(bridge, "Rect");

  Aggregate p;
  p.Set("x", Any{7}).Set("y", Any{-9});
  auto echoed = rect.CallAs<Aggregate>("echoPoint:", p);
  REQUIRE(echoed.has_value());
  CHECK(echoed->Get<std::int64_t>("x") == 7);
  CHECK(echoed->Get<std::int64_t>("y") == -9);

  REQUIRE(rect.CallAs<void>("setOriginPoint:", p).has_value());
  CHECK(world.runtime.Ivar<Point>(rect.Id(), "_origin")->y == -9);
}

TEST_CASE("PassesUnionsByValue", "[bridge][Invocation]")
{
  World world;
  Bridge bridge{world.runtime};
  auto counter = InvokeDemo::Make(bridge, "Counter");

  Aggregate bits;
  bits.Set("u", Any{0xFFFFFFFFu});
  auto u = counter.Call("bitsOf:", std::array<Any, 1>{Any{bits}});
  REQUIRE(u.has_value());
  CHECK(u->Cast<std::uint64_t>() == 0xFFFFFFFFu);

  // A union mixing integer and floating members travels in integer registers.
  Aggregate number;
  number.Set("i", Any{-7});
  auto i = counter.Call("numberAsInt:", std::array<Any, 1>{Any{number}});
  REQUIRE(i.has_value());
  CHECK(i->Cast<std::int64_t>() == -7);
}

TEST_CASE("ReadsUnionReturnsWithoutFollowingMembers", "[bridge][Invocation]")
{
  World world;
  Bridge bridge{world.runtime};
  auto counter = InvokeDemo::Make(bridge, "Counter");

  auto mixed = counter.CallAs<Aggregate>("mixed");
  REQUIRE(mixed.has_value());
  REQUIRE(mixed->Size() == 3);
  CHECK(mixed->Get<std::int64_t>("i") == 5);
  CHECK(mixed->Get<std::int64_t>("q") == 5);

  // The string member overlays the integers and comes back as a bare address.
  auto s = mixed->Get<void *>("s");
  REQUIRE(s.has_value());
  CHECK(reinterpret_cast<std::uintptr_t>(*s) == 5);
}

TEST_CASE("PassesSelectorsAndPointers", "[bridge][Invocation]")
{
  World world;
  Bridge bridge{world.runtime};
  auto counter = InvokeDemo::Make(bridge, "Counter");

  auto sel = counter.CallAs<Selector>("echoSelector:", Selector{"increment"});
  REQUIRE(sel.has_value());
  CHECK(sel->name == "increment");

  auto name = counter.CallAs<std::string>("nameOfSelector:", Selector{"addValue:"});
  REQUIRE(name.has_value());
  CHECK(*name == "addValue:");

  int local = 0;
  auto p = counter.CallAs<void *>("echoPointer:", static_cast<void *>(&local));
  REQUIRE(p.has_value());
  CHECK(*p == &local);
}

TEST_CASE("CallsVariadicMethods", "[bridge][Invocation]")
{
  World world;
  Bridge bridge{world.runtime};
  auto counter = InvokeDemo::Make(bridge, "Counter");

  auto sig = DecodeMethodEncoding("q20@0:8i16", 1);
  REQUIRE(sig.has_value());
  const std::array<Any, 4> args{Any{3}, Any{10}, Any{20}, Any{12}};

  auto fixedOnly = counter.CallWithSignature("sumOf:", *sig, args);
  REQUIRE_FALSE(fixedOnly.has_value());
  CHECK(fixedOnly.error().code == ErrorCode::InvalidArgument);

  sig->isVariadic = true;
  auto sum = counter.CallWithSignature("sumOf:", *sig, args);
  REQUIRE(sum.has_value());
  CHECK(sum->Cast<std::int64_t>() == 42);

  const std::array<Any, 2> bad{Any{1}, Any{Aggregate{}}};
  auto unpromotable = counter.CallWithSignature("sumOf:", *sig, bad);
  REQUIRE_FALSE(unpromotable.has_value());
  CHECK(unpromotable.error().code == ErrorCode::InvalidArgument);
  CHECK(unpromotable.error().argIndex == 1);
}

TEST_CASE("WritesBackOutParameters", "[bridge][Invocation]")
{
  World world;
  Bridge bridge{world.runtime};
  auto counter = InvokeDemo::Make(bridge, "Counter");

  OutParam answer;
  REQUIRE(counter.CallAs<void>("storeAnswer:", answer).has_value());
  REQUIRE(answer.HasValue());
  CHECK(answer.As<std::int32_t>().value() == 42);

  OutParam value{Any{std::int64_t{21}}};
  REQUIRE(counter.CallAs<void>("doubleValue:", value).has_value());
  CHECK(value.As<std::int64_t>().value() == 42);
}

TEST_CASE("SurfacesForeignExceptions", "[bridge][Invocation]")
{
  World world;
  Bridge bridge{world.runtime};
  auto counter = InvokeDemo::Make(bridge, "Counter");

  auto r = counter.CallAs<void>("fail:", std::string{"disk full"});
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == ErrorCode::ForeignException);
  CHECK(r.error().subject == "disk full");

  // The exception is consumed; the next call is clean.
  CHECK(counter.CallAs<std::int64_t>("count").has_value());
}

TEST_CASE("EnforcesThreadAffinity", "[bridge][Invocation]")
{
  World world;
  Bridge bridge{world.runtime};
  auto counter = InvokeDemo::Make(bridge, "Counter");

  std::thread other([] {});
  const auto otherId = other.get_id();
  other.join();

  world.runtime.SetAffinityThread(otherId);
  auto r = counter.Call("count");
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == ErrorCode::ThreadAffinityViolation);

  world.runtime.SetAffinityThread(std::this_thread::get_id());
  CHECK(counter.Call("count").has_value());

  world.runtime.SetAffinityThread(std::nullopt);
  CHECK(counter.Call("count").has_value());
}

TEST_CASE("RejectsInvalidForeignStrings", "[bridge][Invocation]")
{
  World world;
  Bridge bridge{world.runtime};
  auto counter = InvokeDemo::Make(bridge, "Counter");

  auto r = counter.Call("invalidUtf8");
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == ErrorCode::EncodingError);

  auto label = counter.CallAs<std::string>("label");
  REQUIRE(label.has_value());
  CHECK(*label == "counter");
}

TEST_CASE("ChecksArgumentCounts", "[bridge][Invocation]")
{
  World world;
  Bridge bridge{world.runtime};
  auto counter = InvokeDemo::Make(bridge, "Counter");

  auto missing = counter.Call("addValue:");
  REQUIRE_FALSE(missing.has_value());
  CHECK(missing.error().code == ErrorCode::InvalidArgument);

  auto extra = counter.Call("count", std::array<Any, 1>{Any{1}});
  REQUIRE_FALSE(extra.has_value());
  CHECK(extra.error().code == ErrorCode::InvalidArgument);

  // Nothing reached the foreign side.
  CHECK(counter.CallAs<std::int64_t>("count").value() == 0);
}

TEST_CASE("ReportsUndecodableSignatures", "[bridge][Invocation]")
{
  World world;
  Bridge bridge{world.runtime};
  auto broken = InvokeDemo::Make(bridge, "Broken");

  auto r = broken.Call("broken");
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == ErrorCode::DecodeError);
}

TEST_CASE("SharesCallInterfacesPerSignature", "[bridge][Invocation]")
{
  World world;
  Bridge bridge{world.runtime};
  auto counter = InvokeDemo::Make(bridge, "Counter");
  auto other = InvokeDemo::Make(bridge, "Counter");

  const auto before = bridge.Engine().CachedInterfaceCount();
  REQUIRE(counter.Call("count").has_value());
  REQUIRE(other.Call("count").has_value());
  CHECK(bridge.Engine().CachedInterfaceCount() == before + 1);

  REQUIRE(counter.Call("increment").has_value());
  CHECK(bridge.Engine().CachedInterfaceCount() == before + 2);
}

TEST_CASE("KeysCallInterfacesByLayout", "[bridge][Invocation]")
{
  World world;
  Bridge bridge{world.runtime};
  auto counter = InvokeDemo::Make(bridge, "Counter");
  auto cls = bridge.ResolveClass("Rect");
  REQUIRE(cls.has_value());
  auto rect = cls->CallAs<ProxyHandle>("rectWithWidth:height:", 3.0, 4.0);
  REQUIRE(rect.has_value());
  REQUIRE(counter.CallAs<std::int64_t>("addValue:", std::int64_t{7}).has_value());

  // Hand-built signatures whose encoding text says nothing about their layout.
  MethodSignature count;
  count.returnType = TypeDescriptor::MakeInteger(8, true);
  count.encoding = "stale";
  MethodSignature area;
  area.returnType = TypeDescriptor::MakeFloat(8);
  area.encoding = "stale";

  const auto before = bridge.Engine().CachedInterfaceCount();
  auto n = counter.CallWithSignature("count", count, std::span<const Any>{});
  REQUIRE(n.has_value());
  CHECK(n->Cast<std::int64_t>() == 7);

  auto a = rect->CallWithSignature("area", area, std::span<const Any>{});
  REQUIRE(a.has_value());
  CHECK(a->Cast<double>() == 12.0);
  CHECK(bridge.Engine().CachedInterfaceCount() == before + 2);

  // Same layout, different text: the interface is shared.
  area.encoding = "d16@0:8";
  REQUIRE(rect->CallWithSignature("area", area, std::span<const Any>{}).has_value());
  CHECK(bridge.Engine().CachedInterfaceCount() == before + 2);
}
