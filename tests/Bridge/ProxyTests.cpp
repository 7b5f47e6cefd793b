#include <catch2/catch_test_macros.hpp>

#include <ObjBridge/Bridge.hpp>

#include "World.hpp"

#include <array>
#include <cstdint>
#include <string>

using namespace ObjBridge;
using namespace ObjBridgeTests;

namespace ProxyDemo
{
  ProxyHandle MakeRect(Bridge &bridge, double width, double height)
  {
    auto cls = bridge.ResolveClass("Rect");
    REQUIRE(cls.has_value());
    auto raw = cls->CallAs<ProxyHandle>("alloc");
    REQUIRE(raw.has_value());
    auto rect = raw->CallAs<ProxyHandle>("initWithWidth:height:", width, height);
    REQUIRE(rect.has_value());
    return *rect;
  }
} // namespace ProxyDemo

TEST_CASE("ResolvesClassesAndProtocols", "[bridge][Proxy]")
{
  World world;
  Bridge bridge{world.runtime};

  auto rect = bridge.ResolveClass("Rect");
  REQUIRE(rect.has_value());
  CHECK(rect->Kind() == ProxyKind::Class);
  CHECK(rect->ClassName() == "Rect");
  CHECK(rect->Id() == world.runtime.FindClass("Rect"));

  auto drawable = bridge.ResolveProtocol("Drawable");
  REQUIRE(drawable.has_value());
  CHECK(drawable->Kind() == ProxyKind::Protocol);
  CHECK(drawable->ClassName() == "Drawable");

  auto missing = bridge.ResolveClass("DoesNotExist");
  REQUIRE_FALSE(missing.has_value());
  CHECK(missing.error().code == ErrorCode::NotFound);
  CHECK(missing.error().subject == "DoesNotExist");
}

TEST_CASE("ReadsAndWritesProperties", "[bridge][Proxy]")
{
  World world;
  Bridge bridge{world.runtime};
  auto rect = ProxyDemo::MakeRect(bridge, 2.0, 5.0);

  CHECK(rect.GetPropertyAs<double>("width").value() == 2.0);
  REQUIRE(rect.SetProperty("width", Any{3}).has_value());
  CHECK(rect.GetPropertyAs<double>("width").value() == 3.0);
  CHECK(rect.GetPropertyAs<double>("area").value() == 15.0);

  // Inherited property backed by Shape's accessors.
  CHECK(rect.GetPropertyAs<std::int32_t>("sides").value() == 4);

  auto readOnly = rect.SetProperty("area", Any{1.0});
  REQUIRE_FALSE(readOnly.has_value());
  CHECK(readOnly.error().code == ErrorCode::InvalidArgument);
  CHECK(readOnly.error().subject == "area");

  auto missing = rect.GetProperty("colour");
  REQUIRE_FALSE(missing.has_value());
  CHECK(missing.error().code == ErrorCode::NoSuchMember);
}

TEST_CASE("UsesCustomPropertyAccessors", "[bridge][Proxy]")
{
  World world;
  Bridge bridge{world.runtime};
  auto rect = ProxyDemo::MakeRect(bridge, 1.0, 1.0);

  Aggregate origin;
  origin.Set("x", Any{10}).Set("y", Any{20});
  REQUIRE(rect.SetProperty("origin", Any{origin}).has_value());

  auto back = rect.GetPropertyAs<Aggregate>("origin");
  REQUIRE(back.has_value());
  CHECK(back->Get<std::int64_t>("x") == 10);
  CHECK(back->Get<std::int64_t>("y") == 20);
}

TEST_CASE("FindsPropertiesDeclaredByProtocols", "[bridge][Proxy]")
{
  World world;
  Bridge bridge{world.runtime};
  auto counter = bridge.Wrap(world.SharedCounter());

  auto label = counter.GetPropertyAs<std::string>("label");
  REQUIRE(label.has_value());
  CHECK(*label == "counter");

  auto cls = bridge.ResolveClass("Counter");
  REQUIRE(cls.has_value());
  auto onClass = cls->GetProperty("label");
  REQUIRE_FALSE(onClass.has_value());
  CHECK(onClass.error().code == ErrorCode::NoSuchMember);
}

TEST_CASE("ResolvesHostAttributes", "[bridge][Proxy]")
{
  World world;
  Bridge bridge{world.runtime};
  auto rect = ProxyDemo::MakeRect(bridge, 3.0, 3.0);

  auto area = rect.GetAttribute("area");
  REQUIRE(area.has_value());
  CHECK(area->Cast<double>() == 9.0);

  auto label = rect.GetAttribute("label");
  REQUIRE(label.has_value());
  CHECK(label->Cast<std::string>() == "shape");

  auto counter = bridge.Wrap(world.SharedCounter());
  auto count = counter.GetAttribute("count");
  REQUIRE(count.has_value());
  CHECK(count->Cast<std::int64_t>() == 0);

  auto cls = bridge.ResolveClass("Counter");
  REQUIRE(cls.has_value());
  auto shared = cls->GetAttribute("sharedCounter");
  REQUIRE(shared.has_value());
  CHECK(shared->Cast<ProxyHandle>().Id() == world.SharedCounter());

  for (const char *name : {"fly", "addValue_", "initWithWidth_height_"})
  {
    INFO(name);
    auto r = counter.GetAttribute(name);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == ErrorCode::NoSuchMember);
  }
}

TEST_CASE("ReadsInstanceVariables", "[bridge][Proxy]")
{
  World world;
  Bridge bridge{world.runtime};
  auto rect = ProxyDemo::MakeRect(bridge, 6.0, 7.0);

  auto sides = rect.GetIvar("_sides");
  REQUIRE(sides.has_value());
  CHECK(sides->Cast<std::int64_t>() == 4);

  auto height = rect.GetIvar("_height");
  REQUIRE(height.has_value());
  CHECK(height->Cast<double>() == 7.0);

  auto origin = rect.GetIvar("_origin");
  REQUIRE(origin.has_value());
  CHECK(origin->Cast<Aggregate>().Size() == 2);

  auto missing = rect.GetIvar("_depth");
  REQUIRE_FALSE(missing.has_value());
  CHECK(missing.error().code == ErrorCode::NoSuchMember);

  auto cls = bridge.ResolveClass("Rect");
  REQUIRE(cls.has_value());
  auto onClass = cls->GetIvar("_sides");
  REQUIRE_FALSE(onClass.has_value());
  CHECK(onClass.error().code == ErrorCode::NoSuchMember);
}

TEST_CASE("AnswersTypePredicates", "[bridge][Proxy]")
{
  World world;
  Bridge bridge{world.runtime};
  auto cls = bridge.ResolveClass("Square");
  REQUIRE(cls.has_value());
  auto raw = cls->CallAs<ProxyHandle>("alloc");
  REQUIRE(raw.has_value());
  auto square = raw->CallAs<ProxyHandle>("initWithSide:", 2.0);
  REQUIRE(square.has_value());

  CHECK(square->ClassName() == "Square");
  CHECK(square->IsInstanceOf("Square"));
  CHECK(square->IsInstanceOf("Shape"));
  CHECK(square->IsInstanceOf("Object"));
  CHECK_FALSE(square->IsInstanceOf("Counter"));
  CHECK(square->IsInstanceOf("Drawable"));
  CHECK(square->IsInstanceOf("Named"));
  CHECK_FALSE(square->IsInstanceOf("Missing"));
  CHECK_FALSE(square->IsSubclassOf("Rect"));

  CHECK(cls->IsSubclassOf("Rect"));
  CHECK(cls->IsSubclassOf("Square"));
  CHECK_FALSE(cls->IsSubclassOf("Counter"));
  CHECK_FALSE(cls->IsInstanceOf("Rect"));
  CHECK_FALSE(cls->IsInstanceOf("Drawable"));

  CHECK(square->ConformsTo("Drawable"));
  CHECK(square->ConformsTo("Named"));
  CHECK(cls->ConformsTo("Named"));
  CHECK_FALSE(square->ConformsTo("Missing"));
  auto drawable = bridge.ResolveProtocol("Drawable");
  REQUIRE(drawable.has_value());
  CHECK(drawable->ConformsTo("Named"));

  CHECK(square->RespondsTo("area"));
  CHECK(square->RespondsTo("retain"));
  CHECK_FALSE(square->RespondsTo("alloc"));
  CHECK(cls->RespondsTo("alloc"));
  CHECK_FALSE(drawable->RespondsTo("area"));
}

TEST_CASE("RejectsUnknownMessages", "[bridge][Proxy]")
{
  World world;
  Bridge bridge{world.runtime};
  auto counter = bridge.Wrap(world.SharedCounter());

  auto unknown = counter.Call("fly");
  REQUIRE_FALSE(unknown.has_value());
  CHECK(unknown.error().code == ErrorCode::NoSuchMember);
  CHECK(unknown.error().subject == "fly");

  auto protocol = bridge.ResolveProtocol("Named");
  REQUIRE(protocol.has_value());
  auto toProtocol = protocol->Call("label");
  REQUIRE_FALSE(toProtocol.has_value());
  CHECK(toProtocol.error().code == ErrorCode::NoSuchMember);
}

TEST_CASE("CallsWithExplicitEncodings", "[bridge][Proxy]")
{
  World world;
  Bridge bridge{world.runtime};
  auto counter = bridge.Wrap(world.SharedCounter());

  const std::array<Any, 1> args{Any{5}};
  auto r = counter.CallWithSignature("addValue:", "q24@0:8q16", args);
  REQUIRE(r.has_value());
  CHECK(r->Cast<std::int64_t>() == 5);

  auto arity = counter.CallWithSignature("addValue:", "q16@0:8", args);
  REQUIRE_FALSE(arity.has_value());

  auto malformed = counter.CallWithSignature("addValue:", "q24@0:8{q16", args);
  REQUIRE_FALSE(malformed.has_value());
  CHECK(malformed.error().code == ErrorCode::DecodeError);
}

TEST_CASE("DetachedHandlesFailCleanly", "[bridge][Proxy]")
{
  ProxyHandle empty;
  CHECK_FALSE(empty.IsValid());
  CHECK(empty.Id() == nullptr);
  CHECK(empty.ClassName().empty());

  auto call = empty.Call("count");
  REQUIRE_FALSE(call.has_value());
  CHECK(call.error().code == ErrorCode::InvalidArgument);
  CHECK_FALSE(empty.RespondsTo("count"));
  CHECK_FALSE(empty.IsInstanceOf("Object"));
  CHECK_FALSE(empty.GetProperty("width").has_value());
}
