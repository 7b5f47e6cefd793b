#include <catch2/catch_test_macros.hpp>

#include <ObjBridge/Bridge.hpp>

#include "World.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

using namespace ObjBridge;
using namespace ObjBridgeTests;

namespace BoxingDemo
{
  struct Celsius
  {
    double degrees;
  };
} // namespace BoxingDemo

TEST_CASE("BoxesStringsIntoForeignStrings", "[bridge][Boxing]")
{
  World world;
  Bridge bridge{world.runtime};
  auto counter = bridge.Wrap(world.SharedCounter());

  CHECK(counter.CallAs<std::uint64_t>("lengthOf:", std::string{"hello"}).value() == 5);
  CHECK(counter.CallAs<std::uint64_t>("lengthOf:", static_cast<const char *>("hi")).value() == 2);
  CHECK(counter.CallAs<std::uint64_t>("lengthOf:", nullptr).value() == 0);

  auto boxed = bridge.Marshaller().Box(Any{std::string{"text"}});
  REQUIRE(boxed.has_value());
  CHECK(boxed->ClassName() == "NSString");
  CHECK(TextOf(boxed->Id()) == "text");
  CHECK(boxed->CallAs<std::string>("UTF8String").value() == "text");
}

TEST_CASE("BoxesSequencesIntoForeignArrays", "[bridge][Boxing]")
{
  World world;
  Bridge bridge{world.runtime};
  auto counter = bridge.Wrap(world.SharedCounter());

  const std::vector<Any> items{Any{std::string{"a"}}, Any{std::string{"b"}}, Any{counter}};
  CHECK(counter.CallAs<std::uint64_t>("countOf:", items).value() == 3);

  auto array = bridge.Marshaller().Box(Any{items});
  REQUIRE(array.has_value());
  CHECK(array->ClassName() == "NSArray");

  auto first = array->CallAs<ProxyHandle>("objectAtIndex:", std::uint64_t{0});
  REQUIRE(first.has_value());
  CHECK(first->CallAs<std::string>("UTF8String").value() == "a");

  auto last = array->CallAs<ProxyHandle>("objectAtIndex:", std::uint64_t{2});
  REQUIRE(last.has_value());
  CHECK(*last == counter);

  auto outOfRange = array->Call("objectAtIndex:", std::array<Any, 1>{Any{std::uint64_t{3}}});
  REQUIRE_FALSE(outOfRange.has_value());
  CHECK(outOfRange.error().code == ErrorCode::ForeignException);
  CHECK(outOfRange.error().subject == "NSRangeException");

  const std::vector<Any> nested{Any{std::vector<Any>{Any{std::string{"x"}}}}, Any{std::string{"y"}}};
  CHECK(counter.CallAs<std::uint64_t>("countOf:", nested).value() == 2);
}

TEST_CASE("BoxesMapsIntoForeignDictionaries", "[bridge][Boxing]")
{
  World world;
  Bridge bridge{world.runtime};

  const std::map<std::string, Any> entries{{"one", Any{std::string{"uno"}}}, {"two", Any{std::string{"dos"}}}};
  auto dict = bridge.Marshaller().Box(Any{entries});
  REQUIRE(dict.has_value());
  CHECK(dict->ClassName() == "NSDictionary");
  CHECK(dict->CallAs<std::uint64_t>("count").value() == 2);

  auto two = dict->CallAs<ProxyHandle>("objectForKey:", std::string{"two"});
  REQUIRE(two.has_value());
  REQUIRE(two->IsValid());
  CHECK(TextOf(two->Id()) == "dos");

  auto none = dict->Call("objectForKey:", std::array<Any, 1>{Any{std::string{"three"}}});
  REQUIRE(none.has_value());
  CHECK(detail::Holds<std::nullptr_t>(*none));
}

TEST_CASE("CollectionsRejectNull", "[bridge][Boxing]")
{
  World world;
  Bridge bridge{world.runtime};
  auto counter = bridge.Wrap(world.SharedCounter());

  const std::vector<Any> withNull{Any{std::string{"a"}}, Any{nullptr}};
  auto r = counter.CallAs<std::uint64_t>("countOf:", withNull);
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == ErrorCode::InvalidArgument);

  const std::map<std::string, Any> nullValue{{"k", Any{nullptr}}};
  auto d = bridge.Marshaller().Box(Any{nullValue});
  REQUIRE_FALSE(d.has_value());
  CHECK(d.error().code == ErrorCode::InvalidArgument);
  CHECK(d.error().subject == "k");

  const std::vector<Any> unboxable{Any{Aggregate{}}};
  auto u = bridge.Marshaller().Box(Any{unboxable});
  REQUIRE_FALSE(u.has_value());
  CHECK(u.error().code == ErrorCode::UnsupportedType);
}

TEST_CASE("AutoBoxingCanBeDisabled", "[bridge][Boxing]")
{
  World world;
  BridgeOptions options;
  options.autoBoxing = false;
  Bridge bridge{world.runtime, options};
  auto counter = bridge.Wrap(world.SharedCounter());

  auto r = counter.CallAs<std::uint64_t>("lengthOf:", std::string{"hello"});
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == ErrorCode::InvalidArgument);
  CHECK(r.error().argIndex == 0);

  // Explicit boxing still works.
  auto boxed = bridge.Marshaller().Box(Any{std::string{"hello"}});
  REQUIRE(boxed.has_value());
  CHECK(counter.CallAs<std::uint64_t>("lengthOf:", *boxed).value() == 5);
}

TEST_CASE("AcceptsCustomBoxingAdapters", "[bridge][Boxing]")
{
  World world;
  Bridge bridge{world.runtime};
  auto counter = bridge.Wrap(world.SharedCounter());

  CHECK_FALSE(counter.CallAs<std::uint64_t>("lengthOf:", BoxingDemo::Celsius{21.5}).has_value());

  bridge.Marshaller().RegisterBoxing<BoxingDemo::Celsius>(
      [](Bridge &b, const Any &v) -> Expected<ProxyHandle>
      {
        const auto c = v.Cast<BoxingDemo::Celsius>();
        return b.Marshaller().Box(Any{std::to_string(static_cast<int>(c.degrees)) + "C"});
      });
  CHECK(counter.CallAs<std::uint64_t>("lengthOf:", BoxingDemo::Celsius{21.5}).value() == 3);
}

TEST_CASE("BoxingClassesAreConfigurable", "[bridge][Boxing]")
{
  World world;
  BridgeOptions options;
  options.boxing.stringClass = "NSMissingString";
  Bridge bridge{world.runtime, options};

  auto r = bridge.Marshaller().Box(Any{std::string{"x"}});
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == ErrorCode::NotFound);
  CHECK(r.error().subject == "NSMissingString");
}

TEST_CASE("BoxedFactoryResultsAreBorrowed", "[bridge][Boxing]")
{
  World world;
  Bridge bridge{world.runtime};
  const auto deallocated = world.runtime.DeallocatedCount();
  {
    auto boxed = bridge.Marshaller().Box(Any{std::string{"kept by the world"}});
    REQUIRE(boxed.has_value());
    CHECK_FALSE(boxed->Ref()->IsOwned());
    CHECK(world.runtime.RetainCount(boxed->Id()) == 1);
  }
  CHECK(world.runtime.DeallocatedCount() == deallocated);
}
