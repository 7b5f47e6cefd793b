#include <catch2/catch_test_macros.hpp>

#include <ObjBridge/Bridge.hpp>

#include "World.hpp"

#include <array>
#include <cstdint>
#include <thread>
#include <vector>

using namespace ObjBridge;
using namespace ObjBridgeTests;

TEST_CASE("OwnedResultsAreReleasedOnce", "[bridge][Lifetime]")
{
  World world;
  Bridge bridge{world.runtime};
  auto cls = bridge.ResolveClass("Counter");
  REQUIRE(cls.has_value());

  const auto before = world.runtime.DeallocatedCount();
  {
    auto counter = cls->CallAs<ProxyHandle>("new");
    REQUIRE(counter.has_value());
    CHECK(counter->Ref()->IsOwned());
    CHECK(world.runtime.RetainCount(counter->Id()) == 1);

    std::vector<ProxyHandle> copies(4, *counter);
    ProxyHandle moved = std::move(copies.back());
    copies.pop_back();
    CHECK(world.runtime.RetainCount(counter->Id()) == 1);
    CHECK(world.runtime.DeallocatedCount() == before);
  }
  CHECK(world.runtime.DeallocatedCount() == before + 1);
}

TEST_CASE("InitConsumesItsReceiver", "[bridge][Lifetime]")
{
  World world;
  Bridge bridge{world.runtime};
  auto cls = bridge.ResolveClass("Rect");
  REQUIRE(cls.has_value());

  const auto before = world.runtime.DeallocatedCount();
  {
    auto raw = cls->CallAs<ProxyHandle>("alloc");
    REQUIRE(raw.has_value());
    CHECK(raw->Ref()->IsOwned());

    auto rect = raw->CallAs<ProxyHandle>("initWithWidth:height:", 1.0, 2.0);
    REQUIRE(rect.has_value());
    CHECK(rect->Id() == raw->Id());
    CHECK_FALSE(raw->Ref()->IsOwned());
    CHECK(rect->Ref()->IsOwned());
    CHECK(world.runtime.RetainCount(rect->Id()) == 1);
  }
  CHECK(world.runtime.DeallocatedCount() == before + 1);
}

TEST_CASE("BorrowedResultsAreLeftAlone", "[bridge][Lifetime]")
{
  World world;
  Bridge bridge{world.runtime};
  auto cls = bridge.ResolveClass("Counter");
  REQUIRE(cls.has_value());

  const auto retainCount = world.runtime.RetainCount(world.SharedCounter());
  const auto before = world.runtime.DeallocatedCount();
  {
    auto shared = cls->CallAs<ProxyHandle>("sharedCounter");
    REQUIRE(shared.has_value());
    CHECK(shared->Id() == world.SharedCounter());
    CHECK_FALSE(shared->Ref()->IsOwned());
    CHECK(world.runtime.RetainCount(shared->Id()) == retainCount);

    auto again = cls->CallAs<ProxyHandle>("sharedCounter");
    REQUIRE(again.has_value());
    CHECK(*again == *shared);
  }
  CHECK(world.runtime.RetainCount(world.SharedCounter()) == retainCount);
  CHECK(world.runtime.DeallocatedCount() == before);
}

TEST_CASE("CopyFamilyReturnsOwned", "[bridge][Lifetime]")
{
  World world;
  Bridge bridge{world.runtime};
  auto original = bridge.Wrap(world.SharedCounter());
  REQUIRE(original.CallAs<std::int64_t>("addValue:", std::int64_t{9}).has_value());

  const auto before = world.runtime.DeallocatedCount();
  {
    auto copy = original.CallAs<ProxyHandle>("copy");
    REQUIRE(copy.has_value());
    CHECK(copy->Ref()->IsOwned());
    CHECK(copy->Id() != original.Id());
    CHECK(copy->CallAs<std::int64_t>("count").value() == 9);
  }
  CHECK(world.runtime.DeallocatedCount() == before + 1);
}

TEST_CASE("ExplicitRetainAndRelease", "[bridge][Lifetime]")
{
  World world;
  Bridge bridge{world.runtime};
  auto counter = bridge.Wrap(world.SharedCounter());
  const auto base = world.runtime.RetainCount(counter.Id());

  auto retained = counter.CallAs<ProxyHandle>("retain");
  REQUIRE(retained.has_value());
  CHECK_FALSE(retained->Ref()->IsOwned());
  CHECK(world.runtime.RetainCount(counter.Id()) == base + 1);
  CHECK(counter.CallAs<std::uint64_t>("retainCount").value() == static_cast<std::uint64_t>(base + 1));

  REQUIRE(counter.CallAs<void>("release").has_value());
  CHECK(world.runtime.RetainCount(counter.Id()) == base);
}

TEST_CASE("WrapHonoursRequestedOwnership", "[bridge][Lifetime]")
{
  World world;
  Bridge bridge{world.runtime};
  const auto before = world.runtime.DeallocatedCount();
  {
    ObjectId fresh = world.runtime.CreateInstance(world.runtime.FindClass("Counter"));
    auto owned = bridge.Wrap(fresh, Ownership::Owned);
    CHECK(owned.Kind() == ProxyKind::Instance);
    CHECK(owned.Ref()->IsOwned());

    // Class objects are never owned, whatever the caller asks for.
    auto cls = bridge.Wrap(world.runtime.FindClass("Counter"), Ownership::Owned);
    CHECK(cls.Kind() == ProxyKind::Class);
    CHECK_FALSE(cls.Ref()->IsOwned());

    CHECK_FALSE(bridge.Wrap(nullptr).IsValid());
  }
  CHECK(world.runtime.DeallocatedCount() == before + 1);
}

TEST_CASE("ConcurrentHandleDropsReleaseOnce", "[bridge][Lifetime]")
{
  World world;
  Bridge bridge{world.runtime};
  auto cls = bridge.ResolveClass("Counter");
  REQUIRE(cls.has_value());

  const auto before = world.runtime.DeallocatedCount();
  {
    auto counter = cls->CallAs<ProxyHandle>("new");
    REQUIRE(counter.has_value());

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t)
    {
      threads.emplace_back(
          [copy = *counter]() mutable
          {
            for (int i = 0; i < 100; ++i)
            {
              ProxyHandle local = copy;
              (void)local.Id();
            }
          });
    }
    for (auto &th : threads)
      th.join();
    CHECK(world.runtime.DeallocatedCount() == before);
  }
  CHECK(world.runtime.DeallocatedCount() == before + 1);
}

TEST_CASE("FailedWriteBacksKeepOwnershipStraight", "[bridge][Lifetime]")
{
  World world;
  Bridge bridge{world.runtime};
  auto cls = bridge.ResolveClass("Counter");
  REQUIRE(cls.has_value());

  const auto before = world.runtime.DeallocatedCount();
  {
    auto counter = cls->CallAs<ProxyHandle>("new");
    REQUIRE(counter.has_value());

    // The copy is owned by the caller even though its out parameter is unreadable.
    OutParam note;
    auto copy = counter->Call("copyWithNote:", std::array<Any, 1>{Any{note}});
    REQUIRE_FALSE(copy.has_value());
    CHECK(copy.error().code == ErrorCode::EncodingError);
    CHECK(world.runtime.DeallocatedCount() == before + 1);
  }
  CHECK(world.runtime.DeallocatedCount() == before + 2);

  {
    auto raw = cls->CallAs<ProxyHandle>("alloc");
    REQUIRE(raw.has_value());
    REQUIRE(raw->Ref()->IsOwned());

    OutParam note;
    auto init = raw->Call("initWithNote:", std::array<Any, 1>{Any{note}});
    REQUIRE_FALSE(init.has_value());
    CHECK(init.error().code == ErrorCode::EncodingError);
    CHECK_FALSE(raw->Ref()->IsOwned());
  }
  CHECK(world.runtime.DeallocatedCount() == before + 3);
}
