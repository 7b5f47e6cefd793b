// World.hpp
// LocalRuntime populated with the classes and protocols the bridge tests talk to
#pragma once

#include <ObjBridge/LocalRuntime.hpp>

#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace ObjBridgeTests
{
  using namespace ObjBridge;

  struct Point
  {
    std::int32_t x;
    std::int32_t y;
  };

  union Bits
  {
    std::int32_t i;
    std::uint32_t u;
  };

  union Number
  {
    std::int32_t i;
    double d;
  };

  union Mixed
  {
    std::int32_t i;
    std::int64_t q;
    const char *s;
  };

  inline constexpr std::string_view kPointEncoding = "{Point=\"x\"i\"y\"i}";

  // Classes:
  //   Object (root)
  //   Shape : Object <Drawable>      _sides, -sides, -setSides:, -area, -label
  //   Rect : Shape                   _width, _height, _origin, -initWithWidth:height:, +rectWithWidth:height:
  //   Square : Rect                  -initWithSide:
  //   Counter : Object <Named>       _count and one method per marshalling case
  //   NSString, NSArray, NSDictionary  boxing targets
  //   Broken : Object                a method whose encoding does not decode
  // Protocols: Named, Drawable <Named>
  class World
  {
  public:
    World();
    ~World();

    World(const World &) = delete;
    World &operator=(const World &) = delete;

    // Instance served by +[Counter sharedCounter]; every caller borrows it.
    [[nodiscard]] ObjectId SharedCounter() const noexcept { return m_sharedCounter; }

    // Factory results nobody owns; released when the world goes away.
    void Autorelease(ObjectId object);
    [[nodiscard]] const char *Store(std::string_view text);
    [[nodiscard]] std::vector<ObjectId> *StoreList(const ObjectId *objects, std::uint64_t count);

    [[nodiscard]] static World &Of(ObjectId object);

    LocalRuntime runtime;

  private:
    void Build();

    ObjectId m_sharedCounter{nullptr};
    std::mutex m_mutex;
    std::deque<std::string> m_strings;
    std::deque<std::vector<ObjectId>> m_lists;
    std::vector<ObjectId> m_pool;
  };

  // Text of an NSString instance from the world.
  [[nodiscard]] std::string_view TextOf(ObjectId string);

} // namespace ObjBridgeTests
