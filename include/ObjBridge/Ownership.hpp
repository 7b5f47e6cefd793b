// Ownership.hpp
// Versioned selector-family table deciding who owns a returned foreign reference
#pragma once

#include <NGIN/Primitives.hpp>

#include <ObjBridge/Export.hpp>
#include <ObjBridge/Types.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace ObjBridge
{

  enum class Ownership : NGIN::UInt8
  {
    Borrowed, // never retained or released by the bridge
    Owned,    // the caller already holds +1; released once when the last handle dies
  };

  struct OwnershipRule
  {
    std::string family;
    bool returnsOwned{false};
    bool consumesReceiver{false};
  };

  // Rules keyed by camel-case selector family ("copy" covers "copyWithZone:").
  //
  // Text form, one directive per line, '#' starts a comment:
  //   version 1
  //   family alloc returns-owned
  //   family init returns-owned consumes-receiver
  class OBJBRIDGE_API OwnershipConvention
  {
  public:
    static constexpr NGIN::UInt32 CurrentVersion = 1;

    OwnershipConvention() = default;

    // alloc, new, copy, mutableCopy return owned; init returns owned and consumes its receiver.
    [[nodiscard]] static OwnershipConvention Default();
    [[nodiscard]] static Expected<OwnershipConvention> Parse(std::string_view text);

    [[nodiscard]] NGIN::UInt32 Version() const noexcept { return m_version; }
    [[nodiscard]] const std::vector<OwnershipRule> &Rules() const noexcept { return m_rules; }

    // Matching rule for a selector, or null. The longest matching family wins.
    [[nodiscard]] const OwnershipRule *Match(std::string_view selector) const noexcept;

    [[nodiscard]] Ownership ReturnOwnership(std::string_view selector) const noexcept
    {
      const auto *rule = Match(selector);
      return rule && rule->returnsOwned ? Ownership::Owned : Ownership::Borrowed;
    }

    [[nodiscard]] bool ConsumesReceiver(std::string_view selector) const noexcept
    {
      const auto *rule = Match(selector);
      return rule && rule->consumesReceiver;
    }

    OwnershipConvention &Add(OwnershipRule rule);

  private:
    NGIN::UInt32 m_version{CurrentVersion};
    std::vector<OwnershipRule> m_rules;
  };

} // namespace ObjBridge
