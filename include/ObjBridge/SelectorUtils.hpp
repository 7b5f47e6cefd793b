// SelectorUtils.hpp
// Selector-name helpers: argument counts, attribute-name mapping and default accessors.
#pragma once

#include <NGIN/Primitives.hpp>

#include <cctype>
#include <string>
#include <string_view>

namespace ObjBridge::detail
{

  // Number of arguments a selector declares: one per ':'.
  [[nodiscard]] constexpr NGIN::UIntSize ColonCount(std::string_view selector) noexcept
  {
    NGIN::UIntSize n = 0;
    for (char c : selector)
      if (c == ':')
        ++n;
    return n;
  }

  // Host attribute spelling to selector: "initWithX_y_" -> "initWithX:y:".
  [[nodiscard]] inline std::string AttributeNameToSelector(std::string_view attribute)
  {
    std::string out{attribute};
    for (char &c : out)
      if (c == '_')
        c = ':';
    return out;
  }

  [[nodiscard]] inline std::string SelectorToAttributeName(std::string_view selector)
  {
    std::string out{selector};
    for (char &c : out)
      if (c == ':')
        c = '_';
    return out;
  }

  // "name" -> "setName:"
  [[nodiscard]] inline std::string DefaultSetter(std::string_view property)
  {
    std::string out{"set"};
    out.reserve(property.size() + 4);
    if (!property.empty())
    {
      out += static_cast<char>(std::toupper(static_cast<unsigned char>(property.front())));
      out.append(property.substr(1));
    }
    out += ':';
    return out;
  }

  // True when `selector` starts with the camel-case word `family`: "copy" matches
  // "copy", "copyWithZone:" and "copy:" but not "copyright".
  [[nodiscard]] constexpr bool HasSelectorFamily(std::string_view selector, std::string_view family) noexcept
  {
    // Leading underscores are ignored, as for private-prefixed selectors.
    while (!selector.empty() && selector.front() == '_')
      selector.remove_prefix(1);
    if (family.empty() || selector.substr(0, family.size()) != family)
      return false;
    if (selector.size() == family.size())
      return true;
    const char next = selector[family.size()];
    return !(next >= 'a' && next <= 'z');
  }

} // namespace ObjBridge::detail
