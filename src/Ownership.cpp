#include <ObjBridge/Ownership.hpp>
#include <ObjBridge/SelectorUtils.hpp>

#include <charconv>

namespace ObjBridge
{
  namespace
  {
    constexpr std::string_view kWhitespace = " \t\r";

    std::string_view Trim(std::string_view s)
    {
      const auto b = s.find_first_not_of(kWhitespace);
      if (b == std::string_view::npos)
        return {};
      const auto e = s.find_last_not_of(kWhitespace);
      return s.substr(b, e - b + 1);
    }

    // Splits off the next whitespace-delimited token.
    std::string_view NextToken(std::string_view &rest)
    {
      rest = Trim(rest);
      const auto end = rest.find_first_of(kWhitespace);
      std::string_view token = rest.substr(0, end);
      rest = end == std::string_view::npos ? std::string_view{} : rest.substr(end);
      return token;
    }
  } // namespace

  OwnershipConvention OwnershipConvention::Default()
  {
    OwnershipConvention c;
    c.Add({"alloc", true, false});
    c.Add({"new", true, false});
    c.Add({"copy", true, false});
    c.Add({"mutableCopy", true, false});
    c.Add({"init", true, true});
    return c;
  }

  OwnershipConvention &OwnershipConvention::Add(OwnershipRule rule)
  {
    for (auto &r : m_rules)
    {
      if (r.family == rule.family)
      {
        r = std::move(rule);
        return *this;
      }
    }
    m_rules.push_back(std::move(rule));
    return *this;
  }

  const OwnershipRule *OwnershipConvention::Match(std::string_view selector) const noexcept
  {
    const OwnershipRule *best = nullptr;
    for (const auto &r : m_rules)
    {
      if (!detail::HasSelectorFamily(selector, r.family))
        continue;
      if (!best || r.family.size() > best->family.size())
        best = &r;
    }
    return best;
  }

  Expected<OwnershipConvention> OwnershipConvention::Parse(std::string_view text)
  {
    OwnershipConvention c;
    bool sawVersion = false;

    while (!text.empty())
    {
      const auto nl = text.find('\n');
      std::string_view line = text.substr(0, nl);
      text = nl == std::string_view::npos ? std::string_view{} : text.substr(nl + 1);

      if (const auto hash = line.find('#'); hash != std::string_view::npos)
        line = line.substr(0, hash);
      line = Trim(line);
      if (line.empty())
        continue;

      std::string_view rest = line;
      const std::string_view directive = NextToken(rest);

      if (directive == "version")
      {
        const std::string_view number = NextToken(rest);
        NGIN::UInt32 version = 0;
        auto [ptr, ec] = std::from_chars(number.data(), number.data() + number.size(), version);
        if (ec != std::errc{} || ptr != number.data() + number.size() || !Trim(rest).empty())
          return std::unexpected(Error{ErrorCode::InvalidArgument, "malformed version directive", std::string{line}});
        if (version != CurrentVersion)
          return std::unexpected(Error{ErrorCode::InvalidArgument, "unsupported ownership table version", std::string{number}});
        c.m_version = version;
        sawVersion = true;
        continue;
      }

      if (!sawVersion)
        return std::unexpected(Error{ErrorCode::InvalidArgument, "ownership table must start with a version directive", std::string{line}});

      if (directive != "family")
        return std::unexpected(Error{ErrorCode::InvalidArgument, "unknown ownership directive", std::string{directive}});

      OwnershipRule rule;
      rule.family = std::string{NextToken(rest)};
      if (rule.family.empty())
        return std::unexpected(Error{ErrorCode::InvalidArgument, "family directive without a name", std::string{line}});

      for (std::string_view flag = NextToken(rest); !flag.empty(); flag = NextToken(rest))
      {
        if (flag == "returns-owned")
          rule.returnsOwned = true;
        else if (flag == "returns-borrowed")
          rule.returnsOwned = false;
        else if (flag == "consumes-receiver")
          rule.consumesReceiver = true;
        else
          return std::unexpected(Error{ErrorCode::InvalidArgument, "unknown ownership flag", std::string{flag}});
      }
      c.Add(std::move(rule));
    }

    if (!sawVersion)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "ownership table has no version directive"});
    return c;
  }

} // namespace ObjBridge
