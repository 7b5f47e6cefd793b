// Convert.hpp
// Any -> T conversion used by the typed call helpers
#pragma once

#include <NGIN/Primitives.hpp>

#include <ObjBridge/Types.hpp>

#include <cstdint>
#include <expected>
#include <type_traits>

namespace ObjBridge::detail
{

  template <class T>
  inline constexpr bool is_numeric_v = std::is_arithmetic_v<std::remove_cv_t<std::remove_reference_t<T>>>;

  // Exact match, or any arithmetic result converted to an arithmetic target.
  // Foreign integers arrive as std::int64_t/std::uint64_t and floats as
  // float/double/long double, so numeric targets go through this path.
  template <class To>
  inline Expected<std::remove_cv_t<std::remove_reference_t<To>>> ConvertAny(const Any &src)
  {
    using Dest = std::remove_cv_t<std::remove_reference_t<To>>;
    const auto tid = src.GetTypeId();
    if (tid == TypeIdOf<Dest>())
      return src.template Cast<Dest>();
    if constexpr (is_numeric_v<Dest>)
    {
      if (tid == TypeIdOf<bool>())
        return static_cast<Dest>(src.template Cast<bool>());
      if (tid == TypeIdOf<std::int64_t>())
        return static_cast<Dest>(src.template Cast<std::int64_t>());
      if (tid == TypeIdOf<std::uint64_t>())
        return static_cast<Dest>(src.template Cast<std::uint64_t>());
      if (tid == TypeIdOf<int>())
        return static_cast<Dest>(src.template Cast<int>());
      if (tid == TypeIdOf<unsigned int>())
        return static_cast<Dest>(src.template Cast<unsigned int>());
      if (tid == TypeIdOf<float>())
        return static_cast<Dest>(src.template Cast<float>());
      if (tid == TypeIdOf<double>())
        return static_cast<Dest>(src.template Cast<double>());
      if (tid == TypeIdOf<long double>())
        return static_cast<Dest>(src.template Cast<long double>());
    }
    return std::unexpected(Error{ErrorCode::InvalidArgument, "result type not convertible"});
  }

} // namespace ObjBridge::detail
