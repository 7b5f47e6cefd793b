// Log.hpp
// Library logger (spdlog), shared by every component
#pragma once

#include <ObjBridge/Export.hpp>

#include <spdlog/spdlog.h>

#include <memory>

namespace ObjBridge
{
  // Named "objbridge"; created on first use and registered with spdlog so hosts can
  // reconfigure sinks through spdlog::get("objbridge").
  [[nodiscard]] OBJBRIDGE_API spdlog::logger &Log();

  OBJBRIDGE_API void SetLogLevel(spdlog::level::level_enum level);
} // namespace ObjBridge
