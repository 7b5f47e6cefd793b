#include <ObjBridge/Log.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace ObjBridge
{
  namespace
  {
    std::shared_ptr<spdlog::logger> MakeLogger()
    {
      if (auto existing = spdlog::get("objbridge"))
        return existing;
      auto logger = spdlog::stderr_color_mt("objbridge");
      logger->set_level(spdlog::level::warn);
      return logger;
    }
  } // namespace

  spdlog::logger &Log()
  {
    static std::shared_ptr<spdlog::logger> s_logger = MakeLogger();
    return *s_logger;
  }

  void SetLogLevel(spdlog::level::level_enum level)
  {
    Log().set_level(level);
  }
} // namespace ObjBridge
