#pragma once

#if defined(_WIN32) || defined(_WIN64)
  #if defined(OBJBRIDGE_STATIC)
    #define OBJBRIDGE_API
  #else
    #if defined(OBJBRIDGE_EXPORTS)
      #define OBJBRIDGE_API __declspec(dllexport)
    #else
      #define OBJBRIDGE_API __declspec(dllimport)
    #endif
  #endif
#else
  #define OBJBRIDGE_API __attribute__((visibility("default")))
#endif

