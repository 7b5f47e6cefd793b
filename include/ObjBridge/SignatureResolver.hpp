// SignatureResolver.hpp
// Finds the declared call signature of a selector from runtime metadata
#pragma once

#include <NGIN/Primitives.hpp>

#include <ObjBridge/Encoding.hpp>
#include <ObjBridge/Export.hpp>
#include <ObjBridge/MetadataCache.hpp>
#include <ObjBridge/Types.hpp>

#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace ObjBridge
{

  enum class FallbackPolicy : NGIN::UInt8
  {
    Generic, // synthesize an all-object signature from the selector's colon count
    Reject,  // report NoSignature
  };

  struct ResolvedSignature
  {
    MethodSignature signature;
    bool isFallback{false};
    std::string declaredBy; // class or protocol; empty for a fallback
  };

  // Lookup order: superclass chain, then the protocols adopted anywhere on that
  // chain (recursively), then the fallback policy. A declaration whose encoding
  // does not decode is reported as DecodeError and never falls back.
  class OBJBRIDGE_API SignatureResolver
  {
  public:
    explicit SignatureResolver(MetadataCache &cache, FallbackPolicy policy = FallbackPolicy::Generic);

    [[nodiscard]] Expected<ResolvedSignature> Resolve(std::string_view className, std::string_view selector, bool isClassMethod);

    void SetFallbackPolicy(FallbackPolicy policy) noexcept { m_policy = policy; }
    [[nodiscard]] FallbackPolicy Policy() const noexcept { return m_policy; }

    // Every argument and the return typed as an object reference.
    [[nodiscard]] static MethodSignature MakeFallback(std::string_view selector);

  private:
    [[nodiscard]] const MethodEntry *FindInProtocol(std::string_view protocol, std::string_view selector, bool isClassMethod,
                                                    std::set<std::string, std::less<>> &visited);

    MetadataCache *m_cache;
    FallbackPolicy m_policy;
  };

} // namespace ObjBridge
