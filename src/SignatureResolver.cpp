#include <ObjBridge/SignatureResolver.hpp>
#include <ObjBridge/Log.hpp>
#include <ObjBridge/SelectorUtils.hpp>

namespace ObjBridge
{
  namespace
  {
    Expected<ResolvedSignature> FromEntry(const MethodEntry &entry)
    {
      if (!entry.signature)
      {
        Error e = entry.signature.error();
        e.subject = entry.owner + " " + entry.selector + " \"" + entry.encoding + "\"";
        return std::unexpected(std::move(e));
      }
      return ResolvedSignature{*entry.signature, false, entry.owner};
    }
  } // namespace

  SignatureResolver::SignatureResolver(MetadataCache &cache, FallbackPolicy policy)
      : m_cache(&cache), m_policy(policy)
  {
  }

  MethodSignature SignatureResolver::MakeFallback(std::string_view selector)
  {
    MethodSignature sig;
    sig.returnType = TypeDescriptor::MakeObject();
    const auto n = detail::ColonCount(selector);
    sig.arguments.reserve(n);
    sig.encoding = "@@:";
    for (NGIN::UIntSize i = 0; i < n; ++i)
    {
      sig.arguments.push_back(TypeDescriptor::MakeObject());
      sig.encoding += '@';
    }
    return sig;
  }

  const MethodEntry *SignatureResolver::FindInProtocol(std::string_view protocol, std::string_view selector, bool isClassMethod,
                                                       std::set<std::string, std::less<>> &visited)
  {
    if (!visited.emplace(protocol).second)
      return nullptr;
    auto md = m_cache->ResolveProtocol(protocol);
    if (!md)
      return nullptr; // named but not registered
    if (const auto *m = m_cache->FindMethod(**md, selector, isClassMethod))
      return m;
    for (const auto &adopted : (*md)->adopted)
    {
      if (const auto *m = FindInProtocol(adopted, selector, isClassMethod, visited))
        return m;
    }
    return nullptr;
  }

  Expected<ResolvedSignature> SignatureResolver::Resolve(std::string_view className, std::string_view selector, bool isClassMethod)
  {
    std::vector<const ClassMetadata *> chain;
    std::string current{className};
    while (!current.empty())
    {
      auto cls = m_cache->ResolveClass(current);
      if (!cls)
        return std::unexpected(cls.error());
      if (const auto *m = m_cache->FindMethod(**cls, selector, isClassMethod))
        return FromEntry(*m);
      chain.push_back(*cls);
      current = (*cls)->superclassName;
    }

    // Class objects also answer the root class's instance methods.
    if (isClassMethod && !chain.empty())
    {
      if (const auto *m = m_cache->FindMethod(*chain.back(), selector, false))
        return FromEntry(*m);
    }

    std::set<std::string, std::less<>> visited;
    for (const auto *cls : chain)
    {
      for (const auto &protocol : cls->protocols)
      {
        if (const auto *m = FindInProtocol(protocol, selector, isClassMethod, visited))
          return FromEntry(*m);
      }
    }

    if (m_policy == FallbackPolicy::Reject)
      return std::unexpected(Error{ErrorCode::NoSignature, "no declared signature", std::string{selector}});

    Log().warn("no declared signature for {}[{} {}]; using generic object signature", isClassMethod ? '+' : '-', className, selector);
    return ResolvedSignature{MakeFallback(selector), true, {}};
  }

} // namespace ObjBridge
