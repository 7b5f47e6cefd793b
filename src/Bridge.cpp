#include <ObjBridge/Bridge.hpp>
#include <ObjBridge/Log.hpp>
#include <ObjBridge/SelectorUtils.hpp>

#include <cstdint>
#include <map>
#include <set>
#include <vector>

namespace ObjBridge
{
  namespace
  {
    constexpr NGIN::UIntSize kMaxProtocolDepth = 64;

    const PropertyEntry *FindDeclaredProperty(const ProtocolMetadata &protocol, std::string_view name)
    {
      for (const auto &p : protocol.members.properties)
        if (p.name == name)
          return &p;
      return nullptr;
    }
  } // namespace

  Bridge::Bridge(ObjectRuntime &runtime, BridgeOptions options)
      : m_runtime(&runtime),
        m_options(std::move(options)),
        m_cache(runtime),
        m_resolver(m_cache, m_options.fallbackPolicy),
        m_marshaller(*this),
        m_engine(runtime, m_marshaller, m_options.ownership)
  {
    if (m_options.logLevel)
      SetLogLevel(*m_options.logLevel);
    m_marshaller.SetAutoBoxing(m_options.autoBoxing);
    RegisterDefaultBoxing();
  }

  Bridge::~Bridge() = default;

  Expected<ProxyHandle> Bridge::ResolveClass(std::string_view name)
  {
    auto md = m_cache.ResolveClass(name);
    if (!md)
      return std::unexpected(md.error());
    return Wrap((*md)->handle);
  }

  Expected<ProxyHandle> Bridge::ResolveProtocol(std::string_view name)
  {
    auto md = m_cache.ResolveProtocol(name);
    if (!md)
      return std::unexpected(md.error());
    return Wrap((*md)->handle);
  }

  ProxyHandle Bridge::Wrap(ObjectId object, Ownership ownership)
  {
    if (!object)
      return {};
    ProxyKind kind = ProxyKind::Instance;
    if (m_runtime->IsProtocolObject(object))
      kind = ProxyKind::Protocol;
    else if (m_runtime->IsClassObject(object))
      kind = ProxyKind::Class;
    const bool owned = kind == ProxyKind::Instance && ownership == Ownership::Owned;
    return ProxyHandle{this, kind, std::make_shared<ForeignRef>(*m_runtime, object, owned)};
  }

  void Bridge::RegisterDefaultBoxing()
  {
    m_marshaller.RegisterBoxing<std::string>(
        [](Bridge &b, const Any &v) -> Expected<ProxyHandle>
        {
          const Any arg{v.Cast<std::string>()};
          return b.CallFactory(b.m_options.boxing.stringClass, b.m_options.boxing.stringFactory, std::span<const Any>{&arg, 1});
        });

    m_marshaller.RegisterBoxing<const char *>(
        [](Bridge &b, const Any &v) -> Expected<ProxyHandle>
        {
          const Any arg{std::string{v.Cast<const char *>()}};
          return b.CallFactory(b.m_options.boxing.stringClass, b.m_options.boxing.stringFactory, std::span<const Any>{&arg, 1});
        });

    m_marshaller.RegisterBoxing<std::vector<Any>>(
        [](Bridge &b, const Any &v) -> Expected<ProxyHandle>
        {
          const auto &items = v.Cast<std::vector<Any>>();
          std::vector<ProxyHandle> keep;
          std::vector<ObjectId> ids;
          keep.reserve(items.size());
          ids.reserve(items.size());
          for (NGIN::UIntSize i = 0; i < items.size(); ++i)
          {
            const Any &item = items[i];
            if (detail::Holds<ProxyHandle>(item))
              keep.push_back(item.Cast<ProxyHandle>());
            else if (!item.HasValue() || detail::Holds<std::nullptr_t>(item))
              return std::unexpected(Error{ErrorCode::InvalidArgument, "collections cannot hold null"}.AtArgument(i));
            else
            {
              auto boxed = b.m_marshaller.Box(item);
              if (!boxed)
                return std::unexpected(boxed.error().AtArgument(i));
              keep.push_back(std::move(*boxed));
            }
            ids.push_back(keep.back().Id());
          }
          const Any args[2] = {Any{static_cast<void *>(ids.data())}, Any{static_cast<std::uint64_t>(ids.size())}};
          return b.CallFactory(b.m_options.boxing.arrayClass, b.m_options.boxing.arrayFactory, args);
        });

    m_marshaller.RegisterBoxing<std::map<std::string, Any>>(
        [](Bridge &b, const Any &v) -> Expected<ProxyHandle>
        {
          const auto &entries = v.Cast<std::map<std::string, Any>>();
          std::vector<ProxyHandle> keep;
          std::vector<ObjectId> keys;
          std::vector<ObjectId> objects;
          keep.reserve(entries.size() * 2);
          for (const auto &[key, value] : entries)
          {
            auto boxedKey = b.m_marshaller.Box(Any{key});
            if (!boxedKey)
              return std::unexpected(boxedKey.error());
            keys.push_back(boxedKey->Id());
            keep.push_back(std::move(*boxedKey));

            if (detail::Holds<ProxyHandle>(value))
              keep.push_back(value.Cast<ProxyHandle>());
            else if (!value.HasValue() || detail::Holds<std::nullptr_t>(value))
              return std::unexpected(Error{ErrorCode::InvalidArgument, "collections cannot hold null", key});
            else
            {
              auto boxed = b.m_marshaller.Box(value);
              if (!boxed)
                return std::unexpected(boxed.error());
              keep.push_back(std::move(*boxed));
            }
            objects.push_back(keep.back().Id());
          }
          const Any args[3] = {Any{static_cast<void *>(objects.data())}, Any{static_cast<void *>(keys.data())},
                               Any{static_cast<std::uint64_t>(objects.size())}};
          return b.CallFactory(b.m_options.boxing.dictionaryClass, b.m_options.boxing.dictionaryFactory, args);
        });
  }

  Expected<ProxyHandle> Bridge::CallFactory(std::string_view className, std::string_view factory, std::span<const Any> args)
  {
    auto cls = ResolveClass(className);
    if (!cls)
      return std::unexpected(cls.error());
    auto r = Send(*cls, factory, args);
    if (!r)
      return std::unexpected(r.error());
    if (!detail::Holds<ProxyHandle>(*r))
      return std::unexpected(Error{ErrorCode::UnsupportedType, "boxing factory did not return an object", std::string{factory}});
    return r->Cast<ProxyHandle>();
  }

  Expected<Any> Bridge::Send(const ProxyHandle &target, std::string_view selector, std::span<const Any> args)
  {
    if (!target.IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "message to an empty handle", std::string{selector}});
    if (target.Kind() == ProxyKind::Protocol)
      return std::unexpected(Error{ErrorCode::NoSuchMember, "protocols do not receive messages", std::string{selector}});
    if (!m_runtime->LookUpImp(target.Id(), m_marshaller.SelectorFor(selector)))
      return std::unexpected(Error{ErrorCode::NoSuchMember, "receiver does not respond to selector", std::string{selector}});

    const bool isClassMethod = target.Kind() == ProxyKind::Class;
    auto resolved = m_resolver.Resolve(ClassName(target), selector, isClassMethod);
    if (!resolved)
      return std::unexpected(resolved.error());
    return m_engine.Invoke(target, selector, resolved->signature, args);
  }

  Expected<Any> Bridge::SendWithSignature(const ProxyHandle &target, std::string_view selector, const MethodSignature &signature,
                                          std::span<const Any> args)
  {
    if (!target.IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "message to an empty handle", std::string{selector}});
    if (target.Kind() == ProxyKind::Protocol)
      return std::unexpected(Error{ErrorCode::NoSuchMember, "protocols do not receive messages", std::string{selector}});
    return m_engine.Invoke(target, selector, signature, args);
  }

  bool Bridge::ProtocolAdopts(ProtocolId protocol, std::string_view name, NGIN::UIntSize depth)
  {
    if (!protocol || depth > kMaxProtocolDepth)
      return false;
    if (m_runtime->ProtocolName(protocol) == name)
      return true;
    for (ProtocolId adopted : m_runtime->CopyAdoptedProtocols(protocol))
      if (ProtocolAdopts(adopted, name, depth + 1))
        return true;
    return false;
  }

  Expected<PropertyAttributes> Bridge::FindProperty(std::string_view className, std::string_view name)
  {
    auto entry = m_cache.ResolveProperty(className, name);
    if (entry)
      return (*entry)->attributes;
    if (entry.error().code != ErrorCode::NotFound || entry.error().subject != name)
      return std::unexpected(entry.error());

    // Properties declared only by an adopted protocol.
    std::set<std::string, std::less<>> visited;
    std::vector<std::string> pending;
    for (std::string current{className}; !current.empty();)
    {
      auto cls = m_cache.ResolveClass(current);
      if (!cls)
        break;
      pending.insert(pending.end(), (*cls)->protocols.begin(), (*cls)->protocols.end());
      current = (*cls)->superclassName;
    }
    while (!pending.empty())
    {
      std::string protocol = std::move(pending.back());
      pending.pop_back();
      if (!visited.insert(protocol).second)
        continue;
      auto md = m_cache.ResolveProtocol(protocol);
      if (!md)
        continue;
      if (const auto *p = FindDeclaredProperty(**md, name))
        return p->attributes;
      pending.insert(pending.end(), (*md)->adopted.begin(), (*md)->adopted.end());
    }
    return std::unexpected(Error{ErrorCode::NoSuchMember, "no such property", std::string{name}});
  }

  Expected<Any> Bridge::GetProperty(const ProxyHandle &target, std::string_view name)
  {
    if (!target.IsValid() || target.Kind() != ProxyKind::Instance)
      return std::unexpected(Error{ErrorCode::NoSuchMember, "properties live on instances", std::string{name}});
    auto attrs = FindProperty(ClassName(target), name);
    if (!attrs)
      return std::unexpected(attrs.error());
    const std::string getter = attrs->getter.empty() ? std::string{name} : attrs->getter;
    return Send(target, getter, {});
  }

  Expected<void> Bridge::SetProperty(const ProxyHandle &target, std::string_view name, const Any &value)
  {
    if (!target.IsValid() || target.Kind() != ProxyKind::Instance)
      return std::unexpected(Error{ErrorCode::NoSuchMember, "properties live on instances", std::string{name}});
    auto attrs = FindProperty(ClassName(target), name);
    if (!attrs)
      return std::unexpected(attrs.error());
    if (attrs->Has(PropertyReadOnly))
      return std::unexpected(Error{ErrorCode::InvalidArgument, "property is read-only", std::string{name}});
    const std::string setter = attrs->setter.empty() ? detail::DefaultSetter(name) : attrs->setter;
    auto r = Send(target, setter, std::span<const Any>{&value, 1});
    if (!r)
      return std::unexpected(r.error());
    return {};
  }

  Expected<Any> Bridge::GetAttribute(const ProxyHandle &target, std::string_view name)
  {
    if (!target.IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "attribute of an empty handle", std::string{name}});
    if (target.Kind() == ProxyKind::Instance)
    {
      auto attrs = FindProperty(ClassName(target), name);
      if (attrs)
      {
        const std::string getter = attrs->getter.empty() ? std::string{name} : attrs->getter;
        return Send(target, getter, {});
      }
      if (attrs.error().code != ErrorCode::NoSuchMember)
        return std::unexpected(attrs.error());
    }

    const std::string selector = detail::AttributeNameToSelector(name);
    if (detail::ColonCount(selector) == 0 && RespondsTo(target, selector))
      return Send(target, selector, {});
    return std::unexpected(Error{ErrorCode::NoSuchMember, "no such attribute", std::string{name}});
  }

  Expected<Any> Bridge::GetIvar(const ProxyHandle &target, std::string_view name)
  {
    if (!target.IsValid() || target.Kind() != ProxyKind::Instance)
      return std::unexpected(Error{ErrorCode::NoSuchMember, "instance variables live on instances", std::string{name}});
    auto entry = m_cache.ResolveIvar(ClassName(target), name);
    if (!entry)
    {
      if (entry.error().code == ErrorCode::NotFound)
        return std::unexpected(Error{ErrorCode::NoSuchMember, "no such instance variable", std::string{name}});
      return std::unexpected(entry.error());
    }
    const IvarEntry &ivar = **entry;
    if (!ivar.type)
      return std::unexpected(ivar.type.error());
    const auto *base = static_cast<const std::byte *>(target.Id());
    return m_marshaller.ReadValue(base + ivar.offset, *ivar.type, Ownership::Borrowed);
  }

  std::string Bridge::ClassName(const ProxyHandle &target)
  {
    if (!target.IsValid())
      return {};
    switch (target.Kind())
    {
      case ProxyKind::Protocol: return m_runtime->ProtocolName(target.Id());
      case ProxyKind::Class: return m_runtime->ClassName(target.Id());
      case ProxyKind::Instance: return m_runtime->ClassName(m_runtime->ClassOf(target.Id()));
    }
    return {};
  }

  bool Bridge::IsInstanceOf(const ProxyHandle &target, std::string_view classOrProtocol)
  {
    if (!target.IsValid() || target.Kind() != ProxyKind::Instance)
      return false;
    for (ClassId cls = m_runtime->ClassOf(target.Id()); cls; cls = m_runtime->SuperclassOf(cls))
      if (m_runtime->ClassName(cls) == classOrProtocol)
        return true;
    return ConformsTo(target, classOrProtocol);
  }

  bool Bridge::IsSubclassOf(const ProxyHandle &target, std::string_view className)
  {
    if (!target.IsValid() || target.Kind() != ProxyKind::Class)
      return false;
    for (ClassId cls = target.Id(); cls; cls = m_runtime->SuperclassOf(cls))
      if (m_runtime->ClassName(cls) == className)
        return true;
    return false;
  }

  bool Bridge::ConformsTo(const ProxyHandle &target, std::string_view protocolName)
  {
    if (!target.IsValid())
      return false;
    if (target.Kind() == ProxyKind::Protocol)
      return ProtocolAdopts(target.Id(), protocolName, 0);

    ClassId start = target.Kind() == ProxyKind::Class ? target.Id() : m_runtime->ClassOf(target.Id());
    for (ClassId cls = start; cls; cls = m_runtime->SuperclassOf(cls))
    {
      for (ProtocolId p : m_runtime->CopyProtocolList(cls))
        if (ProtocolAdopts(p, protocolName, 0))
          return true;
    }
    return false;
  }

  bool Bridge::RespondsTo(const ProxyHandle &target, std::string_view selector)
  {
    if (!target.IsValid() || target.Kind() == ProxyKind::Protocol || selector.empty())
      return false;
    return m_runtime->LookUpImp(target.Id(), m_marshaller.SelectorFor(selector)) != nullptr;
  }

} // namespace ObjBridge
