#include <ObjBridge/MetadataCache.hpp>
#include <ObjBridge/Log.hpp>
#include <ObjBridge/SelectorUtils.hpp>

#include <cstdlib>

namespace ObjBridge
{
  namespace
  {
    constexpr NameId InvalidNameId = static_cast<NameId>(detail::MetadataInterner::INVALID_ID);

    MethodEntry MakeMethodEntry(const MethodDescription &desc, std::string_view owner, bool isClassMethod, bool isRequired)
    {
      MethodEntry e;
      e.selector = desc.selector;
      e.owner = std::string{owner};
      e.encoding = desc.typeEncoding;
      e.isClassMethod = isClassMethod;
      e.isRequired = isRequired;
      e.signature = DecodeMethodEncoding(desc.typeEncoding, detail::ColonCount(desc.selector));
      if (!e.signature)
        Log().warn("undecodable method encoding {}[{} {}]: {}", isClassMethod ? '+' : '-', owner, desc.selector,
                   e.signature.error().Describe());
      return e;
    }

    PropertyEntry MakePropertyEntry(const PropertyDescription &desc, std::string_view owner, bool isRequired)
    {
      PropertyEntry e;
      e.name = desc.name;
      e.owner = std::string{owner};
      e.attributeString = desc.attributes;
      e.isRequired = isRequired;
      e.attributes = DecodePropertyAttributes(desc.attributes);
      if (!e.attributes)
        Log().warn("undecodable property attributes {}.{}: {}", owner, desc.name, e.attributes.error().Describe());
      return e;
    }
  } // namespace

  MetadataCache::MetadataCache(ObjectRuntime &runtime)
      : m_runtime(&runtime)
  {
  }

  MetadataCache::~MetadataCache() = default;

  std::mutex &MetadataCache::CommitGate(std::map<std::string, std::unique_ptr<std::mutex>, std::less<>> &gates, std::string_view name)
  {
    std::lock_guard lock{m_gateMutex};
    auto it = gates.find(name);
    if (it == gates.end())
      it = gates.emplace(std::string{name}, std::make_unique<std::mutex>()).first;
    return *it->second;
  }

  NameId MetadataCache::FindNameLocked(std::string_view name) const
  {
    detail::MetadataInterner::IdType id{};
    if (!m_names.TryGetId(name, id))
      return InvalidNameId;
    return static_cast<NameId>(id);
  }

  const ClassMetadata *MetadataCache::FindClassLocked(std::string_view name) const
  {
    const NameId id = FindNameLocked(name);
    if (id == InvalidNameId)
      return nullptr;
    if (auto *p = m_classIndex.GetPtr(id))
      return m_classes[*p].get();
    return nullptr;
  }

  const ProtocolMetadata *MetadataCache::FindProtocolLocked(std::string_view name) const
  {
    const NameId id = FindNameLocked(name);
    if (id == InvalidNameId)
      return nullptr;
    if (auto *p = m_protocolIndex.GetPtr(id))
      return m_protocols[*p].get();
    return nullptr;
  }

  Expected<const ClassMetadata *> MetadataCache::ResolveClass(std::string_view name)
  {
    {
      std::shared_lock lock{m_mutex};
      if (const auto *md = FindClassLocked(name))
      {
        m_hits.fetch_add(1, std::memory_order_relaxed);
        return md;
      }
    }

    // One introspection per name; latecomers wait here and then find the committed entry.
    std::lock_guard gate{CommitGate(m_classGates, name)};
    {
      std::shared_lock lock{m_mutex};
      if (const auto *md = FindClassLocked(name))
      {
        m_hits.fetch_add(1, std::memory_order_relaxed);
        return md;
      }
    }

    m_misses.fetch_add(1, std::memory_order_relaxed);
    ClassId cls = m_runtime->FindClass(name);
    if (!cls)
      return std::unexpected(Error{ErrorCode::NotFound, "class not found", std::string{name}});

    auto md = IntrospectClass(cls, name);
    m_classDecodes.fetch_add(1, std::memory_order_relaxed);
    return Commit(std::move(md));
  }

  Expected<const ProtocolMetadata *> MetadataCache::ResolveProtocol(std::string_view name)
  {
    {
      std::shared_lock lock{m_mutex};
      if (const auto *md = FindProtocolLocked(name))
      {
        m_hits.fetch_add(1, std::memory_order_relaxed);
        return md;
      }
    }

    std::lock_guard gate{CommitGate(m_protocolGates, name)};
    {
      std::shared_lock lock{m_mutex};
      if (const auto *md = FindProtocolLocked(name))
      {
        m_hits.fetch_add(1, std::memory_order_relaxed);
        return md;
      }
    }

    m_misses.fetch_add(1, std::memory_order_relaxed);
    ProtocolId protocol = m_runtime->FindProtocol(name);
    if (!protocol)
      return std::unexpected(Error{ErrorCode::NotFound, "protocol not found", std::string{name}});

    auto md = IntrospectProtocol(protocol, name);
    m_protocolDecodes.fetch_add(1, std::memory_order_relaxed);
    return Commit(std::move(md));
  }

  std::unique_ptr<ClassMetadata> MetadataCache::IntrospectClass(ClassId cls, std::string_view name)
  {
    auto md = std::make_unique<ClassMetadata>();
    md->name = std::string{name};
    md->handle = cls;
    if (ClassId super = m_runtime->SuperclassOf(cls))
      md->superclassName = m_runtime->ClassName(super);

    for (ProtocolId p : m_runtime->CopyProtocolList(cls))
      md->protocols.push_back(m_runtime->ProtocolName(p));

    for (const auto &m : m_runtime->CopyMethodList(cls, false))
      md->members.methods.push_back(MakeMethodEntry(m, name, false, true));
    for (const auto &m : m_runtime->CopyMethodList(cls, true))
      md->members.methods.push_back(MakeMethodEntry(m, name, true, true));
    for (const auto &p : m_runtime->CopyPropertyList(cls))
      md->members.properties.push_back(MakePropertyEntry(p, name, true));

    for (const auto &iv : m_runtime->CopyIvarList(cls))
    {
      IvarEntry e;
      e.name = iv.name;
      e.owner = md->name;
      e.encoding = iv.typeEncoding;
      e.type = Decode(iv.typeEncoding);
      e.offset = iv.offset;
      md->ivars.push_back(std::move(e));
    }

    Log().debug("metadata cache: class {} ({} methods, {} properties, {} ivars)", md->name, md->members.methods.size(),
                md->members.properties.size(), md->ivars.size());
    return md;
  }

  std::unique_ptr<ProtocolMetadata> MetadataCache::IntrospectProtocol(ProtocolId protocol, std::string_view name)
  {
    auto md = std::make_unique<ProtocolMetadata>();
    md->name = std::string{name};
    md->handle = protocol;
    for (ProtocolId p : m_runtime->CopyAdoptedProtocols(protocol))
      md->adopted.push_back(m_runtime->ProtocolName(p));

    for (bool required : {true, false})
    {
      for (bool instance : {true, false})
      {
        for (const auto &m : m_runtime->CopyProtocolMethods(protocol, required, instance))
          md->members.methods.push_back(MakeMethodEntry(m, name, !instance, required));
      }
      for (const auto &p : m_runtime->CopyProtocolProperties(protocol, required))
        md->members.properties.push_back(MakePropertyEntry(p, name, required));
    }

    Log().debug("metadata cache: protocol {} ({} methods)", md->name, md->members.methods.size());
    return md;
  }

  void MetadataCache::IndexMembers(detail::MemberTables &members)
  {
    for (NGIN::UInt32 i = 0; i < members.methods.size(); ++i)
    {
      const auto &m = members.methods[i];
      const auto id = static_cast<NameId>(m_names.InsertOrGet(m.selector));
      auto &index = m.isClassMethod ? members.classMethodIndex : members.instanceMethodIndex;
      // Required declarations come first; keep the first one seen.
      if (!index.GetPtr(id))
        index.Insert(id, i);
    }
    for (NGIN::UInt32 i = 0; i < members.properties.size(); ++i)
    {
      const auto id = static_cast<NameId>(m_names.InsertOrGet(members.properties[i].name));
      if (!members.propertyIndex.GetPtr(id))
        members.propertyIndex.Insert(id, i);
    }
  }

  const ClassMetadata *MetadataCache::Commit(std::unique_ptr<ClassMetadata> cls)
  {
    std::unique_lock lock{m_mutex};
    if (FindClassLocked(cls->name))
    {
      Log().critical("metadata cache: conflicting commit for class {}", cls->name);
      std::abort();
    }
    IndexMembers(cls->members);
    for (NGIN::UInt32 i = 0; i < cls->ivars.size(); ++i)
      cls->ivarIndex.Insert(static_cast<NameId>(m_names.InsertOrGet(cls->ivars[i].name)), i);

    const auto id = static_cast<NameId>(m_names.InsertOrGet(cls->name));
    const auto slot = static_cast<NGIN::UInt32>(m_classes.size());
    m_classes.push_back(std::move(cls));
    m_classIndex.Insert(id, slot);
    return m_classes.back().get();
  }

  const ProtocolMetadata *MetadataCache::Commit(std::unique_ptr<ProtocolMetadata> protocol)
  {
    std::unique_lock lock{m_mutex};
    if (FindProtocolLocked(protocol->name))
    {
      Log().critical("metadata cache: conflicting commit for protocol {}", protocol->name);
      std::abort();
    }
    IndexMembers(protocol->members);

    const auto id = static_cast<NameId>(m_names.InsertOrGet(protocol->name));
    const auto slot = static_cast<NGIN::UInt32>(m_protocols.size());
    m_protocols.push_back(std::move(protocol));
    m_protocolIndex.Insert(id, slot);
    return m_protocols.back().get();
  }

  const MethodEntry *MetadataCache::FindMethod(const ClassMetadata &cls, std::string_view selector, bool isClassMethod) const
  {
    std::shared_lock lock{m_mutex};
    const NameId id = FindNameLocked(selector);
    if (id == InvalidNameId)
      return nullptr;
    auto &index = isClassMethod ? cls.members.classMethodIndex : cls.members.instanceMethodIndex;
    if (auto *p = index.GetPtr(id))
      return &cls.members.methods[*p];
    return nullptr;
  }

  const MethodEntry *MetadataCache::FindMethod(const ProtocolMetadata &protocol, std::string_view selector, bool isClassMethod) const
  {
    std::shared_lock lock{m_mutex};
    const NameId id = FindNameLocked(selector);
    if (id == InvalidNameId)
      return nullptr;
    auto &index = isClassMethod ? protocol.members.classMethodIndex : protocol.members.instanceMethodIndex;
    if (auto *p = index.GetPtr(id))
      return &protocol.members.methods[*p];
    return nullptr;
  }

  Expected<const MethodEntry *> MetadataCache::ResolveMethod(std::string_view className, std::string_view selector, bool isClassMethod)
  {
    std::string current{className};
    while (!current.empty())
    {
      auto cls = ResolveClass(current);
      if (!cls)
        return std::unexpected(cls.error());
      if (const auto *m = FindMethod(**cls, selector, isClassMethod))
        return m;
      current = (*cls)->superclassName;
    }
    return std::unexpected(Error{ErrorCode::NotFound, "method not declared", std::string{selector}});
  }

  Expected<const MethodEntry *> MetadataCache::ResolveProtocolMethod(std::string_view protocol, std::string_view selector, bool isClassMethod)
  {
    auto md = ResolveProtocol(protocol);
    if (!md)
      return std::unexpected(md.error());
    if (const auto *m = FindMethod(**md, selector, isClassMethod))
      return m;
    return std::unexpected(Error{ErrorCode::NotFound, "method not declared", std::string{selector}});
  }

  Expected<const PropertyEntry *> MetadataCache::ResolveProperty(std::string_view className, std::string_view name)
  {
    std::string current{className};
    while (!current.empty())
    {
      auto cls = ResolveClass(current);
      if (!cls)
        return std::unexpected(cls.error());
      {
        std::shared_lock lock{m_mutex};
        const NameId id = FindNameLocked(name);
        if (id != InvalidNameId)
        {
          if (auto *p = (*cls)->members.propertyIndex.GetPtr(id))
            return &(*cls)->members.properties[*p];
        }
      }
      current = (*cls)->superclassName;
    }
    return std::unexpected(Error{ErrorCode::NotFound, "property not declared", std::string{name}});
  }

  Expected<const IvarEntry *> MetadataCache::ResolveIvar(std::string_view className, std::string_view name)
  {
    std::string current{className};
    while (!current.empty())
    {
      auto cls = ResolveClass(current);
      if (!cls)
        return std::unexpected(cls.error());
      {
        std::shared_lock lock{m_mutex};
        const NameId id = FindNameLocked(name);
        if (id != InvalidNameId)
        {
          if (auto *p = (*cls)->ivarIndex.GetPtr(id))
            return &(*cls)->ivars[*p];
        }
      }
      current = (*cls)->superclassName;
    }
    return std::unexpected(Error{ErrorCode::NotFound, "ivar not declared", std::string{name}});
  }

  CacheStats MetadataCache::Stats() const noexcept
  {
    CacheStats s;
    s.classDecodes = m_classDecodes.load(std::memory_order_relaxed);
    s.protocolDecodes = m_protocolDecodes.load(std::memory_order_relaxed);
    s.hits = m_hits.load(std::memory_order_relaxed);
    s.misses = m_misses.load(std::memory_order_relaxed);
    return s;
  }

} // namespace ObjBridge
