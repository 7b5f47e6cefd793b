#include <ObjBridge/LocalRuntime.hpp>

#include <ObjBridge/Encoding.hpp>
#include <ObjBridge/Log.hpp>

#include <algorithm>
#include <cstring>
#include <limits>
#include <new>

namespace ObjBridge
{
  namespace
  {
    using local::ClassData;
    using local::ObjectHeader;
    using local::ObjectKind;
    using local::ProtocolData;

    constexpr std::align_val_t kObjectAlign{alignof(std::max_align_t)};

    ObjectHeader *Header(ObjectId object) noexcept { return static_cast<ObjectHeader *>(object); }

    ClassData *AsClass(ClassId cls) noexcept
    {
      if (!cls || Header(cls)->kind != ObjectKind::Class)
        return nullptr;
      return static_cast<ClassData *>(Header(cls)->owner);
    }

    ProtocolData *AsProtocol(ProtocolId protocol) noexcept
    {
      if (!protocol || Header(protocol)->kind != ObjectKind::Protocol)
        return nullptr;
      return static_cast<ProtocolData *>(Header(protocol)->owner);
    }

    ClassId IdOf(ClassData *cls) noexcept { return cls ? static_cast<ClassId>(&cls->object) : nullptr; }
    ProtocolId IdOf(ProtocolData *p) noexcept { return p ? static_cast<ProtocolId>(&p->object) : nullptr; }

    NGIN::UIntSize AlignUp(NGIN::UIntSize v, NGIN::UIntSize a) { return a == 0 ? v : (v + a - 1) / a * a; }

    bool AdoptsProtocol(const ProtocolData *candidate, const ProtocolData *target)
    {
      if (candidate == target)
        return true;
      for (const auto *p : candidate->adopted)
        if (AdoptsProtocol(p, target))
          return true;
      return false;
    }

    // Root class implementations

    ObjectId RootAlloc(ObjectId self, SelectorId)
    {
      return LocalRuntime::Of(self).CreateInstance(self);
    }

    ObjectId RootNew(ObjectId self, SelectorId)
    {
      auto &rt = LocalRuntime::Of(self);
      ObjectId object = rt.CreateInstance(self);
      const SelectorId init = rt.RegisterSelector("init");
      auto imp = reinterpret_cast<ObjectId (*)(ObjectId, SelectorId)>(rt.LookUpImp(object, init));
      return imp ? imp(object, init) : object;
    }

    ObjectId RootInit(ObjectId self, SelectorId) { return self; }

    ObjectId RootRetain(ObjectId self, SelectorId)
    {
      LocalRuntime::Of(self).Retain(self);
      return self;
    }

    void RootRelease(ObjectId self, SelectorId) { LocalRuntime::Of(self).Release(self); }

    NGIN::UInt64 RootRetainCount(ObjectId self, SelectorId)
    {
      return static_cast<NGIN::UInt64>(LocalRuntime::Of(self).RetainCount(self));
    }

    ClassId RootInstanceClass(ObjectId self, SelectorId) { return LocalRuntime::Of(self).ClassOf(self); }

    ClassId RootClassClass(ObjectId self, SelectorId) { return self; }

    bool RootIsKindOfClass(ObjectId self, SelectorId, ClassId cls) { return LocalRuntime::Of(self).IsKindOf(self, cls); }

    bool RootRespondsToSelector(ObjectId self, SelectorId, SelectorId selector)
    {
      return selector && LocalRuntime::Of(self).LookUpImp(self, selector) != nullptr;
    }

    bool RootConformsToProtocol(ObjectId self, SelectorId, ObjectId protocol)
    {
      auto &rt = LocalRuntime::Of(self);
      ClassId cls = rt.IsClassObject(self) ? self : rt.ClassOf(self);
      return rt.Conforms(cls, protocol);
    }
  } // namespace

  // ClassBuilder

  ClassBuilder::ClassBuilder(LocalRuntime &runtime, std::string_view name, std::string_view superclass)
      : m_runtime(&runtime), m_super(superclass), m_class(std::make_unique<ClassData>()), m_meta(std::make_unique<ClassData>())
  {
    m_class->name = std::string{name};
    m_meta->name = std::string{name};
    m_meta->isMeta = true;
  }

  ClassBuilder &ClassBuilder::InstanceMethod(std::string_view selector, std::string_view types, Imp imp)
  {
    m_class->methods.insert_or_assign(std::string{selector}, local::LocalMethod{std::string{types}, imp});
    return *this;
  }

  ClassBuilder &ClassBuilder::ClassMethod(std::string_view selector, std::string_view types, Imp imp)
  {
    m_meta->methods.insert_or_assign(std::string{selector}, local::LocalMethod{std::string{types}, imp});
    return *this;
  }

  ClassBuilder &ClassBuilder::Ivar(std::string_view name, std::string_view typeEncoding)
  {
    m_ivars.emplace_back(std::string{name}, std::string{typeEncoding});
    return *this;
  }

  ClassBuilder &ClassBuilder::Property(std::string_view name, std::string_view attributes)
  {
    m_class->properties.push_back(PropertyDescription{std::string{name}, std::string{attributes}});
    return *this;
  }

  ClassBuilder &ClassBuilder::Adopt(std::string_view protocol)
  {
    m_adopt.emplace_back(protocol);
    return *this;
  }

  Expected<ClassId> ClassBuilder::Register()
  {
    if (!m_class)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "class already registered"});
    return m_runtime->Publish(std::move(m_class), std::move(m_meta), m_super, m_adopt, m_ivars);
  }

  // ProtocolBuilder

  ProtocolBuilder::ProtocolBuilder(LocalRuntime &runtime, std::string_view name)
      : m_runtime(&runtime), m_protocol(std::make_unique<ProtocolData>())
  {
    m_protocol->name = std::string{name};
  }

  ProtocolBuilder &ProtocolBuilder::Method(std::string_view selector, std::string_view types, bool required, bool instanceMethod)
  {
    m_protocol->methods[required ? 1 : 0][instanceMethod ? 1 : 0].push_back(MethodDescription{std::string{selector}, std::string{types}});
    return *this;
  }

  ProtocolBuilder &ProtocolBuilder::Property(std::string_view name, std::string_view attributes, bool required)
  {
    m_protocol->properties[required ? 1 : 0].push_back(PropertyDescription{std::string{name}, std::string{attributes}});
    return *this;
  }

  ProtocolBuilder &ProtocolBuilder::Adopt(std::string_view protocol)
  {
    m_adopt.emplace_back(protocol);
    return *this;
  }

  Expected<ProtocolId> ProtocolBuilder::Register()
  {
    if (!m_protocol)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "protocol already registered"});
    return m_runtime->Publish(std::move(m_protocol), m_adopt);
  }

  // LocalRuntime

  LocalRuntime::LocalRuntime()
  {
    InstallRootClass();
  }

  LocalRuntime::~LocalRuntime() = default;

  void LocalRuntime::InstallRootClass()
  {
    ClassBuilder b{*this, "Object", ""};
    b.ClassMethod("alloc", "@16#0:8", ToImp(&RootAlloc))
        .ClassMethod("new", "@16#0:8", ToImp(&RootNew))
        .ClassMethod("class", "#16#0:8", ToImp(&RootClassClass))
        .InstanceMethod("init", "@16@0:8", ToImp(&RootInit))
        .InstanceMethod("retain", "@16@0:8", ToImp(&RootRetain))
        .InstanceMethod("release", "Vv16@0:8", ToImp(&RootRelease))
        .InstanceMethod("retainCount", "Q16@0:8", ToImp(&RootRetainCount))
        .InstanceMethod("class", "#16@0:8", ToImp(&RootInstanceClass))
        .InstanceMethod("isKindOfClass:", "B24@0:8#16", ToImp(&RootIsKindOfClass))
        .InstanceMethod("respondsToSelector:", "B24@0:8:16", ToImp(&RootRespondsToSelector))
        .InstanceMethod("conformsToProtocol:", "B24@0:8@16", ToImp(&RootConformsToProtocol));
    auto root = b.Register();
    if (!root)
      Log().error("root class installation failed: {}", root.error().Describe());
  }

  ClassBuilder LocalRuntime::DefineClass(std::string_view name, std::string_view superclass)
  {
    return ClassBuilder{*this, name, superclass};
  }

  ProtocolBuilder LocalRuntime::DefineProtocol(std::string_view name)
  {
    return ProtocolBuilder{*this, name};
  }

  Expected<ClassId> LocalRuntime::Publish(std::unique_ptr<ClassData> cls, std::unique_ptr<ClassData> meta,
                                          std::string_view superclass, const std::vector<std::string> &adopt,
                                          const std::vector<std::pair<std::string, std::string>> &ivars)
  {
    std::unique_lock lock{m_mutex};
    if (m_classes.find(cls->name) != m_classes.end())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "class already defined", cls->name});

    ClassData *super = nullptr;
    if (!superclass.empty())
    {
      auto it = m_classes.find(superclass);
      if (it == m_classes.end())
        return std::unexpected(Error{ErrorCode::NotFound, "superclass not found", std::string{superclass}});
      super = it->second;
    }

    for (const auto &name : adopt)
    {
      auto it = m_protocols.find(name);
      if (it == m_protocols.end())
        return std::unexpected(Error{ErrorCode::NotFound, "protocol not found", name});
      cls->protocols.push_back(it->second);
    }

    NGIN::UIntSize size = super ? super->instanceSize : sizeof(ObjectHeader);
    for (const auto &[name, type] : ivars)
    {
      auto t = Decode(type);
      if (!t)
        return std::unexpected(t.error());
      const auto offset = AlignUp(size, std::max<NGIN::UIntSize>(t->Alignment(), 1));
      cls->ivars.push_back(IvarDescription{name, type, static_cast<std::ptrdiff_t>(offset)});
      size = offset + t->Size();
    }
    cls->instanceSize = size;

    cls->superclass = super;
    meta->superclass = super ? super->metaclass : cls.get();
    cls->metaclass = meta.get();

    // Metaclasses are instances of the root metaclass.
    ClassData *rootMeta = meta.get();
    for (ClassData *c = super; c; c = c->superclass)
      rootMeta = c->metaclass;

    cls->object.isa = meta.get();
    cls->object.runtime = this;
    cls->object.kind = ObjectKind::Class;
    cls->object.owner = cls.get();
    meta->object.isa = rootMeta;
    meta->object.runtime = this;
    meta->object.kind = ObjectKind::Class;
    meta->object.owner = meta.get();

    ClassData *published = cls.get();
    m_classes.emplace(published->name, published);
    m_classStorage.push_back(std::move(cls));
    m_classStorage.push_back(std::move(meta));
    Log().debug("local runtime: registered class {}", published->name);
    return IdOf(published);
  }

  Expected<ProtocolId> LocalRuntime::Publish(std::unique_ptr<ProtocolData> protocol, const std::vector<std::string> &adopt)
  {
    std::unique_lock lock{m_mutex};
    if (m_protocols.find(protocol->name) != m_protocols.end())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "protocol already defined", protocol->name});
    for (const auto &name : adopt)
    {
      auto it = m_protocols.find(name);
      if (it == m_protocols.end())
        return std::unexpected(Error{ErrorCode::NotFound, "protocol not found", name});
      protocol->adopted.push_back(it->second);
    }
    protocol->object.runtime = this;
    protocol->object.kind = ObjectKind::Protocol;
    protocol->object.owner = protocol.get();

    ProtocolData *published = protocol.get();
    m_protocols.emplace(published->name, published);
    m_protocolStorage.push_back(std::move(protocol));
    return IdOf(published);
  }

  ObjectId LocalRuntime::CreateInstance(ClassId cls)
  {
    ClassData *data = AsClass(cls);
    if (!data || data->isMeta)
      return nullptr;
    void *memory = ::operator new(data->instanceSize, kObjectAlign);
    std::memset(memory, 0, data->instanceSize);
    auto *header = ::new (memory) ObjectHeader{};
    header->isa = data;
    header->refs.store(1, std::memory_order_relaxed);
    header->runtime = this;
    header->kind = ObjectKind::Instance;
    return memory;
  }

  long LocalRuntime::RetainCount(ObjectId object) const
  {
    if (!object)
      return 0;
    const auto *header = Header(object);
    if (header->kind != ObjectKind::Instance)
      return std::numeric_limits<long>::max();
    return header->refs.load(std::memory_order_acquire);
  }

  void LocalRuntime::SetClass(ObjectId object, ClassId cls)
  {
    ClassData *data = AsClass(cls);
    if (!object || !data || Header(object)->kind != ObjectKind::Instance)
      return;
    Header(object)->isa = data;
  }

  void LocalRuntime::Raise(std::string reason)
  {
    std::lock_guard lock{m_exceptionMutex};
    m_pending[std::this_thread::get_id()] = std::move(reason);
  }

  void LocalRuntime::SetAffinityThread(std::optional<std::thread::id> thread)
  {
    std::lock_guard lock{m_exceptionMutex};
    m_affinity = thread;
  }

  LocalRuntime &LocalRuntime::Of(ObjectId object) noexcept
  {
    return *Header(object)->runtime;
  }

  void *LocalRuntime::IvarAddress(ObjectId object, std::string_view name) const
  {
    if (!object || Header(object)->kind != ObjectKind::Instance)
      return nullptr;
    std::shared_lock lock{m_mutex};
    for (const ClassData *c = Header(object)->isa; c; c = c->superclass)
    {
      for (const auto &ivar : c->ivars)
        if (ivar.name == name)
          return static_cast<std::byte *>(object) + ivar.offset;
    }
    return nullptr;
  }

  const ClassData *LocalRuntime::LookUpClassLocked(std::string_view name) const
  {
    auto it = m_classes.find(name);
    return it == m_classes.end() ? nullptr : it->second;
  }

  ClassId LocalRuntime::FindClass(std::string_view name) const
  {
    std::shared_lock lock{m_mutex};
    return IdOf(const_cast<ClassData *>(LookUpClassLocked(name)));
  }

  std::string LocalRuntime::ClassName(ClassId cls) const
  {
    const ClassData *data = AsClass(cls);
    return data ? data->name : std::string{};
  }

  ClassId LocalRuntime::SuperclassOf(ClassId cls) const
  {
    const ClassData *data = AsClass(cls);
    return data ? IdOf(data->superclass) : nullptr;
  }

  std::vector<MethodDescription> LocalRuntime::CopyMethodList(ClassId cls, bool classMethods) const
  {
    std::vector<MethodDescription> out;
    const ClassData *data = AsClass(cls);
    if (!data)
      return out;
    if (classMethods && !data->isMeta)
      data = data->metaclass;
    std::shared_lock lock{m_mutex};
    out.reserve(data->methods.size());
    for (const auto &[selector, method] : data->methods)
      out.push_back(MethodDescription{selector, method.types});
    return out;
  }

  std::vector<PropertyDescription> LocalRuntime::CopyPropertyList(ClassId cls) const
  {
    const ClassData *data = AsClass(cls);
    return data ? data->properties : std::vector<PropertyDescription>{};
  }

  std::vector<IvarDescription> LocalRuntime::CopyIvarList(ClassId cls) const
  {
    const ClassData *data = AsClass(cls);
    return data ? data->ivars : std::vector<IvarDescription>{};
  }

  std::vector<ProtocolId> LocalRuntime::CopyProtocolList(ClassId cls) const
  {
    std::vector<ProtocolId> out;
    if (const ClassData *data = AsClass(cls))
    {
      for (auto *p : data->protocols)
        out.push_back(IdOf(p));
    }
    return out;
  }

  ProtocolId LocalRuntime::FindProtocol(std::string_view name) const
  {
    std::shared_lock lock{m_mutex};
    auto it = m_protocols.find(name);
    return it == m_protocols.end() ? nullptr : IdOf(it->second);
  }

  std::string LocalRuntime::ProtocolName(ProtocolId protocol) const
  {
    const ProtocolData *p = AsProtocol(protocol);
    return p ? p->name : std::string{};
  }

  std::vector<MethodDescription> LocalRuntime::CopyProtocolMethods(ProtocolId protocol, bool required, bool instanceMethods) const
  {
    const ProtocolData *p = AsProtocol(protocol);
    return p ? p->methods[required ? 1 : 0][instanceMethods ? 1 : 0] : std::vector<MethodDescription>{};
  }

  std::vector<PropertyDescription> LocalRuntime::CopyProtocolProperties(ProtocolId protocol, bool required) const
  {
    const ProtocolData *p = AsProtocol(protocol);
    return p ? p->properties[required ? 1 : 0] : std::vector<PropertyDescription>{};
  }

  std::vector<ProtocolId> LocalRuntime::CopyAdoptedProtocols(ProtocolId protocol) const
  {
    std::vector<ProtocolId> out;
    if (const ProtocolData *p = AsProtocol(protocol))
    {
      for (auto *a : p->adopted)
        out.push_back(IdOf(a));
    }
    return out;
  }

  ClassId LocalRuntime::ClassOf(ObjectId object) const
  {
    if (!object || Header(object)->kind == ObjectKind::Protocol)
      return nullptr;
    return IdOf(Header(object)->isa);
  }

  bool LocalRuntime::IsClassObject(ObjectId object) const
  {
    return object && Header(object)->kind == ObjectKind::Class;
  }

  bool LocalRuntime::IsProtocolObject(ObjectId object) const
  {
    return object && Header(object)->kind == ObjectKind::Protocol;
  }

  void LocalRuntime::Retain(ObjectId object)
  {
    if (!object || Header(object)->kind != ObjectKind::Instance)
      return;
    Header(object)->refs.fetch_add(1, std::memory_order_relaxed);
  }

  void LocalRuntime::Release(ObjectId object)
  {
    if (!object || Header(object)->kind != ObjectKind::Instance)
      return;
    auto *header = Header(object);
    if (header->refs.fetch_sub(1, std::memory_order_acq_rel) == 1)
    {
      header->~ObjectHeader();
      ::operator delete(object, kObjectAlign);
      m_deallocated.fetch_add(1, std::memory_order_relaxed);
    }
  }

  SelectorId LocalRuntime::RegisterSelector(std::string_view name)
  {
    {
      std::shared_lock lock{m_mutex};
      auto it = m_selectors.find(name);
      if (it != m_selectors.end())
        return &*it;
    }
    std::unique_lock lock{m_mutex};
    auto [it, inserted] = m_selectors.emplace(name);
    return &*it;
  }

  std::string_view LocalRuntime::SelectorName(SelectorId selector) const
  {
    if (!selector)
      return {};
    return *static_cast<const std::string *>(selector);
  }

  Imp LocalRuntime::LookUpImp(ObjectId receiver, SelectorId selector) const
  {
    if (!receiver || !selector || Header(receiver)->kind == ObjectKind::Protocol)
      return nullptr;
    const std::string_view name = SelectorName(selector);
    std::shared_lock lock{m_mutex};
    for (const ClassData *c = Header(receiver)->isa; c; c = c->superclass)
    {
      auto it = c->methods.find(name);
      if (it != c->methods.end())
        return it->second.imp;
    }
    return nullptr;
  }

  std::optional<std::string> LocalRuntime::TakePendingException()
  {
    std::lock_guard lock{m_exceptionMutex};
    auto it = m_pending.find(std::this_thread::get_id());
    if (it == m_pending.end())
      return std::nullopt;
    std::string reason = std::move(it->second);
    m_pending.erase(it);
    return reason;
  }

  std::optional<std::thread::id> LocalRuntime::AffinityThread() const
  {
    std::lock_guard lock{m_exceptionMutex};
    return m_affinity;
  }

  bool LocalRuntime::IsKindOf(ObjectId object, ClassId cls) const
  {
    const ClassData *target = AsClass(cls);
    if (!object || !target)
      return false;
    for (const ClassData *c = Header(object)->isa; c; c = c->superclass)
      if (c == target)
        return true;
    return false;
  }

  bool LocalRuntime::Conforms(ClassId cls, ProtocolId protocol) const
  {
    const ProtocolData *target = AsProtocol(protocol);
    if (!target)
      return false;
    for (const ClassData *c = AsClass(cls); c; c = c->superclass)
    {
      for (const auto *p : c->protocols)
        if (AdoptsProtocol(p, target))
          return true;
    }
    return false;
  }

} // namespace ObjBridge
