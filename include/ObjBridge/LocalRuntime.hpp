// LocalRuntime.hpp
// In-process dynamic object runtime: classes, metaclasses, protocols, ref-counted
// instances and C-ABI method implementations reachable through LookUpImp.
#pragma once

#include <ObjBridge/Export.hpp>
#include <ObjBridge/Runtime.hpp>
#include <ObjBridge/Types.hpp>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ObjBridge
{
  class LocalRuntime;

  namespace local
  {
    struct ClassData;
    struct ProtocolData;

    enum class ObjectKind : NGIN::UInt8
    {
      Instance,
      Class,
      Protocol,
    };

    // Every object starts with this header; ivar offsets are measured from it.
    struct ObjectHeader
    {
      ClassData *isa{nullptr};
      std::atomic<long> refs{1};
      LocalRuntime *runtime{nullptr};
      ObjectKind kind{ObjectKind::Instance};
      void *owner{nullptr}; // ClassData or ProtocolData for non-instances
    };

    struct LocalMethod
    {
      std::string types;
      Imp imp{nullptr};
    };

    struct ClassData
    {
      ObjectHeader object;
      std::string name;
      ClassData *superclass{nullptr};
      ClassData *metaclass{nullptr};
      bool isMeta{false};
      std::map<std::string, LocalMethod, std::less<>> methods;
      std::vector<PropertyDescription> properties;
      std::vector<IvarDescription> ivars;
      std::vector<ProtocolData *> protocols;
      NGIN::UIntSize instanceSize{sizeof(ObjectHeader)};
    };

    struct ProtocolData
    {
      ObjectHeader object;
      std::string name;
      std::vector<ProtocolData *> adopted;
      // [required][instance]
      std::vector<MethodDescription> methods[2][2];
      std::vector<PropertyDescription> properties[2];
    };
  } // namespace local

  // Casts a typed C function to the runtime's generic implementation pointer.
  template <class Fn>
  inline Imp ToImp(Fn *fn) noexcept
  {
    return reinterpret_cast<Imp>(fn);
  }

  class OBJBRIDGE_API ClassBuilder
  {
  public:
    ClassBuilder(LocalRuntime &runtime, std::string_view name, std::string_view superclass);

    ClassBuilder &InstanceMethod(std::string_view selector, std::string_view types, Imp imp);
    ClassBuilder &ClassMethod(std::string_view selector, std::string_view types, Imp imp);
    ClassBuilder &Ivar(std::string_view name, std::string_view typeEncoding);
    ClassBuilder &Property(std::string_view name, std::string_view attributes);
    ClassBuilder &Adopt(std::string_view protocol);

    // Publishes the class. Fails on a duplicate name, a missing superclass or protocol,
    // or an undecodable ivar type.
    Expected<ClassId> Register();

  private:
    LocalRuntime *m_runtime;
    std::string m_super;
    std::vector<std::string> m_adopt;
    std::vector<std::pair<std::string, std::string>> m_ivars;
    std::unique_ptr<local::ClassData> m_class;
    std::unique_ptr<local::ClassData> m_meta;
  };

  class OBJBRIDGE_API ProtocolBuilder
  {
  public:
    ProtocolBuilder(LocalRuntime &runtime, std::string_view name);

    ProtocolBuilder &Method(std::string_view selector, std::string_view types, bool required = true, bool instanceMethod = true);
    ProtocolBuilder &Property(std::string_view name, std::string_view attributes, bool required = true);
    ProtocolBuilder &Adopt(std::string_view protocol);

    Expected<ProtocolId> Register();

  private:
    LocalRuntime *m_runtime;
    std::vector<std::string> m_adopt;
    std::unique_ptr<local::ProtocolData> m_protocol;
  };

  class OBJBRIDGE_API LocalRuntime final : public ObjectRuntime
  {
  public:
    // Installs the root class "Object" with alloc/new/init/retain/release/retainCount/
    // class/isKindOfClass:/respondsToSelector:/conformsToProtocol:.
    LocalRuntime();
    ~LocalRuntime() override;

    LocalRuntime(const LocalRuntime &) = delete;
    LocalRuntime &operator=(const LocalRuntime &) = delete;

    [[nodiscard]] ClassBuilder DefineClass(std::string_view name, std::string_view superclass = "Object");
    [[nodiscard]] ProtocolBuilder DefineProtocol(std::string_view name);

    // New instance with a reference count of one and zeroed ivars.
    [[nodiscard]] ObjectId CreateInstance(ClassId cls);
    [[nodiscard]] long RetainCount(ObjectId object) const;
    [[nodiscard]] NGIN::UInt64 DeallocatedCount() const noexcept { return m_deallocated.load(std::memory_order_relaxed); }

    // Replaces an instance's class; the two classes must share the ivar layout.
    void SetClass(ObjectId object, ClassId cls);

    // Records a foreign exception for the calling thread; implementations call this
    // and return normally.
    void Raise(std::string reason);

    void SetAffinityThread(std::optional<std::thread::id> thread);

    [[nodiscard]] static LocalRuntime &Of(ObjectId object) noexcept;

    // Address of an ivar inside `object`, or null when the class chain has no such ivar.
    [[nodiscard]] void *IvarAddress(ObjectId object, std::string_view name) const;

    template <class T>
    [[nodiscard]] T *Ivar(ObjectId object, std::string_view name) const
    {
      return static_cast<T *>(IvarAddress(object, name));
    }

    // ObjectRuntime
    [[nodiscard]] ClassId FindClass(std::string_view name) const override;
    [[nodiscard]] std::string ClassName(ClassId cls) const override;
    [[nodiscard]] ClassId SuperclassOf(ClassId cls) const override;
    [[nodiscard]] std::vector<MethodDescription> CopyMethodList(ClassId cls, bool classMethods) const override;
    [[nodiscard]] std::vector<PropertyDescription> CopyPropertyList(ClassId cls) const override;
    [[nodiscard]] std::vector<IvarDescription> CopyIvarList(ClassId cls) const override;
    [[nodiscard]] std::vector<ProtocolId> CopyProtocolList(ClassId cls) const override;

    [[nodiscard]] ProtocolId FindProtocol(std::string_view name) const override;
    [[nodiscard]] std::string ProtocolName(ProtocolId protocol) const override;
    [[nodiscard]] std::vector<MethodDescription> CopyProtocolMethods(ProtocolId protocol, bool required, bool instanceMethods) const override;
    [[nodiscard]] std::vector<PropertyDescription> CopyProtocolProperties(ProtocolId protocol, bool required) const override;
    [[nodiscard]] std::vector<ProtocolId> CopyAdoptedProtocols(ProtocolId protocol) const override;

    [[nodiscard]] ClassId ClassOf(ObjectId object) const override;
    [[nodiscard]] bool IsClassObject(ObjectId object) const override;
    [[nodiscard]] bool IsProtocolObject(ObjectId object) const override;
    void Retain(ObjectId object) override;
    void Release(ObjectId object) override;

    [[nodiscard]] SelectorId RegisterSelector(std::string_view name) override;
    [[nodiscard]] std::string_view SelectorName(SelectorId selector) const override;
    [[nodiscard]] Imp LookUpImp(ObjectId receiver, SelectorId selector) const override;

    [[nodiscard]] std::optional<std::string> TakePendingException() override;
    [[nodiscard]] std::optional<std::thread::id> AffinityThread() const override;

    // Superclass-chain test used by the root class's isKindOfClass:.
    [[nodiscard]] bool IsKindOf(ObjectId object, ClassId cls) const;
    [[nodiscard]] bool Conforms(ClassId cls, ProtocolId protocol) const;

  private:
    friend class ClassBuilder;
    friend class ProtocolBuilder;

    Expected<ClassId> Publish(std::unique_ptr<local::ClassData> cls, std::unique_ptr<local::ClassData> meta,
                              std::string_view superclass, const std::vector<std::string> &adopt,
                              const std::vector<std::pair<std::string, std::string>> &ivars);
    Expected<ProtocolId> Publish(std::unique_ptr<local::ProtocolData> protocol, const std::vector<std::string> &adopt);

    void InstallRootClass();

    [[nodiscard]] const local::ClassData *LookUpClassLocked(std::string_view name) const;

    mutable std::shared_mutex m_mutex;
    std::vector<std::unique_ptr<local::ClassData>> m_classStorage;
    std::vector<std::unique_ptr<local::ProtocolData>> m_protocolStorage;
    std::map<std::string, local::ClassData *, std::less<>> m_classes;
    std::map<std::string, local::ProtocolData *, std::less<>> m_protocols;
    std::set<std::string, std::less<>> m_selectors;

    mutable std::mutex m_exceptionMutex;
    std::unordered_map<std::thread::id, std::string> m_pending;
    std::optional<std::thread::id> m_affinity;

    std::atomic<NGIN::UInt64> m_deallocated{0};
  };

} // namespace ObjBridge
