// MetadataCache.hpp
// Lazily filled, never-evicted store of decoded class and protocol metadata
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/HashMap.hpp>
#include <NGIN/Utilities/StringInterner.hpp>

#include <ObjBridge/Encoding.hpp>
#include <ObjBridge/Export.hpp>
#include <ObjBridge/Runtime.hpp>
#include <ObjBridge/Types.hpp>

#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace ObjBridge
{

  struct MethodEntry
  {
    std::string selector;
    std::string owner; // class or protocol that declares it
    std::string encoding;
    // Decoded once at insertion; the error is kept so callers see why it is unusable.
    Expected<MethodSignature> signature{std::unexpected(Error{ErrorCode::DecodeError, "not decoded"})};
    bool isClassMethod{false};
    bool isRequired{true};
  };

  struct PropertyEntry
  {
    std::string name;
    std::string owner;
    std::string attributeString;
    Expected<PropertyAttributes> attributes{std::unexpected(Error{ErrorCode::DecodeError, "not decoded"})};
    bool isRequired{true};
  };

  struct IvarEntry
  {
    std::string name;
    std::string owner;
    std::string encoding;
    Expected<TypeDescriptor> type{std::unexpected(Error{ErrorCode::DecodeError, "not decoded"})};
    std::ptrdiff_t offset{0};
  };

  namespace detail
  {
    using MetadataInterner = NGIN::Utilities::StringInterner<>;

    // Name-keyed member tables shared by classes and protocols.
    struct MemberTables
    {
      std::vector<MethodEntry> methods;
      mutable NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> instanceMethodIndex;
      mutable NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> classMethodIndex;
      std::vector<PropertyEntry> properties;
      mutable NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> propertyIndex;
    };
  } // namespace detail

  struct ClassMetadata
  {
    std::string name;
    std::string superclassName; // empty at a root class; resolved by name on demand
    ClassId handle{nullptr};
    std::vector<std::string> protocols;
    detail::MemberTables members;
    std::vector<IvarEntry> ivars;
    mutable NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> ivarIndex;
  };

  struct ProtocolMetadata
  {
    std::string name;
    ProtocolId handle{nullptr};
    std::vector<std::string> adopted;
    detail::MemberTables members;
  };

  struct CacheStats
  {
    NGIN::UInt64 classDecodes{0};
    NGIN::UInt64 protocolDecodes{0};
    NGIN::UInt64 hits{0};
    NGIN::UInt64 misses{0};
  };

  // Thread-safe. Entries are created on first lookup through the runtime and
  // then served from memory; a name is introspected and decoded at most once.
  // Failed lookups are not remembered.
  class OBJBRIDGE_API MetadataCache
  {
  public:
    explicit MetadataCache(ObjectRuntime &runtime);
    ~MetadataCache();

    MetadataCache(const MetadataCache &) = delete;
    MetadataCache &operator=(const MetadataCache &) = delete;

    [[nodiscard]] Expected<const ClassMetadata *> ResolveClass(std::string_view name);
    [[nodiscard]] Expected<const ProtocolMetadata *> ResolveProtocol(std::string_view name);

    // Walks the superclass chain; the entry belongs to the class that declares it.
    [[nodiscard]] Expected<const MethodEntry *> ResolveMethod(std::string_view className, std::string_view selector, bool isClassMethod);
    // Looks only at the named protocol, not at the protocols it adopts.
    [[nodiscard]] Expected<const MethodEntry *> ResolveProtocolMethod(std::string_view protocol, std::string_view selector, bool isClassMethod);
    [[nodiscard]] Expected<const PropertyEntry *> ResolveProperty(std::string_view className, std::string_view name);
    [[nodiscard]] Expected<const IvarEntry *> ResolveIvar(std::string_view className, std::string_view name);

    // Direct member lookup on one committed entry, without walking.
    [[nodiscard]] const MethodEntry *FindMethod(const ClassMetadata &cls, std::string_view selector, bool isClassMethod) const;
    [[nodiscard]] const MethodEntry *FindMethod(const ProtocolMetadata &protocol, std::string_view selector, bool isClassMethod) const;

    [[nodiscard]] CacheStats Stats() const noexcept;
    [[nodiscard]] ObjectRuntime &Runtime() noexcept { return *m_runtime; }

  private:
    std::mutex &CommitGate(std::map<std::string, std::unique_ptr<std::mutex>, std::less<>> &gates, std::string_view name);

    [[nodiscard]] const ClassMetadata *FindClassLocked(std::string_view name) const;
    [[nodiscard]] const ProtocolMetadata *FindProtocolLocked(std::string_view name) const;
    [[nodiscard]] NameId FindNameLocked(std::string_view name) const;

    std::unique_ptr<ClassMetadata> IntrospectClass(ClassId cls, std::string_view name);
    std::unique_ptr<ProtocolMetadata> IntrospectProtocol(ProtocolId protocol, std::string_view name);

    const ClassMetadata *Commit(std::unique_ptr<ClassMetadata> cls);
    const ProtocolMetadata *Commit(std::unique_ptr<ProtocolMetadata> protocol);
    void IndexMembers(detail::MemberTables &members);

    ObjectRuntime *m_runtime;

    mutable std::shared_mutex m_mutex;
    mutable detail::MetadataInterner m_names;
    std::vector<std::unique_ptr<ClassMetadata>> m_classes;
    mutable NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> m_classIndex;
    std::vector<std::unique_ptr<ProtocolMetadata>> m_protocols;
    mutable NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> m_protocolIndex;

    std::mutex m_gateMutex;
    std::map<std::string, std::unique_ptr<std::mutex>, std::less<>> m_classGates;
    std::map<std::string, std::unique_ptr<std::mutex>, std::less<>> m_protocolGates;

    std::atomic<NGIN::UInt64> m_classDecodes{0};
    std::atomic<NGIN::UInt64> m_protocolDecodes{0};
    std::atomic<NGIN::UInt64> m_hits{0};
    std::atomic<NGIN::UInt64> m_misses{0};
  };

} // namespace ObjBridge
