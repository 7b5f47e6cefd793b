// Bridge.hpp
// Facade owning the metadata cache, resolver, marshaller and invocation engine
#pragma once

#include <ObjBridge/Export.hpp>
#include <ObjBridge/Invocation.hpp>
#include <ObjBridge/Marshaller.hpp>
#include <ObjBridge/MetadataCache.hpp>
#include <ObjBridge/Ownership.hpp>
#include <ObjBridge/Proxy.hpp>
#include <ObjBridge/Runtime.hpp>
#include <ObjBridge/SignatureResolver.hpp>
#include <ObjBridge/Types.hpp>

#include <spdlog/common.h>

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace ObjBridge
{

  // Foreign classes and class-method factories used to box host strings, arrays
  // and dictionaries when they are passed where an object is expected.
  struct BoxingOptions
  {
    std::string stringClass{"NSString"};
    std::string stringFactory{"stringWithUTF8String:"};
    std::string arrayClass{"NSArray"};
    std::string arrayFactory{"arrayWithObjects:count:"};
    std::string dictionaryClass{"NSDictionary"};
    std::string dictionaryFactory{"dictionaryWithObjects:forKeys:count:"};
  };

  struct BridgeOptions
  {
    FallbackPolicy fallbackPolicy{FallbackPolicy::Generic};
    bool autoBoxing{true};
    BoxingOptions boxing{};
    OwnershipConvention ownership{OwnershipConvention::Default()};
    // Applied to the shared "objbridge" logger when set.
    std::optional<spdlog::level::level_enum> logLevel{};
  };

  class OBJBRIDGE_API Bridge
  {
  public:
    explicit Bridge(ObjectRuntime &runtime, BridgeOptions options = {});
    ~Bridge();

    Bridge(const Bridge &) = delete;
    Bridge &operator=(const Bridge &) = delete;

    [[nodiscard]] Expected<ProxyHandle> ResolveClass(std::string_view name);
    [[nodiscard]] Expected<ProxyHandle> ResolveProtocol(std::string_view name);

    // Wraps a foreign reference. Owned references are released when the last
    // handle goes away; borrowed ones are never released by the bridge.
    [[nodiscard]] ProxyHandle Wrap(ObjectId object, Ownership ownership = Ownership::Borrowed);

    [[nodiscard]] ObjectRuntime &Runtime() noexcept { return *m_runtime; }
    [[nodiscard]] MetadataCache &Cache() noexcept { return m_cache; }
    [[nodiscard]] SignatureResolver &Resolver() noexcept { return m_resolver; }
    [[nodiscard]] ValueMarshaller &Marshaller() noexcept { return m_marshaller; }
    [[nodiscard]] InvocationEngine &Engine() noexcept { return m_engine; }
    [[nodiscard]] const BridgeOptions &Options() const noexcept { return m_options; }

    // ProxyHandle entry points
    [[nodiscard]] Expected<Any> Send(const ProxyHandle &target, std::string_view selector, std::span<const Any> args);
    [[nodiscard]] Expected<Any> SendWithSignature(const ProxyHandle &target, std::string_view selector,
                                                  const MethodSignature &signature, std::span<const Any> args);
    [[nodiscard]] Expected<Any> GetProperty(const ProxyHandle &target, std::string_view name);
    [[nodiscard]] Expected<void> SetProperty(const ProxyHandle &target, std::string_view name, const Any &value);
    [[nodiscard]] Expected<Any> GetAttribute(const ProxyHandle &target, std::string_view name);
    [[nodiscard]] Expected<Any> GetIvar(const ProxyHandle &target, std::string_view name);
    [[nodiscard]] std::string ClassName(const ProxyHandle &target);
    // True when an instance's class chain contains `classOrProtocol` or one of its
    // classes adopts a protocol of that name.
    [[nodiscard]] bool IsInstanceOf(const ProxyHandle &target, std::string_view classOrProtocol);
    [[nodiscard]] bool IsSubclassOf(const ProxyHandle &target, std::string_view className);
    [[nodiscard]] bool ConformsTo(const ProxyHandle &target, std::string_view protocolName);
    [[nodiscard]] bool RespondsTo(const ProxyHandle &target, std::string_view selector);

  private:
    void RegisterDefaultBoxing();
    [[nodiscard]] Expected<PropertyAttributes> FindProperty(std::string_view className, std::string_view name);
    [[nodiscard]] bool ProtocolAdopts(ProtocolId protocol, std::string_view name, NGIN::UIntSize depth);
    [[nodiscard]] Expected<ProxyHandle> CallFactory(std::string_view className, std::string_view factory, std::span<const Any> args);

    ObjectRuntime *m_runtime;
    BridgeOptions m_options;
    MetadataCache m_cache;
    SignatureResolver m_resolver;
    ValueMarshaller m_marshaller;
    InvocationEngine m_engine;
  };

} // namespace ObjBridge
