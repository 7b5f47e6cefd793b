// Runtime.hpp
// Collaborator interface to the foreign object runtime (introspection, dispatch, lifetime)
#pragma once

#include <ObjBridge/Export.hpp>
#include <ObjBridge/Types.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace ObjBridge
{

  struct MethodDescription
  {
    std::string selector;
    std::string typeEncoding;
  };

  struct PropertyDescription
  {
    std::string name;
    std::string attributes;
  };

  struct IvarDescription
  {
    std::string name;
    std::string typeEncoding;
    std::ptrdiff_t offset{0};
  };

  // Read-only metadata source plus the message-send mechanism. Implementations
  // must be safe to call from several threads at once.
  //
  // Implementations of methods reached through LookUpImp have the C signature
  //   R imp(ObjectId self, SelectorId _cmd, Args...)
  class OBJBRIDGE_API ObjectRuntime
  {
  public:
    virtual ~ObjectRuntime() = default;

    // Classes. Null handles mean "not found".
    [[nodiscard]] virtual ClassId FindClass(std::string_view name) const = 0;
    [[nodiscard]] virtual std::string ClassName(ClassId cls) const = 0;
    [[nodiscard]] virtual ClassId SuperclassOf(ClassId cls) const = 0;
    [[nodiscard]] virtual std::vector<MethodDescription> CopyMethodList(ClassId cls, bool classMethods) const = 0;
    [[nodiscard]] virtual std::vector<PropertyDescription> CopyPropertyList(ClassId cls) const = 0;
    [[nodiscard]] virtual std::vector<IvarDescription> CopyIvarList(ClassId cls) const = 0;
    [[nodiscard]] virtual std::vector<ProtocolId> CopyProtocolList(ClassId cls) const = 0;

    // Protocols
    [[nodiscard]] virtual ProtocolId FindProtocol(std::string_view name) const = 0;
    [[nodiscard]] virtual std::string ProtocolName(ProtocolId protocol) const = 0;
    [[nodiscard]] virtual std::vector<MethodDescription> CopyProtocolMethods(ProtocolId protocol, bool required, bool instanceMethods) const = 0;
    [[nodiscard]] virtual std::vector<PropertyDescription> CopyProtocolProperties(ProtocolId protocol, bool required) const = 0;
    [[nodiscard]] virtual std::vector<ProtocolId> CopyAdoptedProtocols(ProtocolId protocol) const = 0;

    // Objects. Class objects are objects; ClassOf(class object) is its metaclass.
    [[nodiscard]] virtual ClassId ClassOf(ObjectId object) const = 0;
    [[nodiscard]] virtual bool IsClassObject(ObjectId object) const = 0;
    [[nodiscard]] virtual bool IsProtocolObject(ObjectId object) const = 0;
    virtual void Retain(ObjectId object) = 0;
    virtual void Release(ObjectId object) = 0;

    // Selectors and dispatch
    [[nodiscard]] virtual SelectorId RegisterSelector(std::string_view name) = 0;
    [[nodiscard]] virtual std::string_view SelectorName(SelectorId selector) const = 0;
    // Null when the receiver does not respond to the selector.
    [[nodiscard]] virtual Imp LookUpImp(ObjectId receiver, SelectorId selector) const = 0;

    // Exception raised by the last foreign call on this thread, if any. Clears it.
    [[nodiscard]] virtual std::optional<std::string> TakePendingException() = 0;

    // Thread the runtime requires foreign calls to run on, when it has one.
    [[nodiscard]] virtual std::optional<std::thread::id> AffinityThread() const { return std::nullopt; }
  };

} // namespace ObjBridge
