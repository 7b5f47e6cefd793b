// Invocation.hpp
// Dynamic foreign calls through libffi with table-driven return ownership
#pragma once

#include <NGIN/Primitives.hpp>

#include <ObjBridge/Encoding.hpp>
#include <ObjBridge/Export.hpp>
#include <ObjBridge/Marshaller.hpp>
#include <ObjBridge/Ownership.hpp>
#include <ObjBridge/Proxy.hpp>
#include <ObjBridge/Runtime.hpp>
#include <ObjBridge/Types.hpp>

#include <memory>
#include <span>
#include <string_view>

namespace ObjBridge
{

  // Calls an implementation found through ObjectRuntime::LookUpImp as
  //   R imp(receiver, selector, args...)
  // Call interfaces are prepared once per signature encoding and shared by all threads.
  class OBJBRIDGE_API InvocationEngine
  {
  public:
    InvocationEngine(ObjectRuntime &runtime, ValueMarshaller &marshaller, const OwnershipConvention &ownership);
    ~InvocationEngine();

    InvocationEngine(const InvocationEngine &) = delete;
    InvocationEngine &operator=(const InvocationEngine &) = delete;

    // Arguments beyond the signature's fixed count are passed as a variadic tail
    // after default argument promotion; only variadic signatures accept them.
    // Every argument is marshalled before the call; a marshalling failure carries
    // the argument index.
    [[nodiscard]] Expected<Any> Invoke(const ProxyHandle &target, std::string_view selector, const MethodSignature &signature,
                                       std::span<const Any> args);

    [[nodiscard]] NGIN::UIntSize CachedInterfaceCount() const;

  private:
    struct State;

    ObjectRuntime *m_runtime;
    ValueMarshaller *m_marshaller;
    const OwnershipConvention *m_ownership;
    std::unique_ptr<State> m_state;
  };

} // namespace ObjBridge
