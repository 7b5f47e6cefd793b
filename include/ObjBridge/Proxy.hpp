// Proxy.hpp
// Host handles for foreign classes, protocols and instances
#pragma once

#include <NGIN/Primitives.hpp>

#include <ObjBridge/Convert.hpp>
#include <ObjBridge/Encoding.hpp>
#include <ObjBridge/Export.hpp>
#include <ObjBridge/Runtime.hpp>
#include <ObjBridge/Types.hpp>

#include <array>
#include <atomic>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace ObjBridge
{
  class Bridge;

  enum class ProxyKind : NGIN::UInt8
  {
    Class,
    Protocol,
    Instance,
  };

  // One foreign reference shared by every copy of a ProxyHandle. When it holds
  // a +1 reference that reference is released exactly once, by whichever copy
  // goes last.
  class OBJBRIDGE_API ForeignRef
  {
  public:
    ForeignRef(ObjectRuntime &runtime, ObjectId id, bool owned) noexcept
        : m_runtime(&runtime), m_id(id), m_owned(owned)
    {
    }
    ~ForeignRef();

    ForeignRef(const ForeignRef &) = delete;
    ForeignRef &operator=(const ForeignRef &) = delete;

    [[nodiscard]] ObjectId Id() const noexcept { return m_id; }
    [[nodiscard]] bool IsOwned() const noexcept { return m_owned.load(std::memory_order_acquire); }

    // The foreign side consumed the reference (an init-family receiver).
    void Disarm() noexcept { m_owned.store(false, std::memory_order_release); }

  private:
    ObjectRuntime *m_runtime;
    ObjectId m_id;
    std::atomic<bool> m_owned;
  };

  // Pointer argument whose pointee is marshalled in before the call and written
  // back afterwards. Copies share the value, so the caller's copy sees the result.
  class OutParam
  {
  public:
    OutParam() : m_value(std::make_shared<Any>(Any::MakeVoid())) {}
    explicit OutParam(Any initial) : m_value(std::make_shared<Any>(std::move(initial))) {}

    [[nodiscard]] const Any &Value() const noexcept { return *m_value; }
    [[nodiscard]] bool HasValue() const noexcept { return m_value->HasValue(); }
    void Set(Any value) const { *m_value = std::move(value); }

    template <class T>
    [[nodiscard]] Expected<T> As() const
    {
      return detail::ConvertAny<T>(*m_value);
    }

  private:
    std::shared_ptr<Any> m_value;
  };

  class OBJBRIDGE_API ProxyHandle
  {
  public:
    ProxyHandle() = default;

    [[nodiscard]] bool IsValid() const noexcept { return m_bridge && m_ref && m_ref->Id(); }
    [[nodiscard]] ProxyKind Kind() const noexcept { return m_kind; }
    [[nodiscard]] ObjectId Id() const noexcept { return m_ref ? m_ref->Id() : nullptr; }
    [[nodiscard]] const std::shared_ptr<ForeignRef> &Ref() const noexcept { return m_ref; }
    [[nodiscard]] Bridge *Owner() const noexcept { return m_bridge; }

    // Class name queried from the runtime on every call; for protocols, the protocol name.
    [[nodiscard]] std::string ClassName() const;

    // Sends `selector` with a signature resolved from metadata.
    [[nodiscard]] Expected<Any> Call(std::string_view selector, std::span<const Any> args = {}) const;
    [[nodiscard]] Expected<Any> Call(std::string_view selector, const Any *args, NGIN::UIntSize count) const
    {
      return Call(selector, std::span<const Any>{args, count});
    }

    template <class R, class... A>
    [[nodiscard]] Expected<R> CallAs(std::string_view selector, A &&...a) const
    {
      std::array<Any, sizeof...(A)> tmp{Any{std::forward<A>(a)}...};
      auto r = Call(selector, std::span<const Any>{tmp.data(), tmp.size()});
      if (!r.has_value())
        return std::unexpected(r.error());
      if constexpr (std::is_void_v<R>)
        return {};
      else
        return detail::ConvertAny<R>(*r);
    }

    // Sends with a caller-supplied signature, bypassing metadata lookup.
    [[nodiscard]] Expected<Any> CallWithSignature(std::string_view selector, const MethodSignature &signature,
                                                  std::span<const Any> args = {}) const;
    // `encoding` is a full method encoding, e.g. "i24@0:8i16".
    [[nodiscard]] Expected<Any> CallWithSignature(std::string_view selector, std::string_view encoding,
                                                  std::span<const Any> args = {}) const;

    [[nodiscard]] Expected<Any> GetProperty(std::string_view name) const;
    [[nodiscard]] Expected<void> SetProperty(std::string_view name, const Any &value) const;

    template <class R>
    [[nodiscard]] Expected<R> GetPropertyAs(std::string_view name) const
    {
      auto r = GetProperty(name);
      if (!r.has_value())
        return std::unexpected(r.error());
      return detail::ConvertAny<R>(*r);
    }

    // Host attribute access: a property, else a zero-argument selector of that
    // name ('_' maps to ':'), else NoSuchMember.
    [[nodiscard]] Expected<Any> GetAttribute(std::string_view name) const;

    // Reads an instance variable by name. Read-only.
    [[nodiscard]] Expected<Any> GetIvar(std::string_view name) const;

    // Predicates: false on negative or unresolvable checks, never an error.
    [[nodiscard]] bool IsInstanceOf(std::string_view classOrProtocol) const;
    [[nodiscard]] bool IsSubclassOf(std::string_view className) const;
    [[nodiscard]] bool ConformsTo(std::string_view protocolName) const;
    [[nodiscard]] bool RespondsTo(std::string_view selector) const;

    friend bool operator==(const ProxyHandle &a, const ProxyHandle &b) noexcept { return a.Id() == b.Id(); }

  private:
    friend class Bridge;
    ProxyHandle(Bridge *bridge, ProxyKind kind, std::shared_ptr<ForeignRef> ref)
        : m_bridge(bridge), m_kind(kind), m_ref(std::move(ref))
    {
    }

    Bridge *m_bridge{nullptr};
    ProxyKind m_kind{ProxyKind::Instance};
    std::shared_ptr<ForeignRef> m_ref;
  };

} // namespace ObjBridge
