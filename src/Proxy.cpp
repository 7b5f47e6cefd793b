#include <ObjBridge/Bridge.hpp>
#include <ObjBridge/Log.hpp>
#include <ObjBridge/Proxy.hpp>
#include <ObjBridge/SelectorUtils.hpp>

namespace ObjBridge
{
  namespace
  {
    Error Detached(std::string_view subject)
    {
      return Error{ErrorCode::InvalidArgument, "handle is not attached to a bridge", std::string{subject}};
    }
  } // namespace

  ForeignRef::~ForeignRef()
  {
    if (m_owned.exchange(false, std::memory_order_acq_rel))
    {
      Log().trace("ownership: releasing owned reference {}", m_id);
      m_runtime->Release(m_id);
    }
  }

  std::string ProxyHandle::ClassName() const
  {
    return m_bridge ? m_bridge->ClassName(*this) : std::string{};
  }

  Expected<Any> ProxyHandle::Call(std::string_view selector, std::span<const Any> args) const
  {
    if (!m_bridge)
      return std::unexpected(Detached(selector));
    return m_bridge->Send(*this, selector, args);
  }

  Expected<Any> ProxyHandle::CallWithSignature(std::string_view selector, const MethodSignature &signature,
                                               std::span<const Any> args) const
  {
    if (!m_bridge)
      return std::unexpected(Detached(selector));
    return m_bridge->SendWithSignature(*this, selector, signature, args);
  }

  Expected<Any> ProxyHandle::CallWithSignature(std::string_view selector, std::string_view encoding,
                                               std::span<const Any> args) const
  {
    if (!m_bridge)
      return std::unexpected(Detached(selector));
    auto signature = DecodeMethodEncoding(encoding, detail::ColonCount(selector));
    if (!signature)
      return std::unexpected(signature.error());
    return m_bridge->SendWithSignature(*this, selector, *signature, args);
  }

  Expected<Any> ProxyHandle::GetProperty(std::string_view name) const
  {
    if (!m_bridge)
      return std::unexpected(Detached(name));
    return m_bridge->GetProperty(*this, name);
  }

  Expected<void> ProxyHandle::SetProperty(std::string_view name, const Any &value) const
  {
    if (!m_bridge)
      return std::unexpected(Detached(name));
    return m_bridge->SetProperty(*this, name, value);
  }

  Expected<Any> ProxyHandle::GetAttribute(std::string_view name) const
  {
    if (!m_bridge)
      return std::unexpected(Detached(name));
    return m_bridge->GetAttribute(*this, name);
  }

  Expected<Any> ProxyHandle::GetIvar(std::string_view name) const
  {
    if (!m_bridge)
      return std::unexpected(Detached(name));
    return m_bridge->GetIvar(*this, name);
  }

  bool ProxyHandle::IsInstanceOf(std::string_view classOrProtocol) const
  {
    return m_bridge && m_bridge->IsInstanceOf(*this, classOrProtocol);
  }

  bool ProxyHandle::IsSubclassOf(std::string_view className) const
  {
    return m_bridge && m_bridge->IsSubclassOf(*this, className);
  }

  bool ProxyHandle::ConformsTo(std::string_view protocolName) const
  {
    return m_bridge && m_bridge->ConformsTo(*this, protocolName);
  }

  bool ProxyHandle::RespondsTo(std::string_view selector) const
  {
    return m_bridge && m_bridge->RespondsTo(*this, selector);
  }

} // namespace ObjBridge
