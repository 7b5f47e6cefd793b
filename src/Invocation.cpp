#include <ObjBridge/Invocation.hpp>
#include <ObjBridge/Log.hpp>

#include <NGIN/Containers/Vector.hpp>

#include <ffi.h>

#include <algorithm>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace ObjBridge
{
  namespace
  {
    // Call interface for one signature (plus the promoted variadic tail, if any).
    struct CallInterface
    {
      ffi_cif cif{};
      std::vector<ffi_type *> argTypes;
    };

    void StoreNarrow(ForeignSlot &slot, std::uint64_t raw, NGIN::UIntSize width)
    {
      switch (width)
      {
        case 1: slot.Store(static_cast<std::uint8_t>(raw)); break;
        case 2: slot.Store(static_cast<std::uint16_t>(raw)); break;
        case 4: slot.Store(static_cast<std::uint32_t>(raw)); break;
        default: slot.Store(raw); break;
      }
    }

    bool IsFloatingOnly(const TypeDescriptor &type)
    {
      switch (type.Kind())
      {
        case TypeKind::Float: return true;
        case TypeKind::Array: return IsFloatingOnly(type.Element());
        case TypeKind::Struct:
        case TypeKind::Union:
          for (const auto &f : type.Fields())
            if (!IsFloatingOnly(f.type))
              return false;
          return !type.Fields().empty();
        default: return false;
      }
    }

    ffi_type *IntegerWord(NGIN::UIntSize alignment)
    {
      switch (alignment)
      {
        case 1: return &ffi_type_uint8;
        case 2: return &ffi_type_uint16;
        case 4: return &ffi_type_uint32;
        default: return &ffi_type_uint64;
      }
    }
  } // namespace

  struct InvocationEngine::State
  {
    // ffi_type and element arrays for aggregates, keyed by encoding
    std::mutex typeMutex;
    std::unordered_map<std::string, ffi_type *> types;
    std::vector<std::unique_ptr<ffi_type>> typeStorage;
    std::vector<std::unique_ptr<ffi_type *[]>> elementStorage;

    mutable std::mutex cifMutex;
    std::unordered_map<std::string, std::unique_ptr<CallInterface>> interfaces;

    Expected<ffi_type *> TypeFor(const TypeDescriptor &type, bool asArgument);
    Expected<ffi_type *> AggregateType(const TypeDescriptor &type);
    Expected<void> AppendElements(const TypeDescriptor &type, std::vector<ffi_type *> &out);
  };

  Expected<ffi_type *> InvocationEngine::State::TypeFor(const TypeDescriptor &type, bool asArgument)
  {
    switch (type.Kind())
    {
      case TypeKind::Void:
        return &ffi_type_void;
      case TypeKind::Bool:
        return &ffi_type_uint8;
      case TypeKind::Integer:
        switch (type.Width())
        {
          case 1: return type.IsSigned() ? &ffi_type_sint8 : &ffi_type_uint8;
          case 2: return type.IsSigned() ? &ffi_type_sint16 : &ffi_type_uint16;
          case 4: return type.IsSigned() ? &ffi_type_sint32 : &ffi_type_uint32;
          default: return type.IsSigned() ? &ffi_type_sint64 : &ffi_type_uint64;
        }
      case TypeKind::Float:
        if (type.Width() == sizeof(float))
          return &ffi_type_float;
        if (type.Width() == sizeof(double))
          return &ffi_type_double;
        return &ffi_type_longdouble;
      case TypeKind::CString:
      case TypeKind::Object:
      case TypeKind::Class:
      case TypeKind::Selector:
      case TypeKind::Block:
      case TypeKind::Pointer:
      case TypeKind::Unknown:
        return &ffi_type_pointer;
      case TypeKind::Array:
        if (asArgument)
          return &ffi_type_pointer;
        return std::unexpected(Error{ErrorCode::UnsupportedType, "array by value", std::string{type.Encoding()}});
      case TypeKind::Struct:
      case TypeKind::Union:
        return AggregateType(type);
    }
    return std::unexpected(Error{ErrorCode::UnsupportedType, "no call type", std::string{type.Encoding()}});
  }

  // Flattens a member into struct elements; arrays repeat their element. Unions are
  // emulated by a struct of the same size and register class.
  Expected<void> InvocationEngine::State::AppendElements(const TypeDescriptor &type, std::vector<ffi_type *> &out)
  {
    if (type.Kind() == TypeKind::Array)
    {
      for (NGIN::UIntSize i = 0; i < type.Length(); ++i)
      {
        if (auto ok = AppendElements(type.Element(), out); !ok)
          return ok;
      }
      return {};
    }
    auto t = TypeFor(type, false);
    if (!t)
      return std::unexpected(t.error());
    out.push_back(*t);
    return {};
  }

  Expected<ffi_type *> InvocationEngine::State::AggregateType(const TypeDescriptor &type)
  {
    if (!type.HasFieldList() || type.Fields().empty())
      return std::unexpected(Error{ErrorCode::UnsupportedType, "opaque aggregate", std::string{type.Encoding()}});

    const std::string key{type.Encoding()};
    if (auto it = types.find(key); it != types.end())
      return it->second;

    std::vector<ffi_type *> elements;
    if (type.Kind() == TypeKind::Union && IsFloatingOnly(type))
    {
      const FieldDescriptor *widest = &type.Fields().front();
      for (const auto &f : type.Fields())
      {
        if (f.type.Alignment() > widest->type.Alignment() ||
            (f.type.Alignment() == widest->type.Alignment() && f.type.Size() > widest->type.Size()))
          widest = &f;
      }
      if (auto ok = AppendElements(widest->type, elements); !ok)
        return std::unexpected(ok.error());
      for (NGIN::UIntSize pad = widest->type.Size(); pad < type.Size(); ++pad)
        elements.push_back(&ffi_type_uint8);
    }
    else if (type.Kind() == TypeKind::Union)
    {
      // Any integer member puts the whole union in integer registers.
      ffi_type *word = IntegerWord(type.Alignment());
      const NGIN::UIntSize align = std::max<NGIN::UIntSize>(type.Alignment(), 1);
      for (NGIN::UIntSize i = 0; i < type.Size() / align; ++i)
        elements.push_back(word);
      for (NGIN::UIntSize pad = type.Size() / align * align; pad < type.Size(); ++pad)
        elements.push_back(&ffi_type_uint8);
    }
    else
    {
      for (const auto &f : type.Fields())
      {
        if (f.type.Kind() == TypeKind::Unknown)
          return std::unexpected(Error{ErrorCode::UnsupportedType, "aggregate member of unknown layout", std::string{type.Encoding()}});
        if (auto ok = AppendElements(f.type, elements); !ok)
          return std::unexpected(ok.error());
      }
    }

    auto array = std::make_unique<ffi_type *[]>(elements.size() + 1);
    std::copy(elements.begin(), elements.end(), array.get());
    array[elements.size()] = nullptr;

    auto t = std::make_unique<ffi_type>();
    t->size = 0; // computed by ffi_prep_cif
    t->alignment = 0;
    t->type = FFI_TYPE_STRUCT;
    t->elements = array.get();

    ffi_type *raw = t.get();
    elementStorage.push_back(std::move(array));
    typeStorage.push_back(std::move(t));
    types.emplace(key, raw);
    Log().debug("ffi: built aggregate type for {} ({} elements)", key, elements.size());
    return raw;
  }

  InvocationEngine::InvocationEngine(ObjectRuntime &runtime, ValueMarshaller &marshaller, const OwnershipConvention &ownership)
      : m_runtime(&runtime), m_marshaller(&marshaller), m_ownership(&ownership), m_state(std::make_unique<State>())
  {
  }

  InvocationEngine::~InvocationEngine() = default;

  NGIN::UIntSize InvocationEngine::CachedInterfaceCount() const
  {
    std::lock_guard lock{m_state->cifMutex};
    return m_state->interfaces.size();
  }

  Expected<Any> InvocationEngine::Invoke(const ProxyHandle &target, std::string_view selector, const MethodSignature &signature,
                                         std::span<const Any> args)
  {
    if (!target.IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "message to an empty handle", std::string{selector}});

    if (auto affinity = m_runtime->AffinityThread(); affinity && *affinity != std::this_thread::get_id())
      return std::unexpected(Error{ErrorCode::ThreadAffinityViolation, "foreign call from the wrong thread", std::string{selector}});

    const NGIN::UIntSize fixed = signature.ArgumentCount();
    if (args.size() < fixed || (!signature.isVariadic && args.size() != fixed))
      return std::unexpected(Error{ErrorCode::InvalidArgument, "argument count mismatch", std::string{selector}});

    ObjectId receiver = target.Id();
    SelectorId cmd = m_marshaller->SelectorFor(selector);
    Imp imp = m_runtime->LookUpImp(receiver, cmd);
    if (!imp)
      return std::unexpected(Error{ErrorCode::NoSuchMember, "receiver does not respond to selector", std::string{selector}});

    // Marshal everything before touching the foreign side.
    NGIN::Containers::Vector<TypeDescriptor> types;
    types.Reserve(args.size());
    for (const auto &t : signature.arguments)
      types.PushBack(TypeDescriptor{t});
    // Keyed by the decoded layout; the signature's encoding text may be stale.
    std::string key{signature.returnType.Encoding()};
    for (const auto &t : signature.arguments)
    {
      key += ',';
      key += t.Encoding();
    }
    if (signature.isVariadic)
      key += "|..." + std::to_string(fixed);
    for (NGIN::UIntSize i = fixed; i < args.size(); ++i)
    {
      auto promoted = ValueMarshaller::PromotedType(args[i]);
      if (!promoted)
        return std::unexpected(promoted.error().AtArgument(i));
      key += '|';
      key += promoted->Encoding();
      types.PushBack(std::move(*promoted));
    }

    std::vector<ForeignSlot> slots;
    slots.reserve(args.size());
    for (NGIN::UIntSize i = 0; i < args.size(); ++i)
    {
      auto slot = m_marshaller->ToForeign(args[i], types[i]);
      if (!slot)
        return std::unexpected(slot.error().AtArgument(i));
      slots.push_back(std::move(*slot));
    }

    const CallInterface *ci = nullptr;
    {
      std::lock_guard lock{m_state->cifMutex};
      auto it = m_state->interfaces.find(key);
      if (it == m_state->interfaces.end())
      {
        auto fresh = std::make_unique<CallInterface>();
        ffi_type *rtype = nullptr;
        {
          std::lock_guard typeLock{m_state->typeMutex};
          auto r = m_state->TypeFor(signature.returnType, false);
          if (!r)
            return std::unexpected(r.error());
          rtype = *r;
          fresh->argTypes.push_back(&ffi_type_pointer); // receiver
          fresh->argTypes.push_back(&ffi_type_pointer); // selector
          for (NGIN::UIntSize i = 0; i < types.Size(); ++i)
          {
            auto t = m_state->TypeFor(types[i], true);
            if (!t)
              return std::unexpected(t.error().AtArgument(i));
            fresh->argTypes.push_back(*t);
          }
        }

        const auto total = static_cast<unsigned>(fresh->argTypes.size());
        ffi_status status;
        if (signature.isVariadic)
          status = ffi_prep_cif_var(&fresh->cif, FFI_DEFAULT_ABI, static_cast<unsigned>(fixed + 2), total, rtype, fresh->argTypes.data());
        else
          status = ffi_prep_cif(&fresh->cif, FFI_DEFAULT_ABI, total, rtype, fresh->argTypes.data());
        if (status != FFI_OK)
          return std::unexpected(Error{ErrorCode::UnsupportedType, "ffi_prep_cif failed", key});

        Log().debug("ffi: prepared call interface {}", key);
        it = m_state->interfaces.emplace(key, std::move(fresh)).first;
      }
      ci = it->second.get();
    }

    std::vector<void *> argv;
    argv.reserve(slots.size() + 2);
    argv.push_back(&receiver);
    argv.push_back(&cmd);
    for (auto &s : slots)
      argv.push_back(s.Data());

    const auto &rt = signature.returnType;
    ForeignSlot ret{std::max<NGIN::UIntSize>(rt.Size(), sizeof(ffi_arg))};
    ffi_call(const_cast<ffi_cif *>(&ci->cif), FFI_FN(imp), ret.Data(), argv.data());

    if (auto reason = m_runtime->TakePendingException())
      return std::unexpected(Error{ErrorCode::ForeignException, "foreign exception", std::move(*reason)});

    if (target.Kind() == ProxyKind::Instance && m_ownership->ConsumesReceiver(selector))
    {
      Log().trace("ownership: {} consumed its receiver {}", selector, receiver);
      target.Ref()->Disarm();
    }

    // Integral returns narrower than a register come back widened to ffi_arg.
    if ((rt.Kind() == TypeKind::Integer || rt.Kind() == TypeKind::Bool) && rt.Width() < sizeof(ffi_arg))
    {
      const std::uint64_t raw = rt.IsSigned() && rt.Kind() == TypeKind::Integer
                                    ? static_cast<std::uint64_t>(ret.Load<ffi_sarg>())
                                    : static_cast<std::uint64_t>(ret.Load<ffi_arg>());
      StoreNarrow(ret, raw, rt.Width());
    }

    const Ownership ownership = rt.IsObjectLike() ? m_ownership->ReturnOwnership(selector) : Ownership::Borrowed;
    if (ownership == Ownership::Owned)
      Log().trace("ownership: {} returned an owned reference", selector);
    // Converted first so an owned result is held by a handle even if a write-back fails.
    auto result = m_marshaller->ToHost(ret, rt, ownership);

    for (const auto &s : slots)
    {
      if (auto ok = m_marshaller->ApplyWriteBacks(s); !ok)
        return std::unexpected(ok.error());
    }
    return result;
  }

} // namespace ObjBridge
