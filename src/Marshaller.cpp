#include <ObjBridge/Marshaller.hpp>
#include <ObjBridge/Bridge.hpp>

#include <algorithm>
#include <cfloat>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <limits>
#include <optional>
#include <string>

namespace ObjBridge
{
  namespace
  {
    constexpr NameId InvalidNameId = static_cast<NameId>(NGIN::Utilities::StringInterner<>::INVALID_ID);

    // Host arithmetic value widened to one of three carriers.
    struct HostNumber
    {
      enum class Kind
      {
        Boolean,
        Signed,
        Unsigned,
        Floating,
      };
      Kind kind{Kind::Signed};
      std::int64_t s{0};
      std::uint64_t u{0};
      long double f{0};
    };

    template <class T>
    bool Take(const Any &v, HostNumber &out)
    {
      if (!detail::Holds<T>(v))
        return false;
      const T x = v.template Cast<T>();
      if constexpr (std::is_same_v<T, bool>)
      {
        out.kind = HostNumber::Kind::Boolean;
        out.u = x ? 1 : 0;
        out.s = x ? 1 : 0;
      }
      else if constexpr (std::is_floating_point_v<T>)
      {
        out.kind = HostNumber::Kind::Floating;
        out.f = x;
      }
      else if constexpr (std::is_signed_v<T>)
      {
        out.kind = HostNumber::Kind::Signed;
        out.s = x;
      }
      else
      {
        out.kind = HostNumber::Kind::Unsigned;
        out.u = x;
      }
      return true;
    }

    std::optional<HostNumber> ReadNumber(const Any &v)
    {
      HostNumber n;
      if (Take<bool>(v, n) || Take<int>(v, n) || Take<std::int64_t>(v, n) || Take<std::uint64_t>(v, n) ||
          Take<double>(v, n) || Take<unsigned int>(v, n) || Take<float>(v, n) || Take<long long>(v, n) ||
          Take<unsigned long long>(v, n) || Take<long>(v, n) || Take<unsigned long>(v, n) || Take<short>(v, n) ||
          Take<unsigned short>(v, n) || Take<char>(v, n) || Take<signed char>(v, n) || Take<unsigned char>(v, n) ||
          Take<long double>(v, n))
        return n;
      return std::nullopt;
    }

    template <class T>
    void StoreAt(std::byte *dst, T v) noexcept
    {
      std::memcpy(dst, &v, sizeof(T));
    }

    template <class T>
    T LoadAt(const std::byte *src) noexcept
    {
      T v;
      std::memcpy(&v, src, sizeof(T));
      return v;
    }

    bool IsNull(const Any &v) { return !v.HasValue() || detail::Holds<std::nullptr_t>(v); }

    // RFC 3629: no overlongs, no surrogates, nothing above U+10FFFF.
    bool IsValidUtf8(std::string_view s) noexcept
    {
      NGIN::UIntSize i = 0;
      while (i < s.size())
      {
        const auto c = static_cast<unsigned char>(s[i]);
        NGIN::UIntSize len = 0;
        std::uint32_t cp = 0;
        if (c < 0x80)
        {
          ++i;
          continue;
        }
        else if ((c & 0xE0) == 0xC0)
        {
          len = 2;
          cp = c & 0x1F;
        }
        else if ((c & 0xF0) == 0xE0)
        {
          len = 3;
          cp = c & 0x0F;
        }
        else if ((c & 0xF8) == 0xF0)
        {
          len = 4;
          cp = c & 0x07;
        }
        else
          return false;
        if (i + len > s.size())
          return false;
        for (NGIN::UIntSize k = 1; k < len; ++k)
        {
          const auto cc = static_cast<unsigned char>(s[i + k]);
          if ((cc & 0xC0) != 0x80)
            return false;
          cp = (cp << 6) | (cc & 0x3F);
        }
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000))
          return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
          return false;
        i += len;
      }
      return true;
    }

    Error RangeError(const TypeDescriptor &type)
    {
      return Error{ErrorCode::ArgumentRange, "value out of range for slot", std::string{type.Encoding()}};
    }

    Error KindError(std::string_view message, const TypeDescriptor &type)
    {
      return Error{ErrorCode::InvalidArgument, message, std::string{type.Encoding()}};
    }

    // Aggregates are only marshalled when every member has a known layout.
    Expected<void> CheckAggregate(const TypeDescriptor &type)
    {
      if (!type.HasFieldList() || type.Fields().empty())
        return std::unexpected(Error{ErrorCode::UnsupportedType, "opaque aggregate", std::string{type.Encoding()}});
      for (const auto &f : type.Fields())
      {
        if (f.type.Kind() == TypeKind::Unknown)
          return std::unexpected(Error{ErrorCode::UnsupportedType, "aggregate member of unknown layout", std::string{type.Encoding()}});
      }
      return {};
    }

    // ---- writers ----

    Expected<void> WriteVoid(ValueMarshaller &, const Any &, const TypeDescriptor &type, std::byte *, ForeignSlot &)
    {
      return std::unexpected(KindError("void has no value", type));
    }

    Expected<void> WriteBool(ValueMarshaller &, const Any &host, const TypeDescriptor &type, std::byte *dst, ForeignSlot &)
    {
      const auto n = ReadNumber(host);
      if (!n || n->kind == HostNumber::Kind::Floating)
        return std::unexpected(KindError("expected a boolean", type));
      bool value = false;
      if (n->kind == HostNumber::Kind::Signed)
      {
        if (n->s != 0 && n->s != 1)
          return std::unexpected(RangeError(type));
        value = n->s == 1;
      }
      else
      {
        if (n->u > 1)
          return std::unexpected(RangeError(type));
        value = n->u == 1;
      }
      StoreAt<std::uint8_t>(dst, value ? 1 : 0);
      return {};
    }

    Expected<void> WriteInteger(ValueMarshaller &, const Any &host, const TypeDescriptor &type, std::byte *dst, ForeignSlot &)
    {
      auto n = ReadNumber(host);
      if (!n)
        return std::unexpected(KindError("expected a number", type));

      if (n->kind == HostNumber::Kind::Floating)
      {
        const long double f = n->f;
        if (!std::isfinite(f) || std::trunc(f) != f)
          return std::unexpected(RangeError(type));
        if (f < 0)
        {
          if (f < -9223372036854775808.0L)
            return std::unexpected(RangeError(type));
          n->kind = HostNumber::Kind::Signed;
          n->s = static_cast<std::int64_t>(f);
        }
        else
        {
          if (f >= 18446744073709551616.0L)
            return std::unexpected(RangeError(type));
          n->kind = HostNumber::Kind::Unsigned;
          n->u = static_cast<std::uint64_t>(f);
        }
      }

      const NGIN::UIntSize bits = type.Width() * 8;
      std::uint64_t raw = 0;
      if (type.IsSigned())
      {
        const std::int64_t max = bits >= 64 ? std::numeric_limits<std::int64_t>::max() : (std::int64_t{1} << (bits - 1)) - 1;
        const std::int64_t min = bits >= 64 ? std::numeric_limits<std::int64_t>::min() : -(std::int64_t{1} << (bits - 1));
        if (n->kind == HostNumber::Kind::Signed)
        {
          if (n->s < min || n->s > max)
            return std::unexpected(RangeError(type));
          raw = static_cast<std::uint64_t>(n->s);
        }
        else
        {
          if (n->u > static_cast<std::uint64_t>(max))
            return std::unexpected(RangeError(type));
          raw = n->u;
        }
      }
      else
      {
        const std::uint64_t max = bits >= 64 ? std::numeric_limits<std::uint64_t>::max() : (std::uint64_t{1} << bits) - 1;
        if (n->kind == HostNumber::Kind::Signed)
        {
          if (n->s < 0 || static_cast<std::uint64_t>(n->s) > max)
            return std::unexpected(RangeError(type));
          raw = static_cast<std::uint64_t>(n->s);
        }
        else
        {
          if (n->u > max)
            return std::unexpected(RangeError(type));
          raw = n->u;
        }
      }

      switch (type.Width())
      {
        case 1: StoreAt(dst, static_cast<std::uint8_t>(raw)); break;
        case 2: StoreAt(dst, static_cast<std::uint16_t>(raw)); break;
        case 4: StoreAt(dst, static_cast<std::uint32_t>(raw)); break;
        default: StoreAt(dst, raw); break;
      }
      return {};
    }

    Expected<void> WriteFloat(ValueMarshaller &, const Any &host, const TypeDescriptor &type, std::byte *dst, ForeignSlot &)
    {
      const auto n = ReadNumber(host);
      if (!n || n->kind == HostNumber::Kind::Boolean)
        return std::unexpected(KindError("expected a number", type));
      long double v = 0;
      switch (n->kind)
      {
        case HostNumber::Kind::Signed: v = static_cast<long double>(n->s); break;
        case HostNumber::Kind::Unsigned: v = static_cast<long double>(n->u); break;
        default: v = n->f; break;
      }

      if (type.Width() == sizeof(float))
      {
        if (std::isfinite(v) && std::fabs(v) > FLT_MAX)
          return std::unexpected(RangeError(type));
        StoreAt(dst, static_cast<float>(v));
      }
      else if (type.Width() == sizeof(double))
      {
        if (std::isfinite(v) && std::fabs(v) > DBL_MAX)
          return std::unexpected(RangeError(type));
        StoreAt(dst, static_cast<double>(v));
      }
      else
      {
        StoreAt(dst, v);
      }
      return {};
    }

    Expected<void> WriteCString(ValueMarshaller &, const Any &host, const TypeDescriptor &type, std::byte *dst, ForeignSlot &owner)
    {
      if (IsNull(host))
      {
        StoreAt<const char *>(dst, nullptr);
        return {};
      }
      std::shared_ptr<std::string> text;
      if (detail::Holds<std::string>(host))
        text = std::make_shared<std::string>(host.Cast<std::string>());
      else if (detail::Holds<const char *>(host))
        text = std::make_shared<std::string>(host.Cast<const char *>());
      else
        return std::unexpected(KindError("expected a string", type));

      if (text->find('\0') != std::string::npos)
        return std::unexpected(Error{ErrorCode::EncodingError, "string contains an embedded NUL"});
      StoreAt<const char *>(dst, text->c_str());
      owner.KeepAlive(std::move(text));
      return {};
    }

    Expected<void> WriteObject(ValueMarshaller &m, const Any &host, const TypeDescriptor &type, std::byte *dst, ForeignSlot &owner)
    {
      if (IsNull(host))
      {
        StoreAt<ObjectId>(dst, nullptr);
        return {};
      }
      if (detail::Holds<ProxyHandle>(host))
      {
        StoreAt<ObjectId>(dst, host.Cast<ProxyHandle>().Id());
        return {};
      }
      if (!m.AutoBoxing() || !m.HasBoxing(host.GetTypeId()))
        return std::unexpected(KindError("value is not an object and has no boxing adapter", type));

      auto boxed = m.Box(host);
      if (!boxed)
        return std::unexpected(boxed.error());
      StoreAt<ObjectId>(dst, boxed->Id());
      owner.KeepAlive(std::make_shared<ProxyHandle>(std::move(*boxed)));
      return {};
    }

    Expected<void> WriteSelector(ValueMarshaller &m, const Any &host, const TypeDescriptor &type, std::byte *dst, ForeignSlot &)
    {
      if (IsNull(host))
      {
        StoreAt<SelectorId>(dst, nullptr);
        return {};
      }
      if (detail::Holds<Selector>(host))
        StoreAt<SelectorId>(dst, m.SelectorFor(host.Cast<Selector>().name));
      else if (detail::Holds<std::string>(host))
        StoreAt<SelectorId>(dst, m.SelectorFor(host.Cast<std::string>()));
      else
        return std::unexpected(KindError("expected a selector", type));
      return {};
    }

    Expected<void> WriteStruct(ValueMarshaller &m, const Any &host, const TypeDescriptor &type, std::byte *dst, ForeignSlot &owner)
    {
      if (auto ok = CheckAggregate(type); !ok)
        return ok;
      if (!detail::Holds<Aggregate>(host))
        return std::unexpected(KindError("expected an aggregate", type));
      const auto &agg = host.Cast<Aggregate>();
      const auto &fields = type.Fields();

      for (NGIN::UIntSize i = 0; i < agg.Size(); ++i)
      {
        const auto &name = agg.At(i).name;
        bool known = false;
        for (const auto &f : fields)
          known = known || f.name == name;
        if (!known)
          return std::unexpected(Error{ErrorCode::FieldMismatch, "no such field", name});
      }

      const auto offsets = FieldOffsets(type);
      for (NGIN::UIntSize i = 0; i < fields.size(); ++i)
      {
        const Any *value = agg.Find(fields[i].name);
        if (!value)
          return std::unexpected(Error{ErrorCode::FieldMismatch, "missing field", fields[i].name});
        if (auto ok = m.WriteValue(*value, fields[i].type, dst + offsets[i], owner); !ok)
          return ok;
      }
      return {};
    }

    Expected<void> WriteUnion(ValueMarshaller &m, const Any &host, const TypeDescriptor &type, std::byte *dst, ForeignSlot &owner)
    {
      if (auto ok = CheckAggregate(type); !ok)
        return ok;
      if (!detail::Holds<Aggregate>(host))
        return std::unexpected(KindError("expected an aggregate", type));
      const auto &agg = host.Cast<Aggregate>();
      if (agg.Size() != 1)
        return std::unexpected(Error{ErrorCode::FieldMismatch, "union takes exactly one member", std::string{type.Encoding()}});

      const auto &member = agg.At(0);
      for (const auto &f : type.Fields())
      {
        if (f.name != member.name)
          continue;
        std::memset(dst, 0, type.Size());
        return m.WriteValue(member.value, f.type, dst, owner);
      }
      return std::unexpected(Error{ErrorCode::FieldMismatch, "no such field", member.name});
    }

    Expected<void> WriteArray(ValueMarshaller &m, const Any &host, const TypeDescriptor &type, std::byte *dst, ForeignSlot &owner)
    {
      if (!detail::Holds<std::vector<Any>>(host))
        return std::unexpected(KindError("expected a sequence", type));
      const auto &items = host.Cast<std::vector<Any>>();
      if (items.size() != type.Length())
        return std::unexpected(Error{ErrorCode::FieldMismatch, "array length mismatch", std::string{type.Encoding()}});
      const auto &element = type.Element();
      for (NGIN::UIntSize i = 0; i < items.size(); ++i)
      {
        if (auto ok = m.WriteValue(items[i], element, dst + i * element.Size(), owner); !ok)
          return ok;
      }
      return {};
    }

    Expected<void> WritePointer(ValueMarshaller &m, const Any &host, const TypeDescriptor &type, std::byte *dst, ForeignSlot &owner)
    {
      if (IsNull(host))
      {
        StoreAt<void *>(dst, nullptr);
        return {};
      }
      if (detail::Holds<void *>(host))
      {
        StoreAt<void *>(dst, host.Cast<void *>());
        return {};
      }
      if (!detail::Holds<OutParam>(host))
        return std::unexpected(KindError("expected a pointer or out parameter", type));

      const auto param = host.Cast<OutParam>();
      const auto &pointeeType = type.Element();
      if (pointeeType.Kind() == TypeKind::Void)
        return std::unexpected(Error{ErrorCode::UnsupportedType, "out parameter through void pointer", std::string{type.Encoding()}});

      auto pointee = std::make_shared<ForeignSlot>(std::max<NGIN::UIntSize>(pointeeType.Size(), sizeof(void *)));
      if (param.HasValue() && !type.HasQualifier(QualifierOut))
      {
        if (auto ok = m.WriteValue(param.Value(), pointeeType, static_cast<std::byte *>(pointee->Data()), *pointee); !ok)
          return ok;
      }
      StoreAt<void *>(dst, pointee->Data());
      if (!type.HasQualifier(QualifierIn) && !type.HasQualifier(QualifierConst))
        owner.AddWriteBack(ForeignSlot::WriteBack{param, pointee, pointeeType});
      owner.KeepAlive(std::move(pointee));
      return {};
    }

    Expected<void> WriteUnknown(ValueMarshaller &, const Any &host, const TypeDescriptor &type, std::byte *dst, ForeignSlot &)
    {
      if (IsNull(host))
      {
        std::memset(dst, 0, type.Size());
        return {};
      }
      if (!detail::Holds<Blob>(host))
        return std::unexpected(KindError("expected a blob for an opaque slot", type));
      const auto &blob = host.Cast<Blob>();
      if (blob.bytes.size() > type.Size())
        return std::unexpected(RangeError(type));
      std::memset(dst, 0, type.Size());
      std::memcpy(dst, blob.bytes.data(), blob.bytes.size());
      return {};
    }

    // ---- readers ----

    Expected<Any> ReadVoid(ValueMarshaller &, const std::byte *, const TypeDescriptor &, Ownership)
    {
      return Any::MakeVoid();
    }

    Expected<Any> ReadBool(ValueMarshaller &, const std::byte *src, const TypeDescriptor &, Ownership)
    {
      return Any{LoadAt<std::uint8_t>(src) != 0};
    }

    Expected<Any> ReadInteger(ValueMarshaller &, const std::byte *src, const TypeDescriptor &type, Ownership)
    {
      if (type.IsSigned())
      {
        switch (type.Width())
        {
          case 1: return Any{static_cast<std::int64_t>(LoadAt<std::int8_t>(src))};
          case 2: return Any{static_cast<std::int64_t>(LoadAt<std::int16_t>(src))};
          case 4: return Any{static_cast<std::int64_t>(LoadAt<std::int32_t>(src))};
          default: return Any{LoadAt<std::int64_t>(src)};
        }
      }
      switch (type.Width())
      {
        case 1: return Any{static_cast<std::uint64_t>(LoadAt<std::uint8_t>(src))};
        case 2: return Any{static_cast<std::uint64_t>(LoadAt<std::uint16_t>(src))};
        case 4: return Any{static_cast<std::uint64_t>(LoadAt<std::uint32_t>(src))};
        default: return Any{LoadAt<std::uint64_t>(src)};
      }
    }

    Expected<Any> ReadFloat(ValueMarshaller &, const std::byte *src, const TypeDescriptor &type, Ownership)
    {
      if (type.Width() == sizeof(float))
        return Any{LoadAt<float>(src)};
      if (type.Width() == sizeof(double))
        return Any{LoadAt<double>(src)};
      return Any{LoadAt<long double>(src)};
    }

    Expected<Any> ReadCString(ValueMarshaller &, const std::byte *src, const TypeDescriptor &, Ownership)
    {
      const char *p = LoadAt<const char *>(src);
      if (!p)
        return Any{nullptr};
      std::string text{p};
      if (!IsValidUtf8(text))
        return std::unexpected(Error{ErrorCode::EncodingError, "foreign string is not valid UTF-8"});
      return Any{std::move(text)};
    }

    Expected<Any> ReadObject(ValueMarshaller &m, const std::byte *src, const TypeDescriptor &, Ownership ownership)
    {
      ObjectId id = LoadAt<ObjectId>(src);
      if (!id)
        return Any{nullptr};
      return Any{m.Owner().Wrap(id, ownership)};
    }

    Expected<Any> ReadSelector(ValueMarshaller &m, const std::byte *src, const TypeDescriptor &, Ownership)
    {
      SelectorId sel = LoadAt<SelectorId>(src);
      if (!sel)
        return Any{nullptr};
      return Any{Selector{std::string{m.Owner().Runtime().SelectorName(sel)}}};
    }

    Expected<Any> ReadStruct(ValueMarshaller &m, const std::byte *src, const TypeDescriptor &type, Ownership)
    {
      if (auto ok = CheckAggregate(type); !ok)
        return std::unexpected(ok.error());
      const auto offsets = FieldOffsets(type);
      const auto &fields = type.Fields();
      Aggregate out;
      for (NGIN::UIntSize i = 0; i < fields.size(); ++i)
      {
        auto v = m.ReadValue(src + offsets[i], fields[i].type, Ownership::Borrowed);
        if (!v)
          return std::unexpected(v.error());
        out.Set(fields[i].name, std::move(*v));
      }
      return Any{std::move(out)};
    }

    // Union members overlay each other, so only one holds meaningful bits. Scalars
    // are read by value; pointer-like members come back as raw addresses and are
    // never dereferenced.
    Expected<Any> ReadOverlaid(ValueMarshaller &m, const std::byte *src, const TypeDescriptor &type)
    {
      switch (type.Kind())
      {
        case TypeKind::Bool:
        case TypeKind::Integer:
        case TypeKind::Float:
          return m.ReadValue(src, type, Ownership::Borrowed);
        case TypeKind::CString:
        case TypeKind::Object:
        case TypeKind::Class:
        case TypeKind::Block:
        case TypeKind::Selector:
        case TypeKind::Pointer:
        {
          void *p = LoadAt<void *>(src);
          if (!p)
            return Any{nullptr};
          return Any{p};
        }
        case TypeKind::Struct:
        case TypeKind::Union:
        {
          if (auto ok = CheckAggregate(type); !ok)
            return std::unexpected(ok.error());
          const auto offsets = FieldOffsets(type);
          const auto &fields = type.Fields();
          Aggregate out;
          for (NGIN::UIntSize i = 0; i < fields.size(); ++i)
          {
            auto v = ReadOverlaid(m, src + offsets[i], fields[i].type);
            if (!v)
              return std::unexpected(v.error());
            out.Set(fields[i].name, std::move(*v));
          }
          return Any{std::move(out)};
        }
        case TypeKind::Array:
        {
          const auto &element = type.Element();
          std::vector<Any> items;
          items.reserve(type.Length());
          for (NGIN::UIntSize i = 0; i < type.Length(); ++i)
          {
            auto v = ReadOverlaid(m, src + i * element.Size(), element);
            if (!v)
              return std::unexpected(v.error());
            items.push_back(std::move(*v));
          }
          return Any{std::move(items)};
        }
        default:
        {
          Blob blob;
          blob.bytes.assign(src, src + type.Size());
          return Any{std::move(blob)};
        }
      }
    }

    Expected<Any> ReadUnion(ValueMarshaller &m, const std::byte *src, const TypeDescriptor &type, Ownership)
    {
      return ReadOverlaid(m, src, type);
    }

    Expected<Any> ReadArray(ValueMarshaller &m, const std::byte *src, const TypeDescriptor &type, Ownership)
    {
      const auto &element = type.Element();
      std::vector<Any> items;
      items.reserve(type.Length());
      for (NGIN::UIntSize i = 0; i < type.Length(); ++i)
      {
        auto v = m.ReadValue(src + i * element.Size(), element, Ownership::Borrowed);
        if (!v)
          return std::unexpected(v.error());
        items.push_back(std::move(*v));
      }
      return Any{std::move(items)};
    }

    Expected<Any> ReadPointer(ValueMarshaller &, const std::byte *src, const TypeDescriptor &, Ownership)
    {
      void *p = LoadAt<void *>(src);
      if (!p)
        return Any{nullptr};
      return Any{p};
    }

    Expected<Any> ReadUnknown(ValueMarshaller &, const std::byte *src, const TypeDescriptor &type, Ownership)
    {
      Blob blob;
      blob.bytes.assign(src, src + type.Size());
      return Any{std::move(blob)};
    }
  } // namespace

  ValueMarshaller::ValueMarshaller(Bridge &bridge)
      : m_bridge(&bridge)
  {
    auto set = [this](TypeKind kind, WriteFn w, ReadFn r)
    { m_adapters[static_cast<NGIN::UIntSize>(kind)] = SlotAdapter{w, r}; };
    set(TypeKind::Void, &WriteVoid, &ReadVoid);
    set(TypeKind::Bool, &WriteBool, &ReadBool);
    set(TypeKind::Integer, &WriteInteger, &ReadInteger);
    set(TypeKind::Float, &WriteFloat, &ReadFloat);
    set(TypeKind::CString, &WriteCString, &ReadCString);
    set(TypeKind::Object, &WriteObject, &ReadObject);
    set(TypeKind::Class, &WriteObject, &ReadObject);
    set(TypeKind::Block, &WriteObject, &ReadObject);
    set(TypeKind::Selector, &WriteSelector, &ReadSelector);
    set(TypeKind::Struct, &WriteStruct, &ReadStruct);
    set(TypeKind::Union, &WriteUnion, &ReadUnion);
    set(TypeKind::Array, &WriteArray, &ReadArray);
    set(TypeKind::Pointer, &WritePointer, &ReadPointer);
    set(TypeKind::Unknown, &WriteUnknown, &ReadUnknown);
  }

  Expected<void> ValueMarshaller::WriteValue(const Any &host, const TypeDescriptor &type, std::byte *dst, ForeignSlot &owner)
  {
    const auto &adapter = m_adapters[static_cast<NGIN::UIntSize>(type.Kind())];
    return adapter.write(*this, host, type, dst, owner);
  }

  Expected<Any> ValueMarshaller::ReadValue(const std::byte *src, const TypeDescriptor &type, Ownership ownership)
  {
    const auto &adapter = m_adapters[static_cast<NGIN::UIntSize>(type.Kind())];
    return adapter.read(*this, src, type, ownership);
  }

  Expected<ForeignSlot> ValueMarshaller::ToForeign(const Any &host, const TypeDescriptor &type)
  {
    if (type.Kind() == TypeKind::Array)
    {
      // C array parameters are pointers to the first element.
      ForeignSlot slot{sizeof(void *)};
      if (IsNull(host))
      {
        slot.Store<void *>(nullptr);
        return slot;
      }
      auto elements = std::make_shared<ForeignSlot>(std::max<NGIN::UIntSize>(type.Size(), 1));
      if (auto ok = WriteValue(host, type, static_cast<std::byte *>(elements->Data()), *elements); !ok)
        return std::unexpected(ok.error());
      slot.Store<void *>(elements->Data());
      slot.KeepAlive(std::move(elements));
      return slot;
    }

    ForeignSlot slot{std::max<NGIN::UIntSize>(type.Size(), 1)};
    if (auto ok = WriteValue(host, type, static_cast<std::byte *>(slot.Data()), slot); !ok)
      return std::unexpected(ok.error());
    return slot;
  }

  Expected<Any> ValueMarshaller::ToHost(const ForeignSlot &slot, const TypeDescriptor &type, Ownership ownership)
  {
    if (type.Kind() != TypeKind::Void && slot.Size() < type.Size())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "slot smaller than its type", std::string{type.Encoding()}});
    return ReadValue(static_cast<const std::byte *>(slot.Data()), type, ownership);
  }

  Expected<void> ValueMarshaller::ApplyWriteBacks(const ForeignSlot &slot)
  {
    for (const auto &wb : slot.WriteBacks())
    {
      auto v = ReadValue(static_cast<const std::byte *>(wb.pointee->Data()), wb.type, Ownership::Borrowed);
      if (!v)
        return std::unexpected(v.error());
      wb.param.Set(std::move(*v));
    }
    return {};
  }

  Expected<TypeDescriptor> ValueMarshaller::PromotedType(const Any &host)
  {
    if (IsNull(host) || detail::Holds<ProxyHandle>(host))
      return TypeDescriptor::MakeObject();
    if (detail::Holds<std::string>(host) || detail::Holds<const char *>(host))
      return TypeDescriptor::MakeCString();
    if (detail::Holds<Selector>(host))
      return TypeDescriptor::MakeSelector();
    if (detail::Holds<void *>(host))
      return TypeDescriptor::MakePointer(TypeDescriptor::MakeVoid());

    const auto n = ReadNumber(host);
    if (!n)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "value has no variadic promotion"});
    if (n->kind == HostNumber::Kind::Floating)
    {
      if (detail::Holds<long double>(host))
        return TypeDescriptor::MakeFloat(sizeof(long double));
      return TypeDescriptor::MakeFloat(sizeof(double));
    }
    // Integers narrower than int promote to int; wider ones keep their width.
    const bool wide = detail::Holds<std::int64_t>(host) || detail::Holds<std::uint64_t>(host) || detail::Holds<long long>(host) ||
                      detail::Holds<unsigned long long>(host) || detail::Holds<long>(host) || detail::Holds<unsigned long>(host);
    const bool isUnsigned = n->kind == HostNumber::Kind::Unsigned && (wide || detail::Holds<unsigned int>(host));
    return TypeDescriptor::MakeInteger(wide ? 8 : 4, !isUnsigned);
  }

  void ValueMarshaller::RegisterBoxing(NGIN::UInt64 typeId, BoxingAdapter adapter)
  {
    std::unique_lock lock{m_boxingMutex};
    if (auto *existing = m_boxing.GetPtr(typeId))
      *existing = std::move(adapter);
    else
      m_boxing.Insert(typeId, std::move(adapter));
  }

  bool ValueMarshaller::HasBoxing(NGIN::UInt64 typeId) const
  {
    std::shared_lock lock{m_boxingMutex};
    return m_boxing.GetPtr(typeId) != nullptr;
  }

  Expected<ProxyHandle> ValueMarshaller::Box(const Any &host)
  {
    BoxingAdapter adapter;
    {
      std::shared_lock lock{m_boxingMutex};
      if (auto *p = m_boxing.GetPtr(host.GetTypeId()))
        adapter = *p;
    }
    if (!adapter)
      return std::unexpected(Error{ErrorCode::UnsupportedType, "no boxing adapter for host type"});
    return adapter(*m_bridge, host);
  }

  SelectorId ValueMarshaller::SelectorFor(std::string_view name)
  {
    std::lock_guard lock{m_selectorMutex};
    NGIN::Utilities::StringInterner<>::IdType id{};
    if (m_selectorNames.TryGetId(name, id))
    {
      if (auto *p = m_selectors.GetPtr(static_cast<NameId>(id)))
        return *p;
    }
    SelectorId sel = m_bridge->Runtime().RegisterSelector(name);
    const auto nid = static_cast<NameId>(m_selectorNames.InsertOrGet(name));
    if (nid != InvalidNameId)
      m_selectors.Insert(nid, sel);
    return sel;
  }

} // namespace ObjBridge
