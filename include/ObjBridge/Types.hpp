// Types.hpp
// Public-facing error codes, opaque foreign handles and shared aliases
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Utilities/Any.hpp>
#include <NGIN/Meta/TypeName.hpp>
#include <NGIN/Hashing/FNV.hpp>

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace ObjBridge
{

  using Any = NGIN::Utilities::Any<>;
  using NameId = NGIN::UInt32;

  // Opaque foreign handles. The runtime owns what they point at.
  using ObjectId = void *;
  using ClassId = void *;
  using ProtocolId = void *;
  using SelectorId = const void *;
  using Imp = void (*)();

  enum class ErrorCode : unsigned
  {
    NotFound = 1,
    InvalidArgument = 2,
    DecodeError = 3,
    ArgumentRange = 4,
    FieldMismatch = 5,
    EncodingError = 6,
    NoSuchMember = 7,
    NoSignature = 8,
    UnsupportedType = 9,
    ForeignException = 10,
    ThreadAffinityViolation = 11,
  };

  [[nodiscard]] constexpr std::string_view ToString(ErrorCode code) noexcept
  {
    switch (code)
    {
      case ErrorCode::NotFound: return "NotFound";
      case ErrorCode::InvalidArgument: return "InvalidArgument";
      case ErrorCode::DecodeError: return "DecodeError";
      case ErrorCode::ArgumentRange: return "ArgumentRangeError";
      case ErrorCode::FieldMismatch: return "FieldMismatchError";
      case ErrorCode::EncodingError: return "EncodingError";
      case ErrorCode::NoSuchMember: return "NoSuchMemberError";
      case ErrorCode::NoSignature: return "NoSignature";
      case ErrorCode::UnsupportedType: return "UnsupportedType";
      case ErrorCode::ForeignException: return "ForeignException";
      case ErrorCode::ThreadAffinityViolation: return "ThreadAffinityViolation";
    }
    return "Unknown";
  }

  struct Error
  {
    static constexpr NGIN::UIntSize NoArgument = static_cast<NGIN::UIntSize>(-1);

    ErrorCode code{ErrorCode::InvalidArgument};
    std::string_view message{};
    // Name, selector or encoding the error is about. For ForeignException this is the
    // reason reported by the foreign runtime.
    std::string subject{};
    NGIN::UIntSize argIndex{NoArgument};

    Error() = default;
    Error(ErrorCode c, std::string_view m) : code(c), message(m) {}
    Error(ErrorCode c, std::string_view m, std::string s) : code(c), message(m), subject(std::move(s)) {}

    [[nodiscard]] Error AtArgument(NGIN::UIntSize index) const
    {
      Error e = *this;
      e.argIndex = index;
      return e;
    }

    // "<code>: <message> (<subject>)", for logs and test failure output
    [[nodiscard]] std::string Describe() const
    {
      std::string out{ToString(code)};
      out += ": ";
      out += message;
      if (!subject.empty())
      {
        out += " (";
        out += subject;
        out += ')';
      }
      if (argIndex != NoArgument)
      {
        out += " at argument ";
        out += std::to_string(argIndex);
      }
      return out;
    }
  };

  template <class T>
  using Expected = std::expected<T, Error>;

  namespace detail
  {
    template <class T>
    inline NGIN::UInt64 TypeIdOf()
    {
      auto sv = NGIN::Meta::TypeName<std::remove_cv_t<std::remove_reference_t<T>>>::qualifiedName;
      return NGIN::Hashing::FNV1a64(sv.data(), sv.size());
    }

    template <class T>
    inline bool Holds(const Any &value)
    {
      return value.GetTypeId() == TypeIdOf<T>();
    }
  } // namespace detail

  // Host-side value kinds the marshaller understands besides arithmetic types,
  // std::string, std::nullptr_t and ProxyHandle.

  // Named selector; distinguishes a selector argument from a string to be boxed.
  struct Selector
  {
    std::string name;
    friend bool operator==(const Selector &, const Selector &) = default;
  };

  // Opaque bytes carried through Unknown-typed slots.
  struct Blob
  {
    std::vector<std::byte> bytes;
    friend bool operator==(const Blob &, const Blob &) = default;
  };

  // Host rendition of a foreign struct or union: ordered (name, value) pairs.
  class Aggregate
  {
  public:
    struct Member
    {
      std::string name;
      Any value;
    };

    Aggregate() = default;

    Aggregate &Set(std::string_view name, Any value)
    {
      for (auto &m : m_members)
      {
        if (m.name == name)
        {
          m.value = std::move(value);
          return *this;
        }
      }
      m_members.push_back(Member{std::string{name}, std::move(value)});
      return *this;
    }

    [[nodiscard]] const Any *Find(std::string_view name) const
    {
      for (const auto &m : m_members)
        if (m.name == name)
          return &m.value;
      return nullptr;
    }

    template <class T>
    [[nodiscard]] std::optional<T> Get(std::string_view name) const
    {
      const Any *v = Find(name);
      if (!v || !detail::Holds<T>(*v))
        return std::nullopt;
      return v->template Cast<T>();
    }

    [[nodiscard]] NGIN::UIntSize Size() const noexcept { return m_members.size(); }
    [[nodiscard]] const Member &At(NGIN::UIntSize i) const { return m_members[i]; }

  private:
    std::vector<Member> m_members;
  };

} // namespace ObjBridge
