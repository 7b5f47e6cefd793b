// Encoding.hpp
// Type-encoding grammar: descriptors for values, method signatures and property attributes
#pragma once

#include <NGIN/Primitives.hpp>

#include <ObjBridge/Export.hpp>
#include <ObjBridge/Types.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace ObjBridge
{

  enum class TypeKind : NGIN::UInt8
  {
    Void,
    Bool,
    Integer,
    Float,
    CString,
    Object,
    Class,
    Selector,
    Block,
    Struct,
    Union,
    Array,
    Pointer,
    Unknown,
  };

  [[nodiscard]] OBJBRIDGE_API std::string_view ToString(TypeKind kind) noexcept;

  // Method/parameter qualifiers that may prefix an encoding ("r^v", "o^@", "Vv").
  enum TypeQualifier : NGIN::UInt8
  {
    QualifierNone = 0,
    QualifierConst = 1u << 0,
    QualifierIn = 1u << 1,
    QualifierInOut = 1u << 2,
    QualifierOut = 1u << 3,
    QualifierByCopy = 1u << 4,
    QualifierByRef = 1u << 5,
    QualifierOneWay = 1u << 6,
    QualifierAtomic = 1u << 7,
  };

  namespace detail
  {
    struct TypeNode;
    struct NodeAccess;
  } // namespace detail

  struct FieldDescriptor;

  // Immutable decoded type. Copies share one node; equality compares encodings.
  class OBJBRIDGE_API TypeDescriptor
  {
  public:
    TypeDescriptor();

    static TypeDescriptor MakeVoid();
    static TypeDescriptor MakeBool();
    static TypeDescriptor MakeInteger(NGIN::UIntSize width, bool isSigned);
    static TypeDescriptor MakeFloat(NGIN::UIntSize width);
    static TypeDescriptor MakeCString();
    static TypeDescriptor MakeObject(std::string_view classHint = {});
    static TypeDescriptor MakeClass();
    static TypeDescriptor MakeSelector();
    static TypeDescriptor MakeBlock();
    static TypeDescriptor MakePointer(TypeDescriptor pointee);
    static TypeDescriptor MakeArray(TypeDescriptor element, NGIN::UIntSize length);
    static TypeDescriptor MakeStruct(std::string_view name, std::vector<FieldDescriptor> fields);
    static TypeDescriptor MakeUnion(std::string_view name, std::vector<FieldDescriptor> fields);
    static TypeDescriptor MakeUnknown(std::string_view raw);

    [[nodiscard]] TypeKind Kind() const noexcept;
    [[nodiscard]] std::string_view Encoding() const noexcept;
    [[nodiscard]] NGIN::UInt8 Qualifiers() const noexcept;
    [[nodiscard]] bool HasQualifier(TypeQualifier q) const noexcept { return (Qualifiers() & q) != 0; }

    // Integer/Float/Bool width in bytes; 0 for other kinds.
    [[nodiscard]] NGIN::UIntSize Width() const noexcept;
    [[nodiscard]] bool IsSigned() const noexcept;

    // Struct/union tag, or the class hint of @"Name". Empty when absent.
    [[nodiscard]] std::string_view Name() const noexcept;

    // Struct/union members. Opaque aggregates ("{Foo}") have no field list.
    [[nodiscard]] bool HasFieldList() const noexcept;
    [[nodiscard]] const std::vector<FieldDescriptor> &Fields() const noexcept;

    // Pointee of Pointer, element of Array.
    [[nodiscard]] const TypeDescriptor &Element() const noexcept;
    [[nodiscard]] NGIN::UIntSize Length() const noexcept;

    // Natural C layout. Opaque aggregates report size 0.
    [[nodiscard]] NGIN::UIntSize Size() const noexcept;
    [[nodiscard]] NGIN::UIntSize Alignment() const noexcept;

    // Object, Class and Block slots all carry a foreign object reference.
    [[nodiscard]] bool IsObjectLike() const noexcept;

    [[nodiscard]] TypeDescriptor WithQualifiers(NGIN::UInt8 qualifiers, std::string_view prefix) const;

    friend bool operator==(const TypeDescriptor &a, const TypeDescriptor &b) noexcept
    {
      return a.Encoding() == b.Encoding();
    }

  private:
    friend struct detail::NodeAccess;
    explicit TypeDescriptor(std::shared_ptr<const detail::TypeNode> node) : m_node(std::move(node)) {}

    std::shared_ptr<const detail::TypeNode> m_node;
  };

  struct FieldDescriptor
  {
    std::string name;
    TypeDescriptor type;
  };

  struct MethodSignature
  {
    TypeDescriptor returnType;
    std::vector<TypeDescriptor> arguments;
    bool isVariadic{false};
    std::string encoding;

    [[nodiscard]] NGIN::UIntSize ArgumentCount() const noexcept { return arguments.size(); }
  };

  enum PropertyFlag : NGIN::UInt8
  {
    PropertyNone = 0,
    PropertyReadOnly = 1u << 0,
    PropertyCopy = 1u << 1,
    PropertyRetain = 1u << 2,
    PropertyNonAtomic = 1u << 3,
    PropertyWeak = 1u << 4,
    PropertyDynamic = 1u << 5,
    PropertyGarbageCollected = 1u << 6,
  };

  struct PropertyAttributes
  {
    TypeDescriptor type;
    NGIN::UInt8 flags{PropertyNone};
    std::string getter; // custom getter selector, empty for the default
    std::string setter; // custom setter selector, empty for the default
    std::string ivar;   // backing instance variable, empty when none

    [[nodiscard]] bool Has(PropertyFlag f) const noexcept { return (flags & f) != 0; }
  };

  // Decodes one complete type encoding. Empty input, truncation and trailing
  // characters are DecodeError; unrecognised type codes decode as Unknown.
  [[nodiscard]] OBJBRIDGE_API Expected<TypeDescriptor> Decode(std::string_view encoding);

  // Decodes the longest type prefix of `encoding`, reporting how many characters it used.
  [[nodiscard]] OBJBRIDGE_API Expected<TypeDescriptor> DecodePrefix(std::string_view encoding, NGIN::UIntSize &consumed);

  // Decodes "ret off recv off sel off arg off..." and drops the receiver and selector
  // slots. Fails unless exactly `argCount` arguments remain.
  [[nodiscard]] OBJBRIDGE_API Expected<MethodSignature> DecodeMethodEncoding(std::string_view encoding, NGIN::UIntSize argCount);

  // Byte offset of each field of a struct with a field list (all zero for unions),
  // using the same natural layout as Size() and Alignment().
  [[nodiscard]] OBJBRIDGE_API std::vector<NGIN::UIntSize> FieldOffsets(const TypeDescriptor &aggregate);

  // Decodes a property attribute list such as `T@"Name",&,N,V_name`.
  [[nodiscard]] OBJBRIDGE_API Expected<PropertyAttributes> DecodePropertyAttributes(std::string_view attributes);

} // namespace ObjBridge
