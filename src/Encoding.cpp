#include <ObjBridge/Encoding.hpp>

#include <algorithm>
#include <charconv>
#include <limits>

namespace ObjBridge
{
  namespace detail
  {
    struct TypeNode
    {
      TypeKind kind{TypeKind::Void};
      std::string encoding;
      NGIN::UInt8 qualifiers{QualifierNone};
      NGIN::UIntSize width{0};
      bool isSigned{false};
      std::string name;
      bool hasFieldList{false};
      std::vector<FieldDescriptor> fields;
      std::vector<TypeDescriptor> element; // pointee or array element, at most one
      NGIN::UIntSize length{0};
      NGIN::UIntSize size{0};
      NGIN::UIntSize alignment{1};
    };

    struct NodeAccess
    {
      static TypeDescriptor Wrap(std::shared_ptr<const TypeNode> node) { return TypeDescriptor{std::move(node)}; }
      static const TypeNode &Node(const TypeDescriptor &d) { return *d.m_node; }
    };
  } // namespace detail

  namespace
  {
    using detail::NodeAccess;
    using detail::TypeNode;

    constexpr NGIN::UIntSize kPointerSize = sizeof(void *);
    constexpr NGIN::UIntSize kPointerAlign = alignof(void *);

    NGIN::UIntSize AlignUp(NGIN::UIntSize v, NGIN::UIntSize a)
    {
      return a == 0 ? v : (v + a - 1) / a * a;
    }

    const std::shared_ptr<const TypeNode> &VoidNode()
    {
      static const std::shared_ptr<const TypeNode> s_void = []
      {
        auto n = std::make_shared<TypeNode>();
        n->kind = TypeKind::Void;
        n->encoding = "v";
        return std::shared_ptr<const TypeNode>{std::move(n)};
      }();
      return s_void;
    }

    std::shared_ptr<TypeNode> Scalar(TypeKind kind, std::string encoding, NGIN::UIntSize size, NGIN::UIntSize align)
    {
      auto n = std::make_shared<TypeNode>();
      n->kind = kind;
      n->encoding = std::move(encoding);
      n->size = size;
      n->alignment = align;
      return n;
    }

    std::shared_ptr<TypeNode> IntegerNode(char code, NGIN::UIntSize width, bool isSigned)
    {
      auto n = Scalar(TypeKind::Integer, std::string(1, code), width, width);
      n->width = width;
      n->isSigned = isSigned;
      return n;
    }

    char IntegerCode(NGIN::UIntSize width, bool isSigned)
    {
      switch (width)
      {
        case 1: return isSigned ? 'c' : 'C';
        case 2: return isSigned ? 's' : 'S';
        case 4: return isSigned ? 'i' : 'I';
        default: return isSigned ? 'q' : 'Q';
      }
    }

    void LayoutAggregate(TypeNode &n, bool isUnion)
    {
      NGIN::UIntSize size = 0;
      NGIN::UIntSize align = 1;
      for (const auto &f : n.fields)
      {
        const auto fa = f.type.Alignment();
        const auto fs = f.type.Size();
        align = std::max(align, fa);
        if (isUnion)
          size = std::max(size, fs);
        else
          size = AlignUp(size, fa) + fs;
      }
      n.alignment = align;
      n.size = AlignUp(size, align);
    }

    std::shared_ptr<TypeNode> AggregateNode(bool isUnion, std::string_view name, std::string encoding,
                                            std::vector<FieldDescriptor> fields, bool hasFieldList)
    {
      auto n = std::make_shared<TypeNode>();
      n->kind = isUnion ? TypeKind::Union : TypeKind::Struct;
      n->name = std::string{name};
      n->encoding = std::move(encoding);
      n->hasFieldList = hasFieldList;
      n->fields = std::move(fields);
      if (hasFieldList)
        LayoutAggregate(*n, isUnion);
      return n;
    }

    std::string AggregateEncoding(char open, char close, std::string_view name, const std::vector<FieldDescriptor> &fields)
    {
      std::string enc;
      enc += open;
      enc += name.empty() ? std::string_view{"?"} : name;
      enc += '=';
      for (const auto &f : fields)
      {
        enc += '"';
        enc += f.name;
        enc += '"';
        enc += f.type.Encoding();
      }
      enc += close;
      return enc;
    }

    NGIN::UInt8 QualifierFor(char c)
    {
      switch (c)
      {
        case 'r': return QualifierConst;
        case 'n': return QualifierIn;
        case 'N': return QualifierInOut;
        case 'o': return QualifierOut;
        case 'O': return QualifierByCopy;
        case 'R': return QualifierByRef;
        case 'V': return QualifierOneWay;
        case 'A': return QualifierAtomic;
        default: return QualifierNone;
      }
    }

    // Characters that can only appear inside or after a type, never start one.
    bool IsStructural(char c)
    {
      return (c >= '0' && c <= '9') || c == '}' || c == ')' || c == ']' || c == '>' || c == '=' || c == '"' ||
             c == ',' || c == '+' || c == '-' || static_cast<unsigned char>(c) <= ' ';
    }

    bool IsDigit(char c) { return c >= '0' && c <= '9'; }

    // Single-pass recursive descent over one encoding string.
    class Parser
    {
    public:
      explicit Parser(std::string_view src) : m_src(src) {}

      [[nodiscard]] NGIN::UIntSize Position() const noexcept { return m_pos; }
      [[nodiscard]] bool AtEnd() const noexcept { return m_pos >= m_src.size(); }

      Expected<TypeDescriptor> ParseType()
      {
        const auto start = m_pos;
        NGIN::UInt8 qualifiers = QualifierNone;
        while (m_pos + 1 < m_src.size())
        {
          const auto q = QualifierFor(m_src[m_pos]);
          if (q == QualifierNone)
            break;
          qualifiers = static_cast<NGIN::UInt8>(qualifiers | q);
          ++m_pos;
        }
        if (AtEnd())
          return std::unexpected(Fail("truncated type encoding"));

        auto base = ParseUnqualified();
        if (!base || qualifiers == QualifierNone)
          return base;
        return base->WithQualifiers(qualifiers, m_src.substr(start, m_pos - start));
      }

      // Frame offsets after each slot of a method encoding: [+-]digits.
      void SkipOffset()
      {
        if (!AtEnd() && (m_src[m_pos] == '+' || m_src[m_pos] == '-'))
          ++m_pos;
        while (!AtEnd() && IsDigit(m_src[m_pos]))
          ++m_pos;
      }

      [[nodiscard]] Error Fail(std::string_view why) const
      {
        return Error{ErrorCode::DecodeError, why, std::string{m_src}};
      }

    private:
      Expected<TypeDescriptor> ParseUnqualified()
      {
        const auto start = m_pos;
        const char c = m_src[m_pos++];
        switch (c)
        {
          case 'c': return TypeDescriptor::MakeInteger(1, true);
          case 'C': return TypeDescriptor::MakeInteger(1, false);
          case 's': return TypeDescriptor::MakeInteger(2, true);
          case 'S': return TypeDescriptor::MakeInteger(2, false);
          case 'i': return TypeDescriptor::MakeInteger(4, true);
          case 'I': return TypeDescriptor::MakeInteger(4, false);
          // 'l'/'L' are always 32-bit; they keep their own code so encodings round-trip.
          case 'l': return NodeAccess::Wrap(IntegerNode('l', 4, true));
          case 'L': return NodeAccess::Wrap(IntegerNode('L', 4, false));
          case 'q': return TypeDescriptor::MakeInteger(8, true);
          case 'Q': return TypeDescriptor::MakeInteger(8, false);
          case 'f': return TypeDescriptor::MakeFloat(4);
          case 'd': return TypeDescriptor::MakeFloat(8);
          case 'D': return TypeDescriptor::MakeFloat(sizeof(long double));
          case 'B': return TypeDescriptor::MakeBool();
          case 'v': return TypeDescriptor::MakeVoid();
          case '*': return TypeDescriptor::MakeCString();
          case '#': return TypeDescriptor::MakeClass();
          case ':': return TypeDescriptor::MakeSelector();
          case '@': return ParseObject();
          case '^':
          {
            if (AtEnd())
              return std::unexpected(Fail("pointer without pointee"));
            auto pointee = ParseType();
            if (!pointee)
              return pointee;
            return TypeDescriptor::MakePointer(*pointee);
          }
          case '[': return ParseArray();
          case '{': return ParseAggregate('}', false);
          case '(': return ParseAggregate(')', true);
          case 'b':
          {
            // Bitfield layout is not modelled; the slot degrades to Unknown.
            const auto digits = m_pos;
            while (!AtEnd() && IsDigit(m_src[m_pos]))
              ++m_pos;
            if (digits == m_pos)
              return std::unexpected(Fail("bitfield without width"));
            return TypeDescriptor::MakeUnknown(m_src.substr(start, m_pos - start));
          }
          case 'j':
          {
            if (AtEnd())
              return std::unexpected(Fail("complex without element type"));
            auto inner = ParseType();
            if (!inner)
              return inner;
            return TypeDescriptor::MakeUnknown(m_src.substr(start, m_pos - start));
          }
          default:
            break;
        }
        if (IsStructural(c))
          return std::unexpected(Fail("unexpected character at start of type"));
        return TypeDescriptor::MakeUnknown(m_src.substr(start, 1));
      }

      Expected<TypeDescriptor> ParseObject()
      {
        if (AtEnd())
          return TypeDescriptor::MakeObject();
        if (m_src[m_pos] == '?')
        {
          ++m_pos;
          // Extended block signature "@?<v@?>" stays opaque.
          if (!AtEnd() && m_src[m_pos] == '<')
          {
            int depth = 0;
            do
            {
              if (m_src[m_pos] == '<')
                ++depth;
              else if (m_src[m_pos] == '>')
                --depth;
              ++m_pos;
            } while (!AtEnd() && depth > 0);
            if (depth != 0)
              return std::unexpected(Fail("unterminated block signature"));
          }
          return TypeDescriptor::MakeBlock();
        }
        if (m_src[m_pos] == '"' && ClassHintFollows())
        {
          const auto close = m_src.find('"', m_pos + 1);
          if (close == std::string_view::npos)
            return std::unexpected(Fail("unterminated class name"));
          auto hint = m_src.substr(m_pos + 1, close - m_pos - 1);
          m_pos = close + 1;
          return TypeDescriptor::MakeObject(hint);
        }
        return TypeDescriptor::MakeObject();
      }

      // Inside a named field list `@"x"` may be a class hint or the next field's name.
      // It is a hint only when another field name or the closing delimiter follows it.
      [[nodiscard]] bool ClassHintFollows() const
      {
        if (m_namedFieldDepth == 0)
          return true;
        const auto close = m_src.find('"', m_pos + 1);
        if (close == std::string_view::npos || close + 1 >= m_src.size())
          return true;
        const char c = m_src[close + 1];
        return c == '"' || c == '}' || c == ')';
      }

      Expected<TypeDescriptor> ParseArray()
      {
        NGIN::UIntSize length = 0;
        const char *begin = m_src.data() + m_pos;
        const char *end = m_src.data() + m_src.size();
        auto [ptr, ec] = std::from_chars(begin, end, length);
        if (ec != std::errc{} || ptr == begin)
          return std::unexpected(Fail("array without length"));
        m_pos += static_cast<NGIN::UIntSize>(ptr - begin);
        if (AtEnd())
          return std::unexpected(Fail("truncated array"));
        auto element = ParseType();
        if (!element)
          return element;
        if (AtEnd() || m_src[m_pos] != ']')
          return std::unexpected(Fail("unterminated array"));
        ++m_pos;
        if (element->Size() != 0 && length > std::numeric_limits<NGIN::UIntSize>::max() / element->Size())
          return std::unexpected(Fail("array size overflows"));
        return TypeDescriptor::MakeArray(*element, length);
      }

      Expected<TypeDescriptor> ParseAggregate(char close, bool isUnion)
      {
        const auto open = m_pos - 1;
        const auto nameStart = m_pos;
        while (!AtEnd() && m_src[m_pos] != '=' && m_src[m_pos] != close)
          ++m_pos;
        if (AtEnd())
          return std::unexpected(Fail(isUnion ? "unterminated union" : "unterminated struct"));
        auto name = m_src.substr(nameStart, m_pos - nameStart);
        if (name == "?")
          name = {};

        if (m_src[m_pos] == close)
        {
          ++m_pos;
          return NodeAccess::Wrap(AggregateNode(isUnion, name, std::string{m_src.substr(open, m_pos - open)}, {}, false));
        }

        ++m_pos; // '='
        std::vector<FieldDescriptor> fields;
        while (true)
        {
          if (AtEnd())
            return std::unexpected(Fail(isUnion ? "unterminated union" : "unterminated struct"));
          if (m_src[m_pos] == close)
          {
            ++m_pos;
            break;
          }
          std::string fieldName;
          bool named = false;
          if (m_src[m_pos] == '"')
          {
            const auto endQuote = m_src.find('"', m_pos + 1);
            if (endQuote == std::string_view::npos)
              return std::unexpected(Fail("unterminated field name"));
            fieldName = std::string{m_src.substr(m_pos + 1, endQuote - m_pos - 1)};
            m_pos = endQuote + 1;
            named = true;
          }
          if (fieldName.empty())
            fieldName = "_field_" + std::to_string(fields.size());

          if (named)
            ++m_namedFieldDepth;
          auto type = ParseType();
          if (named)
            --m_namedFieldDepth;
          if (!type)
            return type;
          fields.push_back(FieldDescriptor{std::move(fieldName), *type});
        }

        return NodeAccess::Wrap(
            AggregateNode(isUnion, name, std::string{m_src.substr(open, m_pos - open)}, std::move(fields), true));
      }

      std::string_view m_src;
      NGIN::UIntSize m_pos{0};
      int m_namedFieldDepth{0};
    };
  } // namespace

  std::string_view ToString(TypeKind kind) noexcept
  {
    switch (kind)
    {
      case TypeKind::Void: return "Void";
      case TypeKind::Bool: return "Bool";
      case TypeKind::Integer: return "Integer";
      case TypeKind::Float: return "Float";
      case TypeKind::CString: return "CString";
      case TypeKind::Object: return "ObjectRef";
      case TypeKind::Class: return "ClassRef";
      case TypeKind::Selector: return "SelectorRef";
      case TypeKind::Block: return "Block";
      case TypeKind::Struct: return "Struct";
      case TypeKind::Union: return "Union";
      case TypeKind::Array: return "Array";
      case TypeKind::Pointer: return "Pointer";
      case TypeKind::Unknown: return "Unknown";
    }
    return "Unknown";
  }

  // TypeDescriptor

  TypeDescriptor::TypeDescriptor() : m_node(VoidNode()) {}

  TypeDescriptor TypeDescriptor::MakeVoid() { return TypeDescriptor{VoidNode()}; }

  TypeDescriptor TypeDescriptor::MakeBool()
  {
    auto n = Scalar(TypeKind::Bool, "B", 1, 1);
    n->width = 1;
    return TypeDescriptor{std::move(n)};
  }

  TypeDescriptor TypeDescriptor::MakeInteger(NGIN::UIntSize width, bool isSigned)
  {
    if (width != 1 && width != 2 && width != 4)
      width = 8;
    return TypeDescriptor{IntegerNode(IntegerCode(width, isSigned), width, isSigned)};
  }

  TypeDescriptor TypeDescriptor::MakeFloat(NGIN::UIntSize width)
  {
    std::shared_ptr<TypeNode> n;
    if (width == 4)
      n = Scalar(TypeKind::Float, "f", sizeof(float), alignof(float));
    else if (width == 8)
      n = Scalar(TypeKind::Float, "d", sizeof(double), alignof(double));
    else
      n = Scalar(TypeKind::Float, "D", sizeof(long double), alignof(long double));
    n->width = n->size;
    n->isSigned = true;
    return TypeDescriptor{std::move(n)};
  }

  TypeDescriptor TypeDescriptor::MakeCString()
  {
    return TypeDescriptor{Scalar(TypeKind::CString, "*", kPointerSize, kPointerAlign)};
  }

  TypeDescriptor TypeDescriptor::MakeObject(std::string_view classHint)
  {
    std::string enc = "@";
    if (!classHint.empty())
    {
      enc += '"';
      enc += classHint;
      enc += '"';
    }
    auto n = Scalar(TypeKind::Object, std::move(enc), kPointerSize, kPointerAlign);
    n->name = std::string{classHint};
    return TypeDescriptor{std::move(n)};
  }

  TypeDescriptor TypeDescriptor::MakeClass()
  {
    return TypeDescriptor{Scalar(TypeKind::Class, "#", kPointerSize, kPointerAlign)};
  }

  TypeDescriptor TypeDescriptor::MakeSelector()
  {
    return TypeDescriptor{Scalar(TypeKind::Selector, ":", kPointerSize, kPointerAlign)};
  }

  TypeDescriptor TypeDescriptor::MakeBlock()
  {
    return TypeDescriptor{Scalar(TypeKind::Block, "@?", kPointerSize, kPointerAlign)};
  }

  TypeDescriptor TypeDescriptor::MakePointer(TypeDescriptor pointee)
  {
    auto n = Scalar(TypeKind::Pointer, "^" + std::string{pointee.Encoding()}, kPointerSize, kPointerAlign);
    n->element.push_back(std::move(pointee));
    return TypeDescriptor{std::move(n)};
  }

  TypeDescriptor TypeDescriptor::MakeArray(TypeDescriptor element, NGIN::UIntSize length)
  {
    auto n = Scalar(TypeKind::Array, "[" + std::to_string(length) + std::string{element.Encoding()} + "]",
                    element.Size() * length, element.Alignment());
    n->length = length;
    n->element.push_back(std::move(element));
    return TypeDescriptor{std::move(n)};
  }

  TypeDescriptor TypeDescriptor::MakeStruct(std::string_view name, std::vector<FieldDescriptor> fields)
  {
    auto enc = AggregateEncoding('{', '}', name, fields);
    return TypeDescriptor{AggregateNode(false, name, std::move(enc), std::move(fields), true)};
  }

  TypeDescriptor TypeDescriptor::MakeUnion(std::string_view name, std::vector<FieldDescriptor> fields)
  {
    auto enc = AggregateEncoding('(', ')', name, fields);
    return TypeDescriptor{AggregateNode(true, name, std::move(enc), std::move(fields), true)};
  }

  TypeDescriptor TypeDescriptor::MakeUnknown(std::string_view raw)
  {
    // Unknown slots travel as pointer-sized opaque words.
    return TypeDescriptor{Scalar(TypeKind::Unknown, std::string{raw}, kPointerSize, kPointerAlign)};
  }

  TypeKind TypeDescriptor::Kind() const noexcept { return m_node->kind; }
  std::string_view TypeDescriptor::Encoding() const noexcept { return m_node->encoding; }
  NGIN::UInt8 TypeDescriptor::Qualifiers() const noexcept { return m_node->qualifiers; }
  NGIN::UIntSize TypeDescriptor::Width() const noexcept { return m_node->width; }
  bool TypeDescriptor::IsSigned() const noexcept { return m_node->isSigned; }
  std::string_view TypeDescriptor::Name() const noexcept { return m_node->name; }
  bool TypeDescriptor::HasFieldList() const noexcept { return m_node->hasFieldList; }
  const std::vector<FieldDescriptor> &TypeDescriptor::Fields() const noexcept { return m_node->fields; }

  const TypeDescriptor &TypeDescriptor::Element() const noexcept
  {
    if (m_node->element.empty())
    {
      static const TypeDescriptor s_void{};
      return s_void;
    }
    return m_node->element.front();
  }

  NGIN::UIntSize TypeDescriptor::Length() const noexcept { return m_node->length; }
  NGIN::UIntSize TypeDescriptor::Size() const noexcept { return m_node->size; }
  NGIN::UIntSize TypeDescriptor::Alignment() const noexcept { return m_node->alignment; }

  bool TypeDescriptor::IsObjectLike() const noexcept
  {
    return m_node->kind == TypeKind::Object || m_node->kind == TypeKind::Class || m_node->kind == TypeKind::Block;
  }

  TypeDescriptor TypeDescriptor::WithQualifiers(NGIN::UInt8 qualifiers, std::string_view encoding) const
  {
    if (qualifiers == QualifierNone)
      return *this;
    auto n = std::make_shared<TypeNode>(*m_node);
    n->qualifiers = static_cast<NGIN::UInt8>(n->qualifiers | qualifiers);
    n->encoding = std::string{encoding};
    return TypeDescriptor{std::move(n)};
  }

  // Decoding entry points

  Expected<TypeDescriptor> DecodePrefix(std::string_view encoding, NGIN::UIntSize &consumed)
  {
    consumed = 0;
    if (encoding.empty())
      return std::unexpected(Error{ErrorCode::DecodeError, "empty type encoding"});
    Parser p{encoding};
    auto t = p.ParseType();
    if (t)
      consumed = p.Position();
    return t;
  }

  Expected<TypeDescriptor> Decode(std::string_view encoding)
  {
    NGIN::UIntSize consumed = 0;
    auto t = DecodePrefix(encoding, consumed);
    if (!t)
      return t;
    if (consumed != encoding.size())
      return std::unexpected(Error{ErrorCode::DecodeError, "trailing characters after type", std::string{encoding}});
    return t;
  }

  Expected<MethodSignature> DecodeMethodEncoding(std::string_view encoding, NGIN::UIntSize argCount)
  {
    if (encoding.empty())
      return std::unexpected(Error{ErrorCode::DecodeError, "empty method encoding"});

    Parser p{encoding};
    std::vector<TypeDescriptor> slots;
    slots.reserve(argCount + 3);
    while (!p.AtEnd())
    {
      auto t = p.ParseType();
      if (!t)
        return std::unexpected(t.error());
      slots.push_back(std::move(*t));
      p.SkipOffset();
    }

    // Return type, receiver, selector.
    if (slots.size() < 3)
      return std::unexpected(p.Fail("method encoding lacks receiver or selector slot"));
    const auto &receiver = slots[1];
    if (receiver.Kind() != TypeKind::Object && receiver.Kind() != TypeKind::Class)
      return std::unexpected(p.Fail("first implicit slot is not an object"));
    if (slots[2].Kind() != TypeKind::Selector)
      return std::unexpected(p.Fail("second implicit slot is not a selector"));

    const auto declared = slots.size() - 3;
    if (declared != argCount)
    {
      Error e = p.Fail("argument count does not match encoding");
      e.argIndex = declared;
      return std::unexpected(std::move(e));
    }

    MethodSignature sig{};
    sig.returnType = std::move(slots[0]);
    sig.arguments.reserve(declared);
    for (NGIN::UIntSize i = 3; i < slots.size(); ++i)
      sig.arguments.push_back(std::move(slots[i]));
    sig.encoding = std::string{encoding};
    return sig;
  }

  std::vector<NGIN::UIntSize> FieldOffsets(const TypeDescriptor &aggregate)
  {
    std::vector<NGIN::UIntSize> offsets;
    offsets.reserve(aggregate.Fields().size());
    const bool isUnion = aggregate.Kind() == TypeKind::Union;
    NGIN::UIntSize size = 0;
    for (const auto &f : aggregate.Fields())
    {
      if (isUnion)
      {
        offsets.push_back(0);
        continue;
      }
      size = AlignUp(size, f.type.Alignment());
      offsets.push_back(size);
      size += f.type.Size();
    }
    return offsets;
  }

  Expected<PropertyAttributes> DecodePropertyAttributes(std::string_view attributes)
  {
    PropertyAttributes out{};
    bool sawType = false;
    NGIN::UIntSize pos = 0;
    while (pos < attributes.size())
    {
      const char code = attributes[pos++];
      if (code == 'T')
      {
        NGIN::UIntSize used = 0;
        auto t = DecodePrefix(attributes.substr(pos), used);
        if (!t)
          return std::unexpected(Error{ErrorCode::DecodeError, t.error().message, std::string{attributes}});
        out.type = std::move(*t);
        sawType = true;
        pos += used;
      }
      else
      {
        const auto comma = attributes.find(',', pos);
        const auto end = comma == std::string_view::npos ? attributes.size() : comma;
        const auto value = attributes.substr(pos, end - pos);
        switch (code)
        {
          case 'R': out.flags |= PropertyReadOnly; break;
          case 'C': out.flags |= PropertyCopy; break;
          case '&': out.flags |= PropertyRetain; break;
          case 'N': out.flags |= PropertyNonAtomic; break;
          case 'W': out.flags |= PropertyWeak; break;
          case 'D': out.flags |= PropertyDynamic; break;
          case 'P': out.flags |= PropertyGarbageCollected; break;
          case 'G': out.getter = std::string{value}; break;
          case 'S': out.setter = std::string{value}; break;
          case 'V': out.ivar = std::string{value}; break;
          default: break; // newer attribute codes are ignored
        }
        pos = end;
      }
      if (pos < attributes.size())
      {
        if (attributes[pos] != ',')
          return std::unexpected(Error{ErrorCode::DecodeError, "malformed property attributes", std::string{attributes}});
        ++pos;
      }
    }
    if (!sawType)
      return std::unexpected(Error{ErrorCode::DecodeError, "property attributes lack a type", std::string{attributes}});
    return out;
  }

} // namespace ObjBridge
