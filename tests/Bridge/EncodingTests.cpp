#include <catch2/catch_test_macros.hpp>

#include <ObjBridge/Encoding.hpp>
#include <ObjBridge/SelectorUtils.hpp>

#include <string>
#include <vector>

using namespace ObjBridge;

TEST_CASE("DecodesScalars", "[bridge][Encoding]")
{
  auto i = Decode("i");
  REQUIRE(i.has_value());
  CHECK(i->Kind() == TypeKind::Integer);
  CHECK(i->Width() == 4);
  CHECK(i->IsSigned());

  auto q = Decode("Q");
  REQUIRE(q.has_value());
  CHECK(q->Width() == 8);
  CHECK_FALSE(q->IsSigned());

  auto l = Decode("l");
  REQUIRE(l.has_value());
  CHECK(l->Width() == 4);
  CHECK(l->Encoding() == "l");

  auto b = Decode("B");
  REQUIRE(b.has_value());
  CHECK(b->Kind() == TypeKind::Bool);
  CHECK(b->Size() == 1);

  auto d = Decode("d");
  REQUIRE(d.has_value());
  CHECK(d->Kind() == TypeKind::Float);
  CHECK(d->Width() == sizeof(double));

  CHECK(Decode("*")->Kind() == TypeKind::CString);
  CHECK(Decode("#")->Kind() == TypeKind::Class);
  CHECK(Decode(":")->Kind() == TypeKind::Selector);
  CHECK(Decode("v")->Kind() == TypeKind::Void);
}

TEST_CASE("DecodesObjectsAndBlocks", "[bridge][Encoding]")
{
  auto plain = Decode("@");
  REQUIRE(plain.has_value());
  CHECK(plain->Kind() == TypeKind::Object);
  CHECK(plain->Name().empty());

  auto hinted = Decode("@\"NSString\"");
  REQUIRE(hinted.has_value());
  CHECK(hinted->Kind() == TypeKind::Object);
  CHECK(hinted->Name() == "NSString");
  CHECK(hinted->IsObjectLike());

  auto block = Decode("@?");
  REQUIRE(block.has_value());
  CHECK(block->Kind() == TypeKind::Block);

  auto extended = Decode("@?<v@?>");
  REQUIRE(extended.has_value());
  CHECK(extended->Kind() == TypeKind::Block);
}

TEST_CASE("DecodesAggregates", "[bridge][Encoding]")
{
  auto point = Decode("{Point=\"x\"i\"y\"i}");
  REQUIRE(point.has_value());
  CHECK(point->Kind() == TypeKind::Struct);
  CHECK(point->Name() == "Point");
  REQUIRE(point->Fields().size() == 2);
  CHECK(point->Fields()[0].name == "x");
  CHECK(point->Fields()[1].name == "y");
  CHECK(point->Size() == 8);
  CHECK(point->Alignment() == 4);

  auto rect = Decode("{CGRect={CGPoint=dd}{CGSize=dd}}");
  REQUIRE(rect.has_value());
  CHECK(rect->Size() == 32);
  REQUIRE(rect->Fields().size() == 2);
  CHECK(rect->Fields()[0].name == "_field_0");
  CHECK(rect->Fields()[1].type.Name() == "CGSize");

  auto bits = Decode("(Bits=\"i\"i\"u\"I)");
  REQUIRE(bits.has_value());
  CHECK(bits->Kind() == TypeKind::Union);
  CHECK(bits->Size() == 4);

  auto opaque = Decode("^{Opaque}");
  REQUIRE(opaque.has_value());
  CHECK(opaque->Kind() == TypeKind::Pointer);
  CHECK_FALSE(opaque->Element().HasFieldList());
  CHECK(opaque->Element().Size() == 0);
}

TEST_CASE("LaysOutMixedStructFields", "[bridge][Encoding]")
{
  auto mixed = Decode("{Mixed=\"c\"c\"d\"d\"s\"s}");
  REQUIRE(mixed.has_value());
  const auto offsets = FieldOffsets(*mixed);
  REQUIRE(offsets.size() == 3);
  CHECK(offsets[0] == 0);
  CHECK(offsets[1] == 8);
  CHECK(offsets[2] == 16);
  CHECK(mixed->Size() == 24);

  auto number = Decode("(Number=\"i\"i\"d\"d)");
  REQUIRE(number.has_value());
  CHECK(FieldOffsets(*number) == std::vector<NGIN::UIntSize>{0, 0});
  CHECK(number->Size() == 8);
}

TEST_CASE("DecodesArraysAndQualifiers", "[bridge][Encoding]")
{
  auto array = Decode("[4i]");
  REQUIRE(array.has_value());
  CHECK(array->Kind() == TypeKind::Array);
  CHECK(array->Length() == 4);
  CHECK(array->Size() == 16);
  CHECK(array->Element().Kind() == TypeKind::Integer);

  auto constVoid = Decode("r^v");
  REQUIRE(constVoid.has_value());
  CHECK(constVoid->Kind() == TypeKind::Pointer);
  CHECK(constVoid->HasQualifier(QualifierConst));
  CHECK(constVoid->Encoding() == "r^v");

  auto out = Decode("o^@");
  REQUIRE(out.has_value());
  CHECK(out->HasQualifier(QualifierOut));
  CHECK(out->Element().Kind() == TypeKind::Object);
}

TEST_CASE("UnrecognisedCodesDecodeAsUnknown", "[bridge][Encoding]")
{
  auto bang = Decode("!");
  REQUIRE(bang.has_value());
  CHECK(bang->Kind() == TypeKind::Unknown);
  CHECK(bang->Size() == sizeof(void *));

  auto bitfield = Decode("b3");
  REQUIRE(bitfield.has_value());
  CHECK(bitfield->Kind() == TypeKind::Unknown);
  CHECK(bitfield->Encoding() == "b3");

  auto complex = Decode("jd");
  REQUIRE(complex.has_value());
  CHECK(complex->Kind() == TypeKind::Unknown);
}

TEST_CASE("MalformedEncodingsAreDecodeErrors", "[bridge][Encoding]")
{
  for (const char *bad : {"", "{Point=ii", "[i]", "}", "ii", "^", "[3i", "(U=\"a\"i"})
  {
    INFO(bad);
    auto r = Decode(bad);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == ErrorCode::DecodeError);
  }
}

TEST_CASE("ArraySizesMustFitTheAddressSpace", "[bridge][Encoding]")
{
  for (const char *huge : {"[4611686018427387904i]", "[2305843009213693952[2i]]", "[18446744073709551615q]"})
  {
    INFO(huge);
    auto r = Decode(huge);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == ErrorCode::DecodeError);
  }

  auto large = Decode("[1048576i]");
  REQUIRE(large.has_value());
  CHECK(large->Size() == 4u * 1048576u);
}

TEST_CASE("DecodingIsIdempotent", "[bridge][Encoding]")
{
  for (const char *enc : {"i", "@\"NSString\"", "{Point=\"x\"i\"y\"i}", "[4{CGPoint=dd}]", "r^v", "^{Opaque}", "(Bits=\"i\"i\"u\"I)", "@?"})
  {
    INFO(enc);
    auto first = Decode(enc);
    REQUIRE(first.has_value());
    auto second = Decode(first->Encoding());
    REQUIRE(second.has_value());
    CHECK(*first == *second);
    CHECK(second->Size() == first->Size());
  }
}

TEST_CASE("DecodesMethodEncodings", "[bridge][Encoding]")
{
  auto setter = DecodeMethodEncoding("v24@0:8i16", 1);
  REQUIRE(setter.has_value());
  CHECK(setter->returnType.Kind() == TypeKind::Void);
  REQUIRE(setter->ArgumentCount() == 1);
  CHECK(setter->arguments[0].Kind() == TypeKind::Integer);
  CHECK_FALSE(setter->isVariadic);

  auto factory = DecodeMethodEncoding("@32#0:8d16d24", 2);
  REQUIRE(factory.has_value());
  CHECK(factory->returnType.Kind() == TypeKind::Object);
  CHECK(factory->ArgumentCount() == 2);

  auto withStruct = DecodeMethodEncoding("{Point=\"x\"i\"y\"i}24@0:8{Point=\"x\"i\"y\"i}16", 1);
  REQUIRE(withStruct.has_value());
  CHECK(withStruct->returnType.Kind() == TypeKind::Struct);
}

TEST_CASE("MethodEncodingArgumentCountMustMatchSelector", "[bridge][Encoding]")
{
  const std::string selector = "setValue:forKey:";
  auto r = DecodeMethodEncoding("v24@0:8i16", detail::ColonCount(selector));
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == ErrorCode::DecodeError);

  auto noSelector = DecodeMethodEncoding("i16@0i8", 0);
  REQUIRE_FALSE(noSelector.has_value());
  CHECK(noSelector.error().code == ErrorCode::DecodeError);

  auto noReceiver = DecodeMethodEncoding("v", 0);
  REQUIRE_FALSE(noReceiver.has_value());
}

TEST_CASE("DecodesPropertyAttributes", "[bridge][Encoding]")
{
  auto name = DecodePropertyAttributes("T@\"NSString\",&,N,V_name");
  REQUIRE(name.has_value());
  CHECK(name->type.Kind() == TypeKind::Object);
  CHECK(name->type.Name() == "NSString");
  CHECK(name->Has(PropertyRetain));
  CHECK(name->Has(PropertyNonAtomic));
  CHECK_FALSE(name->Has(PropertyReadOnly));
  CHECK(name->ivar == "_name");

  auto flag = DecodePropertyAttributes("TB,R,GisOn");
  REQUIRE(flag.has_value());
  CHECK(flag->Has(PropertyReadOnly));
  CHECK(flag->getter == "isOn");
  CHECK(flag->setter.empty());

  auto origin = DecodePropertyAttributes("T{Point=\"x\"i\"y\"i},N,GoriginPoint,SsetOriginPoint:");
  REQUIRE(origin.has_value());
  CHECK(origin->type.Kind() == TypeKind::Struct);
  CHECK(origin->setter == "setOriginPoint:");

  auto untyped = DecodePropertyAttributes("R,N");
  REQUIRE_FALSE(untyped.has_value());
  CHECK(untyped.error().code == ErrorCode::DecodeError);
}

TEST_CASE("MapsSelectorNames", "[bridge][Encoding]")
{
  CHECK(detail::ColonCount("initWithWidth:height:") == 2);
  CHECK(detail::ColonCount("count") == 0);
  CHECK(detail::AttributeNameToSelector("initWithWidth_height_") == "initWithWidth:height:");
  CHECK(detail::SelectorToAttributeName("add:to:") == "add_to_");
  CHECK(detail::DefaultSetter("width") == "setWidth:");
  CHECK(detail::HasSelectorFamily("copyWithZone:", "copy"));
  CHECK(detail::HasSelectorFamily("_copy", "copy"));
  CHECK_FALSE(detail::HasSelectorFamily("copyright", "copy"));
  CHECK_FALSE(detail::HasSelectorFamily("initialize", "init"));
}
