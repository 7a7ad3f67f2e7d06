#include "lifter/frontend/type_parser.hpp"

#include <gtest/gtest.h>

#include <string>

#include "lifter/common/type.hpp"
#include "lifter/common/type_arena.hpp"

namespace lifter::frontend {
namespace {

class TypeParserTest : public ::testing::Test {
 protected:
  void SetUp() override {
    handle_ = types_.DeclareObject("Handle", {});
    types_.SetObjectBody(handle_, {}, kInvalidTypeId);
    box_ = types_.DeclareGenericObject("Box", {"T"}, {});
    types_.SetObjectBody(box_, {}, kInvalidTypeId);
    names_.emplace("Handle", handle_);
    names_.emplace("Box", box_);
  }

  auto Parse(const std::string& text) -> Result<TypeId> {
    return ParseTypeExpression(text, types_, TypeScope{.types = &names_});
  }

  auto ErrorOf(const std::string& text) -> std::string {
    auto result = Parse(text);
    if (result) {
      return "";
    }
    return result.error().primary.message;
  }

  TypeArena types_;
  TypeNameMap names_;
  TypeId handle_;
  TypeId box_;
};

TEST_F(TypeParserTest, Builtins) {
  EXPECT_EQ(Parse("int"), types_.Int());
  EXPECT_EQ(Parse(" string "), types_.String());
  EXPECT_EQ(Parse("void"), types_.Void());
}

TEST_F(TypeParserTest, NamedAndCompound) {
  EXPECT_EQ(Parse("Handle"), handle_);
  EXPECT_EQ(Parse("array[4, Handle]"), types_.Array(handle_, 4));
  EXPECT_EQ(Parse("seq[seq[int]]"), types_.Sequence(types_.Sequence(types_.Int())));
  EXPECT_EQ(
      Parse("(Handle, int)"), types_.Tuple({handle_, types_.Int()}));
}

TEST_F(TypeParserTest, IndirectionsNest) {
  EXPECT_EQ(Parse("ref Handle"), types_.Ref(handle_));
  EXPECT_EQ(Parse("var lent int"), types_.Var(types_.Lent(types_.Int())));
  EXPECT_EQ(Parse("ptr seq[Handle]"), types_.Ptr(types_.Sequence(handle_)));
}

TEST_F(TypeParserTest, GenericInstance) {
  auto type = Parse("Box[Handle]");
  ASSERT_TRUE(type);
  EXPECT_EQ(types_.GenericOrigin(*type), box_);
  EXPECT_EQ(Parse("Box[Handle]"), type);
}

TEST_F(TypeParserTest, GenericParametersInScope) {
  TypeId param = types_.MakeGenericParam("T", 0);
  TypeNameMap generics{{"T", param}};
  auto type = ParseTypeExpression(
      "var Box[T]", types_,
      TypeScope{.types = &names_, .generics = &generics});
  ASSERT_TRUE(type);
  EXPECT_TRUE(types_.IsDependent(*type));
}

TEST_F(TypeParserTest, Errors) {
  EXPECT_EQ(ErrorOf("Missing"), "in type 'Missing': unknown type 'Missing'");
  EXPECT_EQ(
      ErrorOf("Box"), "in type 'Box': generic type 'Box' needs type arguments");
  EXPECT_EQ(
      ErrorOf("Handle[int]"), "in type 'Handle[int]': type 'Handle' is not generic");
  EXPECT_EQ(
      ErrorOf("Box[int, int]"),
      "in type 'Box[int, int]': 'Box' expects 1 type arguments, got 2");
  EXPECT_NE(ErrorOf("array[x, int]"), "");
  EXPECT_NE(ErrorOf("seq[int"), "");
  EXPECT_NE(ErrorOf("int int"), "");
  EXPECT_NE(ErrorOf(""), "");
}

}  // namespace
}  // namespace lifter::frontend
