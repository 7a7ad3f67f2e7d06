#include <gtest/gtest.h>

#include "lifter/common/internal_error.hpp"
#include "lifter/common/type.hpp"
#include "lifter/common/type_arena.hpp"

namespace lifter {
namespace {

class TypeArenaTest : public ::testing::Test {
 protected:
  TypeArena types_;
};

TEST_F(TypeArenaTest, BuiltinsAreDistinct) {
  EXPECT_NE(types_.Int(), types_.Float());
  EXPECT_NE(types_.Bool(), types_.String());
  EXPECT_EQ(types_[types_.Void()].Kind(), TypeKind::kVoid);
  EXPECT_EQ(types_.ToString(types_.String()), "string");
}

TEST_F(TypeArenaTest, CompoundTypesAreInterned) {
  TypeId a = types_.Array(types_.Int(), 3);
  TypeId b = types_.Array(types_.Int(), 3);
  TypeId c = types_.Array(types_.Int(), 4);
  EXPECT_EQ(a, b);
  EXPECT_NE(a, c);

  TypeId t1 = types_.Tuple({types_.Int(), types_.String()});
  TypeId t2 = types_.Tuple({types_.Int(), types_.String()});
  EXPECT_EQ(t1, t2);
  EXPECT_EQ(types_.Ref(a), types_.Ref(b));
  EXPECT_NE(types_.Ref(a), types_.Ptr(a));
}

TEST_F(TypeArenaTest, NominalTypesHaveDeclarationIdentity) {
  TypeId first = types_.DeclareObject("Handle", {});
  TypeId second = types_.DeclareObject("Handle", {});
  EXPECT_NE(first, second);
  ASSERT_EQ(types_.NominalTypes().size(), 2U);
}

TEST_F(TypeArenaTest, ToStringSpellsCompounds) {
  TypeId handle = types_.DeclareObject("Handle", {});
  types_.SetObjectBody(handle, {}, kInvalidTypeId);

  EXPECT_EQ(types_.ToString(types_.Array(handle, 2)), "array[2, Handle]");
  EXPECT_EQ(types_.ToString(types_.Sequence(handle)), "seq[Handle]");
  EXPECT_EQ(
      types_.ToString(types_.Tuple({handle, types_.Int()})), "(Handle, int)");
  EXPECT_EQ(types_.ToString(types_.Lent(handle)), "lent Handle");
}

TEST_F(TypeArenaTest, InstanceCreatedBeforeBodyIsCompletedLater) {
  TypeId box = types_.DeclareGenericObject("Box", {"T"}, {});
  TypeId box_int = types_.Instantiate(box, {types_.Int()});
  EXPECT_FALSE(types_[box_int].AsObject().complete);

  TypeId param = types_[box].AsObject().type_params[0];
  types_.SetObjectBody(
      box, {FieldInfo{.name = "value", .type = types_.Sequence(param)}},
      kInvalidTypeId);

  const ObjectInfo& info = types_[box_int].AsObject();
  ASSERT_TRUE(info.complete);
  ASSERT_EQ(info.fields.size(), 1U);
  EXPECT_EQ(info.fields[0].type, types_.Sequence(types_.Int()));
  EXPECT_EQ(types_.GenericOrigin(box_int), box);
  EXPECT_EQ(types_.ToString(box_int), "Box[int]");
}

TEST_F(TypeArenaTest, InstantiationIsDeduplicated) {
  TypeId box = types_.DeclareGenericObject("Box", {"T"}, {});
  types_.SetObjectBody(box, {}, kInvalidTypeId);
  TypeId a = types_.Instantiate(box, {types_.Int()});
  TypeId b = types_.Instantiate(box, {types_.Int()});
  EXPECT_EQ(a, b);
  EXPECT_EQ(types_.GenericInstances().size(), 1U);
}

TEST_F(TypeArenaTest, DependentTypes) {
  TypeId box = types_.DeclareGenericObject("Box", {"T"}, {});
  TypeId param = types_.MakeGenericParam("U", 0);
  TypeId dependent = types_.Instantiate(box, {param});

  EXPECT_TRUE(types_.IsDependent(param));
  EXPECT_TRUE(types_.IsDependent(types_.Sequence(dependent)));
  EXPECT_FALSE(types_.IsDependent(types_.Instantiate(box, {types_.Int()})));
  EXPECT_TRUE(types_.IsGenericDefinition(box));
  EXPECT_FALSE(types_.IsGenericDefinition(dependent));
}

TEST_F(TypeArenaTest, SettingBodyTwiceIsInternalError) {
  TypeId handle = types_.DeclareObject("Handle", {});
  types_.SetObjectBody(handle, {}, kInvalidTypeId);
  EXPECT_THROW(
      types_.SetObjectBody(handle, {}, kInvalidTypeId), common::InternalError);
}

TEST_F(TypeArenaTest, InstantiatingNonGenericIsInternalError) {
  TypeId handle = types_.DeclareObject("Handle", {});
  EXPECT_THROW(
      types_.Instantiate(handle, {types_.Int()}), common::InternalError);
}

TEST_F(TypeArenaTest, WrongPayloadAccessIsInternalError) {
  EXPECT_THROW(types_[types_.Int()].AsObject(), common::InternalError);
}

}  // namespace
}  // namespace lifter
