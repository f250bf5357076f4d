// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "facade/resp_expr.h"

#include <gmock/gmock.h>

#include <sstream>

#include "facade/facade_test.h"

using namespace std;
using namespace testing;

namespace facade {

namespace {

string Print(const RespExpr& e) {
  ostringstream os;
  os << e;
  return os.str();
}

}  // namespace

TEST(RespExprTest, Scalars) {
  RespExpr s = RespExpr::String("foo");
  EXPECT_EQ(s.type, RespExpr::STRING);
  EXPECT_EQ(s.GetView(), "foo");
  EXPECT_FALSE(s.GetInt());
  EXPECT_FALSE(s.IsOkString());

  RespExpr i = RespExpr::Int(-42);
  ASSERT_TRUE(i.GetInt());
  EXPECT_EQ(*i.GetInt(), -42);
  EXPECT_THAT(i, IntArg(-42));

  EXPECT_TRUE(RespExpr::Ok().IsOkString());
  EXPECT_TRUE(RespExpr::Error("ERR x").IsError());
  EXPECT_THAT(RespExpr::Error("ERR wrong number of arguments"), ErrArg("wrong number"));
}

TEST(RespExprTest, Nil) {
  EXPECT_TRUE(RespExpr::Nil().IsNil());
  EXPECT_TRUE(RespExpr::NilArray().IsNil());
  EXPECT_TRUE(RespExpr{}.IsNil());
  EXPECT_FALSE(RespExpr::Nil().GetInt());
  EXPECT_FALSE(RespExpr::NilArray().GetInt());
  EXPECT_FALSE(RespExpr::String("").IsNil());
  EXPECT_FALSE(RespExpr::Array({}).IsNil());

  EXPECT_NE(RespExpr::Nil(), RespExpr::NilArray());
}

TEST(RespExprTest, Arrays) {
  RespExpr arr = RespExpr::StringArray(vector<string>{"a", "b"});
  EXPECT_THAT(arr, RespArray(ElementsAre("a", "b")));

  RespVec vec;
  vec.push_back(RespExpr::Int(1));
  vec.push_back(std::move(arr));
  RespExpr nested = RespExpr::Array(std::move(vec));
  ASSERT_THAT(nested, ArrLen(2));
  EXPECT_THAT(nested.GetVec()[1], ArrLen(2));

  EXPECT_EQ(nested, nested);
  EXPECT_NE(nested, RespExpr::StringArray(vector<string>{"a", "b"}));
}

TEST(RespExprTest, Print) {
  EXPECT_EQ(Print(RespExpr::String("a\nb")), "'a\\nb'");
  EXPECT_EQ(Print(RespExpr::Int(7)), "i7");
  EXPECT_EQ(Print(RespExpr::Nil()), "nil");
  EXPECT_EQ(Print(RespExpr::NilArray()), "[]");
  EXPECT_EQ(Print(RespExpr::Error("ERR x")), "e(ERR x)");

  RespVec vec;
  vec.push_back(RespExpr::Int(1));
  vec.push_back(RespExpr::String("x"));
  EXPECT_EQ(Print(RespExpr::Array(std::move(vec))), "[i1,'x']");
  EXPECT_EQ(Print(RespExpr::Array({})), "[]");

  EXPECT_STREQ(RespExpr::TypeName(RespExpr::NIL_ARRAY), "nil-array");
  EXPECT_STREQ(RespExpr::TypeName(RespExpr::INT64), "int");
}

}  // namespace facade
