//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_validators.cpp
// Purpose: GoogleTests for tool argument validation against the inputSchema subset
//==========================================================================================================

#include <gtest/gtest.h>

#include "TestTools.h"
#include "toolgate/validation/Validators.h"

using namespace toolgate;
using namespace toolgate::testing;
using toolgate::validation::validateArguments;

namespace {

JSONValue personSchema() {
    return obj({{"type", str("object")},
                {"properties", obj({{"name", obj({{"type", str("string")}})},
                                    {"age", obj({{"type", str("integer")}})},
                                    {"mode", obj({{"enum", arr({str("fast"), str("slow")})}})},
                                    {"tags", obj({{"type", str("array")}, {"items", obj({{"type", str("string")}})}})}})},
                {"required", arr({str("name")})},
                {"additionalProperties", JSONValue{false}}});
}

} // namespace

TEST(Validators, AcceptsConformingArguments) {
    auto errs = validateArguments(personSchema(), obj({{"name", str("ada")}, {"age", num(36)}, {"tags", arr({str("x")})}}));
    EXPECT_TRUE(errs.empty());
}

TEST(Validators, ReportsMissingRequiredField) {
    auto errs = validateArguments(personSchema(), obj({}));
    ASSERT_EQ(errs.size(), 1u);
    EXPECT_EQ(errs[0].field, "name");
    EXPECT_EQ(errs[0].reason, "required field missing");
}

TEST(Validators, ReportsTypeMismatchWithPath) {
    auto errs = validateArguments(personSchema(), obj({{"name", str("a")}, {"tags", arr({str("ok"), num(3)})}}));
    ASSERT_EQ(errs.size(), 1u);
    EXPECT_EQ(errs[0].field, "tags[1]");
    EXPECT_EQ(errs[0].reason, "expected string, got integer");
}

TEST(Validators, RejectsUnexpectedFieldWhenClosed) {
    auto errs = validateArguments(personSchema(), obj({{"name", str("a")}, {"extra", num(1)}}));
    ASSERT_EQ(errs.size(), 1u);
    EXPECT_EQ(errs[0].field, "extra");
    EXPECT_EQ(errs[0].reason, "unexpected field");
}

TEST(Validators, EnumRestrictsValues) {
    auto errs = validateArguments(personSchema(), obj({{"name", str("a")}, {"mode", str("medium")}}));
    ASSERT_EQ(errs.size(), 1u);
    EXPECT_EQ(errs[0].field, "mode");
}

TEST(Validators, IntegralDoubleSatisfiesInteger) {
    auto errs = validateArguments(personSchema(), obj({{"name", str("a")}, {"age", JSONValue{3.0}}}));
    EXPECT_TRUE(errs.empty());
    errs = validateArguments(personSchema(), obj({{"name", str("a")}, {"age", JSONValue{3.5}}}));
    EXPECT_EQ(errs.size(), 1u);
}

TEST(Validators, IntegralDoubleOutsideInt64IsNotInteger) {
    auto schema = obj({{"type", str("object")}, {"properties", obj({{"n", obj({{"type", str("integer")}})}})}});
    auto errs = validateArguments(schema, obj({{"n", JSONValue{1e300}}}));
    ASSERT_EQ(errs.size(), 1u);
    EXPECT_EQ(errs[0].field, "n");
    EXPECT_EQ(validateArguments(schema, obj({{"n", JSONValue{-1e19}}})).size(), 1u);
    EXPECT_EQ(validateArguments(schema, obj({{"n", JSONValue{9223372036854775808.0}}})).size(), 1u);
    EXPECT_TRUE(validateArguments(schema, obj({{"n", JSONValue{-9223372036854775808.0}}})).empty());
    EXPECT_TRUE(validateArguments(schema, obj({{"n", JSONValue{4503599627370496.0}}})).empty());
}

TEST(Validators, TypeUnionAcceptsAnyListedType) {
    auto schema = obj({{"type", arr({str("string"), str("null")})}});
    EXPECT_TRUE(validateArguments(schema, JSONValue{nullptr}).empty());
    EXPECT_TRUE(validateArguments(schema, str("x")).empty());
    auto errs = validateArguments(schema, num(1));
    ASSERT_EQ(errs.size(), 1u);
    EXPECT_EQ(errs[0].reason, "expected string or null, got integer");
}

TEST(Validators, FieldErrorsRenderAsJson) {
    auto j = validation::fieldErrorsToJSON({{"a", "required field missing"}});
    ASSERT_EQ(asArray(at(j, "fields")).size(), 1u);
    EXPECT_EQ(asString(*asArray(at(j, "fields"))[0]), "a");
    EXPECT_EQ(asString(at(*asArray(at(j, "errors"))[0], "reason")), "required field missing");
}
