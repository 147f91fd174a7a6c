/**
 * @file test_type_name.cpp
 * @brief Unit tests for runtime type names
 */

#include <gtest/gtest.h>
#include <mapr/common/type_name.hpp>

#include <map>
#include <string>
#include <vector>

using namespace mapr::common;

namespace app::model {
struct Customer {};

template<typename T>
struct Box {};
}  // namespace app::model

namespace {
struct LocalThing {};
}  // namespace

TEST(TypeNameTest, FullyQualified) {
    EXPECT_EQ(type_name<app::model::Customer>(), "app::model::Customer");
    EXPECT_EQ(type_name<int>(), "int");
}

TEST(TypeNameTest, ShortNameStripsNamespaces) {
    EXPECT_EQ(short_type_name<app::model::Customer>(), "Customer");
    EXPECT_EQ(short_type_name<double>(), "double");
}

TEST(TypeNameTest, ShortNameStripsTemplateArguments) {
    EXPECT_EQ(short_type_name<app::model::Box<app::model::Customer>>(), "Box<Customer>");
}

TEST(TypeNameTest, ShortNameStripsAnonymousNamespace) {
    EXPECT_EQ(short_type_name<LocalThing>(), "LocalThing");
}

TEST(TypeNameTest, RuntimeTypeInfo) {
    app::model::Customer customer;
    const std::type_info& info = typeid(customer);
    EXPECT_EQ(short_type_name(info), "Customer");
    EXPECT_EQ(type_name(info), type_name<app::model::Customer>());
}

TEST(TypeNameTest, StripNamespaces) {
    EXPECT_EQ(strip_namespaces("a::b::C"), "C");
    EXPECT_EQ(strip_namespaces("std::vector<a::B, std::allocator<a::B> >"),
              "vector<B, allocator<B> >");
    EXPECT_EQ(strip_namespaces("(anonymous namespace)::Thing"), "Thing");
    EXPECT_EQ(strip_namespaces("Plain"), "Plain");
    EXPECT_EQ(strip_namespaces(""), "");
}

TEST(TypeNameTest, DemangleFallsBackToInput) {
    EXPECT_EQ(demangle(nullptr), "");
    EXPECT_EQ(demangle("not a mangled name"), "not a mangled name");
}
