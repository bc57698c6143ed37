#include <gtest/gtest.h>

#include <memory>

#include "BellaError.hpp"
#include "evaluator.hpp"

TEST(EnvironmentTest, DeclareThenLookup) {
    auto env = std::make_shared<Environment>();
    env->declare("x", Value{1.0});

    const Value& v = env->lookup("x");
    ASSERT_TRUE(std::holds_alternative<double>(v));
    EXPECT_DOUBLE_EQ(std::get<double>(v), 1.0);
}

TEST(EnvironmentTest, RedeclarationInSameFrameFails) {
    auto env = std::make_shared<Environment>();
    env->declare("x", Value{1.0});
    EXPECT_THROW(env->declare("x", Value{2.0}), RedeclarationError);
    EXPECT_DOUBLE_EQ(std::get<double>(env->lookup("x")), 1.0);
}

TEST(EnvironmentTest, ChildFrameMayShadowParent) {
    auto root = std::make_shared<Environment>();
    root->declare("n", Value{10.0});

    auto child = Environment::child_frame(root, {{"n", Value{3.0}}});
    EXPECT_DOUBLE_EQ(std::get<double>(child->lookup("n")), 3.0);
    EXPECT_DOUBLE_EQ(std::get<double>(root->lookup("n")), 10.0);
}

TEST(EnvironmentTest, LookupWalksTheChain) {
    auto root = std::make_shared<Environment>();
    root->declare("g", Value{true});
    auto child = std::make_shared<Environment>(root);

    EXPECT_TRUE(child->has("g"));
    EXPECT_FALSE(child->has_own("g"));
    EXPECT_TRUE(std::get<bool>(child->lookup("g")));
}

TEST(EnvironmentTest, LookupOfUnboundNameFails) {
    auto root = std::make_shared<Environment>();
    auto child = std::make_shared<Environment>(root);
    EXPECT_THROW(child->lookup("missing"), UnboundVariableError);
    EXPECT_FALSE(child->has("missing"));
}

TEST(EnvironmentTest, AssignUpdatesNearestBinding) {
    auto root = std::make_shared<Environment>();
    root->declare("x", Value{1.0});
    auto child = std::make_shared<Environment>(root);

    child->assign("x", Value{5.0});
    EXPECT_FALSE(child->has_own("x"));
    EXPECT_DOUBLE_EQ(std::get<double>(root->lookup("x")), 5.0);
}

TEST(EnvironmentTest, AssignPrefersInnermostFrame) {
    auto root = std::make_shared<Environment>();
    root->declare("x", Value{1.0});
    auto child = Environment::child_frame(root, {{"x", Value{2.0}}});

    child->assign("x", Value{7.0});
    EXPECT_DOUBLE_EQ(std::get<double>(child->lookup("x")), 7.0);
    EXPECT_DOUBLE_EQ(std::get<double>(root->lookup("x")), 1.0);
}

TEST(EnvironmentTest, AssignToUnboundNameFails) {
    auto env = std::make_shared<Environment>();
    EXPECT_THROW(env->assign("y", Value{1.0}), UnboundVariableError);
    EXPECT_FALSE(env->has("y"));
}

TEST(EnvironmentTest, ChildFrameRejectsDuplicateBindings) {
    auto root = std::make_shared<Environment>();
    EXPECT_THROW(Environment::child_frame(root, {{"a", Value{1.0}}, {"a", Value{2.0}}}), RedeclarationError);
}

TEST(EnvironmentTest, ArraysAreSharedNotCopied) {
    auto env = std::make_shared<Environment>();
    auto arr = std::make_shared<ArrayValue>();
    arr->elements.push_back(Value{1.0});
    env->declare("a", Value{arr});
    env->declare("b", env->lookup("a"));

    std::get<ArrayPtr>(env->lookup("a"))->elements.push_back(Value{2.0});
    EXPECT_EQ(std::get<ArrayPtr>(env->lookup("b"))->elements.size(), 2u);
}

TEST(EnvironmentTest, ErrorsNameTheIdentifier) {
    auto env = std::make_shared<Environment>();
    try {
        env->lookup("ghost");
        FAIL() << "expected UnboundVariableError";
    } catch (const UnboundVariableError& e) {
        EXPECT_EQ(e.type(), "UnboundVariableError");
        EXPECT_NE(std::string(e.what()).find("ghost"), std::string::npos);
    }
}
