#include <gtest/gtest.h>
#include "deco/wrap/wrapper.hpp"

#include <functional>
#include <string>
#include <utility>

// External linkage so the dynamic symbol table carries their names.
int cube(int x) { return x * x * x; }

namespace deco_wrapper_test {
int twice(int x) { return 2 * x; }
}  // namespace deco_wrapper_test

namespace {

int square(int x) { return x * x; }

// Counts calls and passes them through.
struct CountingPolicy {
    int* calls;

    template <typename Target, typename... Args>
        requires std::invocable<Target&, Args...>
    decltype(auto) operator()(Target& target, Args&&... args) const {
        ++*calls;
        return std::invoke(target, std::forward<Args>(args)...);
    }
};

class WrapperTest : public ::testing::Test {};

TEST_F(WrapperTest, AppliesPolicyAroundTarget) {
    int calls = 0;
    deco::wrap::Wrapper wrapped(square, CountingPolicy{&calls});

    EXPECT_EQ(wrapped(3), 9);
    EXPECT_EQ(wrapped(4), 16);
    EXPECT_EQ(calls, 2);
}

TEST_F(WrapperTest, ForwardsReferenceResults) {
    int value = 1;
    auto ref = [&value]() -> int& { return value; };
    int calls = 0;
    deco::wrap::Wrapper<decltype(ref), CountingPolicy> wrapped(
        ref, CountingPolicy{&calls});

    wrapped() = 5;
    EXPECT_EQ(value, 5);
}

TEST_F(WrapperTest, MutableTargetsNeedNonConstWrapper) {
    int counter = 0;
    auto increment = [counter]() mutable { return ++counter; };
    int calls = 0;
    deco::wrap::Wrapper<decltype(increment), CountingPolicy> wrapped(
        increment, CountingPolicy{&calls});

    EXPECT_EQ(wrapped(), 1);
    EXPECT_EQ(wrapped(), 2);

    using Const = const decltype(wrapped)&;
    static_assert(!std::is_invocable_v<Const>);
}

TEST_F(WrapperTest, TargetNameUsesNamedWrapper) {
    auto namedSquare = DECO_NAMED(square);
    EXPECT_EQ(namedSquare.name(), "square");
    EXPECT_EQ(namedSquare(5), 25);
    EXPECT_EQ(deco::wrap::targetName(namedSquare), "square");

    int calls = 0;
    deco::wrap::Wrapper wrapped(namedSquare, CountingPolicy{&calls});
    EXPECT_EQ(deco::wrap::targetName(wrapped), "square");
}

TEST_F(WrapperTest, TargetNameUsesFunctionSymbol) {
    EXPECT_EQ(deco::wrap::targetName(cube), "cube");
    EXPECT_EQ(deco::wrap::targetName(&cube), "cube");
    EXPECT_EQ(deco::wrap::targetName(&deco_wrapper_test::twice), "twice");
}

TEST_F(WrapperTest, TargetNameFallsBackToTypeWithoutSymbol) {
    // Internal linkage: no dynamic symbol to look up.
    std::string name = deco::wrap::targetName(&square);
    EXPECT_NE(name.find("int"), std::string::npos);

    auto closure = [](int x) { return x + 1; };
    EXPECT_FALSE(deco::wrap::targetName(closure).empty());
}

TEST_F(WrapperTest, RequireTargetRejectsEmptyCallables) {
    int (*nullFunction)(int) = nullptr;
    std::function<void()> emptyFunction;

    EXPECT_THROW(deco::wrap::requireTarget(nullFunction),
                 deco::error::InvalidArgument);
    EXPECT_THROW(deco::wrap::requireTarget(emptyFunction),
                 deco::error::InvalidArgument);
    EXPECT_NO_THROW(deco::wrap::requireTarget(&square));
    EXPECT_NO_THROW(deco::wrap::requireTarget([] {}));
}

}  // namespace
