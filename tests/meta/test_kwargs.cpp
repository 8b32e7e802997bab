#include <gtest/gtest.h>
#include "deco/meta/kwargs.hpp"

#include <functional>
#include <string>
#include <tuple>
#include <type_traits>

#include "deco/wrap/repeat.hpp"

namespace {

using deco::meta::CallableTarget;
using deco::meta::Keyword;
using deco::meta::Kwargs;
using deco::meta::kw;

int freeFunction(int x) { return x; }

struct Widget {
    int method() const { return 1; }
    int field = 0;
};

struct GenericFunctor {
    template <typename T>
    auto operator()(T value) const {
        return value;
    }
};

struct OptedInFunctor {
    template <typename T>
    auto operator()(T value) const {
        return value;
    }
};

}  // namespace

template <>
struct deco::meta::is_callable_target<OptedInFunctor> : std::true_type {};

namespace {

class KwargsTest : public ::testing::Test {};

TEST_F(KwargsTest, StoresTypedValues) {
    Kwargs kwargs{kw("retries", 3), kw("label", "fetch"), kw("ratio", 0.5)};

    EXPECT_EQ(kwargs.size(), 3U);
    EXPECT_EQ(kwargs.get<int>("retries"), 3);
    EXPECT_EQ(kwargs.get<std::string>("label"), "fetch");
    EXPECT_DOUBLE_EQ(kwargs.get<double>("ratio"), 0.5);
}

TEST_F(KwargsTest, MissingOrMistypedValueThrows) {
    Kwargs kwargs{kw("retries", 3)};

    EXPECT_THROW((void)kwargs.get<int>("missing"),
                 deco::error::InvalidArgument);
    EXPECT_THROW((void)kwargs.get<std::string>("retries"),
                 deco::error::InvalidArgument);
}

TEST_F(KwargsTest, GetOrFallsBackWhenAbsent) {
    Kwargs kwargs{kw("retries", 3)};

    EXPECT_EQ(kwargs.getOr("retries", 10), 3);
    EXPECT_EQ(kwargs.getOr("timeout", 10), 10);
}

TEST_F(KwargsTest, DuplicateNamesAreRejected) {
    Kwargs kwargs{kw("a", 1)};
    EXPECT_THROW(kwargs.add(kw("a", 2)), deco::error::InvalidArgument);
    EXPECT_THROW((Kwargs{kw("b", 1), kw("b", 2)}),
                 deco::error::InvalidArgument);
}

TEST_F(KwargsTest, SetOverwrites) {
    Kwargs kwargs{kw("a", 1)};
    kwargs.set(kw("a", 2));
    EXPECT_EQ(kwargs.get<int>("a"), 2);
}

TEST_F(KwargsTest, MergedLetsOverridesWin) {
    Kwargs base{kw("a", 1), kw("b", 2)};
    Kwargs overrides{kw("b", 20), kw("c", 30)};

    Kwargs merged = base.merged(overrides);
    EXPECT_EQ(merged.get<int>("a"), 1);
    EXPECT_EQ(merged.get<int>("b"), 20);
    EXPECT_EQ(merged.get<int>("c"), 30);
    EXPECT_EQ(base.get<int>("b"), 2);
}

TEST_F(KwargsTest, NamesAreSorted) {
    Kwargs kwargs{kw("zeta", 1), kw("alpha", 2)};
    auto names = kwargs.names();
    ASSERT_EQ(names.size(), 2U);
    EXPECT_EQ(names[0], "alpha");
    EXPECT_EQ(names[1], "zeta");
}

TEST_F(KwargsTest, CollectKwargsSkipsPositional) {
    Kwargs extra{kw("c", 3)};
    Kwargs collected = deco::meta::collectKwargs(1, kw("a", 1), "text",
                                                 kw("b", 2), extra);
    EXPECT_EQ(collected.size(), 3U);
    EXPECT_TRUE(collected.contains("a"));
    EXPECT_TRUE(collected.contains("b"));
    EXPECT_TRUE(collected.contains("c"));

    EXPECT_THROW((void)deco::meta::collectKwargs(kw("a", 1), kw("a", 2)),
                 deco::error::InvalidArgument);
}

TEST_F(KwargsTest, CollectPositionalCopiesInOrder) {
    std::string text = "hello";
    auto positional =
        deco::meta::collectPositional(kw("skip", 1), 7, text, kw("x", 2), 2.5);

    static_assert(std::is_same_v<decltype(positional),
                                 std::tuple<int, std::string, double>>);
    EXPECT_EQ(std::get<0>(positional), 7);
    EXPECT_EQ(std::get<1>(positional), "hello");
    EXPECT_DOUBLE_EQ(std::get<2>(positional), 2.5);
}

TEST_F(KwargsTest, ForwardPositionalKeepsReferences) {
    int value = 1;
    auto refs = deco::meta::forwardPositional(value, kw("x", 1));
    static_assert(std::is_same_v<decltype(refs), std::tuple<int&>>);
    std::get<0>(refs) = 5;
    EXPECT_EQ(value, 5);
}

class CallableTargetTest : public ::testing::Test {};

TEST_F(CallableTargetTest, AcceptsFunctionsAndPointers) {
    static_assert(CallableTarget<decltype(freeFunction)>);
    static_assert(CallableTarget<decltype(&freeFunction)>);
    static_assert(CallableTarget<decltype(&Widget::method)>);
    static_assert(CallableTarget<decltype(&Widget::field)>);
    SUCCEED();
}

TEST_F(CallableTargetTest, AcceptsClassTypesWithCallOperator) {
    auto lambda = [](int x) { return x; };
    static_assert(CallableTarget<decltype(lambda)>);
    static_assert(CallableTarget<decltype(lambda)&>);
    static_assert(CallableTarget<std::function<void()>>);
    SUCCEED();
}

TEST_F(CallableTargetTest, AcceptsLibraryWrappersAndOptIns) {
    auto wrapped = deco::wrap::repeat(2)([](int x) { return x; });
    static_assert(CallableTarget<decltype(wrapped)>);
    static_assert(CallableTarget<OptedInFunctor>);
    SUCCEED();
}

TEST_F(CallableTargetTest, RejectsConfigurationValues) {
    auto genericLambda = [](auto x) { return x; };
    static_assert(!CallableTarget<int>);
    static_assert(!CallableTarget<std::string>);
    static_assert(!CallableTarget<const char*>);
    static_assert(!CallableTarget<Keyword>);
    static_assert(!CallableTarget<Kwargs>);
    static_assert(!CallableTarget<GenericFunctor>);
    static_assert(!CallableTarget<decltype(genericLambda)>);
    SUCCEED();
}

}  // namespace
