/**
 * @file test_priority_registry.cpp
 * @brief Unit tests for PriorityClassRegistry.
 */

#include "priority/priority_registry.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>

using namespace cluster_gate;

TEST(PriorityRegistryTest, CreateAndGet) {
    PriorityClassRegistry registry;
    ASSERT_TRUE(registry.create({"high", 1000000, false, PreemptionPolicy::CanPreemptLower, "web"}).has_value());

    auto pc = registry.get("high");
    ASSERT_TRUE(pc.has_value());
    EXPECT_EQ(pc->value, 1000000);
    EXPECT_EQ(pc->description, "web");
    EXPECT_FALSE(registry.get("missing").has_value());
}

TEST(PriorityRegistryTest, DuplicateName) {
    PriorityClassRegistry registry;
    ASSERT_TRUE(registry.create({"low", 100}).has_value());
    auto again = registry.create({"low", 5});
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::AlreadyExists);
}

TEST(PriorityRegistryTest, SecondDefaultRejected) {
    PriorityClassRegistry registry;
    ASSERT_TRUE(registry.create({"standard", 500, true}).has_value());

    auto second = registry.create({"other", 10, true});
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, ErrorCode::DuplicateDefaultPriorityClass);
    EXPECT_FALSE(registry.get("other").has_value());
    EXPECT_EQ(registry.default_class()->name, "standard");
}

TEST(PriorityRegistryTest, RemovingDefaultFreesSlot) {
    PriorityClassRegistry registry;
    ASSERT_TRUE(registry.create({"standard", 500, true}).has_value());
    EXPECT_TRUE(registry.remove("standard"));
    EXPECT_FALSE(registry.remove("standard"));
    EXPECT_FALSE(registry.default_class().has_value());
    EXPECT_TRUE(registry.create({"other", 10, true}).has_value());
}

TEST(PriorityRegistryTest, RejectsInvalidClasses) {
    PriorityClassRegistry registry;
    EXPECT_EQ(registry.create({"", 1}).error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(registry.create({"system-mine", 1}).error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(registry.create({"huge", HIGHEST_USER_PRIORITY + 1}).error().code,
              ErrorCode::InvalidArgument);
}

TEST(PriorityRegistryTest, SystemClasses) {
    PriorityClassRegistry registry;
    registry.install_system_classes();
    registry.install_system_classes();
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_EQ(registry.get("system-node-critical")->value, SYSTEM_NODE_CRITICAL);
    EXPECT_GT(SYSTEM_CLUSTER_CRITICAL, HIGHEST_USER_PRIORITY);
}

TEST(PriorityRegistryTest, ResolveNamedDefaultAndNone) {
    PriorityClassRegistry registry;
    ASSERT_TRUE(registry.create({"low", 100, false, PreemptionPolicy::NeverPreempt}).has_value());

    auto none = registry.resolve(std::nullopt);
    ASSERT_TRUE(none.has_value());
    EXPECT_EQ(none->value, 0);
    EXPECT_TRUE(none->class_name.empty());
    EXPECT_EQ(none->preemption_policy, PreemptionPolicy::CanPreemptLower);

    auto named = registry.resolve(std::string{"low"});
    ASSERT_TRUE(named.has_value());
    EXPECT_EQ(named->value, 100);
    EXPECT_EQ(named->preemption_policy, PreemptionPolicy::NeverPreempt);

    ASSERT_TRUE(registry.create({"standard", 500, true}).has_value());
    EXPECT_EQ(registry.resolve(std::nullopt)->class_name, "standard");
    EXPECT_EQ(registry.resolve(std::string{""})->class_name, "standard");

    auto unknown = registry.resolve(std::string{"ghost"});
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code, ErrorCode::UnknownPriorityClass);
}

TEST(PriorityRegistryTest, ListIsSortedByName) {
    PriorityClassRegistry registry;
    ASSERT_TRUE(registry.create({"zeta", 1}).has_value());
    ASSERT_TRUE(registry.create({"alpha", 2}).has_value());
    auto all = registry.list();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].name, "alpha");
    EXPECT_EQ(all[1].name, "zeta");
}

TEST(PriorityRegistryTest, ConcurrentDefaultClaimsHaveOneWinner) {
    PriorityClassRegistry registry;
    std::atomic<int> winners{0};
    std::atomic<int> duplicates{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i] {
            auto r = registry.create({"class-" + std::to_string(i), i, true});
            if (r) {
                ++winners;
            } else if (r.error().code == ErrorCode::DuplicateDefaultPriorityClass) {
                ++duplicates;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(duplicates.load(), 7);
}
