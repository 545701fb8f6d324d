/**
 * @file test_types.cpp
 * @brief Unit tests for core types, quantities, taints and affinity.
 */

#include "core/types.hpp"
#include "workload/quantity.hpp"
#include "workload/workload.hpp"

#include <gtest/gtest.h>

using namespace cluster_gate;

TEST(ResourceVectorTest, FitsWithin) {
    ResourceVector demand{.cpu_millis = 500, .memory_bytes = 1024};
    ResourceVector capacity{.cpu_millis = 1000, .memory_bytes = 1024};
    EXPECT_TRUE(demand.fits_within(capacity));
    demand.memory_bytes = 1025;
    EXPECT_FALSE(demand.fits_within(capacity));
}

TEST(ResourceVectorTest, SubtractionSaturates) {
    ResourceVector a{.cpu_millis = 100, .memory_bytes = 10};
    ResourceVector b{.cpu_millis = 300, .memory_bytes = 5};
    auto diff = a - b;
    EXPECT_EQ(diff.cpu_millis, 0u);
    EXPECT_EQ(diff.memory_bytes, 5u);
}

TEST(ResourceVectorTest, ThreeWayComparison) {
    ResourceVector a{.cpu_millis = 100, .memory_bytes = 1024};
    ResourceVector b{.cpu_millis = 200, .memory_bytes = 1024};
    EXPECT_TRUE(a < b);
    EXPECT_TRUE(a == a);
}

TEST(EnumTest, ParseAndRender) {
    EXPECT_EQ(parse_operation("CREATE"), Operation::Create);
    EXPECT_EQ(parse_operation("delete"), Operation::Delete);
    EXPECT_FALSE(parse_operation("PATCH").has_value());

    EXPECT_EQ(parse_preemption_policy("Never"), PreemptionPolicy::NeverPreempt);
    EXPECT_EQ(parse_preemption_policy("PreemptLowerPriority"), PreemptionPolicy::CanPreemptLower);
    EXPECT_EQ(to_string(PreemptionPolicy::NeverPreempt), "Never");

    EXPECT_EQ(parse_taint_effect("NoExecute"), TaintEffect::NoExecute);
    EXPECT_FALSE(parse_taint_effect("noexecute").has_value());

    EXPECT_EQ(to_string(WorkloadState::PendingPreemption), "pending_preemption");
}

// ─────────────────────────────────────────────
// Quantities
// ─────────────────────────────────────────────

TEST(QuantityTest, CpuForms) {
    EXPECT_EQ(*parse_cpu_millis("250m"), 250u);
    EXPECT_EQ(*parse_cpu_millis("2"), 2000u);
    EXPECT_EQ(*parse_cpu_millis("0.5"), 500u);
    EXPECT_EQ(*parse_cpu_millis("1.0005"), 1001u);   // rounded up
    EXPECT_EQ(*cpu_millis_from_json(nlohmann::json(3)), 3000u);
    EXPECT_EQ(*cpu_millis_from_json(nlohmann::json(0.25)), 250u);
}

TEST(QuantityTest, CpuRejectsGarbage) {
    EXPECT_FALSE(parse_cpu_millis("").has_value());
    EXPECT_FALSE(parse_cpu_millis("abc").has_value());
    EXPECT_FALSE(parse_cpu_millis("1.5m").has_value());
    EXPECT_FALSE(cpu_millis_from_json(nlohmann::json(-1)).has_value());
    EXPECT_FALSE(cpu_millis_from_json(nlohmann::json::array()).has_value());
}

TEST(QuantityTest, MemoryForms) {
    EXPECT_EQ(*parse_memory_bytes("128Mi"), 128ULL << 20);
    EXPECT_EQ(*parse_memory_bytes("1Gi"), 1ULL << 30);
    EXPECT_EQ(*parse_memory_bytes("1G"), 1000000000ULL);
    EXPECT_EQ(*parse_memory_bytes("1.5Ki"), 1536u);
    EXPECT_EQ(*parse_memory_bytes("4096"), 4096u);
    EXPECT_EQ(*memory_bytes_from_json(nlohmann::json(2048)), 2048u);
}

TEST(QuantityTest, MemoryOverflow) {
    auto r = parse_memory_bytes("99999999999Pi");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}

TEST(QuantityTest, Formatting) {
    EXPECT_EQ(format_cpu_millis(2000), "2");
    EXPECT_EQ(format_cpu_millis(1500), "1500m");
    EXPECT_EQ(format_memory_bytes(2ULL << 30), "2Gi");
    EXPECT_EQ(format_memory_bytes(1000), "1000");
}

// ─────────────────────────────────────────────
// Taints, tolerations, affinity
// ─────────────────────────────────────────────

TEST(TolerationTest, EqualMatchesKeyAndValue) {
    Taint taint{"dedicated", "gpu", TaintEffect::NoSchedule};
    Toleration match{"dedicated", Toleration::Operator::Equal, "gpu", std::nullopt};
    Toleration other{"dedicated", Toleration::Operator::Equal, "cpu", std::nullopt};
    EXPECT_TRUE(match.tolerates(taint));
    EXPECT_FALSE(other.tolerates(taint));
}

TEST(TolerationTest, ExistsAndEffect) {
    Taint taint{"maintenance", "", TaintEffect::NoExecute};
    Toleration any_key{"", Toleration::Operator::Exists, "", std::nullopt};
    Toleration wrong_effect{"maintenance", Toleration::Operator::Exists, "", TaintEffect::NoSchedule};
    EXPECT_TRUE(any_key.tolerates(taint));
    EXPECT_FALSE(wrong_effect.tolerates(taint));
    EXPECT_TRUE(tolerates_all({wrong_effect, any_key}, taint));
}

TEST(AffinityTest, KeyAndValues) {
    LabelMap labels{{"zone", "a"}, {"tier", "gpu"}};
    EXPECT_TRUE((AffinityTerm{"zone", {"a", "b"}}.matches(labels)));
    EXPECT_FALSE((AffinityTerm{"zone", {"c"}}.matches(labels)));
    EXPECT_TRUE((AffinityTerm{"tier", {}}.matches(labels)));
    EXPECT_FALSE((AffinityTerm{"rack", {}}.matches(labels)));
}
