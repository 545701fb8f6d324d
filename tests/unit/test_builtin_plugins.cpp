/**
 * @file test_builtin_plugins.cpp
 * @brief Unit tests for the in-process mutating and validating plugins.
 * @author Dimitris Kafetzis
 */

#include "admission/builtin_plugins.hpp"
#include "admission/pipeline.hpp"

#include <gtest/gtest.h>

using namespace cluster_gate;
using nlohmann::json;

namespace {

AdmissionRequest pod(const std::string& user, json spec = json::object()) {
    AdmissionRequest req;
    req.uid = "uid-1";
    req.operation = Operation::Create;
    req.kind = "Pod";
    req.namespace_name = "default";
    req.user = user;
    req.object = {{"metadata", {{"name", "web"}, {"namespace", "default"}}}, {"spec", std::move(spec)}};
    return req;
}

AdmissionRequest priority_class(const std::string& name, int64_t value, bool global_default) {
    AdmissionRequest req;
    req.uid = "uid-pc";
    req.operation = Operation::Create;
    req.kind = "PriorityClass";
    req.user = "admin";
    req.object = {{"metadata", {{"name", name}}}, {"value", value}, {"globalDefault", global_default}};
    return req;
}

json apply(const AdmissionRequest& req, const Result<Patch>& patch) {
    EXPECT_TRUE(patch.has_value());
    auto out = apply_patch(req.object, *patch);
    EXPECT_TRUE(out.has_value());
    return *out;
}

}  // namespace

// ─────────────────────────────────────────────
// CreatedByLabeler
// ─────────────────────────────────────────────

TEST(CreatedByLabelerTest, LabelsWithUser) {
    CreatedByLabeler labeler;
    auto req = pod("alice");
    auto out = apply(req, labeler.mutate(req, {}));
    EXPECT_EQ(out["metadata"]["labels"]["created-by"], "alice");
}

TEST(CreatedByLabelerTest, OverwritesForgedLabel) {
    CreatedByLabeler labeler("owner");
    auto req = pod("bob");
    req.object["metadata"]["labels"] = {{"owner", "mallory"}, {"app", "web"}};
    auto out = apply(req, labeler.mutate(req, {}));
    EXPECT_EQ(out["metadata"]["labels"]["owner"], "bob");
    EXPECT_EQ(out["metadata"]["labels"]["app"], "web");
}

TEST(CreatedByLabelerTest, AnonymousAndDelete) {
    CreatedByLabeler labeler;
    auto req = pod("");
    auto out = apply(req, labeler.mutate(req, {}));
    EXPECT_EQ(out["metadata"]["labels"]["created-by"], std::string{ANONYMOUS_USER});

    req.operation = Operation::Delete;
    auto patch = labeler.mutate(req, {});
    ASSERT_TRUE(patch.has_value());
    EXPECT_TRUE(patch->empty());
}

TEST(CreatedByLabelerTest, AlreadyLabelledIsNoOp) {
    CreatedByLabeler labeler;
    auto req = pod("alice");
    req.object["metadata"]["labels"] = {{"created-by", "alice"}};
    auto patch = labeler.mutate(req, {});
    ASSERT_TRUE(patch.has_value());
    EXPECT_TRUE(patch->empty());
}

// ─────────────────────────────────────────────
// PriorityResolver
// ─────────────────────────────────────────────

TEST(PriorityResolverTest, ResolvesNamedClass) {
    auto registry = std::make_shared<PriorityClassRegistry>();
    ASSERT_TRUE(registry->create({"low", 100, false, PreemptionPolicy::NeverPreempt, ""}).has_value());

    PriorityResolver resolver(registry);
    auto req = pod("alice", {{"priorityClassName", "low"}});
    auto out = apply(req, resolver.mutate(req, {}));
    EXPECT_EQ(out["spec"]["priority"], 100);
    EXPECT_EQ(out["spec"]["preemptionPolicy"], "Never");
}

TEST(PriorityResolverTest, FillsDefaultClassName) {
    auto registry = std::make_shared<PriorityClassRegistry>();
    ASSERT_TRUE(registry->create({"standard", 500, true, PreemptionPolicy::CanPreemptLower, ""}).has_value());

    PriorityResolver resolver(registry);
    auto req = pod("alice");
    auto out = apply(req, resolver.mutate(req, {}));
    EXPECT_EQ(out["spec"]["priorityClassName"], "standard");
    EXPECT_EQ(out["spec"]["priority"], 500);
    EXPECT_EQ(out["spec"]["preemptionPolicy"], "PreemptLowerPriority");
}

TEST(PriorityResolverTest, NoClassNoDefaultIsZero) {
    auto registry = std::make_shared<PriorityClassRegistry>();
    PriorityResolver resolver(registry);
    auto req = pod("alice");
    auto out = apply(req, resolver.mutate(req, {}));
    EXPECT_EQ(out["spec"]["priority"], 0);
    EXPECT_FALSE(out["spec"].contains("priorityClassName"));
}

TEST(PriorityResolverTest, UnknownClassFails) {
    auto registry = std::make_shared<PriorityClassRegistry>();
    PriorityResolver resolver(registry);
    auto req = pod("alice", {{"priorityClassName", "ghost"}});
    auto patch = resolver.mutate(req, {});
    ASSERT_FALSE(patch.has_value());
    EXPECT_EQ(patch.error().code, ErrorCode::UnknownPriorityClass);
}

// ─────────────────────────────────────────────
// DefaultResourceRequests
// ─────────────────────────────────────────────

TEST(DefaultResourceRequestsTest, FillsOnlyMissingEntries) {
    DefaultResourceRequests defaults({.cpu_millis = 100, .memory_bytes = 128ULL << 20});
    auto req = pod("alice", {{"resources", {{"requests", {{"cpu", "2"}}}}}});
    auto out = apply(req, defaults.mutate(req, {}));
    EXPECT_EQ(out["spec"]["resources"]["requests"]["cpu"], "2");
    EXPECT_EQ(out["spec"]["resources"]["requests"]["memory"], "128Mi");
}

TEST(DefaultResourceRequestsTest, CreatesWholeTree) {
    DefaultResourceRequests defaults({.cpu_millis = 250, .memory_bytes = 0});
    auto req = pod("alice");
    auto out = apply(req, defaults.mutate(req, {}));
    EXPECT_EQ(out["spec"]["resources"]["requests"]["cpu"], "250m");
    EXPECT_FALSE(out["spec"]["resources"]["requests"].contains("memory"));
}

// ─────────────────────────────────────────────
// PriorityClassDefault
// ─────────────────────────────────────────────

TEST(PriorityClassDefaultTest, SecondDefaultIsRejected) {
    auto registry = std::make_shared<PriorityClassRegistry>();
    ASSERT_TRUE(registry->create({"standard", 500, true, PreemptionPolicy::CanPreemptLower, ""}).has_value());

    PriorityClassDefault validator(registry);
    auto verdict = validator.validate(priority_class("other", 10, true), {});
    ASSERT_TRUE(verdict.has_value());
    EXPECT_FALSE(verdict->allowed);
    EXPECT_EQ(verdict->code, ErrorCode::DuplicateDefaultPriorityClass);
}

TEST(PriorityClassDefaultTest, NonDefaultAndFirstDefaultAllowed) {
    auto registry = std::make_shared<PriorityClassRegistry>();
    PriorityClassDefault validator(registry);
    EXPECT_TRUE(validator.validate(priority_class("first", 10, true), {})->allowed);
    EXPECT_TRUE(validator.validate(priority_class("plain", 10, false), {})->allowed);
}

TEST(PriorityClassDefaultTest, ExistingNameIsRejected) {
    auto registry = std::make_shared<PriorityClassRegistry>();
    ASSERT_TRUE(registry->create({"low", 100, false, PreemptionPolicy::NeverPreempt, ""}).has_value());
    PriorityClassDefault validator(registry);
    auto verdict = validator.validate(priority_class("low", 5, false), {});
    ASSERT_TRUE(verdict.has_value());
    EXPECT_EQ(verdict->code, ErrorCode::AlreadyExists);
}

TEST(PriorityClassDefaultTest, IgnoresOtherKinds) {
    auto registry = std::make_shared<PriorityClassRegistry>();
    ASSERT_TRUE(registry->create({"standard", 500, true, PreemptionPolicy::CanPreemptLower, ""}).has_value());
    PriorityClassDefault validator(registry);
    auto req = pod("alice");
    req.object["globalDefault"] = true;
    EXPECT_TRUE(validator.validate(req, {})->allowed);
}

// ─────────────────────────────────────────────
// RequiredLabels / NamespaceLifecycle
// ─────────────────────────────────────────────

TEST(RequiredLabelsTest, ListsMissingKeys) {
    RequiredLabels validator({"team", "app", "tier"});
    auto req = pod("alice");
    req.object["metadata"]["labels"] = {{"app", "web"}};
    auto verdict = validator.validate(req, {});
    ASSERT_TRUE(verdict.has_value());
    EXPECT_FALSE(verdict->allowed);
    EXPECT_EQ(verdict->reason, "missing required label(s): team, tier");
}

TEST(RequiredLabelsTest, AllPresent) {
    RequiredLabels validator({"app"});
    auto req = pod("alice");
    req.object["metadata"]["labels"] = {{"app", "web"}};
    EXPECT_TRUE(validator.validate(req, {})->allowed);
}

TEST(NamespaceLifecycleTest, UnknownNamespaceDenied) {
    auto namespaces = std::make_shared<NamespaceRegistry>();
    namespaces->add("default");
    NamespaceLifecycle validator(namespaces);

    auto ok = pod("alice");
    EXPECT_TRUE(validator.validate(ok, {})->allowed);

    auto bad = pod("alice");
    bad.namespace_name = "ghost";
    auto verdict = validator.validate(bad, {});
    ASSERT_TRUE(verdict.has_value());
    EXPECT_FALSE(verdict->allowed);
    EXPECT_EQ(verdict->code, ErrorCode::NotFound);

    bad.operation = Operation::Delete;
    EXPECT_TRUE(validator.validate(bad, {})->allowed);
}

TEST(NamespaceRegistryTest, AddRemoveList) {
    NamespaceRegistry registry;
    EXPECT_TRUE(registry.add("b"));
    EXPECT_TRUE(registry.add("a"));
    EXPECT_FALSE(registry.add("a"));
    EXPECT_EQ(registry.list(), (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(registry.remove("a"));
    EXPECT_FALSE(registry.remove("a"));
    EXPECT_FALSE(registry.contains("a"));
}

// ─────────────────────────────────────────────
// Chained through a pipeline
// ─────────────────────────────────────────────

TEST(BuiltinChainTest, CreatedByThenRequiredLabel) {
    auto pipeline = AdmissionPipeline::create({
        AdmissionStage::mutating("created-by", 0, std::make_shared<CreatedByLabeler>()),
        AdmissionStage::validating("required-labels", 0,
                                   std::make_shared<RequiredLabels>(std::vector<std::string>{"created-by"})),
    });
    ASSERT_TRUE(pipeline.has_value());

    auto review = pipeline->admit(pod("alice"));
    ASSERT_TRUE(review.verdict.allowed) << review.verdict.reason;
    EXPECT_EQ(review.request.object["metadata"]["labels"]["created-by"], "alice");
}
