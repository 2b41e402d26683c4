#include <gtest/gtest.h>
#include "mojrpc/registry.hpp"
#include <stdexcept>

using namespace mojrpc;

namespace {

struct Ctx {};

using TestRegistry = Registry<Ctx>;

TestRegistry::SyncHandler returning(nlohmann::json value) {
    return [value](const Request&, const Ctx&) -> HandlerResult { return value; };
}

HandlerResult call(const TestRegistry& reg, const std::string& method) {
    auto res = reg.lookup(method);
    if (!res.handler) throw std::logic_error("not found");
    Request req;
    req.method = method;
    return std::get<TestRegistry::SyncHandler>(*res.handler)(req, Ctx{});
}

} // namespace

TEST(MethodNamespace, PrefixBeforeFirstUnderscore) {
    EXPECT_EQ(method_namespace("eth_getBalance").value_or(""), "eth");
    EXPECT_EQ(method_namespace("moj_get_proof").value_or(""), "moj");
    EXPECT_FALSE(method_namespace("bogus").has_value());
    EXPECT_FALSE(method_namespace("_private").has_value());
}

TEST(Registry, ExactLookup) {
    TestRegistry reg;
    reg.register_method("moj_echo", returning(1));
    auto res = reg.lookup("moj_echo");
    EXPECT_EQ(res.kind, ResolutionKind::Exact);
    ASSERT_NE(res.handler, nullptr);
}

TEST(Registry, FallbackLookup) {
    TestRegistry reg;
    reg.register_fallback("eth", returning("0x1"));
    EXPECT_EQ(reg.lookup("eth_chainId").kind, ResolutionKind::Fallback);
    EXPECT_EQ(reg.lookup("eth_blockNumber").kind, ResolutionKind::Fallback);
    EXPECT_EQ(std::get<nlohmann::json>(call(reg, "eth_chainId")), "0x1");
}

TEST(Registry, NotFound) {
    TestRegistry reg;
    reg.register_fallback("eth", returning(0));
    auto res = reg.lookup("net_version");
    EXPECT_EQ(res.kind, ResolutionKind::NotFound);
    EXPECT_EQ(res.handler, nullptr);
    EXPECT_EQ(reg.lookup("eth").kind, ResolutionKind::NotFound);
    EXPECT_EQ(reg.lookup("bogus").kind, ResolutionKind::NotFound);
}

TEST(Registry, ExactWinsOverFallbackRegardlessOfOrder) {
    TestRegistry before;
    before.register_method("eth_chainId", returning("exact"));
    before.register_fallback("eth", returning("fallback"));

    TestRegistry after;
    after.register_fallback("eth", returning("fallback"));
    after.register_method("eth_chainId", returning("exact"));

    for (const auto* reg : {&before, &after}) {
        EXPECT_EQ(reg->lookup("eth_chainId").kind, ResolutionKind::Exact);
        EXPECT_EQ(std::get<nlohmann::json>(call(*reg, "eth_chainId")), "exact");
        EXPECT_EQ(std::get<nlohmann::json>(call(*reg, "eth_gasPrice")), "fallback");
    }
}

TEST(Registry, ReRegistrationReplaces) {
    TestRegistry reg;
    reg.register_method("moj_echo", returning("old"));
    reg.register_method("moj_echo", returning("new"));
    EXPECT_EQ(std::get<nlohmann::json>(call(reg, "moj_echo")), "new");
    EXPECT_EQ(reg.methods().size(), 1u);

    reg.register_fallback("eth", returning(1));
    reg.register_fallback("eth", returning(2));
    EXPECT_EQ(std::get<nlohmann::json>(call(reg, "eth_x")), 2);
}

TEST(Registry, AsyncHandlers) {
    TestRegistry reg;
    reg.register_async("moj_getProof", [](const Request&, const Ctx&) {
        std::promise<HandlerResult> p;
        p.set_value(nlohmann::json("proof"));
        return p.get_future();
    });
    reg.register_fallback_async("debug", [](const Request&, const Ctx&) {
        std::promise<HandlerResult> p;
        p.set_value(RpcErr::internal());
        return p.get_future();
    });

    auto exact = reg.lookup("moj_getProof");
    ASSERT_EQ(exact.kind, ResolutionKind::Exact);
    EXPECT_TRUE(std::holds_alternative<TestRegistry::AsyncHandler>(*exact.handler));
    EXPECT_EQ(reg.lookup("debug_traceTransaction").kind, ResolutionKind::Fallback);
}

TEST(Registry, RejectsInvalidNames) {
    TestRegistry reg;
    EXPECT_THROW(reg.register_method("", returning(1)), std::invalid_argument);
    EXPECT_THROW(reg.register_fallback("", returning(1)), std::invalid_argument);
    EXPECT_THROW(reg.register_fallback("eth_", returning(1)), std::invalid_argument);
}

TEST(Registry, Introspection) {
    TestRegistry reg;
    reg.register_method("moj_getProof", returning(1))
       .register_method("eth_chainId", returning(2))
       .register_fallback("net", returning(3))
       .register_fallback("eth", returning(4));

    EXPECT_TRUE(reg.contains("eth_chainId"));
    EXPECT_FALSE(reg.contains("eth_gasPrice"));
    EXPECT_TRUE(reg.has_fallback("net"));
    EXPECT_FALSE(reg.has_fallback("moj"));
    EXPECT_EQ(reg.methods(), (std::vector<std::string>{"eth_chainId", "moj_getProof"}));
    EXPECT_EQ(reg.namespaces(), (std::vector<std::string>{"eth", "net"}));
}

TEST(Registry, ResolutionKindNames) {
    EXPECT_EQ(to_string(ResolutionKind::Exact), "exact");
    EXPECT_EQ(to_string(ResolutionKind::Fallback), "fallback");
    EXPECT_EQ(to_string(ResolutionKind::NotFound), "not-found");
}
