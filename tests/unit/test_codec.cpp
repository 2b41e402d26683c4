#include <gtest/gtest.h>
#include "mojrpc/codec.hpp"
#include "mojrpc/error.hpp"

using namespace mojrpc;

// ---- Decode tests ----

TEST(CodecDecode, Object) {
    auto j = Codec::decode(R"({"jsonrpc":"2.0","id":1,"method":"moj_echo","params":{"a":[1,2.5,"x",null,true]}})");
    ASSERT_TRUE(j.is_object());
    EXPECT_EQ(j["id"], 1);
    EXPECT_EQ(j["params"]["a"][0], 1);
    EXPECT_DOUBLE_EQ(j["params"]["a"][1].get<double>(), 2.5);
    EXPECT_EQ(j["params"]["a"][2], "x");
    EXPECT_TRUE(j["params"]["a"][3].is_null());
    EXPECT_EQ(j["params"]["a"][4], true);
}

TEST(CodecDecode, Array) {
    auto j = Codec::decode(R"([{"jsonrpc":"2.0","method":"a"},{"jsonrpc":"2.0","method":"b"}])");
    ASSERT_TRUE(j.is_array());
    EXPECT_EQ(j.size(), 2u);
}

TEST(CodecDecode, ScalarDocuments) {
    EXPECT_EQ(Codec::decode("42"), 42);
    EXPECT_EQ(Codec::decode(R"("hello")"), "hello");
    EXPECT_EQ(Codec::decode("true"), true);
    EXPECT_TRUE(Codec::decode("null").is_null());
}

TEST(CodecDecode, InvalidJson) {
    EXPECT_THROW(Codec::decode("not-json"), RpcParseError);
    EXPECT_THROW(Codec::decode("{invalid json"), RpcParseError);
}

TEST(CodecDecode, EmptyInput) {
    EXPECT_THROW(Codec::decode(""), RpcParseError);
}

TEST(CodecDecode, TrailingContent) {
    EXPECT_THROW(Codec::decode(R"({"jsonrpc":"2.0"} {"jsonrpc":"2.0"})"), RpcParseError);
}

// ---- Request validation ----

TEST(CodecParseRequest, Valid) {
    auto req = Codec::parse_request(nlohmann::json::parse(
        R"({"jsonrpc":"2.0","id":1,"method":"moj_echo","params":["hi"]})"));
    EXPECT_EQ(std::get<int64_t>(*req.id), 1);
    EXPECT_EQ(req.method, "moj_echo");
    EXPECT_EQ((*req.params)[0], "hi");
}

TEST(CodecParseRequest, NullIdIsNotification) {
    auto req = Codec::parse_request(nlohmann::json::parse(
        R"({"jsonrpc":"2.0","id":null,"method":"moj_echo"})"));
    EXPECT_TRUE(req.is_notification());
    EXPECT_FALSE(req.params.has_value());
}

TEST(CodecParseRequest, NullParamsTreatedAsAbsent) {
    auto req = Codec::parse_request(nlohmann::json::parse(
        R"({"jsonrpc":"2.0","id":"s","method":"moj_echo","params":null})"));
    EXPECT_FALSE(req.params.has_value());
}

TEST(CodecParseRequest, NotAnObject) {
    EXPECT_THROW(Codec::parse_request(nlohmann::json(1)), RpcInvalidRequestError);
}

TEST(CodecParseRequest, MissingMethodKeepsId) {
    try {
        (void)Codec::parse_request(nlohmann::json::parse(R"({"jsonrpc":"2.0","id":9})"));
        FAIL() << "expected RpcInvalidRequestError";
    } catch (const RpcInvalidRequestError& e) {
        ASSERT_TRUE(e.id.has_value());
        EXPECT_EQ(std::get<int64_t>(*e.id), 9);
    }
}

TEST(CodecParseRequest, WrongVersion) {
    EXPECT_THROW(Codec::parse_request(nlohmann::json::parse(R"({"jsonrpc":"1.0","id":1,"method":"a"})")),
                 RpcInvalidRequestError);
    EXPECT_THROW(Codec::parse_request(nlohmann::json::parse(R"({"id":1,"method":"a"})")),
                 RpcInvalidRequestError);
    EXPECT_THROW(Codec::parse_request(nlohmann::json::parse(R"({"jsonrpc":2.0,"id":1,"method":"a"})")),
                 RpcInvalidRequestError);
}

TEST(CodecParseRequest, MethodMustBeNonEmptyString) {
    EXPECT_THROW(Codec::parse_request(nlohmann::json::parse(R"({"jsonrpc":"2.0","id":1,"method":5})")),
                 RpcInvalidRequestError);
    EXPECT_THROW(Codec::parse_request(nlohmann::json::parse(R"({"jsonrpc":"2.0","id":1,"method":""})")),
                 RpcInvalidRequestError);
}

TEST(CodecParseRequest, ScalarParamsRejected) {
    EXPECT_THROW(Codec::parse_request(nlohmann::json::parse(
                     R"({"jsonrpc":"2.0","id":1,"method":"a","params":"x"})")),
                 RpcInvalidRequestError);
}

TEST(CodecParseRequest, BadIdDropsId) {
    try {
        (void)Codec::parse_request(nlohmann::json::parse(R"({"jsonrpc":"2.0","id":1.5,"method":"a"})"));
        FAIL() << "expected RpcInvalidRequestError";
    } catch (const RpcInvalidRequestError& e) {
        EXPECT_FALSE(e.id.has_value());
    }
}

// ---- Serialize tests ----

TEST(CodecSerialize, Response) {
    Response resp;
    resp.id = RequestId{std::string("r1")};
    resp.result = nlohmann::json{{"echo", nlohmann::json::array({"hi"})}};
    auto j = nlohmann::json::parse(Codec::serialize(resp));
    EXPECT_EQ(j, nlohmann::json::parse(R"({"jsonrpc":"2.0","id":"r1","result":{"echo":["hi"]}})"));
}

TEST(CodecSerialize, Batch) {
    Response a;
    a.id = RequestId{int64_t{1}};
    a.result = 1;
    Response b;
    b.id = RequestId{int64_t{2}};
    b.error = JsonRpcError{-32601, "Method not found", std::nullopt};

    auto j = nlohmann::json::parse(Codec::serialize_batch({a, b}));
    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 2u);
    EXPECT_EQ(j[0]["id"], 1);
    EXPECT_EQ(j[1]["error"]["code"], -32601);
}

TEST(CodecSerialize, InvalidUtf8IsReplaced) {
    nlohmann::json j = std::string("bad \xff byte");
    EXPECT_NO_THROW((void)Codec::dump(j));
}
