#include <gtest/gtest.h>
#include "mojrpc/error_shaper.hpp"
#include <stdexcept>

using namespace mojrpc;

TEST(ErrorShaper, StandardCodes) {
    EXPECT_EQ(ErrorShaper::code_of(ErrorKind::ParseError), -32700);
    EXPECT_EQ(ErrorShaper::code_of(ErrorKind::InvalidRequest), -32600);
    EXPECT_EQ(ErrorShaper::code_of(ErrorKind::MethodNotFound), -32601);
    EXPECT_EQ(ErrorShaper::code_of(ErrorKind::InvalidParams), -32602);
    EXPECT_EQ(ErrorShaper::code_of(ErrorKind::InternalError), -32603);
}

TEST(ErrorShaper, KindWithData) {
    auto err = ErrorShaper::shape(ErrorKind::InvalidRequest, nlohmann::json("Empty batch"));
    EXPECT_EQ(err.code, -32600);
    EXPECT_EQ(err.message, "Invalid Request");
    EXPECT_EQ(*err.data, "Empty batch");
}

TEST(ErrorShaper, InvalidParamsDefaultMessage) {
    auto err = ErrorShaper::shape(RpcErr::invalid_params());
    EXPECT_EQ(err.code, -32602);
    EXPECT_EQ(err.message, "Invalid params");
    EXPECT_FALSE(err.data.has_value());
}

TEST(ErrorShaper, InvalidParamsCustomMessage) {
    auto err = ErrorShaper::shape(RpcErr::invalid_params("expected job id", nlohmann::json{{"index", 0}}));
    EXPECT_EQ(err.code, -32602);
    EXPECT_EQ(err.message, "expected job id");
    EXPECT_EQ((*err.data)["index"], 0);
}

TEST(ErrorShaper, ApplicationErrorPassesThrough) {
    auto err = ErrorShaper::shape(RpcErr::application(-32000, "insufficient balance", nlohmann::json("0x0")));
    EXPECT_EQ(err.code, -32000);
    EXPECT_EQ(err.message, "insufficient balance");
    EXPECT_EQ(*err.data, "0x0");

    EXPECT_EQ(ErrorShaper::shape(RpcErr::application(-32099, "x")).code, -32099);
    EXPECT_EQ(ErrorShaper::shape(RpcErr::application(3, "reverted")).code, 3);
    EXPECT_EQ(ErrorShaper::shape(RpcErr::application(-40000, "custom")).code, -40000);
}

TEST(ErrorShaper, ReservedApplicationCodesNormalized) {
    for (int code : {-32700, -32600, -32601, -32602, -32603, -32100, -32768, -32500}) {
        auto err = ErrorShaper::shape(RpcErr::application(code, "leaks", nlohmann::json("secret")));
        EXPECT_EQ(err.code, -32603) << code;
        EXPECT_EQ(err.message, "Internal error") << code;
        EXPECT_FALSE(err.data.has_value()) << code;
    }
}

TEST(ErrorShaper, HandlerErrorException) {
    auto ex = std::make_exception_ptr(RpcHandlerError(RpcErr::application(-32001, "job not ready")));
    auto err = ErrorShaper::shape(ex);
    EXPECT_EQ(err.code, -32001);
    EXPECT_EQ(err.message, "job not ready");
}

TEST(ErrorShaper, UnexpectedExceptionIsOpaque) {
    auto ex = std::make_exception_ptr(std::runtime_error("db at /var/lib/secret failed"));
    auto err = ErrorShaper::shape(ex);
    EXPECT_EQ(err.code, -32603);
    EXPECT_EQ(err.message, "Internal error");
    EXPECT_FALSE(err.data.has_value());
}

TEST(ErrorShaper, NonStandardException) {
    auto err = ErrorShaper::shape(std::make_exception_ptr(42));
    EXPECT_EQ(err.code, -32603);
    EXPECT_EQ(err.message, "Internal error");
}

TEST(ErrorShaper, Timeout) {
    auto err = ErrorShaper::shape(std::make_exception_ptr(RpcTimeoutError("Request timed out: moj_getProof")));
    EXPECT_EQ(err.code, -32603);
    EXPECT_EQ(err.message, "handler timed out");
}

TEST(ErrorShaper, FromWire) {
    auto std_err = ErrorShaper::from_wire(JsonRpcError{-32602, "bad block tag", std::nullopt});
    EXPECT_EQ(std_err.kind, ErrorKind::InvalidParams);
    EXPECT_EQ(std_err.message, "bad block tag");

    auto app = ErrorShaper::from_wire(JsonRpcError{-32000, "nonce too low", nlohmann::json(1)});
    EXPECT_EQ(app.kind, ErrorKind::Application);
    EXPECT_EQ(app.code, -32000);
    EXPECT_EQ(*app.data, 1);
}

TEST(ErrorShaper, ErrorResponse) {
    auto resp = ErrorShaper::error_response(RequestId{int64_t{4}}, ErrorShaper::shape(ErrorKind::MethodNotFound));
    EXPECT_TRUE(resp.is_error());
    EXPECT_EQ(std::get<int64_t>(*resp.id), 4);
    EXPECT_EQ(resp.error->message, "Method not found");
}
