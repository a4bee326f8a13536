/**
 * @file test_error_model.cpp
 * @brief Tests for error codes, messages and categories
 */

#include <gtest/gtest.h>

#include <string>

#include "vgl/core/vgl_error.h"
#include "vgl/core/vgl_error_model.h"
#include "vgl/wire/vgl_errors.h"

TEST(ErrorModel, MessagesMatchEngineErrorStrings) {
    EXPECT_STREQ(vgl_error_message(VGL_SUCCESS), "Success");
    EXPECT_STREQ(vgl_error_message(VGL_ERROR_MODEL_NOT_LOADED), "No model loaded");
    EXPECT_STREQ(vgl_error_message(VGL_ERROR_NULL_RESPONSE),
                 "Invalid response from native engine");
    EXPECT_STREQ(vgl_error_message(-12345), "Unknown error");
}

TEST(ErrorModel, CategoriesFollowCodeRanges) {
    EXPECT_STREQ(vgl_error_category(VGL_SUCCESS), "Success");
    EXPECT_STREQ(vgl_error_category(VGL_ERROR_NOT_INITIALIZED), "Initialization");
    EXPECT_STREQ(vgl_error_category(VGL_ERROR_MODEL_LOAD_FAILED), "Model");
    EXPECT_STREQ(vgl_error_category(VGL_ERROR_INFERENCE_FAILED), "Inference");
    EXPECT_STREQ(vgl_error_category(VGL_ERROR_NULL_POINTER), "Validation");
    EXPECT_STREQ(vgl_error_category(VGL_ERROR_UNSUPPORTED_AUDIO_FORMAT), "Audio");
    EXPECT_STREQ(vgl_error_category(VGL_ERROR_PROTOCOL_TRUNCATED), "Protocol");
    EXPECT_STREQ(vgl_error_category(VGL_ERROR_PROVIDER_NOT_FOUND), "EngineProvider");
    EXPECT_STREQ(vgl_error_category(VGL_ERROR_NULL_RESPONSE), "Engine");
    EXPECT_STREQ(vgl_error_category(VGL_ERROR_CHANNEL_CLOSED), "Channel");
    EXPECT_STREQ(vgl_error_category(VGL_ERROR_CONFIG_INVALID), "Other");
    EXPECT_STREQ(vgl_error_category(-5000), "Unknown");
}

TEST(ErrorModel, MakeErrorModel) {
    vgl_error_model_t model = vgl_make_error_model(VGL_ERROR_PROTOCOL_UNKNOWN_TAG);
    EXPECT_EQ(model.code, VGL_ERROR_PROTOCOL_UNKNOWN_TAG);
    EXPECT_STREQ(model.message, "Unknown tag");
    EXPECT_STREQ(model.category, "Protocol");
    EXPECT_EQ(model.retryable, VGL_FALSE);
}

TEST(ErrorModel, EngineFailuresAreRetryableProtocolFailuresAreNot) {
    EXPECT_EQ(vgl_error_is_retryable(VGL_ERROR_NULL_RESPONSE), VGL_TRUE);
    EXPECT_EQ(vgl_error_is_retryable(VGL_ERROR_MODEL_LOAD_FAILED), VGL_TRUE);
    EXPECT_EQ(vgl_error_is_retryable(VGL_ERROR_INFERENCE_FAILED), VGL_TRUE);
    EXPECT_EQ(vgl_error_is_retryable(VGL_ERROR_PROTOCOL_TRUNCATED), VGL_FALSE);
    EXPECT_EQ(vgl_error_is_retryable(VGL_ERROR_CHANNEL_CLOSED), VGL_FALSE);
    EXPECT_EQ(vgl_error_is_retryable(VGL_ERROR_NULL_POINTER), VGL_FALSE);
    EXPECT_EQ(vgl_error_is_retryable(VGL_SUCCESS), VGL_FALSE);
    EXPECT_EQ(vgl_error_is_retryable(-5000), VGL_FALSE);
}

TEST(ErrorModel, BridgeErrorKinds) {
    vgl::ProtocolError protocol(VGL_ERROR_PROTOCOL_MALFORMED, "bad bool");
    vgl::EngineFault fault("No model loaded");

    EXPECT_EQ(protocol.kind(), vgl::ErrorKind::Protocol);
    EXPECT_EQ(protocol.code(), VGL_ERROR_PROTOCOL_MALFORMED);
    EXPECT_EQ(fault.kind(), vgl::ErrorKind::Engine);
    EXPECT_EQ(fault.code(), VGL_ERROR_ENGINE_FAULT);
    EXPECT_EQ(std::string(fault.what()), "No model loaded");

    const vgl::BridgeError& as_base = fault;
    EXPECT_EQ(as_base.kind(), vgl::ErrorKind::Engine);
}

TEST(ErrorModel, BridgeErrorReportsCategoryOfItsCode) {
    vgl::ProtocolError protocol(VGL_ERROR_PROTOCOL_TRAILING_BYTES, "3 trailing bytes");
    vgl::EngineFault fault("Invalid response from native engine", VGL_ERROR_NULL_RESPONSE);

    EXPECT_STREQ(protocol.category(), "Protocol");
    EXPECT_FALSE(protocol.retryable());
    EXPECT_STREQ(fault.category(), "Engine");
    EXPECT_TRUE(fault.retryable());
}
