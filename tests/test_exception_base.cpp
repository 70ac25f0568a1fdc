/**
 * @file test_exception_base.cpp
 * @brief Unit tests for typed domain exceptions and their serialization
 */

#include <gtest/gtest.h>
#include <domaincore/exception/exceptions.h>
#include <memory>
#include <stdexcept>
#include <string>

using namespace domaincore::exception;

namespace {

Json::Value parseJson(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        ADD_FAILURE() << "Invalid JSON: " << errors;
    }
    return root;
}

} // anonymous namespace

class ExceptionBaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        ExceptionBase::setStackCaptureEnabled(true);
    }

    void TearDown() override {
        ExceptionBase::setStackCaptureEnabled(true);
    }
};

TEST_F(ExceptionBaseTest, CodesAreFixedPerVariant) {
    EXPECT_STREQ(ArgumentNotProvidedException("m").getCode(), "generic_argument_not_provided");
    EXPECT_STREQ(ArgumentInvalidException("m").getCode(), "generic_argument_invalid");
    EXPECT_STREQ(ArgumentOutOfRangeException("m").getCode(), "generic_argument_out_of_range");
}

TEST_F(ExceptionBaseTest, MessageIsStoredVerbatim) {
    ArgumentNotProvidedException ex("  Email is required\n");

    EXPECT_EQ(ex.getMessage(), "  Email is required\n");
    EXPECT_EQ(std::string(ex.what()), "  Email is required\n");
    EXPECT_FALSE(ex.getMetadata().has_value());
    EXPECT_FALSE(ex.getCause());
}

TEST_F(ExceptionBaseTest, CanBeCaughtAsBaseAndStdException) {
    bool caughtAsBase = false;
    try {
        throw ArgumentInvalidException("bad value");
    } catch (const ExceptionBase& e) {
        caughtAsBase = true;
        EXPECT_STREQ(e.getCode(), ArgumentInvalidException::kCode);
    }
    EXPECT_TRUE(caughtAsBase);

    EXPECT_THROW(throw ArgumentNotProvidedException("missing"), std::runtime_error);
}

TEST_F(ExceptionBaseTest, SerializeWithoutCauseOrMetadata) {
    ArgumentNotProvidedException ex("missing");
    SerializedException serialized = ex.serialize();

    EXPECT_EQ(serialized.message, "missing");
    EXPECT_EQ(serialized.code, "generic_argument_not_provided");
    EXPECT_FALSE(serialized.cause.has_value());
    EXPECT_FALSE(serialized.metadata.has_value());

    Json::Value json = serialized.toJson();
    EXPECT_EQ(json["message"].asString(), "missing");
    EXPECT_EQ(json["code"].asString(), "generic_argument_not_provided");
    EXPECT_FALSE(json.isMember("cause"));
    EXPECT_FALSE(json.isMember("metadata"));
}

TEST_F(ExceptionBaseTest, SerializeIncludesMetadata) {
    Json::Value metadata(Json::objectValue);
    metadata["field"] = "email";
    metadata["attempt"] = 2;

    ArgumentInvalidException ex("invalid", metadata);
    SerializedException serialized = ex.serialize();

    ASSERT_TRUE(serialized.metadata.has_value());
    EXPECT_EQ(*serialized.metadata, metadata);
    EXPECT_EQ(serialized.toJson()["metadata"]["field"].asString(), "email");
}

TEST_F(ExceptionBaseTest, SerializeRendersStdExceptionCause) {
    std::unique_ptr<ArgumentInvalidException> wrapped;
    try {
        throw std::runtime_error("connection refused");
    } catch (...) {
        wrapped = std::make_unique<ArgumentInvalidException>(
            "lookup failed", std::nullopt, std::current_exception());
    }
    ASSERT_TRUE(wrapped);
    EXPECT_TRUE(wrapped->getCause());

    SerializedException serialized = wrapped->serialize();
    ASSERT_TRUE(serialized.cause.has_value());
    EXPECT_EQ(*serialized.cause, R"({"message":"connection refused"})");
    EXPECT_EQ(serialized.code, "generic_argument_invalid");
    EXPECT_TRUE(serialized.toJson().isMember("cause"));
}

TEST_F(ExceptionBaseTest, SerializeRendersDomainExceptionCause) {
    ExceptionBase::setStackCaptureEnabled(false);

    std::unique_ptr<ArgumentOutOfRangeException> wrapped;
    try {
        Json::Value metadata(Json::objectValue);
        metadata["min"] = 0;
        throw ArgumentNotProvidedException("age missing", metadata);
    } catch (const ExceptionBase&) {
        wrapped = std::make_unique<ArgumentOutOfRangeException>(
            "age rejected", std::nullopt, std::current_exception());
    }
    ASSERT_TRUE(wrapped);

    SerializedException serialized = wrapped->serialize();
    EXPECT_EQ(serialized.code, "generic_argument_out_of_range");
    ASSERT_TRUE(serialized.cause.has_value());

    Json::Value cause = parseJson(*serialized.cause);
    EXPECT_EQ(cause["message"].asString(), "age missing");
    EXPECT_EQ(cause["code"].asString(), "generic_argument_not_provided");
    EXPECT_EQ(cause["metadata"]["min"].asInt(), 0);
    EXPECT_FALSE(cause.isMember("stack"));
}

TEST_F(ExceptionBaseTest, RenderCauseOfEmptyPointerIsNull) {
    EXPECT_EQ(renderCause(nullptr), "null");
    EXPECT_EQ(renderCause(std::exception_ptr{}), "null");
}

TEST_F(ExceptionBaseTest, RenderCauseOfStdException) {
    auto cause = std::make_exception_ptr(std::out_of_range("index 7"));
    EXPECT_EQ(renderCause(cause), R"({"message":"index 7"})");
}

TEST_F(ExceptionBaseTest, StackAbsentWhenCaptureDisabled) {
    ExceptionBase::setStackCaptureEnabled(false);
    EXPECT_FALSE(ExceptionBase::isStackCaptureEnabled());

    ArgumentNotProvidedException ex("missing");
    EXPECT_FALSE(ex.getStack().has_value());
    EXPECT_FALSE(ex.serialize().stack.has_value());
    EXPECT_FALSE(ex.serialize().toJson().isMember("stack"));
}

TEST_F(ExceptionBaseTest, StackCarriedIntoSerializedForm) {
    ArgumentNotProvidedException ex("missing");

    SerializedException serialized = ex.serialize();
    EXPECT_EQ(serialized.stack, ex.getStack());
    EXPECT_EQ(serialized.toJson().isMember("stack"), ex.getStack().has_value());
}

TEST_F(ExceptionBaseTest, SerializeIsIdempotent) {
    std::unique_ptr<ArgumentInvalidException> ex;
    try {
        throw std::logic_error("root");
    } catch (...) {
        ex = std::make_unique<ArgumentInvalidException>(
            "wrapped", Json::Value("context"), std::current_exception());
    }
    ASSERT_TRUE(ex);

    EXPECT_EQ(ex->serialize().toJsonString(), ex->serialize().toJsonString());
}

TEST_F(ExceptionBaseTest, CopyPreservesState) {
    ArgumentInvalidException original("invalid", Json::Value(42));
    ArgumentInvalidException copy(original);

    EXPECT_EQ(copy.getMessage(), original.getMessage());
    EXPECT_EQ(copy.getMetadata(), original.getMetadata());
    EXPECT_EQ(copy.serialize().toJsonString(), original.serialize().toJsonString());
}
