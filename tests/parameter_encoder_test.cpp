#include <coro_request/errors.hpp>
#include <coro_request/form_data.hpp>
#include <coro_request/parameter_encoder.hpp>
#include <coro_request/parameters.hpp>

#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>
#include <string>

using namespace coro_request;

// ===========================================================================
// JSON
// ===========================================================================

TEST(JsonEncoderTest, RoundTripsNestedValues) {
    Parameters params = {
        {"name", "widget"},
        {"count", 42},
        {"ratio", 0.5},
        {"enabled", true},
        {"nothing", nullptr},
        {"tags", json11::Json::array{"a", "b"}},
        {"owner", json11::Json::object{{"id", 7}, {"name", "ann"}}},
    };

    Parameters decoded = decode_json(encode_json(params));

    EXPECT_EQ(decoded, params);
    EXPECT_EQ(decoded["owner"]["name"].string_value(), "ann");
    EXPECT_EQ(decoded["count"].int_value(), 42);
}

TEST(JsonEncoderTest, EmptyMapEncodesAsEmptyObject) {
    EXPECT_EQ(encode_json({}), "{}");
}

TEST(JsonEncoderTest, RejectsNonFiniteNumbers) {
    Parameters params = {{"value", json11::Json::array{1, std::numeric_limits<double>::infinity()}}};
    EXPECT_THROW(encode_json(params), std::invalid_argument);
}

TEST(JsonDecoderTest, RejectsMalformedOrNonObjectDocuments) {
    EXPECT_THROW(decode_json("Not valid JSON"), std::runtime_error);
    EXPECT_THROW(decode_json("[1, 2]"), std::runtime_error);
}

// ===========================================================================
// URL form
// ===========================================================================

TEST(FormEncoderTest, PercentEncodesReservedCharacters) {
    EXPECT_EQ(url_encode("test user"), "test%20user");
    EXPECT_EQ(url_encode("a&b=c"), "a%26b%3Dc");
    EXPECT_EQ(url_encode("safe-_.~"), "safe-_.~");
    EXPECT_EQ(url_decode("test+user%21"), "test user!");
}

TEST(FormEncoderTest, MalformedEscapeThrows) {
    EXPECT_THROW(url_decode("%4"), std::invalid_argument);
    EXPECT_THROW(url_decode("%zz"), std::invalid_argument);
}

TEST(FormEncoderTest, FlattensScalarsInKeyOrder) {
    Parameters params = {
        {"b", "two words"},
        {"a", 1},
        {"c", false},
        {"d", nullptr},
    };
    EXPECT_EQ(encode_form(params), "a=1&b=two%20words&c=false&d=");
}

TEST(FormEncoderTest, FlattensNestedObjectsAndArrays) {
    Parameters params = {
        {"user", json11::Json::object{{"name", "ann"}}},
        {"ids", json11::Json::array{1, 2}},
    };

    auto form = FormData::from_parameters(params);
    ASSERT_EQ(form.fields().size(), 3u);
    EXPECT_EQ(form.fields()[0].first, "ids[]");
    EXPECT_EQ(form.fields()[0].second, "1");
    EXPECT_EQ(form.fields()[1].first, "ids[]");
    EXPECT_EQ(form.fields()[1].second, "2");
    EXPECT_EQ(form.fields()[2].first, "user[name]");
    EXPECT_EQ(form.fields()[2].second, "ann");
    EXPECT_EQ(form.encode(), "ids%5B%5D=1&ids%5B%5D=2&user%5Bname%5D=ann");
}

TEST(FormEncoderTest, RoundTripsFlatStringMaps) {
    Parameters params = {
        {"username", "test user"},
        {"email", "test@example.com"},
        {"message", "Hello World! Special chars: #%&=+"},
    };
    EXPECT_EQ(decode_form(encode_form(params)), params);
}

TEST(FormEncoderTest, RejectsNonFiniteNumbers) {
    Parameters params = {{"x", std::numeric_limits<double>::quiet_NaN()}};
    EXPECT_THROW(encode_form(params), std::invalid_argument);
}

// ===========================================================================
// Encoder lookup
// ===========================================================================

TEST(EncoderForTest, BuiltInEncodings) {
    Parameters params = {{"k", "v"}};
    EXPECT_EQ(encoder_for(ParameterEncoding::JSON)(params), "{\"k\": \"v\"}");
    EXPECT_EQ(encoder_for(ParameterEncoding::URL)(params), "k=v");
}

TEST(EncoderForTest, UnknownEncodingIsAnEncodingFailure) {
    try {
        encoder_for(ParameterEncoding("application/x-unknown"));
        FAIL() << "expected BuildError";
    } catch (const BuildError& e) {
        EXPECT_EQ(e.kind(), BuildError::Kind::EncodingFailure);
    }
}

// ===========================================================================
// File
// ===========================================================================

TEST(FileTest, HoldsPayloadAndOptionalMetadata) {
    File file("file content", std::string("testfile.txt"), std::string("text/plain"),
              Parameters{{"key", "value"}});

    EXPECT_EQ(file.data(), "file content");
    EXPECT_EQ(file.filename(), "testfile.txt");
    EXPECT_EQ(file.mimetype(), "text/plain");
    ASSERT_TRUE(file.metadata().has_value());
    EXPECT_EQ(file.metadata()->at("key").string_value(), "value");

    File bare("bytes");
    EXPECT_FALSE(bare.filename().has_value());
    EXPECT_FALSE(bare.mimetype().has_value());
    EXPECT_FALSE(bare.metadata().has_value());
}

TEST(FileTest, FilesKeepFieldNamesInOrder) {
    Files files;
    files.emplace_back("avatar", File("png bytes", std::string("me.png"), std::string("image/png")));
    files.emplace_back("avatar", File("second"));
    files.push_back(FileParameter("resume", File("pdf bytes", std::string("cv.pdf"))));

    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0].first, "avatar");
    EXPECT_EQ(files[0].second.mimetype(), "image/png");
    EXPECT_EQ(files[1].second.data(), "second");
    EXPECT_EQ(files[2].first, "resume");
    EXPECT_EQ(files[2].second.filename(), "cv.pdf");
}
