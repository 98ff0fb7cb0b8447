// test/unit/test_request.cpp
// -----------------------------------------------------------

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

#include "service/request.hpp"

namespace {

TEST(RequestParseTest, InboundRequest) {
    const std::string json = R"({
        "mode": "inbound",
        "displayName": "Max Mustermann",
        "fields": {
            "resumeText": "Line1\nLine2 \"quoted\"\t\\",
            "jobText": "Jürgen sucht"
        }
    })";

    piiguard::service::Request req = piiguard::service::parseRequest(json);
    EXPECT_EQ(req.mode, "inbound");
    EXPECT_EQ(req.displayName, "Max Mustermann");
    ASSERT_EQ(req.fields.size(), (size_t)2);
    EXPECT_EQ(req.fields[0].first, "resumeText");
    EXPECT_EQ(req.fields[0].second, "Line1\nLine2 \"quoted\"\t\\");
    EXPECT_EQ(req.fields[1].first, "jobText");
    EXPECT_EQ(req.fields[1].second, "J\xC3\xBCrgen sucht");
    EXPECT_TRUE(req.text.empty());
}

TEST(RequestParseTest, OutboundRequestWithNullName) {
    piiguard::service::Request req = piiguard::service::parseRequest(
        R"({"mode":"outbound","displayName":null,"text":"  keep  spacing \n"})");
    EXPECT_EQ(req.mode, "outbound");
    EXPECT_TRUE(req.displayName.empty());
    EXPECT_EQ(req.text, "  keep  spacing \n");
}

TEST(RequestParseTest, SurrogatePairDecodesToUtf8) {
    piiguard::service::Request req = piiguard::service::parseRequest(
        R"({"mode":"audit","text":"smile \ud83d\ude00"})");
    EXPECT_EQ(req.text, "smile \xF0\x9F\x98\x80");
}

TEST(RequestParseTest, UnknownScalarKeysAreSkipped) {
    piiguard::service::Request req = piiguard::service::parseRequest(
        R"({"requestId":42,"retry":false,"mode":"audit","note":"x","text":"t"})");
    EXPECT_EQ(req.mode, "audit");
    EXPECT_EQ(req.text, "t");
}

TEST(RequestParseTest, MalformedDocumentsThrow) {
    const char* bad[] = {
        "",
        "mode=inbound",
        R"({"text":"no mode"})",
        R"({"mode":""})",
        R"({"mode":"audit"} trailing)",
        R"({"mode":"audit","text":"unterminated)",
        R"({"mode":"audit","text":"bad \q escape"})",
        R"({"mode":"audit","text":"\ud83d alone"})",
        R"({"mode":"inbound","fields":{"resumeText":{"nested":"x"}}})",
        R"({"mode":"inbound","fields":{"a":"1","a":"2"}})",
        R"({"mode":"audit","extra":[1,2]})",
        R"({"mode":"audit","displayName":7})",
    };
    for (const char* json : bad) {
        EXPECT_THROW(piiguard::service::parseRequest(json), std::runtime_error) << json;
    }
}

} // namespace
