// test/integration/test_redaction_service.cpp
// -----------------------------------------------------------
// Request -> RedactionService -> Response, per mode.

#include <string>
#include <gtest/gtest.h>

#include "config/guard_config.hpp"
#include "service/privacy_gateway.hpp"
#include "service/redaction_service.hpp"
#include "service/request.hpp"
#include "service/response.hpp"

namespace {

using piiguard::service::Request;
using piiguard::service::Response;

class RedactionServiceTest : public ::testing::Test {
protected:
    RedactionServiceTest()
        : gateway_(config_), service_(gateway_)
    {
    }

    piiguard::config::GuardConfig config_;
    piiguard::service::PrivacyGateway gateway_;
    piiguard::service::RedactionService service_;
};

TEST_F(RedactionServiceTest, InboundTagsRedactionsWithTheirField) {
    Request req;
    req.mode = "inbound";
    req.displayName = "Max Mustermann";
    req.fields = {
        {"resumeText", "Max Mustermann\nSoftware Engineer\nmax@example.com\nweitere Angaben folgen sp\xC3\xA4ter"},
        {"jobText", "Wir suchen eine Software Engineerin in Berlin. Bewerbung an jobs@firma.de"},
    };

    Response resp = service_.HandleRequest(req);
    ASSERT_EQ(resp.statusCode, 200);
    ASSERT_EQ(resp.fields.size(), (size_t)2);
    EXPECT_EQ(resp.fields[0].first, "resumeText");
    EXPECT_EQ(resp.fields[0].second.substr(0, 36), "[NAME_1]\nSoftware Engineer\n[EMAIL_1]");
    EXPECT_EQ(resp.fields[1].first, "jobText");

    ASSERT_EQ(resp.redactions.size(), (size_t)3);
    EXPECT_EQ(resp.redactions[0].field, "resumeText");
    EXPECT_EQ(resp.redactions[1].field, "resumeText");
    EXPECT_EQ(resp.redactions[2].field, "jobText");
    EXPECT_FALSE(resp.hasLeakage);
}

TEST_F(RedactionServiceTest, InboundValidationErrorIs400) {
    Request req;
    req.mode = "inbound";
    req.fields = {{"resumeText", "too short"}};

    Response resp = service_.HandleRequest(req);
    EXPECT_EQ(resp.statusCode, 400);
    EXPECT_NE(resp.message.find("resumeText"), std::string::npos);
    EXPECT_TRUE(resp.fields.empty());
}

TEST_F(RedactionServiceTest, UnknownModeIs400) {
    Request req;
    req.mode = "translate";
    Response resp = service_.HandleRequest(req);
    EXPECT_EQ(resp.statusCode, 400);
    EXPECT_EQ(resp.message, "Unknown mode: translate");
}

TEST_F(RedactionServiceTest, OutboundReturnsTextAndLeakage) {
    Request req;
    req.mode = "outbound";
    req.text = "Reach me at jane@example.org";

    Response resp = service_.HandleRequest(req);
    ASSERT_EQ(resp.statusCode, 200);
    ASSERT_EQ(resp.fields.size(), (size_t)1);
    EXPECT_EQ(resp.fields[0].first, "text");
    EXPECT_EQ(resp.fields[0].second, "Reach me at [EMAIL_1]");
    EXPECT_TRUE(resp.hasLeakage);
    EXPECT_NE(resp.toJson().find(R"("leakage":{"hasEmail":false,"hasUrl":false})"), std::string::npos);
}

TEST_F(RedactionServiceTest, OutboundLongAddressWithoutSpaces) {
    Request req;
    req.mode = "outbound";
    req.text = "Contact: " + std::string(200000, 'b') + "@example.com";

    Response resp = service_.HandleRequest(req);
    ASSERT_EQ(resp.statusCode, 200);
    ASSERT_EQ(resp.fields.size(), (size_t)1);
    EXPECT_EQ(resp.fields[0].second, "Contact: [EMAIL_1]");
    EXPECT_FALSE(resp.leakage.hasEmail);
}

TEST_F(RedactionServiceTest, OutboundWithInvalidNameIs400) {
    Request req;
    req.mode = "outbound";
    req.displayName = "M";
    req.text = "anything";
    EXPECT_EQ(service_.HandleRequest(req).statusCode, 400);
}

TEST_F(RedactionServiceTest, AuditLeavesTextAlone) {
    Request req;
    req.mode = "audit";
    req.text = "mail me at a@b.de";

    Response resp = service_.HandleRequest(req);
    EXPECT_EQ(resp.statusCode, 200);
    EXPECT_TRUE(resp.fields.empty());
    EXPECT_TRUE(resp.redactions.empty());
    EXPECT_TRUE(resp.hasLeakage);
    EXPECT_TRUE(resp.leakage.hasEmail);
    EXPECT_FALSE(resp.leakage.hasUrl);
}

TEST_F(RedactionServiceTest, JsonInJsonOut) {
    Request req = piiguard::service::parseRequest(
        R"({"mode":"outbound","displayName":null,"text":"Reach me at jane@example.org\nhttps://jane.dev"})");
    const std::string json = service_.HandleRequest(req).toJson();

    EXPECT_EQ(json,
              R"({"status":200,"message":"OK","fields":{"text":"Reach me at [EMAIL_1]\n[URL_1]"},)"
              R"("redactions":[)"
              R"({"field":"text","category":"EMAIL","match":"jane@example.org","offset":12,"replacement":"[EMAIL_1]"},)"
              R"({"field":"text","category":"URL","match":"https://jane.dev","offset":22,"replacement":"[URL_1]"}],)"
              R"("leakage":{"hasEmail":false,"hasUrl":false}})");
}

} // namespace
