// test/unit/test_placeholder.cpp
// -----------------------------------------------------------
// Placeholder vocabulary: labels, token formatting, recognition.

#include <gtest/gtest.h>
#include <string>

#include "redact/placeholder.hpp"

namespace {

using piiguard::redact::RedactionCategory;

TEST(PlaceholderTest, TokenFormat) {
    EXPECT_EQ(piiguard::redact::placeholderToken(RedactionCategory::Email, 1), "[EMAIL_1]");
    EXPECT_EQ(piiguard::redact::placeholderToken(RedactionCategory::PostalCode, 12), "[POSTAL_CODE_12]");
    EXPECT_EQ(piiguard::redact::placeholderToken(RedactionCategory::DateOfBirth, 3), "[DOB_3]");
    EXPECT_EQ(piiguard::redact::placeholderToken(RedactionCategory::Name, 1), "[NAME_1]");
}

TEST(PlaceholderTest, EveryLabelMapsBackToItsCategory) {
    for (RedactionCategory c : piiguard::redact::allCategories()) {
        RedactionCategory parsed = RedactionCategory::Email;
        ASSERT_TRUE(piiguard::redact::categoryFromLabel(piiguard::redact::placeholderLabel(c), parsed));
        EXPECT_EQ(parsed, c);
    }

    RedactionCategory unused = RedactionCategory::Email;
    EXPECT_FALSE(piiguard::redact::categoryFromLabel("postal_code", unused));
    EXPECT_FALSE(piiguard::redact::categoryFromLabel("SSN", unused));
}

TEST(PlaceholderTest, RecognisesOnlyWellFormedTokens) {
    EXPECT_TRUE(piiguard::redact::isPlaceholder("[NAME_1]"));
    EXPECT_TRUE(piiguard::redact::isPlaceholder("[POSTAL_CODE_27]"));
    EXPECT_FALSE(piiguard::redact::isPlaceholder("[NAME_0]"));
    EXPECT_FALSE(piiguard::redact::isPlaceholder("[NAME_]"));
    EXPECT_FALSE(piiguard::redact::isPlaceholder("NAME_1"));
    EXPECT_FALSE(piiguard::redact::isPlaceholder("[SSN_1]"));
    EXPECT_FALSE(piiguard::redact::isPlaceholder("[EMAIL_1] "));
}

TEST(PlaceholderTest, CountsPerCategory) {
    const std::string text = "[DATE_1] and [DOB_1], later [DATE_2]; not [DATE_]";
    EXPECT_EQ(piiguard::redact::countPlaceholders(text, RedactionCategory::Date), (size_t)2);
    EXPECT_EQ(piiguard::redact::countPlaceholders(text, RedactionCategory::DateOfBirth), (size_t)1);
    EXPECT_EQ(piiguard::redact::countPlaceholders(text, RedactionCategory::Name), (size_t)0);
}

} // namespace
