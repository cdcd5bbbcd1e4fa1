// test_eligibility.cpp - board, special-treatment, segment and price-band rules
#include <gtest/gtest.h>

#include "screen.hpp"
#include <limits>

namespace {
InstrumentIdentity ident(const std::string& code, const std::string& name = "正常股份") {
    InstrumentIdentity id;
    id.code = code;
    id.name = name;
    return id;
}
} // namespace

TEST(Eligibility, GrowthBoardNeverEligible) {
    for (const Profile& p : {support_retest_profile(), deep_contraction_profile()}) {
        EXPECT_FALSE(is_eligible(ident("300750"), 10.0, p)) << p.name;
        EXPECT_EQ(eligibility_reason(ident("300750"), 10.0, p), Reason::IneligibleCode);
    }
}

TEST(Eligibility, InnovationBoard) {
    EXPECT_EQ(eligibility_reason(ident("688001"), 10.0, support_retest_profile()), Reason::IneligibleCode);
    // not on the deny-list, but outside the 60/00 allow-list
    EXPECT_EQ(eligibility_reason(ident("688001"), 10.0, deep_contraction_profile()), Reason::OutsideSegment);
}

TEST(Eligibility, SpecialTreatmentNames) {
    for (const Profile& p : {support_retest_profile(), deep_contraction_profile()}) {
        EXPECT_EQ(eligibility_reason(ident("600001", "ST中孚"), 10.0, p), Reason::SpecialTreatment);
        EXPECT_EQ(eligibility_reason(ident("600001", "*ST康美"), 10.0, p), Reason::SpecialTreatment);
        EXPECT_EQ(eligibility_reason(ident("000001", "PT水仙"), 10.0, p), Reason::SpecialTreatment);
        EXPECT_EQ(eligibility_reason(ident("000001", "某*股"), 10.0, p), Reason::SpecialTreatment);
    }
}

TEST(Eligibility, PlaceholderNameIsNotFlagged) {
    EXPECT_TRUE(is_eligible(ident("600000", kUnknownName), 10.0, support_retest_profile()));
}

TEST(Eligibility, SegmentAllowListOnlyForDeepContraction) {
    EXPECT_TRUE(is_eligible(ident("830799"), 10.0, support_retest_profile()));
    EXPECT_EQ(eligibility_reason(ident("830799"), 10.0, deep_contraction_profile()), Reason::OutsideSegment);
    EXPECT_TRUE(is_eligible(ident("600000"), 10.0, deep_contraction_profile()));
    EXPECT_TRUE(is_eligible(ident("000002"), 10.0, deep_contraction_profile()));
}

TEST(Eligibility, PriceBandIsInclusive) {
    const Profile a = support_retest_profile();
    EXPECT_TRUE(is_eligible(ident("600000"), 5.0, a));
    EXPECT_TRUE(is_eligible(ident("600000"), 20.0, a));
    EXPECT_EQ(eligibility_reason(ident("600000"), 4.99, a), Reason::PriceOutOfBand);
    EXPECT_EQ(eligibility_reason(ident("600000"), 20.01, a), Reason::PriceOutOfBand);

    const Profile b = deep_contraction_profile();
    EXPECT_TRUE(is_eligible(ident("600000"), 15.0, b));
    EXPECT_FALSE(is_eligible(ident("600000"), 15.5, b));
}

TEST(Eligibility, NonFinitePriceFailsClosed) {
    EXPECT_FALSE(is_eligible(ident("600000"), std::numeric_limits<double>::quiet_NaN(), support_retest_profile()));
}

TEST(Eligibility, RulesApplyInOrder) {
    // a 30-prefixed ST name out of band reports the first rule that failed
    EXPECT_EQ(eligibility_reason(ident("300001", "*ST"), 100.0, support_retest_profile()), Reason::IneligibleCode);
    EXPECT_EQ(eligibility_reason(ident("600001", "*ST"), 100.0, support_retest_profile()), Reason::SpecialTreatment);
}

TEST(CheckIdentity, IgnoresPrice) {
    EXPECT_EQ(check_identity(ident("600000"), deep_contraction_profile()), Reason::None);
    EXPECT_EQ(check_identity(ident("900901"), deep_contraction_profile()), Reason::OutsideSegment);
}
