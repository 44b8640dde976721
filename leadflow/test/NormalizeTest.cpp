#include <leadflow/Normalize.h>
#include <leadflow/Pipeline.h>
#include <folly/portability/GTest.h>

TEST(PhoneNumberTest, Normalize) {
  EXPECT_EQ(PhoneNumber::normalize("+1 (713) 555-1234"), "7135551234");
  EXPECT_EQ(PhoneNumber::normalize("17135551234"), "7135551234");
  EXPECT_EQ(PhoneNumber::normalize("713.555.1234"), "7135551234");
  EXPECT_EQ(PhoneNumber::normalize("  713 555 1234  "), "7135551234");
  EXPECT_EQ(PhoneNumber::normalize("27135551234"), "27135551234");
  EXPECT_EQ(PhoneNumber::normalize("+44 20 7946 0958"), "442079460958");
  EXPECT_EQ(PhoneNumber::normalize("n/a"), "");
}

TEST(PhoneNumberTest, Usable) {
  EXPECT_TRUE(PhoneNumber::isUsable("7135551234"));
  EXPECT_FALSE(PhoneNumber::isUsable("555"));
  EXPECT_FALSE(PhoneNumber::isUsable(""));
  EXPECT_FALSE(PhoneNumber::isUsable("442079460958"));
}

TEST(EmailAddressTest, Normalize) {
  EXPECT_EQ(EmailAddress::normalize("  John@ACME.com "), "john@acme.com");
  EXPECT_EQ(EmailAddress::normalize("jane@x.com"), "jane@x.com");
}

TEST(EmailAddressTest, Usable) {
  EXPECT_TRUE(EmailAddress::isUsable("john@acme.com"));
  EXPECT_TRUE(EmailAddress::isUsable("a.b+tag@mail.example.org"));
  EXPECT_FALSE(EmailAddress::isUsable("john"));
  EXPECT_FALSE(EmailAddress::isUsable("@acme.com"));
  EXPECT_FALSE(EmailAddress::isUsable("john@acme"));
  EXPECT_FALSE(EmailAddress::isUsable("john@acme."));
  EXPECT_FALSE(EmailAddress::isUsable("john@@acme.com"));
  EXPECT_FALSE(EmailAddress::isUsable("jo hn@acme.com"));
}

TEST(CompanyNameTest, StripsLegalSuffixes) {
  EXPECT_EQ(CompanyName::normalize("Acme"), "acme");
  EXPECT_EQ(CompanyName::normalize("ACME, LLC"), "acme");
  EXPECT_EQ(CompanyName::normalize("Acme L.L.C."), "acme");
  EXPECT_EQ(CompanyName::normalize("Acme Inc."), "acme");
  EXPECT_EQ(CompanyName::normalize("Acme Corporation"), "acme");
  EXPECT_EQ(CompanyName::normalize("Acme Holdings Co., Inc."), "acme holdings");
  EXPECT_EQ(CompanyName::normalize("  Acme Ltd  "), "acme");
  EXPECT_EQ(CompanyName::normalize("Smith & Sons L.P."), "smith & sons");
}

TEST(CompanyNameTest, KeepsWordsEndingLikeSuffixes) {
  EXPECT_EQ(CompanyName::normalize("Taco"), "taco");
  EXPECT_EQ(CompanyName::normalize("Blue Bronco"), "blue bronco");
  EXPECT_EQ(CompanyName::normalize("Zinc"), "zinc");
  EXPECT_EQ(CompanyName::normalize("Capital Holdings"), "capital holdings");
  // Never stripped down to nothing
  EXPECT_EQ(CompanyName::normalize("Company"), "company");
  EXPECT_EQ(CompanyName::normalize("Inc"), "inc");
}

TEST(TimezoneTest, FromState) {
  EXPECT_EQ(timezoneFromState("TX"), "central");
  EXPECT_EQ(timezoneFromState("ny"), "eastern");
  EXPECT_EQ(timezoneFromState(" CA "), "pacific");
  EXPECT_EQ(timezoneFromState("AZ"), "mountain");
  EXPECT_EQ(timezoneFromState("AK"), "alaska");
  EXPECT_EQ(timezoneFromState("HI"), "hawaii");
  EXPECT_EQ(timezoneFromState(""), "central");
  EXPECT_EQ(timezoneFromState("ZZ"), "central");
}

TEST(TimezoneTest, Rank) {
  EXPECT_LT(timezoneRank("eastern"), timezoneRank("central"));
  EXPECT_LT(timezoneRank("central"), timezoneRank("mountain"));
  EXPECT_LT(timezoneRank("mountain"), timezoneRank("pacific"));
  EXPECT_EQ(timezoneRank("mars"), timezoneRank("central"));
}

TEST(ParkedMonthTest, Parse) {
  auto month = ParkedMonth::parse("2024-06");
  ASSERT_TRUE(month.hasValue());
  EXPECT_EQ(month->year, 2024);
  EXPECT_EQ(month->month, 6);
  EXPECT_EQ(month->str(), "2024-06");

  EXPECT_FALSE(ParkedMonth::parse("2024-13").hasValue());
  EXPECT_FALSE(ParkedMonth::parse("2024-00").hasValue());
  EXPECT_FALSE(ParkedMonth::parse("2024/06").hasValue());
  EXPECT_FALSE(ParkedMonth::parse("24-06").hasValue());
  EXPECT_FALSE(ParkedMonth::parse("").hasValue());
}

TEST(ParkedMonthTest, Order) {
  ParkedMonth march = ParkedMonth::of(Date(2024, 3, 13));
  EXPECT_EQ(march, (ParkedMonth{2024, 3}));
  EXPECT_TRUE((ParkedMonth{2023, 12}) < march);
  EXPECT_TRUE(march <= march);
  EXPECT_FALSE((ParkedMonth{2024, 4}) <= march);
}
