//
// Created by nova on 3/11/21.
//

#include <gtest/gtest.h>
#include "../Utils.h"

TEST(EmailTest, AcceptsPlainAddress)
{
	EXPECT_TRUE(Utils::EmailIsValid("ops@example.com"));
	EXPECT_TRUE(Utils::EmailIsValid("first.last+acme@mail.example.org"));
	EXPECT_EQ(Utils::ParseEmailAddress("ops@example.com"), "ops@example.com");
}

TEST(EmailTest, RejectsMalformedAddress)
{
	EXPECT_FALSE(Utils::EmailIsValid(""));
	EXPECT_FALSE(Utils::EmailIsValid("not-an-email"));
	EXPECT_FALSE(Utils::EmailIsValid("two@@example.com"));
	EXPECT_FALSE(Utils::EmailIsValid("dot.@example.com"));
	EXPECT_FALSE(Utils::EmailIsValid("ops@-example.com"));
	EXPECT_FALSE(Utils::EmailIsValid("ops example@example.com"));
	EXPECT_EQ(Utils::ParseEmailAddress("ops@"), "");
}

TEST(EmailTest, LocalPartIsLimitedTo64Octets)
{
	EXPECT_TRUE(Utils::EmailIsValid(std::string(64, 'a') + "@example.com"));
	EXPECT_FALSE(Utils::EmailIsValid(std::string(65, 'a') + "@example.com"));
}

TEST(EmailTest, NameAddrIsReducedToAddrSpec)
{
	EXPECT_EQ(Utils::ParseEmailAddress("Ops Team <ops@example.com>"), "ops@example.com");
	EXPECT_EQ(Utils::ParseEmailAddress("<ops@example.com>"), "ops@example.com");
	EXPECT_EQ(Utils::ParseEmailAddress("Ops Team <not an email>"), "");
}

TEST(CodecTest, Base64UrlHasNoPaddingAndUsesUrlAlphabet)
{
	EXPECT_EQ(Utils::Codec::Base64UrlEncode(std::string("")), "");
	EXPECT_EQ(Utils::Codec::Base64UrlEncode(std::string("f")), "Zg");
	EXPECT_EQ(Utils::Codec::Base64UrlEncode(std::string("fo")), "Zm8");
	EXPECT_EQ(Utils::Codec::Base64UrlEncode(std::string("foo")), "Zm9v");
	EXPECT_EQ(Utils::Codec::Base64UrlEncode(std::string("\xfb\xff", 2)), "-_8");
	EXPECT_EQ(Utils::Codec::Base64UrlDecode("-_8"), std::string("\xfb\xff", 2));
}

TEST(CodecTest, ByteVectorEncodingMatchesStringEncoding)
{
	std::string binary("\x00\x01\x02\xfe\xff", 5);
	auto bytes = Utils::StringProcess::StringToByteVec(binary);
	ASSERT_EQ(bytes->size(), 5u);
	EXPECT_EQ(Utils::Codec::Base64UrlEncode(bytes), Utils::Codec::Base64UrlEncode(binary));
	EXPECT_EQ(Utils::StringProcess::ByteVecToString(Utils::Codec::Base64UrlDecodeToBytes("AAEC_v8")), binary);
}

TEST(StringProcessTest, CompactJsonHasSortedMembersAndNoWhitespace)
{
	Json::Value json;
	json["y"] = "2";
	json["crv"] = "P-256";
	json["x"] = "1";
	json["kty"] = "EC";
	EXPECT_EQ(Utils::StringProcess::JsonToCompactString(json), R"({"crv":"P-256","kty":"EC","x":"1","y":"2"})");
}

TEST(StringProcessTest, StringToJsonReportsErrors)
{
	Json::Value json;
	EXPECT_EQ(Utils::StringProcess::StringToJson(R"({"a": [1, 2]})", &json), "");
	EXPECT_EQ(json["a"].size(), 2u);
	EXPECT_NE(Utils::StringProcess::StringToJson("{not json", &json), "");
}

TEST(StringProcessTest, ToLowerCase)
{
	EXPECT_EQ(Utils::StringProcess::ToLowerCase("LetsEncrypt-Staging"), "letsencrypt-staging");
}

TEST(URLTest, SplitsSchemeHostPortFromPath)
{
	auto [host, path] = Utils::URL::Split("https://acme-v02.api.letsencrypt.org/directory");
	EXPECT_EQ(host, "https://acme-v02.api.letsencrypt.org");
	EXPECT_EQ(path, "/directory");

	auto [hostWithPort, pathWithQuery] = Utils::URL::Split("http://localhost:14000/acme/new-acct?x=1");
	EXPECT_EQ(hostWithPort, "http://localhost:14000");
	EXPECT_EQ(pathWithQuery, "/acme/new-acct?x=1");

	auto [bareHost, rootPath] = Utils::URL::Split("https://ca.test");
	EXPECT_EQ(bareHost, "https://ca.test");
	EXPECT_EQ(rootPath, "/");
}

TEST(URLTest, RejectsNonHttpUrls)
{
	EXPECT_FALSE(Utils::URL::IsValid(""));
	EXPECT_FALSE(Utils::URL::IsValid("ftp://ca.test/directory"));
	EXPECT_FALSE(Utils::URL::IsValid("ca.test/directory"));
	EXPECT_FALSE(Utils::URL::IsValid("https:///directory"));
	EXPECT_TRUE(Utils::URL::IsValid("HTTPS://ca.test/directory"));
}

TEST(TimeTest, RFC3339)
{
	EXPECT_EQ(Utils::Time::UnixTimeToRFC3339(0, 0), "1970-01-01T00:00:00+00:00");
	EXPECT_EQ(Utils::Time::UnixTimeToRFC3339(0, 8), "1970-01-01T08:00:00+08:00");
	EXPECT_EQ(Utils::Time::UnixTimeToRFC3339(0, -5), "1969-12-31T19:00:00-05:00");
	EXPECT_EQ(Utils::Time::UnixTimeToRFC3339(0, 15), "");
}
