//
// Created by nova on 3/11/21.
//

#include <gtest/gtest.h>
#include "../JWS.h"

static Json::Value Decode(const std::string& b64Url)
{
	Json::Value json;
	Utils::StringProcess::StringToJson(Utils::Codec::Base64UrlDecode(b64Url), &json);
	return json;
}

TEST(JWSTest, ProtectedHeaderCarriesJwkWithoutKeyId)
{
	auto key = Acme::AccountKey::Generate();
	Json::Value payload;
	payload["termsOfServiceAgreed"] = true;
	auto envelope = Acme::JWS::Sign(key, "https://ca.test/acme/new-acct", "nonce-1", payload, "");

	Json::Value header = Acme::JWS::DecodeProtected(envelope);
	EXPECT_EQ(header["alg"].asString(), "ES256");
	EXPECT_EQ(header["nonce"].asString(), "nonce-1");
	EXPECT_EQ(header["url"].asString(), "https://ca.test/acme/new-acct");
	EXPECT_EQ(header["jwk"], key.jwk());
	EXPECT_FALSE(header.isMember("kid"));
	EXPECT_TRUE(Decode(envelope.payloadB64Url)["termsOfServiceAgreed"].asBool());
}

TEST(JWSTest, ProtectedHeaderCarriesKeyIdInsteadOfJwk)
{
	auto key = Acme::AccountKey::Generate();
	auto envelope = Acme::JWS::Sign(key, "https://ca.test/acme/new-order", "nonce-2", Json::Value(Json::objectValue),
	                                "https://ca.test/acme/acct/123");

	Json::Value header = Acme::JWS::DecodeProtected(envelope);
	EXPECT_EQ(header["kid"].asString(), "https://ca.test/acme/acct/123");
	EXPECT_FALSE(header.isMember("jwk"));
	EXPECT_EQ(Utils::Codec::Base64UrlDecode(envelope.payloadB64Url), "{}");
}

TEST(JWSTest, NullPayloadIsEmpty)
{
	auto key = Acme::AccountKey::Generate();
	auto envelope = Acme::JWS::Sign(key, "https://ca.test/acme/acct/123", "nonce-3", Json::Value(), "https://ca.test/acme/acct/123");
	EXPECT_EQ(envelope.payloadB64Url, "");
	EXPECT_EQ(envelope.signingInput(), envelope.protectedB64Url + ".");
	EXPECT_TRUE(Acme::JWS::Verify(envelope, key));
}

TEST(JWSTest, SignatureVerifiesOverSigningInput)
{
	auto key = Acme::AccountKey::Generate();
	Json::Value payload;
	payload["contact"].append("mailto:ops@example.com");
	auto envelope = Acme::JWS::Sign(key, "https://ca.test/acme/new-acct", "nonce-4", payload, "");

	EXPECT_EQ(Utils::Codec::Base64UrlDecodeToBytes(envelope.signatureB64Url)->size(), 64u);
	EXPECT_TRUE(Acme::JWS::Verify(envelope, key));

	auto tampered = envelope;
	tampered.payloadB64Url = Utils::Codec::Base64UrlEncode(std::string(R"({"contact":["mailto:evil@example.com"]})"));
	EXPECT_FALSE(Acme::JWS::Verify(tampered, key));

	EXPECT_FALSE(Acme::JWS::Verify(envelope, Acme::AccountKey::Generate()));
}

TEST(JWSTest, BodyIsFlattenedJson)
{
	auto key = Acme::AccountKey::Generate();
	auto envelope = Acme::JWS::Sign(key, "https://ca.test/acme/new-acct", "nonce-5", Json::Value(Json::objectValue), "");

	Json::Value body;
	ASSERT_EQ(Utils::StringProcess::StringToJson(envelope.body(), &body), "");
	EXPECT_EQ(body.getMemberNames().size(), 3u);
	EXPECT_EQ(body["protected"].asString(), envelope.protectedB64Url);
	EXPECT_EQ(body["payload"].asString(), envelope.payloadB64Url);
	EXPECT_EQ(body["signature"].asString(), envelope.signatureB64Url);
}

TEST(JWSTest, MalformedInputsAreSigningErrors)
{
	auto key = Acme::AccountKey::Generate();
	EXPECT_THROW(Acme::JWS::Sign(key, "https://ca.test/acme/new-acct", "", Json::Value(), ""), Acme::SigningError);
	EXPECT_THROW(Acme::JWS::Sign(key, "", "nonce-6", Json::Value(), ""), Acme::SigningError);
	EXPECT_THROW(Acme::JWS::Sign(Acme::AccountKey(), "https://ca.test/acme/new-acct", "nonce-6", Json::Value(), ""),
	             Acme::SigningError);
}
