//
// Created by nova on 3/7/21.
//

#include "JWS.h"

Json::Value Acme::JWS::Envelope::toJson() const
{
	Json::Value body;
	body["protected"] = protectedB64Url;
	body["payload"]   = payloadB64Url;
	body["signature"] = signatureB64Url;
	return body;
}

std::string Acme::JWS::Envelope::body() const
{
	return Utils::StringProcess::JsonToCompactString(toJson());
}

Acme::JWS::Envelope Acme::JWS::Sign(const AccountKey& key, const std::string& url, const std::string& nonce,
                                    const Json::Value& payload, const std::string& keyId)
{
	if (!key.valid())
		throw SigningError("cannot sign request", "no account key");
	if (nonce.empty())
		throw SigningError("cannot sign request", "empty replay-nonce");
	if (url.empty())
		throw SigningError("cannot sign request", "empty request url");

	/* Protected header */
	Json::Value header;
	header["alg"] = "ES256";
	header["nonce"] = nonce;
	header["url"] = url;
	if (keyId.empty())
	{
		try
		{
			header["jwk"] = key.jwk();
		}
		catch (CryptoError& e)
		{
			throw SigningError("cannot embed the account key in the protected header", e.what());
		}
	}
	else
		header["kid"] = keyId;

	Envelope envelope;
	envelope.protectedB64Url = Utils::Codec::Base64UrlEncode(Utils::StringProcess::JsonToCompactString(header));
	if (!payload.isNull())
		envelope.payloadB64Url = Utils::Codec::Base64UrlEncode(Utils::StringProcess::JsonToCompactString(payload));

	/* Perform ES256 */
	try
	{
		auto signature = key.sign(envelope.signingInput());
		envelope.signatureB64Url = Utils::Codec::Base64UrlEncode(signature);
	}
	catch (OpensslWrap::Exceptions::SignFailed& e)
	{
		throw SigningError("cannot sign request", e.what());
	}
	return envelope;
}

Json::Value Acme::JWS::DecodeProtected(const Envelope& envelope)
{
	Json::Value header;
	std::string errors = Utils::StringProcess::StringToJson(Utils::Codec::Base64UrlDecode(envelope.protectedB64Url), &header);
	if (!errors.empty() or !header.isObject())
		return Json::Value();
	return header;
}

bool Acme::JWS::Verify(const Envelope& envelope, const AccountKey& key)
{
	if (!key.valid())
		return false;
	return key.verify(envelope.signingInput(), Utils::Codec::Base64UrlDecodeToBytes(envelope.signatureB64Url));
}
