//
// Created by nova on 3/6/21.
//

#include "AccountKey.h"

Acme::AccountKey Acme::AccountKey::Generate()
{
	try
	{
		return AccountKey(OpensslWrap::AsymmetricEC::Create());
	}
	catch (OpensslWrap::Exceptions::KeyGenerationFailed& e)
	{
		throw CryptoError("cannot generate the account key", e.what());
	}
}

Acme::AccountKey Acme::AccountKey::FromPEM(const std::string& pem)
{
	try
	{
		return AccountKey(OpensslWrap::PEM::ToECKey(pem));
	}
	catch (OpensslWrap::Exceptions::PemStringToKeyFailedException& e)
	{
		throw CryptoError("cannot decode the account key", e.what());
	}
	catch (OpensslWrap::Exceptions::NotECKeyException& e)
	{
		throw CryptoError("cannot decode the account key", e.what());
	}
}

std::string Acme::AccountKey::toPEM() const
{
	if (pkey == nullptr)
		throw CryptoError("cannot encode the account key", "no key");

	std::string pem = OpensslWrap::AsymmetricEC::PrivateKeyToSEC1(pkey);
	if (pem.empty())
		throw CryptoError("cannot encode the account key", OpensslWrap::LastError());
	return pem;
}

Json::Value Acme::AccountKey::jwk() const
{
	auto [x, y] = OpensslWrap::AsymmetricEC::PublicCoordinates(pkey);
	if (x == nullptr or y == nullptr)
		throw CryptoError("cannot read the public point of the account key", OpensslWrap::LastError());

	Json::Value jwk;
	jwk["crv"] = "P-256";
	jwk["kty"] = "EC";
	jwk["x"] = Utils::Codec::Base64UrlEncode(x);
	jwk["y"] = Utils::Codec::Base64UrlEncode(y);
	return jwk;
}

std::string Acme::AccountKey::thumbprint() const
{
	/* jsoncpp writes object members sorted by name, which is the required member order */
	std::string canonical = Utils::StringProcess::JsonToCompactString(jwk());
	try
	{
		auto digest = OpensslWrap::Digest::SHA256(Utils::StringProcess::StringToByteVec(canonical));
		return Utils::Codec::Base64UrlEncode(digest);
	}
	catch (Utils::AllocateMemoryFailed& e)
	{
		throw CryptoError("cannot compute the key thumbprint", e.what());
	}
}

std::shared_ptr<std::vector<std::byte>> Acme::AccountKey::sign(const std::string& msg) const
{
	return OpensslWrap::AsymmetricEC::ES256(Utils::StringProcess::StringToByteVec(msg), pkey);
}

bool Acme::AccountKey::verify(const std::string& msg, const std::shared_ptr<const std::vector<std::byte>>& signature) const
{
	return OpensslWrap::AsymmetricEC::VerifyES256(Utils::StringProcess::StringToByteVec(msg), signature, pkey);
}
