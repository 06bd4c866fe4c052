//
// Created by nova on 7/31/20.
//

#include <openssl/err.h>
#include <openssl/core_names.h>
#include <openssl/obj_mac.h>
#include "OpensslWrap.h"

using BioPtr = std::unique_ptr<BIO, Utils::Deleter<BIO_free>>;
using BignumPtr = std::unique_ptr<BIGNUM, Utils::Deleter<BN_free>>;
using EcdsaSigPtr = std::unique_ptr<ECDSA_SIG, Utils::Deleter<ECDSA_SIG_free>>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, Utils::Deleter<EVP_PKEY_CTX_free>>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, Utils::Deleter<EVP_MD_CTX_free>>;

std::string OpensslWrap::LastError()
{
	unsigned long code = ERR_get_error();
	if (code == 0)
		return std::string();
	char buffer[256];
	ERR_error_string_n(code, buffer, sizeof(buffer));
	ERR_clear_error();
	return std::string(buffer);
}

/* This callback function was used to suppress passphrase prompt
 * if an encrypted key is passed in, account keys are never encrypted. */
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-parameter"
static int SuppressPassPrompt(char *buf, int size, int rwflag, void *u)
{
	return 0;
}
#pragma GCC diagnostic pop

std::shared_ptr<EVP_PKEY> OpensslWrap::PEM::ToECKey(const std::string& pemKeyString)
{
	BioPtr buffer(BIO_new_mem_buf((const void*)pemKeyString.c_str(), (int)pemKeyString.length()));
	if (buffer == nullptr)
		throw Exceptions::PemStringToKeyFailedException("cannot allocate memory buffer for the key.");

	EVP_PKEY* raw = PEM_read_bio_PrivateKey(buffer.get(), nullptr, SuppressPassPrompt, nullptr);
	if (raw == nullptr)
		throw Exceptions::PemStringToKeyFailedException("not a valid PEM format private key: " + LastError());
	std::shared_ptr<EVP_PKEY> key(raw, Utils::Deleter<EVP_PKEY_free>());

	if (EVP_PKEY_get_base_id(key.get()) != EVP_PKEY_EC)    /* Check if key type is EC */
		throw Exceptions::NotECKeyException("the key is not an EC key.");
	if (AsymmetricEC::CurveName(key) != SN_X9_62_prime256v1)
		throw Exceptions::NotECKeyException("the key is not on curve P-256.");

	return key;
}

std::shared_ptr<EVP_PKEY> OpensslWrap::AsymmetricEC::Create()
{
	PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr));
	if (ctx == nullptr)
		throw Exceptions::KeyGenerationFailed("EVP_PKEY_CTX_new_id() failed: " + LastError());

	if (EVP_PKEY_keygen_init(ctx.get()) <= 0)
		throw Exceptions::KeyGenerationFailed("EVP_PKEY_keygen_init() failed: " + LastError());

	if (EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx.get(), NID_X9_62_prime256v1) <= 0)
		throw Exceptions::KeyGenerationFailed("cannot select curve P-256: " + LastError());

	EVP_PKEY* key = nullptr;
	if (EVP_PKEY_keygen(ctx.get(), &key) <= 0)
		throw Exceptions::KeyGenerationFailed("EVP_PKEY_keygen() failed: " + LastError());

	return std::shared_ptr<EVP_PKEY>(key, Utils::Deleter<EVP_PKEY_free>());
}

std::string OpensslWrap::AsymmetricEC::CurveName(const std::shared_ptr<EVP_PKEY>& key)
{
	if (key == nullptr)
		return std::string();

	char name[80];
	size_t length = 0;
	if (EVP_PKEY_get_group_name(key.get(), name, sizeof(name), &length) != 1)
		return std::string();
	return std::string(name, length);
}

std::string OpensslWrap::AsymmetricEC::PrivateKeyToSEC1(const std::shared_ptr<EVP_PKEY>& key)
{
	if (key == nullptr)
		return std::string();

	BioPtr bio(BIO_new(BIO_s_mem()));
	if (bio == nullptr)
		return std::string();

	/* Traditional format of an EC key is the SEC1 ECPrivateKey structure */
	if (PEM_write_bio_PrivateKey_traditional(bio.get(), key.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1)
		return std::string();

	BUF_MEM *buffer = nullptr;
	BIO_get_mem_ptr(bio.get(), &buffer);
	return std::string((char*)buffer->data, buffer->length);
}

std::tuple<std::shared_ptr<std::vector<std::byte>>, std::shared_ptr<std::vector<std::byte>>>
OpensslWrap::AsymmetricEC::PublicCoordinates(const std::shared_ptr<EVP_PKEY>& key)
{
	if (key == nullptr)
		return std::make_tuple(nullptr, nullptr);

	BIGNUM* x = nullptr;
	BIGNUM* y = nullptr;
	if (EVP_PKEY_get_bn_param(key.get(), OSSL_PKEY_PARAM_EC_PUB_X, &x) != 1 or
	    EVP_PKEY_get_bn_param(key.get(), OSSL_PKEY_PARAM_EC_PUB_Y, &y) != 1)
	{
		BN_free(x);
		BN_free(y);
		return std::make_tuple(nullptr, nullptr);
	}
	BignumPtr xOwner(x), yOwner(y);

	auto xBytes = std::make_shared<std::vector<std::byte>>(ES256_COORDINATE_BYTES);
	auto yBytes = std::make_shared<std::vector<std::byte>>(ES256_COORDINATE_BYTES);
	if (BN_bn2binpad(x, (unsigned char*)xBytes->data(), ES256_COORDINATE_BYTES) != ES256_COORDINATE_BYTES or
	    BN_bn2binpad(y, (unsigned char*)yBytes->data(), ES256_COORDINATE_BYTES) != ES256_COORDINATE_BYTES)
		return std::make_tuple(nullptr, nullptr);

	return std::make_tuple(xBytes, yBytes);
}

std::shared_ptr<std::vector<std::byte>>
OpensslWrap::AsymmetricEC::ES256(
		const std::shared_ptr<const std::vector<std::byte>>& msg,
		const std::shared_ptr<EVP_PKEY>& privateKey)
{
	if (privateKey == nullptr or msg == nullptr)
		throw Exceptions::SignFailed("no key or message to sign.");

	MdCtxPtr ctx(EVP_MD_CTX_new());
	if (ctx == nullptr)
		throw Exceptions::SignFailed("EVP_MD_CTX_new() failed.");

	if (EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, privateKey.get()) != 1)
		throw Exceptions::SignFailed("EVP_DigestSignInit() failed: " + LastError());

	/* First call gets the maximum DER signature length */
	size_t derLength = 0;
	const auto* tbs = (const unsigned char*)msg->data();
	if (EVP_DigestSign(ctx.get(), nullptr, &derLength, tbs, msg->size()) != 1)
		throw Exceptions::SignFailed("EVP_DigestSign() failed: " + LastError());
	std::vector<unsigned char> der(derLength);
	if (EVP_DigestSign(ctx.get(), der.data(), &derLength, tbs, msg->size()) != 1)
		throw Exceptions::SignFailed("EVP_DigestSign() failed: " + LastError());

	/* DER to fixed-size r || s */
	const unsigned char* derPtr = der.data();
	EcdsaSigPtr sig(d2i_ECDSA_SIG(nullptr, &derPtr, (long)derLength));
	if (sig == nullptr)
		throw Exceptions::SignFailed("cannot decode ECDSA signature.");

	const BIGNUM* r = nullptr;
	const BIGNUM* s = nullptr;
	ECDSA_SIG_get0(sig.get(), &r, &s);

	auto signature = std::make_shared<std::vector<std::byte>>(ES256_SIGNATURE_BYTES);
	auto* out = (unsigned char*)signature->data();
	if (BN_bn2binpad(r, out, ES256_COORDINATE_BYTES) != ES256_COORDINATE_BYTES or
	    BN_bn2binpad(s, out + ES256_COORDINATE_BYTES, ES256_COORDINATE_BYTES) != ES256_COORDINATE_BYTES)
		throw Exceptions::SignFailed("signature component exceeds 32 bytes.");

	return signature;
}

bool OpensslWrap::AsymmetricEC::VerifyES256(
		const std::shared_ptr<const std::vector<std::byte>>& msg,
		const std::shared_ptr<const std::vector<std::byte>>& signature,
		const std::shared_ptr<EVP_PKEY>& key)
{
	if (msg == nullptr or signature == nullptr or key == nullptr)
		return false;
	if (signature->size() != ES256_SIGNATURE_BYTES)
		return false;

	/* r || s back to DER */
	const auto* raw = (const unsigned char*)signature->data();
	BignumPtr r(BN_bin2bn(raw, ES256_COORDINATE_BYTES, nullptr));
	BignumPtr s(BN_bin2bn(raw + ES256_COORDINATE_BYTES, ES256_COORDINATE_BYTES, nullptr));
	EcdsaSigPtr sig(ECDSA_SIG_new());
	if (r == nullptr or s == nullptr or sig == nullptr)
		return false;
	if (ECDSA_SIG_set0(sig.get(), r.get(), s.get()) != 1)
		return false;
	r.release();    // owned by sig now
	s.release();

	unsigned char* der = nullptr;
	int derLength = i2d_ECDSA_SIG(sig.get(), &der);
	if (derLength <= 0)
		return false;
	std::vector<unsigned char> derCopy(der, der + derLength);
	OPENSSL_free(der);

	MdCtxPtr ctx(EVP_MD_CTX_new());
	if (ctx == nullptr)
		return false;
	if (EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key.get()) != 1)
	{
		ERR_clear_error();
		return false;
	}
	int ret = EVP_DigestVerify(ctx.get(), derCopy.data(), derCopy.size(), (const unsigned char*)msg->data(), msg->size());
	ERR_clear_error();
	return ret == 1;
}

std::shared_ptr<std::vector<std::byte>> OpensslWrap::Digest::SHA256(const std::shared_ptr<const std::vector<std::byte>>& msg)
{
	auto digest = std::make_shared<std::vector<std::byte>>(EVP_MAX_MD_SIZE);
	unsigned int length = 0;
	if (EVP_Digest(msg->data(), msg->size(), (unsigned char*)digest->data(), &length, EVP_sha256(), nullptr) != 1)
		throw Utils::AllocateMemoryFailed("EVP_Digest() failed: " + LastError());
	digest->resize(length);
	return digest;
}
