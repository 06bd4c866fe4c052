//
// Created by nova on 3/6/21.
//

#ifndef ACMEREG_ACCOUNTKEY_H
#define ACMEREG_ACCOUNTKEY_H

#include <string>
#include <memory>
#include <json/json.h>
#include "Errors.h"
#include "../utils/OpensslWrap.h"

namespace Acme
{
	/* ACME account key, an ECDSA key pair on P-256. Immutable once created. */
	class AccountKey
	{
	public:
		/* Exceptions: CryptoError() */
		static AccountKey Generate();
		/* Accepts what toPEM() writes, as well as PKCS#8.
		 * Exceptions: CryptoError() */
		static AccountKey FromPEM(const std::string& pem);

		/* Exceptions: CryptoError() */
		[[nodiscard]] std::string toPEM() const;

		/* {"crv": "P-256", "kty": "EC", "x": "...", "y": "..."}
		 * Exceptions: CryptoError() */
		[[nodiscard]] Json::Value jwk() const;
		/* RFC 7638, base64url of SHA-256 over the compact JWK with members in lexical order.
		 * Exceptions: CryptoError() */
		[[nodiscard]] std::string thumbprint() const;

		/* Returns: r || s, 64 bytes
		 * Exceptions: OpensslWrap::Exceptions::SignFailed() */
		[[nodiscard]] std::shared_ptr<std::vector<std::byte>> sign(const std::string& msg) const;
		[[nodiscard]] bool verify(const std::string& msg, const std::shared_ptr<const std::vector<std::byte>>& signature) const;

		[[nodiscard]] bool valid() const { return pkey != nullptr; }
		[[nodiscard]] const std::shared_ptr<EVP_PKEY>& evp() const { return pkey; }

		AccountKey() = default;

	private:
		explicit AccountKey(std::shared_ptr<EVP_PKEY> key) : pkey(std::move(key)) {}
		std::shared_ptr<EVP_PKEY> pkey;
	};
}

#endif //ACMEREG_ACCOUNTKEY_H
