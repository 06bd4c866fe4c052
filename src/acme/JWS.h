//
// Created by nova on 3/7/21.
//

#ifndef ACMEREG_JWS_H
#define ACMEREG_JWS_H

#include <string>
#include <json/json.h>
#include "AccountKey.h"
#include "Errors.h"

namespace Acme
{
	namespace JWS
	{
		/* Flattened JSON serialization (RFC 7515 section 7.2.2), every member base64url encoded */
		struct Envelope
		{
			std::string protectedB64Url;
			std::string payloadB64Url;      /* "" for a POST-as-GET */
			std::string signatureB64Url;

			/* protected || '.' || payload */
			[[nodiscard]] std::string signingInput() const { return protectedB64Url + "." + payloadB64Url; }
			[[nodiscard]] Json::Value toJson() const;
			/* Request body for Content-Type "application/jose+json" */
			[[nodiscard]] std::string body() const;
		};

		/* Protected header carries "jwk" when keyId is empty, "kid" otherwise.
		 * A null payload is encoded as an empty payload segment.
		 * Exceptions: SigningError() */
		Envelope Sign(const AccountKey& key, const std::string& url, const std::string& nonce,
		              const Json::Value& payload, const std::string& keyId);

		/* Decoded protected header, null if it is not a JSON object */
		Json::Value DecodeProtected(const Envelope& envelope);

		/* Check the signature of an envelope against the public part of key */
		bool Verify(const Envelope& envelope, const AccountKey& key);
	}
}

#endif //ACMEREG_JWS_H
