//
// Created by nova on 8/2/20.
//

#ifndef ACMEREG_ACME_H
#define ACMEREG_ACME_H

#include <map>
#include <string>
#include <memory>
#include <json/json.h>
#include "AccountKey.h"
#include "Directory.h"
#include "Registrar.h"
#include "Credentials.h"
#include "Errors.h"
#include "Transport.h"

namespace Acme
{
	/* Supported CA */
	bool CAIsSupported(const std::string& caName);
	const std::map<std::string, std::string>& SupportedCAList();    /* Returns <caName, directory url> */
	/* Returns "" if the CA is not supported */
	std::string DirectoryURL(const std::string& caName);

	/* One account provisioning run: key, directory, registration, credentials file */
	class API
	{
	public:
		/* Structure of 'globalConfigs' is the one Configuration produces.
		 * A null 'transport' makes the API talk to the CA over cpp-httplib.
		 * Exceptions: CertificateAuthorityNotSupportedException()
		 *             InputError() for an unknown 'output.format' */
		explicit API(const Json::Value& globalConfigs, std::shared_ptr<HTTP::Client> transport = nullptr);
		~API() = default;

		/* Returns the credentials that were written to the output path.
		 * Exceptions: InputError()
		 *             CryptoError()
		 *             DirectoryError()
		 *             NonceError()
		 *             SigningError()
		 *             RegistrationError()
		 *             TermsNotAcceptedError()
		 *             InvariantError()
		 *             PersistenceError() */
		AccountCredentials provision();

		[[nodiscard]] const std::string& directoryURL() const { return directoryUrl; }

	private:
		std::string contactEmail();     /* Exceptions: InputError() */
		bool termsAgreed();             /* Exceptions: InputError() */
		AccountKey generateKey();       /* Exceptions: CryptoError() */
		Directory directory();
		Account newAccount(const AccountKey& key, const Directory& dir, const std::string& email);
		void persist(const AccountCredentials& credentials);

		Json::Value globalConfigs;
		std::string directoryUrl;
		std::string outputPath;
		Credentials::Format outputFormat = Credentials::Format::Json;
		std::shared_ptr<HTTP::Client> cli;
	};

	class CertificateAuthorityNotSupportedException : public std::exception
	{
	public:
		CertificateAuthorityNotSupportedException() = default;
		explicit CertificateAuthorityNotSupportedException(std::string str) : message(std::move(str)) {}
		~CertificateAuthorityNotSupportedException() noexcept override = default;
		[[nodiscard]] const char* what() const noexcept override { return message.c_str(); }

	private:
		std::string message;
	};
}

#endif //ACMEREG_ACME_H
