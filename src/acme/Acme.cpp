//
// Created by nova on 8/2/20.
//

#include <easylogging++.h>
#include "Acme.h"
#include "HttplibImpl.h"
#include "../utils/Utils.h"

const std::map<std::string, std::string>& Acme::SupportedCAList()
{
	static std::map<std::string, std::string> caAndDirectory
	{
		{"letsencrypt", "https://acme-v02.api.letsencrypt.org/directory"},
		{"letsencrypt-staging", "https://acme-staging-v02.api.letsencrypt.org/directory"},
	};
	return caAndDirectory;
}

bool Acme::CAIsSupported(const std::string& caName)
{
	std::string lowerCase = Utils::StringProcess::ToLowerCase(caName);
	for (const auto& nameAndUrl : SupportedCAList())
	{
		if (nameAndUrl.first == lowerCase)
			return true;
	}
	return false;
}

std::string Acme::DirectoryURL(const std::string& caName)
{
	auto found = SupportedCAList().find(Utils::StringProcess::ToLowerCase(caName));
	return found == SupportedCAList().end() ? std::string() : found->second;
}

Acme::API::API(const Json::Value& globalConfigs, std::shared_ptr<HTTP::Client> transport) :
		globalConfigs(globalConfigs), cli(std::move(transport))
{
	const Json::Value& acme = globalConfigs["acme"];
	directoryUrl = acme["directory_url"].isString() ? acme["directory_url"].asString() : std::string();
	if (directoryUrl.empty())
	{
		std::string caName = acme["ca"].isString() ? acme["ca"].asString() : std::string();
		if (!CAIsSupported(caName))
			throw CertificateAuthorityNotSupportedException("not supported certificate authority '" + caName + "'");
		directoryUrl = DirectoryURL(caName);
	}

	outputPath = globalConfigs["output"]["path"].isString() ? globalConfigs["output"]["path"].asString() : std::string();
	const Json::Value& format = globalConfigs["output"]["format"];
	if (!format.isNull() and (!format.isString() or !Credentials::ParseFormat(format.asString(), &outputFormat)))
		throw InputError("unknown credentials format", format.isString() ? format.asString() : "not a string");

	if (cli == nullptr)
		cli = std::make_shared<HTTP::HttplibImpl>(acme);
}

Acme::AccountCredentials Acme::API::provision()
{
	/* Nothing is generated or requested for an unusable email, output path or refused terms */
	std::string email = contactEmail();
	if (outputPath.empty())
		throw InputError("output path is empty");
	if (!termsAgreed())
		throw TermsNotAcceptedError("the CA's terms of service must be agreed to before registering",
		                            "'acme.terms_of_service_agreed' is false");

	AccountKey key = generateKey();
	Directory dir = directory();
	Account account = newAccount(key, dir, email);

	AccountCredentials credentials;
	credentials.uri = account.uri;
	credentials.key = key.toPEM();
	persist(credentials);
	return credentials;
}

std::string Acme::API::contactEmail()
{
	const Json::Value& mailto = globalConfigs["acme"]["mailto"];
	std::string email = mailto.isString() ? mailto.asString() : std::string();
	if (email.empty())
		throw InputError("contact email is empty");
	std::string address = Utils::ParseEmailAddress(email);
	if (address.empty())
		throw InputError("contact email is invalid", email);
	return address;
}

bool Acme::API::termsAgreed()
{
	/* Absent means agreed, the run is refused only on an explicit false */
	const Json::Value& agreed = globalConfigs["acme"]["terms_of_service_agreed"];
	if (agreed.isNull())
		return true;
	else if (!agreed.isBool())
		throw InputError("'acme.terms_of_service_agreed' must be a boolean");
	return agreed.asBool();
}

Acme::AccountKey Acme::API::generateKey()
{
	LOG(INFO) << "ACME - Generating P-256 account key...";
	AccountKey key = AccountKey::Generate();
	LOG(INFO) << "ACME - Account key thumbprint: " << key.thumbprint();
	return key;
}

Acme::Directory Acme::API::directory()
{
	LOG(INFO) << "ACME - Fetching directory from " << directoryUrl << "...";
	DirectoryClient directoryClient(cli);
	Directory dir = directoryClient.fetchDirectory(directoryUrl);
	if (!dir.termsOfService.empty())
		LOG(INFO) << "ACME - Terms of service: " << dir.termsOfService;
	if (dir.externalAccountRequired)
		LOG(WARNING) << "ACME - CA requires external account binding, registration may be rejected";
	return dir;
}

Acme::Account Acme::API::newAccount(const AccountKey& key, const Directory& dir, const std::string& email)
{
	bool acceptTermsOfService = termsAgreed();

	LOG(INFO) << "ACME - Registering account for " << email << "...";
	Registrar registrar(cli);
	Registration registration = registrar.submit(key, dir, email, acceptTermsOfService);
	if (registration.created)
		LOG(INFO) << "ACME - Account created: " << registration.account.uri;
	else
		LOG(INFO) << "ACME - Account already exists: " << registration.account.uri;
	if (!registration.account.status.empty())
		LOG(INFO) << "ACME - Account status: " << registration.account.status;
	return registration.account;
}

void Acme::API::persist(const AccountCredentials& credentials)
{
	LOG(INFO) << "ACME - Writing " << (outputFormat == Credentials::Format::KeyOnly ? "account key" : "account credentials")
	          << " to " << outputPath << "...";
	Credentials::WriteFile(credentials, outputPath, outputFormat);
	LOG(INFO) << "ACME - Done.";
}
