#include <cstdlib>
#include <memory>
#include <tuple>
#include <iostream>
#include <json/json.h>
#include <easylogging++.h>
#include "Options.h"
#include "Configuration.h"
#include "acme/Acme.h"
#include "utils/Log.h"
#include "utils/Codes.h"

INITIALIZE_EASYLOGGINGPP

int main(int argc, char* argv[])
{
	/* Get command line options */
	std::tuple<std::string, Json::Value> result;
	try
	{
		result = Options(argc, argv).get();
	}
	catch (OptionsException& e)
	{
		std::cerr << "[Options Error] " << e.what() << std::endl;
		exit(OPTIONS_INVALID);
	}
	auto[configFilePath, overrides] = result;

	/* Get configurations */
	Json::Value globalConfigs;
	try
	{
		Configuration loader = Configuration(configFilePath, overrides);
		globalConfigs = loader.getJson();
	}
	catch (ConfigurationException& e)
	{
		std::cerr << "[Config Error] " << e.what() << std::endl;
		exit(CONFIG_FILE_INVALID);
	}

	/* Easylogging */
	SetupEasylogger(globalConfigs);

	/* Register */
	try
	{
		Acme::API acmeAPI(globalConfigs);
		acmeAPI.provision();
	}
	catch (Acme::CertificateAuthorityNotSupportedException& e)
	{
		LOG(ERROR) << e.what();
		exit(CONFIG_FILE_INVALID);
	}
	catch (Acme::InputError& e)
	{
		LOG(ERROR) << e.what();
		exit(INPUT_INVALID);
	}
	catch (Acme::TermsNotAcceptedError& e)
	{
		LOG(ERROR) << e.what();
		exit(INPUT_INVALID);
	}
	catch (Acme::CryptoError& e)
	{
		LOG(ERROR) << e.what();
		exit(CRYPTO_FAILED);
	}
	catch (Acme::PersistenceError& e)
	{
		LOG(ERROR) << e.what();
		exit(PERSISTENCE_FAILED);
	}
	catch (Acme::RegistrationError& e)
	{
		LOG(ERROR) << e.what();
		if (!e.problemType().empty())
			LOG(ERROR) << "CA problem type: " << e.problemType();
		exit(REGISTRATION_FAILED);
	}
	catch (Acme::Error& e)      /* Directory, nonce, signing and invariant failures */
	{
		LOG(ERROR) << e.what();
		exit(REGISTRATION_FAILED);
	}

	return 0;
}
