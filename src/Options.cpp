//
// Created by nova on 7/23/20.
//

#include <cstdlib>
#include "Options.h"

std::tuple<std::string, Json::Value> Options::get()
{
	int index = 0;
	int opt = 0;
	while(EOF != (opt = getopt_long(argc, argv, "e:o:skd:c:l:vh", longOptions, &index)))
	{
		switch (opt)
		{
			case 'e': selectedOption["email"] = std::string(optarg); break;
			case 'o': selectedOption["output"] = std::string(optarg); break;
			case 's': selectedOption["staging"] = "true"; break;
			case 'k': selectedOption["key-only"] = "true"; break;
			case 'd': selectedOption["directory"] = std::string(optarg); break;
			case 'c': selectedOption["config"] = std::string(optarg); break;
			case 'l': selectedOption["log-dir"] = std::string(optarg); break;
			case 'v':
			{
				std::cout << VERSION << std::endl;
				exit(EXIT_SUCCESS);
			}
			case 'h':
			{
				std::cout << R"(AcmeReg )" << VERSION << std::endl;
				std::cout << R"()" << std::endl;
				std::cout << R"(Register an ACME account and save its credentials.)" << std::endl;
				std::cout << R"()" << std::endl;
				std::cout << R"(Usage: acmereg -e EMAIL)" << std::endl;
				std::cout << R"(       acmereg -e EMAIL -o PATH --staging)" << std::endl;
				std::cout << R"(       acmereg -e EMAIL -o PATH --key-only)" << std::endl;
				std::cout << R"(       acmereg -c PATH)" << std::endl;
				std::cout << R"()" << std::endl;
				std::cout << R"(Options:)" << std::endl;
				std::cout << R"(Either long or short options are allowed.)" << std::endl;
				std::cout << R"(  --version   -v         Print acmereg's version.)" << std::endl;
				std::cout << R"(  --help      -h         Print this message.)" << std::endl;
				std::cout << R"(  --email     -e [ADDR]  Contact email of the account.)" << std::endl;
				std::cout << R"(  --output    -o [PATH]  Where to save the credentials,)" << std::endl;
				std::cout << R"(                         default "account_credentials.json".)" << std::endl;
				std::cout << R"(  --staging   -s         Register with Let's Encrypt's staging environment.)" << std::endl;
				std::cout << R"(  --key-only  -k         Save the PEM private key only, not the json document.)" << std::endl;
				std::cout << R"(  --directory -d [URL]   Directory url of another ACME CA.)" << std::endl;
				std::cout << R"(  --config    -c [PATH]  Configuration json file's path.)" << std::endl;
				std::cout << R"(  --log-dir   -l [DIR]   Also write logs to DIR/acmereg.log.)" << std::endl;
				exit(EXIT_SUCCESS);
			}
			default: exit(OPTIONS_INVALID);
		}
	}

	if (optind < argc)
		throw OptionsException("Unexpected argument '" + std::string(argv[optind]) + "'.");

	auto notFound = selectedOption.end();
	if (selectedOption.find("output") != notFound and selectedOption["output"].empty())
		throw OptionsException("Argument of option '--output' or '-o' cannot be empty.");
	else if (selectedOption.find("staging") != notFound and selectedOption.find("directory") != notFound)
		throw OptionsException("Option '--staging' or '-s' conflicts with '--directory' or '-d'.");

	Json::Value overrides(Json::objectValue);
	if (selectedOption.find("email") != notFound)
		overrides["acme"]["mailto"] = selectedOption["email"];
	if (selectedOption.find("staging") != notFound)
	{
		overrides["acme"]["ca"] = "letsencrypt-staging";
		overrides["acme"]["directory_url"] = Json::Value(Json::nullValue);   /* Drops the file's directory_url */
	}
	if (selectedOption.find("directory") != notFound)
		overrides["acme"]["directory_url"] = selectedOption["directory"];
	if (selectedOption.find("output") != notFound)
		overrides["output"]["path"] = selectedOption["output"];
	if (selectedOption.find("key-only") != notFound)
		overrides["output"]["format"] = "key";
	if (selectedOption.find("log-dir") != notFound)
		overrides["log"]["dir"] = selectedOption["log-dir"];

	std::string configFilePath = selectedOption.find("config") != notFound ? selectedOption["config"] : std::string();
	return make_tuple(configFilePath, overrides);
}

Options::Options(int argc, char** argv)
{
	this->argc = argc;
	this->argv = argv;

	longOptions = (struct option*)malloc(10 * sizeof(option));
	longOptions[0] = {"email", required_argument, nullptr, 'e'};
	longOptions[1] = {"output", required_argument, nullptr, 'o'};
	longOptions[2] = {"staging", no_argument, nullptr, 's'};
	longOptions[3] = {"key-only", no_argument, nullptr, 'k'};
	longOptions[4] = {"directory", required_argument, nullptr, 'd'};
	longOptions[5] = {"config", required_argument, nullptr, 'c'};
	longOptions[6] = {"log-dir", required_argument, nullptr, 'l'};
	longOptions[7] = {"version", no_argument, nullptr, 'v'};
	longOptions[8] = {"help", no_argument, nullptr, 'h'};
	longOptions[9] = {nullptr, 0, nullptr, 0};
}

Options::~Options()
{
	free(longOptions);
}
