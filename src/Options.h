//
// Created by nova on 7/23/20.
//

#ifndef ACMEREG_OPTIONS_H
#define ACMEREG_OPTIONS_H

#include <map>
#include <tuple>
#include <string>
#include <getopt.h>
#include <exception>
#include <utility>
#include <iostream>
#include <json/json.h>
#include "utils/Codes.h"

class Options
{
public:
	Options(int argc, char** argv);
	~Options();
	/* Return tuple: configFilePath ("" if not given), overrides
	 * Structure of overrides, only the selected options are present:
	 * {
	 *     "log": { "dir": "..." },
	 *     "acme": { "ca": "letsencrypt-staging", "directory_url": "...", "mailto": "..." },
	 *     "output": { "path": "...", "format": "key" }
	 * }
	 * Exceptions: OptionsException() */
	std::tuple<std::string, Json::Value> get();

private:
	int argc;
	char** argv;
	struct option* longOptions;
	std::map<std::string, std::string> selectedOption;
};

class OptionsException : public std::exception
{
public:
	explicit OptionsException(std::string str) : message(std::move(str)) {}
	~OptionsException() noexcept override = default;

	[[nodiscard]] const char* what() const noexcept override {
		return message.c_str();
	}

private:
	std::string message;
};

#endif //ACMEREG_OPTIONS_H
