//
// Created by nova on 8/29/20.
//

#include <gtest/gtest.h>
#include <easylogging++.h>

INITIALIZE_EASYLOGGINGPP

int main(int argc, char* argv[])
{
	testing::InitGoogleTest(&argc, argv);

	/* Step logs of Acme::API would interleave with the test report */
	el::Configurations loggerConf;
	loggerConf.setToDefault();
	loggerConf.set(el::Level::Global, el::ConfigurationType::ToStandardOutput, "false");
	loggerConf.set(el::Level::Global, el::ConfigurationType::ToFile, "false");
	el::Loggers::reconfigureAllLoggers(loggerConf);

	return RUN_ALL_TESTS();
}
