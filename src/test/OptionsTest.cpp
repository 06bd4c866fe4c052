//
// Created by nova on 3/12/21.
//

#include <vector>
#include <string>
#include <gtest/gtest.h>
#include "../Options.h"

/* getopt_long keeps its position in globals, every parse starts over */
static std::tuple<std::string, Json::Value> Parse(std::vector<std::string> args)
{
	args.insert(args.begin(), "acmereg");
	std::vector<char*> argv;
	for (auto& arg : args)
		argv.push_back(arg.data());
	argv.push_back(nullptr);
	optind = 0;
	return Options((int)args.size(), argv.data()).get();
}

TEST(OptionsTest, NoOptionsGiveNoOverrides)
{
	auto [configFilePath, overrides] = Parse({});
	EXPECT_EQ(configFilePath, "");
	EXPECT_TRUE(overrides.empty());
}

TEST(OptionsTest, LongOptions)
{
	auto [configFilePath, overrides] = Parse({"--email", "ops@example.com", "--output", "/tmp/acct.json",
	                                          "--key-only", "--config", "/etc/acmereg.json", "--log-dir", "/var/log"});
	EXPECT_EQ(configFilePath, "/etc/acmereg.json");
	EXPECT_EQ(overrides["acme"]["mailto"].asString(), "ops@example.com");
	EXPECT_EQ(overrides["output"]["path"].asString(), "/tmp/acct.json");
	EXPECT_EQ(overrides["output"]["format"].asString(), "key");
	EXPECT_EQ(overrides["log"]["dir"].asString(), "/var/log");
	EXPECT_FALSE(overrides["acme"].isMember("ca"));
}

TEST(OptionsTest, ShortOptions)
{
	auto [configFilePath, overrides] = Parse({"-e", "ops@example.com", "-s"});
	EXPECT_EQ(configFilePath, "");
	EXPECT_EQ(overrides["acme"]["mailto"].asString(), "ops@example.com");
	EXPECT_EQ(overrides["acme"]["ca"].asString(), "letsencrypt-staging");
	EXPECT_TRUE(overrides["acme"]["directory_url"].isNull());
}

TEST(OptionsTest, DirectoryUrl)
{
	auto [configFilePath, overrides] = Parse({"-e", "ops@example.com", "-d", "https://localhost:14000/dir"});
	EXPECT_EQ(overrides["acme"]["directory_url"].asString(), "https://localhost:14000/dir");
}

TEST(OptionsTest, StagingConflictsWithDirectory)
{
	EXPECT_THROW(Parse({"-s", "-d", "https://localhost:14000/dir"}), OptionsException);
}

TEST(OptionsTest, EmptyOutputIsRejected)
{
	EXPECT_THROW(Parse({"-e", "ops@example.com", "-o", ""}), OptionsException);
}

TEST(OptionsTest, StrayArgumentIsRejected)
{
	EXPECT_THROW(Parse({"-e", "ops@example.com", "extra"}), OptionsException);
}
