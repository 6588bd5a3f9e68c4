// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../FtpBridge/Source/base/config.h"

using namespace zen;
using namespace fbr;
using ::testing::HasSubstr;


class ConfigTest : public ::testing::Test
{
protected:
    void apply(const ConfigSettings& settings) { applyConfigSettings(cfg_, settings, issues_); }

    BridgeConfig cfg_;
    std::vector<std::string> issues_;
};


TEST_F(ConfigTest, DefaultsAreValid)
{
    EXPECT_TRUE(validateConfig(cfg_).empty());
    EXPECT_EQ(cfg_.defaultProtocol, RemoteProtocol::ftps);
    EXPECT_EQ(cfg_.port, 8000);
    EXPECT_EQ(cfg_.chunkSize, 8192u);
    EXPECT_EQ(cfg_.maxFileSize, 1073741824u);
}


TEST_F(ConfigTest, EnvFileParsing)
{
    const ConfigSettings settings = parseEnvFile("# bridge settings\r\n"
                                                 "FTP_BRIDGE_PORT=8080\r\n"
                                                 "\n"
                                                 "export FTP_BRIDGE_DEFAULT_PROTOCOL = sftp\n"
                                                 "FTP_BRIDGE_LOG_FILE=\"/var/log/ftp bridge.log\"\n"
                                                 "FTP_BRIDGE_TEMP_DIR=/tmp/bridge # scratch\n"
                                                 "OTHER_SERVICE_PORT=9000\n");
    EXPECT_EQ(settings.size(), 4u);
    EXPECT_EQ(settings.at("PORT"), "8080");
    EXPECT_EQ(settings.at("DEFAULT_PROTOCOL"), "sftp");
    EXPECT_EQ(settings.at("LOG_FILE"), "/var/log/ftp bridge.log");
    EXPECT_EQ(settings.at("TEMP_DIR"), "/tmp/bridge");
}


TEST_F(ConfigTest, EnvFileSyntaxError)
{
    EXPECT_THROW(parseEnvFile("FTP_BRIDGE_PORT=8080\nnot a setting\n"), SysError);
}


TEST_F(ConfigTest, JsonConfigParsing)
{
    const ConfigSettings settings = parseJsonConfig(R"({
        "port": 9000,
        "debug": true,
        "known_hosts_path": "/etc/ssh/known_hosts",
        "allowed_extensions": [".csv", "XLSX"],
        "tokens": { "powerbi": "0123456789abcdef0123456789abcdef" },
        "log_file": null
    })");
    EXPECT_EQ(settings.at("PORT"), "9000");
    EXPECT_EQ(settings.at("DEBUG"), "true");
    EXPECT_EQ(settings.at("KNOWN_HOSTS_PATH"), "/etc/ssh/known_hosts");
    EXPECT_EQ(settings.at("ALLOWED_EXTENSIONS"), ".csv,XLSX");
    EXPECT_EQ(settings.at("TOKEN_POWERBI"), "0123456789abcdef0123456789abcdef");
    EXPECT_FALSE(settings.contains("LOG_FILE"));

    apply(settings);
    EXPECT_TRUE(issues_.empty());
    EXPECT_EQ(cfg_.port, 9000);
    EXPECT_TRUE(cfg_.debug);
    EXPECT_EQ(getEffectiveLogLevel(cfg_), MSG_TYPE_DEBUG);
    EXPECT_EQ(cfg_.allowedExtensions, (std::vector<std::string>{".csv", ".xlsx"}));
    ASSERT_EQ(cfg_.accessTokens.size(), 1u);
    EXPECT_EQ(cfg_.accessTokens[0].clientName, "powerbi");
}


TEST_F(ConfigTest, JsonConfigErrors)
{
    EXPECT_THROW(parseJsonConfig("[1, 2]"), SysError);
    EXPECT_THROW(parseJsonConfig("{\"port\": "), SysError);
    EXPECT_THROW(parseJsonConfig(R"({"tokens": {"a": 5}})"), SysError);
    EXPECT_THROW(parseJsonConfig(R"({"host": {"name": "x"}})"), SysError);
}


TEST_F(ConfigTest, LaterLayersWin)
{
    apply({{"PORT", "9000"}, {"FTP_TIMEOUT", "60"}});
    apply({{"PORT", "9100"}});

    EXPECT_TRUE(issues_.empty());
    EXPECT_EQ(cfg_.port, 9100);
    EXPECT_EQ(cfg_.ftpTimeoutSec, 60);
}


TEST_F(ConfigTest, EnvironmentSettings)
{
    const char* envp[] =
    {
        "PATH=/usr/bin",
        "FTP_BRIDGE_TOKEN_POWERBI=0123456789abcdef0123456789abcdef",
        "ftp_bridge_port=8081",
        "FTP_BRIDGE_BROKEN",
        nullptr
    };
    const ConfigSettings settings = getEnvironmentSettings(envp);
    EXPECT_EQ(settings.size(), 2u);
    EXPECT_EQ(settings.at("PORT"), "8081");

    apply(settings);
    ASSERT_EQ(cfg_.accessTokens.size(), 1u);
    EXPECT_EQ(cfg_.accessTokens[0].clientName, "powerbi");
    EXPECT_EQ(cfg_.accessTokens[0].token, "0123456789abcdef0123456789abcdef");
}


TEST_F(ConfigTest, TokenOverriddenByLaterLayer)
{
    apply({{"TOKEN_EXCEL", "0123456789abcdef0123456789abcdef"}});
    apply({{"TOKEN_EXCEL", "fedcba9876543210fedcba9876543210"}});

    ASSERT_EQ(cfg_.accessTokens.size(), 1u);
    EXPECT_EQ(cfg_.accessTokens[0].token, "fedcba9876543210fedcba9876543210");
}


TEST_F(ConfigTest, UnparsableValuesReported)
{
    apply({{"PORT", "eighty"}, {"DEBUG", "maybe"}, {"DEFAULT_PROTOCOL", "http"}, {"LOG_LEVEL", "VERBOSE"}});

    EXPECT_EQ(issues_.size(), 4u);
    EXPECT_EQ(cfg_.port, 8000); //unchanged
    EXPECT_FALSE(cfg_.debug);
    EXPECT_EQ(cfg_.defaultProtocol, RemoteProtocol::ftps);
}


TEST_F(ConfigTest, UnknownKeysIgnored)
{
    apply({{"CORS_ORIGINS", "http://localhost:3000"}, {"RATE_LIMIT_ENABLED", "true"}});
    EXPECT_TRUE(issues_.empty());
}


TEST_F(ConfigTest, ExtensionListNormalized)
{
    apply({{"ALLOWED_EXTENSIONS", " CSV, .Xlsx,,csv ,txt"}});
    EXPECT_EQ(cfg_.allowedExtensions, (std::vector<std::string>{".csv", ".xlsx", ".txt"}));
}


TEST_F(ConfigTest, RangeValidation)
{
    cfg_.port = 0;
    cfg_.ftpTimeoutSec = 1;
    cfg_.maxConnections = 0;
    cfg_.maxFileSize = 0;

    const std::vector<std::string> issues = validateConfig(cfg_);
    EXPECT_EQ(issues.size(), 4u);
    EXPECT_THAT(issues[0], HasSubstr("FTP_BRIDGE_PORT"));
}


TEST_F(ConfigTest, ChunkBoundsConsistent)
{
    cfg_.chunkSizeMin = 65536;
    cfg_.chunkSizeMax = 4096;
    EXPECT_FALSE(validateConfig(cfg_).empty());

    cfg_.chunkSizeMin = 1024;
    cfg_.chunkSizeMax = 4096;
    cfg_.chunkSize = 8192;
    const std::vector<std::string> issues = validateConfig(cfg_);
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_THAT(issues[0], HasSubstr("CHUNK_SIZE"));
}


TEST_F(ConfigTest, ShortTokenInvalid)
{
    cfg_.accessTokens.push_back({"excel", "tooshort"});

    const std::vector<std::string> issues = validateConfig(cfg_);
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_THAT(issues[0], HasSubstr("FTP_BRIDGE_TOKEN_EXCEL"));
    EXPECT_THAT(issues[0], ::testing::Not(HasSubstr("tooshort")));
}


TEST_F(ConfigTest, SecurityWarnings)
{
    cfg_.knownHostsPath = "/etc/ssh/known_hosts";
    cfg_.caBundlePath = "/etc/ssl/certs/ca-certificates.crt";
    EXPECT_TRUE(getSecurityWarnings(cfg_).empty());

    cfg_.defaultProtocol = RemoteProtocol::ftp;
    cfg_.knownHostsPath.clear();
    EXPECT_EQ(getSecurityWarnings(cfg_).size(), 2u);

    cfg_.caBundlePath.clear();
    const std::vector<std::string> warnings = getSecurityWarnings(cfg_);
    ASSERT_EQ(warnings.size(), 3u);
    EXPECT_NE(warnings[2].find("FTPS server certificates are not verified"), std::string::npos);
}


TEST_F(ConfigTest, AdminTokenSettings)
{
    apply({{"CA_BUNDLE", " /etc/ssl/certs/ca-certificates.crt "},
        {"ADMIN_TOKEN", "short"},
        {"TOKEN_POWERBI", "0123456789abcdef0123456789abcdef"}});
    EXPECT_TRUE(issues_.empty());
    EXPECT_EQ(cfg_.caBundlePath, "/etc/ssl/certs/ca-certificates.crt");
    EXPECT_EQ(cfg_.adminToken, "short");
    ASSERT_EQ(cfg_.accessTokens.size(), 1u); //admin token is no client token

    std::vector<std::string> validation = validateConfig(cfg_);
    ASSERT_EQ(validation.size(), 1u);
    EXPECT_NE(validation[0].find("ADMIN_TOKEN"), std::string::npos);

    cfg_.adminToken = cfg_.accessTokens[0].token;
    validation = validateConfig(cfg_);
    ASSERT_EQ(validation.size(), 1u);
    EXPECT_NE(validation[0].find("must differ"), std::string::npos);

    cfg_.adminToken = "fedcba9876543210fedcba9876543210";
    EXPECT_TRUE(validateConfig(cfg_).empty());
}


TEST_F(ConfigTest, DefaultPortPerProtocol)
{
    cfg_.ftpsPort = 21;
    EXPECT_EQ(getDefaultPort(cfg_, RemoteProtocol::ftp),  21);
    EXPECT_EQ(getDefaultPort(cfg_, RemoteProtocol::ftps), 21);
    EXPECT_EQ(getDefaultPort(cfg_, RemoteProtocol::sftp), 22);
}
