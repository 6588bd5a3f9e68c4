// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef CONFIG_H_78274329847320948543
#define CONFIG_H_78274329847320948543

#include <map>
#include <vector>
#include <zen/error_log.h>
#include <zen/file_error.h>
#include "chunk_tuner.h"
#include "../afs/abstract.h"


namespace fbr
{
const char ENV_VAR_PREFIX[] = "FTP_BRIDGE_";
const char TOKEN_KEY_PREFIX[] = "TOKEN_"; //FTP_BRIDGE_TOKEN_POWERBI=... => client "powerbi"
const size_t ACCESS_TOKEN_LENGTH_MIN = 32;

struct AccessToken
{
    std::string clientName;
    std::string token;
};

struct BridgeConfig
{
    std::string host = "0.0.0.0";
    int port = 8000;
    bool debug = false;        //=> log level DEBUG
    bool degradedMode = false; //operator override: refuse all transfers

    RemoteProtocol defaultProtocol = RemoteProtocol::ftps;
    int ftpTimeoutSec = 30;
    int ftpPort  = 21;
    int ftpsPort = 990;
    int sftpPort = 22;
    std::string knownHostsPath; //empty: no SFTP host key verification
    std::string caBundlePath;   //empty: no FTPS server certificate verification

    std::string tempDir = "./temp"; //health report only: transfers are streamed, never staged

    uint64_t maxFileSize = 1024 * 1024 * 1024; //1 GiB
    size_t chunkSize    = 8192;
    size_t chunkSizeMin = 1024;
    size_t chunkSizeMax = 1024 * 1024;
    uint64_t chunkTuneThreshold = CHUNK_TUNE_THRESHOLD_DEFAULT;

    std::vector<std::string> allowedExtensions{".txt", ".csv", ".xlsx", ".xls", ".pdf", ".zip", ".json", ".xml", ".tsv", ".dat", ".log"};

    zen::MessageType logLevel = zen::MSG_TYPE_INFO;
    std::string logFile = "ftp_bridge.log"; //empty: stderr only

    size_t maxConnections = 16; //concurrent requests = worker threads

    std::vector<AccessToken> accessTokens;
    std::string adminToken; //maintenance trigger only, never valid for downloads; empty: trigger disabled
};

//"debug" wins over "log_level"
zen::MessageType getEffectiveLogLevel(const BridgeConfig& cfg);

int getDefaultPort(const BridgeConfig& cfg, RemoteProtocol protocol);

//------------------------------------------------------------------------------------------

//one configuration layer: upper-case key without prefix => raw value, e.g. "CHUNK_SIZE" => "8192"
using ConfigSettings = std::map<std::string, std::string>;

/*  {"port": 8080, "default_protocol": "sftp", "allowed_extensions": [".csv", ".xlsx"],
     "tokens": {"powerbi": "0123456789abcdef0123456789abcdef"}}                           */
ConfigSettings parseJsonConfig(const std::string& jsonText); //throw SysError

//KEY=VALUE lines, "#" comments, optional "export " and quotes; keys without FTP_BRIDGE_ prefix are ignored
ConfigSettings parseEnvFile(const std::string& fileContent); //throw SysError

//"FTP_BRIDGE_*" entries of a "KEY=VALUE" array like "environ"
ConfigSettings getEnvironmentSettings(const char* const* envp);

//later layers win; unparsable values are reported and leave the previous value untouched
void applyConfigSettings(BridgeConfig& cfg, const ConfigSettings& settings, std::vector<std::string>& issues);

//range checks and cross-field constraints: empty => valid
std::vector<std::string> validateConfig(const BridgeConfig& cfg);

//valid, but questionable: logged at startup
std::vector<std::string> getSecurityWarnings(const BridgeConfig& cfg);

//------------------------------------------------------------------------------------------

struct ConfigSources
{
    std::string configFilePath; //optional: JSON
    std::string envFilePath;    //optional: ".env"
    bool envFileRequired = false; //explicitly passed via command line => must exist
};

//defaults < JSON config < .env < process environment
BridgeConfig loadBridgeConfig(const ConfigSources& sources, std::vector<std::string>& issues); //throw FileError
}

#endif //CONFIG_H_78274329847320948543
