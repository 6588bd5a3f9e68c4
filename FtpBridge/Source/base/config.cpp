// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "config.h"
#include <algorithm>
#include <unistd.h> //environ
#include <zen/file_access.h>
#include <zen/file_io.h>
#include <zen/json.h>

using namespace zen;
using namespace fbr;


namespace
{
const uint64_t CHUNK_SIZE_LIMIT_LOW  = 1024;
const uint64_t CHUNK_SIZE_LIMIT_HIGH = 1024 * 1024;      //default chunk size
const uint64_t CHUNK_SIZE_MAX_LIMIT  = 16 * 1024 * 1024; //upper bound for tuning
const size_t MAX_CONNECTIONS_LIMIT = 1024;


std::string quote(const std::string& str) { return '"' + str + '"'; }


template <class Num>
void readNumber(const std::string& key, const std::string& value, Num& num, std::vector<std::string>& issues)
{
    if (const std::optional<Num> n = tryStringTo<Num>(value))
        num = *n;
    else
        issues.push_back(ENV_VAR_PREFIX + key + ": Invalid number " + quote(value) + '.');
}


void readBool(const std::string& key, const std::string& value, bool& b, std::vector<std::string>& issues)
{
    const std::string valFmt = asciiToLowerCpy(trimCpy(value));

    if (valFmt == "true" || valFmt == "1" || valFmt == "yes" || valFmt == "on")
        b = true;
    else if (valFmt == "false" || valFmt == "0" || valFmt == "no" || valFmt == "off" || valFmt.empty())
        b = false;
    else
        issues.push_back(ENV_VAR_PREFIX + key + ": Invalid boolean value " + quote(value) + '.');
}


std::optional<MessageType> parseLogLevel(std::string_view name)
{
    const std::string nameFmt = asciiToUpperCpy(trimCpy(name));
    if (nameFmt == "DEBUG")
        return MSG_TYPE_DEBUG;
    if (nameFmt == "INFO")
        return MSG_TYPE_INFO;
    if (nameFmt == "WARNING")
        return MSG_TYPE_WARNING;
    if (nameFmt == "ERROR" || nameFmt == "CRITICAL")
        return MSG_TYPE_ERROR;
    return {};
}


std::vector<std::string> parseExtensionList(std::string_view list)
{
    std::vector<std::string> extensions;
    split(list, ',', [&](const std::string_view block)
    {
        std::string ext = asciiToLowerCpy(trimCpy(block));
        if (ext.empty())
            return;
        if (!startsWith(ext, "."))
            ext = '.' + ext;

        if (std::find(extensions.begin(), extensions.end(), ext) == extensions.end())
            extensions.push_back(ext);
    });
    return extensions;
}


//strip matching quotes, or an inline comment if unquoted
std::string parseEnvValue(std::string_view value)
{
    std::string valTrm = trimCpy(value);

    if (valTrm.size() >= 2 && (valTrm.front() == '"' || valTrm.front() == '\'') && valTrm.back() == valTrm.front())
        return valTrm.substr(1, valTrm.size() - 2);

    if (const size_t pos = valTrm.find(" #"); pos != std::string::npos)
        valTrm = trimCpy(std::string_view(valTrm).substr(0, pos));
    return valTrm;
}
}


MessageType fbr::getEffectiveLogLevel(const BridgeConfig& cfg)
{
    return cfg.debug ? MSG_TYPE_DEBUG : cfg.logLevel;
}


int fbr::getDefaultPort(const BridgeConfig& cfg, RemoteProtocol protocol)
{
    switch (protocol)
    {
        case RemoteProtocol::ftp:
            return cfg.ftpPort;
        case RemoteProtocol::ftps:
            return cfg.ftpsPort;
        case RemoteProtocol::sftp:
            return cfg.sftpPort;
    }
    assert(false);
    return cfg.ftpPort;
}


ConfigSettings fbr::parseJsonConfig(const std::string& jsonText) //throw SysError
{
    JsonValue jroot;
    try
    {
        jroot = parseJson(jsonText); //throw JsonParsingError
    }
    catch (const JsonParsingError& e)
    {
        throw SysError("JSON parsing error at row " + numberTo(e.row + 1) + ", column " + numberTo(e.col + 1) + '.');
    }

    if (jroot.type != JsonValue::Type::object)
        throw SysError("JSON root is not an object.");

    ConfigSettings settings;
    for (const auto& [name, jval] : jroot.objectVal)
    {
        const std::string key = asciiToUpperCpy(name);

        switch (jval.type)
        {
            case JsonValue::Type::null:
                break;

            case JsonValue::Type::boolean:
            case JsonValue::Type::number:
            case JsonValue::Type::string:
                settings[key] = jval.primVal;
                break;

            case JsonValue::Type::array: //"allowed_extensions": [".csv", ".xlsx"]
            {
                std::string list;
                for (const JsonValue& item : jval.arrayVal)
                {
                    if (item.type == JsonValue::Type::array || item.type == JsonValue::Type::object)
                        throw SysError("Unexpected nested value for key " + quote(name) + '.');
                    list += (list.empty() ? "" : ",") + item.primVal;
                }
                settings[key] = list;
            }
            break;

            case JsonValue::Type::object:
                if (key != "TOKENS")
                    throw SysError("Unexpected object value for key " + quote(name) + '.');

                for (const auto& [clientName, jtoken] : jval.objectVal)
                {
                    if (jtoken.type != JsonValue::Type::string)
                        throw SysError("Token for client " + quote(clientName) + " is not a string.");
                    settings[TOKEN_KEY_PREFIX + asciiToUpperCpy(clientName)] = jtoken.primVal;
                }
                break;
        }
    }
    return settings;
}


ConfigSettings fbr::parseEnvFile(const std::string& fileContent) //throw SysError
{
    ConfigSettings settings;
    size_t lineNo = 0;

    split(fileContent, '\n', [&](const std::string_view line)
    {
        ++lineNo;
        std::string lineTrm = trimCpy(line); //including \r
        if (lineTrm.empty() || startsWith(lineTrm, "#"))
            return;

        if (startsWith(lineTrm, "export "))
            lineTrm = trimCpy(std::string_view(lineTrm).substr(strLength("export ")));

        const size_t pos = lineTrm.find('=');
        if (pos == std::string::npos || pos == 0)
            throw SysError("Invalid line " + numberTo(lineNo) + ": expected KEY=VALUE.");

        const std::string key = asciiToUpperCpy(trimCpy(std::string_view(lineTrm).substr(0, pos)));
        if (startsWith(key, ENV_VAR_PREFIX))
            settings[key.substr(strLength(ENV_VAR_PREFIX))] = parseEnvValue(std::string_view(lineTrm).substr(pos + 1));
    });
    return settings;
}


ConfigSettings fbr::getEnvironmentSettings(const char* const* envp)
{
    ConfigSettings settings;
    if (envp)
        for (; *envp; ++envp)
        {
            const std::string_view entry = *envp;
            const size_t pos = entry.find('=');
            if (pos == std::string_view::npos)
                continue;

            const std::string key = asciiToUpperCpy(entry.substr(0, pos));
            if (startsWith(key, ENV_VAR_PREFIX))
                settings[key.substr(strLength(ENV_VAR_PREFIX))] = std::string(entry.substr(pos + 1));
        }
    return settings;
}


void fbr::applyConfigSettings(BridgeConfig& cfg, const ConfigSettings& settings, std::vector<std::string>& issues)
{
    for (const auto& [key, value] : settings)
        if (key == "HOST")
            cfg.host = trimCpy(value);
        else if (key == "PORT")
            readNumber(key, value, cfg.port, issues);
        else if (key == "DEBUG")
            readBool(key, value, cfg.debug, issues);
        else if (key == "DEGRADED_MODE")
            readBool(key, value, cfg.degradedMode, issues);
        else if (key == "DEFAULT_PROTOCOL")
        {
            if (const std::optional<RemoteProtocol> protocol = parseRemoteProtocol(value))
                cfg.defaultProtocol = *protocol;
            else
                issues.push_back(ENV_VAR_PREFIX + key + ": Unknown protocol " + quote(value) + ". Expected: ftp, ftps, sftp");
        }
        else if (key == "FTP_TIMEOUT")
            readNumber(key, value, cfg.ftpTimeoutSec, issues);
        else if (key == "FTP_PORT")
            readNumber(key, value, cfg.ftpPort, issues);
        else if (key == "FTPS_PORT")
            readNumber(key, value, cfg.ftpsPort, issues);
        else if (key == "SFTP_PORT")
            readNumber(key, value, cfg.sftpPort, issues);
        else if (key == "KNOWN_HOSTS_PATH")
            cfg.knownHostsPath = trimCpy(value);
        else if (key == "CA_BUNDLE")
            cfg.caBundlePath = trimCpy(value);
        else if (key == "ADMIN_TOKEN")
            cfg.adminToken = value;
        else if (key == "TEMP_DIR")
            cfg.tempDir = trimCpy(value);
        else if (key == "MAX_FILE_SIZE")
            readNumber(key, value, cfg.maxFileSize, issues);
        else if (key == "CHUNK_SIZE")
            readNumber(key, value, cfg.chunkSize, issues);
        else if (key == "CHUNK_SIZE_MIN")
            readNumber(key, value, cfg.chunkSizeMin, issues);
        else if (key == "CHUNK_SIZE_MAX")
            readNumber(key, value, cfg.chunkSizeMax, issues);
        else if (key == "CHUNK_TUNE_THRESHOLD")
            readNumber(key, value, cfg.chunkTuneThreshold, issues);
        else if (key == "ALLOWED_EXTENSIONS")
            cfg.allowedExtensions = parseExtensionList(value);
        else if (key == "LOG_LEVEL")
        {
            if (const std::optional<MessageType> level = parseLogLevel(value))
                cfg.logLevel = *level;
            else
                issues.push_back(ENV_VAR_PREFIX + key + ": Unknown log level " + quote(value) + ". Expected: DEBUG, INFO, WARNING, ERROR");
        }
        else if (key == "LOG_FILE")
            cfg.logFile = trimCpy(value);
        else if (key == "MAX_CONNECTIONS")
            readNumber(key, value, cfg.maxConnections, issues);
        else if (startsWith(key, TOKEN_KEY_PREFIX))
        {
            const std::string clientName = asciiToLowerCpy(key.substr(strLength(TOKEN_KEY_PREFIX)));
            if (clientName.empty())
            {
                issues.push_back(ENV_VAR_PREFIX + key + ": Missing client name.");
                continue;
            }

            auto it = std::find_if(cfg.accessTokens.begin(), cfg.accessTokens.end(), [&](const AccessToken& at) { return at.clientName == clientName; });
            if (it != cfg.accessTokens.end())
                it->token = value;
            else
                cfg.accessTokens.push_back({clientName, value});
        }
    //else: unknown keys are ignored: deployments may carry settings for features not offered here (e.g. CORS, rate limiting)
}


std::vector<std::string> fbr::validateConfig(const BridgeConfig& cfg)
{
    std::vector<std::string> issues;

    auto checkRange = [&](const char* key, uint64_t value, uint64_t low, uint64_t high)
    {
        if (value < low || value > high)
            issues.push_back(ENV_VAR_PREFIX + std::string(key) + ": Value " + numberTo(value) + " is out of range [" + numberTo(low) + ", " + numberTo(high) + "].");
    };
    auto checkPort = [&](const char* key, int port)
    {
        if (port < 1 || port > 65535)
            issues.push_back(ENV_VAR_PREFIX + std::string(key) + ": Invalid port number " + numberTo(port) + '.');
    };

    if (cfg.host.empty())
        issues.push_back(ENV_VAR_PREFIX + std::string("HOST: Missing bind address."));

    checkPort("PORT",      cfg.port);
    checkPort("FTP_PORT",  cfg.ftpPort);
    checkPort("FTPS_PORT", cfg.ftpsPort);
    checkPort("SFTP_PORT", cfg.sftpPort);

    if (cfg.ftpTimeoutSec < 5 || cfg.ftpTimeoutSec > 300)
        issues.push_back(ENV_VAR_PREFIX + std::string("FTP_TIMEOUT: Value ") + numberTo(cfg.ftpTimeoutSec) + " is out of range [5, 300].");

    if (cfg.maxFileSize == 0)
        issues.push_back(ENV_VAR_PREFIX + std::string("MAX_FILE_SIZE: Value must be greater than 0."));

    checkRange("CHUNK_SIZE",     cfg.chunkSize,    CHUNK_SIZE_LIMIT_LOW, CHUNK_SIZE_LIMIT_HIGH);
    checkRange("CHUNK_SIZE_MIN", cfg.chunkSizeMin, CHUNK_SIZE_LIMIT_LOW, CHUNK_SIZE_MAX_LIMIT);
    checkRange("CHUNK_SIZE_MAX", cfg.chunkSizeMax, CHUNK_SIZE_LIMIT_LOW, CHUNK_SIZE_MAX_LIMIT);

    if (cfg.chunkSizeMin > cfg.chunkSizeMax)
        issues.push_back(ENV_VAR_PREFIX + std::string("CHUNK_SIZE_MIN: Value ") + numberTo(cfg.chunkSizeMin) +
                         " is greater than CHUNK_SIZE_MAX " + numberTo(cfg.chunkSizeMax) + '.');
    else if (cfg.chunkSize < cfg.chunkSizeMin || cfg.chunkSize > cfg.chunkSizeMax)
        issues.push_back(ENV_VAR_PREFIX + std::string("CHUNK_SIZE: Value ") + numberTo(cfg.chunkSize) +
                         " is outside [CHUNK_SIZE_MIN, CHUNK_SIZE_MAX].");

    if (cfg.chunkTuneThreshold == 0)
        issues.push_back(ENV_VAR_PREFIX + std::string("CHUNK_TUNE_THRESHOLD: Value must be greater than 0."));

    if (cfg.allowedExtensions.empty())
        issues.push_back(ENV_VAR_PREFIX + std::string("ALLOWED_EXTENSIONS: No file extension allowed."));

    checkRange("MAX_CONNECTIONS", cfg.maxConnections, 1, MAX_CONNECTIONS_LIMIT);

    if (cfg.tempDir.empty())
        issues.push_back(ENV_VAR_PREFIX + std::string("TEMP_DIR: Missing folder path."));

    for (const AccessToken& at : cfg.accessTokens)
        if (at.token.size() < ACCESS_TOKEN_LENGTH_MIN) //don't log the token!
            issues.push_back(ENV_VAR_PREFIX + std::string(TOKEN_KEY_PREFIX) + asciiToUpperCpy(at.clientName) +
                             ": Token is too short (minimum " + numberTo(ACCESS_TOKEN_LENGTH_MIN) + " characters).");

    if (!cfg.adminToken.empty())
    {
        if (cfg.adminToken.size() < ACCESS_TOKEN_LENGTH_MIN)
            issues.push_back(ENV_VAR_PREFIX + std::string("ADMIN_TOKEN: Token is too short (minimum ") + numberTo(ACCESS_TOKEN_LENGTH_MIN) + " characters).");

        if (std::any_of(cfg.accessTokens.begin(), cfg.accessTokens.end(), [&](const AccessToken& at) { return at.token == cfg.adminToken; }))
            issues.push_back(ENV_VAR_PREFIX + std::string("ADMIN_TOKEN: Token must differ from all client tokens."));
    }
    return issues;
}


std::vector<std::string> fbr::getSecurityWarnings(const BridgeConfig& cfg)
{
    std::vector<std::string> warnings;

    if (cfg.defaultProtocol == RemoteProtocol::ftp)
        warnings.push_back("Default protocol is plain FTP: credentials and data are sent unencrypted. Use FTPS or SFTP instead.");

    if (cfg.knownHostsPath.empty())
        warnings.push_back("No known_hosts file configured: SFTP host keys are not verified.");

    if (cfg.caBundlePath.empty())
        warnings.push_back("No CA bundle configured: FTPS server certificates are not verified.");

    if (!cfg.debug && cfg.logLevel == MSG_TYPE_DEBUG)
        warnings.push_back("Log level DEBUG should not be used in production.");

    return warnings;
}


BridgeConfig fbr::loadBridgeConfig(const ConfigSources& sources, std::vector<std::string>& issues) //throw FileError
{
    BridgeConfig cfg;

    if (!sources.configFilePath.empty())
    {
        const std::string jsonText = getFileContent(sources.configFilePath); //throw FileError
        try
        {
            applyConfigSettings(cfg, parseJsonConfig(jsonText), issues); //throw SysError
        }
        catch (const SysError& e) { throw FileError("Cannot read configuration file " + fmtFilePath(sources.configFilePath) + '.', e.toString()); }
    }

    if (!sources.envFilePath.empty())
        if (sources.envFileRequired || itemExists(sources.envFilePath)) //throw FileError
        {
            const std::string envText = getFileContent(sources.envFilePath); //throw FileError
            try
            {
                applyConfigSettings(cfg, parseEnvFile(envText), issues); //throw SysError
            }
            catch (const SysError& e) { throw FileError("Cannot read environment file " + fmtFilePath(sources.envFilePath) + '.', e.toString()); }
        }

    applyConfigSettings(cfg, getEnvironmentSettings(::environ), issues);

    const std::vector<std::string> validationIssues = validateConfig(cfg);
    issues.insert(issues.end(), validationIssues.begin(), validationIssues.end());
    return cfg;
}
