// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <algorithm>
#include <csignal>
#include <iostream>
#include <thread>
#include <pthread.h>
#include <libcurl/curl_wrap.h> //DON'T include <curl/curl.h> directly!
#include <zen/extra_log.h>
#include <zen/file_access.h>
#include "afs/ftp.h"
#include "afs/sftp.h"
#include "base/config.h"
#include "server/routes.h"
#include "version/version.h"
#include "return_codes.h"

using namespace zen;
using namespace fbr;


namespace
{
const char optionConfig[]      = "--config";
const char optionEnvFile[]     = "--env-file";
const char optionCheckConfig[] = "--check-config";

const char defaultEnvFilePath[] = "./.env";


struct CommandLine
{
    ConfigSources sources;
    bool checkConfigOnly = false;
    bool showHelp = false;
};


CommandLine parseCommandLine(const std::vector<std::string>& commandArgs) //throw SysError
{
    auto isHelpRequest = [](const std::string& arg)
    {
        auto it = std::find_if(arg.begin(), arg.end(), [](char c) { return c != '/' && c != '-'; });
        if (it == arg.begin()) return false; //require at least one prefix character

        const std::string argTmp(it, arg.end());
        return equalAsciiNoCase(argTmp, "help") ||
               equalAsciiNoCase(argTmp, "h")    ||
               argTmp == "?";
    };

    auto isCommandLineOption = [&](const std::string& arg)
    {
        return equalAsciiNoCase(arg, optionConfig     ) ||
               equalAsciiNoCase(arg, optionEnvFile    ) ||
               equalAsciiNoCase(arg, optionCheckConfig) ||
               isHelpRequest(arg);
    };

    CommandLine cmdLine;
    bool envFileSpecified = false;

    for (auto it = commandArgs.begin(); it != commandArgs.end(); ++it)
        if (isHelpRequest(*it))
            cmdLine.showHelp = true;
        else if (equalAsciiNoCase(*it, optionCheckConfig))
            cmdLine.checkConfigOnly = true;
        else if (equalAsciiNoCase(*it, optionConfig))
        {
            if (++it == commandArgs.end() || isCommandLineOption(*it))
                throw SysError("A file path is expected after " + std::string(optionConfig) + '.');
            cmdLine.sources.configFilePath = *it;
        }
        else if (equalAsciiNoCase(*it, optionEnvFile))
        {
            if (++it == commandArgs.end() || isCommandLineOption(*it))
                throw SysError("A file path is expected after " + std::string(optionEnvFile) + '.');
            cmdLine.sources.envFilePath = *it;
            cmdLine.sources.envFileRequired = true;
            envFileSpecified = true;
        }
        else
            throw SysError("Unknown command line option " + fmtPath(*it) + '.');

    if (!envFileSpecified)
        try
        {
            if (itemExists(defaultEnvFilePath)) //throw FileError
                cmdLine.sources.envFilePath = defaultEnvFilePath;
        }
        catch (const FileError& e) { throw SysError(e.toString()); }

    return cmdLine;
}


void showSyntaxHelp()
{
    std::cout << bridgeServiceName << ' ' << bridgeVersion << "\n\n"
              "Syntax:\n"
              "  ftp_bridge [" << optionConfig << " <file>] [" << optionEnvFile << " <file>] [" << optionCheckConfig << "] [--help]\n\n" <<
              "  " << optionConfig      << "        JSON configuration file\n" <<
              "  " << optionEnvFile     << "      KEY=VALUE file (default: " << defaultEnvFilePath << " if present)\n" <<
              "  " << optionCheckConfig << "  validate the configuration and exit\n\n"
              "Settings are read in order: defaults, JSON file, .env file, process environment (" << ENV_VAR_PREFIX << "*).\n"
              "Clients authenticate with tokens set via " << ENV_VAR_PREFIX << TOKEN_KEY_PREFIX << "<NAME>.\n";
}


//true: no issues
bool reportConfigIssues(const std::vector<std::string>& issues, const std::vector<std::string>& warnings)
{
    for (const std::string& issue : issues)
        std::cerr << "Configuration error: " << issue << '\n';
    for (const std::string& warning : warnings)
        std::cerr << "Security warning: " << warning << '\n';

    if (issues.empty())
        std::cout << "Configuration is valid.\n";
    return issues.empty();
}


//SIGINT/SIGTERM must be blocked before any other thread is created: then only sigwait() sees them
class ShutdownSignalWatcher
{
public:
    ShutdownSignalWatcher(ServerLog& log, std::atomic<bool>& stopRequested) : stopRequested_(stopRequested) //throw SysError
    {
        sigemptyset(&signals_);
        sigaddset(&signals_, SIGINT);
        sigaddset(&signals_, SIGTERM);

        if (const int rv = ::pthread_sigmask(SIG_BLOCK, &signals_, nullptr);
            rv != 0)
            throw SysError(formatSystemError("pthread_sigmask", rv));

        watcher_ = std::thread([this, &log]
        {
            int signalNo = 0;
            if (const int rv = ::sigwait(&signals_, &signalNo);
                rv != 0)
                log.logError(formatSystemError("sigwait", rv));
            else if (!shuttingDown_)
                log.logInfo(std::string("Received ") + (signalNo == SIGINT ? "SIGINT" : "SIGTERM") + ", shutting down...");

            stopRequested_ = true;
        });
    }

    ~ShutdownSignalWatcher()
    {
        if (!stopRequested_) //server stopped by error: wake up sigwait(); SIGTERM is blocked => no process termination
        {
            shuttingDown_ = true;
            ::pthread_kill(watcher_.native_handle(), SIGTERM);
        }
        watcher_.join();
    }

private:
    ShutdownSignalWatcher           (const ShutdownSignalWatcher&) = delete;
    ShutdownSignalWatcher& operator=(const ShutdownSignalWatcher&) = delete;

    std::atomic<bool>& stopRequested_;
    std::atomic<bool> shuttingDown_{false};
    sigset_t signals_{};
    std::thread watcher_;
};


BridgeExitCode runBridge(const BridgeConfig& cfg, const std::vector<std::string>& configIssues)
{
    std::unique_ptr<ServerLog> log;
    try
    {
        log = std::make_unique<ServerLog>(cfg.logFile, getEffectiveLogLevel(cfg)); //throw FileError
    }
    catch (const FileError& e)
    {
        std::cerr << e.toString() << '\n';
        return BridgeExitCode::startupFailure;
    }

    //last chance for errors from global destructors, e.g. sessions closed during shutdown
    initExtraLog([](const ErrorLog& extraLog)
    {
        for (const LogEntry& entry : extraLog)
            std::cerr << formatMessage(entry);
    });

    log->logInfo(std::string(bridgeServiceName) + ' ' + bridgeVersion + " starting (libcurl " + getCurlFeatures().version +
                 ", libssh2 " + getLibssh2Version() + ')');

    for (const std::string& issue : configIssues)
        log->logError("Configuration error: " + issue);
    for (const std::string& warning : getSecurityWarnings(cfg))
        log->logWarning("Security warning: " + warning);

    const std::shared_ptr<const BackendFactory> factory = createDefaultBackendFactory({cfg.knownHostsPath, cfg.caBundlePath});

    std::string protocolList;
    for (const RemoteProtocol protocol : factory->getAvailableProtocols())
        protocolList += (protocolList.empty() ? "" : ", ") + getProtocolName(protocol);
    log->logInfo("Protocols available: " + (protocolList.empty() ? std::string("none") : protocolList));

    DegradedModeController degradedMode(cfg, factory, [&](const std::string& knownHostsPath) //throw SysError
    {
        const size_t entryCount = getKnownHostsEntryCount(knownHostsPath); //throw SysError
        log->logDebug("known_hosts " + fmtPath(knownHostsPath) + ": " + numberTo(entryCount) + " entries");
    });

    if (const DegradedModeState state = degradedMode.initialize();
        state.isDegraded)
        log->logWarning("Service starts in DEGRADED MODE: " + state.reason);
    else
        log->logInfo("Access tokens loaded: " + numberTo(cfg.accessTokens.size()));

    RequestRouter router(BridgeContext{cfg, *factory, degradedMode, *log});

    std::atomic<bool> stopRequested{false};
    try
    {
        ShutdownSignalWatcher signalWatcher(*log, stopRequested); //throw SysError

        HttpServer server({cfg.host, cfg.port, cfg.maxConnections, cfg.ftpTimeoutSec},
                          [&](const HttpRequest& request, HttpResponseSink& response, const std::string& peerName) //throw SysError
        {
            router.handleRequest(request, response, peerName); //throw SysError
        },
        *log); //throw SysError

        log->logInfo("Listening on " + cfg.host + ':' + numberTo(server.getPort())); //throw SysError

        server.run(stopRequested); //throw SysError
    }
    catch (const SysError& e)
    {
        log->logError("Server failure.\n" + e.toString());
        log->flushExtraLog();
        return BridgeExitCode::startupFailure;
    }

    log->flushExtraLog();
    const ErrorLogStats stats = log->getStats();
    log->logInfo("Service stopped. Errors: " + numberTo(stats.error) + ", warnings: " + numberTo(stats.warning));
    return BridgeExitCode::success;
}
}


int main(int argc, char* argv[])
{
    std::vector<std::string> commandArgs;
    for (int i = 1; i < argc; ++i)
        commandArgs.emplace_back(argv[i]);

    CommandLine cmdLine;
    try
    {
        cmdLine = parseCommandLine(commandArgs); //throw SysError
    }
    catch (const SysError& e)
    {
        std::cerr << e.toString() << "\n\n";
        showSyntaxHelp();
        return static_cast<int>(BridgeExitCode::configError);
    }

    if (cmdLine.showHelp)
    {
        showSyntaxHelp();
        return static_cast<int>(BridgeExitCode::success);
    }

    BridgeConfig cfg;
    std::vector<std::string> configIssues;
    try
    {
        cfg = loadBridgeConfig(cmdLine.sources, configIssues); //throw FileError
    }
    catch (const FileError& e)
    {
        std::cerr << e.toString() << '\n';
        return static_cast<int>(BridgeExitCode::configError);
    }

    if (cmdLine.checkConfigOnly)
        return static_cast<int>(reportConfigIssues(configIssues, getSecurityWarnings(cfg)) ?
                                BridgeExitCode::success : BridgeExitCode::configError);

    //invalid settings don't prevent startup: the service runs in degraded mode and reports the cause via /health
    return static_cast<int>(runBridge(cfg, configIssues));
}
