// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "degraded_mode.h"

using namespace zen;
using namespace fbr;


DegradedModeState fbr::evaluateDegradedMode(const BridgeConfig& cfg, const BackendFactory& factory, const KnownHostsCheck& checkKnownHosts)
{
    std::vector<std::string> reasons;

    if (cfg.degradedMode)
        reasons.push_back("Degraded mode is enabled by configuration.");

    if (cfg.accessTokens.empty())
        reasons.push_back("No access tokens configured.");

    if (const std::vector<std::string>& issues = validateConfig(cfg);
        !issues.empty())
        reasons.push_back("Invalid configuration: " + issues[0]);

    if (!factory.isAvailable(cfg.defaultProtocol))
        reasons.push_back("Default protocol " + fmtPath(getProtocolName(cfg.defaultProtocol)) + " is not available.");

    if (!cfg.knownHostsPath.empty() && factory.isAvailable(RemoteProtocol::sftp))
        try
        {
            checkKnownHosts(cfg.knownHostsPath); //throw SysError
        }
        catch (const SysError& e)
        {
            reasons.push_back("Known hosts file " + fmtPath(cfg.knownHostsPath) + " cannot be used: " + replaceCpy(e.toString(), "\n", " "));
        }

    DegradedModeState state;
    state.isDegraded = !reasons.empty();
    for (const std::string& reason : reasons)
        state.reason += (state.reason.empty() ? "" : "; ") + reason;
    return state;
}


DegradedModeState DegradedModeController::reevaluate()
{
    std::lock_guard dummy(lockEvaluate_);

    const DegradedModeState state = evaluateDegradedMode(cfg_, *factory_, checkKnownHosts_);

    //reason first: a reader seeing "degraded" must never see a stale reason
    reason_.access([&](std::string& reason) { reason = state.reason; });
    degraded_.store(state.isDegraded, std::memory_order_release);
    return state;
}
