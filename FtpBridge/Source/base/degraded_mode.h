// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef DEGRADED_MODE_H_1209384712093847
#define DEGRADED_MODE_H_1209384712093847

#include <atomic>
#include <functional>
#include <zen/thread.h>
#include "config.h"
#include "../afs/concrete.h"


namespace fbr
{
struct DegradedModeState
{
    bool isDegraded = false;
    std::string reason; //empty if not degraded; several causes are joined by "; "
};

//checks an existing known_hosts file; throws if it can't be used
using KnownHostsCheck = std::function<void(const std::string& knownHostsPath)>; //throw SysError

/*  causes: operator override, no access tokens, invalid settings,
            default protocol not available, configured known_hosts file unusable    */
DegradedModeState evaluateDegradedMode(const BridgeConfig& cfg, const BackendFactory& factory, const KnownHostsCheck& checkKnownHosts);


/*  process-wide availability flag:
    - written by initialize() at startup and by reevaluate() on the maintenance trigger only
    - isDegraded() is lock-free: read by every request
    - reason is read on the error path only => mutex is fine     */
class DegradedModeController
{
public:
    DegradedModeController(const BridgeConfig& cfg, std::shared_ptr<const BackendFactory> factory, KnownHostsCheck checkKnownHosts) :
        cfg_(cfg), factory_(std::move(factory)), checkKnownHosts_(std::move(checkKnownHosts)) {}

    DegradedModeState initialize() { return reevaluate(); }
    DegradedModeState reevaluate(); //THREAD-SAFETY: serialized internally

    bool isDegraded() const { return degraded_.load(std::memory_order_acquire); }
    std::string getReason() { return reason_.access([](const std::string& reason) { return reason; }); }

    DegradedModeState getState() { return {isDegraded(), getReason()}; }

private:
    DegradedModeController           (const DegradedModeController&) = delete;
    DegradedModeController& operator=(const DegradedModeController&) = delete;

    const BridgeConfig cfg_;
    const std::shared_ptr<const BackendFactory> factory_;
    const KnownHostsCheck checkKnownHosts_;

    std::mutex lockEvaluate_;
    std::atomic<bool> degraded_{true}; //until initialized
    zen::Protected<std::string> reason_{"Service is still initializing."};
};
}

#endif //DEGRADED_MODE_H_1209384712093847
