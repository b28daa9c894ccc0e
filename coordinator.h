/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt

    Applies a display layout while the window manager is frozen, so it never
    observes a half-updated topology:

    Idle -> Frozen -> TopologyApplied -> MonitorsCreated -> ConfigWritten
         -> Resumed -> PersistenceWritten

    Once the window manager was stopped it is always resumed, whichever step
    failed. A window manager without the preload library mapped is restarted
    with it first.
*/

#ifndef SPLITRANDR_COORDINATOR_H
#define SPLITRANDR_COORDINATOR_H

#include <sys/types.h>
#include <string>

#include "display-commands.h"
#include "display-layout.h"
#include "process-control.h"

namespace splitrandr
{

enum class CoordinatorState
{
    Idle,
    Frozen,
    TopologyApplied,
    MonitorsCreated,
    ConfigWritten,
    Resumed,
    PersistenceWritten
};

const char* coordinator_state_name(CoordinatorState state);

enum class ApplyResult
{
    Ok,
    RestartFailed,
    FreezeFailed,
    TopologyFailed,
    MonitorsFailed,
    ConfigWriteFailed,
    ResumeFailed,
    PersistenceFailed
};

const char* apply_result_name(ApplyResult result);

struct CoordinatorOptions
{
    std::string windowManager = "cinnamon";
    // Preload library checked in and injected into the window manager; empty skips the check
    std::string preloadLibrary;
    std::string configPath;
    std::string monitorsXmlPath;
    unsigned    settleTimeoutMs = 10000;
    unsigned    pollIntervalMs = 100;
    unsigned    positionAttempts = 3;
    bool        restartDetached = true;
};

class Coordinator
{
public:
    Coordinator(ProcessControl& processes, DisplayCommands& display, CoordinatorOptions options);

    ApplyResult apply(DisplayLayout const& layout);

    CoordinatorState state() const { return state_; }
    // The window manager process acted upon, 0 if none was found
    pid_t windowManager() const { return pid_; }

private:
    pid_t ensureAttached(pid_t pid);
    bool freeze();
    bool resume();
    ApplyResult reconfigure(DisplayLayout const& layout);
    bool applyTopology(DisplayLayout const& layout);
    bool createMonitors(DisplayLayout const& layout);
    bool writeConfig(DisplayLayout const& layout);
    void enter(CoordinatorState state);

    // Polls until done() holds or the settle timeout expires
    template<typename Predicate>
    bool waitFor(Predicate const& done);

    ProcessControl&    processes_;
    DisplayCommands&   display_;
    CoordinatorOptions options_;
    CoordinatorState   state_ = CoordinatorState::Idle;
    pid_t              pid_ = 0;
    bool               frozen_ = false;
};

} // namespace splitrandr

#endif // SPLITRANDR_COORDINATOR_H
