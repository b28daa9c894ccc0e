/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt
*/

#include <signal.h>
#include <algorithm>

#include "config-codec.h"
#include "coordinator.h"
#include "log.h"
#include "monitors-xml.h"
#include "paths.h"

namespace splitrandr
{

const char* coordinator_state_name(CoordinatorState state)
{
    switch(state)
    {
    case CoordinatorState::Idle:               return "idle";
    case CoordinatorState::Frozen:             return "frozen";
    case CoordinatorState::TopologyApplied:    return "topology applied";
    case CoordinatorState::MonitorsCreated:    return "monitors created";
    case CoordinatorState::ConfigWritten:      return "config written";
    case CoordinatorState::Resumed:            return "resumed";
    case CoordinatorState::PersistenceWritten: return "persistence written";
    }
    return "unknown";
}

const char* apply_result_name(ApplyResult result)
{
    switch(result)
    {
    case ApplyResult::Ok:                return "ok";
    case ApplyResult::RestartFailed:     return "window manager restart failed";
    case ApplyResult::FreezeFailed:      return "window manager could not be frozen";
    case ApplyResult::TopologyFailed:    return "output configuration failed";
    case ApplyResult::MonitorsFailed:    return "virtual monitor creation failed";
    case ApplyResult::ConfigWriteFailed: return "configuration file could not be written";
    case ApplyResult::ResumeFailed:      return "window manager could not be resumed";
    case ApplyResult::PersistenceFailed: return "display persistence file could not be written";
    }
    return "unknown";
}

Coordinator::Coordinator(ProcessControl& processes, DisplayCommands& display, CoordinatorOptions options)
    : processes_(processes)
    , display_(display)
    , options_(std::move(options))
{
}

template<typename Predicate>
bool Coordinator::waitFor(Predicate const& done)
{
    const unsigned interval = std::max(options_.pollIntervalMs, 1u);
    for(unsigned waited = 0;; waited += interval)
    {
        if(done())
            return true;
        if(waited >= options_.settleTimeoutMs)
            return false;
        processes_.sleepFor(interval);
    }
}

void Coordinator::enter(CoordinatorState state)
{
    state_ = state;
    Debug::log(TRACE, "coordinator: %s", coordinator_state_name(state));
}

ApplyResult Coordinator::apply(DisplayLayout const& layout)
{
    state_ = CoordinatorState::Idle;
    frozen_ = false;

    pid_ = processes_.findProcess(options_.windowManager);
    if(!pid_)
        Debug::log(WARN, "%s is not running, applying without freezing it", options_.windowManager.c_str());
    else if(!options_.preloadLibrary.empty() && !processes_.mapsLibrary(pid_, options_.preloadLibrary))
    {
        if(!options_.restartDetached)
            Debug::log(WARN, "%s (%d) does not have %s loaded, split outputs stay invisible to it",
                       options_.windowManager.c_str(), int(pid_), options_.preloadLibrary.c_str());
        else
        {
            pid_ = ensureAttached(pid_);
            if(!pid_)
                return ApplyResult::RestartFailed;
        }
    }

    if(pid_ && !freeze())
    {
        // A half-delivered SIGSTOP must not leave the window manager stopped
        if(!resume())
            return ApplyResult::ResumeFailed;
        return ApplyResult::FreezeFailed;
    }

    ApplyResult result = reconfigure(layout);
    if(!resume() && result == ApplyResult::Ok)
        result = ApplyResult::ResumeFailed;
    if(result != ApplyResult::Ok)
        return result;

    if(!write_monitors_xml(options_.monitorsXmlPath, layout))
        return ApplyResult::PersistenceFailed;
    enter(CoordinatorState::PersistenceWritten);
    return ApplyResult::Ok;
}

pid_t Coordinator::ensureAttached(pid_t pid)
{
    Debug::log(LOG, "%s (%d) does not have %s loaded, restarting it", options_.windowManager.c_str(), int(pid),
               options_.preloadLibrary.c_str());
    if(!processes_.spawnDetached({options_.windowManager, "--replace"}, options_.preloadLibrary))
    {
        Debug::log(ERR, "cannot start %s --replace", options_.windowManager.c_str());
        return 0;
    }

    pid_t attached = 0;
    const bool ok = waitFor([&]() {
        const pid_t candidate = processes_.findProcess(options_.windowManager);
        if(candidate && processes_.mapsLibrary(candidate, options_.preloadLibrary))
            attached = candidate;
        return attached != 0;
    });
    if(!ok)
    {
        Debug::log(ERR, "%s did not come back with %s loaded within %u ms", options_.windowManager.c_str(),
                   options_.preloadLibrary.c_str(), options_.settleTimeoutMs);
        return 0;
    }
    Debug::log(LOG, "%s restarted as %d", options_.windowManager.c_str(), int(attached));
    return attached;
}

bool Coordinator::freeze()
{
    if(!processes_.sendSignal(pid_, SIGSTOP))
        return false;
    frozen_ = true;

    // SIGSTOP is idempotent, so it is simply repeated until the stop shows up
    const bool settled = waitFor([this]() {
        const char state = processes_.processState(pid_);
        if(state == 'T' || state == 't' || state == 0)
            return true;
        processes_.sendSignal(pid_, SIGSTOP);
        return false;
    });

    const char state = processes_.processState(pid_);
    if(!settled || (state != 'T' && state != 't'))
    {
        Debug::log(ERR, "%s (%d) did not stop (state '%c')", options_.windowManager.c_str(), int(pid_), state ? state : '-');
        return false;
    }
    Debug::log(LOG, "froze %s (%d)", options_.windowManager.c_str(), int(pid_));
    enter(CoordinatorState::Frozen);
    return true;
}

bool Coordinator::resume()
{
    if(!frozen_)
    {
        enter(CoordinatorState::Resumed);
        return true;
    }

    // One round trip so the server has delivered every RandR event before the window manager wakes up
    std::vector<std::string> monitors;
    if(!display_.listMonitors(monitors))
        Debug::log(TRACE, "round trip before resuming failed");

    if(processes_.processState(pid_) == 0)
    {
        Debug::log(ERR, "%s (%d) vanished while frozen; if it is still around, resume it with: kill -CONT %d",
                   options_.windowManager.c_str(), int(pid_), int(pid_));
        frozen_ = false;
        return false;
    }
    if(!processes_.sendSignal(pid_, SIGCONT))
    {
        Debug::log(ERR, "cannot resume %s; resume it with: kill -CONT %d", options_.windowManager.c_str(), int(pid_));
        return false;
    }
    frozen_ = false;
    Debug::log(LOG, "resumed %s (%d)", options_.windowManager.c_str(), int(pid_));
    enter(CoordinatorState::Resumed);
    return true;
}

ApplyResult Coordinator::reconfigure(DisplayLayout const& layout)
{
    if(!applyTopology(layout))
        return ApplyResult::TopologyFailed;
    if(!createMonitors(layout))
        return ApplyResult::MonitorsFailed;
    if(!writeConfig(layout))
        return ApplyResult::ConfigWriteFailed;
    return ApplyResult::Ok;
}

bool Coordinator::applyTopology(DisplayLayout const& layout)
{
    const auto args = topology_arguments(layout);
    if(!display_.run(args))
        return false;

    // Some drivers move outputs asynchronously; re-apply until the positions stick
    for(unsigned attempt = 1; attempt <= options_.positionAttempts; ++attempt)
    {
        std::map<std::string, std::pair<int, int>> positions;
        if(!display_.queryPositions(positions))
        {
            Debug::log(WARN, "cannot query output positions, not verifying them");
            break;
        }

        bool mismatch = false;
        for(const auto& output : layout.outputs)
        {
            if(!output.active)
                continue;
            const auto actual = positions.find(output.name);
            if(actual == positions.end() || actual->second == std::make_pair(output.x, output.y))
                continue;
            Debug::log(WARN, "%s is at %d,%d instead of %d,%d (attempt %u)", output.name.c_str(), actual->second.first,
                       actual->second.second, output.x, output.y, attempt);
            mismatch = true;
        }
        if(!mismatch)
            break;
        if(attempt == options_.positionAttempts)
        {
            Debug::log(ERR, "output positions still differ after %u attempts", attempt);
            break;
        }
        processes_.sleepFor(options_.pollIntervalMs);
        if(!display_.run(args))
            return false;
    }

    enter(CoordinatorState::TopologyApplied);
    return true;
}

bool Coordinator::createMonitors(DisplayLayout const& layout)
{
    std::vector<std::string> existing;
    if(display_.listMonitors(existing))
    {
        for(const auto& name : existing)
        {
            const auto parent = virtual_monitor_parent(name);
            if(parent.empty() || !layout.find(parent))
                continue;
            Debug::log(LOG, "deleting virtual monitor %s", name.c_str());
            if(!display_.run({"--delmonitor", name}))
                Debug::log(TRACE, "virtual monitor %s was already gone", name.c_str());
        }
    }
    else
        Debug::log(WARN, "cannot list monitors, stale virtual monitors may remain");

    for(const auto& output : layout.outputs)
    {
        for(const auto& monitor : virtual_monitors(output))
        {
            Debug::log(LOG, "creating virtual monitor %s %s %s", monitor.name.c_str(), monitor.geometry.c_str(),
                       monitor.owner.c_str());
            if(!display_.run({"--setmonitor", monitor.name, monitor.geometry, monitor.owner}))
                return false;
        }
    }
    enter(CoordinatorState::MonitorsCreated);
    return true;
}

bool Coordinator::writeConfig(DisplayLayout const& layout)
{
    const auto configs = split_configs(layout);
    if(configs.empty())
    {
        if(!remove_file(options_.configPath))
            return false;
        Debug::log(LOG, "no split outputs, removed %s", options_.configPath.c_str());
    }
    else
    {
        const auto bytes = encode_config(configs);
        if(!write_file_atomically(options_.configPath, bytes.data(), bytes.size()))
            return false;
        Debug::log(LOG, "wrote %zu split outputs to %s", configs.size(), options_.configPath.c_str());
    }
    enter(CoordinatorState::ConfigWritten);
    return true;
}

} // namespace splitrandr
