/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt

    State shared by every hook of the preload library.

    Unloaded -> Loaded         library constructor resolved the real functions
    Loaded -> ConfigBound      first configuration accepted
    ConfigBound -> Serving     first screen resources answered with fake outputs
    any -> Disabled            fake id invariant broken, pure pass-through
*/

#ifndef SPLITRANDR_ENGINE_H
#define SPLITRANDR_ENGINE_H

#include <memory>
#include <string>
#include <vector>

#include "config-store.h"
#include "fake-table.h"
#include "fake-xid.h"

namespace splitrandr
{

enum class EngineState
{
    Unloaded,
    Loaded,
    ConfigBound,
    Serving,
    Disabled
};

const char* engine_state_name(EngineState state);

class Engine
{
public:
    explicit Engine(std::string configPath);

    // The process-wide instance used by the hooks, never destroyed
    static Engine& instance();

    void attach();
    EngineState state() const { return state_; }

    // Polls the configuration file; true when the snapshot changed
    bool pollConfig();

    // True when the current configuration would split at least one output
    bool wantsSplits() const;

    /*
        Rebuilds the fake table against a fresh view of the real outputs and
        swaps it in. The current table, with any CRTC updates made through
        it, is kept while neither the configuration nor the real outputs
        changed. On failure the previous table stays in place, except for an
        id collision which disables the engine.
    */
    std::shared_ptr<FakeTable> refresh(std::vector<RealOutputState> const& real);

    // Drops all fake objects, e.g. after the configuration was removed
    void clear();

    // Snapshot for the duration of one hook; may be null
    std::shared_ptr<FakeTable> table() const;

    std::shared_ptr<const LoadedConfig> config() const { return store_.current(); }

private:
    void install(std::shared_ptr<FakeTable> table);

    ConfigStore                store_;
    FakeXidNamespace           ids_;
    std::shared_ptr<FakeTable> table_;
    EngineState                state_ = EngineState::Unloaded;

    // What table_ was built from
    unsigned                     builtGeneration_ = 0;
    std::vector<RealOutputState> builtFrom_;
};

} // namespace splitrandr

#endif // SPLITRANDR_ENGINE_H
