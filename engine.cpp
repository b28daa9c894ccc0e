/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt
*/

#include "engine.h"
#include "log.h"
#include "paths.h"

namespace splitrandr
{

namespace
{

bool same_real_state(std::vector<RealOutputState> const& a, std::vector<RealOutputState> const& b)
{
    if(a.size() != b.size())
        return false;
    for(size_t i = 0; i < a.size(); ++i)
    {
        if(a[i].output != b[i].output || a[i].name != b[i].name || a[i].edidHex != b[i].edidHex ||
           a[i].crtc != b[i].crtc || a[i].crtcX != b[i].crtcX || a[i].crtcY != b[i].crtcY ||
           a[i].crtcWidth != b[i].crtcWidth || a[i].crtcHeight != b[i].crtcHeight || a[i].mode != b[i].mode ||
           a[i].rotation != b[i].rotation)
            return false;
    }
    return true;
}

} // namespace

const char* engine_state_name(EngineState state)
{
    switch(state)
    {
    case EngineState::Unloaded:    return "unloaded";
    case EngineState::Loaded:      return "loaded";
    case EngineState::ConfigBound: return "config bound";
    case EngineState::Serving:     return "serving";
    case EngineState::Disabled:    return "disabled";
    }
    return "unknown";
}

Engine::Engine(std::string configPath)
    : store_(std::move(configPath))
{
}

Engine& Engine::instance()
{
    static Engine* engine = new Engine(binary_config_path());
    return *engine;
}

void Engine::attach()
{
    if(state_ != EngineState::Unloaded)
        return;
    state_ = EngineState::Loaded;
    Debug::log(LOG, "attached, configuration at %s", store_.path().c_str());
}

bool Engine::pollConfig()
{
    if(state_ == EngineState::Disabled)
        return false;
    if(state_ == EngineState::Unloaded)
        attach();

    const auto result = store_.poll();
    if(store_.bound() && state_ == EngineState::Loaded)
        state_ = EngineState::ConfigBound;
    return result == ConfigStore::PollResult::Loaded || result == ConfigStore::PollResult::Removed;
}

bool Engine::wantsSplits() const
{
    if(state_ == EngineState::Disabled)
        return false;
    const auto current = store_.current();
    for(const auto& entry : current->entries)
        if(entry.leaves.size() > 1)
            return true;
    return false;
}

std::shared_ptr<FakeTable> Engine::refresh(std::vector<RealOutputState> const& real)
{
    if(state_ == EngineState::Disabled)
        return nullptr;

    const auto current = store_.current();
    const auto previous = table();
    if(previous && current->generation == builtGeneration_ && same_real_state(real, builtFrom_))
        return previous;

    std::shared_ptr<FakeTable> next(new FakeTable);
    if(build_fake_table(current->entries, real, ids_, *next) == BuildStatus::IdCollision)
    {
        Debug::log(ERR, "fake resource ids exhausted or duplicated, disabling output splitting");
        install(nullptr);
        state_ = EngineState::Disabled;
        return nullptr;
    }

    install(next);
    builtGeneration_ = current->generation;
    builtFrom_ = real;
    if(!next->empty() && (state_ == EngineState::ConfigBound || state_ == EngineState::Loaded))
    {
        state_ = EngineState::Serving;
        Debug::log(LOG, "serving %zu fake outputs", next->outputs.size());
    }
    return next;
}

void Engine::clear()
{
    install(nullptr);
}

std::shared_ptr<FakeTable> Engine::table() const
{
    return std::atomic_load(&table_);
}

void Engine::install(std::shared_ptr<FakeTable> table)
{
    std::atomic_store(&table_, std::move(table));
}

} // namespace splitrandr
