/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt
*/

#ifndef SPLITRANDR_PROCESS_CONTROL_H
#define SPLITRANDR_PROCESS_CONTROL_H

#include <sys/types.h>
#include <string>
#include <vector>

namespace splitrandr
{

// What the coordinator needs to know about and do to the window manager process
class ProcessControl
{
public:
    virtual ~ProcessControl() {}

    // Live (non-zombie) process whose command name is comm, 0 if none
    virtual pid_t findProcess(std::string const& comm) = 0;

    virtual bool sendSignal(pid_t pid, int signal) = 0;

    // Scheduler state letter from /proc/<pid>/stat, 0 if the process is gone
    virtual char processState(pid_t pid) = 0;

    // True if the library file is mapped into the process
    virtual bool mapsLibrary(pid_t pid, std::string const& library) = 0;

    // Starts argv in a new session with library prepended to LD_PRELOAD
    virtual bool spawnDetached(std::vector<std::string> const& argv, std::string const& library) = 0;

    virtual void sleepFor(unsigned milliseconds) = 0;
};

// ProcessControl backed by kill(2), procfs and fork/exec
class SystemProcessControl : public ProcessControl
{
public:
    pid_t findProcess(std::string const& comm) override;
    bool sendSignal(pid_t pid, int signal) override;
    char processState(pid_t pid) override;
    bool mapsLibrary(pid_t pid, std::string const& library) override;
    bool spawnDetached(std::vector<std::string> const& argv, std::string const& library) override;
    void sleepFor(unsigned milliseconds) override;
};

// LD_PRELOAD value with library in front, without duplicating it
std::string prepend_preload(const char* current, std::string const& library);

// Parses the state letter out of the contents of /proc/<pid>/stat
char parse_stat_state(std::string const& stat);

} // namespace splitrandr

#endif // SPLITRANDR_PROCESS_CONTROL_H
