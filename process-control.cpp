/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt
*/

#include <ctype.h>
#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>
#include <unistd.h>
#include <sys/wait.h>

#include "log.h"
#include "process-control.h"

namespace splitrandr
{

namespace
{

bool read_proc_file(pid_t pid, const char* entry, std::string& contents)
{
    char path[64];
    snprintf(path, sizeof path, "/proc/%d/%s", int(pid), entry);
    FILE* f = fopen(path, "re");
    if(!f)
        return false;
    contents.clear();
    char buf[4096];
    size_t n;
    while((n = fread(buf, 1, sizeof buf, f)) > 0)
        contents.append(buf, n);
    fclose(f);
    return true;
}

std::string real_path(std::string const& path)
{
    char resolved[PATH_MAX];
    if(!realpath(path.c_str(), resolved))
        return path;
    return resolved;
}

std::string base_name(std::string const& path)
{
    const auto slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace

std::string prepend_preload(const char* current, std::string const& library)
{
    if(!current || !*current)
        return library;

    // LD_PRELOAD accepts both colons and spaces as separators
    std::string existing(current);
    size_t start = 0;
    while(start <= existing.size())
    {
        const auto end = existing.find_first_of(": ", start);
        const auto item = existing.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if(item == library)
            return existing;
        if(end == std::string::npos)
            break;
        start = end + 1;
    }
    return library + ":" + existing;
}

char parse_stat_state(std::string const& stat)
{
    // The command name in parentheses may itself contain spaces and parentheses
    const auto paren = stat.rfind(')');
    if(paren == std::string::npos)
        return 0;
    for(size_t i = paren + 1; i < stat.size(); ++i)
        if(!isspace(static_cast<unsigned char>(stat[i])))
            return stat[i];
    return 0;
}

pid_t SystemProcessControl::findProcess(std::string const& comm)
{
    DIR* proc = opendir("/proc");
    if(!proc)
    {
        Debug::log(ERR, "cannot list /proc: %s", strerror(errno));
        return 0;
    }

    pid_t found = 0;
    while(const struct dirent* entry = readdir(proc))
    {
        char* end;
        const long pid = strtol(entry->d_name, &end, 10);
        if(*end || pid <= 0)
            continue;

        std::string name;
        if(!read_proc_file(pid, "comm", name))
            continue;
        if(!name.empty() && name.back() == '\n')
            name.erase(name.size() - 1);
        if(name != comm)
            continue;

        const char state = processState(pid);
        if(state == 0 || state == 'Z' || state == 'X')
            continue;
        found = pid;
        break;
    }
    closedir(proc);
    return found;
}

bool SystemProcessControl::sendSignal(pid_t pid, int signal)
{
    if(kill(pid, signal) < 0)
    {
        Debug::log(WARN, "cannot send signal %d to %d: %s", signal, int(pid), strerror(errno));
        return false;
    }
    return true;
}

char SystemProcessControl::processState(pid_t pid)
{
    std::string stat;
    if(!read_proc_file(pid, "stat", stat))
        return 0;
    return parse_stat_state(stat);
}

bool SystemProcessControl::mapsLibrary(pid_t pid, std::string const& library)
{
    std::string maps;
    if(!read_proc_file(pid, "maps", maps))
        return false;

    const std::string resolved = real_path(library);
    const bool byName = library.find('/') == std::string::npos;
    size_t start = 0;
    while(start < maps.size())
    {
        auto end = maps.find('\n', start);
        if(end == std::string::npos)
            end = maps.size();
        // address perms offset dev inode pathname
        const auto path = maps.find('/', start);
        if(path != std::string::npos && path < end)
        {
            const std::string mapped = maps.substr(path, end - path);
            if(mapped == library || mapped == resolved || (byName && base_name(mapped) == library))
                return true;
        }
        start = end + 1;
    }
    return false;
}

bool SystemProcessControl::spawnDetached(std::vector<std::string> const& argv, std::string const& library)
{
    if(argv.empty())
        return false;

    std::vector<char*> args;
    for(const auto& arg : argv)
        args.push_back(const_cast<char*>(arg.c_str()));
    args.push_back(nullptr);
    const std::string preload = prepend_preload(getenv("LD_PRELOAD"), library);

    const pid_t child = fork();
    if(child < 0)
    {
        Debug::log(ERR, "fork failed: %s", strerror(errno));
        return false;
    }
    if(child == 0)
    {
        // Double fork so the window manager is reparented to init, not to us
        if(fork() != 0)
            _exit(0);
        setsid();
        const int devnull = open("/dev/null", O_RDWR);
        if(devnull >= 0)
        {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            if(devnull > STDERR_FILENO)
                close(devnull);
        }
        setenv("LD_PRELOAD", preload.c_str(), 1);
        execvp(args[0], args.data());
        _exit(127);
    }

    int status = 0;
    while(waitpid(child, &status, 0) < 0)
    {
        if(errno != EINTR)
        {
            Debug::log(ERR, "waitpid failed: %s", strerror(errno));
            return false;
        }
    }
    Debug::log(LOG, "started %s with LD_PRELOAD=%s", argv[0].c_str(), preload.c_str());
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

void SystemProcessControl::sleepFor(unsigned milliseconds)
{
    struct timespec delay;
    delay.tv_sec = milliseconds / 1000;
    delay.tv_nsec = (milliseconds % 1000) * 1000000L;
    while(nanosleep(&delay, &delay) < 0 && errno == EINTR)
    {
    }
}

} // namespace splitrandr
