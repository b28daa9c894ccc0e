/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt
*/

#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <pwd.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <sys/stat.h>

#include "log.h"
#include "paths.h"

namespace splitrandr
{

std::string config_home()
{
    const char* xdg = getenv("XDG_CONFIG_HOME");
    if(xdg && *xdg == '/')
        return xdg;

    const char* home = getenv("HOME");
    if(!home || !*home)
    {
        const struct passwd* pw = getpwuid(getuid());
        home = pw ? pw->pw_dir : "/tmp";
    }
    return std::string(home) + "/.config";
}

std::string binary_config_path()
{
    const char* explicitPath = getenv("SPLITRANDR_CONFIG");
    if(explicitPath && *explicitPath)
        return explicitPath;
    return config_home() + "/splitrandr.bin";
}

std::string monitors_xml_path()
{
    return config_home() + "/cinnamon-monitors.xml";
}

bool make_parent_dirs(std::string const& path)
{
    for(size_t slash = path.find('/', 1); slash != std::string::npos; slash = path.find('/', slash + 1))
    {
        const std::string dir = path.substr(0, slash);
        if(mkdir(dir.c_str(), 0755) < 0 && errno != EEXIST)
            return false;
    }
    return true;
}

bool write_file_atomically(std::string const& path, const void* data, size_t size)
{
    if(!make_parent_dirs(path))
    {
        Debug::log(ERR, "cannot create the directory of %s: %s", path.c_str(), strerror(errno));
        return false;
    }

    const std::string temp = path + ".tmp." + std::to_string(getpid());
    const int fd = open(temp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if(fd < 0)
    {
        Debug::log(ERR, "cannot create %s: %s", temp.c_str(), strerror(errno));
        return false;
    }

    const char* p = static_cast<const char*>(data);
    size_t left = size;
    while(left)
    {
        const ssize_t written = write(fd, p, left);
        if(written < 0 && errno == EINTR)
            continue;
        if(written <= 0)
        {
            Debug::log(ERR, "cannot write %s: %s", temp.c_str(), strerror(errno));
            close(fd);
            unlink(temp.c_str());
            return false;
        }
        p += written;
        left -= written;
    }
    const bool flushed = fsync(fd) == 0;
    const bool closed = close(fd) == 0;
    if(!flushed || !closed)
    {
        Debug::log(ERR, "cannot flush %s: %s", temp.c_str(), strerror(errno));
        unlink(temp.c_str());
        return false;
    }
    if(rename(temp.c_str(), path.c_str()) < 0)
    {
        Debug::log(ERR, "cannot rename %s to %s: %s", temp.c_str(), path.c_str(), strerror(errno));
        unlink(temp.c_str());
        return false;
    }
    return true;
}

bool remove_file(std::string const& path)
{
    if(unlink(path.c_str()) < 0 && errno != ENOENT)
    {
        Debug::log(ERR, "cannot remove %s: %s", path.c_str(), strerror(errno));
        return false;
    }
    return true;
}

} // namespace splitrandr
