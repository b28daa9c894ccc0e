/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt
*/

#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <sys/wait.h>
#include <sstream>

#include "display-commands.h"
#include "log.h"

namespace splitrandr
{

namespace
{

std::string join(std::vector<std::string> const& args)
{
    std::string line;
    for(const auto& arg : args)
    {
        if(!line.empty())
            line += ' ';
        line += arg;
    }
    return line;
}

std::vector<std::string> split_lines(std::string const& text)
{
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while(std::getline(in, line))
        lines.push_back(line);
    return lines;
}

} // namespace

std::vector<std::string> parse_monitor_list(std::string const& text)
{
    // Monitors: 2
    //  0: +*DP-1~0 1152/300x1080/280+0+0  DP-1
    std::vector<std::string> names;
    for(const auto& line : split_lines(text))
    {
        const auto colon = line.find(':');
        if(colon == std::string::npos || line.compare(0, 9, "Monitors:") == 0)
            continue;
        auto start = line.find_first_not_of(" \t+*", colon + 1);
        if(start == std::string::npos)
            continue;
        const auto end = line.find_first_of(" \t", start);
        names.push_back(line.substr(start, end == std::string::npos ? std::string::npos : end - start));
    }
    return names;
}

std::map<std::string, std::pair<int, int>> parse_output_positions(std::string const& text)
{
    // DP-1 connected primary 1920x1080+0+0 (normal left inverted right x axis y axis) 527mm x 296mm
    std::map<std::string, std::pair<int, int>> positions;
    for(const auto& line : split_lines(text))
    {
        if(line.empty() || line[0] == ' ' || line[0] == '\t' || line.compare(0, 7, "Screen ") == 0)
            continue;

        std::istringstream words(line);
        std::string name, state, word;
        if(!(words >> name >> state))
            continue;
        if(state != "connected" && state != "disconnected" && state != "unknown")
            continue;
        while(words >> word)
        {
            unsigned w, h;
            int x, y, consumed = 0;
            if(sscanf(word.c_str(), "%ux%u+%d+%d%n", &w, &h, &x, &y, &consumed) == 4 && size_t(consumed) == word.size())
            {
                positions[name] = std::make_pair(x, y);
                break;
            }
        }
    }
    return positions;
}

XrandrCommands::XrandrCommands(std::string executable)
    : executable_(std::move(executable))
{
}

bool XrandrCommands::run(std::vector<std::string> const& args)
{
    return execute(args, nullptr);
}

bool XrandrCommands::listMonitors(std::vector<std::string>& names)
{
    std::string output;
    if(!execute({"--listmonitors"}, &output))
        return false;
    names = parse_monitor_list(output);
    return true;
}

bool XrandrCommands::queryPositions(std::map<std::string, std::pair<int, int>>& positions)
{
    std::string output;
    if(!execute({"--query"}, &output))
        return false;
    positions = parse_output_positions(output);
    return true;
}

bool XrandrCommands::execute(std::vector<std::string> const& args, std::string* output)
{
    Debug::log(TRACE, "%s %s", executable_.c_str(), join(args).c_str());

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(executable_.c_str()));
    for(const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    int pipefd[2] = {-1, -1};
    if(output && pipe2(pipefd, O_CLOEXEC) < 0)
    {
        Debug::log(ERR, "pipe failed: %s", strerror(errno));
        return false;
    }

    const pid_t child = fork();
    if(child < 0)
    {
        Debug::log(ERR, "fork failed: %s", strerror(errno));
        if(output)
        {
            close(pipefd[0]);
            close(pipefd[1]);
        }
        return false;
    }
    if(child == 0)
    {
        unsetenv("LD_PRELOAD");
        if(output)
            dup2(pipefd[1], STDOUT_FILENO);
        execvp(argv[0], argv.data());
        _exit(127);
    }

    if(output)
    {
        close(pipefd[1]);
        output->clear();
        char buf[4096];
        for(;;)
        {
            const ssize_t n = read(pipefd[0], buf, sizeof buf);
            if(n < 0 && errno == EINTR)
                continue;
            if(n <= 0)
                break;
            output->append(buf, n);
        }
        close(pipefd[0]);
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
    if(!WIFEXITED(status) || WEXITSTATUS(status) != 0)
    {
        Debug::log(WARN, "%s %s failed with status %d", executable_.c_str(), join(args).c_str(),
                   WIFEXITED(status) ? WEXITSTATUS(status) : -1);
        return false;
    }
    return true;
}

} // namespace splitrandr
