/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt
*/

#ifndef SPLITRANDR_DISPLAY_COMMANDS_H
#define SPLITRANDR_DISPLAY_COMMANDS_H

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace splitrandr
{

// The display command surface used while the window manager is frozen
class DisplayCommands
{
public:
    virtual ~DisplayCommands() {}

    // Runs one display configuration command; true on success
    virtual bool run(std::vector<std::string> const& args) = 0;

    // Names of all monitors, virtual ones included
    virtual bool listMonitors(std::vector<std::string>& names) = 0;

    // Top-left corner of every active output
    virtual bool queryPositions(std::map<std::string, std::pair<int, int>>& positions) = 0;
};

/*
    DisplayCommands running the xrandr executable. LD_PRELOAD is removed from
    its environment so it always sees the real outputs.
*/
class XrandrCommands : public DisplayCommands
{
public:
    explicit XrandrCommands(std::string executable = "xrandr");

    bool run(std::vector<std::string> const& args) override;
    bool listMonitors(std::vector<std::string>& names) override;
    bool queryPositions(std::map<std::string, std::pair<int, int>>& positions) override;

private:
    bool execute(std::vector<std::string> const& args, std::string* output);

    std::string executable_;
};

// Monitor names from the output of xrandr --listmonitors
std::vector<std::string> parse_monitor_list(std::string const& text);

// Output positions from the output of xrandr --query
std::map<std::string, std::pair<int, int>> parse_output_positions(std::string const& text);

} // namespace splitrandr

#endif // SPLITRANDR_DISPLAY_COMMANDS_H
