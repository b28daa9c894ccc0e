/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt
*/

#include <stdio.h>
#include <algorithm>

#include "display-layout.h"

namespace splitrandr
{

const char* rotation_name(uint16_t rotation)
{
    switch(rotation & 0xf)
    {
    case ROTATE_90:  return "left";
    case ROTATE_180: return "inverted";
    case ROTATE_270: return "right";
    default:         return "normal";
    }
}

OutputLayout* DisplayLayout::find(std::string const& name)
{
    for(auto& output : outputs)
        if(output.name == name)
            return &output;
    return nullptr;
}

const OutputLayout* DisplayLayout::find(std::string const& name) const
{
    for(const auto& output : outputs)
        if(output.name == name)
            return &output;
    return nullptr;
}

void DisplayLayout::fitScreen()
{
    unsigned width = 0, height = 0;
    for(const auto& output : outputs)
    {
        if(!output.active)
            continue;
        width = std::max<unsigned>(width, std::max(output.x, 0) + output.width);
        height = std::max<unsigned>(height, std::max(output.y, 0) + output.height);
    }
    screenWidth = width;
    screenHeight = height;
}

std::string virtual_monitor_name(std::string const& output, unsigned leafIndex)
{
    return output + "~" + std::to_string(leafIndex);
}

std::string virtual_monitor_parent(std::string const& name)
{
    const auto tilde = name.rfind('~');
    if(tilde == std::string::npos || tilde == 0 || tilde + 1 == name.size())
        return std::string();
    if(name.find_first_not_of("0123456789", tilde + 1) != std::string::npos)
        return std::string();
    return name.substr(0, tilde);
}

std::vector<std::string> topology_arguments(DisplayLayout const& layout)
{
    std::vector<std::string> args;
    char buf[64];
    if(layout.screenWidth && layout.screenHeight)
    {
        snprintf(buf, sizeof buf, "%ux%u", layout.screenWidth, layout.screenHeight);
        args.push_back("--fb");
        args.push_back(buf);
    }

    for(const auto& output : layout.outputs)
    {
        args.push_back("--output");
        args.push_back(output.name);
        if(!output.active)
        {
            args.push_back("--off");
            continue;
        }

        if(output.mode.empty())
            args.push_back("--auto");
        else
        {
            args.push_back("--mode");
            args.push_back(output.mode);
            if(output.rate > 0)
            {
                snprintf(buf, sizeof buf, "%.2f", output.rate);
                args.push_back("--rate");
                args.push_back(buf);
            }
        }
        snprintf(buf, sizeof buf, "%dx%d", output.x, output.y);
        args.push_back("--pos");
        args.push_back(buf);
        args.push_back("--rotate");
        args.push_back(rotation_name(output.rotation));
        if(output.primary)
            args.push_back("--primary");
    }
    return args;
}

std::vector<VirtualMonitor> virtual_monitors(OutputLayout const& output)
{
    std::vector<VirtualMonitor> monitors;
    if(!output.active || output.tree.isLeaf())
        return monitors;

    const auto leaves = resolve(output.tree, output.width, output.height);
    char geometry[96];
    for(size_t i = 0; i < leaves.size(); ++i)
    {
        VirtualMonitor monitor;
        monitor.name = virtual_monitor_name(output.name, i);
        monitor.owner = i == 0 ? output.name : "none";
        monitor.area = Rect(output.x + leaves[i].x, output.y + leaves[i].y, leaves[i].width, leaves[i].height);
        monitor.mmWidth = output.width ? output.mmWidth * leaves[i].width / output.width : 0;
        monitor.mmHeight = output.height ? output.mmHeight * leaves[i].height / output.height : 0;
        snprintf(geometry, sizeof geometry, "%u/%lux%u/%lu+%d+%d", monitor.area.width, monitor.mmWidth,
                 monitor.area.height, monitor.mmHeight, monitor.area.x, monitor.area.y);
        monitor.geometry = geometry;
        monitors.push_back(monitor);
    }
    return monitors;
}

std::vector<OutputSplitConfig> split_configs(DisplayLayout const& layout)
{
    std::vector<OutputSplitConfig> configs;
    for(const auto& output : layout.outputs)
    {
        if(!output.active || output.tree.isLeaf())
            continue;
        OutputSplitConfig config;
        config.name = output.name;
        config.edidHex = output.edidHex;
        config.width = output.width;
        config.height = output.height;
        config.tree = output.tree;
        configs.push_back(config);
    }
    return configs;
}

} // namespace splitrandr
