/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt

    The desired display topology: real outputs with their mode, position and
    rotation, and the split tree laid over each of them.
*/

#ifndef SPLITRANDR_DISPLAY_LAYOUT_H
#define SPLITRANDR_DISPLAY_LAYOUT_H

#include <stdint.h>
#include <string>
#include <vector>

#include "config-codec.h"
#include "split-tree.h"

namespace splitrandr
{

enum Rotation : uint16_t
{
    ROTATE_0   = 1,
    ROTATE_90  = 2,
    ROTATE_180 = 4,
    ROTATE_270 = 8
};

// xrandr --rotate argument
const char* rotation_name(uint16_t rotation);

struct OutputLayout
{
    std::string   name;
    std::string   edidHex;
    bool          active = false;
    int           x = 0;
    int           y = 0;
    // Size on screen, i.e. after rotation
    unsigned      width = 0;
    unsigned      height = 0;
    std::string   mode;
    double        rate = 0;
    bool          primary = false;
    uint16_t      rotation = ROTATE_0;
    unsigned long mmWidth = 0;
    unsigned long mmHeight = 0;
    SplitTree     tree;
};

struct DisplayLayout
{
    unsigned                  screenWidth = 0;
    unsigned                  screenHeight = 0;
    std::vector<OutputLayout> outputs;

    OutputLayout* find(std::string const& name);
    const OutputLayout* find(std::string const& name) const;

    // Smallest framebuffer holding every active output
    void fitScreen();
};

// One xrandr --setmonitor call
struct VirtualMonitor
{
    std::string name;
    // <w>/<mmw>x<h>/<mmh>+<x>+<y>
    std::string geometry;
    // The output the monitor claims, "none" for all but the first leaf
    std::string owner;
    Rect        area;
    unsigned long mmWidth = 0;
    unsigned long mmHeight = 0;
};

// <output>~<leaf index>
std::string virtual_monitor_name(std::string const& output, unsigned leafIndex);

// Output name of a virtual monitor, empty if name is not one
std::string virtual_monitor_parent(std::string const& name);

// Arguments for one xrandr call applying the real topology
std::vector<std::string> topology_arguments(DisplayLayout const& layout);

// Virtual monitors for every leaf of a split active output, in leaf order
std::vector<VirtualMonitor> virtual_monitors(OutputLayout const& output);

// Binary configuration entries of the split active outputs
std::vector<OutputSplitConfig> split_configs(DisplayLayout const& layout);

} // namespace splitrandr

#endif // SPLITRANDR_DISPLAY_LAYOUT_H
