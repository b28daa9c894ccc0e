/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt
*/

#include <stdlib.h>
#include <string.h>
#include <algorithm>
#include <map>
#include <utility>
#include <vector>

#include "display-query.h"
#include "edid.h"
#include "log.h"

namespace splitrandr
{

namespace
{

/*
    Hex-coded EDID of an output, empty if the output has none
*/
std::string get_output_edid(xcb_connection_t* c, xcb_randr_output_t output)
{
    xcb_intern_atom_cookie_t edid_atom_cookie = xcb_intern_atom(c, 1, 4, "EDID"); // 4 == strlen("EDID")
    xcb_intern_atom_reply_t* edid_atom = xcb_intern_atom_reply(c, edid_atom_cookie, NULL);
    if(!edid_atom) return std::string();

    std::string edid;
    xcb_randr_get_output_property_cookie_t edid_prop_cookie = xcb_randr_get_output_property(c, output, edid_atom->atom, XCB_ATOM_ANY,
                                                                                            0, 384, 0, 0);
    xcb_randr_get_output_property_reply_t* edid_prop = xcb_randr_get_output_property_reply(c, edid_prop_cookie, NULL);
    if(edid_prop)
    {
        // EDID property is 8 bits (format = 8), num_items counts bytes
        if(edid_prop->format == 8)
            edid = edid_to_hex(xcb_randr_get_output_property_data(edid_prop), edid_prop->num_items);
        free(edid_prop);
    }
    free(edid_atom);
    return edid;
}

std::string atom_name(xcb_connection_t* c, xcb_atom_t atom)
{
    xcb_get_atom_name_reply_t* reply = xcb_get_atom_name_reply(c, xcb_get_atom_name(c, atom), NULL);
    if(!reply)
        return std::string();
    std::string name(xcb_get_atom_name_name(reply), xcb_get_atom_name_name_length(reply));
    free(reply);
    return name;
}

} // namespace

double mode_refresh_rate(xcb_randr_mode_info_t const& mode)
{
    double vtotal = mode.vtotal;
    if(mode.mode_flags & XCB_RANDR_MODE_FLAG_DOUBLE_SCAN)
        vtotal *= 2;
    if(mode.mode_flags & XCB_RANDR_MODE_FLAG_INTERLACE)
        vtotal /= 2;
    if(!mode.htotal || vtotal <= 0)
        return 0;
    return mode.dot_clock / (mode.htotal * vtotal);
}

bool query_display_layout(xcb_connection_t* c, xcb_screen_t* screen, DisplayLayout& layout)
{
    const auto resCookie = xcb_randr_get_screen_resources_current(c, screen->root);
    const auto primaryCookie = xcb_randr_get_output_primary(c, screen->root);
    xcb_randr_get_screen_resources_current_reply_t* res = xcb_randr_get_screen_resources_current_reply(c, resCookie, NULL);
    xcb_randr_get_output_primary_reply_t* primary = xcb_randr_get_output_primary_reply(c, primaryCookie, NULL);
    if(!res)
    {
        free(primary);
        Debug::log(ERR, "the X server did not answer RRGetScreenResourcesCurrent");
        return false;
    }
    const xcb_randr_output_t primaryOutput = primary ? primary->output : XCB_NONE;
    free(primary);

    const xcb_randr_mode_info_t* modes = xcb_randr_get_screen_resources_current_modes(res);
    const int numModes = xcb_randr_get_screen_resources_current_modes_length(res);
    const uint8_t* names = xcb_randr_get_screen_resources_current_names(res);
    const xcb_randr_output_t* outputs = xcb_randr_get_screen_resources_current_outputs(res);
    const int numOutputs = xcb_randr_get_screen_resources_current_outputs_length(res);

    layout = DisplayLayout();
    layout.screenWidth = screen->width_in_pixels;
    layout.screenHeight = screen->height_in_pixels;

    for(int i = 0; i < numOutputs; ++i)
    {
        const auto infoCookie = xcb_randr_get_output_info(c, outputs[i], res->config_timestamp);
        xcb_randr_get_output_info_reply_t* info = xcb_randr_get_output_info_reply(c, infoCookie, NULL);
        if(!info)
            continue;
        if(info->connection != XCB_RANDR_CONNECTION_CONNECTED)
        {
            free(info);
            continue;
        }

        OutputLayout output;
        output.name.assign(reinterpret_cast<const char*>(xcb_randr_get_output_info_name(info)),
                           xcb_randr_get_output_info_name_length(info));
        output.edidHex = get_output_edid(c, outputs[i]);
        output.mmWidth = info->mm_width;
        output.mmHeight = info->mm_height;
        output.primary = outputs[i] == primaryOutput;

        if(info->crtc != XCB_NONE)
        {
            const auto crtcCookie = xcb_randr_get_crtc_info(c, info->crtc, res->config_timestamp);
            xcb_randr_get_crtc_info_reply_t* crtc = xcb_randr_get_crtc_info_reply(c, crtcCookie, NULL);
            if(crtc && crtc->mode != XCB_NONE)
            {
                output.active = true;
                output.x = crtc->x;
                output.y = crtc->y;
                output.width = crtc->width;
                output.height = crtc->height;
                output.rotation = crtc->rotation;

                // Mode names are packed back to back in mode order
                const uint8_t* name = names;
                for(int m = 0; m < numModes; name += modes[m].name_len, ++m)
                {
                    if(modes[m].id != crtc->mode)
                        continue;
                    output.mode.assign(reinterpret_cast<const char*>(name), modes[m].name_len);
                    output.rate = mode_refresh_rate(modes[m]);
                    break;
                }
            }
            free(crtc);
        }
        free(info);

        Debug::log(TRACE, "output %s: %s %ux%u+%d+%d mode %s", output.name.c_str(), output.active ? "active" : "inactive",
                   output.width, output.height, output.x, output.y, output.mode.c_str());
        layout.outputs.push_back(output);
    }
    free(res);
    return true;
}

bool query_split_trees(xcb_connection_t* c, xcb_screen_t* screen, DisplayLayout& layout)
{
    xcb_randr_get_monitors_reply_t* monitors = xcb_randr_get_monitors_reply(c, xcb_randr_get_monitors(c, screen->root, 1), NULL);
    if(!monitors)
    {
        Debug::log(WARN, "the X server did not answer RRGetMonitors");
        return false;
    }

    // Leaf index and area of every virtual monitor, per output
    std::map<std::string, std::vector<std::pair<unsigned long, Rect>>> regions;
    for(auto it = xcb_randr_get_monitors_monitors_iterator(monitors); it.rem; xcb_randr_monitor_info_next(&it))
    {
        const std::string name = atom_name(c, it.data->name);
        const std::string parent = virtual_monitor_parent(name);
        if(parent.empty())
            continue;
        const unsigned long index = strtoul(name.c_str() + parent.size() + 1, nullptr, 10);
        regions[parent].push_back(std::make_pair(index, Rect(it.data->x, it.data->y, it.data->width, it.data->height)));
    }
    free(monitors);

    for(auto& entry : regions)
    {
        OutputLayout* output = layout.find(entry.first);
        if(!output || !output->active)
        {
            Debug::log(TRACE, "virtual monitors of %s ignored, the output is not active", entry.first.c_str());
            continue;
        }
        std::sort(entry.second.begin(), entry.second.end(),
                  [](std::pair<unsigned long, Rect> const& a, std::pair<unsigned long, Rect> const& b) { return a.first < b.first; });
        std::vector<Rect> leaves;
        for(const auto& region : entry.second)
            leaves.push_back(Rect(region.second.x - output->x, region.second.y - output->y, region.second.width,
                                  region.second.height));
        output->tree = split_tree_from_regions(leaves, output->width, output->height);
        Debug::log(TRACE, "%s is currently split as %s", output->name.c_str(), output->tree.toString().c_str());
    }
    return true;
}

} // namespace splitrandr
