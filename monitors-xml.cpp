/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt
*/

#include <stdio.h>

#include "edid.h"
#include "log.h"
#include "monitors-xml.h"
#include "paths.h"

namespace splitrandr
{

namespace
{

std::string escape(std::string const& text)
{
    std::string out;
    for(char c : text)
    {
        switch(c)
        {
        case '&':  out += "&amp;"; break;
        case '<':  out += "&lt;"; break;
        case '>':  out += "&gt;"; break;
        case '"':  out += "&quot;"; break;
        case '\'': out += "&apos;"; break;
        default:   out += c;
        }
    }
    return out;
}

struct LogicalMonitor
{
    std::string     connector;
    MonitorIdentity identity;
    Rect            area;
    double          rate;
    bool            primary;
};

void append_logical_monitor(std::string& xml, LogicalMonitor const& monitor)
{
    char buf[512];
    snprintf(buf, sizeof buf,
             "    <logicalmonitor>\n"
             "      <x>%d</x>\n"
             "      <y>%d</y>\n"
             "      <scale>1</scale>\n",
             monitor.area.x, monitor.area.y);
    xml += buf;
    if(monitor.primary)
        xml += "      <primary>yes</primary>\n";
    xml += "      <monitor>\n"
           "        <monitorspec>\n";
    xml += "          <connector>" + escape(monitor.connector) + "</connector>\n";
    xml += "          <vendor>" + escape(monitor.identity.vendor) + "</vendor>\n";
    xml += "          <product>" + escape(monitor.identity.product) + "</product>\n";
    xml += "          <serial>" + escape(monitor.identity.serial) + "</serial>\n";
    snprintf(buf, sizeof buf,
             "        </monitorspec>\n"
             "        <mode>\n"
             "          <width>%u</width>\n"
             "          <height>%u</height>\n"
             "          <rate>%.3f</rate>\n"
             "        </mode>\n"
             "      </monitor>\n"
             "    </logicalmonitor>\n",
             monitor.area.width, monitor.area.height, monitor.rate);
    xml += buf;
}

LogicalMonitor real_monitor(OutputLayout const& output)
{
    LogicalMonitor monitor;
    monitor.connector = output.name;
    monitor.identity = parse_monitor_identity(output.edidHex);
    monitor.area = Rect(output.x, output.y, output.width, output.height);
    monitor.rate = output.rate > 0 ? output.rate : 60.0;
    monitor.primary = output.primary;
    return monitor;
}

} // namespace

std::string monitors_xml(DisplayLayout const& layout)
{
    std::string xml = "<monitors version=\"2\">\n";

    xml += "  <configuration>\n";
    for(const auto& output : layout.outputs)
    {
        if(!output.active)
            continue;
        if(output.tree.isLeaf())
        {
            append_logical_monitor(xml, real_monitor(output));
            continue;
        }
        for(const auto& virt : virtual_monitors(output))
        {
            LogicalMonitor monitor;
            monitor.connector = virt.name;
            monitor.area = virt.area;
            monitor.rate = output.rate > 0 ? output.rate : 60.0;
            monitor.primary = false;
            append_logical_monitor(xml, monitor);
        }
    }
    xml += "  </configuration>\n";

    xml += "  <configuration>\n";
    for(const auto& output : layout.outputs)
        if(output.active)
            append_logical_monitor(xml, real_monitor(output));
    xml += "  </configuration>\n";

    xml += "</monitors>\n";
    return xml;
}

bool write_monitors_xml(std::string const& path, DisplayLayout const& layout)
{
    const std::string xml = monitors_xml(layout);
    if(!write_file_atomically(path, xml.data(), xml.size()))
        return false;
    Debug::log(LOG, "wrote %s", path.c_str());
    return true;
}

} // namespace splitrandr
