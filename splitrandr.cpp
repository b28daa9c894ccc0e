/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt

    Command-line front end: reads the current topology, lays the given split
    trees over the named outputs and applies the result with the window
    manager frozen.
*/

#include <getopt.h>
#include <stdio.h>
#include <stdlib.h>
#include <xcb/xcb.h>
#include <string>

#include "coordinator.h"
#include "display-commands.h"
#include "display-query.h"
#include "log.h"
#include "paths.h"
#include "process-control.h"
#include "split-tree.h"

#ifndef SPLITRANDR_PRELOAD_PATH
#define SPLITRANDR_PRELOAD_PATH "libsplitrandr-preload.so"
#endif

using namespace splitrandr;

namespace
{

enum ExitCode
{
    EXIT_OK = 0,
    EXIT_APPLY_FAILED = 1,
    EXIT_USAGE = 2,
    EXIT_DISPLAY = 3
};

void usage(FILE* out, const char* argv0)
{
    fprintf(out,
            "Usage: %s [OPTION]... OUTPUT=TREE...\n"
            "Split outputs into virtual monitors the window manager treats as real ones.\n"
            "\n"
            "TREE is N for an unsplit output, V<p>(<tree>,<tree>) for a left/right split\n"
            "at proportion p of the width, H<p>(<tree>,<tree>) for a top/bottom split,\n"
            "e.g. DP-1='V0.6(N,H0.4(N,N))'. Outputs not named keep their current splits.\n"
            "\n"
            "  -w, --wm NAME              window manager process to freeze (default cinnamon)\n"
            "  -p, --preload PATH         preload library (default %s)\n"
            "  -c, --config PATH          binary configuration file\n"
            "  -m, --monitors-xml PATH    display persistence file\n"
            "  -t, --settle-timeout MS    bound for every wait on the window manager\n"
            "  -n, --no-restart           never restart the window manager\n"
            "  -d, --dry-run              print what would be done\n"
            "  -v, --verbose              trace every step\n"
            "  -h, --help                 show this help\n",
            argv0, SPLITRANDR_PRELOAD_PATH);
}

bool parse_timeout(const char* text, unsigned& value)
{
    char* end;
    const unsigned long parsed = strtoul(text, &end, 10);
    if(!*text || *end || parsed > 600000)
        return false;
    value = parsed;
    return true;
}

bool apply_argument(std::string const& arg, DisplayLayout& layout)
{
    const auto eq = arg.find('=');
    if(eq == std::string::npos || eq == 0)
    {
        Debug::log(ERR, "expected OUTPUT=TREE, got '%s'", arg.c_str());
        return false;
    }
    const std::string name = arg.substr(0, eq);
    OutputLayout* output = layout.find(name);
    if(!output)
    {
        Debug::log(ERR, "no connected output named %s", name.c_str());
        return false;
    }
    if(!output->active)
    {
        Debug::log(ERR, "%s is not active, enable it before splitting it", name.c_str());
        return false;
    }
    SplitTree tree;
    if(!parse_split_tree(arg.substr(eq + 1), tree))
    {
        Debug::log(ERR, "cannot parse split tree '%s'", arg.substr(eq + 1).c_str());
        return false;
    }
    if(tree.leafCount() > output->width || tree.leafCount() > output->height)
    {
        Debug::log(ERR, "%s is too small for %u regions", name.c_str(), tree.leafCount());
        return false;
    }
    output->tree = tree;
    return true;
}

void print_plan(DisplayLayout const& layout, CoordinatorOptions const& options)
{
    printf("freeze %s\n", options.windowManager.c_str());
    printf("xrandr");
    for(const auto& arg : topology_arguments(layout))
        printf(" %s", arg.c_str());
    printf("\n");
    for(const auto& output : layout.outputs)
        for(const auto& monitor : virtual_monitors(output))
            printf("xrandr --setmonitor %s %s %s\n", monitor.name.c_str(), monitor.geometry.c_str(), monitor.owner.c_str());
    const auto configs = split_configs(layout);
    if(configs.empty())
        printf("remove %s\n", options.configPath.c_str());
    for(const auto& config : configs)
        printf("write %s: %s %ux%u %s\n", options.configPath.c_str(), config.name.c_str(), config.width, config.height,
               config.tree.toString().c_str());
    printf("resume %s\n", options.windowManager.c_str());
    printf("write %s\n", options.monitorsXmlPath.c_str());
}

} // namespace

int main(int argc, char** argv)
{
    Debug::init("splitrandr");

    CoordinatorOptions options;
    options.configPath = binary_config_path();
    options.monitorsXmlPath = monitors_xml_path();
    const char* preloadEnv = getenv("SPLITRANDR_PRELOAD");
    options.preloadLibrary = preloadEnv && *preloadEnv ? preloadEnv : SPLITRANDR_PRELOAD_PATH;
    bool dryRun = false;

    static const struct option longOptions[] = {
        {"wm",             required_argument, nullptr, 'w'},
        {"preload",        required_argument, nullptr, 'p'},
        {"config",         required_argument, nullptr, 'c'},
        {"monitors-xml",   required_argument, nullptr, 'm'},
        {"settle-timeout", required_argument, nullptr, 't'},
        {"no-restart",     no_argument,       nullptr, 'n'},
        {"dry-run",        no_argument,       nullptr, 'd'},
        {"verbose",        no_argument,       nullptr, 'v'},
        {"help",           no_argument,       nullptr, 'h'},
        {nullptr,          0,                 nullptr, 0}
    };

    int opt;
    while((opt = getopt_long(argc, argv, "w:p:c:m:t:ndvh", longOptions, nullptr)) != -1)
    {
        switch(opt)
        {
        case 'w': options.windowManager = optarg; break;
        case 'p': options.preloadLibrary = optarg; break;
        case 'c': options.configPath = optarg; break;
        case 'm': options.monitorsXmlPath = optarg; break;
        case 't':
            if(!parse_timeout(optarg, options.settleTimeoutMs))
            {
                Debug::log(ERR, "invalid settle timeout '%s'", optarg);
                return EXIT_USAGE;
            }
            break;
        case 'n': options.restartDetached = false; break;
        case 'd': dryRun = true; break;
        case 'v': Debug::setTrace(true); break;
        case 'h': usage(stdout, argv[0]); return EXIT_OK;
        default:  usage(stderr, argv[0]); return EXIT_USAGE;
        }
    }
    if(optind == argc)
    {
        usage(stderr, argv[0]);
        return EXIT_USAGE;
    }

    int screenNumber = 0;
    xcb_connection_t* c = xcb_connect(nullptr, &screenNumber);
    if(xcb_connection_has_error(c))
    {
        Debug::log(ERR, "cannot connect to the X server");
        xcb_disconnect(c);
        return EXIT_DISPLAY;
    }
    xcb_screen_iterator_t screens = xcb_setup_roots_iterator(xcb_get_setup(c));
    for(int i = 0; i < screenNumber && screens.rem; ++i)
        xcb_screen_next(&screens);

    DisplayLayout layout;
    const bool queried = screens.rem && query_display_layout(c, screens.data, layout);
    if(queried && !query_split_trees(c, screens.data, layout))
        Debug::log(WARN, "cannot read existing virtual monitors, outputs not named are left unsplit");
    xcb_disconnect(c);
    if(!queried)
        return EXIT_DISPLAY;

    for(int i = optind; i < argc; ++i)
        if(!apply_argument(argv[i], layout))
            return EXIT_USAGE;
    layout.fitScreen();

    if(dryRun)
    {
        print_plan(layout, options);
        return EXIT_OK;
    }

    SystemProcessControl processes;
    XrandrCommands display;
    Coordinator coordinator(processes, display, options);
    const ApplyResult result = coordinator.apply(layout);
    if(result != ApplyResult::Ok)
    {
        Debug::log(ERR, "%s (stopped at: %s)", apply_result_name(result), coordinator_state_name(coordinator.state()));
        return EXIT_APPLY_FAILED;
    }
    Debug::log(LOG, "done");
    return EXIT_OK;
}
