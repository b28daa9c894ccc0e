/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt

    Interposes the libXrandr calls a window manager uses to enumerate and
    configure outputs. Every split output gets one fake output, CRTC and mode
    per region, appended to the real resources.
*/

#include <stdlib.h>
#include <string.h>
#include <X11/Xlib.h>
#include <X11/extensions/Xrandr.h>
#include <algorithm>
#include <string>
#include <vector>

#include "dispatch.h"
#include "edid.h"
#include "engine.h"
#include "log.h"

#define SPLITRANDR_XRANDR_HOOKS(X)   \
    X(XRRGetScreenResources)         \
    X(XRRGetScreenResourcesCurrent)  \
    X(XRRGetOutputInfo)              \
    X(XRRGetCrtcInfo)                \
    X(XRRSetCrtcConfig)              \
    X(XRRGetOutputProperty)          \
    X(XRRListOutputProperties)       \
    X(XRRQueryOutputProperty)        \
    X(XSetErrorHandler)

namespace splitrandr
{

namespace
{

struct XrandrDispatch
{
    SPLITRANDR_XRANDR_HOOKS(SPLITRANDR_DECLARE_REAL)
};

XrandrDispatch realXrandr;
bool           xrandrResolved = false;

XrandrDispatch const& real()
{
    if(!xrandrResolved)
        resolve_xrandr_dispatch();
    return realXrandr;
}

/*
    Snapshot of the real outputs

    Only connected outputs with an active CRTC can be split. The EDID is
    read through the real property call, never through our own hook.
*/

std::string output_edid(Display* dpy, RROutput output)
{
    const Atom edidAtom = XInternAtom(dpy, RR_PROPERTY_RANDR_EDID, True);
    if(edidAtom == None || !real().XRRGetOutputProperty)
        return std::string();

    Atom actualType = None;
    int actualFormat = 0;
    unsigned long nitems = 0, bytesAfter = 0;
    unsigned char* prop = nullptr;
    if(real().XRRGetOutputProperty(dpy, output, edidAtom, 0, 384, False, False, AnyPropertyType, &actualType,
                                   &actualFormat, &nitems, &bytesAfter, &prop) != Success)
        return std::string();

    std::string hex;
    // EDID is an 8-bit property, so nitems is the byte count
    if(prop && actualFormat == 8 && nitems > 0)
        hex = edid_to_hex(prop, nitems);
    if(prop)
        XFree(prop);
    return hex;
}

const XRRModeInfo* find_mode(XRRScreenResources const& res, RRMode id)
{
    for(int i = 0; i < res.nmode; ++i)
        if(res.modes[i].id == id)
            return &res.modes[i];
    return nullptr;
}

std::vector<RealOutputState> real_outputs(Display* dpy, XRRScreenResources* res)
{
    std::vector<RealOutputState> outputs;
    for(int i = 0; i < res->noutput; ++i)
    {
        XRROutputInfo* const info = real().XRRGetOutputInfo(dpy, res, res->outputs[i]);
        if(!info)
            continue;

        RealOutputState state;
        state.output = res->outputs[i];
        state.name.assign(info->name, info->nameLen);
        state.mmWidth = info->mm_width;
        state.mmHeight = info->mm_height;
        state.subpixelOrder = info->subpixel_order;
        if(info->connection == RR_Connected && info->crtc)
        {
            XRRCrtcInfo* const crtc = real().XRRGetCrtcInfo(dpy, res, info->crtc);
            if(crtc && crtc->mode)
            {
                state.crtc = info->crtc;
                state.crtcX = crtc->x;
                state.crtcY = crtc->y;
                state.crtcWidth = crtc->width;
                state.crtcHeight = crtc->height;
                state.mode = crtc->mode;
                state.rotation = crtc->rotation;
                state.rotations = crtc->rotations;
            }
            if(crtc)
                XRRFreeCrtcInfo(crtc);
        }
        XRRFreeOutputInfo(info);
        if(!state.crtc)
            continue;

        if(const auto* const mode = find_mode(*res, state.mode))
        {
            state.timing.dotClock = mode->dotClock;
            state.timing.hSyncStart = mode->hSyncStart;
            state.timing.hSyncEnd = mode->hSyncEnd;
            state.timing.hTotal = mode->hTotal;
            state.timing.hSkew = mode->hSkew;
            state.timing.vSyncStart = mode->vSyncStart;
            state.timing.vSyncEnd = mode->vSyncEnd;
            state.timing.vTotal = mode->vTotal;
            state.timing.modeFlags = mode->modeFlags;
        }
        state.edidHex = output_edid(dpy, state.output);
        outputs.push_back(std::move(state));
    }
    return outputs;
}

/*
    Reply construction

    libXrandr allocates every reply as one block with the variable-length
    arrays behind the fixed part, and the XRRFree* functions release it with
    a single free(). The fake replies follow the same layout.
*/

XRRScreenResources* make_screen_resources(XRRScreenResources const& orig, FakeTable const& table)
{
    const int ncrtc = orig.ncrtc + table.crtcs.size();
    const int noutput = orig.noutput + table.outputs.size();
    const int nmode = orig.nmode + table.modes.size();

    size_t namesLen = 0;
    for(int i = 0; i < orig.nmode; ++i)
        namesLen += orig.modes[i].nameLength + 1;
    for(const auto& mode : table.modes)
        namesLen += mode.name.size() + 1;

    const size_t size = sizeof(XRRScreenResources) + nmode * sizeof(XRRModeInfo) + ncrtc * sizeof(RRCrtc) +
                        noutput * sizeof(RROutput) + namesLen;
    auto* const p = static_cast<XRRScreenResources*>(malloc(size));
    if(!p)
        return nullptr;

    // Copy fixed-size part
    *p = orig;
    p->ncrtc = ncrtc;
    p->noutput = noutput;
    p->nmode = nmode;
    p->modes = reinterpret_cast<XRRModeInfo*>(p + 1);
    p->crtcs = reinterpret_cast<RRCrtc*>(p->modes + nmode);
    p->outputs = reinterpret_cast<RROutput*>(p->crtcs + ncrtc);
    char* names = reinterpret_cast<char*>(p->outputs + noutput);

    // Now fill in the variable-length data
    std::copy_n(orig.crtcs, orig.ncrtc, p->crtcs);
    int i = orig.ncrtc;
    for(const auto& crtc : table.crtcs)
        p->crtcs[i++] = crtc.xid;

    std::copy_n(orig.outputs, orig.noutput, p->outputs);
    i = orig.noutput;
    for(const auto& output : table.outputs)
        p->outputs[i++] = output.xid;

    for(i = 0; i < orig.nmode; ++i)
    {
        p->modes[i] = orig.modes[i];
        p->modes[i].name = names;
        memcpy(names, orig.modes[i].name, orig.modes[i].nameLength);
        names[orig.modes[i].nameLength] = 0;
        names += orig.modes[i].nameLength + 1;
    }
    for(const auto& mode : table.modes)
    {
        XRRModeInfo& info = p->modes[i++];
        info.id = mode.xid;
        info.width = mode.width;
        info.height = mode.height;
        info.dotClock = mode.timing.dotClock;
        info.hSyncStart = mode.timing.hSyncStart;
        info.hSyncEnd = mode.timing.hSyncEnd;
        info.hTotal = mode.timing.hTotal;
        info.hSkew = mode.timing.hSkew;
        info.vSyncStart = mode.timing.vSyncStart;
        info.vSyncEnd = mode.timing.vSyncEnd;
        info.vTotal = mode.timing.vTotal;
        info.modeFlags = mode.timing.modeFlags;
        info.nameLength = mode.name.size();
        info.name = names;
        memcpy(names, mode.name.c_str(), mode.name.size() + 1);
        names += mode.name.size() + 1;
    }
    return p;
}

XRROutputInfo* make_output_info(FakeOutputRecord const& output, Time timestamp)
{
    const size_t size = sizeof(XRROutputInfo) + sizeof(RRCrtc) + sizeof(RRMode) + output.name.size() + 1;
    auto* const p = static_cast<XRROutputInfo*>(malloc(size));
    if(!p)
        return nullptr;

    p->timestamp = timestamp;
    p->crtc = output.crtc;
    p->mm_width = output.mmWidth;
    p->mm_height = output.mmHeight;
    p->connection = RR_Connected;
    p->subpixel_order = output.subpixelOrder;
    p->ncrtc = 1;
    p->crtcs = reinterpret_cast<RRCrtc*>(p + 1);
    p->crtcs[0] = output.crtc;
    p->nclone = 0;
    p->clones = nullptr;
    p->nmode = 1;
    p->npreferred = 1;
    p->modes = reinterpret_cast<RRMode*>(p->crtcs + 1);
    p->modes[0] = output.mode;
    p->nameLen = output.name.size();
    p->name = reinterpret_cast<char*>(p->modes + 1);
    memcpy(p->name, output.name.c_str(), output.name.size() + 1);
    return p;
}

XRRCrtcInfo* make_crtc_info(FakeCrtcRecord const& crtc, Time timestamp)
{
    const size_t size = sizeof(XRRCrtcInfo) + 2 * sizeof(RROutput);
    auto* const p = static_cast<XRRCrtcInfo*>(malloc(size));
    if(!p)
        return nullptr;

    const bool enabled = crtc.mode != 0;
    p->timestamp = timestamp;
    p->x = crtc.x;
    p->y = crtc.y;
    p->width = enabled ? crtc.width : 0;
    p->height = enabled ? crtc.height : 0;
    p->mode = crtc.mode;
    p->rotation = crtc.rotation;
    p->rotations = crtc.rotations;
    p->outputs = reinterpret_cast<RROutput*>(p + 1);
    p->noutput = enabled ? 1 : 0;
    p->outputs[0] = crtc.output;
    p->possible = p->outputs + 1;
    p->npossible = 1;
    p->possible[0] = crtc.output;
    return p;
}

XRRScreenResources* augment_resources(Display* dpy, XRRScreenResources* res)
{
    if(!res)
        return res;

    auto& engine = Engine::instance();
    engine.pollConfig();
    if(!engine.wantsSplits())
    {
        engine.clear();
        return res;
    }

    const auto table = engine.refresh(real_outputs(dpy, res));
    if(!table || table->empty())
        return res;

    XRRScreenResources* const fake = make_screen_resources(*res, *table);
    if(!fake)
        return res;
    XRRFreeScreenResources(res);
    return fake;
}

/*
    Error filter

    A fake id that reaches the server through a call this library does not
    intercept comes back as BadOutput, BadCrtc or BadMode. Those errors are
    dropped; everything else goes to the handler the application installed.
*/

XErrorHandler appErrorHandler = nullptr;
XErrorHandler defaultErrorHandler = nullptr;
bool          errorFilterInstalled = false;

int filter_errors(Display* dpy, XErrorEvent* event)
{
    if(is_fake(event->resourceid))
    {
        Debug::log(TRACE, "dropped X error %d (request %d.%d) for fake resource 0x%08lx", event->error_code,
                   event->request_code, event->minor_code, event->resourceid);
        return 0;
    }
    if(appErrorHandler)
        return appErrorHandler(dpy, event);
    return 0;
}

} // namespace

bool resolve_xrandr_dispatch()
{
    auto& table = realXrandr;
    bool ok = true;
    SPLITRANDR_XRANDR_HOOKS(SPLITRANDR_RESOLVE_REAL)
    xrandrResolved = true;
    return ok;
}

void install_error_filter()
{
    if(errorFilterInstalled || !real().XSetErrorHandler)
        return;
    defaultErrorHandler = appErrorHandler = real().XSetErrorHandler(filter_errors);
    errorFilterInstalled = true;
}

} // namespace splitrandr

using namespace splitrandr;

/*
    Overridden library functions
*/

extern "C"
{

XRRScreenResources* XRRGetScreenResources(Display* dpy, Window window)
{
    if(!real().XRRGetScreenResources)
        return nullptr;
    return augment_resources(dpy, real().XRRGetScreenResources(dpy, window));
}

XRRScreenResources* XRRGetScreenResourcesCurrent(Display* dpy, Window window)
{
    if(!real().XRRGetScreenResourcesCurrent)
        return nullptr;
    return augment_resources(dpy, real().XRRGetScreenResourcesCurrent(dpy, window));
}

// --------------------- Output info ---------------------------
XRROutputInfo* XRRGetOutputInfo(Display* dpy, XRRScreenResources* resources, RROutput output)
{
    const auto table = Engine::instance().table();
    if(is_fake(output))
    {
        const auto* const record = table ? table->findOutput(output) : nullptr;
        if(!record)
        {
            Debug::log(TRACE, "output info for stale fake output 0x%08lx", output);
            return nullptr;
        }
        return make_output_info(*record, resources ? resources->timestamp : CurrentTime);
    }

    if(!real().XRRGetOutputInfo)
        return nullptr;
    XRROutputInfo* const info = real().XRRGetOutputInfo(dpy, resources, output);
    if(info && table && table->isSplitOutput(output))
    {
        // This output is split into fake ones. Make it look disconnected.
        info->connection = RR_Disconnected;
    }
    return info;
}

// --------------------- CRTC info ---------------------------
XRRCrtcInfo* XRRGetCrtcInfo(Display* dpy, XRRScreenResources* resources, RRCrtc crtc)
{
    const auto table = Engine::instance().table();
    if(is_fake(crtc))
    {
        const auto* const record = table ? table->findCrtc(crtc) : nullptr;
        if(!record)
        {
            Debug::log(TRACE, "crtc info for stale fake crtc 0x%08lx", crtc);
            return nullptr;
        }
        return make_crtc_info(*record, resources ? resources->timestamp : CurrentTime);
    }

    if(!real().XRRGetCrtcInfo)
        return nullptr;
    XRRCrtcInfo* const info = real().XRRGetCrtcInfo(dpy, resources, crtc);
    if(info && table && table->isSplitCrtc(crtc))
    {
        // This CRTC drives a split output. Hide its current mode.
        info->mode = None;
        info->x = info->y = 0;
        info->width = info->height = 0;
    }
    return info;
}

Status XRRSetCrtcConfig(Display* dpy, XRRScreenResources* resources, RRCrtc crtc, Time timestamp, int x, int y,
                        RRMode mode, Rotation rotation, RROutput* outputs, int noutputs)
{
    if(is_fake(crtc))
    {
        const auto table = Engine::instance().table();
        if(!table || !table->updateCrtc(crtc, x, y, mode, rotation))
        {
            Debug::log(TRACE, "set config on stale fake crtc 0x%08lx", crtc);
            return RRSetConfigFailed;
        }
        Debug::log(TRACE, "fake crtc 0x%08lx now at %d,%d mode 0x%08lx", crtc, x, y, mode);
        return RRSetConfigSuccess;
    }
    if(!real().XRRSetCrtcConfig)
        return RRSetConfigFailed;
    return real().XRRSetCrtcConfig(dpy, resources, crtc, timestamp, x, y, mode, rotation, outputs, noutputs);
}

// --------------------- Output properties ---------------------------
int XRRGetOutputProperty(Display* dpy, RROutput output, Atom property, long offset, long length, Bool _delete,
                         Bool pending, Atom req_type, Atom* actual_type, int* actual_format, unsigned long* nitems,
                         unsigned long* bytes_after, unsigned char** prop)
{
    if(is_fake(output))
    {
        // Fake outputs have no identity of their own, report the property as absent
        *actual_type = None;
        *actual_format = 0;
        *nitems = 0;
        *bytes_after = 0;
        *prop = nullptr;
        return Success;
    }
    if(!real().XRRGetOutputProperty)
        return BadImplementation;
    return real().XRRGetOutputProperty(dpy, output, property, offset, length, _delete, pending, req_type, actual_type,
                                       actual_format, nitems, bytes_after, prop);
}

Atom* XRRListOutputProperties(Display* dpy, RROutput output, int* nprop)
{
    if(is_fake(output))
    {
        *nprop = 0;
        return nullptr;
    }
    if(!real().XRRListOutputProperties)
    {
        *nprop = 0;
        return nullptr;
    }
    return real().XRRListOutputProperties(dpy, output, nprop);
}

XRRPropertyInfo* XRRQueryOutputProperty(Display* dpy, RROutput output, Atom property)
{
    if(is_fake(output) || !real().XRRQueryOutputProperty)
        return nullptr;
    return real().XRRQueryOutputProperty(dpy, output, property);
}

// --------------------- Error handler ---------------------------
XErrorHandler XSetErrorHandler(XErrorHandler handler)
{
    if(!errorFilterInstalled)
    {
        if(!real().XSetErrorHandler)
            return nullptr;
        return real().XSetErrorHandler(handler);
    }
    const auto previous = appErrorHandler;
    appErrorHandler = handler ? handler : defaultErrorHandler;
    return previous;
}

} // extern "C"
