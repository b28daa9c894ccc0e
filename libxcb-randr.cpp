/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt

    Interposes the libxcb-randr calls some window managers issue directly
    instead of going through libXrandr: CRTC configuration, CRTC transform and
    output property changes. Requests aimed at fake CRTCs or outputs are
    answered locally; everything else is passed on unchanged.

    Other libxcb-randr calls are deliberately left alone, so a client
    enumerating resources over xcb sees the real, unsplit topology.
*/

#include <stdlib.h>
#include <xcb/xcb.h>
#include <xcb/randr.h>

#include "dispatch.h"
#include "engine.h"
#include "fake-cookies.h"
#include "log.h"

#define SPLITRANDR_XCB_RANDR_HOOKS(X)            \
    X(xcb_randr_set_crtc_config)                 \
    X(xcb_randr_set_crtc_config_unchecked)       \
    X(xcb_randr_set_crtc_config_reply)           \
    X(xcb_randr_set_crtc_transform)              \
    X(xcb_randr_set_crtc_transform_checked)      \
    X(xcb_randr_change_output_property)          \
    X(xcb_randr_change_output_property_checked)

namespace splitrandr
{

namespace
{

struct XcbRandrDispatch
{
    SPLITRANDR_XCB_RANDR_HOOKS(SPLITRANDR_DECLARE_REAL)
};

XcbRandrDispatch realXcbRandr;
bool             xcbRandrResolved = false;

XcbRandrDispatch const& real()
{
    if(!xcbRandrResolved)
        resolve_xcb_randr_dispatch();
    return realXcbRandr;
}

/*
    A fake CRTC configuration still needs a sequence number the caller can
    wait on. A GetInputFocus round trip provides one without side effects;
    its reply is swallowed by xcb_randr_set_crtc_config_reply, which answers
    with the status remembered here.
*/
FakeReplyCookies fake_config_cookies;

uint8_t apply_fake_crtc_config(xcb_randr_crtc_t crtc, int16_t x, int16_t y, xcb_randr_mode_t mode, uint16_t rotation)
{
    const auto table = Engine::instance().table();
    if(!table || !table->updateCrtc(crtc, x, y, mode, rotation))
    {
        Debug::log(TRACE, "xcb set config on stale fake crtc 0x%08x", crtc);
        return XCB_RANDR_SET_CONFIG_FAILED;
    }
    Debug::log(TRACE, "xcb fake crtc 0x%08x now at %d,%d mode 0x%08x", crtc, x, y, mode);
    return XCB_RANDR_SET_CONFIG_SUCCESS;
}

xcb_randr_set_crtc_config_cookie_t fake_config_cookie(xcb_connection_t* c, bool checked, uint8_t status)
{
    const auto focus = checked ? xcb_get_input_focus(c) : xcb_get_input_focus_unchecked(c);
    fake_config_cookies.remember(c, focus.sequence, status);
    xcb_randr_set_crtc_config_cookie_t cookie;
    cookie.sequence = focus.sequence;
    return cookie;
}

} // namespace

bool resolve_xcb_randr_dispatch()
{
    auto& table = realXcbRandr;
    bool ok = true;
    SPLITRANDR_XCB_RANDR_HOOKS(SPLITRANDR_RESOLVE_REAL)
    xcbRandrResolved = true;
    return ok;
}

} // namespace splitrandr

using namespace splitrandr;

/*
    Overridden library functions
*/

extern "C"
{

// --------------------- CRTC config ---------------------------
xcb_randr_set_crtc_config_cookie_t xcb_randr_set_crtc_config(xcb_connection_t* c, xcb_randr_crtc_t crtc, xcb_timestamp_t timestamp,
                                                             xcb_timestamp_t config_timestamp, int16_t x, int16_t y,
                                                             xcb_randr_mode_t mode, uint16_t rotation, uint32_t outputs_len,
                                                             const xcb_randr_output_t* outputs)
{
    if(is_fake(crtc))
        return fake_config_cookie(c, true, apply_fake_crtc_config(crtc, x, y, mode, rotation));
    return real().xcb_randr_set_crtc_config(c, crtc, timestamp, config_timestamp, x, y, mode, rotation, outputs_len, outputs);
}

xcb_randr_set_crtc_config_cookie_t xcb_randr_set_crtc_config_unchecked(xcb_connection_t* c, xcb_randr_crtc_t crtc,
                                                                       xcb_timestamp_t timestamp, xcb_timestamp_t config_timestamp,
                                                                       int16_t x, int16_t y, xcb_randr_mode_t mode, uint16_t rotation,
                                                                       uint32_t outputs_len, const xcb_randr_output_t* outputs)
{
    if(is_fake(crtc))
        return fake_config_cookie(c, false, apply_fake_crtc_config(crtc, x, y, mode, rotation));
    return real().xcb_randr_set_crtc_config_unchecked(c, crtc, timestamp, config_timestamp, x, y, mode, rotation, outputs_len,
                                                      outputs);
}

xcb_randr_set_crtc_config_reply_t* xcb_randr_set_crtc_config_reply(xcb_connection_t* c, xcb_randr_set_crtc_config_cookie_t cookie,
                                                                   xcb_generic_error_t** e)
{
    uint8_t status;
    if(!fake_config_cookies.take(c, cookie.sequence, status))
        return real().xcb_randr_set_crtc_config_reply(c, cookie, e);

    xcb_get_input_focus_cookie_t focusCookie;
    focusCookie.sequence = cookie.sequence;
    free(xcb_get_input_focus_reply(c, focusCookie, e));
    if(e && *e)
    {
        // The connection is broken; report that rather than a fabricated success
        return nullptr;
    }

    const auto p = static_cast<xcb_randr_set_crtc_config_reply_t*>(calloc(1, sizeof(xcb_randr_set_crtc_config_reply_t)));
    if(!p)
        return nullptr;
    p->response_type = 1; // X_Reply
    p->status = status;
    p->sequence = cookie.sequence;
    p->timestamp = XCB_CURRENT_TIME;
    return p;
}

// --------------------- CRTC transform ---------------------------
xcb_void_cookie_t xcb_randr_set_crtc_transform(xcb_connection_t* c, xcb_randr_crtc_t crtc, xcb_render_transform_t transform,
                                               uint16_t filter_len, const char* filter_name, uint32_t filter_params_len,
                                               const xcb_render_fixed_t* filter_params)
{
    if(is_fake(crtc))
        return xcb_no_operation(c);
    return real().xcb_randr_set_crtc_transform(c, crtc, transform, filter_len, filter_name, filter_params_len, filter_params);
}

xcb_void_cookie_t xcb_randr_set_crtc_transform_checked(xcb_connection_t* c, xcb_randr_crtc_t crtc, xcb_render_transform_t transform,
                                                       uint16_t filter_len, const char* filter_name, uint32_t filter_params_len,
                                                       const xcb_render_fixed_t* filter_params)
{
    if(is_fake(crtc))
        return xcb_no_operation_checked(c);
    return real().xcb_randr_set_crtc_transform_checked(c, crtc, transform, filter_len, filter_name, filter_params_len,
                                                       filter_params);
}

// --------------------- Output properties ---------------------------
xcb_void_cookie_t xcb_randr_change_output_property(xcb_connection_t* c, xcb_randr_output_t output, xcb_atom_t property,
                                                   xcb_atom_t type, uint8_t format, uint8_t mode, uint32_t num_units,
                                                   const void* data)
{
    // Fake outputs have no properties to change
    if(is_fake(output))
        return xcb_no_operation(c);
    return real().xcb_randr_change_output_property(c, output, property, type, format, mode, num_units, data);
}

xcb_void_cookie_t xcb_randr_change_output_property_checked(xcb_connection_t* c, xcb_randr_output_t output, xcb_atom_t property,
                                                           xcb_atom_t type, uint8_t format, uint8_t mode, uint32_t num_units,
                                                           const void* data)
{
    if(is_fake(output))
        return xcb_no_operation_checked(c);
    return real().xcb_randr_change_output_property_checked(c, output, property, type, format, mode, num_units, data);
}

} // extern "C"
