#include "x11_capture.h"

#include <mutex>
#include <optional>

#include <fmt/core.h>

#include "capture_error.h"
#include "logging_policy.h"
#include "pixel_decoder.h"

// Last, since Xlib defines macros like None, Status, Success and Bool.
#include <X11/Xatom.h>
#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <X11/extensions/Xrandr.h>

namespace snapmcp {

namespace {

auto const& x11_logger() {
    static const auto logger = make_logger("x11");
    return logger;
}

// Xlib's default error handler exits the process; log the error instead
// and let the failing call's return value carry it.
int log_x_error(Display* dpy, XErrorEvent* event) {
    char text[256] = {};
    XGetErrorText(dpy, event->error_code, text, sizeof(text));
    DEBUG(
        x11_logger(), "X error: {} (request {}, resource 0x{:x})",
        text, event->request_code, event->resourceid
    );
    return 0;
}

struct XFreeDeleter {
    void operator()(void* p) const { if (p) XFree(p); }
};

struct XImageDeleter {
    void operator()(XImage* image) const { if (image) XDestroyImage(image); }
};

using XImagePtr = std::unique_ptr<XImage, XImageDeleter>;

// Returns a format-32 property as a list (Xlib stores these as longs).
std::vector<unsigned long> get_longs(
    Display* dpy, Window win, Atom prop, Atom type, long max_items = 4096
) {
    Atom actual = 0;
    int format = 0;
    unsigned long items = 0, after = 0;
    unsigned char* data = nullptr;
    int const ret = XGetWindowProperty(
        dpy, win, prop, 0, max_items, False, type,
        &actual, &format, &items, &after, &data
    );
    std::unique_ptr<unsigned char, XFreeDeleter> const owned{data};
    if (ret != Success || !data || actual != type || format != 32) return {};
    auto const* longs = reinterpret_cast<unsigned long const*>(data);
    return {longs, longs + items};
}

// Returns a format-8 property as text, or {} if absent.
std::optional<std::string> get_text(
    Display* dpy, Window win, Atom prop, Atom type
) {
    Atom actual = 0;
    int format = 0;
    unsigned long items = 0, after = 0;
    unsigned char* data = nullptr;
    int const ret = XGetWindowProperty(
        dpy, win, prop, 0, 1024, False, type,
        &actual, &format, &items, &after, &data
    );
    std::unique_ptr<unsigned char, XFreeDeleter> const owned{data};
    if (ret != Success || !data || actual != type || format != 8) return {};
    return std::string(reinterpret_cast<char const*>(data), items);
}

// Scales a masked channel to 8 bits.
uint8_t channel(unsigned long pixel, unsigned long mask) {
    if (!mask) return 0;
    int shift = 0;
    while (!((mask >> shift) & 1)) ++shift;
    unsigned long const max = mask >> shift;
    return uint8_t(((pixel & mask) >> shift) * 255 / max);
}

DecodedImage decode_ximage(XImage* image) {
    XY<int> const size = {image->width, image->height};
    if (
        image->bits_per_pixel == 32 && image->byte_order == LSBFirst &&
        image->red_mask == 0xFF0000 && image->green_mask == 0xFF00 &&
        image->blue_mask == 0xFF
    ) {
        return decode_pixels(
            reinterpret_cast<uint8_t const*>(image->data),
            size_t(image->bytes_per_line) * image->height,
            image->bytes_per_line, fourcc("XR24"), size
        );
    }

    // Other visuals (16-bit, big-endian servers) go pixel by pixel.
    DecodedImage out;
    out.size = size;
    out.rgba.resize(size_t(size.x) * size.y * 4);
    uint8_t* dest = out.rgba.data();
    for (int y = 0; y < size.y; ++y) {
        for (int x = 0; x < size.x; ++x) {
            unsigned long const pixel = XGetPixel(image, x, y);
            *dest++ = channel(pixel, image->red_mask);
            *dest++ = channel(pixel, image->green_mask);
            *dest++ = channel(pixel, image->blue_mask);
            *dest++ = 0xFF;
        }
    }
    return out;
}

class X11CaptureDef : public WindowCaptureBackend {
  public:
    X11CaptureDef(std::shared_ptr<UnixSystem> sys, std::string name)
        : sys(std::move(sys)), display_name(std::move(name)) {}

    virtual ~X11CaptureDef() final {
        if (dpy) XCloseDisplay(dpy);
    }

    virtual std::vector<CaptureOutput> list_outputs() final {
        std::scoped_lock const lock{mutex};
        std::vector<CaptureOutput> out;
        for (auto& monitor : monitors(display())) out.push_back(monitor.output);
        return out;
    }

    virtual DecodedImage capture_output(std::optional<uint32_t> id) final {
        std::scoped_lock const lock{mutex};
        auto* d = display();
        auto const found = monitors(d);
        auto const& monitor = find_monitor(found, id);
        auto const& output = monitor.output;
        return grab(
            d, monitor.root,
            desktop_region(output, {{0, 0}, output.size.as<int64_t>()})
        );
    }

    virtual DecodedImage capture_region(
        std::optional<uint32_t> id, Region const& region
    ) final {
        std::scoped_lock const lock{mutex};
        auto* d = display();
        auto const found = monitors(d);
        auto const& monitor = find_monitor(found, id);
        check_region(monitor.output, region);
        return grab(d, monitor.root, desktop_region(monitor.output, region));
    }

    virtual std::vector<CaptureWindow> list_windows() final {
        std::scoped_lock const lock{mutex};
        auto* d = display();
        auto const found = monitors(d);
        std::vector<CaptureWindow> out;
        for (int s = 0; s < ScreenCount(d); ++s) {
            for (auto const win : client_windows(d, RootWindow(d, s))) {
                auto window = describe_window(d, win, found);
                if (window) out.push_back(std::move(*window));
            }
        }
        DEBUG(x11_logger(), "Found {} windows", out.size());
        return out;
    }

    virtual DecodedImage capture_window(uint32_t id) final {
        std::scoped_lock const lock{mutex};
        auto* d = display();
        Window const win = id;
        XWindowAttributes attr = {};
        CHECK_CAPTURE(
            XGetWindowAttributes(d, win, &attr), CaptureErrc::not_found,
            "Window {} not found", id
        );
        CHECK_RUNTIME(
            attr.map_state == IsViewable,
            "Window {} is not visible (minimized or unmapped)", id
        );

        // Grab from the root, as shown on screen; parts of the window
        // past the screen edge have no pixels and are cut off.
        int x = 0, y = 0;
        Window child = 0;
        XTranslateCoordinates(d, win, attr.root, 0, 0, &x, &y, &child);
        Region const rect = {{x, y}, {attr.width, attr.height}};
        XY<int64_t> const screen_size = {
            WidthOfScreen(attr.screen), HeightOfScreen(attr.screen)
        };
        auto const visible = rect.clipped_to(screen_size);
        CHECK_RUNTIME(
            visible.size.x > 0 && visible.size.y > 0,
            "Window {} ({}) is entirely off screen", id, debug(rect)
        );
        if (visible != rect)
            DEBUG(x11_logger(), "Window {} clipped to {}", id, debug(visible));
        return grab(d, attr.root, visible);
    }

  private:
    struct Atoms {
        Atom client_list, wm_name, utf8_string, wm_pid;
        Atom wm_state, state_hidden, state_max_vert, state_max_horz;
    };

    // A monitor and the root window it shows part of.
    struct Monitor {
        CaptureOutput output;
        Window root = 0;
    };

    std::shared_ptr<UnixSystem> const sys;
    std::string const display_name;
    std::mutex mutex;
    Display* dpy = nullptr;
    Atoms atoms = {};

    Display* display() {
        if (dpy) return dpy;

        static std::once_flag handler_once;
        std::call_once(handler_once, [] { XSetErrorHandler(log_x_error); });

        auto const name = display_name.empty()
            ? sys->getenv("DISPLAY").value_or("") : display_name;
        CHECK_CAPTURE(
            !name.empty(), CaptureErrc::display_unavailable,
            "No X display to capture (DISPLAY is not set)"
        );
        dpy = XOpenDisplay(name.c_str());
        CHECK_CAPTURE(
            dpy, CaptureErrc::display_unavailable,
            "Cannot open X display \"{}\" (no X server or XWayland)", name
        );

        auto const intern = [&](char const* n) { return XInternAtom(dpy, n, False); };
        atoms.client_list = intern("_NET_CLIENT_LIST");
        atoms.wm_name = intern("_NET_WM_NAME");
        atoms.utf8_string = intern("UTF8_STRING");
        atoms.wm_pid = intern("_NET_WM_PID");
        atoms.wm_state = intern("_NET_WM_STATE");
        atoms.state_hidden = intern("_NET_WM_STATE_HIDDEN");
        atoms.state_max_vert = intern("_NET_WM_STATE_MAXIMIZED_VERT");
        atoms.state_max_horz = intern("_NET_WM_STATE_MAXIMIZED_HORZ");

        x11_logger()->info(
            "Opened X display \"{}\" ({} screen{})", DisplayString(dpy),
            ScreenCount(dpy), ScreenCount(dpy) == 1 ? "" : "s"
        );
        return dpy;
    }

    // RandR monitors of every screen; a screen without RandR monitors
    // (no RandR 1.5 on the server) counts as one monitor.
    std::vector<Monitor> monitors(Display* d) {
        std::vector<Monitor> out;
        for (int s = 0; s < ScreenCount(d); ++s) {
            Window const root = RootWindow(d, s);
            bool const default_screen = (s == DefaultScreen(d));

            int count = 0;
            auto* const infos = XRRGetMonitors(d, root, True, &count);
            for (int m = 0; m < count; ++m) {
                auto const& info = infos[m];
                Monitor monitor = {{}, root};
                auto& output = monitor.output;
                output.id = out.size();
                output.name = atom_name(d, info.name)
                    .value_or(fmt::format("Monitor {}", output.id));
                output.position = {info.x, info.y};
                output.size = {info.width, info.height};
                output.is_primary = info.primary && default_screen;
                out.push_back(std::move(monitor));
            }
            if (infos) XRRFreeMonitors(infos);

            if (count <= 0) {
                Monitor monitor = {{}, root};
                auto& output = monitor.output;
                output.id = out.size();
                output.name = fmt::format("Screen {}", s);
                output.size = {DisplayWidth(d, s), DisplayHeight(d, s)};
                output.is_primary = default_screen;
                out.push_back(std::move(monitor));
            }
        }
        TRACE(x11_logger(), "Found {} monitors", out.size());
        return out;
    }

    static Monitor const& find_monitor(
        std::vector<Monitor> const& found, std::optional<uint32_t> id
    ) {
        std::vector<CaptureOutput> outputs;
        for (auto const& monitor : found) outputs.push_back(monitor.output);
        return found[find_output(outputs, id).id];
    }

    static std::optional<std::string> atom_name(Display* d, Atom atom) {
        if (atom == None) return {};
        std::unique_ptr<char, XFreeDeleter> const name{XGetAtomName(d, atom)};
        if (!name || !*name) return {};
        return std::string(name.get());
    }

    // EWMH client list if the window manager keeps one, else the
    // viewable children of the root.
    std::vector<Window> client_windows(Display* d, Window root) {
        auto const clients = get_longs(d, root, atoms.client_list, XA_WINDOW);
        if (!clients.empty()) return {clients.begin(), clients.end()};

        Window root_ret = 0, parent_ret = 0;
        Window* children = nullptr;
        unsigned int count = 0;
        if (!XQueryTree(d, root, &root_ret, &parent_ret, &children, &count))
            return {};
        std::unique_ptr<Window, XFreeDeleter> const owned{children};

        std::vector<Window> out;
        for (unsigned int i = 0; i < count; ++i) {
            XWindowAttributes attr = {};
            if (!XGetWindowAttributes(d, children[i], &attr)) continue;
            if (attr.map_state == IsViewable && !attr.override_redirect)
                out.push_back(children[i]);
        }
        return out;
    }

    std::optional<CaptureWindow> describe_window(
        Display* d, Window win, std::vector<Monitor> const& found
    ) {
        XWindowAttributes attr = {};
        if (!XGetWindowAttributes(d, win, &attr)) return {};

        CaptureWindow out;
        out.id = uint32_t(win);
        int x = 0, y = 0;
        Window child = 0;
        XTranslateCoordinates(d, win, attr.root, 0, 0, &x, &y, &child);
        out.position = {x, y};
        out.size = {attr.width, attr.height};
        XY<int64_t> const center = {
            x + int64_t(attr.width) / 2, y + int64_t(attr.height) / 2
        };
        std::vector<CaptureOutput> same_root;
        for (auto const& monitor : found) {
            if (monitor.root == attr.root) same_root.push_back(monitor.output);
        }
        out.output_id = output_at(same_root, center);

        auto title = get_text(d, win, atoms.wm_name, atoms.utf8_string);
        if (!title) {
            char* name = nullptr;
            if (XFetchName(d, win, &name) && name) title = name;
            XFreeDeleter{}(name);
        }
        out.title = title.value_or("");
        out.app_name = app_name(d, win);

        bool max_vert = false, max_horz = false;
        for (auto const state : get_longs(d, win, atoms.wm_state, XA_ATOM)) {
            if (state == atoms.state_hidden) out.is_minimized = true;
            if (state == atoms.state_max_vert) max_vert = true;
            if (state == atoms.state_max_horz) max_horz = true;
        }
        if (attr.map_state != IsViewable) out.is_minimized = true;
        out.is_maximized = max_vert && max_horz;
        TRACE(x11_logger(), "  {}", debug(out));
        return out;
    }

    // Process name from _NET_WM_PID, else the WM_CLASS class.
    std::string app_name(Display* d, Window win) {
        auto const pid = get_longs(d, win, atoms.wm_pid, XA_CARDINAL, 1);
        if (!pid.empty()) {
            auto const comm = fmt::format("/proc/{}/comm", pid[0]);
            auto const text = read_text_file(*sys, comm);
            if (!text.err && !text.value.empty()) return text.value;
        }

        XClassHint hint = {};
        if (!XGetClassHint(d, win, &hint)) return {};
        std::string const out = hint.res_class ? hint.res_class : "";
        XFreeDeleter{}(hint.res_name);
        XFreeDeleter{}(hint.res_class);
        return out;
    }

    DecodedImage grab(Display* d, Window root, Region const& rect) {
        XImagePtr const image{XGetImage(
            d, root, rect.origin.x, rect.origin.y,
            rect.size.x, rect.size.y, AllPlanes, ZPixmap
        )};
        CHECK_RUNTIME(
            image, "XGetImage failed ({} of 0x{:x})", debug(rect), root
        );
        auto decoded = decode_ximage(image.get());
        DEBUG(x11_logger(), "Grabbed {}", debug(decoded));
        return decoded;
    }
};

}  // anonymous namespace

std::unique_ptr<WindowCaptureBackend> open_x11_capture(
    std::shared_ptr<UnixSystem> sys, std::string const& display_name
) {
    return std::make_unique<X11CaptureDef>(std::move(sys), display_name);
}

}  // namespace snapmcp
