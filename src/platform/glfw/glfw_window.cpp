#ifdef KESTREL_USE_GLFW

    #include "glfw_window.hpp"

    #define GLFW_INCLUDE_NONE
    #include <GLFW/glfw3.h>
    #include <cmath>
    #include <kestrel/errors.hpp>
    #include <kestrel/logger.hpp>
    #include <algorithm>
    #include <mutex>
    #include <stdexcept>

    #include "../utf8.hpp"

    #if defined(_WIN32)
        #define GLFW_EXPOSE_NATIVE_WIN32
        #include <GLFW/glfw3native.h>
    #elif defined(KESTREL_HAS_X11)
        #define GLFW_EXPOSE_NATIVE_X11
        #include <GLFW/glfw3native.h>
    #endif

namespace kestrel
{

namespace
{

std::mutex& library_mutex()
{
    static std::mutex mutex;
    return mutex;
}

int library_users = 0;

void error_callback(int code, const char* description)
{
    KESTREL_LOG_ERROR("window", "GLFW error {}: {}", code, description ? description : "");
}

GlfwEventSource* source_of(GLFWwindow* window)
{
    return static_cast<GlfwEventSource*>(glfwGetWindowUserPointer(window));
}

}   // namespace

// ─── GlfwLibrary ────────────────────────────────────────────────────────────

GlfwLibrary::GlfwLibrary()
{
    std::lock_guard<std::mutex> lock(library_mutex());
    if (library_users == 0)
    {
        glfwSetErrorCallback(error_callback);
        if (!glfwInit())
        {
            throw SurfaceCreationError("Failed to initialize GLFW");
        }
        KESTREL_LOG_DEBUG("window", "GLFW {} initialized", glfwGetVersionString());
    }
    ++library_users;
}

GlfwLibrary::~GlfwLibrary()
{
    std::lock_guard<std::mutex> lock(library_mutex());
    if (--library_users == 0)
    {
        glfwTerminate();
    }
}

// ─── Input mapping ──────────────────────────────────────────────────────────

Code code_from_glfw(int key)
{
    if (key >= GLFW_KEY_A && key <= GLFW_KEY_Z)
        return static_cast<Code>(static_cast<int>(Code::KeyA) + (key - GLFW_KEY_A));
    if (key >= GLFW_KEY_0 && key <= GLFW_KEY_9)
        return static_cast<Code>(static_cast<int>(Code::Digit0) + (key - GLFW_KEY_0));
    if (key >= GLFW_KEY_F1 && key <= GLFW_KEY_F12)
        return static_cast<Code>(static_cast<int>(Code::F1) + (key - GLFW_KEY_F1));

    switch (key)
    {
        case GLFW_KEY_SPACE:
            return Code::Space;
        case GLFW_KEY_ENTER:
        case GLFW_KEY_KP_ENTER:
            return Code::Enter;
        case GLFW_KEY_ESCAPE:
            return Code::Escape;
        case GLFW_KEY_TAB:
            return Code::Tab;
        case GLFW_KEY_BACKSPACE:
            return Code::Backspace;
        case GLFW_KEY_DELETE:
            return Code::Delete;
        case GLFW_KEY_INSERT:
            return Code::Insert;
        case GLFW_KEY_HOME:
            return Code::Home;
        case GLFW_KEY_END:
            return Code::End;
        case GLFW_KEY_PAGE_UP:
            return Code::PageUp;
        case GLFW_KEY_PAGE_DOWN:
            return Code::PageDown;
        case GLFW_KEY_LEFT:
            return Code::ArrowLeft;
        case GLFW_KEY_RIGHT:
            return Code::ArrowRight;
        case GLFW_KEY_UP:
            return Code::ArrowUp;
        case GLFW_KEY_DOWN:
            return Code::ArrowDown;
        case GLFW_KEY_LEFT_SHIFT:
            return Code::ShiftLeft;
        case GLFW_KEY_RIGHT_SHIFT:
            return Code::ShiftRight;
        case GLFW_KEY_LEFT_CONTROL:
            return Code::ControlLeft;
        case GLFW_KEY_RIGHT_CONTROL:
            return Code::ControlRight;
        case GLFW_KEY_LEFT_ALT:
            return Code::AltLeft;
        case GLFW_KEY_RIGHT_ALT:
            return Code::AltRight;
        case GLFW_KEY_LEFT_SUPER:
            return Code::MetaLeft;
        case GLFW_KEY_RIGHT_SUPER:
            return Code::MetaRight;
        default:
            return Code::Unidentified;
    }
}

Modifiers modifiers_from_glfw(int mods)
{
    Modifiers out;
    out.set(Modifiers::SHIFT, (mods & GLFW_MOD_SHIFT) != 0);
    out.set(Modifiers::CTRL, (mods & GLFW_MOD_CONTROL) != 0);
    out.set(Modifiers::ALT, (mods & GLFW_MOD_ALT) != 0);
    out.set(Modifiers::SUPER, (mods & GLFW_MOD_SUPER) != 0);
    return out;
}

NativeMouseButton button_from_glfw(int button, uint16_t& other)
{
    other = 0;
    switch (button)
    {
        case GLFW_MOUSE_BUTTON_LEFT:
            return NativeMouseButton::Left;
        case GLFW_MOUSE_BUTTON_RIGHT:
            return NativeMouseButton::Right;
        case GLFW_MOUSE_BUTTON_MIDDLE:
            return NativeMouseButton::Middle;
        case GLFW_MOUSE_BUTTON_4:
            return NativeMouseButton::Back;
        case GLFW_MOUSE_BUTTON_5:
            return NativeMouseButton::Forward;
        default:
            other = static_cast<uint16_t>(button + 1);
            return NativeMouseButton::Other;
    }
}

// ─── GlfwWindow ─────────────────────────────────────────────────────────────

GlfwWindow::GlfwWindow(WindowId id, GLFWwindow* window, GraphicsBackend backend)
    : id_(id), window_(window), backend_(backend)
{
}

GlfwWindow::~GlfwWindow()
{
    if (window_)
    {
        glfwDestroyWindow(window_);
        window_ = nullptr;
    }
}

void* GlfwWindow::native_handle() const
{
    #if defined(_WIN32)
    // Direct3D12 needs the HWND; the GL and Vulkan paths go through GLFW.
    if (backend_ == GraphicsBackend::Direct3D12)
    {
        return glfwGetWin32Window(window_);
    }
    #endif
    return static_cast<void*>(window_);
}

NativeWindowInfo GlfwWindow::info() const
{
    NativeWindowInfo out;
    if (!window_)
    {
        return out;
    }

    int fb_w = 0, fb_h = 0;
    glfwGetFramebufferSize(window_, &fb_w, &fb_h);
    float xscale = 1.0f, yscale = 1.0f;
    glfwGetWindowContentScale(window_, &xscale, &yscale);

    out.scale           = xscale > 0.0f ? static_cast<double>(xscale) : 1.0;
    out.physical        = {static_cast<uint32_t>(std::max(fb_w, 0)),
                           static_cast<uint32_t>(std::max(fb_h, 0))};
    out.logical_width   = static_cast<double>(out.physical.width) / out.scale;
    out.logical_height  = static_cast<double>(out.physical.height) / out.scale;
    return out;
}

void GlfwWindow::request_resize(double logical_width, double logical_height)
{
    if (!window_)
    {
        return;
    }
    #ifdef __APPLE__
    // Screen coordinates are logical points on macOS.
    double factor = 1.0;
    #else
    double factor = info().scale;
    #endif
    glfwSetWindowSize(window_,
                      static_cast<int>(std::lround(logical_width * factor)),
                      static_cast<int>(std::lround(logical_height * factor)));
}

bool GlfwWindow::is_minimized() const
{
    return window_ && glfwGetWindowAttrib(window_, GLFW_ICONIFIED) == GLFW_TRUE;
}

std::optional<PhysicalSize> GlfwWindow::current_monitor_size() const
{
    if (!window_)
    {
        return std::nullopt;
    }

    int wx = 0, wy = 0, ww = 0, wh = 0;
    glfwGetWindowPos(window_, &wx, &wy);
    glfwGetWindowSize(window_, &ww, &wh);
    const int cx = wx + ww / 2;
    const int cy = wy + wh / 2;

    int           count    = 0;
    GLFWmonitor** monitors = glfwGetMonitors(&count);
    GLFWmonitor*  match    = count > 0 ? monitors[0] : nullptr;
    for (int i = 0; i < count; ++i)
    {
        int mx = 0, my = 0;
        glfwGetMonitorPos(monitors[i], &mx, &my);
        const GLFWvidmode* mode = glfwGetVideoMode(monitors[i]);
        if (mode && cx >= mx && cx < mx + mode->width && cy >= my && cy < my + mode->height)
        {
            match = monitors[i];
            break;
        }
    }
    if (!match)
    {
        return std::nullopt;
    }

    const GLFWvidmode* mode = glfwGetVideoMode(match);
    if (!mode)
    {
        return std::nullopt;
    }
    return PhysicalSize{static_cast<uint32_t>(mode->width), static_cast<uint32_t>(mode->height)};
}

void GlfwWindow::to_native_logical(double& x, double& y) const
{
    int ww = 0, wh = 0, fb_w = 0, fb_h = 0;
    glfwGetWindowSize(window_, &ww, &wh);
    glfwGetFramebufferSize(window_, &fb_w, &fb_h);
    const double scale = info().scale;

    // Screen coordinates -> framebuffer pixels -> logical units.
    if (ww > 0 && wh > 0)
    {
        x = x * static_cast<double>(fb_w) / ww;
        y = y * static_cast<double>(fb_h) / wh;
    }
    x /= scale;
    y /= scale;
}

// ─── GlfwEventSource ────────────────────────────────────────────────────────

GlfwEventSource::GlfwEventSource(GlfwWindow& window) : window_(window)
{
    GLFWwindow* w = window_.glfw_window();
    glfwSetWindowUserPointer(w, this);
    glfwSetCursorPosCallback(w, cursor_pos_callback);
    glfwSetCursorEnterCallback(w, cursor_enter_callback);
    glfwSetMouseButtonCallback(w, mouse_button_callback);
    glfwSetScrollCallback(w, scroll_callback);
    glfwSetKeyCallback(w, key_callback);
    glfwSetCharCallback(w, char_callback);
    glfwSetWindowFocusCallback(w, focus_callback);
    glfwSetWindowIconifyCallback(w, iconify_callback);
    glfwSetFramebufferSizeCallback(w, framebuffer_size_callback);
    glfwSetWindowContentScaleCallback(w, content_scale_callback);
    glfwSetWindowCloseCallback(w, close_callback);
}

GlfwEventSource::~GlfwEventSource()
{
    if (GLFWwindow* w = window_.glfw_window())
    {
        glfwSetWindowUserPointer(w, nullptr);
    }
}

void GlfwEventSource::poll(const PlatformEventSink& sink)
{
    glfwPollEvents();
    dispatch(sink);
}

void GlfwEventSource::wait(const PlatformEventSink& sink)
{
    glfwWaitEvents();
    dispatch(sink);
}

void GlfwEventSource::dispatch(const PlatformEventSink& sink)
{
    std::vector<PlatformEvent> batch;
    batch.swap(pending_);
    for (const auto& event : batch)
    {
        sink(event);
    }
}

void GlfwEventSource::push_resize()
{
    push(PlatformEvent::resized(window_.info()));
}

void GlfwEventSource::cursor_pos_callback(GLFWwindow* window, double x, double y)
{
    if (auto* self = source_of(window))
    {
        self->window_.to_native_logical(x, y);
        self->push(PlatformEvent::cursor_moved(x, y));
    }
}

void GlfwEventSource::cursor_enter_callback(GLFWwindow* window, int entered)
{
    if (auto* self = source_of(window))
    {
        self->push(PlatformEvent::of(entered ? PlatformEvent::Type::CursorEntered
                                             : PlatformEvent::Type::CursorLeft));
    }
}

void GlfwEventSource::mouse_button_callback(GLFWwindow* window, int button, int action, int mods)
{
    (void)mods;
    if (auto* self = source_of(window))
    {
        uint16_t other  = 0;
        auto     native = button_from_glfw(button, other);
        auto     type   = action == GLFW_PRESS ? PlatformEvent::Type::ButtonPressed
                                               : PlatformEvent::Type::ButtonReleased;
        self->push(PlatformEvent::mouse_button(type, native, other));
    }
}

void GlfwEventSource::scroll_callback(GLFWwindow* window, double x_offset, double y_offset)
{
    if (auto* self = source_of(window))
    {
        self->push(PlatformEvent::wheel(ScrollUnit::Lines, x_offset, y_offset));
    }
}

void GlfwEventSource::key_callback(GLFWwindow* window, int key, int scancode, int action,
                                   int mods)
{
    (void)scancode;
    auto* self = source_of(window);
    if (!self)
    {
        return;
    }
    // Repeats are reported as further key-downs.
    KeyState state = action == GLFW_RELEASE ? KeyState::Up : KeyState::Down;
    self->push(PlatformEvent::key(state, code_from_glfw(key), {}, modifiers_from_glfw(mods)));
}

void GlfwEventSource::char_callback(GLFWwindow* window, unsigned int codepoint)
{
    auto* self = source_of(window);
    if (!self)
    {
        return;
    }

    // GLFW reports the text of a key press right after its key event; attach
    // it there so the key-down carries its characters.
    if (!self->pending_.empty())
    {
        auto& last = self->pending_.back();
        if (last.type == PlatformEvent::Type::Keyboard && last.key_state == KeyState::Down)
        {
            utf8::append(last.text, static_cast<char32_t>(codepoint));
            return;
        }
    }

    // Text without a key event (input methods, dead keys).
    std::string text;
    utf8::append(text, static_cast<char32_t>(codepoint));
    self->push(PlatformEvent::key(KeyState::Down, Code::Unidentified, std::move(text)));
}

void GlfwEventSource::focus_callback(GLFWwindow* window, int focused)
{
    if (auto* self = source_of(window))
    {
        self->push(PlatformEvent::of(focused ? PlatformEvent::Type::Focused
                                             : PlatformEvent::Type::Unfocused));
    }
}

void GlfwEventSource::iconify_callback(GLFWwindow* window, int iconified)
{
    if (auto* self = source_of(window))
    {
        if (iconified)
            self->push(PlatformEvent::of(PlatformEvent::Type::Minimized));
        else
            self->push_resize();
    }
}

void GlfwEventSource::framebuffer_size_callback(GLFWwindow* window, int width, int height)
{
    (void)width;
    (void)height;
    if (auto* self = source_of(window))
    {
        self->push_resize();
    }
}

void GlfwEventSource::content_scale_callback(GLFWwindow* window, float xscale, float yscale)
{
    (void)yscale;
    if (auto* self = source_of(window))
    {
        KESTREL_LOG_DEBUG("window", "Content scale changed to {}", xscale);
        self->push_resize();
    }
}

void GlfwEventSource::close_callback(GLFWwindow* window)
{
    // Closing is decided by the run loop, not by GLFW.
    glfwSetWindowShouldClose(window, GLFW_FALSE);
    if (auto* self = source_of(window))
    {
        self->push(PlatformEvent::of(PlatformEvent::Type::WillClose));
    }
}

// ─── GlfwWindowFactory ──────────────────────────────────────────────────────

NativeWindowBundle GlfwWindowFactory::build(WindowId id, const WindowDescription& desc,
                                            GraphicsBackend backend, bool decorated)
{
    // Initialise GLFW before touching window hints.
    GlfwLibrary library;

    glfwDefaultWindowHints();
    if (backend == GraphicsBackend::OpenGL)
    {
        glfwWindowHint(GLFW_CLIENT_API, GLFW_OPENGL_API);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
        glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    #ifdef __APPLE__
        glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
    #endif
    }
    else
    {
        glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    }
    glfwWindowHint(GLFW_RESIZABLE, desc.resizable ? GLFW_TRUE : GLFW_FALSE);
    glfwWindowHint(GLFW_DECORATED, decorated ? GLFW_TRUE : GLFW_FALSE);
    glfwWindowHint(GLFW_SCALE_TO_MONITOR, GLFW_TRUE);

    // The requested inner size is in logical units; GLFW scales it to the
    // monitor, and the user scale factor is applied on top.
    const int width  = static_cast<int>(std::lround(desc.inner_size.width * desc.user_scale_factor));
    const int height = static_cast<int>(std::lround(desc.inner_size.height * desc.user_scale_factor));

    GLFWwindow* glfw_win = glfwCreateWindow(width, height, desc.title.c_str(), nullptr, nullptr);
    if (!glfw_win)
    {
        throw SurfaceCreationError("glfwCreateWindow failed for \"" + desc.title + "\"");
    }

    NativeWindowBundle bundle;
    auto               window = std::make_unique<GlfwWindow>(id, glfw_win, backend);
    bundle.events             = std::make_unique<GlfwEventSource>(*window);
    bundle.window             = std::move(window);

    KESTREL_LOG_INFO("window",
                     "Created window {}: {}x{} \"{}\"",
                     id,
                     desc.inner_size.width,
                     desc.inner_size.height,
                     desc.title);
    return bundle;
}

NativeWindowBundle GlfwWindowFactory::create(WindowId id, const WindowDescription& desc,
                                             GraphicsBackend backend)
{
    return build(id, desc, backend, true);
}

NativeWindowBundle GlfwWindowFactory::create_child(WindowId id, const WindowDescription& desc,
                                                   GraphicsBackend backend, ParentWindow parent)
{
    if (!parent.handle)
    {
        throw ConfigurationError("create_child: parent window handle is null");
    }

    auto  bundle   = build(id, desc, backend, false);
    auto* glfw_win = static_cast<GlfwWindow*>(bundle.window.get())->glfw_window();

    #if defined(_WIN32)
    HWND child = glfwGetWin32Window(glfw_win);
    SetWindowLongPtrW(child, GWL_STYLE, WS_CHILD | WS_VISIBLE);
    if (!SetParent(child, static_cast<HWND>(parent.handle)))
    {
        throw SurfaceCreationError("SetParent failed for window " + std::to_string(id));
    }
    #elif defined(KESTREL_HAS_X11)
    Display* display = glfwGetX11Display();
    ::Window child   = glfwGetX11Window(glfw_win);
    XReparentWindow(display, child, reinterpret_cast<::Window>(parent.handle), 0, 0);
    XFlush(display);
    #else
    (void)glfw_win;
    throw ConfigurationError("Parented windows are not supported on this platform");
    #endif

    KESTREL_LOG_INFO("window", "Window {} embedded into host window", id);
    return bundle;
}

}   // namespace kestrel

#endif   // KESTREL_USE_GLFW
