#pragma once

#ifdef KESTREL_USE_GLFW

    #include <cstdint>
    #include <string>
    #include <vector>

    #include "../native_window.hpp"

struct GLFWwindow;

namespace kestrel
{

// Keeps GLFW initialised while at least one holder is alive.
class GlfwLibrary
{
   public:
    GlfwLibrary();
    ~GlfwLibrary();

    GlfwLibrary(const GlfwLibrary&)            = delete;
    GlfwLibrary& operator=(const GlfwLibrary&) = delete;
};

// GLFW key code to layout-independent key code.
Code code_from_glfw(int key);

// GLFW modifier bits to Modifiers.
Modifiers modifiers_from_glfw(int mods);

// GLFW mouse button index to the native button kind (GLFW buttons 4 and 5
// are back and forward).
NativeMouseButton button_from_glfw(int button, uint16_t& other);

class GlfwWindow final : public NativeWindow
{
   public:
    GlfwWindow(WindowId id, GLFWwindow* window, GraphicsBackend backend);
    ~GlfwWindow() override;

    GlfwWindow(const GlfwWindow&)            = delete;
    GlfwWindow& operator=(const GlfwWindow&) = delete;

    WindowId         id() const override { return id_; }
    void*            native_handle() const override;
    NativeWindowInfo info() const override;
    void             request_resize(double logical_width, double logical_height) override;
    bool             is_minimized() const override;

    std::optional<PhysicalSize> current_monitor_size() const override;

    GLFWwindow* glfw_window() const { return window_; }

    // GLFW cursor coordinates (screen coordinates) to native logical units.
    void to_native_logical(double& x, double& y) const;

   private:
    GlfwLibrary library_;
    WindowId        id_     = INVALID_WINDOW_ID;
    GLFWwindow*     window_ = nullptr;
    GraphicsBackend backend_;
};

// Collects GLFW callbacks for one window and hands them out on poll/wait.
class GlfwEventSource final : public PlatformEventSource
{
   public:
    explicit GlfwEventSource(GlfwWindow& window);
    ~GlfwEventSource() override;

    GlfwEventSource(const GlfwEventSource&)            = delete;
    GlfwEventSource& operator=(const GlfwEventSource&) = delete;

    void poll(const PlatformEventSink& sink) override;
    void wait(const PlatformEventSink& sink) override;

   private:
    void dispatch(const PlatformEventSink& sink);
    void push(PlatformEvent event) { pending_.push_back(std::move(event)); }
    void push_resize();

    static void cursor_pos_callback(GLFWwindow* window, double x, double y);
    static void cursor_enter_callback(GLFWwindow* window, int entered);
    static void mouse_button_callback(GLFWwindow* window, int button, int action, int mods);
    static void scroll_callback(GLFWwindow* window, double x_offset, double y_offset);
    static void key_callback(GLFWwindow* window, int key, int scancode, int action, int mods);
    static void char_callback(GLFWwindow* window, unsigned int codepoint);
    static void focus_callback(GLFWwindow* window, int focused);
    static void iconify_callback(GLFWwindow* window, int iconified);
    static void framebuffer_size_callback(GLFWwindow* window, int width, int height);
    static void content_scale_callback(GLFWwindow* window, float xscale, float yscale);
    static void close_callback(GLFWwindow* window);

    GlfwWindow&                window_;
    std::vector<PlatformEvent> pending_;
};

class GlfwWindowFactory final : public WindowFactory
{
   public:
    NativeWindowBundle create(WindowId id, const WindowDescription& desc,
                              GraphicsBackend backend) override;

    NativeWindowBundle create_child(WindowId id, const WindowDescription& desc,
                                    GraphicsBackend backend, ParentWindow parent) override;

   private:
    NativeWindowBundle build(WindowId id, const WindowDescription& desc, GraphicsBackend backend,
                             bool decorated);
};

}   // namespace kestrel

#endif   // KESTREL_USE_GLFW
