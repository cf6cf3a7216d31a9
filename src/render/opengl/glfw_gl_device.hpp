#pragma once

#ifdef KESTREL_HAS_OPENGL

    #include <cstdint>
    #include <unordered_map>

    #include "gl_device.hpp"

struct GLFWwindow;

namespace kestrel
{

// GlDevice over the OpenGL context GLFW creates with the window.
class GlfwGlDevice final : public GlDevice
{
   public:
    GlfwGlDevice() = default;
    ~GlfwGlDevice() override;

    GlfwGlDevice(const GlfwGlDevice&)            = delete;
    GlfwGlDevice& operator=(const GlfwGlDevice&) = delete;

    void attach(NativeWindow& window, bool vsync) override;

    void make_current() override;
    void make_not_current() override;

    uint64_t create_window_target(PhysicalSize size) override;
    uint64_t create_offscreen_target(PhysicalSize size) override;
    void     destroy_target(uint64_t id) override;
    void     resize_window_target(PhysicalSize size) override;

    void flush() override;
    bool swap_buffers() override;

   private:
    struct Target
    {
        uint32_t framebuffer = 0;
        uint32_t texture     = 0;   // 0 for the window framebuffer
        bool     owned       = false;
    };

    GLFWwindow*                          window_  = nullptr;
    uint64_t                             next_id_ = 1;
    std::unordered_map<uint64_t, Target> targets_;
};

}   // namespace kestrel

#endif   // KESTREL_HAS_OPENGL
