#ifdef KESTREL_HAS_OPENGL

    #include "glfw_gl_device.hpp"

    #define GL_GLEXT_PROTOTYPES
    #define GLFW_INCLUDE_GLEXT
    #include <GLFW/glfw3.h>
    #include <kestrel/errors.hpp>
    #include <kestrel/logger.hpp>

    #include "../../platform/native_window.hpp"

namespace kestrel
{

GlfwGlDevice::~GlfwGlDevice()
{
    if (!targets_.empty())
    {
        KESTREL_LOG_DEBUG("gl", "{} framebuffer(s) left to the context on shutdown", targets_.size());
    }
}

void GlfwGlDevice::attach(NativeWindow& window, bool vsync)
{
    window_ = static_cast<GLFWwindow*>(window.native_handle());
    if (!window_)
    {
        throw SurfaceCreationError("OpenGL: window has no native handle");
    }

    glfwMakeContextCurrent(window_);
    if (glfwGetCurrentContext() != window_)
    {
        throw SurfaceCreationError("OpenGL: window was created without a GL context");
    }
    glfwSwapInterval(vsync ? 1 : 0);

    const auto* version  = reinterpret_cast<const char*>(glGetString(GL_VERSION));
    const auto* renderer = reinterpret_cast<const char*>(glGetString(GL_RENDERER));
    KESTREL_LOG_INFO("gl",
                     "Context: {} on {}",
                     version ? version : "unknown",
                     renderer ? renderer : "unknown");

    glfwMakeContextCurrent(nullptr);
}

void GlfwGlDevice::make_current()
{
    glfwMakeContextCurrent(window_);
}

void GlfwGlDevice::make_not_current()
{
    glfwMakeContextCurrent(nullptr);
}

uint64_t GlfwGlDevice::create_window_target(PhysicalSize size)
{
    GLint bound = 0;
    glGetIntegerv(GL_FRAMEBUFFER_BINDING, &bound);
    glViewport(0, 0, static_cast<GLsizei>(size.width), static_cast<GLsizei>(size.height));

    uint64_t id = next_id_++;
    targets_[id] = Target{static_cast<uint32_t>(bound), 0, false};
    return id;
}

uint64_t GlfwGlDevice::create_offscreen_target(PhysicalSize size)
{
    GLint previous = 0;
    glGetIntegerv(GL_FRAMEBUFFER_BINDING, &previous);

    GLuint texture = 0;
    glGenTextures(1, &texture);
    glBindTexture(GL_TEXTURE_2D, texture);
    glTexImage2D(GL_TEXTURE_2D,
                 0,
                 GL_RGBA8,
                 static_cast<GLsizei>(size.width),
                 static_cast<GLsizei>(size.height),
                 0,
                 GL_RGBA,
                 GL_UNSIGNED_BYTE,
                 nullptr);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);

    GLuint framebuffer = 0;
    glGenFramebuffers(1, &framebuffer);
    glBindFramebuffer(GL_FRAMEBUFFER, framebuffer);
    glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D, texture, 0);

    GLenum status = glCheckFramebufferStatus(GL_FRAMEBUFFER);
    glBindFramebuffer(GL_FRAMEBUFFER, static_cast<GLuint>(previous));
    glBindTexture(GL_TEXTURE_2D, 0);

    if (status != GL_FRAMEBUFFER_COMPLETE)
    {
        KESTREL_LOG_ERROR("gl", "Offscreen framebuffer incomplete (status {})", status);
        glDeleteFramebuffers(1, &framebuffer);
        glDeleteTextures(1, &texture);
        return 0;
    }

    uint64_t id = next_id_++;
    targets_[id] = Target{framebuffer, texture, true};
    return id;
}

void GlfwGlDevice::destroy_target(uint64_t id)
{
    auto it = targets_.find(id);
    if (it == targets_.end())
    {
        return;
    }
    if (it->second.owned)
    {
        GLuint framebuffer = it->second.framebuffer;
        GLuint texture     = it->second.texture;
        glDeleteFramebuffers(1, &framebuffer);
        glDeleteTextures(1, &texture);
    }
    targets_.erase(it);
}

void GlfwGlDevice::resize_window_target(PhysicalSize size)
{
    glViewport(0, 0, static_cast<GLsizei>(size.width), static_cast<GLsizei>(size.height));
}

void GlfwGlDevice::flush()
{
    glFlush();
}

bool GlfwGlDevice::swap_buffers()
{
    glfwSwapBuffers(window_);

    const char* description = nullptr;
    int         code        = glfwGetError(&description);
    if (code != GLFW_NO_ERROR)
    {
        KESTREL_LOG_ERROR("gl", "glfwSwapBuffers failed: {}", description ? description : "unknown");
        return false;
    }
    return true;
}

}   // namespace kestrel

#endif   // KESTREL_HAS_OPENGL
