#pragma once

#include <cstddef>
#include <kestrel/event.hpp>
#include <kestrel/surface.hpp>
#include <kestrel/window_description.hpp>
#include <optional>
#include <unordered_map>
#include <vector>

#include "native_window.hpp"

namespace kestrel
{

// Owns every native window and its event source, from open until the
// window is closed. Other components keep plain references and look windows
// up by id.
//
// Usage:
//   WindowLifecycle windows(factory, GraphicsBackend::OpenGL);
//   WindowId id = windows.open(desc);
//   ...
//   // after a tick:
//   windows.process_pending_closes();
class WindowLifecycle
{
   public:
    WindowLifecycle(WindowFactory& factory, GraphicsBackend backend);
    ~WindowLifecycle();

    WindowLifecycle(const WindowLifecycle&)            = delete;
    WindowLifecycle& operator=(const WindowLifecycle&) = delete;

    // Create a top-level window. Throws SurfaceCreationError when the
    // native backend cannot create it.
    WindowId open(const WindowDescription& desc);

    // Create a window embedded into a host window.
    WindowId open_parented(const WindowDescription& desc, ParentWindow parent);

    // The native close button was pressed. Destruction is deferred to
    // process_pending_closes() so a tick never sees a dangling window.
    void on_will_close(WindowId id);

    // Mark a window for destruction (deferred like on_will_close()).
    void request_close(WindowId id);

    // Destroy a window immediately. Unknown ids are ignored.
    void close(WindowId id);

    // Destroy everything marked for close. Returns how many went away.
    size_t process_pending_closes();

    NativeWindow*        find(WindowId id) const;
    PlatformEventSource* events(WindowId id) const;

    // Associate the UI core entity rendered into a window.
    void                  bind(WindowId id, Entity entity);
    std::optional<Entity> entity_for(WindowId id) const;

    bool   is_open(WindowId id) const { return find(id) != nullptr; }
    bool   any_open() const { return !windows_.empty(); }
    size_t count() const { return windows_.size(); }

    bool is_close_pending(WindowId id) const;

   private:
    struct Entry
    {
        NativeWindowBundle    bundle;
        std::optional<Entity> entity;
        bool                  close_pending = false;
    };

    WindowId register_bundle(WindowId id, NativeWindowBundle bundle);

    WindowFactory&                        factory_;
    GraphicsBackend                       backend_;
    WindowId                              next_id_ = 1;
    std::unordered_map<WindowId, Entry>   windows_;
    std::vector<WindowId>                 pending_close_ids_;
};

}   // namespace kestrel
