#include "window_lifecycle.hpp"

#include <algorithm>
#include <kestrel/errors.hpp>
#include <kestrel/logger.hpp>

namespace kestrel
{

WindowLifecycle::WindowLifecycle(WindowFactory& factory, GraphicsBackend backend)
    : factory_(factory), backend_(backend)
{
}

WindowLifecycle::~WindowLifecycle()
{
    std::vector<WindowId> ids;
    ids.reserve(windows_.size());
    for (const auto& [id, entry] : windows_)
    {
        ids.push_back(id);
    }
    for (WindowId id : ids)
    {
        close(id);
    }
}

WindowId WindowLifecycle::register_bundle(WindowId id, NativeWindowBundle bundle)
{
    if (!bundle.window || !bundle.events)
    {
        throw SurfaceCreationError("Window factory returned an incomplete window");
    }

    Entry entry;
    entry.bundle = std::move(bundle);
    windows_.emplace(id, std::move(entry));

    KESTREL_LOG_DEBUG("window", "Window {} registered ({} open)", id, windows_.size());
    return id;
}

WindowId WindowLifecycle::open(const WindowDescription& desc)
{
    WindowId id = next_id_++;
    return register_bundle(id, factory_.create(id, desc, backend_));
}

WindowId WindowLifecycle::open_parented(const WindowDescription& desc, ParentWindow parent)
{
    WindowId id = next_id_++;
    return register_bundle(id, factory_.create_child(id, desc, backend_, parent));
}

void WindowLifecycle::on_will_close(WindowId id)
{
    KESTREL_LOG_DEBUG("window", "Window {} will close", id);
    request_close(id);
}

void WindowLifecycle::request_close(WindowId id)
{
    auto it = windows_.find(id);
    if (it == windows_.end() || it->second.close_pending)
    {
        return;
    }
    it->second.close_pending = true;
    pending_close_ids_.push_back(id);
}

void WindowLifecycle::close(WindowId id)
{
    auto it = windows_.find(id);
    if (it == windows_.end())
    {
        return;
    }

    // The event source refers to the window; drop it first.
    it->second.bundle.events.reset();
    it->second.bundle.window.reset();
    windows_.erase(it);

    pending_close_ids_.erase(std::remove(pending_close_ids_.begin(), pending_close_ids_.end(), id),
                             pending_close_ids_.end());

    KESTREL_LOG_INFO("window", "Destroyed window {}", id);
}

size_t WindowLifecycle::process_pending_closes()
{
    if (pending_close_ids_.empty())
    {
        return 0;
    }

    // Copy and clear to avoid re-entrancy issues
    auto ids = std::move(pending_close_ids_);
    pending_close_ids_.clear();

    size_t closed = 0;
    for (WindowId id : ids)
    {
        if (windows_.count(id))
        {
            close(id);
            ++closed;
        }
    }
    return closed;
}

NativeWindow* WindowLifecycle::find(WindowId id) const
{
    auto it = windows_.find(id);
    return it != windows_.end() ? it->second.bundle.window.get() : nullptr;
}

PlatformEventSource* WindowLifecycle::events(WindowId id) const
{
    auto it = windows_.find(id);
    return it != windows_.end() ? it->second.bundle.events.get() : nullptr;
}

void WindowLifecycle::bind(WindowId id, Entity entity)
{
    auto it = windows_.find(id);
    if (it == windows_.end())
    {
        KESTREL_LOG_WARN("window", "bind: unknown window {}", id);
        return;
    }
    it->second.entity = entity;
}

std::optional<Entity> WindowLifecycle::entity_for(WindowId id) const
{
    auto it = windows_.find(id);
    if (it == windows_.end())
    {
        return std::nullopt;
    }
    return it->second.entity;
}

bool WindowLifecycle::is_close_pending(WindowId id) const
{
    auto it = windows_.find(id);
    return it != windows_.end() && it->second.close_pending;
}

}   // namespace kestrel
