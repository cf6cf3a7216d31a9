#pragma once

#include <cstdint>

namespace kestrel
{

// Core types
struct Entity;
struct Event;
struct WindowEvent;
class Modifiers;
class UiCore;
class EventChannel;
class EventProxy;

// Geometry and surfaces
struct WindowSize;
struct PhysicalSize;
struct BoundingBox;
struct Surface;
struct RenderSurfacePair;
struct SurfaceFrame;

// Configuration
struct WindowDescription;
struct AppConfig;
struct ScalePolicy;
struct QuitAccelerator;

// Platform and rendering
class NativeWindow;
class PlatformEventSource;
class WindowFactory;
struct ParentWindow;
class SurfaceManager;

// Application
class Application;
class ParentedWindow;

using WindowId = uint32_t;

}   // namespace kestrel
