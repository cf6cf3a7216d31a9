#pragma once

// Kestrel: platform layer of a retained-mode UI toolkit.

#include <kestrel/app.hpp>
#include <kestrel/errors.hpp>
#include <kestrel/event.hpp>
#include <kestrel/event_channel.hpp>
#include <kestrel/fwd.hpp>
#include <kestrel/geometry.hpp>
#include <kestrel/logger.hpp>
#include <kestrel/surface.hpp>
#include <kestrel/ui_core.hpp>
#include <kestrel/window_description.hpp>
