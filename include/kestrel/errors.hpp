#pragma once

#include <stdexcept>
#include <string>

namespace kestrel
{

// The requested graphics backend was not compiled into this build.
class ConfigurationError : public std::runtime_error
{
   public:
    using std::runtime_error::runtime_error;
};

// No GPU adapter accepted device creation. The application cannot start.
class DeviceAcquisitionError : public std::runtime_error
{
   public:
    using std::runtime_error::runtime_error;
};

// The backend refused to bind a render target for a window.
class SurfaceCreationError : public std::runtime_error
{
   public:
    using std::runtime_error::runtime_error;
};

// The present/swap call failed.
class PresentError : public std::runtime_error
{
   public:
    explicit PresentError(const std::string& what, bool device_lost = false)
        : std::runtime_error(what), device_lost_(device_lost)
    {
    }

    // Device loss could be recovered by recreating the context and surfaces;
    // anything else is a driver fault.
    bool device_lost() const { return device_lost_; }

   private:
    bool device_lost_ = false;
};

}   // namespace kestrel
