#include "../interface/businterface.h"

#include "spdlog/fmt/fmt.h"

namespace bus
{
    namespace
    {
        std::string MakeMessage(Fault::Reason reason, memory::Address addr, unsigned int width)
        {
            return fmt::format("bus fault: {} ({}-bit access at {:05x})", ToString(reason), width, addr);
        }
    }

    Fault::Fault(Reason reason, memory::Address addr, unsigned int width)
        : std::runtime_error(MakeMessage(reason, addr, width))
        , reason(reason), addr(addr), width(width)
    {
    }

    std::string ToString(Fault::Reason reason)
    {
        switch (reason) {
            case Fault::Reason::Unmapped:
                return "unmapped address";
            case Fault::Reason::DeviceError:
                return "device error";
        }
        return "unknown";
    }
}
