#include "invariant.h"

#include <cstdlib>
#include "../logger.h"

namespace cpu
{
    void InvariantViolation(const std::string& message)
    {
        ObtainLogger("cpu")->critical("internal invariant violated: {}", message);
        spdlog::shutdown();
        std::abort();
    }
}
