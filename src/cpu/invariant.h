#pragma once

#include <string>
#include <utility>
#include "spdlog/fmt/fmt.h"

namespace cpu
{
    //! \brief Terminates emulation after a collaborator broke the CPU core's contract
    //!
    //! Used for states that well-behaved decoder output can never produce, such as
    //! a register-direct operand routed through effective address calculation.
    //! This is distinct from an operand that simply does not apply to an access,
    //! which is reported as an empty result.
    [[noreturn]] void InvariantViolation(const std::string& message);

    template<typename... Args>
    [[noreturn]] void InvariantViolation(fmt::format_string<Args...> message, Args&&... args)
    {
        InvariantViolation(fmt::format(message, std::forward<Args>(args)...));
    }
}
