#pragma once

#include <cstdint>
#include "operand.h"
#include "state.h"
#include "../interface/businterface.h"

namespace cpu
{
    enum class DefaultSegment
    {
        Data,
        Stack
    };

    struct EffectiveAddress
    {
        uint16_t seg;
        uint16_t off;
    };

    //! \brief Returns the segment used when no override prefix is present
    //!
    //! Every BP-based form defaults to SS, everything else (including [disp16]) to DS.
    [[nodiscard]] DefaultSegment DefaultSegmentOf(const AddressingMode& mode);

    // An override always replaces the default
    [[nodiscard]] uint16_t ResolveSegment(DefaultSegment def, SegmentOverride seg_override, const State& state);

    //! \brief Computes segment:offset for a memory operand
    //!
    //! Offset arithmetic wraps at 16 bits. A RegisterMode addressing mode is a
    //! decoder bug and terminates emulation.
    [[nodiscard]] EffectiveAddress CalculateEffectiveAddress(const AddressingMode& mode, SegmentOverride seg_override, const State& state);

    // seg * 16 + off, wrapped to the 1MB address space
    [[nodiscard]] constexpr memory::Address MakeAddr(uint16_t seg, uint16_t off)
    {
        return ((static_cast<memory::Address>(seg) << 4) + static_cast<memory::Address>(off)) & memory::AddressMask;
    }

    [[nodiscard]] constexpr memory::Address MakeAddr(const EffectiveAddress& ea)
    {
        return MakeAddr(ea.seg, ea.off);
    }
}
