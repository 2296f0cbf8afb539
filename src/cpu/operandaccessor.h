#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include "operand.h"
#include "state.h"
#include "../interface/businterface.h"

namespace cpu
{
    //! \brief Reads and writes instruction operands
    //!
    //! Register and immediate operands act on the register file directly; memory
    //! operands go through effective address calculation and the bus. Reads
    //! yield std::nullopt if the operand has no value of the requested width;
    //! writes to operands that are not a storage location do nothing. Both
    //! report the bus cycles spent (0 when the bus was not involved). A failing
    //! bus access propagates as bus::Fault.
    class OperandAccessor final
    {
        struct Impl;
        std::unique_ptr<Impl> impl;

      public:
        explicit OperandAccessor(State& state);
        ~OperandAccessor();

        [[nodiscard]] std::optional<bus::Access<uint8_t>> Read8(BusInterface& bus, const Operand& op, SegmentOverride seg_override);
        [[nodiscard]] std::optional<bus::Access<uint16_t>> Read16(BusInterface& bus, const Operand& op, SegmentOverride seg_override);

        bus::Cycles Write8(BusInterface& bus, const Operand& op, SegmentOverride seg_override, uint8_t value);
        bus::Cycles Write16(BusInterface& bus, const Operand& op, SegmentOverride seg_override, uint16_t value);
    };
}
