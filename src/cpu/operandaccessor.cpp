#include "operandaccessor.h"
#include "address.h"

#include "../logger.h"

namespace cpu
{
    namespace
    {
        template<typename T>
        bus::Access<T> Direct(T value)
        {
            return { value, 0 };
        }
    }

    struct OperandAccessor::Impl
    {
        State& state;
        std::shared_ptr<spdlog::logger> logger;

        explicit Impl(State& state);

        memory::Address Translate(const AddressingMode& mode, SegmentOverride seg_override);

        template<typename T>
        std::optional<bus::Access<T>> NotApplicable(const Operand& op, unsigned int width);
        bus::Cycles NotStorable(const Operand& op, unsigned int width);
    };

    OperandAccessor::Impl::Impl(State& state)
        : state(state)
        , logger(ObtainLogger("operand"))
    {
    }

    memory::Address OperandAccessor::Impl::Translate(const AddressingMode& mode, SegmentOverride seg_override)
    {
        const auto ea = CalculateEffectiveAddress(mode, seg_override, state);
        const auto addr = MakeAddr(ea);
        if (logger->should_log(spdlog::level::trace))
            logger->trace("{} -> {:04x}:{:04x} linear {:05x}", ToString(operand::Memory{ mode }, seg_override), ea.seg, ea.off, addr);
        return addr;
    }

    template<typename T>
    std::optional<bus::Access<T>> OperandAccessor::Impl::NotApplicable(const Operand& op, unsigned int width)
    {
        if (logger->should_log(spdlog::level::trace))
            logger->trace("read{}(): {} has no {}-bit value", width, ToString(op), width);
        return {};
    }

    bus::Cycles OperandAccessor::Impl::NotStorable(const Operand& op, unsigned int width)
    {
        if (logger->should_log(spdlog::level::trace))
            logger->trace("write{}(): ignoring write to {}", width, ToString(op));
        return 0;
    }

    OperandAccessor::OperandAccessor(State& state)
        : impl(std::make_unique<Impl>(state))
    {
    }

    OperandAccessor::~OperandAccessor() = default;

    std::optional<bus::Access<uint8_t>> OperandAccessor::Read8(BusInterface& bus, const Operand& op, SegmentOverride seg_override)
    {
        using Result = std::optional<bus::Access<uint8_t>>;
        return std::visit(overloaded{
            [&](const operand::Immediate8& imm) -> Result {
                return Direct(imm.value);
            },
            [&](const operand::Relative8& rel) -> Result {
                // Bit pattern is kept as-is
                return Direct(static_cast<uint8_t>(rel.value));
            },
            [&](const operand::Reg8& r) -> Result {
                return Direct(GetRegister8(impl->state, r.reg));
            },
            [&](const operand::Memory& mem) -> Result {
                const auto addr = impl->Translate(mem.mode, seg_override);
                return bus.ReadByte(addr);
            },
            [&](const operand::Immediate16&) { return impl->NotApplicable<uint8_t>(op, 8); },
            [&](const operand::Relative16&) { return impl->NotApplicable<uint8_t>(op, 8); },
            [&](const operand::Offset8&) { return impl->NotApplicable<uint8_t>(op, 8); },
            [&](const operand::Offset16&) { return impl->NotApplicable<uint8_t>(op, 8); },
            [&](const operand::Reg16&) { return impl->NotApplicable<uint8_t>(op, 8); },
            [&](const operand::NearAddress&) { return impl->NotApplicable<uint8_t>(op, 8); },
            [&](const operand::FarAddress&) { return impl->NotApplicable<uint8_t>(op, 8); },
            [&](const operand::NoOperand&) { return impl->NotApplicable<uint8_t>(op, 8); },
            [&](const operand::InvalidOperand&) { return impl->NotApplicable<uint8_t>(op, 8); }
        }, op);
    }

    std::optional<bus::Access<uint16_t>> OperandAccessor::Read16(BusInterface& bus, const Operand& op, SegmentOverride seg_override)
    {
        using Result = std::optional<bus::Access<uint16_t>>;
        return std::visit(overloaded{
            [&](const operand::Immediate16& imm) -> Result {
                return Direct(imm.value);
            },
            [&](const operand::Relative16& rel) -> Result {
                return Direct(static_cast<uint16_t>(rel.value));
            },
            [&](const operand::Reg16& r) -> Result {
                return Direct(GetRegister16(impl->state, r.reg));
            },
            [&](const operand::Memory& mem) -> Result {
                const auto addr = impl->Translate(mem.mode, seg_override);
                return bus.ReadWord(addr);
            },
            [&](const operand::Immediate8&) { return impl->NotApplicable<uint16_t>(op, 16); },
            [&](const operand::Relative8&) { return impl->NotApplicable<uint16_t>(op, 16); },
            [&](const operand::Offset8&) { return impl->NotApplicable<uint16_t>(op, 16); },
            [&](const operand::Offset16&) { return impl->NotApplicable<uint16_t>(op, 16); },
            [&](const operand::Reg8&) { return impl->NotApplicable<uint16_t>(op, 16); },
            [&](const operand::NearAddress&) { return impl->NotApplicable<uint16_t>(op, 16); },
            [&](const operand::FarAddress&) { return impl->NotApplicable<uint16_t>(op, 16); },
            [&](const operand::NoOperand&) { return impl->NotApplicable<uint16_t>(op, 16); },
            [&](const operand::InvalidOperand&) { return impl->NotApplicable<uint16_t>(op, 16); }
        }, op);
    }

    bus::Cycles OperandAccessor::Write8(BusInterface& bus, const Operand& op, SegmentOverride seg_override, uint8_t value)
    {
        return std::visit(overloaded{
            [&](const operand::Reg8& r) -> bus::Cycles {
                SetRegister8(impl->state, r.reg, value);
                return 0;
            },
            [&](const operand::Memory& mem) -> bus::Cycles {
                const auto addr = impl->Translate(mem.mode, seg_override);
                return bus.WriteByte(addr, value);
            },
            [&](const operand::Immediate8&) { return impl->NotStorable(op, 8); },
            [&](const operand::Immediate16&) { return impl->NotStorable(op, 8); },
            [&](const operand::Relative8&) { return impl->NotStorable(op, 8); },
            [&](const operand::Relative16&) { return impl->NotStorable(op, 8); },
            [&](const operand::Offset8&) { return impl->NotStorable(op, 8); },
            [&](const operand::Offset16&) { return impl->NotStorable(op, 8); },
            [&](const operand::Reg16&) { return impl->NotStorable(op, 8); },
            [&](const operand::NearAddress&) { return impl->NotStorable(op, 8); },
            [&](const operand::FarAddress&) { return impl->NotStorable(op, 8); },
            [&](const operand::NoOperand&) { return impl->NotStorable(op, 8); },
            [&](const operand::InvalidOperand&) { return impl->NotStorable(op, 8); }
        }, op);
    }

    bus::Cycles OperandAccessor::Write16(BusInterface& bus, const Operand& op, SegmentOverride seg_override, uint16_t value)
    {
        return std::visit(overloaded{
            [&](const operand::Reg16& r) -> bus::Cycles {
                // Segment registers are ordinary storage here; whether an instruction
                // may load them is decided by the caller
                SetRegister16(impl->state, r.reg, value);
                return 0;
            },
            [&](const operand::Memory& mem) -> bus::Cycles {
                const auto addr = impl->Translate(mem.mode, seg_override);
                return bus.WriteWord(addr, value);
            },
            [&](const operand::Immediate8&) { return impl->NotStorable(op, 16); },
            [&](const operand::Immediate16&) { return impl->NotStorable(op, 16); },
            [&](const operand::Relative8&) { return impl->NotStorable(op, 16); },
            [&](const operand::Relative16&) { return impl->NotStorable(op, 16); },
            [&](const operand::Offset8&) { return impl->NotStorable(op, 16); },
            [&](const operand::Offset16&) { return impl->NotStorable(op, 16); },
            [&](const operand::Reg8&) { return impl->NotStorable(op, 16); },
            [&](const operand::NearAddress&) { return impl->NotStorable(op, 16); },
            [&](const operand::FarAddress&) { return impl->NotStorable(op, 16); },
            [&](const operand::NoOperand&) { return impl->NotStorable(op, 16); },
            [&](const operand::InvalidOperand&) { return impl->NotStorable(op, 16); }
        }, op);
    }
}
