#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include "state.h"

namespace cpu
{
    template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };

    namespace disp
    {
        struct None { };
        // mod=01: sign-extended to 16 bits when applied
        struct Disp8 { int8_t value; };
        // mod=10
        struct Disp16 { uint16_t value; };
    }

    using Displacement = std::variant<disp::None, disp::Disp8, disp::Disp16>;

    [[nodiscard]] uint16_t DisplacementValue(const Displacement& d);

    namespace mode
    {
        // Base/index combinations selected by the rm field
        enum class Base
        {
            BxSi, BxDi, BpSi, BpDi,
            Si, Di, Bp, Bx
        };

        // [base + displacement]
        struct Indexed { Base base; Displacement disp; };

        // mod=00, rm=110: [disp16]
        struct Direct { uint16_t disp16; };

        // mod=11; the decoder must turn these into Register8/Register16 operands
        struct RegisterMode { };
    }

    using AddressingMode = std::variant<mode::Indexed, mode::Direct, mode::RegisterMode>;

    enum class SegmentOverride
    {
        None,
        ES,
        CS,
        SS,
        DS
    };

    namespace operand
    {
        struct Immediate8 { uint8_t value; };
        struct Immediate16 { uint16_t value; };
        struct Relative8 { int8_t value; };
        struct Relative16 { int16_t value; };
        struct Offset8 { uint16_t offset; };
        struct Offset16 { uint16_t offset; };
        struct Reg8 { Register8 reg; };
        struct Reg16 { Register16 reg; };
        struct Memory { AddressingMode mode; };
        struct NearAddress { uint16_t offset; };
        struct FarAddress { uint16_t segment; uint16_t offset; };
        struct NoOperand { };
        struct InvalidOperand { };
    }

    using Operand = std::variant<
        operand::Immediate8,
        operand::Immediate16,
        operand::Relative8,
        operand::Relative16,
        operand::Offset8,
        operand::Offset16,
        operand::Reg8,
        operand::Reg16,
        operand::Memory,
        operand::NearAddress,
        operand::FarAddress,
        operand::NoOperand,
        operand::InvalidOperand>;

    // Disassembler-style text, e.g. "[bp+si+0x10]", "es:[bx]", "al", "0x1234"
    [[nodiscard]] std::string ToString(const AddressingMode& mode);
    [[nodiscard]] std::string ToString(const Operand& op);
    [[nodiscard]] std::string ToString(const Operand& op, SegmentOverride seg_override);
    [[nodiscard]] const char* ToString(SegmentOverride seg_override);

    struct ParsedOperand
    {
        Operand operand;
        SegmentOverride seg_override;
    };

    //! \brief Parses the text produced by ToString()
    //!
    //! The number of hex digits selects the width: "0x12" is an 8-bit immediate,
    //! "0x0012" a 16-bit one, and likewise for displacements ("[bx+0x10]" vs
    //! "[bx+0x0010]"). A leading "seg:" is only accepted on memory operands.
    [[nodiscard]] std::optional<ParsedOperand> ParseOperand(std::string_view text);
}
