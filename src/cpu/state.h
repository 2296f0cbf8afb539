#pragma once

#include <cstdint>

namespace cpu
{
    using Flags = uint16_t;

    namespace flag
    {
        static constexpr inline Flags ON = (1 << 1); // Always set
        static constexpr inline Flags CPU8086 = 0xf000; // Top nibble always set on 8086/8088
    }

    // These must be in sync with the x86 segment values (Sw)
    enum class Segment
    {
        ES = 0,
        CS = 1,
        SS = 2,
        DS = 3
    };

    // Order matches the reg field of the ModRM byte (w=0)
    enum class Register8
    {
        AL, CL, DL, BL,
        AH, CH, DH, BH
    };

    // General registers in reg field order (w=1), followed by the segment registers in Sw order
    enum class Register16
    {
        AX, CX, DX, BX,
        SP, BP, SI, DI,
        ES, CS, SS, DS
    };

    //! \brief CPU state
    class State
    {
      public:
        uint16_t m_ax, m_cx, m_dx, m_bx, m_sp, m_bp, m_si, m_di, m_ip;
        uint16_t m_es, m_cs, m_ss, m_ds;
        uint16_t m_flags;
    };

    void Reset(State& state);
    void Dump(const State& state);

    [[nodiscard]] uint16_t GetSegment(const State& state, Segment seg);

    // The 8-bit registers are the halves of AX, CX, DX and BX; the other half is never touched
    [[nodiscard]] uint8_t GetRegister8(const State& state, Register8 reg);
    void SetRegister8(State& state, Register8 reg, uint8_t value);

    [[nodiscard]] uint16_t GetRegister16(const State& state, Register16 reg);
    void SetRegister16(State& state, Register16 reg, uint16_t value);

    [[nodiscard]] const char* ToString(Register8 reg);
    [[nodiscard]] const char* ToString(Register16 reg);
}
