#include "state.h"
#include "invariant.h"

#include <type_traits>
#include "spdlog/spdlog.h"

namespace cpu
{
    namespace
    {
        template<typename T>
        auto& GetReg16(T& state, Register16 reg)
            requires (std::is_same_v<std::remove_cv_t<T>, State>)
        {
            switch (reg) {
                case Register16::AX:
                    return state.m_ax;
                case Register16::CX:
                    return state.m_cx;
                case Register16::DX:
                    return state.m_dx;
                case Register16::BX:
                    return state.m_bx;
                case Register16::SP:
                    return state.m_sp;
                case Register16::BP:
                    return state.m_bp;
                case Register16::SI:
                    return state.m_si;
                case Register16::DI:
                    return state.m_di;
                case Register16::ES:
                    return state.m_es;
                case Register16::CS:
                    return state.m_cs;
                case Register16::SS:
                    return state.m_ss;
                case Register16::DS:
                    return state.m_ds;
            }
            InvariantViolation("invalid 16-bit register {}", static_cast<int>(reg));
        }

        template<typename T>
        struct Reg8
        {
            T& reg;
            const unsigned int shift;

            uint8_t Load() const {
                return (reg >> shift) & 0xff;
            }

            void Store(const uint8_t value) {
                if (shift > 0) {
                    reg = (reg & 0x00ff) | (value << 8);
                } else {
                    reg = (reg & 0xff00) | value;
                }
            }
        };

        template<typename T>
        auto ObtainReg8(T& state, Register8 reg)
            requires (std::is_same_v<std::remove_cv_t<T>, State>)
        {
            const auto n = static_cast<int>(reg);
            if (n < 0 || n > 7)
                InvariantViolation("invalid 8-bit register {}", n);

            // AL..BL are the low halves of AX..BX, AH..BH the high halves
            const unsigned int shift = (n > 3) ? 8 : 0;
            auto& reg16 = GetReg16(state, static_cast<Register16>(n & 3));
            return Reg8<std::remove_reference_t<decltype(reg16)>>{ reg16, shift };
        }
    }

    void Reset(State& state)
    {
        state = State{};
        state.m_flags = flag::CPU8086 | flag::ON;
        state.m_cs = 0xffff;
    }

    void Dump(const State& st)
    {
        spdlog::debug("  ax={:04x} bx={:04x} cx={:04x} dx={:04x} si={:04x} di={:04x} bp={:04x} flags={:04x}", st.m_ax,
            st.m_bx, st.m_cx, st.m_dx, st.m_si, st.m_di, st.m_bp, st.m_flags);
        spdlog::debug("  cs:ip={:04x}:{:04x} ds={:04x} es={:04x} ss:sp={:04x}:{:04x}", st.m_cs, st.m_ip, st.m_ds, st.m_es, st.m_ss,
            st.m_sp);
    }

    uint16_t GetSegment(const State& state, Segment seg)
    {
        switch (seg) {
            case Segment::ES:
                return state.m_es;
            case Segment::CS:
                return state.m_cs;
            case Segment::SS:
                return state.m_ss;
            case Segment::DS:
                return state.m_ds;
        }
        InvariantViolation("invalid segment {}", static_cast<int>(seg));
    }

    uint8_t GetRegister8(const State& state, Register8 reg)
    {
        return ObtainReg8(state, reg).Load();
    }

    void SetRegister8(State& state, Register8 reg, uint8_t value)
    {
        ObtainReg8(state, reg).Store(value);
    }

    uint16_t GetRegister16(const State& state, Register16 reg)
    {
        return GetReg16(state, reg);
    }

    void SetRegister16(State& state, Register16 reg, uint16_t value)
    {
        GetReg16(state, reg) = value;
    }

    const char* ToString(Register8 reg)
    {
        switch (reg) {
            case Register8::AL: return "al";
            case Register8::CL: return "cl";
            case Register8::DL: return "dl";
            case Register8::BL: return "bl";
            case Register8::AH: return "ah";
            case Register8::CH: return "ch";
            case Register8::DH: return "dh";
            case Register8::BH: return "bh";
        }
        return "?";
    }

    const char* ToString(Register16 reg)
    {
        switch (reg) {
            case Register16::AX: return "ax";
            case Register16::CX: return "cx";
            case Register16::DX: return "dx";
            case Register16::BX: return "bx";
            case Register16::SP: return "sp";
            case Register16::BP: return "bp";
            case Register16::SI: return "si";
            case Register16::DI: return "di";
            case Register16::ES: return "es";
            case Register16::CS: return "cs";
            case Register16::SS: return "ss";
            case Register16::DS: return "ds";
        }
        return "?";
    }
}
