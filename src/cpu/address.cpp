#include "address.h"
#include "invariant.h"

namespace cpu
{
    namespace
    {
        DefaultSegment DefaultSegmentOf(mode::Base base)
        {
            switch (base) {
                case mode::Base::BpSi:
                case mode::Base::BpDi:
                case mode::Base::Bp:
                    return DefaultSegment::Stack;
                case mode::Base::BxSi:
                case mode::Base::BxDi:
                case mode::Base::Si:
                case mode::Base::Di:
                case mode::Base::Bx:
                    return DefaultSegment::Data;
            }
            InvariantViolation("invalid base {}", static_cast<int>(base));
        }

        Segment SegmentOf(DefaultSegment def, SegmentOverride seg_override)
        {
            switch (seg_override) {
                case SegmentOverride::None:
                    return def == DefaultSegment::Stack ? Segment::SS : Segment::DS;
                case SegmentOverride::ES:
                    return Segment::ES;
                case SegmentOverride::CS:
                    return Segment::CS;
                case SegmentOverride::SS:
                    return Segment::SS;
                case SegmentOverride::DS:
                    return Segment::DS;
            }
            InvariantViolation("invalid segment override {}", static_cast<int>(seg_override));
        }

        uint16_t BaseOffset(mode::Base base, const State& state)
        {
            switch (base) {
                case mode::Base::BxSi: // (bx) + (si)
                    return state.m_bx + state.m_si;
                case mode::Base::BxDi: // (bx) + (di)
                    return state.m_bx + state.m_di;
                case mode::Base::BpSi: // (bp) + (si)
                    return state.m_bp + state.m_si;
                case mode::Base::BpDi: // (bp) + (di)
                    return state.m_bp + state.m_di;
                case mode::Base::Si:
                    return state.m_si;
                case mode::Base::Di:
                    return state.m_di;
                case mode::Base::Bp:
                    return state.m_bp;
                case mode::Base::Bx:
                    return state.m_bx;
            }
            InvariantViolation("invalid base {}", static_cast<int>(base));
        }
    }

    DefaultSegment DefaultSegmentOf(const AddressingMode& mode)
    {
        return std::visit(overloaded{
            [](const mode::Indexed& ind) {
                return DefaultSegmentOf(ind.base);
            },
            [](const mode::Direct&) {
                return DefaultSegment::Data;
            },
            [&](const mode::RegisterMode&) -> DefaultSegment {
                InvariantViolation("no default segment for {}", ToString(mode));
            } }, mode);
    }

    uint16_t ResolveSegment(DefaultSegment def, SegmentOverride seg_override, const State& state)
    {
        return GetSegment(state, SegmentOf(def, seg_override));
    }

    EffectiveAddress CalculateEffectiveAddress(const AddressingMode& mode, SegmentOverride seg_override, const State& state)
    {
        return std::visit(overloaded{
            [&](const mode::Indexed& ind) {
                // Truncation to 16 bits provides the wraparound within the segment
                const uint16_t off = BaseOffset(ind.base, state) + DisplacementValue(ind.disp);
                const auto seg = ResolveSegment(DefaultSegmentOf(ind.base), seg_override, state);
                return EffectiveAddress{ seg, off };
            },
            [&](const mode::Direct& direct) {
                const auto seg = ResolveSegment(DefaultSegment::Data, seg_override, state);
                return EffectiveAddress{ seg, direct.disp16 };
            },
            [&](const mode::RegisterMode&) -> EffectiveAddress {
                // The decoder should have turned this into a register operand
                InvariantViolation("cannot calculate effective address of {}", ToString(mode));
            } }, mode);
    }
}
