#include "gtest/gtest.h"
#include "gmock/gmock.h"
#include "cpu/state.h"

#include <array>

namespace
{
    constexpr std::array<cpu::Register8, 8> allRegisters8{
        cpu::Register8::AL, cpu::Register8::CL, cpu::Register8::DL, cpu::Register8::BL,
        cpu::Register8::AH, cpu::Register8::CH, cpu::Register8::DH, cpu::Register8::BH,
    };

    constexpr std::array<cpu::Register16, 12> allRegisters16{
        cpu::Register16::AX, cpu::Register16::CX, cpu::Register16::DX, cpu::Register16::BX,
        cpu::Register16::SP, cpu::Register16::BP, cpu::Register16::SI, cpu::Register16::DI,
        cpu::Register16::ES, cpu::Register16::CS, cpu::Register16::SS, cpu::Register16::DS,
    };

    struct StateTest : ::testing::Test
    {
        cpu::State state;

        StateTest()
        {
            cpu::Reset(state);
        }
    };
}

TEST_F(StateTest, ResetLoadsPowerOnState)
{
    state.m_ax = 0x1234;
    state.m_ds = 0x5678;
    cpu::Reset(state);
    EXPECT_EQ(0xffff, state.m_cs);
    EXPECT_EQ(0, state.m_ip);
    EXPECT_EQ(0, state.m_ds);
    EXPECT_EQ(0, state.m_es);
    EXPECT_EQ(0, state.m_ss);
    EXPECT_EQ(0, state.m_ax);
    EXPECT_EQ(0xf002, state.m_flags);
}

TEST_F(StateTest, EightBitRegistersRoundTrip)
{
    uint8_t value = 0x11;
    for (const auto reg : allRegisters8) {
        cpu::SetRegister8(state, reg, value);
        EXPECT_EQ(value, cpu::GetRegister8(state, reg)) << cpu::ToString(reg);
        value += 0x11;
    }
}

TEST_F(StateTest, SixteenBitRegistersRoundTrip)
{
    uint16_t value = 0x1001;
    for (const auto reg : allRegisters16) {
        cpu::SetRegister16(state, reg, value);
        EXPECT_EQ(value, cpu::GetRegister16(state, reg)) << cpu::ToString(reg);
        value += 0x1111;
    }
}

TEST_F(StateTest, SixteenBitRegistersAreIndependent)
{
    for (const auto reg : allRegisters16)
        cpu::SetRegister16(state, reg, 0);
    cpu::SetRegister16(state, cpu::Register16::SI, 0xbeef);
    for (const auto reg : allRegisters16) {
        if (reg == cpu::Register16::SI) continue;
        EXPECT_EQ(0, cpu::GetRegister16(state, reg)) << cpu::ToString(reg);
    }
    EXPECT_EQ(0xbeef, state.m_si);
}

TEST_F(StateTest, WritingHighHalfKeepsLowHalf)
{
    state.m_ax = 0x1234;
    cpu::SetRegister8(state, cpu::Register8::AH, 0xab);
    EXPECT_EQ(0xab34, state.m_ax);
    EXPECT_EQ(0x34, cpu::GetRegister8(state, cpu::Register8::AL));
}

TEST_F(StateTest, WritingLowHalfKeepsHighHalf)
{
    state.m_dx = 0x1234;
    cpu::SetRegister8(state, cpu::Register8::DL, 0xcd);
    EXPECT_EQ(0x12cd, state.m_dx);
    EXPECT_EQ(0x12, cpu::GetRegister8(state, cpu::Register8::DH));
}

TEST_F(StateTest, EightBitRegistersMapOntoGeneralRegisters)
{
    state.m_ax = 0x0102;
    state.m_cx = 0x0304;
    state.m_dx = 0x0506;
    state.m_bx = 0x0708;
    EXPECT_EQ(0x02, cpu::GetRegister8(state, cpu::Register8::AL));
    EXPECT_EQ(0x01, cpu::GetRegister8(state, cpu::Register8::AH));
    EXPECT_EQ(0x04, cpu::GetRegister8(state, cpu::Register8::CL));
    EXPECT_EQ(0x03, cpu::GetRegister8(state, cpu::Register8::CH));
    EXPECT_EQ(0x06, cpu::GetRegister8(state, cpu::Register8::DL));
    EXPECT_EQ(0x05, cpu::GetRegister8(state, cpu::Register8::DH));
    EXPECT_EQ(0x08, cpu::GetRegister8(state, cpu::Register8::BL));
    EXPECT_EQ(0x07, cpu::GetRegister8(state, cpu::Register8::BH));
}

TEST_F(StateTest, SegmentsMatchSegmentRegisters)
{
    state.m_es = 0x1111; state.m_cs = 0x2222; state.m_ss = 0x3333; state.m_ds = 0x4444;
    EXPECT_EQ(0x1111, cpu::GetSegment(state, cpu::Segment::ES));
    EXPECT_EQ(0x2222, cpu::GetSegment(state, cpu::Segment::CS));
    EXPECT_EQ(0x3333, cpu::GetSegment(state, cpu::Segment::SS));
    EXPECT_EQ(0x4444, cpu::GetSegment(state, cpu::Segment::DS));
}

TEST(StateDeathTest, InvalidRegister16IsFatal)
{
    cpu::State state{};
    EXPECT_DEATH(cpu::SetRegister16(state, static_cast<cpu::Register16>(12), 0), "invalid 16-bit register 12");
}

TEST(StateDeathTest, InvalidRegister8IsFatal)
{
    cpu::State state{};
    EXPECT_DEATH(cpu::SetRegister8(state, static_cast<cpu::Register8>(8), 0), "invalid 8-bit register 8");
}
