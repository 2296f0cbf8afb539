#include "gtest/gtest.h"
#include "gmock/gmock.h"
#include "cpu/address.h"
#include "cpu/operandaccessor.h"
#include "cpu_helper.h"

#include <array>
#include <vector>

using namespace cpu_helper;
using ::testing::_;
using ::testing::Throw;
using cpu::mode::Base;
using cpu::SegmentOverride;

namespace
{
    constexpr inline auto None = SegmentOverride::None;

    // Operands which are neither registers nor memory
    const std::vector<cpu::Operand> encodingOnlyOperands{
        cpu::operand::Immediate8{ 0x12 },
        cpu::operand::Immediate16{ 0x1234 },
        cpu::operand::Relative8{ -1 },
        cpu::operand::Relative16{ -1 },
        cpu::operand::Offset8{ 0x10 },
        cpu::operand::Offset16{ 0x10 },
        cpu::operand::NearAddress{ 0x100 },
        cpu::operand::FarAddress{ 0x1000, 0x100 },
        cpu::operand::NoOperand{},
        cpu::operand::InvalidOperand{},
    };

    std::array<uint16_t, 13> Snapshot(const cpu::State& st)
    {
        return { st.m_ax, st.m_cx, st.m_dx, st.m_bx, st.m_sp, st.m_bp, st.m_si, st.m_di,
                 st.m_es, st.m_cs, st.m_ss, st.m_ds, st.m_flags };
    }

    struct OperandAccessorTest : ::testing::Test
    {
        testing::NiceMock<BusMock> bus;
        cpu::State state;
        StateBuilder sb{ state };
        cpu::OperandAccessor accessor{ state };

        OperandAccessorTest()
        {
            ResetState(state);
        }

        void ExpectNoBusAccess()
        {
            EXPECT_CALL(bus, ReadByte(_)).Times(0);
            EXPECT_CALL(bus, ReadWord(_)).Times(0);
            EXPECT_CALL(bus, WriteByte(_, _)).Times(0);
            EXPECT_CALL(bus, WriteWord(_, _)).Times(0);
        }
    };
}

TEST_F(OperandAccessorTest, Read8Immediate)
{
    ExpectNoBusAccess();
    const auto r = accessor.Read8(bus, cpu::operand::Immediate8{ 0xa5 }, None);
    ASSERT_TRUE(r);
    EXPECT_EQ(0xa5, r->value);
    EXPECT_EQ(0, r->cycles);
}

TEST_F(OperandAccessorTest, Read8RelativeKeepsBitPattern)
{
    ExpectNoBusAccess();
    EXPECT_EQ(0xff, accessor.Read8(bus, cpu::operand::Relative8{ -1 }, None)->value);
    EXPECT_EQ(0x80, accessor.Read8(bus, cpu::operand::Relative8{ -128 }, None)->value);
    EXPECT_EQ(0x7f, accessor.Read8(bus, cpu::operand::Relative8{ 127 }, None)->value);
}

TEST_F(OperandAccessorTest, Read8Register)
{
    ExpectNoBusAccess();
    sb.AX(0x1122).CX(0x3344).DX(0x5566).BX(0x7788);
    EXPECT_EQ(0x22, accessor.Read8(bus, cpu::operand::Reg8{ cpu::Register8::AL }, None)->value);
    EXPECT_EQ(0x11, accessor.Read8(bus, cpu::operand::Reg8{ cpu::Register8::AH }, None)->value);
    EXPECT_EQ(0x44, accessor.Read8(bus, cpu::operand::Reg8{ cpu::Register8::CL }, None)->value);
    EXPECT_EQ(0x33, accessor.Read8(bus, cpu::operand::Reg8{ cpu::Register8::CH }, None)->value);
    EXPECT_EQ(0x66, accessor.Read8(bus, cpu::operand::Reg8{ cpu::Register8::DL }, None)->value);
    EXPECT_EQ(0x55, accessor.Read8(bus, cpu::operand::Reg8{ cpu::Register8::DH }, None)->value);
    EXPECT_EQ(0x88, accessor.Read8(bus, cpu::operand::Reg8{ cpu::Register8::BL }, None)->value);
    EXPECT_EQ(0x77, accessor.Read8(bus, cpu::operand::Reg8{ cpu::Register8::BH }, None)->value);
}

TEST_F(OperandAccessorTest, Read8HasNoValueForOtherKinds)
{
    ExpectNoBusAccess();
    const std::vector<cpu::Operand> operands{
        cpu::operand::Immediate16{ 0x1234 },
        cpu::operand::Relative16{ 0x10 },
        cpu::operand::Offset8{ 0x10 },
        cpu::operand::Offset16{ 0x10 },
        cpu::operand::Reg16{ cpu::Register16::AX },
        cpu::operand::NearAddress{ 0x100 },
        cpu::operand::FarAddress{ 0x1000, 0x100 },
        cpu::operand::NoOperand{},
        cpu::operand::InvalidOperand{},
    };
    for (const auto& op : operands) {
        EXPECT_FALSE(accessor.Read8(bus, op, None)) << cpu::ToString(op);
    }
}

TEST_F(OperandAccessorTest, Read16Immediate)
{
    ExpectNoBusAccess();
    const auto r = accessor.Read16(bus, cpu::operand::Immediate16{ 0xbeef }, None);
    ASSERT_TRUE(r);
    EXPECT_EQ(0xbeef, r->value);
    EXPECT_EQ(0, r->cycles);
}

TEST_F(OperandAccessorTest, Read16RelativeKeepsBitPattern)
{
    ExpectNoBusAccess();
    EXPECT_EQ(0xfffe, accessor.Read16(bus, cpu::operand::Relative16{ -2 }, None)->value);
    EXPECT_EQ(0x8000, accessor.Read16(bus, cpu::operand::Relative16{ -32768 }, None)->value);
}

TEST_F(OperandAccessorTest, Read16AllRegisters)
{
    ExpectNoBusAccess();
    sb.AX(0x0001).CX(0x0002).DX(0x0003).BX(0x0004).SP(0x0005).BP(0x0006).SI(0x0007).DI(0x0008);
    sb.ES(0x0009).CS(0x000a).SS(0x000b).DS(0x000c);

    const std::array<cpu::Register16, 12> regs{
        cpu::Register16::AX, cpu::Register16::CX, cpu::Register16::DX, cpu::Register16::BX,
        cpu::Register16::SP, cpu::Register16::BP, cpu::Register16::SI, cpu::Register16::DI,
        cpu::Register16::ES, cpu::Register16::CS, cpu::Register16::SS, cpu::Register16::DS,
    };
    uint16_t expected = 1;
    for (const auto reg : regs) {
        const auto r = accessor.Read16(bus, cpu::operand::Reg16{ reg }, None);
        ASSERT_TRUE(r) << cpu::ToString(reg);
        EXPECT_EQ(expected, r->value) << cpu::ToString(reg);
        ++expected;
    }
}

TEST_F(OperandAccessorTest, Read16HasNoValueForOtherKinds)
{
    ExpectNoBusAccess();
    const std::vector<cpu::Operand> operands{
        cpu::operand::Immediate8{ 0x12 },
        cpu::operand::Relative8{ 0x10 },
        cpu::operand::Offset8{ 0x10 },
        cpu::operand::Offset16{ 0x10 },
        cpu::operand::Reg8{ cpu::Register8::AL },
        cpu::operand::NearAddress{ 0x100 },
        cpu::operand::FarAddress{ 0x1000, 0x100 },
        cpu::operand::NoOperand{},
        cpu::operand::InvalidOperand{},
    };
    for (const auto& op : operands) {
        EXPECT_FALSE(accessor.Read16(bus, op, None)) << cpu::ToString(op);
    }
}

TEST_F(OperandAccessorTest, Read8MemoryUsesStackSegmentForBp)
{
    sb.BP(0x1000);
    const memory::Address addr = initialSS * 16 + 0x1004;
    EXPECT_CALL(bus, ReadByte(addr)).WillOnce(Return(bus::Access<uint8_t>{ 0x5a, 7 }));

    const auto r = accessor.Read8(bus, Mem(Indexed(Base::Bp, cpu::disp::Disp8{ 4 })), None);
    ASSERT_TRUE(r);
    EXPECT_EQ(0x5a, r->value);
    EXPECT_EQ(7, r->cycles);
}

TEST_F(OperandAccessorTest, Read8MemoryHonoursOverride)
{
    sb.BP(0x1000);
    const memory::Address addr = initialDS * 16 + 0x1004;
    EXPECT_CALL(bus, ReadByte(addr)).WillOnce(Return(bus::Access<uint8_t>{ 0x33, 4 }));

    const auto r = accessor.Read8(bus, Mem(Indexed(Base::Bp, cpu::disp::Disp8{ 4 })), SegmentOverride::DS);
    ASSERT_TRUE(r);
    EXPECT_EQ(0x33, r->value);
}

TEST_F(OperandAccessorTest, Read16MemoryThroughBus)
{
    sb.BX(0x0200).SI(0x0050);
    const memory::Address addr = initialES * 16 + 0x0250;
    const std::array<uint8_t, 2> bytes{ 0x34, 0x12 };
    bus.StoreBytes(addr, bytes);
    EXPECT_CALL(bus, ReadWord(addr));

    const auto r = accessor.Read16(bus, Mem(Indexed(Base::BxSi)), SegmentOverride::ES);
    ASSERT_TRUE(r);
    EXPECT_EQ(0x1234, r->value);
    // Two bus cycles on the 8-bit data bus
    EXPECT_EQ(2 * bus::ClocksPerBusCycle, r->cycles);
}

TEST_F(OperandAccessorTest, DirectAddressUsesDataSegment)
{
    const memory::Address addr = initialDS * 16 + 0x1234;
    EXPECT_CALL(bus, ReadWord(addr)).WillOnce(Return(bus::Access<uint16_t>{ 0xcafe, 8 }));
    EXPECT_EQ(0xcafe, accessor.Read16(bus, Mem(cpu::mode::Direct{ 0x1234 }), None)->value);
}

TEST_F(OperandAccessorTest, MemoryAddressWrapsAtOneMegabyte)
{
    sb.DS(0xffff);
    EXPECT_CALL(bus, ReadByte(0x00000)).WillOnce(Return(bus::Access<uint8_t>{ 0x42, 4 }));
    EXPECT_EQ(0x42, accessor.Read8(bus, Mem(cpu::mode::Direct{ 0x0010 }), None)->value);
}

TEST_F(OperandAccessorTest, OffsetWrapsWithinSegment)
{
    sb.BX(0xffff);
    EXPECT_CALL(bus, ReadByte(initialDS * 16)).WillOnce(Return(bus::Access<uint8_t>{ 0x01, 4 }));
    EXPECT_EQ(0x01, accessor.Read8(bus, Mem(Indexed(Base::Bx, cpu::disp::Disp8{ 1 })), None)->value);
}

TEST_F(OperandAccessorTest, Write8Register)
{
    ExpectNoBusAccess();
    sb.BX(0x1234);
    EXPECT_EQ(0, accessor.Write8(bus, cpu::operand::Reg8{ cpu::Register8::BH }, None, 0xab));
    EXPECT_EQ(0xab34, state.m_bx);
    EXPECT_EQ(0, accessor.Write8(bus, cpu::operand::Reg8{ cpu::Register8::BL }, None, 0xcd));
    EXPECT_EQ(0xabcd, state.m_bx);
}

TEST_F(OperandAccessorTest, Write16Register)
{
    ExpectNoBusAccess();
    EXPECT_EQ(0, accessor.Write16(bus, cpu::operand::Reg16{ cpu::Register16::DI }, None, 0x8765));
    EXPECT_EQ(0x8765, state.m_di);
}

TEST_F(OperandAccessorTest, Write16SegmentRegistersIsAllowed)
{
    ExpectNoBusAccess();
    static_cast<void>(accessor.Write16(bus, cpu::operand::Reg16{ cpu::Register16::CS }, None, 0x1111));
    static_cast<void>(accessor.Write16(bus, cpu::operand::Reg16{ cpu::Register16::SS }, None, 0x2222));
    static_cast<void>(accessor.Write16(bus, cpu::operand::Reg16{ cpu::Register16::DS }, None, 0x3333));
    static_cast<void>(accessor.Write16(bus, cpu::operand::Reg16{ cpu::Register16::ES }, None, 0x4444));
    EXPECT_EQ(0x1111, state.m_cs);
    EXPECT_EQ(0x2222, state.m_ss);
    EXPECT_EQ(0x3333, state.m_ds);
    EXPECT_EQ(0x4444, state.m_es);
}

TEST_F(OperandAccessorTest, Write8MemoryReportsBusCycles)
{
    sb.SI(0x0010);
    const memory::Address addr = initialCS * 16 + 0x0008;
    EXPECT_CALL(bus, WriteByte(addr, 0x99)).WillOnce(Return(9));
    EXPECT_EQ(9, accessor.Write8(bus, Mem(Indexed(Base::Si, cpu::disp::Disp8{ -8 })), SegmentOverride::CS, 0x99));
}

TEST_F(OperandAccessorTest, Write16MemoryThroughBus)
{
    sb.BP(0x0100).DI(0x0002);
    const memory::Address addr = initialSS * 16 + 0x0102;
    EXPECT_CALL(bus, WriteWord(addr, 0xabcd));

    const auto cycles = accessor.Write16(bus, Mem(Indexed(Base::BpDi)), None, 0xabcd);
    EXPECT_EQ(2 * bus::ClocksPerBusCycle, cycles);
    EXPECT_EQ(0xabcd, bus.LoadWord(addr));
    EXPECT_EQ(0xcd, bus.LoadByte(addr));
}

TEST_F(OperandAccessorTest, WriteToNonStorableOperandsIsIgnored)
{
    ExpectNoBusAccess();
    sb.AX(0x1234).BX(0x5678).DS(0x9abc);
    const auto before = Snapshot(state);
    for (const auto& op : encodingOnlyOperands) {
        EXPECT_EQ(0, accessor.Write8(bus, op, None, 0xff)) << cpu::ToString(op);
        EXPECT_EQ(0, accessor.Write16(bus, op, None, 0xffff)) << cpu::ToString(op);
    }
    EXPECT_EQ(before, Snapshot(state));
}

TEST_F(OperandAccessorTest, WriteWithMismatchedRegisterWidthIsIgnored)
{
    ExpectNoBusAccess();
    sb.AX(0x1234);
    const auto before = Snapshot(state);
    EXPECT_EQ(0, accessor.Write8(bus, cpu::operand::Reg16{ cpu::Register16::AX }, None, 0xff));
    EXPECT_EQ(0, accessor.Write16(bus, cpu::operand::Reg8{ cpu::Register8::AL }, None, 0xffff));
    EXPECT_EQ(before, Snapshot(state));
}

TEST_F(OperandAccessorTest, BusFaultPropagates)
{
    const auto fault = bus::Fault(bus::Fault::Reason::DeviceError, 0x40000, 8);
    EXPECT_CALL(bus, ReadByte(_)).WillOnce(Throw(fault));
    EXPECT_CALL(bus, WriteWord(_, _)).WillOnce(Throw(fault));

    EXPECT_THROW(static_cast<void>(accessor.Read8(bus, Mem(Indexed(Base::Bx)), None)), bus::Fault);
    EXPECT_THROW(accessor.Write16(bus, Mem(Indexed(Base::Bx)), None, 0x1234), bus::Fault);
}

namespace
{
    struct SmallMemoryTest : ::testing::Test
    {
        // 64KB of RAM, nothing above it
        Memory memory{ bus::Config{ .ram_size = 0x1'0000 } };
        cpu::State state;
        StateBuilder sb{ state };
        cpu::OperandAccessor accessor{ state };

        SmallMemoryTest()
        {
            ResetState(state);
        }
    };
}

TEST_F(SmallMemoryTest, UnmappedReadIsReported)
{
    // ds=4000 lies beyond the installed memory
    try {
        static_cast<void>(accessor.Read16(memory, Mem(Indexed(Base::Si)), None));
        FAIL() << "expected bus fault";
    } catch (const bus::Fault& f) {
        EXPECT_EQ(bus::Fault::Reason::Unmapped, f.GetReason());
        EXPECT_EQ(initialDS * 16u, f.GetAddress());
        EXPECT_EQ(16, f.GetWidth());
    }
}

TEST_F(SmallMemoryTest, UnmappedWriteLeavesRegistersAlone)
{
    sb.AX(0x1234);
    const auto before = Snapshot(state);
    EXPECT_THROW(accessor.Write8(memory, Mem(Indexed(Base::Di)), None, 0x55), bus::Fault);
    EXPECT_EQ(before, Snapshot(state));
}

TEST_F(SmallMemoryTest, MappedAccessSucceeds)
{
    sb.DS(0x0100).BX(0x0010);
    EXPECT_EQ(8, accessor.Write16(memory, Mem(Indexed(Base::Bx)), None, 0x4321));
    EXPECT_EQ(0x21, accessor.Read8(memory, Mem(Indexed(Base::Bx)), None)->value);
    EXPECT_EQ(0x43, accessor.Read8(memory, Mem(Indexed(Base::Bx, cpu::disp::Disp8{ 1 })), None)->value);
}

TEST(OperandAccessorDeathTest, RegisterModeMemoryOperandIsFatal)
{
    testing::NiceMock<BusMock> bus;
    cpu::State state{};
    cpu::OperandAccessor accessor{ state };
    const cpu::Operand op = cpu::operand::Memory{ cpu::mode::RegisterMode{} };
    EXPECT_DEATH(static_cast<void>(accessor.Read8(bus, op, None)), "<register mode>");
    EXPECT_DEATH(accessor.Write16(bus, op, None, 0), "<register mode>");
}

TEST(OperandAccessorDeathTest, InvalidRegister16IsFatal)
{
    testing::NiceMock<BusMock> bus;
    cpu::State state{};
    cpu::OperandAccessor accessor{ state };
    const cpu::Operand op = cpu::operand::Reg16{ static_cast<cpu::Register16>(42) };
    EXPECT_DEATH(accessor.Write16(bus, op, None, 0), "invalid 16-bit register 42");
    EXPECT_DEATH(static_cast<void>(accessor.Read16(bus, op, None)), "invalid 16-bit register 42");
}
