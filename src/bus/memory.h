#pragma once

#include <cstdint>
#include <memory>
#include "../interface/businterface.h"

namespace bus
{
    enum class DataBusWidth {
        Bits8,  // 8088
        Bits16  // 8086
    };

    struct Config
    {
        uint32_t ram_size = memory::AddressSpaceSize;
        unsigned int wait_states = 0;
        DataBusWidth data_bus = DataBusWidth::Bits8;
    };

    // Clocks in a single bus cycle (T1..T4) without wait states
    constexpr inline Cycles ClocksPerBusCycle = 4;

    // Throws std::runtime_error when the size does not fit the address space
    uint32_t RamSizeFromKilobytes(uint32_t kb);
}

class Memory final : public BusInterface
{
    struct Impl;
    std::unique_ptr<Impl> impl;

  public:
    Memory();
    explicit Memory(const bus::Config& config);
    ~Memory();

    void Reset();

    const bus::Config& GetConfig() const;

    bus::Access<uint8_t> ReadByte(memory::Address addr) override;
    bus::Access<uint16_t> ReadWord(memory::Address addr) override;

    bus::Cycles WriteByte(memory::Address addr, uint8_t data) override;
    bus::Cycles WriteWord(memory::Address addr, uint16_t data) override;

    void AddPeripheral(memory::Address base, uint32_t length, MemoryMappedPeripheral& peripheral) override;

    void* GetPointer(memory::Address addr, uint32_t length) override;
};
