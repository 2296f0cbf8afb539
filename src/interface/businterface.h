#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace memory
{
    using Address = uint32_t;

    // Real-mode physical address space is 20 bits wide
    constexpr inline Address AddressMask = 0xf'ffff;
    constexpr inline size_t AddressSpaceSize = AddressMask + 1;
}

namespace bus
{
    // Clock cycles consumed by a bus access
    using Cycles = unsigned int;

    template<typename T>
    struct Access
    {
        T value;
        Cycles cycles;
    };

    class Fault : public std::runtime_error
    {
      public:
        enum class Reason {
            Unmapped,
            DeviceError
        };

        Fault(Reason reason, memory::Address addr, unsigned int width);

        Reason GetReason() const { return reason; }
        memory::Address GetAddress() const { return addr; }
        unsigned int GetWidth() const { return width; }

      private:
        Reason reason;
        memory::Address addr;
        unsigned int width;
    };

    std::string ToString(Fault::Reason reason);
}

class MemoryMappedPeripheral
{
  public:
    virtual ~MemoryMappedPeripheral() = default;

    // May throw bus::Fault (DeviceError) when the device cannot complete the access
    virtual uint8_t ReadByte(memory::Address addr) = 0;
    virtual uint16_t ReadWord(memory::Address addr) = 0;

    virtual void WriteByte(memory::Address addr, uint8_t data) = 0;
    virtual void WriteWord(memory::Address addr, uint16_t data) = 0;
};

//! \brief System bus as seen from the CPU
//!
//! Every access either completes and reports the cycles it took, or throws
//! bus::Fault.
struct BusInterface
{
    virtual ~BusInterface() = default;

    virtual bus::Access<uint8_t> ReadByte(memory::Address addr) = 0;
    virtual bus::Access<uint16_t> ReadWord(memory::Address addr) = 0;

    virtual bus::Cycles WriteByte(memory::Address addr, uint8_t data) = 0;
    virtual bus::Cycles WriteWord(memory::Address addr, uint16_t data) = 0;

    virtual void AddPeripheral(memory::Address base, uint32_t length, MemoryMappedPeripheral& peripheral) = 0;

    virtual void* GetPointer(memory::Address addr, uint32_t length) = 0;
};
