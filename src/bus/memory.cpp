#include "memory.h"
#include <algorithm>
#include <stdexcept>
#include <vector>

#include "../logger.h"

namespace
{
    struct Mapping
    {
        const memory::Address base;
        const uint32_t length;
        MemoryMappedPeripheral& peripheral;

        bool Matches(memory::Address addr) const {
            return addr >= base && addr < base + length;
        }
    };

    constexpr memory::Address NextAddress(memory::Address addr)
    {
        return (addr + 1) & memory::AddressMask;
    }
}

uint32_t bus::RamSizeFromKilobytes(uint32_t kb)
{
    if (kb == 0 || kb > memory::AddressSpaceSize / 1024)
        throw std::runtime_error(fmt::format("ram size must be between 1 and {} KB", memory::AddressSpaceSize / 1024));
    return kb * 1024;
}

struct Memory::Impl
{
    const bus::Config config;
    std::unique_ptr<uint8_t[]> memory;
    std::vector<Mapping> mappings;
    std::shared_ptr<spdlog::logger> logger;

    explicit Impl(const bus::Config& config);
    void Reset();

    const Mapping* FindMapping(memory::Address addr) const;
    bool IsRAM(memory::Address addr) const { return addr < config.ram_size; }
    bool IsMapped(memory::Address addr) const { return FindMapping(addr) || IsRAM(addr); }

    bus::Cycles ByteCycles() const;
    bus::Cycles WordCycles(memory::Address addr) const;

    uint8_t LoadByte(memory::Address addr);
    uint16_t LoadWord(memory::Address addr);
    void StoreByte(memory::Address addr, uint8_t data);
    void StoreWord(memory::Address addr, uint16_t data);

    [[noreturn]] void Unmapped(memory::Address addr, unsigned int width);
    [[noreturn]] void WordFailed(const bus::Fault& fault, memory::Address addr);
};

Memory::Impl::Impl(const bus::Config& config)
    : config(config)
    , logger(ObtainLogger("bus"))
{
    if (config.ram_size == 0 || config.ram_size > memory::AddressSpaceSize)
        throw std::runtime_error("invalid ram size");
    memory = std::make_unique<uint8_t[]>(config.ram_size);
    Reset();
}

void Memory::Impl::Reset()
{
    std::fill(memory.get(), memory.get() + config.ram_size, 0);
}

const Mapping* Memory::Impl::FindMapping(memory::Address addr) const
{
    const auto it = std::find_if(mappings.begin(), mappings.end(), [&](const auto& m) {
        return m.Matches(addr);
    });
    return it != mappings.end() ? &*it : nullptr;
}

bus::Cycles Memory::Impl::ByteCycles() const
{
    return bus::ClocksPerBusCycle + config.wait_states;
}

bus::Cycles Memory::Impl::WordCycles(memory::Address addr) const
{
    // The 8086 moves an aligned word in one bus cycle; the 8088 always needs two
    const bool single = config.data_bus == bus::DataBusWidth::Bits16 && (addr & 1) == 0;
    return (single ? 1 : 2) * ByteCycles();
}

void Memory::Impl::Unmapped(memory::Address addr, unsigned int width)
{
    logger->warn("access to unmapped address {:05x} ({}-bit)", addr, width);
    throw bus::Fault(bus::Fault::Reason::Unmapped, addr, width);
}

void Memory::Impl::WordFailed(const bus::Fault& fault, memory::Address addr)
{
    logger->warn("word access at {:05x} failed: {}", addr, fault.what());
    throw bus::Fault(fault.GetReason(), addr, 16);
}

uint8_t Memory::Impl::LoadByte(memory::Address addr)
{
    if (const auto m = FindMapping(addr); m)
        return m->peripheral.ReadByte(addr);
    if (!IsRAM(addr))
        Unmapped(addr, 8);
    return memory[addr];
}

uint16_t Memory::Impl::LoadWord(memory::Address addr)
{
    const auto next = NextAddress(addr);
    if (const auto m = FindMapping(addr); m && m->Matches(next))
        return m->peripheral.ReadWord(addr);
    if (!FindMapping(addr) && !FindMapping(next) && IsRAM(addr) && IsRAM(next))
        return memory[addr] | static_cast<uint16_t>(memory[next]) << 8;

    // Straddles a boundary; split into byte accesses so each half goes where it belongs
    if (!IsMapped(addr))
        Unmapped(addr, 16);
    if (!IsMapped(next))
        Unmapped(next, 16);
    try {
        const uint16_t lo = LoadByte(addr);
        const uint16_t hi = LoadByte(next);
        return lo | (hi << 8);
    } catch (const bus::Fault& fault) {
        WordFailed(fault, addr);
    }
}

void Memory::Impl::StoreByte(memory::Address addr, uint8_t data)
{
    if (const auto m = FindMapping(addr); m) {
        m->peripheral.WriteByte(addr, data);
    } else if (IsRAM(addr)) {
        memory[addr] = data;
    } else {
        Unmapped(addr, 8);
    }
}

void Memory::Impl::StoreWord(memory::Address addr, uint16_t data)
{
    const auto next = NextAddress(addr);
    if (const auto m = FindMapping(addr); m && m->Matches(next)) {
        m->peripheral.WriteWord(addr, data);
    } else if (!FindMapping(addr) && !FindMapping(next) && IsRAM(addr) && IsRAM(next)) {
        memory[addr] = data & 0xff;
        memory[next] = data >> 8;
    } else {
        // Both halves must be mapped before anything is stored
        if (!IsMapped(addr))
            Unmapped(addr, 16);
        if (!IsMapped(next))
            Unmapped(next, 16);

        // A device refusing either half fails the whole word; RAM keeps its old contents
        const bool low_in_ram = FindMapping(addr) == nullptr;
        const uint8_t previous = low_in_ram ? memory[addr] : 0;
        try {
            StoreByte(addr, data & 0xff);
            StoreByte(next, data >> 8);
        } catch (const bus::Fault& fault) {
            if (low_in_ram)
                memory[addr] = previous;
            WordFailed(fault, addr);
        }
    }
}

Memory::Memory()
    : Memory(bus::Config{})
{
}

Memory::Memory(const bus::Config& config)
    : impl(std::make_unique<Impl>(config))
{
}

Memory::~Memory() = default;

void Memory::Reset() { impl->Reset(); }

const bus::Config& Memory::GetConfig() const { return impl->config; }

bus::Access<uint8_t> Memory::ReadByte(memory::Address addr)
{
    addr &= memory::AddressMask;
    return { impl->LoadByte(addr), impl->ByteCycles() };
}

bus::Access<uint16_t> Memory::ReadWord(memory::Address addr)
{
    addr &= memory::AddressMask;
    return { impl->LoadWord(addr), impl->WordCycles(addr) };
}

bus::Cycles Memory::WriteByte(memory::Address addr, uint8_t data)
{
    addr &= memory::AddressMask;
    impl->StoreByte(addr, data);
    return impl->ByteCycles();
}

bus::Cycles Memory::WriteWord(memory::Address addr, uint16_t data)
{
    addr &= memory::AddressMask;
    impl->StoreWord(addr, data);
    return impl->WordCycles(addr);
}

void Memory::AddPeripheral(memory::Address base, uint32_t length, MemoryMappedPeripheral& peripheral)
{
    impl->mappings.push_back(Mapping{ base, length, peripheral });
}

void* Memory::GetPointer(memory::Address addr, uint32_t length)
{
    const auto ram_size = impl->config.ram_size;
    if (addr > ram_size || length > ram_size - addr)
        return nullptr;
    const auto last = addr + length;
    const auto overlaps = std::any_of(impl->mappings.begin(), impl->mappings.end(), [&](const auto& m) {
        return addr < m.base + m.length && m.base < last;
    });
    if (overlaps)
        return nullptr;
    return &impl->memory[addr];
}
