#include "cpu/address.h"
#include "cpu/operand.h"
#include "cpu/operandaccessor.h"
#include "cpu/state.h"
#include "bus/memory.h"

#include <array>
#include <charconv>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "argparse/argparse.hpp"
#include "spdlog/spdlog.h"
#include "spdlog/cfg/env.h"
#include "spdlog/fmt/fmt.h"

namespace {

constexpr inline std::array<std::pair<const char*, cpu::Register16>, 12> registerOptions{ {
    { "--ax", cpu::Register16::AX }, { "--bx", cpu::Register16::BX },
    { "--cx", cpu::Register16::CX }, { "--dx", cpu::Register16::DX },
    { "--sp", cpu::Register16::SP }, { "--bp", cpu::Register16::BP },
    { "--si", cpu::Register16::SI }, { "--di", cpu::Register16::DI },
    { "--es", cpu::Register16::ES }, { "--cs", cpu::Register16::CS },
    { "--ss", cpu::Register16::SS }, { "--ds", cpu::Register16::DS },
} };

template<typename T>
T parse_hex(const std::string& s, const char* what)
{
    T result{};
    const auto [ ptr, ec ] = std::from_chars(s.data(), s.data() + s.size(), result, 16);
    if (ec != std::errc() || ptr != s.data() + s.size()) {
        throw std::runtime_error(std::string("unable to parse ") + what + " '" + s + "'");
    }
    return result;
}

template<typename T>
T parse_decimal(const std::string& s, const char* what)
{
    T result{};
    const auto [ ptr, ec ] = std::from_chars(s.data(), s.data() + s.size(), result);
    if (ec != std::errc() || ptr != s.data() + s.size()) {
        throw std::runtime_error(std::string("unable to parse ") + what + " '" + s + "'");
    }
    return result;
}

memory::Address decode_address(const std::string& s)
{
    if (const auto n = s.find(':'); n != std::string::npos) {
        const auto seg = parse_hex<uint16_t>(s.substr(0, n), "segment");
        const auto off = parse_hex<uint16_t>(s.substr(n + 1), "offset");
        return cpu::MakeAddr(seg, off);
    }
    return parse_hex<memory::Address>(s, "address") & memory::AddressMask;
}

// file@seg:off
void load_image(Memory& memory, const std::string& arg)
{
    const auto at = arg.rfind('@');
    if (at == std::string::npos) throw std::runtime_error("expected file@address, got '" + arg + "'");
    const auto fname = arg.substr(0, at);
    const auto base = decode_address(arg.substr(at + 1));

    std::ifstream ifs(fname, std::ifstream::binary);
    if (!ifs) throw std::runtime_error(std::string("cannot open '") + fname + "'");

    ifs.seekg(0, std::ifstream::end);
    const std::streamoff length = ifs.tellg();
    ifs.seekg(0);
    if (length < 0 || length > static_cast<std::streamoff>(memory::AddressSpaceSize))
        throw std::runtime_error(std::string("cannot determine a usable size of '") + fname + "'");

    const auto ptr = memory.GetPointer(base, static_cast<uint32_t>(length));
    if (!ptr) throw std::runtime_error("cannot obtain pointer to memory");
    spdlog::info("Loading '{}' at address 0x{:x}", fname, base);

    ifs.read(static_cast<char*>(ptr), length);
    if (!ifs || ifs.gcount() != length)
        throw std::runtime_error("read error");
}

cpu::SegmentOverride decode_override(const std::string& s)
{
    if (s == "es") return cpu::SegmentOverride::ES;
    if (s == "cs") return cpu::SegmentOverride::CS;
    if (s == "ss") return cpu::SegmentOverride::SS;
    if (s == "ds") return cpu::SegmentOverride::DS;
    throw std::runtime_error("invalid segment override '" + s + "'");
}

bus::Config make_bus_config(const argparse::ArgumentParser& prog)
{
    bus::Config config;
    config.ram_size = bus::RamSizeFromKilobytes(parse_decimal<uint32_t>(prog.get<std::string>("--ram-size"), "ram size"));
    config.wait_states = parse_decimal<unsigned int>(prog.get<std::string>("--wait-states"), "wait states");
    const auto width = prog.get<std::string>("--bus-width");
    if (width == "8") {
        config.data_bus = bus::DataBusWidth::Bits8;
    } else if (width == "16") {
        config.data_bus = bus::DataBusWidth::Bits16;
    } else {
        throw std::runtime_error("bus width must be 8 or 16");
    }
    return config;
}

void print_location(const cpu::Operand& op, cpu::SegmentOverride seg_override, const cpu::State& state)
{
    const auto mem = std::get_if<cpu::operand::Memory>(&op);
    if (!mem) {
        std::cout << cpu::ToString(op) << ": not a memory operand\n";
        return;
    }
    const auto ea = cpu::CalculateEffectiveAddress(mem->mode, seg_override, state);
    std::cout << fmt::format("{}: segment {:04x} offset {:04x} linear {:05x}\n",
        cpu::ToString(op, seg_override), ea.seg, ea.off, cpu::MakeAddr(ea));
}

int run(const argparse::ArgumentParser& prog)
{
    const auto command = prog.get<std::string>("command");
    const auto parsed = cpu::ParseOperand(prog.get<std::string>("operand"));
    if (!parsed) throw std::runtime_error("cannot parse operand '" + prog.get<std::string>("operand") + "'");

    auto seg_override = parsed->seg_override;
    if (auto seg = prog.present("--seg"); seg) {
        const auto o = decode_override(*seg);
        if (seg_override != cpu::SegmentOverride::None && seg_override != o)
            throw std::runtime_error("conflicting segment overrides");
        seg_override = o;
    }

    cpu::State state;
    cpu::Reset(state);
    state.m_cs = 0;
    for (const auto& [ option, reg ] : registerOptions) {
        if (auto v = prog.present(option); v) {
            cpu::SetRegister16(state, reg, parse_hex<uint16_t>(*v, option + 2));
        }
    }
    cpu::Dump(state);

    Memory memory(make_bus_config(prog));
    for (const auto& image : prog.get<std::vector<std::string>>("--load")) {
        load_image(memory, image);
    }

    cpu::OperandAccessor accessor(state);
    const auto& op = parsed->operand;

    if (command == "ea") {
        print_location(op, seg_override, state);
        return 0;
    }

    if (command == "read8" || command == "read16") {
        std::optional<bus::Access<uint16_t>> result;
        if (command == "read8") {
            if (const auto r = accessor.Read8(memory, op, seg_override); r)
                result = bus::Access<uint16_t>{ r->value, r->cycles };
        } else {
            result = accessor.Read16(memory, op, seg_override);
        }
        if (!result) {
            std::cout << cpu::ToString(op, seg_override) << ": no " << command.substr(4) << "-bit value\n";
            return 1;
        }
        const int digits = command == "read8" ? 2 : 4;
        std::cout << fmt::format("{} = {:0{}x} ({} cycles)\n", cpu::ToString(op, seg_override), result->value, digits, result->cycles);
        return 0;
    }

    if (command == "write8" || command == "write16") {
        auto value = prog.present("--value");
        if (!value) throw std::runtime_error(command + " requires --value");
        bus::Cycles cycles{};
        if (command == "write8") {
            cycles = accessor.Write8(memory, op, seg_override, parse_hex<uint8_t>(*value, "value"));
            const auto r = accessor.Read8(memory, op, seg_override);
            std::cout << fmt::format("{} <- {} ({} cycles)", cpu::ToString(op, seg_override), *value, cycles);
            if (r) std::cout << fmt::format(", now {:02x}", r->value);
        } else {
            cycles = accessor.Write16(memory, op, seg_override, parse_hex<uint16_t>(*value, "value"));
            const auto r = accessor.Read16(memory, op, seg_override);
            std::cout << fmt::format("{} <- {} ({} cycles)", cpu::ToString(op, seg_override), *value, cycles);
            if (r) std::cout << fmt::format(", now {:04x}", r->value);
        }
        std::cout << '\n';
        cpu::Dump(state);
        return 0;
    }

    throw std::runtime_error("unknown command '" + command + "'");
}

}

// Use SPDLOG_LEVEL=trace to see every operand access
int main(int argc, char** argv)
{
    argparse::ArgumentParser prog("x86ea");
    prog.add_argument("command")
        .help("ea, read8, read16, write8 or write16");
    prog.add_argument("operand")
        .help("operand, e.g. 'es:[bx+si+0x10]', 'al' or '[0x1234]'");
    prog.add_argument("--value")
        .help("value to write (hex)");
    prog.add_argument("--seg")
        .help("segment override (es, cs, ss or ds)");
    for (const auto& [ option, reg ] : registerOptions) {
        prog.add_argument(option)
            .help(std::string("initial value of ") + cpu::ToString(reg) + " (hex)");
    }
    prog.add_argument("--ram-size")
        .help("installed memory in KB")
        .default_value(std::string("1024"));
    prog.add_argument("--wait-states")
        .help("wait states per bus cycle")
        .default_value(std::string("0"));
    prog.add_argument("--bus-width")
        .help("data bus width, 8 (8088) or 16 (8086)")
        .default_value(std::string("8"));
    prog.add_argument("--load")
        .append()
        .default_value(std::vector<std::string>{})
        .help("load binary image into memory, file@seg:off");
    try {
        prog.parse_args(argc, argv);
    } catch(const std::runtime_error& e) {
        std::cerr << e.what() << '\n';
        std::cerr << prog;
        return 1;
    }

    spdlog::set_level(spdlog::level::warn);
    spdlog::cfg::load_env_levels();

    try {
        return run(prog);
    } catch(const bus::Fault& e) {
        std::cerr << e.what() << '\n';
        return 2;
    } catch(const std::runtime_error& e) {
        std::cerr << e.what() << '\n';
        return 1;
    }
}
