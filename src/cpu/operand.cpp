#include "operand.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <iterator>
#include <string>
#include <utility>
#include "spdlog/fmt/fmt.h"

namespace cpu
{
    namespace
    {
        constexpr std::array<std::pair<std::string_view, Register8>, 8> reg8Names{ {
            { "al", Register8::AL }, { "cl", Register8::CL }, { "dl", Register8::DL }, { "bl", Register8::BL },
            { "ah", Register8::AH }, { "ch", Register8::CH }, { "dh", Register8::DH }, { "bh", Register8::BH },
        } };

        constexpr std::array<std::pair<std::string_view, Register16>, 12> reg16Names{ {
            { "ax", Register16::AX }, { "cx", Register16::CX }, { "dx", Register16::DX }, { "bx", Register16::BX },
            { "sp", Register16::SP }, { "bp", Register16::BP }, { "si", Register16::SI }, { "di", Register16::DI },
            { "es", Register16::ES }, { "cs", Register16::CS }, { "ss", Register16::SS }, { "ds", Register16::DS },
        } };

        constexpr std::array<std::pair<std::string_view, mode::Base>, 8> baseNames{ {
            { "bx+si", mode::Base::BxSi }, { "bx+di", mode::Base::BxDi },
            { "bp+si", mode::Base::BpSi }, { "bp+di", mode::Base::BpDi },
            { "si", mode::Base::Si }, { "di", mode::Base::Di },
            { "bp", mode::Base::Bp }, { "bx", mode::Base::Bx },
        } };

        constexpr std::array<std::pair<std::string_view, SegmentOverride>, 4> overrideNames{ {
            { "es", SegmentOverride::ES }, { "cs", SegmentOverride::CS },
            { "ss", SegmentOverride::SS }, { "ds", SegmentOverride::DS },
        } };

        template<typename T, size_t N>
        std::optional<T> Lookup(const std::array<std::pair<std::string_view, T>, N>& table, std::string_view name)
        {
            const auto it = std::find_if(table.begin(), table.end(), [&](const auto& e) {
                return e.first == name;
            });
            if (it == table.end())
                return {};
            return it->second;
        }

        template<typename T, size_t N>
        std::string_view NameOf(const std::array<std::pair<std::string_view, T>, N>& table, T value)
        {
            const auto it = std::find_if(table.begin(), table.end(), [&](const auto& e) {
                return e.second == value;
            });
            return it != table.end() ? it->first : "?";
        }

        std::string FormatSigned(int value, int digits)
        {
            const char sign = value < 0 ? '-' : '+';
            const unsigned int magnitude = value < 0 ? -value : value;
            return fmt::format("{}0x{:0{}x}", sign, magnitude, digits);
        }

        struct Number
        {
            uint32_t value;
            size_t digits;
        };

        // "0x" followed by 1..8 hex digits, nothing else
        std::optional<Number> ParseHex(std::string_view s)
        {
            if (s.size() < 3 || s[0] != '0' || (s[1] != 'x' && s[1] != 'X'))
                return {};
            s.remove_prefix(2);
            if (s.size() > 8)
                return {};
            uint32_t value{};
            const auto [ ptr, ec ] = std::from_chars(s.data(), s.data() + s.size(), value, 16);
            if (ec != std::errc() || ptr != s.data() + s.size())
                return {};
            return Number{ value, s.size() };
        }

        std::optional<std::pair<uint16_t, uint16_t>> ParseSegOff(std::string_view s)
        {
            const auto colon = s.find(':');
            if (colon == std::string_view::npos || colon == 0 || colon > 4 || s.size() - colon - 1 > 4 || s.size() == colon + 1)
                return {};
            uint16_t seg{}, off{};
            const auto segEnd = s.data() + colon;
            if (const auto [ ptr, ec ] = std::from_chars(s.data(), segEnd, seg, 16); ec != std::errc() || ptr != segEnd)
                return {};
            const auto offEnd = s.data() + s.size();
            if (const auto [ ptr, ec ] = std::from_chars(segEnd + 1, offEnd, off, 16); ec != std::errc() || ptr != offEnd)
                return {};
            return std::pair{ seg, off };
        }

        // Signed displacement as written after a base: "+0x10", "-0x4", "+0x1234"
        std::optional<Displacement> ParseDisplacement(std::string_view s)
        {
            if (s.empty())
                return disp::None{};
            const bool negative = s[0] == '-';
            if (!negative && s[0] != '+')
                return {};
            const auto num = ParseHex(s.substr(1));
            if (!num)
                return {};
            if (num->digits <= 2) {
                if (num->value > (negative ? 0x80u : 0x7fu))
                    return {};
                const int v = negative ? -static_cast<int>(num->value) : static_cast<int>(num->value);
                return disp::Disp8{ static_cast<int8_t>(v) };
            }
            if (num->digits <= 4) {
                const auto v = static_cast<uint16_t>(num->value);
                return disp::Disp16{ negative ? static_cast<uint16_t>(-v) : v };
            }
            return {};
        }

        std::optional<AddressingMode> ParseMemory(std::string_view s)
        {
            if (s.size() < 3 || s.front() != '[' || s.back() != ']')
                return {};
            s = s.substr(1, s.size() - 2);

            if (const auto num = ParseHex(s); num) {
                if (num->digits > 4)
                    return {};
                return mode::Direct{ static_cast<uint16_t>(num->value) };
            }

            // Longest base name first, so "bx+si" wins over "bx"
            for (const auto& [ name, base ] : baseNames) {
                if (s.substr(0, name.size()) != name)
                    continue;
                if (const auto d = ParseDisplacement(s.substr(name.size())); d)
                    return mode::Indexed{ base, *d };
            }
            return {};
        }

        std::optional<Operand> ParseRelative(std::string_view s, bool wide)
        {
            if (s.empty())
                return {};
            const bool negative = s[0] == '-';
            if (!negative && s[0] != '+')
                return {};
            const auto num = ParseHex(s.substr(1));
            if (!num)
                return {};
            const auto limit = wide ? (negative ? 0x8000u : 0x7fffu) : (negative ? 0x80u : 0x7fu);
            if (num->value > limit)
                return {};
            const int v = negative ? -static_cast<int>(num->value) : static_cast<int>(num->value);
            if (wide)
                return operand::Relative16{ static_cast<int16_t>(v) };
            return operand::Relative8{ static_cast<int8_t>(v) };
        }

        std::optional<uint16_t> ParseWord(std::string_view s)
        {
            const auto num = ParseHex(s);
            if (!num || num->digits > 4)
                return {};
            return static_cast<uint16_t>(num->value);
        }

        std::string_view StripPrefix(std::string_view s, std::string_view prefix)
        {
            return s.substr(prefix.size());
        }

        bool StartsWith(std::string_view s, std::string_view prefix)
        {
            return s.substr(0, prefix.size()) == prefix;
        }
    }

    uint16_t DisplacementValue(const Displacement& d)
    {
        return std::visit(overloaded{
            [](const disp::None&) -> uint16_t {
                return 0;
            },
            [](const disp::Disp8& d8) -> uint16_t {
                return static_cast<uint16_t>(static_cast<int16_t>(d8.value));
            },
            [](const disp::Disp16& d16) -> uint16_t {
                return d16.value;
            } }, d);
    }

    std::string ToString(const AddressingMode& m)
    {
        return std::visit(overloaded{
            [](const mode::Indexed& ind) {
                const auto base = NameOf(baseNames, ind.base);
                const auto d = std::visit(overloaded{
                    [](const disp::None&) { return std::string{}; },
                    [](const disp::Disp8& d8) { return FormatSigned(d8.value, 2); },
                    [](const disp::Disp16& d16) { return fmt::format("+0x{:04x}", d16.value); }
                }, ind.disp);
                return fmt::format("[{}{}]", base, d);
            },
            [](const mode::Direct& direct) {
                return fmt::format("[0x{:04x}]", direct.disp16);
            },
            [](const mode::RegisterMode&) {
                return std::string{ "<register mode>" };
            } }, m);
    }

    std::string ToString(const Operand& op)
    {
        return std::visit(overloaded{
            [](const operand::Immediate8& imm) { return fmt::format("0x{:02x}", imm.value); },
            [](const operand::Immediate16& imm) { return fmt::format("0x{:04x}", imm.value); },
            [](const operand::Relative8& rel) { return "rel8 " + FormatSigned(rel.value, 2); },
            [](const operand::Relative16& rel) { return "rel16 " + FormatSigned(rel.value, 4); },
            [](const operand::Offset8& o) { return fmt::format("offset8 0x{:04x}", o.offset); },
            [](const operand::Offset16& o) { return fmt::format("offset16 0x{:04x}", o.offset); },
            [](const operand::Reg8& r) { return std::string{ ToString(r.reg) }; },
            [](const operand::Reg16& r) { return std::string{ ToString(r.reg) }; },
            [](const operand::Memory& mem) { return ToString(mem.mode); },
            [](const operand::NearAddress& near) { return fmt::format("near 0x{:04x}", near.offset); },
            [](const operand::FarAddress& far) { return fmt::format("{:04x}:{:04x}", far.segment, far.offset); },
            [](const operand::NoOperand&) { return std::string{ "<none>" }; },
            [](const operand::InvalidOperand&) { return std::string{ "<invalid>" }; }
        }, op);
    }

    std::string ToString(const Operand& op, SegmentOverride seg_override)
    {
        if (seg_override != SegmentOverride::None && std::holds_alternative<operand::Memory>(op))
            return fmt::format("{}:{}", ToString(seg_override), ToString(op));
        return ToString(op);
    }

    const char* ToString(SegmentOverride seg_override)
    {
        switch (seg_override) {
            case SegmentOverride::None: return "none";
            case SegmentOverride::ES: return "es";
            case SegmentOverride::CS: return "cs";
            case SegmentOverride::SS: return "ss";
            case SegmentOverride::DS: return "ds";
        }
        return "?";
    }

    std::optional<ParsedOperand> ParseOperand(std::string_view input)
    {
        std::string text;
        std::transform(input.begin(), input.end(), std::back_inserter(text), [](unsigned char ch) {
            return static_cast<char>(std::tolower(ch));
        });
        std::erase_if(text, [](unsigned char ch) { return std::isspace(ch) != 0; });
        std::string_view s{ text };

        auto plain = [](Operand op) {
            return ParsedOperand{ std::move(op), SegmentOverride::None };
        };

        if (s == "<none>")
            return plain(operand::NoOperand{});
        if (s == "<invalid>")
            return plain(operand::InvalidOperand{});
        if (const auto r = Lookup(reg8Names, s); r)
            return plain(operand::Reg8{ *r });
        if (const auto r = Lookup(reg16Names, s); r)
            return plain(operand::Reg16{ *r });

        if (StartsWith(s, "rel8")) {
            if (auto op = ParseRelative(StripPrefix(s, "rel8"), false); op)
                return plain(*op);
            return {};
        }
        if (StartsWith(s, "rel16")) {
            if (auto op = ParseRelative(StripPrefix(s, "rel16"), true); op)
                return plain(*op);
            return {};
        }
        if (StartsWith(s, "offset8")) {
            if (const auto w = ParseWord(StripPrefix(s, "offset8")); w)
                return plain(operand::Offset8{ *w });
            return {};
        }
        if (StartsWith(s, "offset16")) {
            if (const auto w = ParseWord(StripPrefix(s, "offset16")); w)
                return plain(operand::Offset16{ *w });
            return {};
        }
        if (StartsWith(s, "near")) {
            if (const auto w = ParseWord(StripPrefix(s, "near")); w)
                return plain(operand::NearAddress{ *w });
            return {};
        }

        // Memory operand, optionally with a segment prefix
        auto seg_override = SegmentOverride::None;
        if (s.size() > 3 && s[2] == ':' && s[3] == '[') {
            const auto o = Lookup(overrideNames, s.substr(0, 2));
            if (!o)
                return {};
            seg_override = *o;
            s.remove_prefix(3);
        }
        if (!s.empty() && s.front() == '[') {
            if (const auto m = ParseMemory(s); m)
                return ParsedOperand{ operand::Memory{ *m }, seg_override };
            return {};
        }

        if (const auto segoff = ParseSegOff(s); segoff)
            return plain(operand::FarAddress{ segoff->first, segoff->second });

        if (const auto num = ParseHex(s); num) {
            if (num->digits <= 2)
                return plain(operand::Immediate8{ static_cast<uint8_t>(num->value) });
            if (num->digits <= 4)
                return plain(operand::Immediate16{ static_cast<uint16_t>(num->value) });
        }
        return {};
    }
}
