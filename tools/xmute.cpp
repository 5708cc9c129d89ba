#include <libxmute/libxmute.hpp>

#include <cstdio> // This include seems to be missing from readline
#include <readline/readline.h>
#include <readline/history.h>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <print>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace
{
struct session
{
    xmute::buffer<std::byte> data;
    std::size_t offset = 0;
    xmute::guard_policy policy = xmute::guard_policy::Exact;

    std::span<const std::byte> view() const
    {
        return data.bytes().subspan(std::min(offset, data.size()));
    }
};

std::vector<std::string> split(std::string_view str, char delimiter)
{
    std::vector<std::string> out{};
    std::stringstream ss{std::string{str}};
    std::string item;

    while (std::getline(ss, item, delimiter))
    {
        if (!item.empty())
        {
            out.push_back(item);
        }
    }

    return out;
}

bool is_prefix(std::string_view str, std::string_view of)
{
    if (str.size() > of.size()) return false;
    return std::equal(str.begin(), str.end(), of.begin());
}

// Wrapper around std::from_chars which allows 0xblah and must use whole str
template <class Integral>
std::optional<Integral> to_integral(std::string_view sv, int base = 10)
{
    auto begin = sv.begin();
    if (base == 16 && sv.size() > 1 && begin[0] == '0' && begin[1] == 'x')
    {
        begin += 2;
    }

    Integral result;
    auto from_chars_result = std::from_chars(begin, sv.end(), result, base);

    if (from_chars_result.ptr != sv.end())
    {
        return std::nullopt;
    }

    return result;
}

template <>
std::optional<std::byte> to_integral(std::string_view sv, int base)
{
    auto as_unsigned_eight_bit = to_integral<std::uint8_t>(sv, base);
    if (!as_unsigned_eight_bit.has_value())
    {
        return std::nullopt;
    }

    return static_cast<std::byte>(as_unsigned_eight_bit.value());
}

std::optional<xmute::guard_policy> guard_policy_by_name(std::string_view name)
{
    if (is_prefix(name, "exact")) return xmute::guard_policy::Exact;
    if (is_prefix(name, "atleast")) return xmute::guard_policy::AtLeast;
    if (is_prefix(name, "single")) return xmute::guard_policy::SingleValue;
    return std::nullopt;
}

std::string_view to_string(xmute::guard_policy policy)
{
    switch (policy)
    {
        case xmute::guard_policy::Exact:
            return "exact";
        case xmute::guard_policy::AtLeast:
            return "atleast";
        case xmute::guard_policy::SingleValue:
            return "single";
    }

    std::unreachable();
}

std::string_view to_string(xmute::error_kind kind)
{
    switch (kind)
    {
        case xmute::error_kind::Unaligned:
            return "Unaligned";
        case xmute::error_kind::InvalidValue:
            return "InvalidValue";
        case xmute::error_kind::SizeMismatch:
            return "SizeMismatch";
        case xmute::error_kind::NotEnoughBytes:
            return "NotEnoughBytes";
    }

    std::unreachable();
}

template <typename T>
std::string format_value(T t)
{
    if constexpr (std::is_same_v<T, bool>)
    {
        return t ? "true" : "false";
    }
    else if constexpr (std::is_floating_point_v<T>)
    {
        return std::format("{}", t);
    }
    else if constexpr (std::is_signed_v<T>)
    {
        return std::format("{}", t);
    }
    else
    {
        return std::format("{:#0{}x}", t, sizeof(T) * 2 + 2);
    }
}

void print_help(const std::vector<std::string>& args)
{
    if (args.size() == 1)
    {
        std::println(R"(Available commands:
            align  - Show the alignment check of the current view
            bytes  - Replace the buffer with hex bytes
            dump   - Print the current view
            load   - Read a file into the buffer
            many   - View the current bytes as a sequence
            offset - Start the view at a byte offset
            one    - Read a single value
            policy - Set the default guard policy
        )");
    }
    else if (is_prefix(args[1], "one") || is_prefix(args[1], "many"))
    {
        std::println(R"(Usage:
            one <type> [exact|atleast|single]
            many <type> [exact|atleast|single]
        Types: u8 i8 u16 i16 u32 i32 u64 i64 f32 f64 bool
        )");
    }
    else if (is_prefix(args[1], "bytes"))
    {
        std::println(R"(Usage:
            bytes <hex> <hex> ...    e.g. bytes 0x01 02 ff
        )");
    }
    else
    {
        std::println("No help available");
    }
}

void print_error(const xmute::error& err)
{
    std::println("xmute error: {}: {}", to_string(err.kind()), err.what());
    if (auto guard = err.guard())
    {
        if (guard->deficit() != 0)
        {
            std::println("  {} more bytes reach the next element boundary", guard->deficit());
        }
        if (guard->surplus() != 0)
        {
            std::println("  drop {} trailing bytes to satisfy the policy", guard->surplus());
        }
    }
    else if (auto unaligned = err.unaligned())
    {
        std::println("  retry with offset +{}", unaligned->offset);
    }
}

template <typename T>
void show_one(const session& state, xmute::guard_policy policy)
{
    auto value = xmute::transmute_one<T>(state.view(), policy);
    std::println("{}", format_value(value));
}

template <typename T>
void show_many(const session& state, xmute::guard_policy policy)
{
    auto values = xmute::transmute_many<T>(state.view(), policy);
    auto unused = state.view().size() - values.size_bytes();

    std::print("{} elements:", values.size());
    for (auto value: values)
    {
        std::print(" {}", format_value(value));
    }
    std::println("");

    if (unused != 0)
    {
        std::println("{} trailing bytes unused", unused);
    }
}

template <typename T>
void show_alignment(const session& state)
{
    auto check = xmute::check_alignment<T>(state.view());
    if (check.is_aligned())
    {
        std::println("Aligned for {} byte alignment", check.alignment);
    }
    else
    {
        std::println("Misaligned for {} byte alignment, skip {} bytes ({} usable)", check.alignment,
                     check.offset_to_next_valid, xmute::usable_bytes(state.view().size(), check));
    }
}

// Calls f with a value of the named type
template <typename F>
bool dispatch_type(std::string_view name, F f)
{
    if (name == "u8") f(std::uint8_t{});
    else if (name == "i8") f(std::int8_t{});
    else if (name == "u16") f(std::uint16_t{});
    else if (name == "i16") f(std::int16_t{});
    else if (name == "u32") f(std::uint32_t{});
    else if (name == "i32") f(std::int32_t{});
    else if (name == "u64") f(std::uint64_t{});
    else if (name == "i64") f(std::int64_t{});
    else if (name == "f32") f(float{});
    else if (name == "f64") f(double{});
    else if (name == "bool") f(bool{});
    else return false;

    return true;
}

void handle_transmute_command(const session& state, const std::vector<std::string>& args)
{
    if (args.size() < 2 || args.size() > 3)
    {
        print_help({"help", args[0]});
        return;
    }

    auto policy = state.policy;
    if (args.size() == 3)
    {
        auto named = guard_policy_by_name(args[2]);
        if (!named)
        {
            std::println("Unknown policy {}", args[2]);
            return;
        }
        policy = *named;
    }

    auto single = is_prefix(args[0], "one");
    auto known = dispatch_type(args[1], [&]<typename T>(T) {
        if (single)
        {
            show_one<T>(state, policy);
        }
        else
        {
            show_many<T>(state, policy);
        }
    });

    if (!known)
    {
        std::println("Unknown type {}", args[1]);
    }
}

void handle_bytes_command(session& state, const std::vector<std::string>& args)
{
    std::vector<std::byte> bytes;
    for (auto it = args.begin() + 1; it != args.end(); ++it)
    {
        auto byte = to_integral<std::byte>(*it, 16);
        if (!byte)
        {
            std::println("Invalid byte {}", *it);
            return;
        }
        bytes.push_back(*byte);
    }

    state.data = xmute::buffer<std::byte>(std::span<const std::byte>{bytes});
    state.offset = 0;
    std::println("Loaded {} bytes", state.data.size());
}

void load_file(session& state, const std::string& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file)
    {
        std::println("Could not open {}", path);
        return;
    }

    std::vector<char> contents{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
    state.data = xmute::buffer<std::byte>(std::as_bytes(std::span<const char>{contents}));
    state.offset = 0;
    std::println("Loaded {} bytes from {}", state.data.size(), path);
}

void handle_dump_command(const session& state)
{
    auto view = state.view();
    for (std::size_t i = 0; i < view.size(); ++i)
    {
        if (i % 16 == 0)
        {
            std::print("{}{:#06x}:", i == 0 ? "" : "\n", state.offset + i);
        }
        std::print(" {:02x}", std::to_integer<unsigned>(view[i]));
    }
    std::println("");
}

void handle_command(session& state, std::string_view line)
{
    auto args = split(line, ' ');
    if (args.empty())
    {
        return;
    }

    auto command = args[0];

    if (is_prefix(command, "help"))
    {
        print_help(args);
    }
    else if (is_prefix(command, "align"))
    {
        if (args.size() != 2 || !dispatch_type(args[1], [&]<typename T>(T) { show_alignment<T>(state); }))
        {
            print_help({"help", "one"});
        }
    }
    else if (is_prefix(command, "bytes"))
    {
        handle_bytes_command(state, args);
    }
    else if (is_prefix(command, "dump"))
    {
        handle_dump_command(state);
    }
    else if (is_prefix(command, "load"))
    {
        if (args.size() != 2)
        {
            std::println("load expects a path");
            return;
        }
        load_file(state, args[1]);
    }
    else if (is_prefix(command, "many") || is_prefix(command, "one"))
    {
        handle_transmute_command(state, args);
    }
    else if (is_prefix(command, "offset"))
    {
        auto offset = args.size() == 2 ? to_integral<std::size_t>(args[1]) : std::nullopt;
        if (!offset || *offset > state.data.size())
        {
            std::println("offset expects a position within the {} byte buffer", state.data.size());
            return;
        }
        state.offset = *offset;
    }
    else if (is_prefix(command, "policy"))
    {
        auto policy = args.size() == 2 ? guard_policy_by_name(args[1]) : std::nullopt;
        if (!policy)
        {
            std::println("Current policy is {}, choose from exact, atleast, single", to_string(state.policy));
            return;
        }
        state.policy = *policy;
    }
    else
    {
        std::println("Error: Unknown command");
    }
}

void main_loop(session& state)
{
    char* line_ptr = nullptr;
    while ((line_ptr = readline("xmute> ")) != nullptr)
    {
        std::string line;

        if (line_ptr == std::string_view{""})
        {
            free(line_ptr);
            if (history_length > 0)
            {
                line = history_list()[history_length - 1]->line;
            }
        }
        else
        {
            line = line_ptr;
            add_history(line_ptr);
            free(line_ptr);
        }

        if (!line.empty())
        {
            try
            {
                handle_command(state, line);
            }
            catch (const xmute::error& err)
            {
                print_error(err);
                std::cout << std::flush;
            }
        }
    }
}
}

int main(int argc, const char** argv)
{
    session state;
    std::optional<std::size_t> start_offset;
    const char* path = nullptr;

    for (auto i = 1; i < argc; ++i)
    {
        if (argv[i] == std::string_view("-o") && i + 1 < argc)
        {
            start_offset = to_integral<std::size_t>(argv[++i]);
            if (!start_offset)
            {
                std::println("-o expects a byte offset");
                return -1;
            }
        }
        else
        {
            path = argv[i];
        }
    }

    if (path)
    {
        load_file(state, path);
    }

    if (start_offset)
    {
        state.offset = std::min(*start_offset, state.data.size());
    }

    main_loop(state);
}
