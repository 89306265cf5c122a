/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <limits>
#include <lc/narrow-cast.hpp>
#include <lc/cbor/value.hpp>

namespace ledger_codec::cbor {
    static const cpp_int &max_uint64()
    {
        static const cpp_int max { std::numeric_limits<uint64_t>::max() };
        return max;
    }

    value make_int(const cpp_int &v)
    {
        if (v >= 0)
            return uint_value { v };
        return nint_value { cpp_int { -1 - v } };
    }

    value make_simple(const uint8_t v)
    {
        if ((v >= 20 && v <= 22) || (v >= 24 && v <= 31)) [[unlikely]]
            throw encode_error("simple value {} cannot be represented with make_simple", v);
        return simple_value { v };
    }

    major_type value::type() const noexcept
    {
        switch (_val.index()) {
            case 0: return major_type::uint;
            case 1: return major_type::nint;
            case 2: return major_type::bytes;
            case 3: return major_type::text;
            case 4: return major_type::array;
            case 5: return major_type::map;
            case 6: return major_type::tag;
            default: return major_type::simple;
        }
    }

    std::string_view value::type_name() const noexcept
    {
        static constexpr std::array<std::string_view, 10> names {
            "uint", "nint", "bytes", "text", "array", "map", "tag", "bool", "null", "simple"
        };
        return names.at(_val.index());
    }

    void value::_throw_mismatch(const std::string_view exp_type, const std::source_location &loc) const
    {
        throw schema_error("expected a CBOR {} but got {}: {} at {}:{}", exp_type, type_name(), *this, loc.file_name(), loc.line());
    }

    uint64_t value::uint(const std::source_location &loc) const
    {
        const auto &v = _get<uint_value>("uint", loc);
        if (v.num > max_uint64()) [[unlikely]]
            throw schema_error("the uint {} does not fit into 64 bits at {}:{}", v.num, loc.file_name(), loc.line());
        return v.num.convert_to<uint64_t>();
    }

    cpp_int value::bigint(const std::source_location &loc) const
    {
        if (const auto *v = std::get_if<uint_value>(&_val); v)
            return v->num;
        if (const auto *v = std::get_if<nint_value>(&_val); v)
            return cpp_int { -1 - v->arg };
        _throw_mismatch("integer", loc);
    }

    int64_t value::int64(const std::source_location &loc) const
    {
        const auto v = bigint(loc);
        if (v < std::numeric_limits<int64_t>::min() || v > std::numeric_limits<int64_t>::max()) [[unlikely]]
            throw schema_error("the integer {} does not fit into int64 at {}:{}", v, loc.file_name(), loc.line());
        return v.convert_to<int64_t>();
    }

    buffer value::bytes(const std::source_location &loc) const
    {
        return _get<uint8_vector>("bytes", loc);
    }

    std::string_view value::text(const std::source_location &loc) const
    {
        return _get<std::string>("text", loc);
    }

    const cbor::array &value::array(const std::source_location &loc) const
    {
        return _get<cbor::array>("array", loc);
    }

    const cbor::map &value::map(const std::source_location &loc) const
    {
        return _get<cbor::map>("map", loc);
    }

    const cbor::tag &value::tag(const std::source_location &loc) const
    {
        return _get<cbor::tag>("tag", loc);
    }

    bool value::boolean(const std::source_location &loc) const
    {
        return _get<bool>("bool", loc);
    }

    uint8_t value::simple(const std::source_location &loc) const
    {
        return _get<simple_value>("simple", loc).val;
    }

    static bool is_printable(const buffer b)
    {
        for (const uint8_t c: b) {
            if (c < 32 || c > 126) [[unlikely]]
                return false;
        }
        return true;
    }

    // RFC 8949 diagnostic notation, underscores mark indefinite collections
    static void stringify(std::string &out, const value &v)
    {
        std::visit([&](const auto &c) {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, uint_value>) {
                fmt::format_to(std::back_inserter(out), "{}", c.num);
            } else if constexpr (std::is_same_v<T, nint_value>) {
                fmt::format_to(std::back_inserter(out), "{}", cpp_int { -1 - c.arg });
            } else if constexpr (std::is_same_v<T, uint8_vector>) {
                fmt::format_to(std::back_inserter(out), "h'{}'", c);
            } else if constexpr (std::is_same_v<T, std::string>) {
                fmt::format_to(std::back_inserter(out), "\"{}\"", is_printable(buffer { c }) ? c : std::string { "<binary>" });
            } else if constexpr (std::is_same_v<T, cbor::array>) {
                out += c.indefinite ? "[_ " : "[";
                for (auto it = c.begin(); it != c.end(); ++it) {
                    if (it != c.begin())
                        out += ", ";
                    stringify(out, *it);
                }
                out += ']';
            } else if constexpr (std::is_same_v<T, cbor::map>) {
                out += c.indefinite ? "{_ " : "{";
                for (auto it = c.begin(); it != c.end(); ++it) {
                    if (it != c.begin())
                        out += ", ";
                    stringify(out, it->first);
                    out += ": ";
                    stringify(out, it->second);
                }
                out += '}';
            } else if constexpr (std::is_same_v<T, cbor::tag>) {
                fmt::format_to(std::back_inserter(out), "{}(", c.id);
                stringify(out, c.inner());
                out += ')';
            } else if constexpr (std::is_same_v<T, bool>) {
                out += c ? "true" : "false";
            } else if constexpr (std::is_same_v<T, null_value>) {
                out += "null";
            } else if constexpr (std::is_same_v<T, simple_value>) {
                fmt::format_to(std::back_inserter(out), "simple({})", c.val);
            } else {
                static_assert(sizeof(T) == 0, "unsupported CBOR value type");
            }
        }, v.storage());
    }

    std::string stringify(const value &v)
    {
        std::string res {};
        stringify(res, v);
        return res;
    }
}
