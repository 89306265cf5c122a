/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_CBOR_VALUE_HPP
#define LEDGER_CODEC_CBOR_VALUE_HPP

#include <memory>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <lc/big-int.hpp>
#include <lc/container.hpp>
#include <lc/error.hpp>
#include <lc/cbor/types.hpp>

namespace ledger_codec::cbor {
    struct value;

    struct uint_value {
        cpp_int num {};

        bool operator==(const uint_value &o) const
        {
            return num == o.num;
        }
    };

    // stores the encoded argument, the represented integer is -1 - arg
    struct nint_value {
        cpp_int arg {};

        bool operator==(const nint_value &o) const
        {
            return arg == o.arg;
        }
    };

    struct null_value {
        bool operator==(const null_value &) const noexcept =default;
    };

    struct simple_value {
        uint8_t val = 0;

        bool operator==(const simple_value &) const noexcept =default;
    };

    struct array: vector<value> {
        using base_type = vector<value>;
        using base_type::base_type;

        bool indefinite = false;

        const value &at(size_t pos, const std::source_location &loc=std::source_location::current()) const;
        bool operator==(const array &o) const;
    };

    using map_item = std::pair<value, value>;

    struct map: vector<map_item> {
        using base_type = vector<map_item>;
        using base_type::base_type;

        bool indefinite = false;

        const value *find(const value &key) const;
        bool operator==(const map &o) const;
    };

    struct tag {
        uint64_t id = 0;
        std::shared_ptr<const value> val;

        tag(uint64_t id_, value v);
        const value &inner() const;
        bool operator==(const tag &o) const;
    };

    template<typename T, typename V>
    struct is_alternative_of;

    template<typename T, typename... Ts>
    struct is_alternative_of<T, std::variant<Ts...>>: std::bool_constant<(std::is_same_v<T, Ts> || ...)> {
    };

    struct value {
        using storage_type = std::variant<uint_value, nint_value, uint8_vector, std::string, cbor::array, cbor::map, cbor::tag, bool, null_value, simple_value>;

        value(): _val { null_value {} }
        {
        }

        // only exact alternatives are accepted so that pointers and string literals do not silently become booleans
        template<typename T>
            requires is_alternative_of<std::decay_t<T>, storage_type>::value
        value(T &&v): _val { std::forward<T>(v) }
        {
        }

        major_type type() const noexcept;
        std::string_view type_name() const noexcept;

        template<typename T>
        bool is() const noexcept
        {
            return std::holds_alternative<T>(_val);
        }

        bool is_null() const noexcept
        {
            return is<null_value>();
        }

        uint64_t uint(const std::source_location &loc=std::source_location::current()) const;
        cpp_int bigint(const std::source_location &loc=std::source_location::current()) const;
        int64_t int64(const std::source_location &loc=std::source_location::current()) const;
        buffer bytes(const std::source_location &loc=std::source_location::current()) const;
        std::string_view text(const std::source_location &loc=std::source_location::current()) const;
        const cbor::array &array(const std::source_location &loc=std::source_location::current()) const;
        const cbor::map &map(const std::source_location &loc=std::source_location::current()) const;
        const cbor::tag &tag(const std::source_location &loc=std::source_location::current()) const;
        bool boolean(const std::source_location &loc=std::source_location::current()) const;
        uint8_t simple(const std::source_location &loc=std::source_location::current()) const;

        const value &at(const size_t idx, const std::source_location &loc=std::source_location::current()) const
        {
            return array(loc).at(idx, loc);
        }

        const storage_type &storage() const noexcept
        {
            return _val;
        }

        bool operator==(const value &o) const
        {
            return _val == o._val;
        }
    private:
        storage_type _val;

        template<typename T>
        const T &_get(std::string_view exp_type, const std::source_location &loc) const
        {
            if (const auto *v = std::get_if<T>(&_val); v) [[likely]]
                return *v;
            _throw_mismatch(exp_type, loc);
        }

        [[noreturn]] void _throw_mismatch(std::string_view exp_type, const std::source_location &loc) const;
    };

    inline const value &array::at(const size_t pos, const std::source_location &loc) const
    {
        if (pos < size()) [[likely]]
            return base_type::operator[](pos);
        throw schema_error("invalid element index {} in an array of size {} at {}:{}", pos, size(), loc.file_name(), loc.line());
    }

    inline bool array::operator==(const array &o) const
    {
        return indefinite == o.indefinite && static_cast<const base_type &>(*this) == static_cast<const base_type &>(o);
    }

    inline const value *map::find(const value &key) const
    {
        for (const auto &[k, v]: *this) {
            if (k == key)
                return &v;
        }
        return nullptr;
    }

    inline bool map::operator==(const map &o) const
    {
        return indefinite == o.indefinite && static_cast<const base_type &>(*this) == static_cast<const base_type &>(o);
    }

    inline tag::tag(const uint64_t id_, value v):
        id { id_ }, val { std::make_shared<const value>(std::move(v)) }
    {
    }

    inline const value &tag::inner() const
    {
        return *val;
    }

    inline bool tag::operator==(const tag &o) const
    {
        return id == o.id && *val == *o.val;
    }

    inline value make_uint(const uint64_t v)
    {
        return uint_value { v };
    }

    // encodes -1 - arg, so make_nint(0) is -1
    inline value make_nint(const uint64_t arg)
    {
        return nint_value { arg };
    }

    extern value make_int(const cpp_int &v);

    inline value make_bytes(const buffer b)
    {
        return uint8_vector { b };
    }

    inline value make_text(const std::string_view s)
    {
        return std::string { s };
    }

    inline value make_array(vector<value> items, const bool indefinite=false)
    {
        cbor::array res {};
        static_cast<vector<value> &>(res) = std::move(items);
        res.indefinite = indefinite;
        return res;
    }

    inline value make_map(vector<map_item> items, const bool indefinite=false)
    {
        cbor::map res {};
        static_cast<vector<map_item> &>(res) = std::move(items);
        res.indefinite = indefinite;
        return res;
    }

    inline value make_tag(const uint64_t id, value v)
    {
        return cbor::tag { id, std::move(v) };
    }

    inline value make_bool(const bool b)
    {
        return b;
    }

    inline value make_null()
    {
        return null_value {};
    }

    // values 20-22 have dedicated forms and 24-31 are reserved
    extern value make_simple(uint8_t v);

    extern std::string stringify(const value &v);
}

namespace fmt {
    template<>
    struct formatter<ledger_codec::cbor::value>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", ledger_codec::cbor::stringify(v));
        }
    };
}

#endif // !LEDGER_CODEC_CBOR_VALUE_HPP
