/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_CDDL_TRANSFORM_HPP
#define LEDGER_CODEC_CDDL_TRANSFORM_HPP

#include <algorithm>
#include <concepts>
#include <initializer_list>
#include <optional>
#include <limits>
#include <type_traits>
#include <lc/array.hpp>
#include <lc/container.hpp>
#include <lc/result.hpp>
#include <lc/cbor/codec.hpp>

namespace ledger_codec::cddl {
    template<typename T>
    concept constructible_from_cbor_c = requires(const cbor::value &v)
    {
        { T::from_cbor(v) } -> std::convertible_to<T>;
    };

    template<typename T>
    concept convertible_to_cbor_c = requires(const T &t)
    {
        { t.to_cbor() } -> std::same_as<cbor::value>;
    };

    template<typename T>
    struct is_byte_array: std::false_type {
    };

    template<size_t SZ>
    struct is_byte_array<byte_array<SZ>>: std::true_type {
    };

    template <typename T>
    concept integral_c = std::is_integral_v<T> && !std::is_same_v<T, bool> && !constructible_from_cbor_c<T>;

    template <typename T>
    concept constructible_from_buffer_c = std::is_constructible_v<T, buffer> && !constructible_from_cbor_c<T> && !std::is_same_v<T, cbor::value>;

    template<typename T>
    T value_from_cbor(const cbor::value &v)
    {
        return T::from_cbor(v);
    }

    template<integral_c T>
    T value_from_cbor(const cbor::value &v)
    {
        const auto num = v.bigint();
        if (num < std::numeric_limits<T>::min() || num > std::numeric_limits<T>::max()) [[unlikely]]
            throw schema_error("the integer {} is out of the allowed range [{}, {}]", num, std::numeric_limits<T>::min(), std::numeric_limits<T>::max());
        return num.template convert_to<T>();
    }

    template<std::same_as<bool> T>
    T value_from_cbor(const cbor::value &v)
    {
        return v.boolean();
    }

    template<std::same_as<std::string> T>
    T value_from_cbor(const cbor::value &v)
    {
        return std::string { v.text() };
    }

    template<std::same_as<cpp_int> T>
    T value_from_cbor(const cbor::value &v)
    {
        return v.bigint();
    }

    template<std::same_as<cbor::value> T>
    T value_from_cbor(const cbor::value &v)
    {
        return v;
    }

    template<constructible_from_buffer_c T>
    T value_from_cbor(const cbor::value &v)
    {
        const auto bytes = v.bytes();
        if constexpr (is_byte_array<T>::value) {
            if (bytes.size() != sizeof(T)) [[unlikely]]
                throw schema_error("expected a byte string of {} bytes but got {}", sizeof(T), bytes.size());
        }
        return T { bytes };
    }

    template<typename T>
    cbor::value value_to_cbor(const T &v)
    {
        if constexpr (convertible_to_cbor_c<T>) {
            return v.to_cbor();
        } else if constexpr (std::is_same_v<T, cbor::value>) {
            return v;
        } else if constexpr (std::is_same_v<T, bool>) {
            return cbor::make_bool(v);
        } else if constexpr (std::is_integral_v<T> && std::is_unsigned_v<T>) {
            return cbor::make_uint(v);
        } else if constexpr (std::is_integral_v<T>) {
            return cbor::make_int(v);
        } else if constexpr (std::is_same_v<T, cpp_int>) {
            return cbor::make_int(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return cbor::make_text(v);
        } else if constexpr (std::is_convertible_v<T, buffer>) {
            return cbor::make_bytes(v);
        } else {
            static_assert(sizeof(T) == 0, "unsupported type for CBOR serialization");
            return {};
        }
    }

    template<typename... Args>
    cbor::value tuple_to_cbor(const Args &...args)
    {
        return cbor::make_array({ value_to_cbor(args)... });
    }

    // Positional reader of the tuple shape: [a, b, ? c]
    struct array_reader {
        array_reader(const cbor::value &v, const size_t min_size, const size_t max_size, const std::string_view name):
            _items { v.array() }
        {
            if (_items.size() < min_size || _items.size() > max_size) [[unlikely]]
                throw schema_error("{} must have from {} to {} elements but has {}", name, min_size, max_size, _items.size());
        }

        array_reader(const cbor::value &v, const size_t exact_size, const std::string_view name):
            array_reader { v, exact_size, exact_size, name }
        {
        }

        bool done() const noexcept
        {
            return _pos >= _items.size();
        }

        size_t size() const noexcept
        {
            return _items.size();
        }

        const cbor::value &read()
        {
            return _items.at(_pos++);
        }

        template<typename T>
        T read()
        {
            return value_from_cbor<T>(read());
        }

        // the selector of a tagged union: [typ, ...]
        uint64_t read_type()
        {
            return read<uint64_t>();
        }
    private:
        const cbor::array &_items;
        size_t _pos = 0;
    };

    // Reader of the integer-keyed map shape. Duplicate and unknown keys are rejected.
    struct int_map_reader {
        int_map_reader(const cbor::value &v, const std::initializer_list<uint64_t> known_keys, const std::string_view name):
            _name { name }
        {
            for (const auto &[k, val]: v.map()) {
                const auto key = value_from_cbor<uint64_t>(k);
                if (std::find(known_keys.begin(), known_keys.end(), key) == known_keys.end()) [[unlikely]]
                    throw schema_error("{} does not support key {}", _name, key);
                if (const auto [it, created] = _items.try_emplace(key, &val); !created) [[unlikely]]
                    throw schema_error("{} contains a duplicate key {}", _name, key);
            }
        }

        bool contains(const uint64_t key) const
        {
            return _items.find(key) != _items.end();
        }

        const cbor::value &required(const uint64_t key) const
        {
            const auto it = _items.find(key);
            if (it == _items.end()) [[unlikely]]
                throw schema_error("{} misses the required key {}", _name, key);
            return *it->second;
        }

        template<typename T>
        T required(const uint64_t key) const
        {
            return value_from_cbor<T>(required(key));
        }

        template<typename T>
        std::optional<T> optional(const uint64_t key) const
        {
            if (const auto it = _items.find(key); it != _items.end())
                return value_from_cbor<T>(*it->second);
            return {};
        }
    private:
        std::string_view _name;
        flat_map<uint64_t, const cbor::value *> _items {};
    };

    // Builder of the integer-keyed map shape. Keys are emitted in the order they are added, absent optionals are omitted.
    struct int_map_builder {
        template<typename T>
        int_map_builder &add(const uint64_t key, const T &v)
        {
            _items.emplace_back(cbor::make_uint(key), value_to_cbor(v));
            return *this;
        }

        template<typename T>
        int_map_builder &add(const uint64_t key, const std::optional<T> &v)
        {
            if (v)
                add(key, *v);
            return *this;
        }

        cbor::value build() const
        {
            return cbor::make_map(_items);
        }
    private:
        vector<cbor::map_item> _items {};
    };

    template<typename T>
    struct nil_optional_t: std::optional<T> {
        using base_type = std::optional<T>;
        using base_type::base_type;

        static nil_optional_t from_cbor(const cbor::value &v)
        {
            if (v.is_null())
                return {};
            return value_from_cbor<T>(v);
        }

        cbor::value to_cbor() const
        {
            if (base_type::has_value())
                return value_to_cbor(base_type::operator*());
            return cbor::make_null();
        }

        bool operator==(const nil_optional_t<T> &o) const
        {
            return static_cast<const base_type &>(*this) == static_cast<const base_type &>(o);
        }
    };

    static constexpr uint64_t set_tag_id = 258;

    // An array wrapped in tag 258. Plain arrays are accepted on decode, duplicates are not.
    template<typename T>
    struct set_t: flat_set<T> {
        using base_type = flat_set<T>;
        using base_type::base_type;

        static set_t from_cbor(const cbor::value &v)
        {
            const auto &items = v.is<cbor::tag>() ? _untag(v) : v.array();
            set_t res {};
            res.reserve(items.size());
            for (const auto &item: items) {
                if (const auto [it, created] = res.emplace(value_from_cbor<T>(item)); !created) [[unlikely]]
                    throw schema_error("a set contains a duplicate item: {}", item);
            }
            return res;
        }

        cbor::value to_cbor() const
        {
            vector<cbor::value> items {};
            items.reserve(base_type::size());
            for (const auto &item: *this)
                items.emplace_back(value_to_cbor(item));
            return cbor::make_tag(set_tag_id, cbor::make_array(std::move(items)));
        }
    private:
        static const cbor::array &_untag(const cbor::value &v)
        {
            const auto &t = v.tag();
            if (t.id != set_tag_id) [[unlikely]]
                throw schema_error("expected a set tag {} but got {}", set_tag_id, t.id);
            return t.inner().array();
        }
    };

    // A set that keeps the order of its items: tag 258 on encode, a plain array is accepted on decode.
    template<typename T>
    struct oset_t: vector<T> {
        using base_type = vector<T>;
        using base_type::base_type;

        static oset_t from_cbor(const cbor::value &v)
        {
            const auto &items = v.is<cbor::tag>() ? _untag(v) : v.array();
            oset_t res {};
            res.reserve(items.size());
            for (const auto &item: items) {
                auto val = value_from_cbor<T>(item);
                if (std::find(res.begin(), res.end(), val) != res.end()) [[unlikely]]
                    throw schema_error("a set contains a duplicate item: {}", item);
                res.emplace_back(std::move(val));
            }
            return res;
        }

        cbor::value to_cbor() const
        {
            vector<cbor::value> items {};
            items.reserve(base_type::size());
            for (const auto &item: *this)
                items.emplace_back(value_to_cbor(item));
            return cbor::make_tag(set_tag_id, cbor::make_array(std::move(items)));
        }
    private:
        static const cbor::array &_untag(const cbor::value &v)
        {
            const auto &t = v.tag();
            if (t.id != set_tag_id) [[unlikely]]
                throw schema_error("expected a set tag {} but got {}", set_tag_id, t.id);
            return t.inner().array();
        }
    };

    template<typename S>
    S nonempty_from_cbor(const cbor::value &v, const std::string_view name)
    {
        auto res = S::from_cbor(v);
        if (res.empty()) [[unlikely]]
            throw schema_error("{} must not be empty", name);
        return res;
    }

    template<typename T>
    set_t<T> nonempty_set_from_cbor(const cbor::value &v, const std::string_view name)
    {
        return nonempty_from_cbor<set_t<T>>(v, name);
    }

    template<typename K, typename V>
    struct map_t: flat_map<K, V> {
        using base_type = flat_map<K, V>;
        using base_type::base_type;

        static map_t from_cbor(const cbor::value &v)
        {
            const auto &items = v.map();
            map_t res {};
            res.reserve(items.size());
            for (const auto &[k, val]: items) {
                if (const auto [it, created] = res.try_emplace(value_from_cbor<K>(k), value_from_cbor<V>(val)); !created) [[unlikely]]
                    throw schema_error("a map contains a duplicate key: {}", k);
            }
            return res;
        }

        cbor::value to_cbor() const
        {
            vector<cbor::map_item> items {};
            items.reserve(base_type::size());
            for (const auto &[k, v]: *this)
                items.emplace_back(value_to_cbor(k), value_to_cbor(v));
            return cbor::make_map(std::move(items));
        }
    };

    template<typename T>
    struct vector_t: vector<T> {
        using base_type = vector<T>;
        using base_type::base_type;

        static vector_t<T> from_cbor(const cbor::value &v)
        {
            const auto &items = v.array();
            vector_t<T> res {};
            res.reserve(items.size());
            for (const auto &item: items)
                res.emplace_back(value_from_cbor<T>(item));
            return res;
        }

        cbor::value to_cbor() const
        {
            vector<cbor::value> items {};
            items.reserve(base_type::size());
            for (const auto &item: *this)
                items.emplace_back(value_to_cbor(item));
            return cbor::make_array(std::move(items));
        }
    };

    // A byte string of at most MAX bytes.
    template<size_t MAX>
    struct bounded_bytes: uint8_vector {
        using uint8_vector::uint8_vector;

        static constexpr size_t max_size = MAX;

        static bounded_bytes from_cbor(const cbor::value &v)
        {
            const auto bytes = v.bytes();
            if (bytes.size() > MAX) [[unlikely]]
                throw schema_error("a byte string must have at most {} bytes but has {}", MAX, bytes.size());
            return bounded_bytes { bytes };
        }

        cbor::value to_cbor() const
        {
            if (size() > MAX) [[unlikely]]
                throw encode_error("a byte string must have at most {} bytes but has {}", MAX, size());
            return cbor::make_bytes(*this);
        }
    };

    // A text string of at most MAX bytes of UTF-8.
    template<size_t MAX>
    struct bounded_text {
        static constexpr size_t max_size = MAX;

        std::string str {};

        bounded_text() =default;

        bounded_text(const std::string_view s): str { s }
        {
        }

        static bounded_text from_cbor(const cbor::value &v)
        {
            const auto text = v.text();
            if (text.size() > MAX) [[unlikely]]
                throw schema_error("a text string must have at most {} bytes but has {}", MAX, text.size());
            return bounded_text { text };
        }

        cbor::value to_cbor() const
        {
            if (str.size() > MAX) [[unlikely]]
                throw encode_error("a text string must have at most {} bytes but has {}", MAX, str.size());
            return cbor::make_text(str);
        }

        auto operator<=>(const bounded_text &) const =default;
    };

    // A non-zero amount.
    struct positive_coin {
        positive_coin() =default;

        positive_coin(const uint64_t amount): _amount { amount }
        {
        }

        static positive_coin from_cbor(const cbor::value &v)
        {
            const auto amount = v.uint();
            if (amount == 0) [[unlikely]]
                throw schema_error("a positive coin must be greater than zero");
            return amount;
        }

        cbor::value to_cbor() const
        {
            if (_amount == 0) [[unlikely]]
                throw encode_error("a positive coin must be greater than zero");
            return cbor::make_uint(_amount);
        }

        uint64_t amount() const noexcept
        {
            return _amount;
        }

        auto operator<=>(const positive_coin &) const noexcept =default;
    private:
        uint64_t _amount = 0;
    };

    template<typename T>
    result<uint8_vector> encode_entity(const T &entity, const cbor::options &opts=cbor::canonical)
    {
        return make_result([&] {
            return cbor::encode(value_to_cbor(entity), opts);
        });
    }

    // The input must contain exactly one data item.
    template<typename T>
    result<T> decode_entity(const buffer bytes)
    {
        return make_result([&] {
            return value_from_cbor<T>(cbor::decode_value(bytes));
        });
    }
}

namespace fmt {
    template<typename T>
        requires ledger_codec::cddl::convertible_to_cbor_c<T>
    struct formatter<T>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.to_cbor());
        }
    };
}

#endif // !LEDGER_CODEC_CDDL_TRANSFORM_HPP
