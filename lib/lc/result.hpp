/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_RESULT_HPP
#define LEDGER_CODEC_RESULT_HPP

#include <type_traits>
#include <variant>
#include <lc/common/logger.hpp>
#include <lc/error.hpp>

namespace ledger_codec {
    template<typename T>
    struct result {
        using value_type = T;

        result(T &&v): _val { std::in_place_index<0>, std::move(v) }
        {
        }

        result(const T &v): _val { std::in_place_index<0>, v }
        {
        }

        result(const decode_error &err): _val { err }
        {
        }

        result(const schema_error &err): _val { err }
        {
        }

        result(const encode_error &err): _val { err }
        {
        }

        bool ok() const noexcept
        {
            return _val.index() == 0;
        }

        explicit operator bool() const noexcept
        {
            return ok();
        }

        template<typename E>
        const E *error_if() const noexcept
        {
            return std::get_if<E>(&_val);
        }

        // The common base of the stored failure; must be called only on failed results.
        const error &failure() const
        {
            return std::visit([](const auto &v) -> const error & {
                using V = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<V, T>) {
                    throw error("failure() requested from a successful result");
                } else {
                    return v;
                }
            }, _val);
        }

        const T &unwrap() const &
        {
            _rethrow();
            return std::get<0>(_val);
        }

        T &unwrap() &
        {
            _rethrow();
            return std::get<0>(_val);
        }

        T unwrap() &&
        {
            _rethrow();
            return std::move(std::get<0>(_val));
        }
    private:
        std::variant<T, decode_error, schema_error, encode_error> _val;

        void _rethrow() const
        {
            switch (_val.index()) {
                case 0: return;
                case 1: throw std::get<1>(_val);
                case 2: throw std::get<2>(_val);
                case 3: throw std::get<3>(_val);
                default: throw error("internal error: unexpected result state: {}", _val.index());
            }
        }
    };

    // Runs a throwing computation and reports codec failures as a result instead.
    template<typename F>
    auto make_result(F &&f) -> result<std::decay_t<std::invoke_result_t<F>>>
    {
        try {
            return f();
        } catch (const decode_error &ex) {
            logger::debug("decode failed: {}", ex.what());
            return ex;
        } catch (const schema_error &ex) {
            logger::debug("schema validation failed: {}", ex.what());
            return ex;
        } catch (const encode_error &ex) {
            logger::debug("encode failed: {}", ex.what());
            return ex;
        }
    }
}

#endif // !LEDGER_CODEC_RESULT_HPP
