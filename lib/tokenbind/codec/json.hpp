#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <functional>
#include <limits>
#include <boost/json.hpp>
#include <tokenbind/common/bytes.hpp>
#include "serializable.hpp"

namespace tokenbind::codec::json {
    using namespace boost::json;

    template<typename T>
    concept from_json_c = requires(T t, boost::json::value jv)
    {
        { T::from_json(jv) };
    };

    template<typename T>
    concept to_json_c = requires(const T t)
    {
        { t.to_json() } -> std::convertible_to<boost::json::value>;
    };

    extern value parse(const buffer &buf);
    extern value load(const std::string &path);
    extern void save_pretty(std::ostream& os, value const &jv, std::string *indent = nullptr);
    extern std::string serialize_pretty(const value &jv);
    extern void save_pretty(const std::string &path, const value &jv);

    struct decoder: archive_t {
        decoder(const boost::json::value &jv)
        {
            _vals.emplace_back(jv);
        }

        template<typename T>
        static void decode(const boost::json::value &jv, T &val)
        {
            if constexpr (from_json_c<T>) {
                val = T::from_json(jv);
            } else if constexpr (serializable_c<T>) {
                decoder dec { jv };
                val.serialize(dec);
            } else if constexpr (std::is_same_v<T, uint8_t>
                    || std::is_same_v<T, uint16_t>
                    || std::is_same_v<T, uint32_t>
                    || std::is_same_v<T, uint64_t>
                    || std::is_same_v<T, bool>) {
                val = boost::json::value_to<T>(jv);
            } else if constexpr (std::is_same_v<T, std::string>) {
                val = boost::json::value_to<std::string_view>(jv);
            } else {
                throw error(fmt::format("json serialization is not enabled for type {}", typeid(T).name()));
            }
        }

        template<typename T>
        void process_uint(T &val)
        {
            val = boost::json::value_to<T>(_top());
        }

        void process(const std::string_view name, auto &val)
        {
            const auto &jo = _top().as_object();
            const auto it = jo.find(name);
            if (it == jo.end()) [[unlikely]]
                throw error(fmt::format("a required field {} is missing in: {}", name, serialize_pretty(jo)));
            decode(it->value(), val);
        }

        void process_array(auto &self)
        {
            using T = std::decay_t<decltype(self)>;
            const auto &j_arr = _top().as_array();
            self.clear();
            self.reserve(j_arr.size());
            for (const auto &jv: j_arr) {
                typename T::value_type v;
                decode(jv, v);
                self.emplace_back(std::move(v));
            }
        }

        void process_bytes(std::vector<uint8_t> &bytes)
        {
            const auto hex = strip_hex_prefix(boost::json::value_to<std::string_view>(_top()));
            if (hex.size() % 2 != 0) [[unlikely]]
                throw error(fmt::format("expected a hex string with an even number of characters but got: {}", hex));
            bytes.resize(hex.size() / 2);
            init_from_hex(bytes, hex);
        }

        void process_bytes_fixed(std::span<uint8_t> bytes)
        {
            const auto hex = boost::json::value_to<std::string_view>(_top());
            if (!hex.starts_with("0x")) [[unlikely]]
                throw error(fmt::format("expected a hex string but got: {}", hex));
            init_from_hex(bytes, hex.substr(2));
        }
    private:
        std::vector<std::reference_wrapper<const boost::json::value>> _vals {};

        const boost::json::value &_top() const
        {
            return _vals.back().get();
        }
    };

    // Mirrors the decoder: objects for serializable types, 0x-prefixed hex for byte strings.
    struct encoder: archive_t {
        template<typename T>
        static boost::json::value encode(const T &val)
        {
            if constexpr (to_json_c<T>) {
                return val.to_json();
            } else if constexpr (serializable_c<T>) {
                encoder enc {};
                const_cast<T &>(val).serialize(enc);
                return std::move(enc._val);
            } else if constexpr (std::is_same_v<T, uint8_t>
                    || std::is_same_v<T, uint16_t>
                    || std::is_same_v<T, uint32_t>
                    || std::is_same_v<T, uint64_t>
                    || std::is_same_v<T, bool>) {
                return boost::json::value_from(val);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return boost::json::string { val };
            } else {
                throw error(fmt::format("json serialization is not enabled for type {}", typeid(T).name()));
            }
        }

        template<typename T>
        void process_uint(const T &val)
        {
            _val = boost::json::value_from(val);
        }

        void process(const std::string_view name, const auto &val)
        {
            if (!_val.is_object())
                _val.emplace_object();
            _val.as_object().insert_or_assign(name, encode(val));
        }

        void process_array(const auto &self)
        {
            auto &arr = _val.emplace_array();
            arr.reserve(self.size());
            for (const auto &v: self)
                arr.emplace_back(encode(v));
        }

        void process_bytes(const buffer bytes)
        {
            _val = boost::json::string { fmt::format("0x{}", buffer_lowercase { bytes.data(), bytes.size() }) };
        }

        void process_bytes_fixed(const buffer bytes)
        {
            process_bytes(bytes);
        }
    private:
        boost::json::value _val {};
    };

    template<typename T>
    boost::json::value to_json(const T &val)
    {
        return encoder::encode(val);
    }

    template<typename T>
    T from_json(const boost::json::value &jv)
    {
        T res;
        decoder::decode(jv, res);
        return res;
    }

    template<typename T>
    T load_obj(const std::string &path)
    {
        return from_json<T>(load(path));
    }
}
