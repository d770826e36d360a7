#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <concepts>
#include <span>
#include <string>
#include <string_view>
#include <typeinfo>
#include <vector>
#include <tokenbind/common/bytes.hpp>

namespace tokenbind::codec {
    struct archive_t {
    };

    template<typename T>
    T from(auto &archive)
    {
        T res;
        res.serialize(archive);
        return res;
    }

    template<typename T>
    concept serializable_c = requires(T t, archive_t a)
    {
        { t.serialize(a) } -> std::same_as<void>;
    };

    // Scalar-like values that have a canonical textual form (addresses, big integers).
    template<typename T>
    concept has_to_string_c = requires(const T t)
    {
        { t.to_string() } -> std::convertible_to<std::string>;
    };

    struct byte_sequence_t: uint8_vector {
        using base_type = uint8_vector;
        using base_type::base_type;

        void serialize(auto &archive)
        {
            archive.process_bytes(*this);
        }
    };

    template<typename T>
    struct sequence_t: std::vector<T> {
        using base_type = std::vector<T>;
        using base_type::base_type;

        void serialize(auto &archive)
        {
            archive.process_array(*this);
        }
    };

    template<typename OUT_IT>
    struct formatter: archive_t {
        static constexpr size_t shift = 2;

        explicit formatter(OUT_IT it):
            _it { std::move(it) }
        {
        }

        template<typename T>
        void format(const T &val)
        {
            if constexpr (has_to_string_c<T>) {
                _it = fmt::format_to(_it, "{}\n", val.to_string());
            } else if constexpr (serializable_c<T>) {
                _it = fmt::format_to(_it, "\n");
                ++_depth;
                const_cast<T &>(val).serialize(*this);
                --_depth;
            } else if constexpr (std::is_same_v<T, uint8_t>
                    || std::is_same_v<T, uint16_t>
                    || std::is_same_v<T, uint32_t>
                    || std::is_same_v<T, uint64_t>
                    || std::is_same_v<T, bool>
                    || std::is_same_v<T, std::string>
                    || std::is_convertible_v<T, std::span<const uint8_t>>) {
                _it = fmt::format_to(_it, "{}\n", val);
            } else {
                throw error(fmt::format("formatter serialization is not enabled for type {}", typeid(T).name()));
            }
        }

        void process_uint(const auto &val)
        {
            format(val);
        }

        void process(const std::string_view name, const auto &val)
        {
            _it = fmt::format_to(_it, "{:{}}{}: ", "", _depth * shift, name);
            format(val);
        }

        void process_array(const auto &arr)
        {
            _it = fmt::format_to(_it, "[");
            if (!arr.empty()) {
                ++_depth;
                _it = fmt::format_to(_it, "\n");
                for (const auto &v: arr) {
                    _it = fmt::format_to(_it, "{:{}}", "", _depth * shift);
                    format(v);
                }
                --_depth;
                _it = fmt::format_to(_it, "{:{}}", "", _depth * shift);
            }
            _it = fmt::format_to(_it, "](size: {})\n", arr.size());
        }

        void process_bytes(const buffer bytes)
        {
            _it = fmt::format_to(_it, "#{}\n", bytes);
        }

        void process_bytes_fixed(const buffer bytes)
        {
            _it = fmt::format_to(_it, "#{}\n", bytes);
        }

        OUT_IT it() const
        {
            return _it;
        }
    private:
        OUT_IT _it;
        size_t _depth = 0;
    };
}

namespace fmt {
    template<tokenbind::codec::has_to_string_c T>
    struct formatter<T>: formatter<int> {
        template<typename FormatContext>
        auto format(const T &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}", v.to_string());
        }
    };

    template<tokenbind::codec::serializable_c T>
        requires (!tokenbind::codec::has_to_string_c<T>)
    struct formatter<T>: formatter<int> {
        template<typename FormatContext>
        auto format(const T &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            tokenbind::codec::formatter<decltype(ctx.out())> frmtr { ctx.out() };
            frmtr.format(v);
            return frmtr.it();
        }
    };
}
