/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <boost/json.hpp>
#include <tokenbind/common/test.hpp>
#include "json.hpp"

namespace {
    using namespace tokenbind;
    using namespace tokenbind::codec::json;
    using namespace std::string_view_literals;

    struct fixed4_t: byte_array<4> {
        using byte_array::byte_array;

        void serialize(auto &archive)
        {
            archive.process_bytes_fixed(*this);
        }
    };

    struct sample_t {
        uint64_t nonce = 0;
        fixed4_t tag {};
        codec::byte_sequence_t payload {};
        codec::sequence_t<fixed4_t> tags {};

        void serialize(auto &archive)
        {
            archive.process("nonce"sv, nonce);
            archive.process("tag"sv, tag);
            archive.process("payload"sv, payload);
            archive.process("tags"sv, tags);
        }

        bool operator==(const sample_t &) const =default;
    };
}

suite tokenbind_codec_json_suite = [] {
    "tokenbind::codec::json"_test = [] {
        "save_pretty + reload object"_test = [] {
            file::tmp t { "json-save-pretty-object-test.json" };
            const auto j = object {
                { "name", "abc" },
                { "version", 123 }
            };
            save_pretty(t.path(), j);
            const auto buf = file::read(t.path());
            expect_equal(std::string_view { "{\n  \"name\": \"abc\",\n  \"version\": 123\n}" }, buf.str());
            const auto loaded = load(t.path());
            expect(j == loaded);
        };
        "save_pretty empty containers"_test = [] {
            expect_equal(std::string { "{}" }, serialize_pretty(object {}));
            expect_equal(std::string { "{\n  \"logs\": []\n}" }, serialize_pretty(object { { "logs", array {} } }));
        };
        "encoder + decoder"_test = [] {
            sample_t s {};
            s.nonce = 7;
            s.tag = fixed4_t::from_hex<fixed4_t>("0xA1B2C3D4");
            s.payload = uint8_vector::from_hex<codec::byte_sequence_t>("00FF");
            s.tags.emplace_back(fixed4_t::from_hex<fixed4_t>("01020304"));
            const auto jv = to_json(s);
            const auto &jo = jv.as_object();
            expect_equal(uint64_t { 7 }, jo.at("nonce").as_uint64());
            expect_equal("0xa1b2c3d4"sv, std::string_view { jo.at("tag").as_string() });
            expect_equal("0x00ff"sv, std::string_view { jo.at("payload").as_string() });
            expect_equal(size_t { 1 }, jo.at("tags").as_array().size());
            const auto s2 = from_json<sample_t>(jv);
            expect(s == s2);
        };
        "missing field"_test = [] {
            const auto jv = parse(buffer { "{\"nonce\": 1}"sv });
            expect(throws([&] { from_json<sample_t>(jv); }));
        };
    };
};
