/*
MIT License
Copyright (c) 2017 Sean Barrett
Copyright (c) 2025 setbe

Permission is hereby granted, free of charge, to any person obtaining a copy of
this software and associated documentation files (the "Software"), to deal in
the Software without restriction, including without limitation the rights to
use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies
of the Software, and to permit persons to whom the Software is furnished to do
so, subject to the following conditions:
The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/

// Synthetic 'post' + 'sbix' fonts for the tests. Nothing here validates;
// the point is to produce exactly the bytes a test wants, including broken ones.

#pragma once

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "emojidump/detail/mac_glyph_names.hpp"

namespace emojidump_test {

    struct TestGlyph {
        std::string name;
        std::vector<std::uint8_t> image;   // empty: no bitmap in any strike
        std::string type = "png ";
    };

    struct FontSpec {
        std::vector<TestGlyph> glyphs;
        std::vector<std::uint16_t> ppems{ 160 };
        bool collection = true;
        std::uint32_t post_version = 0x00020000;
    };

    struct Writer {
        std::vector<std::uint8_t> bytes;

        void u8(std::uint8_t v) { bytes.push_back(v); }
        void u16(std::uint16_t v) { u8(std::uint8_t(v >> 8)); u8(std::uint8_t(v)); }
        void u32(std::uint32_t v) { u16(std::uint16_t(v >> 16)); u16(std::uint16_t(v)); }
        void tag(const char* t) { for (int i = 0; i < 4; ++i) u8(std::uint8_t(t[i])); }
        void raw(const std::vector<std::uint8_t>& v) { bytes.insert(bytes.end(), v.begin(), v.end()); }
        void pad4() { while (bytes.size() % 4) u8(0); }
        std::uint32_t size() const { return static_cast<std::uint32_t>(bytes.size()); }

        void patch32(std::size_t at, std::uint32_t v) {
            bytes[at + 0] = std::uint8_t(v >> 24);
            bytes[at + 1] = std::uint8_t(v >> 16);
            bytes[at + 2] = std::uint8_t(v >> 8);
            bytes[at + 3] = std::uint8_t(v);
        }
    };

    // Fake PNG: the signature plus a marker so every glyph's bytes differ.
    inline std::vector<std::uint8_t> fake_png(std::uint8_t marker, std::size_t extra = 16) {
        std::vector<std::uint8_t> v = { 0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A };
        for (std::size_t i = 0; i < extra; ++i)
            v.push_back(std::uint8_t(marker + i));
        return v;
    }

    inline std::vector<std::uint8_t> build_post(const FontSpec& spec) {
        Writer w;
        w.u32(spec.post_version);
        w.u32(0);        // italicAngle
        w.u16(0);        // underlinePosition
        w.u16(0);        // underlineThickness
        w.u32(0);        // isFixedPitch
        w.u32(0); w.u32(0); w.u32(0); w.u32(0); // memory usage
        if (spec.post_version != 0x00020000)
            return w.bytes;

        w.u16(static_cast<std::uint16_t>(spec.glyphs.size()));
        std::vector<std::string> pool;
        for (const TestGlyph& g : spec.glyphs) {
            std::uint16_t idx = 0xFFFF;
            for (std::uint16_t i = 0; i < emojidump::detail::kNumStandardNames; ++i) {
                if (g.name == emojidump::detail::kMacGlyphNames[i]) { idx = i; break; }
            }
            if (idx == 0xFFFF) {
                idx = static_cast<std::uint16_t>(emojidump::detail::kNumStandardNames + pool.size());
                pool.push_back(g.name);
            }
            w.u16(idx);
        }
        for (const std::string& s : pool) {
            w.u8(static_cast<std::uint8_t>(s.size()));
            for (char c : s) w.u8(static_cast<std::uint8_t>(c));
        }
        return w.bytes;
    }

    // Strike glyph records: originOffsetX, originOffsetY, graphicType, data.
    // Each strike gets its ppem folded into the image so strikes differ.
    inline std::vector<std::uint8_t> build_sbix(const FontSpec& spec) {
        const std::uint32_t num_strikes = static_cast<std::uint32_t>(spec.ppems.size());
        const std::uint32_t num_glyphs = static_cast<std::uint32_t>(spec.glyphs.size());

        Writer w;
        w.u16(1);  // version
        w.u16(1);  // flags: draw outlines
        w.u32(num_strikes);
        const std::size_t offsets_at = w.size();
        for (std::uint32_t i = 0; i < num_strikes; ++i) w.u32(0);

        for (std::uint32_t s = 0; s < num_strikes; ++s) {
            w.pad4();
            const std::uint32_t strike_start = w.size();
            w.patch32(offsets_at + 4 * s, strike_start);
            w.u16(spec.ppems[s]);
            w.u16(72);

            const std::size_t glyph_offsets_at = w.size();
            for (std::uint32_t g = 0; g <= num_glyphs; ++g) w.u32(0);

            for (std::uint32_t g = 0; g < num_glyphs; ++g) {
                w.patch32(glyph_offsets_at + 4 * g, w.size() - strike_start);
                const TestGlyph& tg = spec.glyphs[g];
                if (tg.image.empty())
                    continue;
                w.u16(0);                   // originOffsetX
                w.u16(static_cast<std::uint16_t>(-2)); // originOffsetY
                w.tag(tg.type.c_str());
                std::vector<std::uint8_t> img = tg.image;
                if (tg.type == "png ")
                    img.push_back(static_cast<std::uint8_t>(spec.ppems[s]));
                w.raw(img);
            }
            w.patch32(glyph_offsets_at + 4 * num_glyphs, w.size() - strike_start);
        }
        return w.bytes;
    }

    struct Table {
        const char* tag;
        std::vector<std::uint8_t> data;
    };

    // Tables must be given in tag order.
    inline std::vector<std::uint8_t> build_font(const std::vector<Table>& tables, bool collection) {
        Writer w;
        const std::uint32_t font_start = collection ? 16 : 0;
        if (collection) {
            w.tag("ttcf");
            w.u32(0x00010000);
            w.u32(1);
            w.u32(font_start);
        }

        const std::uint16_t num_tables = static_cast<std::uint16_t>(tables.size());
        w.u32(0x00010000);
        w.u16(num_tables);
        w.u16(16); w.u16(0); w.u16(0); // searchRange, entrySelector, rangeShift

        const std::size_t records_at = w.size();
        for (const Table& t : tables) {
            w.tag(t.tag);
            w.u32(0);  // checksum
            w.u32(0);  // offset
            w.u32(static_cast<std::uint32_t>(t.data.size()));
        }
        for (std::size_t i = 0; i < tables.size(); ++i) {
            w.pad4();
            w.patch32(records_at + 16 * i + 8, w.size());
            w.raw(tables[i].data);
        }
        return w.bytes;
    }

    inline std::vector<std::uint8_t> build_font(const FontSpec& spec) {
        return build_font({ { "post", build_post(spec) }, { "sbix", build_sbix(spec) } }, spec.collection);
    }

    // Absolute file offset of a table inside bytes produced by build_font().
    inline std::uint32_t table_offset(const std::vector<std::uint8_t>& font, const char* tag) {
        const std::size_t dir = (std::memcmp(font.data(), "ttcf", 4) == 0) ? 16 : 0;
        const std::uint16_t n = std::uint16_t((font[dir + 4] << 8) | font[dir + 5]);
        for (std::uint16_t i = 0; i < n; ++i) {
            const std::uint8_t* rec = font.data() + dir + 12 + 16 * i;
            if (std::memcmp(rec, tag, 4) == 0)
                return (std::uint32_t(rec[8]) << 24) | (std::uint32_t(rec[9]) << 16)
                     | (std::uint32_t(rec[10]) << 8) | std::uint32_t(rec[11]);
        }
        return 0;
    }

    inline std::string write_temp(const std::vector<std::uint8_t>& bytes, const std::string& name) {
        std::filesystem::path p = std::filesystem::temp_directory_path() / ("emojidump_test_" + name);
        std::ofstream f(p, std::ios::binary | std::ios::trunc);
        f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        return p.string();
    }

    // Fresh empty directory under the temp dir.
    inline std::string temp_dir(const std::string& name) {
        std::filesystem::path p = std::filesystem::temp_directory_path() / ("emojidump_test_" + name);
        std::error_code ec;
        std::filesystem::remove_all(p, ec);
        std::filesystem::create_directories(p, ec);
        return p.string();
    }

} // namespace emojidump_test
