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

#pragma once

#include <stdint.h> // uint16_t
#include <stdio.h>  // snprintf

#include <string>
#include <utility> // std::move
#include <vector>

#include "detail/buf.hpp"
#include "detail/enums.hpp"
#include "detail/mac_glyph_names.hpp"
#include "font_directory.hpp"
#include "font_file.hpp"
#include "status.hpp"

namespace emojidump {

// Glyph id -> PostScript name, from a version 2.0 'post' table.
// https://learn.microsoft.com/en-us/typography/opentype/spec/post
struct PostTable {
    inline bool Read(const FontFile& file, const TableRecord& post, Status& st);

    // Parses an already loaded table; `base` is its file offset, for diagnostics.
    inline bool Parse(const uint8_t* data, uint32_t size, uint64_t base, Status& st);

    // Empty for ids past NumGlyphs().
    inline const std::string& NameFor(uint16_t glyph_id) const noexcept;
    uint16_t NumGlyphs() const noexcept { return static_cast<uint16_t>(_names.size()); }
    const std::vector<std::string>& Names() const noexcept { return _names; }

    template<class F>
    void ForEach(F&& f) const {
        for (size_t i = 0; i < _names.size(); ++i)
            f(static_cast<uint16_t>(i), _names[i]);
    }

private:
    std::vector<std::string> _names; // indexed by glyph id
}; // struct PostTable


inline const std::string& PostTable::NameFor(uint16_t glyph_id) const noexcept {
    static const std::string kNoName;
    return glyph_id < _names.size() ? _names[glyph_id] : kNoName;
}

inline bool PostTable::Read(const FontFile& file, const TableRecord& post, Status& st) {
    std::vector<uint8_t> block;
    if (!file.ReadAt(post.offset, post.length, block, Stage::Post, st))
        return false;
    return Parse(block.data(), static_cast<uint32_t>(block.size()), post.offset, st);
}

inline bool PostTable::Parse(const uint8_t* data, uint32_t size, uint64_t base, Status& st) {
    _names.clear();
    detail::Buf b = detail::Buf::Over(data, size, base);

    uint32_t version = b.Get32();
    if (b.overrun)
        return st.Fail(ErrorCode::MalformedFont, Stage::Post, base, "truncated 'post' header");
    if (version != static_cast<uint32_t>(detail::PostVersion::V2)) {
        char buf[32];
        snprintf(buf, sizeof(buf), "%u.%u", version >> 16, version & 0xFFFF);
        return st.Fail(ErrorCode::UnsupportedPostFormat, Stage::Post, base,
                       std::string("'post' version ") + buf + ", only 2.0 carries glyph names");
    }

    // italicAngle .. maxMemType1
    b.Seek(32);
    uint16_t num_glyphs = b.Get16();
    if (b.overrun)
        return st.Fail(ErrorCode::MalformedFont, Stage::Post, base + 32, "truncated 'post' header");

    const uint32_t index_start = b.cursor;
    std::vector<uint16_t> name_index(num_glyphs);
    for (uint16_t i = 0; i < num_glyphs; ++i)
        name_index[i] = b.Get16();
    if (b.overrun)
        return st.Fail(ErrorCode::MalformedFont, Stage::Post, base + index_start,
                       "glyph name index overruns the table");

    std::vector<std::string> pool;
    while (!b.AtEnd()) {
        uint64_t at = b.Position();
        std::string s;
        if (!b.GetPascalString(s))
            return st.Fail(ErrorCode::MalformedFont, Stage::Post, at, "truncated glyph name string");
        pool.push_back(std::move(s));
    }

    _names.resize(num_glyphs);
    for (uint16_t gid = 0; gid < num_glyphs; ++gid) {
        uint16_t idx = name_index[gid];
        if (idx < detail::kNumStandardNames) {
            _names[gid] = detail::kMacGlyphNames[idx];
            continue;
        }
        size_t entry = idx - detail::kNumStandardNames;
        if (entry >= pool.size()) {
            _names.clear();
            return st.Fail(ErrorCode::MalformedFont, Stage::Post, base + index_start + 2u * gid,
                           "name index " + std::to_string(idx) + " of glyph " + std::to_string(gid)
                           + " is past the string pool (" + std::to_string(pool.size()) + " entries)");
        }
        _names[gid] = pool[entry];
    }
    return true;
}

} // namespace emojidump
