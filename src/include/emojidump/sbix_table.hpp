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

#include <stdint.h> // uint32_t

#include <string>
#include <vector>

#include "detail/buf.hpp"
#include "font_directory.hpp"
#include "font_file.hpp"
#include "status.hpp"

namespace emojidump {

// Bytes that live in the font file and are only read when asked for.
struct BitmapRef {
    const FontFile* file;
    uint64_t offset;   // absolute
    uint32_t length;

    bool Read(std::vector<uint8_t>& out, Status& st) const {
        return file->ReadAt(offset, length, out, Stage::Sbix, st);
    }
};

struct GlyphBitmap {
    uint16_t glyph_id;
    int16_t origin_x;
    int16_t origin_y;
    char graphic_type[4];  // 'png ', 'jpg ', 'tiff', 'dupe', ...
    BitmapRef payload;     // whole glyph record, header included
    BitmapRef image;       // payload minus the 8 byte header

    bool IsType(const char* tag) const noexcept {
        return graphic_type[0]==tag[0] && graphic_type[1]==tag[1]
            && graphic_type[2]==tag[2] && graphic_type[3]==tag[3];
    }
    std::string Type() const { return std::string(graphic_type, 4); }
};

struct Strike {
    uint16_t ppem;
    uint16_t resolution;   // ppi
    uint32_t offset;       // from start of 'sbix'
    std::vector<uint32_t> glyph_data_offsets; // from start of strike; up to num_glyphs+1
};

// https://developer.apple.com/fonts/TrueType-Reference-Manual/RM06/Chap6sbix.html
//
// Only the strike with the requested ppem is materialized. Glyph images are
// located on demand; nothing but the offset table is held in memory.
struct SbixTable {
    static constexpr uint32_t kGlyphHeaderSize = 8; // originOffsetX, originOffsetY, graphicType

    inline bool Read(const FontFile& file, const TableRecord& sbix, uint16_t ppem,
                     uint16_t num_glyphs, Status& st);

    // [begin, end) of the glyph record inside the strike. False when the
    // glyph has no bitmap at this size.
    inline bool GlyphRange(uint16_t glyph_id, uint32_t& begin, uint32_t& end) const noexcept;

    // False both when the glyph has no bitmap (st stays ok) and when its
    // header cannot be read (st holds the error).
    inline bool BitmapFor(uint16_t glyph_id, GlyphBitmap& out, Status& st) const;

    const Strike& SelectedStrike() const noexcept { return _strike; }
    const std::vector<uint16_t>& StrikeSizes() const noexcept { return _sizes; }
    uint16_t Version() const noexcept { return _version; }
    uint16_t Flags() const noexcept { return _flags; }

private:
    const FontFile* _file{};
    uint32_t _table_offset{};
    uint32_t _table_length{};
    uint16_t _version{}, _flags{};
    std::vector<uint16_t> _sizes;  // ppem of every strike, file order
    Strike _strike{};
}; // struct SbixTable


inline bool SbixTable::Read(const FontFile& file, const TableRecord& sbix, uint16_t ppem,
                            uint16_t num_glyphs, Status& st) {
    _file = &file;
    _table_offset = sbix.offset;
    _table_length = sbix.length;
    _sizes.clear();
    _strike = Strike{};

    std::vector<uint8_t> block;
    if (!file.ReadAt(sbix.offset, sbix.length < 8 ? sbix.length : 8, block, Stage::Sbix, st))
        return false;

    detail::Buf b = detail::Buf::Over(block.data(), static_cast<uint32_t>(block.size()), sbix.offset);
    _version = b.Get16();
    _flags = b.Get16();
    uint32_t num_strikes = b.Get32();
    if (b.overrun)
        return st.Fail(ErrorCode::MalformedFont, Stage::Sbix, sbix.offset, "truncated 'sbix' header");
    if (_version < 1)
        return st.Fail(ErrorCode::MalformedFont, Stage::Sbix, sbix.offset,
                       "unrecognized 'sbix' version " + std::to_string(_version));
    if (uint64_t(num_strikes) * 4 > sbix.length - 8)
        return st.Fail(ErrorCode::MalformedFont, Stage::Sbix, sbix.offset + 4,
                       "strike count " + std::to_string(num_strikes) + " overruns the table");

    std::vector<uint8_t> offsets_block;
    if (!file.ReadAt(uint64_t(sbix.offset) + 8, num_strikes * 4, offsets_block, Stage::Sbix, st))
        return false;
    b = detail::Buf::Over(offsets_block.data(), num_strikes * 4, uint64_t(sbix.offset) + 8);

    bool found = false;
    for (uint32_t i = 0; i < num_strikes; ++i) {
        uint64_t at = b.Position();
        uint32_t strike_offset = b.Get32();
        if (strike_offset > sbix.length || sbix.length - strike_offset < 4)
            return st.Fail(ErrorCode::MalformedFont, Stage::Sbix, at,
                           "strike " + std::to_string(i) + " lies outside the table");

        if (!file.ReadAt(uint64_t(sbix.offset) + strike_offset, 4, block, Stage::Sbix, st))
            return false;
        detail::Buf sh = detail::Buf::Over(block.data(), 4, uint64_t(sbix.offset) + strike_offset);
        uint16_t strike_ppem = sh.Get16();
        uint16_t resolution = sh.Get16();
        _sizes.push_back(strike_ppem);

        if (found || strike_ppem != ppem)
            continue;
        found = true;
        _strike.ppem = strike_ppem;
        _strike.resolution = resolution;
        _strike.offset = strike_offset;
    }

    if (!found) {
        std::string sizes;
        for (uint16_t s : _sizes) {
            if (!sizes.empty()) sizes += ", ";
            sizes += std::to_string(s);
        }
        return st.Fail(ErrorCode::StrikeNotFound, Stage::Sbix, sbix.offset,
                       "no strike at " + std::to_string(ppem) + " ppem (font has: "
                       + (sizes.empty() ? std::string("none") : sizes) + ")");
    }

    // Offsets past the end of the table count as absent.
    uint32_t available = (sbix.length - _strike.offset - 4) / 4;
    uint32_t count = uint32_t(num_glyphs) + 1;
    if (count > available) count = available;

    const uint64_t offsets_at = uint64_t(sbix.offset) + _strike.offset + 4;
    if (!file.ReadAt(offsets_at, count * 4, block, Stage::Sbix, st))
        return false;
    b = detail::Buf::Over(block.data(), count * 4, offsets_at);
    _strike.glyph_data_offsets.resize(count);
    for (uint32_t i = 0; i < count; ++i)
        _strike.glyph_data_offsets[i] = b.Get32();
    return true;
}

inline bool SbixTable::GlyphRange(uint16_t glyph_id, uint32_t& begin, uint32_t& end) const noexcept {
    const std::vector<uint32_t>& offs = _strike.glyph_data_offsets;
    if (size_t(glyph_id) + 1 >= offs.size())
        return false;
    begin = offs[glyph_id];
    end = offs[glyph_id + 1];
    return begin < end;
}

inline bool SbixTable::BitmapFor(uint16_t glyph_id, GlyphBitmap& out, Status& st) const {
    uint32_t begin, end;
    if (!GlyphRange(glyph_id, begin, end))
        return false;

    const uint64_t strike_start = uint64_t(_table_offset) + _strike.offset;
    if (uint64_t(_strike.offset) + end > _table_length || end - begin < kGlyphHeaderSize)
        return st.Fail(ErrorCode::MalformedFont, Stage::Sbix, strike_start + begin,
                       "glyph " + std::to_string(glyph_id) + " record lies outside the strike");

    std::vector<uint8_t> header;
    if (!_file->ReadAt(strike_start + begin, kGlyphHeaderSize, header, Stage::Sbix, st))
        return false;

    detail::Buf b = detail::Buf::Over(header.data(), kGlyphHeaderSize, strike_start + begin);
    out.glyph_id = glyph_id;
    out.origin_x = b.GetShort();
    out.origin_y = b.GetShort();
    b.GetTag(out.graphic_type);

    out.payload = BitmapRef{ _file, strike_start + begin, end - begin };
    out.image = BitmapRef{ _file, strike_start + begin + kGlyphHeaderSize, end - begin - kGlyphHeaderSize };
    return true;
}

} // namespace emojidump
