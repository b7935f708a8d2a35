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

#include <map>
#include <string>
#include <vector>

#include "detail/buf.hpp"
#include "detail/enums.hpp"
#include "font_file.hpp"
#include "status.hpp"

namespace emojidump {

struct TableRecord {
    char tag[4];
    uint32_t checksum;
    uint32_t offset;   // from start of file
    uint32_t length;

    std::string Tag() const { return std::string(tag, 4); }
};

// TTC header (if any) plus the table directory of one font in it.
// https://learn.microsoft.com/en-us/typography/opentype/spec/otff
struct FontDirectory {
    inline bool Read(const FontFile& file, int font_index, Status& st);

    inline const TableRecord* FindTable(const char* tag) const noexcept;
    inline bool RequireTable(const char* tag, Stage stage, TableRecord& out, Status& st) const;

    int GetNumberOfFonts() const noexcept { return _num_fonts; }
    uint32_t FontOffset() const noexcept { return _font_offset; }
    uint32_t SfntVersion() const noexcept { return _sfnt_version; }
    bool IsCollection() const noexcept { return _collection; }
    const std::map<std::string, TableRecord>& Tables() const noexcept { return _tables; }

private:
    inline bool ReadCollectionHeader(const FontFile& file, int font_index, Status& st);
    inline bool ReadTableDirectory(const FontFile& file, Status& st);

    static bool Tag4(const uint8_t* p, char c0, char c1, char c2, char c3) noexcept {
        return p[0]==c0 && p[1]==c1 && p[2]==c2 && p[3]==c3;
    }
    static bool Tag(const uint8_t* p, const char* str) noexcept { return Tag4(p, str[0], str[1], str[2], str[3]); }
    static bool IsFont(uint32_t version) noexcept {
        using detail::SfntVersion;
        return version == static_cast<uint32_t>(SfntVersion::TrueType)
            || version == static_cast<uint32_t>(SfntVersion::OpenType)
            || version == static_cast<uint32_t>(SfntVersion::Apple);
    }

private:
    std::map<std::string, TableRecord> _tables;
    uint32_t _font_offset{};
    uint32_t _sfnt_version{};
    int _num_fonts{};
    bool _collection{};
}; // struct FontDirectory


inline bool FontDirectory::Read(const FontFile& file, int font_index, Status& st) {
    _tables.clear();
    if (font_index < 0)
        return st.Fail(ErrorCode::MalformedFont, Stage::Container, 0,
                       "negative font index " + std::to_string(font_index));

    std::vector<uint8_t> sig;
    if (!file.ReadAt(0, 4, sig, Stage::Container, st))
        return false;

    if (Tag(sig.data(), "ttcf")) {
        _collection = true;
        if (!ReadCollectionHeader(file, font_index, st))
            return false;
    }
    else {
        // if it's just a font, there's only one valid index
        _collection = false;
        _num_fonts = 1;
        _font_offset = 0;
        if (font_index != 0)
            return st.Fail(ErrorCode::MalformedFont, Stage::Container, 0,
                           "font index " + std::to_string(font_index) + " requested from a single font");
    }
    return ReadTableDirectory(file, st);
}

inline bool FontDirectory::ReadCollectionHeader(const FontFile& file, int font_index, Status& st) {
    std::vector<uint8_t> block;
    if (!file.ReadAt(0, 12, block, Stage::Container, st))
        return false;

    detail::Buf b = detail::Buf::Over(block.data(), static_cast<uint32_t>(block.size()));
    b.Skip(4); // 'ttcf'
    uint32_t version = b.Get32();
    uint32_t num_fonts = b.Get32();

    if (version != static_cast<uint32_t>(detail::TtcVersion::V1) &&
        version != static_cast<uint32_t>(detail::TtcVersion::V2))
        return st.Fail(ErrorCode::MalformedFont, Stage::Container, 4,
                       "unrecognized TTC version " + std::to_string(version >> 16));
    if (num_fonts == 0)
        return st.Fail(ErrorCode::MalformedFont, Stage::Container, 8, "collection holds no fonts");
    if (!file.Contains(12, uint64_t(num_fonts) * 4))
        return st.Fail(ErrorCode::MalformedFont, Stage::Container, 8,
                       "font count " + std::to_string(num_fonts) + " overruns the file");
    if (static_cast<uint32_t>(font_index) >= num_fonts)
        return st.Fail(ErrorCode::MalformedFont, Stage::Container, 8,
                       "font index " + std::to_string(font_index) + " out of range, collection holds "
                       + std::to_string(num_fonts));

    _num_fonts = static_cast<int>(num_fonts);

    if (!file.ReadAt(12 + uint64_t(font_index) * 4, 4, block, Stage::Container, st))
        return false;
    b = detail::Buf::Over(block.data(), 4, 12 + uint64_t(font_index) * 4);
    _font_offset = b.Get32();
    return true;
}

inline bool FontDirectory::ReadTableDirectory(const FontFile& file, Status& st) {
    std::vector<uint8_t> block;
    if (!file.ReadAt(_font_offset, 12, block, Stage::Container, st))
        return false;

    detail::Buf b = detail::Buf::Over(block.data(), 12, _font_offset);
    _sfnt_version = b.Get32();
    uint16_t num_tables = b.Get16();
    if (!IsFont(_sfnt_version))
        return st.Fail(ErrorCode::MalformedFont, Stage::Container, _font_offset,
                       "unrecognized sfnt version tag");

    const uint64_t dir = uint64_t(_font_offset) + 12;
    if (!file.ReadAt(dir, uint32_t(num_tables) * 16, block, Stage::Container, st))
        return false;

    // nothing is published unless every record checks out
    std::map<std::string, TableRecord> tables;
    b = detail::Buf::Over(block.data(), static_cast<uint32_t>(block.size()), dir);
    for (uint16_t i = 0; i < num_tables; ++i) {
        uint64_t at = b.Position();
        TableRecord rec{};
        b.GetTag(rec.tag);
        rec.checksum = b.Get32();
        rec.offset = b.Get32();
        rec.length = b.Get32();
        if (b.overrun)
            return st.Fail(ErrorCode::MalformedFont, Stage::Container, at, "truncated table directory");
        if (!file.Contains(rec.offset, rec.length))
            return st.Fail(ErrorCode::MalformedFont, Stage::Container, at,
                           "table '" + rec.Tag() + "' lies outside the file");
        tables[rec.Tag()] = rec;
    }
    _tables.swap(tables);
    return true;
}

inline const TableRecord* FontDirectory::FindTable(const char* tag) const noexcept {
    auto it = _tables.find(std::string(tag, 4));
    return it == _tables.end() ? nullptr : &it->second;
}

inline bool FontDirectory::RequireTable(const char* tag, Stage stage, TableRecord& out, Status& st) const {
    const TableRecord* rec = FindTable(tag);
    if (!rec)
        return st.Fail(ErrorCode::MalformedFont, stage, _font_offset,
                       std::string("required table '") + tag + "' is missing");
    out = *rec;
    return true;
}

} // namespace emojidump
