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

#include <fstream>
#include <string>
#include <vector>

#include "status.hpp"

namespace emojidump {

// Read-only handle on the font file. Everything above it works on small blocks
// fetched with ReadAt(); glyph images are fetched the same way, on demand.
struct FontFile {
    FontFile() = default;
    FontFile(const FontFile&) = delete;
    FontFile& operator=(const FontFile&) = delete;

    inline bool Open(const std::string& path, Status& st);

    // Fails with MalformedFont (reported at `stage`) when [offset, offset+size)
    // is not inside the file.
    inline bool ReadAt(uint64_t offset, uint32_t size, std::vector<uint8_t>& out,
                       Stage stage, Status& st) const;

    inline bool Contains(uint64_t offset, uint64_t size) const noexcept {
        return offset <= _size && size <= _size - offset;
    }

    uint64_t Size() const noexcept { return _size; }
    const std::string& Path() const noexcept { return _path; }

private:
    mutable std::ifstream _in;
    uint64_t _size{};
    std::string _path;
}; // struct FontFile


inline bool FontFile::Open(const std::string& path, Status& st) {
    _path = path;
    _in.open(path, std::ios::binary | std::ios::ate);
    if (!_in)
        return st.Fail(ErrorCode::FileNotFound, Stage::Container, 0,
                       "couldn't open font file: " + path);

    std::streamoff size = _in.tellg();
    if (size < 0)
        return st.Fail(ErrorCode::FileNotFound, Stage::Container, 0,
                       "couldn't determine size of: " + path);
    _size = static_cast<uint64_t>(size);
    _in.seekg(0, std::ios::beg);
    return true;
}

inline bool FontFile::ReadAt(uint64_t offset, uint32_t size, std::vector<uint8_t>& out,
                             Stage stage, Status& st) const {
    if (!Contains(offset, size))
        return st.Fail(ErrorCode::MalformedFont, stage, offset,
                       "read of " + std::to_string(size) + " bytes past end of file ("
                       + std::to_string(_size) + " bytes)");

    out.resize(size);
    if (size == 0)
        return true;

    _in.clear();
    _in.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    _in.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(size));
    if (!_in)
        return st.Fail(ErrorCode::MalformedFont, stage, offset, "short read");
    return true;
}

} // namespace emojidump
