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

#include <stddef.h> // size_t
#include <stdint.h> // uint32_t

#include <string>

namespace emojidump {
    namespace detail {
        // Big-endian cursor over a block that was read from the font file.
        // `base` is the absolute file offset of data[0], so failures can be
        // reported against the file rather than the block.
        struct Buf {
            const uint8_t* data;
            uint32_t cursor;
            uint32_t size;
            uint64_t base;
            bool overrun;

            inline uint8_t Get8() noexcept;
            inline void Seek(uint32_t o) noexcept;
            inline void Skip(uint32_t o) noexcept { Seek(cursor + o); }
            inline uint32_t Get(int n) noexcept;
            inline uint16_t Get16() noexcept { return static_cast<uint16_t>(Get(2)); }
            inline uint32_t Get32() noexcept { return Get(4); }
            inline int16_t GetShort() noexcept { return static_cast<int16_t>(Get(2)); }
            inline bool GetTag(char tag[4]) noexcept;
            inline bool GetPascalString(std::string& out);

            inline bool Has(uint32_t n) const noexcept { return n <= size - cursor; }
            inline bool AtEnd() const noexcept { return cursor >= size; }
            inline uint64_t Position() const noexcept { return base + cursor; }

            static inline Buf Over(const uint8_t* p, uint32_t n, uint64_t base_offset = 0) noexcept {
                Buf b{};
                b.data = p;
                b.size = n;
                b.base = base_offset;
                return b;
            }
        }; // struct Buf



        inline uint8_t Buf::Get8() noexcept {
            if (cursor >= size) {
                overrun = true;
                return 0;
            }
            return data[cursor++];
        }

        inline void Buf::Seek(uint32_t o) noexcept {
            if (o > size) {
                overrun = true;
                cursor = size;
                return;
            }
            cursor = o;
        }

        inline uint32_t Buf::Get(int n) noexcept {
            uint32_t v = 0;
            for (int i = 0; i < n; ++i)
                v = (v << 8) | Get8();
            return v;
        }

        inline bool Buf::GetTag(char tag[4]) noexcept {
            for (int i = 0; i < 4; ++i)
                tag[i] = static_cast<char>(Get8());
            return !overrun;
        }

        // length byte, then that many bytes
        inline bool Buf::GetPascalString(std::string& out) {
            if (!Has(1)) {
                overrun = true;
                return false;
            }
            uint8_t len = data[cursor++];
            if (!Has(len)) {
                overrun = true;
                return false;
            }
            out.assign(reinterpret_cast<const char*>(data + cursor), len);
            cursor += len;
            return true;
        }
    } // namespace detail
} // namespace emojidump
