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
#include <stdio.h>  // snprintf

#include <string>

#include "detail/enums.hpp"

namespace emojidump {

// One emoji as Unicode scalar values, ZWJs and selectors included.
using Sequence = std::u32string;

inline int HexDigit(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

// Whole of [first, last) must be hex; at most 6 digits.
inline bool ParseHex(const char* first, const char* last, char32_t& out) noexcept {
    if (first == last || last - first > 6) return false;
    uint32_t v = 0;
    for (const char* p = first; p != last; ++p) {
        int d = HexDigit(*p);
        if (d < 0) return false;
        v = (v << 4) | static_cast<uint32_t>(d);
    }
    if (v > 0x10FFFF) return false;
    out = static_cast<char32_t>(v);
    return true;
}

// "1F468 200D 1F469" -> {U+1F468, U+200D, U+1F469}
inline bool ParseHexSequence(const std::string& text, Sequence& out) {
    out.clear();
    const char* p = text.c_str();
    const char* end = p + text.size();
    while (p < end) {
        while (p < end && (*p == ' ' || *p == '\t')) ++p;
        const char* start = p;
        while (p < end && *p != ' ' && *p != '\t') ++p;
        if (start == p) break;
        char32_t c;
        if (!ParseHex(start, p, c)) return false;
        out.push_back(c);
    }
    return !out.empty();
}

// "1F468 200D 1F469", for diagnostics
inline std::string ToHex(const Sequence& seq) {
    std::string out;
    char buf[16];
    for (char32_t c : seq) {
        snprintf(buf, sizeof(buf), out.empty() ? "%04X" : " %04X", static_cast<unsigned>(c));
        out += buf;
    }
    return out;
}

inline std::string ToUtf8(const Sequence& seq) {
    std::string out;
    for (char32_t c : seq) {
        uint32_t v = static_cast<uint32_t>(c);
        if (v < 0x80) {
            out += static_cast<char>(v);
        } else if (v < 0x800) {
            out += static_cast<char>(0xC0 | (v >> 6));
            out += static_cast<char>(0x80 | (v & 0x3F));
        } else if (v < 0x10000) {
            out += static_cast<char>(0xE0 | (v >> 12));
            out += static_cast<char>(0x80 | ((v >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (v & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (v >> 18));
            out += static_cast<char>(0x80 | ((v >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((v >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (v & 0x3F));
        }
    }
    return out;
}

// Output name of a sequence, Noto build style: VS16 dropped, the rest as
// lowercase hex joined by '_'.
//   {1F468, 200D, 1F469, 200D, 1F467} -> "emoji_u1f468_200d_1f469_200d_1f467"
inline std::string ToIdentifier(const Sequence& seq) {
    std::string out = "emoji_u";
    bool first = true;
    char buf[16];
    for (char32_t c : seq) {
        if (c == codepoint::Vs16) continue;
        snprintf(buf, sizeof(buf), first ? "%04x" : "_%04x", static_cast<unsigned>(c));
        out += buf;
        first = false;
    }
    return out;
}

inline bool HasSkinTone(const Sequence& seq) noexcept {
    for (char32_t c : seq)
        if (codepoint::IsSkinTone(c)) return true;
    return false;
}

} // namespace emojidump
