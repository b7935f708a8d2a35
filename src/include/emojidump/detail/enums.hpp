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

namespace emojidump {
    namespace detail {
        // sfnt version tags, see
        // https://learn.microsoft.com/en-us/typography/opentype/spec/otff#table-directory
        enum class SfntVersion : uint32_t {
            TrueType = 0x00010000,
            OpenType = 0x4F54544F, // 'OTTO', CFF outlines
            Apple    = 0x74727565  // 'true'
        };

        enum class TtcVersion : uint32_t {
            V1 = 0x00010000,
            V2 = 0x00020000
        };

        // Fixed 16.16 version numbers of the 'post' table. Only 2.0 carries
        // glyph names we can read.
        enum class PostVersion : uint32_t {
            V1   = 0x00010000,
            V2   = 0x00020000,
            V2_5 = 0x00025000,
            V3   = 0x00030000
        };

        // Glyph names 0..257 come from the standard Macintosh glyph order.
        constexpr uint16_t kNumStandardNames = 258;
    } // namespace detail

    namespace codepoint {
        constexpr char32_t Zwj          = 0x200D;
        constexpr char32_t Vs16         = 0xFE0F;
        constexpr char32_t MaleSign     = 0x2642;
        constexpr char32_t FemaleSign   = 0x2640;
        constexpr char32_t HeavyHeart   = 0x2764;
        constexpr char32_t KissMark     = 0x1F48B;

        // skin tones, Fitzpatrick type 1-2 .. type 6
        constexpr char32_t SkinTone1    = 0x1F3FB;
        constexpr char32_t SkinTone2    = 0x1F3FC;
        constexpr char32_t SkinTone3    = 0x1F3FD;
        constexpr char32_t SkinTone4    = 0x1F3FE;
        constexpr char32_t SkinTone5    = 0x1F3FF;

        constexpr char32_t Boy          = 0x1F466;
        constexpr char32_t Girl         = 0x1F467;
        constexpr char32_t Man          = 0x1F468;
        constexpr char32_t Woman        = 0x1F469;

        constexpr char32_t Family       = 0x1F46A;
        constexpr char32_t CoupleHeart  = 0x1F491;
        constexpr char32_t Kiss         = 0x1F48F;

        constexpr char32_t kSkinTones[5] = {
            SkinTone1, SkinTone2, SkinTone3, SkinTone4, SkinTone5
        };

        inline bool IsSkinTone(char32_t c) noexcept {
            return c >= SkinTone1 && c <= SkinTone5;
        }
    } // namespace codepoint
} // namespace emojidump
