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
#include <stdint.h> // uint16_t

#include <set>
#include <string>
#include <vector>

#include "detail/enums.hpp"
#include "post_table.hpp"
#include "resolver.hpp"
#include "sbix_table.hpp"
#include "sequence.hpp"

namespace emojidump {

// Characters that take a skin tone, per the Emoji_Modifier_Sequence lines of
// emoji-sequences.txt. Built once per run and not modified afterwards.
struct ModifierBases {
    static constexpr const char* kMarker = "Emoji_Modifier_Sequence";

    // "261D 1F3FB ; RGI_Emoji_Modifier_Sequence ; index pointing up: light skin tone"
    static ModifierBases FromLines(const std::vector<std::string>& lines) {
        ModifierBases bases;
        for (const std::string& raw : lines) {
            std::string line = raw.substr(0, raw.find('#'));
            if (line.find(kMarker) == std::string::npos)
                continue;

            size_t n = 0;
            while (n < line.size() && n < 6 && HexDigit(line[n]) >= 0) ++n;
            char32_t base;
            if (n < 4 || n > 5 || !ParseHex(line.data(), line.data() + n, base))
                continue;
            bases._bases.insert(base);
        }
        return bases;
    }

    bool Contains(char32_t c) const { return _bases.count(c) != 0; }
    size_t Size() const noexcept { return _bases.size(); }
    bool Empty() const noexcept { return _bases.empty(); }

private:
    std::set<char32_t> _bases;
}; // struct ModifierBases


// Second pass: skin tone sequences a complete emoji font should expose, and
// the glyphs that can stand for them.
struct ModifierEnumerator {
    ModifierEnumerator(const ModifierBases& bases, const SequenceResolver& resolver) noexcept
        : _bases(bases), _resolver(resolver) {}

    // `context` is a full emoji sequence whose first character may be a base.
    //   with MALE SIGN:  base tone ZWJ MALE VS16                  (5)
    //   otherwise:       base tone, then base tone ZWJ FEMALE VS16 (10)
    std::vector<Sequence> SequencesFor(const Sequence& context) const {
        std::vector<Sequence> out;
        if (context.empty() || !_bases.Contains(context[0]))
            return out;

        const char32_t base = context[0];
        if (context.find(codepoint::MaleSign) != Sequence::npos) {
            for (char32_t tone : codepoint::kSkinTones)
                out.push_back(Sequence{ base, tone, codepoint::Zwj, codepoint::MaleSign, codepoint::Vs16 });
            return out;
        }

        for (char32_t tone : codepoint::kSkinTones)
            out.push_back(Sequence{ base, tone });
        for (char32_t tone : codepoint::kSkinTones)
            out.push_back(Sequence{ base, tone, codepoint::Zwj, codepoint::FemaleSign, codepoint::Vs16 });
        return out;
    }

    // Caches the candidate set of every glyph that has a bitmap.
    void Prepare(const PostTable& names, const SbixTable& sbix) {
        _glyphs.clear();
        for (uint16_t gid = 0; gid < names.NumGlyphs(); ++gid) {
            uint32_t begin, end;
            if (!sbix.GlyphRange(gid, begin, end))
                continue;
            const std::string& name = names.NameFor(gid);
            _glyphs.push_back(Glyph{ gid, HasToneSuffix(name), _resolver.Candidates(name) });
        }
    }

    // First glyph, in id order, whose candidates include `seq` (or `seq`
    // followed by VS16 ZWJ FEMALE SIGN). Toned sequences only look at names
    // with a .1 - .5 suffix.
    bool FindGlyph(const Sequence& seq, uint16_t& glyph_id) const {
        const bool toned = HasSkinTone(seq);
        const Sequence female = seq + Sequence{ codepoint::Vs16, codepoint::Zwj, codepoint::FemaleSign };
        for (const Glyph& g : _glyphs) {
            if (toned && !g.tone_suffix)
                continue;
            for (const Sequence& c : g.candidates) {
                if (c == seq || c == female) {
                    glyph_id = g.id;
                    return true;
                }
            }
        }
        return false;
    }

    // ".1" .. ".5" at the end or followed by another '.'
    static bool HasToneSuffix(const std::string& name) noexcept {
        for (size_t i = 0; i + 1 < name.size(); ++i) {
            if (name[i] != '.' || name[i + 1] < '1' || name[i + 1] > '5')
                continue;
            if (i + 2 == name.size() || name[i + 2] == '.')
                return true;
        }
        return false;
    }

    size_t NumGlyphs() const noexcept { return _glyphs.size(); }

private:
    struct Glyph {
        uint16_t id;
        bool tone_suffix;
        std::vector<Sequence> candidates;
    };

    const ModifierBases& _bases;
    const SequenceResolver& _resolver;
    std::vector<Glyph> _glyphs;
}; // struct ModifierEnumerator

} // namespace emojidump
