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

#include <string>
#include <utility> // std::move
#include <vector>

#include "detail/enums.hpp"
#include "emoji_database.hpp"
#include "sequence.hpp"

namespace emojidump {

// One rule of the glyph naming convention. Match() appends candidate
// sequences for `name` and returns true if the rule applies.
struct NamePattern {
    virtual bool Match(const std::string& name, std::vector<Sequence>& out) const = 0;
    virtual ~NamePattern() noexcept = default;
};

// Combinations that the font aliases to one legacy codepoint instead of a
// joined sequence. Known cases only; do not extend without checking the font.
struct CanonicalComposite {
    char32_t composite;
    const char* members;
};

static const CanonicalComposite kCanonicalComposites[] = {
    { codepoint::Family,      "MWB" },
    { codepoint::CoupleHeart, "WM"  },
    { codepoint::Kiss,        "WM"  },
};

// u1F46A.MWG (family), u1F491.MM (couple with heart), u1F48F.WW (kiss)
struct CompositePattern final : NamePattern {
    static char32_t Person(char c) noexcept {
        switch (c) {
        case 'B': return codepoint::Boy;
        case 'G': return codepoint::Girl;
        case 'M': return codepoint::Man;
        case 'W': return codepoint::Woman;
        default:  return 0;
        }
    }

    bool Match(const std::string& name, std::vector<Sequence>& out) const override {
        size_t dot = name.find('.');
        if (name.size() < 2 || name[0] != 'u' || dot == std::string::npos)
            return false;

        const std::string hex = name.substr(1, dot - 1);
        char32_t composite;
        if (hex == "1F46A")      composite = codepoint::Family;
        else if (hex == "1F491") composite = codepoint::CoupleHeart;
        else if (hex == "1F48F") composite = codepoint::Kiss;
        else return false;

        const std::string members = name.substr(dot + 1);
        if (members.empty())
            return false;
        for (char c : members)
            if (!Person(c)) return false;

        for (const CanonicalComposite& cc : kCanonicalComposites) {
            if (cc.composite == composite && members == cc.members) {
                out.push_back(Sequence(1, composite));
                return true;
            }
        }

        Sequence middle(1, codepoint::Zwj);
        if (composite == codepoint::CoupleHeart) {
            middle = { codepoint::Zwj, codepoint::HeavyHeart, codepoint::Vs16, codepoint::Zwj };
        }
        else if (composite == codepoint::Kiss) {
            middle = { codepoint::Zwj, codepoint::HeavyHeart, codepoint::Vs16, codepoint::Zwj,
                       codepoint::KissMark, codepoint::Zwj };
        }

        Sequence seq;
        for (size_t i = 0; i < members.size(); ++i) {
            if (i) seq += middle;
            seq.push_back(Person(members[i]));
        }
        out.push_back(seq);
        return true;
    }
};

// Everything else: u1F3C3_u200D_u2640.1 and friends.
//
//   uXXXX          -> U+XXXX; each further _uXXXX is joined with a ZWJ
//   .0             -> dropped (gender neutral marker)
//   .1 .. .5       -> skin tone modifier
//   trailing .M/.W -> VS16 ZWJ MALE/FEMALE SIGN
//
// Besides that base candidate: without its first VS16, without any ZWJ, and
// each of those with a VS16 appended, since fonts and Unicode data disagree
// on optional selectors.
struct TokenPattern final : NamePattern {
    static bool IsUpperHex(char c) noexcept {
        return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'F');
    }
    static bool IsWord(char32_t c) noexcept {
        return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_';
    }

    // u + hex at name[i]; on success `end` is one past the last digit
    static bool Token(const std::string& name, size_t i, char32_t& cp, size_t& end) noexcept {
        if (i >= name.size() || name[i] != 'u') return false;
        size_t j = i + 1;
        while (j < name.size() && IsUpperHex(name[j])) ++j;
        if (!ParseHex(name.data() + i + 1, name.data() + j, cp)) return false;
        end = j;
        return true;
    }

    static Sequence Decode(const std::string& name) {
        Sequence raw;
        size_t i = 0;
        while (i < name.size()) {
            char32_t cp;
            size_t end;
            if (i == 0 && Token(name, 0, cp, end)) {
                raw.push_back(cp);
                i = end;
            }
            else if (name[i] == '_' && Token(name, i + 1, cp, end)) {
                raw.push_back(codepoint::Zwj);
                raw.push_back(cp);
                i = end;
            }
            else {
                raw.push_back(static_cast<unsigned char>(name[i]));
                ++i;
            }
        }

        // first ".0" at a word boundary
        for (size_t k = 0; k + 1 < raw.size(); ++k) {
            if (raw[k] == '.' && raw[k + 1] == '0' && (k + 2 == raw.size() || !IsWord(raw[k + 2]))) {
                raw.erase(k, 2);
                break;
            }
        }

        // first ".1" .. ".5"
        for (size_t k = 0; k + 1 < raw.size(); ++k) {
            if (raw[k] == '.' && raw[k + 1] >= '1' && raw[k + 1] <= '5') {
                char32_t tone = codepoint::kSkinTones[raw[k + 1] - '1'];
                raw.replace(k, 2, Sequence(1, tone));
                break;
            }
        }

        const size_t n = raw.size();
        if (n >= 2 && raw[n - 2] == '.' && (raw[n - 1] == 'M' || raw[n - 1] == 'W')) {
            char32_t sign = raw[n - 1] == 'M' ? codepoint::MaleSign : codepoint::FemaleSign;
            raw.resize(n - 2);
            raw.push_back(codepoint::Vs16);
            raw.push_back(codepoint::Zwj);
            raw.push_back(sign);
        }
        return raw;
    }

    bool Match(const std::string& name, std::vector<Sequence>& out) const override {
        const size_t first = out.size();
        Sequence raw = Decode(name);
        out.push_back(raw);

        size_t vs = raw.find(codepoint::Vs16);
        if (vs != Sequence::npos) {
            Sequence c = raw;
            c.erase(vs, 1);
            out.push_back(c);
        }
        if (raw.find(codepoint::Zwj) != Sequence::npos) {
            Sequence c;
            for (char32_t ch : raw)
                if (ch != codepoint::Zwj) c.push_back(ch);
            out.push_back(c);
        }

        const size_t last = out.size();
        for (size_t i = first; i < last; ++i)
            out.push_back(out[i] + codepoint::Vs16);
        return true;
    }
};

// Glyph name -> the Unicode sequence(s) it can stand for.
struct SequenceResolver {
    SequenceResolver() noexcept : _patterns{ &_composite, &_token } {}
    SequenceResolver(const SequenceResolver&) = delete;
    SequenceResolver& operator=(const SequenceResolver&) = delete;

    // Every candidate, in generation order; no database involved.
    std::vector<Sequence> Candidates(const std::string& name) const {
        std::vector<Sequence> out;
        for (const NamePattern* p : _patterns)
            if (p->Match(name, out)) break;
        return out;
    }

    // Unique name mode: the first candidate the database knows.
    bool Resolve(const std::string& name, const EmojiOracle& oracle, Sequence& out) const {
        for (Sequence& c : Candidates(name)) {
            if (oracle.Contains(c)) {
                out = std::move(c);
                return true;
            }
        }
        return false;
    }

    // Find any match mode: every candidate the database knows.
    std::vector<Sequence> Matches(const std::string& name, const EmojiOracle& oracle) const {
        std::vector<Sequence> out;
        for (Sequence& c : Candidates(name))
            if (oracle.Contains(c)) out.push_back(std::move(c));
        return out;
    }

private:
    CompositePattern _composite;
    TokenPattern _token;
    const NamePattern* _patterns[2];
}; // struct SequenceResolver

} // namespace emojidump
