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

#include <fstream>
#include <string>
#include <unordered_map>
#include <utility> // std::move
#include <vector>

#include "sequence.hpp"
#include "status.hpp"

namespace emojidump {

// The canonical emoji set the resolver checks candidates against.
struct EmojiOracle {
    virtual bool Contains(const Sequence& seq) const = 0;
    virtual ~EmojiOracle() noexcept = default;
};

struct EmojiEntry {
    Sequence sequence;
    std::string type;         // Basic_Emoji, RGI_Emoji_ZWJ_Sequence, ...
    std::string description;
};

inline bool ReadLines(const std::string& path, std::vector<std::string>& out, Status& st) {
    std::ifstream in(path);
    if (!in)
        return st.Fail(ErrorCode::FileNotFound, Stage::Resolve, 0, "couldn't open: " + path);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        out.push_back(line);
    }
    return true;
}

inline std::string Trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return std::string();
    size_t e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

// Built from Unicode's emoji-sequences.txt / emoji-zwj-sequences.txt:
//
//   1F466..1F469  ; Basic_Emoji            ; boy..woman   # E0.6  [4]
//   1F468 200D 1F469 200D 1F467 ; RGI_Emoji_ZWJ_Sequence ; family: man, woman, girl
//
// Ranges expand to one entry per codepoint. Entries keep file order.
struct EmojiDatabase final : EmojiOracle {
    inline size_t AddLines(const std::vector<std::string>& lines);
    inline bool LoadFile(const std::string& path, Status& st);

    bool Contains(const Sequence& seq) const override { return _index.count(seq) != 0; }

    const EmojiEntry* Find(const Sequence& seq) const {
        auto it = _index.find(seq);
        return it == _index.end() ? nullptr : &_entries[it->second];
    }

    const std::vector<EmojiEntry>& Entries() const noexcept { return _entries; }
    size_t Size() const noexcept { return _entries.size(); }
    size_t SkippedLines() const noexcept { return _skipped; }

private:
    inline void Add(Sequence seq, const std::string& type, const std::string& description);

    std::vector<EmojiEntry> _entries;
    std::unordered_map<Sequence, size_t> _index;
    size_t _skipped{};
}; // struct EmojiDatabase


inline void EmojiDatabase::Add(Sequence seq, const std::string& type, const std::string& description) {
    if (_index.count(seq)) return;
    _index.emplace(seq, _entries.size());
    _entries.push_back(EmojiEntry{ std::move(seq), type, description });
}

inline size_t EmojiDatabase::AddLines(const std::vector<std::string>& lines) {
    const size_t before = _entries.size();
    for (const std::string& raw : lines) {
        std::string line = Trim(raw.substr(0, raw.find('#')));
        if (line.empty()) continue;

        size_t semi = line.find(';');
        if (semi == std::string::npos) { ++_skipped; continue; }
        std::string points = Trim(line.substr(0, semi));
        std::string rest = line.substr(semi + 1);
        size_t semi2 = rest.find(';');
        std::string type = Trim(rest.substr(0, semi2));
        std::string description = semi2 == std::string::npos ? std::string() : Trim(rest.substr(semi2 + 1));

        size_t dots = points.find("..");
        if (dots != std::string::npos) {
            char32_t first, last;
            const char* p = points.c_str();
            if (!ParseHex(p, p + dots, first) ||
                !ParseHex(p + dots + 2, p + points.size(), last) ||
                last < first) {
                ++_skipped;
                continue;
            }
            for (char32_t c = first; c <= last; ++c)
                Add(Sequence(1, c), type, description);
            continue;
        }

        Sequence seq;
        if (!ParseHexSequence(points, seq)) { ++_skipped; continue; }
        Add(std::move(seq), type, description);
    }
    return _entries.size() - before;
}

inline bool EmojiDatabase::LoadFile(const std::string& path, Status& st) {
    std::vector<std::string> lines;
    if (!ReadLines(path, lines, st))
        return false;
    AddLines(lines);
    return true;
}

} // namespace emojidump
