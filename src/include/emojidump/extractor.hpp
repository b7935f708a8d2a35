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

#include <filesystem>
#include <fstream>
#include <set>
#include <string>
#include <system_error>
#include <utility> // std::move
#include <vector>

#include "emoji_database.hpp"
#include "font_directory.hpp"
#include "font_file.hpp"
#include "modifier.hpp"
#include "post_table.hpp"
#include "resolver.hpp"
#include "sbix_table.hpp"
#include "sequence.hpp"
#include "status.hpp"

namespace emojidump {

struct Options {
    std::string font_path;
    std::string output_dir;
    std::vector<std::string> sequence_files;   // emoji-sequences.txt, emoji-zwj-sequences.txt, ...
    int font_index{ 0 };
    uint16_t pixels_per_em{ 160 };
    bool keep_unresolved{ false };             // also write glyph_<name> for unresolved glyphs
    LogFn log{ nullptr };
};

struct RunStats {
    size_t glyphs{};
    size_t without_bitmap{};
    size_t unsupported_format{};
    size_t written{};
    size_t duplicates{};
    size_t unresolved{};
    size_t modifier_sequences{};
    size_t synthesized{};
    size_t skipped_existing{};
    size_t no_match{};
};

// Where extracted images go. Identifiers come from ToIdentifier().
struct AssetSink {
    virtual bool Exists(const std::string& id) const = 0;
    virtual bool Write(const std::string& id, const std::vector<uint8_t>& bytes) = 0;
    virtual ~AssetSink() noexcept = default;
};

// <dir>/<id>.png; each file is written to a temporary name and renamed into place.
struct DirectorySink final : AssetSink {
    explicit DirectorySink(std::string dir) : _dir(std::move(dir)) {}

    bool Prepare(Status& st) {
        std::error_code ec;
        std::filesystem::create_directories(_dir, ec);
        if (ec)
            return st.Fail(ErrorCode::WriteFailed, Stage::Output, 0,
                           "couldn't create " + _dir.string() + ": " + ec.message());
        return true;
    }

    std::filesystem::path PathFor(const std::string& id) const { return _dir / (id + ".png"); }

    bool Exists(const std::string& id) const override {
        std::error_code ec;
        return std::filesystem::exists(PathFor(id), ec);
    }

    bool Write(const std::string& id, const std::vector<uint8_t>& bytes) override {
        const std::filesystem::path dst = PathFor(id);
        std::filesystem::path tmp = dst;
        tmp += ".tmp";
        bool written;
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) return false;
            out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
            out.close();
            written = !out.fail();
        }
        std::error_code ec;
        if (written)
            std::filesystem::rename(tmp, dst, ec);
        if (!written || ec) {
            // no stray .tmp left behind
            std::filesystem::remove(tmp, ec);
            return false;
        }
        return true;
    }

private:
    std::filesystem::path _dir;
}; // struct DirectorySink


// Opens the font once, then runs the glyph pass and the modifier pass.
struct Extractor {
    Extractor() = default;
    Extractor(const Extractor&) = delete;
    Extractor& operator=(const Extractor&) = delete;

    inline bool Open(const Options& options, Status& st);

    // Every glyph with a PNG bitmap, written under its resolved sequence.
    inline bool ExtractGlyphs(const EmojiOracle& oracle, AssetSink& sink, RunStats& stats, Status& st);

    // Skin tone sequences reachable through other glyphs' names.
    inline bool SynthesizeModifierSequences(const EmojiDatabase& db, const ModifierBases& bases,
                                            AssetSink& sink, RunStats& stats, Status& st);

    bool Run(const EmojiDatabase& db, const ModifierBases& bases, AssetSink& sink,
             RunStats& stats, Status& st) {
        return ExtractGlyphs(db, sink, stats, st)
            && SynthesizeModifierSequences(db, bases, sink, stats, st);
    }

    // Image bytes of a glyph. A 'dupe' record is followed once. False with
    // st ok when the glyph has no PNG at this strike.
    inline bool ReadImage(uint16_t glyph_id, std::vector<uint8_t>& out, Status& st) const;

    const FontDirectory& Directory() const noexcept { return _directory; }
    const PostTable& Names() const noexcept { return _post; }
    const SbixTable& Sbix() const noexcept { return _sbix; }
    const SequenceResolver& Resolver() const noexcept { return _resolver; }

    // glyph_ prefix plus the name with anything unsafe in a file name replaced by '_'
    static std::string RawIdentifier(const std::string& glyph_name) {
        std::string id = "glyph_";
        for (char c : glyph_name) {
            bool safe = (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z')
                     || c == '.' || c == '-' || c == '_';
            id += safe ? c : '_';
        }
        return id;
    }

private:
    void Log(LogLevel level, const std::string& message) const {
        if (_options.log) _options.log(level, message.c_str());
    }

    Options _options;
    FontFile _file;
    FontDirectory _directory;
    PostTable _post;
    SbixTable _sbix;
    SequenceResolver _resolver;
}; // struct Extractor


inline bool Extractor::Open(const Options& options, Status& st) {
    _options = options;
    if (!_file.Open(options.font_path, st))
        return false;
    if (!_directory.Read(_file, options.font_index, st))
        return false;

    TableRecord post{}, sbix{};
    if (!_directory.RequireTable("post", Stage::Post, post, st))
        return false;
    if (!_directory.RequireTable("sbix", Stage::Sbix, sbix, st))
        return false;

    if (!_post.Read(_file, post, st))
        return false;
    if (!_sbix.Read(_file, sbix, options.pixels_per_em, _post.NumGlyphs(), st))
        return false;

    Log(LogLevel::Info, _file.Path() + ": font " + std::to_string(options.font_index) + " of "
        + std::to_string(_directory.GetNumberOfFonts()) + ": "
        + std::to_string(_post.NumGlyphs()) + " glyphs, strike "
        + std::to_string(_sbix.SelectedStrike().ppem) + " ppem");
    return true;
}

inline bool Extractor::ReadImage(uint16_t glyph_id, std::vector<uint8_t>& out, Status& st) const {
    GlyphBitmap bm{};
    if (!_sbix.BitmapFor(glyph_id, bm, st))
        return false;

    if (bm.IsType("dupe")) {
        std::vector<uint8_t> ref;
        if (!bm.image.Read(ref, st))
            return false;
        if (ref.size() < 2)
            return st.Fail(ErrorCode::MalformedFont, Stage::Sbix, bm.image.offset,
                           "truncated 'dupe' record of glyph " + std::to_string(glyph_id));
        uint16_t target = static_cast<uint16_t>((ref[0] << 8) | ref[1]);
        if (!_sbix.BitmapFor(target, bm, st))
            return false;
    }

    if (!bm.IsType("png "))
        return false;
    return bm.image.Read(out, st);
}

inline bool Extractor::ExtractGlyphs(const EmojiOracle& oracle, AssetSink& sink, RunStats& stats, Status& st) {
    std::set<std::string> written;
    std::vector<uint8_t> bytes;

    for (uint16_t gid = 0; gid < _post.NumGlyphs(); ++gid) {
        ++stats.glyphs;
        const std::string& name = _post.NameFor(gid);

        uint32_t begin, end;
        if (!_sbix.GlyphRange(gid, begin, end)) {
            ++stats.without_bitmap;
            continue;
        }
        if (!ReadImage(gid, bytes, st)) {
            if (!st.ok()) return false;
            ++stats.unsupported_format;
            Log(LogLevel::Warning, "glyph " + std::to_string(gid) + " '" + name + "' is not a PNG, skipped");
            continue;
        }

        std::string id;
        Sequence seq;
        if (_resolver.Resolve(name, oracle, seq)) {
            id = ToIdentifier(seq);
        }
        else {
            ++stats.unresolved;
            Log(LogLevel::Info, std::string(ErrorCodeName(ErrorCode::UnresolvedGlyphName))
                + ": glyph " + std::to_string(gid) + " '" + name + "'");
            if (!_options.keep_unresolved)
                continue;
            id = RawIdentifier(name);
        }

        if (!written.insert(id).second) {
            ++stats.duplicates;
            Log(LogLevel::Info, "glyph " + std::to_string(gid) + " '" + name + "' duplicates " + id);
            continue;
        }
        if (!sink.Write(id, bytes))
            return st.Fail(ErrorCode::WriteFailed, Stage::Output, 0, "couldn't write " + id);
        ++stats.written;
    }
    return true;
}

inline bool Extractor::SynthesizeModifierSequences(const EmojiDatabase& db, const ModifierBases& bases,
                                                   AssetSink& sink, RunStats& stats, Status& st) {
    if (bases.Empty()) {
        Log(LogLevel::Warning, "no Emoji_Modifier_Sequence data, modifier pass skipped");
        return true;
    }

    ModifierEnumerator enumerator(bases, _resolver);
    enumerator.Prepare(_post, _sbix);

    std::set<Sequence> seen;
    std::vector<uint8_t> bytes;
    for (const EmojiEntry& entry : db.Entries()) {
        for (const Sequence& seq : enumerator.SequencesFor(entry.sequence)) {
            if (!seen.insert(seq).second)
                continue;
            ++stats.modifier_sequences;

            const std::string id = ToIdentifier(seq);
            if (sink.Exists(id)) {
                ++stats.skipped_existing;
                continue;
            }

            uint16_t gid;
            if (!enumerator.FindGlyph(seq, gid)) {
                ++stats.no_match;
                continue;
            }
            if (!ReadImage(gid, bytes, st)) {
                if (!st.ok()) return false;
                ++stats.no_match;
                continue;
            }
            if (!sink.Write(id, bytes))
                return st.Fail(ErrorCode::WriteFailed, Stage::Output, 0, "couldn't write " + id);
            ++stats.synthesized;
            Log(LogLevel::Info, id + " from glyph '" + _post.NameFor(gid) + "'");
        }
    }
    return true;
}

} // namespace emojidump
