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

// Container, 'post' and 'sbix' parsing against synthetic fonts.
//
// ENV:
//  - EMOJIDUMP_TEST_TTC : optional real sbix .ttc (e.g. Apple Color Emoji)

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

#include "emojidump/emojidump.hpp"
#include "font_builder.hpp"

using namespace emojidump;
using emojidump_test::FontSpec;
using emojidump_test::TestGlyph;

namespace {

    FontSpec small_font() {
        FontSpec spec;
        spec.glyphs = {
            { ".notdef", {} },
            { "space", {} },
            { "u1F466", emojidump_test::fake_png(0x10) },
            { "u1F6B4.1", emojidump_test::fake_png(0x20, 40) },
            { "u1F46A.MWG", emojidump_test::fake_png(0x30, 7) },
        };
        spec.ppems = { 32, 160 };
        return spec;
    }

    struct OpenedFont {
        FontFile file;
        FontDirectory dir;
        PostTable post;
        Status st;
    };

    bool open_font(OpenedFont& f, const std::string& path, int index = 0) {
        return f.file.Open(path, f.st) && f.dir.Read(f.file, index, f.st);
    }

} // namespace

// =====================================================================================
//                                  CONTAINER
// =====================================================================================

TEST_CASE("FontDirectory - TTC with one font finds post and sbix", "[container]") {
    auto bytes = emojidump_test::build_font(small_font());
    auto path = emojidump_test::write_temp(bytes, "ttc_ok.ttc");

    OpenedFont f;
    REQUIRE(open_font(f, path));
    REQUIRE(f.st.ok());
    REQUIRE(f.dir.IsCollection());
    REQUIRE(f.dir.GetNumberOfFonts() == 1);
    REQUIRE(f.dir.FontOffset() == 16);
    REQUIRE(f.dir.Tables().size() == 2);

    const TableRecord* post = f.dir.FindTable("post");
    const TableRecord* sbix = f.dir.FindTable("sbix");
    REQUIRE(post != nullptr);
    REQUIRE(sbix != nullptr);
    REQUIRE(post->offset == emojidump_test::table_offset(bytes, "post"));
    REQUIRE(sbix->offset == emojidump_test::table_offset(bytes, "sbix"));
    REQUIRE(f.dir.FindTable("glyf") == nullptr);
}

TEST_CASE("FontDirectory - bare sfnt is font 0 at offset 0", "[container]") {
    FontSpec spec = small_font();
    spec.collection = false;
    auto path = emojidump_test::write_temp(emojidump_test::build_font(spec), "sfnt_ok.ttf");

    OpenedFont f;
    REQUIRE(open_font(f, path));
    REQUIRE_FALSE(f.dir.IsCollection());
    REQUIRE(f.dir.GetNumberOfFonts() == 1);
    REQUIRE(f.dir.FontOffset() == 0);
    REQUIRE(f.dir.SfntVersion() == 0x00010000);

    OpenedFont g;
    REQUIRE_FALSE(open_font(g, path, 1));
    REQUIRE(g.st.code == ErrorCode::MalformedFont);
}

TEST_CASE("FontDirectory - bad signature is MalformedFont", "[container][malformed]") {
    auto bytes = emojidump_test::build_font(small_font());
    bytes[16] = 'x'; bytes[17] = 'y'; bytes[18] = 'z'; bytes[19] = 'w'; // sfnt version
    auto path = emojidump_test::write_temp(bytes, "bad_version.ttc");

    OpenedFont f;
    REQUIRE_FALSE(open_font(f, path));
    REQUIRE(f.st.code == ErrorCode::MalformedFont);
    REQUIRE(f.st.stage == Stage::Container);
    REQUIRE(f.st.offset == 16);
    REQUIRE(f.dir.Tables().empty());

    std::vector<std::uint8_t> junk = { 'n', 'o', 'p', 'e', 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0 };
    OpenedFont g;
    REQUIRE_FALSE(open_font(g, emojidump_test::write_temp(junk, "junk.ttf")));
    REQUIRE(g.st.code == ErrorCode::MalformedFont);
    REQUIRE(g.st.offset == 0);
}

TEST_CASE("FontDirectory - truncated inputs are MalformedFont", "[container][malformed]") {
    auto bytes = emojidump_test::build_font(small_font());

    SECTION("shorter than a signature") {
        std::vector<std::uint8_t> two(bytes.begin(), bytes.begin() + 2);
        OpenedFont f;
        REQUIRE_FALSE(open_font(f, emojidump_test::write_temp(two, "trunc2.ttc")));
        REQUIRE(f.st.code == ErrorCode::MalformedFont);
        REQUIRE(f.dir.Tables().empty());
    }
    SECTION("TTC header cut short") {
        std::vector<std::uint8_t> cut(bytes.begin(), bytes.begin() + 10);
        OpenedFont f;
        REQUIRE_FALSE(open_font(f, emojidump_test::write_temp(cut, "trunc10.ttc")));
        REQUIRE(f.st.code == ErrorCode::MalformedFont);
    }
    SECTION("table directory cut short") {
        std::vector<std::uint8_t> cut(bytes.begin(), bytes.begin() + 16 + 12 + 20);
        OpenedFont f;
        REQUIRE_FALSE(open_font(f, emojidump_test::write_temp(cut, "trunc_dir.ttc")));
        REQUIRE(f.st.code == ErrorCode::MalformedFont);
        REQUIRE(f.st.stage == Stage::Container);
        REQUIRE(f.dir.Tables().empty());
    }
    SECTION("table data cut off") {
        std::vector<std::uint8_t> cut(bytes.begin(), bytes.end() - 4);
        OpenedFont f;
        REQUIRE_FALSE(open_font(f, emojidump_test::write_temp(cut, "trunc_tables.ttc")));
        REQUIRE(f.st.code == ErrorCode::MalformedFont);
        // reported at the 'sbix' directory record
        REQUIRE(f.st.offset == 16 + 12 + 16);
        // 'post' was fine, but a failed directory exposes nothing
        REQUIRE(f.dir.Tables().empty());
        REQUIRE(f.dir.FindTable("post") == nullptr);
    }
}

TEST_CASE("FontDirectory - failed re-read drops the previous directory", "[container][malformed]") {
    auto bytes = emojidump_test::build_font(small_font());
    auto good = emojidump_test::write_temp(bytes, "reread_good.ttc");
    std::vector<std::uint8_t> cut(bytes.begin(), bytes.end() - 4);
    auto bad = emojidump_test::write_temp(cut, "reread_bad.ttc");

    FontFile good_file, bad_file;
    FontDirectory dir;
    Status st;
    REQUIRE(good_file.Open(good, st));
    REQUIRE(dir.Read(good_file, 0, st));
    REQUIRE(dir.Tables().size() == 2);

    REQUIRE(bad_file.Open(bad, st));
    REQUIRE_FALSE(dir.Read(bad_file, 0, st));
    REQUIRE(st.code == ErrorCode::MalformedFont);
    REQUIRE(dir.Tables().empty());
    REQUIRE(dir.FindTable("sbix") == nullptr);
}

TEST_CASE("FontDirectory - TTC version and font index are checked", "[container][malformed]") {
    auto bytes = emojidump_test::build_font(small_font());

    OpenedFont f;
    REQUIRE_FALSE(open_font(f, emojidump_test::write_temp(bytes, "index.ttc"), 1));
    REQUIRE(f.st.code == ErrorCode::MalformedFont);
    REQUIRE(f.st.offset == 8);

    bytes[5] = 0x07; // version 7.0
    OpenedFont g;
    REQUIRE_FALSE(open_font(g, emojidump_test::write_temp(bytes, "ttc_v7.ttc")));
    REQUIRE(g.st.code == ErrorCode::MalformedFont);
    REQUIRE(g.st.offset == 4);
}

TEST_CASE("FontDirectory - missing sbix is reported by RequireTable", "[container]") {
    FontSpec spec = small_font();
    auto bytes = emojidump_test::build_font({ { "post", emojidump_test::build_post(spec) } }, true);
    auto path = emojidump_test::write_temp(bytes, "no_sbix.ttc");

    OpenedFont f;
    REQUIRE(open_font(f, path));
    TableRecord rec{};
    REQUIRE(f.dir.RequireTable("post", Stage::Post, rec, f.st));
    REQUIRE_FALSE(f.dir.RequireTable("sbix", Stage::Sbix, rec, f.st));
    REQUIRE(f.st.code == ErrorCode::MalformedFont);
    REQUIRE(f.st.stage == Stage::Sbix);
    REQUIRE(f.st.message.find("sbix") != std::string::npos);
}

TEST_CASE("FontFile - missing file is FileNotFound", "[container]") {
    FontFile file;
    Status st;
    REQUIRE_FALSE(file.Open("/nonexistent/emojidump/font.ttc", st));
    REQUIRE(st.code == ErrorCode::FileNotFound);
}

// =====================================================================================
//                                     POST
// =====================================================================================

TEST_CASE("PostTable - standard and custom names by glyph id", "[post]") {
    auto path = emojidump_test::write_temp(emojidump_test::build_font(small_font()), "post_ok.ttc");

    OpenedFont f;
    REQUIRE(open_font(f, path));
    TableRecord rec{};
    REQUIRE(f.dir.RequireTable("post", Stage::Post, rec, f.st));
    REQUIRE(f.post.Read(f.file, rec, f.st));

    REQUIRE(f.post.NumGlyphs() == 5);
    REQUIRE(f.post.NameFor(0) == ".notdef");
    REQUIRE(f.post.NameFor(1) == "space");
    REQUIRE(f.post.NameFor(2) == "u1F466");
    REQUIRE(f.post.NameFor(3) == "u1F6B4.1");
    REQUIRE(f.post.NameFor(4) == "u1F46A.MWG");
    REQUIRE(f.post.NameFor(5).empty());
    REQUIRE(f.post.NameFor(0xFFFF).empty());

    std::vector<std::string> seen;
    std::uint16_t expected_id = 0;
    f.post.ForEach([&](std::uint16_t id, const std::string& name) {
        REQUIRE(id == expected_id++);
        seen.push_back(name);
    });
    REQUIRE(seen == f.post.Names());
}

TEST_CASE("PostTable - every standard Macintosh name is reachable", "[post]") {
    REQUIRE(std::string(detail::kMacGlyphNames[0]) == ".notdef");
    REQUIRE(std::string(detail::kMacGlyphNames[3]) == "space");
    REQUIRE(std::string(detail::kMacGlyphNames[36]) == "A");
    REQUIRE(std::string(detail::kMacGlyphNames[68]) == "a");
    REQUIRE(std::string(detail::kMacGlyphNames[210]) == "apple");
    REQUIRE(std::string(detail::kMacGlyphNames[257]) == "dcroat");
}

TEST_CASE("PostTable - versions other than 2.0 are UnsupportedPostFormat", "[post]") {
    FontSpec spec = small_font();
    spec.post_version = 0x00030000;
    auto bytes = emojidump_test::build_font(spec);
    auto path = emojidump_test::write_temp(bytes, "post_v3.ttc");

    OpenedFont f;
    REQUIRE(open_font(f, path));
    TableRecord rec{};
    REQUIRE(f.dir.RequireTable("post", Stage::Post, rec, f.st));
    REQUIRE_FALSE(f.post.Read(f.file, rec, f.st));
    REQUIRE(f.st.code == ErrorCode::UnsupportedPostFormat);
    REQUIRE(f.st.stage == Stage::Post);
    REQUIRE(f.st.offset == emojidump_test::table_offset(bytes, "post"));
    REQUIRE(f.st.message.find("3.0") != std::string::npos);
}

TEST_CASE("PostTable - string pool underflow is fatal", "[post][malformed]") {
    FontSpec spec = small_font();
    auto post = emojidump_test::build_post(spec);
    // drop the last Pascal string ("u1F46A.MWG", 1 + 10 bytes)
    post.resize(post.size() - 11);

    Status st;
    PostTable table;
    REQUIRE_FALSE(table.Parse(post.data(), static_cast<std::uint32_t>(post.size()), 1000, st));
    REQUIRE(st.code == ErrorCode::MalformedFont);
    REQUIRE(st.stage == Stage::Post);
    // index entry of glyph 4
    REQUIRE(st.offset == 1000 + 34 + 2 * 4);
    REQUIRE(table.NumGlyphs() == 0);

    // half a string
    auto torn = emojidump_test::build_post(spec);
    torn.resize(torn.size() - 3);
    Status st2;
    REQUIRE_FALSE(table.Parse(torn.data(), static_cast<std::uint32_t>(torn.size()), 0, st2));
    REQUIRE(st2.code == ErrorCode::MalformedFont);
}

// =====================================================================================
//                                     SBIX
// =====================================================================================

TEST_CASE("SbixTable - selects the strike with the requested ppem", "[sbix]") {
    auto bytes = emojidump_test::build_font(small_font());
    auto path = emojidump_test::write_temp(bytes, "sbix_ok.ttc");

    OpenedFont f;
    REQUIRE(open_font(f, path));
    TableRecord post{}, sbix{};
    REQUIRE(f.dir.RequireTable("post", Stage::Post, post, f.st));
    REQUIRE(f.dir.RequireTable("sbix", Stage::Sbix, sbix, f.st));
    REQUIRE(f.post.Read(f.file, post, f.st));

    SbixTable table;
    REQUIRE(table.Read(f.file, sbix, 160, f.post.NumGlyphs(), f.st));
    REQUIRE(table.Version() == 1);
    REQUIRE(table.Flags() == 1);
    REQUIRE(table.SelectedStrike().ppem == 160);
    REQUIRE(table.SelectedStrike().resolution == 72);
    REQUIRE(table.SelectedStrike().glyph_data_offsets.size() == 6u);
    REQUIRE(table.StrikeSizes() == std::vector<std::uint16_t>{ 32, 160 });

    std::uint32_t b, e;
    REQUIRE_FALSE(table.GlyphRange(0, b, e));
    REQUIRE_FALSE(table.GlyphRange(1, b, e));
    REQUIRE(table.GlyphRange(2, b, e));
    REQUIRE_FALSE(table.GlyphRange(5, b, e)); // past the last glyph

    GlyphBitmap bm{};
    REQUIRE(table.BitmapFor(2, bm, f.st));
    REQUIRE(bm.glyph_id == 2);
    REQUIRE(bm.IsType("png "));
    REQUIRE(bm.Type() == "png ");
    REQUIRE(bm.origin_x == 0);
    REQUIRE(bm.origin_y == -2);

    std::vector<std::uint8_t> image;
    REQUIRE(bm.image.Read(image, f.st));
    auto expected = emojidump_test::fake_png(0x10);
    expected.push_back(160);
    REQUIRE(image == expected);

    REQUIRE_FALSE(table.BitmapFor(1, bm, f.st));
    REQUIRE(f.st.ok());
}

TEST_CASE("SbixTable - glyph byte range re-slices the strike data exactly", "[sbix]") {
    auto bytes = emojidump_test::build_font(small_font());
    auto path = emojidump_test::write_temp(bytes, "sbix_slice.ttc");

    OpenedFont f;
    REQUIRE(open_font(f, path));
    TableRecord post{}, sbix{};
    REQUIRE(f.dir.RequireTable("post", Stage::Post, post, f.st));
    REQUIRE(f.dir.RequireTable("sbix", Stage::Sbix, sbix, f.st));
    REQUIRE(f.post.Read(f.file, post, f.st));

    for (std::uint16_t ppem : { 32, 160 }) {
        SbixTable table;
        REQUIRE(table.Read(f.file, sbix, ppem, f.post.NumGlyphs(), f.st));
        const Strike& strike = table.SelectedStrike();
        const std::size_t strike_start = sbix.offset + strike.offset;

        for (std::uint16_t gid = 2; gid < 5; ++gid) {
            GlyphBitmap bm{};
            REQUIRE(table.BitmapFor(gid, bm, f.st));
            std::vector<std::uint8_t> payload;
            REQUIRE(bm.payload.Read(payload, f.st));

            std::vector<std::uint8_t> sliced(
                bytes.begin() + strike_start + strike.glyph_data_offsets[gid],
                bytes.begin() + strike_start + strike.glyph_data_offsets[gid + 1]);
            REQUIRE(payload == sliced);

            std::vector<std::uint8_t> image;
            REQUIRE(bm.image.Read(image, f.st));
            REQUIRE(image.size() + SbixTable::kGlyphHeaderSize == payload.size());
            REQUIRE(image.back() == static_cast<std::uint8_t>(ppem));
        }
    }
}

TEST_CASE("SbixTable - missing ppem is StrikeNotFound", "[sbix]") {
    FontSpec spec = small_font();
    spec.ppems = { 32, 136 };
    auto path = emojidump_test::write_temp(emojidump_test::build_font(spec), "sbix_160.ttc");

    OpenedFont f;
    REQUIRE(open_font(f, path));
    TableRecord post{}, sbix{};
    REQUIRE(f.dir.RequireTable("post", Stage::Post, post, f.st));
    REQUIRE(f.dir.RequireTable("sbix", Stage::Sbix, sbix, f.st));
    REQUIRE(f.post.Read(f.file, post, f.st));

    SbixTable table;
    REQUIRE_FALSE(table.Read(f.file, sbix, 160, f.post.NumGlyphs(), f.st));
    REQUIRE(f.st.code == ErrorCode::StrikeNotFound);
    REQUIRE(f.st.stage == Stage::Sbix);
    REQUIRE(f.st.message.find("32, 136") != std::string::npos);
    REQUIRE(table.StrikeSizes() == std::vector<std::uint16_t>{ 32, 136 });
}

TEST_CASE("SbixTable - strike offset outside the table is MalformedFont", "[sbix][malformed]") {
    FontSpec spec = small_font();
    auto sbix_bytes = emojidump_test::build_sbix(spec);
    // first strike offset -> far away
    sbix_bytes[8] = 0x7F;
    auto bytes = emojidump_test::build_font(
        { { "post", emojidump_test::build_post(spec) }, { "sbix", sbix_bytes } }, true);
    auto path = emojidump_test::write_temp(bytes, "sbix_bad_strike.ttc");

    OpenedFont f;
    REQUIRE(open_font(f, path));
    TableRecord post{}, sbix{};
    REQUIRE(f.dir.RequireTable("post", Stage::Post, post, f.st));
    REQUIRE(f.dir.RequireTable("sbix", Stage::Sbix, sbix, f.st));
    REQUIRE(f.post.Read(f.file, post, f.st));

    SbixTable table;
    REQUIRE_FALSE(table.Read(f.file, sbix, 160, f.post.NumGlyphs(), f.st));
    REQUIRE(f.st.code == ErrorCode::MalformedFont);
    REQUIRE(f.st.offset == sbix.offset + 8);
}

TEST_CASE("Status - ToString names stage, code and offset", "[status]") {
    Status st;
    REQUIRE(st.ok());
    REQUIRE_FALSE(st.Fail(ErrorCode::MalformedFont, Stage::Container, 42, "truncated table directory"));
    REQUIRE_FALSE(st.ok());
    REQUIRE(st.ToString() == "container: MalformedFont at offset 42: truncated table directory");

    Status nf;
    nf.Fail(ErrorCode::StrikeNotFound, Stage::Sbix, 7, "no strike");
    REQUIRE(nf.ToString() == "sbix: StrikeNotFound: no strike");
}

TEST_CASE("Optional - real sbix collection (if provided)", "[container][sbix][optional]") {
    const char* env = std::getenv("EMOJIDUMP_TEST_TTC");
    if (!env || !*env) {
        WARN("Set EMOJIDUMP_TEST_TTC=/path/to/Apple Color Emoji.ttc to enable.");
        return;
    }

    OpenedFont f;
    REQUIRE(open_font(f, env));
    REQUIRE(f.dir.GetNumberOfFonts() >= 1);
    TableRecord post{}, sbix{};
    REQUIRE(f.dir.RequireTable("post", Stage::Post, post, f.st));
    REQUIRE(f.dir.RequireTable("sbix", Stage::Sbix, sbix, f.st));
    REQUIRE(f.post.Read(f.file, post, f.st));
    REQUIRE(f.post.NumGlyphs() > 0);
    REQUIRE(f.post.NameFor(0) == ".notdef");

    SbixTable table;
    REQUIRE(table.Read(f.file, sbix, 160, f.post.NumGlyphs(), f.st));
}
