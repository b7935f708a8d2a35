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

#include "emojidump/emojidump.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace emojidump;

static bool g_verbose = false;

static void log_to_stderr(LogLevel level, const char* message) {
    switch (level) {
    case LogLevel::Info:
        if (g_verbose) std::cout << message << std::endl;
        break;
    case LogLevel::Warning:
        std::cerr << "warning: " << message << std::endl;
        break;
    }
}

static bool env_int(const char* name, long lo, long hi, long& out) {
    const char* v = std::getenv(name);
    if (!v || !*v) return true;
    char* end = nullptr;
    long n = std::strtol(v, &end, 10);
    if (*end || n < lo || n > hi) {
        std::cerr << name << " must be a number in [" << lo << ", " << hi << "], got '" << v << "'" << std::endl;
        return false;
    }
    out = n;
    return true;
}

static void usage() {
    std::cerr << "usage: emojidump <font.ttc> <out-dir> <emoji-sequences.txt> [emoji-zwj-sequences.txt ...]\n"
                 "  EMOJIDUMP_SIZE=160          strike to extract (ppem)\n"
                 "  EMOJIDUMP_FONT_INDEX=0      font inside the collection\n"
                 "  EMOJIDUMP_KEEP_UNRESOLVED=1 also write glyph_<name>.png for unknown names\n"
                 "  EMOJIDUMP_VERBOSE=1         print every glyph decision" << std::endl;
}

int main(int argc, char** argv) {
    if (argc < 4) {
        usage();
        return 2;
    }

    // 1. Options
    Options opt;
    opt.font_path = argv[1];
    opt.output_dir = argv[2];
    for (int i = 3; i < argc; ++i)
        opt.sequence_files.push_back(argv[i]);
    opt.log = log_to_stderr;

    long size = opt.pixels_per_em, index = opt.font_index, keep = 0, verbose = 0;
    if (!env_int("EMOJIDUMP_SIZE", 1, 0xFFFF, size) ||
        !env_int("EMOJIDUMP_FONT_INDEX", 0, 0xFFFF, index) ||
        !env_int("EMOJIDUMP_KEEP_UNRESOLVED", 0, 1, keep) ||
        !env_int("EMOJIDUMP_VERBOSE", 0, 1, verbose)) {
        usage();
        return 2;
    }
    opt.pixels_per_em = static_cast<uint16_t>(size);
    opt.font_index = static_cast<int>(index);
    opt.keep_unresolved = keep != 0;
    g_verbose = verbose != 0;

    // 2. Reference data
    Status st;
    EmojiDatabase db;
    std::vector<std::string> lines;
    for (const std::string& path : opt.sequence_files) {
        if (!ReadLines(path, lines, st)) {
            std::cerr << st.ToString() << std::endl;
            return 1;
        }
    }
    db.AddLines(lines);
    ModifierBases bases = ModifierBases::FromLines(lines);
    std::cout << "Loaded " << db.Size() << " emoji, " << bases.Size() << " modifier bases";
    if (db.SkippedLines())
        std::cout << " (" << db.SkippedLines() << " unreadable lines)";
    std::cout << std::endl;

    // 3. Font
    Extractor ex;
    if (!ex.Open(opt, st)) {
        std::cerr << "Error while reading font: " << st.ToString() << std::endl;
        return 1;
    }

    // 4. Output
    DirectorySink sink(opt.output_dir);
    if (!sink.Prepare(st)) {
        std::cerr << st.ToString() << std::endl;
        return 1;
    }

    std::cout << "Exporting emojis..." << std::endl;
    RunStats stats;
    if (!ex.ExtractGlyphs(db, sink, stats, st)) {
        std::cerr << "Error while exporting: " << st.ToString() << std::endl;
        return 1;
    }
    std::cout << "Exporting emoji modifier sequences..." << std::endl;
    if (!ex.SynthesizeModifierSequences(db, bases, sink, stats, st)) {
        std::cerr << "Error while exporting: " << st.ToString() << std::endl;
        return 1;
    }

    std::cout << stats.glyphs << " glyphs, " << stats.written << " written, "
              << stats.unresolved << " unresolved, " << stats.without_bitmap << " without bitmap, "
              << stats.unsupported_format << " not PNG, " << stats.duplicates << " duplicates\n"
              << stats.modifier_sequences << " modifier sequences: " << stats.synthesized << " synthesized, "
              << stats.skipped_existing << " already present, " << stats.no_match << " without a glyph"
              << std::endl;
    return 0;
}
