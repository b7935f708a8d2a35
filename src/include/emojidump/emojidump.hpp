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


// =======================================================================
//
//    emojidump -- color bitmaps out of an 'sbix' font
//
// Walks a TrueType collection (or a single sfnt), names every glyph through
// its 'post' table, pulls the PNG of each glyph from one 'sbix' strike and
// works out which Unicode emoji sequence the glyph name stands for.
//
// =======================================================================
//
// Typical use:
//
//     emojidump::Options opt;
//     opt.font_path = "Apple Color Emoji.ttc";
//     opt.pixels_per_em = 160;
//
//     emojidump::Status st;
//     emojidump::Extractor ex;
//     if (!ex.Open(opt, st)) { /* st.ToString() says which stage and offset */ }
//
//     emojidump::EmojiDatabase db;       // from emoji-sequences.txt etc.
//     emojidump::ModifierBases bases = emojidump::ModifierBases::FromLines(lines);
//     emojidump::DirectorySink sink("out");
//     emojidump::RunStats stats;
//     ex.Run(db, bases, sink, stats, st);

#pragma once

#include "status.hpp"
#include "font_file.hpp"
#include "font_directory.hpp"
#include "post_table.hpp"
#include "sbix_table.hpp"
#include "sequence.hpp"
#include "emoji_database.hpp"
#include "resolver.hpp"
#include "modifier.hpp"
#include "extractor.hpp"
