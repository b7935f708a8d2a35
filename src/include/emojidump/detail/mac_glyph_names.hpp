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

#include "enums.hpp"

namespace emojidump {
    namespace detail {
        // Standard Macintosh glyph order, see
        // https://developer.apple.com/fonts/TrueType-Reference-Manual/RM06/Chap6post.html
        static const char* const kMacGlyphNames[kNumStandardNames] = {
            ".notdef", ".null", "nonmarkingreturn", "space", "exclam",
            "quotedbl", "numbersign", "dollar", "percent", "ampersand",
            "quotesingle", "parenleft", "parenright", "asterisk", "plus",
            "comma", "hyphen", "period", "slash", "zero",
            "one", "two", "three", "four", "five",
            "six", "seven", "eight", "nine", "colon",
            "semicolon", "less", "equal", "greater", "question",
            "at", "A", "B", "C", "D",
            "E", "F", "G", "H", "I",
            "J", "K", "L", "M", "N",
            "O", "P", "Q", "R", "S",
            "T", "U", "V", "W", "X",
            "Y", "Z", "bracketleft", "backslash", "bracketright",
            "asciicircum", "underscore", "grave", "a", "b",
            "c", "d", "e", "f", "g",
            "h", "i", "j", "k", "l",
            "m", "n", "o", "p", "q",
            "r", "s", "t", "u", "v",
            "w", "x", "y", "z", "braceleft",
            "bar", "braceright", "asciitilde", "Adieresis", "Aring",
            "Ccedilla", "Eacute", "Ntilde", "Odieresis", "Udieresis",
            "aacute", "agrave", "acircumflex", "adieresis", "atilde",
            "aring", "ccedilla", "eacute", "egrave", "ecircumflex",
            "edieresis", "iacute", "igrave", "icircumflex", "idieresis",
            "ntilde", "oacute", "ograve", "ocircumflex", "odieresis",
            "otilde", "uacute", "ugrave", "ucircumflex", "udieresis",
            "dagger", "degree", "cent", "sterling", "section",
            "bullet", "paragraph", "germandbls", "registered", "copyright",
            "trademark", "acute", "dieresis", "notequal", "AE",
            "Oslash", "infinity", "plusminus", "lessequal", "greaterequal",
            "yen", "mu", "partialdiff", "summation", "product",
            "pi", "integral", "ordfeminine", "ordmasculine", "Omega",
            "ae", "oslash", "questiondown", "exclamdown", "logicalnot",
            "radical", "florin", "approxequal", "Delta", "guillemotleft",
            "guillemotright", "ellipsis", "nonbreakingspace", "Agrave", "Atilde",
            "Otilde", "OE", "oe", "endash", "emdash",
            "quotedblleft", "quotedblright", "quoteleft", "quoteright", "divide",
            "lozenge", "ydieresis", "Ydieresis", "fraction", "currency",
            "guilsinglleft", "guilsinglright", "fi", "fl", "daggerdbl",
            "periodcentered", "quotesinglbase", "quotedblbase", "perthousand", "Acircumflex",
            "Ecircumflex", "Aacute", "Edieresis", "Egrave", "Iacute",
            "Icircumflex", "Idieresis", "Igrave", "Oacute", "Ocircumflex",
            "apple", "Ograve", "Uacute", "Ucircumflex", "Ugrave",
            "dotlessi", "circumflex", "tilde", "macron", "breve",
            "dotaccent", "ring", "cedilla", "hungarumlaut", "ogonek",
            "caron", "Lslash", "lslash", "Scaron", "scaron",
            "Zcaron", "zcaron", "brokenbar", "Eth", "eth",
            "Yacute", "yacute", "Thorn", "thorn", "minus",
            "multiply", "onesuperior", "twosuperior", "threesuperior", "onehalf",
            "onequarter", "threequarters", "franc", "Gbreve", "gbreve",
            "Idotaccent", "Scedilla", "scedilla", "Cacute", "cacute",
            "Ccaron", "ccaron", "dcroat"
        };
    } // namespace detail
} // namespace emojidump
