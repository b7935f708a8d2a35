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

#include <stdint.h> // uint64_t

#include <string>
#include <utility> // std::move

namespace emojidump {

enum class ErrorCode {
    None = 0,
    FileNotFound,          // font or reference data cannot be opened
    MalformedFont,         // bad signature, truncated directory, out-of-bounds offsets
    UnsupportedPostFormat, // 'post' is not version 2.0
    StrikeNotFound,        // no 'sbix' strike at the requested ppem
    UnresolvedGlyphName,   // per glyph, not fatal
    WriteFailed            // output sink refused a blob
};

// Where parsing diverged. Reported with the offset for structural failures.
enum class Stage {
    None = 0,
    Container,
    Post,
    Sbix,
    Resolve,
    Output
};

// Fatal errors travel through Status, never through the log.
enum class LogLevel {
    Info,
    Warning
};

// optional; may be nullptr
using LogFn = void(*)(LogLevel level, const char* message);

inline const char* ErrorCodeName(ErrorCode code) noexcept {
    switch (code) {
    case ErrorCode::None:                  return "None";
    case ErrorCode::FileNotFound:          return "FileNotFound";
    case ErrorCode::MalformedFont:         return "MalformedFont";
    case ErrorCode::UnsupportedPostFormat: return "UnsupportedPostFormat";
    case ErrorCode::StrikeNotFound:        return "StrikeNotFound";
    case ErrorCode::UnresolvedGlyphName:   return "UnresolvedGlyphName";
    case ErrorCode::WriteFailed:           return "WriteFailed";
    }
    return "Unknown";
}

inline const char* StageName(Stage stage) noexcept {
    switch (stage) {
    case Stage::None:      return "none";
    case Stage::Container: return "container";
    case Stage::Post:      return "post";
    case Stage::Sbix:      return "sbix";
    case Stage::Resolve:   return "resolve";
    case Stage::Output:    return "output";
    }
    return "unknown";
}

struct Status {
    ErrorCode code{ ErrorCode::None };
    Stage stage{ Stage::None };
    uint64_t offset{};     // absolute file offset, when meaningful
    std::string message;

    bool ok() const noexcept { return code == ErrorCode::None; }

    // Always returns false so parsers can `return st.Fail(...)`.
    bool Fail(ErrorCode c, Stage s, uint64_t off, std::string msg) {
        code = c;
        stage = s;
        offset = off;
        message = std::move(msg);
        return false;
    }

    // "<stage>: <code> at offset <n>: <message>"
    std::string ToString() const {
        std::string out = StageName(stage);
        out += ": ";
        out += ErrorCodeName(code);
        if (code == ErrorCode::MalformedFont || code == ErrorCode::UnsupportedPostFormat) {
            out += " at offset ";
            out += std::to_string(offset);
        }
        if (!message.empty()) {
            out += ": ";
            out += message;
        }
        return out;
    }
};

} // namespace emojidump
