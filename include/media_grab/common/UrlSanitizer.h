#pragma once

#include <string>

namespace media_grab::common {

// Remove invisible/formatting Unicode codepoints commonly found in copy/pasted URLs
// (U+200B..U+200F, U+202A..U+202E, U+2060, U+2066..U+2069, U+FEFF), strip ASCII
// control characters and trim surrounding ASCII whitespace.
std::string sanitizeUrl(const std::string& input);

// Same codepoint filtering as sanitizeUrl but keeps whitespace and line breaks,
// so free text can still be tokenized afterwards.
std::string stripInvisible(const std::string& text);

// Remove terminal color/control escape sequences (ESC [ ... final byte).
std::string stripAnsiEscapes(const std::string& text);

// ASCII lower-casing; bytes outside ASCII, e.g. parts of UTF-8 sequences, are kept as is.
std::string toLowerAscii(std::string text);

// Compact hex dump of the given string for logging, e.g. "68 74 74 70".
std::string hexDump(const std::string& input);

} // namespace media_grab::common
