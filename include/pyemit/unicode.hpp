// Code point decoding plus general-category predicates and case mapping from the ICU character database
#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include <llvm/ADT/StringRef.h>

namespace pyemit
{
namespace unicode
{

    using CodePoint = uint32_t;

    constexpr CodePoint kReplacementChar = 0xFFFD;

    // Decode UTF-8; malformed sequences become U+FFFD (one per offending byte).
    std::vector<CodePoint> decode_utf8(llvm::StringRef text);
    std::string encode_utf8(const std::vector<CodePoint> &cps);
    void append_utf8(std::string &out, CodePoint cp);

    bool is_letter(CodePoint cp);          // L*
    bool is_uppercase(CodePoint cp);       // Lu (and Lt)
    bool is_lowercase(CodePoint cp);       // Ll
    bool is_decimal_digit(CodePoint cp);   // Nd
    bool is_connector_punctuation(CodePoint cp); // Pc
    bool is_mark(CodePoint cp);            // Mn, Mc
    bool is_alphabetic(CodePoint cp);      // L*, Nl
    bool is_word_character(CodePoint cp);  // letter or decimal digit

    // ASCII [A-Za-z0-9_]
    bool is_ascii_letter_digit_or_underscore(CodePoint cp);

    // Simple one-to-one case mapping (UnicodeData.txt); identity where there is none.
    CodePoint to_upper(CodePoint cp);
    CodePoint to_lower(CodePoint cp);

} // namespace unicode
} // namespace pyemit
