#include "pyemit/unicode.hpp"

#include <llvm/Support/ConvertUTF.h>
#include <unicode/uchar.h>

namespace pyemit
{
namespace unicode
{
    namespace
    {
        bool in_categories(CodePoint cp, uint32_t mask) { return (U_GET_GC_MASK(static_cast<UChar32>(cp)) & mask) != 0; }
    } // namespace

    std::vector<CodePoint> decode_utf8(llvm::StringRef text)
    {
        std::vector<CodePoint> out;
        out.reserve(text.size());
        auto *p = reinterpret_cast<const llvm::UTF8 *>(text.data());
        auto *end = p + text.size();
        while (p < end)
        {
            if (*p < 0x80)
            {
                out.push_back(*p++);
                continue;
            }
            llvm::UTF32 cp = 0;
            const llvm::UTF8 *cursor = p;
            if (llvm::convertUTF8Sequence(&cursor, end, &cp, llvm::strictConversion) == llvm::conversionOK)
            {
                out.push_back(cp);
                p = cursor;
            }
            else
            {
                out.push_back(kReplacementChar);
                ++p;
            }
        }
        return out;
    }

    void append_utf8(std::string &out, CodePoint cp)
    {
        char buf[UNI_MAX_UTF8_BYTES_PER_CODE_POINT];
        char *ptr = buf;
        if (!llvm::ConvertCodePointToUTF8(cp, ptr))
        {
            ptr = buf;
            llvm::ConvertCodePointToUTF8(kReplacementChar, ptr);
        }
        out.append(buf, ptr);
    }

    std::string encode_utf8(const std::vector<CodePoint> &cps)
    {
        std::string out;
        out.reserve(cps.size());
        for (auto cp : cps)
            append_utf8(out, cp);
        return out;
    }

    bool is_letter(CodePoint cp) { return in_categories(cp, U_GC_L_MASK); }
    bool is_uppercase(CodePoint cp) { return in_categories(cp, U_GC_LU_MASK | U_GC_LT_MASK); }
    bool is_lowercase(CodePoint cp) { return in_categories(cp, U_GC_LL_MASK); }
    bool is_decimal_digit(CodePoint cp) { return in_categories(cp, U_GC_ND_MASK); }
    bool is_connector_punctuation(CodePoint cp) { return in_categories(cp, U_GC_PC_MASK); }
    bool is_mark(CodePoint cp) { return in_categories(cp, U_GC_MN_MASK | U_GC_MC_MASK); }
    bool is_alphabetic(CodePoint cp) { return in_categories(cp, U_GC_L_MASK | U_GC_NL_MASK); }
    bool is_word_character(CodePoint cp) { return is_letter(cp) || is_decimal_digit(cp); }

    bool is_ascii_letter_digit_or_underscore(CodePoint cp)
    {
        return (cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z') || (cp >= '0' && cp <= '9') || cp == '_';
    }

    CodePoint to_upper(CodePoint cp) { return static_cast<CodePoint>(u_toupper(static_cast<UChar32>(cp))); }
    CodePoint to_lower(CodePoint cp) { return static_cast<CodePoint>(u_tolower(static_cast<UChar32>(cp))); }

} // namespace unicode
} // namespace pyemit
