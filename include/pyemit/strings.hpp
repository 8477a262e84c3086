// Identifier legalization, word splitting and case-style recombination
#pragma once
#include <functional>
#include <string>
#include <vector>

#include <llvm/ADT/StringRef.h>

#include "pyemit/unicode.hpp"

namespace pyemit
{

    enum class WordCasing
    {
        AllUpper,    // "XML", "A"
        AllLower,    // "name"
        Capitalized, // "Name"
        Mixed,       // cased letters that fit none of the above
        Caseless     // digits, CJK and other uncased runs
    };

    struct Word
    {
        std::string text;
        WordCasing casing{WordCasing::Caseless};
        // No lowercase letter: styled with the acronym transforms.
        bool is_acronym() const { return casing == WordCasing::AllUpper || casing == WordCasing::Caseless; }
    };

    using CodePointPredicate = std::function<bool(unicode::CodePoint)>;
    using Legalizer = std::function<std::string(const std::string &)>;
    using WordStyle = std::string (*)(const std::string &);

    // Drop every code point failing is_allowed.
    std::string legalize_characters(llvm::StringRef text, const CodePointPredicate &is_allowed);
    Legalizer make_legalizer(CodePointPredicate is_allowed);

    WordCasing detect_casing(llvm::StringRef word);

    // Total segmentation: never throws, every code point lands in a word or is a discarded separator.
    std::vector<Word> split_into_words(llvm::StringRef label);

    std::string first_upper_word_style(const std::string &word);
    std::string all_upper_word_style(const std::string &word);
    std::string all_lower_word_style(const std::string &word);
    std::string original_word_style(const std::string &word);

    struct NameStyle
    {
        WordStyle first_word = first_upper_word_style;
        WordStyle rest_words = first_upper_word_style;
        WordStyle first_acronym = all_upper_word_style;
        WordStyle rest_acronyms = all_upper_word_style;
        std::string separator;
    };

    // Legalize each word, style and join; synthesizes "empty" when nothing survives and
    // prefixes "the" when the styled result would not start with a start character.
    std::string combine_words(const std::vector<Word> &words, const Legalizer &legalize,
                              WordStyle first_word_style, WordStyle rest_word_style,
                              WordStyle first_acronym_style, WordStyle rest_acronym_style,
                              const std::string &separator, const CodePointPredicate &is_start_character);

    inline std::string combine_words(const std::vector<Word> &words, const Legalizer &legalize, const NameStyle &style,
                                     const CodePointPredicate &is_start_character)
    {
        return combine_words(words, legalize, style.first_word, style.rest_words, style.first_acronym,
                             style.rest_acronyms, style.separator, is_start_character);
    }

} // namespace pyemit
