#include "pyemit/strings.hpp"

namespace pyemit
{

    using unicode::CodePoint;

    std::string legalize_characters(llvm::StringRef text, const CodePointPredicate &is_allowed)
    {
        std::string out;
        out.reserve(text.size());
        for (auto cp : unicode::decode_utf8(text))
        {
            if (is_allowed(cp))
                unicode::append_utf8(out, cp);
        }
        return out;
    }

    Legalizer make_legalizer(CodePointPredicate is_allowed)
    {
        return [is_allowed = std::move(is_allowed)](const std::string &s) { return legalize_characters(s, is_allowed); };
    }

    WordCasing detect_casing(llvm::StringRef word)
    {
        bool any_cased = false, first_cased_upper = false, rest_has_upper = false, any_lower = false, any_upper = false;
        for (auto cp : unicode::decode_utf8(word))
        {
            bool up = unicode::is_uppercase(cp), low = unicode::is_lowercase(cp);
            if (!up && !low)
                continue;
            if (!any_cased)
                first_cased_upper = up;
            else if (up)
                rest_has_upper = true;
            any_cased = true;
            any_upper |= up;
            any_lower |= low;
        }
        if (!any_cased)
            return WordCasing::Caseless;
        if (!any_lower)
            return WordCasing::AllUpper;
        if (!any_upper)
            return WordCasing::AllLower;
        if (first_cased_upper && !rest_has_upper)
            return WordCasing::Capitalized;
        return WordCasing::Mixed;
    }

    namespace
    {
        bool is_caseless_letter(CodePoint cp)
        {
            return unicode::is_letter(cp) && !unicode::is_uppercase(cp) && !unicode::is_lowercase(cp);
        }

        class WordScanner
        {
        public:
            explicit WordScanner(llvm::StringRef label) : cps_(unicode::decode_utf8(label)) {}

            std::vector<Word> run()
            {
                for (;;)
                {
                    skip_while([](CodePoint cp) { return !unicode::is_word_character(cp); });
                    if (at_end())
                        break;
                    start_ = i_;
                    CodePoint cp = current();
                    if (unicode::is_lowercase(cp))
                    {
                        skip_lower();
                        skip_digits();
                    }
                    else if (unicode::is_decimal_digit(cp))
                    {
                        skip_digits();
                    }
                    else if (unicode::is_uppercase(cp))
                    {
                        size_t capitals = skip_upper();
                        if (!at_end())
                        {
                            if (capitals == 1)
                            {
                                skip_lower();
                                skip_digits();
                            }
                            else if (unicode::is_decimal_digit(current()))
                                skip_digits();
                            else if (unicode::is_lowercase(current()))
                            {
                                // last capital (with its marks) starts the next word
                                --i_;
                                while (unicode::is_mark(current()))
                                    --i_;
                            }
                        }
                    }
                    else
                    {
                        skip_run(is_caseless_letter);
                        skip_digits();
                    }
                    commit();
                }
                return std::move(words_);
            }

        private:
            bool at_end() const { return i_ >= cps_.size(); }
            CodePoint current() const { return cps_[i_]; }
            template <class Pred>
            void skip_while(Pred p)
            {
                while (!at_end() && p(current()))
                    ++i_;
            }
            // Like skip_while, but combining marks stay with the character they follow.
            // Returns the number of non-mark characters consumed.
            template <class Pred>
            size_t skip_run(Pred p)
            {
                size_t n = 0;
                while (!at_end() && p(current()))
                {
                    ++i_;
                    ++n;
                    skip_while(unicode::is_mark);
                }
                return n;
            }
            void skip_lower() { skip_run(unicode::is_lowercase); }
            size_t skip_upper() { return skip_run(unicode::is_uppercase); }
            void skip_digits() { skip_run(unicode::is_decimal_digit); }

            void commit()
            {
                std::string text;
                for (size_t k = start_; k < i_; ++k)
                    unicode::append_utf8(text, cps_[k]);
                auto casing = detect_casing(text);
                words_.push_back(Word{std::move(text), casing});
            }

            std::vector<CodePoint> cps_;
            size_t i_ = 0;
            size_t start_ = 0;
            std::vector<Word> words_;
        };

        template <class F>
        std::string map_code_points(const std::string &word, F f)
        {
            std::string out;
            out.reserve(word.size());
            size_t index = 0;
            for (auto cp : unicode::decode_utf8(word))
                unicode::append_utf8(out, f(cp, index++));
            return out;
        }
    } // namespace

    std::vector<Word> split_into_words(llvm::StringRef label)
    {
        return WordScanner(label).run();
    }

    std::string first_upper_word_style(const std::string &word)
    {
        return map_code_points(word, [](CodePoint cp, size_t i) { return i == 0 ? unicode::to_upper(cp) : unicode::to_lower(cp); });
    }

    std::string all_upper_word_style(const std::string &word)
    {
        return map_code_points(word, [](CodePoint cp, size_t) { return unicode::to_upper(cp); });
    }

    std::string all_lower_word_style(const std::string &word)
    {
        return map_code_points(word, [](CodePoint cp, size_t) { return unicode::to_lower(cp); });
    }

    std::string original_word_style(const std::string &word) { return word; }

    std::string combine_words(const std::vector<Word> &words, const Legalizer &legalize,
                              WordStyle first_word_style, WordStyle rest_word_style,
                              WordStyle first_acronym_style, WordStyle rest_acronym_style,
                              const std::string &separator, const CodePointPredicate &is_start_character)
    {
        std::vector<Word> legal;
        for (auto &w : words)
        {
            auto text = legalize(w.text);
            if (text.empty())
                continue;
            legal.push_back(Word{std::move(text), w.casing});
        }
        if (legal.empty())
            legal.push_back(Word{legalize("empty"), WordCasing::AllLower});

        std::vector<std::string> styled;
        const Word &first = legal.front();
        WordStyle first_style = first.is_acronym() ? first_acronym_style : first_word_style;
        std::string styled_first = first_style(first.text);
        size_t rest_begin = 1;
        auto first_cps = unicode::decode_utf8(styled_first);
        if (first_cps.empty() || !is_start_character(first_cps.front()))
        {
            styled.push_back(first_word_style(legalize("the")));
            rest_begin = 0;
        }
        else
        {
            styled.push_back(std::move(styled_first));
        }
        for (size_t i = rest_begin; i < legal.size(); ++i)
        {
            WordStyle style = legal[i].is_acronym() ? rest_acronym_style : rest_word_style;
            styled.push_back(style(legal[i].text));
        }

        std::string out;
        for (size_t i = 0; i < styled.size(); ++i)
        {
            if (i)
                out += separator;
            out += styled[i];
        }
        return out;
    }

} // namespace pyemit
