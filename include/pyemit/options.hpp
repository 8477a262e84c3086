// Render options, environment overrides and the Python target descriptor
#pragma once
#include <optional>
#include <string>
#include <vector>

#include <llvm/ADT/StringRef.h>

namespace pyemit
{

    struct RenderOptions
    {
        // false: multi-member unions render inline; true: each gets a `Name = Union[...]` declaration
        bool declare_unions = false;
        bool ascii_identifiers = false;
        std::vector<std::string> leading_comments;
    };

    // Unset or empty -> nullopt; 1/t/T/y/Y -> true; anything else -> false.
    std::optional<bool> env_flag(const char *name);
    inline bool env_flag_enabled(const char *name) { return env_flag(name).value_or(false); }

    // Apply PYEMIT_DECLARE_UNIONS / PYEMIT_ASCII_IDENTIFIERS on top of base.
    RenderOptions detect_options(RenderOptions base = {});

    // Set a boolean option by its descriptor name; false when the name is unknown.
    bool apply_option(RenderOptions &opts, llvm::StringRef name, bool value);

    struct OptionDescription
    {
        std::string name;
        std::string description;
        bool default_value = false;
    };

    struct TargetLanguage
    {
        std::string display_name;
        std::vector<std::string> aliases;
        std::string extension;
        std::vector<OptionDescription> options;
    };

    const TargetLanguage &python_target();

} // namespace pyemit
