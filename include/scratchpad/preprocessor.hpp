#pragma once

// scratchpad/preprocessor.hpp - Leading import/comment extraction.
//
// Before the first line of code, the preprocessor drops:
//   - block comments (/* ... */, possibly spanning lines)
//   - line comments (//)
//   - blank lines
//   - include directives (#include <name> / #include "name"), collecting name
// From the first code line onwards every line is kept verbatim, including
// blank lines and comments.
//
// KNOWN FOOT-GUN:
//   An unterminated leading block comment consumes every remaining line,
//   real code included. This is not reported as an error.
//
// removed_line_count is the number of leading lines dropped. The compiler
// frontend turns it into a #line directive so that body line 1 is reported
// as original line removed_line_count + 1.

#include <optional>
#include <string>
#include <string_view>

#include "scratchpad/types.hpp"

namespace scratchpad {

PreprocessedSource preprocess(const std::string& source_text);

// Returns the header name when `trimmed_line` is an include directive.
std::optional<std::string> match_import(std::string_view trimmed_line);

// Merge configured default imports with user imports. Configured imports
// come first; later duplicates are dropped.
CompilationUnit make_compilation_unit(const PreprocessedSource& source,
                                      const ScriptConfig& config,
                                      const std::string& source_name = "script.cpp");

}  // namespace scratchpad
