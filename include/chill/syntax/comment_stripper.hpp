// chill/syntax/comment_stripper.hpp - Comment removal that keeps line numbering
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace chill::syntax
{

/**
 * Remove block comments (possibly spanning lines) and `--` line comments.
 *
 * Line breaks inside a block comment are kept, so the result has exactly the
 * same number of lines as the input and every line keeps its number. An
 * unterminated block comment opener is left in place.
 */
[[nodiscard]] std::string strip_comments(std::string_view source);

/**
 * Split text into lines on '\n' (a trailing '\r' is dropped from each line).
 *
 * Always yields `count('\n') + 1` entries; the views point into `text`.
 */
[[nodiscard]] std::vector<std::string_view> split_lines(std::string_view text);

}  // namespace chill::syntax
