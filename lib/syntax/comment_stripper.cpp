// chill/syntax/comment_stripper.cpp
#include "chill/syntax/comment_stripper.hpp"

namespace chill::syntax
{

std::string strip_comments(std::string_view source)
{
  std::string without_blocks;
  without_blocks.reserve(source.size());

  size_t i = 0;
  while (i < source.size()) {
    if (source[i] == '/' && i + 1 < source.size() && source[i + 1] == '*') {
      const size_t close = source.find("*/", i + 2);
      if (close == std::string_view::npos) {
        without_blocks.append(source.substr(i));
        break;
      }
      for (size_t k = i + 2; k < close; ++k) {
        if (source[k] == '\n') {
          without_blocks.push_back('\n');
        }
      }
      i = close + 2;
      continue;
    }
    without_blocks.push_back(source[i]);
    ++i;
  }

  std::string out;
  out.reserve(without_blocks.size());

  bool in_line_comment = false;
  for (size_t k = 0; k < without_blocks.size(); ++k) {
    const char c = without_blocks[k];
    if (c == '\n') {
      in_line_comment = false;
      out.push_back(c);
      continue;
    }
    if (in_line_comment) {
      continue;
    }
    if (c == '-' && k + 1 < without_blocks.size() && without_blocks[k + 1] == '-') {
      in_line_comment = true;
      continue;
    }
    out.push_back(c);
  }

  return out;
}

std::vector<std::string_view> split_lines(std::string_view text)
{
  std::vector<std::string_view> lines;

  size_t start = 0;
  for (;;) {
    const size_t nl = text.find('\n', start);
    const size_t end = (nl == std::string_view::npos) ? text.size() : nl;
    std::string_view line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    lines.push_back(line);
    if (nl == std::string_view::npos) {
      break;
    }
    start = nl + 1;
  }

  return lines;
}

}  // namespace chill::syntax
