#include "scratchpad/preprocessor.hpp"

#include <algorithm>
#include <vector>

namespace scratchpad {

namespace {

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\v' || c == '\f';
}

std::string_view trim(std::string_view v) {
  while (!v.empty() && is_space(v.front())) v.remove_prefix(1);
  while (!v.empty() && is_space(v.back())) v.remove_suffix(1);
  return v;
}

inline bool starts_with(std::string_view v, std::string_view prefix) {
  return v.size() >= prefix.size() && v.compare(0, prefix.size(), prefix) == 0;
}

// Splits on "\r\n", "\r" and "\n". A trailing separator yields a final empty line.
std::vector<std::string_view> split_lines(std::string_view text) {
  std::vector<std::string_view> lines;
  size_t start = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\n' || text[i] == '\r') {
      lines.push_back(text.substr(start, i - start));
      if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') ++i;
      start = i + 1;
    }
  }
  lines.push_back(text.substr(start));
  return lines;
}

}  // namespace

std::optional<std::string> match_import(std::string_view line) {
  line = trim(line);
  if (!starts_with(line, "#")) return std::nullopt;
  line.remove_prefix(1);
  while (!line.empty() && is_space(line.front())) line.remove_prefix(1);
  if (!starts_with(line, "include")) return std::nullopt;
  line.remove_prefix(7);
  if (line.empty() || !is_space(line.front())) return std::nullopt;
  line = trim(line);
  if (line.size() < 3) return std::nullopt;

  const char open = line.front();
  const char close = open == '<' ? '>' : (open == '"' ? '"' : '\0');
  if (close == '\0' || line.back() != close) return std::nullopt;
  const std::string_view name = line.substr(1, line.size() - 2);
  if (name.empty() || name.find(close) != std::string_view::npos) return std::nullopt;
  return std::string(name);
}

PreprocessedSource preprocess(const std::string& source_text) {
  PreprocessedSource out;
  std::vector<std::string_view> kept;
  bool in_block_comment = false;
  bool code_started = false;

  for (const auto line : split_lines(source_text)) {
    if (code_started) {
      kept.push_back(line);
      continue;
    }

    const std::string_view trimmed = trim(line);
    ++out.removed_line_count;

    if (in_block_comment) {
      if (trimmed.find("*/") != std::string_view::npos) in_block_comment = false;
      continue;
    }
    if (starts_with(trimmed, "/*")) {
      // The closer must follow the opener; "/*/" does not close.
      if (trimmed.find("*/", 2) == std::string_view::npos) in_block_comment = true;
      continue;
    }
    if (trimmed.empty() || starts_with(trimmed, "//")) {
      continue;
    }
    if (auto name = match_import(trimmed)) {
      out.imports.push_back(std::move(*name));
      continue;
    }

    --out.removed_line_count;
    code_started = true;
    kept.push_back(line);
  }

  for (size_t i = 0; i < kept.size(); ++i) {
    if (i) out.body += '\n';
    out.body.append(kept[i].data(), kept[i].size());
  }
  return out;
}

CompilationUnit make_compilation_unit(const PreprocessedSource& source,
                                      const ScriptConfig& config,
                                      const std::string& source_name) {
  CompilationUnit unit;
  unit.body = source.body;
  unit.removed_line_count = source.removed_line_count;
  unit.source_name = source_name;

  auto add = [&unit](const std::string& name) {
    if (name.empty()) return;
    if (std::find(unit.imports.begin(), unit.imports.end(), name) == unit.imports.end()) {
      unit.imports.push_back(name);
    }
  };
  for (const auto& name : config.default_imports) add(name);
  for (const auto& name : source.imports) add(name);
  return unit;
}

}  // namespace scratchpad
