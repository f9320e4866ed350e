#include "TextHints.hpp"

#include <array>
#include <nlohmann/json.hpp>
#include <utility>

#include "utils.hpp"

namespace {
bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
         c == '\v';
}
bool is_digit(char c) { return c >= '0' && c <= '9'; }
bool is_alpha(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }
bool is_alnum(char c) { return is_alpha(c) || is_digit(c); }

bool is_email_local_char(char c) {
  return is_alnum(c) || c == '.' || c == '_' || c == '%' || c == '+' ||
         c == '-';
}
bool is_email_domain_char(char c) { return is_alnum(c) || c == '.' || c == '-'; }

std::string_view trim(std::string_view sv) {
  while (!sv.empty() && is_space(sv.front())) sv.remove_prefix(1);
  while (!sv.empty() && is_space(sv.back())) sv.remove_suffix(1);
  return sv;
}

// Calls fn(line) for every line until it returns false.
template <typename Fn>
void for_each_line(std::string_view text, Fn&& fn) {
  while (!text.empty()) {
    const auto newline = text.find('\n');
    std::string_view line = text.substr(0, newline);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    if (!fn(line)) return;
    if (newline == std::string_view::npos) return;
    text.remove_prefix(newline + 1);
  }
}

// Length of the UTF-8 sequence introduced by lead, or 0 if lead is invalid.
std::size_t sequence_length(unsigned char lead) {
  if (lead < 0x80) return 1;
  if (lead >= 0xC2 && lead <= 0xDF) return 2;
  if (lead >= 0xE0 && lead <= 0xEF) return 3;
  if (lead >= 0xF0 && lead <= 0xF4) return 4;
  return 0;
}

// Cuts a string to at most max_bytes without splitting a UTF-8 sequence.
std::string truncate_utf8(std::string_view text, std::size_t max_bytes) {
  if (text.size() <= max_bytes) return std::string(text);
  std::size_t end = max_bytes;
  while (end > 0 && (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) {
    --end;
  }
  return std::string(text.substr(0, end));
}

// Characters that may directly precede an absolute path.
bool is_path_boundary(char c) {
  return is_space(c) || c == '"' || c == '\'' || c == '(' || c == '<' ||
         c == '[' || c == '=' || c == ',' || c == ':' || c == '`';
}

bool is_path_name_char(char c) {
  return static_cast<unsigned char>(c) >= 0x80 || is_alnum(c) || c == '.' ||
         c == '_' || c == '-' || c == '~';
}

// "/etc/passwd" and "C:\Users\x" are paths; "sys/types.h", "// note" and
// "/* note" are not.
bool starts_absolute_path(std::string_view text, std::size_t i) {
  if (i > 0 && !is_path_boundary(text[i - 1])) return false;
  if (text[i] == '/') {
    return i + 1 < text.size() && is_path_name_char(text[i + 1]);
  }
  return is_alpha(text[i]) && i + 3 < text.size() && text[i + 1] == ':' &&
         text[i + 2] == '\\' && !is_space(text[i + 3]);
}

std::string mask_paths(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    if (!starts_absolute_path(text, i)) {
      out += text[i++];
      continue;
    }
    while (i < text.size() && !is_space(text[i])) ++i;
    out += "[PATH]";
  }
  return out;
}

std::string mask_emails(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  std::size_t copied = 0;
  std::size_t at = text.find('@');
  while (at != std::string_view::npos) {
    std::size_t left = at;
    while (left > copied && is_email_local_char(text[left - 1])) --left;

    std::size_t domain_end = at + 1;
    while (domain_end < text.size() && is_email_domain_char(text[domain_end])) {
      ++domain_end;
    }
    // The top-level domain is the last ".letters" run of two or more letters.
    std::size_t match_end = std::string_view::npos;
    for (std::size_t dot = domain_end; dot > at + 2; --dot) {
      const std::size_t p = dot - 1;
      if (text[p] != '.') continue;
      std::size_t letters = p + 1;
      while (letters < domain_end && is_alpha(text[letters])) ++letters;
      if (letters - (p + 1) >= 2) {
        match_end = letters;
        break;
      }
    }

    if (left < at && match_end != std::string_view::npos) {
      out.append(text.substr(copied, left - copied));
      out += "[EMAIL]";
      copied = match_end;
      at = text.find('@', match_end);
    } else {
      at = text.find('@', at + 1);
    }
  }
  out.append(text.substr(copied));
  return out;
}

std::string mask_digit_runs(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    if (!is_digit(text[i])) {
      out += text[i++];
      continue;
    }
    std::size_t end = i;
    while (end < text.size() && is_digit(text[end])) ++end;
    if (end - i >= 4) {
      out += "####";
    } else {
      out.append(text.substr(i, end - i));
    }
    i = end;
  }
  return out;
}
}  // namespace

bool TextHints::is_valid_utf8(std::string_view text) {
  std::size_t i = 0;
  while (i < text.size()) {
    const auto lead = static_cast<unsigned char>(text[i]);
    const std::size_t len = sequence_length(lead);
    if (len == 0 || i + len > text.size()) return false;
    for (std::size_t k = 1; k < len; ++k) {
      if ((static_cast<unsigned char>(text[i + k]) & 0xC0) != 0x80) {
        return false;
      }
    }
    if (len >= 3) {
      const auto second = static_cast<unsigned char>(text[i + 1]);
      if (lead == 0xE0 && second < 0xA0) return false;  // overlong
      if (lead == 0xED && second > 0x9F) return false;  // surrogate
      if (lead == 0xF0 && second < 0x90) return false;  // overlong
      if (lead == 0xF4 && second > 0x8F) return false;  // > U+10FFFF
    }
    i += len;
  }
  return true;
}

std::string TextHints::decode_sample(std::string_view raw) {
  // A fixed-size sample may end in the middle of a multi-byte character.
  std::string_view body = raw;
  for (std::size_t back = 1; back <= 3 && back <= raw.size(); ++back) {
    const auto byte = static_cast<unsigned char>(raw[raw.size() - back]);
    if ((byte & 0xC0) == 0x80) continue;
    const std::size_t len = sequence_length(byte);
    if (len > back) body = raw.substr(0, raw.size() - back);
    break;
  }
  if (is_valid_utf8(body)) {
    return std::string(body);
  }

  std::string decoded;
  decoded.reserve(raw.size() * 2);
  for (char c : raw) {
    const auto byte = static_cast<unsigned char>(c);
    if (byte < 0x80) {
      decoded += c;
    } else {
      decoded += static_cast<char>(0xC0 | (byte >> 6));
      decoded += static_cast<char>(0x80 | (byte & 0x3F));
    }
  }
  return decoded;
}

std::string TextHints::mask_sensitive_text(std::string_view text) {
  return mask_digit_runs(mask_emails(mask_paths(text)));
}

std::vector<std::string> TextHints::extract_imports(std::string_view text,
                                                    std::size_t limit) {
  std::vector<std::string> imports;
  for_each_line(text, [&](std::string_view line) {
    const auto stripped = trim(line);
    if (stripped.starts_with("import ") || stripped.starts_with("#include") ||
        (stripped.starts_with("from ") &&
         stripped.find(" import ") != std::string_view::npos)) {
      imports.emplace_back(stripped);
    }
    return imports.size() < limit;
  });
  return imports;
}

std::optional<std::string> TextHints::extract_top_comment(
    std::string_view text, std::size_t max_length) {
  std::optional<std::string> comment;
  for_each_line(text, [&](std::string_view line) {
    const auto stripped = trim(line);
    if (stripped.empty()) return true;
    static constexpr std::array<std::string_view, 5> kOpeners = {
        "#", "//", "/*", "\"\"\"", "'''"};
    for (auto opener : kOpeners) {
      if (stripped.starts_with(opener)) {
        comment = truncate_utf8(stripped, max_length);
        break;
      }
    }
    return false;
  });
  return comment;
}

std::vector<std::string> TextHints::extract_markdown_headings(
    std::string_view text, std::size_t limit) {
  std::vector<std::string> headings;
  for_each_line(text, [&](std::string_view line) {
    if (line.starts_with("#")) {
      std::string_view heading = line;
      while (!heading.empty() && (heading.front() == '#' || heading.front() == ' ')) {
        heading.remove_prefix(1);
      }
      while (!heading.empty() && (heading.back() == '#' || heading.back() == ' ')) {
        heading.remove_suffix(1);
      }
      if (!heading.empty()) headings.emplace_back(heading);
    }
    return headings.size() < limit;
  });
  return headings;
}

std::vector<std::string> TextHints::extract_json_root_keys(
    std::string_view text, std::size_t limit) {
  std::vector<std::string> keys;
  // ordered_json keeps the keys in document order.
  const auto parsed = nlohmann::ordered_json::parse(text, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) return keys;
  for (const auto& item : parsed.items()) {
    if (keys.size() >= limit) break;
    keys.push_back(item.key());
  }
  return keys;
}

std::vector<std::string> TextHints::parse_csv_header(std::string_view text,
                                                     std::size_t limit) {
  std::vector<std::string> fields;
  std::string current;
  bool in_quotes = false;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < text.size() && text[i + 1] == '"') {
          current += '"';
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        current += c;
      }
      continue;
    }
    if (c == '"') {
      in_quotes = true;
    } else if (c == ',') {
      fields.push_back(std::move(current));
      current.clear();
    } else if (c == '\n' || c == '\r') {
      break;
    } else {
      current += c;
    }
  }
  if (!fields.empty() || !current.empty()) {
    fields.push_back(std::move(current));
  }
  if (fields.size() > limit) fields.resize(limit);
  return fields;
}

std::string TextHints::guess_mime_type(std::string_view extension) {
  static const std::array<std::pair<std::string_view, std::string_view>, 34>
      kMimeTypes = {{
          {".py", "text/x-python"},       {".c", "text/x-c"},
          {".h", "text/x-c"},             {".cpp", "text/x-c++"},
          {".hpp", "text/x-c++"},         {".cc", "text/x-c++"},
          {".java", "text/x-java"},       {".js", "text/javascript"},
          {".ts", "application/typescript"},
          {".sh", "application/x-sh"},    {".md", "text/markdown"},
          {".txt", "text/plain"},         {".rst", "text/x-rst"},
          {".html", "text/html"},         {".css", "text/css"},
          {".csv", "text/csv"},           {".json", "application/json"},
          {".yml", "application/yaml"},   {".yaml", "application/yaml"},
          {".toml", "application/toml"},  {".xml", "application/xml"},
          {".ipynb", "application/x-ipynb+json"},
          {".pdf", "application/pdf"},    {".zip", "application/zip"},
          {".gz", "application/gzip"},    {".tar", "application/x-tar"},
          {".png", "image/png"},          {".jpg", "image/jpeg"},
          {".jpeg", "image/jpeg"},        {".gif", "image/gif"},
          {".webp", "image/webp"},        {".tiff", "image/tiff"},
          {".svg", "image/svg+xml"},      {".log", "text/plain"},
      }};
  const std::string lowered = string_to_lower_ascii(extension);
  for (const auto& [ext, mime] : kMimeTypes) {
    if (lowered == ext) return std::string(mime);
  }
  return "application/octet-stream";
}
