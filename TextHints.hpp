#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Cheap, best-effort text helpers used by the scanner. None of them throw on
// odd input; they return empty results instead.
namespace TextHints {
// Returns valid UTF-8: the input itself when it already is (ignoring a
// sequence cut off at the end), otherwise a byte-preserving Latin-1 decoding.
std::string decode_sample(std::string_view raw);

bool is_valid_utf8(std::string_view text);

// Replaces absolute paths with [PATH], e-mail addresses with [EMAIL] and runs
// of four or more digits with ####, in that order.
std::string mask_sensitive_text(std::string_view text);

std::vector<std::string> extract_imports(std::string_view text,
                                         std::size_t limit = 5);
std::optional<std::string> extract_top_comment(std::string_view text,
                                               std::size_t max_length = 200);
std::vector<std::string> extract_markdown_headings(std::string_view text,
                                                   std::size_t limit = 5);
std::vector<std::string> extract_json_root_keys(std::string_view text,
                                                std::size_t limit = 10);
std::vector<std::string> parse_csv_header(std::string_view text,
                                          std::size_t limit = 20);

std::string guess_mime_type(std::string_view extension);
}  // namespace TextHints
