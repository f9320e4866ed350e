#include "Scanner.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <execution>
#include <exiv2/exiv2.hpp>
#include <fstream>
#include <mutex>

#include "ContentIdentity.hpp"
#include "DocumentStore.hpp"
#include "IOManager.hpp"
#include "TextHints.hpp"

namespace {
std::mutex g_exiv2_mutex;

constexpr size_t kChunkSize = 128;

fs::path expand_root(const fs::path& root) {
  // Only "~" and "~/..." name the current user's home; "~user" is literal.
  const std::string text = safe_path_to_string(root);
  if (text != "~" && !text.starts_with("~/")) return root;
  const char* home = std::getenv("HOME");
  if (!home || !*home) return root;
  return text.size() > 2 ? fs::path(home) / path_from_utf8(text.substr(2))
                         : fs::path(home);
}

double to_epoch_seconds(fs::file_time_type file_time) {
  const auto sys_time = std::chrono::file_clock::to_sys(file_time);
  return std::chrono::duration<double>(sys_time.time_since_epoch()).count();
}

bool is_photo_extension(const std::string& ext_lower) {
  static const std::vector<std::string> image_extensions = {
      ".jpg", ".jpeg", ".png", ".webp", ".tiff",
      ".raw", ".cr2",  ".nef", ".arw",  ".dng"};
  return std::find(image_extensions.begin(), image_extensions.end(),
                   ext_lower) != image_extensions.end();
}

std::vector<std::string> masked(std::vector<std::string> values) {
  for (auto& value : values) {
    value = TextHints::mask_sensitive_text(value);
  }
  return values;
}
}  // namespace

Scanner::Scanner(ScanConfig config) : m_config(std::move(config)) {}

std::vector<fs::path> Scanner::discover_files() const {
  std::vector<fs::path> files;
  for (const auto& configured_root : m_config.roots) {
    const fs::path root = fs::absolute(expand_root(configured_root));
    std::error_code ec;
    if (!fs::exists(root, ec)) {
      IOManager::log(std::format("Root path missing, skipping: {}",
                                 safe_path_to_string(root)));
      continue;
    }
    if (fs::is_regular_file(root, ec)) {
      files.push_back(root.lexically_normal());
      continue;
    }

    const auto options = fs::directory_options::skip_permission_denied;
    std::error_code walk_ec;
    fs::recursive_directory_iterator it(root, options, walk_ec);
    for (; !walk_ec && it != fs::recursive_directory_iterator();
         it.increment(walk_ec)) {
      std::error_code entry_ec;
      if (it->is_directory(entry_ec)) {
        // Opening it first means an unreadable subtree is skipped on its own
        // instead of ending the walk of the whole root.
        fs::directory_iterator listing(it->path(), options, entry_ec);
        if (entry_ec) {
          IOManager::log(std::format("Cannot read '{}': {}. Skipping subtree.",
                                     safe_path_to_string(it->path()),
                                     entry_ec.message()));
          it.disable_recursion_pending();
        }
        continue;
      }
      if (it->is_regular_file(entry_ec)) {
        files.push_back(it->path().lexically_normal());
      }
    }
    if (walk_ec) {
      IOManager::log(std::format(
          "Error while walking '{}': {}. Keeping files found so far.",
          safe_path_to_string(root), walk_ec.message()));
    }
  }

  // Overlapping roots must not produce the same document twice.
  std::sort(files.begin(), files.end());
  files.erase(std::unique(files.begin(), files.end()), files.end());
  return files;
}

std::vector<Document> Scanner::scan() const {
  IOManager::log("Scanning roots for files...");
  const std::vector<fs::path> paths_to_scan = discover_files();
  IOManager::log(
      std::format("Found {} files. Analyzing...", paths_to_scan.size()));

  // Each worker writes only its own slot, so collection needs no lock.
  std::vector<std::optional<Document>> slots(paths_to_scan.size());
  for (size_t i = 0; i < paths_to_scan.size(); i += kChunkSize) {
    auto first = paths_to_scan.begin() + i;
    auto last =
        paths_to_scan.begin() + std::min(i + kChunkSize, paths_to_scan.size());
    std::transform(std::execution::par, first, last, slots.begin() + i,
                   [this](const fs::path& p) { return scan_file(p); });
  }

  std::vector<Document> documents;
  documents.reserve(slots.size());
  for (auto& slot : slots) {
    if (slot) documents.push_back(std::move(*slot));
  }
  IOManager::log(std::format("Analysis complete. {} of {} files qualified.",
                             documents.size(), paths_to_scan.size()));

  DocumentStore store(m_config.cache_path);
  store.upsert(documents);

  IOManager::save_json(m_config.output_path, json(documents));
  IOManager::log(std::format("Scan snapshot written to {}",
                             safe_path_to_string(m_config.output_path)));
  return documents;
}

std::string Scanner::read_sample(const fs::path& path) const {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw fs::filesystem_error("Failed to open file for sampling", path,
                               std::make_error_code(std::errc::io_error));
  }
  std::string raw(m_config.sample_bytes, '\0');
  file.read(raw.data(), static_cast<std::streamsize>(raw.size()));
  raw.resize(static_cast<size_t>(file.gcount()));
  return raw;
}

std::optional<std::string> Scanner::get_exif_date(const fs::path& path) const {
  std::scoped_lock lock(g_exiv2_mutex);

  try {
    Exiv2::Image::UniquePtr image =
        Exiv2::ImageFactory::open(safe_path_to_string(path));
    if (!image.get()) return std::nullopt;
    image->readMetadata();
    const auto& exifData = image->exifData();
    if (exifData.empty()) return std::nullopt;

    for (const char* key : {"Exif.Photo.DateTimeOriginal", "Exif.Image.DateTime"}) {
      auto datum = exifData.findKey(Exiv2::ExifKey(key));
      if (datum != exifData.end() && datum->count() > 0) {
        std::string date_str = datum->toString();
        if (date_str.length() >= 10) {
          return date_str.substr(0, 10);
        }
      }
    }
  } catch (const Exiv2::Error& e) {
    IOManager::log(std::format("Non-critical Exiv2 error reading '{}': {}",
                               safe_path_to_string(path), e.what()));
  } catch (const std::exception& e) {
    IOManager::log(
        std::format("Non-critical standard exception reading '{}': {}",
                    safe_path_to_string(path), e.what()));
  }
  return std::nullopt;
}

std::optional<Document> Scanner::scan_file(const fs::path& path) const {
  try {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return std::nullopt;
    const auto size = fs::file_size(path, ec);
    if (ec) {
      IOManager::log(std::format("Warning: cannot stat '{}': {}. Skipping.",
                                 safe_path_to_string(path), ec.message()));
      return std::nullopt;
    }
    if (size > m_config.max_size_bytes) return std::nullopt;
    const auto modified = fs::last_write_time(path, ec);
    if (ec) {
      IOManager::log(std::format("Warning: cannot stat '{}': {}. Skipping.",
                                 safe_path_to_string(path), ec.message()));
      return std::nullopt;
    }

    Document doc;
    doc.path = path;
    doc.name = safe_path_to_string(path.filename());
    doc.extension = string_to_lower_ascii(safe_path_to_string(path.extension()));
    doc.size = size;
    doc.modified_time = to_epoch_seconds(modified);
    doc.content_digest = ContentIdentity::digest_file(path);
    doc.doc_id = ContentIdentity::derive_doc_id(path, doc.content_digest);
    doc.mime_type = TextHints::guess_mime_type(doc.extension);
    doc.dir_hint = safe_path_to_string(path.parent_path().filename());

    const std::string decoded = TextHints::decode_sample(read_sample(path));
    doc.sample_text = TextHints::mask_sensitive_text(decoded);

    // Hints are parsed from the unmasked text; each result is masked after.
    doc.imports_first = masked(TextHints::extract_imports(decoded));
    if (auto comment = TextHints::extract_top_comment(decoded)) {
      doc.top_comment = TextHints::mask_sensitive_text(*comment);
    }
    doc.markdown_headings =
        masked(TextHints::extract_markdown_headings(decoded));
    doc.json_root_keys = masked(TextHints::extract_json_root_keys(decoded));
    if (doc.extension == ".csv") {
      doc.csv_header = masked(TextHints::parse_csv_header(decoded));
    }
    if (is_photo_extension(doc.extension)) {
      doc.capture_date = get_exif_date(path);
    }
    return doc;
  } catch (const fs::filesystem_error& e) {
    IOManager::log(
        std::format("Warning: Filesystem error processing '{}': {}. Skipping.",
                    safe_path_to_string(path), e.what()));
  } catch (const std::exception& e) {
    IOManager::log(std::format("Warning: error processing '{}': {}. Skipping.",
                               safe_path_to_string(path), e.what()));
  }
  return std::nullopt;
}
