#include "IOManager.hpp"

#include <chrono>
#include <fstream>
#include <functional>
#include <mutex>
#include <print>

namespace {
std::ofstream& get_log_stream() {
  static std::ofstream log_file("organizer.log", std::ios_base::app);
  return log_file;
}

std::mutex log_mutex;

std::function<void(std::string_view)> g_log_handler = nullptr;

std::vector<std::string> string_list(const ordered_json& node,
                                     std::string_view context) {
  std::vector<std::string> values;
  if (node.is_null()) return values;
  if (!node.is_array()) {
    throw ValidationError(std::format("{} must be a list", context));
  }
  for (const auto& item : node) {
    if (!item.is_string()) {
      throw ValidationError(
          std::format("{} must contain only strings", context));
    }
    values.push_back(item.get<std::string>());
  }
  return values;
}

std::string normalize_extension(std::string ext) {
  ext = string_to_lower_ascii(ext);
  if (!ext.empty() && ext.front() != '.') ext.insert(ext.begin(), '.');
  return ext;
}

BucketRule parse_bucket(const std::string& name, const ordered_json& node) {
  if (!node.is_object()) {
    throw ValidationError(
        std::format("bucket '{}' must be a mapping of rule lists", name));
  }
  auto field = [&](const char* key) {
    return string_list(node.contains(key) ? node.at(key) : ordered_json(),
                       std::format("buckets.{}.{}", name, key));
  };
  BucketRule rule;
  rule.name = name;
  for (auto& ext : field("exts")) {
    rule.exts.push_back(normalize_extension(std::move(ext)));
  }
  rule.name_keywords = field("name_keywords");
  rule.dir_keywords = field("dir_keywords");
  rule.code_hints = field("code_hints");
  rule.imports = field("imports");
  rule.title_keywords = field("title_keywords");
  return rule;
}

json read_json_file(const fs::path& path) {
  std::ifstream file(path);
  if (!file) {
    throw ValidationError(std::format("cannot open '{}'",
                                      safe_path_to_string(path)));
  }
  try {
    return json::parse(file);
  } catch (const json::parse_error& e) {
    throw ValidationError(std::format("'{}' is not valid JSON: {}",
                                      safe_path_to_string(path), e.what()));
  }
}

}  // namespace

void IOManager::initialize_logger() { get_log_stream(); }

void IOManager::set_log_handler(std::function<void(std::string_view)> handler) {
  std::scoped_lock lock(log_mutex);
  g_log_handler = handler;
}

void IOManager::log(std::string_view message) {
  std::scoped_lock lock(log_mutex);

  auto now = std::chrono::floor<std::chrono::seconds>(
      std::chrono::system_clock::now());
  auto time_str = std::format("{:%Y-%m-%d %H:%M:%S}", now);
  std::string full_message = std::format("{} | {}", time_str, message);

  if (g_log_handler) {
    g_log_handler(full_message);
  }

  auto& log_stream = get_log_stream();
  if (log_stream.is_open()) {
    log_stream << full_message << "\n" << std::flush;
  }
}

std::optional<RuleConfig> IOManager::load_rule_config(
    const fs::path& configPath) {
  if (!fs::exists(configPath)) {
    log(std::format("Error: Rule config not found at {}",
                    safe_path_to_string(configPath)));
    return std::nullopt;
  }
  std::ifstream configFile(configPath);
  try {
    // ordered_json keeps buckets in file order, which decides score ties.
    ordered_json configJson = ordered_json::parse(configFile);
    if (!configJson.is_object()) {
      throw ValidationError("rule config root must be a mapping");
    }
    if (!configJson.contains("buckets") ||
        !configJson.at("buckets").is_object()) {
      throw ValidationError("rule config requires a 'buckets' mapping");
    }

    RuleConfig config;
    for (const auto& [name, bucket] : configJson.at("buckets").items()) {
      config.buckets.push_back(parse_bucket(name, bucket));
    }

    if (configJson.contains("weights")) {
      const auto& weights = configJson.at("weights");
      if (!weights.is_object()) {
        throw ValidationError("'weights' must be a mapping");
      }
      for (const auto& [category, value] : weights.items()) {
        if (!value.is_number_integer()) {
          throw ValidationError(
              std::format("weight '{}' must be an integer", category));
        }
        const std::string key = category == "mimetype" ? "ext" : category;
        config.weights[key] = value.get<int>();
      }
    }

    config.project_hints = string_list(
        configJson.contains("project_hints") ? configJson.at("project_hints")
                                             : ordered_json(),
        "project_hints");
    log(std::format("Loaded {} buckets and {} project hints from {}",
                    config.buckets.size(), config.project_hints.size(),
                    safe_path_to_string(configPath)));
    return config;
  } catch (const ordered_json::exception& e) {
    log(std::format("Error parsing rule config: {}", e.what()));
    return std::nullopt;
  } catch (const ValidationError& e) {
    log(std::format("Invalid rule config: {}", e.what()));
    return std::nullopt;
  }
}

std::optional<SchemaConfig> IOManager::load_schema(const fs::path& schemaPath) {
  if (!fs::exists(schemaPath)) {
    log(std::format("Error: Schema file not found at {}",
                    safe_path_to_string(schemaPath)));
    return std::nullopt;
  }
  std::ifstream schemaFile(schemaPath);
  try {
    ordered_json schemaJson = ordered_json::parse(schemaFile);
    if (!schemaJson.is_object()) {
      throw ValidationError("schema root must be a mapping");
    }
    if (!schemaJson.contains("target_root") ||
        !schemaJson.at("target_root").is_string()) {
      throw ValidationError("schema requires a string 'target_root'");
    }

    SchemaConfig schema;
    schema.target_root =
        path_from_utf8(schemaJson.at("target_root").get<std::string>());
    schema.structure = string_list(schemaJson.contains("structure")
                                       ? schemaJson.at("structure")
                                       : ordered_json(),
                                   "structure");

    const std::string policy = schemaJson.value("conflict_policy", "suffix");
    auto parsed_policy = parse_conflict_policy(policy);
    if (!parsed_policy) {
      throw ValidationError(
          std::format("unsupported conflict_policy '{}'", policy));
    }
    schema.conflict_policy = *parsed_policy;

    const std::string mode = schemaJson.value("mode", "move");
    auto parsed_mode = parse_transfer_mode(mode);
    if (!parsed_mode) {
      throw ValidationError(
          std::format("mode must be 'move' or 'copy', got '{}'", mode));
    }
    schema.mode = *parsed_mode;
    return schema;
  } catch (const ordered_json::exception& e) {
    log(std::format("Error parsing schema: {}", e.what()));
    return std::nullopt;
  } catch (const ValidationError& e) {
    log(std::format("Invalid schema: {}", e.what()));
    return std::nullopt;
  }
}

void IOManager::save_json(const fs::path& path, const json& data) {
  ensure_directory(path.parent_path());
  std::ofstream out(path);
  if (!out) {
    throw std::runtime_error(
        std::format("cannot write '{}'", safe_path_to_string(path)));
  }
  out << data.dump(2, ' ', false, json::error_handler_t::replace);
}

void IOManager::save_scores(const fs::path& path,
                            const std::vector<BucketScore>& scores) {
  save_json(path, json(scores));
}

std::vector<BucketScore> IOManager::load_scores(const fs::path& path) {
  if (!fs::exists(path)) {
    log(std::format("No score file at {}", safe_path_to_string(path)));
    return {};
  }
  json data = read_json_file(path);
  // Accept both a bare list and {"scores": [...]}.
  if (data.is_object() && data.contains("scores")) {
    data = data.at("scores");
  }
  if (!data.is_array()) {
    throw ValidationError("score file must hold a list of bucket scores");
  }
  std::vector<BucketScore> scores;
  scores.reserve(data.size());
  for (const auto& item : data) {
    scores.push_back(item.get<BucketScore>());
  }
  return scores;
}

ScoreMap IOManager::load_score_map(const fs::path& path) {
  ScoreMap mapping;
  for (auto& score : load_scores(path)) {
    mapping[score.doc_id] = std::move(score.bucket);
  }
  return mapping;
}

void IOManager::save_plans(const fs::path& path,
                           const std::vector<OrganizePlan>& plans) {
  save_json(path, json(plans));
}

std::vector<OrganizePlan> IOManager::load_plans(const fs::path& path) {
  const json data = read_json_file(path);
  if (!data.is_array()) {
    throw ValidationError("plan file must hold a list of plans");
  }
  std::vector<OrganizePlan> plans;
  plans.reserve(data.size());
  for (const auto& item : data) {
    plans.push_back(item.get<OrganizePlan>());
  }
  log(std::format("Loaded {} plans from {}", plans.size(),
                  safe_path_to_string(path)));
  return plans;
}

void IOManager::save_cluster_result(const fs::path& path,
                                    const ClusterResult& result) {
  save_json(path, json{{"projects", result.projects}});
}

ClusterResult IOManager::load_cluster_result(const fs::path& path) {
  if (!fs::exists(path)) {
    log(std::format("No cluster file at {}", safe_path_to_string(path)));
    return {};
  }
  json data = read_json_file(path);
  if (!data.is_object() || !data.contains("projects") ||
      !data.at("projects").is_array()) {
    throw ValidationError("cluster file requires a 'projects' list");
  }
  ClusterResult result;
  for (const auto& item : data.at("projects")) {
    result.projects.push_back(item.get<ClusterProject>());
  }
  return result;
}
