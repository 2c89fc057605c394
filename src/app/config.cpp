#include <boxfit/app/config.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>
#include <string_view>

namespace boxfit::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

}  // namespace

std::vector<double> parse_width_list(const std::string& value) {
  std::vector<double> widths;
  std::istringstream in(value);
  std::string item;
  while (std::getline(in, item, ',')) {
    trim(item);
    if (item.empty()) continue;
    widths.push_back(std::stod(item));
  }
  return widths;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name) {
  // from_str maps unknown names to off.
  const auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") return std::nullopt;
  return level;
}

AnalyzerConfig default_config() {
  AnalyzerConfig c;
  c.constraints.max_height = 11.0;
  c.constraints.max_width = 22.0;
  c.constraints.max_length = 15.0;
  c.constraints.cardboard_widths = {23.0, 39.0};
  c.columns = {"Item ID", "Height", "Width", "Length"};
  c.output_dir = "output";
  c.num_workers = 0;
  c.log_level = "info";
  return c;
}

AnalyzerConfig load_config(const std::string& path) {
  AnalyzerConfig c = default_config();
  std::ifstream f(path);
  if (!f) {
    spdlog::warn("config '{}' not readable; using defaults", path);
    return c;
  }

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    if (key == "max_height") c.constraints.max_height = std::stod(value);
    else if (key == "max_width") c.constraints.max_width = std::stod(value);
    else if (key == "max_length") c.constraints.max_length = std::stod(value);
    else if (key == "cardboard_widths") c.constraints.cardboard_widths = parse_width_list(value);
    else if (key == "id_column") c.columns.id = value;
    else if (key == "height_column") c.columns.height = value;
    else if (key == "width_column") c.columns.width = value;
    else if (key == "length_column") c.columns.length = value;
    else if (key == "output_dir") c.output_dir = value;
    else if (key == "num_workers") c.num_workers = static_cast<std::size_t>(std::stoul(value));
    else if (key == "log_level") c.log_level = value;
    else spdlog::warn("config '{}': unknown key '{}' ignored", path, key);
  }
  return c;
}

}  // namespace boxfit::app
