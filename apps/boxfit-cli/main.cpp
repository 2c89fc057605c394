/**
 * boxfit-cli — Classify item dimensions against the machine envelope and
 * cardboard widths; write annotated results and a summary per input.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/boxfit_cli [--config path] --input items.csv [--input more.csv ...]
 * Writes output/<stem>_size_analysis.csv and output/<stem>_summary.csv; inputs
 * sharing a file stem get "_<position>" appended to keep their outputs apart.
 */

#include <boxfit/app/analysis_runner.hpp>
#include <boxfit/app/config.hpp>
#include <boxfit/core/analysis_result.hpp>
#include <boxfit/core/error.hpp>
#include <boxfit/io/csv_reader.hpp>
#include <boxfit/io/csv_writer.hpp>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace {

std::string join_widths(const std::vector<double>& widths) {
  std::ostringstream out;
  for (std::size_t i = 0; i < widths.size(); ++i) {
    if (i > 0) out << ", ";
    out << widths[i];
  }
  return out.str();
}

void print_usage() {
  std::cout << "Usage: boxfit_cli [options] --input <path> [--input <path> ...]\n"
            << "  --config <path>      Analyzer config (key=value file); default: built-in\n"
            << "  --id-col <name>      Item ID column (default from config: \"Item ID\")\n"
            << "  --height-col <name>  Height column\n"
            << "  --width-col <name>   Width column\n"
            << "  --length-col <name>  Length column\n"
            << "  --output-dir <dir>   Where result files are written (default: output)\n"
            << "  --workers <n>        Parallel workers for several inputs (0 = all cores)\n"
            << "  --log-level <lvl>    trace | debug | info | warn | error | off\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::vector<std::string> inputs;
  std::string id_col, height_col, width_col, length_col;
  std::string output_dir_override;
  std::string workers_override;
  std::string log_level_override;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      inputs.emplace_back(argv[++i]);
    } else if (arg == "--id-col" && i + 1 < argc) {
      id_col = argv[++i];
    } else if (arg == "--height-col" && i + 1 < argc) {
      height_col = argv[++i];
    } else if (arg == "--width-col" && i + 1 < argc) {
      width_col = argv[++i];
    } else if (arg == "--length-col" && i + 1 < argc) {
      length_col = argv[++i];
    } else if (arg == "--output-dir" && i + 1 < argc) {
      output_dir_override = argv[++i];
    } else if (arg == "--workers" && i + 1 < argc) {
      workers_override = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      log_level_override = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      print_usage();
      return 2;
    }
  }

  if (inputs.empty()) {
    std::cerr << "No --input given\n";
    print_usage();
    return 2;
  }

  boxfit::app::AnalyzerConfig cfg;
  try {
    cfg = config_path.empty() ? boxfit::app::default_config()
                              : boxfit::app::load_config(config_path);
    if (!workers_override.empty()) {
      cfg.num_workers = static_cast<std::size_t>(std::stoul(workers_override));
    }
  } catch (const std::exception& e) {
    std::cerr << "Invalid configuration: " << e.what() << "\n";
    return 2;
  }
  if (!id_col.empty()) cfg.columns.id = id_col;
  if (!height_col.empty()) cfg.columns.height = height_col;
  if (!width_col.empty()) cfg.columns.width = width_col;
  if (!length_col.empty()) cfg.columns.length = length_col;
  if (!output_dir_override.empty()) cfg.output_dir = output_dir_override;
  if (!log_level_override.empty()) cfg.log_level = log_level_override;

  const auto level = boxfit::app::parse_log_level(cfg.log_level);
  if (!level) {
    std::cerr << "Unknown log level: " << cfg.log_level << "\n";
    print_usage();
    return 2;
  }
  spdlog::set_level(*level);

  std::cout << "Machine max box size: width " << cfg.constraints.max_width
            << ", length " << cfg.constraints.max_length << ", height "
            << cfg.constraints.max_height << "\n"
            << "Cardboard widths: " << join_widths(cfg.constraints.cardboard_widths)
            << "\n";

  bool all_ok = true;
  const std::vector<std::string> input_stems = boxfit::io::unique_output_stems(inputs);
  std::vector<boxfit::app::AnalysisJob> jobs;
  std::vector<std::string> job_stems;  // parallel to jobs
  jobs.reserve(inputs.size());
  job_stems.reserve(inputs.size());
  for (std::size_t i = 0; i < inputs.size(); ++i) {
    auto table = boxfit::io::read_csv(inputs[i]);
    if (!table) {
      std::cerr << "Failed to load " << inputs[i] << ": "
                << boxfit::core::to_string(table.error()) << "\n";
      all_ok = false;
      continue;
    }
    jobs.push_back({inputs[i], std::move(*table), cfg.columns, cfg.constraints});
    job_stems.push_back(input_stems[i]);
  }

  const std::filesystem::path out_dir(cfg.output_dir);
  std::error_code ec;
  std::filesystem::create_directories(out_dir, ec);
  if (ec) {
    std::cerr << "Cannot create output directory " << out_dir << ": " << ec.message() << "\n";
    return 1;
  }

  std::mutex out_mutex;
  boxfit::app::run_analysis_batch_parallel(
      jobs,
      [&](const boxfit::app::AnalysisJob& job, const boxfit::app::JobOutcome& outcome) {
        const auto idx = static_cast<std::size_t>(&job - jobs.data());
        const std::string& stem = job_stems[idx];
        bool ok = outcome.has_value();
        if (ok) {
          const auto results_path = (out_dir / boxfit::io::results_file_name(stem)).string();
          const auto summary_path = (out_dir / boxfit::io::summary_file_name(stem)).string();
          ok = boxfit::io::write_results_csv_file(results_path, *outcome).has_value() &&
               boxfit::io::write_summary_csv_file(summary_path, outcome->summary).has_value();
        }

        std::lock_guard lock(out_mutex);
        if (!outcome) {
          std::cerr << job.name << ": " << boxfit::core::to_string(outcome.error()) << "\n";
        } else {
          const auto& s = outcome->summary;
          std::cout << job.name << ": Total=" << s.total << " OK=" << s.ok_count << " ("
                    << std::fixed << std::setprecision(2) << s.ok_pct << "%) No OK="
                    << s.no_ok_count << " (" << s.no_ok_pct << "%)\n"
                    << std::defaultfloat;
          if (!ok) std::cerr << job.name << ": could not write results\n";
        }
        if (!ok) all_ok = false;
      },
      cfg.num_workers);

  return all_ok ? 0 : 1;
}
