/// @file
/// @brief CLI entry point for the IPED task matrix generator.

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/version_info.h"
#include "design/matrix_io.h"
#include "design/task_planner.h"
#include "generator.h"

namespace {

/// @brief Command-line options parsed from argv.
struct CliOptions {
  iped::StudyDesignParams params;
  std::vector<std::string> names;
  uint32_t seed = 0;
  bool randomize = false;
  double tolerance = iped::kDefaultExposureTolerance;
  int pool_cap = iped::kDefaultPoolCapPerLevel;
  int threads = 1;
  int batch = 0;
  uint32_t timeout_ms = 0;
  std::string output = "output.json";
  std::string validate_path;
  bool json_output = false;
  bool pretty = false;
  bool strict = false;
  bool verbose = false;
};

/// @brief Print usage information to stdout.
void printUsage() {
  std::printf("iped_cli - Task matrix generator for element-exposure studies\n\n");
  std::printf("Usage: iped_cli [options]\n");
  std::printf("       iped_cli --validate FILE [--tolerance X]\n\n");
  std::printf("Options:\n");
  std::printf("  --elements N     Number of elements (4-16)\n");
  std::printf("  --tasks N        Tasks per respondent (1-100, 0 = recommended)\n");
  std::printf("  --respondents N  Number of respondents (1-10000)\n");
  std::printf("  --min-active N   Minimum elements shown per task\n");
  std::printf("  --max-active N   Maximum elements shown per task\n");
  std::printf("  --names A,B,...  Element identifiers (default E1..En)\n");
  std::printf("  --seed N         Random seed (0 = derived from parameters)\n");
  std::printf("  --randomize      Draw a fresh random seed\n");
  std::printf("  --tolerance X    Allowed exposure deviation as a fraction of mean (0.10)\n");
  std::printf("  --pool-cap N     Candidate tasks kept per active level (128)\n");
  std::printf("  --threads N      Scheduling threads (0 = hardware concurrency)\n");
  std::printf("  --batch N        Respondents per tally snapshot (0 = thread count)\n");
  std::printf("  --timeout-ms N   Abort generation after N milliseconds\n");
  std::printf("  --strict         No retry\n");
  std::printf("  --verbose-retry  Log state transitions and retries\n");
  std::printf("  --json           Also write a summary JSON next to the output\n");
  std::printf("  --pretty         Indent the matrix JSON\n");
  std::printf("  -o FILE          Output file path\n");
  std::printf("  --validate FILE  Re-validate a persisted matrix and exit\n");
  std::printf("  --help           Show this help\n");
}

/// @brief Split a comma-separated list.
std::vector<std::string> splitNames(const char* arg) {
  std::vector<std::string> names;
  std::stringstream stream(arg);
  std::string item;
  while (std::getline(stream, item, ',')) {
    names.push_back(item);
  }
  return names;
}

/// @brief Parse command-line arguments into CliOptions.
/// @param argc Argument count from main().
/// @param argv Argument vector from main().
/// @param opts Output structure populated with parsed values.
/// @return False if --help was requested (caller should exit cleanly).
bool parseArgs(int argc, char* argv[], CliOptions& opts) {
  opts.params.tasks_per_respondent = 0;
  for (int idx = 1; idx < argc; ++idx) {
    if (std::strcmp(argv[idx], "--help") == 0 ||
        std::strcmp(argv[idx], "-h") == 0) {
      printUsage();
      return false;
    }
    if (std::strcmp(argv[idx], "--elements") == 0 && idx + 1 < argc) {
      opts.params.num_elements = std::atoi(argv[++idx]);
    } else if (std::strcmp(argv[idx], "--tasks") == 0 && idx + 1 < argc) {
      opts.params.tasks_per_respondent = std::atoi(argv[++idx]);
    } else if (std::strcmp(argv[idx], "--respondents") == 0 && idx + 1 < argc) {
      opts.params.num_respondents = std::atoi(argv[++idx]);
    } else if (std::strcmp(argv[idx], "--min-active") == 0 && idx + 1 < argc) {
      opts.params.min_active = std::atoi(argv[++idx]);
    } else if (std::strcmp(argv[idx], "--max-active") == 0 && idx + 1 < argc) {
      opts.params.max_active = std::atoi(argv[++idx]);
    } else if (std::strcmp(argv[idx], "--names") == 0 && idx + 1 < argc) {
      opts.names = splitNames(argv[++idx]);
    } else if (std::strcmp(argv[idx], "--seed") == 0 && idx + 1 < argc) {
      opts.seed = static_cast<uint32_t>(std::strtoul(argv[++idx], nullptr, 10));
    } else if (std::strcmp(argv[idx], "--randomize") == 0) {
      opts.randomize = true;
    } else if (std::strcmp(argv[idx], "--tolerance") == 0 && idx + 1 < argc) {
      opts.tolerance = std::atof(argv[++idx]);
    } else if (std::strcmp(argv[idx], "--pool-cap") == 0 && idx + 1 < argc) {
      opts.pool_cap = std::atoi(argv[++idx]);
    } else if (std::strcmp(argv[idx], "--threads") == 0 && idx + 1 < argc) {
      opts.threads = std::atoi(argv[++idx]);
    } else if (std::strcmp(argv[idx], "--batch") == 0 && idx + 1 < argc) {
      opts.batch = std::atoi(argv[++idx]);
    } else if (std::strcmp(argv[idx], "--timeout-ms") == 0 && idx + 1 < argc) {
      opts.timeout_ms = static_cast<uint32_t>(std::strtoul(argv[++idx], nullptr, 10));
    } else if (std::strcmp(argv[idx], "--strict") == 0) {
      opts.strict = true;
    } else if (std::strcmp(argv[idx], "--verbose-retry") == 0) {
      opts.verbose = true;
    } else if (std::strcmp(argv[idx], "--json") == 0) {
      opts.json_output = true;
    } else if (std::strcmp(argv[idx], "--pretty") == 0) {
      opts.pretty = true;
    } else if (std::strcmp(argv[idx], "-o") == 0 && idx + 1 < argc) {
      opts.output = argv[++idx];
    } else if (std::strcmp(argv[idx], "--validate") == 0 && idx + 1 < argc) {
      opts.validate_path = argv[++idx];
    } else {
      std::fprintf(stderr, "Warning: ignoring unknown option %s\n", argv[idx]);
    }
  }
  return true;
}

/// @brief Build a GeneratorConfig from parsed CLI options.
/// @param opts Parsed command-line options.
/// @return GeneratorConfig ready for generation.
iped::GeneratorConfig buildGeneratorConfig(const CliOptions& opts) {
  iped::GeneratorConfig config;
  config.params = opts.params;
  if (config.params.tasks_per_respondent == 0) {
    config.params.tasks_per_respondent =
        iped::recommendTasksPerRespondent(config.params.num_elements);
  }
  config.element_names = opts.names;
  config.seed = opts.seed;
  config.randomize_seed = opts.randomize;
  config.exposure_tolerance = opts.tolerance;
  config.pool_cap_per_level = opts.pool_cap;
  config.strict = opts.strict;
  config.num_threads = opts.threads;
  config.batch_size = opts.batch;
  config.timeout_ms = opts.timeout_ms;
  config.verbose = opts.verbose;
  return config;
}

bool writeTextFile(const std::string& path, const std::string& text) {
  std::ofstream file(path);
  if (!file.is_open()) return false;
  file << text;
  return static_cast<bool>(file);
}

void printExposure(const iped::ExposureSummary& summary,
                   const std::vector<std::string>& element_ids) {
  std::printf("Exposure:   mean %.2f, max deviation %.2f (%.1f%%)\n", summary.mean,
              summary.max_abs_deviation, summary.relative_deviation * 100.0);
  for (size_t elem = 0; elem < summary.counts.size() && elem < element_ids.size(); ++elem) {
    std::printf("  %-10s %lld\n", element_ids[elem].c_str(),
                static_cast<long long>(summary.counts[elem]));
  }
  if (summary.duplicate_sequences > 0) {
    std::printf("Repeated respondent sequences: %zu\n", summary.duplicate_sequences);
  }
}

/// @brief --validate mode: parse a persisted matrix and check its invariants.
int runValidate(const CliOptions& opts) {
  std::ifstream file(opts.validate_path);
  if (!file.is_open()) {
    std::fprintf(stderr, "Error: cannot read %s\n", opts.validate_path.c_str());
    return 1;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  const std::string text = buffer.str();

  iped::StudyMatrix matrix;
  iped::ValidationReport report;
  std::string parse_error;
  if (!iped::validateMatrixJson(text.data(), text.size(), opts.tolerance, matrix, report,
                                &parse_error)) {
    std::fprintf(stderr, "Error: %s: %s\n", opts.validate_path.c_str(), parse_error.c_str());
    return 1;
  }

  iped::StudyDesignParams inferred = iped::inferStudyParams(matrix);
  std::printf("Matrix:     %s\n", opts.validate_path.c_str());
  std::printf("Elements:   %d\n", inferred.num_elements);
  std::printf("Respondents: %d\n", inferred.num_respondents);
  std::printf("Tasks:      %d per respondent\n", inferred.tasks_per_respondent);
  std::printf("Active:     %d-%d\n", inferred.min_active, inferred.max_active);

  if (!report.valid) {
    std::fprintf(stderr, "Invalid: %s: %s\n", iped::matrixViolationToString(report.violation),
                 report.message.c_str());
    return 1;
  }
  printExposure(iped::summarizeExposures(matrix), matrix.element_ids);
  std::printf("Valid\n");
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliOptions opts;
  if (!parseArgs(argc, argv, opts)) {
    return 0;
  }

  std::printf("iped_cli v%s\n", IPED_VERSION);
  if (!opts.validate_path.empty()) {
    return runValidate(opts);
  }

  iped::GeneratorConfig config = buildGeneratorConfig(opts);
  const iped::StudyDesignParams& params = config.params;

  std::printf("Elements:   %d\n", params.num_elements);
  std::printf("Tasks:      %d per respondent%s\n", params.tasks_per_respondent,
              opts.params.tasks_per_respondent == 0 ? " (recommended)" : "");
  std::printf("Respondents: %d\n", params.num_respondents);
  std::printf("Active:     %d-%d of %llu distinct tasks\n", params.min_active, params.max_active,
              static_cast<unsigned long long>(iped::visibleCapacity(
                  params.num_elements, params.min_active, params.max_active)));
  std::printf("Tolerance:  %.2f\n", config.exposure_tolerance);
  std::printf("Seed:       %u%s\n", config.seed,
              config.randomize_seed ? " (random)" : config.seed == 0 ? " (auto)" : "");
  std::printf("\n");

  iped::DesignResult result = iped::generate(config);

  if (!result.success) {
    std::fprintf(stderr, "Error: %s: %s\n", iped::designErrorToString(result.error),
                 result.error_message.c_str());
    return 1;
  }

  std::printf("Seed used:  %u\n", result.seed_used);
  std::printf("Attempts:   %d (pool %zu candidates, cap %d/level)\n", result.attempts,
              result.pool_size, result.pool_cap_used);
  printExposure(result.exposure, result.matrix.element_ids);

  if (!writeTextFile(opts.output, iped::matrixToJson(result.matrix, opts.pretty))) {
    std::fprintf(stderr, "Error: failed to write %s\n", opts.output.c_str());
    return 1;
  }
  std::printf("\nOutput:     %s\n", opts.output.c_str());

  if (opts.json_output) {
    std::string json_path = opts.output;
    auto dot_pos = json_path.rfind('.');
    if (dot_pos != std::string::npos) {
      json_path = json_path.substr(0, dot_pos) + "_summary.json";
    } else {
      json_path += "_summary.json";
    }
    if (writeTextFile(json_path, iped::buildSummaryJson(result, config))) {
      std::printf("Summary:    %s\n", json_path.c_str());
    } else {
      std::fprintf(stderr, "Warning: failed to write %s\n", json_path.c_str());
    }
  }

  return 0;
}
