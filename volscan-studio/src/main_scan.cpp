#include <spdlog/spdlog.h>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>
#include "csv.hpp"
#include "profile.hpp"
#include "report.hpp"
#include "scan.hpp"

static void usage(const char* argv0){
  std::printf(
    "usage: %s [--profile support-retest|deep-contraction] [--data DIR] [--names FILE]\n"
    "          [--config FILE] [--out DIR] [--workers N] [--verbose]\n", argv0);
}

int main(int argc, char** argv){
  std::string profile_name = "support-retest";
  std::string data_dir     = "stock_data";
  std::string names_file   = "stock_names.csv";
  std::string config_file;
  std::string out_root     = ".";
  int workers = default_worker_count();
  bool verbose = false;

  for (int i = 1; i < argc; ++i){
    const std::string a = argv[i];
    auto value = [&](std::string& dst){
      if (i + 1 >= argc){ std::fprintf(stderr, "missing value for %s\n", a.c_str()); return false; }
      dst = argv[++i]; return true;
    };
    std::string tmp;
    if      (a == "--profile"){ if (!value(profile_name)) return 2; }
    else if (a == "--data")   { if (!value(data_dir)) return 2; }
    else if (a == "--names")  { if (!value(names_file)) return 2; }
    else if (a == "--config") { if (!value(config_file)) return 2; }
    else if (a == "--out")    { if (!value(out_root)) return 2; }
    else if (a == "--workers"){
      if (!value(tmp)) return 2;
      try { workers = std::stoi(tmp); }
      catch (const std::exception&){ std::fprintf(stderr, "bad --workers value '%s'\n", tmp.c_str()); return 2; }
    }
    else if (a == "--verbose" || a == "-v") verbose = true;
    else if (a == "--help" || a == "-h"){ usage(argv[0]); return 0; }
    else { std::fprintf(stderr, "unknown argument '%s'\n", a.c_str()); usage(argv[0]); return 2; }
  }

  spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
  if (verbose) spdlog::set_level(spdlog::level::debug);

  Profile profile;
  if (!profile_from_name(profile_name, profile)){
    spdlog::error("Unknown profile '{}'", profile_name);
    return 2;
  }
  if (!config_file.empty()){
    std::string err;
    if (!load_profile_overrides(config_file, profile, err)){
      spdlog::error("{}", err);
      return 2;
    }
  }
  spdlog::info("Starting scan ({})", describe_profile(profile));

  std::string err, warn;
  const auto files = list_csv_files(data_dir, err);
  if (!err.empty()){ spdlog::error("{}", err); return 1; }
  if (files.empty()){ spdlog::error("No CSV files found in {}", data_dir); return 1; }

  NameTable names = load_name_table(names_file, warn, err);
  if (!warn.empty()) spdlog::warn("{}", warn);
  if (!err.empty()){
    if (profile.names_required){ spdlog::error("{}", err); return 1; }
    spdlog::warn("{}; names default to '{}'", err, kUnknownName);
  } else {
    spdlog::info("Loaded {} instrument names", names.size());
  }

  spdlog::info("Scanning {} files on {} worker threads", files.size(),
               effective_worker_count(workers, files.size()));
  const auto t0 = std::chrono::steady_clock::now();
  const ScanReport report = run_scan(files, profile, names, workers);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
  spdlog::info("Done in {} ms: {} matched, {} excluded, {} failed",
               ms, report.matched, report.excluded, report.errors);

  if (report.ranked.empty()){
    spdlog::info("No instruments matched the screen.");
    if (!profile.write_empty_result) return 0;
  }

  const std::string path = default_output_path(profile, out_root, std::time(nullptr));
  if (!write_results_csv(path, report.ranked, profile, err)){
    spdlog::error("{}", err);
    return 1;
  }

  if (!report.ranked.empty()){
    std::fputs(format_results_table(report.ranked, profile).c_str(), stdout);
    spdlog::info("Selected {} instruments.", report.ranked.size());
  }
  spdlog::info("Results saved to {}", path);
  return 0;
}
