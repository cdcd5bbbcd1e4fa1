#pragma once
#include "screen.hpp"
#include <ctime>
#include <string>
#include <vector>

// Column headers in output order for the profile's result file
std::vector<std::string> result_columns(const Profile& p);

// <out_root>/<strftime(p.output_subdir)>/<p.output_prefix>_YYYYMMDD_HHMMSS.csv (local time)
std::string default_output_path(const Profile& p, const std::string& out_root, std::time_t now);

// Creates parent directories. UTF-8 with BOM so spreadsheet tools pick up the names.
bool write_results_csv(const std::string& path, const std::vector<Verdict>& rows,
                       const Profile& p, std::string& err);

// Aligned console table of the ranked rows
std::string format_results_table(const std::vector<Verdict>& rows, const Profile& p);
