#include "report.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

std::vector<std::string> result_columns(const Profile& p){
    if (p.strategy == Strategy::SupportRetest)
        return {"code", "latest_close", "support_price", "signal_score", "operation_advice", "name"};
    return {"Code", "Name", "Latest_Close", "Latest_Volume",
            "Max_Volume_" + std::to_string(p.volume_period) + "d",
            "Low_Price_" + std::to_string(p.price_low_period) + "d_Threshold"};
}

static std::string format_time(const std::string& pattern, std::time_t now){
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &now);
#else
    localtime_r(&now, &tm);
#endif
    std::ostringstream os;
    os << std::put_time(&tm, pattern.c_str());
    return os.str();
}

std::string default_output_path(const Profile& p, const std::string& out_root, std::time_t now){
    fs::path dir = fs::path(out_root) / format_time(p.output_subdir, now);
    const std::string file = p.output_prefix + "_" + format_time("%Y%m%d_%H%M%S", now) + ".csv";
    return (dir / file).string();
}

// Whole values (volumes) print as integers; other values use the shortest
// precision that reads back to the same double.
static std::string num(double v){
    std::ostringstream os;
    if (std::isfinite(v) && v == std::floor(v) && std::fabs(v) < 1e18){
        os << std::fixed << std::setprecision(0) << v;
        return os.str();
    }
    for (int prec = 15; prec < std::numeric_limits<double>::max_digits10; ++prec){
        os.str("");
        os << std::setprecision(prec) << v;
        if (std::strtod(os.str().c_str(), nullptr) == v) return os.str();
    }
    os.str("");
    os << std::setprecision(std::numeric_limits<double>::max_digits10) << v;
    return os.str();
}

static std::string csv_cell(const std::string& s){
    if (s.find_first_of(",\"\n") == std::string::npos) return s;
    std::string q = "\"";
    for (char c : s){ if (c == '"') q += '"'; q += c; }
    return q + "\"";
}

static std::vector<std::string> row_cells(const Verdict& v, const Profile& p){
    if (p.strategy == Strategy::SupportRetest)
        return {v.code, num(v.latest_close), num(v.support_price), std::to_string(v.score),
                tier_label(v.tier), v.name};
    return {v.code, v.name, num(v.latest_close), num(v.latest_volume),
            num(v.max_volume), num(v.low_threshold)};
}

bool write_results_csv(const std::string& path, const std::vector<Verdict>& rows,
                       const Profile& p, std::string& err){
    err.clear();
    std::error_code ec;
    const fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);
    if (ec){ err = "Cannot create " + parent.string() + ": " + ec.message(); return false; }

    std::ofstream f(path, std::ios::binary);
    if (!f){ err = "Cannot write " + path; return false; }

    f << "\xEF\xBB\xBF";
    const auto cols = result_columns(p);
    for (size_t i = 0; i < cols.size(); ++i) f << (i ? "," : "") << cols[i];
    f << "\n";
    for (const auto& v : rows){
        const auto cells = row_cells(v, p);
        for (size_t i = 0; i < cells.size(); ++i) f << (i ? "," : "") << csv_cell(cells[i]);
        f << "\n";
    }
    f.flush();
    if (!f){ err = "Write failed for " + path; return false; }
    return true;
}

std::string format_results_table(const std::vector<Verdict>& rows, const Profile& p){
    const auto cols = result_columns(p);
    std::vector<std::vector<std::string>> table;
    table.push_back(cols);
    for (const auto& v : rows) table.push_back(row_cells(v, p));

    // byte widths; CJK names will not line up perfectly
    std::vector<size_t> width(cols.size(), 0);
    for (const auto& r : table)
        for (size_t i = 0; i < r.size(); ++i) width[i] = std::max(width[i], r[i].size());

    std::ostringstream os;
    for (const auto& r : table){
        for (size_t i = 0; i < r.size(); ++i){
            os << std::left << std::setw((int)width[i] + 2) << r[i];
        }
        os << "\n";
    }
    return os.str();
}
