#pragma once
#include "model.hpp"
#include <string>
#include <vector>

// Load one instrument's daily bars. Header names are matched in Chinese
// (日期,开盘,收盘,成交量,最高,最低) or English (date,open,close,volume,high,low),
// in any column order. Rows are returned ascending by date.
// Any missing column or bad numeric cell sets err and returns no bars.
BarSeries load_csv(const std::string& path,
                   std::string& warn,
                   std::string& err);

// Load a "code,name" table; codes are zero-padded to 6 digits.
NameTable load_name_table(const std::string& path,
                          std::string& warn,
                          std::string& err);

// "stock_data/600000.csv" -> "600000", "1.csv" -> "000001"
std::string code_from_path(const std::string& path);

std::string zero_pad_code(std::string code);

InstrumentIdentity resolve_identity(const std::string& code, const NameTable& names);

// Parse "YYYY-MM-DD", "YYYY/MM/DD" or "YYYYMMDD" -> epoch ms at 00:00:00 UTC, -1 on error
int64_t parse_date_ms(const std::string& s);
