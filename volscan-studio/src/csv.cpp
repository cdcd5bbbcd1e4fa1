#include "csv.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <filesystem>
#include <iterator>
#include <stdexcept>

#if defined(_WIN32)
  static inline time_t timegm_portable(std::tm* t){ return _mkgmtime(t); }
#else
  static inline time_t timegm_portable(std::tm* t){ return timegm(t); }
#endif

static inline void trim_cr(std::string& s){
  while (!s.empty() && (s.back() == '\r' || s.back()=='\n')) s.pop_back();
}

static inline void strip_bom(std::string& s){
  if (s.size() >= 3 && (unsigned char)s[0]==0xEF && (unsigned char)s[1]==0xBB && (unsigned char)s[2]==0xBF)
    s.erase(0, 3);
}

static inline std::string strip_chars(std::string s, const char* chars){
  for (const char* c = chars; *c; ++c){
    s.erase(std::remove(s.begin(), s.end(), *c), s.end());
  }
  return s;
}

static inline std::string trim_quoted(const std::string& s){
  const char* ws = " \t\"";
  const size_t start = s.find_first_not_of(ws);
  if (start == std::string::npos) return {};
  return s.substr(start, s.find_last_not_of(ws) - start + 1);
}

static inline std::vector<std::string> split_fields(const std::string& line){
  std::vector<std::string> out;
  std::istringstream ss(line);
  std::string tok;
  while (std::getline(ss, tok, ',')) out.push_back(tok);
  // "a,b," has an empty trailing field
  if (!line.empty() && line.back() == ',') out.emplace_back();
  return out;
}

// Normalize a header cell for detection (remove spaces/quotes, lower-case ASCII)
static inline std::string norm(std::string s){
  s = strip_chars(s, " \t\"");
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
  return s;
}

static inline double parse_number(const std::string& cell){
  std::string s = strip_chars(cell, " \t\"");
  if (s.empty()) throw std::invalid_argument("empty cell");
  size_t used = 0;
  double v = std::stod(s, &used);
  if (used != s.size()) throw std::invalid_argument("trailing characters in '" + s + "'");
  return v;
}

int64_t parse_date_ms(const std::string& raw){
  std::string s = strip_chars(raw, " \t\"");
  int y=0,m=0,d=0;
  if (s.size() == 8 && std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c); })){
    y = std::stoi(s.substr(0,4)); m = std::stoi(s.substr(4,2)); d = std::stoi(s.substr(6,2));
  } else {
    char c1='-', c2='-';
    std::istringstream is(s);
    is >> y >> c1 >> m >> c2 >> d;
    if (!is || c1 != c2 || (c1!='-' && c1!='/')) return -1;
  }
  if (m < 1 || m > 12 || d < 1 || d > 31) return -1;

  std::tm tm{}; tm.tm_year = y - 1900; tm.tm_mon = m - 1; tm.tm_mday = d;
  time_t t = timegm_portable(&tm);
  if (t < 0) return -1;
  return static_cast<int64_t>(t) * 1000;
}

std::string zero_pad_code(std::string code){
  code = strip_chars(code, " \t\"");
  if (code.size() < 6) code.insert(0, 6 - code.size(), '0');
  return code;
}

std::string code_from_path(const std::string& path){
  std::string base = std::filesystem::path(path).filename().string();
  return zero_pad_code(base.substr(0, base.find('.')));
}

InstrumentIdentity resolve_identity(const std::string& code, const NameTable& names){
  InstrumentIdentity id;
  id.code = zero_pad_code(code);
  auto it = names.find(id.code);
  if (it != names.end() && !it->second.empty()) id.name = it->second;
  return id;
}

namespace {
struct ColumnMap {
  int date=-1, open=-1, close=-1, volume=-1, high=-1, low=-1;
};

ColumnMap detect_columns(const std::vector<std::string>& header){
  ColumnMap c;
  for (int i = 0; i < (int)header.size(); ++i){
    const std::string h = norm(header[i]);
    if      (h == "日期" || h == "date")   c.date = i;
    else if (h == "开盘" || h == "open")   c.open = i;
    else if (h == "收盘" || h == "close")  c.close = i;
    else if (h == "成交量" || h == "volume") c.volume = i;
    else if (h == "最高" || h == "high")   c.high = i;
    else if (h == "最低" || h == "low")    c.low = i;
  }
  return c;
}
} // namespace

BarSeries load_csv(const std::string& path, std::string& warn, std::string& err){
  BarSeries out;
  warn.clear(); err.clear();

  std::ifstream f(path);
  if(!f){ err = "Cannot open " + path; return out; }

  std::string header;
  if (!std::getline(f, header)){ err = "Empty file " + path; return out; }
  trim_cr(header);
  strip_bom(header);

  const ColumnMap cols = detect_columns(split_fields(header));
  if (cols.date < 0)   { err = "Missing column 日期/date in " + path; return out; }
  if (cols.open < 0)   { err = "Missing column 开盘/open in " + path; return out; }
  if (cols.close < 0)  { err = "Missing column 收盘/close in " + path; return out; }
  if (cols.volume < 0) { err = "Missing column 成交量/volume in " + path; return out; }
  const int needed = std::max({cols.date, cols.open, cols.close, cols.volume, cols.high, cols.low}) + 1;

  std::string line; size_t ln = 1; // already read header
  BarSeries tmp;
  while (std::getline(f, line)){
    ++ln; trim_cr(line);
    if(line.empty()) continue;

    auto cells = split_fields(line);
    if ((int)cells.size() < needed){
      err = "Missing field at line " + std::to_string(ln);
      return out;
    }

    Bar b{};
    b.ts_ms = parse_date_ms(cells[cols.date]);
    if (b.ts_ms < 0){ err = "Bad date at line " + std::to_string(ln); return out; }

    try {
      b.open   = parse_number(cells[cols.open]);
      b.close  = parse_number(cells[cols.close]);
      b.volume = parse_number(cells[cols.volume]);
      if (cols.high >= 0) b.high = parse_number(cells[cols.high]);
      if (cols.low >= 0)  b.low  = parse_number(cells[cols.low]);
    } catch (const std::exception& e){
      err = "Numeric parse error at line " + std::to_string(ln) + ": " + e.what();
      return out;
    }
    tmp.push_back(b);
  }

  if (tmp.empty()) return out;

  // Vendors disagree on row order; the core needs ascending dates.
  std::stable_sort(tmp.begin(), tmp.end(), [](const Bar& a, const Bar& b){ return a.ts_ms < b.ts_ms; });
  auto last = std::unique(tmp.begin(), tmp.end(), [](const Bar& a, const Bar& b){ return a.ts_ms == b.ts_ms; });
  if (last != tmp.end()){
    warn = "Dropped " + std::to_string(std::distance(last, tmp.end())) + " duplicate date(s) in " + path;
    tmp.erase(last, tmp.end());
  }
  out.swap(tmp);
  return out;
}

NameTable load_name_table(const std::string& path, std::string& warn, std::string& err){
  NameTable names;
  warn.clear(); err.clear();

  std::ifstream f(path);
  if(!f){ err = "Cannot open " + path; return names; }

  std::string header;
  if (!std::getline(f, header)){ err = "Empty file " + path; return names; }

  std::string line;
  size_t skipped = 0;
  while (std::getline(f, line)){
    trim_cr(line);
    if (line.empty()) continue;
    auto cells = split_fields(line);
    if (cells.size() < 2 || strip_chars(cells[0], " \t\"").empty()){ ++skipped; continue; }
    names[zero_pad_code(cells[0])] = trim_quoted(cells[1]);
  }
  if (skipped) warn = "Skipped " + std::to_string(skipped) + " malformed row(s) in " + path;
  return names;
}
