#pragma once
#include "screen.hpp"
#include <string>
#include <vector>

struct ScanEntry {
    std::string        path;
    InstrumentIdentity identity;
    ScreenOutcome      outcome;
};

struct ScanReport {
    std::vector<ScanEntry> entries;   // one per input file, in input order
    std::vector<Verdict>   ranked;    // after rank_verdicts
    size_t matched  = 0;
    size_t excluded = 0;
    size_t errors   = 0;
};

// Sorted *.csv paths directly under dir
std::vector<std::string> list_csv_files(const std::string& dir, std::string& err);

// Identity rules are checked before the file is read. Never throws.
ScreenOutcome scan_file(const std::string& path, const Profile& p, const NameTable& names,
                        InstrumentIdentity* identity = nullptr);

// One task per file on `workers` threads; returns after every task is done
std::vector<ScanEntry> scan_universe(const std::vector<std::string>& paths,
                                     const Profile& p, const NameTable& names, int workers);

// Support retest: score desc (stable), truncated to top_n. Deep contraction: by code.
std::vector<Verdict> rank_verdicts(std::vector<Verdict> verdicts, const Profile& p);

ScanReport run_scan(const std::vector<std::string>& paths,
                    const Profile& p, const NameTable& names, int workers);

int default_worker_count();

// Worker threads actually started for `tasks` files: at least 1, at most
// min(tasks, kMaxWorkers)
constexpr int kMaxWorkers = 256;
size_t effective_worker_count(int requested, size_t tasks);
