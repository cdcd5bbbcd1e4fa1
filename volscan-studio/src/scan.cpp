#include "scan.hpp"
#include "csv.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

int default_worker_count(){
    const unsigned hc = std::thread::hardware_concurrency();
    return hc ? (int)hc * 2 : 4;
}

size_t effective_worker_count(int requested, size_t tasks){
    const int clamped = std::clamp(requested, 1, kMaxWorkers);
    return std::min<size_t>((size_t)clamped, tasks);
}

std::vector<std::string> list_csv_files(const std::string& dir, std::string& err){
    std::vector<std::string> out;
    err.clear();
    std::error_code ec;
    if (!fs::is_directory(dir, ec)){ err = "Directory '" + dir + "' not found"; return out; }

    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)){
        if (it->is_regular_file(ec) && it->path().extension() == ".csv")
            out.push_back(it->path().string());
    }
    if (ec){ err = "Cannot list '" + dir + "': " + ec.message(); out.clear(); return out; }
    std::sort(out.begin(), out.end());
    return out;
}

ScreenOutcome scan_file(const std::string& path, const Profile& p, const NameTable& names,
                        InstrumentIdentity* identity){
    try {
        const InstrumentIdentity id = resolve_identity(code_from_path(path), names);
        if (identity) *identity = id;

        // Skip the read entirely when the code or name already rules it out
        const Reason early = check_identity(id, p);
        if (early != Reason::None) return ScreenOutcome::excluded(early);

        std::string warn, err;
        BarSeries bars = load_csv(path, warn, err);
        if (!warn.empty()) spdlog::debug("{}: {}", id.code, warn);
        if (!err.empty()) return ScreenOutcome::error(err);
        return screen_instrument(id, bars, p);
    } catch (const std::exception& e){
        return ScreenOutcome::error(path + ": " + e.what());
    }
}

std::vector<ScanEntry> scan_universe(const std::vector<std::string>& paths,
                                     const Profile& p, const NameTable& names, int workers){
    std::vector<ScanEntry> entries(paths.size());
    if (paths.empty()) return entries;

    // Each task owns entries[i]; the counter is the only shared write.
    std::atomic<size_t> next{0};
    auto work = [&](){
        for (size_t i = next.fetch_add(1); i < paths.size(); i = next.fetch_add(1)){
            ScanEntry& e = entries[i];
            e.path = paths[i];
            e.outcome = scan_file(paths[i], p, names, &e.identity);
        }
    };

    const size_t n = effective_worker_count(workers, paths.size());
    std::vector<std::thread> pool;
    pool.reserve(n);
    try {
        for (size_t t = 0; t < n; ++t) pool.emplace_back(work);
    } catch (const std::system_error& e){
        // Threads already started keep draining; the caller takes the rest.
        spdlog::warn("started {} of {} worker threads ({}), continuing", pool.size(), n, e.what());
        work();
    }
    for (auto& th : pool) th.join();
    return entries;
}

std::vector<Verdict> rank_verdicts(std::vector<Verdict> verdicts, const Profile& p){
    if (p.strategy == Strategy::SupportRetest){
        std::stable_sort(verdicts.begin(), verdicts.end(),
                         [](const Verdict& a, const Verdict& b){ return a.score > b.score; });
    } else {
        std::stable_sort(verdicts.begin(), verdicts.end(),
                         [](const Verdict& a, const Verdict& b){ return a.code < b.code; });
    }
    if (p.top_n > 0 && verdicts.size() > (size_t)p.top_n) verdicts.resize(p.top_n);
    return verdicts;
}

ScanReport run_scan(const std::vector<std::string>& paths,
                    const Profile& p, const NameTable& names, int workers){
    ScanReport r;
    r.entries = scan_universe(paths, p, names, workers);

    std::vector<Verdict> verdicts;
    for (const auto& e : r.entries){
        switch (e.outcome.kind){
            case OutcomeKind::Match:
                ++r.matched;
                verdicts.push_back(e.outcome.verdict);
                break;
            case OutcomeKind::Excluded:
                ++r.excluded;
                spdlog::debug("{} excluded: {} {}", e.identity.code, reason_label(e.outcome.reason), e.outcome.detail);
                break;
            case OutcomeKind::Error:
                ++r.errors;
                spdlog::debug("{} failed: {}", e.path, e.outcome.detail);
                break;
        }
    }
    r.ranked = rank_verdicts(std::move(verdicts), p);
    return r;
}
