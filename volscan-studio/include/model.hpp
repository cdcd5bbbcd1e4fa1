#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

// A single daily bar
struct Bar {
    int64_t ts_ms{};      // trading date at 00:00 UTC, in milliseconds
    double open{}, high{}, low{}, close{}, volume{};
};

// Ascending by date, one bar per day
using BarSeries = std::vector<Bar>;

inline constexpr const char* kUnknownName = "unknown";

struct InstrumentIdentity {
    std::string code;                 // zero-padded to 6 digits
    std::string name = kUnknownName;
};

// code -> display name, loaded once and shared read-only by all workers
using NameTable = std::unordered_map<std::string, std::string>;
