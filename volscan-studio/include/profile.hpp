#pragma once
#include <string>
#include <vector>

// Which evaluation/scoring rule a profile runs
enum class Strategy {
    SupportRetest,     // volume-day open retest, tiered score
    DeepContraction,   // extreme shrink at the 40-day low, pass/fail
};

// ---- Parameters ----
struct Profile {
    std::string name;
    Strategy    strategy = Strategy::SupportRetest;

    // Validator
    int min_bars = 30;

    // Eligibility
    std::vector<std::string> excluded_prefixes{"30", "688"};
    std::vector<std::string> allowed_prefixes;             // empty = no allow-list
    std::vector<std::string> flag_markers{"ST", "PT", "*"};
    double price_min = 5.0;
    double price_max = 20.0;

    // Support retest
    int    support_window    = 20;    // bars searched for the reference volume day
    double proximity_max     = 0.03;  // |close - support| / support
    double volume_ratio_max  = 0.5;   // latest / reference volume, strict
    int    ma_window         = 5;
    int    base_score        = 70;
    int    ma_bonus          = 20;
    int    reexpansion_bonus = 10;
    int    min_score         = 70;

    // Deep contraction
    int    volume_period         = 120;
    int    price_low_period      = 40;
    double volume_shrink_ratio   = 0.03;
    double price_low_range_ratio = 0.03;

    // Ranking
    int top_n = 5;                    // <= 0 keeps every verdict

    // Persistence
    std::string output_subdir  = "%Y-%m";          // strftime pattern under the output root
    std::string output_prefix  = "dragon_back_strategy";
    bool names_required        = true;   // no name table -> batch aborts
    bool write_empty_result    = false;  // write header-only file when nothing matched
};

Profile support_retest_profile();
Profile deep_contraction_profile();

// "support-retest" / "deep-contraction" (also "a" / "b")
bool profile_from_name(const std::string& name, Profile& out);

// Apply a YAML override file on top of p. Unknown keys and type errors fail.
bool load_profile_overrides(const std::string& path, Profile& p, std::string& err);

// Bars the profile needs before anything is evaluated
int required_bars(const Profile& p);

// One-line threshold summary for the run banner
std::string describe_profile(const Profile& p);
