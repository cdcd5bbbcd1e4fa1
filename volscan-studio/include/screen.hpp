#pragma once
#include "model.hpp"
#include "profile.hpp"
#include <cstddef>
#include <string>

// ---- Outputs ----
enum class Tier {
    None,
    Tentative,        // base conditions only
    Priority,         // close above the short moving average
    HighConviction,   // volume re-expanding off the contraction
};

const char* tier_label(Tier t);

struct Verdict {
    std::string code;
    std::string name = kUnknownName;
    double latest_close  = 0.0;
    double latest_volume = 0.0;
    size_t ref_index     = 0;    // index into the series of the reference volume day

    // support retest
    double support_price    = 0.0;   // rounded to 2 dp
    double proximity        = 0.0;
    double volume_ratio     = 0.0;
    double reference_volume = 0.0;
    int    score            = 0;
    Tier   tier             = Tier::None;

    // deep contraction
    double max_volume    = 0.0;
    double low_close     = 0.0;
    double high_close    = 0.0;
    double low_threshold = 0.0;
};

enum class OutcomeKind { Match, Excluded, Error };

enum class Reason {
    None,
    DataInsufficient,
    IneligibleCode,
    SpecialTreatment,
    OutsideSegment,
    PriceOutOfBand,
    NotAtSupport,
    VolumeNotShrunk,
    NotAtLow,
    BelowMinScore,
    MalformedRecord,
};

const char* reason_label(Reason r);

// Exactly one per instrument: a verdict, a rule that excluded it, or a failure
struct ScreenOutcome {
    OutcomeKind kind = OutcomeKind::Excluded;
    Reason      reason = Reason::None;
    std::string detail;
    Verdict     verdict;

    bool matched() const { return kind == OutcomeKind::Match; }

    static ScreenOutcome match(Verdict v);
    static ScreenOutcome excluded(Reason r, std::string detail = {});
    static ScreenOutcome error(std::string detail);
};

// Trailing-window extremes; indices are absolute positions in the series
struct Extrema {
    size_t ref_index   = 0;     // first bar with the window's maximum volume
    double ref_volume  = 0.0;
    double ref_open    = 0.0;
    double floor_close   = 0.0;
    double ceiling_close = 0.0;
};

// Length and field checks. Returns Reason::None when the series is usable.
Reason validate_series(const BarSeries& s, const Profile& p, std::string* detail = nullptr);

// Code and name rules only (no price); shared by the early file skip
Reason check_identity(const InstrumentIdentity& id, const Profile& p);

Reason eligibility_reason(const InstrumentIdentity& id, double latest_close, const Profile& p);
bool   is_eligible(const InstrumentIdentity& id, double latest_close, const Profile& p);

// Throws std::invalid_argument when a window is empty or longer than the series
Extrema locate_extrema(const BarSeries& s, int volume_window, int price_window);
Extrema locate_extrema(const BarSeries& s, const Profile& p);

ScreenOutcome evaluate_pattern(const BarSeries& s, const Extrema& ex,
                               const InstrumentIdentity& id, const Profile& p);

// Validator -> eligibility -> extrema -> evaluator. Never throws.
ScreenOutcome screen_instrument(const InstrumentIdentity& id, const BarSeries& s, const Profile& p);

double round2(double v);
