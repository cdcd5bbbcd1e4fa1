#include "screen.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <utility>

const char* tier_label(Tier t){
    switch (t){
        case Tier::Tentative:      return "tentative light entry";
        case Tier::Priority:       return "priority / half position";
        case Tier::HighConviction: return "high-conviction / core position";
        case Tier::None:           break;
    }
    return "watch";
}

const char* reason_label(Reason r){
    switch (r){
        case Reason::None:             return "none";
        case Reason::DataInsufficient: return "data insufficient";
        case Reason::IneligibleCode:   return "excluded board";
        case Reason::SpecialTreatment: return "special treatment";
        case Reason::OutsideSegment:   return "outside segment";
        case Reason::PriceOutOfBand:   return "price out of band";
        case Reason::NotAtSupport:     return "not at support";
        case Reason::VolumeNotShrunk:  return "volume not shrunk";
        case Reason::NotAtLow:         return "not at low";
        case Reason::BelowMinScore:    return "below min score";
        case Reason::MalformedRecord:  return "malformed record";
    }
    return "unknown";
}

ScreenOutcome ScreenOutcome::match(Verdict v){
    ScreenOutcome o;
    o.kind = OutcomeKind::Match;
    o.verdict = std::move(v);
    return o;
}

ScreenOutcome ScreenOutcome::excluded(Reason r, std::string detail){
    ScreenOutcome o;
    o.kind = OutcomeKind::Excluded;
    o.reason = r;
    o.detail = std::move(detail);
    return o;
}

ScreenOutcome ScreenOutcome::error(std::string detail){
    ScreenOutcome o;
    o.kind = OutcomeKind::Error;
    o.reason = Reason::MalformedRecord;
    o.detail = std::move(detail);
    return o;
}

double round2(double v){ return std::round(v * 100.0) / 100.0; }

static bool starts_with(const std::string& s, const std::string& prefix){
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static bool starts_with_any(const std::string& s, const std::vector<std::string>& prefixes){
    return std::any_of(prefixes.begin(), prefixes.end(),
                       [&](const std::string& p){ return starts_with(s, p); });
}

// ---- Validator ----
Reason validate_series(const BarSeries& s, const Profile& p, std::string* detail){
    const int need = required_bars(p);
    if ((int)s.size() < need){
        if (detail) *detail = std::to_string(s.size()) + " bars, need " + std::to_string(need);
        return Reason::DataInsufficient;
    }
    for (size_t i = 0; i < s.size(); ++i){
        const Bar& b = s[i];
        const bool finite = std::isfinite(b.open) && std::isfinite(b.close) && std::isfinite(b.volume);
        if (!finite || b.open < 0 || b.close < 0 || b.volume < 0){
            if (detail) *detail = "invalid field in bar " + std::to_string(i);
            return Reason::MalformedRecord;
        }
        if (i > 0 && s[i - 1].ts_ms >= b.ts_ms){
            if (detail) *detail = "dates not ascending at bar " + std::to_string(i);
            return Reason::MalformedRecord;
        }
    }
    return Reason::None;
}

// ---- Eligibility ----
Reason check_identity(const InstrumentIdentity& id, const Profile& p){
    if (starts_with_any(id.code, p.excluded_prefixes)) return Reason::IneligibleCode;
    for (const auto& marker : p.flag_markers){
        if (!marker.empty() && id.name.find(marker) != std::string::npos) return Reason::SpecialTreatment;
    }
    if (!p.allowed_prefixes.empty() && !starts_with_any(id.code, p.allowed_prefixes))
        return Reason::OutsideSegment;
    return Reason::None;
}

Reason eligibility_reason(const InstrumentIdentity& id, double latest_close, const Profile& p){
    const Reason r = check_identity(id, p);
    if (r != Reason::None) return r;
    // NaN fails both comparisons
    if (!(latest_close >= p.price_min && latest_close <= p.price_max)) return Reason::PriceOutOfBand;
    return Reason::None;
}

bool is_eligible(const InstrumentIdentity& id, double latest_close, const Profile& p){
    try {
        return eligibility_reason(id, latest_close, p) == Reason::None;
    } catch (const std::exception&){
        return false;
    }
}

// ---- Extremum locator ----
Extrema locate_extrema(const BarSeries& s, int volume_window, int price_window){
    if (volume_window <= 0 || price_window <= 0 ||
        (size_t)volume_window > s.size() || (size_t)price_window > s.size())
        throw std::invalid_argument("window longer than series");

    Extrema ex;
    const size_t vstart = s.size() - volume_window;
    auto vmax = std::max_element(s.begin() + vstart, s.end(),
                                 [](const Bar& a, const Bar& b){ return a.volume < b.volume; });
    ex.ref_index  = (size_t)std::distance(s.begin(), vmax);
    ex.ref_volume = vmax->volume;
    ex.ref_open   = vmax->open;

    const size_t pstart = s.size() - price_window;
    auto mm = std::minmax_element(s.begin() + pstart, s.end(),
                                  [](const Bar& a, const Bar& b){ return a.close < b.close; });
    ex.floor_close   = mm.first->close;
    ex.ceiling_close = mm.second->close;
    return ex;
}

Extrema locate_extrema(const BarSeries& s, const Profile& p){
    if (p.strategy == Strategy::SupportRetest)
        return locate_extrema(s, p.support_window, p.support_window);
    return locate_extrema(s, p.volume_period, p.price_low_period);
}

// ---- Pattern evaluator ----
// NaN when fewer than `window` bars exist, so no comparison against it passes.
static double mean_last_close(const BarSeries& s, int window){
    if (window <= 0 || s.size() < (size_t)window) return std::numeric_limits<double>::quiet_NaN();
    double sum = 0.0;
    for (size_t i = s.size() - window; i < s.size(); ++i) sum += s[i].close;
    return sum / window;
}

static ScreenOutcome evaluate_support_retest(const BarSeries& s, const Extrema& ex,
                                             const InstrumentIdentity& id, const Profile& p){
    const Bar& last = s.back();
    const Bar& prev = s[s.size() - 2];

    const double support = ex.ref_open;
    if (!(support > 0.0)) return ScreenOutcome::error("non-positive support price");
    if (!(ex.ref_volume > 0.0)) return ScreenOutcome::error("zero reference volume");

    const double proximity = std::fabs(last.close - support) / support;
    const double vol_ratio = last.volume / ex.ref_volume;
    if (proximity > p.proximity_max) return ScreenOutcome::excluded(Reason::NotAtSupport);
    if (!(vol_ratio < p.volume_ratio_max)) return ScreenOutcome::excluded(Reason::VolumeNotShrunk);

    int  score = p.base_score;
    Tier tier  = Tier::Tentative;
    if (last.close > mean_last_close(s, p.ma_window)){
        score += p.ma_bonus;
        tier = Tier::Priority;
    }
    if (last.volume > prev.volume){
        score += p.reexpansion_bonus;
        tier = Tier::HighConviction;
    }
    if (score < p.min_score) return ScreenOutcome::excluded(Reason::BelowMinScore);

    Verdict v;
    v.code = id.code;
    v.name = id.name;
    v.latest_close     = last.close;
    v.latest_volume    = last.volume;
    v.ref_index        = ex.ref_index;
    v.support_price    = round2(support);
    v.proximity        = proximity;
    v.volume_ratio     = vol_ratio;
    v.reference_volume = ex.ref_volume;
    v.score            = score;
    v.tier             = tier;
    return ScreenOutcome::match(std::move(v));
}

static ScreenOutcome evaluate_deep_contraction(const BarSeries& s, const Extrema& ex,
                                               const InstrumentIdentity& id, const Profile& p){
    const Bar& last = s.back();

    if (last.volume > ex.ref_volume * p.volume_shrink_ratio)
        return ScreenOutcome::excluded(Reason::VolumeNotShrunk);

    const double range = ex.ceiling_close - ex.floor_close;
    const double low_threshold = ex.floor_close + p.price_low_range_ratio * range;
    if (last.close > low_threshold) return ScreenOutcome::excluded(Reason::NotAtLow);

    Verdict v;
    v.code = id.code;
    v.name = id.name;
    v.latest_close  = last.close;
    v.latest_volume = last.volume;
    v.ref_index     = ex.ref_index;
    v.max_volume    = ex.ref_volume;
    v.volume_ratio  = ex.ref_volume > 0.0 ? last.volume / ex.ref_volume : 0.0;
    v.low_close     = ex.floor_close;
    v.high_close    = ex.ceiling_close;
    v.low_threshold = low_threshold;
    return ScreenOutcome::match(std::move(v));
}

ScreenOutcome evaluate_pattern(const BarSeries& s, const Extrema& ex,
                               const InstrumentIdentity& id, const Profile& p){
    if (s.size() < 2) return ScreenOutcome::excluded(Reason::DataInsufficient);
    switch (p.strategy){
        case Strategy::SupportRetest:   return evaluate_support_retest(s, ex, id, p);
        case Strategy::DeepContraction: return evaluate_deep_contraction(s, ex, id, p);
    }
    return ScreenOutcome::error("unknown strategy");
}

ScreenOutcome screen_instrument(const InstrumentIdentity& id, const BarSeries& s, const Profile& p){
    try {
        std::string detail;
        const Reason invalid = validate_series(s, p, &detail);
        if (invalid == Reason::MalformedRecord) return ScreenOutcome::error(detail);
        if (invalid != Reason::None) return ScreenOutcome::excluded(invalid, detail);

        const Reason ineligible = eligibility_reason(id, s.back().close, p);
        if (ineligible != Reason::None) return ScreenOutcome::excluded(ineligible);

        const Extrema ex = locate_extrema(s, p);
        return evaluate_pattern(s, ex, id, p);
    } catch (const std::exception& e){
        return ScreenOutcome::error(e.what());
    }
}
