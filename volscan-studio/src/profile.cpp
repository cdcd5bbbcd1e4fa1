#include "profile.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <functional>
#include <map>
#include <sstream>

Profile support_retest_profile(){
    Profile p;
    p.name = "support-retest";
    p.strategy = Strategy::SupportRetest;
    return p;
}

Profile deep_contraction_profile(){
    Profile p;
    p.name = "deep-contraction";
    p.strategy = Strategy::DeepContraction;
    p.min_bars = 120;
    p.excluded_prefixes = {"30"};
    p.allowed_prefixes  = {"60", "00"};
    p.price_min = 5.0;
    p.price_max = 15.0;
    p.top_n = 0;
    p.output_subdir = "output/%Y/%m";
    p.output_prefix = "volume_bottom_scan_results";
    p.names_required = false;
    p.write_empty_result = true;
    return p;
}

bool profile_from_name(const std::string& name, Profile& out){
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    if (n == "support-retest" || n == "a")   { out = support_retest_profile(); return true; }
    if (n == "deep-contraction" || n == "b") { out = deep_contraction_profile(); return true; }
    return false;
}

int required_bars(const Profile& p){
    if (p.strategy == Strategy::SupportRetest)
        return std::max({p.min_bars, p.support_window, p.ma_window, 2});
    return std::max({p.min_bars, p.volume_period, p.price_low_period});
}

bool load_profile_overrides(const std::string& path, Profile& p, std::string& err){
    err.clear();
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e){
        err = "Cannot load " + path + ": " + e.what();
        return false;
    }
    if (root.IsNull()) return true;
    if (!root.IsMap()){ err = path + ": expected a mapping of profile keys"; return false; }

    using Setter = std::function<void(const YAML::Node&)>;
    const std::map<std::string, Setter> setters = {
        {"min_bars",              [&](const YAML::Node& n){ p.min_bars = n.as<int>(); }},
        {"excluded_prefixes",     [&](const YAML::Node& n){ p.excluded_prefixes = n.as<std::vector<std::string>>(); }},
        {"allowed_prefixes",      [&](const YAML::Node& n){ p.allowed_prefixes = n.as<std::vector<std::string>>(); }},
        {"flag_markers",          [&](const YAML::Node& n){ p.flag_markers = n.as<std::vector<std::string>>(); }},
        {"price_min",             [&](const YAML::Node& n){ p.price_min = n.as<double>(); }},
        {"price_max",             [&](const YAML::Node& n){ p.price_max = n.as<double>(); }},
        {"support_window",        [&](const YAML::Node& n){ p.support_window = n.as<int>(); }},
        {"proximity_max",         [&](const YAML::Node& n){ p.proximity_max = n.as<double>(); }},
        {"volume_ratio_max",      [&](const YAML::Node& n){ p.volume_ratio_max = n.as<double>(); }},
        {"ma_window",             [&](const YAML::Node& n){ p.ma_window = n.as<int>(); }},
        {"base_score",            [&](const YAML::Node& n){ p.base_score = n.as<int>(); }},
        {"ma_bonus",              [&](const YAML::Node& n){ p.ma_bonus = n.as<int>(); }},
        {"reexpansion_bonus",     [&](const YAML::Node& n){ p.reexpansion_bonus = n.as<int>(); }},
        {"min_score",             [&](const YAML::Node& n){ p.min_score = n.as<int>(); }},
        {"volume_period",         [&](const YAML::Node& n){ p.volume_period = n.as<int>(); }},
        {"price_low_period",      [&](const YAML::Node& n){ p.price_low_period = n.as<int>(); }},
        {"volume_shrink_ratio",   [&](const YAML::Node& n){ p.volume_shrink_ratio = n.as<double>(); }},
        {"price_low_range_ratio", [&](const YAML::Node& n){ p.price_low_range_ratio = n.as<double>(); }},
        {"top_n",                 [&](const YAML::Node& n){ p.top_n = n.as<int>(); }},
    };

    Profile staged = p;
    for (const auto& kv : root){
        const std::string key = kv.first.as<std::string>();
        auto it = setters.find(key);
        if (it == setters.end()){ err = path + ": unknown key '" + key + "'"; p = staged; return false; }
        try {
            it->second(kv.second);
        } catch (const YAML::Exception& e){
            err = path + ": bad value for '" + key + "': " + e.what();
            p = staged;
            return false;
        }
    }

    if (p.price_min > p.price_max){ err = path + ": price_min > price_max"; p = staged; return false; }
    if (p.support_window <= 0 || p.ma_window <= 0 || p.volume_period <= 0 || p.price_low_period <= 0){
        err = path + ": window lengths must be positive"; p = staged; return false;
    }
    return true;
}

static std::string join(const std::vector<std::string>& v){
    std::string s;
    for (size_t i = 0; i < v.size(); ++i){ if (i) s += "/"; s += v[i]; }
    return s.empty() ? "-" : s;
}

std::string describe_profile(const Profile& p){
    std::ostringstream os;
    os << p.name << ": price [" << p.price_min << ", " << p.price_max << "]"
       << ", exclude " << join(p.excluded_prefixes);
    if (!p.allowed_prefixes.empty()) os << ", only " << join(p.allowed_prefixes);
    if (p.strategy == Strategy::SupportRetest){
        os << ", support window " << p.support_window
           << ", proximity <= " << p.proximity_max * 100 << "%"
           << ", volume ratio < " << p.volume_ratio_max * 100 << "%"
           << ", top " << p.top_n;
    } else {
        os << ", volume <= " << p.volume_shrink_ratio * 100 << "% of " << p.volume_period << "d max"
           << ", close within " << p.price_low_range_ratio * 100 << "% of " << p.price_low_period << "d range";
    }
    return os.str();
}
