#include "engine_config.h"
#include "utils.h"
#include <fstream>
#include <iostream>
#include <cstdint>

using namespace std;

bool apply_config_entry(EngineConfig& cfg, const string& key, const string& value) {
    int64_t iv = 0;
    double dv = 0.0;
    if (key == "data_dir") {
        if (value.empty()) return false;
        cfg.data_dir = value;
        return true;
    }
    if (key == "penalty_weight") {
        if (!parse_double_field(value, dv) || dv < 0.0) return false;
        cfg.penalty_weight = dv;
        return true;
    }
    if (key == "diversity_factor") {
        if (!parse_double_field(value, dv) || dv < 0.0 || dv > 1.0) return false;
        cfg.diversity_factor = dv;
        return true;
    }
    if (key == "max_df_ratio") {
        if (!parse_double_field(value, dv) || dv <= 0.0 || dv > 1.0) return false;
        cfg.max_df_ratio = dv;
        return true;
    }
    if (key == "max_rating") {
        if (!parse_double_field(value, dv) || dv <= 0.0) return false;
        cfg.max_rating = dv;
        return true;
    }
    if (key == "min_df") {
        if (!parse_int_field(value, iv) || iv < 1) return false;
        cfg.min_df = (int)iv;
        return true;
    }
    if (key == "max_features") {
        if (!parse_int_field(value, iv) || iv < 1) return false;
        cfg.max_features = (int)iv;
        return true;
    }
    if (key == "ngram_max") {
        if (!parse_int_field(value, iv) || iv < 1 || iv > 3) return false;
        cfg.ngram_max = (int)iv;
        return true;
    }
    if (key == "default_count") {
        if (!parse_int_field(value, iv) || iv < 1) return false;
        cfg.default_count = (int)iv;
        return true;
    }
    if (key == "candidate_multiplier") {
        if (!parse_int_field(value, iv) || iv < 1) return false;
        cfg.candidate_multiplier = (int)iv;
        return true;
    }
    if (key == "verbose") {
        cfg.verbose = (value == "1" || value == "true" || value == "yes");
        return true;
    }
    return false;
}

bool load_engine_config(const string& path, EngineConfig& cfg) {
    ifstream in(path);
    if (!in.is_open()) return false;
    string line;
    int lineno = 0;
    while (getline(in, line)) {
        ++lineno;
        string s = trim_copy(line);
        if (s.empty() || s[0] == '#') continue;
        size_t eq = s.find('=');
        if (eq == string::npos) {
            cerr << "[config] " << path << ":" << lineno << " ignored, expected key=value\n";
            continue;
        }
        string key = trim_copy(s.substr(0, eq));
        string value = trim_copy(s.substr(eq + 1));
        if (!apply_config_entry(cfg, key, value)) {
            cerr << "[config] " << path << ":" << lineno << " ignored entry '" << key << "'\n";
        }
    }
    in.close();
    return true;
}
