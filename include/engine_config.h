#ifndef ENGINE_CONFIG_H
#define ENGINE_CONFIG_H

#include <string>

struct EngineConfig {
    std::string data_dir = "data";

    // scoring
    double penalty_weight = 0.3;
    double diversity_factor = 0.3;
    int candidate_multiplier = 2;
    int default_count = 4;
    double max_rating = 5.0;

    // vectorization policy
    int min_df = 2;
    double max_df_ratio = 0.8;
    int max_features = 5000;
    int ngram_max = 2;

    bool verbose = false;
};

bool load_engine_config(const std::string& path, EngineConfig& cfg);
bool apply_config_entry(EngineConfig& cfg, const std::string& key, const std::string& value);

#endif
