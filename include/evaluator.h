#ifndef EVALUATOR_H
#define EVALUATOR_H

#include <unordered_map>
#include <vector>
#include "item.h"
#include "engine_config.h"

struct EvalMetrics {
    int users_tested = 0;
    double hit_at_k = 0.0;
    double precision_at_k = 0.0;
    double content_share = 0.0;
};

EvalMetrics evaluate_holdout(const std::vector<Item>& items,
                             const std::unordered_map<int, UserActivity>& activities,
                             const EngineConfig& cfg,
                             int sample_size,
                             int k);

#endif
