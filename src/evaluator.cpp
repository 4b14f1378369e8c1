#include "evaluator.h"
#include "recommender.h"
#include <random>
#include <algorithm>
#include <iostream>

using namespace std;

EvalMetrics evaluate_holdout(const vector<Item>& items,
                             const unordered_map<int, UserActivity>& activities,
                             const EngineConfig& cfg,
                             int sample_size,
                             int k)
{
    EvalMetrics res;
    if (items.empty() || activities.empty() || k <= 0) return res;

    vector<int> candidates;
    for (auto &kv : activities) {
        int likes = 0;
        for (auto &r : kv.second.like_records) if (r.kind == ActivityKind::Like) ++likes;
        if (likes >= 2) candidates.push_back(kv.first);
    }
    if (candidates.empty()) {
        cout << "[eval] no users with at least two likes\n";
        return res;
    }
    sort(candidates.begin(), candidates.end());
    mt19937 rng(123456);
    shuffle(candidates.begin(), candidates.end(), rng);

    int hits = 0;
    double prec_sum = 0.0;
    size_t content_total = 0;
    size_t returned_total = 0;
    int tested = 0;
    for (int uid : candidates) {
        if (tested >= sample_size) break;
        const UserActivity &act = activities.at(uid);
        vector<int> like_idx;
        for (size_t i = 0; i < act.like_records.size(); ++i)
            if (act.like_records[i].kind == ActivityKind::Like) like_idx.push_back((int)i);
        uniform_int_distribution<size_t> dist(0, like_idx.size() - 1);
        int hold = like_idx[dist(rng)];
        int held_item = act.like_records[hold].item_id;

        UserActivity reduced = act;
        reduced.like_records.erase(reduced.like_records.begin() + hold);

        vector<Recommendation> recs = run_pipeline(items, reduced, uid, -1, k, cfg);
        bool hit = false;
        for (auto &r : recs) {
            if (r.item.id == held_item) hit = true;
            if (r.source == RecommendationSource::ContentBased) ++content_total;
        }
        returned_total += recs.size();
        if (hit) ++hits;
        prec_sum += (hit ? 1.0 : 0.0) / (double)k;
        ++tested;
    }

    res.users_tested = tested;
    if (tested > 0) {
        res.hit_at_k = (double)hits / (double)tested;
        res.precision_at_k = prec_sum / (double)tested;
    }
    if (returned_total > 0) res.content_share = (double)content_total / (double)returned_total;
    return res;
}
