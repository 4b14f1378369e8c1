#include "recommender.h"

#include <algorithm>
#include <cmath>

using namespace std;

double mean_affinity(const FeatureMatrix& fm, size_t row, const vector<int>& ref_rows) {
    if (ref_rows.empty()) return 0.0;
    double sum = 0.0;
    for (int r : ref_rows) sum += (double)cosine_rows(fm, row, (size_t)r);
    return sum / (double)ref_rows.size();
}

static vector<int> rows_for_ids(const FeatureMatrix& fm, const set<int>& ids) {
    vector<int> rows;
    for (int id : ids) {
        int r = fm.row_index(id);
        if (r >= 0) rows.push_back(r);
    }
    return rows;
}

RankedRows score_content(const FeatureMatrix& fm,
                         const vector<Item>& items,
                         const UserProfile& profile,
                         const set<int>& excluded_ids,
                         int k,
                         double penalty_weight)
{
    RankedRows out;
    if (fm.empty() || k <= 0 || profile.liked.empty()) return out;
    vector<int> liked_rows = rows_for_ids(fm, profile.liked);
    if (liked_rows.empty()) return out;
    vector<int> disliked_rows = rows_for_ids(fm, profile.disliked);

    out.reserve(fm.size());
    for (size_t r = 0; r < fm.size(); ++r) {
        double s = mean_affinity(fm, r, liked_rows);
        if (!disliked_rows.empty()) s -= penalty_weight * mean_affinity(fm, r, disliked_rows);
        out.emplace_back((int)r, s);
    }
    // ties keep catalog order
    stable_sort(out.begin(), out.end(), [](const pair<int,double>& A, const pair<int,double>& B) {
        return A.second > B.second;
    });

    RankedRows kept;
    for (auto& pr : out) {
        if ((int)kept.size() >= k) break;
        int id = items[pr.first].id;
        if (profile_has_interaction(profile, id)) continue;
        if (excluded_ids.count(id)) continue;
        kept.push_back(pr);
    }
    return kept;
}
