#include "recommender.h"

#include <algorithm>

using namespace std;

// zero likes scores zero whatever the rating
double popularity_score(const Item& it, double max_rating) {
    double likes = (double)count_or_zero(it.likes);
    double rating = rating_or_zero(it.average_rating, max_rating);
    return likes * 0.4 + rating * likes * 0.6;
}

vector<Recommendation> recommend_popular(const vector<Item>& items, int n, const set<int>& skip_ids, double max_rating) {
    vector<Recommendation> out;
    if (n <= 0 || items.empty()) return out;
    vector<pair<int,double>> scored;
    scored.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) scored.emplace_back((int)i, popularity_score(items[i], max_rating));
    stable_sort(scored.begin(), scored.end(), [](const pair<int,double>& A, const pair<int,double>& B) {
        return A.second > B.second;
    });
    for (auto& pr : scored) {
        if ((int)out.size() >= n) break;
        const Item& it = items[pr.first];
        if (skip_ids.count(it.id)) continue;
        Recommendation r;
        r.item = it;
        r.score = pr.second;
        r.source = RecommendationSource::Popularity;
        out.push_back(r);
    }
    return out;
}
