#include "recommender.h"

#include <cmath>
#include <unordered_map>
#include <string>

using namespace std;

int max_per_author(size_t list_len, double diversity_factor) {
    int cap = (int)floor((double)list_len * diversity_factor);
    return cap < 1 ? 1 : cap;
}

vector<Recommendation> diversify_by_author(const vector<Recommendation>& ranked, double diversity_factor) {
    if (ranked.size() <= 3) return ranked;
    int cap = max_per_author(ranked.size(), diversity_factor);
    unordered_map<string,int> per_author;
    vector<Recommendation> out;
    out.reserve(ranked.size());
    for (const Recommendation& r : ranked) {
        int& c = per_author[r.item.author];
        if (c >= cap) continue;
        ++c;
        out.push_back(r);
    }
    return out;
}
