#ifndef DATA_EXPLORER_H
#define DATA_EXPLORER_H

#include <string>
#include <vector>
#include <utility>
#include "item.h"

using namespace std;

struct CatalogStats {
    size_t items = 0;
    double likes_mean = 0.0, likes_std = 0.0, likes_median = 0.0;
    double rating_mean = 0.0, rating_std = 0.0, rating_median = 0.0;
    size_t rated_items = 0;
    vector<pair<string,int>> top_genres;
    vector<pair<int,int>> rating_distribution;
    vector<pair<int,double>> popular_items;
};

struct DataExplorer {
    double max_rating = 5.0;
    CatalogStats compute_stats(const vector<Item>& items, const vector<ActivityRecord>& reviews) const;
    bool analyze_catalog(const vector<Item>& items,
                         const vector<ActivityRecord>& reviews,
                         const string& out_prefix) const;
};

#endif
