#include "data_explorer.h"
#include "column_stats.h"
#include "recommender.h"
#include "utils.h"
#include <fstream>
#include <algorithm>
#include <cmath>
#include <map>
#include <iostream>
#include <iomanip>

#ifdef USE_MATPLOT
#include <matplot/matplot.h>
#endif

using namespace std;

#ifdef USE_MATPLOT
static void plot_histogram_matplot(const vector<double>& data, const string& stitle, const string& sxlabel, const string& outpath)
{
    if (data.empty()) return;
    matplot::figure();
    matplot::hist(data);
    matplot::title(stitle);
    matplot::xlabel(sxlabel);
    matplot::ylabel("count");
    matplot::save(outpath);
}

static void plot_bar_counts_matplot(const vector<pair<string,int>>& items, const string& stitle, const string& outpath)
{
    if (items.empty()) return;
    vector<double> values;
    for (const auto &p : items) values.push_back((double)p.second);
    matplot::figure();
    matplot::bar(values);
    matplot::title(stitle);
    matplot::save(outpath);
}
#endif

CatalogStats DataExplorer::compute_stats(const vector<Item>& items, const vector<ActivityRecord>& reviews) const
{
    CatalogStats st;
    st.items = items.size();

    vector<double> likes;
    vector<double> ratings;
    map<string,int> genre_counts;
    for (const Item& it : items) {
        likes.push_back((double)count_or_zero(it.likes));
        if (std::isfinite(it.average_rating) && it.average_rating > 0.0) ratings.push_back(rating_or_zero(it.average_rating, max_rating));
        for (const string& g : split_tags(it.genres, ',')) genre_counts[g] += 1;
    }
    st.likes_mean = mean_of(likes);
    st.likes_std = stddev_of(likes, st.likes_mean);
    st.likes_median = median_of(likes);
    st.rated_items = ratings.size();
    st.rating_mean = mean_of(ratings);
    st.rating_std = stddev_of(ratings, st.rating_mean);
    st.rating_median = median_of(ratings);

    for (auto& kv : genre_counts) st.top_genres.emplace_back(kv.first, kv.second);
    stable_sort(st.top_genres.begin(), st.top_genres.end(), [](const pair<string,int>& A, const pair<string,int>& B) {
        return A.second > B.second;
    });
    if (st.top_genres.size() > 12) st.top_genres.resize(12);

    map<int,int> dist;
    for (const ActivityRecord& r : reviews) {
        if (r.kind != ActivityKind::Rating) continue;
        dist[(int)lround(r.value)] += 1;
    }
    for (auto& kv : dist) st.rating_distribution.emplace_back(kv.first, kv.second);

    set<int> none;
    vector<Recommendation> top = recommend_popular(items, 10, none, max_rating);
    for (auto& r : top) st.popular_items.emplace_back(r.item.id, r.score);
    return st;
}

bool DataExplorer::analyze_catalog(const vector<Item>& items,
                                   const vector<ActivityRecord>& reviews,
                                   const string& out_prefix) const
{
    CatalogStats st = compute_stats(items, reviews);
    string path = out_prefix + "_stats.txt";
    ofstream out(path);
    if (!out.is_open()) {
        cerr << "[explore] cannot open output file: " << path << "\n";
        return false;
    }
    out << fixed << setprecision(3);
    out << "items: " << st.items << "\n";
    out << "likes: mean=" << st.likes_mean << " std=" << st.likes_std << " median=" << st.likes_median << "\n";
    out << "rating: rated=" << st.rated_items << " mean=" << st.rating_mean << " std=" << st.rating_std
        << " median=" << st.rating_median << "\n";
    out << "genres:";
    for (auto& g : st.top_genres) out << " " << g.first << "=" << g.second;
    out << "\n";
    out << "rating distribution:";
    for (auto& d : st.rating_distribution) out << " " << d.first << "=" << d.second;
    out << "\n";
    out << "popular:";
    for (auto& p : st.popular_items) out << " " << p.first << "(" << p.second << ")";
    out << "\n";
    out.close();
    cout << "[explore] stats written to " << path << "\n";

#ifdef USE_MATPLOT
    vector<double> likes;
    vector<double> ratings;
    for (const Item& it : items) {
        likes.push_back((double)count_or_zero(it.likes));
        ratings.push_back(rating_or_zero(it.average_rating, max_rating));
    }
    plot_histogram_matplot(likes, "Likes per book", "likes", out_prefix + "_likes_hist.png");
    plot_histogram_matplot(ratings, "Average rating per book", "rating", out_prefix + "_rating_hist.png");
    plot_bar_counts_matplot(st.top_genres, "Top genres", out_prefix + "_genres_bar.png");
    cout << "[explore] plots written with prefix " << out_prefix << "\n";
#endif
    return true;
}
