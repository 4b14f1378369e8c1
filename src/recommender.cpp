#include "recommender.h"
#include "catalog_loader.h"

#include <iostream>
#include <algorithm>
#include <cstdint>

using namespace std;

vector<Recommendation> run_pipeline(const vector<Item>& items,
                                    const UserActivity& activity,
                                    int user_id,
                                    int exclude_item_id,
                                    int count,
                                    const EngineConfig& cfg)
{
    vector<Recommendation> out;
    if (count <= 0 || items.empty()) return out;

    set<int> excluded;
    if (exclude_item_id >= 0) excluded.insert(exclude_item_id);

    UserProfile profile;
    if (!build_user_profile(user_id, activity, profile)) {
        if (cfg.verbose) cerr << "[recommender] user " << user_id << " cold start, popularity only\n";
        return recommend_popular(items, count, excluded, cfg.max_rating);
    }

    FeatureMatrix fm = build_feature_matrix(items, cfg);
    int k = (int)min<int64_t>((int64_t)count * cfg.candidate_multiplier, (int64_t)items.size());
    RankedRows ranked = score_content(fm, items, profile, excluded, k, cfg.penalty_weight);

    vector<Recommendation> content;
    content.reserve(ranked.size());
    for (auto& pr : ranked) {
        Recommendation r;
        r.item = items[pr.first];
        r.score = pr.second;
        r.source = RecommendationSource::ContentBased;
        content.push_back(r);
    }
    out = diversify_by_author(content, cfg.diversity_factor);
    if ((int)out.size() > count) out.resize(count);

    if ((int)out.size() < count) {
        set<int> skip = excluded;
        skip.insert(profile.liked.begin(), profile.liked.end());
        skip.insert(profile.disliked.begin(), profile.disliked.end());
        for (auto& r : out) skip.insert(r.item.id);
        vector<Recommendation> top_up = recommend_popular(items, count - (int)out.size(), skip, cfg.max_rating);
        out.insert(out.end(), top_up.begin(), top_up.end());
    }

    if (cfg.verbose) {
        cerr << "[recommender] user " << user_id << " liked=" << profile.liked.size()
             << " disliked=" << profile.disliked.size() << " rated=" << profile.rated.size()
             << " content=" << ranked.size() << " returned=" << out.size() << "\n";
    }
    return out;
}

Recommender::Recommender(const CatalogRepository* repo_in, const EngineConfig& cfg_in)
    : repo(repo_in), cfg(cfg_in)
{
}

bool Recommender::recommend(int user_id, int exclude_item_id, int count, vector<Recommendation>& out) const
{
    if (!repo) {
        cerr << "[recommender] no repository configured\n";
        return false;
    }
    vector<Item> items;
    if (!load_catalog(*repo, items)) {
        cerr << "[recommender] catalog unavailable\n";
        return false;
    }
    UserActivity activity;
    if (!repo->get_user_activity(user_id, activity)) {
        cerr << "[recommender] activity unavailable for user " << user_id << "\n";
        return false;
    }
    out = run_pipeline(items, activity, user_id, exclude_item_id, count, cfg);
    return true;
}

bool Recommender::recommend(int user_id, vector<Recommendation>& out) const
{
    return recommend(user_id, -1, cfg.default_count, out);
}
