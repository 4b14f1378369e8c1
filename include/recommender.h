#ifndef RECOMMENDER_H
#define RECOMMENDER_H

#include <vector>
#include <set>
#include <utility>
#include "item.h"
#include "user_profile.h"
#include "feature_extractor.h"
#include "engine_config.h"

class CatalogRepository;

// (catalog row, score) pairs, best first
typedef std::vector<std::pair<int,double>> RankedRows;

// content scorer: empty when the profile has no liked item in the catalog
RankedRows score_content(const FeatureMatrix& fm,
                         const std::vector<Item>& items,
                         const UserProfile& profile,
                         const std::set<int>& excluded_ids,
                         int k,
                         double penalty_weight);

double mean_affinity(const FeatureMatrix& fm, size_t row, const std::vector<int>& ref_rows);

std::vector<Recommendation> diversify_by_author(const std::vector<Recommendation>& ranked, double diversity_factor);
int max_per_author(size_t list_len, double diversity_factor);

double popularity_score(const Item& it, double max_rating = 5.0);
std::vector<Recommendation> recommend_popular(const std::vector<Item>& items,
                                              int n,
                                              const std::set<int>& skip_ids,
                                              double max_rating = 5.0);

// stateless core: items and activity already fetched
std::vector<Recommendation> run_pipeline(const std::vector<Item>& items,
                                         const UserActivity& activity,
                                         int user_id,
                                         int exclude_item_id,
                                         int count,
                                         const EngineConfig& cfg);

class Recommender {
public:
    Recommender(const CatalogRepository* repo_in, const EngineConfig& cfg_in);

    // false only when the repository fails; out is untouched then
    bool recommend(int user_id, int exclude_item_id, int count, std::vector<Recommendation>& out) const;
    bool recommend(int user_id, std::vector<Recommendation>& out) const;

    const EngineConfig& config() const { return cfg; }

private:
    const CatalogRepository* repo = nullptr;
    EngineConfig cfg;
};

#endif
