#include "engine_config.h"
#include "catalog_loader.h"
#include "recommender.h"
#include "serializer.h"
#include "data_explorer.h"
#include "evaluator.h"

#include <iostream>
#include <string>
#include <vector>
#include <unordered_map>
#include <cstdlib>
#include <stdexcept>

using namespace std;

static const string CONFIG_PATH = "config/engine.cfg";

static void print_usage() {
    cerr << "usage: bookrec recommend <user_id> [exclude_id] [count]\n"
         << "       bookrec explore [out_prefix]\n"
         << "       bookrec evaluate [sample] [k]\n";
}

static bool parse_arg_int(const char* s, int& out) {
    try {
        size_t pos = 0;
        string str(s);
        int v = stoi(str, &pos);
        if (pos != str.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

static int cmd_recommend(const EngineConfig& cfg, int argc, char** argv) {
    int uid = -1;
    if (argc < 3 || !parse_arg_int(argv[2], uid) || uid < 0) {
        cout << error_json(argc < 3 ? "User ID is required" : "Invalid User ID") << endl;
        return 2;
    }
    int exclude_id = -1;
    if (argc > 3 && !parse_arg_int(argv[3], exclude_id)) exclude_id = -1;
    int count = cfg.default_count;
    if (argc > 4 && (!parse_arg_int(argv[4], count) || count < 0)) {
        cout << error_json("Invalid count") << endl;
        return 2;
    }

    CsvCatalogRepository repo(cfg.data_dir);
    Recommender rec(&repo, cfg);
    vector<Recommendation> recs;
    if (!rec.recommend(uid, exclude_id, count, recs)) {
        cout << error_json("Error fetching recommendations") << endl;
        return 1;
    }
    cout << recommendations_to_json(recs) << endl;
    return 0;
}

static int cmd_explore(const EngineConfig& cfg, int argc, char** argv) {
    string prefix = argc > 2 ? string(argv[2]) : cfg.data_dir + "/explore";
    CsvCatalogRepository repo(cfg.data_dir);
    vector<Item> items;
    if (!load_catalog(repo, items)) {
        cerr << "[main] cannot load catalog from " << cfg.data_dir << "\n";
        return 1;
    }
    vector<ActivityRecord> reviews;
    if (!repo.list_ratings(reviews)) {
        cerr << "[main] cannot load reviews from " << cfg.data_dir << "\n";
        return 1;
    }
    cout << "[main] loaded " << items.size() << " books, " << reviews.size() << " ratings\n";
    DataExplorer de;
    de.max_rating = cfg.max_rating;
    return de.analyze_catalog(items, reviews, prefix) ? 0 : 1;
}

static int cmd_evaluate(const EngineConfig& cfg, int argc, char** argv) {
    int sample = 200;
    int k = cfg.default_count;
    if (argc > 2 && !parse_arg_int(argv[2], sample)) sample = 200;
    if (argc > 3 && !parse_arg_int(argv[3], k)) k = cfg.default_count;

    CsvCatalogRepository repo(cfg.data_dir);
    vector<Item> items;
    unordered_map<int, UserActivity> activities;
    if (!load_catalog(repo, items) || !repo.list_all_activity(activities)) {
        cerr << "[main] cannot load data from " << cfg.data_dir << "\n";
        return 1;
    }
    cout << "[main] running holdout evaluation (sample=" << sample << ", topk=" << k << ")\n";
    EvalMetrics m = evaluate_holdout(items, activities, cfg, sample, k);
    cout << "[main] holdout results: users=" << m.users_tested
         << " hit@k=" << m.hit_at_k
         << " precision@k=" << m.precision_at_k
         << " content_share=" << m.content_share << "\n";
    return 0;
}

int main(int argc, char** argv) {
    EngineConfig cfg;
    if (load_engine_config(CONFIG_PATH, cfg)) {
        cerr << "[main] config loaded from " << CONFIG_PATH << "\n";
    } else {
        cerr << "[main] " << CONFIG_PATH << " not found, using defaults\n";
    }
    const char* env_dir = getenv("BOOKREC_DATA_DIR");
    if (env_dir && *env_dir) cfg.data_dir = env_dir;

    if (argc < 2) {
        print_usage();
        return 2;
    }
    string cmd = argv[1];
    if (cmd == "recommend") return cmd_recommend(cfg, argc, argv);
    if (cmd == "explore") return cmd_explore(cfg, argc, argv);
    if (cmd == "evaluate") return cmd_evaluate(cfg, argc, argv);
    print_usage();
    return 2;
}
