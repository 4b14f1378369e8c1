#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <cstdlib>
#include <cstdint>
#include <climits>

#include "engine_config.h"
#include "catalog_loader.h"
#include "recommender.h"
#include "serializer.h"
#include "utils.h"

using namespace std;

int main(int argc, char** argv) {
    ios::sync_with_stdio(true);
    cin.tie(nullptr);

    const string CONFIG_PATH = argc > 1 ? string(argv[1]) : string("config/engine.cfg");
    EngineConfig cfg;
    if (load_engine_config(CONFIG_PATH, cfg)) {
        cerr << "[api_cli] config loaded from " << CONFIG_PATH << "\n";
    } else {
        cerr << "[api_cli] " << CONFIG_PATH << " not found, using defaults\n";
    }
    const char* env_dir = getenv("BOOKREC_DATA_DIR");
    if (env_dir && *env_dir) cfg.data_dir = env_dir;
    cerr << "[api_cli] serving data from " << cfg.data_dir << "\n";

    CsvCatalogRepository repo(cfg.data_dir);
    Recommender rec(&repo, cfg);

    cout << "READY" << endl;
    cout.flush();

    string line;
    while (true) {
        if (! std::getline(cin, line)) break;
        if (line.size() == 0) {
            cout << "{}" << endl;
            cout.flush();
            continue;
        }
        string cmd;
        istringstream iss(line);
        iss >> cmd;
        if (cmd == "PING") {
            cout << "{\"ok\":true}" << endl;
            cout.flush();
            continue;
        }
        if (cmd == "EXIT") {
            cout << "{\"ok\":true, \"exiting\":true}" << endl;
            cout.flush();
            break;
        }
        if (cmd == "USER") {
            string uid_arg, exclude_arg, count_arg;
            int uid = -1;
            if (!(iss >> uid_arg) || !parse_id_field(uid_arg, uid)) {
                cout << error_json("Invalid User ID") << endl;
                cout.flush();
                continue;
            }
            int exclude_id = -1;
            int count = cfg.default_count;
            if (iss >> exclude_arg && !parse_id_field(exclude_arg, exclude_id)) exclude_id = -1;
            if (iss >> count_arg) {
                int64_t v = 0;
                if (!parse_int_field(count_arg, v) || v < 0 || v > INT_MAX) {
                    cout << error_json("Invalid count") << endl;
                    cout.flush();
                    continue;
                }
                count = (int)v;
            }
            vector<Recommendation> recs;
            if (!rec.recommend(uid, exclude_id, count, recs)) {
                cout << error_json("Error fetching recommendations") << endl;
                cout.flush();
                continue;
            }
            cout << recommendations_to_json(recs) << endl;
            cout.flush();
            continue;
        }
        cout << "{\"error\":\"unknown command\"}" << endl;
        cout.flush();
    }

    return 0;
}
