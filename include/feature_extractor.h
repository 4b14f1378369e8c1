#ifndef FEATURE_EXTRACTOR_H
#define FEATURE_EXTRACTOR_H
#include <string>
#include <vector>
#include <unordered_map>
#include "item.h"
#include "tfidf_index.h"
#include "engine_config.h"
using namespace std;

// One row per item in catalog order: text dims [0, text_dims) then
// standardized likes at text_dims and standardized rating at text_dims + 1.
struct FeatureMatrix {
    vector<SparseRow> rows;
    vector<float> norms;
    size_t text_dims = 0;
    unordered_map<int,int> row_of_item;
    bool empty() const { return rows.empty(); }
    size_t size() const { return rows.size(); }
    int row_index(int item_id) const;
};

string item_document(const Item& it);
FeatureMatrix build_feature_matrix(const vector<Item>& items, const EngineConfig& cfg);
float cosine_rows(const FeatureMatrix& fm, size_t a, size_t b);
#endif
