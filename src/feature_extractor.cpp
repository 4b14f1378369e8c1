#include "feature_extractor.h"
#include "tokenizer.h"
#include "vocab_builder.h"
#include "column_stats.h"
#include <cmath>
#include <iostream>

using namespace std;

int FeatureMatrix::row_index(int item_id) const {
    auto it = row_of_item.find(item_id);
    if (it == row_of_item.end()) return -1;
    return it->second;
}

string item_document(const Item& it) {
    return it.title + " " + it.author + " " + it.description + " " + it.genres;
}

FeatureMatrix build_feature_matrix(const vector<Item>& items, const EngineConfig& cfg) {
    FeatureMatrix fm;
    if (items.empty()) return fm;

    Tokenizer tok;
    vector<vector<string>> doc_terms;
    doc_terms.reserve(items.size());
    for (const Item& it : items) doc_terms.push_back(tok.terms(item_document(it), cfg.ngram_max));

    VocabPolicy policy;
    policy.min_df = cfg.min_df;
    policy.max_df_ratio = cfg.max_df_ratio;
    policy.max_features = cfg.max_features;
    policy.ngram_max = cfg.ngram_max;
    VocabBuilder vb(policy);
    vb.fit(doc_terms);

    TFIDFIndex tfidf;
    tfidf.build(vb);
    fm.text_dims = vb.size();

    unordered_map<string, vector<double>> numeric;
    vector<double>& likes = numeric["likes"];
    vector<double>& rating = numeric["average_rating"];
    likes.reserve(items.size());
    rating.reserve(items.size());
    for (const Item& it : items) {
        likes.push_back((double)count_or_zero(it.likes));
        rating.push_back(rating_or_zero(it.average_rating, cfg.max_rating));
    }
    unordered_map<string, pair<double,double>> norms = compute_column_normalizers(numeric);

    fm.rows.resize(items.size());
    fm.norms.resize(items.size());
    int likes_dim = (int)fm.text_dims;
    int rating_dim = (int)fm.text_dims + 1;
    for (size_t r = 0; r < items.size(); ++r) {
        SparseRow& row = fm.rows[r];
        tfidf.compute_tfidf_vector(doc_terms[r], vb, row);
        float zl = (float)standardize(likes[r], norms["likes"]);
        float zr = (float)standardize(rating[r], norms["average_rating"]);
        if (zl != 0.0f) row[likes_dim] = zl;
        if (zr != 0.0f) row[rating_dim] = zr;
        fm.norms[r] = sparse_norm(row);
        fm.row_of_item[items[r].id] = (int)r;
    }

    if (cfg.verbose) {
        cerr << "[features] items=" << items.size() << " vocab=" << fm.text_dims << "\n";
    }
    return fm;
}

float cosine_rows(const FeatureMatrix& fm, size_t a, size_t b) {
    if (a >= fm.rows.size() || b >= fm.rows.size()) return 0.0f;
    float na = fm.norms[a];
    float nb = fm.norms[b];
    if (na <= 0.0f || nb <= 0.0f) return 0.0f;
    return sparse_dot(fm.rows[a], fm.rows[b]) / (na * nb);
}
