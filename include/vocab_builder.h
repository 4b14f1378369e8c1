#ifndef VOCAB_BUILDER_H
#define VOCAB_BUILDER_H

#include <string>
#include <vector>
#include <unordered_map>
#include "tokenizer.h"

using namespace std;

struct VocabPolicy {
    int min_df = 2;
    double max_df_ratio = 0.8;
    int max_features = 5000;
    int ngram_max = 2;
};

// Fitted over one document set and thrown away with it.
struct VocabBuilder {
    explicit VocabBuilder(const VocabPolicy& policy);
    void fit(const vector<vector<string>>& doc_terms);
    int term_id(const string& term) const;
    size_t size() const { return id2token.size(); }

    unordered_map<string,int> token2id;
    vector<string> id2token;
    // document frequency per kept term id
    vector<int> docfreq;
    int num_docs = 0;

private:
    VocabPolicy policy;
};

#endif
