#include "vocab_builder.h"
#include <algorithm>
#include <unordered_set>
#include <cmath>

using namespace std;

VocabBuilder::VocabBuilder(const VocabPolicy& policy_in) : policy(policy_in) {}

// min_df / max_df pruning, then the max_features most frequent terms, ids in lexical order
void VocabBuilder::fit(const vector<vector<string>>& doc_terms) {
    token2id.clear();
    id2token.clear();
    docfreq.clear();
    num_docs = (int)doc_terms.size();
    if (num_docs == 0) return;

    unordered_map<string,int> df;
    unordered_map<string,long long> corpus_tf;
    for (const auto& terms : doc_terms) {
        unordered_set<string> seen;
        for (const string& t : terms) {
            corpus_tf[t] += 1;
            if (seen.insert(t).second) df[t] += 1;
        }
    }

    double max_doc_count = policy.max_df_ratio * (double)num_docs;
    vector<pair<string,long long>> kept;
    kept.reserve(df.size());
    for (auto& kv : df) {
        if (kv.second < policy.min_df) continue;
        if ((double)kv.second > max_doc_count) continue;
        kept.emplace_back(kv.first, corpus_tf[kv.first]);
    }

    if (policy.max_features > 0 && (int)kept.size() > policy.max_features) {
        sort(kept.begin(), kept.end(), [](const pair<string,long long>& A, const pair<string,long long>& B) {
            if (A.second == B.second) return A.first < B.first;
            return A.second > B.second;
        });
        kept.resize(policy.max_features);
    }

    sort(kept.begin(), kept.end(), [](const pair<string,long long>& A, const pair<string,long long>& B) {
        return A.first < B.first;
    });

    id2token.reserve(kept.size());
    docfreq.reserve(kept.size());
    for (auto& pr : kept) {
        int nid = (int)id2token.size();
        token2id[pr.first] = nid;
        id2token.push_back(pr.first);
        docfreq.push_back(df[pr.first]);
    }
}

int VocabBuilder::term_id(const string& term) const {
    auto it = token2id.find(term);
    if (it == token2id.end()) return -1;
    return it->second;
}
