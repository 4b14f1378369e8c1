#include "tfidf_index.h"
#include "vocab_builder.h"
#include <cmath>

using namespace std;

void TFIDFIndex::build(const VocabBuilder& vocab) {
    N = vocab.num_docs;
    idf_per_term.assign(vocab.size(), 0.0f);
    for (size_t t = 0; t < vocab.size(); ++t) {
        // smooth variant
        double idf = log((1.0 + (double)N) / (1.0 + (double)vocab.docfreq[t])) + 1.0;
        idf_per_term[t] = (float)idf;
    }
}

float TFIDFIndex::idf(int term_id) const {
    if (term_id < 0 || term_id >= (int)idf_per_term.size()) return 0.0f;
    return idf_per_term[term_id];
}

void TFIDFIndex::compute_tfidf_vector(const vector<string>& terms, const VocabBuilder& vocab, SparseRow& out) const {
    out.clear();
    if (N <= 0) return;
    unordered_map<int,int> counts;
    for (const string& t : terms) {
        int id = vocab.term_id(t);
        if (id < 0) continue;
        counts[id] += 1;
    }
    double sum2 = 0.0;
    for (auto& pr : counts) {
        double w = (double)pr.second * (double)idf(pr.first);
        out[pr.first] = (float)w;
        sum2 += w * w;
    }
    double norm = sqrt(sum2);
    if (norm > 0.0) {
        for (auto& pr : out) pr.second = (float)((double)pr.second / norm);
    }
}

float sparse_dot(const SparseRow& A, const SparseRow& B) {
    if (A.empty() || B.empty()) return 0.0f;
    double dot = 0.0;
    if (A.size() < B.size()) {
        for (auto it = A.begin(); it != A.end(); ++it) {
            auto jt = B.find(it->first);
            if (jt != B.end()) dot += (double)it->second * jt->second;
        }
    } else {
        for (auto it = B.begin(); it != B.end(); ++it) {
            auto jt = A.find(it->first);
            if (jt != A.end()) dot += (double)it->second * jt->second;
        }
    }
    return (float)dot;
}

float sparse_norm(const SparseRow& A) {
    double s = 0.0;
    for (auto& pr : A) s += (double)pr.second * pr.second;
    return (float)sqrt(s);
}
