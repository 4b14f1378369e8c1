#ifndef TFIDF_INDEX_H
#define TFIDF_INDEX_H

#include <unordered_map>
#include <vector>
#include <string>

struct VocabBuilder;

typedef std::unordered_map<int,float> SparseRow;

struct TFIDFIndex {
    void build(const VocabBuilder& vocab);
    float idf(int term_id) const;
    // raw counts x smooth idf, L2 normalized; unknown terms are skipped
    void compute_tfidf_vector(const std::vector<std::string>& terms, const VocabBuilder& vocab, SparseRow& out) const;
    size_t dims() const { return idf_per_term.size(); }
private:
    int N = 0;
    std::vector<float> idf_per_term;
};

float sparse_dot(const SparseRow& A, const SparseRow& B);
float sparse_norm(const SparseRow& A);

#endif
