#ifndef TOKENIZER_H
#define TOKENIZER_H
#include <string>
#include <vector>
using namespace std;
struct Tokenizer {
    explicit Tokenizer(bool drop_stop_words = true);
    ~Tokenizer();
    vector<string> tokenize(const string& text) const;
    // unigrams followed by adjacent n-grams up to ngram_max, joined by a space
    vector<string> terms(const string& text, int ngram_max) const;
    static bool is_stop_word(const string& w);
    static string normalize(const string& text);
private:
    bool drop_stop_words;
};
#endif
