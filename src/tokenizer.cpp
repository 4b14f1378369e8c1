#include "tokenizer.h"
#include <sstream>
#include <cctype>
#include <unordered_set>
#include <iterator>

static const char* const kStopWords[] = {
    "a", "about", "above", "across", "after", "afterwards", "again", "against", "all", "almost",
    "alone", "along", "already", "also", "although", "always", "am", "among", "amongst", "amoungst",
    "amount", "an", "and", "another", "any", "anyhow", "anyone", "anything", "anyway", "anywhere",
    "are", "around", "as", "at", "back", "be", "became", "because", "become", "becomes",
    "becoming", "been", "before", "beforehand", "behind", "being", "below", "beside", "besides", "between",
    "beyond", "bill", "both", "bottom", "but", "by", "call", "can", "cannot", "cant",
    "co", "con", "could", "couldnt", "cry", "de", "describe", "detail", "do", "done",
    "down", "due", "during", "each", "eg", "eight", "either", "eleven", "else", "elsewhere",
    "empty", "enough", "etc", "even", "ever", "every", "everyone", "everything", "everywhere", "except",
    "few", "fifteen", "fifty", "fill", "find", "fire", "first", "five", "for", "former",
    "formerly", "forty", "found", "four", "from", "front", "full", "further", "get", "give",
    "go", "had", "has", "hasnt", "have", "he", "hence", "her", "here", "hereafter",
    "hereby", "herein", "hereupon", "hers", "herself", "him", "himself", "his", "how", "however",
    "hundred", "i", "ie", "if", "in", "inc", "indeed", "interest", "into", "is",
    "it", "its", "itself", "keep", "last", "latter", "latterly", "least", "less", "ltd",
    "made", "many", "may", "me", "meanwhile", "might", "mill", "mine", "more", "moreover",
    "most", "mostly", "move", "much", "must", "my", "myself", "name", "namely", "neither",
    "never", "nevertheless", "next", "nine", "no", "nobody", "none", "noone", "nor", "not",
    "nothing", "now", "nowhere", "of", "off", "often", "on", "once", "one", "only",
    "onto", "or", "other", "others", "otherwise", "our", "ours", "ourselves", "out", "over",
    "own", "part", "per", "perhaps", "please", "put", "rather", "re", "same", "see",
    "seem", "seemed", "seeming", "seems", "serious", "several", "she", "should", "show", "side",
    "since", "sincere", "six", "sixty", "so", "some", "somehow", "someone", "something", "sometime",
    "sometimes", "somewhere", "still", "such", "system", "take", "ten", "than", "that", "the",
    "their", "them", "themselves", "then", "thence", "there", "thereafter", "thereby", "therefore", "therein",
    "thereupon", "these", "they", "thick", "thin", "third", "this", "those", "though", "three",
    "through", "throughout", "thru", "thus", "to", "together", "too", "top", "toward", "towards",
    "twelve", "twenty", "two", "un", "under", "until", "up", "upon", "us", "very",
    "via", "was", "we", "well", "were", "what", "whatever", "when", "whence", "whenever",
    "where", "whereafter", "whereas", "whereby", "wherein", "whereupon", "wherever", "whether", "which", "while",
    "whither", "who", "whoever", "whole", "whom", "whose", "why", "will", "with", "within",
    "without", "would", "yet", "you", "your", "yours", "yourself", "yourselves"
};

static const unordered_set<string>& stop_word_set() {
    static const unordered_set<string> s(std::begin(kStopWords), std::end(kStopWords));
    return s;
}

Tokenizer::Tokenizer(bool drop_stop_words_in) : drop_stop_words(drop_stop_words_in) {}
Tokenizer::~Tokenizer() {}

bool Tokenizer::is_stop_word(const string& w) {
    return stop_word_set().count(w) > 0;
}

// lowercase, everything but letters/digits/utf-8 bytes becomes a space, runs collapsed
string Tokenizer::normalize(const string& text) {
    string s = text;
    for (size_t i = 0; i < s.size(); ++i) {
        unsigned char c = (unsigned char)s[i];
        if (c >= 'A' && c <= 'Z') s[i] = (char)(c + 32);
        else if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || c >= 0x80)) s[i] = ' ';
    }
    string r;
    bool prev_space = false;
    for (size_t i = 0; i < s.size(); ++i) {
        char ch = s[i];
        if (ch == ' ') {
            if (prev_space) continue;
            prev_space = true;
            r.push_back(' ');
        } else {
            prev_space = false;
            r.push_back(ch);
        }
    }
    while (!r.empty() && r.front() == ' ') r.erase(r.begin());
    while (!r.empty() && r.back() == ' ') r.pop_back();
    return r;
}

vector<string> Tokenizer::tokenize(const string& text) const {
    istringstream ss(normalize(text));
    vector<string> out;
    string tok;
    while (ss >> tok) {
        if (tok.size() < 2) continue;
        if (drop_stop_words && is_stop_word(tok)) continue;
        out.push_back(tok);
    }
    return out;
}

vector<string> Tokenizer::terms(const string& text, int ngram_max) const {
    vector<string> toks = tokenize(text);
    vector<string> out = toks;
    for (int n = 2; n <= ngram_max; ++n) {
        if ((int)toks.size() < n) break;
        for (size_t i = 0; i + n <= toks.size(); ++i) {
            string g = toks[i];
            for (int j = 1; j < n; ++j) g += " " + toks[i + j];
            out.push_back(g);
        }
    }
    return out;
}
