#include "utils.h"
#include <sstream>
#include <cctype>
#include <cstdlib>
#include <cerrno>
#include <climits>

using namespace std;

vector<string> split_csv_line(const string& line)
{
    vector<string> out;
    string cur;
    bool in_quote = false;
    for (size_t i = 0; i < line.size(); ++i)
    {
        char c = line[i];
        if (c == '"') {
            // doubled quote inside a quoted field
            if (in_quote && i + 1 < line.size() && line[i+1] == '"') {
                cur.push_back('"'); ++i; continue;
            }
            in_quote = !in_quote;
            continue;
        }
        if (c == ',' && !in_quote) { out.push_back(cur); cur.clear(); }
        else if (c == '\r' && !in_quote && i + 1 == line.size()) continue;
        else cur.push_back(c);
    }
    out.push_back(cur);
    return out;
}

string trim_copy(const string& s) {
    size_t a = 0;
    while (a < s.size() && isspace((unsigned char)s[a])) ++a;
    size_t b = s.size();
    while (b > a && isspace((unsigned char)s[b-1])) --b;
    return s.substr(a, b - a);
}

vector<string> split_tags(const string& field, char sep) {
    vector<string> out;
    stringstream ss(field);
    string tok;
    while (getline(ss, tok, sep)) {
        string t = trim_copy(tok);
        if (!t.empty()) out.push_back(t);
    }
    return out;
}

bool parse_int_field(const string& field, int64_t& out) {
    string s = trim_copy(field);
    if (s.empty() || s == "null" || s == "NULL") return false;
    char* end = nullptr;
    errno = 0;
    long long v = strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    out = (int64_t)v;
    return true;
}

bool parse_id_field(const string& field, int& out) {
    int64_t v = 0;
    if (!parse_int_field(field, v)) return false;
    if (v < 0 || v > INT_MAX) return false;
    out = (int)v;
    return true;
}

bool parse_double_field(const string& field, double& out) {
    string s = trim_copy(field);
    if (s.empty() || s == "null" || s == "NULL") return false;
    char* end = nullptr;
    errno = 0;
    double v = strtod(s.c_str(), &end);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    out = v;
    return true;
}

int find_column(const vector<string>& header, const string& name) {
    for (size_t i = 0; i < header.size(); ++i) {
        string h = trim_copy(header[i]);
        if (h.size() == name.size()) {
            bool same = true;
            for (size_t j = 0; j < h.size(); ++j) {
                if (tolower((unsigned char)h[j]) != tolower((unsigned char)name[j])) { same = false; break; }
            }
            if (same) return (int)i;
        }
    }
    return -1;
}
