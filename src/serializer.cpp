#include "serializer.h"
#include <sstream>
#include <iomanip>
#include <cmath>
#include <cstdio>
#include <cstdint>

using namespace std;

string json_escape(const string &s) {
    string out;
    for (char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\"': out += "\\\""; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if ((unsigned char)c < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", (int)c);
                    out += buf;
                } else out += c;
        }
    }
    return out;
}

// NaN and infinities have no JSON form
void write_json_number(ostream &os, double v) {
    if (!std::isfinite(v)) { os << "null"; return; }
    ostringstream tmp;
    tmp << std::setprecision(17) << v;
    os << tmp.str();
}

static void write_count(ostream &os, int64_t v) {
    if (v < 0) os << "null";
    else os << v;
}

void write_recommendation_json(const Recommendation &r, ostream &os) {
    const Item &it = r.item;
    os << "{";
    os << "\"id\":" << (int64_t)it.id << ",";
    os << "\"title\":\"" << json_escape(it.title) << "\",";
    os << "\"author\":\"" << json_escape(it.author) << "\",";
    os << "\"description\":\"" << json_escape(it.description) << "\",";
    os << "\"genres\":\"" << json_escape(it.genres) << "\",";
    os << "\"cover\":\"" << json_escape(it.cover) << "\",";
    os << "\"likes\":"; write_count(os, it.likes); os << ",";
    os << "\"dislikes\":"; write_count(os, it.dislikes); os << ",";
    os << "\"averageRating\":"; write_json_number(os, it.average_rating); os << ",";
    os << "\"score\":"; write_json_number(os, r.score); os << ",";
    os << "\"source\":\"" << recommendation_source_name(r.source) << "\"";
    os << "}";
}

void write_recommendations_json(const vector<Recommendation> &recs, ostream &os) {
    os << "{\"recommendations\":[";
    for (size_t i = 0; i < recs.size(); ++i) {
        if (i) os << ",";
        write_recommendation_json(recs[i], os);
    }
    os << "]}";
}

string recommendations_to_json(const vector<Recommendation> &recs) {
    ostringstream os;
    write_recommendations_json(recs, os);
    return os.str();
}

string error_json(const string &msg) {
    return "{\"error\":\"" + json_escape(msg) + "\"}";
}
