#include "item.h"
#include <cmath>

using namespace std;

bool parse_activity_kind(const string& action, ActivityKind& out) {
    if (action == "like") { out = ActivityKind::Like; return true; }
    if (action == "dislike") { out = ActivityKind::Dislike; return true; }
    if (action == "rating") { out = ActivityKind::Rating; return true; }
    if (action == "search") { out = ActivityKind::Search; return true; }
    if (action == "download") { out = ActivityKind::Download; return true; }
    return false;
}

const char* recommendation_source_name(RecommendationSource s) {
    return s == RecommendationSource::ContentBased ? "content" : "popularity";
}

int64_t count_or_zero(int64_t v) {
    return v < 0 ? 0 : v;
}

double rating_or_zero(double v, double max_rating) {
    if (!std::isfinite(v) || v < 0.0) return 0.0;
    if (v > max_rating) return max_rating;
    return v;
}
