#ifndef ITEM_H
#define ITEM_H

#include <string>
#include <vector>
#include <cstdint>
#include <limits>

// absent numeric fields: likes/dislikes = -1, average_rating = NaN
struct Item {
    int id = -1;
    std::string title;
    std::string author;
    std::string description;
    std::string genres;
    std::string cover;
    int64_t likes = -1;
    int64_t dislikes = -1;
    double average_rating = std::numeric_limits<double>::quiet_NaN();
};

enum class ActivityKind { Like, Dislike, Rating, Search, Download };

struct ActivityRecord {
    int user_id = -1;
    int item_id = -1;
    ActivityKind kind = ActivityKind::Like;
    double value = 0.0;
    int64_t timestamp = 0;
};

struct StatedPreferences {
    std::string favorite_genres;
    std::string favorite_authors;
    std::string favorite_books;
};

struct UserActivity {
    std::vector<ActivityRecord> like_records;
    std::vector<ActivityRecord> rating_records;
    bool has_preferences = false;
    StatedPreferences preferences;
};

enum class RecommendationSource { ContentBased, Popularity };

struct Recommendation {
    Item item;
    double score = 0.0;
    RecommendationSource source = RecommendationSource::ContentBased;
};

bool parse_activity_kind(const std::string& action, ActivityKind& out);
const char* recommendation_source_name(RecommendationSource s);

// the one place absent numerics become zero
int64_t count_or_zero(int64_t v);
// ratings are clamped into [0, max_rating]
double rating_or_zero(double v, double max_rating = 5.0);

#endif
