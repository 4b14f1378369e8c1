#include "catalog_loader.h"
#include "utils.h"
#include <fstream>
#include <iostream>
#include <limits>

using namespace std;

static string field_at(const vector<string>& parts, int idx) {
    if (idx < 0 || (size_t)idx >= parts.size()) return string();
    return parts[idx];
}

bool load_books_csv(const string& path, vector<Item>& out_items) {
    ifstream in(path);
    if (!in.is_open()) {
        cerr << "[catalog] cannot open " << path << "\n";
        return false;
    }
    string header;
    if (!getline(in, header)) {
        cerr << "[catalog] missing header in " << path << "\n";
        return false;
    }
    vector<string> cols = split_csv_line(header);
    int idx_id = find_column(cols, "id");
    int idx_title = find_column(cols, "title");
    int idx_author = find_column(cols, "author");
    int idx_desc = find_column(cols, "description");
    int idx_genres = find_column(cols, "genres");
    int idx_cover = find_column(cols, "cover");
    int idx_likes = find_column(cols, "likes");
    int idx_dislikes = find_column(cols, "dislikes");
    int idx_rating = find_column(cols, "average_rating");
    if (idx_rating < 0) idx_rating = find_column(cols, "averagerating");
    if (idx_id < 0 || idx_title < 0 || idx_author < 0) {
        cerr << "[catalog] " << path << " lacks id/title/author columns\n";
        return false;
    }

    vector<Item> items;
    string line;
    int lineno = 1;
    int dropped = 0;
    while (getline(in, line)) {
        ++lineno;
        if (line.empty()) continue;
        vector<string> parts = split_csv_line(line);
        int id = 0;
        if (!parse_id_field(field_at(parts, idx_id), id)) {
            ++dropped;
            continue;
        }
        Item it;
        it.id = id;
        it.title = trim_copy(field_at(parts, idx_title));
        it.author = trim_copy(field_at(parts, idx_author));
        if (it.title.empty() || it.author.empty()) {
            ++dropped;
            continue;
        }
        it.description = field_at(parts, idx_desc);
        it.genres = field_at(parts, idx_genres);
        it.cover = field_at(parts, idx_cover);
        int64_t v = 0;
        it.likes = parse_int_field(field_at(parts, idx_likes), v) ? v : -1;
        it.dislikes = parse_int_field(field_at(parts, idx_dislikes), v) ? v : -1;
        double r = 0.0;
        it.average_rating = parse_double_field(field_at(parts, idx_rating), r) ? r : numeric_limits<double>::quiet_NaN();
        items.push_back(std::move(it));
    }
    in.close();
    if (dropped > 0) {
        cerr << "[catalog] dropped " << dropped << " rows without id/title/author from " << path << "\n";
    }
    out_items = std::move(items);
    return true;
}

// user_filter < 0 loads every user
bool load_likes_csv(const string& path, int user_filter, vector<ActivityRecord>& out) {
    ifstream in(path);
    if (!in.is_open()) return false;
    string header;
    if (!getline(in, header)) return true;
    vector<string> cols = split_csv_line(header);
    int idx_user = find_column(cols, "user_id");
    int idx_book = find_column(cols, "book_id");
    int idx_action = find_column(cols, "action");
    int idx_ts = find_column(cols, "timestamp");
    if (idx_user < 0 || idx_book < 0 || idx_action < 0) {
        cerr << "[catalog] " << path << " lacks user_id/book_id/action columns\n";
        return false;
    }
    string line;
    while (getline(in, line)) {
        if (line.empty()) continue;
        vector<string> parts = split_csv_line(line);
        int uid = 0, bid = 0;
        int64_t ts = 0;
        if (!parse_id_field(field_at(parts, idx_user), uid)) continue;
        if (user_filter >= 0 && uid != user_filter) continue;
        if (!parse_id_field(field_at(parts, idx_book), bid)) continue;
        ActivityRecord r;
        if (!parse_activity_kind(trim_copy(field_at(parts, idx_action)), r.kind)) continue;
        r.user_id = uid;
        r.item_id = bid;
        if (parse_int_field(field_at(parts, idx_ts), ts)) r.timestamp = ts;
        out.push_back(r);
    }
    in.close();
    return true;
}

bool load_reviews_csv(const string& path, int user_filter, vector<ActivityRecord>& out) {
    ifstream in(path);
    if (!in.is_open()) return false;
    string header;
    if (!getline(in, header)) return true;
    vector<string> cols = split_csv_line(header);
    int idx_user = find_column(cols, "user_id");
    int idx_book = find_column(cols, "book_id");
    int idx_rating = find_column(cols, "rating");
    int idx_ts = find_column(cols, "timestamp");
    if (idx_user < 0 || idx_book < 0 || idx_rating < 0) {
        cerr << "[catalog] " << path << " lacks user_id/book_id/rating columns\n";
        return false;
    }
    string line;
    while (getline(in, line)) {
        if (line.empty()) continue;
        vector<string> parts = split_csv_line(line);
        int uid = 0, bid = 0;
        int64_t ts = 0;
        double value = 0.0;
        if (!parse_id_field(field_at(parts, idx_user), uid)) continue;
        if (user_filter >= 0 && uid != user_filter) continue;
        if (!parse_id_field(field_at(parts, idx_book), bid)) continue;
        // reviews without a rating are text-only
        if (!parse_double_field(field_at(parts, idx_rating), value)) continue;
        ActivityRecord r;
        r.user_id = uid;
        r.item_id = bid;
        r.kind = ActivityKind::Rating;
        r.value = value;
        if (parse_int_field(field_at(parts, idx_ts), ts)) r.timestamp = ts;
        out.push_back(r);
    }
    in.close();
    return true;
}

bool load_preferences_csv(const string& path, int user_id, StatedPreferences& out, bool& found) {
    found = false;
    ifstream in(path);
    if (!in.is_open()) return false;
    string header;
    if (!getline(in, header)) return true;
    vector<string> cols = split_csv_line(header);
    int idx_user = find_column(cols, "user_id");
    int idx_genres = find_column(cols, "favorite_genres");
    int idx_authors = find_column(cols, "favorite_authors");
    int idx_books = find_column(cols, "favorite_books");
    if (idx_user < 0) return false;
    string line;
    while (getline(in, line)) {
        if (line.empty()) continue;
        vector<string> parts = split_csv_line(line);
        int uid = 0;
        if (!parse_id_field(field_at(parts, idx_user), uid) || uid != user_id) continue;
        out.favorite_genres = field_at(parts, idx_genres);
        out.favorite_authors = field_at(parts, idx_authors);
        out.favorite_books = field_at(parts, idx_books);
        found = true;
        break;
    }
    in.close();
    return true;
}

CsvCatalogRepository::CsvCatalogRepository(const string& data_dir_in) : data_dir(data_dir_in) {}

bool CsvCatalogRepository::list_items(vector<Item>& out) const {
    return load_books_csv(data_dir + "/books.csv", out);
}

static bool file_exists(const string& path) {
    ifstream f(path);
    return f.is_open();
}

// activity files are optional; a file that exists but cannot be parsed is a failure
bool CsvCatalogRepository::get_user_activity(int user_id, UserActivity& out) const {
    UserActivity act;
    string likes_path = data_dir + "/likes.csv";
    string reviews_path = data_dir + "/reviews.csv";
    string users_path = data_dir + "/users.csv";
    if (file_exists(likes_path) && !load_likes_csv(likes_path, user_id, act.like_records)) return false;
    if (file_exists(reviews_path) && !load_reviews_csv(reviews_path, user_id, act.rating_records)) return false;
    if (file_exists(users_path)) {
        bool found = false;
        if (!load_preferences_csv(users_path, user_id, act.preferences, found)) return false;
        act.has_preferences = found;
    }
    out = std::move(act);
    return true;
}

bool CsvCatalogRepository::list_ratings(vector<ActivityRecord>& out) const {
    string reviews_path = data_dir + "/reviews.csv";
    if (!file_exists(reviews_path)) return true;
    return load_reviews_csv(reviews_path, -1, out);
}

bool CsvCatalogRepository::list_all_activity(unordered_map<int, UserActivity>& out) const {
    vector<ActivityRecord> likes;
    vector<ActivityRecord> ratings;
    string likes_path = data_dir + "/likes.csv";
    string reviews_path = data_dir + "/reviews.csv";
    if (file_exists(likes_path) && !load_likes_csv(likes_path, -1, likes)) return false;
    if (file_exists(reviews_path) && !load_reviews_csv(reviews_path, -1, ratings)) return false;
    out.clear();
    for (auto& r : likes) out[r.user_id].like_records.push_back(r);
    for (auto& r : ratings) out[r.user_id].rating_records.push_back(r);
    return true;
}

bool load_catalog(const CatalogRepository& repo, vector<Item>& out_items) {
    vector<Item> items;
    if (!repo.list_items(items)) return false;
    out_items = std::move(items);
    return true;
}
