#ifndef CATALOG_LOADER_H
#define CATALOG_LOADER_H

#include <string>
#include <vector>
#include <unordered_map>
#include "item.h"

// Read side of the data store. A false return is a repository failure.
class CatalogRepository {
public:
    virtual ~CatalogRepository() {}
    virtual bool list_items(std::vector<Item>& out) const = 0;
    virtual bool get_user_activity(int user_id, UserActivity& out) const = 0;
};

// Reads books.csv / likes.csv / reviews.csv / users.csv from a directory on every call.
class CsvCatalogRepository : public CatalogRepository {
public:
    explicit CsvCatalogRepository(const std::string& data_dir);
    bool list_items(std::vector<Item>& out) const override;
    bool get_user_activity(int user_id, UserActivity& out) const override;
    bool list_ratings(std::vector<ActivityRecord>& out) const;
    bool list_all_activity(std::unordered_map<int, UserActivity>& out) const;
    const std::string& dir() const { return data_dir; }
private:
    std::string data_dir;
};

bool load_catalog(const CatalogRepository& repo, std::vector<Item>& out_items);

bool load_books_csv(const std::string& path, std::vector<Item>& out_items);
bool load_likes_csv(const std::string& path, int user_filter, std::vector<ActivityRecord>& out);
bool load_reviews_csv(const std::string& path, int user_filter, std::vector<ActivityRecord>& out);
bool load_preferences_csv(const std::string& path, int user_id, StatedPreferences& out, bool& found);

#endif
