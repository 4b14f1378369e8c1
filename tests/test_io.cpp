#include <gtest/gtest.h>
#include "engine_config.h"
#include "catalog_loader.h"
#include "serializer.h"
#include "data_explorer.h"
#include "evaluator.h"
#include "recommender.h"
#include "utils.h"
#include "test_helpers.h"

#include <filesystem>
#include <fstream>
#include <cmath>
#include <limits>
#include <cstdlib>
#include <unordered_map>

namespace fs = std::filesystem;

namespace {

class TempDataDir : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() /
              ("bookrec_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir);
        fs::create_directories(dir);
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
    void write(const std::string& name, const std::string& content) {
        std::ofstream out(dir / name);
        out << content;
    }
    std::string path() const { return dir.string(); }

    fs::path dir;
};

const char* kBooks =
    "id,title,author,description,genres,cover,likes,dislikes,average_rating\n"
    "1,Dune,Herbert,\"Desert planet, spice\",scifi,dune.jpg,100,2,4.8\n"
    "2,Dune Messiah,Herbert,,scifi,,10,1,4.0\n"
    "3,Cooking 101,Chef,Basics,food,,5,,\n"
    "4,,Nobody,missing title,,,1,0,1.0\n";

}  // namespace

TEST(UtilsTest, SplitCsvHandlesQuotes) {
    std::vector<std::string> parts = split_csv_line("1,\"a, b\",\"say \"\"hi\"\"\",");
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[1], "a, b");
    EXPECT_EQ(parts[2], "say \"hi\"");
    EXPECT_EQ(parts[3], "");
}

TEST(UtilsTest, NumericFields) {
    int64_t i = 0;
    double d = 0.0;
    EXPECT_TRUE(parse_int_field(" 42 ", i));
    EXPECT_EQ(i, 42);
    EXPECT_FALSE(parse_int_field("", i));
    EXPECT_FALSE(parse_int_field("4x", i));
    EXPECT_TRUE(parse_double_field("3.5", d));
    EXPECT_DOUBLE_EQ(d, 3.5);
    EXPECT_FALSE(parse_double_field("null", d));
    EXPECT_EQ(split_tags(" scifi , ,classic", ',').size(), 2u);
}

TEST(UtilsTest, IdFieldsMustFitInInt) {
    int id = -7;
    EXPECT_TRUE(parse_id_field("2147483647", id));
    EXPECT_EQ(id, 2147483647);
    EXPECT_FALSE(parse_id_field("2147483648", id));
    EXPECT_FALSE(parse_id_field("4294967297", id));
    EXPECT_FALSE(parse_id_field("-1", id));
    EXPECT_FALSE(parse_id_field("", id));
    EXPECT_EQ(id, 2147483647);
}

TEST(EngineConfigTest, Defaults) {
    EngineConfig cfg;
    EXPECT_DOUBLE_EQ(cfg.penalty_weight, 0.3);
    EXPECT_DOUBLE_EQ(cfg.diversity_factor, 0.3);
    EXPECT_EQ(cfg.min_df, 2);
    EXPECT_DOUBLE_EQ(cfg.max_df_ratio, 0.8);
    EXPECT_EQ(cfg.max_features, 5000);
    EXPECT_EQ(cfg.ngram_max, 2);
    EXPECT_EQ(cfg.candidate_multiplier, 2);
}

TEST(EngineConfigTest, RejectsOutOfRangeValues) {
    EngineConfig cfg;
    EXPECT_FALSE(apply_config_entry(cfg, "diversity_factor", "1.5"));
    EXPECT_FALSE(apply_config_entry(cfg, "min_df", "zero"));
    EXPECT_FALSE(apply_config_entry(cfg, "unknown", "1"));
    EXPECT_DOUBLE_EQ(cfg.diversity_factor, 0.3);
    EXPECT_TRUE(apply_config_entry(cfg, "penalty_weight", "0.5"));
    EXPECT_DOUBLE_EQ(cfg.penalty_weight, 0.5);
}

TEST_F(TempDataDir, EngineConfigFileIsParsed) {
    write("engine.cfg", "# comment\ndata_dir = /srv/books\npenalty_weight=0.25\nbogus line\nverbose=true\nmax_features=100\n");
    EngineConfig cfg;
    ASSERT_TRUE(load_engine_config((dir / "engine.cfg").string(), cfg));
    EXPECT_EQ(cfg.data_dir, "/srv/books");
    EXPECT_DOUBLE_EQ(cfg.penalty_weight, 0.25);
    EXPECT_TRUE(cfg.verbose);
    EXPECT_EQ(cfg.max_features, 100);
    EngineConfig untouched;
    EXPECT_FALSE(load_engine_config((dir / "missing.cfg").string(), untouched));
    EXPECT_EQ(untouched.data_dir, "data");
}

TEST_F(TempDataDir, BooksAreDecodedAndInvalidRowsDropped) {
    write("books.csv", kBooks);
    std::vector<Item> items;
    ASSERT_TRUE(load_books_csv((dir / "books.csv").string(), items));
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0].description, "Desert planet, spice");
    EXPECT_EQ(items[0].likes, 100);
    EXPECT_DOUBLE_EQ(items[0].average_rating, 4.8);
    EXPECT_EQ(items[2].dislikes, -1);
    EXPECT_TRUE(std::isnan(items[2].average_rating));
}

TEST_F(TempDataDir, OversizedIdsAreDroppedNotTruncated) {
    write("books.csv", std::string(kBooks) + "4294967298,Alias,Someone,,,,1,0,1.0\n");
    write("likes.csv", "user_id,book_id,action\n1,1,like\n4294967297,2,like\n1,4294967299,dislike\n");
    write("reviews.csv", "user_id,book_id,rating\n4294967297,3,5\n1,4294967299,2\n");
    CsvCatalogRepository repo(path());
    std::vector<Item> items;
    ASSERT_TRUE(repo.list_items(items));
    ASSERT_EQ(items.size(), 3u);
    for (const Item& it : items) EXPECT_NE(it.title, "Alias");
    UserActivity act;
    ASSERT_TRUE(repo.get_user_activity(1, act));
    ASSERT_EQ(act.like_records.size(), 1u);
    EXPECT_EQ(act.like_records[0].item_id, 1);
    EXPECT_TRUE(act.rating_records.empty());
    std::unordered_map<int, UserActivity> all;
    ASSERT_TRUE(repo.list_all_activity(all));
    EXPECT_EQ(all.size(), 1u);
}

TEST_F(TempDataDir, MissingBooksFileIsRepositoryFailure) {
    CsvCatalogRepository repo(path());
    std::vector<Item> items;
    EXPECT_FALSE(repo.list_items(items));
    EngineConfig cfg;
    Recommender rec(&repo, cfg);
    std::vector<Recommendation> out;
    EXPECT_FALSE(rec.recommend(1, -1, 4, out));
}

TEST_F(TempDataDir, ActivityIsReadPerUser) {
    write("books.csv", kBooks);
    write("likes.csv", "user_id,book_id,action\n1,1,like\n1,2,dislike\n2,3,like\n1,3,download\n1,9,shrug\n");
    write("reviews.csv", "user_id,book_id,rating\n1,3,4\n2,1,5\n1,2,\n");
    write("users.csv", "user_id,favorite_genres,favorite_authors,favorite_books\n1,scifi,Herbert,Dune\n");
    CsvCatalogRepository repo(path());
    UserActivity act;
    ASSERT_TRUE(repo.get_user_activity(1, act));
    EXPECT_EQ(act.like_records.size(), 3u);
    ASSERT_EQ(act.rating_records.size(), 1u);
    EXPECT_DOUBLE_EQ(act.rating_records[0].value, 4.0);
    EXPECT_TRUE(act.has_preferences);
    EXPECT_EQ(act.preferences.favorite_genres, "scifi");

    UserActivity none;
    ASSERT_TRUE(repo.get_user_activity(77, none));
    EXPECT_TRUE(none.like_records.empty());
    EXPECT_FALSE(none.has_preferences);

    std::unordered_map<int, UserActivity> all;
    ASSERT_TRUE(repo.list_all_activity(all));
    EXPECT_EQ(all.size(), 2u);
}

TEST_F(TempDataDir, EndToEndRecommendationFromCsv) {
    write("books.csv", kBooks);
    write("likes.csv", "user_id,book_id,action\n1,1,like\n");
    CsvCatalogRepository repo(path());
    EngineConfig cfg;
    Recommender rec(&repo, cfg);
    std::vector<Recommendation> out;
    ASSERT_TRUE(rec.recommend(1, -1, 2, out));
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].item.id, 2);
    EXPECT_EQ(out[1].item.id, 3);

    std::vector<Recommendation> cold;
    ASSERT_TRUE(rec.recommend(2, -1, 2, cold));
    ASSERT_EQ(cold.size(), 2u);
    EXPECT_EQ(cold[0].item.id, 1);
}

TEST(SerializerTest, EscapesStrings) {
    EXPECT_EQ(json_escape("a\"b\\c\n"), "a\\\"b\\\\c\\n");
    EXPECT_EQ(error_json("bad \"id\""), "{\"error\":\"bad \\\"id\\\"\"}");
}

TEST(SerializerTest, AbsentNumbersBecomeNull) {
    Recommendation r;
    r.item = make_item(3, "Cooking 101", "Chef", -1, std::numeric_limits<double>::quiet_NaN());
    r.item.dislikes = -1;
    r.score = std::numeric_limits<double>::infinity();
    r.source = RecommendationSource::Popularity;
    std::string js = recommendations_to_json(std::vector<Recommendation>(1, r));
    EXPECT_NE(js.find("\"likes\":null"), std::string::npos);
    EXPECT_NE(js.find("\"dislikes\":null"), std::string::npos);
    EXPECT_NE(js.find("\"averageRating\":null"), std::string::npos);
    EXPECT_NE(js.find("\"score\":null"), std::string::npos);
    EXPECT_NE(js.find("\"source\":\"popularity\""), std::string::npos);
    EXPECT_EQ(js.find("nan"), std::string::npos);
}

TEST(SerializerTest, DefaultItemRatingIsAbsent) {
    Item it;
    EXPECT_TRUE(std::isnan(it.average_rating));
    EXPECT_EQ(it.likes, -1);
    EXPECT_DOUBLE_EQ(rating_or_zero(it.average_rating), 0.0);
    Recommendation r;
    r.item = it;
    EXPECT_NE(recommendations_to_json(std::vector<Recommendation>(1, r)).find("\"averageRating\":null"), std::string::npos);
}

TEST(SerializerTest, PreservesOrderAndNumbers) {
    std::vector<Recommendation> recs;
    for (int id : {5, 2, 9}) {
        Recommendation r;
        r.item = make_item(id, "T", "A", 3, 4.5);
        r.score = 0.25;
        recs.push_back(r);
    }
    std::string js = recommendations_to_json(recs);
    size_t p5 = js.find("\"id\":5");
    size_t p2 = js.find("\"id\":2");
    size_t p9 = js.find("\"id\":9");
    ASSERT_NE(p5, std::string::npos);
    EXPECT_LT(p5, p2);
    EXPECT_LT(p2, p9);
    EXPECT_NE(js.find("\"score\":0.25,"), std::string::npos);
    EXPECT_NE(js.find("\"likes\":3"), std::string::npos);
    EXPECT_EQ(recommendations_to_json(std::vector<Recommendation>()), "{\"recommendations\":[]}");
}

TEST(SerializerTest, SmallScoresKeepTheirPrecision) {
    std::vector<Recommendation> recs(2);
    recs[0].item = make_item(1, "T", "A", 1, 1.0);
    recs[0].score = 3e-7;
    recs[1].item = make_item(2, "T", "A", 1, 1.0);
    recs[1].score = 1e-7;
    std::string js = recommendations_to_json(recs);
    std::vector<double> scores;
    size_t pos = 0;
    const std::string key = "\"score\":";
    while ((pos = js.find(key, pos)) != std::string::npos) {
        pos += key.size();
        scores.push_back(std::strtod(js.c_str() + pos, nullptr));
    }
    ASSERT_EQ(scores.size(), 2u);
    EXPECT_DOUBLE_EQ(scores[0], 3e-7);
    EXPECT_DOUBLE_EQ(scores[1], 1e-7);
}

TEST(DataExplorerTest, ComputesCatalogStats) {
    std::vector<Item> items = dune_catalog();
    items[0].genres = "scifi, classic";
    items[1].genres = "scifi";
    items[2].genres = "food";
    std::vector<ActivityRecord> reviews = {rating_of(1, 1, 5.0), rating_of(2, 1, 5.0), rating_of(3, 2, 4.0)};
    DataExplorer de;
    CatalogStats st = de.compute_stats(items, reviews);
    EXPECT_EQ(st.items, 3u);
    EXPECT_DOUBLE_EQ(st.likes_median, 10.0);
    ASSERT_FALSE(st.top_genres.empty());
    EXPECT_EQ(st.top_genres[0].first, "scifi");
    EXPECT_EQ(st.top_genres[0].second, 2);
    ASSERT_EQ(st.rating_distribution.size(), 2u);
    EXPECT_EQ(st.rating_distribution[1].first, 5);
    EXPECT_EQ(st.rating_distribution[1].second, 2);
    ASSERT_EQ(st.popular_items.size(), 3u);
    EXPECT_EQ(st.popular_items[0].first, 1);
}

TEST_F(TempDataDir, ExplorerWritesStatsFile) {
    DataExplorer de;
    std::string prefix = (dir / "explore").string();
    ASSERT_TRUE(de.analyze_catalog(dune_catalog(), std::vector<ActivityRecord>(), prefix));
    EXPECT_TRUE(fs::exists(prefix + "_stats.txt"));
}

TEST(EvaluatorTest, HoldoutFindsHiddenSibling) {
    std::vector<Item> items;
    items.push_back(make_item(1, "Dune", "Herbert", 100, 4.8, "scifi desert"));
    items.push_back(make_item(2, "Dune Messiah", "Herbert", 10, 4.0, "scifi desert"));
    items.push_back(make_item(3, "Cooking 101", "Chef", 5, 3.0, "food"));
    items.push_back(make_item(4, "Baking Bread", "Chef", 4, 3.5, "food"));
    std::unordered_map<int, UserActivity> acts;
    acts[1].like_records = {like_of(1, 1), like_of(1, 2)};
    acts[2].like_records = {like_of(2, 3)};
    EngineConfig cfg;
    EvalMetrics m = evaluate_holdout(items, acts, cfg, 10, 2);
    EXPECT_EQ(m.users_tested, 1);
    EXPECT_DOUBLE_EQ(m.hit_at_k, 1.0);
    EXPECT_DOUBLE_EQ(m.precision_at_k, 0.5);
    EXPECT_GT(m.content_share, 0.0);
}

TEST(EvaluatorTest, NoEligibleUsers) {
    std::unordered_map<int, UserActivity> acts;
    acts[2].like_records = {like_of(2, 3)};
    EngineConfig cfg;
    EvalMetrics m = evaluate_holdout(dune_catalog(), acts, cfg, 10, 2);
    EXPECT_EQ(m.users_tested, 0);
}
