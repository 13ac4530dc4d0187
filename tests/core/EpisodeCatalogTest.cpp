#include "core/EpisodeCatalog.hpp"
#include "core/Errors.hpp"
#include "TestSupport.hpp"
#include <gtest/gtest.h>

using namespace podcapture::core;
using namespace podcapture::test;

namespace {

constexpr std::chrono::seconds kRetention = std::chrono::hours(24 * 21);

Episode makeEpisode(const std::string& key, std::chrono::system_clock::time_point published,
                    std::vector<std::string> partPaths = {}) {
    Episode episode;
    episode.key = key;
    episode.showName = "Show " + key;
    episode.title = "Title " + key;
    episode.publishInstant = published;
    if (partPaths.empty()) {
        partPaths.push_back("episodes_mp3/" + key + ".mp3");
    }
    for (size_t i = 0; i < partPaths.size(); ++i) {
        episode.parts.push_back(AudioPart{static_cast<int>(i) + 1, partPaths[i], 100});
    }
    return episode;
}

class EpisodeCatalogTest : public ::testing::Test {
protected:
    fs::path storage() const { return dir / "downloaded_episodes.json"; }

    TempDir dir;
    const std::chrono::system_clock::time_point now = parseIsoUtc("2025-10-19T02:00:00Z");
};

} // namespace

TEST_F(EpisodeCatalogTest, MissingFileLoadsEmpty) {
    EpisodeCatalog catalog(storage(), dir.path());
    catalog.load();
    EXPECT_TRUE(catalog.empty());
}

TEST_F(EpisodeCatalogTest, SaveThenLoadReproducesCatalog) {
    EpisodeCatalog catalog(storage(), dir.path());
    catalog.insert(makeEpisode("a", now, {"episodes_mp3/a_part001.mp3", "episodes_mp3/a_part002.mp3"}));
    catalog.insert(makeEpisode("b", now - std::chrono::hours(1)));
    catalog.save();

    EXPECT_TRUE(fs::exists(storage()));
    EXPECT_FALSE(fs::exists(dir / "downloaded_episodes.json.tmp"));

    EpisodeCatalog reloaded(storage(), dir.path());
    reloaded.load();
    ASSERT_EQ(reloaded.size(), 2u);
    EXPECT_EQ(reloaded.episodes(), catalog.episodes());

    auto a = reloaded.find("a");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->parts.size(), 2u);
    EXPECT_FALSE(reloaded.find("missing").has_value());
}

TEST_F(EpisodeCatalogTest, ResavingLoadedCatalogIsByteIdentical) {
    Episode rich = makeEpisode("2025-10-18_1900-0700_The_Smear_Campaign", now,
                               {"episodes_mp3/smear_part001.mp3", "episodes_mp3/smear_part002.mp3"});
    rich.descriptionHtml = "<p><strong>The Smear Campaign</strong></p>\n<p>Tracklist:</p>";
    rich.imageRef = "https://spinitron.com/images/smear.jpg";
    rich.authorName = "DJ Tone Deaf";
    rich.sourceUrl = "https://spinitron.com/KTAL/pl/1/The-Smear-Campaign";

    {
        EpisodeCatalog catalog(storage(), dir.path());
        catalog.insert(rich);
        catalog.insert(makeEpisode("b", now - std::chrono::hours(1)));
        catalog.save();
    }
    const std::string first = readFile(storage());
    ASSERT_FALSE(first.empty());

    for (int pass = 0; pass < 2; ++pass) {
        EpisodeCatalog catalog(storage(), dir.path());
        catalog.load();
        ASSERT_EQ(catalog.size(), 2u);
        catalog.save();
        EXPECT_EQ(readFile(storage()), first) << "after resave " << pass + 1;
    }
}

TEST_F(EpisodeCatalogTest, DuplicateKeyIsRejected) {
    EpisodeCatalog catalog(storage(), dir.path());
    catalog.insert(makeEpisode("a", now));

    try {
        catalog.insert(makeEpisode("a", now));
        FAIL() << "expected DuplicateKeyError";
    } catch (const DuplicateKeyError& e) {
        EXPECT_EQ(e.key(), "a");
    }
    EXPECT_EQ(catalog.size(), 1u);
    EXPECT_TRUE(catalog.contains("a"));
}

TEST_F(EpisodeCatalogTest, EpisodesAreNewestFirstThenByKey) {
    EpisodeCatalog catalog(storage(), dir.path());
    catalog.insert(makeEpisode("old", now - std::chrono::hours(48)));
    catalog.insert(makeEpisode("z-new", now));
    catalog.insert(makeEpisode("a-new", now));

    auto ordered = catalog.episodes();
    ASSERT_EQ(ordered.size(), 3u);
    EXPECT_EQ(ordered[0].key, "a-new");
    EXPECT_EQ(ordered[1].key, "z-new");
    EXPECT_EQ(ordered[2].key, "old");
}

TEST_F(EpisodeCatalogTest, CorruptFileLoadsEmpty) {
    writeFile(storage(), "{ not json");
    EpisodeCatalog catalog(storage(), dir.path());
    catalog.load();
    EXPECT_TRUE(catalog.empty());

    writeFile(storage(), "[1, 2, 3]");
    catalog.load();
    EXPECT_TRUE(catalog.empty());
}

TEST_F(EpisodeCatalogTest, MalformedEntryIsSkipped) {
    EpisodeCatalog catalog(storage(), dir.path());
    catalog.insert(makeEpisode("good", now));
    catalog.save();

    auto j = nlohmann::json::parse(readFile(storage()));
    j["bad"] = {{"title", "no parts or date"}};
    writeFile(storage(), j.dump());

    EpisodeCatalog reloaded(storage(), dir.path());
    reloaded.load();
    EXPECT_EQ(reloaded.size(), 1u);
    EXPECT_TRUE(reloaded.contains("good"));
}

TEST_F(EpisodeCatalogTest, EvictionHonorsRetentionBoundary) {
    EpisodeCatalog catalog(storage(), dir.path());
    catalog.insert(makeEpisode("boundary", now - kRetention));
    catalog.insert(makeEpisode("expired", now - kRetention - std::chrono::seconds(1),
                               {"episodes_mp3/expired_part001.mp3", "episodes_mp3/expired_part002.mp3"}));
    catalog.insert(makeEpisode("fresh", now));

    writeFile(dir / "episodes_mp3/expired_part001.mp3", "x");
    writeFile(dir / "episodes_mp3/expired_part002.mp3", "x");
    writeFile(dir / "episodes_mp3/fresh.mp3", "x");

    auto evicted = catalog.evictOlderThan(kRetention, now);

    ASSERT_EQ(evicted.size(), 1u);
    EXPECT_EQ(evicted[0].key, "expired");
    EXPECT_FALSE(catalog.contains("expired"));
    EXPECT_TRUE(catalog.contains("boundary"));
    EXPECT_TRUE(catalog.contains("fresh"));
    EXPECT_FALSE(fs::exists(dir / "episodes_mp3/expired_part001.mp3"));
    EXPECT_FALSE(fs::exists(dir / "episodes_mp3/expired_part002.mp3"));
    EXPECT_TRUE(fs::exists(dir / "episodes_mp3/fresh.mp3"));
}

TEST_F(EpisodeCatalogTest, EvictionToleratesMissingPartFiles) {
    EpisodeCatalog catalog(storage(), dir.path());
    catalog.insert(makeEpisode("gone", now - kRetention - std::chrono::hours(1)));

    EXPECT_EQ(catalog.evictOlderThan(kRetention, now).size(), 1u);
    EXPECT_TRUE(catalog.empty());
}

TEST_F(EpisodeCatalogTest, PruneRemovesOnlyOldUnreferencedAudio) {
    const auto mediaDir = dir / "episodes_mp3";
    const auto wallNow = std::chrono::system_clock::now();
    const auto old = fs::file_time_type::clock::now() - std::chrono::hours(24 * 30);

    writeFile(mediaDir / "orphan.mp3", "x");
    writeFile(mediaDir / "kept.mp3", "x");
    writeFile(mediaDir / "notes.txt", "x");
    writeFile(mediaDir / "recent.mp3", "x");
    fs::last_write_time(mediaDir / "orphan.mp3", old);
    fs::last_write_time(mediaDir / "kept.mp3", old);
    fs::last_write_time(mediaDir / "notes.txt", old);

    EpisodeCatalog catalog(storage(), dir.path());
    catalog.insert(makeEpisode("kept", wallNow, {"episodes_mp3/kept.mp3"}));

    auto removed = catalog.pruneStaleMedia(mediaDir, kRetention, wallNow);

    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0].filename().string(), "orphan.mp3");
    EXPECT_FALSE(fs::exists(mediaDir / "orphan.mp3"));
    EXPECT_TRUE(fs::exists(mediaDir / "kept.mp3"));
    EXPECT_TRUE(fs::exists(mediaDir / "notes.txt"));
    EXPECT_TRUE(fs::exists(mediaDir / "recent.mp3"));
}

TEST_F(EpisodeCatalogTest, PruneIgnoresMissingMediaDir) {
    EpisodeCatalog catalog(storage(), dir.path());
    EXPECT_TRUE(catalog.pruneStaleMedia(dir / "nowhere", kRetention, now).empty());
}
