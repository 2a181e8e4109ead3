#include "core/ChannelCatalog.h"

#include <gtest/gtest.h>

namespace {

ChannelList sampleChannels() {
    ChannelList list;
    list.append(Channel("zeta news", "News", QString(), "http://z"));
    list.append(Channel("Alpha", "Movies", QString(), "http://a"));
    list.append(Channel("beta", "news", QString(), "http://b"));
    list.append(Channel("Gamma Sports", "", QString(), "http://g"));
    return list;
}

QStringList names(const ChannelList& channels) {
    QStringList out;
    for (int i = 0; i < channels.size(); ++i) out << channels[i].name;
    return out;
}

} // namespace

TEST(ChannelCatalogTest, StartsEmptyWithPlainHeader)
{
    ChannelCatalog catalog;
    EXPECT_TRUE(catalog.isEmpty());
    EXPECT_EQ(catalog.header(), QString("Channels"));
    EXPECT_TRUE(catalog.filter(QString()).isEmpty());
}

TEST(ChannelCatalogTest, ReplaceSwapsWholeListAndLabel)
{
    ChannelCatalog catalog;
    catalog.replace(sampleChannels(), "uk");
    EXPECT_EQ(catalog.size(), 4);
    EXPECT_EQ(catalog.header(), QString("Channels: uk"));

    ChannelList one;
    one.append(Channel("Only", "", QString(), "http://o"));
    catalog.replace(one);
    EXPECT_EQ(catalog.size(), 1);
    EXPECT_EQ(catalog.channels()[0].name, QString("Only"));
    EXPECT_EQ(catalog.header(), QString("Channels"));

    catalog.clear();
    EXPECT_TRUE(catalog.isEmpty());
}

TEST(ChannelCatalogTest, EmptyQueryKeepsEverythingSortedByName)
{
    ChannelCatalog catalog;
    catalog.replace(sampleChannels());
    EXPECT_EQ(names(catalog.filter("")),
              QStringList() << "Alpha" << "beta" << "Gamma Sports" << "zeta news");
    EXPECT_EQ(catalog.filter("   ").size(), 4);
}

TEST(ChannelCatalogTest, QueryMatchesNameOrGroupCaseInsensitively)
{
    ChannelCatalog catalog;
    catalog.replace(sampleChannels());

    EXPECT_EQ(names(catalog.filter("NEWS")), QStringList() << "beta" << "zeta news");
    EXPECT_EQ(names(catalog.filter("  sport ")), QStringList() << "Gamma Sports");
    EXPECT_EQ(names(catalog.filter("movies")), QStringList() << "Alpha");
    EXPECT_TRUE(catalog.filter("nothing-matches").isEmpty());
}

TEST(ChannelCatalogTest, SortIsStableForEqualNames)
{
    ChannelList list;
    list.append(Channel("News", "", QString(), "http://first"));
    list.append(Channel("Arts", "", QString(), "http://arts"));
    list.append(Channel("news", "", QString(), "http://second"));

    ChannelList sorted = ChannelCatalog::filter(list, QString());
    ASSERT_EQ(sorted.size(), 3);
    EXPECT_EQ(sorted[0].streamUrl, QString("http://arts"));
    EXPECT_EQ(sorted[1].streamUrl, QString("http://first"));
    EXPECT_EQ(sorted[2].streamUrl, QString("http://second"));
}

// Test that filtering never mutates the catalog
TEST(ChannelCatalogTest, FilterLeavesCatalogOrderAlone)
{
    ChannelCatalog catalog;
    catalog.replace(sampleChannels());
    catalog.filter("a");
    EXPECT_EQ(catalog.channels()[0].name, QString("zeta news"));
}

TEST(ChannelCatalogTest, LabelFromUrl)
{
    EXPECT_EQ(ChannelCatalog::labelFromUrl("https://iptv-org.github.io/iptv/countries/th.m3u"), QString("th"));
    EXPECT_EQ(ChannelCatalog::labelFromUrl("https://example.com/lists/Sports.M3U8"), QString("Sports"));
    EXPECT_EQ(ChannelCatalog::labelFromUrl("http://provider.tv/get.php?user=x"), QString("provider.tv"));
    EXPECT_EQ(ChannelCatalog::labelFromUrl("http://provider.tv/"), QString("provider.tv"));
    EXPECT_EQ(ChannelCatalog::labelFromUrl("not a url"), QString("Playlist"));
}

TEST(ChannelCatalogTest, LabelFromPath)
{
    EXPECT_EQ(ChannelCatalog::labelFromPath("/home/me/My List.m3u8"), QString("My List"));
    EXPECT_EQ(ChannelCatalog::labelFromPath("favs.m3u"), QString("favs"));
}

TEST(ChannelCatalogTest, MixedCaseExample)
{
    ChannelList list;
    list.append(Channel("BBC", "", QString(), "http://bbc"));
    list.append(Channel("abc", "", QString(), "http://abc"));
    list.append(Channel("Zeta", "", QString(), "http://zeta"));

    EXPECT_EQ(names(ChannelCatalog::filter(list, "b")), QStringList() << "abc" << "BBC");
}

TEST(ChannelCatalogTest, FilterIsIdempotent)
{
    ChannelCatalog catalog;
    catalog.replace(sampleChannels());
    const QStringList queries = QStringList() << "" << "news" << "A" << "zzz";
    for (const QString& q : queries) {
        ChannelList once = catalog.filter(q);
        ChannelList twice = ChannelCatalog::filter(once, q);
        EXPECT_EQ(names(once), names(twice)) << q.toStdString();
    }
}
