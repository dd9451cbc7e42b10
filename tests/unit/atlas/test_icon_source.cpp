#include <gtest/gtest.h>
#include "tessera/atlas/icon_source.hpp"
#include "test_support.hpp"

using namespace tessera;
using namespace tessera::atlas;

TEST(IconSetTest, SortsByIdentifier) {
    auto set = IconSet::create({
        IconSource::from_memory("zoom", ""),
        IconSource::from_memory("Alarm", ""),
        IconSource::from_memory("alarm", ""),
        IconSource::from_memory("arrow-left", ""),
    });
    ASSERT_TRUE(set.is_ok());

    ASSERT_EQ(set.value().size(), 4u);
    // Byte order: uppercase before lowercase
    EXPECT_EQ(set.value()[0].id, "Alarm");
    EXPECT_EQ(set.value()[1].id, "alarm");
    EXPECT_EQ(set.value()[2].id, "arrow-left");
    EXPECT_EQ(set.value()[3].id, "zoom");
}

TEST(IconSetTest, DuplicateIdentifierIsInvalid) {
    auto set = IconSet::create({
        IconSource::from_memory("home", "a"),
        IconSource::from_memory("home", "b"),
    });
    ASSERT_TRUE(set.is_err());
    EXPECT_EQ(set.error().code, PackErrorCode::InvalidConfig);
    EXPECT_NE(set.error().message.find("home"), std::string::npos);
}

TEST(IconSetTest, IdentifierWithTabOrLineBreakIsInvalid) {
    for (const char* id : {"a\tb", "a\nb", "trailing\r"}) {
        auto set = IconSet::create({
            IconSource::from_memory("fine", ""),
            IconSource::from_memory(id, ""),
        });
        ASSERT_TRUE(set.is_err()) << id;
        EXPECT_EQ(set.error().code, PackErrorCode::InvalidConfig);
    }
}

TEST(IconSetTest, EmptyIdentifierIsInvalid) {
    auto set = IconSet::create({IconSource::from_memory("", "")});
    ASSERT_TRUE(set.is_err());
    EXPECT_EQ(set.error().code, PackErrorCode::InvalidConfig);
}

TEST(IconSetTest, IdentifierWithSpacesIsKept) {
    auto set = IconSet::create({IconSource::from_memory("arrow left", "")});
    ASSERT_TRUE(set.is_ok());
    EXPECT_EQ(set.value()[0].id, "arrow left");
}

TEST(IconSetTest, EmptySetIsAllowed) {
    auto set = IconSet::create({});
    ASSERT_TRUE(set.is_ok());
    EXPECT_TRUE(set.value().empty());
}

TEST(IconSetTest, TruncatedKeepsPrefix) {
    std::vector<IconSource> sources;
    for (char c = 'a'; c <= 'j'; ++c) {
        sources.push_back(IconSource::from_memory(std::string(1, c), ""));
    }
    auto set = IconSet::create(std::move(sources));
    ASSERT_TRUE(set.is_ok());

    IconSet first = set.value().truncated(3);
    ASSERT_EQ(first.size(), 3u);
    EXPECT_EQ(first[2].id, "c");

    EXPECT_EQ(set.value().truncated(50).size(), 10u);
}

TEST(IconSourceTest, MemoryContent) {
    IconSource source = IconSource::from_memory("x", "<svg/>");
    auto text = source.content->read();
    ASSERT_TRUE(text.is_ok());
    EXPECT_EQ(text.value(), "<svg/>");
    EXPECT_EQ(source.content->describe(), "<memory>");
}

TEST(IconSourceTest, FileContent) {
    fixtures::TempDir dir;
    fixtures::write_text(dir / "star.svg", "<svg viewBox=\"0 0 1 1\"/>");

    IconSource source = IconSource::from_file("star", dir / "star.svg");
    auto text = source.content->read();
    ASSERT_TRUE(text.is_ok());
    EXPECT_EQ(text.value(), "<svg viewBox=\"0 0 1 1\"/>");
    EXPECT_NE(source.content->describe().find("star.svg"), std::string::npos);
}

TEST(IconSourceTest, MissingFileIsReadError) {
    IconSource source = IconSource::from_file("ghost", "/nonexistent/tessera/ghost.svg");
    auto text = source.content->read();
    ASSERT_TRUE(text.is_err());
    EXPECT_EQ(text.error().code, PackErrorCode::ReadError);
}
