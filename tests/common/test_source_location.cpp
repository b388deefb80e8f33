#include "common/source_location.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using namespace parsediag;

TEST(ResolveLocationTest, AbsentMeta) {
    auto loc = resolve_location(LocationMeta::none(), "b.ex");
    EXPECT_EQ(loc, (ResolvedLocation{"b.ex", 0}));
}

TEST(ResolveLocationTest, LineOnly) {
    auto loc = resolve_location(LocationMeta::at_line(17), "b.ex");
    EXPECT_EQ(loc.file, "b.ex");
    EXPECT_EQ(loc.line, 17u);
}

TEST(ResolveLocationTest, FileOverrideIsVerbatim) {
    LocationMeta meta;
    meta.line = 3;
    meta.file = FileOverride{"lib/macro.ex", 40};
    auto loc = resolve_location(meta, "b.ex");
    EXPECT_EQ(loc.file, "lib/macro.ex");
    EXPECT_EQ(loc.line, 40u);
}

TEST(ResolveLocationTest, FileOverrideWithLineZero) {
    auto loc = resolve_location(LocationMeta::with_file("lib/macro.ex", 0), "b.ex");
    EXPECT_EQ(loc, (ResolvedLocation{"lib/macro.ex", 0}));
}

TEST(FormatFileLocationTest, WithoutLine) {
    EXPECT_EQ(format_file_location(0, "lib/a.ex"), "lib/a.ex");
}

TEST(FormatFileLocationTest, WithLine) {
    EXPECT_EQ(format_file_location(12, "lib/a.ex"), "lib/a.ex:12");
}

TEST(FormatFileLocationTest, RelativeToWorkingDirectory) {
    auto abs = (std::filesystem::current_path() / "lib" / "a.ex").string();
    EXPECT_EQ(format_file_location(5, abs), "lib/a.ex:5");
}
