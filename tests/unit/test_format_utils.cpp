#include <gtest/gtest.h>

#include "castbridge/utils/format_utils.hpp"
#include "castbridge/utils/media_types.hpp"

using namespace castbridge::utils;

TEST(FormatDurationTest, MinutesAndHours) {
    EXPECT_EQ(format_duration(0), "0:00");
    EXPECT_EQ(format_duration(65.9), "1:05");
    EXPECT_EQ(format_duration(3600), "1:00:00");
    EXPECT_EQ(format_duration(7384), "2:03:04");
    EXPECT_EQ(format_duration(-12), "0:00");
}

TEST(ParseSeekTargetTest, RelativeOffsets) {
    EXPECT_EQ(parse_seek_target("+30", 100, 0), 130.0);
    EXPECT_EQ(parse_seek_target("-30", 100, 0), 70.0);
    EXPECT_EQ(parse_seek_target("-500", 100, 0), 0.0);
    EXPECT_EQ(parse_seek_target(" +2.5 ", 10, 0), 12.5);
}

TEST(ParseSeekTargetTest, ClockForms) {
    EXPECT_EQ(parse_seek_target("1:30", 0, 0), 90.0);
    EXPECT_EQ(parse_seek_target("1:02:03", 0, 0), 3723.0);
    EXPECT_EQ(parse_seek_target("45", 0, 0), 45.0);
}

TEST(ParseSeekTargetTest, ClampedToDuration) {
    EXPECT_EQ(parse_seek_target("10:00", 0, 300), 300.0);
    EXPECT_EQ(parse_seek_target("+100", 250, 300), 300.0);
}

TEST(ParseSeekTargetTest, RejectsGarbage) {
    EXPECT_FALSE(parse_seek_target("", 0, 0).has_value());
    EXPECT_FALSE(parse_seek_target("abc", 0, 0).has_value());
    EXPECT_FALSE(parse_seek_target("1:", 0, 0).has_value());
    EXPECT_FALSE(parse_seek_target("1:2:3:4", 0, 0).has_value());
    EXPECT_FALSE(parse_seek_target("+", 0, 0).has_value());
    EXPECT_FALSE(parse_seek_target("inf", 0, 0).has_value());
    EXPECT_FALSE(parse_seek_target("1.2.3", 0, 0).has_value());
}

TEST(FormatBytesTest, Units) {
    EXPECT_EQ(format_bytes(512), "512 B");
    EXPECT_EQ(format_bytes(1536), "1.5 KB");
    EXPECT_EQ(format_bytes(5ULL * 1024 * 1024), "5.0 MB");
}

TEST(MediaTypesTest, ContentTypeFromExtension) {
    EXPECT_EQ(guess_content_type("movie.MP4"), "video/mp4");
    EXPECT_EQ(guess_content_type("/music/track.flac"), "audio/flac");
    EXPECT_EQ(guess_content_type("notes.txt"), "application/octet-stream");
    EXPECT_EQ(guess_content_type("noextension"), "application/octet-stream");
}

TEST(MediaTypesTest, SupportedMedia) {
    EXPECT_TRUE(is_supported_media("clip.webm"));
    EXPECT_TRUE(is_supported_media("photo.JPG"));
    EXPECT_FALSE(is_supported_media("subs.srt"));
    EXPECT_FALSE(is_supported_media("archive.zip"));
}

TEST(MediaTypesTest, ExtensionForContentType) {
    EXPECT_EQ(extension_for_content_type("video/quicktime"), ".mov");
    EXPECT_EQ(extension_for_content_type("audio/mpeg; charset=binary"), ".mp3");
    EXPECT_EQ(extension_for_content_type("application/x-unknown"), "");
}

TEST(MediaTypesTest, Category) {
    EXPECT_EQ(category_of("video/mp4"), MediaCategory::Video);
    EXPECT_EQ(category_of("Audio/FLAC"), MediaCategory::Audio);
    EXPECT_EQ(category_of("image/png"), MediaCategory::Image);
    EXPECT_EQ(category_of("application/json"), MediaCategory::Other);
}
