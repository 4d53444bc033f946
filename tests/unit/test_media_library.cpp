#include <gtest/gtest.h>

#include "castbridge/services/media/media_library.hpp"
#include "castbridge/utils/uuid.hpp"

#include <fstream>

using namespace castbridge;
using namespace castbridge::services;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

class MediaLibraryTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = fs::temp_directory_path() / ("castbridge-library-" + utils::Uuid::generate_v4().to_hex());
        fs::create_directories(root);
        library = std::make_unique<MediaLibrary>(root / "uploads");
    }

    void TearDown() override {
        library.reset();
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    fs::path write_file(const std::string& name, const std::string& content) {
        auto path = root / name;
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    fs::path root;
    std::unique_ptr<MediaLibrary> library;
};

TEST_F(MediaLibraryTest, AddFileRegistersToken) {
    auto path = write_file("movie.mp4", "0123456789");

    auto served = library->add_file(path);
    ASSERT_TRUE(served);
    EXPECT_FALSE(served->token.empty());
    EXPECT_EQ(served->display_name, "movie.mp4");
    EXPECT_EQ(served->content_type, "video/mp4");
    EXPECT_EQ(served->size, 10u);
    EXPECT_FALSE(served->owned);

    auto resolved = library->resolve(served->token);
    ASSERT_TRUE(resolved);
    EXPECT_EQ(resolved->path, served->path);
}

TEST_F(MediaLibraryTest, SamePathReusesToken) {
    auto path = write_file("song.mp3", "abc");

    auto first = library->add_file(path);
    auto second = library->add_file(path);
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(first->token, second->token);
    EXPECT_EQ(library->size(), 1u);
}

TEST_F(MediaLibraryTest, MissingFileIsNotFound) {
    auto served = library->add_file(root / "nope.mp4");
    ASSERT_FALSE(served);
    EXPECT_EQ(served.error().error, core::CastError::NotFound);
}

TEST_F(MediaLibraryTest, DirectoryIsRejected) {
    fs::create_directories(root / "folder.mp4");
    auto served = library->add_file(root / "folder.mp4");
    ASSERT_FALSE(served);
    EXPECT_EQ(served.error().error, core::CastError::InvalidInput);
}

TEST_F(MediaLibraryTest, UnknownTokenIsNotFound) {
    auto resolved = library->resolve("does-not-exist");
    ASSERT_FALSE(resolved);
    EXPECT_EQ(resolved.error().error, core::CastError::NotFound);
}

TEST_F(MediaLibraryTest, VanishedFileIsNotFound) {
    auto path = write_file("clip.webm", "data");
    auto served = library->add_file(path);
    ASSERT_TRUE(served);

    fs::remove(path);
    auto resolved = library->resolve(served->token);
    ASSERT_FALSE(resolved);
    EXPECT_EQ(resolved.error().error, core::CastError::NotFound);
}

TEST_F(MediaLibraryTest, UploadPathKeepsExtensionInsideUploadDir) {
    auto path = library->reserve_upload_path("holiday.MOV", "video/quicktime");
    EXPECT_EQ(path.parent_path(), library->upload_dir());
    EXPECT_EQ(path.extension(), ".mov");

    auto from_type = library->reserve_upload_path("", "video/mp4");
    EXPECT_EQ(from_type.extension(), ".mp4");

    EXPECT_NE(library->reserve_upload_path("a.mp4", ""), library->reserve_upload_path("a.mp4", ""));
}

TEST_F(MediaLibraryTest, AdoptedUploadIsDeletedOnRemove) {
    auto stored = library->reserve_upload_path("clip.mov", "video/quicktime");
    {
        std::ofstream out(stored, std::ios::binary);
        out << "frames";
    }

    auto served = library->adopt_upload(stored, "clip.mov", "application/octet-stream", 1h);
    ASSERT_TRUE(served);
    EXPECT_TRUE(served->owned);
    EXPECT_EQ(served->display_name, "clip.mov");
    EXPECT_EQ(served->content_type, "video/quicktime");
    EXPECT_EQ(served->size, 6u);

    EXPECT_TRUE(library->remove(served->token));
    EXPECT_FALSE(fs::exists(stored));
    EXPECT_FALSE(library->remove(served->token));
}

TEST_F(MediaLibraryTest, ExpiredUploadIsPurged) {
    auto stored = library->reserve_upload_path("old.mp4", "video/mp4");
    {
        std::ofstream out(stored, std::ios::binary);
        out << "x";
    }

    auto served = library->adopt_upload(stored, "old.mp4", "video/mp4", 0s);
    ASSERT_TRUE(served);

    auto resolved = library->resolve(served->token);
    ASSERT_FALSE(resolved);
    EXPECT_EQ(resolved.error().error, core::CastError::NotFound);

    EXPECT_EQ(library->purge_expired(), 1u);
    EXPECT_FALSE(fs::exists(stored));
    EXPECT_EQ(library->size(), 0u);
}

TEST_F(MediaLibraryTest, RegisteredLocalFilesSurviveLibrary) {
    auto path = write_file("keep.mp4", "keep");
    ASSERT_TRUE(library->add_file(path));

    library.reset();
    EXPECT_TRUE(fs::exists(path));
}
