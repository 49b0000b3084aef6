/**
 * @file HashEngineTest.cpp
 * @brief Unit tests for single-pass MD5/SHA1/SHA256 hashing
 */

#include "services/HashEngine.hpp"

#include "fixtures/TestFixtures.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <sstream>

using ::testing::HasSubstr;

class HashEngineTest : public TempDirFixture {
protected:
    std::ostringstream progress;
    HashEngine engine{progress};
};

TEST_F(HashEngineTest, Hash_KnownContent_MatchesReferenceDigests) {
    const auto file = write_file("abc.bin", "abc");

    auto hashed = engine.hash(file);

    ASSERT_TRUE(hashed.has_value());
    EXPECT_EQ(hashed->path, file);
    EXPECT_EQ(hashed->md5, "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(hashed->sha1, "a9993e364706816aba3e25717850c26c9cd0d89d");
    EXPECT_EQ(hashed->sha256, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(HashEngineTest, Hash_EmptyFile_DigestsOfEmptyInput) {
    const auto file = write_file("empty.bin", "");

    auto hashed = engine.hash(file);

    ASSERT_TRUE(hashed.has_value());
    EXPECT_EQ(hashed->md5, "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(hashed->sha1, "da39a3ee5e6b4b0d3255bfef95601890afd80709");
    EXPECT_EQ(hashed->sha256, "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_THAT(progress.str(), HasSubstr("100% \n"));
}

TEST_F(HashEngineTest, Hash_MultiChunkFile_MarksEveryTwentyPercentWithNewline) {
    const auto file = write_file("five_chunks.bin", std::string(5 * HashEngine::CHUNK_SIZE, 'x'));

    auto hashed = engine.hash(file);

    ASSERT_TRUE(hashed.has_value());
    EXPECT_EQ(progress.str(), "\nHashing " + file.string() +
                                  "\n20% \n40% \n60% \n80% \n100% \nHashing completed\n");
}

TEST_F(HashEngineTest, Hash_PartialLastChunk_ReachesHundredPercent) {
    const auto file =
        write_file("uneven.bin", std::string(3 * HashEngine::CHUNK_SIZE + 100, '\0'));

    auto hashed = engine.hash(file);

    ASSERT_TRUE(hashed.has_value());
    EXPECT_THAT(progress.str(), HasSubstr("100% \nHashing completed\n"));
}

TEST_F(HashEngineTest, Hash_SameContentDifferentChunking_SameDigests) {
    const std::string content(2 * HashEngine::CHUNK_SIZE + 7, 'q');
    const auto a = write_file("a.bin", content);
    const auto b = write_file("b.bin", content);

    auto first = engine.hash(a);
    auto second = engine.hash(b);

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->sha256, second->sha256);
    EXPECT_EQ(first->md5, second->md5);
}

TEST_F(HashEngineTest, Hash_MissingFile_ReturnsIoFailure) {
    auto hashed = engine.hash(temp_dir / "missing.dmg");

    ASSERT_FALSE(hashed.has_value());
    EXPECT_EQ(hashed.error().kind, util::ErrorKind::IO_FAILURE);
}

TEST_F(HashEngineTest, Hash_Directory_ReturnsIoFailure) {
    auto hashed = engine.hash(temp_dir);

    ASSERT_FALSE(hashed.has_value());
    EXPECT_EQ(hashed.error().kind, util::ErrorKind::IO_FAILURE);
}
