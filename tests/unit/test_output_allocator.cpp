#include <gtest/gtest.h>

#include "OutputAllocator.h"
#include "TestDoubles.h"

#include <memory>
#include <regex>

using namespace Ferry;
using namespace Ferry::Testing;

namespace {
    VoidResult writeAll(OutputFile& file, const std::vector<uint8_t>& data) {
        return file.write(data.data(), data.size());
    }

    /// Yields the given names in order, then repeats the last one
    OutputAllocator::NameGenerator sequence(std::vector<std::string> names) {
        auto index = std::make_shared<std::size_t>(0);
        return [names, index](uint64_t, uint64_t) {
            std::size_t i = std::min(*index, names.size() - 1);
            ++*index;
            return names[i];
        };
    }
}

class OutputAllocatorTest : public ::testing::Test {
protected:
    TempDir dir_{"outputs"};
};

TEST_F(OutputAllocatorTest, DefaultNameFormat) {
    std::string name = OutputAllocator::defaultName(12, 5);
    EXPECT_TRUE(std::regex_match(name, std::regex("transfer-[0-9]{8}T[0-9]{6}Z-s12-t5-[0-9a-f]{8}"))) << name;
    EXPECT_NE(OutputAllocator::defaultName(12, 5), OutputAllocator::defaultName(12, 5));
}

TEST_F(OutputAllocatorTest, NameWithoutRandomTagUsesSequence) {
    std::regex shape("transfer-[0-9]{8}T[0-9]{6}Z-s3-t9-[0-9a-f]{8}");
    std::string first = OutputAllocator::formatName(3, 9, std::nullopt);
    std::string second = OutputAllocator::formatName(3, 9, std::nullopt);
    EXPECT_TRUE(std::regex_match(first, shape)) << first;
    EXPECT_TRUE(std::regex_match(second, shape)) << second;
    EXPECT_NE(first.substr(first.size() - 8), second.substr(second.size() - 8));

    std::string tagged = OutputAllocator::formatName(3, 9, 0xabcdef01u);
    EXPECT_EQ(tagged.substr(tagged.size() - 9), "-abcdef01");
}

TEST_F(OutputAllocatorTest, PrepareCreatesMissingDirectory) {
    OutputAllocator allocator(dir_ / "nested" / "received");
    ASSERT_TRUE(allocator.prepare());
    EXPECT_TRUE(std::filesystem::is_directory(dir_ / "nested" / "received"));
}

TEST_F(OutputAllocatorTest, PrepareRejectsRegularFile) {
    writeFile(dir_ / "occupied", {1, 2, 3});
    OutputAllocator allocator(dir_ / "occupied");
    auto prepared = allocator.prepare();
    ASSERT_FALSE(prepared);
    EXPECT_EQ(prepared.error().code, ErrorCode::OUTPUT_DIRECTORY_INVALID);
}

TEST_F(OutputAllocatorTest, PreparePurgesStalePartialFiles) {
    writeFile(dir_ / ".transfer-old.part", {1});
    writeFile(dir_ / "keep.part", {2});
    writeFile(dir_ / ".transfer-keep.txt", {3});

    OutputAllocator allocator(dir_.path());
    ASSERT_TRUE(allocator.prepare());

    EXPECT_FALSE(std::filesystem::exists(dir_ / ".transfer-old.part"));
    EXPECT_TRUE(std::filesystem::exists(dir_ / "keep.part"));
    EXPECT_TRUE(std::filesystem::exists(dir_ / ".transfer-keep.txt"));
}

TEST_F(OutputAllocatorTest, CommitPublishesUnderFinalName) {
    OutputAllocator allocator(dir_.path(), sequence({"transfer-a"}));
    ASSERT_TRUE(allocator.prepare());

    auto allocated = allocator.allocate(1, 1);
    ASSERT_TRUE(allocated);
    auto file = std::move(allocated.value());
    EXPECT_EQ(file->partialPath(), dir_ / ".transfer-a.part");
    EXPECT_TRUE(std::filesystem::exists(file->partialPath()));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "transfer-a"));

    auto data = randomBytes(5000);
    ASSERT_TRUE(writeAll(*file, data));
    EXPECT_EQ(file->bytesWritten(), data.size());
    ASSERT_TRUE(file->commit());

    EXPECT_TRUE(file->committed());
    EXPECT_EQ(file->finalPath(), dir_ / "transfer-a");
    EXPECT_EQ(readFile(dir_ / "transfer-a"), data);
    EXPECT_FALSE(std::filesystem::exists(dir_ / ".transfer-a.part"));

    file.reset();
    EXPECT_TRUE(std::filesystem::exists(dir_ / "transfer-a"));
}

TEST_F(OutputAllocatorTest, DestructionDiscardsPartialFile) {
    OutputAllocator allocator(dir_.path(), sequence({"transfer-b"}));
    {
        auto allocated = allocator.allocate(1, 1);
        ASSERT_TRUE(allocated);
        ASSERT_TRUE(writeAll(*allocated.value(), randomBytes(100)));
    }
    EXPECT_TRUE(dir_.files().empty());
}

TEST_F(OutputAllocatorTest, DiscardRemovesPartialAndBlocksCommit) {
    OutputAllocator allocator(dir_.path(), sequence({"transfer-c"}));
    auto allocated = allocator.allocate(1, 1);
    ASSERT_TRUE(allocated);
    auto& file = *allocated.value();

    file.discard();
    EXPECT_FALSE(std::filesystem::exists(file.partialPath()));
    auto committed = file.commit();
    ASSERT_FALSE(committed);
    EXPECT_FALSE(std::filesystem::exists(dir_ / "transfer-c"));
}

TEST_F(OutputAllocatorTest, ExistingNameIsSkippedAtAllocation) {
    writeFile(dir_ / "transfer-taken", {9, 9});
    OutputAllocator allocator(dir_.path(), sequence({"transfer-taken", "transfer-free"}));

    auto allocated = allocator.allocate(1, 1);
    ASSERT_TRUE(allocated);
    EXPECT_EQ(allocated.value()->finalPath(), dir_ / "transfer-free");
    EXPECT_EQ(readFile(dir_ / "transfer-taken"), (std::vector<uint8_t>{9, 9}));
}

TEST_F(OutputAllocatorTest, CollisionAtPublishRegeneratesWithoutOverwriting) {
    OutputAllocator allocator(dir_.path(), sequence({"transfer-race", "transfer-retry"}));
    auto allocated = allocator.allocate(1, 1);
    ASSERT_TRUE(allocated);
    auto& file = *allocated.value();

    // Another writer takes the name between allocation and commit
    writeFile(dir_ / "transfer-race", {7});

    auto data = randomBytes(300);
    ASSERT_TRUE(writeAll(file, data));
    ASSERT_TRUE(file.commit());

    EXPECT_EQ(file.finalPath(), dir_ / "transfer-retry");
    EXPECT_EQ(readFile(dir_ / "transfer-retry"), data);
    EXPECT_EQ(readFile(dir_ / "transfer-race"), (std::vector<uint8_t>{7}));
}

TEST_F(OutputAllocatorTest, AllocationGivesUpAfterMaxAttempts) {
    writeFile(dir_ / "transfer-always", {1});
    OutputAllocator allocator(dir_.path(), sequence({"transfer-always"}));

    auto allocated = allocator.allocate(1, 1);
    ASSERT_FALSE(allocated);
    EXPECT_EQ(allocated.error().code, ErrorCode::NAME_ALLOCATION_EXHAUSTED);
}

TEST_F(OutputAllocatorTest, UnsafeGeneratedNameIsRefused) {
    OutputAllocator allocator(dir_.path(), sequence({"../escape"}));
    auto allocated = allocator.allocate(1, 1);
    ASSERT_FALSE(allocated);
    EXPECT_EQ(allocated.error().code, ErrorCode::INTERNAL_ERROR);
    EXPECT_FALSE(std::filesystem::exists(dir_.path().parent_path() / "escape"));
}

TEST_F(OutputAllocatorTest, ConcurrentAllocationsGetDistinctNames) {
    OutputAllocator allocator(dir_.path());
    std::vector<std::unique_ptr<OutputFile>> files;
    for (uint64_t stream = 1; stream <= 20; ++stream) {
        auto allocated = allocator.allocate(1, stream);
        ASSERT_TRUE(allocated);
        files.push_back(std::move(allocated.value()));
    }
    for (auto& file : files) {
        ASSERT_TRUE(file->commit());
    }
    EXPECT_EQ(dir_.files().size(), 20u);
}
