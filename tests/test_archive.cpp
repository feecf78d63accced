#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <bsa/archive.hpp>

#include <gtest/gtest.h>

namespace fs = std::filesystem;

// Archive holds its Reader through a unique_ptr to a forward-declared type;
// these only need the special members to be defined out of line.
TEST(ArchiveIncompleteTypeTest, UniquePtr) {
  auto archivePtr = std::make_unique<bsa::Archive>();
  ASSERT_NE(archivePtr, nullptr);
  EXPECT_EQ(archivePtr->state(), bsa::Archive::State::Empty);
}

TEST(ArchiveIncompleteTypeTest, UnorderedMap) {
  std::unordered_map<std::string, bsa::Archive> map;
  map["test"] = bsa::Archive();
  EXPECT_FALSE(map.empty());
}

TEST(ArchiveIncompleteTypeTest, Vector) {
  std::vector<bsa::Archive> vec;
  vec.push_back(bsa::Archive());
  vec.emplace_back();
  EXPECT_EQ(vec.size(), 2u);
}

class ArchiveTest : public ::testing::Test {
protected:
  void SetUp() override {
    tempDir_ = fs::temp_directory_path() /
               (std::string("bsa_test_archive_") +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::create_directories(tempDir_);

    // Sources are added by relative path, which becomes the entry name
    previousDir_ = fs::current_path();
    fs::current_path(tempDir_);
  }

  void TearDown() override {
    fs::current_path(previousDir_);
    fs::remove_all(tempDir_);
  }

  void createSourceFile(const fs::path &path, const std::string &content) {
    if (path.has_parent_path()) {
      fs::create_directories(path.parent_path());
    }
    std::ofstream file(path, std::ios::binary);
    file << content;
  }

  // readme.txt ("hello") and sub/data.bin (01 02 03)
  std::vector<fs::path> sampleSources() {
    createSourceFile("readme.txt", "hello");
    createSourceFile("sub/data.bin", std::string("\x01\x02\x03", 3));
    return {"readme.txt", "sub/data.bin"};
  }

  fs::path tempDir_;
  fs::path previousDir_;
};

TEST_F(ArchiveTest, QueriesBeforeOpenFail) {
  bsa::Archive archive;
  bsa::Error error;

  EXPECT_FALSE(archive.isOpen());
  EXPECT_EQ(archive.state(), bsa::Archive::State::Empty);
  EXPECT_EQ(archive.fileCount(), 0u);
  EXPECT_TRUE(archive.path().empty());

  EXPECT_FALSE(archive.exists("readme.txt", &error).has_value());
  EXPECT_EQ(error.code, bsa::ErrorCode::NotOpen);

  error = bsa::Error();
  EXPECT_FALSE(archive.files(&error).has_value());
  EXPECT_EQ(error.code, bsa::ErrorCode::NotOpen);

  error = bsa::Error();
  EXPECT_FALSE(archive.extractToMemory("readme.txt", &error).has_value());
  EXPECT_EQ(error.code, bsa::ErrorCode::NotOpen);

  error = bsa::Error();
  EXPECT_FALSE(archive.extract("readme.txt", "readme.txt", &error));
  EXPECT_EQ(error.code, bsa::ErrorCode::NotOpen);

  EXPECT_EQ(archive.findFile("readme.txt"), nullptr);
}

TEST_F(ArchiveTest, CreateThenOpen) {
  auto sources = sampleSources();

  {
    bsa::Archive archive;
    bsa::Error error;
    ASSERT_TRUE(archive.create("out.bsa", sources, &error)) << error.message;
    EXPECT_EQ(archive.state(), bsa::Archive::State::Written);
  }

  bsa::Archive archive;
  bsa::Error error;
  ASSERT_TRUE(archive.open("out.bsa", &error)) << error.message;
  EXPECT_EQ(archive.state(), bsa::Archive::State::Loaded);
  EXPECT_TRUE(archive.path() == fs::path("out.bsa"));

  auto files = archive.files(&error);
  ASSERT_TRUE(files.has_value()) << error.message;
  ASSERT_EQ(files->size(), 2u);
  EXPECT_EQ((*files)[0].name, "readme.txt");
  EXPECT_EQ((*files)[1].name, "sub\\data.bin");

  auto readme = archive.extractToMemory("readme.txt", &error);
  ASSERT_TRUE(readme.has_value()) << error.message;
  EXPECT_EQ(*readme, (std::vector<uint8_t>{'h', 'e', 'l', 'l', 'o'}));

  auto data = archive.extractToMemory("sub\\data.bin", &error);
  ASSERT_TRUE(data.has_value()) << error.message;
  EXPECT_EQ(*data, (std::vector<uint8_t>{0x01, 0x02, 0x03}));

  // Forward slashes are accepted
  auto sameData = archive.extractToMemory("sub/data.bin", &error);
  ASSERT_TRUE(sameData.has_value()) << error.message;
  EXPECT_EQ(*sameData, *data);

  EXPECT_EQ(archive.exists("readme.txt"), std::optional<bool>(true));
  EXPECT_EQ(archive.exists("missing"), std::optional<bool>(false));

  EXPECT_FALSE(archive.extractToMemory("missing", &error).has_value());
  EXPECT_EQ(error.code, bsa::ErrorCode::FileNotFound);
  EXPECT_EQ(error.name, "missing");
}

// A created archive is queryable without reopening
TEST_F(ArchiveTest, QueriesAfterCreate) {
  auto sources = sampleSources();

  bsa::Archive archive;
  bsa::Error error;
  ASSERT_TRUE(archive.create("out.bsa", sources, &error)) << error.message;

  EXPECT_TRUE(archive.isOpen());
  EXPECT_EQ(archive.fileCount(), 2u);

  const bsa::FileEntry *entry = archive.findFile("sub\\data.bin");
  ASSERT_NE(entry, nullptr);
  EXPECT_EQ(entry->size, 3u);
  EXPECT_EQ(entry->offset + entry->size, fs::file_size("out.bsa"));

  auto readme = archive.extractToMemory("readme.txt", &error);
  ASSERT_TRUE(readme.has_value()) << error.message;
  EXPECT_EQ(std::string(readme->begin(), readme->end()), "hello");

  ASSERT_TRUE(archive.extract("readme.txt", "copy.txt", &error)) << error.message;
  std::ifstream copy("copy.txt", std::ios::binary);
  std::string content;
  std::getline(copy, content);
  EXPECT_EQ(content, "hello");
}

TEST_F(ArchiveTest, CreateWithArchiveNames) {
  createSourceFile("local/one.txt", "1");
  createSourceFile("local/two.txt", "22");

  std::vector<bsa::SourceFile> sources = {
      {"local/one.txt", "Meshes/One.NIF"},
      {"local/two.txt", "textures\\two.dds"},
  };

  bsa::Archive written;
  bsa::Error error;
  ASSERT_TRUE(written.create("named.bsa", sources, &error)) << error.message;

  bsa::Archive archive;
  ASSERT_TRUE(archive.open("named.bsa", &error)) << error.message;

  auto files = archive.files(&error);
  ASSERT_TRUE(files.has_value()) << error.message;
  ASSERT_EQ(files->size(), 2u);
  EXPECT_EQ((*files)[0].name, "meshes\\one.nif");
  EXPECT_EQ((*files)[1].name, "textures\\two.dds");

  auto two = archive.extractToMemory("textures/two.dds", &error);
  ASSERT_TRUE(two.has_value()) << error.message;
  EXPECT_EQ(std::string(two->begin(), two->end()), "22");
}

TEST_F(ArchiveTest, CreateEmpty) {
  bsa::Archive archive;
  bsa::Error error;
  ASSERT_TRUE(archive.create("empty.bsa", std::vector<fs::path>(), &error)) << error.message;
  EXPECT_EQ(archive.fileCount(), 0u);
  EXPECT_EQ(fs::file_size("empty.bsa"), 12u);

  bsa::Archive reopened;
  ASSERT_TRUE(reopened.open("empty.bsa", &error)) << error.message;
  auto files = reopened.files(&error);
  ASSERT_TRUE(files.has_value());
  EXPECT_TRUE(files->empty());
}

TEST_F(ArchiveTest, DuplicateNamesLastWins) {
  createSourceFile("a/same.txt", "first");
  createSourceFile("b/same.txt", "second");

  std::vector<bsa::SourceFile> sources = {
      {"a/same.txt", "same.txt"},
      {"b/same.txt", "same.txt"},
  };

  bsa::Archive archive;
  bsa::Error error;
  ASSERT_TRUE(archive.create("dup.bsa", sources, &error)) << error.message;

  auto files = archive.files();
  ASSERT_TRUE(files.has_value());
  EXPECT_EQ(files->size(), 2u);

  auto data = archive.extractToMemory("same.txt", &error);
  ASSERT_TRUE(data.has_value()) << error.message;
  EXPECT_EQ(std::string(data->begin(), data->end()), "second");
}

TEST_F(ArchiveTest, SecondOpenFails) {
  auto sources = sampleSources();
  {
    bsa::Archive writer;
    ASSERT_TRUE(writer.create("out.bsa", sources));
  }
  createSourceFile("other.txt", "other");

  bsa::Archive archive;
  bsa::Error error;
  ASSERT_TRUE(archive.open("out.bsa", &error)) << error.message;

  EXPECT_FALSE(archive.open("out.bsa", &error));
  EXPECT_EQ(error.code, bsa::ErrorCode::AlreadyOpen);

  std::vector<fs::path> other = {"other.txt"};
  EXPECT_FALSE(archive.create("other.bsa", other, &error));
  EXPECT_EQ(error.code, bsa::ErrorCode::AlreadyOpen);
  EXPECT_FALSE(fs::exists("other.bsa"));

  // The loaded directory is untouched
  EXPECT_EQ(archive.state(), bsa::Archive::State::Loaded);
  EXPECT_EQ(archive.fileCount(), 2u);
  EXPECT_EQ(archive.exists("readme.txt"), std::optional<bool>(true));
}

TEST_F(ArchiveTest, OpenAfterCreateFails) {
  auto sources = sampleSources();

  bsa::Archive archive;
  bsa::Error error;
  ASSERT_TRUE(archive.create("out.bsa", sources, &error)) << error.message;

  EXPECT_FALSE(archive.open("out.bsa", &error));
  EXPECT_EQ(error.code, bsa::ErrorCode::AlreadyOpen);
  EXPECT_EQ(archive.state(), bsa::Archive::State::Written);
}

TEST_F(ArchiveTest, FailedOpenLeavesArchiveEmpty) {
  createSourceFile("garbage.bsa", "this is not an archive");
  auto sources = sampleSources();
  {
    bsa::Archive writer;
    ASSERT_TRUE(writer.create("out.bsa", sources));
  }

  bsa::Archive archive;
  bsa::Error error;
  EXPECT_FALSE(archive.open("garbage.bsa", &error));
  EXPECT_EQ(error.code, bsa::ErrorCode::BadHeader);
  EXPECT_EQ(archive.state(), bsa::Archive::State::Empty);

  EXPECT_FALSE(archive.open("does_not_exist.bsa", &error));
  EXPECT_EQ(error.code, bsa::ErrorCode::Io);
  EXPECT_EQ(archive.state(), bsa::Archive::State::Empty);

  ASSERT_TRUE(archive.open("out.bsa", &error)) << error.message;
  EXPECT_EQ(archive.fileCount(), 2u);
}

TEST_F(ArchiveTest, FailedCreateLeavesArchiveEmpty) {
  std::vector<fs::path> sources = {"missing.txt"};

  bsa::Archive archive;
  bsa::Error error;
  EXPECT_FALSE(archive.create("out.bsa", sources, &error));
  EXPECT_EQ(error.code, bsa::ErrorCode::Io);
  EXPECT_EQ(archive.state(), bsa::Archive::State::Empty);
  EXPECT_FALSE(archive.isOpen());
}

TEST_F(ArchiveTest, MoveKeepsState) {
  auto sources = sampleSources();

  bsa::Archive archive;
  ASSERT_TRUE(archive.create("out.bsa", sources));

  bsa::Archive moved = std::move(archive);
  EXPECT_EQ(moved.state(), bsa::Archive::State::Written);
  EXPECT_EQ(moved.fileCount(), 2u);

  bsa::Archive assigned;
  assigned = std::move(moved);
  EXPECT_EQ(assigned.state(), bsa::Archive::State::Written);
  EXPECT_EQ(assigned.exists("sub/data.bin"), std::optional<bool>(true));
}

TEST(ErrorTest, CodeNames) {
  EXPECT_EQ(bsa::errorCodeName(bsa::ErrorCode::None), "None");
  EXPECT_EQ(bsa::errorCodeName(bsa::ErrorCode::FileNotFound), "FileNotFound");
  EXPECT_EQ(bsa::errorCodeName(bsa::ErrorCode::PositionMismatch), "PositionMismatch");

  bsa::Error error;
  EXPECT_FALSE(error);
  error.code = bsa::ErrorCode::Io;
  EXPECT_TRUE(error);
}
