#include <gtest/gtest.h>

#include <filesystem>

#include "download/assembler.h"
#include "test_support.h"
#include "utils/sha256.h"

using namespace chunkfetch;
using namespace chunkfetch::test;
namespace fs = std::filesystem;

namespace {

void writeChunks(const fs::path& dir) {
    writeFile(dir / "model.part01", "hello ");
    writeFile(dir / "model.part02", "chunked ");
    writeFile(dir / "model.part03", "world");
}

}  // namespace

TEST(AssemblerTest, ConcatenatesInIndexOrder) {
    TempDir tmp("assembler");
    writeChunks(tmp.path);
    LocalChunkStore store(makeTestConfig(tmp.path, 3));
    Assembler assembler(store, 19, sha256_text("hello chunked world"));

    auto res = assembler.assemble({0, 1, 2});
    ASSERT_TRUE(res.ok()) << res.error_message;
    EXPECT_EQ(fs::path(*res.data), tmp.path / "model.gguf");
    EXPECT_EQ(readFile(tmp.path / "model.gguf"), "hello chunked world");
    EXPECT_EQ(assembler.lastAssembledBytes(), 19u);
    EXPECT_FALSE(fs::exists(tmp.path / "model.gguf.assembling"));
}

TEST(AssemblerTest, MissingChunkLeavesNoFinalFile) {
    TempDir tmp("assembler");
    writeChunks(tmp.path);
    fs::remove(tmp.path / "model.part02");
    LocalChunkStore store(makeTestConfig(tmp.path, 3));
    Assembler assembler(store);

    auto res = assembler.assemble({0, 1, 2});
    EXPECT_EQ(res.error, DownloadErrorCode::AssemblyError);
    EXPECT_NE(res.error_message.find("model.part02"), std::string::npos);
    EXPECT_FALSE(fs::exists(tmp.path / "model.gguf"));
    EXPECT_FALSE(fs::exists(tmp.path / "model.gguf.assembling"));
}

TEST(AssemblerTest, EmptyChunkIsRejected) {
    TempDir tmp("assembler");
    writeChunks(tmp.path);
    writeFile(tmp.path / "model.part03", "");
    LocalChunkStore store(makeTestConfig(tmp.path, 3));
    Assembler assembler(store);

    EXPECT_EQ(assembler.assemble({0, 1, 2}).error, DownloadErrorCode::AssemblyError);
    EXPECT_FALSE(fs::exists(tmp.path / "model.gguf"));
}

TEST(AssemblerTest, IncompleteOrUnorderedListIsRejected) {
    TempDir tmp("assembler");
    writeChunks(tmp.path);
    LocalChunkStore store(makeTestConfig(tmp.path, 3));
    Assembler assembler(store);

    EXPECT_EQ(assembler.assemble({0, 1}).error, DownloadErrorCode::AssemblyError);
    EXPECT_EQ(assembler.assemble({0, 2, 1}).error, DownloadErrorCode::AssemblyError);
    EXPECT_FALSE(fs::exists(tmp.path / "model.gguf"));
}

TEST(AssemblerTest, TotalSizeMismatchIsRejected) {
    TempDir tmp("assembler");
    writeChunks(tmp.path);
    LocalChunkStore store(makeTestConfig(tmp.path, 3));
    Assembler assembler(store, 20);

    auto res = assembler.assemble({0, 1, 2});
    EXPECT_EQ(res.error, DownloadErrorCode::AssemblyError);
    EXPECT_FALSE(fs::exists(tmp.path / "model.gguf"));
}

TEST(AssemblerTest, ArtifactChecksumMismatchIsRejected) {
    TempDir tmp("assembler");
    writeChunks(tmp.path);
    LocalChunkStore store(makeTestConfig(tmp.path, 3));
    Assembler assembler(store, 0, sha256_text("something else"));

    auto res = assembler.assemble({0, 1, 2});
    EXPECT_EQ(res.error, DownloadErrorCode::AssemblyError);
    EXPECT_NE(res.error_message.find("checksum"), std::string::npos);
    EXPECT_FALSE(fs::exists(tmp.path / "model.gguf"));
}
