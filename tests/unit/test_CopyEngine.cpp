#include "fixtures.hpp"
#include "storage/LocalBackend.hpp"
#include "transfer/CopyEngine.hpp"
#include "transfer/Error.hpp"
#include "filters/Chain.hpp"
#include "config/Config.hpp"

#include <memory>

namespace fs = std::filesystem;
using namespace usync::storage;
using namespace usync::transfer;

class CopyEngineTest : public usync::test::TempDirTest {
protected:
    std::shared_ptr<LocalBackend> local = std::make_shared<LocalBackend>();

    [[nodiscard]] CopyEngine engine(CopyOptions opts = {}) const { return {local, local, std::move(opts)}; }

    [[nodiscard]] std::string at(const std::string& rel) const { return (test_dir / rel).string(); }
};

TEST_F(CopyEngineTest, RejectsMissingBackend) {
    EXPECT_THROW(CopyEngine(nullptr, local, {}), std::invalid_argument);
}

TEST_F(CopyEngineTest, LocalTransfersGoThroughDestination) {
    const auto e = engine();
    EXPECT_EQ(&e.transferBackend(), local.get());
}

TEST_F(CopyEngineTest, CopyDispatchesOnSourceKind) {
    writeTextFile(test_dir / "file.txt", "12345");
    writeTextFile(test_dir / "tree" / "x.txt", "x");
    writeTextFile(test_dir / "tree" / "y" / "z.txt", "zz");

    CopyOptions opts;
    opts.recursive = true;
    opts.verbose = true;
    const auto e = engine(opts);

    EXPECT_FALSE(e.isDirectory(at("file.txt")));
    EXPECT_TRUE(e.isDirectory(at("tree")));

    const auto fileStats = e.copy(at("file.txt"), at("out/file.txt"));
    EXPECT_EQ(fileStats.files_copied, 1u);
    EXPECT_EQ(fileStats.bytes_copied, 5u);

    const auto treeStats = e.copy(at("tree"), at("out/tree"));
    EXPECT_EQ(treeStats.files_copied, 2u);
    EXPECT_EQ(readTextFile(test_dir / "out" / "tree" / "y" / "z.txt"), "zz");
}

TEST_F(CopyEngineTest, CopyOfMissingSourceIsNotFound) {
    try {
        (void)engine().copy(at("missing"), at("dst"));
        FAIL() << "expected NotFound";
    } catch (const BackendError& e) {
        EXPECT_EQ(e.kind(), BackendError::Kind::NotFound);
    }
}

TEST_F(CopyEngineTest, MoveFileRemovesSource) {
    writeTextFile(test_dir / "src.txt", "moving");

    (void)engine().move(at("src.txt"), at("moved/dst.txt"));
    EXPECT_FALSE(fs::exists(test_dir / "src.txt"));
    EXPECT_EQ(readTextFile(test_dir / "moved" / "dst.txt"), "moving");
}

TEST_F(CopyEngineTest, MoveDirectoryRemovesTree) {
    writeTextFile(test_dir / "src" / "a", "a");
    writeTextFile(test_dir / "src" / "b" / "c", "c");

    CopyOptions opts;
    opts.recursive = true;
    opts.checksum = ChecksumAlgorithm::Md5;
    (void)engine(opts).move(at("src"), at("dst"));

    EXPECT_FALSE(fs::exists(test_dir / "src"));
    EXPECT_EQ(readTextFile(test_dir / "dst" / "b" / "c"), "c");
}

TEST_F(CopyEngineTest, MoveDryRunTouchesNothing) {
    writeTextFile(test_dir / "src.txt", "stay");

    CopyOptions opts;
    opts.dry_run = true;
    (void)engine(opts).move(at("src.txt"), at("dst.txt"));

    EXPECT_TRUE(fs::exists(test_dir / "src.txt"));
    EXPECT_FALSE(fs::exists(test_dir / "dst.txt"));
}

TEST_F(CopyEngineTest, MoveDirectoryWithFiltersIsRefused) {
    writeTextFile(test_dir / "src" / "keep.txt", "k");
    writeTextFile(test_dir / "src" / "drop.bin", "d");

    usync::config::FiltersConfig cfg;
    cfg.include = {"*.txt"};
    CopyOptions opts;
    opts.recursive = true;
    opts.filters = usync::filters::Chain::fromConfig(cfg);

    try {
        (void)engine(opts).move(at("src"), at("dst"));
        FAIL() << "expected UnsupportedOperation";
    } catch (const BackendError& e) {
        EXPECT_EQ(e.kind(), BackendError::Kind::UnsupportedOperation);
    }
    EXPECT_TRUE(fs::exists(test_dir / "src" / "drop.bin"));
}

TEST_F(CopyEngineTest, ResumeCompletesPartialCopy) {
    const auto body = patternBytes(70000);
    writeTextFile(test_dir / "src", body);
    writeTextFile(test_dir / "dst", body.substr(0, 30000));

    CopyOptions opts;
    opts.checksum = ChecksumAlgorithm::Sha256;
    EXPECT_EQ(engine(opts).copyFileResuming(at("src"), at("dst"), 30000), 40000u);
    EXPECT_EQ(readTextFile(test_dir / "dst"), body);
}
