#include "fixtures.hpp"
#include "storage/LocalBackend.hpp"
#include "storage/List.hpp"
#include "filters/Chain.hpp"
#include "config/Config.hpp"
#include "transfer/Error.hpp"

#include <algorithm>

namespace fs = std::filesystem;
using namespace usync::storage;
using namespace usync::transfer;

class LocalBackendTest : public usync::test::TempDirTest {
protected:
    LocalBackend backend;

    static BackendError::Kind kindOf(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const BackendError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "expected a BackendError";
        return BackendError::Kind::Other;
    }

    void makeTree(const fs::path& root) {
        writeTextFile(root / "a.txt", "alpha");
        writeTextFile(root / "b.txt", "bravo!");
        writeTextFile(root / "sub" / "c.txt", "charlie");
        writeTextFile(root / "sub" / "deep" / "d.bin", patternBytes(4096));
        fs::create_directories(root / "empty");
    }
};

TEST_F(LocalBackendTest, CopyFileReturnsBytes) {
    writeTextFile(test_dir / "src.txt", "hello world");
    EXPECT_EQ(backend.copyFile((test_dir / "src.txt").string(), (test_dir / "out" / "dst.txt").string(), {}), 11u);
    EXPECT_EQ(readTextFile(test_dir / "out" / "dst.txt"), "hello world");
}

TEST_F(LocalBackendTest, CopyFilePreservesModificationTime) {
    writeTextFile(test_dir / "src.txt", "x");
    const auto past = fs::file_time_type::clock::now() - std::chrono::hours(48);
    fs::last_write_time(test_dir / "src.txt", past);

    backend.copyFile((test_dir / "src.txt").string(), (test_dir / "dst.txt").string(), {});

    const auto src = backend.list((test_dir / "src.txt").string()).front();
    const auto dst = backend.list((test_dir / "dst.txt").string()).front();
    EXPECT_EQ(src.modified, dst.modified);
}

TEST_F(LocalBackendTest, CopyFileErrors) {
    fs::create_directories(test_dir / "dir");

    EXPECT_EQ(kindOf([&] { backend.copyFile((test_dir / "missing").string(), (test_dir / "x").string(), {}); }),
              BackendError::Kind::NotFound);
    EXPECT_EQ(kindOf([&] { backend.copyFile((test_dir / "dir").string(), (test_dir / "x").string(), {}); }),
              BackendError::Kind::InvalidPath);
}

TEST_F(LocalBackendTest, CopyFileDryRunWritesNothing) {
    writeTextFile(test_dir / "src.txt", "data");
    CopyOptions opts;
    opts.dry_run = true;

    EXPECT_EQ(backend.copyFile((test_dir / "src.txt").string(), (test_dir / "dst.txt").string(), opts), 0u);
    EXPECT_FALSE(fs::exists(test_dir / "dst.txt"));
}

TEST_F(LocalBackendTest, CopyDirectoryRequiresRecursive) {
    makeTree(test_dir / "src");
    EXPECT_EQ(kindOf([&] { (void)backend.copyDirectory((test_dir / "src").string(), (test_dir / "dst").string(), {}); }),
              BackendError::Kind::UnsupportedOperation);
}

TEST_F(LocalBackendTest, CopyDirectoryErrors) {
    writeTextFile(test_dir / "file", "x");
    CopyOptions opts;
    opts.recursive = true;

    EXPECT_EQ(kindOf([&] { (void)backend.copyDirectory((test_dir / "missing").string(), (test_dir / "dst").string(), opts); }),
              BackendError::Kind::NotFound);
    EXPECT_EQ(kindOf([&] { (void)backend.copyDirectory((test_dir / "file").string(), (test_dir / "dst").string(), opts); }),
              BackendError::Kind::InvalidPath);
}

TEST_F(LocalBackendTest, CopyDirectoryMirrorsTreeAndCounts) {
    makeTree(test_dir / "src");
    CopyOptions opts;
    opts.recursive = true;
    opts.verbose = true;

    const auto stats = backend.copyDirectory((test_dir / "src").string(), (test_dir / "dst").string(), opts);

    EXPECT_EQ(stats.files_copied, 4u);
    EXPECT_EQ(stats.bytes_copied, 5u + 6u + 7u + 4096u);
    EXPECT_EQ(stats.files_skipped, 0u);
    EXPECT_EQ(readTextFile(test_dir / "dst" / "sub" / "c.txt"), "charlie");
    EXPECT_EQ(readTextFile(test_dir / "dst" / "sub" / "deep" / "d.bin"), patternBytes(4096));
    EXPECT_TRUE(fs::is_directory(test_dir / "dst" / "empty"));
}

TEST_F(LocalBackendTest, SequentialAndParallelAgree) {
    for (int i = 0; i < 25; ++i) writeTextFile(test_dir / "src" / ("f" + std::to_string(i)), patternBytes(i * 100));
    CopyOptions opts;
    opts.recursive = true;
    opts.verbose = true;

    TransferSettings sequential;
    sequential.parallel = false;
    TransferSettings parallel;
    parallel.maxWorkers = 4;

    const auto a = LocalBackend(sequential).copyDirectory((test_dir / "src").string(), (test_dir / "seq").string(), opts);
    const auto b = LocalBackend(parallel).copyDirectory((test_dir / "src").string(), (test_dir / "par").string(), opts);

    EXPECT_EQ(a.files_copied, 25u);
    EXPECT_EQ(a.files_copied, b.files_copied);
    EXPECT_EQ(a.bytes_copied, b.bytes_copied);
    for (int i = 0; i < 25; ++i)
        EXPECT_EQ(readTextFile(test_dir / "par" / ("f" + std::to_string(i))), patternBytes(i * 100));
}

TEST_F(LocalBackendTest, MinimalStatsStayZero) {
    makeTree(test_dir / "src");
    CopyOptions opts;
    opts.recursive = true;

    const auto stats = backend.copyDirectory((test_dir / "src").string(), (test_dir / "dst").string(), opts);
    EXPECT_TRUE(stats.isMinimal());
    EXPECT_EQ(stats.files_copied, 0u);
    EXPECT_TRUE(fs::exists(test_dir / "dst" / "a.txt"));
}

TEST_F(LocalBackendTest, FiltersSkipFilesAndCountThem) {
    makeTree(test_dir / "src");
    usync::config::FiltersConfig cfg;
    cfg.include = {"*.txt"};

    CopyOptions opts;
    opts.recursive = true;
    opts.verbose = true;
    opts.filters = usync::filters::Chain::fromConfig(cfg);

    const auto stats = backend.copyDirectory((test_dir / "src").string(), (test_dir / "dst").string(), opts);
    EXPECT_EQ(stats.files_copied, 3u);
    EXPECT_EQ(stats.files_skipped, 1u);
    EXPECT_FALSE(fs::exists(test_dir / "dst" / "sub" / "deep" / "d.bin"));
}

TEST_F(LocalBackendTest, CopyDirectoryDryRunCreatesNothing) {
    makeTree(test_dir / "src");
    CopyOptions opts;
    opts.recursive = true;
    opts.dry_run = true;

    (void)backend.copyDirectory((test_dir / "src").string(), (test_dir / "dst").string(), opts);
    EXPECT_FALSE(fs::exists(test_dir / "dst"));
}

TEST_F(LocalBackendTest, ListReportsFileAndChildren) {
    makeTree(test_dir / "src");

    const auto file = backend.list((test_dir / "src" / "b.txt").string());
    ASSERT_EQ(file.size(), 1u);
    EXPECT_EQ(file.front().path, (test_dir / "src" / "b.txt").string());
    EXPECT_EQ(file.front().size, 6u);
    EXPECT_FALSE(file.front().is_dir);
    EXPECT_TRUE(file.front().modified.has_value());

    const auto children = backend.list((test_dir / "src").string());
    ASSERT_EQ(children.size(), 4u);
    EXPECT_TRUE(std::ranges::is_sorted(children, {}, &usync::fs::model::Entry::path));

    const auto sub = std::ranges::find(children, (test_dir / "src" / "sub").string(), &usync::fs::model::Entry::path);
    ASSERT_NE(sub, children.end());
    EXPECT_TRUE(sub->is_dir);
    EXPECT_EQ(sub->size, 0u);
}

TEST_F(LocalBackendTest, ListRecursiveWalksEverything) {
    makeTree(test_dir / "src");
    const auto all = listRecursive(backend, (test_dir / "src").string());

    EXPECT_EQ(std::ranges::count_if(all, [](const auto& e) { return !e.is_dir; }), 4);
    EXPECT_EQ(std::ranges::count_if(all, [](const auto& e) { return e.is_dir; }), 3);
}

TEST_F(LocalBackendTest, SymlinkedDirectoriesAreNotFollowed) {
    writeTextFile(test_dir / "src" / "a.txt", "alpha");
    fs::create_directory_symlink(".", test_dir / "src" / "loop");
    CopyOptions opts;
    opts.recursive = true;
    opts.verbose = true;

    const auto stats = backend.copyDirectory((test_dir / "src").string(), (test_dir / "dst").string(), opts);
    EXPECT_EQ(stats.files_copied, 1u);
    EXPECT_TRUE(fs::exists(test_dir / "dst" / "a.txt"));
    EXPECT_FALSE(fs::exists(fs::symlink_status(test_dir / "dst" / "loop")));

    const auto children = backend.list((test_dir / "src").string());
    const auto loop = std::ranges::find(children, (test_dir / "src" / "loop").string(), &usync::fs::model::Entry::path);
    ASSERT_NE(loop, children.end());
    EXPECT_FALSE(loop->is_dir);
    EXPECT_EQ(loop->size, 0u);

    const auto all = listRecursive(backend, (test_dir / "src").string());
    EXPECT_EQ(all.size(), 2u);
    EXPECT_TRUE(std::ranges::none_of(all, [](const auto& e) { return e.is_dir; }));
}

TEST_F(LocalBackendTest, ChecksumOfDirectoryIsInvalidPath) {
    fs::create_directories(test_dir / "dir");
    EXPECT_EQ(kindOf([&] { (void)backend.checksum((test_dir / "dir").string(), ChecksumAlgorithm::Md5); }),
              BackendError::Kind::InvalidPath);
    EXPECT_EQ(kindOf([&] { (void)backend.checksum((test_dir / "gone").string(), ChecksumAlgorithm::Md5); }),
              BackendError::Kind::NotFound);
}

TEST_F(LocalBackendTest, ListMissingIsNotFound) {
    EXPECT_EQ(kindOf([&] { (void)backend.list((test_dir / "missing").string()); }), BackendError::Kind::NotFound);
}

TEST_F(LocalBackendTest, RemoveFileAndTree) {
    makeTree(test_dir / "src");

    backend.remove((test_dir / "src" / "a.txt").string());
    EXPECT_FALSE(fs::exists(test_dir / "src" / "a.txt"));

    backend.remove((test_dir / "src").string());
    EXPECT_FALSE(fs::exists(test_dir / "src"));

    EXPECT_EQ(kindOf([&] { backend.remove((test_dir / "src").string()); }), BackendError::Kind::NotFound);
}

TEST_F(LocalBackendTest, ExistsUsesListing) {
    writeTextFile(test_dir / "here", "1");
    EXPECT_TRUE(backend.exists((test_dir / "here").string()));
    EXPECT_TRUE(backend.exists(test_dir.string()));
    EXPECT_FALSE(backend.exists((test_dir / "gone").string()));
}

TEST_F(LocalBackendTest, LocalBackendIsNotRemote) {
    EXPECT_FALSE(backend.isRemote());
    EXPECT_EQ(backend.name(), "local");
}
