#include "fixtures.hpp"
#include "storage/remote/HttpBackend.hpp"
#include "storage/remote/S3Backend.hpp"
#include "storage/remote/SshBackend.hpp"
#include "transfer/Error.hpp"

namespace fs = std::filesystem;
using namespace usync::storage;
using namespace usync::storage::remote;
using namespace usync::transfer;
using Args = std::vector<std::string>;

class RemoteBackendTest : public usync::test::TempDirTest {
protected:
    // Stand-in for an external tool: a shell script that ignores its arguments
    std::string fakeTool(const std::string& name, const std::string& body) const {
        const auto path = test_dir / name;
        writeTextFile(path, "#!/bin/sh\n" + body + "\n");
        fs::permissions(path, fs::perms::owner_all, fs::perm_options::add);
        return path.string();
    }

    template <typename Fn>
    static BackendError::Kind kindOf(Fn&& fn) {
        try {
            fn();
        } catch (const BackendError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "expected a BackendError";
        return BackendError::Kind::Other;
    }
};

TEST_F(RemoteBackendTest, ScpArgumentOrder) {
    const SshBackend ssh(Location::parse("ssh://bob@host:2222/srv"), {});

    CopyOptions opts;
    opts.ssh_opts = {"StrictHostKeyChecking=no"};

    EXPECT_EQ(ssh.scpArgs(opts, true, "/local/a", ssh.remoteSpec("/srv/a")),
              (Args{"scp", "-r", "-P", "2222", "-q", "-o", "StrictHostKeyChecking=no", "/local/a", "bob@host:/srv/a"}));

    opts.verbose = true;
    opts.ssh_opts.clear();
    EXPECT_EQ(ssh.scpArgs(opts, false, "bob@host:/srv/a", "/local/a"),
              (Args{"scp", "-P", "2222", "bob@host:/srv/a", "/local/a"}));
}

TEST_F(RemoteBackendTest, SshArgumentsUseDefaultPortQuietly) {
    auto loc = Location::parse("ssh://host/x");
    loc.options = {"BatchMode=yes"};
    const SshBackend ssh(loc, {});

    EXPECT_EQ(ssh.sshArgs("ls -la '/x'"), (Args{"ssh", "-o", "BatchMode=yes", "host", "ls -la '/x'"}));
    EXPECT_EQ(ssh.remoteSpec("rel/path"), "host:rel/path");
}

TEST_F(RemoteBackendTest, ParsesLsListing) {
    const std::string output =
        "total 12\n"
        "drwxr-xr-x 3 bob bob 4096 Jan  1 12:00 .\n"
        "drwxr-xr-x 5 bob bob 4096 Jan  1 12:00 ..\n"
        "-rw-r--r-- 1 bob bob  123 Jan  1 12:00 my notes.txt\n"
        "drwxr-xr-x 2 bob bob 4096 Mar 15  2023 sub\n"
        "lrwxrwxrwx 1 bob bob    6 Jan  1 12:00 link -> target\n";

    const auto entries = SshBackend::parseLsOutput(output, "ssh://h/base");
    ASSERT_EQ(entries.size(), 3u);

    EXPECT_EQ(entries[0].path, "ssh://h/base/my notes.txt");
    EXPECT_EQ(entries[0].size, 123u);
    EXPECT_FALSE(entries[0].is_dir);

    EXPECT_EQ(entries[1].path, "ssh://h/base/sub");
    EXPECT_TRUE(entries[1].is_dir);
    EXPECT_EQ(entries[1].size, 0u);

    EXPECT_EQ(entries[2].path, "ssh://h/base/link");
}

TEST_F(RemoteBackendTest, ChecksumCommands) {
    EXPECT_EQ(SshBackend::checksumCommand(ChecksumAlgorithm::Md5), "md5sum");
    EXPECT_EQ(SshBackend::checksumCommand(ChecksumAlgorithm::Sha1), "sha1sum");
    EXPECT_EQ(SshBackend::checksumCommand(ChecksumAlgorithm::Sha256), "sha256sum");
}

TEST_F(RemoteBackendTest, SshListThroughTool) {
    TransferSettings settings;
    settings.sshBin = fakeTool("ssh",
        "cat <<'OUT'\n"
        "total 4\n"
        "-rw-r--r-- 1 u u 42 Jan  1 12:00 a.txt\n"
        "drwxr-xr-x 2 u u 4096 Jan  1 12:00 d\n"
        "OUT");

    const SshBackend ssh(Location::parse("ssh://u@h/data"), settings);
    const auto entries = ssh.list("ssh://u@h/data");

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].path, "ssh://u@h/data/a.txt");
    EXPECT_EQ(entries[0].size, 42u);
    EXPECT_TRUE(entries[1].is_dir);
}

TEST_F(RemoteBackendTest, SshChecksumThroughTool) {
    TransferSettings settings;
    settings.sshBin = fakeTool("ssh", "echo 'd41d8cd98f00b204e9800998ecf8427e  /data/empty'");

    const SshBackend ssh(Location::parse("ssh://u@h/data"), settings);
    EXPECT_EQ(ssh.checksum("ssh://u@h/data/empty", ChecksumAlgorithm::Md5), "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(kindOf([&] { (void)ssh.checksum("ssh://u@h/data/empty", ChecksumAlgorithm::Sha256); }),
              BackendError::Kind::Other);
}

TEST_F(RemoteBackendTest, ToolFailuresMapToKinds) {
    TransferSettings missing;
    missing.sshBin = (test_dir / "no-such-ssh").string();
    const SshBackend unreachable(Location::parse("ssh://u@h/x"), missing);
    EXPECT_EQ(kindOf([&] { (void)unreachable.list("ssh://u@h/x"); }), BackendError::Kind::ConnectionError);

    TransferSettings notFound;
    notFound.sshBin = fakeTool("ssh-nf", "echo \"ls: cannot access '/x': No such file or directory\" >&2; exit 2");
    const SshBackend gone(Location::parse("ssh://u@h/x"), notFound);
    EXPECT_EQ(kindOf([&] { (void)gone.list("ssh://u@h/x"); }), BackendError::Kind::NotFound);
    EXPECT_FALSE(gone.exists("ssh://u@h/x"));

    TransferSettings denied;
    denied.sshBin = fakeTool("ssh-denied", "echo 'Permission denied (publickey).' >&2; exit 255");
    const SshBackend locked(Location::parse("ssh://u@h/x"), denied);
    try {
        (void)locked.list("ssh://u@h/x");
        FAIL() << "expected IoError";
    } catch (const BackendError& e) {
        EXPECT_EQ(e.kind(), BackendError::Kind::IoError);
        EXPECT_EQ(e.cause(), "Permission denied (publickey).");
    }
}

TEST_F(RemoteBackendTest, TransferDirectionIsChecked) {
    const SshBackend ssh(Location::parse("ssh://u@h/x"), {});

    EXPECT_EQ(kindOf([&] { (void)ssh.copyFile("ssh://u@h/a", "ssh://u@h/b", {}); }),
              BackendError::Kind::UnsupportedOperation);
    EXPECT_EQ(kindOf([&] { (void)ssh.copyFile("/a", "/b", {}); }), BackendError::Kind::InvalidPath);
    EXPECT_EQ(kindOf([&] { (void)ssh.copyDirectory("ssh://u@h/a", "/b", {}); }),
              BackendError::Kind::UnsupportedOperation);
}

TEST_F(RemoteBackendTest, SshDownloadCreatesLocalParents) {
    TransferSettings settings;
    settings.scpBin = fakeTool("scp", "for last; do :; done\nprintf 'remote bytes' > \"$last\"");
    const SshBackend ssh(Location::parse("ssh://u@h/x"), settings);

    const auto dst = test_dir / "nested" / "deeper" / "file";
    EXPECT_EQ(ssh.copyFile("ssh://u@h/x/file", dst.string(), {}), 12u);
    EXPECT_EQ(readTextFile(dst), "remote bytes");
}

TEST_F(RemoteBackendTest, SshDryRunRunsNothing) {
    TransferSettings settings;
    settings.scpBin = (test_dir / "no-such-scp").string();
    const SshBackend ssh(Location::parse("ssh://u@h/x"), settings);

    CopyOptions opts;
    opts.dry_run = true;
    EXPECT_EQ(ssh.copyFile("ssh://u@h/x/file", (test_dir / "file").string(), opts), 0u);
    EXPECT_FALSE(fs::exists(test_dir / "file"));
}

TEST_F(RemoteBackendTest, S3KeysAndArguments) {
    TransferSettings settings;
    settings.s3EndpointUrl = "https://minio.local:9000";
    const S3Backend s3(Location::parse("s3://bucket/base"), settings);

    EXPECT_EQ(s3.bucket(), "bucket");
    EXPECT_EQ(s3.keyOf("s3://bucket/base/x.txt"), "base/x.txt");
    EXPECT_EQ(s3.s3Url("s3://bucket/base/x.txt"), "s3://bucket/base/x.txt");
    EXPECT_EQ(s3.awsArgs({"s3", "ls"}), (Args{"aws", "s3", "ls", "--endpoint-url", "https://minio.local:9000"}));

    EXPECT_EQ(s3.cpArgs({}, "/l", "s3://bucket/k"),
              (Args{"aws", "s3", "cp", "/l", "s3://bucket/k", "--no-progress", "--only-show-errors",
                    "--endpoint-url", "https://minio.local:9000"}));

    CopyOptions progress;
    progress.progress = true;
    EXPECT_EQ(s3.cpArgs(progress, "/l", "s3://bucket/k"),
              (Args{"aws", "s3", "cp", "/l", "s3://bucket/k", "--endpoint-url", "https://minio.local:9000"}));
}

TEST_F(RemoteBackendTest, ParsesS3Listing) {
    const std::string output =
        "                           PRE photos/\n"
        "2024-01-02 10:00:00       1234 notes.txt\n"
        "2024-01-02 10:00:00          0 empty file.dat\n";

    const auto entries = S3Backend::parseLsOutput(output, "s3://b/base");
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].path, "s3://b/base/photos");
    EXPECT_TRUE(entries[0].is_dir);
    EXPECT_EQ(entries[1].size, 1234u);
    EXPECT_EQ(entries[2].path, "s3://b/base/empty file.dat");
}

TEST_F(RemoteBackendTest, ParsesETag) {
    EXPECT_EQ(S3Backend::parseETag(R"({"ETag": "\"0cc175b9c0f1b6a831c399e269772661\"", "ContentLength": 1})"),
              "0cc175b9c0f1b6a831c399e269772661");
    EXPECT_THROW(S3Backend::parseETag("not json"), BackendError);
    EXPECT_THROW(S3Backend::parseETag(R"({"ContentLength": 1})"), BackendError);
}

TEST_F(RemoteBackendTest, S3ChecksumIsMd5Only) {
    TransferSettings settings;
    settings.awsBin = fakeTool("aws", "cat <<'OUT'\n{\"ETag\": \"\\\"0cc175b9c0f1b6a831c399e269772661\\\"\"}\nOUT");
    const S3Backend s3(Location::parse("s3://bucket/base"), settings);

    EXPECT_EQ(s3.checksum("s3://bucket/base/a", ChecksumAlgorithm::Md5), "0cc175b9c0f1b6a831c399e269772661");
    EXPECT_EQ(kindOf([&] { (void)s3.checksum("s3://bucket/base/a", ChecksumAlgorithm::Sha1); }),
              BackendError::Kind::UnsupportedOperation);

    TransferSettings multipart;
    multipart.awsBin = fakeTool("aws-mp", "cat <<'OUT'\n{\"ETag\": \"\\\"9b2cf535f27731c974343645a3985328-3\\\"\"}\nOUT");
    const S3Backend big(Location::parse("s3://bucket/base"), multipart);
    EXPECT_EQ(kindOf([&] { (void)big.checksum("s3://bucket/base/big", ChecksumAlgorithm::Md5); }),
              BackendError::Kind::UnsupportedOperation);
}

TEST_F(RemoteBackendTest, HttpIsReadOnly) {
    const HttpBackend http(Location::parse("https://example.com/files"), {});

    EXPECT_EQ(http.url("https://example.com/files/a.bin"), "https://example.com/files/a.bin");
    EXPECT_EQ(kindOf([&] { (void)http.list("https://example.com/files"); }), BackendError::Kind::UnsupportedOperation);
    EXPECT_EQ(kindOf([&] { http.remove("https://example.com/files/a.bin"); }), BackendError::Kind::UnsupportedOperation);
    EXPECT_EQ(kindOf([&] { (void)http.copyFile((test_dir / "up").string(), "https://example.com/files/up", {}); }),
              BackendError::Kind::UnsupportedOperation);
}
