#include <catch2/catch.hpp>

#include <algorithm>
#include <cerrno>

#include <unistd.h>

#include "common/fakes.hpp"
#include "common/temp_dir.hpp"
#include "mod_deployer/FileOps.hpp"

using namespace moddep;
using namespace moddep::tests;

namespace {

	struct Fixture {
		RecoveryPolicy recovery{ nullptr, nullptr };
		FileOps files{ recovery };
		TempDir tmp{ "file_ops" };
	};

} // namespace

TEST_CASE_METHOD(Fixture, "removing a missing path succeeds", "[file_ops]")
{
	Error e;
	CHECK(files.remove(tmp / "missing", &e));
	CHECK(files.unlink(tmp / "missing", &e));
	CHECK(files.rmdir(tmp / "missing", &e));
	CHECK(files.unlink(tmp / "missing" / "deeper" / "file", &e));
}

TEST_CASE_METHOD(Fixture, "remove deletes a whole tree", "[file_ops]")
{
	writeText(tmp / "tree" / "a" / "b.txt", "b");
	writeText(tmp / "tree" / "c.txt", "c");

	Error e;
	REQUIRE(files.remove(tmp / "tree", &e));
	CHECK_FALSE(fs::exists(tmp / "tree"));
}

TEST_CASE_METHOD(Fixture, "unlink refuses directories", "[file_ops]")
{
	fs::create_directories(tmp / "dir");

	Error e;
	REQUIRE_FALSE(files.unlink(tmp / "dir", &e));
	CHECK(e.kind == ErrorKind::Io);
	CHECK(e.path == tmp / "dir");
	CHECK(fs::is_directory(tmp / "dir"));
}

TEST_CASE_METHOD(Fixture, "rmdir refuses non-empty directories", "[file_ops]")
{
	writeText(tmp / "dir" / "file", "x");

	Error e;
	REQUIRE_FALSE(files.rmdir(tmp / "dir", &e));
	CHECK(fs::exists(tmp / "dir" / "file"));

	fs::remove(tmp / "dir" / "file");
	REQUIRE(files.rmdir(tmp / "dir", &e));
	CHECK_FALSE(fs::exists(tmp / "dir"));
}

TEST_CASE_METHOD(Fixture, "reading a missing file reports the os error", "[file_ops]")
{
	std::string text;
	Error e;
	REQUIRE_FALSE(files.readFile(tmp / "missing.txt", text, &e));
	CHECK(e.kind == ErrorKind::Io);
	CHECK(classify(e.code) == OsErrorClass::NotFound);
	CHECK(e.path == tmp / "missing.txt");
	CHECK_FALSE(e.backtrace.empty());
}

TEST_CASE_METHOD(Fixture, "write and read file contents", "[file_ops]")
{
	Error e;
	REQUIRE(files.writeFile(tmp / "data.bin", std::string("a\0b", 3), &e));

	std::string text;
	REQUIRE(files.readFile(tmp / "data.bin", text, &e));
	CHECK(text == std::string("a\0b", 3));
}

TEST_CASE_METHOD(Fixture, "ensureDir creates nested directories and tolerates existing ones", "[file_ops]")
{
	Error e;
	REQUIRE(files.ensureDir(tmp / "a" / "b" / "c", &e));
	CHECK(fs::is_directory(tmp / "a" / "b" / "c"));
	REQUIRE(files.ensureDir(tmp / "a" / "b" / "c", &e));
}

TEST_CASE_METHOD(Fixture, "ensureDirWritable leaves no canary behind", "[file_ops]")
{
	Error e;
	REQUIRE(files.ensureDirWritable(tmp / "target", &e));
	CHECK(fs::is_directory(tmp / "target"));
	CHECK(fs::is_empty(tmp / "target"));
}

TEST_CASE_METHOD(Fixture, "copy replaces the destination atomically", "[file_ops]")
{
	writeText(tmp / "src.txt", "new content");
	writeText(tmp / "dest.txt", "old");

	Error e;
	REQUIRE(files.copy(tmp / "src.txt", tmp / "dest.txt", &e));
	CHECK(readText(tmp / "dest.txt") == "new content");
	CHECK_FALSE(fs::exists(tmp / "dest.txt.tmp_copy"));
}

TEST_CASE_METHOD(Fixture, "copy onto a hardlink of the source is rejected", "[file_ops]")
{
	writeText(tmp / "src.txt", "payload");
	fs::create_hard_link(tmp / "src.txt", tmp / "link.txt");

	Error e;
	REQUIRE_FALSE(files.copy(tmp / "src.txt", tmp / "link.txt", &e));
	CHECK(e.kind == ErrorKind::Io);
	CHECK(e.message.find("same file") != std::string::npos);
	CHECK(readText(tmp / "src.txt") == "payload");
}

TEST_CASE_METHOD(Fixture, "copy without the self-copy check keeps data intact", "[file_ops]")
{
	writeText(tmp / "src.txt", "payload");
	fs::create_hard_link(tmp / "src.txt", tmp / "link.txt");

	CopyOptions options;
	options.selfCopyCheck = false;
	Error e;
	REQUIRE(files.copy(tmp / "src.txt", tmp / "link.txt", options, &e));
	CHECK(readText(tmp / "src.txt") == "payload");
	CHECK(readText(tmp / "link.txt") == "payload");
	CHECK_FALSE(fs::equivalent(tmp / "src.txt", tmp / "link.txt"));
}

TEST_CASE("copy defaults come from the constructor", "[file_ops]")
{
	RecoveryPolicy recovery(nullptr, nullptr);
	CopyOptions options;
	options.selfCopyCheck = false;
	FileOps files(recovery, options);
	TempDir tmp("file_ops");

	writeText(tmp / "src.txt", "payload");
	fs::create_hard_link(tmp / "src.txt", tmp / "link.txt");

	Error e;
	REQUIRE(files.copy(tmp / "src.txt", tmp / "link.txt", &e));
	CHECK(readText(tmp / "link.txt") == "payload");
}

TEST_CASE_METHOD(Fixture, "rename and move replace existing files", "[file_ops]")
{
	writeText(tmp / "a.txt", "a");
	writeText(tmp / "b.txt", "b");

	Error e;
	REQUIRE(files.rename(tmp / "a.txt", tmp / "b.txt", &e));
	CHECK_FALSE(fs::exists(tmp / "a.txt"));
	CHECK(readText(tmp / "b.txt") == "a");

	REQUIRE(files.move(tmp / "b.txt", tmp / "c.txt", &e));
	CHECK_FALSE(fs::exists(tmp / "b.txt"));
	CHECK(readText(tmp / "c.txt") == "a");
}

TEST_CASE_METHOD(Fixture, "hardlinks share their identity", "[file_ops]")
{
	writeText(tmp / "a.txt", "a");
	writeText(tmp / "other.txt", "o");

	Error e;
	REQUIRE(files.link(tmp / "a.txt", tmp / "b.txt", &e));

	FileId a, b, other;
	REQUIRE(files.identity(tmp / "a.txt", a, &e));
	REQUIRE(files.identity(tmp / "b.txt", b, &e));
	REQUIRE(files.identity(tmp / "other.txt", other, &e));
	CHECK(a == b);
	CHECK(a != other);
}

TEST_CASE_METHOD(Fixture, "symlinks are inspected without being followed", "[file_ops]")
{
	writeText(tmp / "target.txt", "t");

	Error e;
	REQUIRE(files.symlink(tmp / "target.txt", tmp / "link", &e));

	fs::path target;
	REQUIRE(files.readLink(tmp / "link", target, &e));
	CHECK(target == tmp / "target.txt");

	fs::file_status st;
	REQUIRE(files.lstat(tmp / "link", st, &e));
	CHECK(fs::is_symlink(st));

	fs::remove(tmp / "target.txt");
	CHECK(files.exists(tmp / "link"));
	REQUIRE(files.unlink(tmp / "link", &e));
	CHECK_FALSE(files.exists(tmp / "link"));
}

TEST_CASE("unwritable directory goes through the recovery dialog", "[file_ops]")
{
	//---root пишет в любую директорию
	if (geteuid() == 0)
	{
		WARN("running as root, directory permissions are not enforced");
		return;
	}

	TempDir tmp{ "file_ops_ro" };
	const fs::path dir = tmp / "locked";
	fs::create_directories(dir);
	fs::permissions(dir, fs::perms::owner_read | fs::perms::owner_exec, fs::perm_options::replace);

	FakeElevatedHelper helper;
	helper.response.outcome = ElevationOutcome::Success;
	Error e;

	SECTION("headless")
	{
		RecoveryPolicy recovery(nullptr, &helper);
		FileOps files(recovery);
		REQUIRE_FALSE(files.ensureDirWritable(dir, &e));
		CHECK(e.kind == ErrorKind::PermissionDenied);
		CHECK(helper.requests.empty());
	}
	SECTION("permission given, then canceled")
	{
		FakeDialog dialog({ 2 });
		RecoveryPolicy recovery(&dialog, &helper);
		FileOps files(recovery);
		REQUIRE_FALSE(files.ensureDirWritable(dir, &e));
		CHECK(e.kind == ErrorKind::UserCanceled);
		CHECK(dialog.calls() == 2);
		CHECK(helper.requests.size() == 1);
	}

	fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace);
	CHECK_FALSE(fs::exists(dir / FileOps::kCanaryName));
}

TEST_CASE_METHOD(Fixture, "readDir lists direct children and chmod replaces permissions", "[file_ops]")
{
	writeText(tmp / "dir" / "a.txt", "a");
	writeText(tmp / "dir" / "sub" / "b.txt", "b");

	std::vector<fs::path> out;
	Error e;
	REQUIRE(files.readDir(tmp / "dir", out, &e));
	std::sort(out.begin(), out.end());
	REQUIRE(out.size() == 2);
	CHECK(out[0] == tmp / "dir" / "a.txt");
	CHECK(out[1] == tmp / "dir" / "sub");

	REQUIRE(files.chmod(tmp / "dir" / "a.txt", fs::perms::owner_read, &e));
	const fs::perms p = fs::status(tmp / "dir" / "a.txt").permissions();
	CHECK((p & fs::perms::all) == fs::perms::owner_read);
	REQUIRE(files.chmod(tmp / "dir" / "a.txt", fs::perms::owner_read | fs::perms::owner_write, &e));
}

TEST_CASE_METHOD(Fixture, "walkFiles lists files relative to the root", "[file_ops]")
{
	writeText(tmp / "mod" / "a.txt", "a");
	writeText(tmp / "mod" / "sub" / "b.txt", "b");
	fs::create_directories(tmp / "mod" / "empty");

	std::vector<fs::path> out;
	Error e;
	REQUIRE(files.walkFiles(tmp / "mod", out, &e));
	std::sort(out.begin(), out.end());
	REQUIRE(out.size() == 2);
	CHECK(out[0] == fs::path("a.txt"));
	CHECK(out[1] == fs::path("sub") / "b.txt");
}
