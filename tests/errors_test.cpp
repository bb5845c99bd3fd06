#include <catch2/catch.hpp>

#include <cerrno>

#include "mod_deployer/Errors.hpp"

using namespace moddep;

namespace {
	std::error_code posix(int e) { return std::error_code(e, std::generic_category()); }
}

TEST_CASE("os errors are classified by errno", "[errors]")
{
	CHECK(classify(std::error_code()) == OsErrorClass::None);
	CHECK(classify(posix(ENOENT)) == OsErrorClass::NotFound);
	CHECK(classify(posix(EEXIST)) == OsErrorClass::Exists);
	CHECK(classify(posix(EBUSY)) == OsErrorClass::Busy);
	CHECK(classify(posix(ETXTBSY)) == OsErrorClass::Busy);
	CHECK(classify(posix(ENOSPC)) == OsErrorClass::DiskFull);
	CHECK(classify(posix(EACCES)) == OsErrorClass::Permission);
	CHECK(classify(posix(EPERM)) == OsErrorClass::Permission);
	CHECK(classify(posix(EINVAL)) == OsErrorClass::Other);
	CHECK(classify(std::error_code(EBUSY, std::system_category())) == OsErrorClass::Busy);
}

TEST_CASE("os error kind follows the error class", "[errors]")
{
	const Backtrace trace = Backtrace::capture();

	const Error busy = makeOsError(posix(EBUSY), "unlink", "/tmp/x", trace);
	CHECK(busy.kind == ErrorKind::TransientIo);
	CHECK(busy.code == posix(EBUSY));
	CHECK(busy.path == fs::path("/tmp/x"));

	CHECK(makeOsError(posix(ENOSPC), "write", "/tmp/x", trace).kind == ErrorKind::TransientIo);
	CHECK(makeOsError(posix(EACCES), "write", "/tmp/x", trace).kind == ErrorKind::PermissionDenied);
	CHECK(makeOsError(posix(ENOENT), "read", "/tmp/x", trace).kind == ErrorKind::Io);
}

TEST_CASE("report is offered only for unexpected failures", "[errors]")
{
	CHECK_FALSE(allowReport(userCanceled()));
	CHECK_FALSE(allowReport(makeError(ErrorKind::TemporaryError, "busy")));
	CHECK_FALSE(allowReport(makeError(ErrorKind::ProcessCanceled, "not applicable")));

	Error notFound = makeError(ErrorKind::Io, "missing");
	notFound.code = posix(ENOENT);
	CHECK_FALSE(allowReport(notFound));

	Error io = makeError(ErrorKind::Io, "broken");
	io.code = posix(EIO);
	CHECK(allowReport(io));
}

TEST_CASE("backtrace is rendered only on demand", "[errors]")
{
	Error e = makeOsError(posix(EIO), "read", "/tmp/file", Backtrace::capture());
	REQUIRE_FALSE(e.backtrace.empty());

	const std::string brief = describe(e, false);
	CHECK(brief.find("Io: read failed for '/tmp/file'") == 0);
	CHECK(brief.find('\n') == std::string::npos);

	const std::string full = describe(e);
	CHECK(full.size() > brief.size());

	const Error copy = e;
	CHECK(&copy.backtrace.render() == &e.backtrace.render());
}

TEST_CASE("copies taken before rendering share the rendered backtrace", "[errors]")
{
	const Backtrace trace = Backtrace::capture();
	const Backtrace early = trace;
	const Error e = makeOsError(posix(EIO), "write", "/tmp/file", trace);

	const std::string& text = early.render();
	CHECK(&trace.render() == &text);
	CHECK(&e.backtrace.render() == &text);
}
