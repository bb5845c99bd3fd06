#include <catch2/catch.hpp>

#include <cerrno>
#include <string>
#include <thread>

#include <unistd.h>

#include "common/temp_dir.hpp"
#include "mod_deployer/Elevation.hpp"
#include "mod_deployer/Platform.hpp"
#include "mod_deployer/Process.hpp"
#include "platform/ChannelImpl.hpp"
#include "platform/PlatformImpl.hpp"

using namespace moddep;
using namespace moddep::tests;

namespace {

	//---Исполняемый shell-скрипт вместо pkexec
	fs::path writeLauncher(const TempDir& tmp, const std::string& name, const std::string& body)
	{
		const fs::path script = tmp / name;
		writeText(script, "#!/bin/sh\n" + body + "\n");
		fs::permissions(script, fs::perms::owner_all, fs::perm_options::replace);
		return script;
	}

	ElevationOptions helperOptions(const fs::path& launcher)
	{
		ElevationOptions o;
		o.helperExe = MOD_DEPLOYER_ELEVATE_EXE;
		o.launcher = launcher;
		return o;
	}

} // namespace

TEST_CASE("elevation request survives the channel encoding", "[elevation]")
{
	ElevationRequest request = elevated::grantAccess("/games/My Game/Data: mods", true);
	CHECK(request.function == elevated::kEnsureDirAccess);
	CHECK(request.params.at("uid") == std::to_string(currentUser().uid));

	ElevationRequest decoded;
	std::string err;
	REQUIRE(elevated::decodeRequest(elevated::encodeRequest(request), decoded, &err));
	CHECK(decoded.function == request.function);
	CHECK(decoded.params == request.params);

	CHECK_FALSE(elevated::decodeRequest("function: [unclosed", decoded, &err));
	CHECK_FALSE(err.empty());
}

TEST_CASE("elevation response keeps outcome, code and message", "[elevation]")
{
	ElevationResponse response;
	response.outcome = ElevationOutcome::Declined;
	response.code = 126;
	response.message = "dismissed: by user";

	ElevationResponse decoded;
	std::string err;
	REQUIRE(elevated::decodeResponse(elevated::encodeResponse(response), decoded, &err));
	CHECK(decoded.outcome == ElevationOutcome::Declined);
	CHECK(decoded.code == 126);
	CHECK(decoded.message == "dismissed: by user");

	REQUIRE(elevated::decodeResponse("outcome: success", decoded, &err));
	CHECK(decoded.outcome == ElevationOutcome::Success);
	CHECK(decoded.code == 0);

	CHECK_FALSE(elevated::decodeResponse("outcome: maybe", decoded, &err));
	CHECK(err.find("maybe") != std::string::npos);
}

TEST_CASE("helper functions run against the current user", "[elevation]")
{
	TempDir tmp{ "elevation_exec" };

	SECTION("ensure-dir-access creates the directory")
	{
		const fs::path dir = tmp / "a" / "b";
		const ElevationResponse r = elevated::execute(elevated::grantAccess(dir, true));
		CHECK(r.outcome == ElevationOutcome::Success);
		CHECK(fs::is_directory(dir));
	}
	SECTION("grant-access adds owner rights")
	{
		const fs::path file = tmp / "locked.txt";
		writeText(file, "x");
		fs::permissions(file, fs::perms::owner_read, fs::perm_options::replace);

		const ElevationResponse r = elevated::execute(elevated::grantAccess(file, false));
		CHECK(r.outcome == ElevationOutcome::Success);
		CHECK((fs::status(file).permissions() & fs::perms::owner_all) == fs::perms::owner_all);
	}
	SECTION("missing path")
	{
		const ElevationResponse r = elevated::execute(elevated::grantAccess(tmp / "missing.txt", false));
		CHECK(r.outcome == ElevationOutcome::Error);
		CHECK(r.code == ENOENT);
	}
	SECTION("malformed requests")
	{
		ElevationRequest request = elevated::grantAccess(tmp.path(), false);
		request.function = "format-disk";
		CHECK(elevated::execute(request).code == ENOSYS);

		request = elevated::grantAccess(tmp.path(), false);
		request.params.erase("uid");
		CHECK(elevated::execute(request).code == EINVAL);

		request = elevated::grantAccess(tmp.path(), false);
		request.params["gid"] = "nobody";
		CHECK(elevated::execute(request).code == EINVAL);
	}
}

TEST_CASE("channel reports a helper that never connects", "[elevation]")
{
	platform::LocalChannel channel;
	std::string err;
	REQUIRE(channel.listen(platform::runtimeDir(), "mod_deployer_test_" + std::to_string(::getpid()), &err));
	const fs::path endpoint = channel.endpoint();
	CHECK(fs::exists(endpoint));

	process::SpawnResult sr;
	REQUIRE(process::spawn("/bin/sh", { "-c", "exit 5" }, sr));

	process::ExitStatus exit;
	CHECK(channel.waitForPeer(sr.pid, exit, &err) == platform::LocalChannel::WaitResult::ChildExited);
	CHECK(exit.exited);
	CHECK(exit.exitCode == 5);

	channel.close();
	CHECK_FALSE(fs::exists(endpoint));
}

TEST_CASE("channel carries one request and an optional reply", "[elevation]")
{
	const bool reply = GENERATE(true, false);

	platform::LocalChannel server;
	std::string err;
	REQUIRE(server.listen(platform::runtimeDir(), "mod_deployer_test_" + std::to_string(::getpid()), &err));

	process::SpawnResult sr;
	REQUIRE(process::spawn("/bin/sh", { "-c", "sleep 5" }, sr));

	std::string received;
	std::thread client([&]() {
		platform::LocalChannel peer;
		std::string clientErr;
		if (!platform::LocalChannel::connect(server.endpoint(), peer, &clientErr)) return;
		if (!peer.receiveAll(received, &clientErr)) return;
		if (reply) peer.sendAll("outcome: success", &clientErr);
	});

	process::ExitStatus exit;
	const auto waited = server.waitForPeer(sr.pid, exit, &err);
	std::string answer;
	const bool exchanged = waited == platform::LocalChannel::WaitResult::Connected
		&& server.sendAll("function: grant-access", &err) && server.receiveAll(answer, &err);
	client.join();

	process::terminate(sr.pid);
	process::ExitStatus ignored;
	process::wait(sr.pid, ignored);

	REQUIRE(exchanged);
	CHECK(received == "function: grant-access");
	CHECK(answer == (reply ? "outcome: success" : ""));
}

TEST_CASE("launcher exit codes map to distinct outcomes", "[elevation]")
{
	TempDir tmp{ "elevation_launcher" };
	const ElevationRequest request = elevated::grantAccess(tmp / "dir", true);

	SECTION("authentication dismissed")
	{
		auto helper = makeElevatedHelper(helperOptions(writeLauncher(tmp, "dismissed.sh", "exit 126")));
		const ElevationResponse r = helper->run(request);
		CHECK(r.outcome == ElevationOutcome::Declined);
		CHECK(r.code == 126);
	}
	SECTION("not authorized")
	{
		auto helper = makeElevatedHelper(helperOptions(writeLauncher(tmp, "refused.sh", "exit 127")));
		CHECK(helper->run(request).outcome == ElevationOutcome::Declined);
	}
	SECTION("launcher failure")
	{
		auto helper = makeElevatedHelper(helperOptions(writeLauncher(tmp, "broken.sh", "exit 3")));
		const ElevationResponse r = helper->run(request);
		CHECK(r.outcome == ElevationOutcome::Error);
		CHECK(r.code == 3);
	}
	SECTION("launcher starts the helper")
	{
		auto helper = makeElevatedHelper(helperOptions(writeLauncher(tmp, "passthrough.sh", "exec \"$@\"")));
		const ElevationResponse r = helper->run(request);
		CHECK(r.outcome == ElevationOutcome::Success);
		CHECK(fs::is_directory(tmp / "dir"));
	}
}

TEST_CASE("helper started directly performs the request", "[elevation]")
{
	TempDir tmp{ "elevation_direct" };
	auto helper = makeElevatedHelper(helperOptions(""));

	const ElevationResponse created = helper->run(elevated::grantAccess(tmp / "made" / "here", true));
	CHECK(created.outcome == ElevationOutcome::Success);
	CHECK(fs::is_directory(tmp / "made" / "here"));

	const ElevationResponse missing = helper->run(elevated::grantAccess(tmp / "missing.txt", false));
	CHECK(missing.outcome == ElevationOutcome::Error);
	CHECK(missing.code == ENOENT);

	ElevationOptions absent;
	absent.helperExe = tmp / "no-such-helper";
	absent.launcher.clear();
	const ElevationResponse failed = makeElevatedHelper(absent)->run(elevated::grantAccess(tmp.path(), true));
	CHECK(failed.outcome == ElevationOutcome::Error);
}
