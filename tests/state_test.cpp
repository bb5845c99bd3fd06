#include <catch2/catch.hpp>

#include "common/temp_dir.hpp"
#include "mod_deployer/FileOps.hpp"
#include "mod_deployer/State.hpp"

using namespace moddep;
using namespace moddep::tests;

namespace {

	Mod makeMod(const std::string& id, const std::string& type = "")
	{
		Mod m;
		m.id = id;
		m.type = type;
		m.installationPath = id;
		return m;
	}

} // namespace

TEST_CASE("reducer tracks mods and their enabled flag", "[state]")
{
	AppState s;
	s = applyAction(s, actions::AddMod{ "g", makeMod("a") });
	s = applyAction(s, actions::AddMod{ "g", makeMod("b") });
	s = applyAction(s, actions::SetModEnabled{ "g", "a", true });

	REQUIRE(s.findMod("g", "a"));
	CHECK(s.isEnabled("g", "a"));
	CHECK_FALSE(s.isEnabled("g", "b"));
	CHECK_FALSE(s.findMod("other", "a"));

	s = applyAction(s, actions::SetModState{ "g", "b", ModState::Downloading });
	CHECK(s.findMod("g", "b")->state == ModState::Downloading);

	s = applyAction(s, actions::RemoveMod{ "g", "a" });
	CHECK_FALSE(s.findMod("g", "a"));
	CHECK_FALSE(s.isEnabled("g", "a"));
}

TEST_CASE("clearing the activator falls back to automatic selection", "[state]")
{
	AppState s;
	s = applyAction(s, actions::SetActivator{ "g", "symlink" });
	CHECK(s.activatorFor("g") == "symlink");

	s = applyAction(s, actions::SetActivator{ "g", "" });
	CHECK(s.activatorFor("g").empty());
	CHECK(s.activators.count("g") == 0);
}

TEST_CASE("deployment flag defaults to not necessary", "[state]")
{
	AppState s;
	CHECK_FALSE(s.needsDeployment("g"));
	s = applyAction(s, actions::SetDeploymentNecessary{ "g", true });
	CHECK(s.needsDeployment("g"));
}

TEST_CASE("listeners see previous and current state", "[state]")
{
	MemoryStateStore store;
	std::vector<std::pair<bool, bool>> seen;
	const int token = store.subscribe([&seen](const AppState& prev, const AppState& cur) {
		seen.emplace_back(prev.findMod("g", "a") != nullptr, cur.findMod("g", "a") != nullptr);
	});

	Error e;
	REQUIRE(store.dispatch(actions::AddMod{ "g", makeMod("a") }, &e));
	REQUIRE(seen.size() == 1);
	CHECK(seen[0] == std::make_pair(false, true));

	store.unsubscribe(token);
	REQUIRE(store.dispatch(actions::RemoveMod{ "g", "a" }, &e));
	CHECK(seen.size() == 1);
}

TEST_CASE("listeners may dispatch from inside a notification", "[state]")
{
	MemoryStateStore store;
	store.subscribe([&store](const AppState& prev, const AppState& cur) {
		if (!prev.findMod("g", "a") && cur.findMod("g", "a"))
		{
			Error e;
			store.dispatch(actions::SetDeploymentNecessary{ "g", true }, &e);
		}
	});

	Error e;
	REQUIRE(store.dispatch(actions::AddMod{ "g", makeMod("a") }, &e));
	const AppState s = store.snapshot();
	CHECK(s.findMod("g", "a"));
	CHECK(s.needsDeployment("g"));
}

TEST_CASE("yaml state survives a restart", "[state]")
{
	TempDir tmp("state");
	RecoveryPolicy recovery(nullptr, nullptr);
	FileOps files(recovery);
	const fs::path path = tmp / "nested" / "state.yaml";

	Mod mod = makeMod("skyui", "interface");
	mod.rules.push_back({ "after", "sse-engine-fixes" });
	mod.fileOverrides.push_back("interface/skyui.swf");

	Error e;
	{
		YamlStateStore store(files, path);
		REQUIRE(store.load(&e));
		REQUIRE(store.dispatch(actions::SetInstanceId{ "inst-1" }, &e));
		REQUIRE(store.dispatch(actions::SetActiveGame{ "skyrim" }, &e));
		REQUIRE(store.dispatch(actions::AddMod{ "skyrim", mod }, &e));
		REQUIRE(store.dispatch(actions::SetModEnabled{ "skyrim", "skyui", true }, &e));
		REQUIRE(store.dispatch(actions::SetActivator{ "skyrim", "symlink" }, &e));
		REQUIRE(store.dispatch(actions::SetDeploymentNecessary{ "skyrim", true }, &e));
	}
	REQUIRE(fs::exists(path));

	YamlStateStore reloaded(files, path);
	REQUIRE(reloaded.load(&e));
	const AppState s = reloaded.snapshot();
	CHECK(s.instanceId == "inst-1");
	CHECK(s.activeGameId == "skyrim");
	CHECK(s.activatorFor("skyrim") == "symlink");
	CHECK(s.needsDeployment("skyrim"));
	CHECK(s.isEnabled("skyrim", "skyui"));

	const Mod* loaded = s.findMod("skyrim", "skyui");
	REQUIRE(loaded);
	CHECK(loaded->type == "interface");
	CHECK(loaded->installationPath == fs::path("skyui"));
	CHECK(loaded->state == ModState::Installed);
	CHECK(loaded->rules == mod.rules);
	CHECK(loaded->fileOverrides == mod.fileOverrides);
}

TEST_CASE("missing state file starts empty, corrupt one is an error", "[state]")
{
	TempDir tmp("state");
	RecoveryPolicy recovery(nullptr, nullptr);
	FileOps files(recovery);

	Error e;
	YamlStateStore fresh(files, tmp / "none.yaml");
	REQUIRE(fresh.load(&e));
	CHECK(fresh.snapshot().mods.empty());

	writeText(tmp / "broken.yaml", "games: [unclosed");
	YamlStateStore broken(files, tmp / "broken.yaml");
	REQUIRE_FALSE(broken.load(&e));
	CHECK(e.kind == ErrorKind::Io);
}

TEST_CASE("loading keeps games registered from configuration", "[state]")
{
	TempDir tmp("state");
	RecoveryPolicy recovery(nullptr, nullptr);
	FileOps files(recovery);
	writeText(tmp / "state.yaml", "instance_id: abc\n");

	GameDescriptor game;
	game.id = "g";
	game.installPath = tmp / "game";

	YamlStateStore store(files, tmp / "state.yaml");
	Error e;
	REQUIRE(store.dispatch(actions::SetGame{ game }, &e));
	REQUIRE(store.load(&e));
	CHECK(store.snapshot().instanceId == "abc");
	CHECK(store.snapshot().findGame("g"));
}
