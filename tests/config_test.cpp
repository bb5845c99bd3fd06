#include <catch2/catch.hpp>

#include "common/temp_dir.hpp"
#include "mod_deployer/Config.hpp"

using namespace moddep;
using namespace moddep::tests;

TEST_CASE("minimal configuration gets defaults under the data root", "[config]")
{
	AppConfig cfg;
	std::string err;
	REQUIRE(parseConfig(
		"data_root: /var/lib/mods\n"
		"games:\n"
		"  - id: skyrim\n"
		"    install_path: /games/skyrim\n", cfg, &err));

	CHECK(cfg.dataRoot == fs::path("/var/lib/mods"));
	CHECK(cfg.stateFile == fs::path("/var/lib/mods/state.yaml"));
	CHECK(cfg.logDir == fs::path("/var/lib/mods/log"));
	CHECK(cfg.retry.count == 3);
	CHECK(cfg.copy.selfCopyCheck);
	CHECK(cfg.elevation.helperExe.filename() == "mod-deployer-elevate");
	CHECK(cfg.elevation.helperExe.is_absolute());

	REQUIRE(cfg.games.size() == 1);
	const GameDescriptor& game = cfg.games[0].descriptor;
	CHECK(game.id == "skyrim");
	CHECK(game.installPath == fs::path("/games/skyrim"));
	CHECK(game.stagingPath == fs::path("/var/lib/mods/skyrim/mods"));
	REQUIRE(game.modPaths.size() == 1);
	CHECK(game.modPaths.at("") == fs::path("."));
	CHECK(cfg.games[0].activator.empty());
}

TEST_CASE("full configuration is read as written", "[config]")
{
	AppConfig cfg;
	std::string err;
	REQUIRE(parseConfig(
		"instance_id: abc123\n"
		"data_root: /srv/mods\n"
		"state_file: /etc/mod_deployer/state.yaml\n"
		"log_dir: logs\n"
		"retry: { count: 5, delay_ms: 20 }\n"
		"elevation: { helper: /usr/libexec/mod-deployer-elevate, launcher: '' }\n"
		"copy: { self_copy_check: false }\n"
		"games:\n"
		"  - id: fallout4\n"
		"    install_path: /games/fo4\n"
		"    staging_path: /fast/fo4\n"
		"    activator: symlink\n"
		"    mod_paths: { '': Data, root: . }\n", cfg, &err));

	CHECK(cfg.instanceId == "abc123");
	CHECK(cfg.stateFile == fs::path("/etc/mod_deployer/state.yaml"));
	CHECK(cfg.logDir == fs::path("/srv/mods/logs"));
	CHECK(cfg.retry.count == 5);
	CHECK(cfg.retry.delay == std::chrono::milliseconds(20));
	CHECK(cfg.elevation.helperExe == fs::path("/usr/libexec/mod-deployer-elevate"));
	CHECK(cfg.elevation.launcher.empty());
	CHECK_FALSE(cfg.copy.selfCopyCheck);

	REQUIRE(cfg.games.size() == 1);
	CHECK(cfg.games[0].activator == "symlink");
	CHECK(cfg.games[0].descriptor.stagingPath == fs::path("/fast/fo4"));
	CHECK(cfg.games[0].descriptor.modPaths.at("") == fs::path("Data"));
	CHECK(cfg.games[0].descriptor.modPaths.at("root") == fs::path("."));
}

TEST_CASE("invalid configurations are rejected with a reason", "[config]")
{
	AppConfig cfg;
	std::string err;

	SECTION("game without id")
	{
		REQUIRE_FALSE(parseConfig("games:\n  - install_path: /g\n", cfg, &err));
		CHECK(err == "game without id");
	}
	SECTION("duplicate game")
	{
		REQUIRE_FALSE(parseConfig(
			"games:\n"
			"  - { id: g, install_path: /a }\n"
			"  - { id: g, install_path: /b }\n", cfg, &err));
		CHECK(err.find("duplicate") != std::string::npos);
	}
	SECTION("game without install path")
	{
		REQUIRE_FALSE(parseConfig("games:\n  - id: g\n", cfg, &err));
		CHECK(err.find("install_path") != std::string::npos);
	}
	SECTION("negative retry")
	{
		REQUIRE_FALSE(parseConfig("retry: { count: -1 }\n", cfg, &err));
		CHECK_FALSE(err.empty());
	}
	SECTION("not a mapping")
	{
		REQUIRE_FALSE(parseConfig("- a\n- b\n", cfg, &err));
	}
	SECTION("malformed yaml")
	{
		REQUIRE_FALSE(parseConfig("games: [", cfg, &err));
		CHECK_FALSE(err.empty());
	}
	SECTION("wrong value type")
	{
		REQUIRE_FALSE(parseConfig("retry: { count: many }\n", cfg, &err));
	}
}

TEST_CASE("configuration file errors name the file", "[config]")
{
	TempDir tmp("config");
	AppConfig cfg;
	std::string err;

	REQUIRE_FALSE(loadConfig(tmp / "missing.yaml", cfg, &err));
	CHECK(err.find("missing.yaml") != std::string::npos);

	writeText(tmp / "bad.yaml", "games:\n  - id: g\n");
	REQUIRE_FALSE(loadConfig(tmp / "bad.yaml", cfg, &err));
	CHECK(err.find("bad.yaml") != std::string::npos);

	writeText(tmp / "good.yaml", "data_root: " + tmp.path().string() + "\n");
	REQUIRE(loadConfig(tmp / "good.yaml", cfg, &err));
	CHECK(cfg.games.empty());
}

TEST_CASE("instance ids are random", "[config]")
{
	const std::string a = generateInstanceId();
	const std::string b = generateInstanceId();
	CHECK_FALSE(a.empty());
	CHECK(a != b);
}
