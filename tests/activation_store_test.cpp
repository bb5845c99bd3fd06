#include <catch2/catch.hpp>

#include "common/temp_dir.hpp"
#include "mod_deployer/ActivationStore.hpp"
#include "mod_deployer/FileOps.hpp"

using namespace moddep;
using namespace moddep::tests;

namespace {

	struct Fixture {
		RecoveryPolicy recovery{ nullptr, nullptr };
		FileOps files{ recovery };
		ActivationStore store{ files, "inst-1" };
		TempDir tmp{ "activation_store" };
	};

	DeployedEntry entry(const std::string& rel, const std::string& mod, const std::string& method)
	{
		DeployedEntry e;
		e.relPath = rel;
		e.modId = mod;
		e.source = mod;
		e.methodId = method;
		e.contentId = "1:" + rel;
		return e;
	}

} // namespace

TEST_CASE("manifest file is named after the mod type", "[activation_store]")
{
	CHECK(ActivationStore::manifestPath("/t", "") == fs::path("/t/.mod_deployer.default.yaml"));
	CHECK(ActivationStore::manifestPath("/t", "enb") == fs::path("/t/.mod_deployer.enb.yaml"));
}

TEST_CASE_METHOD(Fixture, "saved manifest is loaded back", "[activation_store]")
{
	ActivationManifest m;
	m.files["textures/a.dds"] = entry("textures/a.dds", "modA", "hardlink");
	DeployedEntry stale = entry("b.esp", "modB", "hardlink");
	stale.stale = true;
	m.files["b.esp"] = stale;

	Error e;
	REQUIRE(store.save("", "inst-1", tmp.path(), m, "hardlink", &e));
	CHECK(fs::exists(ActivationStore::manifestPath(tmp.path(), "")));
	CHECK_FALSE(fs::exists(tmp / ".mod_deployer.default.yaml.tmp"));

	ActivationManifest loaded;
	REQUIRE(store.load("", tmp.path(), "hardlink", loaded, &e));
	CHECK(loaded.instanceId == "inst-1");
	CHECK(loaded.methodId == "hardlink");
	REQUIRE(loaded.files.size() == 2);

	const DeployedEntry& a = loaded.files.at("textures/a.dds");
	CHECK(a.relPath == fs::path("textures/a.dds"));
	CHECK(a.modId == "modA");
	CHECK(a.source == fs::path("modA"));
	CHECK(a.contentId == "1:textures/a.dds");
	CHECK_FALSE(a.stale);
	CHECK(loaded.files.at("b.esp").stale);
}

TEST_CASE_METHOD(Fixture, "saving an empty manifest removes the file", "[activation_store]")
{
	ActivationManifest m;
	m.files["a"] = entry("a", "modA", "copy");

	Error e;
	REQUIRE(store.save("", "inst-1", tmp.path(), m, "copy", &e));
	REQUIRE(store.save("", "inst-1", tmp.path(), ActivationManifest{}, "copy", &e));
	CHECK_FALSE(fs::exists(ActivationStore::manifestPath(tmp.path(), "")));
}

TEST_CASE_METHOD(Fixture, "missing or corrupt manifests mean nothing is deployed", "[activation_store]")
{
	ActivationManifest loaded;
	Error e;

	SECTION("missing")
	{
		REQUIRE(store.load("", tmp.path(), "symlink", loaded, &e));
	}
	SECTION("corrupt")
	{
		writeText(ActivationStore::manifestPath(tmp.path(), ""), "version: 1\nfiles: [ {path: a");
		REQUIRE(store.load("", tmp.path(), "symlink", loaded, &e));
	}
	SECTION("unknown version")
	{
		writeText(ActivationStore::manifestPath(tmp.path(), ""), "version: 7\nfiles: []\n");
		REQUIRE(store.load("", tmp.path(), "symlink", loaded, &e));
	}

	CHECK(loaded.empty());
	CHECK(loaded.instanceId == "inst-1");
	CHECK(loaded.methodId == "symlink");
}

TEST_CASE_METHOD(Fixture, "fallback purge removes deployed artifacts and keeps foreign files", "[activation_store]")
{
	const fs::path staging = tmp / "staging";
	const fs::path game = tmp / "game";
	writeText(staging / "modA" / "textures" / "sky.dds", "sky");
	writeText(game / "Data" / "plugin.esp", "deployed by manifest");
	writeText(game / "Data" / "user.ini", "user file");
	fs::create_directories(game / "Data" / "textures");
	fs::create_symlink(staging / "modA" / "textures" / "sky.dds", game / "Data" / "textures" / "sky.dds");
	fs::create_symlink(tmp / "elsewhere.txt", game / "Data" / "foreign_link");

	ActivationManifest m;
	m.files["plugin.esp"] = entry("plugin.esp", "modA", "copy");
	Error e;
	REQUIRE(store.save("", "inst-old", game / "Data", m, "copy", &e));

	GameDescriptor descriptor;
	descriptor.id = "g";
	descriptor.installPath = game;
	descriptor.stagingPath = staging;
	descriptor.modPaths[""] = "Data";
	descriptor.modPaths["missing"] = "NotThere";

	REQUIRE(store.fallbackPurge(makeContext(descriptor, ""), &e));
	CHECK_FALSE(fs::exists(game / "Data" / "plugin.esp"));
	CHECK_FALSE(fs::exists(fs::symlink_status(game / "Data" / "textures" / "sky.dds")));
	CHECK_FALSE(fs::exists(game / "Data" / "textures"));
	CHECK_FALSE(fs::exists(ActivationStore::manifestPath(game / "Data", "")));
	CHECK(fs::exists(game / "Data" / "user.ini"));
	CHECK(fs::is_symlink(fs::symlink_status(game / "Data" / "foreign_link")));
	CHECK(fs::exists(staging / "modA" / "textures" / "sky.dds"));
}
