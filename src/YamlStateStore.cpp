#include "mod_deployer/State.hpp"
#include "mod_deployer/FileOps.hpp"

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace moddep {

	YamlStateStore::YamlStateStore(const FileOps& files, fs::path path)
		: files_(files), path_(std::move(path))
	{
	}
	//------------------------------------------------------------
	//	Игры приходят из конфигурации и в файл не пишутся
	//------------------------------------------------------------
	std::string YamlStateStore::encode(const AppState& state)
	{
		YAML::Emitter out;
		out << YAML::BeginMap;
		out << YAML::Key << "instance_id" << YAML::Value << state.instanceId;
		out << YAML::Key << "active_game" << YAML::Value << state.activeGameId;

		out << YAML::Key << "games" << YAML::Value << YAML::BeginMap;
		std::set<std::string> gameIds;
		for (const auto& kv : state.mods) gameIds.insert(kv.first);
		for (const auto& kv : state.activators) gameIds.insert(kv.first);
		for (const auto& kv : state.deploymentNecessary) gameIds.insert(kv.first);

		for (const std::string& gameId : gameIds)
		{
			out << YAML::Key << gameId << YAML::Value << YAML::BeginMap;
			out << YAML::Key << "activator" << YAML::Value << state.activatorFor(gameId);
			out << YAML::Key << "deployment_necessary" << YAML::Value << state.needsDeployment(gameId);

			out << YAML::Key << "mods" << YAML::Value << YAML::BeginSeq;
			const auto mods = state.mods.find(gameId);
			if (mods != state.mods.end())
			{
				for (const auto& m : mods->second)
				{
					const Mod& mod = m.second;
					out << YAML::BeginMap;
					out << YAML::Key << "id" << YAML::Value << mod.id;
					out << YAML::Key << "type" << YAML::Value << mod.type;
					out << YAML::Key << "installation_path" << YAML::Value << mod.installationPath.generic_string();
					out << YAML::Key << "state" << YAML::Value << toString(mod.state);
					out << YAML::Key << "enabled" << YAML::Value << state.isEnabled(gameId, mod.id);
					if (!mod.rules.empty())
					{
						out << YAML::Key << "rules" << YAML::Value << YAML::BeginSeq;
						for (const ModRule& r : mod.rules)
						{
							out << YAML::Flow << YAML::BeginMap
								<< YAML::Key << "type" << YAML::Value << r.type
								<< YAML::Key << "reference" << YAML::Value << r.reference
								<< YAML::EndMap;
						}
						out << YAML::EndSeq;
					}
					if (!mod.fileOverrides.empty())
					{
						out << YAML::Key << "file_overrides" << YAML::Value << YAML::Flow << mod.fileOverrides;
					}
					out << YAML::EndMap;
				}
			}
			out << YAML::EndSeq;
			out << YAML::EndMap;
		}
		out << YAML::EndMap;
		out << YAML::EndMap;
		return out.c_str();
	}

	bool YamlStateStore::decode(const std::string& text, AppState& out, std::string* error)
	{
		try
		{
			const YAML::Node root = YAML::Load(text);
			if (root.IsNull()) return true;
			if (!root.IsMap())
			{
				if (error) *error = "state file is not a mapping";
				return false;
			}

			if (root["instance_id"]) out.instanceId = root["instance_id"].as<std::string>();
			if (root["active_game"]) out.activeGameId = root["active_game"].as<std::string>();

			if (const YAML::Node games = root["games"])
			{
				for (const auto& g : games)
				{
					const std::string gameId = g.first.as<std::string>();
					const YAML::Node node = g.second;

					const std::string activator = node["activator"] ? node["activator"].as<std::string>() : std::string();
					if (!activator.empty()) out.activators[gameId] = activator;
					if (node["deployment_necessary"]) out.deploymentNecessary[gameId] = node["deployment_necessary"].as<bool>();

					if (const YAML::Node mods = node["mods"])
					{
						for (const auto& m : mods)
						{
							Mod mod;
							mod.id = m["id"].as<std::string>();
							mod.type = m["type"] ? m["type"].as<std::string>() : std::string();
							mod.installationPath = m["installation_path"] ? m["installation_path"].as<std::string>() : mod.id;
							if (m["state"] && !parseModState(m["state"].as<std::string>(), mod.state))
							{
								if (error) *error = "mod \"" + mod.id + "\" has unknown state";
								return false;
							}
							if (const YAML::Node rules = m["rules"])
							{
								for (const auto& r : rules)
								{
									mod.rules.push_back(ModRule{ r["type"].as<std::string>(), r["reference"].as<std::string>() });
								}
							}
							if (m["file_overrides"]) mod.fileOverrides = m["file_overrides"].as<std::vector<std::string>>();

							if (m["enabled"] && m["enabled"].as<bool>()) out.enabledMods[gameId].insert(mod.id);
							out.mods[gameId][mod.id] = std::move(mod);
						}
					}
				}
			}
			return true;
		}
		catch (const YAML::Exception& e)
		{
			if (error) *error = e.what();
			return false;
		}
	}

	bool YamlStateStore::load(Error* error)
	{
		if (!files_.exists(path_))
		{
			LOG(INFO) << "state file " << path_ << " not found, starting empty";
			return true;
		}

		std::string text;
		if (!files_.readFile(path_, text, error)) return false;

		AppState loaded;
		std::string parseErr;
		if (!decode(text, loaded, &parseErr))
		{
			return fail(error, makeError(ErrorKind::Io, "state file " + path_.string() + " is corrupt: " + parseErr, path_));
		}

		//---Игры из конфигурации сохраняются
		loaded.games = state_.games;
		state_ = std::move(loaded);
		LOG(INFO) << "state loaded from " << path_;
		return true;
	}

	bool YamlStateStore::persist(const AppState& state, Error* error)
	{
		if (path_.has_parent_path() && !files_.ensureDir(path_.parent_path(), error)) return false;

		fs::path tmp = path_;
		tmp += ".tmp";
		if (!files_.writeFile(tmp, encode(state), error)) return false;
		return files_.rename(tmp, path_, error);
	}

};//---namespace moddep
