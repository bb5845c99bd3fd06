#include "mod_deployer/Config.hpp"
#include "mod_deployer/Paths.hpp"

#include <cstdint>
#include <fstream>
#include <random>
#include <set>
#include <sstream>

#include <yaml-cpp/yaml.h>

namespace moddep {

	namespace {

		constexpr const char* kDefaultHelper = "mod-deployer-elevate";

		static fs::path underRoot(const fs::path& root, const fs::path& p)
		{
			return p.is_absolute() ? p : (root / p).lexically_normal();
		}

		template <typename T>
		static T valueOr(const YAML::Node& node, const char* key, T fallback)
		{
			const YAML::Node v = node[key];
			return v ? v.as<T>() : fallback;
		}

	} // namespace

	fs::path defaultConfigPath()
	{
		return xdgDir("XDG_CONFIG_HOME", ".config") / "mod_deployer" / "config.yaml";
	}

	fs::path defaultDataRoot()
	{
		return xdgDir("XDG_DATA_HOME", ".local/share") / "mod_deployer";
	}

	std::string generateInstanceId()
	{
		std::random_device rd;
		std::mt19937_64 gen(((std::uint64_t)rd() << 32) ^ rd());
		std::ostringstream os;
		os << std::hex << gen();
		return os.str();
	}
	//------------------------------------------------------------
	//	Разбор YAML-конфигурации
	//------------------------------------------------------------
	bool parseConfig(const std::string& text, AppConfig& out, std::string* error)
	{
		try
		{
			const YAML::Node root = YAML::Load(text);
			if (!root.IsNull() && !root.IsMap())
			{
				if (error) *error = "configuration is not a mapping";
				return false;
			}

			AppConfig cfg;
			cfg.instanceId = valueOr<std::string>(root, "instance_id", "");
			cfg.dataRoot = valueOr<std::string>(root, "data_root", defaultDataRoot().string());
			cfg.stateFile = underRoot(cfg.dataRoot, valueOr<std::string>(root, "state_file", "state.yaml"));
			cfg.logDir = underRoot(cfg.dataRoot, valueOr<std::string>(root, "log_dir", "log"));

			//---Повторы
			if (const YAML::Node retry = root["retry"])
			{
				cfg.retry.count = valueOr<int>(retry, "count", cfg.retry.count);
				cfg.retry.delay = std::chrono::milliseconds(valueOr<long long>(retry, "delay_ms", cfg.retry.delay.count()));
				if (cfg.retry.count < 0 || cfg.retry.delay.count() < 0)
				{
					if (error) *error = "retry.count and retry.delay_ms must not be negative";
					return false;
				}
			}

			//---Помощник с повышенными правами
			std::string helper = kDefaultHelper;
			if (const YAML::Node elevation = root["elevation"])
			{
				helper = valueOr<std::string>(elevation, "helper", helper);
				cfg.elevation.launcher = valueOr<std::string>(elevation, "launcher", cfg.elevation.launcher.string());
			}
			cfg.elevation.helperExe = resolveHelperExePath(helper);

			//---Копирование
			if (const YAML::Node copy = root["copy"])
			{
				cfg.copy.selfCopyCheck = valueOr<bool>(copy, "self_copy_check", cfg.copy.selfCopyCheck);
			}

			//---Игры
			std::set<std::string> ids;
			if (const YAML::Node games = root["games"])
			{
				for (const auto& node : games)
				{
					GameConfig game;
					game.descriptor.id = valueOr<std::string>(node, "id", "");
					if (game.descriptor.id.empty())
					{
						if (error) *error = "game without id";
						return false;
					}
					if (!ids.insert(game.descriptor.id).second)
					{
						if (error) *error = "duplicate game id '" + game.descriptor.id + "'";
						return false;
					}

					const std::string install = valueOr<std::string>(node, "install_path", "");
					if (install.empty())
					{
						if (error) *error = "game '" + game.descriptor.id + "' has no install_path";
						return false;
					}
					game.descriptor.installPath = install;
					game.descriptor.stagingPath = underRoot(cfg.dataRoot,
						valueOr<std::string>(node, "staging_path", (fs::path(game.descriptor.id) / "mods").string()));
					game.activator = valueOr<std::string>(node, "activator", "");

					if (const YAML::Node modPaths = node["mod_paths"])
					{
						for (const auto& kv : modPaths)
						{
							game.descriptor.modPaths[kv.first.as<std::string>()] = kv.second.as<std::string>();
						}
					}
					if (game.descriptor.modPaths.empty()) game.descriptor.modPaths[""] = ".";

					cfg.games.push_back(std::move(game));
				}
			}

			out = std::move(cfg);
			return true;
		}
		catch (const YAML::Exception& e)
		{
			if (error) *error = e.what();
			return false;
		}
	}

	bool loadConfig(const fs::path& path, AppConfig& out, std::string* error)
	{
		std::ifstream f(path, std::ios::binary);
		if (!f)
		{
			if (error) *error = "can't open configuration " + path.string();
			return false;
		}
		std::ostringstream text;
		text << f.rdbuf();

		std::string err;
		if (!parseConfig(text.str(), out, &err))
		{
			if (error) *error = path.string() + ": " + err;
			return false;
		}
		return true;
	}

};//---namespace moddep
