#include "mod_deployer/Model.hpp"

#include <algorithm>
#include <cctype>

#include <glog/logging.h>

namespace moddep {

	const char* toString(ModState state)
	{
		switch (state)
		{
		case ModState::Downloading: return "downloading";
		case ModState::Downloaded:  return "downloaded";
		case ModState::Installed:   return "installed";
		}
		return "installed";
	}

	bool parseModState(const std::string& s, ModState& out)
	{
		if (s == "downloading") { out = ModState::Downloading; return true; }
		if (s == "downloaded") { out = ModState::Downloaded; return true; }
		if (s == "installed") { out = ModState::Installed; return true; }
		return false;
	}

	GameDeploymentContext GameDeploymentContext::withActivator(const std::string& id) const
	{
		GameDeploymentContext copy = *this;
		copy.activatorId = id;
		return copy;
	}

	std::vector<std::string> GameDeploymentContext::modTypes() const
	{
		std::vector<std::string> types;
		types.reserve(modPaths.size());
		for (const auto& kv : modPaths) types.push_back(kv.first);
		return types;
	}

	fs::path GameDeploymentContext::targetFor(const std::string& modType) const
	{
		const auto it = modPaths.find(modType);
		return it == modPaths.end() ? fs::path() : it->second;
	}

	GameDeploymentContext makeContext(const GameDescriptor& game, const std::string& activatorId)
	{
		GameDeploymentContext ctx;
		ctx.gameId = game.id;
		ctx.installPath = game.installPath;
		ctx.stagingPath = game.stagingPath;
		ctx.activatorId = activatorId;
		for (const auto& kv : game.modPaths)
		{
			//---Относительные пути отсчитываются от директории игры
			ctx.modPaths[kv.first] = kv.second.is_absolute()
				? kv.second.lexically_normal()
				: (game.installPath / kv.second).lexically_normal();
		}
		return ctx;
	}
	//------------------------------------------------------------
	//	Регистронезависимость ФС: существует ли тот же путь
	//	с изменённым регистром последнего компонента
	//------------------------------------------------------------
	static bool isCaseInsensitive(const fs::path& dir)
	{
		std::error_code ec;
		fs::path probe = dir;
		while (!probe.empty() && !fs::exists(probe, ec))
		{
			if (probe.parent_path() == probe) return false;
			probe = probe.parent_path();
		}

		std::string name = probe.filename().string();
		const auto letter = std::find_if(name.begin(), name.end(), [](unsigned char c) { return std::isalpha(c) != 0; });
		if (letter == name.end()) return false;

		const unsigned char c = (unsigned char)*letter;
		*letter = std::islower(c) ? (char)std::toupper(c) : (char)std::tolower(c);

		const fs::path toggled = probe.parent_path() / name;
		return fs::exists(toggled, ec) && fs::equivalent(probe, toggled, ec);
	}

	NormalizeFn makeNormalizeFunc(const fs::path& dir)
	{
		const bool caseInsensitive = isCaseInsensitive(dir);
		VLOG(1) << "path normalization for " << dir << ": case "
			<< (caseInsensitive ? "insensitive" : "sensitive");

		return [caseInsensitive](const std::string& input) {
			std::string out = input;
			std::replace(out.begin(), out.end(), '\\', '/');
			while (out.size() > 1 && out.back() == '/') out.pop_back();
			if (caseInsensitive)
			{
				std::transform(out.begin(), out.end(), out.begin(),
					[](unsigned char c) { return (char)std::tolower(c); });
			}
			return out;
		};
	}

};//---namespace moddep
