#include "mod_deployer/Refresh.hpp"
#include "mod_deployer/FileOps.hpp"

#include <set>

#include <glog/logging.h>

namespace moddep {

	namespace {

		//---Служебные записи staging: скрытые и с префиксом "__"
		static bool isServiceEntry(const std::string& name)
		{
			return name.empty() || name[0] == '.' || name.compare(0, 2, "__") == 0;
		}

	} // namespace

	bool refreshMods(const FileOps& files, const fs::path& stagingDir, const std::map<std::string, Mod>& known,
		RefreshResult& out, Error* error)
	{
		out = RefreshResult{};

		std::vector<fs::path> entries;
		if (!files.readDir(stagingDir, entries, error)) return false;

		std::set<std::string> onDisk;
		for (const fs::path& p : entries)
		{
			const std::string name = p.filename().string();
			if (isServiceEntry(name) || !files.isDirectory(p)) continue;
			onDisk.insert(name);
		}

		std::set<std::string> knownPaths;
		for (const auto& kv : known)
		{
			const Mod& mod = kv.second;
			const std::string path = mod.installationPath.generic_string();
			knownPaths.insert(path);

			if (onDisk.count(path) == 0 && isMaterialized(mod.state))
			{
				out.removed.push_back(mod.id);
			}
		}
		for (const std::string& name : onDisk)
		{
			if (knownPaths.count(name) == 0) out.added.push_back(name);
		}

		LOG(INFO) << "refresh " << stagingDir << ": " << onDisk.size() << " on disk, "
			<< out.added.size() << " added, " << out.removed.size() << " removed";
		return true;
	}

};//---namespace moddep
