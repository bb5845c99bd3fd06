#include "mod_deployer/ActivationStore.hpp"
#include "mod_deployer/FileOps.hpp"

#include <algorithm>
#include <set>

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace moddep {

	namespace {

		constexpr int kManifestVersion = 1;
		constexpr const char* kManifestPrefix = ".mod_deployer.";
		constexpr const char* kManifestSuffix = ".yaml";

		static bool isManifestName(const std::string& name)
		{
			const std::string prefix = kManifestPrefix;
			const std::string suffix = kManifestSuffix;
			return name.size() > prefix.size() + suffix.size()
				&& name.compare(0, prefix.size(), prefix) == 0
				&& name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
		}

		//---Путь лежит внутри base (лексически)
		static bool isInside(const fs::path& path, const fs::path& base)
		{
			const fs::path rel = path.lexically_relative(base);
			return !rel.empty() && *rel.begin() != "..";
		}

		static fs::path absoluteNormal(const fs::path& p)
		{
			std::error_code ec;
			const fs::path abs = fs::absolute(p, ec);
			return (ec ? p : abs).lexically_normal();
		}

	} // namespace

	ActivationStore::ActivationStore(const FileOps& files, std::string instanceId)
		: files_(files), instanceId_(std::move(instanceId))
	{
	}

	fs::path ActivationStore::manifestPath(const fs::path& targetDir, const std::string& modType)
	{
		return targetDir / (std::string(kManifestPrefix) + (modType.empty() ? "default" : modType) + kManifestSuffix);
	}
	//------------------------------------------------------------
	//	Формат: {version, instance, method, files: [...]}
	//------------------------------------------------------------
	std::string ActivationStore::encode(const ActivationManifest& manifest)
	{
		YAML::Emitter out;
		out << YAML::BeginMap;
		out << YAML::Key << "version" << YAML::Value << kManifestVersion;
		out << YAML::Key << "instance" << YAML::Value << manifest.instanceId;
		out << YAML::Key << "method" << YAML::Value << manifest.methodId;
		out << YAML::Key << "files" << YAML::Value << YAML::BeginSeq;
		for (const auto& kv : manifest.files)
		{
			const DeployedEntry& e = kv.second;
			out << YAML::BeginMap;
			out << YAML::Key << "path" << YAML::Value << e.relPath.generic_string();
			out << YAML::Key << "mod" << YAML::Value << e.modId;
			out << YAML::Key << "source" << YAML::Value << e.source.generic_string();
			out << YAML::Key << "method" << YAML::Value << e.methodId;
			out << YAML::Key << "content" << YAML::Value << e.contentId;
			out << YAML::Key << "stale" << YAML::Value << e.stale;
			out << YAML::EndMap;
		}
		out << YAML::EndSeq;
		out << YAML::EndMap;
		return out.c_str();
	}

	bool ActivationStore::decode(const std::string& text, ActivationManifest& out, std::string* error)
	{
		try
		{
			const YAML::Node root = YAML::Load(text);
			if (!root.IsMap())
			{
				if (error) *error = "manifest is not a mapping";
				return false;
			}
			const int version = root["version"] ? root["version"].as<int>() : 0;
			if (version != kManifestVersion)
			{
				if (error) *error = "unsupported manifest version " + std::to_string(version);
				return false;
			}

			out = ActivationManifest{};
			out.instanceId = root["instance"] ? root["instance"].as<std::string>() : std::string();
			out.methodId = root["method"] ? root["method"].as<std::string>() : std::string();

			if (const YAML::Node files = root["files"])
			{
				for (const auto& node : files)
				{
					DeployedEntry e;
					e.relPath = node["path"].as<std::string>();
					e.modId = node["mod"].as<std::string>();
					e.source = node["source"] ? node["source"].as<std::string>() : std::string();
					e.methodId = node["method"] ? node["method"].as<std::string>() : out.methodId;
					e.contentId = node["content"] ? node["content"].as<std::string>() : std::string();
					e.stale = node["stale"] ? node["stale"].as<bool>() : false;
					out.files[e.relPath.generic_string()] = std::move(e);
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
	//------------------------------------------------------------
	//	Загрузка манифеста. Ошибки чтения и разбора не фатальны:
	//	развёртывание продолжается как первое
	//------------------------------------------------------------
	bool ActivationStore::load(const std::string& modType, const fs::path& targetDir, const std::string& methodId,
		ActivationManifest& out, Error* error) const
	{
		const fs::path path = manifestPath(targetDir, modType);

		out = ActivationManifest{};
		out.instanceId = instanceId_;
		out.methodId = methodId;

		if (!files_.exists(path))
		{
			VLOG(1) << "no manifest at " << path << ", nothing deployed";
			return true;
		}

		std::string text;
		Error readErr;
		if (!files_.readFile(path, text, &readErr))
		{
			if (readErr.kind == ErrorKind::UserCanceled) return fail(error, std::move(readErr));
			LOG(WARNING) << "failed to read manifest " << path << ": " << readErr.message << ", assuming nothing deployed";
			return true;
		}

		ActivationManifest parsed;
		std::string parseErr;
		if (!decode(text, parsed, &parseErr))
		{
			LOG(WARNING) << "manifest " << path << " is corrupt (" << parseErr << "), assuming nothing deployed";
			return true;
		}

		if (!parsed.instanceId.empty() && parsed.instanceId != instanceId_)
		{
			LOG(WARNING) << "manifest " << path << " was written by instance \"" << parsed.instanceId
				<< "\", current instance is \"" << instanceId_ << "\"";
		}
		if (!methodId.empty() && parsed.methodId != methodId)
		{
			LOG(INFO) << "manifest " << path << " was written by \"" << parsed.methodId
				<< "\", loading for \"" << methodId << "\"";
		}

		out = std::move(parsed);
		VLOG(1) << "loaded manifest " << path << ": " << out.files.size() << " entries";
		return true;
	}
	//------------------------------------------------------------
	//	Сохранение: запись во временный файл и замена
	//------------------------------------------------------------
	bool ActivationStore::save(const std::string& modType, const std::string& instanceId, const fs::path& targetDir,
		const ActivationManifest& manifest, const std::string& methodId, Error* error) const
	{
		const fs::path path = manifestPath(targetDir, modType);
		if (manifest.empty())
		{
			VLOG(1) << "manifest " << path << " is empty, removing";
			return files_.unlink(path, error);
		}

		ActivationManifest stamped = manifest;
		stamped.instanceId = instanceId;
		stamped.methodId = methodId;

		fs::path tmp = path;
		tmp += ".tmp";
		if (!files_.writeFile(tmp, encode(stamped), error)) return false;
		if (!files_.rename(tmp, path, error))
		{
			Error cleanup;
			if (!files_.unlink(tmp, &cleanup))
			{
				LOG(WARNING) << "failed to remove " << tmp << ": " << cleanup.message;
			}
			return false;
		}
		VLOG(1) << "saved manifest " << path << ": " << stamped.files.size() << " entries";
		return true;
	}
	//------------------------------------------------------------
	//	Грубая очистка
	//------------------------------------------------------------
	bool ActivationStore::fallbackPurge(const GameDeploymentContext& context, Error* error) const
	{
		LOG(WARNING) << "fallback purge for " << context.gameId << ": manifests are not trusted";
		for (const auto& kv : context.modPaths)
		{
			if (!purgeDirectory(kv.second, context.stagingPath, error)) return false;
		}
		LOG(INFO) << "fallback purge for " << context.gameId << " finished";
		return true;
	}

	bool ActivationStore::purgeDirectory(const fs::path& targetDir, const fs::path& stagingDir, Error* error) const
	{
		if (!files_.isDirectory(targetDir)) return true;

		std::vector<fs::path> rels;
		Error walkErr;
		if (!files_.walkFiles(targetDir, rels, &walkErr))
		{
			if (walkErr.kind == ErrorKind::UserCanceled) return fail(error, std::move(walkErr));
			LOG(WARNING) << "fallback purge: can't list " << targetDir << ": " << walkErr.message;
			return true;
		}

		std::set<fs::path> touched;
		bool canceled = false;
		auto removeOne = [&](const fs::path& p) {
			Error e;
			if (files_.unlink(p, &e))
			{
				touched.insert(p.parent_path());
				return;
			}
			if (e.kind == ErrorKind::UserCanceled)
			{
				canceled = true;
				fail(error, std::move(e));
				return;
			}
			LOG(WARNING) << "fallback purge: failed to remove " << p << ": " << e.message;
		};

		//--- 1) Файлы из манифестов, найденных на диске, и сами манифесты
		for (const fs::path& rel : rels)
		{
			if (!isManifestName(rel.filename().string())) continue;
			const fs::path manifestFile = targetDir / rel;

			std::string text;
			ActivationManifest m;
			std::string parseErr;
			Error readErr;
			if (files_.readFile(manifestFile, text, &readErr) && decode(text, m, &parseErr))
			{
				for (const auto& kv : m.files)
				{
					const fs::path p = manifestFile.parent_path() / kv.second.relPath;
					if (!files_.exists(p) || files_.isDirectory(p)) continue;
					removeOne(p);
					if (canceled) return false;
				}
			}
			else if (readErr.kind == ErrorKind::UserCanceled)
			{
				return fail(error, std::move(readErr));
			}
			removeOne(manifestFile);
			if (canceled) return false;
		}

		//--- 2) Символические ссылки в staging
		const fs::path staging = absoluteNormal(stagingDir);
		for (const fs::path& rel : rels)
		{
			const fs::path p = targetDir / rel;
			std::error_code ec;
			if (!fs::is_symlink(fs::symlink_status(p, ec))) continue;
			const fs::path target = fs::read_symlink(p, ec);
			if (ec || !isInside(absoluteNormal(p.parent_path() / target), staging)) continue;
			removeOne(p);
			if (canceled) return false;
		}

		//--- 3) Опустевшие директории, начиная с самых глубоких
		std::vector<fs::path> dirs(touched.begin(), touched.end());
		std::sort(dirs.begin(), dirs.end(), [](const fs::path& a, const fs::path& b) {
			return a.native().size() > b.native().size();
		});
		for (fs::path dir : dirs)
		{
			while (isInside(dir, targetDir) && dir != targetDir)
			{
				std::error_code ec;
				if (!fs::is_empty(dir, ec) || ec) break;
				Error e;
				if (!files_.rmdir(dir, &e))
				{
					LOG(WARNING) << "fallback purge: failed to remove " << dir << ": " << e.message;
					break;
				}
				dir = dir.parent_path();
			}
		}
		return true;
	}

};//---namespace moddep
