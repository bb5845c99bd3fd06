#include "methods/LinkingMethod.hpp"

#include <glog/logging.h>

namespace moddep {

	std::string unsupportedReasonForGame(const IDeploymentMethod& method, const GameDeploymentContext& game)
	{
		for (const std::string& type : game.modTypes())
		{
			std::string reason = method.unsupportedReason(game, type);
			if (!reason.empty()) return reason;
		}
		return {};
	}

	namespace methods {

		LinkingMethod::LinkingMethod(const FileOps& files, std::string id, std::string name)
			: files_(files), id_(std::move(id)), name_(std::move(name))
		{
		}

		std::string LinkingMethod::unsupportedReason(const GameDeploymentContext& game, const std::string& modType) const
		{
			const fs::path target = game.targetFor(modType);
			if (target.empty())
			{
				return "Game \"" + game.gameId + "\" has no target directory for mod type \""
					+ (modType.empty() ? std::string("default") : modType) + "\".";
			}
			return techniqueUnsupported(game.stagingPath, target);
		}

		bool LinkingMethod::owns(const DeployedEntry& entry, const fs::path& dest) const
		{
			const std::string observed = observedId(dest);
			return !observed.empty() && observed == entry.contentId;
		}
		//------------------------------------------------------------
		//	Список файлов мода в staging
		//------------------------------------------------------------
		bool LinkingMethod::managedFiles(const fs::path& installDir, const Mod& mod,
			std::vector<ManagedFile>& out, Error* error) const
		{
			const fs::path modDir = installDir / mod.installationPath;
			std::vector<fs::path> rels;
			if (!files_.walkFiles(modDir, rels, error)) return false;

			out.clear();
			out.reserve(rels.size());
			for (const fs::path& rel : rels)
			{
				ManagedFile f;
				f.source = modDir / rel;
				f.modId = mod.id;
				f.modType = mod.type;
				f.relPath = rel;
				out.push_back(std::move(f));
			}
			return true;
		}
		//------------------------------------------------------------
		//	Удаление опустевших директорий вверх до целевой (не включая её)
		//------------------------------------------------------------
		void LinkingMethod::pruneEmptyParents(const fs::path& dir, const fs::path& stop) const
		{
			fs::path cur = dir;
			for (;;)
			{
				const fs::path rel = cur.lexically_relative(stop);
				if (rel.empty() || rel == "." || *rel.begin() == "..") return;

				std::error_code ec;
				if (!fs::is_empty(cur, ec) || ec) return;

				Error e;
				if (!files_.rmdir(cur, &e))
				{
					LOG(WARNING) << "failed to remove empty directory " << cur << ": " << e.message;
					return;
				}
				cur = cur.parent_path();
			}
		}
		//------------------------------------------------------------
		//	prepare: записи этого способа сверяются с диском,
		//	записи других способов переносятся без изменений
		//------------------------------------------------------------
		bool LinkingMethod::prepare(const fs::path& targetDir, bool undeployOnly, const ActivationManifest& prior,
			const NormalizeFn& normalize, DeploymentHandle& out, Error* /*error*/) const
		{
			out = DeploymentHandle{};
			out.targetDir = targetDir;
			out.undeployOnly = undeployOnly;
			out.normalize = normalize;
			out.working.instanceId = prior.instanceId;
			out.working.methodId = id_;

			for (const auto& kv : prior.files)
			{
				const DeployedEntry& entry = kv.second;
				const std::string key = normalize(entry.relPath.generic_string());

				if (entry.methodId != id_)
				{
					out.working.files[key] = entry;
					continue;
				}

				const fs::path dest = targetDir / entry.relPath;
				if (!files_.exists(dest))
				{
					VLOG(1) << "deployed file vanished: " << dest;
					continue;
				}
				if (!owns(entry, dest))
				{
					LOG(WARNING) << "file " << dest << " was changed outside of " << name_ << ", no longer managed";
					continue;
				}
				out.working.files[key] = entry;
			}

			VLOG(1) << name_ << " prepared " << targetDir << " (" << out.working.files.size() << " entries"
				<< (undeployOnly ? ", undeploy only)" : ")");
			return true;
		}
		//------------------------------------------------------------
		//	activate
		//------------------------------------------------------------
		bool LinkingMethod::activate(DeploymentHandle& handle, const fs::path& installDir, const Mod& mod, Error* error) const
		{
			if (handle.undeployOnly)
			{
				return fail(error, makeError(ErrorKind::ProcessCanceled,
					"can't activate mod \"" + mod.id + "\" during undeployment", handle.targetDir));
			}

			std::vector<ManagedFile> managed;
			if (!managedFiles(installDir, mod, managed, error)) return false;

			for (const ManagedFile& f : managed)
			{
				const fs::path dest = handle.targetDir / f.relPath;
				const std::string key = handle.normalize(f.relPath.generic_string());

				auto it = handle.working.files.find(key);
				if (it != handle.working.files.end())
				{
					DeployedEntry& entry = it->second;
					if (entry.methodId != id_)
					{
						LOG(WARNING) << "skipping " << dest << ": deployed by \"" << entry.methodId << "\"";
						continue;
					}
					if (entry.modId != mod.id)
					{
						VLOG(1) << dest << " provided by \"" << entry.modId << "\" is overridden by \"" << mod.id << "\"";
					}
					if (owns(entry, dest))
					{
						if (!files_.unlink(dest, error))
						{
							entry.stale = true;
							return false;
						}
					}
					else if (files_.exists(dest))
					{
						LOG(WARNING) << "skipping " << dest << ": replaced outside of " << name_;
						handle.working.files.erase(it);
						continue;
					}
					handle.working.files.erase(it);
				}
				else if (files_.exists(dest))
				{
					const std::string expected = expectedId(f.source);
					if (expected.empty() || observedId(dest) != expected)
					{
						LOG(WARNING) << "skipping " << dest << ": file not managed by " << name_;
						continue;
					}
					//---Артефакт уже на месте (манифест был потерян)
					DeployedEntry adopted;
					adopted.relPath = f.relPath;
					adopted.modId = mod.id;
					adopted.source = mod.installationPath;
					adopted.methodId = id_;
					adopted.contentId = expected;
					handle.working.files[key] = std::move(adopted);
					continue;
				}

				if (!files_.ensureDir(dest.parent_path(), error)) return false;
				if (!deployFile(f.source, dest, error)) return false;

				DeployedEntry entry;
				entry.relPath = f.relPath;
				entry.modId = mod.id;
				entry.source = mod.installationPath;
				entry.methodId = id_;
				entry.contentId = observedId(dest);
				handle.working.files[key] = std::move(entry);
			}

			VLOG(1) << name_ << " activated \"" << mod.id << "\" (" << managed.size() << " files) in " << handle.targetDir;
			return true;
		}
		//------------------------------------------------------------
		//	deactivate: владение определяется записью манифеста, не именем
		//------------------------------------------------------------
		bool LinkingMethod::deactivate(DeploymentHandle& handle, const fs::path& /*installDir*/, const Mod& mod, Error* error) const
		{
			std::size_t removed = 0;
			for (auto it = handle.working.files.begin(); it != handle.working.files.end();)
			{
				DeployedEntry& entry = it->second;
				if (entry.modId != mod.id || entry.methodId != id_)
				{
					++it;
					continue;
				}

				const fs::path dest = handle.targetDir / entry.relPath;
				if (!files_.exists(dest))
				{
					it = handle.working.files.erase(it);
					continue;
				}
				if (!owns(entry, dest))
				{
					LOG(WARNING) << "leaving " << dest << ": replaced outside of " << name_;
					it = handle.working.files.erase(it);
					continue;
				}
				if (!files_.unlink(dest, error))
				{
					entry.stale = true;
					return false;
				}
				pruneEmptyParents(dest.parent_path(), handle.targetDir);
				it = handle.working.files.erase(it);
				++removed;
			}

			VLOG(1) << name_ << " deactivated \"" << mod.id << "\" (" << removed << " files) in " << handle.targetDir;
			return true;
		}
		//------------------------------------------------------------
		//	finalize: повторная очистка stale-записей и поиск сирот
		//	(исходный файл в staging исчез вместе с модом)
		//------------------------------------------------------------
		bool LinkingMethod::finalize(DeploymentHandle& handle, const std::string& gameId, const fs::path& installDir,
			ActivationManifest& out, Error* error) const
		{
			for (auto it = handle.working.files.begin(); it != handle.working.files.end();)
			{
				DeployedEntry& entry = it->second;
				if (entry.methodId != id_)
				{
					++it;
					continue;
				}

				const bool orphan = !files_.exists(installDir / entry.source / entry.relPath);
				if (!orphan && !entry.stale)
				{
					++it;
					continue;
				}

				const fs::path dest = handle.targetDir / entry.relPath;
				if (orphan)
				{
					LOG(WARNING) << "orphaned file " << dest << " (mod \"" << entry.modId << "\" no longer provides it)";
					handle.orphans.push_back(entry.relPath);
				}

				if (!files_.exists(dest))
				{
					it = handle.working.files.erase(it);
					continue;
				}
				if (!owns(entry, dest))
				{
					LOG(WARNING) << "leaving " << dest << ": replaced outside of " << name_;
					it = handle.working.files.erase(it);
					continue;
				}

				Error cleanup;
				if (!files_.unlink(dest, &cleanup))
				{
					if (cleanup.kind == ErrorKind::UserCanceled) return fail(error, std::move(cleanup));
					LOG(WARNING) << "cleanup of " << dest << " failed, kept as stale: " << describe(cleanup, false);
					entry.stale = true;
					++it;
					continue;
				}
				pruneEmptyParents(dest.parent_path(), handle.targetDir);
				it = handle.working.files.erase(it);
			}

			out = handle.working;
			out.methodId = id_;
			LOG(INFO) << name_ << " finalized " << gameId << " " << handle.targetDir << ": "
				<< out.files.size() << " files deployed, " << handle.orphans.size() << " orphans";
			return true;
		}

	};//---namespace methods

};//---namespace moddep
