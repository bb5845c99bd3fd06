#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "mod_deployer/FileOps.hpp"
#include "mod_deployer/IDeploymentMethod.hpp"

namespace moddep {

	namespace methods {
		namespace fs = std::filesystem;

		//---Общая часть способов, разворачивающих каждый файл мода отдельным артефактом.
		//   Наследники задают только технику (ссылка / копия) и идентичность содержимого
		class LinkingMethod : public IDeploymentMethod {
		public:
			LinkingMethod(const FileOps& files, std::string id, std::string name);

			const std::string& id() const override { return id_; }
			std::string name() const override { return name_; }

			std::string unsupportedReason(const GameDeploymentContext& game, const std::string& modType) const override;

			bool prepare(const fs::path& targetDir, bool undeployOnly, const ActivationManifest& prior,
				const NormalizeFn& normalize, DeploymentHandle& out, Error* error) const override;
			bool activate(DeploymentHandle& handle, const fs::path& installDir, const Mod& mod, Error* error) const override;
			bool deactivate(DeploymentHandle& handle, const fs::path& installDir, const Mod& mod, Error* error) const override;
			bool finalize(DeploymentHandle& handle, const std::string& gameId, const fs::path& installDir,
				ActivationManifest& out, Error* error) const override;

		protected:
			//---Ограничения техники для пары staging / целевая директория ("" - поддерживается)
			virtual std::string techniqueUnsupported(const fs::path& stagingDir, const fs::path& targetDir) const = 0;
			//---Создать артефакт dest для файла source
			virtual bool deployFile(const fs::path& source, const fs::path& dest, Error* error) const = 0;
			//---Идентичность артефакта, лежащего по пути dest ("" - не артефакт этой техники)
			virtual std::string observedId(const fs::path& dest) const = 0;
			//---Идентичность, которую имел бы артефакт для source ("" - заранее неизвестна)
			virtual std::string expectedId(const fs::path& source) const = 0;

			const FileOps& files_;

		private:
			bool owns(const DeployedEntry& entry, const fs::path& dest) const;
			bool managedFiles(const fs::path& installDir, const Mod& mod, std::vector<ManagedFile>& out, Error* error) const;
			void pruneEmptyParents(const fs::path& dir, const fs::path& stop) const;

			std::string id_;
			std::string name_;
		};

	};//---namespace methods

};//---namespace moddep
