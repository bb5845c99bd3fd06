#include "methods/LinkingMethod.hpp"
#include "mod_deployer/DeploymentMethods.hpp"
#include "mod_deployer/Platform.hpp"

#include <cstdint>

namespace moddep {

	namespace {

		static std::string idOf(const fs::path& path)
		{
			FileId id;
			std::error_code ec;
			if (!fileId(path, id, ec)) return {};
			return std::to_string(id.device) + ":" + std::to_string(id.inode);
		}

		//---Жёсткие ссылки: артефакт - тот же inode, что и файл в staging
		class HardlinkMethod final : public methods::LinkingMethod {
		public:
			explicit HardlinkMethod(const FileOps& files)
				: LinkingMethod(files, "hardlink", "Hardlink Deployment")
			{
			}

		protected:
			std::string techniqueUnsupported(const fs::path& stagingDir, const fs::path& targetDir) const override
			{
				std::uint64_t stagingDev = 0, targetDev = 0;
				std::error_code ec;
				if (!deviceOf(stagingDir, stagingDev, ec))
				{
					return "Staging folder " + stagingDir.string() + " is not accessible: " + ec.message();
				}
				if (!deviceOf(targetDir, targetDev, ec))
				{
					return "Target folder " + targetDir.string() + " is not accessible: " + ec.message();
				}
				if (stagingDev != targetDev)
				{
					return "Hardlinks only work if mods are stored on the same partition as the game ("
						+ stagingDir.string() + " vs " + targetDir.string() + ").";
				}
				return {};
			}

			bool deployFile(const fs::path& source, const fs::path& dest, Error* error) const override
			{
				return files_.link(source, dest, error);
			}

			std::string observedId(const fs::path& dest) const override
			{
				std::error_code ec;
				if (!fs::is_regular_file(fs::symlink_status(dest, ec))) return {};
				return idOf(dest);
			}

			std::string expectedId(const fs::path& source) const override
			{
				return idOf(source);
			}
		};

	} // namespace

	std::unique_ptr<IDeploymentMethod> makeHardlinkMethod(const FileOps& files)
	{
		return std::make_unique<HardlinkMethod>(files);
	}

};//---namespace moddep
