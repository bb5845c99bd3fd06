#include "methods/LinkingMethod.hpp"
#include "mod_deployer/DeploymentMethods.hpp"

namespace moddep {

	namespace {

		//---Символические ссылки на абсолютный путь в staging
		class SymlinkMethod final : public methods::LinkingMethod {
		public:
			explicit SymlinkMethod(const FileOps& files)
				: LinkingMethod(files, "symlink", "Symlink Deployment")
			{
			}

		protected:
			std::string techniqueUnsupported(const fs::path& /*stagingDir*/, const fs::path& /*targetDir*/) const override
			{
				return {};
			}

			bool deployFile(const fs::path& source, const fs::path& dest, Error* error) const override
			{
				return files_.symlink(expectedId(source), dest, error);
			}

			std::string observedId(const fs::path& dest) const override
			{
				std::error_code ec;
				if (!fs::is_symlink(fs::symlink_status(dest, ec))) return {};
				const fs::path target = fs::read_symlink(dest, ec);
				if (ec) return {};
				return target.string();
			}

			std::string expectedId(const fs::path& source) const override
			{
				std::error_code ec;
				const fs::path abs = fs::absolute(source, ec);
				return (ec ? source : abs).lexically_normal().string();
			}
		};

	} // namespace

	std::unique_ptr<IDeploymentMethod> makeSymlinkMethod(const FileOps& files)
	{
		return std::make_unique<SymlinkMethod>(files);
	}

};//---namespace moddep
