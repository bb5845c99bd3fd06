#include "methods/LinkingMethod.hpp"
#include "mod_deployer/DeploymentMethods.hpp"

namespace moddep {

	namespace {

		//---Копирование: работает везде, идентичность - размер + время изменения копии
		class CopyMethod final : public methods::LinkingMethod {
		public:
			explicit CopyMethod(const FileOps& files)
				: LinkingMethod(files, "copy", "Copy Deployment")
			{
			}

		protected:
			std::string techniqueUnsupported(const fs::path& /*stagingDir*/, const fs::path& /*targetDir*/) const override
			{
				return {};
			}

			bool deployFile(const fs::path& source, const fs::path& dest, Error* error) const override
			{
				return files_.copy(source, dest, error);
			}

			std::string observedId(const fs::path& dest) const override
			{
				std::error_code ec;
				if (!fs::is_regular_file(fs::symlink_status(dest, ec))) return {};
				const auto size = fs::file_size(dest, ec);
				if (ec) return {};
				const auto mtime = fs::last_write_time(dest, ec);
				if (ec) return {};
				return std::to_string(size) + ":" + std::to_string(mtime.time_since_epoch().count());
			}

			//---Копия получает собственное время изменения: заранее не известно
			std::string expectedId(const fs::path& /*source*/) const override
			{
				return {};
			}
		};

	} // namespace

	std::unique_ptr<IDeploymentMethod> makeCopyMethod(const FileOps& files)
	{
		return std::make_unique<CopyMethod>(files);
	}

};//---namespace moddep
