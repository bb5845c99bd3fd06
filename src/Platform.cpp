#include "mod_deployer/Platform.hpp"
#include "platform/PlatformImpl.hpp"

namespace moddep {
	//------------------------------------------------------------
	//	Проверка прав администратора
	//------------------------------------------------------------
	bool isElevated() {
		return platform::isElevated();
	}

	UserIdentity currentUser() {
		return platform::currentUser();
	}

	std::vector<LockingProcess> findLockingProcesses(const fs::path& path) {
		return platform::findLockingProcesses(path);
	}

	bool fileId(const fs::path& path, FileId& out, std::error_code& ec) {
		return platform::fileId(path, out, ec);
	}
	//------------------------------------------------------------
	//	Устройство пути; для несуществующего пути - ближайший
	//	существующий предок (цель развёртывания может ещё не существовать)
	//------------------------------------------------------------
	bool deviceOf(const fs::path& path, std::uint64_t& device, std::error_code& ec) {
		fs::path probe = path;
		for (;;)
		{
			FileId id;
			if (platform::fileId(probe, id, ec))
			{
				device = id.device;
				return true;
			}
			if (!probe.has_relative_path() || probe.parent_path() == probe) return false;
			probe = probe.parent_path();
		}
	}
}; //---namespace moddep
