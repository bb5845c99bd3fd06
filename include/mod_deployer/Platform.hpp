#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace moddep {

	namespace fs = std::filesystem;

	//---Процесс, удерживающий файл
	struct LockingProcess final {
		int pid = 0;
		std::string appName;
	};

	//---Учётная запись, от имени которой работает процесс
	struct UserIdentity final {
		std::uint32_t uid = 0;
		std::uint32_t gid = 0;
	};

	//---Идентичность файла на уровне ФС (устройство + inode)
	struct FileId final {
		std::uint64_t device = 0;
		std::uint64_t inode = 0;

		bool operator==(const FileId& o) const { return device == o.device && inode == o.inode; }
		bool operator!=(const FileId& o) const { return !(*this == o); }
	};

	//---Запуск с правами администратора / root
	bool isElevated();

	UserIdentity currentUser();

	//---Поиск процессов, открывших файл (best-effort, никогда не завершается ошибкой)
	std::vector<LockingProcess> findLockingProcesses(const fs::path& path);

	//---Идентичность файла без разыменования символических ссылок
	bool fileId(const fs::path& path, FileId& out, std::error_code& ec);

	//---Устройство, на котором находится путь (или ближайший существующий предок)
	bool deviceOf(const fs::path& path, std::uint64_t& device, std::error_code& ec);

};//---namespace moddep
