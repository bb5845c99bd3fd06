#pragma once
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include "mod_deployer/Platform.hpp"

namespace moddep {

	//---Платформенно-зависимые реализации
	namespace platform {
		namespace fs = std::filesystem;

		//---Получение пути к собственному исполняемому файлу
		fs::path selfExePath();
		//---Проверка, что процесс запущен с правами администратора / root
		bool isElevated();
		//---Текущий пользователь
		UserIdentity currentUser();
		//---Процессы, открывшие файл
		std::vector<LockingProcess> findLockingProcesses(const fs::path& path);
		//---lstat: устройство + inode
		bool fileId(const fs::path& path, FileId& out, std::error_code& ec);
		//---Захват адресов кадров стека
		std::vector<void*> captureFrames(int skip);
		//---Символизация кадров (дорого, вызывается только на пути ошибки)
		std::string symbolizeFrames(const std::vector<void*>& frames);
		//---Выдать пользователю владение и rwx на путь (выполняется с повышенными правами)
		bool grantAccess(const fs::path& path, const UserIdentity& user, std::error_code& ec);
		//---Каталог для локальных каналов (XDG_RUNTIME_DIR или temp)
		fs::path runtimeDir();
	}

} // namespace moddep
