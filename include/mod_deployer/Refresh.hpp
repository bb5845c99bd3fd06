#pragma once
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "Errors.hpp"
#include "Model.hpp"

namespace moddep {

	class FileOps;

	struct RefreshResult final {
		std::vector<std::string> added;		//	Имена директорий в staging, неизвестные состоянию
		std::vector<std::string> removed;	//	Id модов (downloaded / installed), пропавших с диска
	};

	//---Сверка известных модов с содержимым staging.
	//   Моды в состоянии downloading ещё не материализованы: их отсутствие ожидаемо
	bool refreshMods(const FileOps& files, const fs::path& stagingDir, const std::map<std::string, Mod>& known,
		RefreshResult& out, Error* error);

};//---namespace moddep
