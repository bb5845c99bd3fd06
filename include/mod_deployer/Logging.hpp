#pragma once
#include <filesystem>

namespace moddep {

	//---Инициализация логгера: файлы info / warning / error / fatal в logDir + вывод в stderr
	void initLogging(const char* programName, const std::filesystem::path& logDir);

	//---Логгер помощника: только stderr (файлы под root в директории пользователя не создаются)
	void initHelperLogging(const char* programName);

};//---namespace moddep
