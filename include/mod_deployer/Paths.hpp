#pragma once
#include <filesystem>
#include <string>

namespace moddep {

	namespace fs = std::filesystem;

	//---Директория, в которой находится исполняемый файл
	fs::path selfDir();

	//--Определение пути к исполняемому файлу помощника:
	//	Если exeArg пустой → пустой путь
	//	Если exeArg относительный путь → selfDir() / exeArg
	//	Если exeArg абсолютный путь → остаётся без изменений
	fs::path resolveHelperExePath(const std::string& exeArg);

	//---Путь из переменной окружения или $HOME/<fallback>
	fs::path xdgDir(const char* envName, const char* homeFallback);

};//---namespace moddep
