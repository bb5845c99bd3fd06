#include "mod_deployer/Paths.hpp"
#include "platform/PlatformImpl.hpp"

#include <cstdlib>

namespace moddep {

	//---Директория, в которой находится исполняемый файл (зависит от платформы)
	fs::path selfDir() {

		//---Получение пути к собственному исполняемому файлу
		const fs::path exe = platform::selfExePath();

		//---Возврат родительской директории или текущей директории, если путь не определён
		if (!exe.empty())
		{
			return exe.parent_path();
		}
		return fs::current_path();
	}
	//---Определение пути к исполняемому файлу помощника
	fs::path resolveHelperExePath(const std::string& exeArg) {

		if (exeArg.empty())
		{
			return {};
		}

		//---Формирование пути
		fs::path p(exeArg);

		//---Если путь относительный → формирование абсолютного пути относительно selfDir
		if (p.is_relative())
		{
			p = (selfDir() / p).lexically_normal();
		}
		return p;
	}
	//---XDG-директория пользователя
	fs::path xdgDir(const char* envName, const char* homeFallback) {

		const char* env = std::getenv(envName);
		if (env && *env) return fs::path(env);

		const char* home = std::getenv("HOME");
		if (home && *home) return fs::path(home) / homeFallback;

		return fs::temp_directory_path() / homeFallback;
	}

};//---namespace moddep
