#pragma once
#include <string>
#include <iostream>

namespace moddep {

	//---Команды CLI
	enum class Command {
		Help,
		Activate,
		Deploy,
		Purge,
		Refresh,
		AddMod,
		RemoveMod,
		Enable,
		Disable,
		SetActivator,
		List,
		Invalid
	};

	//---Опции командной строки
	struct CliOptions final {

		//---Команда
		Command cmd = Command::Help;

		std::string configPath;		//	Путь к конфигурации (по умолчанию XDG)
		std::string gameId;			//	Игра (по умолчанию активная или первая из конфигурации)
		std::string modId;			//	Мод для --add-mod / --remove-mod / --enable / --disable
		std::string modType;		//	Тип мода для --add-mod
		std::string activator;		//	Способ развёртывания для --set-activator

		//---Флаги
		bool verbose = false;		//	Подробный лог (VLOG 1)
		bool enable = false;		//	--add-mod: сразу включить мод
	};

	CliOptions parseCli(int argc, char** argv);
	void printHelp(std::ostream& os);

	//---Опции помощника с повышенными правами
	struct HelperOptions final {
		std::string channel;		//	Путь к сокету родителя
	};

	HelperOptions parseHelperCli(int argc, char** argv);

};//---namespace moddep
