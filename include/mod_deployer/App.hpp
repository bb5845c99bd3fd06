#pragma once
#include "Cli.hpp"

namespace moddep {

	//---Запуск команды CLI: конфигурация → состояние → оркестратор.
	//   Код возврата: 0 - успех, 1 - ошибка, 2 - некорректные параметры
	int runApp(const CliOptions& opt);

};//---namespace moddep
