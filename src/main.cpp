#include <iostream>
#include "mod_deployer/App.hpp"
#include "mod_deployer/Cli.hpp"

int main(int argc, char** argv) {

	//---Разбор аргументов командной строки
	const moddep::CliOptions opt = moddep::parseCli(argc, argv);

	//---Если запрошена справка или команда некорректна → вывод справки и выход
	if (opt.cmd == moddep::Command::Help || opt.cmd == moddep::Command::Invalid)
	{
		moddep::printHelp(std::cout);
		return (opt.cmd == moddep::Command::Invalid) ? 2 : 0;
	}
	//---Запуск команды с заданными опциями
	return moddep::runApp(opt);
}
