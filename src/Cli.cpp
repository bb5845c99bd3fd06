#include "mod_deployer/Cli.hpp"
#include <string_view>
#include <iomanip>
#include <utility>
#include <vector>

namespace moddep {
	//------------------------------------------------------------
	//	Проверка, что строка соответствует флагу
	//------------------------------------------------------------
	static bool isFlag(std::string_view s, std::string_view f) { return s == f; }
	//------------------------------------------------------------
	//	Проверка, что строка начинается с префикса
	//------------------------------------------------------------
	static bool startsWith(std::string_view s, std::string_view p) {
		return s.size() >= p.size() && s.substr(0, p.size()) == p;
	}
	//------------------------------------------------------------
	//	Удаление кавычек в начале и конце строки
	//------------------------------------------------------------
	static std::string trimQuotes(std::string v) {

		//---Если строка слишком короткая → возврат без изменений
		if (v.size() < 2) return v;

		//---Проверка на двойные или одинарные кавычки
		const bool dbl = (v.front() == '"' && v.back() == '"');
		const bool sgl = (v.front() == '\'' && v.back() == '\'');

		//---Если есть кавычки → удаление
		if (dbl || sgl) v = v.substr(1, v.size() - 2);

		return v;
	}
	//------------------------------------------------------------
	//	Получение значения ключа из аргументов командной строки
	//------------------------------------------------------------
	static std::string getKv(int argc, char** argv, const std::string& key) {

		//---Формирование префикса ключа
		const std::string prefix = key + "=";

		//---Поиск ключа в аргументах
		for (int i = 1; i < argc; i++)
		{
			std::string_view a = argv[i];
			if (startsWith(a, prefix))
			{
				//---Возврат значения без префикса и с удалёнными кавычками
				return trimQuotes(std::string(a.substr(prefix.size())));
			}
		}
		return {};
	}
	//------------------------------------------------------------
	//	Проверка наличия флага в аргументах командной строки
	//------------------------------------------------------------
	static bool hasFlag(int argc, char** argv, std::string_view flag) {
		for (int i = 1; i < argc; i++)
		{
			if (isFlag(argv[i], flag)) return true;
		}
		return false;
	}
	//------------------------------------------------------------
	//	Флаги команд
	//------------------------------------------------------------
	static const std::vector<std::pair<const char*, Command>>& commandFlags() {
		static const std::vector<std::pair<const char*, Command>> kFlags = {
			{ "--activate", Command::Activate },
			{ "--deploy", Command::Deploy },
			{ "--purge", Command::Purge },
			{ "--refresh", Command::Refresh },
			{ "--add-mod", Command::AddMod },
			{ "--remove-mod", Command::RemoveMod },
			{ "--enable", Command::Enable },
			{ "--disable", Command::Disable },
			{ "--set-activator", Command::SetActivator },
			{ "--list", Command::List },
		};
		return kFlags;
	}
	//------------------------------------------------------------
	//---Парсинг опций командной строки
	//------------------------------------------------------------
	CliOptions parseCli(int argc, char** argv) {

		//---Результирующие опции
		CliOptions o;

		o.configPath = getKv(argc, argv, "--config");
		o.gameId = getKv(argc, argv, "--game");
		o.modId = getKv(argc, argv, "--mod");
		o.modType = getKv(argc, argv, "--type");
		o.activator = getKv(argc, argv, "--activator");
		o.verbose = hasFlag(argc, argv, "--verbose");

		//---Определение команды
		int cmdCount = 0;
		for (const auto& f : commandFlags())
		{
			if (hasFlag(argc, argv, f.first))
			{
				o.cmd = f.second;
				++cmdCount;
			}
		}
		//-----enable как модификатор --add-mod
		if (cmdCount == 2 && o.cmd == Command::Enable && hasFlag(argc, argv, "--add-mod"))
		{
			o.cmd = Command::AddMod;
			o.enable = true;
			cmdCount = 1;
		}

		//---Если не указана ни одна команда → Help
		if (cmdCount == 0 || hasFlag(argc, argv, "--help"))
		{
			o.cmd = Command::Help;
			return o;
		}
		//---Если некорректно указана команда → Invalid
		if (cmdCount > 1)
		{
			o.cmd = Command::Invalid;
			return o;
		}

		//---Обязательные параметры
		const bool needsMod = o.cmd == Command::AddMod || o.cmd == Command::RemoveMod
			|| o.cmd == Command::Enable || o.cmd == Command::Disable;
		if (needsMod && o.modId.empty()) o.cmd = Command::Invalid;
		if (o.cmd == Command::SetActivator && o.activator.empty()) o.cmd = Command::Invalid;

		//---Возврат опций
		return o;
	}

	HelperOptions parseHelperCli(int argc, char** argv) {
		HelperOptions o;
		o.channel = getKv(argc, argv, "--channel");
		return o;
	}
	//------------------------------------------------------------
	//	Вывод опции с описанием
	//------------------------------------------------------------
	static void printOpt(std::ostream& os, const std::string& opt, const std::string& desc, int w = 26)
	{
		os << "  " << std::left << std::setw(w) << opt << desc << "\n";
	}
	//------------------------------------------------------------
	//	Вывод справки по использованию
	//------------------------------------------------------------
	void printHelp(std::ostream& os)
	{
		os <<
			"mod-deployer\n\n"
			"Usage:\n"
			"  mod-deployer <command> [options]\n\n"
			"Commands (choose exactly one):\n";

		printOpt(os, "--activate", "Validate staging folder, migrate deployment method, refresh mods");
		printOpt(os, "--deploy", "Deploy all enabled mods");
		printOpt(os, "--purge", "Remove everything deployed");
		printOpt(os, "--refresh", "Reconcile known mods with the staging folder");
		printOpt(os, "--add-mod", "Register a mod (--mod=<id> [--type=<type>] [--enable])");
		printOpt(os, "--remove-mod", "Undeploy and delete a mod (--mod=<id>)");
		printOpt(os, "--enable / --disable", "Enable or disable a mod (--mod=<id>)");
		printOpt(os, "--set-activator", "Change deployment method (--activator=hardlink|symlink|copy)");
		printOpt(os, "--list", "Show mods and deployment state");

		os << "\nCommon options:\n";
		printOpt(os, "--config=<path>", "Configuration file (default: $XDG_CONFIG_HOME/mod_deployer/config.yaml)");
		printOpt(os, "--game=<id>", "Game to operate on (default: active game or the first configured)");
		printOpt(os, "--verbose", "Verbose logging");

		os <<
			"\nExamples:\n"
			"  mod-deployer --activate --game=skyrim\n"
			"  mod-deployer --add-mod --mod=skyui --enable\n"
			"  mod-deployer --set-activator --activator=symlink\n"
			"  mod-deployer --deploy --config=\"/home/user/mods/config.yaml\"\n"
			"  mod-deployer --remove-mod --mod=skyui\n";
	}
};//---namespace moddep
