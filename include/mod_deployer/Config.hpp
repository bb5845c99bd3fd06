#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "Elevation.hpp"
#include "FileOps.hpp"
#include "Model.hpp"
#include "Recovery.hpp"

namespace moddep {

	namespace fs = std::filesystem;

	//---Игра из конфигурации
	struct GameConfig final {
		GameDescriptor descriptor;
		std::string activator;		//	Способ развёртывания по умолчанию (необязательно)
	};

	//---Конфигурация приложения (YAML)
	struct AppConfig final {
		std::string instanceId;		//	Пусто - берётся из состояния или генерируется
		fs::path dataRoot;
		fs::path stateFile = "state.yaml";	//	Относительно dataRoot
		fs::path logDir = "log";			//	Относительно dataRoot
		RetryOptions retry;
		ElevationOptions elevation;
		CopyOptions copy;
		std::vector<GameConfig> games;
	};

	//---Путь к конфигурации по умолчанию ($XDG_CONFIG_HOME/mod_deployer/config.yaml)
	fs::path defaultConfigPath();
	//---Корень данных по умолчанию ($XDG_DATA_HOME/mod_deployer)
	fs::path defaultDataRoot();

	//---Загрузка конфигурации. Относительные state_file / log_dir разрешаются от data_root,
	//   относительный путь помощника - от директории исполняемого файла
	bool loadConfig(const fs::path& path, AppConfig& out, std::string* error);
	bool parseConfig(const std::string& text, AppConfig& out, std::string* error);

	//---Случайный идентификатор экземпляра
	std::string generateInstanceId();

};//---namespace moddep
