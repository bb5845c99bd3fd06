#pragma once
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace moddep {

	namespace fs = std::filesystem;

	//---Жизненный цикл мода
	enum class ModState {
		Downloading,
		Downloaded,
		Installed
	};

	const char* toString(ModState state);
	bool parseModState(const std::string& s, ModState& out);

	//---Мод считается материализованным в staging только в состояниях downloaded / installed
	inline bool isMaterialized(ModState s) { return s == ModState::Downloaded || s == ModState::Installed; }

	//---Правило зависимости / порядка между модами
	struct ModRule final {
		std::string type;			//	before / after / requires / conflicts
		std::string reference;		//	Идентификатор другого мода
		bool operator==(const ModRule& o) const { return type == o.type && reference == o.reference; }
	};

	struct Mod final {
		std::string id;
		std::string type;					//	Тип мода, выбирает целевую директорию ("" - по умолчанию)
		fs::path installationPath;			//	Относительно staging-директории
		ModState state = ModState::Installed;
		std::vector<ModRule> rules;
		std::vector<std::string> fileOverrides;
	};

	//---Единица содержимого мода
	struct ManagedFile final {
		fs::path source;		//	Абсолютный путь в staging
		std::string modId;
		std::string modType;
		fs::path relPath;		//	Путь относительно директории установки мода
	};

	//---Описание игры (результат обнаружения, приходит извне)
	struct GameDescriptor final {
		std::string id;
		fs::path installPath;
		fs::path stagingPath;
		std::map<std::string, fs::path> modPaths;	//	Тип мода → директория (относительно installPath или абсолютная)
	};

	//---Привязка развёртывания для одной игры: снимок на время операции.
	//   Не изменяется на месте - withActivator() создаёт новый контекст
	struct GameDeploymentContext final {
		std::string gameId;
		fs::path installPath;
		fs::path stagingPath;
		std::string activatorId;
		std::map<std::string, fs::path> modPaths;	//	Тип мода → абсолютная целевая директория

		GameDeploymentContext withActivator(const std::string& id) const;
		std::vector<std::string> modTypes() const;
		//---Целевая директория для типа ("" если тип неизвестен игре)
		fs::path targetFor(const std::string& modType) const;
	};

	GameDeploymentContext makeContext(const GameDescriptor& game, const std::string& activatorId);

	//---Запись манифеста: один развёрнутый файл
	struct DeployedEntry final {
		fs::path relPath;			//	Относительно целевой директории
		std::string modId;			//	Мод-владелец
		fs::path source;			//	Директория установки мода (относительно staging)
		std::string methodId;		//	Способ развёртывания, создавший запись
		std::string contentId;		//	Идентичность содержимого (см. способ развёртывания)
		bool stale = false;			//	Очистка не удалась, артефакт может остаться на диске
	};

	//---Манифест развёртывания для пары (тип мода, целевая директория)
	struct ActivationManifest final {
		std::string instanceId;
		std::string methodId;
		std::map<std::string, DeployedEntry> files;	//	Ключ - нормализованный relPath

		bool empty() const { return files.empty(); }
	};

	//---Канонизация путей для сравнения (регистр, разделители)
	using NormalizeFn = std::function<std::string(const std::string&)>;

	//---Функция нормализации для директории: регистр учитывается, только если ФС его различает
	NormalizeFn makeNormalizeFunc(const fs::path& dir);

};//---namespace moddep
