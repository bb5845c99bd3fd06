#pragma once
#include <functional>
#include <map>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "Errors.hpp"
#include "Model.hpp"

namespace moddep {

	//---Снимок состояния приложения
	struct AppState final {
		std::string instanceId;
		std::string activeGameId;
		std::map<std::string, GameDescriptor> games;
		std::map<std::string, std::map<std::string, Mod>> mods;			//	Игра → id → мод
		std::map<std::string, std::set<std::string>> enabledMods;		//	Игра → включённые моды профиля
		std::map<std::string, std::string> activators;					//	Игра → настроенный способ
		std::map<std::string, bool> deploymentNecessary;				//	Игра → требуется развёртывание

		const GameDescriptor* findGame(const std::string& gameId) const;
		const Mod* findMod(const std::string& gameId, const std::string& modId) const;
		bool isEnabled(const std::string& gameId, const std::string& modId) const;
		std::string activatorFor(const std::string& gameId) const;
		bool needsDeployment(const std::string& gameId) const;
	};

	//---Действия над состоянием
	namespace actions {
		struct SetInstanceId final { std::string instanceId; };
		struct SetGame final { GameDescriptor game; };
		struct SetActiveGame final { std::string gameId; };
		struct AddMod final { std::string gameId; Mod mod; };
		struct RemoveMod final { std::string gameId; std::string modId; };
		struct SetModState final { std::string gameId; std::string modId; ModState state; };
		struct SetModEnabled final { std::string gameId; std::string modId; bool enabled; };
		struct SetActivator final { std::string gameId; std::string activatorId; };
		struct SetDeploymentNecessary final { std::string gameId; bool necessary; };
	};//---namespace actions

	using Action = std::variant<
		actions::SetInstanceId,
		actions::SetGame,
		actions::SetActiveGame,
		actions::AddMod,
		actions::RemoveMod,
		actions::SetModState,
		actions::SetModEnabled,
		actions::SetActivator,
		actions::SetDeploymentNecessary>;

	//---Редуктор: новое состояние после действия
	AppState applyAction(AppState state, const Action& action);

	//---Подписчик: (предыдущее, текущее) после каждого действия
	using StateListener = std::function<void(const AppState& previous, const AppState& current)>;

	//---Доступ к состоянию: снимок / действие / подписка
	class IStateAccess {
	public:
		virtual ~IStateAccess() = default;

		virtual AppState snapshot() const = 0;
		virtual bool dispatch(const Action& action, Error* error) = 0;
		virtual int subscribe(StateListener listener) = 0;
		virtual void unsubscribe(int token) = 0;
	};

	//---Хранилище в памяти
	class MemoryStateStore : public IStateAccess {
	public:
		MemoryStateStore() = default;
		explicit MemoryStateStore(AppState initial);

		AppState snapshot() const override;
		bool dispatch(const Action& action, Error* error) override;
		int subscribe(StateListener listener) override;
		void unsubscribe(int token) override;

	protected:
		//---Сохранение нового состояния (для постоянных хранилищ)
		virtual bool persist(const AppState& state, Error* error);

		AppState state_;

	private:
		std::map<int, StateListener> listeners_;
		int nextToken_ = 1;
	};

	class FileOps;

	//---Хранилище в YAML-файле (запись нового файла и замена)
	class YamlStateStore final : public MemoryStateStore {
	public:
		YamlStateStore(const FileOps& files, fs::path path);

		//---Загрузка; отсутствующий файл - пустое состояние
		bool load(Error* error);

		const fs::path& path() const { return path_; }

		static std::string encode(const AppState& state);
		static bool decode(const std::string& text, AppState& out, std::string* error);

	protected:
		bool persist(const AppState& state, Error* error) override;

	private:
		const FileOps& files_;
		fs::path path_;
	};

};//---namespace moddep
