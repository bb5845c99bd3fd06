#pragma once
#include <atomic>
#include <functional>
#include <set>
#include <string>

#include "Errors.hpp"
#include "Model.hpp"
#include "State.hpp"

namespace moddep {

	class ActivationStore;
	class FileOps;
	class IDeploymentMethod;
	class INotifier;
	class IRecoveryDialog;
	class MethodRegistry;

	//---Фаза цикла развёртывания игры
	enum class DeploymentPhase {
		Idle,
		Validating,
		Migrating,
		Deploying,
		Undeploying,
		Finalizing
	};

	const char* toString(DeploymentPhase phase);

	//---Оркестратор развёртывания: выбор способа, миграция, сверка, удаление модов.
	//   Операции выполняются строго последовательно; пересечение двух операций
	//   завершается TemporaryError
	class DeploymentOrchestrator final {
	public:
		DeploymentOrchestrator(IStateAccess& state, const FileOps& files, const ActivationStore& store,
			MethodRegistry& methods, IRecoveryDialog* dialog, INotifier& notifier);

		//---Активация игры: проверка staging, миграция способа, сверка
		bool onGameModeActivated(const std::string& gameId, Error* error);

		//---Развернуть все включённые моды / убрать всё развёрнутое
		bool deploy(const std::string& gameId, Error* error);
		bool purge(const std::string& gameId, Error* error);

		//---Сверка известных модов со staging
		bool refresh(const std::string& gameId, Error* error);

		bool addMod(const std::string& gameId, const Mod& mod, Error* error);
		bool removeMod(const std::string& gameId, const std::string& modId, Error* error);

		//---Смена способа развёртывания: неподходящий отклоняется до любых изменений на диске
		bool setActivator(const std::string& gameId, const std::string& activatorId, Error* error);

		//---Реакции на изменение состояния (подписка на IStateAccess)
		void onModsChanged(const AppState& previous, const AppState& current);
		void onPathsChanged(const AppState& previous, const AppState& current);

		//---Действующий способ: явно настроенный, если он подходит, иначе первый подходящий
		bool selectMethod(const GameDeploymentContext& context, const IDeploymentMethod*& out, Error* error) const;

		DeploymentPhase phase() const { return phase_; }

		//---Завершение процесса по выбору "Quit" (по умолчанию std::exit)
		void setExitHook(std::function<void(int)> hook) { exitHook_ = std::move(hook); }

	private:
		//---Что делает один цикл над директорией типа мода
		struct CycleRequest final {
			bool undeployOnly = false;
			std::set<std::string> only;		//	Для undeploy: только эти моды (пусто - все)
		};

		bool contextFor(const AppState& state, const std::string& gameId, GameDeploymentContext& out, Error* error) const;

		bool validateStaging(const GameDeploymentContext& context, Error* error);
		bool migrateIfNeeded(const GameDeploymentContext& context, Error* error);

		bool deployLocked(const std::string& gameId, Error* error);
		bool undeployAll(const GameDeploymentContext& context, const IDeploymentMethod& method,
			const std::set<std::string>& only, Error* error);
		//---Undeploy способами, записанными в манифестах; недоступный способ - ProcessCanceled до изменений на диске
		bool undeployOwned(const GameDeploymentContext& context, const std::set<std::string>& only, Error* error);
		bool runCycle(const GameDeploymentContext& context, const IDeploymentMethod& method,
			const std::string& modType, const CycleRequest& request, Error* error);

		bool refreshLocked(const std::string& gameId, Error* error);

		//---Ошибка: показ пользователю по уровню, затем возврат false
		bool report(const std::string& title, Error e, Error* error);

		IStateAccess& state_;
		const FileOps& files_;
		const ActivationStore& store_;
		MethodRegistry& methods_;
		IRecoveryDialog* dialog_;
		INotifier& notifier_;

		std::atomic<bool> busy_{ false };
		DeploymentPhase phase_ = DeploymentPhase::Idle;
		std::function<void(int)> exitHook_;
	};

};//---namespace moddep
