#include "mod_deployer/Orchestrator.hpp"
#include "mod_deployer/ActivationStore.hpp"
#include "mod_deployer/DeploymentMethods.hpp"
#include "mod_deployer/Dialog.hpp"
#include "mod_deployer/FileOps.hpp"
#include "mod_deployer/Notifier.hpp"
#include "mod_deployer/Refresh.hpp"

#include <cstdlib>
#include <map>
#include <utility>
#include <vector>

#include <glog/logging.h>

namespace moddep {

	namespace {

		constexpr const char* kReinitActivity = "reinitializing-staging";

		//---Возврат в Idle при любом выходе из операции
		class PhaseScope final {
		public:
			explicit PhaseScope(DeploymentPhase& phase) : phase_(phase) {}
			~PhaseScope() { phase_ = DeploymentPhase::Idle; }

			PhaseScope(const PhaseScope&) = delete;
			PhaseScope& operator=(const PhaseScope&) = delete;

		private:
			DeploymentPhase& phase_;
		};

		//---Операции не пересекаются; повторный вход тоже отклоняется
		class BusyGuard final {
		public:
			explicit BusyGuard(std::atomic<bool>& busy)
				: busy_(busy), acquired_(!busy.exchange(true))
			{
			}
			~BusyGuard() { if (acquired_) busy_ = false; }

			BusyGuard(const BusyGuard&) = delete;
			BusyGuard& operator=(const BusyGuard&) = delete;

			bool acquired() const { return acquired_; }

		private:
			std::atomic<bool>& busy_;
			bool acquired_;
		};

		static Error busyError()
		{
			return makeError(ErrorKind::TemporaryError, "Another deployment operation is still running.");
		}

		static std::string typeName(const std::string& modType)
		{
			return modType.empty() ? std::string("default") : modType;
		}

	} // namespace

	const char* toString(DeploymentPhase phase)
	{
		switch (phase)
		{
		case DeploymentPhase::Idle:        return "idle";
		case DeploymentPhase::Validating:  return "validating";
		case DeploymentPhase::Migrating:   return "migrating";
		case DeploymentPhase::Deploying:   return "deploying";
		case DeploymentPhase::Undeploying: return "undeploying";
		case DeploymentPhase::Finalizing:  return "finalizing";
		}
		return "idle";
	}

	DeploymentOrchestrator::DeploymentOrchestrator(IStateAccess& state, const FileOps& files, const ActivationStore& store,
		MethodRegistry& methods, IRecoveryDialog* dialog, INotifier& notifier)
		: state_(state), files_(files), store_(store), methods_(methods), dialog_(dialog), notifier_(notifier)
		, exitHook_([](int code) { std::exit(code); })
	{
	}

	bool DeploymentOrchestrator::report(const std::string& title, Error e, Error* error)
	{
		reportError(notifier_, title, e);
		return fail(error, std::move(e));
	}

	bool DeploymentOrchestrator::contextFor(const AppState& state, const std::string& gameId,
		GameDeploymentContext& out, Error* error) const
	{
		const GameDescriptor* game = state.findGame(gameId);
		if (!game)
		{
			return fail(error, makeError(ErrorKind::ProcessCanceled, "Game \"" + gameId + "\" is not managed."));
		}
		out = makeContext(*game, state.activatorFor(gameId));
		return true;
	}

	bool DeploymentOrchestrator::selectMethod(const GameDeploymentContext& context, const IDeploymentMethod*& out, Error* error) const
	{
		out = nullptr;
		if (!context.activatorId.empty())
		{
			const IDeploymentMethod* configured = methods_.find(context.activatorId);
			if (configured && unsupportedReasonForGame(*configured, context).empty())
			{
				out = configured;
				return true;
			}
			VLOG(1) << "configured method \"" << context.activatorId << "\" is not usable for " << context.gameId;
		}

		out = methods_.firstSupporting(context);
		if (!out)
		{
			return fail(error, makeError(ErrorKind::ProcessCanceled,
				"No deployment method is available for \"" + context.gameId + "\"."));
		}
		return true;
	}
	//------------------------------------------------------------
	//	Validating: staging существует и доступен для записи.
	//	Отсутствующий staging: выход или переинициализация
	//------------------------------------------------------------
	bool DeploymentOrchestrator::validateStaging(const GameDeploymentContext& context, Error* error)
	{
		phase_ = DeploymentPhase::Validating;
		if (files_.isDirectory(context.stagingPath))
		{
			return files_.ensureDirWritable(context.stagingPath, error);
		}

		LOG(WARNING) << "staging folder " << context.stagingPath << " for " << context.gameId << " is missing";
		if (!dialog_)
		{
			return fail(error, makeError(ErrorKind::ProcessCanceled,
				"Staging folder \"" + context.stagingPath.string() + "\" is missing.", context.stagingPath));
		}

		DialogRequest req;
		req.title = "Staging folder missing";
		req.message = "Your staging folder \"" + context.stagingPath.string() + "\" is missing. "
			"This might happen because you deleted it or because the drive it was on is not connected.\n"
			"If you reinitialize the folder, files deployed from it will be purged and the mods "
			"installed for this game will be lost.";
		req.buttons = { "Quit", "Reinitialize staging folder" };

		const int choice = dialog_->choose(req);
		if (choice != 1)
		{
			if (choice == 0)
			{
				LOG(WARNING) << "user chose to quit because of missing staging folder";
				exitHook_(1);
			}
			Error e = userCanceled();
			e.path = context.stagingPath;
			return fail(error, std::move(e));
		}

		notifier_.sendActivity(kReinitActivity, "Purging deployment and recreating the staging folder");
		const bool ok = store_.fallbackPurge(context, error) && files_.ensureDir(context.stagingPath, error);
		notifier_.dismiss(kReinitActivity);
		if (ok) LOG(INFO) << "staging folder " << context.stagingPath << " reinitialized";
		return ok;
	}
	//------------------------------------------------------------
	//	Migrating: настроенный способ больше не подходит игре.
	//	Если объект способа ещё доступен - он используется последний
	//	раз для очистки; если нет - миграция пропускается
	//------------------------------------------------------------
	bool DeploymentOrchestrator::migrateIfNeeded(const GameDeploymentContext& context, Error* error)
	{
		const std::string& configured = context.activatorId;
		if (configured.empty()) return true;

		const IDeploymentMethod* previous = methods_.find(configured);
		if (!previous)
		{
			//---Настройка остаётся: способ может вернуться, предупреждение - при каждой проверке
			LOG(WARNING) << "deployment method \"" << configured << "\" is not available, skipping migration";
			notifier_.showError("Deployment method unavailable",
				"The deployment method \"" + configured + "\" previously used for \"" + context.gameId
				+ "\" is no longer available. Files it deployed can't be removed automatically.", false);
			return true;
		}

		const std::string reason = unsupportedReasonForGame(*previous, context);
		if (reason.empty()) return true;

		phase_ = DeploymentPhase::Migrating;
		LOG(WARNING) << "deployment method \"" << configured << "\" no longer usable for "
			<< context.gameId << " (" << reason << "), purging its deployment";
		if (!undeployAll(context, *previous, {}, error)) return false;

		if (!state_.dispatch(actions::SetActivator{ context.gameId, "" }, error)) return false;
		if (!state_.dispatch(actions::SetDeploymentNecessary{ context.gameId, true }, error)) return false;

		const IDeploymentMethod* next = methods_.firstSupporting(context.withActivator(""));
		LOG(INFO) << context.gameId << " now uses " << (next ? "\"" + next->id() + "\"" : std::string("no deployment method"));
		return true;
	}
	//------------------------------------------------------------
	//	Один цикл prepare → deactivate / activate → finalize → save
	//	для директории одного типа модов
	//------------------------------------------------------------
	bool DeploymentOrchestrator::runCycle(const GameDeploymentContext& context, const IDeploymentMethod& method,
		const std::string& modType, const CycleRequest& request, Error* error)
	{
		const fs::path targetDir = context.targetFor(modType);
		if (targetDir.empty())
		{
			return fail(error, makeError(ErrorKind::ProcessCanceled,
				"Game \"" + context.gameId + "\" has no target folder for mod type \"" + typeName(modType) + "\"."));
		}

		if (request.undeployOnly)
		{
			if (!files_.isDirectory(targetDir))
			{
				VLOG(1) << "nothing to undeploy in " << targetDir;
				return true;
			}
		}
		else if (!files_.ensureDirWritable(targetDir, error))
		{
			return false;
		}

		const NormalizeFn normalize = makeNormalizeFunc(targetDir);

		ActivationManifest prior;
		if (!store_.load(modType, targetDir, method.id(), prior, error)) return false;

		DeploymentHandle handle;
		if (!method.prepare(targetDir, request.undeployOnly, prior, normalize, handle, error)) return false;

		const AppState state = state_.snapshot();

		//---Моды, которые этот способ развернул в директорию
		std::map<std::string, fs::path> deployed;
		for (const auto& kv : handle.working.files)
		{
			if (kv.second.methodId == method.id()) deployed[kv.second.modId] = kv.second.source;
		}
		auto modFor = [&](const std::string& modId) {
			const Mod* known = state.findMod(context.gameId, modId);
			if (known) return *known;
			Mod stub;
			stub.id = modId;
			stub.type = modType;
			stub.installationPath = deployed[modId];
			return stub;
		};

		Error actErr;
		bool acted = true;
		if (request.undeployOnly)
		{
			for (const auto& kv : deployed)
			{
				if (!request.only.empty() && request.only.count(kv.first) == 0) continue;
				if (!method.deactivate(handle, context.stagingPath, modFor(kv.first), &actErr))
				{
					acted = false;
					break;
				}
			}
		}
		else
		{
			for (const auto& kv : deployed)
			{
				const Mod* mod = state.findMod(context.gameId, kv.first);
				const bool keep = mod && mod->type == modType && isMaterialized(mod->state)
					&& state.isEnabled(context.gameId, kv.first);
				if (keep) continue;
				if (!method.deactivate(handle, context.stagingPath, modFor(kv.first), &actErr))
				{
					acted = false;
					break;
				}
			}

			const auto gameMods = state.mods.find(context.gameId);
			if (acted && gameMods != state.mods.end())
			{
				for (const auto& kv : gameMods->second)
				{
					const Mod& mod = kv.second;
					if (mod.type != modType || !isMaterialized(mod.state) || !state.isEnabled(context.gameId, mod.id)) continue;
					if (!method.activate(handle, context.stagingPath, mod, &actErr))
					{
						acted = false;
						break;
					}
				}
			}
		}

		const std::string& instanceId = state.instanceId;
		if (!acted)
		{
			//---Уже созданные артефакты должны остаться в манифесте
			LOG(WARNING) << "deployment of " << targetDir << " interrupted, recording partial state";
			Error saveErr;
			if (!store_.save(modType, instanceId, targetDir, handle.working, method.id(), &saveErr))
			{
				LOG(ERROR) << "failed to record partial deployment of " << targetDir << ": " << saveErr.message;
			}
			return fail(error, std::move(actErr));
		}

		phase_ = DeploymentPhase::Finalizing;
		ActivationManifest next;
		if (!method.finalize(handle, context.gameId, context.stagingPath, next, error)) return false;
		if (!handle.orphans.empty())
		{
			LOG(WARNING) << handle.orphans.size() << " orphaned files cleaned up in " << targetDir;
		}
		return store_.save(modType, instanceId, targetDir, next, method.id(), error);
	}

	bool DeploymentOrchestrator::undeployAll(const GameDeploymentContext& context, const IDeploymentMethod& method,
		const std::set<std::string>& only, Error* error)
	{
		CycleRequest request;
		request.undeployOnly = true;
		request.only = only;

		for (const std::string& modType : context.modTypes())
		{
			phase_ = DeploymentPhase::Undeploying;
			if (!runCycle(context, method, modType, request, error)) return false;
		}
		return true;
	}
	//------------------------------------------------------------
	//	Undeploy тем способом, который создал записи манифеста,
	//	а не текущим: настроенный способ мог стать неподходящим
	//------------------------------------------------------------
	bool DeploymentOrchestrator::undeployOwned(const GameDeploymentContext& context,
		const std::set<std::string>& only, Error* error)
	{
		std::vector<std::pair<std::string, const IDeploymentMethod*>> cycles;
		for (const std::string& modType : context.modTypes())
		{
			const fs::path targetDir = context.targetFor(modType);
			if (targetDir.empty() || !files_.isDirectory(targetDir)) continue;

			ActivationManifest manifest;
			if (!store_.load(modType, targetDir, "", manifest, error)) return false;

			std::set<std::string> owners;
			for (const auto& kv : manifest.files)
			{
				if (only.empty() || only.count(kv.second.modId) != 0) owners.insert(kv.second.methodId);
			}

			//---Сначала все владельцы, потом изменения на диске
			for (const std::string& owner : owners)
			{
				const IDeploymentMethod* method = methods_.find(owner);
				if (!method)
				{
					return fail(error, makeError(ErrorKind::ProcessCanceled,
						"Files in \"" + targetDir.string() + "\" were deployed with \"" + owner
						+ "\", which is no longer available. They can't be removed automatically.", targetDir));
				}
				cycles.emplace_back(modType, method);
			}
		}

		CycleRequest request;
		request.undeployOnly = true;
		request.only = only;
		for (const auto& cycle : cycles)
		{
			phase_ = DeploymentPhase::Undeploying;
			if (!runCycle(context, *cycle.second, cycle.first, request, error)) return false;
		}
		return true;
	}

	bool DeploymentOrchestrator::deployLocked(const std::string& gameId, Error* error)
	{
		GameDeploymentContext context;
		if (!contextFor(state_.snapshot(), gameId, context, error)) return false;
		if (!validateStaging(context, error)) return false;
		if (!migrateIfNeeded(context, error)) return false;

		//---Миграция могла сменить способ
		if (!contextFor(state_.snapshot(), gameId, context, error)) return false;

		const IDeploymentMethod* method = nullptr;
		if (!selectMethod(context, method, error)) return false;

		const AppState state = state_.snapshot();
		const auto gameMods = state.mods.find(gameId);
		if (gameMods != state.mods.end())
		{
			for (const auto& kv : gameMods->second)
			{
				if (state.isEnabled(gameId, kv.first) && context.targetFor(kv.second.type).empty())
				{
					LOG(WARNING) << "mod \"" << kv.first << "\" has type \"" << typeName(kv.second.type)
						<< "\" unknown to " << gameId << ", not deployed";
				}
			}
		}

		LOG(INFO) << "deploying " << gameId << " with \"" << method->id() << "\"";
		for (const std::string& modType : context.modTypes())
		{
			phase_ = DeploymentPhase::Deploying;
			if (!runCycle(context, *method, modType, CycleRequest{}, error)) return false;
		}

		if (!state_.dispatch(actions::SetDeploymentNecessary{ gameId, false }, error)) return false;
		LOG(INFO) << "deployment of " << gameId << " finished";
		return true;
	}
	//------------------------------------------------------------
	//	Публичные операции
	//------------------------------------------------------------
	bool DeploymentOrchestrator::onGameModeActivated(const std::string& gameId, Error* error)
	{
		const std::string title = "Failed to activate game";
		BusyGuard guard(busy_);
		if (!guard.acquired()) return report(title, busyError(), error);
		PhaseScope scope(phase_);

		Error e;
		GameDeploymentContext context;
		if (!contextFor(state_.snapshot(), gameId, context, &e)) return report(title, std::move(e), error);
		if (!state_.dispatch(actions::SetActiveGame{ gameId }, &e)) return report(title, std::move(e), error);

		LOG(INFO) << "game " << gameId << " activated";
		if (!validateStaging(context, &e)) return report(title, std::move(e), error);
		if (!migrateIfNeeded(context, &e)) return report(title, std::move(e), error);
		return refreshLocked(gameId, error);
	}

	bool DeploymentOrchestrator::deploy(const std::string& gameId, Error* error)
	{
		BusyGuard guard(busy_);
		if (!guard.acquired()) return report("Deployment failed", busyError(), error);
		PhaseScope scope(phase_);

		Error e;
		if (!deployLocked(gameId, &e)) return report("Deployment failed", std::move(e), error);
		return true;
	}

	bool DeploymentOrchestrator::purge(const std::string& gameId, Error* error)
	{
		const std::string title = "Purge failed";
		BusyGuard guard(busy_);
		if (!guard.acquired()) return report(title, busyError(), error);
		PhaseScope scope(phase_);

		Error e;
		GameDeploymentContext context;
		if (!contextFor(state_.snapshot(), gameId, context, &e)
			|| !undeployOwned(context, {}, &e)
			|| !state_.dispatch(actions::SetDeploymentNecessary{ gameId, true }, &e))
		{
			return report(title, std::move(e), error);
		}
		LOG(INFO) << "purged " << gameId;
		return true;
	}
	//------------------------------------------------------------
	//	Сверка: ошибки "не найдено" показываются без предложения
	//	отчёта (allowReport), отказ пользователя - молча
	//------------------------------------------------------------
	bool DeploymentOrchestrator::refreshLocked(const std::string& gameId, Error* error)
	{
		const std::string title = "Failed to read mods";
		const AppState state = state_.snapshot();

		Error e;
		GameDeploymentContext context;
		if (!contextFor(state, gameId, context, &e)) return report(title, std::move(e), error);

		static const std::map<std::string, Mod> kNoMods;
		const auto known = state.mods.find(gameId);

		RefreshResult result;
		if (!refreshMods(files_, context.stagingPath, known == state.mods.end() ? kNoMods : known->second, result, &e))
		{
			return report(title, std::move(e), error);
		}

		for (const std::string& name : result.added)
		{
			Mod mod;
			mod.id = name;
			mod.installationPath = name;
			mod.state = ModState::Installed;
			LOG(INFO) << "discovered mod \"" << name << "\" in " << context.stagingPath;
			if (!state_.dispatch(actions::AddMod{ gameId, mod }, &e)) return report(title, std::move(e), error);
		}
		for (const std::string& modId : result.removed)
		{
			LOG(INFO) << "mod \"" << modId << "\" was removed from " << context.stagingPath;
			if (!state_.dispatch(actions::RemoveMod{ gameId, modId }, &e)) return report(title, std::move(e), error);
		}
		if (!result.removed.empty()
			&& !state_.dispatch(actions::SetDeploymentNecessary{ gameId, true }, &e))
		{
			return report(title, std::move(e), error);
		}

		notifier_.emitEvent(kEventModsRefreshed);
		return true;
	}

	bool DeploymentOrchestrator::refresh(const std::string& gameId, Error* error)
	{
		BusyGuard guard(busy_);
		if (!guard.acquired()) return report("Failed to read mods", busyError(), error);
		return refreshLocked(gameId, error);
	}

	bool DeploymentOrchestrator::addMod(const std::string& gameId, const Mod& mod, Error* error)
	{
		const std::string title = "Failed to add mod";
		BusyGuard guard(busy_);
		if (!guard.acquired()) return report(title, busyError(), error);

		Error e;
		GameDeploymentContext context;
		if (!contextFor(state_.snapshot(), gameId, context, &e)) return report(title, std::move(e), error);

		Mod added = mod;
		if (added.installationPath.empty()) added.installationPath = added.id;

		if (!files_.ensureDir(context.stagingPath / added.installationPath, &e)
			|| !state_.dispatch(actions::AddMod{ gameId, added }, &e))
		{
			return report(title, std::move(e), error);
		}
		LOG(INFO) << "mod \"" << added.id << "\" added to " << gameId;
		return true;
	}
	//------------------------------------------------------------
	//	Удаление мода: выключить → убрать развёрнутое → удалить
	//	директорию установки → убрать из состояния. При ошибке мод
	//	остаётся в состоянии
	//------------------------------------------------------------
	bool DeploymentOrchestrator::removeMod(const std::string& gameId, const std::string& modId, Error* error)
	{
		const std::string title = "Failed to remove mod";
		BusyGuard guard(busy_);
		if (!guard.acquired()) return report(title, busyError(), error);
		PhaseScope scope(phase_);

		const AppState state = state_.snapshot();
		const Mod* found = state.findMod(gameId, modId);
		if (!found)
		{
			VLOG(1) << "mod \"" << modId << "\" is not known for " << gameId << ", nothing to remove";
			return true;
		}
		const Mod mod = *found;
		if (!isMaterialized(mod.state))
		{
			return report(title, makeError(ErrorKind::ProcessCanceled,
				"Can't remove mod \"" + modId + "\" while it is being downloaded."), error);
		}

		Error e;
		GameDeploymentContext context;
		if (!contextFor(state, gameId, context, &e)) return report(title, std::move(e), error);

		if (state.isEnabled(gameId, modId)
			&& !state_.dispatch(actions::SetModEnabled{ gameId, modId, false }, &e))
		{
			return report(title, std::move(e), error);
		}
		//---Выключенный мод тоже мог остаться развёрнутым до следующего deploy
		if (!undeployOwned(context, { modId }, &e)) return report(title, std::move(e), error);

		if (!files_.remove(context.stagingPath / mod.installationPath, &e)) return report(title, std::move(e), error);
		if (!state_.dispatch(actions::RemoveMod{ gameId, modId }, &e)) return report(title, std::move(e), error);

		LOG(INFO) << "mod \"" << modId << "\" removed from " << gameId;
		return true;
	}
	//------------------------------------------------------------
	//	Смена способа: проверка до любых изменений на диске
	//------------------------------------------------------------
	bool DeploymentOrchestrator::setActivator(const std::string& gameId, const std::string& activatorId, Error* error)
	{
		const std::string title = "Failed to change deployment method";
		BusyGuard guard(busy_);
		if (!guard.acquired()) return report(title, busyError(), error);
		PhaseScope scope(phase_);

		Error e;
		GameDeploymentContext context;
		if (!contextFor(state_.snapshot(), gameId, context, &e)) return report(title, std::move(e), error);

		const IDeploymentMethod* next = methods_.find(activatorId);
		if (!next)
		{
			return report(title, makeError(ErrorKind::ProcessCanceled,
				"Unknown deployment method \"" + activatorId + "\"."), error);
		}
		const std::string reason = unsupportedReasonForGame(*next, context);
		if (!reason.empty())
		{
			return report(title, makeError(ErrorKind::ProcessCanceled,
				"\"" + next->name() + "\" can't be used for \"" + gameId + "\": " + reason), error);
		}

		const IDeploymentMethod* current = nullptr;
		Error selectErr;
		if (!selectMethod(context, current, &selectErr))
		{
			VLOG(1) << "no current deployment method for " << gameId << ": " << selectErr.message;
		}

		if (current && current != next)
		{
			LOG(INFO) << "switching " << gameId << " from \"" << current->id() << "\" to \"" << next->id() << "\"";
			if (!undeployAll(context, *current, {}, &e)) return report(title, std::move(e), error);
		}

		if (!state_.dispatch(actions::SetActivator{ gameId, activatorId }, &e)
			|| (current != next && !state_.dispatch(actions::SetDeploymentNecessary{ gameId, true }, &e)))
		{
			return report(title, std::move(e), error);
		}
		return true;
	}
	//------------------------------------------------------------
	//	Изменились правила или переопределения файлов мода
	//------------------------------------------------------------
	void DeploymentOrchestrator::onModsChanged(const AppState& previous, const AppState& current)
	{
		for (const auto& game : current.mods)
		{
			if (current.needsDeployment(game.first)) continue;

			const auto before = previous.mods.find(game.first);
			if (before == previous.mods.end()) continue;

			for (const auto& kv : game.second)
			{
				const auto old = before->second.find(kv.first);
				if (old == before->second.end()) continue;
				if (old->second.rules == kv.second.rules && old->second.fileOverrides == kv.second.fileOverrides) continue;

				VLOG(1) << "rules of \"" << kv.first << "\" changed, " << game.first << " needs deployment";
				Error e;
				if (!state_.dispatch(actions::SetDeploymentNecessary{ game.first, true }, &e))
				{
					reportError(notifier_, "Failed to update state", e);
				}
				break;
			}
		}
	}
	//------------------------------------------------------------
	//	Изменился путь staging активной игры - сверка заново
	//------------------------------------------------------------
	void DeploymentOrchestrator::onPathsChanged(const AppState& previous, const AppState& current)
	{
		const std::string& gameId = current.activeGameId;
		if (gameId.empty() || previous.activeGameId != gameId) return;

		const GameDescriptor* before = previous.findGame(gameId);
		const GameDescriptor* after = current.findGame(gameId);
		if (!before || !after || before->stagingPath == after->stagingPath) return;

		LOG(INFO) << "staging folder of " << gameId << " changed to " << after->stagingPath;
		Error e;
		if (!refresh(gameId, &e))
		{
			VLOG(1) << "refresh after path change failed: " << toString(e.kind);
		}
	}

};//---namespace moddep
