#include "mod_deployer/App.hpp"
#include "mod_deployer/ActivationStore.hpp"
#include "mod_deployer/Config.hpp"
#include "mod_deployer/ConsoleUi.hpp"
#include "mod_deployer/DeploymentMethods.hpp"
#include "mod_deployer/Elevation.hpp"
#include "mod_deployer/FileOps.hpp"
#include "mod_deployer/Logging.hpp"
#include "mod_deployer/Orchestrator.hpp"
#include "mod_deployer/Platform.hpp"
#include "mod_deployer/Recovery.hpp"
#include "mod_deployer/State.hpp"

#include <iostream>
#include <memory>

#include <glog/logging.h>

namespace moddep {

	namespace {
		//------------------------------------------------------------
		//	Логирование ошибки и возврат кода ошибки
		//------------------------------------------------------------
		static int failed(const std::string& msg) {
			LOG(ERROR) << msg;
			return 1;
		}

		static int failed(const std::string& what, const Error& e) {
			//---Отказ пользователя - не ошибка приложения
			if (e.kind == ErrorKind::UserCanceled)
			{
				LOG(INFO) << what << ": canceled by user";
				return 1;
			}
			LOG(ERROR) << what << ": " << describe(e, false);
			return 1;
		}
		//------------------------------------------------------------
		//	Игра для команды: --game, иначе активная, иначе первая
		//------------------------------------------------------------
		static std::string pickGame(const CliOptions& opt, const AppState& state, const AppConfig& config)
		{
			if (!opt.gameId.empty()) return opt.gameId;
			if (!state.activeGameId.empty() && state.findGame(state.activeGameId)) return state.activeGameId;
			if (!config.games.empty()) return config.games.front().descriptor.id;
			return {};
		}
		//------------------------------------------------------------
		//	Вывод модов и состояния развёртывания
		//------------------------------------------------------------
		static void printState(std::ostream& os, const AppState& state, const std::string& gameId,
			const MethodRegistry& methods, const DeploymentOrchestrator& orchestrator)
		{
			const GameDescriptor* game = state.findGame(gameId);
			if (!game) return;

			const GameDeploymentContext context = makeContext(*game, state.activatorFor(gameId));
			const IDeploymentMethod* method = nullptr;
			Error e;
			const bool haveMethod = orchestrator.selectMethod(context, method, &e);

			os << "game:        " << gameId << "\n"
				<< "install:     " << game->installPath.string() << "\n"
				<< "staging:     " << game->stagingPath.string() << "\n"
				<< "method:      " << (haveMethod ? method->id() : "(none: " + e.message + ")") << "\n"
				<< "deployment:  " << (state.needsDeployment(gameId) ? "necessary" : "up to date") << "\n";

			os << "methods:\n";
			for (const IDeploymentMethod* m : methods.all())
			{
				const std::string reason = unsupportedReasonForGame(*m, context);
				os << "  " << m->id() << " - " << m->name();
				if (!reason.empty()) os << " (unsupported: " << reason << ")";
				os << "\n";
			}

			os << "mods:\n";
			const auto mods = state.mods.find(gameId);
			if (mods == state.mods.end() || mods->second.empty())
			{
				os << "  (none)\n";
				return;
			}
			for (const auto& kv : mods->second)
			{
				const Mod& mod = kv.second;
				os << "  [" << (state.isEnabled(gameId, mod.id) ? 'x' : ' ') << "] " << mod.id
					<< "  type=" << (mod.type.empty() ? "default" : mod.type)
					<< "  state=" << toString(mod.state) << "\n";
			}
		}

	} // namespace

	//------------------------------------------------------------
	//	Оркестратор приложения: запуск команды с заданными опциями
	//------------------------------------------------------------
	int runApp(const CliOptions& opt) {

		//---Конфигурация
		const fs::path configPath = opt.configPath.empty() ? defaultConfigPath() : fs::path(opt.configPath);
		AppConfig config;
		std::string err;
		if (!loadConfig(configPath, config, &err))
		{
			std::cerr << err << std::endl;
			return 2;
		}

		//---Логгер
		initLogging("mod-deployer", config.logDir);
		if (opt.verbose) FLAGS_v = 1;
		LOG(INFO) << "configuration " << configPath << ", data root " << config.dataRoot;

		//---Восстановление после ошибок ОС: диалог в терминале + помощник с правами
		ConsoleDialog dialog(std::cin, std::cout);
		ConsoleNotifier notifier(std::cout);
		ElevationOptions elevation = config.elevation;
		if (isElevated()) elevation.launcher.clear();	// уже root: помощник без запроса прав
		std::unique_ptr<IElevatedHelper> helper = makeElevatedHelper(elevation);
		RecoveryPolicy recovery(&dialog, helper.get(), config.retry);
		FileOps files(recovery, config.copy);

		//---Состояние
		YamlStateStore state(files, config.stateFile);
		Error e;
		if (!state.load(&e)) return failed("can't load state " + config.stateFile.string(), e);

		for (const GameConfig& game : config.games)
		{
			if (!state.dispatch(actions::SetGame{ game.descriptor }, &e)) return failed("can't register game " + game.descriptor.id, e);
			if (!game.activator.empty() && state.snapshot().activatorFor(game.descriptor.id).empty())
			{
				if (!state.dispatch(actions::SetActivator{ game.descriptor.id, game.activator }, &e))
				{
					return failed("can't set deployment method for " + game.descriptor.id, e);
				}
			}
		}

		//---Идентификатор экземпляра: из состояния, иначе из конфигурации, иначе новый
		std::string instanceId = state.snapshot().instanceId;
		if (instanceId.empty()) instanceId = config.instanceId;
		if (instanceId.empty()) instanceId = generateInstanceId();
		if (!state.dispatch(actions::SetInstanceId{ instanceId }, &e)) return failed("can't store instance id", e);

		//---Способы развёртывания и оркестратор
		ActivationStore store(files, instanceId);
		MethodRegistry methods;
		registerBuiltinMethods(methods, files);
		DeploymentOrchestrator orchestrator(state, files, store, methods, &dialog, notifier);

		const int modsToken = state.subscribe([&orchestrator](const AppState& prev, const AppState& cur) {
			orchestrator.onModsChanged(prev, cur);
		});
		const int pathsToken = state.subscribe([&orchestrator](const AppState& prev, const AppState& cur) {
			orchestrator.onPathsChanged(prev, cur);
		});
		struct Unsubscribe final {
			IStateAccess& state;
			int tokens[2];
			~Unsubscribe() { for (int t : tokens) state.unsubscribe(t); }
		} unsubscribe{ state, { modsToken, pathsToken } };

		//---Игра
		const std::string gameId = pickGame(opt, state.snapshot(), config);
		if (gameId.empty()) return failed("No games configured in " + configPath.string());
		if (!state.snapshot().findGame(gameId)) return failed("Unknown game: " + gameId);

		if (!orchestrator.onGameModeActivated(gameId, &e)) return failed("activation of " + gameId + " failed", e);

		//---Команда
		switch (opt.cmd)
		{
		case Command::Activate:
			return 0;

		case Command::Deploy:
			return orchestrator.deploy(gameId, &e) ? 0 : failed("deploy", e);

		case Command::Purge:
			return orchestrator.purge(gameId, &e) ? 0 : failed("purge", e);

		case Command::Refresh:
			return orchestrator.refresh(gameId, &e) ? 0 : failed("refresh", e);

		case Command::AddMod:
		{
			Mod mod;
			mod.id = opt.modId;
			mod.type = opt.modType;
			mod.state = ModState::Installed;
			if (!orchestrator.addMod(gameId, mod, &e)) return failed("add mod " + opt.modId, e);
			if (!opt.enable) return 0;
			if (!state.dispatch(actions::SetModEnabled{ gameId, opt.modId, true }, &e)
				|| !state.dispatch(actions::SetDeploymentNecessary{ gameId, true }, &e))
			{
				return failed("enable mod " + opt.modId, e);
			}
			return 0;
		}

		case Command::RemoveMod:
			return orchestrator.removeMod(gameId, opt.modId, &e) ? 0 : failed("remove mod " + opt.modId, e);

		case Command::Enable:
		case Command::Disable:
		{
			const bool enable = opt.cmd == Command::Enable;
			if (!state.snapshot().findMod(gameId, opt.modId)) return failed("Unknown mod: " + opt.modId);
			if (!state.dispatch(actions::SetModEnabled{ gameId, opt.modId, enable }, &e)
				|| !state.dispatch(actions::SetDeploymentNecessary{ gameId, true }, &e))
			{
				return failed(std::string(enable ? "enable" : "disable") + " mod " + opt.modId, e);
			}
			return 0;
		}

		case Command::SetActivator:
			return orchestrator.setActivator(gameId, opt.activator, &e) ? 0 : failed("set deployment method", e);

		case Command::List:
			printState(std::cout, state.snapshot(), gameId, methods, orchestrator);
			return 0;

		case Command::Help:
		case Command::Invalid:
			break;
		}
		return 2;
	}

};//---namespace moddep
