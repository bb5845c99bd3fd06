#include "mod_deployer/State.hpp"

#include <glog/logging.h>

namespace moddep {

	const GameDescriptor* AppState::findGame(const std::string& gameId) const
	{
		const auto it = games.find(gameId);
		return it == games.end() ? nullptr : &it->second;
	}

	const Mod* AppState::findMod(const std::string& gameId, const std::string& modId) const
	{
		const auto g = mods.find(gameId);
		if (g == mods.end()) return nullptr;
		const auto m = g->second.find(modId);
		return m == g->second.end() ? nullptr : &m->second;
	}

	bool AppState::isEnabled(const std::string& gameId, const std::string& modId) const
	{
		const auto g = enabledMods.find(gameId);
		return g != enabledMods.end() && g->second.count(modId) != 0;
	}

	std::string AppState::activatorFor(const std::string& gameId) const
	{
		const auto it = activators.find(gameId);
		return it == activators.end() ? std::string() : it->second;
	}

	bool AppState::needsDeployment(const std::string& gameId) const
	{
		const auto it = deploymentNecessary.find(gameId);
		return it != deploymentNecessary.end() && it->second;
	}

	namespace {

		struct Reducer final {
			AppState& s;

			void operator()(const actions::SetInstanceId& a) const
			{
				s.instanceId = a.instanceId;
			}
			void operator()(const actions::SetGame& a) const
			{
				s.games[a.game.id] = a.game;
			}
			void operator()(const actions::SetActiveGame& a) const
			{
				s.activeGameId = a.gameId;
			}
			void operator()(const actions::AddMod& a) const
			{
				s.mods[a.gameId][a.mod.id] = a.mod;
			}
			void operator()(const actions::RemoveMod& a) const
			{
				s.mods[a.gameId].erase(a.modId);
				s.enabledMods[a.gameId].erase(a.modId);
			}
			void operator()(const actions::SetModState& a) const
			{
				auto& gameMods = s.mods[a.gameId];
				const auto it = gameMods.find(a.modId);
				if (it != gameMods.end()) it->second.state = a.state;
			}
			void operator()(const actions::SetModEnabled& a) const
			{
				if (a.enabled) s.enabledMods[a.gameId].insert(a.modId);
				else s.enabledMods[a.gameId].erase(a.modId);
			}
			void operator()(const actions::SetActivator& a) const
			{
				if (a.activatorId.empty()) s.activators.erase(a.gameId);
				else s.activators[a.gameId] = a.activatorId;
			}
			void operator()(const actions::SetDeploymentNecessary& a) const
			{
				s.deploymentNecessary[a.gameId] = a.necessary;
			}
		};

	} // namespace

	AppState applyAction(AppState state, const Action& action)
	{
		std::visit(Reducer{ state }, action);
		return state;
	}
	//------------------------------------------------------------
	//	MemoryStateStore
	//------------------------------------------------------------
	MemoryStateStore::MemoryStateStore(AppState initial)
		: state_(std::move(initial))
	{
	}

	AppState MemoryStateStore::snapshot() const
	{
		return state_;
	}

	bool MemoryStateStore::dispatch(const Action& action, Error* error)
	{
		const AppState previous = state_;
		AppState next = applyAction(state_, action);
		if (!persist(next, error)) return false;
		state_ = std::move(next);

		//---Подписчик может вызвать dispatch повторно: работаем с копиями
		const AppState current = state_;
		const auto listeners = listeners_;
		for (const auto& kv : listeners)
		{
			kv.second(previous, current);
		}
		return true;
	}

	int MemoryStateStore::subscribe(StateListener listener)
	{
		const int token = nextToken_++;
		listeners_[token] = std::move(listener);
		return token;
	}

	void MemoryStateStore::unsubscribe(int token)
	{
		listeners_.erase(token);
	}

	bool MemoryStateStore::persist(const AppState& /*state*/, Error* /*error*/)
	{
		return true;
	}

};//---namespace moddep
