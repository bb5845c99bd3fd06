#include "mod_deployer/DeploymentMethods.hpp"

#include <algorithm>

#include <glog/logging.h>

namespace moddep {

	void MethodRegistry::add(std::unique_ptr<IDeploymentMethod> method)
	{
		if (!method) return;
		if (find(method->id()))
		{
			LOG(WARNING) << "deployment method \"" << method->id() << "\" is already registered";
			return;
		}
		VLOG(1) << "registered deployment method \"" << method->id() << "\"";
		methods_.push_back(std::move(method));
	}

	bool MethodRegistry::remove(const std::string& id)
	{
		const auto it = std::find_if(methods_.begin(), methods_.end(),
			[&](const std::unique_ptr<IDeploymentMethod>& m) { return m->id() == id; });
		if (it == methods_.end()) return false;
		methods_.erase(it);
		return true;
	}

	const IDeploymentMethod* MethodRegistry::find(const std::string& id) const
	{
		for (const auto& m : methods_)
		{
			if (m->id() == id) return m.get();
		}
		return nullptr;
	}

	const IDeploymentMethod* MethodRegistry::firstSupporting(const GameDeploymentContext& game) const
	{
		for (const auto& m : methods_)
		{
			const std::string reason = unsupportedReasonForGame(*m, game);
			if (reason.empty()) return m.get();
			VLOG(1) << "\"" << m->id() << "\" not usable for " << game.gameId << ": " << reason;
		}
		return nullptr;
	}

	std::vector<const IDeploymentMethod*> MethodRegistry::all() const
	{
		std::vector<const IDeploymentMethod*> out;
		out.reserve(methods_.size());
		for (const auto& m : methods_) out.push_back(m.get());
		return out;
	}

	void registerBuiltinMethods(MethodRegistry& registry, const FileOps& files)
	{
		registry.add(makeHardlinkMethod(files));
		registry.add(makeSymlinkMethod(files));
		registry.add(makeCopyMethod(files));
	}

};//---namespace moddep
