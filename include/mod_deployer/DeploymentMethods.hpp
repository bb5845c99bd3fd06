#pragma once
#include <memory>
#include <string>
#include <vector>

#include "IDeploymentMethod.hpp"

namespace moddep {

	class FileOps;

	//---Зарегистрированные способы развёртывания (в порядке предпочтения)
	class MethodRegistry final {
	public:
		void add(std::unique_ptr<IDeploymentMethod> method);
		//---Снять способ с регистрации (модуль, который его предоставлял, выгружен)
		bool remove(const std::string& id);

		const IDeploymentMethod* find(const std::string& id) const;
		//---Первый способ, поддерживающий все типы модов игры
		const IDeploymentMethod* firstSupporting(const GameDeploymentContext& game) const;

		std::vector<const IDeploymentMethod*> all() const;

	private:
		std::vector<std::unique_ptr<IDeploymentMethod>> methods_;
	};

	//---Встроенные способы: hardlink, symlink, copy
	std::unique_ptr<IDeploymentMethod> makeHardlinkMethod(const FileOps& files);
	std::unique_ptr<IDeploymentMethod> makeSymlinkMethod(const FileOps& files);
	std::unique_ptr<IDeploymentMethod> makeCopyMethod(const FileOps& files);

	void registerBuiltinMethods(MethodRegistry& registry, const FileOps& files);

};//---namespace moddep
