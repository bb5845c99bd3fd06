#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "Errors.hpp"
#include "Model.hpp"

namespace moddep {

	namespace fs = std::filesystem;

	//---Рабочее состояние одного цикла prepare → activate / deactivate → finalize
	struct DeploymentHandle final {
		fs::path targetDir;
		bool undeployOnly = false;
		NormalizeFn normalize;
		ActivationManifest working;			//	Текущее представление о развёрнутом
		std::vector<fs::path> orphans;		//	Найденные в finalize сироты
	};

	//---Способ развёртывания (жёсткие ссылки / символические ссылки / копирование).
	//   Не хранит состояние между вызовами: всё рабочее состояние живёт в DeploymentHandle
	class IDeploymentMethod {
	public:
		virtual ~IDeploymentMethod() = default;

		virtual const std::string& id() const = 0;
		virtual std::string name() const = 0;

		//---Пустая строка - способ поддерживает тип мода для игры, иначе причина отказа
		virtual std::string unsupportedReason(const GameDeploymentContext& game, const std::string& modType) const = 0;

		//---Загрузка и проверка записей прежнего манифеста по реальной ФС
		virtual bool prepare(const fs::path& targetDir, bool undeployOnly, const ActivationManifest& prior,
			const NormalizeFn& normalize, DeploymentHandle& out, Error* error) const = 0;

		//---Развернуть файлы мода (повторный вызов пересоздаёт ссылки)
		virtual bool activate(DeploymentHandle& handle, const fs::path& installDir, const Mod& mod, Error* error) const = 0;

		//---Удалить ровно то, что этот способ создал для мода
		virtual bool deactivate(DeploymentHandle& handle, const fs::path& installDir, const Mod& mod, Error* error) const = 0;

		//---Свести рабочее состояние в новый манифест, найти и убрать сирот
		virtual bool finalize(DeploymentHandle& handle, const std::string& gameId, const fs::path& installDir,
			ActivationManifest& out, Error* error) const = 0;
	};

	//---Первая причина отказа по всем типам модов игры ("" - поддерживаются все)
	std::string unsupportedReasonForGame(const IDeploymentMethod& method, const GameDeploymentContext& game);

};//---namespace moddep
