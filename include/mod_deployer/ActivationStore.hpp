#pragma once
#include <filesystem>
#include <string>

#include "Errors.hpp"
#include "Model.hpp"

namespace moddep {

	namespace fs = std::filesystem;

	class FileOps;

	//---Хранилище манифестов развёртывания: один файл на пару (тип мода, целевая директория)
	class ActivationStore final {
	public:
		ActivationStore(const FileOps& files, std::string instanceId);

		//---Отсутствующий или повреждённый манифест - пустой (развёртывание "с нуля").
		//   false только при отказе пользователя (UserCanceled)
		bool load(const std::string& modType, const fs::path& targetDir, const std::string& methodId,
			ActivationManifest& out, Error* error) const;

		//---Атомарная запись: новый файл, затем замена. Пустой манифест удаляет файл
		bool save(const std::string& modType, const std::string& instanceId, const fs::path& targetDir,
			const ActivationManifest& manifest, const std::string& methodId, Error* error) const;

		//---Грубая очистка всех целевых директорий без доверия манифестам:
		//   ссылки в staging, файлы из найденных манифестов, сами манифесты, пустые директории
		bool fallbackPurge(const GameDeploymentContext& context, Error* error) const;

		static fs::path manifestPath(const fs::path& targetDir, const std::string& modType);

		//---Сериализация (используется и для диагностики)
		static std::string encode(const ActivationManifest& manifest);
		static bool decode(const std::string& text, ActivationManifest& out, std::string* error);

	private:
		bool purgeDirectory(const fs::path& targetDir, const fs::path& stagingDir, Error* error) const;

		const FileOps& files_;
		std::string instanceId_;
	};

};//---namespace moddep
