#pragma once
#include <filesystem>
#include <map>
#include <memory>
#include <string>

namespace moddep {

	namespace fs = std::filesystem;

	//---Итог вызова привилегированного помощника
	enum class ElevationOutcome {
		Success,	// Функция выполнена
		Declined,	// Пользователь отклонил запрос прав на уровне ОС
		Error		// Любая другая ошибка (код и сообщение в ответе)
	};

	//---Запрос: имя функции помощника + параметры
	struct ElevationRequest final {
		std::string function;
		std::map<std::string, std::string> params;
	};

	struct ElevationResponse final {
		ElevationOutcome outcome = ElevationOutcome::Error;
		int code = 0;
		std::string message;
	};

	//---Интерфейс привилегированного помощника (транспорт скрыт за ним)
	class IElevatedHelper {
	public:
		virtual ~IElevatedHelper() = default;

		//---Блокирует вызывающего до завершения / отключения / ошибки помощника
		virtual ElevationResponse run(const ElevationRequest& request) = 0;
	};

	//---Параметры запуска внешнего помощника
	struct ElevationOptions final {
		fs::path helperExe;						//	mod-deployer-elevate
		fs::path launcher = "/usr/bin/pkexec";	//	Запрос прав ОС; пустой - запуск напрямую
	};

	//---Помощник, работающий в отдельном процессе через локальный канал
	std::unique_ptr<IElevatedHelper> makeElevatedHelper(const ElevationOptions& options);

	//---Функции, доступные помощнику
	namespace elevated {

		inline constexpr const char* kGrantAccess = "grant-access";
		inline constexpr const char* kEnsureDirAccess = "ensure-dir-access";

		//---Запрос на выдачу текущему пользователю rwx на путь
		ElevationRequest grantAccess(const fs::path& path, bool directory);

		//---Сериализация для канала (YAML-документ)
		std::string encodeRequest(const ElevationRequest& request);
		bool decodeRequest(const std::string& text, ElevationRequest& out, std::string* error);
		std::string encodeResponse(const ElevationResponse& response);
		bool decodeResponse(const std::string& text, ElevationResponse& out, std::string* error);

		//---Выполнение запроса на стороне помощника (уже с повышенными правами)
		ElevationResponse execute(const ElevationRequest& request);

	} // namespace elevated

};//---namespace moddep
