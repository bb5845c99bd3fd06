#include "mod_deployer/Logging.hpp"

#include <system_error>

#include <glog/logging.h>

namespace moddep {

	namespace fs = std::filesystem;

	//---Инициализация логгера
	void initLogging(const char* programName, const fs::path& logDir) {

		//---Создание директории для логов
		std::error_code ec;
		if (!logDir.empty()) fs::create_directories(logDir, ec);

		google::SetLogFilenameExtension(".txt"); // Расширение
		if (!logDir.empty() && !ec)
		{
			google::SetLogDestination(google::GLOG_INFO, (logDir / "info").string().c_str()); // Путь и название логов для ошибок, предупреждений и информации
			google::SetLogDestination(google::GLOG_WARNING, (logDir / "warning").string().c_str());
			google::SetLogDestination(google::GLOG_ERROR, (logDir / "error").string().c_str());
			google::SetLogDestination(google::GLOG_FATAL, (logDir / "fatal").string().c_str());
		}
		google::InitGoogleLogging(programName); // Инициализация

		//---Настройка вывода в консоль
		FLAGS_alsologtostderr = true;
		FLAGS_colorlogtostderr = true;

		if (ec) LOG(WARNING) << "can't create log directory " << logDir << ": " << ec.message();
	}

	void initHelperLogging(const char* programName) {
		google::InitGoogleLogging(programName);
		FLAGS_logtostderr = true;
	}

};//---namespace moddep
