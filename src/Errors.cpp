#include "mod_deployer/Errors.hpp"

#include <cerrno>
#include <sstream>

namespace moddep {

	//------------------------------------------------------------
	//	Имя вида ошибки для логов
	//------------------------------------------------------------
	const char* toString(ErrorKind kind)
	{
		switch (kind)
		{
		case ErrorKind::UserCanceled:		return "UserCanceled";
		case ErrorKind::TemporaryError:		return "TemporaryError";
		case ErrorKind::ProcessCanceled:	return "ProcessCanceled";
		case ErrorKind::TransientIo:		return "TransientIo";
		case ErrorKind::PermissionDenied:	return "PermissionDenied";
		case ErrorKind::Io:					return "Io";
		}
		return "Io";
	}
	//------------------------------------------------------------
	//	Классификация кода ОС
	//------------------------------------------------------------
	OsErrorClass classify(const std::error_code& ec)
	{
		if (!ec) return OsErrorClass::None;

		//---Коды std::filesystem приходят в generic/system категориях, сравниваем по errno
		const std::error_condition cond = ec.default_error_condition();
		if (cond.category() != std::generic_category()) return OsErrorClass::Other;

		switch (cond.value())
		{
		case ENOENT:
			return OsErrorClass::NotFound;
		case EEXIST:
			return OsErrorClass::Exists;
		case EBUSY:
		case ETXTBSY:
			return OsErrorClass::Busy;
		case ENOSPC:
#ifdef EDQUOT
		case EDQUOT:
#endif
			return OsErrorClass::DiskFull;
		case EACCES:
		case EPERM:
			return OsErrorClass::Permission;
		default:
			return OsErrorClass::Other;
		}
	}
	//------------------------------------------------------------
	//	Уровень уведомления: отчёт об ошибке предлагается только
	//	для непредвиденных ситуаций
	//------------------------------------------------------------
	bool allowReport(const Error& e)
	{
		switch (e.kind)
		{
		case ErrorKind::UserCanceled:
		case ErrorKind::TemporaryError:
		case ErrorKind::ProcessCanceled:
			return false;
		case ErrorKind::TransientIo:
		case ErrorKind::PermissionDenied:
		case ErrorKind::Io:
			//---"Не найдено" - как правило следствие действий пользователя
			return classify(e.code) != OsErrorClass::NotFound;
		}
		return true;
	}
	//------------------------------------------------------------
	//	Полное описание ошибки
	//------------------------------------------------------------
	std::string describe(const Error& e, bool withBacktrace)
	{
		std::ostringstream os;
		os << toString(e.kind) << ": " << e.message;
		if (e.code)
		{
			os << " (" << e.code.message() << ", code " << e.code.value() << ")";
		}
		if (withBacktrace && !e.backtrace.empty())
		{
			os << "\n" << e.backtrace.render();
		}
		return os.str();
	}

	Error makeError(ErrorKind kind, std::string message, fs::path path)
	{
		Error e;
		e.kind = kind;
		e.message = std::move(message);
		e.path = std::move(path);
		return e;
	}
	//------------------------------------------------------------
	//	Ошибка ОС с привязкой к логической точке вызова
	//------------------------------------------------------------
	Error makeOsError(const std::error_code& ec, const char* op, const fs::path& path, const Backtrace& trace)
	{
		Error e;
		switch (classify(ec))
		{
		case OsErrorClass::Busy:
		case OsErrorClass::DiskFull:
			e.kind = ErrorKind::TransientIo;
			break;
		case OsErrorClass::Permission:
			e.kind = ErrorKind::PermissionDenied;
			break;
		case OsErrorClass::None:
		case OsErrorClass::NotFound:
		case OsErrorClass::Exists:
		case OsErrorClass::Other:
			e.kind = ErrorKind::Io;
			break;
		}
		e.code = ec;
		e.path = path;
		e.message = std::string(op) + " failed for '" + path.string() + "'";
		e.backtrace = trace;
		return e;
	}

};//---namespace moddep
