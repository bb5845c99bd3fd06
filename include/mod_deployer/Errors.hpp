#pragma once
#include <filesystem>
#include <string>
#include <system_error>

#include "Backtrace.hpp"

namespace moddep {

	namespace fs = std::filesystem;

	//---Таксономия ошибок, видимая вызывающему коду
	enum class ErrorKind {
		UserCanceled,		// Пользователь отказался от восстановления / подтверждения
		TemporaryError,		// Временное состояние: всю операцию можно повторить
		ProcessCanceled,	// Операция неприменима в текущем состоянии (не баг)
		TransientIo,		// Занятость / нехватка места, повторы исчерпаны
		PermissionDenied,	// Нет прав, восстановление не удалось
		Io					// Любая другая ошибка ОС
	};

	//---Класс системной ошибки для политики восстановления
	enum class OsErrorClass {
		None,
		NotFound,
		Exists,
		Busy,
		DiskFull,
		Permission,
		Other
	};

	//---Ошибка операции: дискриминант + исходный код ОС + логическая точка вызова
	struct Error final {
		ErrorKind kind = ErrorKind::Io;
		std::error_code code;		//	Код ОС (пустой для логических ошибок)
		std::string message;		//	Описание
		fs::path path;				//	Путь, на котором произошла ошибка
		Backtrace backtrace;		//	Стек в точке вызова обёртки
	};

	const char* toString(ErrorKind kind);

	//---Классификация кода ОС
	OsErrorClass classify(const std::error_code& ec);

	//---Ошибку стоит показывать с предложением отправить отчёт?
	bool allowReport(const Error& e);

	//---Полное текстовое описание (backtrace материализуется только здесь)
	std::string describe(const Error& e, bool withBacktrace = true);

	//---Конструкторы ошибок
	Error makeError(ErrorKind kind, std::string message, fs::path path = {});
	Error makeOsError(const std::error_code& ec, const char* op, const fs::path& path, const Backtrace& trace);

	inline Error userCanceled() { return makeError(ErrorKind::UserCanceled, "canceled by user"); }

	//---Заполнение out-параметра и возврат false (error может быть nullptr)
	inline bool fail(Error* error, Error e)
	{
		if (error) *error = std::move(e);
		return false;
	}

};//---namespace moddep
