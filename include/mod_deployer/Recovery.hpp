#pragma once
#include <chrono>
#include <filesystem>
#include <functional>
#include <system_error>

#include "Backtrace.hpp"
#include "Errors.hpp"

namespace moddep {

	namespace fs = std::filesystem;

	class IRecoveryDialog;
	class IElevatedHelper;

	//---Параметры ограниченных автоматических повторов (без участия пользователя)
	struct RetryOptions final {
		int count = 3;
		std::chrono::milliseconds delay{ 100 };
	};

	//---Примитивная операция: возвращает код ОС (пустой - успех)
	using PrimitiveOp = std::function<std::error_code()>;

	//---Политика восстановления после ошибок ОС.
	//   Занятость и нехватка места → {Cancel, Retry}; нет прав → {Cancel, Retry, Give permission}.
	//   Повторы интерактивного пути не ограничены: выход только по отказу пользователя.
	//   UserCanceled пробрасывается без изменений через все уровни
	class RecoveryPolicy final {
	public:
		//---dialog / elevation могут быть nullptr: тогда интерактивного восстановления нет
		RecoveryPolicy(IRecoveryDialog* dialog, IElevatedHelper* elevation, RetryOptions retry = {});

		//---Выполнить операцию с интерактивным восстановлением
		bool run(const char* op, const fs::path& target, const PrimitiveOp& fn,
			const Backtrace& trace, Error* error) const;

		//---Выполнить операцию с ограниченными повторами (занятость / нет прав) без диалога
		bool runBounded(const char* op, const fs::path& target, const PrimitiveOp& fn,
			const Backtrace& trace, Error* error) const;

		//---Решение после ошибки ОС: true - повторить операцию, false - остановиться (error заполнен)
		bool recover(const std::error_code& ec, const char* op, const fs::path& target,
			const Backtrace& trace, Error* error) const;

		//---Выполнить произвольную операцию; при отказе в доступе спросить пользователя
		//   и при необходимости выдать права через помощника
		bool forcePerm(const std::function<bool(Error*)>& op, Error* error) const;

		//---Нет прав на директорию (ensureDirWritable): {Cancel, Retry, Give permission},
		//   выдача прав - на всю директорию (помощник создаёт её при отсутствии).
		//   true - повторить проверку, false - остановиться (error заполнен)
		bool recoverDirectory(const std::error_code& ec, const fs::path& dir, const Backtrace& trace, Error* error) const;

		const RetryOptions& retryOptions() const { return retry_; }
		bool interactive() const { return dialog_ != nullptr; }

	private:
		enum class Choice { Cancel, Retry, GivePermission };

		Choice askBusy(const fs::path& target) const;
		Choice askDiskFull() const;
		Choice askPermission(const fs::path& target) const;

		//---Выдача прав через помощника: false + error (UserCanceled при отказе в запросе ОС)
		bool elevateGrant(const fs::path& target, bool directory, Error* error) const;

		IRecoveryDialog* dialog_;
		IElevatedHelper* elevation_;
		RetryOptions retry_;
	};

};//---namespace moddep
