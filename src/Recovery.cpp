#include "mod_deployer/Recovery.hpp"
#include "mod_deployer/Dialog.hpp"
#include "mod_deployer/Elevation.hpp"
#include "mod_deployer/Platform.hpp"

#include <sstream>
#include <thread>

#include <glog/logging.h>

namespace moddep {

	namespace {

		//---Список процессов для детализации диалога
		static std::string processList(const std::vector<LockingProcess>& processes)
		{
			std::ostringstream os;
			os << "Please close the following applications and retry:";
			for (const auto& p : processes)
			{
				os << "\n" << p.appName << " (" << p.pid << ")";
			}
			return os.str();
		}

		static Error canceledAt(const fs::path& target, const Backtrace& trace)
		{
			Error e = userCanceled();
			e.path = target;
			e.backtrace = trace;
			return e;
		}

	} // namespace

	RecoveryPolicy::RecoveryPolicy(IRecoveryDialog* dialog, IElevatedHelper* elevation, RetryOptions retry)
		: dialog_(dialog), elevation_(elevation), retry_(retry)
	{
	}
	//------------------------------------------------------------
	//	Файл занят другим процессом
	//------------------------------------------------------------
	RecoveryPolicy::Choice RecoveryPolicy::askBusy(const fs::path& target) const
	{
		DialogRequest req;
		req.title = "File busy";
		req.message = "Need to access \"" + target.string() + "\" but it's open in another application. "
			"Please close the file in all other applications and then retry.";
		req.detail = processList(findLockingProcesses(target));
		req.buttons = { "Cancel", "Retry" };

		return dialog_->choose(req) == 1 ? Choice::Retry : Choice::Cancel;
	}
	//------------------------------------------------------------
	//	Диск заполнен
	//------------------------------------------------------------
	RecoveryPolicy::Choice RecoveryPolicy::askDiskFull() const
	{
		DialogRequest req;
		req.title = "Disk full";
		req.message = "Operation can't continue because the disk is full. "
			"Please free up some space and retry.";
		req.buttons = { "Cancel", "Retry" };

		return dialog_->choose(req) == 1 ? Choice::Retry : Choice::Cancel;
	}
	//------------------------------------------------------------
	//	Нет доступа: файл может быть и заблокирован, и защищён правами
	//------------------------------------------------------------
	RecoveryPolicy::Choice RecoveryPolicy::askPermission(const fs::path& target) const
	{
		const std::vector<LockingProcess> processes = findLockingProcesses(target);

		DialogRequest req;
		req.title = "Access denied";
		req.message = processes.empty()
			? "Need to access \"" + target.string() + "\" but don't have permission to."
			: "Need to access \"" + target.string() + "\" but it either has too restrictive permissions "
			  "or is locked by another process.";
		if (elevation_)
		{
			req.message += " If your account has admin rights the file can be unlocked for you.";
		}
		if (!processes.empty()) req.detail = processList(processes);

		req.buttons = { "Cancel", "Retry" };
		if (elevation_) req.buttons.push_back("Give permission");

		switch (dialog_->choose(req))
		{
		case 1:  return Choice::Retry;
		case 2:  return elevation_ ? Choice::GivePermission : Choice::Cancel;
		default: return Choice::Cancel;
		}
	}
	//------------------------------------------------------------
	//	Выдача прав через помощника. Для несуществующего пути
	//	права выдаются на родительскую директорию
	//------------------------------------------------------------
	bool RecoveryPolicy::elevateGrant(const fs::path& target, bool directory, Error* error) const
	{
		fs::path grantPath = target;
		std::error_code ec;
		if (!directory && !fs::exists(fs::symlink_status(target, ec)))
		{
			grantPath = target.parent_path();
		}

		LOG(INFO) << "requesting elevated access to " << grantPath;
		const ElevationResponse r = elevation_->run(elevated::grantAccess(grantPath, directory));
		switch (r.outcome)
		{
		case ElevationOutcome::Success:
			return true;
		case ElevationOutcome::Declined:
			return fail(error, canceledAt(grantPath, Backtrace()));
		case ElevationOutcome::Error:
			{
				Error e = makeError(ErrorKind::PermissionDenied,
					"failed to acquire permission: OS error " + r.message + " (" + std::to_string(r.code) + ")",
					grantPath);
				e.code = std::error_code(r.code, std::generic_category());
				return fail(error, std::move(e));
			}
		}
		return false;
	}
	//------------------------------------------------------------
	//	Решение после ошибки ОС
	//------------------------------------------------------------
	bool RecoveryPolicy::recover(const std::error_code& ec, const char* op, const fs::path& target,
		const Backtrace& trace, Error* error) const
	{
		const OsErrorClass cls = classify(ec);
		const bool recoverable =
			cls == OsErrorClass::Busy || cls == OsErrorClass::DiskFull || cls == OsErrorClass::Permission;

		if (!recoverable || !dialog_)
		{
			return fail(error, makeOsError(ec, op, target, trace));
		}

		LOG(WARNING) << op << " failed for " << target << ": " << ec.message() << ", asking user";

		Choice choice = Choice::Cancel;
		switch (cls)
		{
		case OsErrorClass::Busy:
			choice = askBusy(target);
			break;
		case OsErrorClass::DiskFull:
			choice = askDiskFull();
			break;
		case OsErrorClass::Permission:
			choice = askPermission(target);
			break;
		case OsErrorClass::None:
		case OsErrorClass::NotFound:
		case OsErrorClass::Exists:
		case OsErrorClass::Other:
			break;
		}

		switch (choice)
		{
		case Choice::Cancel:
			LOG(INFO) << op << " canceled by user for " << target;
			return fail(error, canceledAt(target, trace));
		case Choice::Retry:
			return true;
		case Choice::GivePermission:
			{
				Error grantErr;
				if (elevateGrant(target, false, &grantErr)) return true;
				if (grantErr.kind == ErrorKind::UserCanceled)
				{
					grantErr.backtrace = trace;
					return fail(error, std::move(grantErr));
				}
				//---Ошибка помощника только логируется: наружу уходит исходная ошибка
				LOG(ERROR) << "failed to acquire permission for " << target << ": " << grantErr.message;
				return fail(error, makeOsError(ec, op, target, trace));
			}
		}
		return fail(error, makeOsError(ec, op, target, trace));
	}
	//------------------------------------------------------------
	//	Интерактивный цикл: повтор, пока пользователь не откажется
	//------------------------------------------------------------
	bool RecoveryPolicy::run(const char* op, const fs::path& target, const PrimitiveOp& fn,
		const Backtrace& trace, Error* error) const
	{
		for (;;)
		{
			const std::error_code ec = fn();
			if (!ec) return true;
			if (!recover(ec, op, target, trace, error)) return false;
			VLOG(1) << "retrying " << op << " on " << target;
		}
	}
	//------------------------------------------------------------
	//	Ограниченные повторы с фиксированной задержкой
	//------------------------------------------------------------
	bool RecoveryPolicy::runBounded(const char* op, const fs::path& target, const PrimitiveOp& fn,
		const Backtrace& trace, Error* error) const
	{
		int tries = retry_.count;
		for (;;)
		{
			const std::error_code ec = fn();
			if (!ec) return true;

			const OsErrorClass cls = classify(ec);
			const bool retryable = cls == OsErrorClass::Busy || cls == OsErrorClass::Permission;
			if (retryable && tries > 0)
			{
				--tries;
				VLOG(1) << op << " on " << target << " failed (" << ec.message() << "), "
					<< tries << " retries left";
				std::this_thread::sleep_for(retry_.delay);
				continue;
			}
			if (retryable)
			{
				LOG(WARNING) << op << " on " << target << " failed after " << retry_.count << " retries";
			}
			return fail(error, makeOsError(ec, op, target, trace));
		}
	}
	//------------------------------------------------------------
	//	Повтор произвольной операции при отказе в доступе
	//------------------------------------------------------------
	bool RecoveryPolicy::forcePerm(const std::function<bool(Error*)>& op, Error* error) const
	{
		for (;;)
		{
			Error e;
			if (op(&e)) return true;

			const bool permission = e.kind == ErrorKind::PermissionDenied
				|| classify(e.code) == OsErrorClass::Permission;
			if (!permission || !dialog_) return fail(error, std::move(e));

			DialogRequest req;
			req.title = "Access denied (2)";
			req.message = "Need to access \"" + e.path.string() + "\" but don't have permission to.\n"
				"If your account has admin rights the file can be unlocked for you. "
				"The system will ask for your password.";
			req.buttons = { "Cancel", "Retry" };
			if (elevation_) req.buttons.push_back("Give permission");

			const int choice = dialog_->choose(req);
			if (choice == 1) continue;
			if (choice != 2 || !elevation_) return fail(error, canceledAt(e.path, e.backtrace));

			Error grantErr;
			if (!elevateGrant(e.path, false, &grantErr))
			{
				if (grantErr.kind == ErrorKind::UserCanceled) return fail(error, std::move(grantErr));
				LOG(ERROR) << "failed to acquire permission: " << grantErr.message;
				return fail(error, std::move(e));
			}
		}
	}
	//------------------------------------------------------------
	//	Права на директорию (ensureDirWritable)
	//------------------------------------------------------------
	bool RecoveryPolicy::recoverDirectory(const std::error_code& ec, const fs::path& dir, const Backtrace& trace,
		Error* error) const
	{
		const char* op = "ensureDirWritable";
		if (!dialog_) return fail(error, makeOsError(ec, op, dir, trace));

		LOG(WARNING) << "directory " << dir << " is not writable: " << ec.message() << ", asking user";
		switch (askPermission(dir))
		{
		case Choice::Cancel:
			LOG(INFO) << op << " canceled by user for " << dir;
			return fail(error, canceledAt(dir, trace));
		case Choice::Retry:
			return true;
		case Choice::GivePermission:
			{
				Error grantErr;
				if (elevateGrant(dir, true, &grantErr)) return true;
				if (grantErr.kind == ErrorKind::UserCanceled)
				{
					grantErr.backtrace = trace;
					return fail(error, std::move(grantErr));
				}
				LOG(ERROR) << "failed to acquire permission for " << dir << ": " << grantErr.message;
				return fail(error, makeOsError(ec, op, dir, trace));
			}
		}
		return fail(error, makeOsError(ec, op, dir, trace));
	}

};//---namespace moddep
