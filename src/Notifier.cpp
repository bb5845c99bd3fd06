#include "mod_deployer/Notifier.hpp"

#include <glog/logging.h>

namespace moddep {

	void reportError(INotifier& notifier, const std::string& title, const Error& error)
	{
		switch (error.kind)
		{
		case ErrorKind::UserCanceled:
			LOG(INFO) << title << ": canceled by user";
			return;
		case ErrorKind::TemporaryError:
			LOG(WARNING) << title << ": " << describe(error, false);
			notifier.showError(title, error.message + "\nThis is probably a temporary problem, please try again.", false);
			return;
		case ErrorKind::ProcessCanceled:
			LOG(INFO) << title << ": " << describe(error, false);
			notifier.showError(title, error.message, false);
			return;
		case ErrorKind::TransientIo:
		case ErrorKind::PermissionDenied:
		case ErrorKind::Io:
			LOG(ERROR) << title << ": " << describe(error);
			notifier.showError(title, describe(error, false), allowReport(error));
			return;
		}
	}

};//---namespace moddep
