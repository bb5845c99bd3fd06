#include "mod_deployer/ConsoleUi.hpp"

#include <istream>
#include <ostream>
#include <stdexcept>

#include <glog/logging.h>

namespace moddep {

	ConsoleDialog::ConsoleDialog(std::istream& in, std::ostream& out)
		: in_(in), out_(out)
	{
	}
	//------------------------------------------------------------
	//	Закрытый ввод (EOF) - диалог закрыт
	//------------------------------------------------------------
	int ConsoleDialog::choose(const DialogRequest& request)
	{
		out_ << "\n== " << request.title << " ==\n" << request.message << "\n";
		if (!request.detail.empty()) out_ << request.detail << "\n";
		if (request.buttons.empty()) return -1;

		for (;;)
		{
			for (std::size_t i = 0; i < request.buttons.size(); ++i)
			{
				out_ << "  [" << i << "] " << request.buttons[i] << "\n";
			}
			out_ << "> " << std::flush;

			std::string line;
			if (!std::getline(in_, line))
			{
				LOG(INFO) << "dialog \"" << request.title << "\" closed (no input)";
				return -1;
			}
			try
			{
				const int choice = std::stoi(line);
				if (choice >= 0 && (std::size_t)choice < request.buttons.size())
				{
					LOG(INFO) << "dialog \"" << request.title << "\": " << request.buttons[(std::size_t)choice];
					return choice;
				}
			}
			catch (const std::exception&)
			{
				VLOG(1) << "not a number: " << line;
			}
			out_ << "Please enter a number between 0 and " << request.buttons.size() - 1 << "\n";
		}
	}

	ConsoleNotifier::ConsoleNotifier(std::ostream& out)
		: out_(out)
	{
	}

	void ConsoleNotifier::showError(const std::string& title, const std::string& message, bool allowReport)
	{
		out_ << "error: " << title << ": " << message << "\n";
		if (allowReport) out_ << "This looks like a bug, please report it together with the log files.\n";
	}

	void ConsoleNotifier::sendActivity(const std::string& id, const std::string& message)
	{
		LOG(INFO) << "[" << id << "] " << message;
		out_ << message << "...\n";
	}

	void ConsoleNotifier::dismiss(const std::string& id)
	{
		VLOG(1) << "[" << id << "] done";
	}

	void ConsoleNotifier::emitEvent(const std::string& name)
	{
		VLOG(1) << "event: " << name;
	}

};//---namespace moddep
