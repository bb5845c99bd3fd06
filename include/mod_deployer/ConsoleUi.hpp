#pragma once
#include <iosfwd>
#include <string>

#include "Dialog.hpp"
#include "Notifier.hpp"

namespace moddep {

	//---Диалог восстановления в терминале: вопрос в out, номер кнопки из in
	class ConsoleDialog final : public IRecoveryDialog {
	public:
		ConsoleDialog(std::istream& in, std::ostream& out);

		int choose(const DialogRequest& request) override;

	private:
		std::istream& in_;
		std::ostream& out_;
	};

	//---Уведомления в лог и в терминал
	class ConsoleNotifier final : public INotifier {
	public:
		explicit ConsoleNotifier(std::ostream& out);

		void showError(const std::string& title, const std::string& message, bool allowReport) override;
		void sendActivity(const std::string& id, const std::string& message) override;
		void dismiss(const std::string& id) override;
		void emitEvent(const std::string& name) override;

	private:
		std::ostream& out_;
	};

};//---namespace moddep
