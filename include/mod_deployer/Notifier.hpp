#pragma once
#include <string>

#include "Errors.hpp"

namespace moddep {

	//---Поверхность уведомлений для UI
	class INotifier {
	public:
		virtual ~INotifier() = default;

		//---allowReport: ошибка похожа на баг и её стоит отправить разработчикам
		virtual void showError(const std::string& title, const std::string& message, bool allowReport) = 0;
		//---Долгая операция: показать / убрать индикатор
		virtual void sendActivity(const std::string& id, const std::string& message) = 0;
		virtual void dismiss(const std::string& id) = 0;
		//---Событие для подписчиков UI ("mods-refreshed", ...)
		virtual void emitEvent(const std::string& name) = 0;
	};

	constexpr const char* kEventModsRefreshed = "mods-refreshed";

	//---Показ ошибки с уровнем, зависящим от её вида (UserCanceled не показывается)
	void reportError(INotifier& notifier, const std::string& title, const Error& error);

};//---namespace moddep
