#pragma once
#include <string>
#include <vector>

namespace moddep {

	//---Запрос к пользователю: заголовок, сообщение, детали и упорядоченные кнопки
	struct DialogRequest final {
		std::string title;
		std::string message;
		std::string detail;					//	Опционально (например, список процессов)
		std::vector<std::string> buttons;	//	Индекс 0 всегда "Cancel"/отказ
	};

	//---Интерфейс диалога восстановления / подтверждения
	class IRecoveryDialog {
	public:
		virtual ~IRecoveryDialog() = default;

		//---Возвращает индекс выбранной кнопки, отрицательное значение - диалог закрыт
		virtual int choose(const DialogRequest& request) = 0;
	};

};//---namespace moddep
