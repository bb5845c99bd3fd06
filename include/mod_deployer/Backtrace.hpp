#pragma once
#include <memory>
#include <string>
#include <vector>

namespace moddep {

	//---Снимок стека в точке вызова файловой операции.
	//   capture() сохраняет только адреса кадров; символизация выполняется
	//   лениво в render() и только если ошибка действительно дошла до вывода
	class Backtrace final {
	public:
		Backtrace() = default;

		//---Захват текущего стека (skip - число верхних кадров, которые отбрасываются)
		static Backtrace capture(int skip = 1);

		bool empty() const { return frames_.empty(); }
		std::size_t depth() const { return frames_.size(); }

		//---Материализация трассировки. Результат кэшируется в общем слоте,
		//   который capture() создаёт заранее: его видят все копии снимка
		const std::string& render() const;

	private:
		struct Rendered final {
			bool done = false;
			std::string text;
		};

		std::vector<void*> frames_;
		mutable std::shared_ptr<Rendered> rendered_;
	};

};//---namespace moddep
