#pragma once
#include <filesystem>
#include <string>

#include "mod_deployer/Process.hpp"

namespace moddep::platform {

	namespace fs = std::filesystem;

	//---Локальный канал между процессом и привилегированным помощником.
	//   Серверная сторона создаётся на время одного вызова и удаляется в деструкторе
	class LocalChannel final {
	public:
		LocalChannel() = default;
		~LocalChannel();

		LocalChannel(const LocalChannel&) = delete;
		LocalChannel& operator=(const LocalChannel&) = delete;
		LocalChannel(LocalChannel&& other) noexcept;
		LocalChannel& operator=(LocalChannel&& other) noexcept;

		//---Результат ожидания подключения помощника
		enum class WaitResult {
			Connected,		// Помощник подключился
			ChildExited,	// Помощник завершился, не подключившись
			Failed			// Ошибка канала
		};

		//---Серверная сторона: создать уникальный сокет <dir>/<name> с правами 0600
		bool listen(const fs::path& dir, const std::string& name, std::string* error);

		//---Ожидание подключения, параллельно отслеживая завершение процесса pid
		WaitResult waitForPeer(int pid, process::ExitStatus& exit, std::string* error);

		//---Клиентская сторона (помощник)
		static bool connect(const fs::path& endpoint, LocalChannel& out, std::string* error);

		//---Отправить документ целиком и закрыть сторону записи
		bool sendAll(const std::string& data, std::string* error);

		//---Прочитать всё до закрытия стороны записи собеседником
		bool receiveAll(std::string& out, std::string* error);

		const fs::path& endpoint() const { return endpoint_; }
		void close();

	private:
		int listenFd_ = -1;
		int connFd_ = -1;
		fs::path endpoint_;
		bool owner_ = false;
	};

} // namespace moddep::platform
