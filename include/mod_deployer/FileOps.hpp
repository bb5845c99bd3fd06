#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "Errors.hpp"
#include "Platform.hpp"
#include "Recovery.hpp"

namespace moddep {

	namespace fs = std::filesystem;

	struct CopyOptions final {
		bool selfCopyCheck = true;	//	Проверять, что источник и приёмник - не один и тот же файл
	};

	//---Устойчивые файловые операции.
	//   Каждый вызов захватывает backtrace точки вызова; ошибки ОС проходят через RecoveryPolicy.
	//   Удаление отсутствующего пути (remove / unlink / rmdir) - успех
	class FileOps final {
	public:
		explicit FileOps(const RecoveryPolicy& recovery, CopyOptions copyDefaults = {});

		//---Чтение метаданных
		bool stat(const fs::path& path, fs::file_status& out, Error* error) const;
		bool lstat(const fs::path& path, fs::file_status& out, Error* error) const;
		bool exists(const fs::path& path) const;
		bool isDirectory(const fs::path& path) const;
		bool identity(const fs::path& path, FileId& out, Error* error) const;

		//---Содержимое директорий
		bool readDir(const fs::path& dir, std::vector<fs::path>& out, Error* error) const;
		//---Рекурсивный список файлов (не директорий) относительно dir
		bool walkFiles(const fs::path& dir, std::vector<fs::path>& out, Error* error) const;

		//---Содержимое файлов
		bool readFile(const fs::path& path, std::string& out, Error* error) const;
		bool writeFile(const fs::path& path, const std::string& data, Error* error) const;
		bool readLink(const fs::path& path, fs::path& out, Error* error) const;

		//---Копирование / перемещение
		bool copy(const fs::path& src, const fs::path& dest, const CopyOptions& options, Error* error) const;
		bool copy(const fs::path& src, const fs::path& dest, Error* error) const { return copy(src, dest, copyDefaults_, error); }
		bool move(const fs::path& src, const fs::path& dest, Error* error) const;
		bool rename(const fs::path& src, const fs::path& dest, Error* error) const;

		//---Удаление (идемпотентное)
		bool remove(const fs::path& path, Error* error) const;
		bool unlink(const fs::path& path, Error* error) const;
		bool rmdir(const fs::path& path, Error* error) const;

		//---Создание
		bool ensureDir(const fs::path& dir, Error* error) const;
		bool chmod(const fs::path& path, fs::perms perms, Error* error) const;
		bool link(const fs::path& existing, const fs::path& linkPath, Error* error) const;
		bool symlink(const fs::path& target, const fs::path& linkPath, Error* error) const;

		//---Создать директорию при отсутствии и проверить запись канареечным файлом
		bool ensureDirWritable(const fs::path& dir, Error* error) const;

		const RecoveryPolicy& recovery() const { return recovery_; }

		static constexpr const char* kCanaryName = "__mod_deployer_canary";

	private:
		const RecoveryPolicy& recovery_;
		CopyOptions copyDefaults_;
	};

};//---namespace moddep
