#include "mod_deployer/FileOps.hpp"

#include <cerrno>
#include <fstream>
#include <iterator>

#include <glog/logging.h>

namespace moddep {

	namespace {

		//---Ошибка потока: errno, если он установлен, иначе EIO
		static std::error_code streamError()
		{
			return std::error_code(errno != 0 ? errno : EIO, std::generic_category());
		}

		//---"Не найдено" для операций удаления - не ошибка
		static std::error_code ignoreNotFound(std::error_code ec)
		{
			if (classify(ec) == OsErrorClass::NotFound) ec.clear();
			return ec;
		}

		static std::string idString(const FileId& id)
		{
			return std::to_string(id.device) + ":" + std::to_string(id.inode);
		}

	} // namespace

	FileOps::FileOps(const RecoveryPolicy& recovery, CopyOptions copyDefaults)
		: recovery_(recovery), copyDefaults_(copyDefaults)
	{
	}

	bool FileOps::stat(const fs::path& path, fs::file_status& out, Error* error) const
	{
		const Backtrace trace = Backtrace::capture();
		return recovery_.run("stat", path, [&]() {
			std::error_code ec;
			out = fs::status(path, ec);
			return ec;
		}, trace, error);
	}

	bool FileOps::lstat(const fs::path& path, fs::file_status& out, Error* error) const
	{
		const Backtrace trace = Backtrace::capture();
		return recovery_.run("lstat", path, [&]() {
			std::error_code ec;
			out = fs::symlink_status(path, ec);
			return ec;
		}, trace, error);
	}

	bool FileOps::exists(const fs::path& path) const
	{
		std::error_code ec;
		return fs::exists(fs::symlink_status(path, ec));
	}

	bool FileOps::isDirectory(const fs::path& path) const
	{
		std::error_code ec;
		return fs::is_directory(path, ec);
	}

	bool FileOps::identity(const fs::path& path, FileId& out, Error* error) const
	{
		const Backtrace trace = Backtrace::capture();
		return recovery_.run("stat", path, [&]() {
			std::error_code ec;
			fileId(path, out, ec);
			return ec;
		}, trace, error);
	}

	bool FileOps::readDir(const fs::path& dir, std::vector<fs::path>& out, Error* error) const
	{
		const Backtrace trace = Backtrace::capture();
		return recovery_.run("readdir", dir, [&]() {
			out.clear();
			std::error_code ec;
			for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
			{
				out.push_back(it->path());
			}
			return ec;
		}, trace, error);
	}

	bool FileOps::walkFiles(const fs::path& dir, std::vector<fs::path>& out, Error* error) const
	{
		const Backtrace trace = Backtrace::capture();
		return recovery_.run("readdir", dir, [&]() {
			out.clear();
			std::error_code ec;
			for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
			{
				std::error_code typeEc;
				if (it->is_directory(typeEc) && !it->is_symlink(typeEc)) continue;
				out.push_back(it->path().lexically_relative(dir));
			}
			return ec;
		}, trace, error);
	}

	bool FileOps::readFile(const fs::path& path, std::string& out, Error* error) const
	{
		const Backtrace trace = Backtrace::capture();
		return recovery_.run("read", path, [&]() {
			errno = 0;
			std::ifstream f(path, std::ios::binary);
			if (!f) return streamError();
			out.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
			if (f.bad()) return streamError();
			return std::error_code();
		}, trace, error);
	}

	bool FileOps::writeFile(const fs::path& path, const std::string& data, Error* error) const
	{
		const Backtrace trace = Backtrace::capture();
		return recovery_.run("write", path, [&]() {
			errno = 0;
			std::ofstream f(path, std::ios::binary | std::ios::trunc);
			if (!f) return streamError();
			f.write(data.data(), (std::streamsize)data.size());
			f.flush();
			if (!f) return streamError();
			return std::error_code();
		}, trace, error);
	}

	bool FileOps::readLink(const fs::path& path, fs::path& out, Error* error) const
	{
		const Backtrace trace = Backtrace::capture();
		return recovery_.run("readlink", path, [&]() {
			std::error_code ec;
			out = fs::read_symlink(path, ec);
			return ec;
		}, trace, error);
	}
	//------------------------------------------------------------
	//	Копирование. Стандартное копирование поверх самого себя
	//	(жёсткая ссылка, регистронезависимая ФС) обрезает данные,
	//	поэтому сначала сравниваем идентичность файлов.
	//	Файл копируется во временный рядом с приёмником и затем
	//	переименовывается поверх него
	//------------------------------------------------------------
	bool FileOps::copy(const fs::path& src, const fs::path& dest, const CopyOptions& options, Error* error) const
	{
		const Backtrace trace = Backtrace::capture();

		if (options.selfCopyCheck)
		{
			std::error_code ec;
			if (fs::exists(dest, ec) && fs::equivalent(src, dest, ec) && !ec)
			{
				FileId id;
				std::error_code idEc;
				fileId(src, id, idEc);
				Error e = makeError(ErrorKind::Io,
					"Source \"" + src.string() + "\" and destination \"" + dest.string()
					+ "\" are the same file (id \"" + idString(id) + "\").", dest);
				e.backtrace = trace;
				return fail(error, std::move(e));
			}
		}

		std::error_code typeEc;
		if (fs::is_directory(src, typeEc))
		{
			return recovery_.run("copy", dest, [&]() {
				std::error_code ec;
				fs::copy(src, dest, fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
				return ec;
			}, trace, error);
		}

		const fs::path tmp = dest.parent_path() / (dest.filename().string() + ".tmp_copy");
		if (!recovery_.run("copy", dest, [&]() {
				std::error_code ec;
				fs::copy_file(src, tmp, fs::copy_options::overwrite_existing, ec);
				return ec;
			}, trace, error))
		{
			std::error_code ignored;
			fs::remove(tmp, ignored);
			return false;
		}
		if (!recovery_.run("rename", dest, [&]() {
				std::error_code ec;
				fs::rename(tmp, dest, ec);
				return ec;
			}, trace, error))
		{
			std::error_code ignored;
			fs::remove(tmp, ignored);
			return false;
		}
		return true;
	}
	//------------------------------------------------------------
	//	Перемещение: rename, при EXDEV - копирование + удаление
	//------------------------------------------------------------
	bool FileOps::move(const fs::path& src, const fs::path& dest, Error* error) const
	{
		const Backtrace trace = Backtrace::capture();

		bool crossDevice = false;
		const bool ok = recovery_.run("move", dest, [&]() {
			std::error_code ec;
			fs::rename(src, dest, ec);
			if (ec == std::errc::cross_device_link)
			{
				crossDevice = true;
				ec.clear();
			}
			return ec;
		}, trace, error);
		if (!ok) return false;
		if (!crossDevice) return true;

		VLOG(1) << "move across devices: " << src << " -> " << dest;
		if (!copy(src, dest, copyDefaults_, error)) return false;
		return remove(src, error);
	}
	//------------------------------------------------------------
	//	Переименование. Отказ в доступе, когда приёмник - директория,
	//	повтором не исправить: ошибка уходит сразу
	//------------------------------------------------------------
	bool FileOps::rename(const fs::path& src, const fs::path& dest, Error* error) const
	{
		const Backtrace trace = Backtrace::capture();
		for (;;)
		{
			std::error_code ec;
			fs::rename(src, dest, ec);
			if (!ec) return true;

			if (classify(ec) == OsErrorClass::Permission)
			{
				std::error_code statEc;
				if (fs::is_directory(dest, statEc))
				{
					return fail(error, makeOsError(ec, "rename", dest, trace));
				}
			}
			if (!recovery_.recover(ec, "rename", dest, trace, error)) return false;
		}
	}

	bool FileOps::remove(const fs::path& path, Error* error) const
	{
		const Backtrace trace = Backtrace::capture();
		return recovery_.run("remove", path, [&]() {
			std::error_code ec;
			fs::remove_all(path, ec);
			return ignoreNotFound(ec);
		}, trace, error);
	}

	bool FileOps::unlink(const fs::path& path, Error* error) const
	{
		const Backtrace trace = Backtrace::capture();
		return recovery_.run("unlink", path, [&]() {
			std::error_code ec;
			const fs::file_status st = fs::symlink_status(path, ec);
			if (ec) return ignoreNotFound(ec);
			if (fs::is_directory(st)) return std::make_error_code(std::errc::is_a_directory);
			fs::remove(path, ec);
			return ignoreNotFound(ec);
		}, trace, error);
	}

	bool FileOps::rmdir(const fs::path& path, Error* error) const
	{
		const Backtrace trace = Backtrace::capture();
		return recovery_.runBounded("rmdir", path, [&]() {
			std::error_code ec;
			const fs::file_status st = fs::symlink_status(path, ec);
			if (ec) return ignoreNotFound(ec);
			if (!fs::is_directory(st)) return std::make_error_code(std::errc::not_a_directory);
			fs::remove(path, ec);
			return ignoreNotFound(ec);
		}, trace, error);
	}

	bool FileOps::ensureDir(const fs::path& dir, Error* error) const
	{
		const Backtrace trace = Backtrace::capture();
		return recovery_.run("mkdir", dir, [&]() {
			std::error_code ec;
			fs::create_directories(dir, ec);
			//---На некоторых ФС create_directories сообщает EEXIST для существующей директории
			if (classify(ec) == OsErrorClass::Exists && fs::is_directory(dir)) ec.clear();
			return ec;
		}, trace, error);
	}

	bool FileOps::chmod(const fs::path& path, fs::perms perms, Error* error) const
	{
		const Backtrace trace = Backtrace::capture();
		return recovery_.run("chmod", path, [&]() {
			std::error_code ec;
			fs::permissions(path, perms, fs::perm_options::replace, ec);
			return ec;
		}, trace, error);
	}

	bool FileOps::link(const fs::path& existing, const fs::path& linkPath, Error* error) const
	{
		const Backtrace trace = Backtrace::capture();
		return recovery_.run("link", linkPath, [&]() {
			std::error_code ec;
			fs::create_hard_link(existing, linkPath, ec);
			return ec;
		}, trace, error);
	}

	bool FileOps::symlink(const fs::path& target, const fs::path& linkPath, Error* error) const
	{
		const Backtrace trace = Backtrace::capture();
		return recovery_.run("symlink", linkPath, [&]() {
			std::error_code ec;
			fs::create_symlink(target, linkPath, ec);
			return ec;
		}, trace, error);
	}
	//------------------------------------------------------------
	//	Проверка записи: директория + канареечный файл.
	//	При отказе в доступе - диалог, права выдаются на всю директорию
	//------------------------------------------------------------
	bool FileOps::ensureDirWritable(const fs::path& dir, Error* error) const
	{
		const Backtrace trace = Backtrace::capture();
		const fs::path canary = dir / kCanaryName;

		auto probe = [&]() {
			std::error_code ec;
			fs::create_directories(dir, ec);
			if (ec && !(classify(ec) == OsErrorClass::Exists && fs::is_directory(dir))) return ec;

			errno = 0;
			{
				std::ofstream f(canary, std::ios::binary | std::ios::trunc);
				if (!f) return streamError();
			}
			ec.clear();
			fs::remove(canary, ec);
			return ec;
		};

		for (;;)
		{
			const std::error_code ec = probe();
			if (!ec) return true;

			if (classify(ec) != OsErrorClass::Permission)
			{
				return fail(error, makeOsError(ec, "ensureDirWritable", dir, trace));
			}
			if (!recovery_.recoverDirectory(ec, dir, trace, error)) return false;
			VLOG(1) << "retrying ensureDirWritable on " << dir;
		}
	}

};//---namespace moddep
