#if defined(__linux__)
#include "platform/PlatformImpl.hpp"

#include <cstdlib>
#include <execinfo.h>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace moddep::platform {

	//---Получение пути к собственному исполняемому файлу
	fs::path selfExePath()
	{
		std::vector<char> buf(4096, '\0');
		ssize_t n = ::readlink("/proc/self/exe", buf.data(), buf.size() - 1);
		if (n <= 0) return {};
		buf[(size_t)n] = '\0';
		return fs::path(buf.data());
	}
	//---Проверка, что процесс запущен с правами root
	bool isElevated()
	{
		return ::geteuid() == 0;
	}

	UserIdentity currentUser()
	{
		UserIdentity u;
		u.uid = (std::uint32_t)::getuid();
		u.gid = (std::uint32_t)::getgid();
		return u;
	}

	//---Имя процесса из /proc/<pid>/comm
	static std::string processName(const fs::path& procDir)
	{
		std::ifstream f(procDir / "comm");
		std::string name;
		std::getline(f, name);
		return name;
	}

	//---Перебор /proc/<pid>/fd: ищем дескрипторы, указывающие на путь
	std::vector<LockingProcess> findLockingProcesses(const fs::path& path)
	{
		std::vector<LockingProcess> result;

		std::error_code ec;
		const fs::path wanted = fs::weakly_canonical(path, ec);
		if (ec) return result;

		fs::directory_iterator procIt("/proc", fs::directory_options::skip_permission_denied, ec);
		if (ec) return result;

		for (const auto& entry : procIt)
		{
			const std::string pidStr = entry.path().filename().string();
			if (pidStr.empty() || pidStr.find_first_not_of("0123456789") != std::string::npos) continue;

			std::error_code fdEc;
			fs::directory_iterator fdIt(entry.path() / "fd", fs::directory_options::skip_permission_denied, fdEc);
			if (fdEc) continue;

			for (const auto& fd : fdIt)
			{
				std::error_code linkEc;
				const fs::path target = fs::read_symlink(fd.path(), linkEc);
				if (linkEc || target != wanted) continue;

				LockingProcess p;
				p.pid = std::atoi(pidStr.c_str());
				p.appName = processName(entry.path());
				result.push_back(std::move(p));
				break;
			}
		}
		return result;
	}

	bool fileId(const fs::path& path, FileId& out, std::error_code& ec)
	{
		struct stat st{};
		if (::lstat(path.c_str(), &st) != 0)
		{
			ec = std::error_code(errno, std::generic_category());
			return false;
		}
		ec.clear();
		out.device = (std::uint64_t)st.st_dev;
		out.inode = (std::uint64_t)st.st_ino;
		return true;
	}

	std::vector<void*> captureFrames(int skip)
	{
		//---Только адреса: backtrace() не выполняет символизацию
		void* buf[64];
		const int n = ::backtrace(buf, 64);
		std::vector<void*> frames;
		for (int i = skip; i < n; ++i) frames.push_back(buf[i]);
		return frames;
	}

	std::string symbolizeFrames(const std::vector<void*>& frames)
	{
		if (frames.empty()) return {};

		char** symbols = ::backtrace_symbols(const_cast<void* const*>(frames.data()), (int)frames.size());
		if (!symbols) return {};

		std::ostringstream os;
		for (std::size_t i = 0; i < frames.size(); ++i)
		{
			os << "    at " << symbols[i] << "\n";
		}
		std::free(symbols);
		return os.str();
	}

	bool grantAccess(const fs::path& path, const UserIdentity& user, std::error_code& ec)
	{
		if (::chown(path.c_str(), (uid_t)user.uid, (gid_t)user.gid) != 0)
		{
			ec = std::error_code(errno, std::generic_category());
			return false;
		}
		//---Владельцу добавляем rwx, остальные биты не трогаем
		fs::permissions(path, fs::perms::owner_all, fs::perm_options::add, ec);
		return !ec;
	}

	fs::path runtimeDir()
	{
		if (const char* xdg = std::getenv("XDG_RUNTIME_DIR"))
		{
			std::error_code ec;
			if (xdg[0] != '\0' && fs::is_directory(xdg, ec)) return fs::path(xdg);
		}
		std::error_code ec;
		const fs::path tmp = fs::temp_directory_path(ec);
		return ec ? fs::path("/tmp") : tmp;
	}

} // namespace moddep::platform
#endif
