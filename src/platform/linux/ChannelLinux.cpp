#if defined(__linux__)

#include "platform/ChannelImpl.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

namespace moddep::platform {

    namespace {

        //---Интервал опроса завершения помощника, пока пользователь отвечает на запрос прав
        constexpr int kPollIntervalMs = 200;

        static std::string errnoMessage(const char* what)
        {
            return std::string(what) + ": " + std::strerror(errno);
        }

        static bool fillAddress(const fs::path& endpoint, sockaddr_un& addr, std::string* error)
        {
            std::memset(&addr, 0, sizeof(addr));
            addr.sun_family = AF_UNIX;

            const std::string s = endpoint.string();
            if (s.size() >= sizeof(addr.sun_path))
            {
                if (error) *error = "channel path too long: " + s;
                return false;
            }
            std::memcpy(addr.sun_path, s.c_str(), s.size() + 1);
            return true;
        }

    } // namespace

    LocalChannel::~LocalChannel()
    {
        close();
    }

    LocalChannel::LocalChannel(LocalChannel&& other) noexcept
        : listenFd_(other.listenFd_), connFd_(other.connFd_),
          endpoint_(std::move(other.endpoint_)), owner_(other.owner_)
    {
        other.listenFd_ = -1;
        other.connFd_ = -1;
        other.owner_ = false;
    }

    LocalChannel& LocalChannel::operator=(LocalChannel&& other) noexcept
    {
        if (this != &other)
        {
            close();
            listenFd_ = other.listenFd_;
            connFd_ = other.connFd_;
            endpoint_ = std::move(other.endpoint_);
            owner_ = other.owner_;
            other.listenFd_ = -1;
            other.connFd_ = -1;
            other.owner_ = false;
        }
        return *this;
    }

    void LocalChannel::close()
    {
        if (connFd_ >= 0) { ::close(connFd_); connFd_ = -1; }
        if (listenFd_ >= 0) { ::close(listenFd_); listenFd_ = -1; }

        //---Сокет-файл удаляет только создавшая его сторона
        if (owner_ && !endpoint_.empty())
        {
            ::unlink(endpoint_.c_str());
            owner_ = false;
        }
    }

    bool LocalChannel::listen(const fs::path& dir, const std::string& name, std::string* error)
    {
        close();
        endpoint_ = dir / name;

        sockaddr_un addr{};
        if (!fillAddress(endpoint_, addr, error)) return false;

        listenFd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (listenFd_ < 0)
        {
            if (error) *error = errnoMessage("socket");
            return false;
        }

        //---Сокет доступен только владельцу; помощник работает от root
        const mode_t oldMask = ::umask(0077);
        const int rc = ::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::umask(oldMask);
        if (rc != 0)
        {
            if (error) *error = errnoMessage("bind");
            close();
            return false;
        }
        owner_ = true;

        if (::listen(listenFd_, 1) != 0)
        {
            if (error) *error = errnoMessage("listen");
            close();
            return false;
        }
        return true;
    }

    LocalChannel::WaitResult LocalChannel::waitForPeer(int pid, process::ExitStatus& exit, std::string* error)
    {
        exit = {};
        for (;;)
        {
            pollfd pfd{};
            pfd.fd = listenFd_;
            pfd.events = POLLIN;

            const int rc = ::poll(&pfd, 1, kPollIntervalMs);
            if (rc < 0)
            {
                if (errno == EINTR) continue;
                if (error) *error = errnoMessage("poll");
                return WaitResult::Failed;
            }
            if (rc > 0)
            {
                if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL))
                {
                    if (error) *error = "channel error while waiting for helper";
                    return WaitResult::Failed;
                }
                connFd_ = ::accept4(listenFd_, nullptr, nullptr, SOCK_CLOEXEC);
                if (connFd_ < 0)
                {
                    if (error) *error = errnoMessage("accept");
                    return WaitResult::Failed;
                }
                return WaitResult::Connected;
            }

            //---Таймаут опроса: проверяем, жив ли помощник
            if (!process::tryWait(pid, exit))
            {
                if (error) *error = "waitpid failed, errno=" + std::to_string(exit.sysError);
                return WaitResult::Failed;
            }
            if (exit.exited) return WaitResult::ChildExited;
        }
    }

    bool LocalChannel::connect(const fs::path& endpoint, LocalChannel& out, std::string* error)
    {
        out.close();

        sockaddr_un addr{};
        if (!fillAddress(endpoint, addr, error)) return false;

        const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd < 0)
        {
            if (error) *error = errnoMessage("socket");
            return false;
        }
        if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0)
        {
            if (error) *error = errnoMessage("connect");
            ::close(fd);
            return false;
        }
        out.connFd_ = fd;
        out.endpoint_ = endpoint;
        out.owner_ = false;
        return true;
    }

    bool LocalChannel::sendAll(const std::string& data, std::string* error)
    {
        std::size_t sent = 0;
        while (sent < data.size())
        {
            const ssize_t n = ::send(connFd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n < 0)
            {
                if (errno == EINTR) continue;
                if (error) *error = errnoMessage("send");
                return false;
            }
            sent += (std::size_t)n;
        }
        ::shutdown(connFd_, SHUT_WR);
        return true;
    }

    bool LocalChannel::receiveAll(std::string& out, std::string* error)
    {
        out.clear();
        char buf[4096];
        for (;;)
        {
            const ssize_t n = ::recv(connFd_, buf, sizeof(buf), 0);
            if (n == 0) return true;
            if (n < 0)
            {
                if (errno == EINTR) continue;
                //---Разрыв соединения собеседником - это конец данных, а не ошибка
                if (errno == ECONNRESET) return true;
                if (error) *error = errnoMessage("recv");
                return false;
            }
            out.append(buf, (std::size_t)n);
        }
    }

} // namespace moddep::platform

#endif
