#include <atomic>
#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <memory>
#include <sys/socket.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>
#include <vector>

#include "ctl/ipc.hpp"
#include "util/log.hpp"

namespace ipc
{
namespace fs = std::filesystem;

static bool ensure_parent_dir(const std::string &sock_path)
{
    std::error_code ec;
    fs::path        p(sock_path);
    fs::path        dir = p.parent_path();
    if (dir.empty())
        return true;  // socket in CWD

    if (!fs::exists(dir, ec))
    {
        if (!fs::create_directories(dir, ec))
        {
            LOG_ERROR("create_directories(%s) failed: %s", dir.string().c_str(),
                      ec.message().c_str());
            return false;
        }
    }
    // Enforce 0700 on the directory
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec)
    {
        LOG_WARN("permissions(%s, 0700) failed: %s", dir.string().c_str(), ec.message().c_str());
    }
    return true;
}

static bool send_all(int fd, const std::string &data)
{
    const char *buf  = data.data();
    size_t      len  = data.size();
    size_t      sent = 0;
    while (sent < len)
    {
        ssize_t n = send(fd, buf + sent, len - sent, MSG_NOSIGNAL);
        if (n > 0)
        {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR)
            continue;
        LOG_ERROR("send() failed: %s", std::strerror(errno));
        return false;
    }
    return true;
}

// Reads up to the first '\n' (or EOF); strips the newline and an optional '\r'.
static bool recv_line(int fd, std::string &out)
{
    std::string line;
    char        buf[256];
    while (1)
    {
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n > 0)
        {
            line.append(buf, static_cast<size_t>(n));
            if (line.find('\n') != std::string::npos)
                break;
            continue;
        }
        if (n == 0)
            break;  // EOF
        if (n == -1 && errno == EINTR)
            continue;
        LOG_ERROR("recv() failed: %s", std::strerror(errno));
        return false;
    }
    auto pos = line.find('\n');
    out      = (pos == std::string::npos) ? line : line.substr(0, pos);
    if (!out.empty() && out.back() == '\r')
        out.pop_back();
    return true;
}

namespace
{

struct Worker
{
    std::thread                        th;
    std::shared_ptr<std::atomic<bool>> done;
};

// Joins finished workers, or all of them when `all` is set.
void reap(std::vector<Worker> &workers, bool all)
{
    for (auto it = workers.begin(); it != workers.end();)
    {
        if (all || it->done->load())
        {
            it->th.join();
            it = workers.erase(it);
        }
        else
        {
            ++it;
        }
    }
}

void answer(int fd, const std::string &line, const Handler &on_line)
{
    std::string reply = on_line ? on_line(line) : std::string("OK");
    reply.push_back('\n');
    if (!send_all(fd, reply))
        LOG_WARN("reply to '%s' not delivered", line.c_str());
    close(fd);
}

}  // namespace

bool start_server(const std::string &sock_path, const Handler &on_line)
{
    sockaddr_un addr{};
    std::memset(&addr, 0, sizeof(addr));

    if (sock_path.empty())
    {
        errno = EINVAL;
        LOG_ERROR("Invalid socket path");
        return false;
    }
    if (sock_path.size() >= sizeof(addr.sun_path))
    {
        errno = ENAMETOOLONG;
        LOG_ERROR("Path name too long for AF_UNIX: %s", sock_path.c_str());
        return false;
    }

    // ensure parent directory exists (mkdir -p)
    if (!ensure_parent_dir(sock_path))
        return false;

    (void)::unlink(sock_path.c_str());  // ignore errors

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd == -1)
    {
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
        return false;
    }

    int fd_flags = fcntl(fd, F_GETFD, 0);
    if (fd_flags != -1)
        fcntl(fd, F_SETFD, fd_flags | FD_CLOEXEC);

    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, sock_path.c_str(), sizeof(addr.sun_path) - 1);
    addr.sun_path[sizeof(addr.sun_path) - 1] = '\0';
    socklen_t addr_len = static_cast<socklen_t>(offsetof(struct sockaddr_un, sun_path) +
                                                std::strlen(addr.sun_path) + 1);

    if (bind(fd, reinterpret_cast<sockaddr *>(&addr), addr_len) == -1)
    {
        int saved = errno;
        close(fd);
        errno = saved;
        LOG_ERROR("bind() failed: %s", std::strerror(errno));
        return false;
    }
    if (listen(fd, 4) == -1)
    {
        int saved = errno;
        close(fd);
        unlink(sock_path.c_str());
        errno = saved;
        LOG_ERROR("listen() failed: %s", std::strerror(errno));
        return false;
    }

    LOG_DEBUG("Listening on %s", sock_path.c_str());

    std::vector<Worker> workers;
    while (1)
    {
        int newfd = accept(fd, nullptr, nullptr);
        if (newfd == -1)
        {
            if (errno == EINTR)
                continue;
            int saved = errno;
            close(fd);
            unlink(sock_path.c_str());
            reap(workers, true);
            errno = saved;
            LOG_ERROR("accept() failed: %s", std::strerror(errno));
            return false;
        }
        reap(workers, false);

        int aflags = fcntl(newfd, F_GETFD, 0);
        if (aflags != -1)
            fcntl(newfd, F_SETFD, aflags | FD_CLOEXEC);
        std::string first;
        if (!recv_line(newfd, first))
        {
            close(newfd);
            continue;  // keep server alive; accept next connection
        }

        if (first == "QUIT")
        {
            answer(newfd, first, on_line);
            break;  // graceful shutdown
        }

        // a request may block on its device; the next one must still get through
        Worker w;
        w.done    = std::make_shared<std::atomic<bool>>(false);
        auto done = w.done;
        w.th      = std::thread([newfd, first, &on_line, done] {
            answer(newfd, first, on_line);
            done->store(true);
        });
        workers.push_back(std::move(w));
    }

    close(fd);
    unlink(sock_path.c_str());
    reap(workers, true);
    return true;
}

bool request(const std::string &sock_path, const std::string &line, std::string &reply)
{
    sockaddr_un addr{};
    std::memset(&addr, 0, sizeof(addr));

    if (line.empty() || sock_path.empty())
    {
        errno = EINVAL;
        LOG_ERROR("Invalid line or socket path");
        return false;
    }
    if (sock_path.size() >= sizeof(addr.sun_path))
    {
        errno = ENAMETOOLONG;
        LOG_ERROR("Path name too long for AF_UNIX: %s", sock_path.c_str());
        return false;
    }

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd == -1)
    {
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
        return false;
    }

    int fd_flags = fcntl(fd, F_GETFD, 0);
    if (fd_flags != -1)
        fcntl(fd, F_SETFD, fd_flags | FD_CLOEXEC);
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, sock_path.c_str(), sizeof(addr.sun_path) - 1);
    addr.sun_path[sizeof(addr.sun_path) - 1] = '\0';
    socklen_t addr_len = static_cast<socklen_t>(offsetof(struct sockaddr_un, sun_path) +
                                                std::strlen(addr.sun_path) + 1);

    if (connect(fd, reinterpret_cast<sockaddr *>(&addr), addr_len) == -1)
    {
        int saved = errno;
        close(fd);
        errno = saved;
        LOG_ERROR("connect() failed: %s", std::strerror(errno));
        return false;
    }

    std::string out = line;
    if (out.back() != '\n')
        out.push_back('\n');
    LOG_DEBUG("Sending line: %s", line.c_str());
    if (!send_all(fd, out))
    {
        close(fd);
        return false;
    }
    // half-close so the server sees the end of the request
    shutdown(fd, SHUT_WR);

    bool ok = recv_line(fd, reply);
    close(fd);
    return ok;
}

std::string expand_user(const std::string &p)
{
    // expand leading '~' or '~/' to $HOME
    if (!p.empty() && p[0] == '~' && (p.size() == 1 || p[1] == '/'))
    {
        const char *home = std::getenv("HOME");
        if (home && (*home))  // non-empty
        {
            return (p.size() == 1) ? std::string(home) : std::string(home) + p.substr(1);
        }
    }
    return p;
}

}  // namespace ipc
