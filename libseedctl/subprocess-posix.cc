// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#include <array>
#include <memory>
#include <cerrno>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <event2/buffer.h>
#include <event2/event.h>

#include <fmt/core.h>

#include "libseedctl/error.h"
#include "libseedctl/log.h"
#include "libseedctl/subprocess.h"
#include "libseedctl/utils.h"

using namespace std::literals;

namespace
{
using Pipe = std::array<int, 2>;

// unique_ptr never calls these with nullptr; event_free() also removes a pending event
struct EventBaseDeleter
{
    void operator()(event_base* base) const noexcept
    {
        event_base_free(base);
    }
};

struct EventDeleter
{
    void operator()(event* ev) const noexcept
    {
        event_free(ev);
    }
};

struct BufferDeleter
{
    void operator()(evbuffer* buf) const noexcept
    {
        evbuffer_free(buf);
    }
};

using evbase_ptr = std::unique_ptr<event_base, EventBaseDeleter>;
using event_ptr = std::unique_ptr<event, EventDeleter>;
using evbuffer_ptr = std::unique_ptr<evbuffer, BufferDeleter>;

void set_system_error(sc_error* error, int code, std::string_view what)
{
    sc_error_set(error, code, fmt::format("{:s} failed: {:s} ({:d})", what, sc_strerror(code), code));
}

void close_pipe(Pipe& fds)
{
    for (auto& fd : fds)
    {
        if (fd != -1)
        {
            close(fd);
            fd = -1;
        }
    }
}

// drains one of the child's output pipes until EOF
struct Reader
{
    evbuffer_ptr buf{ evbuffer_new() };
    event_ptr event;
    int read_errno = 0;
};

void on_readable(evutil_socket_t fd, short /*what*/, void* vreader)
{
    auto* const reader = static_cast<Reader*>(vreader);

    auto const n_read = evbuffer_read(reader->buf.get(), fd, -1);
    if (n_read > 0)
    {
        return;
    }

    if (n_read == -1)
    {
        if (errno == EINTR || errno == EAGAIN)
        {
            return;
        }

        reader->read_errno = errno;
    }

    // EOF or a hard error; either way this pipe is done
    event_del(reader->event.get());
}

[[nodiscard]] std::string drain(Reader const& reader)
{
    auto* const buf = reader.buf.get();
    auto const len = evbuffer_get_length(buf);
    auto str = std::string(len, '\0');
    evbuffer_remove(buf, std::data(str), len);
    return str;
}

[[noreturn]] void exec_in_child(std::string const& command, Pipe& out, Pipe& err)
{
    if (dup2(out[1], STDOUT_FILENO) == -1 || dup2(err[1], STDERR_FILENO) == -1)
    {
        _exit(127);
    }

    close_pipe(out);
    close_pipe(err);

    auto const argv = std::array<char const*, 4>{ "/bin/sh", "-c", command.c_str(), nullptr };
    execv(argv[0], const_cast<char* const*>(std::data(argv)));
    _exit(127);
}

[[nodiscard]] bool wait_for_child(pid_t pid, int* status, sc_error* error)
{
    for (;;)
    {
        if (waitpid(pid, status, 0) != -1)
        {
            return true;
        }

        if (errno != EINTR)
        {
            set_system_error(error, errno, "Call to waitpid()");
            return false;
        }
    }
}
} // namespace

std::optional<sc_spawn_result> sc_spawn_capture(std::string_view command, sc_error* error)
{
    auto const base = evbase_ptr{ event_base_new() };
    if (!base)
    {
        set_system_error(error, ENOMEM, "Call to event_base_new()");
        return {};
    }

    auto out_fds = Pipe{ -1, -1 };
    auto err_fds = Pipe{ -1, -1 };

    if (pipe(std::data(out_fds)) == -1 || pipe(std::data(err_fds)) == -1)
    {
        set_system_error(error, errno, "Call to pipe()");
        close_pipe(out_fds);
        close_pipe(err_fds);
        return {};
    }

    // copy before forking; the child must not allocate
    auto const command_sz = std::string{ command };

    auto const child_pid = fork();

    if (child_pid == -1)
    {
        set_system_error(error, errno, "Call to fork()");
        close_pipe(out_fds);
        close_pipe(err_fds);
        return {};
    }

    if (child_pid == 0)
    {
        exec_in_child(command_sz, out_fds, err_fds);
    }

    close(out_fds[1]);
    close(err_fds[1]);
    out_fds[1] = -1;
    err_fds[1] = -1;

    auto out = Reader{};
    auto err = Reader{};
    out.event.reset(event_new(base.get(), out_fds[0], EV_READ | EV_PERSIST, on_readable, &out));
    err.event.reset(event_new(base.get(), err_fds[0], EV_READ | EV_PERSIST, on_readable, &err));

    // dispatch returns once both pipes reached EOF
    event_add(out.event.get(), nullptr);
    event_add(err.event.get(), nullptr);
    event_base_dispatch(base.get());

    close_pipe(out_fds);
    close_pipe(err_fds);

    auto result = sc_spawn_result{};
    if (!wait_for_child(child_pid, &result.status, error))
    {
        return {};
    }

    if (auto const read_errno = out.read_errno != 0 ? out.read_errno : err.read_errno; read_errno != 0)
    {
        set_system_error(error, read_errno, "Reading child output");
        return {};
    }

    result.out = drain(out);
    result.err = drain(err);
    sc_logAddTrace(fmt::format("'{:s}' exited with status {:d}", command, sc_spawn_exit_code(result)));
    return result;
}

int sc_spawn_exit_code(sc_spawn_result const& result) noexcept
{
    return WIFEXITED(result.status) ? WEXITSTATUS(result.status) : -1;
}
