#include "ssh_client.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <algorithm>
#include <cstring>

static std::string last_error(LIBSSH2_SESSION* session) {
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session, &msg, &len, 0);
    if (!msg || len <= 0) return "unknown error";
    return std::string(msg, static_cast<size_t>(len));
}

static Result<void> init_libssh2() {
    static std::once_flag once;
    static int rc = 0;
    std::call_once(once, [] { rc = libssh2_init(0); });
    if (rc != 0) {
        return Result<void>::Err("Failed to initialize libssh2");
    }
    return Result<void>::Ok();
}

// ── SSHHandle ──────────────────────────────────────────────────

SSHHandle::SSHHandle(LIBSSH2_SESSION* s, std::shared_ptr<Transport> t)
    : session(s), transport(std::move(t)) {
}

SSHHandle::~SSHHandle() {
    if (!session) return;
    std::lock_guard<std::mutex> lock(io_mutex);
    // Best effort: the transport may already be shut down
    libssh2_session_disconnect(session, "Normal disconnection");
    libssh2_session_free(session);
    session = nullptr;
}

bool SSHHandle::wait(const Deadline& deadline) {
    if (deadline_passed(deadline)) return false;

    int dir;
    {
        std::lock_guard<std::mutex> lock(io_mutex);
        dir = libssh2_session_block_directions(session);
    }

    int timeout_ms = SSH_WAIT_SLICE_MS;
    if (deadline) timeout_ms = std::min(timeout_ms, remaining_ms(deadline));

    short events = 0;
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;

    if (events == 0 || transport->native_handle() == SSHPOOL_INVALID_SOCKET) {
        platform::sleep_ms(std::min(timeout_ms, SSH_POLL_INTERVAL_MS));
    } else {
        platform::poll_socket(transport->native_handle(), events, timeout_ms);
    }
    return true;
}

// ── SSHSession ─────────────────────────────────────────────────

SSHSession::SSHSession(std::shared_ptr<SSHHandle> handle, LIBSSH2_CHANNEL* channel)
    : handle_(std::move(handle)), channel_(channel) {
}

SSHSession::~SSHSession() {
    close();
}

void SSHSession::close() {
    if (!channel_) return;

    auto deadline = Deadline(Clock::now() + std::chrono::seconds(SSH_CLOSE_TIMEOUT_SECS));
    int rc;
    do {
        std::lock_guard<std::mutex> lock(handle_->io_mutex);
        rc = libssh2_channel_close(channel_);
    } while (rc == LIBSSH2_ERROR_EAGAIN && handle_->wait(deadline));

    {
        std::lock_guard<std::mutex> lock(handle_->io_mutex);
        libssh2_channel_free(channel_);
    }
    channel_ = nullptr;
}

SSHResult SSHSession::run(const std::string& command, int timeout_secs) {
    if (!channel_) {
        return SSHResult{-1, "", "Session is closed"};
    }
    if (used_) {
        return SSHResult{-1, "", "Session already ran a command"};
    }
    used_ = true;

    int effective_timeout = (timeout_secs > 0) ? timeout_secs : SSH_CMD_TIMEOUT_SECS;
    auto deadline = Deadline(Clock::now() + std::chrono::seconds(effective_timeout));
    std::string timeout_msg = fmt::format("Command timed out after {}s", effective_timeout);

    int rc;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(handle_->io_mutex);
            rc = libssh2_channel_exec(channel_, command.c_str());
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        if (!handle_->wait(deadline)) return SSHResult{-1, "", timeout_msg};
    }
    if (rc != 0) {
        std::lock_guard<std::mutex> lock(handle_->io_mutex);
        return SSHResult{-1, "", "Failed to exec command: " + last_error(handle_->session)};
    }

    // No stdin: send EOF so commands reading it do not hang
    while (true) {
        {
            std::lock_guard<std::mutex> lock(handle_->io_mutex);
            rc = libssh2_channel_send_eof(channel_);
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        if (!handle_->wait(deadline)) return SSHResult{-1, "", timeout_msg};
    }

    // Drain stdout and stderr together so neither window fills up
    std::string out;
    std::string err;
    char buf[SSH_READ_BUF_SIZE];
    while (true) {
        ssize_t n_out;
        ssize_t n_err;
        {
            std::lock_guard<std::mutex> lock(handle_->io_mutex);
            n_out = libssh2_channel_read(channel_, buf, sizeof(buf));
            if (n_out > 0) out.append(buf, static_cast<size_t>(n_out));
            n_err = libssh2_channel_read_stderr(channel_, buf, sizeof(buf));
            if (n_err > 0) err.append(buf, static_cast<size_t>(n_err));
        }
        if (n_out > 0 || n_err > 0) continue;

        if ((n_out < 0 && n_out != LIBSSH2_ERROR_EAGAIN) ||
            (n_err < 0 && n_err != LIBSSH2_ERROR_EAGAIN)) {
            std::lock_guard<std::mutex> lock(handle_->io_mutex);
            return SSHResult{-1, out, "SSH channel read error: " + last_error(handle_->session)};
        }

        bool eof;
        {
            std::lock_guard<std::mutex> lock(handle_->io_mutex);
            eof = libssh2_channel_eof(channel_) != 0;
        }
        if (eof) break;
        if (!handle_->wait(deadline)) return SSHResult{-1, out, timeout_msg};
    }

    // Exit status is only available after the close handshake
    while (true) {
        {
            std::lock_guard<std::mutex> lock(handle_->io_mutex);
            rc = libssh2_channel_close(channel_);
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        if (!handle_->wait(deadline)) return SSHResult{-1, out, timeout_msg};
    }
    while (true) {
        {
            std::lock_guard<std::mutex> lock(handle_->io_mutex);
            rc = libssh2_channel_wait_closed(channel_);
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        if (!handle_->wait(deadline)) return SSHResult{-1, out, timeout_msg};
    }

    int exit_status;
    {
        std::lock_guard<std::mutex> lock(handle_->io_mutex);
        exit_status = libssh2_channel_get_exit_status(channel_);
    }
    return SSHResult{exit_status, out, err};
}

// ── SSHClient ──────────────────────────────────────────────────

SSHClient::SSHClient(std::shared_ptr<SSHHandle> handle)
    : handle_(std::move(handle)) {
}

Result<std::unique_ptr<Session>> SSHClient::new_session(const Deadline& deadline) {
    using R = Result<std::unique_ptr<Session>>;

    if (handle_->transport->closed()) {
        return R::Err("ssh: transport is closed");
    }

    std::unique_lock<std::timed_mutex> open_lock(handle_->open_mutex, std::defer_lock);
    if (deadline) {
        if (!open_lock.try_lock_until(*deadline)) {
            return R::Err("ssh: session open timed out");
        }
    } else {
        open_lock.lock();
    }

    while (true) {
        LIBSSH2_CHANNEL* ch;
        int err = 0;
        std::string msg;
        {
            std::lock_guard<std::mutex> lock(handle_->io_mutex);
            ch = libssh2_channel_open_session(handle_->session);
            if (!ch) {
                err = libssh2_session_last_errno(handle_->session);
                if (err != LIBSSH2_ERROR_EAGAIN) msg = last_error(handle_->session);
            }
        }
        if (ch) {
            return R::Ok(std::make_unique<SSHSession>(handle_, ch));
        }
        if (err != LIBSSH2_ERROR_EAGAIN) {
            return R::Err("ssh: failed to open session: " + msg);
        }
        if (!handle_->wait(deadline)) {
            return R::Err("ssh: session open timed out");
        }
    }
}

// ── Handshake and authentication ───────────────────────────────

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round;
};

// libssh2 keyboard-interactive callback. Every prompt gets the password.
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);

    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
    data->prompt_round++;
}

static std::string hex_fingerprint(const char* hash, size_t len) {
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; i++) {
        out += fmt::format("{:02x}", static_cast<unsigned char>(hash[i]));
    }
    return out;
}

static Result<void> check_host_key(SSHHandle& h, const ClientConfig& config) {
    if (!config.host_key_check) return Result<void>::Ok();

    const char* hash = libssh2_hostkey_hash(h.session, LIBSSH2_HOSTKEY_HASH_SHA256);
    if (!hash) {
        return Result<void>::Err("ssh: server host key unavailable");
    }
    std::string fingerprint = hex_fingerprint(hash, 32);
    if (!config.host_key_check(h.transport->remote_address(), fingerprint)) {
        return Result<void>::Err("ssh: host key rejected for " +
                                 h.transport->remote_address() + " (SHA256 " + fingerprint + ")");
    }
    return Result<void>::Ok();
}

static Result<void> ssh_userauth(SSHHandle& h, const ClientConfig& config,
                                 const Deadline& deadline) {
    LIBSSH2_SESSION* session = h.session;
    const std::string& user = config.user;
    int ret;

    // Check what auth methods the server supports
    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session, user.c_str(),
                                              static_cast<unsigned int>(user.length()))) == nullptr) {
        if (libssh2_userauth_authenticated(session)) {
            return Result<void>::Ok();  // "none" auth accepted
        }
        if (libssh2_session_last_errno(session) != LIBSSH2_ERROR_EAGAIN) {
            return Result<void>::Err("ssh: failed to query auth methods: " + last_error(session));
        }
        if (!h.wait(deadline)) {
            return Result<void>::Err("ssh: authentication timed out");
        }
    }
    std::string methods = auth_list;

    if (config.identity_file && methods.find("publickey") != std::string::npos) {
        const char* passphrase = config.passphrase ? config.passphrase->c_str() : nullptr;
        while ((ret = libssh2_userauth_publickey_fromfile_ex(
                    session, user.c_str(), static_cast<unsigned int>(user.length()),
                    nullptr, config.identity_file->c_str(), passphrase)) == LIBSSH2_ERROR_EAGAIN) {
            if (!h.wait(deadline)) {
                return Result<void>::Err("ssh: authentication timed out");
            }
        }
        if (ret == 0) return Result<void>::Ok();
    }

    if (!config.password.empty() && methods.find("keyboard-interactive") != std::string::npos) {
        KbdAuthData kbd_data;
        kbd_data.password = config.password;
        kbd_data.prompt_round = 0;

        *libssh2_session_abstract(session) = &kbd_data;
        while ((ret = libssh2_userauth_keyboard_interactive(session, user.c_str(),
                                                             kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
            if (!h.wait(deadline)) {
                *libssh2_session_abstract(session) = nullptr;
                return Result<void>::Err("ssh: authentication timed out");
            }
        }
        *libssh2_session_abstract(session) = nullptr;
        if (ret == 0) return Result<void>::Ok();
    }

    if (!config.password.empty() && methods.find("password") != std::string::npos) {
        while ((ret = libssh2_userauth_password(session, user.c_str(),
                                                config.password.c_str())) == LIBSSH2_ERROR_EAGAIN) {
            if (!h.wait(deadline)) {
                return Result<void>::Err("ssh: authentication timed out");
            }
        }
        if (ret == 0) return Result<void>::Ok();
    }

    return Result<void>::Err(fmt::format("ssh: unable to authenticate as {} (server offers: {})",
                                         user, methods));
}

Result<std::shared_ptr<Client>> ssh_handshake(std::shared_ptr<Transport> transport,
                                              const ClientConfig& config,
                                              const Deadline& deadline) {
    using R = Result<std::shared_ptr<Client>>;

    auto init = init_libssh2();
    if (init.is_err()) return R::Err(init.error);

    if (transport->native_handle() == SSHPOOL_INVALID_SOCKET) {
        return R::Err("ssh: transport has no socket");
    }

    LIBSSH2_SESSION* session = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session) {
        return R::Err("ssh: failed to create session");
    }
    libssh2_session_set_blocking(session, 0);

    // From here on the handle frees the session on every return path
    auto handle = std::make_shared<SSHHandle>(session, transport);

    int ret;
    while ((ret = libssh2_session_handshake(session, transport->native_handle())) ==
           LIBSSH2_ERROR_EAGAIN) {
        if (!handle->wait(deadline)) {
            return R::Err("ssh: handshake timed out");
        }
    }
    if (ret != 0) {
        return R::Err("ssh: handshake failed: " + last_error(session));
    }

    auto host_key = check_host_key(*handle, config);
    if (host_key.is_err()) return R::Err(host_key.error);

    auto auth = ssh_userauth(*handle, config, deadline);
    if (auth.is_err()) return R::Err(auth.error);

    return R::Ok(std::make_shared<SSHClient>(handle));
}
