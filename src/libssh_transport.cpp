// libssh_transport.cpp - libssh connection, SFTP tunnel and exec channels
// uses SFTP for file transfer (libssh deprecated SCP in 0.10.x)

#include "rexec/libssh_transport.hpp"

#include "rexec/log.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <vector>

// libssh headers - order matters due to internal dependencies
#include <libssh/libssh.h>
#include <libssh/sftp.h>

// some libssh versions have issues with fcntl.h order
#include <fcntl.h>

namespace rexec::ssh
{

    namespace
    {

        // =============================================================================
        // native session and the channels that depend on it
        // =============================================================================

        // anything allocated from an ssh_session must be freed before the session goes down
        class dependent_resource
        {
        public:
            virtual ~dependent_resource() = default;
            virtual void release() noexcept = 0;
        };

        struct native_session
        {
            ssh_session handle{nullptr};
            bool disconnected{false};
            std::vector<std::weak_ptr<dependent_resource>> dependents;

            native_session() = default;

            ~native_session()
            {
                shutdown();
                if (handle != nullptr)
                {
                    ssh_free(handle);
                }
            }

            native_session(native_session const &) = delete;
            auto operator=(native_session const &) -> native_session & = delete;
            native_session(native_session &&) = delete;
            auto operator=(native_session &&) -> native_session & = delete;

            void track(std::shared_ptr<dependent_resource> const &resource)
            {
                std::erase_if(dependents, [](auto const &weak) { return weak.expired(); });
                dependents.emplace_back(resource);
            }

            void shutdown() noexcept
            {
                for (auto &weak : dependents)
                {
                    if (auto resource = weak.lock())
                    {
                        resource->release();
                    }
                }
                dependents.clear();

                if (handle != nullptr && !disconnected)
                {
                    ssh_disconnect(handle);
                    disconnected = true;
                }
            }

            [[nodiscard]] auto is_open() const noexcept -> bool
            {
                return handle != nullptr && !disconnected && ssh_is_connected(handle) != 0;
            }

            [[nodiscard]] auto last_error() const -> std::string_view
            {
                return handle != nullptr ? ssh_get_error(handle) : "no session";
            }
        };

        using native_ptr = std::shared_ptr<native_session>;

        // =============================================================================
        // RAII guards
        // =============================================================================

        struct sftp_file_guard
        {
            sftp_file file{nullptr};

            sftp_file_guard() = default;
            explicit sftp_file_guard(sftp_file f) : file(f) {}
            ~sftp_file_guard()
            {
                if (file != nullptr)
                {
                    sftp_close(file);
                }
            }

            sftp_file_guard(sftp_file_guard const &) = delete;
            auto operator=(sftp_file_guard const &) -> sftp_file_guard & = delete;
            sftp_file_guard(sftp_file_guard &&) = delete;
            auto operator=(sftp_file_guard &&) -> sftp_file_guard & = delete;

            [[nodiscard]] auto get() const noexcept -> sftp_file { return file; }
            [[nodiscard]] explicit operator bool() const noexcept { return file != nullptr; }
        };

        struct attributes_guard
        {
            sftp_attributes attrs{nullptr};

            explicit attributes_guard(sftp_attributes a) : attrs(a) {}
            ~attributes_guard()
            {
                if (attrs != nullptr)
                {
                    sftp_attributes_free(attrs);
                }
            }

            attributes_guard(attributes_guard const &) = delete;
            auto operator=(attributes_guard const &) -> attributes_guard & = delete;
            attributes_guard(attributes_guard &&) = delete;
            auto operator=(attributes_guard &&) -> attributes_guard & = delete;

            [[nodiscard]] explicit operator bool() const noexcept { return attrs != nullptr; }
        };

        [[nodiscard]] auto to_file_attributes(sftp_attributes const attrs, std::string_view fallback_name)
            -> file_attributes
        {
            file_attributes out;
            out.name = (attrs->name != nullptr) ? std::string{attrs->name} : std::string{fallback_name};
            out.size = attrs->size;
            out.permissions = attrs->permissions;
            out.uid = attrs->uid;
            out.gid = attrs->gid;
            out.mtime = attrs->mtime;
            out.is_directory = attrs->type == SSH_FILEXFER_TYPE_DIRECTORY;
            return out;
        }

        [[nodiscard]] auto final_component(std::string_view path) -> std::string_view
        {
            auto const slash = path.find_last_of('/');
            return slash == std::string_view::npos ? path : path.substr(slash + 1);
        }

        // =============================================================================
        // private key
        // =============================================================================

        class libssh_key final : public private_key
        {
        public:
            libssh_key(ssh_key key, std::filesystem::path source) noexcept : key_(key), source_(std::move(source)) {}

            ~libssh_key() override
            {
                if (key_ != nullptr)
                {
                    ssh_key_free(key_);
                }
            }

            libssh_key(libssh_key const &) = delete;
            auto operator=(libssh_key const &) -> libssh_key & = delete;
            libssh_key(libssh_key &&) = delete;
            auto operator=(libssh_key &&) -> libssh_key & = delete;

            [[nodiscard]] auto source() const noexcept -> std::filesystem::path const & override { return source_; }
            [[nodiscard]] auto get() const noexcept -> ssh_key { return key_; }

        private:
            ssh_key key_{nullptr};
            std::filesystem::path source_;
        };

        // =============================================================================
        // exec channel and its three stream views
        // =============================================================================

        class exec_channel final : public dependent_resource
        {
        public:
            exec_channel(native_ptr session, ssh_channel channel) noexcept
                : session_(std::move(session)), channel_(channel)
            {
            }

            ~exec_channel() override { release(); }

            exec_channel(exec_channel const &) = delete;
            auto operator=(exec_channel const &) -> exec_channel & = delete;
            exec_channel(exec_channel &&) = delete;
            auto operator=(exec_channel &&) -> exec_channel & = delete;

            void release() noexcept override
            {
                if (channel_ != nullptr)
                {
                    ssh_channel_close(channel_);
                    ssh_channel_free(channel_);
                    channel_ = nullptr;
                }
            }

            [[nodiscard]] auto get() const noexcept -> ssh_channel { return channel_; }

        private:
            native_ptr session_;
            ssh_channel channel_{nullptr};
        };

        class channel_input final : public remote_input
        {
        public:
            explicit channel_input(std::shared_ptr<exec_channel> channel) noexcept : channel_(std::move(channel)) {}

            auto write(std::string_view data) -> result<std::size_t> override
            {
                if (channel_->get() == nullptr)
                {
                    return std::unexpected(error::stream_closed);
                }

                std::size_t offset = 0;
                while (offset < data.size())
                {
                    auto const chunk = static_cast<std::uint32_t>(
                        std::min<std::size_t>(data.size() - offset, std::numeric_limits<std::uint32_t>::max()));
                    auto const written = ssh_channel_write(channel_->get(), data.data() + offset, chunk);
                    if (written < 0)
                    {
                        return std::unexpected(error::stream_closed);
                    }
                    offset += static_cast<std::size_t>(written);
                }
                return offset;
            }

            auto close() -> void_result override
            {
                if (channel_->get() == nullptr)
                {
                    return std::unexpected(error::stream_closed);
                }
                if (ssh_channel_send_eof(channel_->get()) != SSH_OK)
                {
                    return std::unexpected(error::stream_closed);
                }
                return {};
            }

        private:
            std::shared_ptr<exec_channel> channel_;
        };

        class channel_output final : public remote_output
        {
        public:
            channel_output(std::shared_ptr<exec_channel> channel, bool is_stderr) noexcept
                : channel_(std::move(channel)), is_stderr_(is_stderr)
            {
            }

            auto read(std::span<char> buffer) -> result<std::size_t> override
            {
                if (channel_->get() == nullptr)
                {
                    return std::unexpected(error::stream_closed);
                }

                auto const count = static_cast<std::uint32_t>(
                    std::min<std::size_t>(buffer.size(), std::numeric_limits<std::uint32_t>::max()));
                auto const nbytes = ssh_channel_read(channel_->get(), buffer.data(), count, is_stderr_ ? 1 : 0);
                if (nbytes < 0)
                {
                    return std::unexpected(error::stream_closed);
                }
                return static_cast<std::size_t>(nbytes);
            }

        private:
            std::shared_ptr<exec_channel> channel_;
            bool is_stderr_{false};
        };

        // =============================================================================
        // SFTP
        // =============================================================================

        class sftp_holder final : public dependent_resource
        {
        public:
            sftp_holder(native_ptr session, sftp_session sftp) noexcept : session_(std::move(session)), sftp_(sftp) {}

            ~sftp_holder() override { release(); }

            sftp_holder(sftp_holder const &) = delete;
            auto operator=(sftp_holder const &) -> sftp_holder & = delete;
            sftp_holder(sftp_holder &&) = delete;
            auto operator=(sftp_holder &&) -> sftp_holder & = delete;

            void release() noexcept override
            {
                if (sftp_ != nullptr)
                {
                    sftp_free(sftp_);
                    sftp_ = nullptr;
                }
            }

            [[nodiscard]] auto get() const noexcept -> sftp_session { return sftp_; }

        private:
            native_ptr session_;
            sftp_session sftp_{nullptr};
        };

        class libssh_transfer_channel final : public transfer_channel
        {
        public:
            explicit libssh_transfer_channel(std::shared_ptr<sftp_holder> holder) noexcept : holder_(std::move(holder)) {}

            auto put(std::istream &source, std::string_view remote_path) -> result<file_attributes> override
            {
                auto *const sftp = holder_->get();
                if (sftp == nullptr)
                {
                    return std::unexpected(error::stream_closed);
                }

                auto const remote = std::string{remote_path};
                sftp_file_guard file{sftp_open(sftp, remote.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644)};
                if (!file)
                {
                    return std::unexpected(error::sftp_open_failed);
                }

                // write in chunks
                std::array<char, constants::sftp_chunk_size> chunk{};
                while (source)
                {
                    source.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
                    auto const got = static_cast<std::size_t>(source.gcount());

                    std::size_t offset = 0;
                    while (offset < got)
                    {
                        auto const written = sftp_write(file.get(), chunk.data() + offset, got - offset);
                        if (written < 0)
                        {
                            return std::unexpected(error::sftp_write_failed);
                        }
                        offset += static_cast<std::size_t>(written);
                    }
                }

                if (source.bad())
                {
                    return std::unexpected(error::file_read_failed);
                }

                attributes_guard attrs{sftp_fstat(file.get())};
                if (!attrs)
                {
                    return std::unexpected(error::sftp_stat_failed);
                }
                return to_file_attributes(attrs.attrs, final_component(remote_path));
            }

            auto get(std::string_view remote_path, std::ostream &sink) -> result<file_attributes> override
            {
                auto *const sftp = holder_->get();
                if (sftp == nullptr)
                {
                    return std::unexpected(error::stream_closed);
                }

                auto const remote = std::string{remote_path};
                sftp_file_guard file{sftp_open(sftp, remote.c_str(), O_RDONLY, 0)};
                if (!file)
                {
                    return std::unexpected(error::sftp_open_failed);
                }

                std::array<char, constants::sftp_chunk_size> chunk{};
                ssize_t nbytes = 0;
                while ((nbytes = sftp_read(file.get(), chunk.data(), chunk.size())) > 0)
                {
                    if (!sink.write(chunk.data(), static_cast<std::streamsize>(nbytes)))
                    {
                        return std::unexpected(error::file_write_failed);
                    }
                }

                if (nbytes < 0)
                {
                    return std::unexpected(error::sftp_read_failed);
                }

                attributes_guard attrs{sftp_fstat(file.get())};
                if (!attrs)
                {
                    return std::unexpected(error::sftp_stat_failed);
                }
                return to_file_attributes(attrs.attrs, final_component(remote_path));
            }

            auto stat(std::string_view remote_path) -> result<file_attributes> override
            {
                auto *const sftp = holder_->get();
                if (sftp == nullptr)
                {
                    return std::unexpected(error::stream_closed);
                }

                attributes_guard attrs{sftp_stat(sftp, std::string{remote_path}.c_str())};
                if (!attrs)
                {
                    return std::unexpected(error::sftp_stat_failed);
                }
                return to_file_attributes(attrs.attrs, final_component(remote_path));
            }

            auto canonicalize(std::string_view remote_path) -> result<std::string> override
            {
                auto *const sftp = holder_->get();
                if (sftp == nullptr)
                {
                    return std::unexpected(error::stream_closed);
                }

                char *resolved = sftp_canonicalize_path(sftp, std::string{remote_path}.c_str());
                if (resolved == nullptr)
                {
                    return std::unexpected(error::sftp_stat_failed);
                }
                std::string out{resolved};
                ssh_string_free_char(resolved);
                return out;
            }

            void close() noexcept override { holder_->release(); }

        private:
            std::shared_ptr<sftp_holder> holder_;
        };

        // =============================================================================
        // connection
        // =============================================================================

        class libssh_connection final : public connection
        {
        public:
            libssh_connection(native_ptr native, std::string host) noexcept
                : native_(std::move(native)), host_(std::move(host))
            {
            }

            ~libssh_connection() override { close(); }

            libssh_connection(libssh_connection const &) = delete;
            auto operator=(libssh_connection const &) -> libssh_connection & = delete;
            libssh_connection(libssh_connection &&) = delete;
            auto operator=(libssh_connection &&) -> libssh_connection & = delete;

            auto open_transfer_channel() -> result<std::unique_ptr<transfer_channel>> override
            {
                if (!native_->is_open())
                {
                    return std::unexpected(error::not_connected);
                }

                auto *const sftp = sftp_new(native_->handle);
                if (sftp == nullptr)
                {
                    log::debug("sftp_new on {}: {}", host_, native_->last_error());
                    return std::unexpected(error::sftp_init_failed);
                }

                // owns sftp from here on
                auto holder = std::make_shared<sftp_holder>(native_, sftp);
                if (sftp_init(sftp) != SSH_OK)
                {
                    log::debug("sftp_init on {}: {}", host_, native_->last_error());
                    return std::unexpected(error::sftp_init_failed);
                }

                native_->track(holder);
                return std::make_unique<libssh_transfer_channel>(std::move(holder));
            }

            auto exec(std::string_view command) -> result<process_streams> override
            {
                if (!native_->is_open())
                {
                    return std::unexpected(error::not_connected);
                }

                auto *const raw = ssh_channel_new(native_->handle);
                if (raw == nullptr)
                {
                    return std::unexpected(error::channel_open_failed);
                }

                auto channel = std::make_shared<exec_channel>(native_, raw);
                if (ssh_channel_open_session(channel->get()) != SSH_OK)
                {
                    log::debug("channel open on {}: {}", host_, native_->last_error());
                    return std::unexpected(error::channel_open_failed);
                }

                if (ssh_channel_request_exec(channel->get(), std::string{command}.c_str()) != SSH_OK)
                {
                    log::debug("exec on {}: {}", host_, native_->last_error());
                    return std::unexpected(error::channel_exec_failed);
                }

                native_->track(channel);

                process_streams streams;
                streams.input = std::make_unique<channel_input>(channel);
                streams.output = std::make_unique<channel_output>(channel, false);
                streams.error = std::make_unique<channel_output>(channel, true);
                return streams;
            }

            auto is_open() const noexcept -> bool override { return native_->is_open(); }

            void close() noexcept override { native_->shutdown(); }

        private:
            native_ptr native_;
            std::string host_;
        };

        // =============================================================================
        // connect helpers
        // =============================================================================

        void apply_options(ssh_session handle, connect_request const &request, session_options const &options)
        {
            int const port = request.port;

            ssh_options_set(handle, SSH_OPTIONS_HOST, request.host.c_str());
            ssh_options_set(handle, SSH_OPTIONS_PORT, &port);
            ssh_options_set(handle, SSH_OPTIONS_USER, request.username.c_str());

            auto const total_ms = options.connect_timeout.count();
            long timeout_secs = static_cast<long>(total_ms / 1000);
            long timeout_usecs = static_cast<long>((total_ms % 1000) * 1000);
            ssh_options_set(handle, SSH_OPTIONS_TIMEOUT, &timeout_secs);
            ssh_options_set(handle, SSH_OPTIONS_TIMEOUT_USEC, &timeout_usecs);

            if (options.verbosity > 0)
            {
                int verbosity = SSH_LOG_PROTOCOL;
                ssh_options_set(handle, SSH_OPTIONS_LOG_VERBOSITY, &verbosity);
            }

            if (!options.known_hosts_file.empty())
            {
                ssh_options_set(handle, SSH_OPTIONS_KNOWNHOSTS, options.known_hosts_file.c_str());
            }

            if (options.host_keys != host_key_policy::strict)
            {
                int strict = 0;
                ssh_options_set(handle, SSH_OPTIONS_STRICTHOSTKEYCHECK, &strict);
            }
        }

        [[nodiscard]] auto verify_host_key(native_session &native, std::string_view host,
                                           session_options const &options) -> void_result
        {
            if (options.host_keys == host_key_policy::accept_any)
            {
                return {};
            }

            switch (ssh_session_is_known_server(native.handle))
            {
            case SSH_KNOWN_HOSTS_OK:
                return {};
            case SSH_KNOWN_HOSTS_CHANGED:
                log::error("host key for {} changed, refusing to connect", host);
                return std::unexpected(error::host_key_verification_failed);
            case SSH_KNOWN_HOSTS_OTHER:
                log::error("host key for {} not found but a key of another type exists, refusing to connect", host);
                return std::unexpected(error::host_key_verification_failed);
            case SSH_KNOWN_HOSTS_NOT_FOUND:
                // no known_hosts file yet, same as an unknown host
            case SSH_KNOWN_HOSTS_UNKNOWN:
                if (options.host_keys == host_key_policy::strict)
                {
                    log::error("{} is not in known_hosts", host);
                    return std::unexpected(error::host_key_verification_failed);
                }
                log::warning("{} not in known_hosts, adding it", host);
                if (ssh_session_update_known_hosts(native.handle) != SSH_OK)
                {
                    log::warning("could not write known_hosts entry for {}: {}", host, native.last_error());
                }
                return {};
            case SSH_KNOWN_HOSTS_ERROR:
            default:
                log::error("host key check for {} failed: {}", host, native.last_error());
                return std::unexpected(error::host_key_verification_failed);
            }
        }

        [[nodiscard]] auto authenticate(native_session &native, connect_request const &request,
                                        session_options const &options) -> void_result
        {
            if (request.uses_password())
            {
                auto const *const password = std::get<secret const *>(request.credential);
                if (password != nullptr &&
                    ssh_userauth_password(native.handle, nullptr, password->c_str()) == SSH_AUTH_SUCCESS)
                {
                    return {};
                }
                return std::unexpected(error::authentication_failed);
            }

            // try the configured key first
            auto const &key = std::get<key_handle>(request.credential);
            if (auto const *const native_key = dynamic_cast<libssh_key const *>(key.get()); native_key != nullptr)
            {
                if (ssh_userauth_publickey(native.handle, nullptr, native_key->get()) == SSH_AUTH_SUCCESS)
                {
                    return {};
                }
            }

            // then agent and default keys
            if (options.try_default_keys &&
                ssh_userauth_publickey_auto(native.handle, nullptr, nullptr) == SSH_AUTH_SUCCESS)
            {
                return {};
            }

            return std::unexpected(error::authentication_failed);
        }

    } // namespace

    // =============================================================================
    // libssh_transport
    // =============================================================================

    auto libssh_transport::load_key(std::filesystem::path const &path) -> result<key_handle>
    {
        ssh_key key = nullptr;
        if (ssh_pki_import_privkey_file(path.c_str(), nullptr, nullptr, nullptr, &key) != SSH_OK || key == nullptr)
        {
            return std::unexpected(error::key_load_failed);
        }
        return std::make_shared<libssh_key const>(key, path);
    }

    auto libssh_transport::connect(connect_request const &request) -> result<std::unique_ptr<connection>>
    {
        session_options const defaults{};
        auto const &options = (request.options != nullptr) ? *request.options : defaults;

        auto native = std::make_shared<native_session>();
        native->handle = ssh_new();
        if (native->handle == nullptr)
        {
            return std::unexpected(error::connection_failed);
        }

        apply_options(native->handle, request, options);

        if (ssh_connect(native->handle) != SSH_OK)
        {
            log::debug("connect to {}:{}: {}", request.host, request.port, native->last_error());
            native->disconnected = true;

            // libssh reports a connect timeout only through its message text
            auto const timed_out = native->last_error().find("imeout") != std::string_view::npos;
            return std::unexpected(timed_out ? error::timeout : error::connection_failed);
        }

        if (auto verified = verify_host_key(*native, request.host, options); !verified.has_value())
        {
            return std::unexpected(verified.error());
        }

        if (auto authenticated = authenticate(*native, request, options); !authenticated.has_value())
        {
            return std::unexpected(authenticated.error());
        }

        return std::make_unique<libssh_connection>(std::move(native), request.host);
    }

    auto make_libssh_transport() -> std::shared_ptr<transport>
    {
        return std::make_shared<libssh_transport>();
    }

} // namespace rexec::ssh
