// transport.hpp - the secure-transport collaborator as seen by the session layer
// the production implementation is libssh (libssh_transport.hpp), tests plug in a mock

#pragma once

#include "rexec/common.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace rexec::ssh
{

    // =============================================================================
    // credentials
    // =============================================================================

    /// @brief Loaded private key; concrete type belongs to the transport that loaded it
    class private_key
    {
    public:
        virtual ~private_key() = default;

        [[nodiscard]] virtual auto source() const noexcept -> std::filesystem::path const & = 0;
    };

    using key_handle = std::shared_ptr<private_key const>;

    /// @brief Password that wipes itself and deliberately has no formatter
    class secret
    {
    public:
        secret() = default;
        explicit secret(std::string value) noexcept : value_(std::move(value)) {}
        ~secret();

        secret(secret const &) = delete;
        auto operator=(secret const &) -> secret & = delete;
        secret(secret &&other) noexcept;
        auto operator=(secret &&other) noexcept -> secret &;

        [[nodiscard]] auto reveal() const noexcept -> std::string_view { return value_; }
        [[nodiscard]] auto c_str() const noexcept -> char const * { return value_.c_str(); }
        [[nodiscard]] auto empty() const noexcept -> bool { return value_.empty(); }

    private:
        void wipe() noexcept;

        std::string value_;
    };

    enum class host_key_policy : std::uint8_t
    {
        accept_new, // unknown keys are trusted and written to known_hosts, changed keys are rejected
        strict,     // only keys already in known_hosts
        accept_any, // no verification at all
    };

    // =============================================================================
    // session configuration
    // =============================================================================

    struct session_options
    {
        std::chrono::milliseconds connect_timeout{constants::default_connect_timeout};
        host_key_policy host_keys{host_key_policy::accept_new};
        std::filesystem::path known_hosts_file; // optional, libssh default if empty
        bool try_default_keys{true};            // agent and ~/.ssh keys after the explicit key
        int verbosity{0};                       // 0=quiet, 1+=verbose
    };

    struct connect_request
    {
        std::string host;
        std::uint16_t port{constants::default_ssh_port};
        std::string username;
        std::variant<key_handle, secret const *> credential;
        session_options const *options{nullptr};

        [[nodiscard]] auto uses_password() const noexcept -> bool
        {
            return std::holds_alternative<secret const *>(credential);
        }
    };

    // =============================================================================
    // transfer results
    // =============================================================================

    struct file_attributes
    {
        std::string name;
        std::uint64_t size{0};
        std::uint32_t permissions{0};
        std::uint32_t uid{0};
        std::uint32_t gid{0};
        std::uint64_t mtime{0};
        bool is_directory{false};
    };

    // =============================================================================
    // remote process streams
    // =============================================================================

    class remote_input
    {
    public:
        virtual ~remote_input() = default;

        [[nodiscard]] virtual auto write(std::string_view data) -> result<std::size_t> = 0;

        /// @brief Send EOF to the remote process
        [[nodiscard]] virtual auto close() -> void_result = 0;
    };

    class remote_output
    {
    public:
        virtual ~remote_output() = default;

        /// @brief Blocking read; zero bytes means end of stream
        [[nodiscard]] virtual auto read(std::span<char> buffer) -> result<std::size_t> = 0;

        [[nodiscard]] auto read_all() -> result<std::string>;
    };

    struct process_streams
    {
        std::unique_ptr<remote_input> input;
        std::unique_ptr<remote_output> output;
        std::unique_ptr<remote_output> error;
    };

    // =============================================================================
    // channels
    // =============================================================================

    class transfer_channel
    {
    public:
        virtual ~transfer_channel() = default;

        [[nodiscard]] virtual auto put(std::istream &source, std::string_view remote_path) -> result<file_attributes> = 0;
        [[nodiscard]] virtual auto get(std::string_view remote_path, std::ostream &sink) -> result<file_attributes> = 0;
        [[nodiscard]] virtual auto stat(std::string_view remote_path) -> result<file_attributes> = 0;

        /// @brief Absolute form of a remote path as the server sees it
        [[nodiscard]] virtual auto canonicalize(std::string_view remote_path) -> result<std::string> = 0;

        virtual void close() noexcept = 0;
    };

    class connection
    {
    public:
        virtual ~connection() = default;

        [[nodiscard]] virtual auto open_transfer_channel() -> result<std::unique_ptr<transfer_channel>> = 0;

        /// @brief Start a command without waiting for it
        [[nodiscard]] virtual auto exec(std::string_view command) -> result<process_streams> = 0;

        [[nodiscard]] virtual auto is_open() const noexcept -> bool = 0;

        virtual void close() noexcept = 0;
    };

    class transport
    {
    public:
        virtual ~transport() = default;

        [[nodiscard]] virtual auto load_key(std::filesystem::path const &path) -> result<key_handle> = 0;

        /// @brief Dial and authenticate; error::authentication_failed is distinct from every other failure
        [[nodiscard]] virtual auto connect(connect_request const &request) -> result<std::unique_ptr<connection>> = 0;
    };

} // namespace rexec::ssh
