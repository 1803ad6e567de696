// remote_path.hpp - path normalization shared by every transfer and launch operation
// remote paths are POSIX paths regardless of the local platform

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace rexec
{

    // =============================================================================
    // normalization
    // =============================================================================

    [[nodiscard]] auto as_path(std::string_view value) -> std::filesystem::path;
    [[nodiscard]] auto as_path(std::string const &value) -> std::filesystem::path;
    [[nodiscard]] auto as_path(std::filesystem::path const &value) -> std::filesystem::path;
    [[nodiscard]] auto as_path(char const *value) -> std::filesystem::path;

    /// @brief Payload files always carry the .json extension
    /// everything from the first '.' on is replaced, so "out.txt" and "out.tar.gz" both become "out.json"
    [[nodiscard]] auto normalize_payload_filename(std::string_view filename) -> std::string;

    /// @brief A destination without an extension names a directory and receives
    /// the source file name; otherwise it names the destination file itself
    [[nodiscard]] auto resolve_destination(std::filesystem::path const &source,
                                           std::filesystem::path const &destination) -> std::filesystem::path;

    /// @brief Relative remote paths are taken relative to the tunnel's working directory, if any
    [[nodiscard]] auto resolve_remote(std::optional<std::string> const &working_directory,
                                      std::filesystem::path const &remote_path) -> std::string;

} // namespace rexec
