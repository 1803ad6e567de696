// remote_path.cpp

#include "rexec/remote_path.hpp"

#include "rexec/common.hpp"

namespace rexec
{

    auto as_path(std::string_view value) -> std::filesystem::path
    {
        return std::filesystem::path{value};
    }

    auto as_path(std::string const &value) -> std::filesystem::path
    {
        return std::filesystem::path{value};
    }

    auto as_path(std::filesystem::path const &value) -> std::filesystem::path
    {
        return value;
    }

    auto as_path(char const *value) -> std::filesystem::path
    {
        return value == nullptr ? std::filesystem::path{} : std::filesystem::path{value};
    }

    auto normalize_payload_filename(std::string_view filename) -> std::string
    {
        auto const stem = filename.substr(0, filename.find('.'));
        return fmt::format("{}{}", stem, constants::payload_extension);
    }

    auto resolve_destination(std::filesystem::path const &source, std::filesystem::path const &destination)
        -> std::filesystem::path
    {
        if (destination.has_extension())
        {
            return destination;
        }
        return destination / source.filename();
    }

    auto resolve_remote(std::optional<std::string> const &working_directory,
                        std::filesystem::path const &remote_path) -> std::string
    {
        if (remote_path.is_absolute() || !working_directory.has_value() || working_directory->empty())
        {
            return remote_path.generic_string();
        }
        return (as_path(*working_directory) / remote_path).generic_string();
    }

} // namespace rexec
