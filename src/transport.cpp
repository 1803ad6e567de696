// transport.cpp - transport-independent pieces of the collaborator interface

#include "rexec/transport.hpp"

#include <algorithm>
#include <array>

namespace rexec::ssh
{

    // =============================================================================
    // secret
    // =============================================================================

    secret::~secret()
    {
        wipe();
    }

    secret::secret(secret &&other) noexcept : value_(std::move(other.value_))
    {
        other.wipe();
    }

    auto secret::operator=(secret &&other) noexcept -> secret &
    {
        if (this != &other)
        {
            wipe();
            value_ = std::move(other.value_);
            other.wipe();
        }
        return *this;
    }

    void secret::wipe() noexcept
    {
        // volatile store so the compiler cannot drop the overwrite of a dying buffer
        auto *p = static_cast<volatile char *>(value_.data());
        for (std::size_t i = 0; i < value_.size(); ++i)
        {
            p[i] = '\0';
        }
        value_.clear();
    }

    // =============================================================================
    // remote_output
    // =============================================================================

    auto remote_output::read_all() -> result<std::string>
    {
        std::string collected;
        std::array<char, 4096> buffer{};

        while (true)
        {
            auto const nbytes = read(buffer);
            if (!nbytes.has_value())
            {
                return std::unexpected(nbytes.error());
            }
            if (*nbytes == 0)
            {
                break;
            }
            collected.append(buffer.data(), std::min(*nbytes, buffer.size()));
        }

        return collected;
    }

} // namespace rexec::ssh
