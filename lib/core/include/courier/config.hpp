/*
Module Name:
- config.hpp

Abstract:
- Immutable library configuration loaded from TOML.
- [transport] tunes BeastTransport, [executor] tunes RequestExecutor and picks
  the log sink, [apis.<name>] declares Api descriptors by name.
- Fails fast with ConfigError on unreadable, malformed or invalid input.
*/
#pragma once

// C++ Standard Library
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>

// TOML++
#include <toml++/toml.hpp>

// Project
#include <courier/api.hpp>
#include <courier/log.hpp>
#include <courier/net/http/beast_transport.hpp>
#include <courier/request_executor.hpp>
#include <courier/utils/transparent_string_hash.hpp>

namespace courier
{

    /// Configuration-loading failure.
    class ConfigError final : public std::runtime_error
    {
    public:
        explicit ConfigError(const std::string& msg) noexcept;
    };

    enum class LogSinkChoice
    {
        default_sink,
        stderr_sink,
        none,
    };

    class Config
    {
    public:
        /// Load from the TOML file at path.
        /// Pre: !path.empty()
        static Config load_file(const std::filesystem::path& path);

        /// Parse TOML text; source names the document in error messages.
        static Config parse(std::string_view text, std::string_view source = "config");

        [[nodiscard]] const net::BeastTransportOptions& transport() const noexcept
        {
            return transport_;
        }
        [[nodiscard]] const ExecutorOptions& executor() const noexcept
        {
            return executor_;
        }
        [[nodiscard]] LogSinkChoice log_sink() const noexcept
        {
            return log_sink_;
        }

        /// Api declared under [apis.<name>]; throws ConfigError when absent.
        [[nodiscard]] const Api& api(std::string_view name) const;
        [[nodiscard]] bool has_api(std::string_view name) const noexcept;

        /// Install the configured sink as the process-wide log sink.
        void apply_logging() const;

    private:
        Config() = default;

        static Config from_table(const toml::table& root, const std::string& where);

        net::BeastTransportOptions transport_;
        ExecutorOptions executor_;
        LogSinkChoice log_sink_{ LogSinkChoice::default_sink };
        std::unordered_map<std::string, Api, TransparentStringHash, TransparentStringEq> apis_;
    };

} // namespace courier
