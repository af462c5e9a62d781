// C++ Standard Library
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <utility>

// TOML++
#include <toml++/toml.hpp>

// Project
#include <courier/config.hpp>

namespace courier
{

    namespace
    {
        // Value at key if present; ConfigError if present with the wrong type.
        template <class V>
        std::optional<V> fetch(const toml::table& section, std::string_view key, const std::string& where)
        {
            const toml::node* node = section.get(key);
            if (!node)
                return std::nullopt;
            if (auto value = node->value<V>())
                return value;
            throw ConfigError("Invalid value for '" + std::string{ key } + "' in " + where);
        }

        std::chrono::milliseconds fetch_millis(const toml::table& section,
                                               std::string_view key,
                                               std::chrono::milliseconds fallback,
                                               const std::string& where)
        {
            const auto ms = fetch<std::int64_t>(section, key, where);
            if (!ms)
                return fallback;
            if (*ms <= 0)
                throw ConfigError("'" + std::string{ key } + "' must be positive in " + where);
            return std::chrono::milliseconds{ *ms };
        }

        const toml::table* section(const toml::table& root, std::string_view key, const std::string& where)
        {
            const toml::node* node = root.get(key);
            if (!node)
                return nullptr;
            if (const auto* tbl = node->as_table())
                return tbl;
            throw ConfigError("Expected table '" + std::string{ key } + "' in " + where);
        }

        net::RedirectMode parse_redirect_mode(const std::string& s, const std::string& where)
        {
            if (s == "none")
                return net::RedirectMode::follow_none;
            if (s == "safe_only")
                return net::RedirectMode::safe_only;
            if (s == "same_origin")
                return net::RedirectMode::same_origin;
            if (s == "all")
                return net::RedirectMode::follow_all;
            throw ConfigError("Unknown redirect_mode '" + s + "' in " + where);
        }

        AuthenticationStyle parse_auth_style(const std::string& s, const std::string& where)
        {
            if (s == "none")
                return AuthenticationStyle::none;
            if (s == "query")
                return AuthenticationStyle::query_parameter;
            if (s == "header")
                return AuthenticationStyle::header;
            if (s == "bearer")
                return AuthenticationStyle::bearer;
            throw ConfigError("Unknown auth_style '" + s + "' in " + where);
        }

        LogSinkChoice parse_log_sink(const std::string& s, const std::string& where)
        {
            if (s == "default")
                return LogSinkChoice::default_sink;
            if (s == "stderr")
                return LogSinkChoice::stderr_sink;
            if (s == "none")
                return LogSinkChoice::none;
            throw ConfigError("Unknown log sink '" + s + "' in " + where);
        }

        net::BeastTransportOptions read_transport(const toml::table& t, const std::string& where)
        {
            net::BeastTransportOptions o;
            o.connect_timeout = fetch_millis(t, "connect_timeout_ms", o.connect_timeout, where);
            o.handshake_timeout = fetch_millis(t, "handshake_timeout_ms", o.handshake_timeout, where);
            if (auto ua = fetch<std::string>(t, "user_agent", where))
                o.user_agent = std::move(*ua);
            if (auto verify = fetch<bool>(t, "verify_peer", where))
                o.verify_peer = *verify;
            if (auto ca = fetch<std::string>(t, "ca_file", where))
                o.ca_file = std::move(*ca);
            if (auto hops = fetch<std::int64_t>(t, "max_redirects", where))
            {
                if (*hops < 0)
                    throw ConfigError("'max_redirects' must not be negative in " + where);
                o.max_redirects = static_cast<std::size_t>(*hops);
            }
            if (auto mode = fetch<std::string>(t, "redirect_mode", where))
                o.redirect_mode = parse_redirect_mode(*mode, where);
            if (auto conns = fetch<std::int64_t>(t, "connections_per_host", where))
            {
                if (*conns <= 0)
                    throw ConfigError("'connections_per_host' must be positive in " + where);
                o.connections_per_host = static_cast<std::size_t>(*conns);
            }
            return o;
        }

        Api read_api(std::string_view name, const toml::table& t, const std::string& where)
        {
            const std::string api_where = "[apis." + std::string{ name } + "] of " + where;

            auto base = fetch<std::string>(t, "base_address", api_where);
            if (!base || base->empty())
                throw ConfigError("Missing key 'base_address' in " + api_where);

            auto style = AuthenticationStyle::none;
            if (auto s = fetch<std::string>(t, "auth_style", api_where))
                style = parse_auth_style(*s, api_where);

            std::string key_name = fetch<std::string>(t, "auth_key_name", api_where).value_or("key");

            std::string key_value = fetch<std::string>(t, "auth_key_value", api_where).value_or("");
            if (auto env = fetch<std::string>(t, "auth_key_env", api_where))
            {
                const char* v = std::getenv(env->c_str());
                if (!v)
                    throw ConfigError("Environment variable '" + *env + "' is not set for " + api_where);
                key_value = v;
            }

            return Api{ std::move(*base), style, std::move(key_name), std::move(key_value) };
        }
    } // namespace

    ConfigError::ConfigError(const std::string& msg) noexcept :
        std::runtime_error{ msg }
    {
    }

    // Validate and convert a parsed document.
    Config Config::from_table(const toml::table& root, const std::string& where)
    {
        Config cfg;

        if (const auto* t = section(root, "transport", where))
            cfg.transport_ = read_transport(*t, "[transport] of " + where);

        if (const auto* e = section(root, "executor", where))
        {
            const std::string exec_where = "[executor] of " + where;
            if (auto dbg = fetch<bool>(*e, "debug_print_bodies", exec_where))
                cfg.executor_.debug_print_bodies = *dbg;
            if (auto sink = fetch<std::string>(*e, "log", exec_where))
                cfg.log_sink_ = parse_log_sink(*sink, exec_where);
        }

        if (const auto* apis = section(root, "apis", where))
        {
            for (const auto& [key, node] : *apis)
            {
                const std::string_view name = key.str();
                const auto* t = node.as_table();
                if (!t)
                    throw ConfigError("Expected table 'apis." + std::string{ name } + "' in " + where);
                cfg.apis_.insert_or_assign(std::string{ name }, read_api(name, *t, where));
            }
        }

        return cfg;
    }

    Config Config::parse(std::string_view text, std::string_view source)
    {
        const std::string where{ source };
        toml::table tbl;
        try
        {
            tbl = toml::parse(text, source);
        }
        catch (const toml::parse_error& e)
        {
            throw ConfigError("TOML parse error in '" + where + "': " + std::string{ e.what() });
        }
        return from_table(tbl, where);
    }

    Config Config::load_file(const std::filesystem::path& path)
    {
        const auto path_str = path.string();
        if (path_str.empty())
            throw ConfigError("Config file path must not be empty");

        toml::table tbl;
        try
        {
            tbl = toml::parse_file(path_str);
        }
        catch (const toml::parse_error& e)
        {
            throw ConfigError("TOML parse error in '" + path_str + "': " + std::string{ e.what() });
        }
        catch (const std::filesystem::filesystem_error& e)
        {
            throw ConfigError("Cannot read config file '" + path_str + "': " + std::string{ e.what() });
        }
        return from_table(tbl, path_str);
    }

    const Api& Config::api(std::string_view name) const
    {
        if (auto it = apis_.find(name); it != apis_.end())
            return it->second;
        throw ConfigError("No API named '" + std::string{ name } + "' is configured");
    }

    bool Config::has_api(std::string_view name) const noexcept
    {
        return apis_.find(name) != apis_.end();
    }

    void Config::apply_logging() const
    {
        switch (log_sink_)
        {
        case LogSinkChoice::default_sink:
            log::set_sink(log::default_sink());
            break;
        case LogSinkChoice::stderr_sink:
            log::set_sink(log::stderr_sink());
            break;
        case LogSinkChoice::none:
            log::set_sink(log::null_sink());
            break;
        }
    }

} // namespace courier
