// C++ Standard Library
#include <cctype>

// Project
#include <courier/net/http/mime.hpp>

namespace courier::net::mime {

namespace {
    void trim(std::string_view& sv)
    {
        while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
            sv.remove_prefix(1);
        while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
            sv.remove_suffix(1);
    }

    std::string to_lower(std::string_view sv)
    {
        std::string s;
        s.reserve(sv.size());
        for (unsigned char c : sv)
            s.push_back(static_cast<char>(std::tolower(c)));
        return s;
    }

    bool is_token(std::string_view sv) noexcept
    {
        if (sv.empty())
            return false;
        for (unsigned char c : sv) {
            if (std::isspace(c) || c == '/' || c == ';' || c == '"' || c < 0x20)
                return false;
        }
        return true;
    }
} // namespace

std::optional<media_type> parse(std::string_view ct, std::error_code& ec)
{
    ec = {};
    trim(ct);

    const auto slash = ct.find('/');
    if (slash == std::string_view::npos) {
        ec = errc::invalid_content_type;
        return std::nullopt;
    }

    std::string_view type = ct.substr(0, slash);
    std::string_view rest = ct.substr(slash + 1);
    const auto semi = rest.find(';');
    std::string_view subtype = (semi == std::string_view::npos) ? rest : rest.substr(0, semi);
    trim(type);
    trim(subtype);
    if (!is_token(type) || !is_token(subtype)) {
        ec = errc::invalid_content_type;
        return std::nullopt;
    }

    media_type mt{to_lower(type), to_lower(subtype), {}};

    std::string_view params = (semi == std::string_view::npos) ? std::string_view{}
                                                               : rest.substr(semi + 1);
    while (!params.empty()) {
        const auto next = params.find(';');
        std::string_view kv = (next == std::string_view::npos) ? params : params.substr(0, next);
        params = (next == std::string_view::npos) ? std::string_view{} : params.substr(next + 1);

        trim(kv);
        const auto eq = kv.find('=');
        if (kv.empty() || eq == std::string_view::npos)
            continue;
        std::string_view key = kv.substr(0, eq);
        std::string_view val = kv.substr(eq + 1);
        trim(key);
        trim(val);
        if (to_lower(key) != "charset")
            continue;
        if (val.size() >= 2 && (val.front() == '"' || val.front() == '\'')
            && val.back() == val.front()) {
            val = val.substr(1, val.size() - 2);
        }
        mt.charset = to_lower(val);
    }
    return mt;
}

} // namespace courier::net::mime
