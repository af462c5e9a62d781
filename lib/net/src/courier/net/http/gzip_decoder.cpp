// C++ Standard Library
#include <string>
#include <string_view>
#include <system_error>

// Zlib
#include <zlib.h>

// GSL
#include <gsl/gsl>

// Project
#include <courier/net/http/encoding.hpp>
#include <courier/net/http/error.hpp>

namespace courier::net::encoding {

bool gzip_decode(std::string_view in, std::string& out, std::error_code& ec)
{
    z_stream zs{};
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(in.data()));
    zs.avail_in = static_cast<uInt>(in.size());

    // 16 + MAX_WBITS: expect a gzip wrapper, not raw zlib
    if (inflateInit2(&zs, 16 + MAX_WBITS) != Z_OK) {
        ec = errc::decompression_failure;
        return false;
    }
    auto release = gsl::finally([&zs] { inflateEnd(&zs); });

    out.clear();
    unsigned char buf[1 << 14];
    int ret = Z_OK;

    do {
        zs.next_out = buf;
        zs.avail_out = static_cast<uInt>(sizeof(buf));

        ret = inflate(&zs, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            ec = errc::decompression_failure;
            return false;
        }
        // Truncated input: zlib made no progress and wants more.
        if (ret == Z_OK && zs.avail_in == 0 && zs.avail_out == sizeof(buf)) {
            ec = errc::decompression_failure;
            return false;
        }

        const std::size_t produced = sizeof(buf) - zs.avail_out;
        if (produced)
            out.append(reinterpret_cast<const char*>(buf), produced);
    } while (ret != Z_STREAM_END);

    ec.clear();
    return true;
}

} // namespace courier::net::encoding
