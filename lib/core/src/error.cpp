// C++ Standard Library
#include <string_view>
#include <utility>

// GSL
#include <gsl/gsl>

// Project
#include <courier/error.hpp>

namespace courier
{

    namespace
    {
        struct error_category_impl final : std::error_category
        {
            const char* name() const noexcept override
            {
                return "courier";
            }

            std::string message(int ev) const override
            {
                switch (static_cast<errc>(ev))
                {
                case errc::transport_failure:
                    return "transport failure";
                case errc::no_data_or_bad_response:
                    return "no data or bad response";
                case errc::decode_failure:
                    return "response body could not be decoded";
                case errc::backend_error:
                    return "backend reported an error";
                case errc::precondition_failure:
                    return "response failed the caller's precondition";
                case errc::unknown_content:
                    return "stream chunk is not valid UTF-8";
                case errc::empty_content:
                    return "stream chunk is empty";
                }
                return "unknown courier error";
            }
        };

        std::string describe(std::string_view what, const RequestContext& ctx)
        {
            std::string out{ what };
            out.append(" (");
            out.append(net::to_string(ctx.method));
            out.push_back(' ');
            out.append(ctx.url);
            out.push_back(')');
            return out;
        }
    } // namespace

    const std::error_category& error_category() noexcept
    {
        static error_category_impl cat;
        return cat;
    }

    RequestContext RequestContext::from(const net::WireRequest& request)
    {
        return RequestContext{ .url = request.url, .method = request.method, .headers = request.headers };
    }

    NetworkError::NetworkError(errc code, const std::string& what, RequestContext context) :
        std::runtime_error{ what }, code_{ code }, context_{ std::move(context) }
    {
    }

    TransportError::TransportError(net::TransportFailure failure,
                                   std::error_code underlying,
                                   RequestContext context) :
        NetworkError{ errc::transport_failure,
                      describe(std::string{ "transport " } + net::to_string(failure) + " failure: "
                                   + underlying.message(),
                               context),
                      context },
        failure_{ failure }, underlying_{ underlying }
    {
    }

    BadResponseError::BadResponseError(RequestContext context, std::optional<int> status) :
        NetworkError{ errc::no_data_or_bad_response,
                      describe(status ? "bad response status " + std::to_string(*status)
                                      : std::string{ "no data or bad response" },
                               context),
                      context },
        status_{ status }
    {
    }

    DecodeError::DecodeError(std::string raw_body, std::string detail, RequestContext context) :
        NetworkError{ errc::decode_failure, describe("decode failure: " + detail, context), context },
        raw_body_{ std::move(raw_body) }, detail_{ std::move(detail) }
    {
    }

    BackendError::BackendError(std::string message, RequestContext context) :
        NetworkError{ errc::backend_error, describe("backend error: " + message, context), context },
        message_{ std::move(message) }
    {
    }

    PreconditionFailure::PreconditionFailure(RequestContext context) :
        NetworkError{ errc::precondition_failure, describe("precondition failure", context), context }
    {
    }

    StreamingError::StreamingError(errc kind, RequestContext context) :
        NetworkError{ kind, describe(make_error_code(kind).message(), context), context },
        kind_{ kind }
    {
        Expects(kind == errc::unknown_content || kind == errc::empty_content);
    }

} // namespace courier
