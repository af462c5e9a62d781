// C++ Standard Library
#include <system_error>
#include <utility>

// Boost
#include <boost/system/system_error.hpp>

// Glaze
#include <glaze/json.hpp>

// GSL
#include <gsl/gsl>

// Project
#include <courier/net/http/error.hpp>
#include <courier/net/http/mime.hpp>
#include <courier/request_executor.hpp>

namespace courier
{

    RequestExecutor::RequestExecutor(boost::asio::any_io_executor executor,
                                     std::shared_ptr<net::Transport> transport,
                                     ExecutorOptions options) :
        executor_{ std::move(executor) }, transport_{ std::move(transport) }, options_{ options }
    {
        Expects(transport_ != nullptr);
    }

    boost::asio::awaitable<net::WireResponse> RequestExecutor::dispatch(const net::WireRequest& request,
                                                                        CancelHandle cancel)
    {
        // No co_await inside a handler; record the failure and raise below.
        std::error_code failure;
        try
        {
            auto response = co_await transport_->send(request, std::move(cancel));
            debug_print(response);
            co_return response;
        }
        catch (const boost::system::system_error& e)
        {
            failure = e.code();
        }
        catch (const std::system_error& e)
        {
            failure = e.code();
        }
        raise(TransportError{ net::classify(failure), failure, RequestContext::from(request) }, "transport");
    }

    void RequestExecutor::debug_print(const net::WireResponse& response) const
    {
        if (!options_.debug_print_bodies)
            return;
        if (!response.body)
        {
            log::debug("executor", "There was no data returned.");
            return;
        }

        const auto ct = response.headers.find("Content-Type");
        if (ct != response.headers.end() && net::mime::is_json(ct->second))
            log::debug("executor", glz::prettify_json(*response.body));
        else
            log::debug("executor", *response.body);
    }

    boost::asio::awaitable<void> RequestExecutor::execute(const Endpoint& endpoint,
                                                          std::function<bool()> predicate,
                                                          CancelHandle cancel)
    {
        co_await execute(endpoint.build_request(), std::move(predicate), std::move(cancel));
    }

    boost::asio::awaitable<void> RequestExecutor::execute(net::WireRequest request,
                                                          std::function<bool()> predicate,
                                                          CancelHandle cancel)
    {
        const auto context = RequestContext::from(request);
        const auto response = co_await dispatch(request, std::move(cancel));

        // HEAD responses carry no body by definition
        if (!response.body && request.method != net::HttpMethod::head)
            raise(BadResponseError{ context, response.status }, "response");

        if (predicate && !predicate())
            raise(PreconditionFailure{ context }, "precondition");

        if (!response.is_success())
            raise(BadResponseError{ context, response.status }, "response");
    }

} // namespace courier
