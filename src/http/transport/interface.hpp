#ifndef NERO_KITSU_TRANSPORT_INTERFACE_HPP
#define NERO_KITSU_TRANSPORT_INTERFACE_HPP

#include <memory>

#include "types.hpp"

namespace http::transport {

    // One in-flight exchange. The body is written and finished before block();
    // get() is valid once block() returned.
    class IExchange {
       public:
        IExchange() = default;
        virtual ~IExchange() = default;
        IExchange(const IExchange&) = delete;
        IExchange& operator=(const IExchange&) = delete;
        IExchange(IExchange&&) = delete;
        IExchange& operator=(IExchange&&) = delete;

        virtual OutgoingBody& body() = 0;
        // No timeout: a stalled peer blocks the caller.
        virtual void block() = 0;
        // Throws TransportError if the exchange failed.
        virtual IncomingResponse get() = 0;
    };

    class IOutgoingHandler {
       public:
        IOutgoingHandler() = default;
        virtual ~IOutgoingHandler() = default;
        IOutgoingHandler(const IOutgoingHandler&) = delete;
        IOutgoingHandler& operator=(const IOutgoingHandler&) = delete;
        IOutgoingHandler(IOutgoingHandler&&) = delete;
        IOutgoingHandler& operator=(IOutgoingHandler&&) = delete;

        virtual std::unique_ptr<IExchange> handle(OutgoingRequest req) = 0;
    };

}  // namespace http::transport

#endif
