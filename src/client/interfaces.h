#pragma once

#include <functional>
#include <memory>

#include "../loadgen/http_types.h"

namespace Occbench {

/**
 * Interface for issuing one HTTP request and waiting for its response.
 * Implementations never throw for HTTP- or socket-level failures; they
 * return a response with status 0 and the TransportError set.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    virtual HttpResponse Execute(const HttpRequest& request) = 0;
};

/**
 * Creates one transport per worker. Workers never share a transport.
 */
using TransportFactory = std::function<std::unique_ptr<ITransport>(int worker_id)>;

} // namespace Occbench
