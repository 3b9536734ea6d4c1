#pragma once

#include <string>
#include <vector>

namespace scry::engine::http {

    struct Response {
        long status = 0;
        std::string body;

        bool ok() const { return status >= 200 && status < 300; }
    };

    /**
     * @brief POSTs a JSON body with libcurl and waits for the reply.
     * @param headers Extra "Name: value" header lines.
     * @param timeout_ms Whole-request deadline, 0 for none.
     * @throws RemoteBackendError on transport failure (DNS, connect, timeout).
     */
    Response post_json(const std::string& url,
                       const std::string& body,
                       const std::vector<std::string>& headers,
                       long timeout_ms);

}
