#pragma once

#include "wire.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>

namespace spyhub {

// Transport to the remote viewer. Posts are delivered on the session's
// event loop; the hub never looks at transport internals.
class iconnection {
public:
    using post_handler = std::function<void(const nlohmann::json& post)>;

    virtual ~iconnection() = default;

    virtual void subscribe(post_handler on_post) = 0;
    virtual void post(const message& m) = 0;
    virtual void disconnect() = 0;
};

using iconnection_sptr = std::shared_ptr<iconnection>;

} // namespace spyhub
