#pragma once

#include "rdbcpp/firebird/firebird_compat.hpp"
#include "rdbcpp/core/exception.hpp"

namespace rdbcpp {
namespace firebird {

/**
 * Process-wide Firebird interfaces (master, dispatcher, util)
 */
class Environment {
public:
    static Environment& getInstance() {
        static Environment instance;
        return instance;
    }

    Firebird::IMaster*   getMaster()   const { return master_;   }
    Firebird::IProvider* getProvider() const { return provider_; }
    Firebird::IUtil*     getUtil()     const { return util_;     }

    Environment(const Environment&)            = delete;
    Environment& operator=(const Environment&) = delete;
    Environment(Environment&&)                 = delete;
    Environment& operator=(Environment&&)      = delete;

private:
    Environment()
        : master_(Firebird::fb_get_master_interface())
        , provider_(nullptr)
        , util_(nullptr)
    {
        if (!master_)
            throw core::ExecutionFailed("Failed to get Firebird master interface");
        provider_ = master_->getDispatcher();
        if (!provider_)
            throw core::ExecutionFailed("Failed to get Firebird provider interface");
        util_ = master_->getUtilInterface();
        if (!util_)
            throw core::ExecutionFailed("Failed to get Firebird util interface");
    }

    ~Environment() = default; // owned by the client library

    Firebird::IMaster*   master_;
    Firebird::IProvider* provider_;
    Firebird::IUtil*     util_;
};

} // namespace firebird
} // namespace rdbcpp
