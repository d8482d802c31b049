#pragma once

// Version information
#define RDBCPP_VERSION_MAJOR 1
#define RDBCPP_VERSION_MINOR 0
#define RDBCPP_VERSION_PATCH 0

// Statement pipeline
#include "rdbcpp/core/exception.hpp"
#include "rdbcpp/core/types.hpp"
#include "rdbcpp/core/parameter.hpp"
#include "rdbcpp/core/criteria.hpp"
#include "rdbcpp/core/statement_spec.hpp"
#include "rdbcpp/core/row.hpp"
#include "rdbcpp/core/entity_mapper.hpp"
#include "rdbcpp/core/result_stream.hpp"
#include "rdbcpp/core/result_consumer.hpp"
#include "rdbcpp/core/execution_engine.hpp"

// Transactions and the client facade
#include "rdbcpp/core/transaction_context.hpp"
#include "rdbcpp/core/transaction_synchronizer.hpp"
#include "rdbcpp/core/database_client.hpp"

// Convenience namespace
namespace rdbcpp {
    using namespace rdbcpp::core;
}
