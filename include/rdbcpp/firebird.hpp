#pragma once

// Client core
#include "rdbcpp/rdbcpp.hpp"

// Firebird driver binding
#include "rdbcpp/firebird/firebird_exception.hpp"
#include "rdbcpp/firebird/connection.hpp"
#include "rdbcpp/firebird/connection_provider.hpp"

// Configuration and logging
#include "rdbcpp_util/config.h"
#include "rdbcpp_util/config_loader.h"
#include "rdbcpp_util/logging.h"
