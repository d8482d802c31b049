#include <gtest/gtest.h>
#include "rdbcpp/firebird/environment.hpp"
#include "rdbcpp/firebird/firebird_exception.hpp"
#include <string>

using namespace rdbcpp;
using rdbcpp::firebird::Environment;
using rdbcpp::firebird::FirebirdException;

// Status vectors are built locally: only the client library is needed, no server
class FirebirdExceptionTest : public ::testing::Test {
protected:
    void SetUp() override {
        status_ = Environment::getInstance().getMaster()->getStatus();
    }

    void TearDown() override {
        status_->dispose();
    }

    FirebirdException fromVector(const intptr_t* vector) {
        status_->setErrors(vector);
        Firebird::FbException fbEx(status_);
        return FirebirdException(fbEx);
    }

    Firebird::IStatus* status_ = nullptr;
};

TEST_F(FirebirdExceptionTest, ConstructorFromString) {
    FirebirdException ex("Not connected to database");

    EXPECT_STREQ(ex.what(), "Not connected to database");
    EXPECT_EQ(ex.getKind(), core::ErrorKind::Driver);
    EXPECT_EQ(ex.getErrorCode(), 0);
    EXPECT_EQ(ex.getSQLState(), "HY000");
    ASSERT_EQ(ex.getErrorMessages().size(), 1u);
}

TEST_F(FirebirdExceptionTest, ConversionFromStatus) {
    const intptr_t vector[] = {
        isc_arg_gds, 335544580,  // isc_dsql_relation_err
        isc_arg_string, reinterpret_cast<intptr_t>("LEGOSET"),
        isc_arg_end
    };
    auto ex = fromVector(vector);

    EXPECT_EQ(ex.getErrorCode(), 335544580);
    EXPECT_EQ(ex.getSQLState(), "42S02");
    ASSERT_GE(ex.getErrorMessages().size(), 1u);
    EXPECT_NE(ex.getErrorMessages()[0].find("LEGOSET"), std::string::npos);
}

TEST_F(FirebirdExceptionTest, ErrorChain) {
    const intptr_t vector[] = {
        isc_arg_gds, 335544321,  // isc_arith_except
        isc_arg_gds, 335544778,  // isc_division_by_zero
        isc_arg_string, reinterpret_cast<intptr_t>("Division by zero occurred"),
        isc_arg_number, 42,
        isc_arg_end
    };
    auto ex = fromVector(vector);

    EXPECT_GE(ex.getErrorMessages().size(), 2u);
    EXPECT_NE(std::string(ex.what()).find("Error chain:"), std::string::npos);
    // First GDS code wins
    EXPECT_EQ(ex.getErrorCode(), 335544321);
}

TEST_F(FirebirdExceptionTest, ServerSqlStateWins) {
    const intptr_t vector[] = {
        isc_arg_gds, 335544665,  // isc_unique_key_violation
        isc_arg_sql_state, reinterpret_cast<intptr_t>("23505"),
        isc_arg_end
    };
    EXPECT_EQ(fromVector(vector).getSQLState(), "23505");
}

TEST_F(FirebirdExceptionTest, EmptyStatus) {
    status_->init();
    Firebird::FbException fbEx(status_);

    EXPECT_NO_THROW({
        FirebirdException ex(fbEx);
        EXPECT_EQ(ex.getErrorCode(), 0);
        EXPECT_EQ(ex.getSQLState(), "HY000");
    });
}

TEST_F(FirebirdExceptionTest, LongErrorMessage) {
    std::string longText(2000, 'X');
    const intptr_t vector[] = {
        isc_arg_gds, 335544321,
        isc_arg_string, reinterpret_cast<intptr_t>(longText.c_str()),
        isc_arg_end
    };
    auto ex = fromVector(vector);

    EXPECT_NE(std::string(ex.what()).length(), 0u);
    EXPECT_LE(std::string(ex.what()).length(), 5000u);
}

TEST_F(FirebirdExceptionTest, SQLStateMapping) {
    struct TestCase {
        int error_code;
        const char* expected_state;
        const char* description;
    };

    const TestCase testCases[] = {
        {335544321, "22012", "Division by zero"},
        {335544347, "23000", "Integrity constraint violation"},
        {335544665, "23000", "Unique key violation"},
        {335544336, "40001", "Deadlock"},
        {335544345, "40001", "Lock conflict"},
        {335544337, "25000", "Invalid transaction state"},
        {123456789, "HY000", "Unknown error - default state"}
    };

    for (const auto& tc : testCases) {
        const intptr_t vector[] = {isc_arg_gds, tc.error_code, isc_arg_end};
        EXPECT_EQ(fromVector(vector).getSQLState(), tc.expected_state)
            << "Failed for " << tc.description << " (code " << tc.error_code << ")";
    }
}

TEST_F(FirebirdExceptionTest, WrappedKeepsDriverDetails) {
    const intptr_t vector[] = {isc_arg_gds, 335544345, isc_arg_end};  // isc_lock_conflict
    auto ex = fromVector(vector);

    auto wrapped = core::ExecutionFailed::wrap(std::make_exception_ptr(ex), "UPDATE LEGOSET");
    EXPECT_EQ(wrapped.getErrorCode(), 335544345);
    EXPECT_EQ(wrapped.getSQLState(), "40001");
    EXPECT_THROW(std::rethrow_exception(wrapped.getCause()), FirebirdException);
}
