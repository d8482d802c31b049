#include <gtest/gtest.h>
#include "fake_driver.hpp"
#include "rdbcpp/core/exception.hpp"
#include "rdbcpp/core/transaction_context.hpp"
#include <memory>
#include <string>

using namespace rdbcpp::core;
using namespace rdbcpp::test;

class TransactionContextTest : public ::testing::Test {
protected:
    void SetUp() override {
        provider_ = std::make_shared<FakeConnectionProvider>();
    }

    FakeState& state() { return provider_->state(); }

    std::shared_ptr<FakeConnectionProvider> provider_;
};

TEST_F(TransactionContextTest, BeginCommit) {
    auto context = TransactionContext::create(provider_);
    EXPECT_EQ(context->getState(), TransactionState::None);
    EXPECT_EQ(provider_->outstanding(), 0);

    context->begin();
    EXPECT_TRUE(context->isActive());
    EXPECT_EQ(state().begun.load(), 1);
    EXPECT_EQ(provider_->outstanding(), 1);

    context->commit();
    EXPECT_EQ(context->getState(), TransactionState::Committed);
    EXPECT_EQ(state().committed.load(), 1);
    EXPECT_EQ(state().handlesReleased.load(), 1);
    EXPECT_EQ(provider_->outstanding(), 0);
}

TEST_F(TransactionContextTest, DistinctIds) {
    auto a = TransactionContext::create(provider_);
    auto b = TransactionContext::create(provider_);
    EXPECT_NE(a->getId(), b->getId());
}

TEST_F(TransactionContextTest, DefinitionReachesDriver) {
    TransactionDefinition definition;
    definition.isolation = IsolationLevel::Serializable;
    definition.name = "nightly-import";

    auto context = TransactionContext::create(provider_, definition);
    context->begin();
    ASSERT_EQ(state().isolations.size(), 1u);
    EXPECT_EQ(state().isolations[0], IsolationLevel::Serializable);
    EXPECT_EQ(context->getDefinition().name, "nightly-import");
    context->rollback();
}

TEST_F(TransactionContextTest, BeginTwiceFails) {
    auto context = TransactionContext::create(provider_);
    context->begin();
    EXPECT_THROW(context->begin(), TransactionAlreadyActive);
    context->rollback();

    // Terminal contexts cannot be restarted
    EXPECT_THROW(context->begin(), TransactionInactive);
}

TEST_F(TransactionContextTest, TerminalStateRejectsFinish) {
    auto context = TransactionContext::create(provider_);
    context->begin();
    context->rollback();

    EXPECT_EQ(context->getState(), TransactionState::RolledBack);
    EXPECT_THROW(context->commit(), TransactionInactive);
    EXPECT_THROW(context->rollback(), TransactionInactive);
    EXPECT_EQ(state().handlesReleased.load(), 1);
}

TEST_F(TransactionContextTest, CommitBeforeBeginFails) {
    auto context = TransactionContext::create(provider_);
    EXPECT_THROW(context->commit(), TransactionInactive);
    EXPECT_THROW(context->setRollbackOnly(), TransactionInactive);
    EXPECT_THROW(context->executeStatement("SELECT 1 FROM RDB$DATABASE", {}), TransactionInactive);
}

TEST_F(TransactionContextTest, BeginFailureReleasesConnection) {
    state().failBegin = true;
    auto context = TransactionContext::create(provider_);

    try {
        context->begin();
        FAIL() << "Expected ExecutionFailed";
    }
    catch (const ExecutionFailed& e) {
        EXPECT_EQ(e.getSQLState(), "08003");
    }
    EXPECT_EQ(context->getState(), TransactionState::None);
    EXPECT_EQ(provider_->outstanding(), 0);
}

TEST_F(TransactionContextTest, CommitFailureStillReleasesHandle) {
    auto context = TransactionContext::create(provider_);
    context->begin();
    state().failCommit = true;

    EXPECT_THROW(context->commit(), ExecutionFailed);
    EXPECT_EQ(context->getState(), TransactionState::RolledBack);
    EXPECT_EQ(state().handlesReleased.load(), 1);
    EXPECT_EQ(provider_->outstanding(), 0);

    EXPECT_THROW(context->commit(), TransactionInactive);
    EXPECT_EQ(state().handlesReleased.load(), 1);
}

TEST_F(TransactionContextTest, RollbackFailureStillReleasesHandle) {
    auto context = TransactionContext::create(provider_);
    context->begin();
    state().failRollback = true;

    EXPECT_THROW(context->rollback(), ExecutionFailed);
    EXPECT_EQ(context->getState(), TransactionState::RolledBack);
    EXPECT_EQ(state().handlesReleased.load(), 1);
    EXPECT_EQ(provider_->outstanding(), 0);
}

TEST_F(TransactionContextTest, RollbackOnlyCommitRollsBack) {
    auto context = TransactionContext::create(provider_);
    context->begin();
    context->setRollbackOnly();
    EXPECT_TRUE(context->isRollbackOnly());

    EXPECT_THROW(context->commit(), UnexpectedRollback);
    EXPECT_EQ(context->getState(), TransactionState::RolledBack);
    EXPECT_EQ(state().committed.load(), 0);
    EXPECT_EQ(state().rolledBack.load(), 1);
    EXPECT_EQ(state().handlesReleased.load(), 1);
}

TEST_F(TransactionContextTest, StatementsRunOnContextConnection) {
    auto context = TransactionContext::create(provider_);
    context->begin();

    auto first = context->executeStatement("UPDATE A SET X = 1", {});
    first->close();
    auto second = context->executeStatement("UPDATE B SET X = 2", {});
    second->close();

    auto executed = provider_->executed();
    ASSERT_EQ(executed.size(), 2u);
    EXPECT_TRUE(executed[0].inTransaction);
    EXPECT_TRUE(executed[1].inTransaction);
    EXPECT_EQ(executed[0].connectionId, executed[1].connectionId);
    EXPECT_EQ(state().acquired.load(), 1);
    context->commit();
}

TEST_F(TransactionContextTest, CursorFailsAfterCommit) {
    ScriptedResult numbers;
    numbers.columns = makeColumns({{"N", SqlType::Integer}});
    numbers.rows = {{Value{std::int32_t{1}}}, {Value{std::int32_t{2}}}};
    provider_->script("SELECT N FROM NUMBERS", numbers);

    auto context = TransactionContext::create(provider_);
    context->begin();
    auto cursor = context->executeStatement("SELECT N FROM NUMBERS", {});
    ASSERT_TRUE(cursor->next().has_value());

    context->commit();
    // Closed on the driver before the connection went back
    EXPECT_EQ(state().cursorsClosed.load(), state().cursorsOpened.load());
    EXPECT_EQ(state().cursorsOutlivingLease.load(), 0);
    EXPECT_EQ(provider_->outstanding(), 0);

    EXPECT_THROW(cursor->next(), TransactionInactive);
    EXPECT_NO_THROW(cursor->close());
    EXPECT_EQ(cursor->columns().size(), 1u);
}

TEST_F(TransactionContextTest, RollbackClosesEveryOpenCursor) {
    ScriptedResult numbers;
    numbers.columns = makeColumns({{"N", SqlType::Integer}});
    numbers.rows = {{Value{std::int32_t{1}}}, {Value{std::int32_t{2}}}};
    provider_->script("SELECT N FROM NUMBERS", numbers);

    auto context = TransactionContext::create(provider_);
    context->begin();
    auto first = context->executeStatement("SELECT N FROM NUMBERS", {});
    auto second = context->executeStatement("SELECT N FROM NUMBERS", {});
    auto third = context->executeStatement("SELECT N FROM NUMBERS", {});
    third->close();
    third.reset();
    ASSERT_TRUE(first->next().has_value());
    EXPECT_EQ(state().cursorsOpened.load(), 3);
    EXPECT_EQ(state().cursorsClosed.load(), 1);

    context->rollback();
    EXPECT_EQ(state().cursorsClosed.load(), 3);
    EXPECT_EQ(state().cursorsOutlivingLease.load(), 0);
    EXPECT_EQ(provider_->outstanding(), 0);
    EXPECT_THROW(second->next(), TransactionInactive);
}

TEST_F(TransactionContextTest, ClosedCursorEndsQuietly) {
    auto context = TransactionContext::create(provider_);
    context->begin();
    auto cursor = context->executeStatement("SELECT N FROM NUMBERS", {});
    cursor->close();
    EXPECT_FALSE(cursor->next().has_value());
    context->commit();
}

TEST_F(TransactionContextTest, StatementFailureIsWrapped) {
    provider_->failOn("DELETE FROM LOCKED", "lock conflict on no wait transaction");
    auto context = TransactionContext::create(provider_);
    context->begin();

    EXPECT_THROW(context->executeStatement("DELETE FROM LOCKED", {}), ExecutionFailed);
    // The context stays usable
    EXPECT_TRUE(context->isActive());
    context->rollback();
}

TEST_F(TransactionContextTest, DestructorRollsBackActiveContext) {
    {
        auto context = TransactionContext::create(provider_);
        context->begin();
    }
    EXPECT_EQ(state().rolledBack.load(), 1);
    EXPECT_EQ(state().handlesReleased.load(), 1);
    EXPECT_EQ(provider_->outstanding(), 0);
}

TEST_F(TransactionContextTest, NullProviderRejected) {
    EXPECT_THROW(TransactionContext::create(nullptr), InvalidSpecification);
}

TEST(TransactionStateTest, Names) {
    EXPECT_EQ(toString(TransactionState::Active), "ACTIVE");
    EXPECT_EQ(toString(TransactionState::RolledBack), "ROLLED_BACK");
    EXPECT_EQ(toString(IsolationLevel::RepeatableRead), "repeatable_read");
    EXPECT_EQ(parseIsolationLevel("Read-Committed"), IsolationLevel::ReadCommitted);
    EXPECT_THROW(parseIsolationLevel("snapshot"), InvalidSpecification);
}
