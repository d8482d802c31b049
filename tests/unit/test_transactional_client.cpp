#include <gtest/gtest.h>
#include "fake_driver.hpp"
#include "rdbcpp/core/database_client.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace rdbcpp::core;
using namespace rdbcpp::test;

namespace {

const std::string kInsert = "INSERT INTO legoset(id, name) VALUES(:id, :name)";
const std::string kBroken = "DELETE FROM locked_table";

} // namespace

class TransactionalClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        provider_ = std::make_shared<FakeConnectionProvider>();
        client_ = std::make_unique<TransactionalDatabaseClient>(provider_, options(FailurePrecedence::Rollback));

        ScriptedResult inserted;
        inserted.affectedRows = 1;
        provider_->script(kInsert, inserted);

        ScriptedResult sets;
        sets.columns = makeColumns({{"ID", SqlType::Integer}, {"NAME", SqlType::Text}});
        sets.rows = {
            {Value{std::int32_t{1}}, Value{std::string("A")}},
            {Value{std::int32_t{2}}, Value{std::string("B")}}};
        provider_->script("SELECT * FROM legoset", sets);

        provider_->failOn(kBroken, "lock conflict on no wait transaction");
    }

    static ClientOptions options(FailurePrecedence precedence) {
        ClientOptions options;
        options.dialect = "firebird";
        options.rollbackFailurePrecedence = precedence;
        return options;
    }

    static Single<std::uint64_t> insertSet(DatabaseClient& db, int id, const std::string& name) {
        return db.execute().sql(kInsert).bind("id", id).bind("name", name).fetch().rowsUpdated();
    }

    FakeState& state() { return provider_->state(); }

    std::shared_ptr<FakeConnectionProvider> provider_;
    std::unique_ptr<TransactionalDatabaseClient> client_;
};

// ============================================================================
// Grouped mode
// ============================================================================

TEST_F(TransactionalClientTest, UnitOfWorkIsLazy) {
    auto inserted = client_->inTransaction([](DatabaseClient& db) { return insertSet(db, 42, "X-Wing"); });

    EXPECT_EQ(state().begun.load(), 0);
    EXPECT_EQ(provider_->executedCount(), 0u);

    EXPECT_EQ(inserted.get(), 1u);
    EXPECT_EQ(state().begun.load(), 1);
}

TEST_F(TransactionalClientTest, SuccessCommits) {
    auto inserted = client_->inTransaction([](DatabaseClient& db) { return insertSet(db, 42, "X-Wing"); });
    EXPECT_EQ(inserted.get(), 1u);

    auto statement = provider_->lastStatement();
    EXPECT_TRUE(statement.inTransaction);
    EXPECT_EQ(state().committed.load(), 1);
    EXPECT_EQ(state().rolledBack.load(), 0);
    EXPECT_EQ(state().handlesReleased.load(), 1);
    EXPECT_EQ(state().autoCommits.load(), 0);
    EXPECT_EQ(provider_->outstanding(), 0);
    EXPECT_EQ(client_->getSynchronizer()->scopeCount(), 0u);
}

TEST_F(TransactionalClientTest, StatementsShareOneConnection) {
    auto rows = client_->inTransaction([](DatabaseClient& db) {
        auto first = db.select().from("legoset").fetch().all();
        auto second = db.select().from("legoset").fetch().all();
        return first.concatWith(second);
    }).toList();

    EXPECT_EQ(rows.size(), 4u);
    auto executed = provider_->executed();
    ASSERT_EQ(executed.size(), 2u);
    EXPECT_TRUE(executed[0].inTransaction);
    EXPECT_EQ(executed[0].connectionId, executed[1].connectionId);
    EXPECT_EQ(state().acquired.load(), 1);
    EXPECT_EQ(state().committed.load(), 1);
}

TEST_F(TransactionalClientTest, FailureRollsBackAndSurfacesOriginal) {
    auto work = client_->inTransaction([](DatabaseClient& db) {
        return insertSet(db, 42, "X-Wing").flatMap([&db](std::uint64_t) {
            return db.execute().sql(kBroken).fetch().rowsUpdated();
        });
    });

    try {
        work.get();
        FAIL() << "Expected ExecutionFailed";
    }
    catch (const ExecutionFailed& e) {
        EXPECT_EQ(e.getSQLState(), "42000");
        EXPECT_NE(std::string(e.what()).find("lock conflict"), std::string::npos);
        EXPECT_TRUE(e.getSuppressed().empty());
    }
    EXPECT_EQ(state().committed.load(), 0);
    EXPECT_EQ(state().rolledBack.load(), 1);
    EXPECT_EQ(provider_->outstanding(), 0);
    EXPECT_EQ(client_->getSynchronizer()->scopeCount(), 0u);
}

TEST_F(TransactionalClientTest, RollbackFailureTakesPrecedence) {
    state().failRollback = true;
    auto work = client_->inTransaction([](DatabaseClient& db) {
        return db.execute().sql(kBroken).then();
    });

    try {
        work.get();
        FAIL() << "Expected ExecutionFailed";
    }
    catch (const ExecutionFailed& e) {
        EXPECT_EQ(e.getSQLState(), "08006");
        ASSERT_EQ(e.getSuppressed().size(), 1u);
        EXPECT_THROW(std::rethrow_exception(e.getSuppressed()[0]), ExecutionFailed);
    }
    EXPECT_EQ(state().handlesReleased.load(), 1);
    EXPECT_EQ(provider_->outstanding(), 0);
}

TEST_F(TransactionalClientTest, OriginalFailureTakesPrecedence) {
    TransactionalDatabaseClient client(provider_, options(FailurePrecedence::Original));
    state().failRollback = true;
    auto work = client.inTransaction([](DatabaseClient& db) {
        return db.execute().sql(kBroken).then();
    });

    try {
        work.get();
        FAIL() << "Expected ExecutionFailed";
    }
    catch (const ExecutionFailed& e) {
        EXPECT_EQ(e.getSQLState(), "42000");
        ASSERT_EQ(e.getSuppressed().size(), 1u);
        try {
            std::rethrow_exception(e.getSuppressed()[0]);
        }
        catch (const ExecutionFailed& rollback) {
            EXPECT_EQ(rollback.getSQLState(), "08006");
        }
    }
}

TEST_F(TransactionalClientTest, BeginFailureLeavesNothingOpen) {
    state().failBegin = true;
    auto work = client_->inTransaction([](DatabaseClient& db) { return insertSet(db, 1, "A"); });

    EXPECT_THROW(work.get(), ExecutionFailed);
    EXPECT_EQ(provider_->executedCount(), 0u);
    EXPECT_EQ(provider_->outstanding(), 0);
    EXPECT_EQ(client_->getSynchronizer()->scopeCount(), 0u);
}

TEST_F(TransactionalClientTest, VoidUnitOfWork) {
    Single<void> done = client_->inTransaction([](DatabaseClient& db) {
        return db.execute().sql("UPDATE legoset SET name = 'x'").then();
    });

    done.get();
    EXPECT_EQ(state().committed.load(), 1);
    EXPECT_TRUE(provider_->lastStatement().inTransaction);
}

TEST_F(TransactionalClientTest, CancelledStreamRollsBack) {
    auto firstOnly = client_->inTransaction([](DatabaseClient& db) {
        return db.select().from("legoset").fetch().all();
    }).take(1).toList();

    EXPECT_EQ(firstOnly.size(), 1u);
    EXPECT_EQ(state().committed.load(), 0);
    EXPECT_EQ(state().rolledBack.load(), 1);
    EXPECT_EQ(provider_->outstanding(), 0);
    EXPECT_EQ(client_->getSynchronizer()->scopeCount(), 0u);
}

TEST_F(TransactionalClientTest, ScopeIsInvisibleOutsideThePull) {
    auto subscription = client_->inTransaction([](DatabaseClient& db) {
        return db.select().from("legoset").fetch().all();
    }).subscribe();

    ASSERT_TRUE(subscription.next().has_value());
    // Between pulls the calling thread has no ambient transaction
    EXPECT_EQ(client_->currentTransaction(), nullptr);
    client_->execute().sql("UPDATE minifig SET name = 'y'").then().get();
    EXPECT_FALSE(provider_->lastStatement().inTransaction);

    while (subscription.next()) {
    }
    EXPECT_EQ(state().committed.load(), 1);
}

TEST_F(TransactionalClientTest, RequiredJoinsAmbientTransaction) {
    auto scope = client_->enableTransactionSynchronization();
    client_->beginTransaction();
    client_->execute().sql("UPDATE legoset SET name = 'outer'").then().get();

    auto inner = client_->inTransaction([](DatabaseClient& db) { return insertSet(db, 7, "inner"); });
    EXPECT_EQ(inner.get(), 1u);

    // Joined work does not commit on its own
    EXPECT_EQ(state().committed.load(), 0);
    auto executed = provider_->executed();
    ASSERT_EQ(executed.size(), 2u);
    EXPECT_EQ(executed[0].connectionId, executed[1].connectionId);

    client_->commitTransaction();
    EXPECT_EQ(state().begun.load(), 1);
    EXPECT_EQ(state().committed.load(), 1);
}

TEST_F(TransactionalClientTest, JoinedFailureMarksRollbackOnly) {
    auto scope = client_->enableTransactionSynchronization();
    client_->beginTransaction();

    auto inner = client_->inTransaction([](DatabaseClient& db) { return db.execute().sql(kBroken).then(); });
    EXPECT_THROW(inner.get(), ExecutionFailed);

    auto context = client_->currentTransaction();
    ASSERT_NE(context, nullptr);
    EXPECT_TRUE(context->isRollbackOnly());

    EXPECT_THROW(client_->commitTransaction(), UnexpectedRollback);
    EXPECT_EQ(state().committed.load(), 0);
    EXPECT_EQ(state().rolledBack.load(), 1);
    EXPECT_EQ(client_->currentTransaction(), nullptr);
}

TEST_F(TransactionalClientTest, RequiresNewSuspendsAmbient) {
    auto scope = client_->enableTransactionSynchronization();
    client_->beginTransaction();
    auto outer = client_->currentTransaction();

    TransactionDefinition definition;
    definition.propagation = Propagation::RequiresNew;
    auto inner = client_->inTransaction([](DatabaseClient& db) { return insertSet(db, 9, "new"); }, definition);
    EXPECT_EQ(inner.get(), 1u);

    EXPECT_EQ(state().begun.load(), 2);
    EXPECT_EQ(state().committed.load(), 1);
    EXPECT_TRUE(provider_->lastStatement().inTransaction);
    // The outer transaction is untouched and ambient again
    EXPECT_EQ(client_->currentTransaction(), outer);
    EXPECT_TRUE(outer->isActive());
    client_->rollbackTransaction();
}

TEST_F(TransactionalClientTest, DefinitionReachesDriver) {
    TransactionDefinition definition;
    definition.isolation = IsolationLevel::ReadCommitted;
    client_->inTransaction([](DatabaseClient& db) { return insertSet(db, 1, "A"); }, definition).get();

    ASSERT_EQ(state().isolations.size(), 1u);
    EXPECT_EQ(state().isolations[0], IsolationLevel::ReadCommitted);
}

// ============================================================================
// Application-controlled mode
// ============================================================================

TEST_F(TransactionalClientTest, RequiresSynchronization) {
    EXPECT_THROW(client_->beginTransaction(), SynchronizationNotEnabled);
    EXPECT_THROW(client_->commitTransaction(), SynchronizationNotEnabled);
    EXPECT_THROW(client_->rollbackTransaction(), SynchronizationNotEnabled);
    EXPECT_EQ(state().begun.load(), 0);
}

TEST_F(TransactionalClientTest, BeginStatementsCommit) {
    auto scope = client_->enableTransactionSynchronization();
    client_->beginTransaction();
    ASSERT_NE(client_->currentTransaction(), nullptr);

    EXPECT_EQ(insertSet(*client_, 1, "A").get(), 1u);
    EXPECT_EQ(insertSet(*client_, 2, "B").get(), 1u);
    client_->commitTransaction();

    auto executed = provider_->executed();
    ASSERT_EQ(executed.size(), 2u);
    EXPECT_TRUE(executed[0].inTransaction);
    EXPECT_EQ(executed[0].connectionId, executed[1].connectionId);
    EXPECT_EQ(state().committed.load(), 1);
    EXPECT_EQ(client_->currentTransaction(), nullptr);

    // Statements after the commit auto-commit again
    insertSet(*client_, 3, "C").get();
    EXPECT_FALSE(provider_->lastStatement().inTransaction);
}

TEST_F(TransactionalClientTest, SecondCommitFails) {
    auto scope = client_->enableTransactionSynchronization();
    client_->beginTransaction();
    client_->commitTransaction();

    EXPECT_THROW(client_->commitTransaction(), TransactionInactive);
    EXPECT_THROW(client_->rollbackTransaction(), TransactionInactive);
    EXPECT_EQ(state().handlesReleased.load(), 1);
}

TEST_F(TransactionalClientTest, CommitWithoutBeginFails) {
    auto scope = client_->enableTransactionSynchronization();
    EXPECT_THROW(client_->commitTransaction(), TransactionInactive);
}

TEST_F(TransactionalClientTest, BeginTwiceFails) {
    auto scope = client_->enableTransactionSynchronization();
    client_->beginTransaction();
    EXPECT_THROW(client_->beginTransaction(), TransactionAlreadyActive);
    EXPECT_EQ(state().begun.load(), 1);
    client_->rollbackTransaction();
    EXPECT_EQ(state().rolledBack.load(), 1);
}

TEST_F(TransactionalClientTest, FailedCommitEndsAssociation) {
    auto scope = client_->enableTransactionSynchronization();
    client_->beginTransaction();
    state().failCommit = true;

    EXPECT_THROW(client_->commitTransaction(), ExecutionFailed);
    EXPECT_EQ(provider_->outstanding(), 0);
    EXPECT_THROW(client_->commitTransaction(), TransactionInactive);

    state().failCommit = false;
    client_->beginTransaction();
    client_->commitTransaction();
    EXPECT_EQ(state().committed.load(), 1);
}

TEST_F(TransactionalClientTest, ScopeDestructionRollsBack) {
    {
        auto scope = client_->enableTransactionSynchronization();
        client_->beginTransaction();
        insertSet(*client_, 1, "A").get();
    }

    EXPECT_EQ(state().rolledBack.load(), 1);
    EXPECT_EQ(state().committed.load(), 0);
    EXPECT_EQ(state().handlesReleased.load(), 1);
    EXPECT_EQ(provider_->outstanding(), 0);
    EXPECT_EQ(client_->currentTransaction(), nullptr);
}

TEST_F(TransactionalClientTest, CommitClosesCursorLeftOpen) {
    auto scope = client_->enableTransactionSynchronization();
    client_->beginTransaction();

    auto rows = client_->select().from("legoset").fetch().all().subscribe();
    ASSERT_TRUE(rows.next().has_value());
    EXPECT_EQ(state().cursorsOpened.load(), 1);

    client_->commitTransaction();
    EXPECT_EQ(state().cursorsClosed.load(), state().cursorsOpened.load());
    EXPECT_EQ(state().cursorsOutlivingLease.load(), 0);
    EXPECT_EQ(provider_->outstanding(), 0);

    // The abandoned stream reports the finished transaction
    EXPECT_THROW(rows.next(), TransactionInactive);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(TransactionalClientTest, ConcurrentStatementsShareOneConnectionSerially) {
    constexpr int kThreads = 4;
    constexpr int kRounds = 10;
    state().slowCalls = true;

    auto scope = client_->enableTransactionSynchronization();
    client_->beginTransaction();

    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([this, &scope, t]() {
            auto activation = scope.activate();
            for (int i = 0; i < kRounds; ++i) {
                EXPECT_EQ(insertSet(*client_, t * 100 + i, "worker").get(), 1u);
                EXPECT_EQ(client_->select().from("legoset").fetch().all().toList().size(), 2u);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    client_->commitTransaction();

    auto executed = provider_->executed();
    ASSERT_EQ(executed.size(), static_cast<size_t>(kThreads * kRounds * 2));
    for (const auto& statement : executed) {
        EXPECT_TRUE(statement.inTransaction);
        EXPECT_EQ(statement.connectionId, executed[0].connectionId);
    }
    EXPECT_EQ(state().acquired.load(), 1);
    EXPECT_EQ(state().overlappingCalls.load(), 0);
    EXPECT_EQ(state().autoCommits.load(), 0);
    EXPECT_EQ(state().committed.load(), 1);
    EXPECT_EQ(provider_->outstanding(), 0);
}

TEST_F(TransactionalClientTest, ConcurrentBeginOnOneScopeHasOneWinner) {
    constexpr int kThreads = 8;
    state().slowCalls = true;

    auto scope = client_->enableTransactionSynchronization();

    std::atomic<int> ready{0};
    std::atomic<int> won{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> contenders;
    for (int t = 0; t < kThreads; ++t) {
        contenders.emplace_back([&]() {
            auto activation = scope.activate();
            ready++;
            while (ready.load() < kThreads) {
                std::this_thread::yield();
            }
            try {
                client_->beginTransaction();
                won++;
            }
            catch (const TransactionAlreadyActive&) {
                rejected++;
            }
        });
    }
    for (auto& contender : contenders) {
        contender.join();
    }

    EXPECT_EQ(won.load(), 1);
    EXPECT_EQ(rejected.load(), kThreads - 1);
    // Losers that got as far as beginning rolled back and gave their connection back
    EXPECT_EQ(state().begun.load() - state().rolledBack.load(), 1);
    EXPECT_EQ(provider_->outstanding(), 1);

    ASSERT_NE(client_->currentTransaction(), nullptr);
    client_->commitTransaction();
    EXPECT_EQ(state().committed.load(), 1);
    EXPECT_EQ(provider_->outstanding(), 0);
}
