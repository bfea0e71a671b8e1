// EN: Unit tests for the Stage Registry - forward-only transitions, recovery resets, checkpoints and export.
// FR: Tests unitaires du Stage Registry - transitions vers l'avant, réinitialisations, checkpoints et export.

#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "orchestrator/orchestration_config.hpp"
#include "orchestrator/stage_registry.hpp"
#include "test_helpers.hpp"

using namespace OBF;
using namespace OBF::Orchestrator;
using namespace std::chrono_literals;

// EN: Test fixture with the built-in onboarding stages and one session
// FR: Fixture de test avec les étapes d'onboarding intégrées et une session
class StageRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_ = std::make_unique<StageRegistry>(DefaultCatalog::onboardingStages());
        ASSERT_TRUE(registry_->createSession("s-1"));
    }

    void complete(const std::string& stage) {
        ASSERT_EQ(registry_->transition("s-1", stage, StageStatus::PROCESSING, clock_.now()), TransitionResult::APPLIED);
        ASSERT_EQ(registry_->transition("s-1", stage, StageStatus::COMPLETED, clock_.now()), TransitionResult::APPLIED);
    }

    Testing::QuietLogger quiet_;
    Testing::ManualClock clock_;
    std::unique_ptr<StageRegistry> registry_;
};

// EN: Definitions keep their order and duplicate or empty ids are refused
// FR: Les définitions gardent leur ordre et les ids en double ou vides sont refusés
TEST_F(StageRegistryTest, DefinitionsAndValidation) {
    EXPECT_EQ(registry_->stageCount(), 5u);
    EXPECT_EQ(registry_->indexOf("it_provisioning"), 2u);
    EXPECT_FALSE(registry_->indexOf("payroll").has_value());
    EXPECT_EQ(registry_->definition("contract_management")->criticality, StageCriticality::HIGH);

    EXPECT_THROW(StageRegistry({}), std::invalid_argument);
    EXPECT_THROW(StageRegistry({{"a", "A", StageCriticality::LOW, {}}, {"a", "A2", StageCriticality::LOW, {}}}),
                 std::invalid_argument);
    EXPECT_THROW(StageRegistry({{"", "Unnamed", StageCriticality::LOW, {}}}), std::invalid_argument);
}

// EN: A new session starts with every stage WAITING; sessions are created only once
// FR: Une nouvelle session démarre avec chaque étape WAITING ; une session n'est créée qu'une fois
TEST_F(StageRegistryTest, SessionCreation) {
    EXPECT_FALSE(registry_->createSession("s-1"));
    auto stages = registry_->getStages("s-1");
    ASSERT_EQ(stages.size(), 5u);
    for (const auto& stage : stages) {
        EXPECT_EQ(stage.status, StageStatus::WAITING);
        EXPECT_FALSE(stage.started_at.has_value());
    }
    EXPECT_TRUE(registry_->getStages("missing").empty());
    EXPECT_FALSE(registry_->getStage("s-1", "payroll").has_value());
}

// EN: Status only moves forward, COMPLETED is terminal, repeats are UNCHANGED
// FR: Le statut n'avance que vers l'avant, COMPLETED est terminal, les répétitions sont UNCHANGED
TEST_F(StageRegistryTest, ForwardOnlyTransitions) {
    const auto start = clock_.now();
    EXPECT_EQ(registry_->transition("s-1", "data_collection", StageStatus::PROCESSING, start), TransitionResult::APPLIED);
    clock_.advance(5min);
    EXPECT_EQ(registry_->transition("s-1", "data_collection", StageStatus::PROCESSING, clock_.now()),
              TransitionResult::UNCHANGED);
    EXPECT_EQ(registry_->getStage("s-1", "data_collection")->started_at, start);

    EXPECT_EQ(registry_->transition("s-1", "data_collection", StageStatus::FAILED, clock_.now()), TransitionResult::APPLIED);
    EXPECT_EQ(registry_->transition("s-1", "data_collection", StageStatus::PROCESSING, clock_.now()),
              TransitionResult::REJECTED);
    EXPECT_EQ(registry_->transition("s-1", "data_collection", StageStatus::WAITING, clock_.now()),
              TransitionResult::REJECTED);

    EXPECT_EQ(registry_->transition("s-1", "data_collection", StageStatus::COMPLETED, clock_.now()),
              TransitionResult::APPLIED);
    auto record = registry_->getStage("s-1", "data_collection");
    EXPECT_EQ(record->completed_at, clock_.now());
    EXPECT_DOUBLE_EQ(record->progress_percent, 100.0);
    EXPECT_EQ(registry_->transition("s-1", "data_collection", StageStatus::ESCALATED, clock_.now()),
              TransitionResult::REJECTED);

    EXPECT_EQ(registry_->transition("nobody", "data_collection", StageStatus::PROCESSING, clock_.now()),
              TransitionResult::NOT_FOUND);
    EXPECT_EQ(registry_->transition("s-1", "payroll", StageStatus::PROCESSING, clock_.now()),
              TransitionResult::NOT_FOUND);
}

// EN: A gate-refused stage moves from ESCALATED straight to COMPLETED on bypass
// FR: Une étape refusée par le gate passe d'ESCALATED directement à COMPLETED sur bypass
TEST_F(StageRegistryTest, EscalatedCanComplete) {
    registry_->transition("s-1", "it_provisioning", StageStatus::PROCESSING, clock_.now());
    EXPECT_EQ(registry_->transition("s-1", "it_provisioning", StageStatus::ESCALATED, clock_.now()),
              TransitionResult::APPLIED);
    EXPECT_EQ(registry_->transition("s-1", "it_provisioning", StageStatus::COMPLETED, clock_.now()),
              TransitionResult::APPLIED);
}

// EN: update() changes counters but refuses status changes
// FR: update() modifie les compteurs mais refuse les changements de statut
TEST_F(StageRegistryTest, UpdateCannotChangeStatus) {
    EXPECT_TRUE(registry_->update("s-1", "data_aggregation", [](StageRecord& record) {
        record.error_count += 2;
        record.errors.push_back("Connection timeout");
    }));
    EXPECT_EQ(registry_->getStage("s-1", "data_aggregation")->error_count, 2);

    EXPECT_THROW(registry_->update("s-1", "data_aggregation",
                                   [](StageRecord& record) { record.status = StageStatus::COMPLETED; }),
                 StateInconsistencyError);
    EXPECT_EQ(registry_->getStage("s-1", "data_aggregation")->status, StageStatus::WAITING);
    EXPECT_FALSE(registry_->update("s-1", "payroll", [](StageRecord&) {}));
}

// EN: resetForRetry re-opens a failed stage but never a completed one
// FR: resetForRetry rouvre une étape en échec mais jamais une étape terminée
TEST_F(StageRegistryTest, ResetForRetry) {
    registry_->transition("s-1", "data_collection", StageStatus::PROCESSING, clock_.now());
    registry_->transition("s-1", "data_collection", StageStatus::TIMEOUT, clock_.now());
    registry_->update("s-1", "data_collection", [](StageRecord& record) {
        record.error_count = 1;
        record.outcome_fingerprint = "abc";
    });

    ASSERT_TRUE(registry_->resetForRetry("s-1", "data_collection"));
    auto record = registry_->getStage("s-1", "data_collection");
    EXPECT_EQ(record->status, StageStatus::PROCESSING);
    EXPECT_EQ(record->error_count, 1);
    EXPECT_TRUE(record->outcome_fingerprint.empty());

    registry_->transition("s-1", "data_collection", StageStatus::COMPLETED, clock_.now());
    EXPECT_FALSE(registry_->resetForRetry("s-1", "data_collection"));
}

// EN: Stages after the last completed one return to WAITING; completed ones are untouched
// FR: Les étapes après la dernière terminée reviennent à WAITING ; les terminées sont intactes
TEST_F(StageRegistryTest, ResetAfterLastCompleted) {
    EXPECT_FALSE(registry_->resetAfterLastCompleted("s-1").has_value());

    complete("data_collection");
    complete("data_aggregation");
    registry_->transition("s-1", "it_provisioning", StageStatus::PROCESSING, clock_.now());
    registry_->transition("s-1", "it_provisioning", StageStatus::FAILED, clock_.now());
    EXPECT_EQ(registry_->lastCompletedStage("s-1"), "data_aggregation");

    auto resume = registry_->resetAfterLastCompleted("s-1");
    ASSERT_TRUE(resume.has_value());
    EXPECT_EQ(*resume, 2u);

    auto stages = registry_->getStages("s-1");
    EXPECT_EQ(stages[0].status, StageStatus::COMPLETED);
    EXPECT_EQ(stages[1].status, StageStatus::COMPLETED);
    EXPECT_EQ(stages[2].status, StageStatus::WAITING);
    EXPECT_FALSE(stages[2].started_at.has_value());
}

// EN: A checkpoint restores the clean dispatched state and keeps the error history
// FR: Un checkpoint restaure l'état propre d'envoi et garde l'historique d'erreurs
TEST_F(StageRegistryTest, CheckpointRestore) {
    EXPECT_FALSE(registry_->restoreCheckpoint("s-1", "contract_management"));

    registry_->transition("s-1", "contract_management", StageStatus::PROCESSING, clock_.now());
    ASSERT_TRUE(registry_->checkpoint("s-1", "contract_management"));

    registry_->update("s-1", "contract_management", [](StageRecord& record) {
        record.output_payload = {{"contractGenerated", false}};
        record.errors.push_back("Signature provider error");
        record.error_count = 1;
    });
    registry_->transition("s-1", "contract_management", StageStatus::FAILED, clock_.now());

    ASSERT_TRUE(registry_->restoreCheckpoint("s-1", "contract_management"));
    auto record = registry_->getStage("s-1", "contract_management");
    EXPECT_EQ(record->status, StageStatus::PROCESSING);
    EXPECT_TRUE(record->output_payload.is_null());
    EXPECT_EQ(record->error_count, 1);
    EXPECT_EQ(record->errors.size(), 1u);
}

// EN: Export then import reproduces the partition; unknown stages make the import fail
// FR: Export puis import reproduit la partition ; des étapes inconnues font échouer l'import
TEST_F(StageRegistryTest, ExportImport) {
    complete("data_collection");
    registry_->update("s-1", "data_collection", [](StageRecord& record) {
        record.output_payload = {{"collectionCompleteness", 92}};
        record.extension_events.push_back("ext-1");
    });

    auto exported = registry_->exportSession("s-1");
    ASSERT_TRUE(exported.has_value());
    EXPECT_EQ((*exported)["session_id"], "s-1");

    ASSERT_TRUE(registry_->importSession("s-2", *exported));
    auto copy = registry_->getStage("s-2", "data_collection");
    EXPECT_EQ(copy->status, StageStatus::COMPLETED);
    EXPECT_EQ(copy->output_payload["collectionCompleteness"], 92);
    EXPECT_EQ(copy->extension_events, std::vector<std::string>{"ext-1"});

    nlohmann::json bogus;
    bogus["stages"] = nlohmann::json::array({nlohmann::json{{"stage_id", "payroll"}, {"status", "waiting"}}});
    EXPECT_FALSE(registry_->importSession("s-3", bogus));
    EXPECT_FALSE(registry_->importSession("s-3", nlohmann::json::object()));
    EXPECT_FALSE(registry_->hasSession("s-3"));
}

// EN: Partitions of different sessions are independent under concurrent writers
// FR: Les partitions de sessions différentes sont indépendantes sous écrivains concurrents
TEST_F(StageRegistryTest, ConcurrentSessions) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this, t] {
            const std::string id = "c-" + std::to_string(t);
            registry_->createSession(id);
            for (int i = 0; i < 100; ++i) {
                registry_->update(id, "data_collection", [](StageRecord& record) { record.error_count++; });
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    for (int t = 0; t < 8; ++t) {
        EXPECT_EQ(registry_->getStage("c-" + std::to_string(t), "data_collection")->error_count, 100);
    }
    EXPECT_EQ(registry_->sessionIds().size(), 9u);
    EXPECT_TRUE(registry_->removeSession("c-0"));
    EXPECT_FALSE(registry_->removeSession("c-0"));
}
