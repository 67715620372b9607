#include <gtest/gtest.h>
#include "test_support.hpp"
#include "../services/ledger-admin/include/admin.hpp"
#include <algorithm>
#include <thread>

using namespace std::chrono;
using json = nlohmann::json;

namespace {
const LockOptions kQuick{milliseconds(100), milliseconds(5), seconds(300)};

bool has_line(const std::vector<std::string>& lines, const std::string& needle) {
    return std::any_of(lines.begin(), lines.end(),
                       [&](const std::string& l) { return l.find(needle) != std::string::npos; });
}
}

class LedgerAdminTest : public ::testing::Test {
protected:
    NewFullPair full_pair(const std::string& prefix, long long seq) {
        NewFullPair fp;
        fp.description1 = "first of " + prefix;
        fp.agent1 = "agentA";
        fp.description2 = "second of " + prefix;
        fp.sequence_index = seq;
        fp.prefix = prefix;
        return fp;
    }

    AdminResult add_task(const std::string& id, const std::string& desc) {
        NewTask t;
        t.description = desc;
        t.task_id = id;
        return admin.add_task(t);
    }

    AdminResult add_pair(const std::string& t1, const std::string& t2, long long seq,
                         std::optional<std::string> pair_id, PairStatus status = PairStatus::Blocked,
                         std::optional<bool> pair_lock = std::nullopt) {
        NewPair p;
        p.task_id1 = t1;
        p.task_id2 = t2;
        p.sequence_index = seq;
        p.pair_id = std::move(pair_id);
        p.status = status;
        p.pair_lock = pair_lock;
        return admin.add_pair(p);
    }

    Ledger current() {
        auto l = store.read();
        EXPECT_TRUE(l.has_value());
        return l.value_or(Ledger{});
    }

    TempDir dir;
    LedgerStore store{dir.file("tasks.json"), quiet_logger()};
    LockManager lock{dir.file("tasks.lock"), "cli_user_1", quiet_logger()};
    LedgerAdmin admin{store, lock, kQuick, quiet_logger()};
};

TEST_F(LedgerAdminTest, InitRefusesToClobberWithoutForce) {
    AdminResult first = admin.init(false);
    ASSERT_TRUE(first.ok) << first.message;
    EXPECT_TRUE(store.exists());
    EXPECT_TRUE(current().tasks.empty());

    ASSERT_TRUE(add_task("t1", "something").ok);
    AdminResult again = admin.init(false);
    EXPECT_FALSE(again.ok);
    EXPECT_NE(again.message.find("already exists"), std::string::npos);
    EXPECT_EQ(current().tasks.size(), 1u);

    EXPECT_TRUE(admin.init(true).ok);
    EXPECT_TRUE(current().tasks.empty());
    EXPECT_FALSE(std::filesystem::exists(lock.path()));
}

TEST_F(LedgerAdminTest, InitDoesNotClobberLedgerCreatedWhileWaitingForLock) {
    write_lock_file(lock.path(), "agentA", system_clock::now());
    LedgerAdmin patient(store, lock, LockOptions{milliseconds(5000), milliseconds(5), seconds(300)},
                        quiet_logger());

    std::thread other([&] {
        std::this_thread::sleep_for(milliseconds(50));
        LedgerStore writer(store.path(), quiet_logger());
        Ledger l;
        l.tasks.push_back(make_task("early", "p"));
        EXPECT_TRUE(writer.write(l));
        std::filesystem::remove(lock.path());
    });
    AdminResult r = patient.init(false);
    other.join();

    EXPECT_FALSE(r.ok);
    EXPECT_NE(r.message.find("already exists"), std::string::npos);
    Ledger l = current();
    ASSERT_EQ(l.tasks.size(), 1u);
    EXPECT_EQ(l.tasks[0].id, "early");
    EXPECT_FALSE(std::filesystem::exists(lock.path()));
}

TEST_F(LedgerAdminTest, AddTaskRecordsCreationHistory) {
    ASSERT_TRUE(admin.init(false).ok);
    NewTask spec;
    spec.description = "write the parser";
    spec.agent_preference = "agentA";
    AdminResult r = admin.add_task(spec);
    ASSERT_TRUE(r.ok) << r.message;
    EXPECT_EQ(r.id.size(), 32u);
    EXPECT_TRUE(r.warnings.empty());

    Ledger l = current();
    const Task* t = l.find_task(r.id);
    ASSERT_NE(t, nullptr);
    EXPECT_EQ(t->status, TaskStatus::Pending);
    EXPECT_EQ(t->description, "write the parser");
    EXPECT_EQ(t->agent_preference.value_or(""), "agentA");
    EXPECT_FALSE(t->assigned_to.has_value());
    ASSERT_EQ(t->history.size(), 1u);
    EXPECT_EQ(t->history[0].event, kEventCreated);
    EXPECT_EQ(t->history[0].agent_id.value_or(""), "cli_user_1");
}

TEST_F(LedgerAdminTest, AddTaskRejectsDuplicateIdAndWarnsOnUnknownPair) {
    NewTask spec{"a task", std::nullopt, std::string("later_pair"), std::string("t1")};
    AdminResult r = admin.add_task(spec);
    ASSERT_TRUE(r.ok);
    EXPECT_TRUE(has_line(r.warnings, "later_pair"));

    std::string before = store.fingerprint();
    AdminResult dup = admin.add_task(spec);
    EXPECT_FALSE(dup.ok);
    EXPECT_EQ(dup.message, "Task ID 't1' already exists.");
    EXPECT_EQ(store.fingerprint(), before);
}

TEST_F(LedgerAdminTest, AddPairLinksTasksAndDefaultsToBlocked) {
    ASSERT_TRUE(add_task("t1", "one").ok);
    ASSERT_TRUE(add_task("t2", "two").ok);

    NewPair p;
    p.task_id1 = "t1";
    p.task_id2 = "t2";
    p.sequence_index = 1;
    p.pair_id = "p1";
    AdminResult r = admin.add_pair(p);
    ASSERT_TRUE(r.ok) << r.message;
    EXPECT_EQ(r.id, "p1");

    Ledger l = current();
    const TaskPair* pair = l.find_pair("p1");
    ASSERT_NE(pair, nullptr);
    EXPECT_EQ(pair->status, PairStatus::Blocked);
    EXPECT_TRUE(pair->pair_lock);
    EXPECT_EQ(pair->tasks, (std::vector<std::string>{"t1", "t2"}));
    EXPECT_EQ(l.find_task("t1")->pair_id.value_or(""), "p1");
    EXPECT_EQ(l.find_task("t2")->history.back().event, kEventUpdated);
}

TEST_F(LedgerAdminTest, AddPairReadyIsUnlockedUnlessToldOtherwise) {
    for (const char* id : {"t1", "t2", "t3", "t4"}) {
        ASSERT_TRUE(add_task(id, id).ok);
    }
    ASSERT_TRUE(add_pair("t1", "t2", 1, "p1", PairStatus::Ready).ok);
    ASSERT_TRUE(add_pair("t3", "t4", 2, "p2", PairStatus::Ready, true).ok);

    Ledger l = current();
    EXPECT_FALSE(l.find_pair("p1")->pair_lock);
    EXPECT_TRUE(l.find_pair("p2")->pair_lock);
}

TEST_F(LedgerAdminTest, AddPairValidatesReferences) {
    ASSERT_TRUE(add_task("t1", "one").ok);
    ASSERT_TRUE(add_task("t2", "two").ok);

    EXPECT_EQ(add_pair("t1", "ghost", 1, std::nullopt).message, "task_id2 'ghost' not found in existing tasks.");
    EXPECT_FALSE(add_pair("t1", "t1", 1, std::nullopt).ok);

    ASSERT_TRUE(add_pair("t1", "t2", 1, "p1").ok);
    AdminResult dup = add_pair("t1", "t2", 1, "p1");
    EXPECT_FALSE(dup.ok);
    EXPECT_EQ(dup.message, "Pair ID 'p1' already exists.");
}

TEST_F(LedgerAdminTest, AddPairWarnsOnReusedSequenceAndRepairing) {
    for (const char* id : {"t1", "t2", "t3"}) {
        ASSERT_TRUE(add_task(id, id).ok);
    }
    ASSERT_TRUE(add_pair("t1", "t2", 1, "p1").ok);
    AdminResult r = add_pair("t2", "t3", 1, "p2");
    ASSERT_TRUE(r.ok);
    EXPECT_TRUE(has_line(r.warnings, "sequence_index 1 is already in use"));
    EXPECT_TRUE(has_line(r.warnings, "Task t2 was already part of pair p1"));
    EXPECT_EQ(current().find_task("t2")->pair_id.value_or(""), "p2");
}

TEST_F(LedgerAdminTest, CreateFullPairBuildsTasksAndBlockedPair) {
    AdminResult r = admin.create_full_pair(full_pair("alpha", 1));
    ASSERT_TRUE(r.ok) << r.message;
    EXPECT_EQ(r.id, "alpha_p");

    Ledger l = current();
    ASSERT_EQ(l.tasks.size(), 2u);
    const Task& t1 = *l.find_task("alpha_t1");
    EXPECT_EQ(t1.agent_preference.value_or(""), "agentA");
    EXPECT_EQ(t1.pair_id.value_or(""), "alpha_p");
    EXPECT_FALSE(l.find_task("alpha_t2")->agent_preference.has_value());
    const TaskPair& p = *l.find_pair("alpha_p");
    EXPECT_EQ(p.status, PairStatus::Blocked);
    EXPECT_TRUE(p.pair_lock);
    EXPECT_EQ(p.sequence_index, 1);

    AdminResult collision = admin.create_full_pair(full_pair("alpha", 2));
    EXPECT_FALSE(collision.ok);
    EXPECT_EQ(current().tasks.size(), 2u);
}

TEST_F(LedgerAdminTest, AdvanceOnEmptyLedgerIsANoop) {
    ASSERT_TRUE(admin.init(false).ok);
    std::string before = store.fingerprint();
    AdminResult r = admin.advance_next_pair(false);
    EXPECT_TRUE(r.ok);
    EXPECT_FALSE(r.changed);
    EXPECT_EQ(r.message, "No task pairs exist in the file.");
    EXPECT_EQ(store.fingerprint(), before);
}

TEST_F(LedgerAdminTest, AdvanceNeedsForceToOpenTheFirstPair) {
    ASSERT_TRUE(admin.create_full_pair(full_pair("b", 2)).ok);
    ASSERT_TRUE(admin.create_full_pair(full_pair("a", 1)).ok);

    AdminResult plain = admin.advance_next_pair(false);
    EXPECT_FALSE(plain.ok);
    EXPECT_NE(plain.message.find("--force"), std::string::npos);

    AdminResult forced = admin.advance_next_pair(true);
    ASSERT_TRUE(forced.ok) << forced.message;
    EXPECT_EQ(forced.id, "a_p");
    Ledger l = current();
    EXPECT_EQ(l.find_pair("a_p")->status, PairStatus::Ready);
    EXPECT_FALSE(l.find_pair("a_p")->pair_lock);
    EXPECT_EQ(l.find_pair("b_p")->status, PairStatus::Blocked);
}

TEST_F(LedgerAdminTest, AdvanceFollowsHighestCompletedPair) {
    ASSERT_TRUE(admin.create_full_pair(full_pair("a", 1)).ok);
    ASSERT_TRUE(admin.create_full_pair(full_pair("b", 2)).ok);
    ASSERT_TRUE(admin.create_full_pair(full_pair("c", 3)).ok);

    Ledger l = current();
    l.find_pair("a_p")->status = PairStatus::Completed;
    ASSERT_TRUE(store.write(l));

    AdminResult r = admin.advance_next_pair(false);
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.id, "b_p");
    AdminResult again = admin.advance_next_pair(false);
    ASSERT_TRUE(again.ok);
    EXPECT_EQ(again.id, "c_p");
    AdminResult none = admin.advance_next_pair(false);
    EXPECT_TRUE(none.ok);
    EXPECT_FALSE(none.changed);
    EXPECT_EQ(none.message, "No suitable BLOCKED pair found to advance (after sequence 1).");
}

TEST_F(LedgerAdminTest, MutationsWaitForTheLock) {
    ASSERT_TRUE(admin.init(false).ok);
    write_lock_file(lock.path(), "agentA", system_clock::now());
    std::string before = store.fingerprint();

    AdminResult r = add_task("", "blocked out");
    EXPECT_FALSE(r.ok);
    EXPECT_NE(r.message.find("failed to acquire lock"), std::string::npos);
    EXPECT_EQ(store.fingerprint(), before);
    EXPECT_EQ(lock.read_record()->agent_id, "agentA");
}

TEST_F(LedgerAdminTest, MutationsLeaveCorruptLedgerAlone) {
    write_file(store.path(), "{ nope");
    std::string before = store.fingerprint();
    EXPECT_FALSE(add_task("", "x").ok);
    EXPECT_FALSE(admin.advance_next_pair(true).ok);
    EXPECT_EQ(store.fingerprint(), before);
}

TEST_F(LedgerAdminTest, StatusViews) {
    ASSERT_TRUE(admin.create_full_pair(full_pair("a", 1)).ok);

    auto whole = admin.status(std::nullopt, std::nullopt);
    ASSERT_TRUE(whole.has_value());
    EXPECT_EQ((*whole)["tasks"].size(), 2u);

    auto pair = admin.status(std::string("a_p"), std::nullopt);
    ASSERT_TRUE(pair.has_value());
    EXPECT_EQ((*pair)["pair"]["pair_id"], "a_p");
    ASSERT_EQ((*pair)["associated_tasks"].size(), 2u);
    EXPECT_EQ((*pair)["associated_tasks"][0]["id"], "a_t1");

    auto task = admin.status(std::nullopt, std::string("a_t2"));
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ((*task)["task"]["description"], "second of a");

    auto missing = admin.status(std::string("zzz"), std::nullopt);
    ASSERT_TRUE(missing.has_value());
    EXPECT_EQ((*missing)["error"], "Pair ID 'zzz' not found.");
}

TEST_F(LedgerAdminTest, StatusMarksDanglingTaskReferences) {
    write_file(store.path(), R"({"tasks": [], "task_pairs": [{"pair_id": "p", "tasks": ["gone"]}]})");
    auto out = admin.status(std::string("p"), std::nullopt);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ((*out)["associated_tasks"][0], (json{{"id", "gone"}, {"error", "Not Found"}}));

    write_file(store.path(), "not json");
    EXPECT_FALSE(admin.status(std::nullopt, std::nullopt).has_value());
}

TEST_F(LedgerAdminTest, ValidateAcceptsAdminBuiltLedger) {
    ASSERT_TRUE(admin.create_full_pair(full_pair("a", 1)).ok);
    ASSERT_TRUE(admin.create_full_pair(full_pair("b", 2)).ok);
    ASSERT_TRUE(admin.advance_next_pair(true).ok);

    ValidationReport rep = admin.validate();
    EXPECT_TRUE(rep.ok());
    EXPECT_TRUE(rep.errors.empty());
    EXPECT_TRUE(rep.warnings.empty());
    EXPECT_EQ(rep.fingerprint, store.fingerprint());
    EXPECT_EQ(rep.fingerprint.size(), 40u);
}

TEST_F(LedgerAdminTest, ValidateReportsStructuralErrors) {
    write_file(store.path(), R"({
      "tasks": [
        {"id": "t1", "status": "PENDING", "pair_id": "p1"},
        {"id": "t1", "status": "PENDING", "pair_id": "p1"},
        {"id": "t2", "status": "IN_PROGRESS", "assigned_to": null, "pair_id": "ghost"},
        {"id": "t3", "status": "PENDING", "assigned_to": "agentA"},
        {"id": "t4", "status": "DONE"},
        {"status": "PENDING"},
        42
      ],
      "task_pairs": [
        {"pair_id": "p1", "tasks": ["t1", "nope"], "status": "READY", "pair_lock": false, "sequence_index": 1},
        {"pair_id": "p1", "tasks": ["t2"], "status": "LATER", "sequence_index": "two"},
        {"pair_id": "p3", "tasks": ["t3", "t4"], "status": "BLOCKED"}
      ]
    })");

    ValidationReport rep = admin.validate();
    EXPECT_FALSE(rep.ok());
    EXPECT_TRUE(has_line(rep.errors, "Duplicate task ID: t1"));
    EXPECT_TRUE(has_line(rep.errors, "orphaned pair_id 'ghost'"));
    EXPECT_TRUE(has_line(rep.errors, "'t2' is IN_PROGRESS but has no assigned_to"));
    EXPECT_TRUE(has_line(rep.errors, "'t3' is PENDING but assigned to agentA"));
    EXPECT_TRUE(has_line(rep.errors, "'t4' has invalid status \"DONE\""));
    EXPECT_TRUE(has_line(rep.errors, "Task found with missing ID"));
    EXPECT_TRUE(has_line(rep.errors, "not an object): 42"));
    EXPECT_TRUE(has_line(rep.errors, "references non-existent task ID: nope"));
    EXPECT_TRUE(has_line(rep.errors, "Duplicate pair ID: p1"));
    EXPECT_TRUE(has_line(rep.errors, "not a list of two task IDs (found 1)"));
    EXPECT_TRUE(has_line(rep.errors, "sequence_index is not an integer"));
    EXPECT_TRUE(has_line(rep.errors, "'p3' has missing sequence_index"));
    EXPECT_TRUE(has_line(rep.errors, "has invalid status \"LATER\""));
}

TEST_F(LedgerAdminTest, ValidateWarnsOnOrderingHazards) {
    write_file(store.path(), R"({
      "tasks": [{"id": "a", "status": "PENDING"}, {"id": "b", "status": "PENDING"}],
      "task_pairs": [
        {"pair_id": "p1", "tasks": ["a", "b"], "status": "READY", "pair_lock": false, "sequence_index": 1},
        {"pair_id": "p2", "tasks": ["a", "b"], "status": "READY", "pair_lock": false, "sequence_index": 1},
        {"pair_id": "p5", "tasks": ["a", "b"], "status": "BLOCKED", "pair_lock": true, "sequence_index": 5}
      ]
    })");
    ValidationReport rep = admin.validate();
    EXPECT_TRUE(rep.ok());
    EXPECT_TRUE(has_line(rep.warnings, "Duplicate sequence_index: 1 used by pairs: p1, p2"));
    EXPECT_TRUE(has_line(rep.warnings, "Gap in sequence_index between 1 and 5"));
    EXPECT_TRUE(has_line(rep.warnings, "More than one READY and unlocked pair: p1, p2"));
}

TEST_F(LedgerAdminTest, ValidateFlagsUnreadableAndPartialDocuments) {
    write_file(store.path(), "[1, 2");
    EXPECT_FALSE(admin.validate().ok());

    write_file(store.path(), R"({"tasks": []})");
    ValidationReport rep = admin.validate();
    EXPECT_TRUE(rep.ok());
    EXPECT_TRUE(has_line(rep.warnings, "Missing 'task_pairs' list."));

    write_file(store.path(), R"({"tasks": {}, "task_pairs": []})");
    EXPECT_TRUE(has_line(admin.validate().errors, "'tasks' is not a list."));
}
