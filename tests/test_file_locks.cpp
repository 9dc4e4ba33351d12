/**
 * @file test_file_locks.cpp
 * @brief Tests for advisory file locks and rebuild coordination
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "test_framework.hpp"
#include "file_locks.hpp"
#include <algorithm>
#include <fstream>
#include <thread>
#include <vector>
#include <sys/wait.h>
#include <unistd.h>

using namespace authcore;
using namespace authcore::testing;
using namespace std::chrono_literals;

namespace {

void waitForAll(std::atomic<int>& arrived, int expected) {
    ++arrived;
    while (arrived.load() < expected) std::this_thread::yield();
}

pid_t deadPid() {
    pid_t child = ::fork();
    if (child == 0) ::_exit(0);
    int status = 0;
    ::waitpid(child, &status, 0);
    return child;
}

void writeDeadOwner(const std::filesystem::path& path, pid_t dead) {
    std::ofstream out(path);
    out << dead << "\n";
}

enum ChildOutcome { CHILD_BUILT = 10, CHILD_CONSUMED = 20, CHILD_NO_OUTCOME = 1, CHILD_THREW = 2 };

// Runs in a forked child once the start pipe closes; the result is the exit status
int coordinateInChild(const std::filesystem::path& dir, int startFd) {
    char ignored;
    if (::read(startFd, &ignored, 1) < 0) return CHILD_THREW;
    try {
        CancellationToken token;
        RebuildCoordinator coordinator(dir, token);
        coordinator.setOutcomeTimeout(5000ms);
        coordinator.enterActivity();
        if (coordinator.designateLoadingAndPicklingJob()) {
            std::this_thread::sleep_for(200ms);
            coordinator.beginPublishing();
            std::ofstream(dir / "outcome") << ::getpid();
            coordinator.finishPublishing();
            return CHILD_BUILT;
        }
        coordinator.awaitOutcome();
        long builder = 0;
        std::ifstream(dir / "outcome") >> builder;
        coordinator.finishConsuming();
        return builder > 0 && builder != ::getpid() ? CHILD_CONSUMED : CHILD_NO_OUTCOME;
    } catch (const std::exception&) {
        return CHILD_THREW;
    }
}

} // namespace

// ============================================================================
// FileLock
// ============================================================================

TEST_CASE_SUITE(ExclusiveExcludesEverything, FileLock) {
    ScratchDir dir;
    FileLock a(dir.path() / "x.lock");
    FileLock b(dir.path() / "x.lock");

    REQUIRE(a.tryLock(LockMode::EXCLUSIVE));
    REQUIRE(a.mode() == LockMode::EXCLUSIVE);
    REQUIRE_FALSE(b.tryLock(LockMode::EXCLUSIVE));
    REQUIRE_FALSE(b.tryLock(LockMode::SHARED));
    REQUIRE_FALSE(b.isLocked());

    a.unlock();
    REQUIRE(b.tryLock(LockMode::SHARED));
    REQUIRE(a.tryLock(LockMode::SHARED));
    REQUIRE_FALSE(a.tryLock(LockMode::EXCLUSIVE));
}

TEST_CASE_SUITE(ExclusiveHolderRecordsPid, FileLock) {
    ScratchDir dir;
    auto path = dir.path() / "owner.lock";
    FileLock lock(path);
    REQUIRE(lock.tryLock(LockMode::EXCLUSIVE));

    std::ifstream in(path);
    long recorded = 0;
    in >> recorded;
    REQUIRE_EQ(recorded, static_cast<long>(::getpid()));

    lock.unlock();
    REQUIRE_EQ(std::filesystem::file_size(path), std::uintmax_t{0});
}

TEST_CASE_SUITE(LockForTimesOut, FileLock) {
    ScratchDir dir;
    FileLock holder(dir.path() / "t.lock");
    FileLock waiter(dir.path() / "t.lock");
    waiter.setPollInterval(5ms);
    CancellationToken token;

    REQUIRE(holder.tryLock(LockMode::EXCLUSIVE));
    REQUIRE_FALSE(waiter.lockFor(LockMode::SHARED, token, 50ms));

    std::thread releaser([&] {
        std::this_thread::sleep_for(30ms);
        holder.unlock();
    });
    bool acquired = waiter.lockFor(LockMode::SHARED, token, 5000ms);
    releaser.join();
    REQUIRE(acquired);
}

TEST_CASE_SUITE(LockForNoticesCancellation, FileLock) {
    ScratchDir dir;
    FileLock holder(dir.path() / "c.lock");
    FileLock waiter(dir.path() / "c.lock");
    CancellationToken token;
    REQUIRE(holder.tryLock(LockMode::EXCLUSIVE));

    std::thread canceller([&] {
        std::this_thread::sleep_for(30ms);
        token.cancel();
    });
    bool cancelled = false;
    try {
        waiter.lockFor(LockMode::EXCLUSIVE, token);
    } catch (const CancelledError&) {
        cancelled = true;
    }
    canceller.join();
    REQUIRE(cancelled);
    REQUIRE_FALSE(waiter.isLocked());
}

TEST_CASE_SUITE(OrphanedLockFileIsBroken, FileLock) {
    ScratchDir dir;
    auto path = dir.path() / "orphan.lock";
    pid_t dead = deadPid();
    {
        std::ofstream out(path);
        out << dead << "\n";
    }
    FileLock lock(path);
    REQUIRE(lock.breakIfOrphaned());
    REQUIRE_LOGGED("held by the dead process " + std::to_string(dead));
    REQUIRE(lock.tryLock(LockMode::EXCLUSIVE));
}

TEST_CASE_SUITE(WaiterOnRemovedFileFollowsThePath, FileLock) {
    ScratchDir dir;
    auto path = dir.path() / "moved.lock";
    writeDeadOwner(path, deadPid());
    FileLock breaker(path);
    FileLock waiter(path);

    REQUIRE(breaker.breakIfOrphaned());
    REQUIRE(waiter.tryLock(LockMode::EXCLUSIVE));
    REQUIRE_FALSE(breaker.tryLock(LockMode::EXCLUSIVE));
    REQUIRE_FALSE(breaker.tryLock(LockMode::SHARED));
}

TEST_CASE_SUITE(SecondBreakerKeepsTheReplacement, FileLock) {
    ScratchDir dir;
    auto path = dir.path() / "twice.lock";
    writeDeadOwner(path, deadPid());
    FileLock first(path);
    FileLock second(path);

    REQUIRE(first.breakIfOrphaned());
    REQUIRE(first.tryLock(LockMode::EXCLUSIVE));
    // second still reads the dead owner through the removed file
    REQUIRE(second.breakIfOrphaned());
    REQUIRE_FALSE(second.tryLock(LockMode::EXCLUSIVE));
    REQUIRE(first.isLocked());
}

TEST_CASE_SUITE(LiveOwnerIsNotBroken, FileLock) {
    ScratchDir dir;
    auto path = dir.path() / "alive.lock";
    {
        std::ofstream out(path);
        out << ::getppid() << "\n";
    }
    FileLock lock(path);
    REQUIRE_FALSE(lock.breakIfOrphaned());

    FileLock own(dir.path() / "own.lock");
    REQUIRE(own.tryLock(LockMode::EXCLUSIVE));
    REQUIRE_FALSE(own.breakIfOrphaned());
}

// ============================================================================
// RebuildCoordinator
// ============================================================================

TEST_CASE_SUITE(ExactlyOneLeader, RebuildCoordinator) {
    ScratchDir dir;
    CancellationToken token;
    RebuildCoordinator first(dir.path(), token);
    RebuildCoordinator second(dir.path(), token);

    first.enterActivity();
    second.enterActivity();
    bool a = first.designateLoadingAndPicklingJob();
    bool b = second.designateLoadingAndPicklingJob();
    REQUIRE(a != b);
    REQUIRE(first.isLeader() == a);
    REQUIRE(second.isLeader() == b);
}

TEST_CASE_SUITE(FollowerWaitsForPublishedOutcome, RebuildCoordinator) {
    ScratchDir dir;
    CancellationToken token;
    std::atomic<int> designated{0};
    std::atomic<int> leaders{0};
    std::atomic<bool> published{false};
    std::atomic<bool> followerSawPublished{false};

    auto participant = [&] {
        RebuildCoordinator coordinator(dir.path(), token);
        coordinator.setOutcomeTimeout(5000ms);
        coordinator.enterActivity();
        bool leader = coordinator.designateLoadingAndPicklingJob();
        waitForAll(designated, 2);
        if (leader) {
            ++leaders;
            std::this_thread::sleep_for(20ms);
            coordinator.beginPublishing();
            published = true;
            coordinator.finishPublishing();
        } else {
            coordinator.awaitOutcome();
            followerSawPublished = published.load();
            coordinator.finishConsuming();
        }
    };

    std::thread t1(participant);
    std::thread t2(participant);
    t1.join();
    t2.join();

    REQUIRE_EQ(leaders.load(), 1);
    REQUIRE(published.load());
    REQUIRE(followerSawPublished.load());
}

TEST_CASE_SUITE(ConcurrentProcessesElectOneBuilder, RebuildCoordinator) {
    ScratchDir dir;
    int start[2];
    REQUIRE_EQ(::pipe(start), 0);

    std::vector<pid_t> children;
    for (int i = 0; i < 2; ++i) {
        pid_t child = ::fork();
        REQUIRE(child >= 0);
        if (child == 0) {
            ::close(start[1]);
            ::_exit(coordinateInChild(dir.path(), start[0]));
        }
        children.push_back(child);
    }
    // closing the write end releases both children at once
    ::close(start[0]);
    ::close(start[1]);

    std::vector<int> outcomes;
    for (pid_t child : children) {
        int status = 0;
        REQUIRE_EQ(::waitpid(child, &status, 0), child);
        REQUIRE(WIFEXITED(status));
        outcomes.push_back(WEXITSTATUS(status));
    }
    std::sort(outcomes.begin(), outcomes.end());
    REQUIRE_EQ(outcomes.front(), static_cast<int>(CHILD_BUILT));
    REQUIRE_EQ(outcomes.back(), static_cast<int>(CHILD_CONSUMED));
}

TEST_CASE_SUITE(ReleasedOnDestruction, RebuildCoordinator) {
    ScratchDir dir;
    CancellationToken token;
    {
        RebuildCoordinator leader(dir.path(), token);
        leader.enterActivity();
        REQUIRE(leader.designateLoadingAndPicklingJob());
    }
    RebuildCoordinator next(dir.path(), token);
    next.enterActivity();
    REQUIRE(next.designateLoadingAndPicklingJob());
}
