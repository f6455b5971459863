#include <gtest/gtest.h>
#include "process_supervisor.hpp"
#include "errors.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <csignal>
#include <thread>

using namespace motus;
using motus_test::wait_until;

namespace {

std::vector<std::string> sh(const std::string& script) {
    return {"/bin/sh", "-c", script};
}

bool contains(const std::vector<int>& ids, int id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

} // namespace

class ProcessSupervisorTest : public ::testing::Test {
protected:
    void TearDown() override {
        supervisor.shutdown_all();
        wait_until([this] { return supervisor.get_running_jobs().empty(); });
    }

    ProcessSupervisor supervisor{20, 10000};
};

TEST_F(ProcessSupervisorTest, UnknownJobDefaults) {
    EXPECT_EQ(supervisor.get_percent(99), 0);
    EXPECT_EQ(supervisor.get_text(99), "");
    EXPECT_EQ(supervisor.get_error_text(99), "");
    EXPECT_EQ(supervisor.get_exit_status(99), -1);
    EXPECT_FALSE(supervisor.is_finished(99));
    EXPECT_FALSE(supervisor.is_tracked(99));
}

TEST_F(ProcessSupervisorTest, ParsesProgressAndFinishes) {
    supervisor.start(sh("printf 'Transferred:   1 B / 2 B, 50%%, 1 B/s, ETA 1s\\n'; sleep 0.3; exit 0"), {}, 1);
    EXPECT_TRUE(supervisor.is_tracked(1));

    ASSERT_TRUE(wait_until([this] { return supervisor.is_finished(1); }));
    EXPECT_EQ(supervisor.get_exit_status(1), 0);
    EXPECT_EQ(supervisor.get_percent(1), 100);
    EXPECT_NE(supervisor.get_text(1).find("Transferred: 1 B / 2 B, 50%"), std::string::npos);
    EXPECT_EQ(supervisor.get_error_text(1), "");
    EXPECT_FALSE(contains(supervisor.get_running_jobs(), 1));
}

TEST_F(ProcessSupervisorTest, SilentChildIsDetected) {
    supervisor.start(sh("exit 0"), {}, 2);
    ASSERT_TRUE(wait_until([this] { return supervisor.is_finished(2); }));
    EXPECT_EQ(supervisor.get_exit_status(2), 0);
    EXPECT_EQ(supervisor.get_percent(2), 100);
}

TEST_F(ProcessSupervisorTest, CollectsErrorsFromBothStreams) {
    supervisor.start(sh("echo 'ERROR : boom'; echo 'oops on stderr' >&2; exit 3"), {}, 3);
    ASSERT_TRUE(wait_until([this] { return supervisor.is_finished(3); }));

    EXPECT_EQ(supervisor.get_exit_status(3), 3);
    std::string errors = supervisor.get_error_text(3);
    EXPECT_NE(errors.find("ERROR : boom\n"), std::string::npos);
    EXPECT_NE(errors.find("oops on stderr\n"), std::string::npos);
}

TEST_F(ProcessSupervisorTest, EnvironmentIsOverlaid) {
    supervisor.start(sh("echo \"ERROR $MOTUS_TEST_VALUE\""), {{"MOTUS_TEST_VALUE", "hello"}}, 4);
    ASSERT_TRUE(wait_until([this] { return supervisor.is_finished(4); }));
    EXPECT_NE(supervisor.get_error_text(4).find("ERROR hello"), std::string::npos);
}

TEST_F(ProcessSupervisorTest, StopIsIdempotent) {
    supervisor.start(sh("exec sleep 30"), {}, 5);
    EXPECT_TRUE(contains(supervisor.get_running_jobs(), 5));
    EXPECT_FALSE(supervisor.is_finished(5));

    supervisor.stop(5);
    supervisor.stop(5);
    ASSERT_TRUE(wait_until([this] { return supervisor.is_finished(5); }));
    EXPECT_EQ(supervisor.get_exit_status(5), -SIGTERM);

    supervisor.stop(5);
    EXPECT_EQ(supervisor.get_exit_status(5), -SIGTERM);
    EXPECT_TRUE(supervisor.is_finished(5));
}

TEST_F(ProcessSupervisorTest, StopDuringLaunchIsDelivered) {
    for (int job_id = 20; job_id < 25; ++job_id) {
        std::thread stopper([this, job_id] {
            while (!supervisor.is_tracked(job_id)) std::this_thread::yield();
            supervisor.stop(job_id);
        });
        supervisor.start(sh("exec sleep 30"), {}, job_id);
        stopper.join();

        ASSERT_TRUE(wait_until([this, job_id] { return supervisor.is_finished(job_id); }))
            << "job " << job_id << " ignored its stop";
        EXPECT_EQ(supervisor.get_exit_status(job_id), -SIGTERM);
    }
}

TEST_F(ProcessSupervisorTest, StopAfterFinishIsNoop) {
    supervisor.start(sh("exit 7"), {}, 6);
    ASSERT_TRUE(wait_until([this] { return supervisor.is_finished(6); }));
    supervisor.stop(6);
    EXPECT_EQ(supervisor.get_exit_status(6), 7);
}

TEST_F(ProcessSupervisorTest, LaunchFailureIsTerminal) {
    supervisor.start({"/nonexistent/motus-fake-tool", "copy"}, {}, 7);
    EXPECT_TRUE(supervisor.is_finished(7));
    EXPECT_EQ(supervisor.get_exit_status(7), -1);
    EXPECT_FALSE(supervisor.get_error_text(7).empty());
    EXPECT_FALSE(contains(supervisor.get_running_jobs(), 7));
}

TEST_F(ProcessSupervisorTest, DuplicateJobRejected) {
    supervisor.start(sh("exit 0"), {}, 8);
    try {
        supervisor.start(sh("exit 0"), {}, 8);
        FAIL() << "expected DuplicateJob";
    } catch (const MotusError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DuplicateJob);
    }
}

TEST_F(ProcessSupervisorTest, RemoveForgetsJob) {
    supervisor.start(sh("exit 0"), {}, 9);
    ASSERT_TRUE(wait_until([this] { return supervisor.is_finished(9); }));

    supervisor.remove(9);
    EXPECT_FALSE(supervisor.is_tracked(9));
    EXPECT_FALSE(supervisor.is_finished(9));
    EXPECT_EQ(supervisor.get_exit_status(9), -1);
    supervisor.remove(9);

    // The id can be reused once forgotten
    supervisor.start(sh("exit 0"), {}, 9);
    ASSERT_TRUE(wait_until([this] { return supervisor.is_finished(9); }));
}

TEST_F(ProcessSupervisorTest, ShutdownAllStopsRunningJobs) {
    supervisor.start(sh("exec sleep 30"), {}, 10);
    supervisor.start(sh("exit 0"), {}, 11);
    ASSERT_TRUE(wait_until([this] { return supervisor.is_finished(11); }));

    EXPECT_EQ(supervisor.shutdown_all(), 1);
    ASSERT_TRUE(wait_until([this] { return supervisor.is_finished(10); }));
    EXPECT_EQ(supervisor.get_exit_status(10), -SIGTERM);
}
