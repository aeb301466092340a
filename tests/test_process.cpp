#include <gtest/gtest.h>
#include <platform/process.hpp>
#include <cerrno>
#include <sys/wait.h>

namespace {

// Block until the child has exited, leaving it unreaped.
void wait_for_exit(int pid) {
    siginfo_t info{};
    ASSERT_EQ(waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT), 0);
}

} // namespace

TEST(Process, RunCaptureCollectsOutput) {
    auto r = platform::run_capture("sh", {"-c", "echo out; echo err >&2; exit 3"});
    EXPECT_EQ(r.exit_code, 3);
    EXPECT_EQ(r.stdout_data, "out\n");
    EXPECT_EQ(r.stderr_data, "err\n");
}

TEST(Process, MissingProgramIs127) {
    auto r = platform::run_capture("slurmsync-no-such-program", {});
    EXPECT_EQ(r.exit_code, 127);
}

TEST(Process, MoveAssignReapsFinishedChild) {
    auto old_child = platform::spawn("true", {});
    ASSERT_TRUE(old_child.valid());
    int old_pid = old_child.native_handle();
    wait_for_exit(old_pid);

    auto next = platform::spawn("true", {});
    ASSERT_TRUE(next.valid());
    old_child = std::move(next);

    int status;
    errno = 0;
    EXPECT_EQ(waitpid(old_pid, &status, WNOHANG), -1);
    EXPECT_EQ(errno, ECHILD);

    EXPECT_EQ(old_child.wait(), 0);
}
