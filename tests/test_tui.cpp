// Tui bookkeeping behind the progress display

#include <gtest/gtest.h>

#include "common/tui.hpp"

#include <string>

namespace {

TransferResult finished(const std::string& name, bool ok) {
    TransferResult r;
    r.file_name = name;
    r.state     = ok ? SessionState::COMPLETED : SessionState::FAILED;
    if (ok) r.outcome = TransferOutcome{};
    else    r.error_kind = ErrorKind::IO;
    return r;
}

} // namespace

TEST(TuiTest, SameBaseNameFromTwoDirectoriesIsTrackedSeparately) {
    Tui tui(2);
    tui.on_start("/data/a/x.bin", 100);
    tui.on_start("/data/b/x.bin", 100);
    tui.on_progress("/data/a/x.bin", 50, 100);
    tui.on_progress("/data/b/x.bin", 70, 100);
    EXPECT_EQ(tui.state().bytes_total.load(), 200u);
    EXPECT_EQ(tui.state().bytes_done.load(), 120u);

    tui.on_finish(finished("/data/a/x.bin", true));
    // b's later progress still counts only its own delta
    tui.on_progress("/data/b/x.bin", 100, 100);
    EXPECT_EQ(tui.state().bytes_done.load(), 150u);

    tui.on_finish(finished("/data/b/x.bin", true));
    EXPECT_EQ(tui.state().files_done.load(), 2u);
}

TEST(TuiTest, FinishedTransferStopsCounting) {
    Tui tui(1);
    tui.on_start("/data/x.bin", 10);
    tui.on_progress("/data/x.bin", 4, 10);
    tui.on_finish(finished("/data/x.bin", false));
    tui.on_progress("/data/x.bin", 10, 10);
    EXPECT_EQ(tui.state().bytes_done.load(), 4u);
    EXPECT_EQ(tui.state().files_failed.load(), 1u);
}

TEST(TuiTest, ListenerCountsFilesWithoutATotal) {
    Tui tui(0, "Received");
    EXPECT_EQ(tui.state().files_total.load(), 0u);
    EXPECT_EQ(tui.state().transfer_label, "Received");

    for (int i = 0; i < 3; ++i) {
        std::string name = "in" + std::to_string(i) + ".bin";
        tui.on_start(name, 1000);
        tui.on_progress(name, 1000, 1000);
        tui.on_finish(finished(name, i != 1));
    }
    EXPECT_EQ(tui.state().files_done.load(), 2u);
    EXPECT_EQ(tui.state().files_failed.load(), 1u);
    EXPECT_EQ(tui.state().bytes_done.load(), 3000u);
}
