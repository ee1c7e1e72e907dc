#include <stdexcept>
#include <gtest/gtest.h>

#include "CleanupRegistry.h"
#include "exception.h"
#include "testutil.h"


class CleanupRegistryTest : public ::testing::Test {
protected:
    void SetUp() override { quietGlobals(); }

    int runToEnd(CleanupRegistry& registry, int code) {
        try {
            registry.runCleanup(code);
        }
        catch (terminated& t) {
            return t.code;
        }

        return -1;
    }
};


TEST_F(CleanupRegistryTest, CallbacksRunInRegistrationOrder) {
    CleanupRegistry registry(throwingTerminator());
    vector<string> order;

    registry.registerCleanup("local", [&](StatusReporter& r) { order.push_back("local"); return 0; });
    registry.registerCleanup("archive", [&](StatusReporter& r) { order.push_back("archive"); return 0; });
    registry.registerCleanup("share", [&](StatusReporter& r) { order.push_back("share"); return 0; });

    EXPECT_EQ(3u, registry.size());
    EXPECT_EQ(EO_SUCCESS, runToEnd(registry, EO_SUCCESS));
    EXPECT_EQ((vector<string>{"local", "archive", "share"}), order);
}


TEST_F(CleanupRegistryTest, EveryCallbackRunsWhateverTheOthersDo) {
    CleanupRegistry registry(throwingTerminator());
    vector<string> order;

    registry.registerCleanup("fails", [&](StatusReporter& r) { order.push_back("fails"); return 3; });
    registry.registerCleanup("throws", [&](StatusReporter& r) -> int {
        order.push_back("throws");
        throw VSException("volume still busy");
    });
    registry.registerCleanup("throws std", [&](StatusReporter& r) -> int {
        order.push_back("throws std");
        throw runtime_error("stoi");
    });
    registry.registerCleanup("last", [&](StatusReporter& r) { order.push_back("last"); return 0; });

    EXPECT_EQ(EO_SECURITY_FAILURE, runToEnd(registry, EO_SECURITY_FAILURE));
    EXPECT_EQ((vector<string>{"fails", "throws", "throws std", "last"}), order);
}


TEST_F(CleanupRegistryTest, TheRequestedCodeIsTheExitCode) {
    CleanupRegistry registry(throwingTerminator());
    registry.registerCleanup("fails", [](StatusReporter& r) { return 1; });

    EXPECT_EQ(EO_MISSING_MOUNT, runToEnd(registry, EO_MISSING_MOUNT));
}


TEST_F(CleanupRegistryTest, AnEmptyRegistryStillTerminates) {
    CleanupRegistry registry(throwingTerminator());

    EXPECT_FALSE(registry.isRunning());
    EXPECT_EQ(EO_TRAPPED_SIGNAL, runToEnd(registry, EO_TRAPPED_SIGNAL));
    EXPECT_TRUE(registry.isRunning());
}


TEST_F(CleanupRegistryTest, EscalationFromInsideCleanupIsRefused) {
    CleanupRegistry registry(throwingTerminator());
    ExitReporter reporter(registry);
    bool refused = false;
    bool reachedNext = false;

    registry.registerCleanup("escalates", [&](StatusReporter& r) -> int {
        try {
            reporter.escalate(EO_MISSING_FILE, "nested");
        }
        catch (VSException& e) {
            refused = true;
            EXPECT_EQ(to_string(EO_MISSING_FILE), e.getData());
        }
        return 0;
    });
    registry.registerCleanup("next", [&](StatusReporter& r) { reachedNext = true; return 0; });

    EXPECT_EQ(EO_SUCCESS, runToEnd(registry, EO_SUCCESS));
    EXPECT_TRUE(refused);
    EXPECT_TRUE(reachedNext);
}


TEST_F(CleanupRegistryTest, AnUncaughtNestedEscalationDoesNotStopTheSequence) {
    CleanupRegistry registry(throwingTerminator());
    ExitReporter reporter(registry);
    bool reachedNext = false;

    registry.registerCleanup("escalates", [&](StatusReporter& r) -> int { reporter.escalate(EO_MISSING_FILE, "nested"); });
    registry.registerCleanup("next", [&](StatusReporter& r) { reachedNext = true; return 0; });

    EXPECT_EQ(EO_LOCKED, runToEnd(registry, EO_LOCKED));
    EXPECT_TRUE(reachedNext);
}


TEST_F(CleanupRegistryTest, EscalationRunsTheCleanupWithItsCode) {
    CleanupRegistry registry(throwingTerminator());
    ExitReporter reporter(registry);
    int cleaned = 0;

    registry.registerCleanup("count", [&](StatusReporter& r) { ++cleaned; return 0; });

    try {
        reporter.escalate(EO_BAD_CONFIGURATION, "remote isn't configured");
        FAIL() << "escalate returned";
    }
    catch (terminated& t) {
        EXPECT_EQ(EO_BAD_CONFIGURATION, t.code);
    }

    EXPECT_EQ(1, cleaned);
}


TEST_F(CleanupRegistryTest, RequirementsEscalateWithTheirOwnCodes) {
    TempDir tmp;
    writeFile(tmp.path("rclone.conf"), "[b2archive]\n");

    auto codeOf = [](function<void(ExitReporter&)> check) {
        CleanupRegistry registry(throwingTerminator());
        ExitReporter reporter(registry);

        try {
            check(reporter);
        }
        catch (terminated& t) {
            return t.code;
        }
        return -1;
    };

    EXPECT_EQ(EO_MISSING_INPUT, codeOf([](ExitReporter& r) { r.requireSetting("remote", "  "); }));
    EXPECT_EQ(EO_MISSING_FILE, codeOf([&](ExitReporter& r) { r.requireExists(tmp.path("absent")); }));
    EXPECT_EQ(EO_MISSING_FOLDER, codeOf([&](ExitReporter& r) { r.requireDirectory(tmp.path("rclone.conf")); }));
    EXPECT_EQ(EO_MISSING_FILE, codeOf([&](ExitReporter& r) { r.requireContains(tmp.path("absent"), "b2archive"); }));
    EXPECT_EQ(EO_BAD_CONFIGURATION, codeOf([&](ExitReporter& r) { r.requireContains(tmp.path("rclone.conf"), "gdrive"); }));
    EXPECT_EQ(-1, codeOf([&](ExitReporter& r) {
        r.requireSetting("remote", "b2archive");
        r.requireExists(tmp.path("rclone.conf"));
        r.requireDirectory(tmp.path());
        r.requireContains(tmp.path("rclone.conf"), "b2archive");
    }));
}


TEST_F(CleanupRegistryTest, ReportPassesTheCodeThrough) {
    StatusReporter reporter("stamp");

    EXPECT_EQ(0, reporter.report(0, "rsync"));
    EXPECT_EQ(23, reporter.report(23, "rsync"));
}
