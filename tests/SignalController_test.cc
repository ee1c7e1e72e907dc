#include <signal.h>
#include <unistd.h>
#include <gtest/gtest.h>

#include "SignalController.h"
#include "testutil.h"


// each death test runs in a child, so exit() and the installed handlers stay there
class SignalControllerDeathTest : public ::testing::Test {
protected:
    void SetUp() override {
        quietGlobals();
        ::testing::FLAGS_gtest_death_test_style = "threadsafe";
    }

    void TearDown() override { SignalController::uninstall(); }
};


TEST_F(SignalControllerDeathTest, ATrappedSignalRunsTheCleanup) {
    EXPECT_EXIT({
        CleanupRegistry registry;
        SignalController::install(registry);
        registry.registerCleanup("marker", [](StatusReporter& r) {
            cerr << "cleanup ran" << endl;
            return 0;
        });

        raise(SIGTERM);
        _exit(0);
    }, ::testing::ExitedWithCode(EO_TRAPPED_SIGNAL), "cleanup ran");
}


TEST_F(SignalControllerDeathTest, EveryTrappedSignalIsHandled) {
    for (int sig: {SIGHUP, SIGINT, SIGQUIT, SIGABRT, SIGTERM}) {
        EXPECT_EXIT({
            CleanupRegistry registry;
            SignalController::install(registry);
            raise(sig);
            _exit(0);
        }, ::testing::ExitedWithCode(EO_TRAPPED_SIGNAL), "") << "signal " << sig;
    }
}


TEST_F(SignalControllerDeathTest, ASignalDuringCleanupIsIgnored) {
    EXPECT_EXIT({
        CleanupRegistry registry;
        SignalController::install(registry);
        registry.registerCleanup("interrupted", [](StatusReporter& r) {
            raise(SIGINT);
            cerr << "still cleaning" << endl;
            return 0;
        });

        registry.runCleanup(EO_MISSING_MOUNT);
    }, ::testing::ExitedWithCode(EO_MISSING_MOUNT), "still cleaning");
}


TEST_F(SignalControllerDeathTest, WithoutARegistryTheProcessStillExits) {
    EXPECT_EXIT({
        CleanupRegistry registry;
        SignalController::install(registry);
        SignalController::uninstall();
        signal(SIGTERM, SignalController::handler);
        raise(SIGTERM);
        _exit(0);
    }, ::testing::ExitedWithCode(EO_TRAPPED_SIGNAL), "");
}
