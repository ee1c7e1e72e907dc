/*
 * Copyright (C) 2024 the vaultsync authors
 * This file is part of vaultsync.
 *
 * vaultsync is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * vaultsync is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with vaultsync.  If not, see <http://www.gnu.org/licenses/>.
 *
 *
 *  vaultsync
 *
 *  vaultsync runs the daily data maintenance of a single workstation.  Each stage
 *  can be run individually or all together:
 *
 *  1. Local backup
 *
 *     The home directory is mirrored onto LUKS encrypted disks that are unlocked,
 *     checked and mounted for the run and locked again afterwards.
 *
 *  2. Archive
 *
 *     cryfs encrypted directories are scrubbed of secrets through their cleartext
 *     view, listed, unmounted and then synced to object storage with rclone.  A
 *     monthly offload set is handled the same way.
 *
 *  3. Sharing
 *
 *     Selected folders are copied into a staging area with every secret and
 *     sensitive file and folder removed, ready for a cloud drive client.
 *
 *  4. Remote backup
 *
 *     Sources are rsync'd to a remote machine once their exclude lists are
 *     confirmed to cover every secret folder.
 *
 *  Whatever happens, every encrypted volume, mount and transfer the run started is
 *  released on the way out, including when a signal ends the run early.
 */

#include <pcre++.h>
#include <pwd.h>
#include <signal.h>
#include <syslog.h>
#include <time.h>
#include <unistd.h>
#include <iostream>
#include <string>
#include <vector>

#include "cxxopts.hpp"
#include "globals.h"
#include "debug.h"
#include "exception.h"
#include "exitcodes.h"
#include "help.h"
#include "util_generic.h"
#include "ArchivePipeline.h"
#include "CleanupRegistry.h"
#include "CommandRunner.h"
#include "Configuration.h"
#include "Filesystem.h"
#include "InstanceLock.h"
#include "LocalBackup.h"
#include "MountTable.h"
#include "PathClassifier.h"
#include "RemoteBackup.h"
#include "Scrubber.h"
#include "SharePreparation.h"
#include "SignalController.h"
#include "VolumeGuard.h"

using namespace pcrepp;


/*******************************************************************************
 * setupUserDirectories()
 *
 * Configure the 3 primary app directories (config, cache, log) to be relative
 * to the current user's home directory.
 *******************************************************************************/
void setupUserDirectories() {
    struct passwd *pws;
    if ((pws = getpwuid(getuid())) == NULL) {
        SCREENERR("error: unable to lookup current user");
        log("error: unable to lookup current user via getpwuid()");
        exit(EO_MISSING_INPUT);
    }

    string vs = "vaultsync";
    GLOBALS.confDir = slashConcat(pws->pw_dir, vs, "/etc");
    GLOBALS.cacheDir = slashConcat(pws->pw_dir, vs, "/var/cache");
    GLOBALS.logDir = slashConcat(pws->pw_dir, vs, "/var/log");
}


void reportArchive(StatusReporter& reporter, archiveResult result, string description) {
    if (result.outcome != EO_SUCCESS)
        reporter.report(result.outcome, description + " (" + outcomeName(result.outcome) + " while " + archiveStateName(result.reached) + ")");
}


/*******************************************************************************
 * main(argc, argv)
 *
 * Main entry point.
 *******************************************************************************/
int main(int argc, char *argv[]) {
    timer AppTimer;
    AppTimer.start();

    GLOBALS.debugSelector = 0;
    GLOBALS.color = true;
    GLOBALS.quiet = false;
    initGlobals();

    // the cleanup sequence is the target of every trapped signal from here on
    CleanupRegistry registry;
    SignalController::install(registry);
    ExitReporter reporter(registry);

    // default directories
    GLOBALS.confDir = CONF_DIR;
    GLOBALS.cacheDir = CACHE_DIR;

    // overwrite with env vars (if any)
    string temp;
    temp = cppgetenv("VS_CONFDIR");
    if (temp.length()) GLOBALS.confDir = temp;

    temp = cppgetenv("VS_CACHEDIR");
    if (temp.length()) GLOBALS.cacheDir = temp;

    temp = cppgetenv("VS_LOGDIR");
    if (temp.length()) GLOBALS.logDir = temp;

    openlog("vaultsync", LOG_PID | LOG_NDELAY, LOG_LOCAL1);
    cxxopts::Options options("vaultsync", "Back up, archive and share a workstation's data without leaking secrets");

    options.add_options()(string("c,") + CLI_CONF, "Configuration file", cxxopts::value<std::string>())(
        string("a,") + CLI_ALL, "All stages", cxxopts::value<bool>()->default_value("false"))(
        string("u,") + CLI_USER, "User directories", cxxopts::value<bool>()->default_value("false"))(
        string("q,") + CLI_QUIET, "No output", cxxopts::value<bool>()->default_value("false"))(
        string("V,") + CLI_VERSION, "Version", cxxopts::value<bool>()->default_value("false"))(
        string("h,") + CLI_HELP, "Show help", cxxopts::value<bool>()->default_value("false"))(
        CLI_LOCAL, "Local backup", cxxopts::value<bool>()->default_value("false"))(
        CLI_ARCHIVE, "Archive", cxxopts::value<bool>()->default_value("false"))(
        CLI_MONTHLY, "Monthly archive", cxxopts::value<bool>()->default_value("false"))(
        CLI_MONTH, "Extra monthly archive", cxxopts::value<std::vector<std::string>>())(
        CLI_SHARE, "Shared preparation", cxxopts::value<bool>()->default_value("false"))(
        CLI_REMOTE, "Remote backup", cxxopts::value<bool>()->default_value("false"))(
        CLI_SCRUB, "Scrub directory", cxxopts::value<std::string>())(
        CLI_CLASSIFY, "Classify directory", cxxopts::value<std::string>())(
        CLI_DEFAULTS, "Show defaults", cxxopts::value<bool>()->default_value("false"))(
        CLI_NOCOLOR, "Disable color", cxxopts::value<bool>()->default_value("false"))(
        CLI_CONFDIR, "Configuration directory", cxxopts::value<std::string>())(
        CLI_CACHEDIR, "Cache directory", cxxopts::value<std::string>())(
        CLI_LOGDIR, "Log directory", cxxopts::value<std::string>());

    try {
        options.allow_unrecognised_options();  // to support -v...
        GLOBALS.cli = options.parse(argc, argv);
        GLOBALS.quiet = GLOBALS.cli[CLI_QUIET].as<bool>();
        GLOBALS.color = !(GLOBALS.quiet || GLOBALS.cli[CLI_NOCOLOR].as<bool>() || !isatty(2));

        if (GLOBALS.cli[CLI_USER].as<bool>())
            setupUserDirectories();

        if (GLOBALS.cli.count(CLI_CONFDIR))
            GLOBALS.confDir = GLOBALS.cli[CLI_CONFDIR].as<string>();

        if (GLOBALS.cli.count(CLI_CACHEDIR))
            GLOBALS.cacheDir = GLOBALS.cli[CLI_CACHEDIR].as<string>();

        if (GLOBALS.cli.count(CLI_LOGDIR))
            GLOBALS.logDir = GLOBALS.cli[CLI_LOGDIR].as<string>();

        /* Enable selective debugging
         * (scheme taken from Exim MTA - Philip Hazel)
         */
        for (auto uarg : GLOBALS.cli.unmatched()) {
            if (uarg == "--vv") {
                GLOBALS.debugSelector = D_all;
                continue;
            }
            else if (uarg == "-v") {
                GLOBALS.debugSelector = D_default;
                continue;
            }
            else if (uarg.length() > 2 && uarg.substr(0, 2) == "-v") {
                unsigned int selector = D_default;
                string problem = decode_bits(selector, uarg.substr(2));

                if (!problem.length()) {
                    GLOBALS.debugSelector = selector;
                    continue;
                }

                SCREENERR("error: " << problem);
                exit(EO_MISSING_INPUT);
            }

            SCREENERR("error: unrecognized parameter " << uarg
                      << "\nUse --help for a list of options.");
            exit(EO_MISSING_INPUT);
        }
    }
    catch (cxxopts::OptionParseException &e) {
        cerr << "vaultsync: " << e.what() << endl;
        exit(EO_MISSING_INPUT);
    }

    if (GLOBALS.cli[CLI_HELP].as<bool>()) {
        showHelp(hOptions);
        exit(EO_SUCCESS);
    }

    if (GLOBALS.cli[CLI_VERSION].as<bool>()) {
        cout << "vaultsync " << VERSION << "\n";
        cout << "(c) 2024 released under GPLv3." << endl;
        exit(EO_SUCCESS);
    }

    bool all = GLOBALS.cli[CLI_ALL].as<bool>();
    bool anyStage = all || GLOBALS.cli[CLI_LOCAL].as<bool>() || GLOBALS.cli[CLI_ARCHIVE].as<bool>() ||
        GLOBALS.cli[CLI_MONTHLY].as<bool>() || GLOBALS.cli.count(CLI_MONTH) || GLOBALS.cli[CLI_SHARE].as<bool>() ||
        GLOBALS.cli[CLI_REMOTE].as<bool>();

    if (!anyStage && !GLOBALS.cli.count(CLI_SCRUB) && !GLOBALS.cli.count(CLI_CLASSIFY) && !GLOBALS.cli[CLI_DEFAULTS].as<bool>()) {
        showHelp(hOptions);
        exit(EO_MISSING_INPUT);
    }

    /* configuration */
    Configuration config;
    string confFile = GLOBALS.cli.count(CLI_CONF) ? GLOBALS.cli[CLI_CONF].as<string>() : slashConcat(GLOBALS.confDir, CONF_FILE);

    try {
        if (!config.loadConfig(confFile)) {
            if (GLOBALS.cli.count(CLI_CONF))
                reporter.escalate(EO_MISSING_FILE, "unable to read " + confFile + errtext());

            DEBUG(D_config) DFMT("no " << confFile << "; using the built-in defaults");
        }
    }
    catch (VSException &e) {
        reporter.escalate(EO_BAD_CONFIGURATION, "error: " + e.detail() + (e.getData().length() ? "\n    " + e.getData() : ""));
    }

    if (GLOBALS.cli[CLI_DEFAULTS].as<bool>()) {
        showHelp(hDefaults, &config);
        exit(EO_SUCCESS);
    }

    LocalFilesystem fs;
    ProcMounts mounts;
    ExecRunner runner(config.decimal(sWait), config.integer(sAttempts));
    PathClassifier classifier(fs, config.home(), config.value(sDataRoot), config.value(sJail));
    Scrubber scrubber(fs, classifier, config.scrubPolicy());

    if (GLOBALS.cli.count(CLI_CLASSIFY)) {
        string candidate = GLOBALS.cli[CLI_CLASSIFY].as<string>();
        auto verdict = classifier.classify(candidate);

        cout << candidate << ": " << pathClassName(verdict) << endl;
        exit(verdict == pcAllowed ? EO_SUCCESS : EO_UNSAFE);
    }

    /* one run per configuration at a time */
    string lockKey = realpathcpp(confFile);
    InstanceLock lock(GLOBALS.cacheDir, lockKey.length() ? lockKey : confFile);

    switch (lock.acquire()) {
        case lsHeld: {
            auto [pid, started] = lock.holder();
            char buffer[100];
            strftime(buffer, sizeof(buffer), "%c", localtime(&started));
            reporter.escalate(EO_LOCKED, "another vaultsync" + (pid ? " (pid " + to_string(pid) + ", started " + buffer + ")" : string("")) +
                              " is running against " + confFile);
        }

        case lsError:
            reporter.escalate(EO_MISSING_FOLDER, "unable to lock " + lock.filename() + "; is " + GLOBALS.cacheDir + " writable?");

        case lsAcquired:
            break;
    }

    if (GLOBALS.cli.count(CLI_SCRUB)) {
        auto result = scrubber.scrub(GLOBALS.cli[CLI_SCRUB].as<string>(), reporter);
        registry.runCleanup(result.ok() ? EO_SUCCESS : result.status == srUnsafe ? EO_UNSAFE : EO_SECURITY_FAILURE);
    }

    VolumeGuard guard(runner, mounts, config.boolean(sSudo));
    LocalBackup localBackup(config, guard, runner, reporter);
    ArchivePipeline archive(config, fs, mounts, runner, scrubber, reporter);
    SharePreparation share(config, fs, classifier, scrubber, runner, reporter);
    RemoteBackup remoteBackup(config, runner, reporter);

    // cleanups only ever see a StatusReporter
    registry.registerCleanup("local backup", LocalBackupCleanup(guard, runner));
    registry.registerCleanup("remote backup", RemoteBackupCleanup(runner));
    registry.registerCleanup("archive", ArchiveCleanup(runner));
    registry.registerCleanup("shared preparation", SharePreparationCleanup(config, fs, scrubber, runner));
    registry.registerCleanup("lock", [&](StatusReporter& r) { lock.release(); return 0; });

    if (all || GLOBALS.cli[CLI_LOCAL].as<bool>())
        reporter.report(localBackup.run(), "local backup");

    if (all || GLOBALS.cli[CLI_ARCHIVE].as<bool>())
        reportArchive(reporter, archive.runGeneralArchive(), "archive");

    if (all || GLOBALS.cli[CLI_MONTHLY].as<bool>())
        reportArchive(reporter, archive.runMonthlyArchive(GLOBALS.month), "monthly archive");

    if (GLOBALS.cli.count(CLI_MONTH)) {
        Pcre monthRE("^\\d{4}(0[1-9]|1[0-2])$");

        for (auto &month: GLOBALS.cli[CLI_MONTH].as<vector<string>>()) {
            if (!monthRE.search(month))
                reporter.escalate(EO_MISSING_INPUT, "--month needs YYYYMM, not " + month);

            reportArchive(reporter, archive.runMonthlyArchive(month), "archive of " + month);
        }
    }

    if (all || GLOBALS.cli[CLI_SHARE].as<bool>())
        reporter.report(share.run(config.value(sShareSource)), "shared preparation");

    if (all || GLOBALS.cli[CLI_REMOTE].as<bool>())
        reporter.report(remoteBackup.runAll(), "remote backups");

    AppTimer.stop();
    DEBUG(D_cleanup) DFMT("stages finished in " << AppTimer.elapsed());

    registry.runCleanup(EO_SUCCESS);
}
