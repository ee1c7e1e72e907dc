
#ifndef GLOBALSDEF_H
#define GLOBALSDEF_H

#define VERSION "1.0.2"

#include <string>
#include <time.h>
#include "cxxopts.hpp"

/*
 Adding a configuration setting.

    (1) add a defined constant for its name #define CLI_xxxx and one for its regex
        #define RE_xxxx in globalsdef.h
    (2) add an enum constant to reference it in Setting.h (order matters, add at end of list)
    (3) add it to the settings vector with its type and default in Configuration::Configuration()
    (4) if the value should show up in --defaults in a particular group, add it to
        showDefaults() in help.cc

 Settings are accessed as config.settings[ENUM].value, or via the typed helpers
 (config.list(ENUM), config.decimal(ENUM), ...) which also perform {home}, {host}
 and {month} interpolation.
 */


#define CONF_DIR "/etc/vaultsync"
#define CACHE_DIR "/var/vaultsync"
#define TMP_OUTPUT_DIR "/tmp/vaultsync_output"
#define CONF_FILE "vaultsync.conf"

#define DFMT(x) cerr << BOLDGREEN << __FUNCTION__ << ": " << RESET << GREEN << x << RESET << endl
#define DFMTNOPREFIX(x) cerr << GREEN << x << RESET << endl

#define NOTQUIET (!GLOBALS.quiet)
#define SCREENERR(x) cerr << RED << x << RESET << endl;
#define DUP2(x,y) while (dup2(x,y) < 0 && errno == EINTR)

#define ifcolor(x) (GLOBALS.color && NOTQUIET ? x : "")

#define RESET       ifcolor("\033[0m")
#define RED         ifcolor("\033[31m")
#define GREEN       ifcolor("\033[32m")
#define YELLOW      ifcolor("\033[33m")
#define BOLDGREEN   ifcolor("\033[1m\033[32m")
#define BOLDBLUE    ifcolor("\033[1m\033[34m")
#define BOLDYELLOW  ifcolor("\033[1m\033[33m")

// separates output sections on stderr
#define RULE "***"

// commandline options
#define CLI_CONF "conf"
#define CLI_CONFDIR "confdir"
#define CLI_CACHEDIR "cachedir"
#define CLI_LOGDIR "logdir"
#define CLI_USER "user"
#define CLI_ARCHIVE "archive"
#define CLI_MONTHLY "monthly"
#define CLI_MONTH "month"
#define CLI_LOCAL "local"
#define CLI_REMOTE "remote"
#define CLI_SHARE "share"
#define CLI_ALL "all"
#define CLI_SCRUB "scrub"
#define CLI_CLASSIFY "classify"
#define CLI_DEFAULTS "defaults"
#define CLI_NOCOLOR "nocolor"
#define CLI_QUIET "quiet"
#define CLI_VERSION "version"
#define CLI_HELP "help"

// config file setting names (as shown by --defaults)
#define CFG_SECRET_FOLDERS "secret_folders"
#define CFG_SECRET_FILES "secret_files"
#define CFG_SENSITIVE_FOLDERS "sensitive_folders"
#define CFG_HOME "home"
#define CFG_DATA_ROOT "data_root"
#define CFG_JAIL "jail"
#define CFG_WAIT "wait"
#define CFG_ATTEMPTS "attempts"
#define CFG_DRAIN_ATTEMPTS "drain_attempts"
#define CFG_TRANSFERS "transfers"
#define CFG_RCLONE_CONF "rclone_conf"
#define CFG_MANIFEST_DIR "manifest_dir"
#define CFG_ARCHIVE_CLEAR "archive_clear"
#define CFG_ARCHIVE_SOURCE "archive_source"
#define CFG_ARCHIVE_REMOTE "archive_remote"
#define CFG_MONTHLY_REMOTE "monthly_remote"
#define CFG_SHARED_STAGING "shared_staging"
#define CFG_SHARE_SOURCE "share_source"
#define CFG_KEY_FILE "key_file"
#define CFG_BACKUP_DISK "backup_disk"
#define CFG_BACKUP_NAME "backup_name"
#define CFG_EXTRA_DISK "extra_backup_disk"
#define CFG_EXTRA_NAME "extra_backup_name"
#define CFG_REMOTE_BACKUP "remote_backup"
#define CFG_REMOTE_SOURCES "remote_sources"
#define CFG_SUDO "sudo"

// conf file regexes
#define CAPTURE_VALUE string("((?:\\s|=|:)+)(.*?)\\s*?")
#define RE_COMMENT "((?:\\s*#).*)*$"
#define RE_BLANK "^((?:\\s*#).*)*$"
#define RE_SECRET_FOLDERS "(secret_folders|secret_dirs)"
#define RE_SECRET_FILES "(secret_files)"
#define RE_SENSITIVE_FOLDERS "(sensitive_folders|sensitive_dirs)"
#define RE_HOME "(home)"
#define RE_DATA_ROOT "(data_root|data|mntdata)"
#define RE_JAIL "(jail|gaol)"
#define RE_WAIT "(wait|retry_wait)"
#define RE_ATTEMPTS "(attempts|max_attempts)"
#define RE_DRAIN_ATTEMPTS "(drain_attempts)"
#define RE_TRANSFERS "(transfers|simultaneous_transfers)"
#define RE_RCLONE_CONF "(rclone_conf|rclone_config)"
#define RE_MANIFEST_DIR "(manifest_dir)"
#define RE_ARCHIVE_CLEAR "(archive_clear)"
#define RE_ARCHIVE_SOURCE "(archive_source|archive_src)"
#define RE_ARCHIVE_REMOTE "(archive_remote)"
#define RE_MONTHLY_REMOTE "(monthly_remote)"
#define RE_SHARED_STAGING "(shared_staging|staging)"
#define RE_SHARE_SOURCE "(share_source)"
#define RE_KEY_FILE "(key_file|keyfile)"
#define RE_BACKUP_DISK "(backup_disk)"
#define RE_BACKUP_NAME "(backup_name)"
#define RE_EXTRA_DISK "(extra_backup_disk|extra_disk)"
#define RE_EXTRA_NAME "(extra_backup_name|extra_name)"
#define RE_REMOTE_BACKUP "(remote_backup|remote)"
#define RE_REMOTE_SOURCES "(remote_sources)"
#define RE_SUDO "(sudo)"

#define INTERP_HOME "{home}"
#define INTERP_HOST "{host}"
#define INTERP_MONTH "{month}"

// name of the fuse device cryfs reports in the mount table
#define CRYFS_DEVICE "cryfs@"
#define CRYFS_CONFIG "cryfs.config"

using namespace std;

enum helpType { hDefaults, hOptions };

struct global_vars {
    cxxopts::ParseResult cli;
    int pid;
    unsigned int debugSelector;
    time_t startupTime;
    bool color;
    bool quiet;
    string logDir;
    string confDir;
    string cacheDir;
    string stamp;       // YYYYMMDD-hostname, prefixes every diagnostic line
    string month;       // YYYYMM of the current run
};

#endif

