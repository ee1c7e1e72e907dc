#include <iostream>
#include <string>
#include "help.h"
#include "Configuration.h"
#include "globals.h"
#include "util_generic.h"


using namespace std;

void showHelp(enum helpType kind, Configuration *config) {
    switch (kind) {
        case hDefaults: {
            Configuration defaults;
            Configuration &current = config == NULL ? defaults : *config;

            cout << "# " << (current.config_filename.length() ? current.config_filename : "built-in defaults") << endl;
            for (auto &cfg: current.settings)
                cout << cfg.confPrint();
            break;
        }

        case hOptions: {
            string helpText = "vaultsync [options]\n\n"
            + string(BOLDBLUE) + "STAGES" + string(RESET) + "\n"
            + "   --local             Back up the home directory to the attached encrypted backup disks.\n"
            + "   --archive           Scrub, unmount and sync the general encrypted archive to object storage.\n"
            + "   --monthly           Same for this month's set under <data_root>/<YYYYMM>, if present.\n"
            + "   --month [YYYYMM]    Also archive the given month's set (may be repeated).\n"
            + "   --share             Stage the folders listed in .include_shared for a cloud drive, scrubbed.\n"
            + "   --remote            rsync the configured sources to the remote backup destination.\n"
            + "   -a, --all           All of the above, in the order local, archive, monthly, share, remote.\n"
            + "\n" + string(BOLDBLUE) + "SENSITIVE DATA\n" + RESET
            + "   --scrub [dir]       Remove secret and sensitive files and folders from dir.  dir must be\n"
            + "                       inside the jail or the data root and can't be either protected root.\n"
            + "   --classify [dir]    Show whether dir is eligible for --scrub without changing anything.\n"
            + "\n" + string(BOLDBLUE) + "GENERAL\n" + RESET
            + "   -c, --conf [file]   Configuration file (default <confdir>/" + CONF_FILE + ").\n"
            + "   --confdir [dir]     Configuration directory (default " + CONF_DIR + "; also VS_CONFDIR).\n"
            + "   --cachedir [dir]    Cache and lock directory (default " + CACHE_DIR + "; also VS_CACHEDIR).\n"
            + "   --logdir [dir]      Log directory on platforms without syslog (also VS_LOGDIR).\n"
            + "   -u, --user          Use ~/vaultsync/{etc,var/cache,var/log} for the above.\n"
            + "   --defaults          Display every setting with its current value.\n"
            + "   --nocolor           Disable color output.\n"
            + "   -q, --quiet         Only show errors.\n"
            + "   -v[options]         Verbose debugging output: -v, --vv, -v+scrub-exec, -v=0x41.\n"
            + "   -V, --version       Version.\n"
            + "   -h, --help          This help.\n";

            cout << helpText;
            break;
        }
    }
}
