#ifndef SETTING_H
#define SETTING_H

#include <string>
#include <pcre++.h>
#include "util_generic.h"

using namespace std;
using namespace pcrepp;

enum SetType { INT, DECIMAL, STRING, LIST, BOOL };

// *** order *** matches the inserts in Configuration::Configuration()
enum SetSpecifier { sSecretFolders, sSecretFiles, sSensitiveFolders, sHome, sDataRoot, sJail, sWait, sAttempts,
    sDrainAttempts, sTransfers, sRcloneConf, sManifestDir, sArchiveClear, sArchiveSource, sArchiveRemote, sMonthlyRemote,
    sSharedStaging, sShareSource, sKeyFile, sBackupDisk, sBackupName, sExtraDisk, sExtraName, sRemoteBackup,
    sRemoteSources, sSudo };

class Setting {
    public:
        string display_name;
        enum SetType data_type;
        string value;
        string defaultValue;
        Pcre regex;
        bool seen;

        // throws std::invalid_argument or std::out_of_range if value doesn't fit data_type
        void validate();

        string confPrint();
        Setting(string name, string pattern, enum SetType setType, string defaultVal);
};

#endif
