
#include <fstream>
#include <stdexcept>
#include <pcre++.h>

#include "Configuration.h"
#include "Setting.h"
#include "util_generic.h"
#include "exception.h"
#include "globals.h"
#include "debug.h"

using namespace pcrepp;


Configuration::Configuration() {
    config_filename = "";

    // define settings and their defaults
    // *** order *** of these inserts matter because they're accessed by position via the SetSpecifier enum
    settings.insert(settings.end(), Setting(CFG_SECRET_FOLDERS, RE_SECRET_FOLDERS, LIST, ".ssh .gnupg .cert .pki .password-store"));
    settings.insert(settings.end(), Setting(CFG_SECRET_FILES, RE_SECRET_FILES, LIST, "*.asc *.key *.pem id_rsa* id_dsa* id_ed25519*"));
    settings.insert(settings.end(), Setting(CFG_SENSITIVE_FOLDERS, RE_SENSITIVE_FOLDERS, LIST, ".git .stfolder .stversions .local"));
    settings.insert(settings.end(), Setting(CFG_HOME, RE_HOME, STRING, ""));
    settings.insert(settings.end(), Setting(CFG_DATA_ROOT, RE_DATA_ROOT, STRING, "/mnt/data"));
    settings.insert(settings.end(), Setting(CFG_JAIL, RE_JAIL, STRING, ""));
    settings.insert(settings.end(), Setting(CFG_WAIT, RE_WAIT, DECIMAL, "5.0"));
    settings.insert(settings.end(), Setting(CFG_ATTEMPTS, RE_ATTEMPTS, INT, "10"));
    settings.insert(settings.end(), Setting(CFG_DRAIN_ATTEMPTS, RE_DRAIN_ATTEMPTS, INT, "120"));
    settings.insert(settings.end(), Setting(CFG_TRANSFERS, RE_TRANSFERS, INT, "32"));
    settings.insert(settings.end(), Setting(CFG_RCLONE_CONF, RE_RCLONE_CONF, STRING, "{home}/{host}-rclone.conf"));
    settings.insert(settings.end(), Setting(CFG_MANIFEST_DIR, RE_MANIFEST_DIR, STRING, "{home}"));
    settings.insert(settings.end(), Setting(CFG_ARCHIVE_CLEAR, RE_ARCHIVE_CLEAR, STRING, "/mnt/data/clear"));
    settings.insert(settings.end(), Setting(CFG_ARCHIVE_SOURCE, RE_ARCHIVE_SOURCE, STRING, "/mnt/data/archive"));
    settings.insert(settings.end(), Setting(CFG_ARCHIVE_REMOTE, RE_ARCHIVE_REMOTE, STRING, ""));
    settings.insert(settings.end(), Setting(CFG_MONTHLY_REMOTE, RE_MONTHLY_REMOTE, STRING, ""));
    settings.insert(settings.end(), Setting(CFG_SHARED_STAGING, RE_SHARED_STAGING, STRING, ""));
    settings.insert(settings.end(), Setting(CFG_SHARE_SOURCE, RE_SHARE_SOURCE, STRING, "{home}"));
    settings.insert(settings.end(), Setting(CFG_KEY_FILE, RE_KEY_FILE, STRING, ""));
    settings.insert(settings.end(), Setting(CFG_BACKUP_DISK, RE_BACKUP_DISK, STRING, ""));
    settings.insert(settings.end(), Setting(CFG_BACKUP_NAME, RE_BACKUP_NAME, STRING, ""));
    settings.insert(settings.end(), Setting(CFG_EXTRA_DISK, RE_EXTRA_DISK, STRING, ""));
    settings.insert(settings.end(), Setting(CFG_EXTRA_NAME, RE_EXTRA_NAME, STRING, ""));
    settings.insert(settings.end(), Setting(CFG_REMOTE_BACKUP, RE_REMOTE_BACKUP, STRING, ""));
    settings.insert(settings.end(), Setting(CFG_REMOTE_SOURCES, RE_REMOTE_SOURCES, LIST, "{home}"));
    settings.insert(settings.end(), Setting(CFG_SUDO, RE_SUDO, BOOL, "true"));
}


bool Configuration::loadConfig(string filename) {
    ifstream configFile;

    configFile.open(filename);
    if (!configFile.is_open())
        return false;

    string dataLine;
    Pcre reBlank(RE_BLANK);
    config_filename = filename;

    unsigned int line = 0;
    while (getline(configFile, dataLine)) {
        ++line;

        // skip blanks and comments
        if (reBlank.search(dataLine))
            continue;

        // compare the line against each of the config settings until there's a match
        bool identified = false;
        for (auto &setting: settings) {
            if (setting.regex.search(dataLine) && setting.regex.matches() > 2) {
                setting.value = setting.regex.get_match(2);

                try {
                    setting.validate();

                    // every secret file glob has to compile
                    if (&setting == &settings[sSecretFiles])
                        for (auto &glob: string2vectorOnSpace(setting.value, true))
                            Pcre compiled(globToRegex(glob));
                }
                catch (const std::exception& e) {
                    throw VSException("unable to parse the value for " + setting.display_name + " on line " + to_string(line) + " of " + filename, dataLine);
                }

                DEBUG(D_config) DFMT(filename << ":" << line << " " << setting.display_name << " = " << setting.value);
                setting.seen = identified = true;
                break;
            }
        }

        if (!identified)
            throw VSException("unrecognized setting on line " + to_string(line) + " of " + filename, dataLine);
    }

    return true;
}


string Configuration::home() const {
    string dir = settings[sHome].value;
    return dir.length() ? dir : getUserHomeDir();
}


string Configuration::interpolate(string text, string month) const {
    if (text.find("{") == string::npos)
        return text;

    strReplaceAll(text, INTERP_HOME, home());
    strReplaceAll(text, INTERP_HOST, hostname());
    strReplaceAll(text, INTERP_MONTH, month.length() ? month : GLOBALS.month);

    return text;
}


string Configuration::value(SetSpecifier which, string month) const {
    if (which == sHome)
        return home();

    return interpolate(settings[which].value, month);
}


vector<string> Configuration::list(SetSpecifier which, string month) const {
    vector<string> result;

    for (auto &item: string2vectorOnSpace(settings[which].value, true))
        result.push_back(interpolate(item, month));

    return result;
}


int Configuration::integer(SetSpecifier which) const {
    return stoi(settings[which].value);
}


double Configuration::decimal(SetSpecifier which) const {
    return stod(settings[which].value);
}


bool Configuration::boolean(SetSpecifier which) const {
    return str2bool(settings[which].value);
}


ScrubPolicy Configuration::scrubPolicy() const {
    ScrubPolicy policy;

    policy.secretFolders = list(sSecretFolders);
    policy.secretFiles = list(sSecretFiles);
    policy.sensitiveFolders = list(sSensitiveFolders);

    return policy;
}

