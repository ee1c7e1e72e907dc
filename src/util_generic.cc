#include <iostream>
#include <sstream>
#include <fstream>
#include <unistd.h>
#include <errno.h>
#include <limits.h>
#include <math.h>
#include <string.h>
#include "time.h"
#include <syslog.h>
#include <openssl/evp.h>
#include <algorithm>
#include <sys/stat.h>
#include <sys/types.h>
#include <pwd.h>
#include <vector>

#include "pcre++.h"
#include "util_generic.h"
#include "globals.h"
#include "exception.h"

using namespace pcrepp;


string plural(size_t number, string text) {
    return (to_string(number) + " " + text + (number == 1 ? "" : "s"));
}


string cppgetenv(string variable) {
    char* c;

    c = getenv(variable.c_str());
    if (c == NULL)
        return "";
    else
        return c;
}


string perlJoin(string delimiter, vector<string> items) {
    string result;

    for (auto &item: items)
        result += (result.length() ? delimiter : "") + item;

    return result;
}


string log(string message) {
    if (message.length() && message.back() == '\n')
        message.pop_back();

#ifdef __APPLE__
    string logDir = GLOBALS.logDir.length() ? GLOBALS.logDir : "/var/log";

    time_t now;
    char timeStamp[100];

    now = time(NULL);
    strftime(timeStamp, sizeof(timeStamp), "%b %d %Y %H:%M:%S ", localtime(&now));

    ofstream logFile;
    logFile.open(logDir + "/vaultsync.log", ios::app);

    if (logFile.is_open()) {
        logFile << string(timeStamp) << "[" << to_string(GLOBALS.pid) << "] " << message << endl;
        logFile.close();
    }
#else
    syslog(LOG_CRIT, "%s", message.c_str());
#endif

    return message;
}


string seconds2hms(time_t seconds) {
    string result;
    int unit[] = {3600, 60, 1};
    bool dataAdded = false;

    if (seconds >= 60*60*100)
        return(string("> ") + to_string(int(seconds / (60 * 60 * 24))) + " days");

    for (int index = 0; index < sizeof(unit) / sizeof(unit[0]); ++index) {
        if (seconds >= unit[index]) {
            double value = floor(seconds / unit[index]);
            seconds = seconds % unit[index];

            char buffer[50];
            snprintf(buffer, sizeof(buffer), "%02.0f", value);
            result += string(dataAdded ? ":" : "") + buffer;
            dataAdded = true;
        }
        else
            result += dataAdded ? ":00" : index == (sizeof(unit) / sizeof(unit[0])) - 1 ? "00" : "00:";
    }

    return result;
}


string slashConcat(string str1, string str2, string str3) {
    if (str1.length() && str1[str1.length() - 1] == '/')
        str1.pop_back();

    if (str2.length() && str2[0] == '/')
        str2.erase(0, 1);

    return (str3.length() ? slashConcat(str1 + "/" + str2, str3) : str1 + "/" + str2);
}


s_pathSplit pathSplit(string path) {
    s_pathSplit s;
    s.dir = s.file = s.file_ext = s.file_base = "";

    // a trailing slash names the directory itself
    while (path.length() > 1 && path.back() == '/')
        path.pop_back();

    if (path.length() > 1) {
        auto pos = path.rfind("/");
        s.file = path.substr(pos + 1);
        s.dir = path.substr(0, pos);

        if (!pos)
            s.dir = "/";

        if (pos == string::npos)
            s.dir = ".";

        pos = s.file.rfind(".");

        if (pos == string::npos || !pos)
            s.file_base = s.file;
        else {
            s.file_base = s.file.substr(0, pos);
            s.file_ext = s.file.substr(pos + 1);
        }
    }
    else {
        if (path.length()) {
            if (path[0] == '/')
                s.dir = "/";
            else {
                s.dir = ".";
                s.file = path;

                if (path[0] != '.')
                    s.file_base = path;
            }
        }
    }

    return s;
}


string MD5string(string origString) {
    EVP_MD_CTX *md5Context;
    unsigned char md5Digest[EVP_MAX_MD_SIZE];
    unsigned int md5DigestLen = 0;

    md5Context = EVP_MD_CTX_new();
    if (md5Context == NULL)
        throw VSException("unable to allocate an MD5 context");

    EVP_DigestInit_ex(md5Context, EVP_md5(), NULL);
    EVP_DigestUpdate(md5Context, origString.c_str(), origString.length());
    EVP_DigestFinal_ex(md5Context, md5Digest, &md5DigestLen);
    EVP_MD_CTX_free(md5Context);

    char tempStr[EVP_MAX_MD_SIZE * 2 + 1];
    for (unsigned int i = 0; i < md5DigestLen; i++)
        snprintf(tempStr+(2*i), 3, "%02x", md5Digest[i]);
    tempStr[md5DigestLen * 2] = 0;

    return(tempStr);
}


string trimSpace(const string &s) {
    auto start = s.begin();
    while (start != s.end() && isspace(*start))
        start++;

    if (start == s.end())
        return "";

    auto end = s.end();
    do {
        end--;
    } while (distance(start, end) > 0 && isspace(*end));

    return string(start, end + 1);
}


string trimQuotes(string s, bool unEscape) {
    Pcre regA("^([\'\"]+)");
    string result = s;

    if (regA.search(s) && regA.matches()) {
        string openQuotes = regA.get_match(0);
        string closeQuotes = openQuotes;
        reverse(closeQuotes.begin(), closeQuotes.end());

        Pcre regB("^" + openQuotes + "(.*)" + closeQuotes + "$");
        if (regB.search(s) && regB.matches())
            result = regB.get_match(0);
    }

    if (unEscape) {
        size_t altpos;  // remove any remaining backslashes
        while ((altpos = result.find("\\")) != string::npos)
            result.erase(altpos, 1);
    }

    return result;
}


// the RE given matches on the tokens to be returned (the data)
void splitOnRegex(vector<string>& result, string data, Pcre& re, bool trimQ, bool unEscape) {
    Pcre regex(re);
    string temp;
    int pos = 0;

    while (pos <= data.length() && regex.search(data, pos)) {
        pos = regex.get_match_end(0);
        ++pos;
        temp = regex.get_match(0);

        if (unEscape) {
            size_t altpos;  // remove any remaining backslashes
            while ((altpos = temp.find("\\")) != string::npos)
                temp.erase(altpos, 1);
        }

        result.push_back(trimQ ? trimQuotes(temp) : temp);
    }
}


// split a string into a vector on spaces, except where quoted or escaped
vector<string> string2vectorOnSpace(string data, bool trimQ, bool unEscape) {
    Pcre regex("((?:([\'\"]).+?(?<!\\\\)\\g2)|(?:\\S|(?:(?<=\\\\)\\s))+)", "g");
    vector<string> result;
    splitOnRegex(result, data, regex, trimQ, unEscape);
    return result;
}


string safeFilename(string filename) {
    Pcre search1("[\\s#;\\/\\\\]+", "g");   // these characters get converted to underscores
    Pcre search2("[\\?\\!\\*]+", "g");      // these characters get removed

    string tempStr = search1.replace(filename, "_");
    return search2.replace(tempStr, "");
}


string pathAsName(string path) {
    Pcre leading("^/+");
    Pcre slashes("/+", "g");
    Pcre spaces("\\s+", "g");

    string tempStr = leading.replace(path, "");
    tempStr = slashes.replace(tempStr, "-");
    return spaces.replace(tempStr, "_");
}


string globToRegex(string glob) {
    string result = "^";

    for (size_t pos = 0; pos < glob.length(); ++pos) {
        char c = glob[pos];

        switch (c) {
            case '*':
                result += "[^/]*";
                break;

            case '?':
                result += "[^/]";
                break;

            case '[': {
                size_t first = pos + 1;
                bool negate = first < glob.length() && glob[first] == '!';

                if (negate)
                    ++first;

                // a ] right after [ or [! is a member, not the end of the class
                bool leadingBracket = first < glob.length() && glob[first] == ']';
                size_t close = glob.find(']', leadingBracket ? first + 1 : first);

                // an unterminated bracket is a literal
                if (close == string::npos) {
                    result += "\\[";
                    break;
                }

                result += negate ? "[^" : "[";

                for (size_t member = first; member < close; ++member)
                    result += glob[member] == ']' || glob[member] == '\\' ? string("\\") + glob[member] : string(1, glob[member]);

                result += ']';
                pos = close;
                break;
            }

            case '.': case '+': case '(': case ')': case '{': case '}':
            case '^': case '$': case '|': case '\\': case ']':
                result += string("\\") + c;
                break;

            default:
                result += c;
        }
    }

    return result + "$";
}


void strReplaceAll(string& s, string const& toReplace, string const& replaceWith) {
    ostringstream oss;
    size_t pos = 0;
    size_t prevPos = pos;

    if (!toReplace.length())
        return;

    while (1) {
        prevPos = pos;
        pos = s.find(toReplace, pos);
        if (pos == string::npos)
            break;
        oss << s.substr(prevPos, pos - prevPos);
        oss << replaceWith;
        pos += toReplace.size();
    }

    oss << s.substr(prevPos);
    s = oss.str();
}


bool str2bool(string text) {
    Pcre regTrue("(^\\s*(t|true|y|yes|1)\\s*$)|(^\\s*$)", "i");
    // a blank value is parsed as true so that just the directive name turns a setting on.
    // e.g. these two lines are identical:
    //      sudo: true
    //      sudo

    return(regTrue.search(text));
}


bool exists(const std::string& name) {
    struct stat statBuffer;
    return (mylstat(name, &statBuffer) == 0);
}


bool isDirectory(const std::string& name) {
    struct stat statBuffer;
    return (mystat(name, &statBuffer) == 0 && S_ISDIR(statBuffer.st_mode));
}


string getUserHomeDir(int uid) {
    char *homeDir;

    if ((homeDir = getenv("HOME")) != NULL)
        return homeDir;

    auto h = getpwuid(uid == -1 ? getuid() : uid);
    if (h != NULL)
        return h->pw_dir;

    return "";
}


string hostname() {
    char buffer[HOST_NAME_MAX + 1];

    if (gethostname(buffer, sizeof(buffer)))
        return "localhost";

    buffer[HOST_NAME_MAX] = 0;
    return buffer;
}


string realpathcpp(string origPath) {
    char tmpBuf[PATH_MAX+1];
    return (realpath(origPath.c_str(), tmpBuf) == NULL ? "" : tmpBuf);
}


int mkdirp(string dir, mode_t mode) {
    struct stat statBuf;
    int result = 0;

    if (mystat(dir, &statBuf) == -1) {
        char data[PATH_MAX + 1];
        strncpy(data, dir.c_str(), PATH_MAX);
        data[PATH_MAX] = 0;
        char *p = strtok(data, "/");

        // a relative dir stays relative to the working directory
        string path = dir.length() && dir[0] == '/' ? "" : ".";

        while (p) {
            path += string("/") + p;

            if (mystat(path, &statBuf) == -1)
                result = mkdir(path.c_str(), mode);

            if (result)
                return(result);

            p = strtok(NULL, "/");
        }
    }

    return 0;
}


int mylstat(string filename, struct stat *buf) {
    return (lstat(filename.c_str(), buf));
}


int mystat(string filename, struct stat *buf) {
    return (stat(filename.c_str(), buf));
}


string errtext(bool format) {
    return((format ? " - " : "") + string(strerror(errno)));
}


void sleepFor(double seconds) {
    if (seconds <= 0)
        return;

    struct timespec request;
    struct timespec remaining;
    request.tv_sec = (time_t)seconds;
    request.tv_nsec = (long)((seconds - request.tv_sec) * 1000000000);

    while (nanosleep(&request, &remaining) == -1 && errno == EINTR)
        request = remaining;
}

