
#ifndef UTIL_GENERIC
#define UTIL_GENERIC

#include <string>
#include <vector>
#include <time.h>
#include <sys/time.h>
#include <sys/stat.h>
#include <iostream>

#include "pcre++.h"
#include "globals.h"

using namespace pcrepp;
using namespace std;


#define mytimersub(tvp, uvp, vvp)                         \
    do {                                                  \
        (vvp)->tv_sec = (tvp)->tv_sec - (uvp)->tv_sec;    \
        (vvp)->tv_usec = (tvp)->tv_usec - (uvp)->tv_usec; \
        if ((vvp)->tv_usec < 0) {                         \
            (vvp)->tv_sec--;                              \
            (vvp)->tv_usec += 1000000;                    \
        }                                                 \
    } while (0)


string cppgetenv(string variable);

string plural(size_t number, string text);

string log(string message);

string seconds2hms(time_t seconds);

string perlJoin(string delimiter, vector<string> items);

void splitOnRegex(vector<string>& result, string data, Pcre& re, bool trimQ, bool unEscape);


class timer {
    struct timeval startTime;
    struct timeval endTime;

    public:
        void start() { gettimeofday(&startTime, NULL); }
        void stop() { gettimeofday(&endTime, NULL); }

        time_t seconds() {
            struct timeval diffTime;
            mytimersub(&endTime, &startTime, &diffTime);
            return diffTime.tv_sec;
        }

        string elapsed() { return seconds2hms(seconds()); }

    timer() { startTime.tv_sec = startTime.tv_usec = endTime.tv_sec = endTime.tv_usec = 0; }
};


struct s_pathSplit {
    string dir;
    string file;
    string file_base;
    string file_ext;
};

// pathsplit assumes a full dir/file
s_pathSplit pathSplit(string path);

string slashConcat(string str1, string str2, string str3 = "");

string MD5string(string data);

string trimSpace(const string &s);

string trimQuotes(string s, bool unEscape = false);

string safeFilename(string filename);

// /mnt/data/my archive -> mnt-data-my_archive
string pathAsName(string path);

// translate a shell glob (*, ?, [...]) into an anchored regex matching a single basename
string globToRegex(string glob);

vector<string> string2vectorOnSpace(string data, bool trimQ = false, bool unEscape = false);

void strReplaceAll(string& s, string const& toReplace, string const& replaceWith);

bool str2bool(string text);

bool exists(const std::string& name);

bool isDirectory(const std::string& name);

string getUserHomeDir(int uid = -1);

string hostname();

string realpathcpp(string origPath);

int mkdirp(string dir, mode_t mode = 0775);

int mylstat(string filename, struct stat *buf);
int mystat(string filename, struct stat *buf);

string errtext(bool format = true);

// sleep for a fractional number of seconds, resuming after signals
void sleepFor(double seconds);

#endif

