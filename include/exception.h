
#ifndef EXCEPTION_H
#define EXCEPTION_H

#include <exception>
#include <string>

using namespace std;


class VSException : public std::exception {
    string message;
    string data;

public:
    VSException(string msg) : message(msg) {}
    VSException(string msg, string d) : message(msg), data(d) {}

    string detail() const { return message; }
    string getData() const { return data; }
    const char *what() const noexcept override { return message.c_str(); }
};


#endif
