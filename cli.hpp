#pragma once
#ifndef CLI_HPP
#define CLI_HPP

#include <ostream>

#define PROG_NAME "pngstego"

// Exit codes

#define ARG_ERROR         1
#define FILE_ERROR        2
#define SIGN_ERROR        4
#define CHUNK_ERROR       8
#define NOT_FOUND_ERROR  16
#define FORMAT_ERROR     32
#define MEM_ERROR        64
#define OTHER_ERROR     128

void showUsage(std::ostream& os);

/*Runs the command named in argv[1]; returns the process exit code*/
int runCommand(int argc, const char* const argv[], std::ostream& out, std::ostream& err);

/*Must be called from inside a catch handler. Reports the exception being
handled on err and returns its exit code; rethrows non std::exception types*/
int handleError(std::ostream& err);

#endif
