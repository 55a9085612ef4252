/* gmn/util.h
 */
/* This software is copyrighted as detailed in the LICENSE file. */
#ifndef GMN_UTIL_H
#define GMN_UTIL_H

#include <cstdio>
#include <string>

enum MakeDirNameType
{
    MD_DIR = 0,
    MD_FILE = 1
};

bool get_a_line(std::string &line, std::FILE *fp);
bool read_file(const std::string &filename, std::string &contents);
bool make_dir(const std::string &dirname, MakeDirNameType nametype);

#endif
