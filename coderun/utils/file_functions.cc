/* file_functions.cc
   Jeremy Barnes, 30 January 2005
   Copyright (c) 2005 Jeremy Barnes.  All rights reserved.
   Copyright (c) 2026 The coderun authors.  All rights reserved.

   Functions to deal with files.
*/

#include <errno.h>
#include <fcntl.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>
#include <iostream>
#include <vector>

#include "coderun/arch/exception.h"
#include "coderun/utils/guard.h"
#include "file_functions.h"

using namespace std;


namespace Coderun {

void delete_file(const std::string & filename)
{
    int res = unlink(filename.c_str());
    if (res != 0)
        throw Exception(errno, "couldn't delete file " + filename, "unlink");
}

void set_file_flag(int fd, int newFlag)
{
    int oldFlags = fcntl(fd, F_GETFL, 0);
    if (oldFlags == -1)
        throw Exception(errno, "fcntl(F_GETFL)", "set_file_flag");
    if (fcntl(fd, F_SETFL, oldFlags | newFlag) == -1)
        throw Exception(errno, "fcntl(F_SETFL)", "set_file_flag");
}

void unset_file_flag(int fd, int oldFlag)
{
    int oldFlags = fcntl(fd, F_GETFL, 0);
    if (oldFlags == -1)
        throw Exception(errno, "fcntl(F_GETFL)", "unset_file_flag");
    if (fcntl(fd, F_SETFL, oldFlags & ~oldFlag) == -1)
        throw Exception(errno, "fcntl(F_SETFL)", "unset_file_flag");
}

bool is_file_flag_set(int fd, int flag)
{
    int oldFlags = fcntl(fd, F_GETFL, 0);
    return ((oldFlags & flag) == flag);
}

bool fileExists(const std::string & filename)
{
    struct stat stats;
    int res = stat(filename.c_str(), &stats);
    if (res == -1)
        return false;
    return true;
}

void write_all(int fd, const char * data, size_t size)
{
    size_t done = 0;
    while (done < size) {
        ssize_t res = ::write(fd, data + done, size - done);
        if (res == -1) {
            if (errno == EINTR)
                continue;
            throw Exception(errno, "write", "write_all");
        }
        done += res;
    }
}

std::string temp_directory()
{
    const char * dir = getenv("TMPDIR");
    if (dir && *dir)
        return dir;
    return "/tmp";
}


/*****************************************************************************/
/* TEMP FILE                                                                 */
/*****************************************************************************/

TempFile::
TempFile(const std::string & contents,
         const std::string & suffix,
         const std::string & prefix)
    : removed_(false)
{
    string tmpl = temp_directory() + "/" + prefix + "XXXXXX" + suffix;
    vector<char> name(tmpl.begin(), tmpl.end());
    name.push_back(0);

    int fd = ::mkstemps(&name[0], suffix.size());
    if (fd == -1)
        throw Exception(errno, "couldn't create " + tmpl, "mkstemps");
    path_ = &name[0];

    Call_Guard unlinkGuard([&] () { ::unlink(path_.c_str()); });
    Call_Guard closeGuard([&] () { ::close(fd); });

    write_all(fd, contents.c_str(), contents.size());

    closeGuard.clear();
    if (::close(fd) == -1)
        throw Exception(errno, "close " + path_, "TempFile");

    unlinkGuard.clear();
}

TempFile::
~TempFile()
{
    if (removed_)
        return;
    int res = ::unlink(path_.c_str());
    if (res == -1 && errno != ENOENT)
        cerr << "couldn't remove temporary file " << path_ << ": "
             << strerror(errno) << endl;
}

void
TempFile::
remove()
{
    if (removed_)
        return;
    removed_ = true;
    int res = ::unlink(path_.c_str());
    if (res == -1 && errno != ENOENT)
        throw Exception(errno, "couldn't delete file " + path_, "unlink");
}

} // namespace Coderun
